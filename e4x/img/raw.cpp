/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file raw.cpp
 * Reader for dd files, split dd sets and block devices.  All segments
 * are opened up front and read with pread(), so the handle has no file
 * position to share between threads.
 */

#include "e4x_img_i.h"
#include "raw.h"

#include <memory>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

static ssize_t
raw_read_segment(IMG_RAW_INFO * raw_info, int a_idx, char *a_buf,
    size_t a_len, E4X_OFF_T a_rel_off)
{
    ssize_t cnt;
    do {
        cnt = pread(raw_info->fds[a_idx], a_buf, a_len, a_rel_off);
    } while (cnt < 0 && errno == EINTR);

    if (cnt < 0) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_READ);
        e4x_error_set_errstr("raw_read: \"%s\" at %" PRIdOFF " (%"
            PRIuSIZE " bytes): %s", raw_info->img_info.img_info.images[a_idx],
            a_rel_off, a_len, strerror(errno));
    }
    return cnt;
}

/*
 * Read starting in the segment that holds a_off and continue into the
 * following ones.  Stops early, with a short count, when a segment
 * returns less than asked.
 */
static ssize_t
raw_read(E4X_IMG_INFO * img_info, E4X_OFF_T a_off, char *a_buf,
    size_t a_len)
{
    IMG_RAW_INFO *raw_info = (IMG_RAW_INFO *) img_info;

    if (e4x_verbose > 1)
        e4x_fprintf(stderr, "raw_read: offset %" PRIdOFF ", %" PRIuSIZE
            " bytes\n", a_off, a_len);

    int seg = 0;
    while (seg < img_info->num_img && raw_info->max_off[seg] <= a_off)
        seg++;
    if (a_off < 0 || seg == img_info->num_img) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_READ_OFF);
        e4x_error_set_errstr("raw_read: offset %" PRIdOFF
            " is outside the image", a_off);
        return -1;
    }

    size_t done = 0;
    for (; seg < img_info->num_img && done < a_len; seg++) {
        const E4X_OFF_T pos = a_off + (E4X_OFF_T) done;
        const E4X_OFF_T seg_start = seg ? raw_info->max_off[seg - 1] : 0;
        // compare as offsets, the segment remainder may exceed size_t
        const E4X_OFF_T left = raw_info->max_off[seg] - pos;
        const size_t want = left < (E4X_OFF_T) (a_len - done) ?
            (size_t) left : a_len - done;

        const ssize_t cnt = raw_read_segment(raw_info, seg, a_buf + done,
            want, pos - seg_start);
        if (cnt < 0)
            return -1;
        done += cnt;
        if ((size_t) cnt != want)
            break;
    }
    return (ssize_t) done;
}

static void
raw_close(E4X_IMG_INFO * img_info)
{
    IMG_RAW_INFO *raw_info = (IMG_RAW_INFO *) img_info;

    for (int i = 0; raw_info->fds && i < img_info->num_img; i++) {
        if (raw_info->fds[i] >= 0)
            close(raw_info->fds[i]);
    }
    free(raw_info->fds);
    free(raw_info->max_off);
    e4x_img_free(raw_info);
}

/*
 * Open one segment read-only and measure it.  fstat() gives the size of
 * a regular file.  A block device has to be asked by seeking to its end.
 *
 * @returns the size or -1 on error
 */
static E4X_OFF_T
raw_open_segment(const char *a_path, int *a_fd)
{
    const int fd = open(a_path, O_RDONLY);
    if (fd < 0) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_OPEN);
        e4x_error_set_errstr("raw_open: \"%s\": %s", a_path,
            strerror(errno));
        return -1;
    }

    struct stat sb;
    E4X_OFF_T size = -1;
    if (fstat(fd, &sb) < 0) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_STAT);
        e4x_error_set_errstr("raw_open: \"%s\": %s", a_path,
            strerror(errno));
    }
    else if (S_ISDIR(sb.st_mode)) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_MAGIC);
        e4x_error_set_errstr("raw_open: \"%s\" is a directory", a_path);
    }
    else if (!S_ISBLK(sb.st_mode)) {
        size = sb.st_size;
    }
    else if ((size = lseek(fd, 0, SEEK_END)) < 0) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_SEEK);
        e4x_error_set_errstr("raw_open: device \"%s\": %s", a_path,
            strerror(errno));
    }

    if (size < 0) {
        close(fd);
        return -1;
    }
    *a_fd = fd;
    return size;
}

/**
 * \internal
 * Open a raw image made of a_num_img segments given in order.
 * @returns NULL on error
 */
E4X_IMG_INFO *
raw_open(int a_num_img, const char *const a_images[], unsigned int a_ssize)
{
    const auto closer = [](IMG_RAW_INFO * r) {
        raw_close((E4X_IMG_INFO *) r);
    };
    std::unique_ptr<IMG_RAW_INFO, decltype(closer)> raw_info(
        (IMG_RAW_INFO *) e4x_img_malloc(sizeof(IMG_RAW_INFO)), closer);
    if (!raw_info)
        return NULL;

    E4X_IMG_INFO *img_info = &raw_info->img_info.img_info;
    img_info->itype = E4X_IMG_TYPE_RAW;
    img_info->sector_size = a_ssize ? a_ssize : 512;
    raw_info->img_info.read = raw_read;
    raw_info->img_info.close = raw_close;

    // num_img stays 0 until the names are copied, after fds exists
    raw_info->fds = (int *) e4x_malloc(a_num_img * sizeof(int));
    raw_info->max_off =
        (E4X_OFF_T *) e4x_malloc(a_num_img * sizeof(E4X_OFF_T));
    if (!raw_info->fds || !raw_info->max_off)
        return NULL;
    for (int i = 0; i < a_num_img; i++)
        raw_info->fds[i] = -1;

    if (!e4x_img_copy_image_names(img_info, a_images, a_num_img))
        return NULL;

    for (int i = 0; i < a_num_img; i++) {
        const E4X_OFF_T seg_size =
            raw_open_segment(img_info->images[i], &raw_info->fds[i]);
        if (seg_size < 0)
            return NULL;
        if (seg_size == 0) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_IMG_OPEN);
            e4x_error_set_errstr("raw_open: \"%s\" is empty",
                img_info->images[i]);
            return NULL;
        }
        img_info->size += seg_size;
        raw_info->max_off[i] = img_info->size;

        if (e4x_verbose)
            e4x_fprintf(stderr, "raw_open: segment %d \"%s\": %" PRIdOFF
                " bytes, ends at %" PRIdOFF "\n", i, img_info->images[i],
                seg_size, raw_info->max_off[i]);
    }

    return (E4X_IMG_INFO *) raw_info.release();
}
