/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/** \file ewf.cpp
 * Reader for EWF (E01) evidence file sets, backed by libewf.
 */

#include "e4x_img_i.h"

#if HAVE_LIBEWF
#include "ewf.h"

#include <memory>
#include <new>
#include <string>
#include <vector>

/*
 * Copy the libewf backtrace into a string and free the error.  Yields
 * an empty string when libewf gave nothing.
 */
static std::string
ewf_error_string(libewf_error_t * ewf_error)
{
    if (ewf_error == NULL)
        return std::string();

    char buf[512];
    const int len = libewf_error_backtrace_sprint(ewf_error, buf, sizeof(buf));
    libewf_error_free(&ewf_error);
    return len > 0 ? std::string(buf) : std::string();
}

/* sets the error record with the libewf message appended */
static void
ewf_set_error(uint32_t a_errno, libewf_error_t * ewf_error,
    const char *a_what, const char *a_image)
{
    const std::string detail = ewf_error_string(ewf_error);
    e4x_error_reset();
    e4x_error_set_errno(a_errno);
    e4x_error_set_errstr("ewf_open: %s: %s (%s)", a_image, a_what,
        detail.c_str());
}

static ssize_t
ewf_read(E4X_IMG_INFO * img_info, E4X_OFF_T a_off, char *a_buf,
    size_t a_len)
{
    IMG_EWF_INFO *ewf_info = (IMG_EWF_INFO *) img_info;

    if (e4x_verbose > 1)
        e4x_fprintf(stderr, "ewf_read: offset %" PRIdOFF ", %" PRIuSIZE
            " bytes\n", a_off, a_len);

    libewf_error_t *ewf_error = NULL;
    ssize_t cnt;
    {
        std::lock_guard<std::mutex> lock(ewf_info->read_lock);
        cnt = libewf_handle_read_buffer_at_offset(ewf_info->handle, a_buf,
            a_len, a_off, &ewf_error);
    }
    if (cnt < 0) {
        const std::string detail = ewf_error_string(ewf_error);
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_READ);
        e4x_error_set_errstr("ewf_read: offset %" PRIdOFF " (%" PRIuSIZE
            " bytes): %s", a_off, a_len,
            detail.empty() ? strerror(errno) : detail.c_str());
        return -1;
    }
    return cnt;
}

static void
ewf_close(E4X_IMG_INFO * img_info)
{
    IMG_EWF_INFO *ewf_info = (IMG_EWF_INFO *) img_info;

    if (ewf_info->handle != NULL) {
        libewf_handle_close(ewf_info->handle, NULL);
        libewf_handle_free(&ewf_info->handle, NULL);
    }
    e4x_img_free_image_names(img_info);
    img_info->tag = 0;
    delete ewf_info;
}

/*
 * A single name is the first segment of a set: let libewf find the
 * others ("image.E01" -> "image.E02", ...).
 */
static bool
ewf_segment_names(int a_num_img, const char *const a_images[],
    std::vector<std::string> &a_names)
{
    if (a_num_img > 1) {
        a_names.assign(a_images, a_images + a_num_img);
        return true;
    }

    char **glob = NULL;
    int glob_len = 0;
    libewf_error_t *ewf_error = NULL;
    if (libewf_glob(a_images[0], strlen(a_images[0]),
            LIBEWF_FORMAT_UNKNOWN, &glob, &glob_len, &ewf_error) == -1) {
        ewf_set_error(E4X_ERR_IMG_MAGIC, ewf_error,
            "not an EWF segment name", a_images[0]);
        return false;
    }
    a_names.assign(glob, glob + glob_len);
    libewf_glob_free(glob, glob_len, NULL);
    return true;
}

/**
 * \internal
 * Open an EWF set.  Fails with E4X_ERR_IMG_MAGIC when the first segment
 * has no EWF signature, which is how detection falls through to raw.
 * @returns NULL on error
 */
E4X_IMG_INFO *
ewf_open(int a_num_img, const char *const a_images[], unsigned int a_ssize)
{
    const auto closer = [](IMG_EWF_INFO * e) {
        ewf_close((E4X_IMG_INFO *) e);
    };
    std::unique_ptr<IMG_EWF_INFO, decltype(closer)> ewf_info(
        new(std::nothrow) IMG_EWF_INFO(), closer);
    if (!ewf_info) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_AUX_MALLOC);
        e4x_error_set_errstr("ewf_open");
        return NULL;
    }

    E4X_IMG_INFO *img_info = &ewf_info->img_info.img_info;
    img_info->tag = E4X_IMG_INFO_TAG;
    img_info->itype = E4X_IMG_TYPE_EWF;
    ewf_info->img_info.read = ewf_read;
    ewf_info->img_info.close = ewf_close;

    std::vector<std::string> names;
    if (!ewf_segment_names(a_num_img, a_images, names))
        return NULL;

    std::vector<const char *> paths;
    for (const std::string & n : names)
        paths.push_back(n.c_str());
    if (!e4x_img_copy_image_names(img_info, paths.data(),
            (int) paths.size()))
        return NULL;

    libewf_error_t *ewf_error = NULL;
    if (libewf_check_file_signature(paths[0], &ewf_error) != 1) {
        ewf_set_error(E4X_ERR_IMG_MAGIC, ewf_error, "no EWF signature",
            paths[0]);
        return NULL;
    }

    if (libewf_handle_initialize(&ewf_info->handle, &ewf_error) != 1) {
        ewf_set_error(E4X_ERR_IMG_OPEN, ewf_error, "handle", paths[0]);
        return NULL;
    }
    if (libewf_handle_open(ewf_info->handle,
            const_cast<char *const *>(paths.data()), (int) paths.size(),
            LIBEWF_OPEN_READ, &ewf_error) != 1) {
        ewf_set_error(E4X_ERR_IMG_OPEN, ewf_error, "open", paths[0]);
        return NULL;
    }

    size64_t media_size = 0;
    if (libewf_handle_get_media_size(ewf_info->handle, &media_size,
            &ewf_error) != 1) {
        ewf_set_error(E4X_ERR_IMG_OPEN, ewf_error, "media size", paths[0]);
        return NULL;
    }
    img_info->size = (E4X_OFF_T) media_size;

    // the acquisition records its own sector size, -b overrides it
    uint32_t bps = 0;
    if (a_ssize != 0)
        bps = a_ssize;
    else if (libewf_handle_get_bytes_per_sector(ewf_info->handle, &bps,
            NULL) != 1 || bps == 0 || bps % 512)
        bps = 512;
    img_info->sector_size = bps;

    return (E4X_IMG_INFO *) ewf_info.release();
}

#endif
