/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file img_io.cpp
 * Byte reads from an open image, served through the chunk cache.
 */

#include "e4x_img_i.h"
#include "lru_cache.h"

#include <algorithm>
#include <memory>
#include <new>

/*
 * Fill a_buf with a_len bytes of the image at a_off, asking the reader
 * as often as it takes.  A reader that returns 0 before that is an
 * image shorter than its recorded size.
 */
static uint8_t
fill_from_reader(IMG_INFO * a_iif, E4X_OFF_T a_off, char *a_buf,
    size_t a_len)
{
    size_t got = 0;
    while (got < a_len) {
        const ssize_t cnt = a_iif->read(&a_iif->img_info,
            a_off + (E4X_OFF_T) got, a_buf + got, a_len - got);
        if (cnt < 0)
            return 1;
        if (cnt == 0) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_IMG_READ);
            e4x_error_set_errstr("e4x_img_read: image ends at %" PRIdOFF
                " before its size of %" PRIdOFF,
                a_off + (E4X_OFF_T) got, a_iif->img_info.size);
            return 1;
        }
        got += (size_t) cnt;
    }
    return 0;
}

/**
 * \internal
 * Read through the chunk cache.  The range is clipped to the image and
 * cut on chunk boundaries.  A missing chunk is read from the image in
 * full and cached, straight into a_buf when the caller wants all of it.
 *
 * @returns number of bytes copied or -1 on error
 */
ssize_t
e4x_img_read_cache(E4X_IMG_INFO * a_img_info, E4X_OFF_T a_off,
    char *a_buf, size_t a_len)
{
    IMG_INFO *iif = reinterpret_cast<IMG_INFO *>(a_img_info);
    const E4X_OFF_T chunk = (E4X_OFF_T) iif->cache->chunk_size();
    const E4X_OFF_T end =
        std::min(a_off + (E4X_OFF_T) a_len, a_img_info->size);

    std::unique_ptr<char[]> scratch;
    E4X_OFF_T pos = a_off;
    while (pos < end) {
        const E4X_OFF_T chunk_off = pos - pos % chunk;
        const size_t chunk_len =
            (size_t) std::min(chunk, a_img_info->size - chunk_off);
        const size_t skip = (size_t) (pos - chunk_off);
        const size_t take =
            (size_t) std::min((E4X_OFF_T) (chunk_len - skip), end - pos);
        char *dst = a_buf + (pos - a_off);

        if (!iif->cache->copy_out(chunk_off, skip, take, dst)) {
            char *whole = dst;
            if (take != chunk_len) {
                if (!scratch)
                    scratch.reset(new(std::nothrow) char[chunk]);
                if (!scratch) {
                    e4x_error_reset();
                    e4x_error_set_errno(E4X_ERR_AUX_MALLOC);
                    e4x_error_set_errstr("e4x_img_read: chunk buffer");
                    return -1;
                }
                whole = scratch.get();
            }
            if (fill_from_reader(iif, chunk_off, whole, chunk_len))
                return -1;
            iif->cache->put(chunk_off, whole, chunk_len);
            if (whole != dst)
                memcpy(dst, whole + skip, take);
        }
        pos += take;
    }
    return (ssize_t) (end - a_off);
}

/* sets the error record for a rejected e4x_img_read() argument */
static ssize_t
bad_read_arg(uint32_t a_errno, const char *a_what)
{
    e4x_error_reset();
    e4x_error_set_errno(a_errno);
    e4x_error_set_errstr("e4x_img_read: %s", a_what);
    return -1;
}

/**
 * \ingroup imglib
 * Read from an open image.  A read that runs past the end of the image
 * is clipped, so the count can be smaller than a_len.
 *
 * @returns number of bytes read or -1 on error
 */
ssize_t
e4x_img_read(E4X_IMG_INFO * a_img_info, E4X_OFF_T a_off,
    char *a_buf, size_t a_len)
{
    if (a_img_info == NULL)
        return bad_read_arg(E4X_ERR_IMG_ARG, "no image");
    if (a_buf == NULL)
        return bad_read_arg(E4X_ERR_IMG_ARG, "no buffer");
    if (a_off < 0)
        return bad_read_arg(E4X_ERR_IMG_ARG, "negative offset");
    if (a_off >= a_img_info->size) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_READ_OFF);
        e4x_error_set_errstr("e4x_img_read: offset %" PRIdOFF
            " is past the end (%" PRIdOFF ")", a_off, a_img_info->size);
        return -1;
    }
    // the end offset has to be representable
    if ((E4X_OFF_T) a_len < 0 || a_off + (E4X_OFF_T) a_len < a_off)
        return bad_read_arg(E4X_ERR_IMG_ARG, "length too large");

    IMG_INFO *iif = reinterpret_cast<IMG_INFO *>(a_img_info);
    return iif->cache_read(a_img_info, a_off, a_buf, a_len);
}
