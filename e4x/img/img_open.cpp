/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file img_open.cpp
 * Opening and closing images: argument checks, choice of the format
 * reader and setup of the chunk cache.
 */

#include "e4x_img_i.h"
#include "lru_cache.h"

#include "raw.h"

#if HAVE_LIBEWF
#include "ewf.h"
#endif

#include <memory>
#include <new>

/**
 * \internal
 * 0 selects the reader's default.  Anything else must be a whole
 * multiple of 512.
 */
bool
e4x_img_sector_size_ok(unsigned int a_ssize)
{
    if (a_ssize % 512 == 0)
        return true;

    e4x_error_set_errno(E4X_ERR_IMG_ARG);
    e4x_error_set_errstr("sector size %u is not a multiple of 512",
        a_ssize);
    return false;
}

static bool
image_names_ok(int a_num_img, const char *const a_images[])
{
    if (a_num_img < 0) {
        e4x_error_set_errno(E4X_ERR_IMG_ARG);
        e4x_error_set_errstr("e4x_img_open: %d images", a_num_img);
        return false;
    }
    if (a_num_img == 0 || a_images == NULL) {
        e4x_error_set_errno(E4X_ERR_IMG_NOFILE);
        e4x_error_set_errstr("e4x_img_open");
        return false;
    }
    for (int i = 0; i < a_num_img; i++) {
        if (a_images[i] == NULL || *a_images[i] == '\0') {
            e4x_error_set_errno(E4X_ERR_IMG_NOFILE);
            e4x_error_set_errstr("e4x_img_open: image %d has no name", i);
            return false;
        }
    }
    return true;
}

/* hands the handle back to the reader that made it */
static void
close_reader(E4X_IMG_INFO * a_img)
{
    reinterpret_cast<IMG_INFO *>(a_img)->close(a_img);
}

typedef std::unique_ptr<E4X_IMG_INFO, decltype(&close_reader)> reader_ptr;

static reader_ptr
open_reader(E4X_IMG_TYPE_ENUM a_type, int a_num_img,
    const char *const a_images[], unsigned int a_ssize)
{
    switch (a_type) {
    case E4X_IMG_TYPE_RAW:
        return reader_ptr(raw_open(a_num_img, a_images, a_ssize),
            close_reader);

#if HAVE_LIBEWF
    case E4X_IMG_TYPE_EWF:
        return reader_ptr(ewf_open(a_num_img, a_images, a_ssize),
            close_reader);

    case E4X_IMG_TYPE_DETECT: {
        reader_ptr img = open_reader(E4X_IMG_TYPE_EWF, a_num_img,
            a_images, a_ssize);
        if (img)
            return img;
        if (e4x_verbose)
            e4x_fprintf(stderr, "e4x_img_open: trying raw: %s\n",
                e4x_error_get());
        e4x_error_reset();
        return open_reader(E4X_IMG_TYPE_RAW, a_num_img, a_images,
            a_ssize);
    }
#else
    case E4X_IMG_TYPE_DETECT:
        return open_reader(E4X_IMG_TYPE_RAW, a_num_img, a_images,
            a_ssize);
#endif

    default:
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_UNSUPTYPE);
        e4x_error_set_errstr("image type 0x%x", (unsigned) a_type);
        return reader_ptr(NULL, close_reader);
    }
}

/**
 * \ingroup imglib
 * Open an image.  Split sets are given as all segment names in order.
 * A single .E01 name stands for its whole EWF segment set.
 *
 * @param a_num_img Number of names in a_images
 * @param a_images Segment paths
 * @param a_type Container format, or E4X_IMG_TYPE_DETECT
 * @param a_ssize Sector size in bytes, 0 for the format's default
 * @returns NULL on error
 */
E4X_IMG_INFO *
e4x_img_open(int a_num_img, const char *const a_images[],
    E4X_IMG_TYPE_ENUM a_type, unsigned int a_ssize)
{
    e4x_error_reset();

    if (!image_names_ok(a_num_img, a_images)
        || !e4x_img_sector_size_ok(a_ssize))
        return NULL;

    if (e4x_verbose)
        e4x_fprintf(stderr, "e4x_img_open: type 0x%x, %d image(s), %s\n",
            (unsigned) a_type, a_num_img, a_images[0]);

    reader_ptr img = open_reader(a_type, a_num_img, a_images, a_ssize);
    if (!img) {
        if (e4x_error_get_errno() == 0)
            e4x_error_set_errno(E4X_ERR_IMG_UNKTYPE);
        return NULL;
    }

    IMG_INFO *iif = reinterpret_cast<IMG_INFO *>(img.get());
    iif->cache = new(std::nothrow) LRUBlockCacheLocking(
        E4X_IMG_INFO_CACHE_NUM, E4X_IMG_INFO_CACHE_LEN);
    if (iif->cache == NULL) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_AUX_MALLOC);
        e4x_error_set_errstr("e4x_img_open: cache");
        return NULL;
    }
    iif->cache_read = e4x_img_read_cache;

    return img.release();
}

/**
 * \ingroup imglib
 * e4x_img_open() for a single name.
 */
E4X_IMG_INFO *
e4x_img_open_sing(const char *a_image, E4X_IMG_TYPE_ENUM a_type,
    unsigned int a_ssize)
{
    const char *const images[] = { a_image };
    return e4x_img_open(1, images, a_type, a_ssize);
}

/**
 * \ingroup imglib
 * Close an image.  NULL and already closed handles are ignored.
 */
void
e4x_img_close(E4X_IMG_INFO * a_img_info)
{
    if (a_img_info == NULL || a_img_info->tag != E4X_IMG_INFO_TAG)
        return;

    IMG_INFO *iif = reinterpret_cast<IMG_INFO *>(a_img_info);
    delete iif->cache;
    iif->cache = NULL;
    iif->close(a_img_info);
}

void *
e4x_img_malloc(size_t a_len)
{
    E4X_IMG_INFO *img = (E4X_IMG_INFO *) e4x_malloc(a_len);
    if (img != NULL)
        img->tag = E4X_IMG_INFO_TAG;
    return img;
}

void
e4x_img_free(void *a_ptr)
{
    E4X_IMG_INFO *img = (E4X_IMG_INFO *) a_ptr;
    if (img == NULL)
        return;
    e4x_img_free_image_names(img);
    img->tag = 0;
    free(img);
}

int
e4x_img_copy_image_names(E4X_IMG_INFO * a_img,
    const char *const a_images[], int a_num)
{
    a_img->images = (char **) e4x_malloc(sizeof(char *) * a_num);
    if (a_img->images == NULL)
        return 0;
    // set first so that a partial copy is still freed
    a_img->num_img = a_num;

    for (int i = 0; i < a_num; i++) {
        const size_t len = strlen(a_images[i]) + 1;
        if ((a_img->images[i] = (char *) e4x_malloc(len)) == NULL)
            return 0;
        memcpy(a_img->images[i], a_images[i], len);
    }
    return 1;
}

void
e4x_img_free_image_names(E4X_IMG_INFO * a_img)
{
    if (a_img->images == NULL)
        return;
    for (int i = 0; i < a_img->num_img; i++)
        free(a_img->images[i]);
    free(a_img->images);
    a_img->images = NULL;
    a_img->num_img = 0;
}
