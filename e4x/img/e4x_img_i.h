/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/*
 * Shared by the image layer sources and the format readers.
 */
#ifndef _E4X_IMG_I_H
#define _E4X_IMG_I_H

#include "e4x/base/e4x_base_i.h"
#include "e4x_img.h"

#include <errno.h>
#include <string.h>

class LRUBlockCacheLocking;

/*
 * Every format reader allocates a struct that starts with this one and
 * sets read and close.  e4x_img_open() then attaches the cache.
 */
struct IMG_INFO {
    E4X_IMG_INFO img_info;

    LRUBlockCacheLocking *cache;
    ssize_t (*cache_read)(E4X_IMG_INFO *, E4X_OFF_T, char *, size_t);

    // the reader's own read: may return fewer bytes than asked
    ssize_t (*read)(E4X_IMG_INFO *, E4X_OFF_T, char *, size_t);
    void (*close)(E4X_IMG_INFO *);
};

// zeroed allocation with the tag set, released by e4x_img_free()
extern void *e4x_img_malloc(size_t);
extern void e4x_img_free(void *);

// @returns 0 on error
extern int e4x_img_copy_image_names(E4X_IMG_INFO *,
    const char *const a_images[], int a_num);
extern void e4x_img_free_image_names(E4X_IMG_INFO *);

extern bool e4x_img_sector_size_ok(unsigned int a_ssize);

extern ssize_t e4x_img_read_cache(E4X_IMG_INFO *, E4X_OFF_T, char *,
    size_t);

#endif
