/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/*
 * Raw reader: a dd file, a split dd set or a block device.
 */

#ifndef _E4X_RAW_H
#define _E4X_RAW_H

#include "e4x_img_i.h"

extern E4X_IMG_INFO *raw_open(int a_num_img, const char *const a_images[],
    unsigned int a_ssize);

typedef struct {
    IMG_INFO img_info;

    int *fds;                   ///< Read-only descriptor per segment, -1 if unopened
    E4X_OFF_T *max_off;         ///< Image offset just past each segment
} IMG_RAW_INFO;

#endif
