/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _E4X_FS_I_H
#define _E4X_FS_I_H

/*
 * Contains the internal library definitions for the file system functions.  This should
 * be included by the code in the file system library.
 */

// Include the other internal header files
#include "e4x/base/e4x_base_i.h"
#include "e4x/img/e4x_img_i.h"

// Include the external file
#include "e4x_fs.h"

#include <time.h>
#include <string.h>

    /* Macro to combine the upper and lower 32-bit parts of a 64-bit value */
#define e4x_getu64_hilo(endian, hi, lo) \
    ((((uint64_t) e4x_getu32(endian, hi)) << 32) | e4x_getu32(endian, lo))

/* Macro to combine a 16-bit upper and a 32-bit lower part into 48 bits */
#define e4x_getu48_hilo(endian, hi, lo) \
    ((((uint64_t) e4x_getu16(endian, hi)) << 32) | e4x_getu32(endian, lo))

    /* fs_open.cpp */
    extern E4X_FS_INFO *e4x_fs_malloc(size_t);
    extern void e4x_fs_free(E4X_FS_INFO *);

    /* fs_meta.cpp */
    extern E4X_FS_META *e4x_fs_meta_alloc();
    extern void e4x_fs_meta_reset(E4X_FS_META *);
    extern void e4x_fs_meta_close(E4X_FS_META * fs_meta);

    /* fs_file.cpp */
    extern E4X_FS_FILE *e4x_fs_file_alloc(E4X_FS_INFO *);

    /* ext4 entry point */
    extern E4X_FS_INFO *ext4fs_open(E4X_IMG_INFO *, E4X_OFF_T);

#endif
