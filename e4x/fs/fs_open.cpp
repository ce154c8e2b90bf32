/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file fs_open.cpp
 * Contains the general code to open a file system and to free the
 * generic handle.
 */

#include "e4x_fs_i.h"

/**
 * \ingroup fslib
 * Opens the ext4 file system that starts at a byte offset of an open
 * disk image.
 *
 * @param a_img_info Disk image to analyze
 * @param a_offset Byte offset to start analyzing from
 *
 * @return NULL on error
 */
E4X_FS_INFO *
e4x_fs_open_img(E4X_IMG_INFO * a_img_info, E4X_OFF_T a_offset)
{
    if (a_img_info == NULL || a_img_info->tag != E4X_IMG_INFO_TAG) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("e4x_fs_open_img: Null or closed image");
        return NULL;
    }

    if (a_offset < 0 || a_offset >= a_img_info->size) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_OFFSET);
        e4x_error_set_errstr("e4x_fs_open_img: offset %" PRIdOFF
            " is outside the image (%" PRIdOFF " bytes)", a_offset,
            a_img_info->size);
        return NULL;
    }

    if (e4x_verbose)
        e4x_fprintf(stderr, "e4x_fs_open_img: opening ext4 at offset %"
            PRIdOFF "\n", a_offset);

    return ext4fs_open(a_img_info, a_offset);
}

/**
 * \ingroup fslib
 * Close an open file system.
 * @param a_fs Pointer to open file system
 */
void
e4x_fs_close(E4X_FS_INFO * a_fs)
{
    if ((a_fs == NULL) || (a_fs->tag != E4X_FS_INFO_TAG))
        return;

    a_fs->close(a_fs);
}

/**
 * \ingroup fslib
 * Print details about the file system to a file handle.
 *
 * @param a_fs File system to print details on
 * @param hFile File handle to print text to
 *
 * @returns 1 on error and 0 on success
 */
uint8_t
e4x_fs_fsstat(E4X_FS_INFO * a_fs, FILE * hFile)
{
    if ((a_fs == NULL) || (a_fs->tag != E4X_FS_INFO_TAG)) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("e4x_fs_fsstat: called with NULL or unallocated structures");
        return 1;
    }
    return a_fs->fsstat(a_fs, hFile);
}

/* allocate a file system structure and set its tag */
E4X_FS_INFO *
e4x_fs_malloc(size_t a_len)
{
    E4X_FS_INFO *fs_info;
    if ((fs_info = (E4X_FS_INFO *) e4x_malloc(a_len)) == NULL)
        return NULL;
    fs_info->tag = E4X_FS_INFO_TAG;
    return fs_info;
}

/* clear the tag and release the structure */
void
e4x_fs_free(E4X_FS_INFO * a_fs_info)
{
    if (a_fs_info == NULL)
        return;
    a_fs_info->tag = 0;
    free(a_fs_info);
}
