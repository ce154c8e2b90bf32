/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file fs_io.cpp
 * Contains functions to read data from a disk image and wrapper functions to read file content.
 */

#include "e4x_fs_i.h"

/**
 * \ingroup fslib
 * Read arbitrary data from inside of the file system.
 * @param a_fs The file system handle.
 * @param a_off The byte offset to start reading from (relative to start of file system)
 * @param a_buf The buffer to store the block in.
 * @param a_len The number of bytes to read
 * @return The number of bytes read or -1 on error.
 */
ssize_t
e4x_fs_read(E4X_FS_INFO * a_fs, E4X_OFF_T a_off, char *a_buf, size_t a_len)
{
    if (a_fs == NULL || a_fs->img_info == NULL || a_buf == NULL) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("e4x_fs_read: NULL argument");
        return -1;
    }

    if (a_off < 0) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_READ_OFF);
        e4x_error_set_errstr("e4x_fs_read: negative offset %" PRIdOFF,
            a_off);
        return -1;
    }

    // do a sanity check on the read bounds, but only if the block
    // value has been set
    if ((a_fs->block_size > 0)
        && ((E4X_DADDR_T) a_off >=
            ((a_fs->last_block_act + 1) * a_fs->block_size))) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_READ);
        if ((E4X_DADDR_T) a_off <
            ((a_fs->last_block + 1) * a_fs->block_size))
            e4x_error_set_errstr
                ("e4x_fs_read: Offset missing in partial image: %"
                PRIdOFF, a_off);
        else
            e4x_error_set_errstr
                ("e4x_fs_read: Offset is too large for image: %"
                PRIdOFF, a_off);
        return -1;
    }

    ssize_t cnt = e4x_img_read(a_fs->img_info, a_off + a_fs->offset,
        a_buf, a_len);
    if (cnt < 0) {
        e4x_error_errstr2_concat(" - e4x_fs_read: offset %" PRIdOFF,
            a_off);
    }
    return cnt;
}

/**
 * \ingroup fslib
 * Read a file system block.
 * @param a_fs The file system handle.
 * @param a_addr The starting block file system address.
 * @param a_buf The char * buffer to store the block data in.
 * @param a_len The number of bytes to read (must be a multiple of the block size)
 * @return The number of bytes read or -1 on error.
 */
ssize_t
e4x_fs_read_block(E4X_FS_INFO * a_fs, E4X_DADDR_T a_addr, char *a_buf,
    size_t a_len)
{
    if (a_fs == NULL || a_fs->block_size == 0
        || a_len % a_fs->block_size) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_READ);
        e4x_error_set_errstr("e4x_fs_read_block: length %" PRIuSIZE
            " not a multiple of %u", a_len,
            a_fs == NULL ? 0 : a_fs->block_size);
        return -1;
    }

    if (a_addr > a_fs->last_block_act) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_READ);
        if (a_addr <= a_fs->last_block)
            e4x_error_set_errstr
                ("e4x_fs_read_block: Address missing in partial image: %"
                PRIuDADDR, a_addr);
        else
            e4x_error_set_errstr
                ("e4x_fs_read_block: Address is too large for image: %"
                PRIuDADDR, a_addr);
        return -1;
    }

    return e4x_fs_read(a_fs, (E4X_OFF_T) (a_addr * a_fs->block_size),
        a_buf, a_len);
}
