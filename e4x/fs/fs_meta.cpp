/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file fs_meta.cpp
 * Contains E4X_FS_META structure management and mode string code.
 */

#include "e4x_fs_i.h"

char e4x_fs_meta_type_str[E4X_FS_META_TYPE_STR_MAX][2] =
    { "-", "-", "d", "p", "c", "b", "l", "s" };

/**
 * \internal
 * Allocate an empty meta structure.
 * @returns NULL on error
 */
E4X_FS_META *
e4x_fs_meta_alloc()
{
    E4X_FS_META *fs_meta;

    if ((fs_meta = (E4X_FS_META *) e4x_malloc(sizeof(E4X_FS_META))) == NULL)
        return NULL;

    fs_meta->tag = E4X_FS_META_TAG;
    return fs_meta;
}

/**
 * \internal
 * Clear the fields so that the structure can be reused for another inode.
 */
void
e4x_fs_meta_reset(E4X_FS_META * a_fs_meta)
{
    free(a_fs_meta->inode_buf);
    memset(a_fs_meta, 0, sizeof(E4X_FS_META));
    a_fs_meta->tag = E4X_FS_META_TAG;
}

/**
 * \internal
 * Free the memory of a meta structure.
 */
void
e4x_fs_meta_close(E4X_FS_META * fs_meta)
{
    if ((fs_meta == NULL) || (fs_meta->tag != E4X_FS_META_TAG))
        return;

    fs_meta->tag = 0;
    free(fs_meta->inode_buf);
    fs_meta->inode_buf = NULL;
    free(fs_meta);
}

/**
 * \ingroup fslib
 * Make a string of the type and permissions in the style of "ls -l".
 *
 * @param a_fs_meta Metadata to make the string for
 * @param a_buf Buffer to store the string in (at least 11 bytes)
 * @param a_len Length of a_buf
 *
 * @returns 1 on error and 0 on success
 */
uint8_t
e4x_fs_meta_make_ls(const E4X_FS_META * a_fs_meta, char *a_buf,
    size_t a_len)
{
    if (a_len < 11) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("e4x_fs_meta_make_ls: buffer too short");
        return 1;
    }

    /* set the type */
    if (a_fs_meta->type < E4X_FS_META_TYPE_STR_MAX)
        a_buf[0] = e4x_fs_meta_type_str[a_fs_meta->type][0];
    else
        a_buf[0] = '-';

    /* user perms */
    a_buf[1] = (a_fs_meta->mode & E4X_FS_META_MODE_IRUSR) ? 'r' : '-';
    a_buf[2] = (a_fs_meta->mode & E4X_FS_META_MODE_IWUSR) ? 'w' : '-';
    if (a_fs_meta->mode & E4X_FS_META_MODE_ISUID)
        a_buf[3] = (a_fs_meta->mode & E4X_FS_META_MODE_IXUSR) ? 's' : 'S';
    else
        a_buf[3] = (a_fs_meta->mode & E4X_FS_META_MODE_IXUSR) ? 'x' : '-';

    /* group perms */
    a_buf[4] = (a_fs_meta->mode & E4X_FS_META_MODE_IRGRP) ? 'r' : '-';
    a_buf[5] = (a_fs_meta->mode & E4X_FS_META_MODE_IWGRP) ? 'w' : '-';
    if (a_fs_meta->mode & E4X_FS_META_MODE_ISGID)
        a_buf[6] = (a_fs_meta->mode & E4X_FS_META_MODE_IXGRP) ? 's' : 'S';
    else
        a_buf[6] = (a_fs_meta->mode & E4X_FS_META_MODE_IXGRP) ? 'x' : '-';

    /* other perms */
    a_buf[7] = (a_fs_meta->mode & E4X_FS_META_MODE_IROTH) ? 'r' : '-';
    a_buf[8] = (a_fs_meta->mode & E4X_FS_META_MODE_IWOTH) ? 'w' : '-';

    /* sticky bit */
    if (a_fs_meta->mode & E4X_FS_META_MODE_ISVTX)
        a_buf[9] = (a_fs_meta->mode & E4X_FS_META_MODE_IXOTH) ? 't' : 'T';
    else
        a_buf[9] = (a_fs_meta->mode & E4X_FS_META_MODE_IXOTH) ? 'x' : '-';

    a_buf[10] = '\0';
    return 0;
}
