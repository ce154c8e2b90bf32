/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file ext4fs.cpp
 * Contains the internal functions to open an ext4 file system, decode
 * its superblock and group descriptors, and load inodes.
 */

#include "e4x_ext4fs.h"

#include <memory>

/** \internal
 * Return 1 if the group holds a copy of the superblock and group
 * descriptors.  With sparse_super only groups 0, 1 and powers of 3, 5
 * and 7 do.
 */
static int
ext4fs_bg_has_super(EXT4FS_INFO * ext4fs, EXT4_GRPNUM_T a_grp)
{
    if (!EXT4FS_HAS_RO_COMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_RO_COMPAT_SPARSE_SUPER))
        return 1;
    if (a_grp <= 1)
        return 1;

    for (EXT4_GRPNUM_T base = 3; base <= 7; base += 2) {
        EXT4_GRPNUM_T p = base;
        while (p < a_grp)
            p *= base;
        if (p == a_grp)
            return 1;
    }
    return 0;
}

/** \internal
 * Block that holds descriptor block number a_gdblk of the table.
 * Without meta_bg the table follows the primary superblock.  With it,
 * each meta group keeps its one descriptor block in its first group.
 */
static E4X_DADDR_T
ext4fs_gd_block(EXT4FS_INFO * ext4fs, EXT4_GRPNUM_T a_gdblk)
{
    E4X_DADDR_T first_meta_bg =
        e4x_getu32(ext4fs->fs_info.endian, ext4fs->fs->s_first_meta_bg);

    if (!EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_INCOMPAT_META_BG)
        || a_gdblk < first_meta_bg) {
        return ext4fs->first_data_block + 1 + a_gdblk;
    }

    const EXT4_GRPNUM_T per_block = ext4fs->fs_info.block_size /
        ext4fs->gd_size;
    const EXT4_GRPNUM_T grp = a_gdblk * per_block;
    return ext4fs->first_data_block +
        (E4X_DADDR_T) grp * ext4fs->blocks_per_group +
        ext4fs_bg_has_super(ext4fs, grp);
}

/** \internal
 * Verify the crc16 of one group descriptor: uuid, little endian group
 * number, then the descriptor with the checksum field left out.
 */
static uint16_t
ext4fs_gd_csum(EXT4FS_INFO * ext4fs, EXT4_GRPNUM_T a_grp,
    const uint8_t * a_gd)
{
    uint8_t grp_le[4];
    uint16_t crc;

    grp_le[0] = (uint8_t) (a_grp & 0xff);
    grp_le[1] = (uint8_t) ((a_grp >> 8) & 0xff);
    grp_le[2] = (uint8_t) ((a_grp >> 16) & 0xff);
    grp_le[3] = (uint8_t) ((a_grp >> 24) & 0xff);

    crc = e4x_crc16(~0, ext4fs->fs->s_uuid, sizeof(ext4fs->fs->s_uuid));
    crc = e4x_crc16(crc, grp_le, sizeof(grp_le));
    crc = e4x_crc16(crc, a_gd, EXT4FS_GD_CHECKSUM_OFF);
    if (ext4fs->gd_size > EXT4FS_GD_CHECKSUM_OFF + 2) {
        crc = e4x_crc16(crc, a_gd + EXT4FS_GD_CHECKSUM_OFF + 2,
            ext4fs->gd_size - EXT4FS_GD_CHECKSUM_OFF - 2);
    }
    return crc;
}

/** \internal
 * Decode one on-disk group descriptor.
 */
static void
ext4fs_gd_copy(EXT4FS_INFO * ext4fs, EXT4_GRPNUM_T a_grp,
    const uint8_t * a_raw, EXT4FS_GROUP * a_group)
{
    E4X_FS_INFO *fs = &ext4fs->fs_info;
    ext4fs_gd gd;

    memset(&gd, 0, sizeof(gd));
    memcpy(&gd, a_raw,
        ext4fs->gd_size < sizeof(gd) ? ext4fs->gd_size : sizeof(gd));

    a_group->block_bitmap = e4x_getu32(fs->endian, gd.bg_block_bitmap_lo);
    a_group->inode_bitmap = e4x_getu32(fs->endian, gd.bg_inode_bitmap_lo);
    a_group->inode_table = e4x_getu32(fs->endian, gd.bg_inode_table_lo);
    a_group->free_blocks_count =
        e4x_getu16(fs->endian, gd.bg_free_blocks_count_lo);
    a_group->free_inodes_count =
        e4x_getu16(fs->endian, gd.bg_free_inodes_count_lo);
    a_group->used_dirs_count =
        e4x_getu16(fs->endian, gd.bg_used_dirs_count_lo);

    // the high words are only meaningful in 64-bit descriptors
    if (ext4fs->gd_size >= EXT4FS_GD_SIZE_64BIT) {
        a_group->block_bitmap |=
            (E4X_DADDR_T) e4x_getu32(fs->endian, gd.bg_block_bitmap_hi) << 32;
        a_group->inode_bitmap |=
            (E4X_DADDR_T) e4x_getu32(fs->endian, gd.bg_inode_bitmap_hi) << 32;
        a_group->inode_table |=
            (E4X_DADDR_T) e4x_getu32(fs->endian, gd.bg_inode_table_hi) << 32;
        a_group->free_blocks_count |=
            (uint32_t) e4x_getu16(fs->endian, gd.bg_free_blocks_count_hi) << 16;
        a_group->free_inodes_count |=
            (uint32_t) e4x_getu16(fs->endian, gd.bg_free_inodes_count_hi) << 16;
        a_group->used_dirs_count |=
            (uint32_t) e4x_getu16(fs->endian, gd.bg_used_dirs_count_hi) << 16;
    }

    a_group->flags = e4x_getu16(fs->endian, gd.bg_flags);
    a_group->checksum = e4x_getu16(fs->endian, gd.bg_checksum);
    a_group->checksum_ok = 1;

    if (EXT4FS_HAS_RO_COMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_RO_COMPAT_GDT_CSUM)
        && !EXT4FS_HAS_RO_COMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_RO_COMPAT_METADATA_CSUM)) {
        uint16_t crc = ext4fs_gd_csum(ext4fs, a_grp, a_raw);
        if (crc != a_group->checksum) {
            a_group->checksum_ok = 0;
            ext4fs->gd_csum_bad++;
            if (e4x_verbose)
                e4x_fprintf(stderr,
                    "ext4fs_gd_copy: group %" PRI_EXT4GRP
                    " checksum mismatch (stored 0x%04x, computed 0x%04x)\n",
                    a_grp, a_group->checksum, crc);
        }
    }
}

/** \internal
 * Read and decode the whole group descriptor table.
 *
 * @returns 1 on error
 */
static uint8_t
ext4fs_group_load(EXT4FS_INFO * ext4fs)
{
    E4X_FS_INFO *fs = &ext4fs->fs_info;
    const EXT4_GRPNUM_T per_block = fs->block_size / ext4fs->gd_size;
    const EXT4_GRPNUM_T gd_blocks =
        (ext4fs->groups_count + per_block - 1) / per_block;

    if (!EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs, EXT4FS_FEATURE_INCOMPAT_META_BG)
        && ext4fs->first_data_block + gd_blocks > fs->last_block_act) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_CORRUPT);
        e4x_error_set_errstr("ext4fs_group_load: group descriptor table (%"
            PRI_EXT4GRP " blocks) extends past the end of the device",
            gd_blocks);
        return 1;
    }

    ext4fs->groups = (EXT4FS_GROUP *) e4x_malloc(sizeof(EXT4FS_GROUP) *
        ext4fs->groups_count);
    if (ext4fs->groups == NULL)
        return 1;

    std::unique_ptr<uint8_t[], decltype(&free)> buf{
        (uint8_t *) e4x_malloc(fs->block_size), free };
    if (!buf)
        return 1;

    for (EXT4_GRPNUM_T b = 0; b < gd_blocks; b++) {
        const E4X_DADDR_T addr = ext4fs_gd_block(ext4fs, b);

        if (addr > fs->last_block_act) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_FS_CORRUPT);
            e4x_error_set_errstr("ext4fs_group_load: group descriptor block %"
                PRIuDADDR " is past the end of the device (last block %"
                PRIuDADDR ")", addr, fs->last_block_act);
            return 1;
        }

        ssize_t cnt = e4x_fs_read_block(fs, addr, (char *) buf.get(),
            fs->block_size);
        if (cnt != (ssize_t) fs->block_size) {
            if (cnt >= 0) {
                e4x_error_reset();
                e4x_error_set_errno(E4X_ERR_FS_CORRUPT);
            }
            e4x_error_set_errstr2("ext4fs_group_load: descriptor block %"
                PRIuDADDR, addr);
            return 1;
        }

        for (EXT4_GRPNUM_T i = 0; i < per_block; i++) {
            const EXT4_GRPNUM_T grp = b * per_block + i;
            if (grp >= ext4fs->groups_count)
                break;
            ext4fs_gd_copy(ext4fs, grp, buf.get() + i * ext4fs->gd_size,
                &ext4fs->groups[grp]);
        }
    }

    if (e4x_verbose && ext4fs->gd_csum_bad)
        e4x_fprintf(stderr,
            "ext4fs_group_load: %" PRI_EXT4GRP
            " group descriptors failed their checksum\n",
            ext4fs->gd_csum_bad);

    return 0;
}

/** \internal
 * Decode a 32-bit on-disk time plus its extra word.  The two low bits
 * of the extra word extend the epoch; the rest is nanoseconds.
 */
static void
ext4fs_decode_time(E4X_ENDIAN_ENUM endian, const uint8_t * a_sec,
    const uint8_t * a_extra, time_t * a_time, uint32_t * a_nano)
{
    int64_t sec = e4x_gets32(endian, a_sec);
    uint32_t extra = 0;

    if (a_extra != NULL)
        extra = e4x_getu32(endian, a_extra);
    sec += ((int64_t) (extra & 0x3)) << 32;

    *a_time = (time_t) sec;
    *a_nano = extra >> 2;
}

/** \internal
 * Read the raw inode record for inum into a_buf (ext4fs->inode_size bytes).
 *
 * @returns 1 on error
 */
static uint8_t
ext4fs_dinode_load(EXT4FS_INFO * ext4fs, E4X_INUM_T dino_inum,
    uint8_t * a_buf)
{
    E4X_FS_INFO *fs = &ext4fs->fs_info;

    if ((dino_inum < fs->first_inum) || (dino_inum > fs->last_inum)) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_INODE_NUM);
        e4x_error_set_errstr("ext4fs_dinode_load: address: %" PRIuINUM,
            dino_inum);
        return 1;
    }

    const EXT4_GRPNUM_T grp = (dino_inum - 1) / ext4fs->inodes_per_group;
    const uint64_t rel = (dino_inum - 1) % ext4fs->inodes_per_group;
    if (grp >= ext4fs->groups_count) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_INODE_NUM);
        e4x_error_set_errstr("ext4fs_dinode_load: address: %" PRIuINUM
            " is in group %" PRI_EXT4GRP " of %" PRI_EXT4GRP, dino_inum,
            grp, ext4fs->groups_count);
        return 1;
    }

    const EXT4FS_GROUP *group = &ext4fs->groups[grp];

    // an uninitialized inode table reads as zeros
    if ((group->flags & EXT4_BG_INODE_UNINIT)
        && EXT4FS_HAS_RO_COMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_RO_COMPAT_GDT_CSUM
            | EXT4FS_FEATURE_RO_COMPAT_METADATA_CSUM)) {
        memset(a_buf, 0, ext4fs->inode_size);
        return 0;
    }

    const uint64_t rel_off = rel * ext4fs->inode_size;
    const E4X_DADDR_T last_blk = group->inode_table +
        (rel_off + ext4fs->inode_size - 1) / fs->block_size;
    if (group->inode_table == 0 || last_blk > fs->last_block_act) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_CORRUPT);
        e4x_error_set_errstr("ext4fs_dinode_load: inode table of group %"
            PRI_EXT4GRP " (block %" PRIuDADDR ") is outside the file system",
            grp, group->inode_table);
        return 1;
    }

    const E4X_OFF_T addr =
        (E4X_OFF_T) group->inode_table * fs->block_size + rel_off;
    ssize_t cnt = e4x_fs_read(fs, addr, (char *) a_buf, ext4fs->inode_size);
    if (cnt != ext4fs->inode_size) {
        if (cnt >= 0) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_FS_CORRUPT);
            e4x_error_set_errstr("ext4fs_dinode_load: short read");
        }
        e4x_error_set_errstr2("ext4fs_dinode_load: Inode %" PRIuINUM
            " from %" PRIdOFF, dino_inum, addr);
        return 1;
    }

    return 0;
}

/* file type bits of i_mode */
static E4X_FS_META_TYPE_ENUM
ext4fs_mode_to_type(uint16_t a_mode)
{
    switch (a_mode & EXT4_IN_FMT) {
    case EXT4_IN_REG:   return E4X_FS_META_TYPE_REG;
    case EXT4_IN_DIR:   return E4X_FS_META_TYPE_DIR;
    case EXT4_IN_LNK:   return E4X_FS_META_TYPE_LNK;
    case EXT4_IN_CHR:   return E4X_FS_META_TYPE_CHR;
    case EXT4_IN_BLK:   return E4X_FS_META_TYPE_BLK;
    case EXT4_IN_FIFO:  return E4X_FS_META_TYPE_FIFO;
    case EXT4_IN_SOCK:  return E4X_FS_META_TYPE_SOCK;
    default:            return E4X_FS_META_TYPE_UNDEF;
    }
}

/** \internal
 * Copy the fields of a raw inode into the generic meta structure.
 *
 * @returns 1 on error
 */
static uint8_t
ext4fs_dinode_copy(EXT4FS_INFO * ext4fs, E4X_FS_META * fs_meta,
    E4X_INUM_T inum, const uint8_t * a_buf)
{
    E4X_FS_INFO *fs = &ext4fs->fs_info;
    const ext4fs_inode *dino = (const ext4fs_inode *) a_buf;
    const uint16_t imode = e4x_getu16(fs->endian, dino->i_mode);

    fs_meta->addr = inum;

    fs_meta->type = ext4fs_mode_to_type(imode);

    // the permission bits share their values with the mode enum
    fs_meta->mode = (E4X_FS_META_MODE_ENUM) (imode & 07777);

    fs_meta->nlink = e4x_getu16(fs->endian, dino->i_nlink);
    fs_meta->size = (E4X_OFF_T) e4x_getu64_hilo(fs->endian,
        dino->i_size_high, dino->i_size);

    fs_meta->uid = e4x_getu16(fs->endian, dino->i_uid) |
        ((E4X_UID_T) e4x_getu16(fs->endian, dino->i_uid_high) << 16);
    fs_meta->gid = e4x_getu16(fs->endian, dino->i_gid) |
        ((E4X_GID_T) e4x_getu16(fs->endian, dino->i_gid_high) << 16);

    fs_meta->flags = e4x_getu32(fs->endian, dino->i_flags);
    fs_meta->xattr_block = e4x_getu48_hilo(fs->endian,
        dino->i_file_acl_high, dino->i_file_acl);

    /* the space after the first 128 bytes only exists in large inodes,
     * and a bogus i_extra_isize must not take us past the record */
    fs_meta->extra_isize = 0;
    if (ext4fs->inode_size > EXT4FS_GOOD_OLD_INODE_SIZE) {
        uint16_t extra = e4x_getu16(fs->endian, dino->i_extra_isize);
        if (EXT4FS_GOOD_OLD_INODE_SIZE + (size_t) extra >
            ext4fs->inode_size || (extra & 3)) {
            if (e4x_verbose)
                e4x_fprintf(stderr,
                    "ext4fs_dinode_copy: inode %" PRIuINUM
                    " has invalid i_extra_isize %d\n", inum, extra);
        }
        else {
            fs_meta->extra_isize = extra;
        }
    }

    const uint16_t extra_isize = fs_meta->extra_isize;
    ext4fs_decode_time(fs->endian, dino->i_atime,
        EXT4FS_INODE_HAS_FIELD(extra_isize, i_atime_extra) ?
        dino->i_atime_extra : NULL, &fs_meta->atime, &fs_meta->atime_nano);
    ext4fs_decode_time(fs->endian, dino->i_mtime,
        EXT4FS_INODE_HAS_FIELD(extra_isize, i_mtime_extra) ?
        dino->i_mtime_extra : NULL, &fs_meta->mtime, &fs_meta->mtime_nano);
    ext4fs_decode_time(fs->endian, dino->i_ctime,
        EXT4FS_INODE_HAS_FIELD(extra_isize, i_ctime_extra) ?
        dino->i_ctime_extra : NULL, &fs_meta->ctime, &fs_meta->ctime_nano);
    if (EXT4FS_INODE_HAS_FIELD(extra_isize, i_crtime)) {
        ext4fs_decode_time(fs->endian, dino->i_crtime,
            EXT4FS_INODE_HAS_FIELD(extra_isize, i_crtime_extra) ?
            dino->i_crtime_extra : NULL, &fs_meta->crtime,
            &fs_meta->crtime_nano);
    }
    else {
        fs_meta->crtime = 0;
        fs_meta->crtime_nano = 0;
    }

    memcpy(fs_meta->content, dino->i_block, E4X_FS_META_CONTENT_LEN);

    // decide how the content is addressed
    if (fs_meta->flags & EXT4_IN_EXTENTS) {
        fs_meta->content_type = E4X_FS_META_CONTENT_TYPE_EXTENTS;
    }
    else if (fs_meta->flags & EXT4_IN_INLINE_DATA) {
        fs_meta->content_type = E4X_FS_META_CONTENT_TYPE_INLINE;
    }
    else if (fs_meta->type == E4X_FS_META_TYPE_LNK
        && fs_meta->size < E4X_FS_META_CONTENT_LEN) {
        fs_meta->content_type = E4X_FS_META_CONTENT_TYPE_FAST_LINK;
    }
    else if (fs_meta->type == E4X_FS_META_TYPE_REG
        || fs_meta->type == E4X_FS_META_TYPE_DIR
        || fs_meta->type == E4X_FS_META_TYPE_LNK) {
        fs_meta->content_type = E4X_FS_META_CONTENT_TYPE_MAPPED;
    }
    else {
        fs_meta->content_type = E4X_FS_META_CONTENT_TYPE_DEFAULT;
    }

    free(fs_meta->inode_buf);
    fs_meta->inode_buf = (uint8_t *) e4x_malloc(ext4fs->inode_size);
    if (fs_meta->inode_buf == NULL) {
        fs_meta->inode_len = 0;
        return 1;
    }
    memcpy(fs_meta->inode_buf, a_buf, ext4fs->inode_size);
    fs_meta->inode_len = ext4fs->inode_size;

    return 0;
}

/** \internal
 * Load the inode into the file structure (file_add_meta callback).
 *
 * @returns 1 on error
 */
static uint8_t
ext4fs_inode_lookup(E4X_FS_INFO * fs, E4X_FS_FILE * a_fs_file,
    E4X_INUM_T inum)
{
    EXT4FS_INFO *ext4fs = (EXT4FS_INFO *) fs;

    if (a_fs_file == NULL) {
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("ext4fs_inode_lookup: fs_file is NULL");
        return 1;
    }

    if (a_fs_file->meta == NULL) {
        if ((a_fs_file->meta = e4x_fs_meta_alloc()) == NULL)
            return 1;
    }
    else {
        e4x_fs_meta_reset(a_fs_file->meta);
    }

    std::unique_ptr<uint8_t[], decltype(&free)> dino_buf{
        (uint8_t *) e4x_malloc(ext4fs->inode_size), free };
    if (!dino_buf)
        return 1;

    if (ext4fs_dinode_load(ext4fs, inum, dino_buf.get()))
        return 1;

    if (ext4fs_dinode_copy(ext4fs, a_fs_file->meta, inum, dino_buf.get()))
        return 1;

    return 0;
}

/**
 * \internal
 * Print details about the file system to a file handle.
 *
 * @param fs File system to print details on
 * @param hFile File handle to print text to
 *
 * @returns 1 on error and 0 on success
 */
static uint8_t
ext4fs_fsstat(E4X_FS_INFO * fs, FILE * hFile)
{
    EXT4FS_INFO *ext4fs = (EXT4FS_INFO *) fs;
    ext4fs_sb *sb = ext4fs->fs;
    char volname[sizeof(sb->s_volume_name) + 1];
    char lastmnt[sizeof(sb->s_last_mounted) + 1];

    // e4x_fs_open_img guarantees fs is valid
    e4x_error_reset();

    memcpy(volname, sb->s_volume_name, sizeof(sb->s_volume_name));
    volname[sizeof(sb->s_volume_name)] = '\0';
    memcpy(lastmnt, sb->s_last_mounted, sizeof(sb->s_last_mounted));
    lastmnt[sizeof(sb->s_last_mounted)] = '\0';

    e4x_fprintf(hFile, "FILE SYSTEM INFORMATION\n");
    e4x_fprintf(hFile, "--------------------------------------------\n");
    e4x_fprintf(hFile, "File System Type: Ext4\n");
    e4x_fprintf(hFile, "Volume Name: %s\n", volname);
    e4x_fprintf(hFile, "Volume ID: ");
    for (size_t i = fs->fs_id_used; i > 0; i--)
        e4x_fprintf(hFile, "%02x", fs->fs_id[i - 1]);
    e4x_fprintf(hFile, "\n");
    e4x_fprintf(hFile, "Last Mounted at: %s\n", lastmnt);

    e4x_fprintf(hFile, "\nRevision: %" PRIu32 "\n",
        e4x_getu32(fs->endian, sb->s_rev_level));
    e4x_fprintf(hFile, "Compat Features: 0x%08" PRIx32 "\n",
        ext4fs->feat_compat);

    e4x_fprintf(hFile, "InCompat Features: ");
    if (EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_INCOMPAT_FILETYPE))
        e4x_fprintf(hFile, "Filetype, ");
    if (EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_INCOMPAT_META_BG))
        e4x_fprintf(hFile, "Meta Block Groups, ");
    if (EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_INCOMPAT_EXTENTS))
        e4x_fprintf(hFile, "Extents, ");
    if (EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs, EXT4FS_FEATURE_INCOMPAT_64BIT))
        e4x_fprintf(hFile, "64bit, ");
    if (EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_INCOMPAT_FLEX_BG))
        e4x_fprintf(hFile, "Flexible Block Groups, ");
    if (EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_INCOMPAT_EA_INODE))
        e4x_fprintf(hFile, "Extended Attributes in Inodes, ");
    if (EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_INCOMPAT_INLINE_DATA))
        e4x_fprintf(hFile, "Inline Data, ");
    e4x_fprintf(hFile, "\n");

    e4x_fprintf(hFile, "Read Only Compat Features: ");
    if (EXT4FS_HAS_RO_COMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_RO_COMPAT_SPARSE_SUPER))
        e4x_fprintf(hFile, "Sparse Super, ");
    if (EXT4FS_HAS_RO_COMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_RO_COMPAT_LARGE_FILE))
        e4x_fprintf(hFile, "Large File, ");
    if (EXT4FS_HAS_RO_COMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_RO_COMPAT_HUGE_FILE))
        e4x_fprintf(hFile, "Huge File, ");
    if (EXT4FS_HAS_RO_COMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_RO_COMPAT_GDT_CSUM))
        e4x_fprintf(hFile, "Group Descriptor Checksums, ");
    if (EXT4FS_HAS_RO_COMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_RO_COMPAT_EXTRA_ISIZE))
        e4x_fprintf(hFile, "Extra Inode Size, ");
    if (EXT4FS_HAS_RO_COMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_RO_COMPAT_METADATA_CSUM))
        e4x_fprintf(hFile, "Metadata Checksums, ");
    e4x_fprintf(hFile, "\n");

    e4x_fprintf(hFile, "\nMETADATA INFORMATION\n");
    e4x_fprintf(hFile, "--------------------------------------------\n");
    e4x_fprintf(hFile, "Inode Range: %" PRIuINUM " - %" PRIuINUM "\n",
        fs->first_inum, fs->last_inum);
    e4x_fprintf(hFile, "First Non-reserved Inode: %" PRIu32 "\n",
        ext4fs->first_ino);
    e4x_fprintf(hFile, "Root Directory: %" PRIuINUM "\n", fs->root_inum);
    e4x_fprintf(hFile, "Free Inodes: %" PRIu32 "\n",
        e4x_getu32(fs->endian, sb->s_free_inode_count));
    e4x_fprintf(hFile, "Inode Size: %" PRIu16 "\n", ext4fs->inode_size);

    e4x_fprintf(hFile, "\nCONTENT INFORMATION\n");
    e4x_fprintf(hFile, "--------------------------------------------\n");
    e4x_fprintf(hFile, "Block Range: %" PRIuDADDR " - %" PRIuDADDR "\n",
        fs->first_block, fs->last_block);
    if (fs->last_block != fs->last_block_act)
        e4x_fprintf(hFile,
            "Total Range in Image: %" PRIuDADDR " - %" PRIuDADDR "\n",
            fs->first_block, fs->last_block_act);
    e4x_fprintf(hFile, "Block Size: %u\n", fs->block_size);
    e4x_fprintf(hFile, "Blocks Per Group: %" PRIu32 "\n",
        ext4fs->blocks_per_group);
    e4x_fprintf(hFile, "Inodes Per Group: %" PRIu32 "\n",
        ext4fs->inodes_per_group);
    e4x_fprintf(hFile, "Group Descriptor Size: %" PRIu16 "\n",
        ext4fs->gd_size);
    e4x_fprintf(hFile, "Number of Block Groups: %" PRI_EXT4GRP "\n",
        ext4fs->groups_count);
    if (ext4fs->gd_csum_bad)
        e4x_fprintf(hFile, "Group Descriptors with Bad Checksums: %"
            PRI_EXT4GRP "\n", ext4fs->gd_csum_bad);

    return 0;
}

static void
ext4fs_close(E4X_FS_INFO * fs)
{
    EXT4FS_INFO *ext4fs = (EXT4FS_INFO *) fs;

    fs->tag = 0;
    free(ext4fs->fs);
    free(ext4fs->groups);
    e4x_fs_free(fs);
}

/** \internal
 * Deepest extent tree that can address 2^32 logical blocks: the root
 * holds 4 entries and every block (block_size - 12) / 12.
 */
static uint16_t
ext4fs_max_extent_depth(unsigned int a_block_size)
{
    const uint64_t per_block = (a_block_size -
        sizeof(ext4fs_extent_header)) / sizeof(ext4fs_extent);
    uint64_t reach = (EXT4FS_FILE_CONTENT_LEN -
        sizeof(ext4fs_extent_header)) / sizeof(ext4fs_extent);
    uint16_t depth = 0;

    while (reach < ((uint64_t) 1 << 32) && depth < EXT4_EXT_MAX_DEPTH) {
        reach *= per_block;
        depth++;
    }
    return depth;
}

/**
 * \internal
 * Open part of a disk image as an ext4 file system.
 *
 * @param img_info Disk image to analyze
 * @param offset Byte offset where file system starts
 * @returns NULL on error or if data is not an ext4 file system
 */
E4X_FS_INFO *
ext4fs_open(E4X_IMG_INFO * img_info, E4X_OFF_T offset)
{
    EXT4FS_INFO *ext4fs;
    E4X_FS_INFO *fs;
    ssize_t cnt;

    // clean up any error messages that are lying around
    e4x_error_reset();

    if (img_info->sector_size == 0) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("ext4fs_open: sector size is 0");
        return NULL;
    }

    const auto deleter = [](EXT4FS_INFO * a_ext4fs) {
        ext4fs_close((E4X_FS_INFO *) a_ext4fs);
    };
    std::unique_ptr<EXT4FS_INFO, decltype(deleter)> holder{
        (EXT4FS_INFO *) e4x_fs_malloc(sizeof(EXT4FS_INFO)), deleter };
    if (!holder)
        return NULL;

    ext4fs = holder.get();
    fs = &(ext4fs->fs_info);
    fs->img_info = img_info;
    fs->offset = offset;
    fs->endian = E4X_LIT_ENDIAN;

    /* read the superblock */
    if ((ext4fs->fs = (ext4fs_sb *) e4x_malloc(sizeof(ext4fs_sb))) == NULL)
        return NULL;

    cnt = e4x_fs_read(fs, EXT4FS_SBOFF, (char *) ext4fs->fs,
        sizeof(ext4fs_sb));
    if (cnt != sizeof(ext4fs_sb)) {
        if (cnt >= 0) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_FS_MAGIC);
            e4x_error_set_errstr("ext4fs_open: image too small for a superblock");
        }
        e4x_error_set_errstr2("ext4fs_open: superblock");
        return NULL;
    }

    ext4fs_sb *sb = ext4fs->fs;

    if (e4x_getu16(fs->endian, sb->s_magic) != EXT4FS_FS_MAGIC) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_MAGIC);
        e4x_error_set_errstr("not an ext4 file system (magic 0x%04x)",
            e4x_getu16(fs->endian, sb->s_magic));
        if (e4x_verbose)
            e4x_fprintf(stderr, "ext4fs_open: invalid magic\n");
        return NULL;
    }

    ext4fs->feat_compat = e4x_getu32(fs->endian, sb->s_feature_compat);
    ext4fs->feat_incompat = e4x_getu32(fs->endian, sb->s_feature_incompat);
    ext4fs->feat_ro_compat = e4x_getu32(fs->endian, sb->s_feature_ro_compat);

    /* block size */
    const uint32_t log_bsize = e4x_getu32(fs->endian, sb->s_log_block_size);
    if (log_bsize > EXT4FS_MAX_LOG_BLOCK_SIZE) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_MAGIC);
        e4x_error_set_errstr("not an ext4 file system (block size 2^%" PRIu32
            " KiB)", log_bsize);
        return NULL;
    }
    fs->block_size = EXT4FS_MIN_BLOCK_SIZE << log_bsize;

    ext4fs->blocks_per_group = e4x_getu32(fs->endian, sb->s_blocks_per_group);
    ext4fs->inodes_per_group = e4x_getu32(fs->endian, sb->s_inodes_per_group);
    if (ext4fs->blocks_per_group == 0 || ext4fs->inodes_per_group == 0) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_MAGIC);
        e4x_error_set_errstr("not an ext4 file system (blocks per group %"
            PRIu32 ", inodes per group %" PRIu32 ")",
            ext4fs->blocks_per_group, ext4fs->inodes_per_group);
        return NULL;
    }

    /* inode size and first inode depend on the revision */
    fs->first_inum = EXT4FS_FIRSTINO;
    if (e4x_getu32(fs->endian, sb->s_rev_level) == EXT4FS_REV_ORIG) {
        ext4fs->inode_size = EXT4FS_GOOD_OLD_INODE_SIZE;
        ext4fs->first_ino = EXT4FS_FIRSTINO_REV0;
    }
    else {
        ext4fs->inode_size = e4x_getu16(fs->endian, sb->s_inode_size);
        ext4fs->first_ino = e4x_getu32(fs->endian, sb->s_first_ino);
        if (ext4fs->inode_size < EXT4FS_GOOD_OLD_INODE_SIZE
            || ext4fs->inode_size > fs->block_size
            || (ext4fs->inode_size & (ext4fs->inode_size - 1))) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_FS_MAGIC);
            e4x_error_set_errstr("ext4fs_open: invalid inode size %" PRIu16,
                ext4fs->inode_size);
            return NULL;
        }
    }

    /* only extent based file systems are supported */
    if (!EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs,
            EXT4FS_FEATURE_INCOMPAT_EXTENTS)) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_UNSUPFEAT);
        e4x_error_set_errstr("ext4fs_open: file system does not use extents"
            " (incompat features 0x%08" PRIx32 ")", ext4fs->feat_incompat);
        return NULL;
    }

    if (e4x_verbose) {
        const uint32_t known = EXT4FS_FEATURE_INCOMPAT_FILETYPE
            | EXT4FS_FEATURE_INCOMPAT_RECOVER
            | EXT4FS_FEATURE_INCOMPAT_META_BG
            | EXT4FS_FEATURE_INCOMPAT_EXTENTS
            | EXT4FS_FEATURE_INCOMPAT_64BIT
            | EXT4FS_FEATURE_INCOMPAT_MMP
            | EXT4FS_FEATURE_INCOMPAT_FLEX_BG
            | EXT4FS_FEATURE_INCOMPAT_EA_INODE
            | EXT4FS_FEATURE_INCOMPAT_CSUM_SEED
            | EXT4FS_FEATURE_INCOMPAT_LARGEDIR
            | EXT4FS_FEATURE_INCOMPAT_INLINE_DATA;
        if (ext4fs->feat_incompat & ~known)
            e4x_fprintf(stderr,
                "ext4fs_open: unhandled incompat features 0x%08" PRIx32
                ", continuing\n", ext4fs->feat_incompat & ~known);
    }

    /* group descriptor size */
    if (EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs, EXT4FS_FEATURE_INCOMPAT_64BIT)) {
        ext4fs->gd_size = e4x_getu16(fs->endian, sb->s_desc_size);
        if (ext4fs->gd_size < EXT4FS_GD_SIZE_64BIT
            || ext4fs->gd_size > fs->block_size
            || (ext4fs->gd_size & (ext4fs->gd_size - 1))) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_FS_MAGIC);
            e4x_error_set_errstr("ext4fs_open: invalid descriptor size %"
                PRIu16, ext4fs->gd_size);
            return NULL;
        }
    }
    else {
        ext4fs->gd_size = EXT4FS_GD_SIZE;
    }

    /* block counts */
    fs->block_count = e4x_getu32(fs->endian, sb->s_blocks_count);
    if (EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs, EXT4FS_FEATURE_INCOMPAT_64BIT))
        fs->block_count |=
            (E4X_DADDR_T) e4x_getu32(fs->endian, sb->s_blocks_count_hi) << 32;
    ext4fs->first_data_block =
        e4x_getu32(fs->endian, sb->s_first_data_block);

    if (fs->block_count <= ext4fs->first_data_block) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_MAGIC);
        e4x_error_set_errstr("ext4fs_open: block count %" PRIuDADDR
            " does not exceed the first data block %" PRIuDADDR,
            fs->block_count, ext4fs->first_data_block);
        return NULL;
    }

    fs->first_block = 0;
    fs->last_block_act = fs->last_block = fs->block_count - 1;
    if ((E4X_DADDR_T) ((img_info->size - offset) / fs->block_size) <
        fs->block_count) {
        if ((img_info->size - offset) / fs->block_size == 0) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_FS_MAGIC);
            e4x_error_set_errstr("ext4fs_open: image smaller than one block");
            return NULL;
        }
        fs->last_block_act =
            (img_info->size - offset) / fs->block_size - 1;
    }

    ext4fs->groups_count = (EXT4_GRPNUM_T) ((fs->block_count -
            ext4fs->first_data_block + ext4fs->blocks_per_group - 1) /
        ext4fs->blocks_per_group);

    /* inode numbers */
    fs->inum_count = e4x_getu32(fs->endian, sb->s_inodes_count);
    if (fs->inum_count < EXT4FS_ROOTINO
        || fs->inum_count >
        (uint64_t) ext4fs->inodes_per_group * ext4fs->groups_count) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_MAGIC);
        e4x_error_set_errstr("ext4fs_open: inode count %" PRIuINUM
            " inconsistent with %" PRI_EXT4GRP " groups of %" PRIu32,
            fs->inum_count, ext4fs->groups_count, ext4fs->inodes_per_group);
        return NULL;
    }
    fs->last_inum = fs->inum_count;
    fs->root_inum = EXT4FS_ROOTINO;

    /* file system id */
    for (fs->fs_id_used = 0; fs->fs_id_used < 16; fs->fs_id_used++) {
        fs->fs_id[fs->fs_id_used] = sb->s_uuid[fs->fs_id_used];
    }

    if (EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs, EXT4FS_FEATURE_INCOMPAT_FILETYPE))
        ext4fs->deentry_type = EXT4_DE_V2;
    else
        ext4fs->deentry_type = EXT4_DE_V1;

    ext4fs->max_extent_depth = ext4fs_max_extent_depth(fs->block_size);

    if (ext4fs_group_load(ext4fs))
        return NULL;

    /* Set the generic function pointers */
    fs->file_add_meta = ext4fs_inode_lookup;
    fs->fsstat = ext4fs_fsstat;
    fs->close = ext4fs_close;

    if (e4x_verbose)
        e4x_fprintf(stderr,
            "ext4fs_open: inodes %" PRIuINUM " root ino %" PRIuINUM
            " blocks %" PRIuDADDR " block size %u groups %" PRI_EXT4GRP
            " desc size %" PRIu16 "\n", fs->inum_count, fs->root_inum,
            fs->block_count, fs->block_size, ext4fs->groups_count,
            ext4fs->gd_size);

    return (E4X_FS_INFO *) holder.release();
}
