/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file ext4fs_xattr.cpp
 * Decodes the extended attributes that are stored after the fixed inode
 * fields, in an external attribute block or in attribute value inodes.
 */

#include "e4x_ext4fs.h"

#include <memory>
#include <set>
#include <utility>

/**
 * \internal
 * Name prefix of an attribute name index.
 * @returns "" for unknown indexes
 */
const char *
ext4fs_xattr_prefix(uint8_t name_index)
{
    switch (name_index) {
    case EXT4_XATTR_INDEX_USER:
        return "user.";
    case EXT4_XATTR_INDEX_POSIX_ACL_ACCESS:
        return "system.posix_acl_access";
    case EXT4_XATTR_INDEX_POSIX_ACL_DEFAULT:
        return "system.posix_acl_default";
    case EXT4_XATTR_INDEX_TRUSTED:
        return "trusted.";
    case EXT4_XATTR_INDEX_SECURITY:
        return "security.";
    case EXT4_XATTR_INDEX_SYSTEM:
        return "system.";
    case EXT4_XATTR_INDEX_RICHACL:
        return "system.richacl";
    default:
        return "";
    }
}

/* record a soft failure; the latest one is the one that is reported */
static void
ext4fs_xattr_corrupt(E4X_RETVAL_ENUM * a_ret, E4X_INUM_T a_inum,
    const char *a_where, const char *a_what)
{
    e4x_error_reset();
    e4x_error_set_errno(E4X_ERR_FS_ATTR_COR);
    e4x_error_set_errstr("ext4fs_xattr_load: inode %" PRIuINUM
        " %s: %s", a_inum, a_where, a_what);
    *a_ret = E4X_COR;

    if (e4x_verbose)
        e4x_fprintf(stderr, "ext4fs_xattr_load: inode %" PRIuINUM
            " %s: %s\n", a_inum, a_where, a_what);
}

/** \internal
 * Read an attribute value that is stored as the content of an
 * attribute value inode.
 * @returns 1 if the value could not be read
 */
static uint8_t
ext4fs_xattr_value_inode(EXT4FS_INFO * ext4fs, E4X_INUM_T a_value_inum,
    uint32_t a_size, std::string & a_value)
{
    E4X_FS_INFO *fs = &ext4fs->fs_info;

    if (a_value_inum < fs->first_inum || a_value_inum > fs->last_inum)
        return 1;

    std::unique_ptr < E4X_FS_FILE, decltype(&e4x_fs_file_close) > file {
        e4x_fs_file_open_meta(fs, NULL, a_value_inum), e4x_fs_file_close};
    if (!file)
        return 1;

    // value inodes hold their data in extents, never in attributes
    if ((file->meta->flags & EXT4_IN_EA_INODE) == 0
        || file->meta->content_type != E4X_FS_META_CONTENT_TYPE_EXTENTS
        || file->meta->size < (E4X_OFF_T) a_size)
        return 1;

    a_value.resize(a_size);
    if (a_size == 0)
        return 0;

    ssize_t cnt = e4x_fs_file_read(file.get(), 0, &a_value[0], a_size);
    return cnt != (ssize_t) a_size;
}

/** \internal
 * Decode the entries of one attribute area.
 *
 * @param a_area Start of the area
 * @param a_area_len Length of the area
 * @param a_first Offset of the first entry in the area
 * @param a_value_base Offset that value offsets are relative to
 * @param a_where Name of the area for messages
 * @param a_seen (name index, name) keys already decoded
 * @param a_xattrs Decoded attributes are appended here
 * @param a_ret Set to E4X_COR on soft failures
 */
static void
ext4fs_xattr_parse(EXT4FS_INFO * ext4fs, E4X_INUM_T a_inum,
    const uint8_t * a_area, size_t a_area_len, size_t a_first,
    size_t a_value_base, const char *a_where,
    std::set < std::pair < uint8_t, std::string > > &a_seen,
    std::vector < E4X_FS_XATTR > &a_xattrs, E4X_RETVAL_ENUM * a_ret)
{
    E4X_FS_INFO *fs = &ext4fs->fs_info;
    size_t pos = a_first;
    char msg[256];

    while (pos + 4 <= a_area_len) {
        if (e4x_getu32(fs->endian, &a_area[pos]) == 0)
            return;

        if (pos + sizeof(ext4fs_xattr_entry) > a_area_len) {
            ext4fs_xattr_corrupt(a_ret, a_inum, a_where,
                "entry header runs past the end of the area");
            return;
        }

        const ext4fs_xattr_entry *ent =
            (const ext4fs_xattr_entry *) &a_area[pos];
        const size_t ent_len = EXT4_XATTR_LEN(ent->e_name_len);
        if (pos + ent_len > a_area_len) {
            ext4fs_xattr_corrupt(a_ret, a_inum, a_where,
                "entry name runs past the end of the area");
            return;
        }

        E4X_FS_XATTR xattr;
        xattr.name_index = ent->e_name_index;
        xattr.name.assign((const char *) &a_area[pos +
                sizeof(ext4fs_xattr_entry)], ent->e_name_len);
        xattr.full_name = ext4fs_xattr_prefix(xattr.name_index);
        xattr.full_name += xattr.name;

        const uint32_t value_inum = e4x_getu32(fs->endian, ent->e_value_inum);
        const uint32_t value_size = e4x_getu32(fs->endian, ent->e_value_size);
        const uint16_t value_offs = e4x_getu16(fs->endian, ent->e_value_offs);

        pos += ent_len;

        if (value_inum != 0) {
            if (ext4fs_xattr_value_inode(ext4fs, value_inum, value_size,
                    xattr.value)) {
                snprintf(msg, sizeof(msg),
                    "value of %s in inode %" PRIu32 " is unreadable",
                    xattr.full_name.c_str(), value_inum);
                ext4fs_xattr_corrupt(a_ret, a_inum, a_where, msg);
                continue;
            }
        }
        else {
            const size_t start = a_value_base + value_offs;
            if (start > a_area_len || value_size > a_area_len - start) {
                snprintf(msg, sizeof(msg),
                    "value of %s runs past the end of the area",
                    xattr.full_name.c_str());
                ext4fs_xattr_corrupt(a_ret, a_inum, a_where, msg);
                continue;
            }
            xattr.value.assign((const char *) &a_area[start], value_size);
        }

        // the first occurrence of a key wins, the display name can repeat
        if (a_seen.insert(std::make_pair(xattr.name_index,
                    xattr.name)).second)
            a_xattrs.push_back(xattr);
    }
}

/**
 * \internal
 * Decode the extended attributes of an inode.  The attributes after the
 * fixed inode fields come first, then those of the attribute block.
 * Problems are soft: what could be decoded is returned.
 *
 * @param ext4fs File system
 * @param fs_meta Inode to decode
 * @param xattrs Filled with the attributes
 * @returns E4X_OK, E4X_COR if some attributes are corrupt, E4X_ERR on memory errors
 */
E4X_RETVAL_ENUM
ext4fs_xattr_load(EXT4FS_INFO * ext4fs, const E4X_FS_META * fs_meta,
    std::vector < E4X_FS_XATTR > &xattrs)
{
    E4X_FS_INFO *fs = &ext4fs->fs_info;
    E4X_RETVAL_ENUM ret = E4X_OK;
    std::set < std::pair < uint8_t, std::string > > seen;

    xattrs.clear();

    /* attributes inside the inode */
    const size_t ibody = EXT4FS_GOOD_OLD_INODE_SIZE + fs_meta->extra_isize;
    if (fs_meta->inode_buf != NULL
        && ibody + sizeof(ext4fs_xattr_ibody_header) <= fs_meta->inode_len) {
        const ext4fs_xattr_ibody_header *hdr =
            (const ext4fs_xattr_ibody_header *) &fs_meta->inode_buf[ibody];
        if (e4x_getu32(fs->endian, hdr->h_magic) == EXT4_XATTR_MAGIC) {
            const size_t first = ibody + sizeof(ext4fs_xattr_ibody_header);
            ext4fs_xattr_parse(ext4fs, fs_meta->addr, fs_meta->inode_buf,
                fs_meta->inode_len, first, first, "in-inode attributes",
                seen, xattrs, &ret);
        }
    }

    /* external attribute block */
    if (fs_meta->xattr_block != 0) {
        char where[64];
        snprintf(where, sizeof(where), "attribute block %" PRIuDADDR,
            fs_meta->xattr_block);

        if (fs_meta->xattr_block > fs->last_block_act) {
            ext4fs_xattr_corrupt(&ret, fs_meta->addr, where,
                "block is outside the device");
            return ret;
        }

        std::unique_ptr < uint8_t[], decltype(&free) > blk {
            (uint8_t *) e4x_malloc(fs->block_size), free};
        if (!blk)
            return E4X_ERR;

        ssize_t cnt = e4x_fs_read_block(fs, fs_meta->xattr_block,
            (char *) blk.get(), fs->block_size);
        if (cnt != (ssize_t) fs->block_size) {
            ext4fs_xattr_corrupt(&ret, fs_meta->addr, where,
                "block could not be read");
            return ret;
        }

        const ext4fs_xattr_header *hdr =
            (const ext4fs_xattr_header *) blk.get();
        if (e4x_getu32(fs->endian, hdr->h_magic) != EXT4_XATTR_MAGIC) {
            ext4fs_xattr_corrupt(&ret, fs_meta->addr, where, "bad magic");
            return ret;
        }
        if (e4x_getu32(fs->endian, hdr->h_blocks) != 1) {
            ext4fs_xattr_corrupt(&ret, fs_meta->addr, where,
                "attribute blocks spanning several blocks are not supported");
            return ret;
        }

        ext4fs_xattr_parse(ext4fs, fs_meta->addr, blk.get(),
            fs->block_size, sizeof(ext4fs_xattr_header), 0, where, seen,
            xattrs, &ret);
    }

    return ret;
}

/**
 * \internal
 * Get the part of an inline file that does not fit in the block area,
 * which is the value of the system.data attribute.
 *
 * @param ext4fs File system
 * @param fs_meta Inode with the inline data flag
 * @param tail Set to the attribute value, or emptied if there is none
 * @returns 1 on error
 */
uint8_t
ext4fs_inline_data(EXT4FS_INFO * ext4fs, const E4X_FS_META * fs_meta,
    std::string & tail)
{
    std::vector < E4X_FS_XATTR > xattrs;

    tail.clear();
    if (ext4fs_xattr_load(ext4fs, fs_meta, xattrs) == E4X_ERR)
        return 1;

    for (const E4X_FS_XATTR & xattr : xattrs) {
        if (xattr.name_index == EXT4_XATTR_INDEX_SYSTEM
            && xattr.name == EXT4_XATTR_INLINE_DATA_NAME) {
            tail = xattr.value;
            break;
        }
    }
    e4x_error_reset();
    return 0;
}
