/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file ext4fs_dent.cpp
 * Iterates the entries of ext4 directories, one block (or inline region)
 * at a time.
 */

#include "e4x_ext4fs.h"

#include <new>
#include <utility>

/*
 * State of an open directory.  Only the block (or inline region) that
 * is being parsed is kept in memory.
 */
struct E4X_FS_DIR {
    int tag;
    E4X_FS_INFO *fs_info;
    E4X_INUM_T addr;            // inode of the directory
    E4X_FS_FILE *fs_file;       // the directory itself

    bool is_inline;
    E4X_INUM_T parent;          // parent inode of inline directories
    int synth;                  // number of "." / ".." entries returned
    std::string inline_data;    // block area followed by system.data
    std::vector < std::pair < size_t, size_t > >regions;  // offset, length
    size_t region_idx;

    std::vector < E4X_FS_ATTR_RUN > runs;
    size_t run_idx;
    E4X_DADDR_T run_blk;        // next block in runs[run_idx]
    std::vector < uint8_t > block;

    const uint8_t *cur;         // region being parsed
    size_t cur_len;
    size_t pos;                 // offset of the next entry in cur
    E4X_OFF_T consumed;         // record lengths consumed so far
};

#define E4X_FS_DIR_TAG 0x57531246

static E4X_FS_NAME_TYPE_ENUM
ext4fs_dent_type(uint8_t a_type)
{
    switch (a_type) {
    case EXT4_DE_REG:
        return E4X_FS_NAME_TYPE_REG;
    case EXT4_DE_DIR:
        return E4X_FS_NAME_TYPE_DIR;
    case EXT4_DE_CHR:
        return E4X_FS_NAME_TYPE_CHR;
    case EXT4_DE_BLK:
        return E4X_FS_NAME_TYPE_BLK;
    case EXT4_DE_FIFO:
        return E4X_FS_NAME_TYPE_FIFO;
    case EXT4_DE_SOCK:
        return E4X_FS_NAME_TYPE_SOCK;
    case EXT4_DE_LNK:
        return E4X_FS_NAME_TYPE_LNK;
    default:
        return E4X_FS_NAME_TYPE_UNDEF;
    }
}

/* fill in one of the entries that inline directories do not store */
static void
ext4fs_dent_synth(E4X_FS_NAME * a_fs_name, const char *a_name,
    E4X_INUM_T a_inum)
{
    a_fs_name->meta_addr = a_inum;
    a_fs_name->type = E4X_FS_NAME_TYPE_DIR;
    a_fs_name->name_len = strlen(a_name);
    a_fs_name->rec_len = 0;
    strncpy(a_fs_name->name, a_name, E4X_FS_NAME_MAX + 1);
}

/** \internal
 * Parse the next used entry of the current region.
 *
 * @returns E4X_OK if an entry was found, E4X_STOP at the end of the
 * region and E4X_COR if the region is corrupt
 */
static E4X_RETVAL_ENUM
ext4fs_dent_parse(E4X_FS_DIR * a_fs_dir, E4X_FS_NAME * a_fs_name)
{
    EXT4FS_INFO *ext4fs = (EXT4FS_INFO *) a_fs_dir->fs_info;
    E4X_FS_INFO *fs = &ext4fs->fs_info;

    while (a_fs_dir->pos < a_fs_dir->cur_len) {
        const size_t remain = a_fs_dir->cur_len - a_fs_dir->pos;

        // slack after the last entry is padding
        if (remain < EXT4FS_DENTRY_MIN_LEN) {
            a_fs_dir->consumed += remain;
            a_fs_dir->pos = a_fs_dir->cur_len;
            break;
        }

        const uint8_t *ent = a_fs_dir->cur + a_fs_dir->pos;
        const ext4fs_dentry2 *dent2 = (const ext4fs_dentry2 *) ent;
        const uint32_t inum = e4x_getu32(fs->endian, dent2->inode);
        size_t rec_len = e4x_getu16(fs->endian, dent2->rec_len);
        if (fs->block_size >= 65536 && (rec_len == 65535 || rec_len == 0))
            rec_len = 65536;

        size_t name_len;
        uint8_t type = EXT4_DE_UNKNOWN;
        if (ext4fs->deentry_type == EXT4_DE_V2) {
            name_len = dent2->name_len;
            type = dent2->type;
        }
        else {
            const ext4fs_dentry1 *dent1 = (const ext4fs_dentry1 *) ent;
            name_len = e4x_getu16(fs->endian, dent1->name_len);
        }

        if (rec_len < EXT4FS_DENTRY_MIN_LEN || rec_len > remain
            || name_len + EXT4FS_DENTRY_HDR_LEN > rec_len) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_FS_DIR_COR);
            e4x_error_set_errstr("ext4fs_dent_parse: directory %" PRIuINUM
                " entry at offset %" PRIuSIZE " has record length %"
                PRIuSIZE " and name length %" PRIuSIZE " with %" PRIuSIZE
                " bytes left", a_fs_dir->addr, a_fs_dir->pos, rec_len,
                name_len, remain);
            // give up on the rest of this region
            a_fs_dir->pos = a_fs_dir->cur_len;
            return E4X_COR;
        }

        a_fs_dir->pos += rec_len;
        a_fs_dir->consumed += rec_len;

        // unused entry
        if (inum == 0)
            continue;

        a_fs_name->meta_addr = inum;
        a_fs_name->type = ext4fs_dent_type(type);
        a_fs_name->name_len = name_len;
        a_fs_name->rec_len = (uint32_t) rec_len;
        size_t copy = name_len > E4X_FS_NAME_MAX ? E4X_FS_NAME_MAX : name_len;
        memcpy(a_fs_name->name, ent + EXT4FS_DENTRY_HDR_LEN, copy);
        a_fs_name->name[copy] = '\0';
        return E4X_OK;
    }
    return E4X_STOP;
}

/** \internal
 * Make the next block or inline region current.
 *
 * @returns E4X_OK, E4X_STOP if there is none left, E4X_ERR on read errors
 */
static E4X_RETVAL_ENUM
ext4fs_dent_load_next(E4X_FS_DIR * a_fs_dir)
{
    E4X_FS_INFO *fs = a_fs_dir->fs_info;

    a_fs_dir->cur = NULL;
    a_fs_dir->cur_len = 0;
    a_fs_dir->pos = 0;

    if (a_fs_dir->is_inline) {
        if (a_fs_dir->region_idx >= a_fs_dir->regions.size())
            return E4X_STOP;
        const std::pair < size_t, size_t > &region =
            a_fs_dir->regions[a_fs_dir->region_idx++];
        a_fs_dir->cur =
            (const uint8_t *) a_fs_dir->inline_data.data() + region.first;
        a_fs_dir->cur_len = region.second;
        return E4X_OK;
    }

    while (a_fs_dir->run_idx < a_fs_dir->runs.size()) {
        const E4X_FS_ATTR_RUN & run = a_fs_dir->runs[a_fs_dir->run_idx];

        // holes in directories carry no entries
        if (run.flags != E4X_FS_ATTR_RUN_FLAG_NONE
            || a_fs_dir->run_blk >= run.len) {
            a_fs_dir->run_idx++;
            a_fs_dir->run_blk = 0;
            continue;
        }

        const E4X_DADDR_T addr = run.addr + a_fs_dir->run_blk++;
        ssize_t cnt = e4x_fs_read_block(fs, addr,
            (char *) a_fs_dir->block.data(), fs->block_size);
        if (cnt != (ssize_t) fs->block_size) {
            if (cnt >= 0) {
                e4x_error_reset();
                e4x_error_set_errno(E4X_ERR_FS_READ);
            }
            e4x_error_set_errstr2("ext4fs_dent_load_next: directory %"
                PRIuINUM " block %" PRIuDADDR, a_fs_dir->addr, addr);
            return E4X_ERR;
        }
        a_fs_dir->cur = a_fs_dir->block.data();
        a_fs_dir->cur_len = fs->block_size;
        return E4X_OK;
    }
    return E4X_STOP;
}

/** \internal
 * Set up the inline regions of a directory with the inline data flag.
 * @returns 1 on error
 */
static uint8_t
ext4fs_dent_inline(E4X_FS_DIR * a_fs_dir)
{
    EXT4FS_INFO *ext4fs = (EXT4FS_INFO *) a_fs_dir->fs_info;
    E4X_FS_META *fs_meta = a_fs_dir->fs_file->meta;
    std::string tail;

    if (ext4fs_inline_data(ext4fs, fs_meta, tail))
        return 1;

    a_fs_dir->is_inline = true;
    a_fs_dir->inline_data.assign((const char *) fs_meta->content,
        E4X_FS_META_CONTENT_LEN);
    a_fs_dir->inline_data += tail;
    a_fs_dir->parent = e4x_getu32(ext4fs->fs_info.endian, fs_meta->content);

    a_fs_dir->regions.push_back(std::make_pair((size_t)
            EXT4_INLINE_DOTDOT_SIZE,
            (size_t) (E4X_FS_META_CONTENT_LEN - EXT4_INLINE_DOTDOT_SIZE)));
    if (!tail.empty())
        a_fs_dir->regions.push_back(std::make_pair((size_t)
                E4X_FS_META_CONTENT_LEN, tail.size()));
    return 0;
}

/**
 * \ingroup fslib
 * Open a directory given its inode.  Entries are decoded as they are
 * asked for with e4x_fs_dir_next().
 *
 * @param a_fs File system the directory is in
 * @param a_addr Inode of the directory
 * @returns NULL on error
 */
E4X_FS_DIR *
e4x_fs_dir_open_meta(E4X_FS_INFO * a_fs, E4X_INUM_T a_addr)
{
    if ((a_fs == NULL) || (a_fs->tag != E4X_FS_INFO_TAG)) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("e4x_fs_dir_open_meta: called with NULL or unallocated structures");
        return NULL;
    }

    if (e4x_verbose)
        e4x_fprintf(stderr,
            "e4x_fs_dir_open_meta: Processing directory %" PRIuINUM "\n",
            a_addr);

    E4X_FS_FILE *fs_file = e4x_fs_file_open_meta(a_fs, NULL, a_addr);
    if (fs_file == NULL) {
        e4x_error_errstr2_concat(" - e4x_fs_dir_open_meta");
        return NULL;
    }

    if (fs_file->meta->type != E4X_FS_META_TYPE_DIR) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("e4x_fs_dir_open_meta: inode %" PRIuINUM
            " is not a directory", a_addr);
        e4x_fs_file_close(fs_file);
        return NULL;
    }

    E4X_FS_DIR *fs_dir = new(std::nothrow) E4X_FS_DIR();
    if (fs_dir == NULL) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_AUX_MALLOC);
        e4x_error_set_errstr("e4x_fs_dir_open_meta: out of memory");
        e4x_fs_file_close(fs_file);
        return NULL;
    }
    fs_dir->tag = E4X_FS_DIR_TAG;
    fs_dir->fs_info = a_fs;
    fs_dir->addr = a_addr;
    fs_dir->fs_file = fs_file;

    switch (fs_file->meta->content_type) {
    case E4X_FS_META_CONTENT_TYPE_INLINE:
        if (ext4fs_dent_inline(fs_dir)) {
            e4x_fs_dir_close(fs_dir);
            return NULL;
        }
        break;

    case E4X_FS_META_CONTENT_TYPE_EXTENTS:
    case E4X_FS_META_CONTENT_TYPE_MAPPED:
        if (e4x_fs_file_extents(fs_file, fs_dir->runs) != E4X_OK) {
            e4x_error_errstr2_concat(" - e4x_fs_dir_open_meta: directory %"
                PRIuINUM, a_addr);
            e4x_fs_dir_close(fs_dir);
            return NULL;
        }
        fs_dir->block.resize(a_fs->block_size);
        break;

    default:
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_CORRUPT);
        e4x_error_set_errstr("e4x_fs_dir_open_meta: directory %" PRIuINUM
            " has no content", a_addr);
        e4x_fs_dir_close(fs_dir);
        return NULL;
    }

    return fs_dir;
}

/**
 * \ingroup fslib
 * Get the next used entry of a directory.  Unused entries are skipped.
 * After E4X_COR the rest of the corrupt block is skipped and the next
 * call continues with the following block.
 *
 * @param a_fs_dir Directory to read from
 * @param a_fs_name Filled with the entry
 * @returns E4X_OK, E4X_STOP when there are no more entries, E4X_COR
 * for a corrupt entry, E4X_ERR on read errors
 */
E4X_RETVAL_ENUM
e4x_fs_dir_next(E4X_FS_DIR * a_fs_dir, E4X_FS_NAME * a_fs_name)
{
    if ((a_fs_dir == NULL) || (a_fs_dir->tag != E4X_FS_DIR_TAG)
        || (a_fs_name == NULL)) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("e4x_fs_dir_next: called with NULL or unallocated structures");
        return E4X_ERR;
    }

    if (a_fs_dir->is_inline && a_fs_dir->synth < 2) {
        if (a_fs_dir->synth++ == 0)
            ext4fs_dent_synth(a_fs_name, ".", a_fs_dir->addr);
        else
            ext4fs_dent_synth(a_fs_name, "..", a_fs_dir->parent);
        return E4X_OK;
    }

    while (true) {
        if (a_fs_dir->cur != NULL) {
            E4X_RETVAL_ENUM ret = ext4fs_dent_parse(a_fs_dir, a_fs_name);
            if (ret != E4X_STOP)
                return ret;
        }

        E4X_RETVAL_ENUM ret = ext4fs_dent_load_next(a_fs_dir);
        if (ret != E4X_OK)
            return ret;
    }
}

/**
 * \ingroup fslib
 * Start over at the first entry of a directory.
 */
void
e4x_fs_dir_rewind(E4X_FS_DIR * a_fs_dir)
{
    if ((a_fs_dir == NULL) || (a_fs_dir->tag != E4X_FS_DIR_TAG))
        return;

    a_fs_dir->synth = 0;
    a_fs_dir->region_idx = 0;
    a_fs_dir->run_idx = 0;
    a_fs_dir->run_blk = 0;
    a_fs_dir->cur = NULL;
    a_fs_dir->cur_len = 0;
    a_fs_dir->pos = 0;
    a_fs_dir->consumed = 0;
}

/**
 * \ingroup fslib
 * Number of bytes of directory data parsed so far, counting unused
 * entries and the padding at the end of blocks.
 */
E4X_OFF_T
e4x_fs_dir_consumed(const E4X_FS_DIR * a_fs_dir)
{
    if ((a_fs_dir == NULL) || (a_fs_dir->tag != E4X_FS_DIR_TAG))
        return 0;
    return a_fs_dir->consumed;
}

/**
 * \ingroup fslib
 * Close a directory that was opened with e4x_fs_dir_open_meta().
 */
void
e4x_fs_dir_close(E4X_FS_DIR * a_fs_dir)
{
    if ((a_fs_dir == NULL) || (a_fs_dir->tag != E4X_FS_DIR_TAG))
        return;

    a_fs_dir->tag = 0;
    e4x_fs_file_close(a_fs_dir->fs_file);
    a_fs_dir->fs_file = NULL;
    delete a_fs_dir;
}
