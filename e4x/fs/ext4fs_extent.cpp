/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file ext4fs_extent.cpp
 * Resolves the extent tree of an inode into runs that cover the whole
 * logical range of the file.
 */

#include "e4x_ext4fs.h"

#include <algorithm>
#include <memory>
#include <set>

/* one node that still has to be visited */
typedef struct {
    E4X_DADDR_T addr;           // block holding the node
    uint16_t depth;             // depth the node must declare
} EXT4FS_EXTENT_TODO;

/** \internal
 * Check an extent node header.
 *
 * @param ext4fs File system the node is in
 * @param a_hdr Header to check
 * @param a_capacity Number of entries that fit in the node
 * @param a_depth Expected depth, or -1 for the root node
 * @param a_inum Inode the tree belongs to (for messages)
 * @param a_addr Block holding the node, 0 for the root
 * @returns 1 if the header is corrupt
 */
static uint8_t
ext4fs_extent_header_check(EXT4FS_INFO * ext4fs,
    const ext4fs_extent_header * a_hdr, unsigned int a_capacity,
    int a_depth, E4X_INUM_T a_inum, E4X_DADDR_T a_addr)
{
    E4X_FS_INFO *fs = &ext4fs->fs_info;
    const uint16_t magic = e4x_getu16(fs->endian, a_hdr->eh_magic);
    const uint16_t entries = e4x_getu16(fs->endian, a_hdr->eh_entries);
    const uint16_t max = e4x_getu16(fs->endian, a_hdr->eh_max);
    const uint16_t depth = e4x_getu16(fs->endian, a_hdr->eh_depth);

    e4x_error_reset();
    e4x_error_set_errno(E4X_ERR_FS_EXTENT_COR);

    if (magic != EXT4_EXT_MAGIC) {
        e4x_error_set_errstr("ext4fs_extent_map: inode %" PRIuINUM
            " extent node at block %" PRIuDADDR " has bad magic 0x%04x",
            a_inum, a_addr, magic);
        return 1;
    }
    if (max > a_capacity) {
        e4x_error_set_errstr("ext4fs_extent_map: inode %" PRIuINUM
            " extent node at block %" PRIuDADDR
            " declares %d slots but only %u fit", a_inum, a_addr, max,
            a_capacity);
        return 1;
    }
    if (entries > max) {
        e4x_error_set_errstr("ext4fs_extent_map: inode %" PRIuINUM
            " extent node at block %" PRIuDADDR
            " has %d entries for %d slots", a_inum, a_addr, entries, max);
        return 1;
    }
    if (a_depth < 0) {
        if (depth > ext4fs->max_extent_depth) {
            e4x_error_set_errstr("ext4fs_extent_map: inode %" PRIuINUM
                " extent tree depth %d exceeds %d", a_inum, depth,
                ext4fs->max_extent_depth);
            return 1;
        }
    }
    else if (depth != a_depth) {
        e4x_error_set_errstr("ext4fs_extent_map: inode %" PRIuINUM
            " extent node at block %" PRIuDADDR
            " has depth %d, expected %d", a_inum, a_addr, depth, a_depth);
        return 1;
    }

    e4x_error_reset();
    return 0;
}

/** \internal
 * Decode the entries of one node.  Leaf extents are added to a_extents
 * and child nodes of index entries are pushed on a_todo.
 *
 * @returns 1 if the node is corrupt
 */
static uint8_t
ext4fs_extent_node(EXT4FS_INFO * ext4fs, const uint8_t * a_node,
    E4X_INUM_T a_inum, E4X_DADDR_T a_addr,
    std::vector < E4X_FS_ATTR_RUN > &a_extents,
    std::vector < EXT4FS_EXTENT_TODO > &a_todo)
{
    E4X_FS_INFO *fs = &ext4fs->fs_info;
    const ext4fs_extent_header *hdr = (const ext4fs_extent_header *) a_node;
    const uint16_t entries = e4x_getu16(fs->endian, hdr->eh_entries);
    const uint16_t depth = e4x_getu16(fs->endian, hdr->eh_depth);

    if (depth == 0) {
        const ext4fs_extent *ext = (const ext4fs_extent *) (hdr + 1);
        for (uint16_t i = 0; i < entries; i++, ext++) {
            E4X_FS_ATTR_RUN run;
            uint16_t len = e4x_getu16(fs->endian, ext->ee_len);

            run.flags = E4X_FS_ATTR_RUN_FLAG_NONE;
            if (len > EXT4_EXT_INIT_MAX_LEN) {
                len -= EXT4_EXT_INIT_MAX_LEN;
                run.flags = E4X_FS_ATTR_RUN_FLAG_UNINIT;
            }
            run.offset = e4x_getu32(fs->endian, ext->ee_block);
            run.addr = e4x_getu48_hilo(fs->endian, ext->ee_start_hi,
                ext->ee_start_lo);
            run.len = len;

            if (len == 0) {
                e4x_error_reset();
                e4x_error_set_errno(E4X_ERR_FS_EXTENT_COR);
                e4x_error_set_errstr("ext4fs_extent_map: inode %" PRIuINUM
                    " has an empty extent at logical block %" PRIuDADDR,
                    a_inum, run.offset);
                return 1;
            }
            if (run.addr + run.len - 1 > fs->last_block_act) {
                e4x_error_reset();
                e4x_error_set_errno(E4X_ERR_FS_EXTENT_COR);
                e4x_error_set_errstr("ext4fs_extent_map: inode %" PRIuINUM
                    " extent %" PRIuDADDR "-%" PRIuDADDR
                    " lies outside the device (last block %" PRIuDADDR
                    ")", a_inum, run.addr, run.addr + run.len - 1,
                    fs->last_block_act);
                return 1;
            }
            a_extents.push_back(run);
        }
        return 0;
    }

    // push in reverse so that children are visited in logical order
    const ext4fs_extent_idx *idx = (const ext4fs_extent_idx *) (hdr + 1);
    for (int i = entries - 1; i >= 0; i--) {
        EXT4FS_EXTENT_TODO todo;
        todo.addr = e4x_getu48_hilo(fs->endian, idx[i].ei_leaf_hi,
            idx[i].ei_leaf_lo);
        todo.depth = depth - 1;

        if (todo.addr == 0 || todo.addr > fs->last_block_act) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_FS_EXTENT_COR);
            e4x_error_set_errstr("ext4fs_extent_map: inode %" PRIuINUM
                " extent node at block %" PRIuDADDR
                " points to block %" PRIuDADDR " outside the device",
                a_inum, a_addr, todo.addr);
            return 1;
        }
        a_todo.push_back(todo);
    }
    return 0;
}

/**
 * \internal
 * Resolve the extent tree of an inode.  The returned runs are sorted,
 * do not overlap and cover [0, ceil(size / block_size)) exactly: ranges
 * that no extent maps are returned as sparse runs and extents past the
 * end of the file are clipped.
 *
 * @param ext4fs File system the inode is in
 * @param fs_meta Inode with the extents flag
 * @param runs Filled with the runs
 * @returns E4X_OK, E4X_COR if the tree is corrupt, E4X_ERR on read errors
 */
E4X_RETVAL_ENUM
ext4fs_extent_map(EXT4FS_INFO * ext4fs, const E4X_FS_META * fs_meta,
    std::vector < E4X_FS_ATTR_RUN > &runs)
{
    E4X_FS_INFO *fs = &ext4fs->fs_info;
    const E4X_INUM_T inum = fs_meta->addr;
    std::vector < E4X_FS_ATTR_RUN > extents;
    std::vector < EXT4FS_EXTENT_TODO > todo;
    std::set < E4X_DADDR_T > seen;

    runs.clear();

    if (fs_meta->size < 0
        || (uint64_t) fs_meta->size / fs->block_size > 0xffffffffULL) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_CORRUPT);
        e4x_error_set_errstr("ext4fs_extent_map: inode %" PRIuINUM
            " size %" PRIdOFF " is beyond the extent address space",
            inum, fs_meta->size);
        return E4X_COR;
    }
    const E4X_DADDR_T nblocks =
        ((uint64_t) fs_meta->size + fs->block_size - 1) / fs->block_size;

    if (ext4fs_extent_header_check(ext4fs,
            (const ext4fs_extent_header *) fs_meta->content,
            (E4X_FS_META_CONTENT_LEN -
                sizeof(ext4fs_extent_header)) / sizeof(ext4fs_extent), -1,
            inum, 0))
        return E4X_COR;

    if (ext4fs_extent_node(ext4fs, fs_meta->content, inum, 0, extents, todo))
        return E4X_COR;

    if (!todo.empty()) {
        const unsigned int capacity =
            (fs->block_size - sizeof(ext4fs_extent_header)) /
            sizeof(ext4fs_extent);
        std::unique_ptr < uint8_t[], decltype(&free) > node {
            (uint8_t *) e4x_malloc(fs->block_size), free};
        if (!node)
            return E4X_ERR;

        while (!todo.empty()) {
            EXT4FS_EXTENT_TODO cur = todo.back();
            todo.pop_back();

            if (!seen.insert(cur.addr).second) {
                e4x_error_reset();
                e4x_error_set_errno(E4X_ERR_FS_EXTENT_COR);
                e4x_error_set_errstr("ext4fs_extent_map: inode %" PRIuINUM
                    " extent block %" PRIuDADDR " is referenced twice",
                    inum, cur.addr);
                return E4X_COR;
            }

            ssize_t cnt = e4x_fs_read_block(fs, cur.addr, (char *) node.get(),
                fs->block_size);
            if (cnt != (ssize_t) fs->block_size) {
                if (cnt >= 0) {
                    e4x_error_reset();
                    e4x_error_set_errno(E4X_ERR_FS_READ);
                }
                e4x_error_set_errstr2("ext4fs_extent_map: inode %" PRIuINUM
                    " extent block %" PRIuDADDR, inum, cur.addr);
                return E4X_ERR;
            }

            if (ext4fs_extent_header_check(ext4fs,
                    (const ext4fs_extent_header *) node.get(), capacity,
                    cur.depth, inum, cur.addr))
                return E4X_COR;

            if (ext4fs_extent_node(ext4fs, node.get(), inum, cur.addr,
                    extents, todo))
                return E4X_COR;
        }
    }

    std::stable_sort(extents.begin(), extents.end(),
        [](const E4X_FS_ATTR_RUN & a, const E4X_FS_ATTR_RUN & b) {
            return a.offset < b.offset;
        });

    E4X_DADDR_T next = 0;
    for (size_t i = 0; i < extents.size(); i++) {
        E4X_FS_ATTR_RUN run = extents[i];

        if (i > 0 && extents[i - 1].offset + extents[i - 1].len > run.offset) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_FS_EXTENT_COR);
            e4x_error_set_errstr("ext4fs_extent_map: inode %" PRIuINUM
                " has overlapping extents at logical block %" PRIuDADDR,
                inum, run.offset);
            return E4X_COR;
        }

        if (run.offset >= nblocks)
            continue;
        if (run.offset + run.len > nblocks)
            run.len = nblocks - run.offset;

        if (run.offset > next) {
            E4X_FS_ATTR_RUN hole;
            hole.offset = next;
            hole.addr = 0;
            hole.len = run.offset - next;
            hole.flags = E4X_FS_ATTR_RUN_FLAG_SPARSE;
            runs.push_back(hole);
        }
        runs.push_back(run);
        next = run.offset + run.len;
    }

    if (next < nblocks) {
        E4X_FS_ATTR_RUN hole;
        hole.offset = next;
        hole.addr = 0;
        hole.len = nblocks - next;
        hole.flags = E4X_FS_ATTR_RUN_FLAG_SPARSE;
        runs.push_back(hole);
    }

    if (e4x_verbose)
        e4x_fprintf(stderr, "ext4fs_extent_map: inode %" PRIuINUM
            " has %" PRIuSIZE " extents in %" PRIuSIZE " runs\n", inum,
            extents.size(), runs.size());

    return E4X_OK;
}
