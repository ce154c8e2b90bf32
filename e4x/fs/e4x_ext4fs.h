/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/*
 * ext4 on-disk layout and the handle of an open ext4 file system.
 * Multi-byte fields are byte arrays read with e4x_getu16/32 so the
 * structs can be laid over any buffer.  Only the fields this library
 * reads are named; the rest are pad_<offset> arrays.
 */

#ifndef _E4X_EXT4FS_H
#define _E4X_EXT4FS_H

#include "e4x_fs_i.h"

#include <stddef.h>

#ifdef __cplusplus
#include <string>
#include <vector>

extern "C" {
#endif

    typedef uint64_t EXT4_GRPNUM_T;
#define PRI_EXT4GRP	PRIu64

#define EXT4FS_FIRSTINO		1       /* bad blocks inode */
#define EXT4FS_ROOTINO		2
#define EXT4FS_FIRSTINO_REV0	11
#define EXT4FS_SBOFF		1024    /* byte offset of the primary superblock */
#define EXT4FS_FS_MAGIC		0xef53
#define EXT4FS_MIN_BLOCK_SIZE	1024
#define EXT4FS_MAX_LOG_BLOCK_SIZE	6       /* 64 KiB */
#define EXT4FS_GOOD_OLD_INODE_SIZE	128
#define EXT4FS_GD_SIZE		32
#define EXT4FS_GD_SIZE_64BIT	64
#define EXT4FS_FILE_CONTENT_LEN	60

/* ---- superblock ---- */

    typedef struct {
        uint8_t s_inodes_count[4];          // 0x000
        uint8_t s_blocks_count[4];          // 0x004
        uint8_t pad_008[8];                 // 0x008 reserved and free block counts
        uint8_t s_free_inode_count[4];      // 0x010
        uint8_t s_first_data_block[4];      // 0x014
        uint8_t s_log_block_size[4];        // 0x018
        uint8_t s_log_cluster_size[4];      // 0x01c
        uint8_t s_blocks_per_group[4];      // 0x020
        uint8_t s_clusters_per_group[4];    // 0x024
        uint8_t s_inodes_per_group[4];      // 0x028
        uint8_t pad_02c[12];                // 0x02c mount times and counts
        uint8_t s_magic[2];                 // 0x038
        uint8_t s_state[2];                 // 0x03a
        uint8_t pad_03c[16];                // 0x03c errors, minor rev, fsck times, creator os
        uint8_t s_rev_level[4];             // 0x04c
        uint8_t pad_050[4];                 // 0x050 default reserved uid and gid
        uint8_t s_first_ino[4];             // 0x054
        uint8_t s_inode_size[2];            // 0x058
        uint8_t pad_05a[2];                 // 0x05a s_block_group_nr
        uint8_t s_feature_compat[4];        // 0x05c
        uint8_t s_feature_incompat[4];      // 0x060
        uint8_t s_feature_ro_compat[4];     // 0x064
        uint8_t s_uuid[16];                 // 0x068
        char s_volume_name[16];             // 0x078
        char s_last_mounted[64];            // 0x088
        uint8_t pad_0c8[54];                // 0x0c8 prealloc, journal, orphan list, htree hash
        uint8_t s_desc_size[2];             // 0x0fe
        uint8_t pad_100[4];                 // 0x100 s_default_mount_opts
        uint8_t s_first_meta_bg[4];         // 0x104
        uint8_t pad_108[72];                // 0x108 s_mkfs_time, journal inode backup
        uint8_t s_blocks_count_hi[4];       // 0x150 64bit only
        uint8_t pad_154[684];               // 0x154
    } ext4fs_sb;

#define EXT4FS_STATE_VALID	0x0001

#define EXT4FS_REV_ORIG		0
#define EXT4FS_REV_DYN		1

#define EXT4FS_HAS_INCOMPAT_FEATURE(ext4fs, mask) \
    (((ext4fs)->feat_incompat & (mask)) != 0)
#define EXT4FS_HAS_RO_COMPAT_FEATURE(ext4fs, mask) \
    (((ext4fs)->feat_ro_compat & (mask)) != 0)

#define EXT4FS_FEATURE_COMPAT_EXT_ATTR		0x0008

#define EXT4FS_FEATURE_INCOMPAT_FILETYPE	0x0002
#define EXT4FS_FEATURE_INCOMPAT_RECOVER		0x0004
#define EXT4FS_FEATURE_INCOMPAT_META_BG		0x0010
#define EXT4FS_FEATURE_INCOMPAT_EXTENTS		0x0040
#define EXT4FS_FEATURE_INCOMPAT_64BIT		0x0080
#define EXT4FS_FEATURE_INCOMPAT_MMP		0x0100
#define EXT4FS_FEATURE_INCOMPAT_FLEX_BG		0x0200
#define EXT4FS_FEATURE_INCOMPAT_EA_INODE	0x0400
#define EXT4FS_FEATURE_INCOMPAT_CSUM_SEED	0x2000
#define EXT4FS_FEATURE_INCOMPAT_LARGEDIR	0x4000
#define EXT4FS_FEATURE_INCOMPAT_INLINE_DATA	0x8000

#define EXT4FS_FEATURE_RO_COMPAT_SPARSE_SUPER	0x0001
#define EXT4FS_FEATURE_RO_COMPAT_LARGE_FILE	0x0002
#define EXT4FS_FEATURE_RO_COMPAT_HUGE_FILE	0x0008
#define EXT4FS_FEATURE_RO_COMPAT_GDT_CSUM	0x0010
#define EXT4FS_FEATURE_RO_COMPAT_EXTRA_ISIZE	0x0040
#define EXT4FS_FEATURE_RO_COMPAT_METADATA_CSUM	0x0400

/* ---- group descriptors ---- */

    /* 32 bytes long unless 64bit is set, then s_desc_size (>= 64) */
    typedef struct {
        uint8_t bg_block_bitmap_lo[4];      // 0x00
        uint8_t bg_inode_bitmap_lo[4];      // 0x04
        uint8_t bg_inode_table_lo[4];       // 0x08
        uint8_t bg_free_blocks_count_lo[2]; // 0x0c
        uint8_t bg_free_inodes_count_lo[2]; // 0x0e
        uint8_t bg_used_dirs_count_lo[2];   // 0x10
        uint8_t bg_flags[2];                // 0x12
        uint8_t pad_014[10];                // 0x14 snapshot bitmap, bitmap checksums, itable unused
        uint8_t bg_checksum[2];             // 0x1e
        uint8_t bg_block_bitmap_hi[4];      // 0x20
        uint8_t bg_inode_bitmap_hi[4];      // 0x24
        uint8_t bg_inode_table_hi[4];       // 0x28
        uint8_t bg_free_blocks_count_hi[2]; // 0x2c
        uint8_t bg_free_inodes_count_hi[2]; // 0x2e
        uint8_t bg_used_dirs_count_hi[2];   // 0x30
        uint8_t pad_032[14];                // 0x32
    } ext4fs_gd;

#define EXT4FS_GD_CHECKSUM_OFF	0x1e

#define EXT4_BG_INODE_UNINIT	0x0001

    /* a group descriptor with the _hi halves folded in */
    typedef struct {
        E4X_DADDR_T block_bitmap;
        E4X_DADDR_T inode_bitmap;
        E4X_DADDR_T inode_table;
        uint32_t free_blocks_count;
        uint32_t free_inodes_count;
        uint32_t used_dirs_count;
        uint16_t flags;
        uint16_t checksum;
        uint8_t checksum_ok;    /* also 1 when there was nothing to check */
    } EXT4FS_GROUP;

/* ---- inodes ---- */

    typedef struct {
        uint8_t i_mode[2];                  // 0x00
        uint8_t i_uid[2];                   // 0x02
        uint8_t i_size[4];                  // 0x04
        uint8_t i_atime[4];                 // 0x08
        uint8_t i_ctime[4];                 // 0x0c
        uint8_t i_mtime[4];                 // 0x10
        uint8_t pad_014[4];                 // 0x14 i_dtime
        uint8_t i_gid[2];                   // 0x18
        uint8_t i_nlink[2];                 // 0x1a
        uint8_t pad_01c[4];                 // 0x1c i_blocks
        uint8_t i_flags[4];                 // 0x20
        uint8_t pad_024[4];                 // 0x24 i_version
        uint8_t i_block[EXT4FS_FILE_CONTENT_LEN];   // 0x28
        uint8_t pad_064[4];                 // 0x64 i_generation
        uint8_t i_file_acl[4];              // 0x68
        uint8_t i_size_high[4];             // 0x6c
        uint8_t pad_070[6];                 // 0x70 i_faddr, i_blocks_high
        uint8_t i_file_acl_high[2];         // 0x76
        uint8_t i_uid_high[2];              // 0x78
        uint8_t i_gid_high[2];              // 0x7a
        uint8_t pad_07c[4];                 // 0x7c i_checksum_lo
        /* large inodes only, up to 128 + i_extra_isize */
        uint8_t i_extra_isize[2];           // 0x80
        uint8_t pad_082[2];                 // 0x82 i_checksum_hi
        uint8_t i_ctime_extra[4];           // 0x84
        uint8_t i_mtime_extra[4];           // 0x88
        uint8_t i_atime_extra[4];           // 0x8c
        uint8_t i_crtime[4];                // 0x90
        uint8_t i_crtime_extra[4];          // 0x94
        uint8_t pad_098[8];                 // 0x98 i_version_hi, i_projid
    } ext4fs_inode;

#define EXT4FS_INODE_HAS_FIELD(extra_isize, field) \
    (EXT4FS_GOOD_OLD_INODE_SIZE + (size_t) (extra_isize) >= \
     offsetof(ext4fs_inode, field) + sizeof(((ext4fs_inode *) 0)->field))

/* i_mode file types */
#define EXT4_IN_FMT	0170000
#define EXT4_IN_SOCK	0140000
#define EXT4_IN_LNK	0120000
#define EXT4_IN_REG	0100000
#define EXT4_IN_BLK	0060000
#define EXT4_IN_DIR	0040000
#define EXT4_IN_CHR	0020000
#define EXT4_IN_FIFO	0010000

/* i_flags */
#define EXT4_IN_EXTENTS		0x00080000
#define EXT4_IN_EA_INODE	0x00200000
#define EXT4_IN_INLINE_DATA	0x10000000

/* ---- extent tree ---- */

    /* every node: header, then eh_entries index entries or extents */
    typedef struct {
        uint8_t eh_magic[2];
        uint8_t eh_entries[2];
        uint8_t eh_max[2];
        uint8_t eh_depth[2];                // 0 in leaves
        uint8_t eh_generation[4];
    } ext4fs_extent_header;

    typedef struct {
        uint8_t ei_block[4];
        uint8_t ei_leaf_lo[4];
        uint8_t ei_leaf_hi[2];
        uint8_t ei_unused[2];
    } ext4fs_extent_idx;

    typedef struct {
        uint8_t ee_block[4];
        uint8_t ee_len[2];                  // > EXT4_EXT_INIT_MAX_LEN: unwritten
        uint8_t ee_start_hi[2];
        uint8_t ee_start_lo[4];
    } ext4fs_extent;

#define EXT4_EXT_MAGIC		0xf30a
#define EXT4_EXT_INIT_MAX_LEN	32768
#define EXT4_EXT_MAX_DEPTH	5

/* ---- directory entries ---- */

    /* without the filetype feature name_len is 16 bits */
    typedef struct {
        uint8_t inode[4];
        uint8_t rec_len[2];
        uint8_t name_len[2];
        char name[E4X_FS_NAME_MAX];
    } ext4fs_dentry1;

    typedef struct {
        uint8_t inode[4];
        uint8_t rec_len[2];
        uint8_t name_len;
        uint8_t type;
        char name[E4X_FS_NAME_MAX];
    } ext4fs_dentry2;

#define EXT4FS_DENTRY_HDR_LEN	8
#define EXT4FS_DENTRY_MIN_LEN	12

/* file_type values of ext4fs_dentry2 */
#define EXT4_DE_UNKNOWN		0
#define EXT4_DE_REG		1
#define EXT4_DE_DIR		2
#define EXT4_DE_CHR		3
#define EXT4_DE_BLK		4
#define EXT4_DE_FIFO		5
#define EXT4_DE_SOCK		6
#define EXT4_DE_LNK		7

#define EXT4_DE_V1	1
#define EXT4_DE_V2	2

/* an inline directory starts with the inode number of its parent */
#define EXT4_INLINE_DOTDOT_SIZE	4

/* ---- extended attributes ---- */

#define EXT4_XATTR_MAGIC	0xEA020000

    /* start of an xattr block */
    typedef struct {
        uint8_t h_magic[4];
        uint8_t h_refcount[4];
        uint8_t h_blocks[4];                // must be 1
        uint8_t h_hash[4];
        uint8_t h_checksum[4];
        uint8_t h_reserved[12];
    } ext4fs_xattr_header;

    /* start of the xattr area at 128 + i_extra_isize */
    typedef struct {
        uint8_t h_magic[4];
    } ext4fs_xattr_ibody_header;

    /* entries are 4 byte aligned and end at a zero u32 */
    typedef struct {
        uint8_t e_name_len;
        uint8_t e_name_index;
        uint8_t e_value_offs[2];
        uint8_t e_value_inum[4];            // ea_inode feature only
        uint8_t e_value_size[4];
        uint8_t e_hash[4];
    } ext4fs_xattr_entry;

#define EXT4_XATTR_LEN(nlen) \
    (((nlen) + sizeof(ext4fs_xattr_entry) + 3) & ~3)

#define EXT4_XATTR_INDEX_USER			1
#define EXT4_XATTR_INDEX_POSIX_ACL_ACCESS	2
#define EXT4_XATTR_INDEX_POSIX_ACL_DEFAULT	3
#define EXT4_XATTR_INDEX_TRUSTED		4
#define EXT4_XATTR_INDEX_SECURITY		6
#define EXT4_XATTR_INDEX_SYSTEM			7
#define EXT4_XATTR_INDEX_RICHACL		8

/* system.data holds what does not fit in i_block of an inline inode */
#define EXT4_XATTR_INLINE_DATA_NAME	"data"

/* ---- handle ---- */

    typedef struct {
        E4X_FS_INFO fs_info;
        ext4fs_sb *fs;

        EXT4FS_GROUP *groups;
        EXT4_GRPNUM_T groups_count;
        uint16_t gd_size;

        uint16_t inode_size;
        uint32_t first_ino;
        uint32_t inodes_per_group;
        uint32_t blocks_per_group;
        E4X_DADDR_T first_data_block;

        uint32_t feat_compat;
        uint32_t feat_incompat;
        uint32_t feat_ro_compat;

        uint8_t deentry_type;           /* EXT4_DE_V1 or EXT4_DE_V2 */
        uint16_t max_extent_depth;      /* bounded by the block size */
        EXT4_GRPNUM_T gd_csum_bad;      /* descriptors failing the crc16 */
    } EXT4FS_INFO;

#ifdef __cplusplus
}

static_assert(sizeof(ext4fs_sb) == 1024, "ext4fs_sb layout");
static_assert(sizeof(ext4fs_gd) == EXT4FS_GD_SIZE_64BIT, "ext4fs_gd layout");
static_assert(sizeof(ext4fs_inode) == 160, "ext4fs_inode layout");
#endif

#ifdef __cplusplus

// ext4fs_extent.cpp
extern E4X_RETVAL_ENUM ext4fs_extent_map(EXT4FS_INFO * ext4fs,
    const E4X_FS_META * fs_meta, std::vector<E4X_FS_ATTR_RUN> &runs);

// ext4fs_xattr.cpp
extern E4X_RETVAL_ENUM ext4fs_xattr_load(EXT4FS_INFO * ext4fs,
    const E4X_FS_META * fs_meta, std::vector<E4X_FS_XATTR> &xattrs);
extern uint8_t ext4fs_inline_data(EXT4FS_INFO * ext4fs,
    const E4X_FS_META * fs_meta, std::string &tail);
extern const char *ext4fs_xattr_prefix(uint8_t name_index);

#endif

#endif
