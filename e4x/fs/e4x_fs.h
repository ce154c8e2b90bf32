/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/** \file e4x_fs.h
 * File system layer: an ext4 file system opened at an offset of an
 * image, its inodes, directory entries, content runs and extended
 * attributes.  Reached through libe4x.h.
 */

/**
 * \defgroup fslib C File System Functions
 * \defgroup fslib_cpp C++ File System Classes
 */
#ifndef _E4X_FS_H
#define _E4X_FS_H

#include <time.h>

#ifdef __cplusplus
#include <string>
#include <vector>

extern "C" {
#endif

    typedef struct E4X_FS_INFO E4X_FS_INFO;
    typedef struct E4X_FS_FILE E4X_FS_FILE;
    typedef struct E4X_FS_DIR E4X_FS_DIR;

    /* ---- content ---- */

    /** Origin of the bytes passed to an E4X_FS_FILE_WALK_CB */
    typedef enum {
        E4X_FS_BLOCK_FLAG_RAW = 0x0001,     ///< Read from a mapped block
        E4X_FS_BLOCK_FLAG_SPARSE = 0x0002,  ///< Hole, the buffer is zeros
        E4X_FS_BLOCK_FLAG_UNINIT = 0x0004,  ///< Unwritten extent, the buffer is zeros
        E4X_FS_BLOCK_FLAG_INLINE = 0x0008   ///< Stored in the inode itself
    } E4X_FS_BLOCK_FLAG_ENUM;

    typedef enum {
        E4X_FS_ATTR_RUN_FLAG_NONE = 0x00,
        E4X_FS_ATTR_RUN_FLAG_SPARSE = 0x01, ///< No extent covers the range
        E4X_FS_ATTR_RUN_FLAG_UNINIT = 0x02  ///< Extent marked unwritten
    } E4X_FS_ATTR_RUN_FLAG_ENUM;

    /**
     * len logical blocks of a file starting at block offset.  addr is
     * the first physical block, 0 for sparse runs.
     */
    typedef struct {
        E4X_DADDR_T offset;
        E4X_DADDR_T addr;
        E4X_DADDR_T len;
        E4X_FS_ATTR_RUN_FLAG_ENUM flags;
    } E4X_FS_ATTR_RUN;

    /* ---- inodes ---- */

    /** File type from the S_IFMT bits of i_mode */
    typedef enum {
        E4X_FS_META_TYPE_UNDEF = 0,
        E4X_FS_META_TYPE_REG,
        E4X_FS_META_TYPE_DIR,
        E4X_FS_META_TYPE_FIFO,
        E4X_FS_META_TYPE_CHR,
        E4X_FS_META_TYPE_BLK,
        E4X_FS_META_TYPE_LNK,
        E4X_FS_META_TYPE_SOCK
    } E4X_FS_META_TYPE_ENUM;

#define E4X_FS_META_TYPE_STR_MAX 8
    /** One letter per type, as in the first column of ls -l */
    extern char e4x_fs_meta_type_str[E4X_FS_META_TYPE_STR_MAX][2];

    /** The low 12 bits of i_mode */
    typedef enum {
        E4X_FS_META_MODE_ISUID = 04000,
        E4X_FS_META_MODE_ISGID = 02000,
        E4X_FS_META_MODE_ISVTX = 01000,
        E4X_FS_META_MODE_IRUSR = 0400,
        E4X_FS_META_MODE_IWUSR = 0200,
        E4X_FS_META_MODE_IXUSR = 0100,
        E4X_FS_META_MODE_IRGRP = 040,
        E4X_FS_META_MODE_IWGRP = 020,
        E4X_FS_META_MODE_IXGRP = 010,
        E4X_FS_META_MODE_IROTH = 04,
        E4X_FS_META_MODE_IWOTH = 02,
        E4X_FS_META_MODE_IXOTH = 01
    } E4X_FS_META_MODE_ENUM;

    /** Interpretation of the 60 byte i_block area */
    typedef enum {
        E4X_FS_META_CONTENT_TYPE_DEFAULT = 0,   ///< Unused (devices, fifos, sockets)
        E4X_FS_META_CONTENT_TYPE_EXTENTS,       ///< Root of an extent tree
        E4X_FS_META_CONTENT_TYPE_INLINE,        ///< Data, continued in system.data
        E4X_FS_META_CONTENT_TYPE_FAST_LINK,     ///< Symlink target
        E4X_FS_META_CONTENT_TYPE_MAPPED         ///< Indirect block map, not readable here
    } E4X_FS_META_CONTENT_TYPE_ENUM;

#define E4X_FS_META_CONTENT_LEN 60

    /**
     * Decoded inode.  Times are seconds since the epoch plus a
     * nanosecond part.  crtime is 0 when the inode is too small to
     * hold it.
     */
    typedef struct {
        int tag;
        E4X_INUM_T addr;
        E4X_FS_META_TYPE_ENUM type;
        E4X_FS_META_MODE_ENUM mode;
        int nlink;
        E4X_OFF_T size;
        E4X_UID_T uid;
        E4X_GID_T gid;

        time_t mtime;
        uint32_t mtime_nano;
        time_t atime;
        uint32_t atime_nano;
        time_t ctime;
        uint32_t ctime_nano;
        time_t crtime;
        uint32_t crtime_nano;

        uint32_t flags;                 ///< i_flags (EXT4_IN_*)
        E4X_DADDR_T xattr_block;        ///< i_file_acl, 0 if none
        uint16_t extra_isize;

        E4X_FS_META_CONTENT_TYPE_ENUM content_type;
        uint8_t content[E4X_FS_META_CONTENT_LEN];

        // the whole on-disk record, for the in-inode xattr area
        uint8_t *inode_buf;
        size_t inode_len;
    } E4X_FS_META;

#define E4X_FS_META_TAG 0x13524635

    /** Write "-rwxr-xr-x" style text for a_fs_meta.  @returns 1 if a_len is too small */
    extern uint8_t e4x_fs_meta_make_ls(const E4X_FS_META * a_fs_meta,
        char *a_buf, size_t a_len);

    /* ---- directory entries ---- */

    /** file_type byte of ext4_dir_entry_2 */
    typedef enum {
        E4X_FS_NAME_TYPE_UNDEF = 0,
        E4X_FS_NAME_TYPE_FIFO = 1,
        E4X_FS_NAME_TYPE_CHR = 2,
        E4X_FS_NAME_TYPE_DIR = 3,
        E4X_FS_NAME_TYPE_BLK = 4,
        E4X_FS_NAME_TYPE_REG = 5,
        E4X_FS_NAME_TYPE_LNK = 6,
        E4X_FS_NAME_TYPE_SOCK = 7
    } E4X_FS_NAME_TYPE_ENUM;

#define E4X_FS_NAME_MAX 255

    /**
     * One directory entry.  name_len is the on-disk length, which an
     * entry without the filetype feature can push past E4X_FS_NAME_MAX.
     * name keeps at most E4X_FS_NAME_MAX bytes and is NUL terminated.
     */
    typedef struct {
        E4X_INUM_T meta_addr;
        E4X_FS_NAME_TYPE_ENUM type;     ///< UNDEF without the filetype feature
        size_t name_len;
        uint32_t rec_len;
        char name[E4X_FS_NAME_MAX + 1];
    } E4X_FS_NAME;

    /* ---- files ---- */

    /** An open inode.  name is NULL unless the caller attached one. */
    struct E4X_FS_FILE {
        int tag;
        E4X_FS_INFO *fs_info;
        E4X_FS_META *meta;
        E4X_FS_NAME *name;
    };

#define E4X_FS_FILE_TAG 0x11212212

    /**
     * Called by e4x_fs_file_walk() for each piece of content in file
     * order.  a_addr is the physical block, 0 unless a_flags is RAW.
     */
    typedef E4X_WALK_RET_ENUM(*E4X_FS_FILE_WALK_CB) (E4X_FS_FILE * a_fs_file,
        E4X_OFF_T a_off, E4X_DADDR_T a_addr, char *a_buf, size_t a_len,
        E4X_FS_BLOCK_FLAG_ENUM a_flags, void *a_ptr);

    extern E4X_FS_FILE *e4x_fs_file_open_meta(E4X_FS_INFO * a_fs,
        E4X_FS_FILE * a_fs_file, E4X_INUM_T a_addr);
    extern void e4x_fs_file_close(E4X_FS_FILE * a_fs_file);
    extern uint8_t e4x_fs_file_walk(E4X_FS_FILE * a_fs_file,
        E4X_FS_FILE_WALK_CB a_action, void *a_ptr);
    extern ssize_t e4x_fs_file_read(E4X_FS_FILE * a_fs_file,
        E4X_OFF_T a_off, char *a_buf, size_t a_len);

#define E4X_FS_LINK_MAX 4096            ///< Longest symlink target, PATH_MAX on Linux

    extern ssize_t e4x_fs_file_readlink(E4X_FS_FILE * a_fs_file,
        char *a_buf, size_t a_len);

    /* ---- directories ---- */

    extern E4X_FS_DIR *e4x_fs_dir_open_meta(E4X_FS_INFO * a_fs,
        E4X_INUM_T a_addr);
    extern E4X_RETVAL_ENUM e4x_fs_dir_next(E4X_FS_DIR * a_fs_dir,
        E4X_FS_NAME * a_fs_name);
    extern void e4x_fs_dir_rewind(E4X_FS_DIR * a_fs_dir);
    extern E4X_OFF_T e4x_fs_dir_consumed(const E4X_FS_DIR * a_fs_dir);
    extern void e4x_fs_dir_close(E4X_FS_DIR * a_fs_dir);

    /* ---- file system ---- */

#define E4X_FS_INFO_FS_ID_LEN 32

    /**
     * An open file system.  ext4fs_open() fills everything in; callers
     * only read it.  last_block is what the superblock claims and
     * last_block_act is clipped to the image, so a truncated image
     * shows as last_block_act < last_block.
     */
    struct E4X_FS_INFO {
        int tag;
        E4X_IMG_INFO *img_info;
        E4X_OFF_T offset;               ///< Byte offset of the file system in the image

        E4X_INUM_T inum_count;
        E4X_INUM_T root_inum;
        E4X_INUM_T first_inum;
        E4X_INUM_T last_inum;

        E4X_DADDR_T block_count;
        E4X_DADDR_T first_block;
        E4X_DADDR_T last_block;
        E4X_DADDR_T last_block_act;
        unsigned int block_size;

        uint8_t fs_id[E4X_FS_INFO_FS_ID_LEN];   ///< s_uuid
        size_t fs_id_used;

        E4X_ENDIAN_ENUM endian;

        uint8_t(*file_add_meta) (E4X_FS_INFO *, E4X_FS_FILE *, E4X_INUM_T);
        uint8_t(*fsstat) (E4X_FS_INFO *, FILE *);
        void (*close) (E4X_FS_INFO *);
    };

#define E4X_FS_INFO_TAG 0x10101010

    extern E4X_FS_INFO *e4x_fs_open_img(E4X_IMG_INFO * a_img,
        E4X_OFF_T a_offset);
    extern void e4x_fs_close(E4X_FS_INFO * a_fs);
    extern uint8_t e4x_fs_fsstat(E4X_FS_INFO * a_fs, FILE * hFile);

    extern ssize_t e4x_fs_read(E4X_FS_INFO * a_fs, E4X_OFF_T a_off,
        char *a_buf, size_t a_len);
    extern ssize_t e4x_fs_read_block(E4X_FS_INFO * a_fs,
        E4X_DADDR_T a_addr, char *a_buf, size_t a_len);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

/**
 * \ingroup fslib_cpp
 * A decoded extended attribute.  full_name is the prefix for
 * name_index followed by name, e.g. "user.comment".
 */
struct E4X_FS_XATTR {
    uint8_t name_index;
    std::string name;
    std::string full_name;
    std::string value;
};

/** Content runs of a file in logical order, holes included. */
extern E4X_RETVAL_ENUM e4x_fs_file_extents(E4X_FS_FILE * a_fs_file,
    std::vector<E4X_FS_ATTR_RUN> &a_runs);
/** In-inode attributes first, then those of the xattr block. */
extern E4X_RETVAL_ENUM e4x_fs_file_xattrs(E4X_FS_FILE * a_fs_file,
    std::vector<E4X_FS_XATTR> &a_xattrs);

/**
 * \ingroup fslib_cpp
 * Owns an open file system.
 */
class E4xFsInfo {
  public:
    E4xFsInfo() : m_fsInfo(NULL) {}
    ~E4xFsInfo() {
        close();
    }

    E4xFsInfo(const E4xFsInfo &) = delete;
    E4xFsInfo & operator=(const E4xFsInfo &) = delete;

    /** @returns 1 on error and 0 on success, see e4x_fs_open_img() */
    uint8_t open(E4X_IMG_INFO * a_img_info, E4X_OFF_T a_offset) {
        close();
        m_fsInfo = e4x_fs_open_img(a_img_info, a_offset);
        return m_fsInfo == NULL;
    }

    void close() {
        e4x_fs_close(m_fsInfo);
        m_fsInfo = NULL;
    }

    E4X_FS_INFO *get() const {
        return m_fsInfo;
    }

    unsigned int getBlockSize() const {
        return m_fsInfo ? m_fsInfo->block_size : 0;
    }

    E4X_DADDR_T getBlockCount() const {
        return m_fsInfo ? m_fsInfo->block_count : 0;
    }

    E4X_INUM_T getRootINum() const {
        return m_fsInfo ? m_fsInfo->root_inum : 0;
    }

  private:
    E4X_FS_INFO * m_fsInfo;
};

#endif
#endif
