/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file fs_file.cpp
 * Functions to allocate, open, walk and read the content of files.
 */

#include "e4x_ext4fs.h"

#include <memory>

/** \internal
 * Largest chunk handed to a file walk callback.
 */
#define E4X_FS_FILE_WALK_CHUNK  (64 * 1024)

/** \internal
 * @returns a zeroed, tagged file of a_fs or NULL on error
 */
E4X_FS_FILE *
e4x_fs_file_alloc(E4X_FS_INFO * a_fs)
{
    E4X_FS_FILE *file = (E4X_FS_FILE *) e4x_malloc(sizeof(E4X_FS_FILE));
    if (file != NULL) {
        file->tag = E4X_FS_FILE_TAG;
        file->fs_info = a_fs;
    }
    return file;
}

/**
 * \ingroup fslib
 * Free a file with its meta and name.  NULL is ignored.
 */
void
e4x_fs_file_close(E4X_FS_FILE * a_fs_file)
{
    if ((a_fs_file == NULL) || (a_fs_file->tag != E4X_FS_FILE_TAG)) {
        return;
    }

    a_fs_file->tag = 0;

    if (a_fs_file->meta) {
        e4x_fs_meta_close(a_fs_file->meta);
        a_fs_file->meta = NULL;
    }
    free(a_fs_file->name);
    a_fs_file->name = NULL;

    free(a_fs_file);
}

/**
 * \ingroup fslib
 * Load inode a_addr.  With a_fs_file set its meta is reloaded in place
 * and its name dropped.  Otherwise a new file is returned, to be freed
 * with e4x_fs_file_close().
 *
 * @returns NULL on error (a new file is not leaked)
 */
E4X_FS_FILE *
e4x_fs_file_open_meta(E4X_FS_INFO * a_fs,
    E4X_FS_FILE * a_fs_file, E4X_INUM_T a_addr)
{
    if ((a_fs == NULL) || (a_fs->tag != E4X_FS_INFO_TAG)) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("e4x_fs_file_open_meta: no open file system");
        return NULL;
    }

    E4X_FS_FILE *fs_file = a_fs_file;
    if (fs_file == NULL) {
        if ((fs_file = e4x_fs_file_alloc(a_fs)) == NULL)
            return NULL;
    }
    else {
        // the name belonged to the previous inode
        free(fs_file->name);
        fs_file->name = NULL;
    }

    if (a_fs->file_add_meta(a_fs, fs_file, a_addr)) {
        if (a_fs_file == NULL)
            e4x_fs_file_close(fs_file);
        return NULL;
    }

    return fs_file;
}

/* check the tags of an open file before using it */
static uint8_t
e4x_fs_file_check(const E4X_FS_FILE * a_fs_file, const char *a_func)
{
    if ((a_fs_file == NULL) || (a_fs_file->tag != E4X_FS_FILE_TAG)
        || (a_fs_file->meta == NULL)
        || (a_fs_file->meta->tag != E4X_FS_META_TAG)
        || (a_fs_file->fs_info == NULL)
        || (a_fs_file->fs_info->tag != E4X_FS_INFO_TAG)) {
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("%s: called with NULL or unallocated structures",
            a_func);
        return 1;
    }
    return 0;
}

/* translate the callback result; returns 1 if the walk must end */
static uint8_t
e4x_fs_file_walk_ret(E4X_WALK_RET_ENUM a_retval, uint8_t * a_err)
{
    if (a_retval == E4X_WALK_CONT)
        return 0;

    if (a_retval == E4X_WALK_ERROR) {
        if (e4x_error_get_errno() == 0) {
            e4x_error_set_errno(E4X_ERR_FS_FWALK);
            e4x_error_set_errstr("file walk callback returned an error");
        }
        *a_err = 1;
    }
    return 1;
}

/*
 * Walk the content of an inline file: the block area followed by the
 * system.data attribute.
 */
static uint8_t
e4x_fs_file_walk_inline(E4X_FS_FILE * a_fs_file,
    E4X_FS_FILE_WALK_CB a_action, void *a_ptr)
{
    EXT4FS_INFO *ext4fs = (EXT4FS_INFO *) a_fs_file->fs_info;
    E4X_FS_META *fs_meta = a_fs_file->meta;
    std::string tail;
    uint8_t err = 0;

    if (fs_meta->size == 0)
        return 0;

    if (ext4fs_inline_data(ext4fs, fs_meta, tail))
        return 1;

    if ((uint64_t) fs_meta->size > E4X_FS_META_CONTENT_LEN + tail.size()) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_CORRUPT);
        e4x_error_set_errstr("e4x_fs_file_walk: inline inode %" PRIuINUM
            " has size %" PRIdOFF " but only %" PRIuSIZE
            " bytes of inline data", fs_meta->addr, fs_meta->size,
            E4X_FS_META_CONTENT_LEN + tail.size());
        return 1;
    }

    std::string data((const char *) fs_meta->content,
        E4X_FS_META_CONTENT_LEN);
    data += tail;
    data.resize((size_t) fs_meta->size);

    e4x_fs_file_walk_ret(a_action(a_fs_file, 0, 0, &data[0], data.size(),
            E4X_FS_BLOCK_FLAG_INLINE, a_ptr), &err);
    return err;
}

/*
 * Walk the content described by the extent tree, in logical order.
 * Holes and uninitialized extents are handed over as zero filled
 * buffers.
 */
static uint8_t
e4x_fs_file_walk_extents(E4X_FS_FILE * a_fs_file,
    E4X_FS_FILE_WALK_CB a_action, void *a_ptr)
{
    E4X_FS_INFO *fs = a_fs_file->fs_info;
    EXT4FS_INFO *ext4fs = (EXT4FS_INFO *) fs;
    E4X_FS_META *fs_meta = a_fs_file->meta;
    std::vector < E4X_FS_ATTR_RUN > runs;
    uint8_t err = 0;

    if (ext4fs_extent_map(ext4fs, fs_meta, runs) != E4X_OK)
        return 1;

    // chunk size is a whole number of blocks
    size_t chunk_blocks = E4X_FS_FILE_WALK_CHUNK / fs->block_size;
    if (chunk_blocks == 0)
        chunk_blocks = 1;
    const size_t chunk_len = chunk_blocks * fs->block_size;

    std::unique_ptr < char[], decltype(&free) > buf {
        (char *) e4x_malloc(chunk_len), free};
    if (!buf)
        return 1;

    for (const E4X_FS_ATTR_RUN & run : runs) {
        E4X_DADDR_T done = 0;

        while (done < run.len) {
            E4X_DADDR_T cnt = run.len - done;
            if (cnt > chunk_blocks)
                cnt = chunk_blocks;

            const E4X_OFF_T off =
                (E4X_OFF_T) ((run.offset + done) * fs->block_size);
            if (off >= fs_meta->size)
                return 0;

            size_t len = (size_t) (cnt * fs->block_size);
            if ((E4X_OFF_T) len > fs_meta->size - off)
                len = (size_t) (fs_meta->size - off);

            E4X_FS_BLOCK_FLAG_ENUM flags;
            E4X_DADDR_T addr = 0;

            if (run.flags & E4X_FS_ATTR_RUN_FLAG_SPARSE) {
                memset(buf.get(), 0, len);
                flags = E4X_FS_BLOCK_FLAG_SPARSE;
            }
            else if (run.flags & E4X_FS_ATTR_RUN_FLAG_UNINIT) {
                memset(buf.get(), 0, len);
                flags = E4X_FS_BLOCK_FLAG_UNINIT;
            }
            else {
                addr = run.addr + done;
                const size_t rlen = (size_t) (cnt * fs->block_size);
                ssize_t rcnt = e4x_fs_read_block(fs, addr, buf.get(), rlen);
                if (rcnt != (ssize_t) rlen) {
                    if (rcnt >= 0) {
                        e4x_error_reset();
                        e4x_error_set_errno(E4X_ERR_FS_READ);
                    }
                    e4x_error_set_errstr2
                        ("e4x_fs_file_walk: inode %" PRIuINUM
                        " block %" PRIuDADDR, fs_meta->addr, addr);
                    return 1;
                }
                flags = E4X_FS_BLOCK_FLAG_RAW;
            }

            if (e4x_fs_file_walk_ret(a_action(a_fs_file, off, addr,
                        buf.get(), len, flags, a_ptr), &err))
                return err;

            done += cnt;
        }
    }
    return 0;
}

/**
 * \ingroup fslib
 * Process the content of a file and call a callback with each chunk of
 * it, in logical order.  Chunks are at most 64 KiB and never run past
 * the file size.
 *
 * @param a_ptr handed to a_action unchanged
 * @returns 1 on error, 0 when done or stopped by a_action
 */
uint8_t
e4x_fs_file_walk(E4X_FS_FILE * a_fs_file,
    E4X_FS_FILE_WALK_CB a_action, void *a_ptr)
{
    e4x_error_reset();

    if (e4x_fs_file_check(a_fs_file, "e4x_fs_file_walk"))
        return 1;

    E4X_FS_META *fs_meta = a_fs_file->meta;

    if (e4x_verbose)
        e4x_fprintf(stderr,
            "e4x_fs_file_walk: Processing file %" PRIuINUM "\n",
            fs_meta->addr);

    switch (fs_meta->content_type) {
    case E4X_FS_META_CONTENT_TYPE_EXTENTS:
        return e4x_fs_file_walk_extents(a_fs_file, a_action, a_ptr);

    case E4X_FS_META_CONTENT_TYPE_INLINE:
        return e4x_fs_file_walk_inline(a_fs_file, a_action, a_ptr);

    case E4X_FS_META_CONTENT_TYPE_FAST_LINK:{
            uint8_t err = 0;
            if (fs_meta->size == 0)
                return 0;
            char lbuf[E4X_FS_META_CONTENT_LEN];
            memcpy(lbuf, fs_meta->content, (size_t) fs_meta->size);
            e4x_fs_file_walk_ret(a_action(a_fs_file, 0, 0, lbuf,
                    (size_t) fs_meta->size, E4X_FS_BLOCK_FLAG_INLINE,
                    a_ptr), &err);
            return err;
        }

    case E4X_FS_META_CONTENT_TYPE_MAPPED:
        e4x_error_set_errno(E4X_ERR_FS_UNSUPFEAT);
        e4x_error_set_errstr
            ("e4x_fs_file_walk: inode %" PRIuINUM
            " uses block mapping instead of extents", fs_meta->addr);
        return 1;

    case E4X_FS_META_CONTENT_TYPE_DEFAULT:
    default:
        return 0;
    }
}


typedef struct {
    E4X_OFF_T off;              // first byte wanted
    char *buf;
    size_t len;                 // bytes wanted
    size_t copied;              // bytes copied so far
} E4X_FS_FILE_READ_CTX;

static E4X_WALK_RET_ENUM
e4x_fs_file_read_act(E4X_FS_FILE *, E4X_OFF_T a_off, E4X_DADDR_T,
    char *a_buf, size_t a_len, E4X_FS_BLOCK_FLAG_ENUM, void *a_ptr)
{
    E4X_FS_FILE_READ_CTX *ctx = (E4X_FS_FILE_READ_CTX *) a_ptr;
    const E4X_OFF_T end = ctx->off + (E4X_OFF_T) ctx->len;
    const E4X_OFF_T chunk_end = a_off + (E4X_OFF_T) a_len;

    if (chunk_end <= ctx->off)
        return E4X_WALK_CONT;
    if (a_off >= end)
        return E4X_WALK_STOP;

    E4X_OFF_T from = a_off > ctx->off ? a_off : ctx->off;
    E4X_OFF_T to = chunk_end < end ? chunk_end : end;
    memcpy(ctx->buf + (from - ctx->off), a_buf + (from - a_off),
        (size_t) (to - from));
    ctx->copied += (size_t) (to - from);

    return to == end ? E4X_WALK_STOP : E4X_WALK_CONT;
}

/**
 * \ingroup fslib
 * Read a_len bytes of the file content at a_offset.  Holes and
 * uninitialized extents read as zeros.  The count is short at the end
 * of the file.
 *
 * @returns bytes read or -1 on error, an offset past the end included
 */
ssize_t
e4x_fs_file_read(E4X_FS_FILE * a_fs_file,
    E4X_OFF_T a_offset, char *a_buf, size_t a_len)
{
    e4x_error_reset();

    if (e4x_fs_file_check(a_fs_file, "e4x_fs_file_read"))
        return -1;

    if (a_buf == NULL || a_offset < 0 || a_offset > a_fs_file->meta->size) {
        e4x_error_set_errno(E4X_ERR_FS_READ_OFF);
        e4x_error_set_errstr("e4x_fs_file_read: offset %" PRIdOFF
            " outside of file of size %" PRIdOFF, a_offset,
            a_fs_file->meta->size);
        return -1;
    }

    if (a_len > (size_t) (a_fs_file->meta->size - a_offset))
        a_len = (size_t) (a_fs_file->meta->size - a_offset);
    if (a_len == 0)
        return 0;

    E4X_FS_FILE_READ_CTX ctx;
    ctx.off = a_offset;
    ctx.buf = a_buf;
    ctx.len = a_len;
    ctx.copied = 0;

    if (e4x_fs_file_walk(a_fs_file, e4x_fs_file_read_act, &ctx))
        return -1;

    return (ssize_t) ctx.copied;
}

/**
 * \ingroup fslib
 * Read the target of a symbolic link, from the block area of fast
 * links or from the content of slow ones.  The result is NUL terminated.
 *
 * @param a_fs_file Symbolic link to read
 * @param a_buf Buffer to store the target in
 * @param a_len Size of a_buf
 * @returns length of the target or -1 on error
 */
ssize_t
e4x_fs_file_readlink(E4X_FS_FILE * a_fs_file, char *a_buf, size_t a_len)
{
    e4x_error_reset();

    if (e4x_fs_file_check(a_fs_file, "e4x_fs_file_readlink"))
        return -1;

    E4X_FS_META *fs_meta = a_fs_file->meta;
    if (fs_meta->type != E4X_FS_META_TYPE_LNK) {
        e4x_error_set_errno(E4X_ERR_FS_ARG);
        e4x_error_set_errstr("e4x_fs_file_readlink: inode %" PRIuINUM
            " is not a symbolic link", fs_meta->addr);
        return -1;
    }

    if (fs_meta->size >= E4X_FS_LINK_MAX
        || (size_t) fs_meta->size >= a_len) {
        e4x_error_set_errno(E4X_ERR_FS_CORRUPT);
        e4x_error_set_errstr("e4x_fs_file_readlink: link target of inode %"
            PRIuINUM " is too long (%" PRIdOFF " bytes)", fs_meta->addr,
            fs_meta->size);
        return -1;
    }

    ssize_t cnt = e4x_fs_file_read(a_fs_file, 0, a_buf, a_len - 1);
    if (cnt < 0)
        return -1;

    if (cnt != fs_meta->size) {
        e4x_error_set_errno(E4X_ERR_FS_READ);
        e4x_error_set_errstr("e4x_fs_file_readlink: short read of link target (%"
            PRIdOFF " of %" PRIdOFF ")", (E4X_OFF_T) cnt, fs_meta->size);
        return -1;
    }
    a_buf[cnt] = '\0';
    return cnt;
}

/**
 * \ingroup fslib_cpp
 * Resolve the logical block layout of a file, including holes.
 * Files without extents produce no runs; block mapped files are an
 * error.
 *
 * @param a_fs_file File to resolve
 * @param a_runs Filled with runs that cover the file in logical order
 * @returns E4X_OK, E4X_COR for a corrupt tree or E4X_ERR
 */
E4X_RETVAL_ENUM
e4x_fs_file_extents(E4X_FS_FILE * a_fs_file,
    std::vector < E4X_FS_ATTR_RUN > &a_runs)
{
    a_runs.clear();
    e4x_error_reset();

    if (e4x_fs_file_check(a_fs_file, "e4x_fs_file_extents"))
        return E4X_ERR;

    switch (a_fs_file->meta->content_type) {
    case E4X_FS_META_CONTENT_TYPE_EXTENTS:
        return ext4fs_extent_map((EXT4FS_INFO *) a_fs_file->fs_info,
            a_fs_file->meta, a_runs);
    case E4X_FS_META_CONTENT_TYPE_MAPPED:
        e4x_error_set_errno(E4X_ERR_FS_UNSUPFEAT);
        e4x_error_set_errstr
            ("e4x_fs_file_extents: inode %" PRIuINUM
            " uses block mapping instead of extents",
            a_fs_file->meta->addr);
        return E4X_ERR;
    default:
        return E4X_OK;
    }
}

/**
 * \ingroup fslib_cpp
 * Decode the extended attributes of a file, first from the inode and
 * then from its attribute block.
 *
 * @param a_fs_file File to decode
 * @param a_xattrs Filled with the attributes
 * @returns E4X_OK, E4X_COR if some attributes could not be decoded, or E4X_ERR
 */
E4X_RETVAL_ENUM
e4x_fs_file_xattrs(E4X_FS_FILE * a_fs_file,
    std::vector < E4X_FS_XATTR > &a_xattrs)
{
    a_xattrs.clear();
    e4x_error_reset();

    if (e4x_fs_file_check(a_fs_file, "e4x_fs_file_xattrs"))
        return E4X_ERR;

    return ext4fs_xattr_load((EXT4FS_INFO *) a_fs_file->fs_info,
        a_fs_file->meta, a_xattrs);
}
