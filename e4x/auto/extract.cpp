/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file extract.cpp
 * Contains the E4xExtract class, which writes the directory tree of a
 * file system to a directory on the host.
 */

#include "e4x_auto_i.h"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#define E4X_EXTRACT_TMP_SUFFIX ".ext4extract.tmp"

/* set an output error including the host errno */
static void
e4x_extract_write_error(const char *a_func, const char *a_what,
    const char *a_host, int a_errno)
{
    e4x_error_reset();
    e4x_error_set_errno(E4X_ERR_AUTO_WRITE);
    e4x_error_set_errstr("%s: %s %s: %s", a_func, a_what, a_host,
        strerror(a_errno));
}


E4xExtract::E4xExtract(const char *a_base_dir)
{
    m_base_dir = (a_base_dir && a_base_dir[0]) ? a_base_dir : ".";
    // strip trailing slashes, but keep "/"
    while (m_base_dir.size() > 1 && m_base_dir[m_base_dir.size() - 1] == '/')
        m_base_dir.erase(m_base_dir.size() - 1);

    m_policy = E4X_SYMLINK_SAVE;
    m_symlinkTable = NULL;
    m_metadataTable = NULL;
    m_fileCount = 0;
    m_dirCount = 0;
    m_linkCount = 0;
    m_skipCount = 0;
}

E4xExtract::~E4xExtract()
{
    closeTables();
}

void
E4xExtract::setSymlinkPolicy(E4X_SYMLINK_POLICY_ENUM a_policy)
{
    m_policy = a_policy;
}

/**
 * Create the file that the symbolic link table is written to.
 * @returns 1 on error (the error values are set)
 */
uint8_t
E4xExtract::setSymlinkTable(const char *a_path)
{
    if (m_symlinkTable)
        fclose(m_symlinkTable);
    if ((m_symlinkTable = fopen(a_path, "w")) == NULL) {
        e4x_extract_write_error("setSymlinkTable", "error creating",
            a_path, errno);
        return 1;
    }
    return 0;
}

/**
 * Create the file that the metadata table is written to.
 * @returns 1 on error (the error values are set)
 */
uint8_t
E4xExtract::setMetadataTable(const char *a_path)
{
    if (m_metadataTable)
        fclose(m_metadataTable);
    if ((m_metadataTable = fopen(a_path, "w")) == NULL) {
        e4x_extract_write_error("setMetadataTable", "error creating",
            a_path, errno);
        return 1;
    }
    return 0;
}

void
E4xExtract::closeTables()
{
    if (m_symlinkTable) {
        if (fclose(m_symlinkTable)) {
            e4x_extract_write_error("closeTables", "error writing",
                "symlink table", errno);
            registerError();
        }
        m_symlinkTable = NULL;
    }
    if (m_metadataTable) {
        if (fclose(m_metadataTable)) {
            e4x_extract_write_error("closeTables", "error writing",
                "metadata table", errno);
            registerError();
        }
        m_metadataTable = NULL;
    }
}


/**
 * Encode an attribute value for the metadata table.  Printable ASCII is
 * kept unless it contains one of the table separators, anything else is
 * written as "0x" and lower case hex digits.
 */
std::string
E4xExtract::encodeXattrValue(const std::string & a_value)
{
    bool raw = true;
    for (size_t i = 0; i < a_value.size(); i++) {
        const unsigned char c = (unsigned char) a_value[i];
        if (c < 0x20 || c > 0x7e || c == ';' || c == '|' || c == '=') {
            raw = false;
            break;
        }
    }
    if (raw)
        return a_value;

    static const char hex[] = "0123456789abcdef";
    std::string ret = "0x";
    ret.reserve(2 + 2 * a_value.size());
    for (size_t i = 0; i < a_value.size(); i++) {
        const unsigned char c = (unsigned char) a_value[i];
        ret += hex[c >> 4];
        ret += hex[c & 0x0f];
    }
    return ret;
}

/**
 * Escape a path or link target for one of the tables.  Each record has
 * to stay on one line with its fields intact, so a backslash, '|' and
 * control bytes are written as backslash escapes ("\\", "\|", "\n",
 * "\xHH").  Other bytes are copied.
 */
std::string
E4xExtract::encodeTablePath(const char *a_path)
{
    static const char hex[] = "0123456789abcdef";
    std::string ret;
    for (const char *p = a_path; *p; p++) {
        const unsigned char c = (unsigned char) *p;
        if (c == '\\' || c == '|') {
            ret += '\\';
            ret += (char) c;
        }
        else if (c == '\n') {
            ret += "\\n";
        }
        else if (c < 0x20 || c == 0x7f) {
            ret += "\\x";
            ret += hex[c >> 4];
            ret += hex[c & 0x0f];
        }
        else {
            ret += (char) c;
        }
    }
    return ret;
}

/**
 * Write one line for a path to the metadata table.
 */
void
E4xExtract::addMetadata(E4X_FS_FILE * a_fs_file, const char *a_path)
{
    if (m_metadataTable == NULL)
        return;

    const E4X_FS_META *meta = a_fs_file->meta;
    char ls[12];
    if (e4x_fs_meta_make_ls(meta, ls, sizeof(ls)))
        strcpy(ls, "----------");

    std::vector < E4X_FS_XATTR > xattrs;
    E4X_RETVAL_ENUM ret = e4x_fs_file_xattrs(a_fs_file, xattrs);
    if (ret != E4X_OK) {
        // partial attributes are still written
        registerError(a_path);
    }

    std::string attrs;
    for (size_t i = 0; i < xattrs.size(); i++) {
        if (i)
            attrs += ';';
        attrs += encodeXattrValue(xattrs[i].full_name);
        attrs += '=';
        attrs += encodeXattrValue(xattrs[i].value);
    }

    fprintf(m_metadataTable, "0|%s|%" PRIuINUM "|%s|%" PRIuUID "|%"
        PRIuGID "|%" PRIdOFF "|%lld|%lld|%lld|%lld|%s\n",
        encodeTablePath(a_path).c_str(),
        meta->addr, ls, meta->uid, meta->gid, meta->size,
        (long long) meta->atime, (long long) meta->mtime,
        (long long) meta->ctime, (long long) meta->crtime, attrs.c_str());
}


/**
 * Create the output directory and its parents.
 * @returns 1 on error (the error values are set)
 */
uint8_t
E4xExtract::makeBaseDir()
{
    struct stat statds;
    std::string fbuf = m_base_dir;

    if (0 != stat(fbuf.c_str(), &statds)) {
        for (size_t i = 1; i <= fbuf.size(); i++) {
            if (i < fbuf.size() && (fbuf[i] != '/' || fbuf[i - 1] == '/'))
                continue;

            const std::string part = fbuf.substr(0, i);
            if (0 != stat(part.c_str(), &statds)) {
                if (mkdir(part.c_str(), 0775) && errno != EEXIST) {
                    e4x_extract_write_error("makeBaseDir",
                        "error making directory", part.c_str(), errno);
                    return 1;
                }
            }
        }
        if (0 != stat(fbuf.c_str(), &statds)) {
            e4x_extract_write_error("makeBaseDir", "error making directory",
                fbuf.c_str(), errno);
            return 1;
        }
    }

    if (!S_ISDIR(statds.st_mode)) {
        e4x_extract_write_error("makeBaseDir", "not a directory", fbuf.c_str(),
            ENOTDIR);
        return 1;
    }
    return 0;
}

/**
 * Create the host directory of an image directory.  A file or symbolic
 * link that is in the way (from an earlier run) is replaced.
 * @returns 1 on error (the error was registered)
 */
uint8_t
E4xExtract::makeDir(const std::string & a_host, const char *a_path)
{
    struct stat statds;

    if (0 == lstat(a_host.c_str(), &statds)) {
        if (S_ISDIR(statds.st_mode))
            return 0;
        if (unlink(a_host.c_str())) {
            e4x_extract_write_error("makeDir", "error removing", a_host.c_str(),
                errno);
            registerError(a_path);
            return 1;
        }
    }

    if (mkdir(a_host.c_str(), 0775)) {
        e4x_extract_write_error("makeDir", "error making directory", a_host.c_str(),
            errno);
        registerError(a_path);
        return 1;
    }
    return 0;
}

/**
 * Remove a file or symbolic link at a host path so that it can be
 * recreated.  Symbolic links are never followed.
 * @returns 1 on error (the error was registered)
 */
uint8_t
E4xExtract::clearHostPath(const std::string & a_host, const char *a_path)
{
    struct stat statds;

    if (0 != lstat(a_host.c_str(), &statds))
        return 0;

    if (S_ISDIR(statds.st_mode)) {
        e4x_extract_write_error("clearHostPath", "directory is in the way of",
            a_host.c_str(), EISDIR);
        registerError(a_path);
        return 1;
    }
    if (unlink(a_host.c_str())) {
        e4x_extract_write_error("clearHostPath", "error removing", a_host.c_str(),
            errno);
        registerError(a_path);
        return 1;
    }
    return 0;
}


/** \internal
 * Callback used to walk file content and write the results to the host file.
 */
static E4X_WALK_RET_ENUM
file_walk_cb(E4X_FS_FILE * a_fs_file, E4X_OFF_T a_off, E4X_DADDR_T a_addr,
    char *a_buf, size_t a_len, E4X_FS_BLOCK_FLAG_ENUM a_flags, void *a_ptr)
{
    FILE *hFile = (FILE *) a_ptr;

    // holes are left to the final truncate
    if (a_flags & (E4X_FS_BLOCK_FLAG_SPARSE | E4X_FS_BLOCK_FLAG_UNINIT))
        return E4X_WALK_CONT;

    if (fseeko(hFile, (off_t) a_off, SEEK_SET)
        || fwrite(a_buf, a_len, 1, hFile) != 1) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_AUTO_WRITE);
        e4x_error_set_errstr("file_walk_cb: error writing %" PRIuSIZE
            " bytes at offset %" PRIdOFF " of inode %" PRIuINUM ": %s",
            a_len, a_off, a_fs_file->meta->addr, strerror(errno));
        return E4X_WALK_ERROR;
    }
    return E4X_WALK_CONT;
}

/**
 * Write the content of a regular file to the host and apply its times.
 * @returns 1 on error (the error was registered)
 */
uint8_t
E4xExtract::writeFile(E4X_FS_FILE * a_fs_file, const std::string & a_host,
    const char *a_path)
{
    const E4X_FS_META *meta = a_fs_file->meta;

    if (meta->content_type == E4X_FS_META_CONTENT_TYPE_MAPPED) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_FS_UNSUPFEAT);
        e4x_error_set_errstr("inode %" PRIuINUM
            " uses indirect block mapping instead of extents", meta->addr);
        registerError(a_path);
        return 1;
    }

    if (clearHostPath(a_host, a_path))
        return 1;

    FILE *hFile;
    if ((hFile = fopen(a_host.c_str(), "wb")) == NULL) {
        e4x_extract_write_error("writeFile", "error opening", a_host.c_str(), errno);
        registerError(a_path);
        return 1;
    }

    if (e4x_fs_file_walk(a_fs_file, file_walk_cb, hFile)) {
        e4x_error_errstr2_concat(" - writing %s", a_host.c_str());
        registerError(a_path);
        fclose(hFile);
        unlink(a_host.c_str());
        return 1;
    }

    if (fflush(hFile) || ftruncate(fileno(hFile), (off_t) meta->size)) {
        e4x_extract_write_error("writeFile", "error writing", a_host.c_str(), errno);
        registerError(a_path);
        fclose(hFile);
        unlink(a_host.c_str());
        return 1;
    }

    if (fclose(hFile)) {
        e4x_extract_write_error("writeFile", "error closing", a_host.c_str(), errno);
        registerError(a_path);
        unlink(a_host.c_str());
        return 1;
    }

    struct timespec times[2];
    times[0].tv_sec = meta->atime;
    times[0].tv_nsec = meta->atime_nano;
    times[1].tv_sec = meta->mtime;
    times[1].tv_nsec = meta->mtime_nano;
    if (utimensat(AT_FDCWD, a_host.c_str(), times, AT_SYMLINK_NOFOLLOW)) {
        // the content is complete, only the times are missing
        e4x_extract_write_error("writeFile", "error setting times of",
            a_host.c_str(), errno);
        registerError(a_path);
    }

    m_fileCount++;
    if (e4x_verbose)
        e4x_fprintf(stderr, "writeFile: extracted %s (%" PRIuINUM ")\n",
            a_path, meta->addr);
    return 0;
}

/**
 * Write a regular file with the given content.
 * @returns 1 on error (the error was registered)
 */
uint8_t
E4xExtract::writeContent(const std::string & a_host, const char *a_buf,
    size_t a_len, const char *a_path)
{
    if (clearHostPath(a_host, a_path))
        return 1;

    FILE *hFile;
    if ((hFile = fopen(a_host.c_str(), "wb")) == NULL) {
        e4x_extract_write_error("writeContent", "error opening", a_host.c_str(),
            errno);
        registerError(a_path);
        return 1;
    }

    if (a_len > 0 && fwrite(a_buf, a_len, 1, hFile) != 1) {
        e4x_extract_write_error("writeContent", "error writing", a_host.c_str(),
            errno);
        registerError(a_path);
        fclose(hFile);
        unlink(a_host.c_str());
        return 1;
    }

    if (fclose(hFile)) {
        e4x_extract_write_error("writeContent", "error closing", a_host.c_str(),
            errno);
        registerError(a_path);
        unlink(a_host.c_str());
        return 1;
    }
    return 0;
}

/* one "path -> target" line of the symlink table */
void
E4xExtract::addSymlinkRecord(const char *a_path, const char *a_target)
{
    if (m_symlinkTable == NULL)
        return;
    fprintf(m_symlinkTable, "%s -> %s\n", encodeTablePath(a_path).c_str(),
        encodeTablePath(a_target).c_str());
}

/**
 * Record a symbolic link in the symlink table and write it according
 * to the symlink policy.
 * @returns 1 on error (the error was registered)
 */
uint8_t
E4xExtract::writeSymlink(E4X_FS_FILE * a_fs_file, const std::string & a_host,
    const char *a_path)
{
    char target[E4X_FS_LINK_MAX];
    ssize_t len = e4x_fs_file_readlink(a_fs_file, target, sizeof(target));
    if (len < 0) {
        registerError(a_path);
        return 1;
    }

    addSymlinkRecord(a_path, target);

    switch (m_policy) {
    case E4X_SYMLINK_SKIP:
        m_skipCount++;
        return 0;

    case E4X_SYMLINK_EMPTY:
        if (writeContent(a_host, NULL, 0, a_path))
            return 1;
        break;

    case E4X_SYMLINK_TEXT:
        if (writeContent(a_host, target, (size_t) len, a_path))
            return 1;
        break;

    case E4X_SYMLINK_SAVE:
    default:{
            // create next to the final name and rename over it
            const std::string tmp = a_host + E4X_EXTRACT_TMP_SUFFIX;
            struct stat statds;

            if (0 == lstat(a_host.c_str(), &statds)
                && S_ISDIR(statds.st_mode)) {
                e4x_extract_write_error("writeSymlink",
                    "directory is in the way of", a_host.c_str(), EISDIR);
                registerError(a_path);
                return 1;
            }
            if (unlink(tmp.c_str()) && errno != ENOENT) {
                e4x_extract_write_error("writeSymlink", "error removing",
                    tmp.c_str(), errno);
                registerError(a_path);
                return 1;
            }
            if (symlink(target, tmp.c_str())) {
                e4x_extract_write_error("writeSymlink",
                    "error creating symbolic link", tmp.c_str(), errno);
                registerError(a_path);
                return 1;
            }
            if (rename(tmp.c_str(), a_host.c_str())) {
                e4x_extract_write_error("writeSymlink", "error renaming to",
                    a_host.c_str(), errno);
                registerError(a_path);
                unlink(tmp.c_str());
                return 1;
            }
            break;
        }
    }

    m_linkCount++;
    if (e4x_verbose)
        e4x_fprintf(stderr, "writeSymlink: %s -> %s\n", a_path, target);
    return 0;
}


E4X_RETVAL_ENUM
E4xExtract::processFile(E4X_FS_FILE * a_fs_file, const char *a_path)
{
    if ((a_fs_file->meta == NULL) || (a_fs_file->name == NULL))
        return E4X_COR;
    if (isDotDir(a_fs_file))
        return E4X_COR;

    const std::string path = std::string(a_path) + a_fs_file->name->name;
    const std::string host = m_base_dir + "/" + path;

    // tables list every path, also those that are not written
    addMetadata(a_fs_file, path.c_str());

    if (host.size() >= PATH_MAX) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_AUTO_WRITE);
        e4x_error_set_errstr("processFile: host path is longer than %d bytes",
            PATH_MAX - 1);
        registerError(path.c_str());
        if (isSymlink(a_fs_file) && m_symlinkTable) {
            char target[E4X_FS_LINK_MAX];
            if (e4x_fs_file_readlink(a_fs_file, target, sizeof(target)) >= 0)
                addSymlinkRecord(path.c_str(), target);
            else
                e4x_error_reset();
        }
        m_skipCount++;
        return E4X_COR;
    }

    if (isDir(a_fs_file)) {
        if (makeDir(host, path.c_str()))
            return E4X_COR;
        m_dirCount++;
    }
    else if (isFile(a_fs_file)) {
        writeFile(a_fs_file, host, path.c_str());
    }
    else if (isSymlink(a_fs_file)) {
        writeSymlink(a_fs_file, host, path.c_str());
    }
    else {
        // devices, fifos and sockets are only recorded
        m_skipCount++;
        if (e4x_verbose)
            e4x_fprintf(stderr, "processFile: not writing %s (type %s)\n",
                path.c_str(), e4x_fs_meta_type_str[a_fs_file->meta->type]);
    }
    return E4X_OK;
}


E4X_FILTER_ENUM
E4xExtract::filterFs(E4X_FS_INFO * fs_info)
{
    if (e4x_verbose)
        e4x_fprintf(stderr, "filterFs: extracting file system at offset %"
            PRIdOFF " (block size %u, %" PRIuDADDR " blocks) to %s\n",
            fs_info->offset, fs_info->block_size, fs_info->block_count,
            m_base_dir.c_str());
    return E4X_FILTER_CONT;
}


/**
 * Extract the file system that starts at a sector offset of the opened
 * image into the output directory.
 *
 * @param a_soffset Sector offset of the file system
 * @returns 1 on fatal errors (registered) and 0 otherwise, even if
 * single paths failed
 */
uint8_t
E4xExtract::extractFiles(E4X_OFF_T a_soffset)
{
    if (m_img_info == NULL) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_AUTO_NOTOPEN);
        e4x_error_set_errstr("extractFiles: no image is open");
        registerError();
        return 1;
    }

    if (makeBaseDir()) {
        registerError();
        closeTables();
        return 1;
    }

    uint8_t retval = findFilesInFs(a_soffset * m_img_info->sector_size);
    closeTables();
    return retval;
}
