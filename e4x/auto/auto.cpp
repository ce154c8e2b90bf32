/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file auto.cpp
 * E4xAuto: opens an image and walks the directory tree of the ext4 file
 * system in it, handing each entry to processFile().
 */

#include "e4x_auto_i.h"

#include <memory>

E4xAuto::E4xAuto()
:  m_img_info(NULL), m_stopAllProcessing(false)
{
}

E4xAuto::~E4xAuto()
{
    closeImage();
}

/**
 * Open the image to extract from.  Clears the error list.
 * @returns 1 on error (the error record is set but not registered)
 */
uint8_t
E4xAuto::openImage(int a_numImg, const char *const a_images[],
    E4X_IMG_TYPE_ENUM a_imgType, unsigned int a_sSize)
{
    resetErrorList();
    closeImage();

    m_img_info = e4x_img_open(a_numImg, a_images, a_imgType, a_sSize);
    return m_img_info == NULL;
}

void
E4xAuto::closeImage()
{
    e4x_img_close(m_img_info);
    m_img_info = NULL;
}

E4X_OFF_T
E4xAuto::getImageSize() const
{
    return m_img_info ? m_img_info->size : 0;
}

unsigned int
E4xAuto::getSectorSize() const
{
    return m_img_info ? m_img_info->sector_size : 0;
}

E4X_FILTER_ENUM
E4xAuto::filterFs(E4X_FS_INFO *)
{
    return E4X_FILTER_CONT;
}

/**
 * Open the file system at byte offset a_start of the image and walk it
 * from the root directory.
 *
 * @returns 1 if the file system could not be opened or its root could
 * not be read (registered).  Failures of single paths are registered
 * but leave the result at 0.
 */
uint8_t
E4xAuto::findFilesInFs(E4X_OFF_T a_start)
{
    if (m_img_info == NULL) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_AUTO_NOTOPEN);
        e4x_error_set_errstr("findFilesInFs: no image is open");
        registerError();
        return 1;
    }

    std::unique_ptr<E4X_FS_INFO, decltype(&e4x_fs_close)> fs(
        e4x_fs_open_img(m_img_info, a_start), e4x_fs_close);
    if (!fs) {
        e4x_error_set_errstr2("Sector offset: %" PRIuOFF,
            a_start / m_img_info->sector_size);
        registerError();
        return 1;
    }

    return walkTree(fs.get()) == E4X_ERR;
}

/** \internal
 * Refuse names that cannot be a single host path component.
 * @returns 1 if the name was refused (registered at the parent path)
 */
uint8_t
E4xAuto::checkName(const E4X_FS_NAME * a_fs_name, const std::string & a_path)
{
    const char *why;

    if (a_fs_name->name_len == 0)
        why = "empty name";
    else if (a_fs_name->name_len > E4X_FS_NAME_MAX)
        why = "name is longer than 255 bytes";
    else if (memchr(a_fs_name->name, '\0', a_fs_name->name_len))
        why = "name contains a NUL byte";
    else if (memchr(a_fs_name->name, '/', a_fs_name->name_len))
        why = "name contains a '/'";
    else
        return 0;

    e4x_error_reset();
    e4x_error_set_errno(E4X_ERR_FS_DIR_COR);
    e4x_error_set_errstr("entry for inode %" PRIuINUM " in %s: %s",
        a_fs_name->meta_addr, a_path.empty() ? "/" : a_path.c_str(), why);
    registerError(a_path.c_str());
    return 1;
}

namespace {

// an open directory and its path relative to the root, "" or "a/b/"
struct dir_frame {
    E4X_FS_DIR *dir;
    std::string path;
};

bool
is_dot_name(const E4X_FS_NAME & a_name)
{
    return a_name.name[0] == '.' && (a_name.name_len == 1
        || (a_name.name_len == 2 && a_name.name[1] == '.'));
}

}

/** \internal
 * Depth first walk with an explicit stack.  Each directory inode is
 * entered once, which breaks hard-linked directory loops.  A directory
 * refused that way is not handed to processFile().
 *
 * @returns E4X_ERR if the root could not be opened, E4X_STOP if the
 * walk was stopped and E4X_OK otherwise
 */
E4X_RETVAL_ENUM
E4xAuto::walkTree(E4X_FS_INFO * a_fs)
{
    const E4X_FILTER_ENUM filter = filterFs(a_fs);
    if (filter == E4X_FILTER_STOP || m_stopAllProcessing)
        return E4X_STOP;
    if (filter == E4X_FILTER_SKIP)
        return E4X_OK;

    std::vector<dir_frame> stack;
    std::set<E4X_INUM_T> visited;

    dir_frame root = { e4x_fs_dir_open_meta(a_fs, a_fs->root_inum), "" };
    if (root.dir == NULL) {
        e4x_error_set_errstr2("root directory of the file system at %"
            PRIuOFF, a_fs->offset);
        registerError("");
        return E4X_ERR;
    }
    stack.push_back(root);
    visited.insert(a_fs->root_inum);

    E4X_RETVAL_ENUM retval = E4X_OK;
    E4X_FS_NAME fs_name;
    while (!stack.empty() && retval == E4X_OK) {
        if (m_stopAllProcessing) {
            retval = E4X_STOP;
            break;
        }

        const dir_frame top = stack.back();
        const E4X_RETVAL_ENUM ret = e4x_fs_dir_next(top.dir, &fs_name);
        if (ret != E4X_OK) {
            if (ret != E4X_STOP)
                registerError(top.path.c_str());
            // a corrupt block only loses that block
            if (ret != E4X_COR) {
                e4x_fs_dir_close(top.dir);
                stack.pop_back();
            }
            continue;
        }

        if (is_dot_name(fs_name) || checkName(&fs_name, top.path))
            continue;

        const std::string path = top.path + fs_name.name;

        std::unique_ptr<E4X_FS_FILE, decltype(&e4x_fs_file_close)> fs_file(
            e4x_fs_file_open_meta(a_fs, NULL, fs_name.meta_addr),
            e4x_fs_file_close);
        if (!fs_file) {
            e4x_error_errstr2_concat(" - entry %s", path.c_str());
            registerError(path.c_str());
            continue;
        }
        fs_file->name = (E4X_FS_NAME *) e4x_malloc(sizeof(E4X_FS_NAME));
        if (fs_file->name == NULL) {
            registerError(path.c_str());
            retval = E4X_ERR;
            break;
        }
        *fs_file->name = fs_name;

        // refuse a looping or too deep directory before anything is
        // written for it
        const bool is_dir = isDir(fs_file.get());
        if (is_dir && visited.count(fs_name.meta_addr)) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_FS_DIR_COR);
            e4x_error_set_errstr("directory inode %" PRIuINUM
                " was already visited (directory loop)", fs_name.meta_addr);
            registerError(path.c_str());
            continue;
        }
        if (is_dir && stack.size() >= E4X_AUTO_MAX_DEPTH) {
            e4x_error_reset();
            e4x_error_set_errno(E4X_ERR_FS_DIR_COR);
            e4x_error_set_errstr("directory nesting deeper than %d",
                E4X_AUTO_MAX_DEPTH);
            registerError(path.c_str());
            continue;
        }

        const E4X_RETVAL_ENUM pret = processFile(fs_file.get(),
            top.path.c_str());
        if (pret == E4X_STOP || m_stopAllProcessing) {
            retval = E4X_STOP;
            break;
        }
        if (pret != E4X_OK || !is_dir)
            continue;
        visited.insert(fs_name.meta_addr);

        dir_frame child = { e4x_fs_dir_open_meta(a_fs, fs_name.meta_addr),
            path + "/" };
        if (child.dir == NULL) {
            registerError(path.c_str());
            continue;
        }
        stack.push_back(child);
    }

    for (dir_frame & f : stack)
        e4x_fs_dir_close(f.dir);
    return retval;
}

void
E4xAuto::setStopProcessing()
{
    m_stopAllProcessing = true;
}

bool
E4xAuto::getStopProcessing() const
{
    return m_stopAllProcessing;
}

/**
 * Move the error record into the error list, tagged with a_path, and
 * ask handleError() whether to go on.  The record is reset afterwards.
 * @returns 1 if processing should stop
 */
uint8_t
E4xAuto::registerError(const char *a_path)
{
    error_record er;
    er.code = e4x_error_get_errno();
    er.msg1 = e4x_error_get_errstr();
    er.msg2 = e4x_error_get_errstr2();
    if (a_path)
        er.path = a_path;
    m_errors.push_back(er);

    const uint8_t stop = handleError();
    if (stop)
        setStopProcessing();

    e4x_error_reset();
    return stop;
}

const std::vector<E4xAuto::error_record>
E4xAuto::getErrorList()
{
    return m_errors;
}

void
E4xAuto::resetErrorList()
{
    m_errors.clear();
}

/**
 * Format a registered error like e4x_error_get() does, prefixed with
 * "path: " when the error belongs to a path.
 */
std::string
E4xAuto::errorRecordToString(const error_record & rec)
{
    e4x_error_reset();
    e4x_error_set_errno(rec.code);
    e4x_error_set_errstr("%s", rec.msg1.c_str());
    e4x_error_set_errstr2("%s", rec.msg2.c_str());
    const char *msg = e4x_error_get();

    std::string ret = rec.path.empty() ? "" : rec.path + ": ";
    if (msg)
        ret += msg;
    e4x_error_reset();
    return ret;
}

uint8_t
E4xAuto::handleError()
{
    return 0;
}

uint8_t
E4xAuto::isDotDir(const E4X_FS_FILE * a_fs_file)
{
    return a_fs_file && a_fs_file->name && is_dot_name(*a_fs_file->name);
}

uint8_t
E4xAuto::isDir(const E4X_FS_FILE * a_fs_file)
{
    return a_fs_file && a_fs_file->meta
        && a_fs_file->meta->type == E4X_FS_META_TYPE_DIR;
}

uint8_t
E4xAuto::isFile(const E4X_FS_FILE * a_fs_file)
{
    return a_fs_file && a_fs_file->meta
        && a_fs_file->meta->type == E4X_FS_META_TYPE_REG;
}

uint8_t
E4xAuto::isSymlink(const E4X_FS_FILE * a_fs_file)
{
    return a_fs_file && a_fs_file->meta
        && a_fs_file->meta->type == E4X_FS_META_TYPE_LNK;
}
