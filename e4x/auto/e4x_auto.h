/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file e4x_auto.h
 * Classes that walk a file system in an image and extract it to the
 * host.  Included through libe4x.h.
 */

/**
 * \defgroup autolib Extraction Automation
 */

#ifndef _E4X_AUTO_H
#define _E4X_AUTO_H

#ifdef __cplusplus

#include "e4x/base/e4x_base.h"
#include "e4x/img/e4x_img.h"
#include "e4x/fs/e4x_fs.h"

#include <set>
#include <string>
#include <vector>

/** Deepest directory nesting that is descended into */
#define E4X_AUTO_MAX_DEPTH 1024

/** Answer of E4xAuto::filterFs() */
typedef enum {
    E4X_FILTER_CONT = 0x00,     ///< Walk the file system
    E4X_FILTER_STOP = 0x01,     ///< Stop all processing
    E4X_FILTER_SKIP = 0x02,     ///< Leave the file system alone
} E4X_FILTER_ENUM;


/** \ingroup autolib
 * Walks the directory tree of an ext4 file system depth first, from the
 * root, and calls processFile() for every entry but "." and "..".
 *
 * Open the image with openImage() and start the walk with
 * findFilesInFs().  Errors do not end the walk: each one is kept in a
 * list with the path it belongs to, see getErrorList().  Override
 * handleError() to stop on errors or to report them as they happen.
 */
class E4xAuto {
  public:
    E4xAuto();
    virtual ~ E4xAuto();

    virtual uint8_t openImage(int, const char *const images[],
        E4X_IMG_TYPE_ENUM, unsigned int a_ssize);
    virtual void closeImage();

    E4X_OFF_T getImageSize() const;
    unsigned int getSectorSize() const;

    /** True once a filter, processFile() or handleError() asked to stop */
    bool getStopProcessing() const;

    uint8_t findFilesInFs(E4X_OFF_T a_start);

    /**
     * Called once the file system is open and before anything in it is
     * visited.
     */
    virtual E4X_FILTER_ENUM filterFs(E4X_FS_INFO * fs_info);

    /**
     * Called for each entry.  fs_file has both name and meta set.
     *
     * @param path parent directory relative to the root, "" for the root
     * itself and otherwise ending in "/"
     * @returns E4X_OK, E4X_COR to keep the walk out of a directory or
     * E4X_STOP to end the walk.  Errors are registered by the callee.
     */
    virtual E4X_RETVAL_ENUM processFile(E4X_FS_FILE * fs_file,
        const char *path) = 0;

    uint8_t registerError(const char *a_path = NULL);

    struct error_record {
        int code;
        std::string msg1;
        std::string msg2;
        std::string path;
    };

    const std::vector < error_record > getErrorList();
    void resetErrorList();
    static std::string errorRecordToString(const error_record & rec);

    /**
     * Hook run by registerError() while the error values are still set.
     * @return 1 to stop the walk, 0 to go on
     */
    virtual uint8_t handleError();

  private:
    std::vector < error_record > m_errors;

    E4xAuto(const E4xAuto &) = delete;
    E4xAuto & operator=(const E4xAuto &) = delete;

    E4X_RETVAL_ENUM walkTree(E4X_FS_INFO * a_fs);
    uint8_t checkName(const E4X_FS_NAME * a_fs_name,
        const std::string & a_path);

  protected:
    E4X_IMG_INFO * m_img_info;
    bool m_stopAllProcessing;

    uint8_t isDotDir(const E4X_FS_FILE * fs_file);
    uint8_t isDir(const E4X_FS_FILE * fs_file);
    uint8_t isFile(const E4X_FS_FILE * fs_file);
    uint8_t isSymlink(const E4X_FS_FILE * fs_file);

    void setStopProcessing();
};


/**
 * How symbolic links are written to the host.
 */
typedef enum {
    E4X_SYMLINK_SAVE = 0,       ///< Create a real symbolic link with the stored target
    E4X_SYMLINK_TEXT,           ///< Write the target as the content of a regular file
    E4X_SYMLINK_EMPTY,          ///< Write an empty regular file
    E4X_SYMLINK_SKIP,           ///< Do not write anything
} E4X_SYMLINK_POLICY_ENUM;


/** \ingroup autolib
 * Extracts the directory tree of a file system into a directory on the
 * host.  Directories and regular files are recreated, symbolic links are
 * written according to the symlink policy and other file types are only
 * recorded.  Optionally writes a table of the symbolic links and a table
 * with the metadata of every visited path.
 */
class E4xExtract:public E4xAuto {
  public:
    explicit E4xExtract(const char *a_base_dir);
    virtual ~ E4xExtract();

    void setSymlinkPolicy(E4X_SYMLINK_POLICY_ENUM a_policy);
    uint8_t setSymlinkTable(const char *a_path);
    uint8_t setMetadataTable(const char *a_path);

    virtual E4X_RETVAL_ENUM processFile(E4X_FS_FILE * fs_file,
        const char *path);
    virtual E4X_FILTER_ENUM filterFs(E4X_FS_INFO * fs_info);

    uint8_t extractFiles(E4X_OFF_T a_soffset);

    int getFileCount() const {
        return m_fileCount;
    };
    int getDirCount() const {
        return m_dirCount;
    };
    int getSymlinkCount() const {
        return m_linkCount;
    };
    int getSkipCount() const {
        return m_skipCount;
    };

    static std::string encodeXattrValue(const std::string & a_value);
    static std::string encodeTablePath(const char *a_path);

  private:
    std::string m_base_dir;
    E4X_SYMLINK_POLICY_ENUM m_policy;
    FILE *m_symlinkTable;
    FILE *m_metadataTable;
    int m_fileCount;
    int m_dirCount;
    int m_linkCount;
    int m_skipCount;

    uint8_t makeBaseDir();
    uint8_t makeDir(const std::string & a_host, const char *a_path);
    uint8_t clearHostPath(const std::string & a_host, const char *a_path);
    uint8_t writeFile(E4X_FS_FILE * a_fs_file, const std::string & a_host,
        const char *a_path);
    uint8_t writeContent(const std::string & a_host, const char *a_buf,
        size_t a_len, const char *a_path);
    uint8_t writeSymlink(E4X_FS_FILE * a_fs_file, const std::string & a_host,
        const char *a_path);
    void addMetadata(E4X_FS_FILE * a_fs_file, const char *a_path);
    void addSymlinkRecord(const char *a_path, const char *a_target);
    void closeTables();
};

#endif

#endif
