/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef EXT4_TEST_IMAGE_H
#define EXT4_TEST_IMAGE_H

#include "e4x/libe4x.h"
#include "test/e4x/fs/ext4_image_builder.h"
#include "test/runner.h"

#include <memory>
#include <string>
#include <vector>

/* A built image written to a temporary file and opened as a file system */
struct Ext4TestImage {
    runner::tempdir dir;
    std::string path;
    E4xImgInfo img;
    E4xFsInfo fs;

    explicit Ext4TestImage(Ext4ImageBuilder & a_builder,
        const std::string & a_name = "ext4img")
        : dir(a_name)
    {
        a_builder.finish();
        path = (dir.path / "image.raw").string();
        a_builder.write(path);
        const char *const images[] = { path.c_str() };
        if (img.open(1, images, E4X_IMG_TYPE_RAW, 0) == 0)
            fs.open(img.get(), 0);
    }

    E4X_FS_INFO *get() const {
        return fs.get();
    }
};

typedef std::unique_ptr<E4X_FS_FILE, decltype(&e4x_fs_file_close)> file_ptr;
typedef std::unique_ptr<E4X_FS_DIR, decltype(&e4x_fs_dir_close)> dir_ptr;

inline file_ptr
open_inode(E4X_FS_INFO * a_fs, E4X_INUM_T a_inum)
{
    return file_ptr(e4x_fs_file_open_meta(a_fs, NULL, a_inum),
        e4x_fs_file_close);
}

inline dir_ptr
open_dir(E4X_FS_INFO * a_fs, E4X_INUM_T a_inum)
{
    return dir_ptr(e4x_fs_dir_open_meta(a_fs, a_inum), e4x_fs_dir_close);
}

/* whole content of a file, or an empty string after an error */
inline std::string
read_all(E4X_FS_FILE * a_file)
{
    std::string buf((size_t) a_file->meta->size, '\0');
    if (buf.empty())
        return buf;
    ssize_t cnt = e4x_fs_file_read(a_file, 0, &buf[0], buf.size());
    if (cnt < 0)
        return std::string();
    buf.resize((size_t) cnt);
    return buf;
}

/* names returned by a directory until it stops or fails */
inline std::vector<std::string>
list_dir(E4X_FS_DIR * a_dir, E4X_RETVAL_ENUM * a_last = NULL)
{
    std::vector<std::string> names;
    E4X_FS_NAME name;
    E4X_RETVAL_ENUM ret;
    while ((ret = e4x_fs_dir_next(a_dir, &name)) == E4X_OK)
        names.push_back(name.name);
    if (a_last != NULL)
        *a_last = ret;
    return names;
}

#endif
