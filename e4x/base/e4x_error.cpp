/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/** \file e4x_error.cpp
 * Contains the per-thread error record and the functions that
 * read and write it.
 */

#include "e4x_base_i.h"

#include <errno.h>

/**
 * \ingroup baselib
 * Tracks whether verbose debugging messages should be printed.
 */
int e4x_verbose = 0;

// message tables, indexed by the low bits of the error code
static const char *e4x_err_aux_str[E4X_ERR_AUX_MAX] = {
    "Out of memory",
};

static const char *e4x_err_img_str[E4X_ERR_IMG_MAX] = {
    "No image file given",
    "Image offset out of range",
    "Unknown image format",
    "Image format not supported by this build",
    "Cannot open image",
    "Cannot stat image",
    "Cannot seek in image",
    "Image read failed",
    "Read offset past the end of the image",
    "Bad argument to the image layer",
    "Not an image file",
};

static const char *e4x_err_fs_str[E4X_ERR_FS_MAX] = {
    "Unsupported file system feature",
    "File system read failed",
    "Read offset past the end of the file",
    "Bad argument to the file system layer",
    "Inode number out of range",
    "Invalid superblock",
    "File content walk failed",
    "Corrupt file system metadata",
    "Corrupt extent tree",
    "Corrupt directory",
    "Corrupt extended attributes",
};

static const char *e4x_err_auto_str[E4X_ERR_AUTO_MAX] = {
    "No image is open",
    "Error writing output",
};

static const struct {
    uint32_t group;
    const char *name;
    const char **msgs;
    uint32_t count;
} e4x_err_groups[] = {
    {E4X_ERR_AUX, "aux", e4x_err_aux_str, E4X_ERR_AUX_MAX},
    {E4X_ERR_IMG, "img", e4x_err_img_str, E4X_ERR_IMG_MAX},
    {E4X_ERR_FS, "fs", e4x_err_fs_str, E4X_ERR_FS_MAX},
    {E4X_ERR_AUTO, "auto", e4x_err_auto_str, E4X_ERR_AUTO_MAX},
};


/* Per-thread error record. */
static thread_local E4X_ERROR_INFO thread_error_info;

/**
 * \ingroup baselib
 * Return the error record of the calling thread.
 */
E4X_ERROR_INFO *
e4x_error_get_info()
{
    return &thread_error_info;
}

/**
 * \ingroup baselib
 * Return the error code of the calling thread.
 */
uint32_t
e4x_error_get_errno()
{
    return e4x_error_get_info()->t_errno;
}

/**
 * \ingroup baselib
 * Set the error code of the calling thread.
 */
void
e4x_error_set_errno(uint32_t t_errno)
{
    e4x_error_get_info()->t_errno = t_errno;
}

char *
e4x_error_get_errstr()
{
    return e4x_error_get_info()->errstr;
}

void
e4x_error_vset_errstr(const char *format, va_list args)
{
    vsnprintf(e4x_error_get_info()->errstr, E4X_ERROR_STRING_MAX_LENGTH,
        format, args);
}

void
e4x_error_set_errstr(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    e4x_error_vset_errstr(format, args);
    va_end(args);
}

char *
e4x_error_get_errstr2()
{
    return e4x_error_get_info()->errstr2;
}

void
e4x_error_vset_errstr2(const char *format, va_list args)
{
    vsnprintf(e4x_error_get_info()->errstr2, E4X_ERROR_STRING_MAX_LENGTH,
        format, args);
}

void
e4x_error_set_errstr2(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    e4x_error_vset_errstr2(format, args);
    va_end(args);
}

/**
 * \ingroup baselib
 * Append a formatted message to the secondary error string.
 */
void
e4x_error_errstr2_concat(const char *format, ...)
{
    char *errstr2 = e4x_error_get_info()->errstr2;
    size_t current_length = strlen(errstr2);
    if (current_length >= E4X_ERROR_STRING_MAX_LENGTH) {
        return;
    }

    va_list args;
    va_start(args, format);
    vsnprintf(&errstr2[current_length],
        E4X_ERROR_STRING_MAX_LENGTH - current_length, format, args);
    va_end(args);
}

/**
 * \ingroup baselib
 * Return the human-readable form of the most recent error in the
 * calling thread.  The string combines the message for the error
 * code with both error strings.
 *
 * @returns A pointer to the error string or NULL if there is no error
 */
const char *
e4x_error_get()
{
    E4X_ERROR_INFO *info = e4x_error_get_info();
    const uint32_t t_errno = info->t_errno;
    char *out = info->errstr_print;
    const size_t max = E4X_ERROR_STRING_MAX_LENGTH;

    if (t_errno == 0)
        return NULL;

    out[0] = '\0';
    const uint32_t idx = t_errno & E4X_ERR_MASK;
    for (const auto & grp : e4x_err_groups) {
        if ((t_errno & ~E4X_ERR_MASK) != grp.group)
            continue;
        if (idx < grp.count)
            snprintf(out, max, "%s", grp.msgs[idx]);
        else
            snprintf(out, max, "%s error %" PRIu32, grp.name, idx);
        break;
    }
    if (out[0] == '\0')
        snprintf(out, max, "Unknown error 0x%" PRIx32, t_errno);

    size_t used = strlen(out);
    if (info->errstr[0] != '\0' && used < max) {
        snprintf(out + used, max - used, " (%s)", info->errstr);
        used = strlen(out);
    }
    if (info->errstr2[0] != '\0' && used < max)
        snprintf(out + used, max - used, " (%s)", info->errstr2);
    return out;
}

/**
 * \ingroup baselib
 * Print the current error message to a file.
 *
 * @param hFile File to print to
 */
void
e4x_error_print(FILE * hFile)
{
    const char *str;
    if (e4x_error_get_errno() == 0)
        return;

    str = e4x_error_get();
    if (str != NULL)
        e4x_fprintf(hFile, "%s\n", str);
}

/**
 * \ingroup baselib
 * Clear the error number and error message.
 */
void
e4x_error_reset()
{
    E4X_ERROR_INFO *info = e4x_error_get_info();
    info->t_errno = 0;
    info->errstr[0] = 0;
    info->errstr2[0] = 0;
    info->errstr_print[0] = 0;
}


/**
 * \ingroup baselib
 * Allocate zeroed memory and set the error record on failure.
 *
 * @param len Number of bytes to allocate
 * @returns NULL on error
 */
void *
e4x_malloc(size_t len)
{
    void *ptr;

    if ((ptr = calloc(1, len)) == NULL) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_AUX_MALLOC);
        e4x_error_set_errstr("e4x_malloc: %s (%" PRIuSIZE" requested)",
            strerror(errno), len);
    }
    return ptr;
}
