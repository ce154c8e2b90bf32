/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/** \file e4x_base.h
 * Public declarations of the base layer: integer types, the per-thread
 * error record, return codes and output helpers.  Programs include
 * libe4x.h instead of this file.
 */

/**
 * \defgroup baselib C Base e4x Library Functions
 * \defgroup baselib_cpp C++ Base e4x Library Classes
 */

#ifndef _E4X_BASE_H
#define _E4X_BASE_H

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>

/** Library version as 0xAABBCCff for version AA.BB.CC */
#define E4X_VERSION_NUM 0x010200ff

/** Library version as a string */
#define E4X_VERSION_STR "1.2.0"

#include "e4x_os.h"

#ifdef __cplusplus
extern "C" {
#endif

#ifdef __GNUC__
#define E4X_ERROR_FORMAT_ATTRIBUTE(n,m) __attribute__((format (printf, n, m)))
#else
#define E4X_ERROR_FORMAT_ATTRIBUTE(n,m)
#endif

/** \name Address and size types */
//@{
    typedef uint64_t E4X_INUM_T;        ///< Inode number
#define PRIuINUM	PRIu64
#define PRIxINUM	PRIx64

    typedef uint32_t E4X_UID_T;         ///< Owner id
#define PRIuUID	    PRIu32

    typedef uint32_t E4X_GID_T;         ///< Group id
#define PRIuGID	    PRIu32

    typedef uint64_t E4X_DADDR_T;       ///< Block number of the file system
#define PRIuDADDR   PRIu64
#define PRIxDADDR   PRIx64

    typedef int64_t E4X_OFF_T;          ///< Byte offset or size in an image or a file
#define PRIuOFF		PRIu64
#define PRIdOFF		PRId64
//@}


/** \name Error record */
//@{
#define E4X_ERROR_STRING_MAX_LENGTH 1024

    /**
     * The last error of a thread: a code from the E4X_ERR_* list and
     * two free form messages.  errstr says what failed, errstr2 is
     * context that callers append on the way up.
     */
    typedef struct {
        uint32_t t_errno;
        char errstr[E4X_ERROR_STRING_MAX_LENGTH + 1];
        char errstr2[E4X_ERROR_STRING_MAX_LENGTH + 1];
        char errstr_print[E4X_ERROR_STRING_MAX_LENGTH + 1];
    } E4X_ERROR_INFO;

    extern E4X_ERROR_INFO *e4x_error_get_info();

    extern uint32_t e4x_error_get_errno();
    extern void e4x_error_set_errno(uint32_t t_errno);
    extern char *e4x_error_get_errstr();
    extern void e4x_error_set_errstr(const char *format,
        ...) E4X_ERROR_FORMAT_ATTRIBUTE(1, 2);
    extern void e4x_error_vset_errstr(const char *format, va_list args);
    extern char *e4x_error_get_errstr2();
    extern void e4x_error_set_errstr2(const char *format,
        ...) E4X_ERROR_FORMAT_ATTRIBUTE(1, 2);
    extern void e4x_error_vset_errstr2(const char *format, va_list args);
    extern void e4x_error_errstr2_concat(const char *format,
        ...) E4X_ERROR_FORMAT_ATTRIBUTE(1, 2);

    extern const char *e4x_error_get();
    extern void e4x_error_print(FILE *);
    extern void e4x_error_reset();
//@}

/* Error codes.  The upper byte names the layer, the rest indexes the
 * message table of that layer in e4x_error.cpp. */
#define E4X_ERR_AUX	0x01000000
#define E4X_ERR_IMG	0x02000000
#define E4X_ERR_FS	0x08000000
#define E4X_ERR_AUTO	0x20000000
#define E4X_ERR_MASK	0x00ffffff

#define E4X_ERR_AUX_MALLOC	(E4X_ERR_AUX | 0)
#define E4X_ERR_AUX_MAX		1

#define E4X_ERR_IMG_NOFILE	(E4X_ERR_IMG | 0)
#define E4X_ERR_IMG_OFFSET	(E4X_ERR_IMG | 1)
#define E4X_ERR_IMG_UNKTYPE	(E4X_ERR_IMG | 2)
#define E4X_ERR_IMG_UNSUPTYPE	(E4X_ERR_IMG | 3)
#define E4X_ERR_IMG_OPEN	(E4X_ERR_IMG | 4)
#define E4X_ERR_IMG_STAT	(E4X_ERR_IMG | 5)
#define E4X_ERR_IMG_SEEK	(E4X_ERR_IMG | 6)
#define E4X_ERR_IMG_READ	(E4X_ERR_IMG | 7)
#define E4X_ERR_IMG_READ_OFF	(E4X_ERR_IMG | 8)
#define E4X_ERR_IMG_ARG		(E4X_ERR_IMG | 9)
#define E4X_ERR_IMG_MAGIC	(E4X_ERR_IMG | 10)
#define E4X_ERR_IMG_MAX		11

#define E4X_ERR_FS_UNSUPFEAT	(E4X_ERR_FS | 0)
#define E4X_ERR_FS_READ		(E4X_ERR_FS | 1)
#define E4X_ERR_FS_READ_OFF	(E4X_ERR_FS | 2)
#define E4X_ERR_FS_ARG		(E4X_ERR_FS | 3)
#define E4X_ERR_FS_INODE_NUM	(E4X_ERR_FS | 4)
#define E4X_ERR_FS_MAGIC	(E4X_ERR_FS | 5)
#define E4X_ERR_FS_FWALK	(E4X_ERR_FS | 6)
#define E4X_ERR_FS_CORRUPT	(E4X_ERR_FS | 7)
#define E4X_ERR_FS_EXTENT_COR	(E4X_ERR_FS | 8)
#define E4X_ERR_FS_DIR_COR	(E4X_ERR_FS | 9)
#define E4X_ERR_FS_ATTR_COR	(E4X_ERR_FS | 10)
#define E4X_ERR_FS_MAX		11

#define E4X_ERR_AUTO_NOTOPEN	(E4X_ERR_AUTO | 0)
#define E4X_ERR_AUTO_WRITE	(E4X_ERR_AUTO | 1)
#define E4X_ERR_AUTO_MAX	2


    /**
     * Result of functions that tell a system error apart from corrupt
     * on-disk data.
     */
    typedef enum {
        E4X_OK,                 ///< Success
        E4X_ERR,                ///< System error, the caller should give up
        E4X_COR,                ///< Corrupt data, other objects can still be processed
        E4X_STOP                ///< Nothing more to return, not an error
    } E4X_RETVAL_ENUM;

    /**
     * What a walk callback wants the walk to do next.
     */
    typedef enum {
        E4X_WALK_CONT = 0x0,    ///< Go on with the next unit
        E4X_WALK_STOP = 0x1,    ///< End the walk successfully
        E4X_WALK_ERROR = 0x2    ///< End the walk with an error (the callback set it)
    } E4X_WALK_RET_ENUM;

    /** Byte order of on-disk fields.  ext4 is always little endian. */
    typedef enum {
        E4X_UNKNOWN_ENDIAN = 0x00,
        E4X_LIT_ENDIAN = 0x01,
        E4X_BIG_ENDIAN = 0x02
    } E4X_ENDIAN_ENUM;


    extern int e4x_verbose;     ///< Debug messages go to stderr when non-zero

    /** Output streams of the tool, stdout and stderr unless redirected */
    extern FILE *e4x_stdout;
    extern FILE *e4x_stderr;

    extern void e4x_fprintf(FILE * fd, const char *msg, ...) E4X_ERROR_FORMAT_ATTRIBUTE(2, 3);
    extern int e4x_print_sanitized(FILE * fd, const char *str);

    extern void e4x_version_print(FILE *);
    extern const char *e4x_version_get_str();

    extern E4X_OFF_T e4x_parse_offset(const char *);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

/**
 * \ingroup baselib_cpp
 * Static access to the error record of the calling thread.
 */
class E4xError {
  public:
    /** @returns the formatted error or NULL, see e4x_error_get() */
    static const char *get() {
        return e4x_error_get();
    };

    static void print(FILE * a_hFile) {
        e4x_error_print(a_hFile);
    };

    static void reset() {
        e4x_error_reset();
    };
};

#endif
#endif
