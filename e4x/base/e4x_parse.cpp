/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file e4x_parse.cpp
 * Contains code to parse specific types of data from
 * the command line
 */
#include "e4x_base_i.h"

/**
 * \ingroup baselib
 * Parse a string that gives the sector offset of the file system
 * in the image (such as "63" or "2048").  The result is in sectors.
 *
 * @param [in] a_offset_str The string version of the offset
 * @return -1 on error or offset on success
 */
E4X_OFF_T
e4x_parse_offset(const char *a_offset_str)
{
    char *cp = NULL;
    E4X_OFF_T num_blk;

    if (a_offset_str == NULL || a_offset_str[0] == '\0') {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_OFFSET);
        e4x_error_set_errstr("e4x_parse_offset: empty offset");
        return -1;
    }

    // a leading sign is never valid
    if (a_offset_str[0] == '-' || a_offset_str[0] == '+') {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_OFFSET);
        e4x_error_set_errstr("e4x_parse_offset: %s", a_offset_str);
        return -1;
    }

    num_blk = strtoll(a_offset_str, &cp, 0);
    if (*cp || *cp == *a_offset_str || num_blk < 0) {
        e4x_error_reset();
        e4x_error_set_errno(E4X_ERR_IMG_OFFSET);
        e4x_error_set_errstr("e4x_parse_offset: %s", a_offset_str);
        return -1;
    }

    return num_blk;
}
