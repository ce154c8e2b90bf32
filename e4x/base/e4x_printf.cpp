/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/** \file e4x_printf.cpp
 * Printing functions used by the library and the tools.  File system
 * names are printed as stored; e4x_print_sanitized() is used for names
 * that go to a terminal.
 */

#include "e4x_base_i.h"

FILE *e4x_stdout = stdout;
FILE *e4x_stderr = stderr;

/**
 * \ingroup baselib
 * Print a string to a file stream.
 *
 * @param fd File to print to
 * @param msg printf message
 */
void
e4x_fprintf(FILE * fd, const char *msg, ...)
{
    va_list args;
    va_start(args, msg);
    vfprintf(fd, msg, args);
    va_end(args);
}

/**
 * \ingroup baselib
 * Print a string with control characters replaced by '^'.
 *
 * @param fd File to print to
 * @param str String to print
 * @returns 1 on error and 0 on success
 */
int
e4x_print_sanitized(FILE * fd, const char *str)
{
    const char replacement = '^';

    size_t len = strlen(str);
    char *buf = (char *) e4x_malloc(len + 1);
    if (buf == NULL)
        return 1;

    for (size_t i = 0; i < len; i++) {
        if (E4X_IS_CNTRL((signed char) str[i]))
            buf[i] = replacement;
        else
            buf[i] = str[i];
    }
    buf[len] = '\0';
    e4x_fprintf(fd, "%s", buf);
    free(buf);
    return 0;
}
