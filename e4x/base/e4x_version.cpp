/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "e4x_base_i.h"

/**
 * \file e4x_version.cpp
 * Contains functions to print and obtain the library version.
 */

/**
 * \ingroup baselib
 * Print the library name and version to a handle (such as "The ext4
 * Extractor ver 1.2.0").
 * @param hFile Handle to print to
 */
void
e4x_version_print(FILE * hFile)
{
    e4x_fprintf(hFile, "The ext4 Extractor ver %s\n", E4X_VERSION_STR);
}

/**
 * \ingroup baselib
 * Return the library version as a string.
 * @returns String version of version (1.2.0 for example)
 */
const char *
e4x_version_get_str()
{
    return E4X_VERSION_STR;
}
