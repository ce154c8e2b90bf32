/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file img_types.cpp
 * Names of the container formats accepted by -i.
 */
#include "e4x_img_i.h"

namespace {

struct img_type_name {
    const char *name;
    E4X_IMG_TYPE_ENUM code;
    const char *comment;
};

// only the formats this build can open
const img_type_name img_type_names[] = {
    {"raw", E4X_IMG_TYPE_RAW, "Single or split raw file (dd) or block device"},
#if HAVE_LIBEWF
    {"ewf", E4X_IMG_TYPE_EWF, "Expert Witness Format (EnCase)"},
#endif
};

}

/**
 * \ingroup imglib
 * @returns the type for a -i argument or E4X_IMG_TYPE_UNSUPP
 */
E4X_IMG_TYPE_ENUM
e4x_img_type_toid(const char *a_str)
{
    for (const img_type_name & t : img_type_names) {
        if (strcmp(a_str, t.name) == 0)
            return t.code;
    }
    return E4X_IMG_TYPE_UNSUPP;
}

/**
 * \ingroup imglib
 * @returns the -i name of a type, or NULL if this build has no reader for it
 */
const char *
e4x_img_type_toname(E4X_IMG_TYPE_ENUM a_type)
{
    for (const img_type_name & t : img_type_names) {
        if (t.code == a_type)
            return t.name;
    }
    return NULL;
}

/**
 * \ingroup imglib
 * List the types for '-i list'.
 */
void
e4x_img_type_print(FILE * hFile)
{
    e4x_fprintf(hFile, "Supported image format types:\n");
    for (const img_type_name & t : img_type_names)
        e4x_fprintf(hFile, "\t%s (%s)\n", t.name, t.comment);
}
