/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/** \file e4x_os.h
 * Integer types and printf formats from the platform headers.
 */

#ifndef _E4X_OS_H
#define _E4X_OS_H

#include <stdint.h>
#include <inttypes.h>
#include <sys/types.h>

#ifndef PRIuSIZE
#define PRIuSIZE "zu"
#endif

#endif
