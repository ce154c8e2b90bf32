/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _E4X_AUTO_I_H
#define _E4X_AUTO_I_H

/*
 * Contains the internal definitions for the automated extraction
 * classes.  This should be included by the code in the auto library.
 */

// Include the other internal header files
#include "e4x/base/e4x_base_i.h"
#include "e4x/img/e4x_img_i.h"
#include "e4x/fs/e4x_fs_i.h"

// Include the external file
#include "e4x_auto.h"

#include <string.h>

#endif
