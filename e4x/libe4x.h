#ifndef _E4X_LIBE4X_H
#define _E4X_LIBE4X_H
/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "e4x/base/e4x_base.h"
#include "e4x/img/e4x_img.h"
#include "e4x/fs/e4x_fs.h"
#include "e4x/auto/e4x_auto.h"

#endif
