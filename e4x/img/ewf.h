/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/*
 * EWF reader, built only with libewf.
 */

#ifndef _E4X_EWF_H
#define _E4X_EWF_H

#if HAVE_LIBEWF

#include "e4x_img_i.h"

#include <libewf.h>

#include <mutex>

extern E4X_IMG_INFO *ewf_open(int a_num_img, const char *const a_images[],
    unsigned int a_ssize);

/*
 * Allocated with new (the mutex is not trivially constructible) and
 * value-initialized, so the IMG_INFO part starts zeroed.
 */
struct IMG_EWF_INFO {
    IMG_INFO img_info;
    libewf_handle_t *handle = nullptr;
    std::mutex read_lock;       // one libewf read at a time per handle
};

#endif
#endif
