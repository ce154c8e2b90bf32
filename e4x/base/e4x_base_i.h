/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/** \file e4x_base_i.h
 * Internal declarations of the base layer that the library sources share.
 */
#ifndef _E4X_BASE_I_H
#define _E4X_BASE_I_H

#include "e4x_base.h"

#include <string.h>

#ifdef __cplusplus
extern "C" {
#endif

    extern void *e4x_malloc(size_t);

    // ext4 group descriptor checksum (crc16, reflected 0xA001)
    extern uint16_t e4x_crc16(uint16_t crc, const uint8_t * buf, size_t len);

#ifdef __cplusplus
}
#endif

/* Readers for unaligned multi-byte fields.  On-disk structures are
 * declared as byte arrays, so every field goes through one of these. */

static inline uint64_t
e4x_get_le(const void *a_buf, int a_len)
{
    const uint8_t *p = (const uint8_t *) a_buf;
    uint64_t v = 0;
    for (int i = a_len - 1; i >= 0; i--)
        v = (v << 8) | p[i];
    return v;
}

static inline uint64_t
e4x_get_be(const void *a_buf, int a_len)
{
    const uint8_t *p = (const uint8_t *) a_buf;
    uint64_t v = 0;
    for (int i = 0; i < a_len; i++)
        v = (v << 8) | p[i];
    return v;
}

#define e4x_getuN(endian, x, n) \
    (((endian) == E4X_LIT_ENDIAN) ? e4x_get_le((x), (n)) : e4x_get_be((x), (n)))

#define e4x_getu16(endian, x)	((uint16_t) e4x_getuN(endian, x, 2))
#define e4x_getu32(endian, x)	((uint32_t) e4x_getuN(endian, x, 4))
#define e4x_gets32(endian, x)	((int32_t) e4x_getu32(endian, x))

#define E4X_IS_CNTRL(x) (((x) >= 0x00) && ((x) < 0x20))

#endif
