/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

/** \file crc.cpp
 * crc16 as used by the ext4 group descriptor checksum
 * (polynomial 0x8005, reflected, so 0xA001 in the table).
 */

#include "e4x_base_i.h"

#include <array>

static std::array<uint16_t, 256>
crc16_make_table()
{
    std::array<uint16_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint16_t c = (uint16_t) i;
        for (int k = 0; k < 8; k++) {
            if (c & 1)
                c = (uint16_t) ((c >> 1) ^ 0xA001);
            else
                c = (uint16_t) (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

/**
 * \internal
 * Update a crc16 with a buffer.  ext4 seeds the sum with ~0.
 *
 * @param crc Running checksum
 * @param buf Data to add
 * @param len Number of bytes in buf
 * @returns Updated checksum
 */
uint16_t
e4x_crc16(uint16_t crc, const uint8_t * buf, size_t len)
{
    static const std::array<uint16_t, 256> crc16_table = crc16_make_table();

    while (len--) {
        crc = (uint16_t) ((crc >> 8) ^ crc16_table[(crc ^ *buf++) & 0xff]);
    }
    return crc;
}
