// This is copyrighted software. More information is at the end of this file.
#ifndef EUPH_ENDIAN_HH
#define EUPH_ENDIAN_HH

#include <euph/euph_config.h>
#include <cstdint>
#include <cstring>

namespace euph {

// Platform endianness detection using CMake-generated config
#if EUPH_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

inline uint16_t swap16(uint16_t x) {
    return static_cast<uint16_t>((x << 8) | (x >> 8));
}

inline uint32_t swap32(uint32_t x) {
    return ((x << 24) | ((x << 8) & 0x00FF0000) |
            ((x >> 8) & 0x0000FF00) | (x >> 24));
}

inline uint16_t swap16le(uint16_t x) {
    return is_little_endian ? x : swap16(x);
}

inline uint32_t swap32le(uint32_t x) {
    return is_little_endian ? x : swap32(x);
}

// Unaligned little-endian loads and stores. Container fields sit at
// arbitrary byte offsets, so these go through memcpy.
inline uint16_t load_u16le(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, sizeof(v));
    return swap16le(v);
}

inline uint32_t load_u32le(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, sizeof(v));
    return swap32le(v);
}

inline void store_u16le(uint8_t* p, uint16_t v) {
    v = swap16le(v);
    std::memcpy(p, &v, sizeof(v));
}

inline void store_u32le(uint8_t* p, uint32_t v) {
    v = swap32le(v);
    std::memcpy(p, &v, sizeof(v));
}

} // namespace euph

#endif // EUPH_ENDIAN_HH


/*
 * Copyright (C) 2025
 *
 * This file is part of libeuph.
 *
 * libeuph is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * libeuph is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with libeuph.  If not, see <http://www.gnu.org/licenses/>.
 */
