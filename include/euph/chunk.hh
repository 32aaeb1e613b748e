// This is copyrighted software. More information is at the end of this file.
/**
 * @file chunk.hh
 * @brief Chunk framing: 4-byte tag, little-endian uint32 size, payload
 */

#pragma once

#include <euph/export_euph.h>
#include <iff/fourcc.hh>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace euph {

/// Size of the tag + size prefix in front of every payload
constexpr size_t CHUNK_HEADER_SIZE = 8;

// Chunk identifiers
EUPH_EXPORT extern const iff::fourcc HEAD_ID;  ///< Technical header
EUPH_EXPORT extern const iff::fourcc META_ID;  ///< Descriptive metadata (JSON)
EUPH_EXPORT extern const iff::fourcc AUDI_ID;  ///< Compressed audio, may repeat
EUPH_EXPORT extern const iff::fourcc AIDE_ID;  ///< Opaque AI enhancement bytes
EUPH_EXPORT extern const iff::fourcc DSPS_ID;  ///< Opaque DSP settings (JSON text)
EUPH_EXPORT extern const iff::fourcc CHKS_ID;  ///< Integrity record

/**
 * @brief Build a tag from a name of up to 4 characters
 *
 * Shorter names are NUL-padded, so make_tag("AI") is 'A','I',0,0.
 *
 * @throws encoding_error if the name is longer than 4 characters
 */
EUPH_EXPORT iff::fourcc make_tag(const std::string& name);

/// Printable tag name with trailing NUL padding removed
EUPH_EXPORT std::string tag_name(const iff::fourcc& tag);

/// True for the six tags this library understands
EUPH_EXPORT bool is_known_tag(const iff::fourcc& tag);

/**
 * @struct chunk_view
 * @brief One parsed chunk, payload pointing into the source buffer
 */
struct chunk_view {
    iff::fourcc type;
    uint32_t size = 0;
    const uint8_t* payload = nullptr;
    size_t offset = 0;       ///< Offset of the chunk header in the buffer
    size_t next_offset = 0;  ///< Offset just past the payload
};

/**
 * @brief Frame a payload as a chunk
 * @return tag + size + payload
 * @throws encoding_error if the payload does not fit a uint32 size field
 */
EUPH_EXPORT std::vector<uint8_t> write_chunk(const iff::fourcc& type, const uint8_t* payload, size_t size);

EUPH_EXPORT std::vector<uint8_t> write_chunk(const iff::fourcc& type, const std::vector<uint8_t>& payload);

/**
 * @brief Frame a payload as a chunk, appending to an existing buffer
 * @throws encoding_error if the payload does not fit a uint32 size field
 */
EUPH_EXPORT void append_chunk(std::vector<uint8_t>& out, const iff::fourcc& type,
                              const uint8_t* payload, size_t size);

/**
 * @brief Parse the chunk starting at offset
 *
 * The payload is not copied; the returned view is valid as long as the
 * buffer is.
 *
 * @throws format_error("truncated chunk") if the header or the declared
 *         payload extends past the end of the buffer
 */
EUPH_EXPORT chunk_view read_chunk(const uint8_t* buffer, size_t buffer_size, size_t offset);

} // namespace euph


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
