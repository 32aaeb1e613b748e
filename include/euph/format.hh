// This is copyrighted software. More information is at the end of this file.
/**
 * @file format.hh
 * @brief Container-level constants and the HEAD chunk layout
 */

#pragma once

#include <euph/export_euph.h>
#include <euph/euph_config.h>
#include <euph/types.hh>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace euph {

/// "EUPH" at offset 0
constexpr uint8_t CONTAINER_MAGIC[4] = {'E', 'U', 'P', 'H'};

/// magic + major + minor + chunk count
constexpr size_t CONTAINER_HEADER_SIZE = 10;

constexpr uint8_t FORMAT_VERSION_MAJOR = EUPH_FORMAT_VERSION_MAJOR;
constexpr uint8_t FORMAT_VERSION_MINOR = EUPH_FORMAT_VERSION_MINOR;

/// Size of the HEAD payload written by this version
constexpr size_t HEADER_PAYLOAD_SIZE = 32;

/// Smallest HEAD payload a decoder accepts (up to and including frame_count)
constexpr size_t HEADER_PAYLOAD_MIN_SIZE = 20;

constexpr unsigned MAX_COMPRESSION_LEVEL = 9;

/// Conventional file extension, including the dot
constexpr const char* FILE_EXTENSION = ".euph";

/**
 * @struct format_version
 * @brief Container version as found in bytes 4 and 5
 */
struct format_version {
    uint8_t major = FORMAT_VERSION_MAJOR;
    uint8_t minor = FORMAT_VERSION_MINOR;

    [[nodiscard]] std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor);
    }
};

/**
 * @struct container_header
 * @brief The fixed 10-byte preamble
 */
struct container_header {
    format_version version;
    uint32_t chunk_count = 0;
};

/**
 * @struct header_info
 * @brief Decoded HEAD chunk
 *
 * Layout (little-endian):
 * @code
 * +0  sample_rate        uint32
 * +4  channel_count      uint16
 * +6  bit_depth          uint16
 * +8  duration_ms        uint32
 * +12 profile            uint8
 * +13 compression_level  uint8
 * +14 flags              uint16 (reserved, 0)
 * +16 frame_count        uint32
 * +20 reserved           12 bytes
 * @endcode
 */
struct header_info {
    sample_rate_t sample_rate = 0;
    channels_t channel_count = 0;
    uint16_t bit_depth = 0;
    uint32_t duration_ms = 0;
    encoding_profile profile = encoding_profile::balanced;
    uint8_t compression_level = 0;
    uint16_t flags = 0;
    uint32_t frame_count = 0;

    /// channel_count x frame_count
    [[nodiscard]] uint64_t total_samples() const {
        return static_cast<uint64_t>(channel_count) * frame_count;
    }
};

EUPH_EXPORT void write_container_header(uint8_t out[CONTAINER_HEADER_SIZE], const container_header& header);

/**
 * @brief Parse and validate the 10-byte preamble
 *
 * @throws format_error("bad magic") if the magic does not match
 * @throws format_error("truncated container header") if fewer than 10 bytes are available
 * @throws unsupported_version_error if the major version is newer than FORMAT_VERSION_MAJOR
 */
EUPH_EXPORT container_header read_container_header(const uint8_t* data, size_t size);

/// True when data starts with "EUPH" and holds a full preamble. Never throws.
EUPH_EXPORT bool has_container_magic(const uint8_t* data, size_t size);

EUPH_EXPORT std::vector<uint8_t> serialize_header(const header_info& info);

/**
 * @brief Parse a HEAD payload
 * @throws format_error on short payloads, an unknown profile, a level above 9,
 *         or a zero sample rate / channel count
 */
EUPH_EXPORT header_info parse_header(const uint8_t* payload, size_t size);

/// Case-insensitive check for the ".euph" extension
EUPH_EXPORT bool has_euph_extension(const std::string& path);

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
