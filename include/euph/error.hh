// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <euph/export_euph.h>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace euph {

/**
 * @brief Base exception class for all libeuph errors
 *
 * All libeuph-specific exceptions derive from this class, making it easy
 * to catch every codec failure with a single catch block.
 */
class EUPH_EXPORT euph_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Structurally malformed container
 *
 * Thrown when decoding input that is not a valid container, such as:
 * - Bad magic signature
 * - Truncated container header or chunk
 * - Missing HEAD, META or AUDI chunk
 * - Audio payload whose size disagrees with the HEAD chunk
 * - Audio payload the byte compressor cannot decode
 */
class EUPH_EXPORT format_error : public euph_error {
public:
    using euph_error::euph_error;
};

/**
 * @brief Container written with a major version this decoder cannot read
 *
 * Raised after the container header is read and before any chunk is
 * parsed. Minor version differences never raise this error.
 */
class EUPH_EXPORT unsupported_version_error : public euph_error {
public:
    unsupported_version_error(uint8_t file_major, uint8_t file_minor)
        : euph_error("unsupported container version " + std::to_string(file_major) + "." +
                     std::to_string(file_minor))
        , m_major(file_major)
        , m_minor(file_minor) {}

    [[nodiscard]] uint8_t file_major() const { return m_major; }
    [[nodiscard]] uint8_t file_minor() const { return m_minor; }

private:
    uint8_t m_major;
    uint8_t m_minor;
};

/**
 * @brief Invalid encoder input
 *
 * Thrown by the encoder, for example when:
 * - The PCM buffer is empty
 * - Per-channel arrays have different lengths
 * - The metadata channel count disagrees with the PCM buffer
 * - The duration is negative
 * - The compression level is out of range
 */
class EUPH_EXPORT encoding_error : public euph_error {
public:
    using euph_error::euph_error;
};

/**
 * @brief Compression backend errors
 *
 * Thrown when no registered backend passes its capability probe, or when
 * the selected backend fails while compressing.
 */
class EUPH_EXPORT backend_error : public euph_error {
public:
    using euph_error::euph_error;
};

/**
 * @brief I/O stream related errors
 *
 * Thrown when a stream cannot be opened, read or written.
 */
class EUPH_EXPORT io_error : public euph_error {
public:
    using euph_error::euph_error;
};

/**
 * @brief State related errors
 *
 * Thrown when an object is used in a state that does not allow the
 * operation, such as pulling from a streaming decoder that already failed.
 */
class EUPH_EXPORT state_error : public euph_error {
public:
    using euph_error::euph_error;
};

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
