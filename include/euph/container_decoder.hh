// This is copyrighted software. More information is at the end of this file.
/**
 * @file container_decoder.hh
 * @brief Parse a complete EUPH container
 */

#pragma once

#include <euph/export_euph.h>
#include <euph/compression_backend.hh>
#include <euph/format.hh>
#include <euph/integrity.hh>
#include <euph/io_stream.hh>
#include <euph/types.hh>
#include <iff/fourcc.hh>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace euph {

/**
 * @struct decode_options
 * @brief Per-call decoder settings
 */
struct decode_options {
    /// Check payloads against the CHKS chunk
    bool validate_integrity = true;
    /// Load the AIDE chunk into ai_data
    bool load_ai_data = true;
    /// Load the DSPS chunk into dsp_settings
    bool load_dsp_settings = true;
};

/**
 * @struct chunk_info
 * @brief Location of one chunk inside the container
 */
struct chunk_info {
    iff::fourcc type;
    size_t offset = 0;   ///< Offset of the chunk header
    uint32_t size = 0;   ///< Payload size
    uint32_t crc = 0;    ///< CRC32 of the payload
};

/**
 * @struct decode_result
 * @brief Everything recovered from a container
 */
struct decode_result {
    track_metadata metadata;
    pcm_data pcm;

    /// AIDE payload, also copied to metadata.enhancement->spatial_data
    std::optional<std::vector<uint8_t>> ai_data;

    /// DSPS payload, also copied to metadata.enhancement->dsp_settings
    std::optional<std::string> dsp_settings;

    integrity_report integrity;
    format_version version;

    /// Non-fatal differences, e.g. a newer minor version
    std::vector<std::string> compatibility_notes;

    /// Every chunk in file order, unknown tags included
    std::vector<chunk_info> chunks;
};

/**
 * @struct container_info
 * @brief Header-level summary, produced without decompressing audio
 */
struct container_info {
    format_version version;
    uint32_t chunk_count = 0;
    size_t total_size = 0;
    header_info header;
    track_metadata metadata;
};

/**
 * @class container_decoder
 * @brief Validates and parses EUPH containers held in memory
 *
 * Structural problems (bad magic, truncation, missing chunks, undecodable
 * audio) throw format_error. Checksum mismatches only show up in
 * decode_result::integrity, so a damaged side-channel chunk never blocks
 * the audio.
 *
 * @code
 * euph::container_decoder decoder;
 * auto result = decoder.decode(bytes);
 * if (!result.integrity.intact()) {
 *     for (const auto& tag : result.integrity.corrupted_chunks) {
 *         std::cerr << "damaged: " << tag << "\n";
 *     }
 * }
 * play(result.pcm);
 * @endcode
 */
class EUPH_EXPORT container_decoder {
public:
    /// Uses the highest-priority backend of default_backend_registry()
    container_decoder();

    /**
     * @param backend Byte compressor to use
     * @throws backend_error if backend is null
     */
    explicit container_decoder(std::shared_ptr<compression_backend> backend);

    /**
     * @brief Decode a complete container
     * @throws format_error for structurally malformed input
     * @throws unsupported_version_error for an unreadable major version
     */
    [[nodiscard]] decode_result decode(const uint8_t* data, size_t size,
                                       const decode_options& options = {}) const;

    [[nodiscard]] decode_result decode(const std::vector<uint8_t>& bytes,
                                       const decode_options& options = {}) const;

    /**
     * @brief Read a stream to its end and decode it
     * @throws io_error if the stream is null or closed
     */
    [[nodiscard]] decode_result decode(io_stream* stream,
                                       const decode_options& options = {}) const;

    /// True if the buffer starts with the magic and a full preamble
    [[nodiscard]] static bool probe(const uint8_t* data, size_t size);

    [[nodiscard]] static bool probe(const std::vector<uint8_t>& bytes);

    /**
     * @brief Read HEAD and META only
     * @throws format_error if HEAD or META is missing or malformed
     */
    [[nodiscard]] container_info get_info(const uint8_t* data, size_t size) const;

    [[nodiscard]] container_info get_info(const std::vector<uint8_t>& bytes) const;

    [[nodiscard]] const std::shared_ptr<compression_backend>& backend() const { return m_backend; }

private:
    std::shared_ptr<compression_backend> m_backend;
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
