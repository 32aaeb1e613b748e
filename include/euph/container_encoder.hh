// This is copyrighted software. More information is at the end of this file.
/**
 * @file container_encoder.hh
 * @brief Assemble PCM and metadata into an EUPH container
 */

#pragma once

#include <euph/export_euph.h>
#include <euph/compression_backend.hh>
#include <euph/io_stream.hh>
#include <euph/types.hh>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace euph {

/**
 * @struct encode_options
 * @brief Per-call encoder settings
 */
struct encode_options {
    /// Defaults to track_metadata::profile when empty
    std::optional<encoding_profile> profile;

    /// 0 (fastest/largest) to 9
    unsigned compression_level = 6;

    /// Write enhancement.spatial_data as an AIDE chunk
    bool include_ai_data = true;

    /// Write enhancement.dsp_settings as a DSPS chunk
    bool include_dsp_settings = true;

    /// Maximum AUDI payload size in bytes
    size_t chunk_size = 64 * 1024;

    /// Append a CHKS chunk
    bool enable_integrity_check = true;
};

/**
 * @enum encode_stage
 * @brief Encoder stages in the order they run
 */
enum class encode_stage {
    header,
    metadata,
    audio_compress,
    ai_data,
    dsp_data,
    checksum,
    finalize
};

EUPH_EXPORT const char* to_string(encode_stage stage);

/**
 * @typedef progress_callback
 * @brief Receives the stage and an overall percentage (0-100)
 *
 * Percentages never decrease and the last call reports 100.
 */
using progress_callback = std::function<void(encode_stage stage, float percent)>;

/**
 * @class container_encoder
 * @brief Builds EUPH containers
 *
 * The encoder holds only its compression backend; encode() is const and
 * may be called from several threads at once.
 *
 * @code
 * euph::container_encoder encoder;
 * euph::track_metadata meta;
 * meta.title = "Intro";
 * meta.sample_rate = 48000;
 * meta.channel_count = 2;
 * meta.duration = 0.5;
 *
 * euph::encode_options opts;
 * opts.profile = euph::encoding_profile::balanced;
 * auto bytes = encoder.encode(pcm, meta, opts);
 * @endcode
 */
class EUPH_EXPORT container_encoder {
public:
    /// Uses the highest-priority backend of default_backend_registry()
    container_encoder();

    /**
     * @param backend Byte compressor to use
     * @throws backend_error if backend is null
     */
    explicit container_encoder(std::shared_ptr<compression_backend> backend);

    /**
     * @brief Encode a track
     *
     * Chunk order: HEAD, META, AUDI (one or more), AIDE, DSPS, CHKS.
     *
     * @throws encoding_error if the input is invalid
     * @throws backend_error if the byte compressor fails
     */
    [[nodiscard]] std::vector<uint8_t> encode(const pcm_data& pcm,
                                              const track_metadata& metadata,
                                              const encode_options& options = {},
                                              const progress_callback& on_progress = {}) const;

    /**
     * @brief Encode a track into a stream
     * @throws io_error if the stream rejects part of the container
     */
    void encode_to(io_stream* stream,
                   const pcm_data& pcm,
                   const track_metadata& metadata,
                   const encode_options& options = {},
                   const progress_callback& on_progress = {}) const;

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
