// This is copyrighted software. More information is at the end of this file.
/**
 * @file types.hh
 * @brief Value types exchanged with the codec
 */

#ifndef EUPH_TYPES_HH
#define EUPH_TYPES_HH

#include <euph/export_euph.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace euph {

/**
 * @typedef sample_rate_t
 * @brief Samples per second (Hz)
 */
using sample_rate_t = uint32_t;

/**
 * @typedef channels_t
 * @brief Number of audio channels, stored as uint16 in the HEAD chunk
 */
using channels_t = uint16_t;

/**
 * @enum encoding_profile
 * @brief Named quantization/compression strategy
 *
 * The numeric values are the on-disk encoding in the HEAD chunk.
 */
enum class encoding_profile : uint8_t {
    lossless = 0, ///< 16-bit quantization, byte compressor when level > 0
    balanced = 1, ///< 16-bit quantization, always byte-compressed
    compact = 2   ///< Reduced bit depth driven by the compression level
};

EUPH_EXPORT const char* to_string(encoding_profile profile);

/**
 * @brief Parse a profile name ("lossless", "balanced", "compact")
 * @return The profile, or an empty optional for unknown names
 */
EUPH_EXPORT std::optional<encoding_profile> profile_from_string(const std::string& name);

/**
 * @struct enhancement_data
 * @brief Side-channel data produced by AI/DSP tooling
 *
 * The codec never looks inside spatial_data or dsp_settings. The flag and
 * the genre label travel in the META chunk; spatial_data is stored in the
 * AIDE chunk and dsp_settings in the DSPS chunk, both byte for byte.
 */
struct enhancement_data {
    bool ai_processed = false;
    std::optional<std::string> genre_detection;
    std::optional<std::vector<uint8_t>> spatial_data;
    std::optional<std::string> dsp_settings; ///< Serialized JSON text
};

/**
 * @struct track_metadata
 * @brief Descriptive and technical description of one track
 *
 * The descriptive fields (title to track_number) are optional and stored
 * as JSON in the META chunk. The technical fields are stored in HEAD.
 */
struct track_metadata {
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<std::string> genre;
    std::optional<int32_t> year;
    std::optional<uint32_t> track_number;

    double duration = 0.0; ///< Seconds
    sample_rate_t sample_rate = 0;
    channels_t channel_count = 0;
    uint16_t bit_depth = 16;
    encoding_profile profile = encoding_profile::balanced;

    std::optional<enhancement_data> enhancement;
};

/**
 * @struct pcm_data
 * @brief Planar float PCM, one array per channel
 *
 * Samples are expected in [-1, 1]; values outside are clamped when
 * quantized.
 */
struct EUPH_EXPORT pcm_data {
    std::vector<std::vector<float>> channels;

    [[nodiscard]] channels_t channel_count() const {
        return static_cast<channels_t>(channels.size());
    }

    /// Frames of the first channel, 0 when there are no channels
    [[nodiscard]] size_t frame_count() const;

    /// True when there are no channels or no frames
    [[nodiscard]] bool empty() const;

    /// True when every channel holds the same number of frames
    [[nodiscard]] bool is_rectangular() const;

    /// Interleave into L, R, L, R, ... order
    [[nodiscard]] std::vector<float> interleave() const;

    /**
     * @brief Split interleaved samples into per-channel arrays
     * @param samples Interleaved samples
     * @param sample_count Number of samples (all channels)
     * @param channels Channel count, must divide sample_count
     * @throws std::invalid_argument if channels is 0 or does not divide sample_count
     */
    static pcm_data from_interleaved(const float* samples, size_t sample_count, channels_t channels);
};

} // namespace euph

#endif // EUPH_TYPES_HH


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
