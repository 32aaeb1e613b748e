// This is copyrighted software. More information is at the end of this file.
/**
 * @file compression_profile.hh
 * @brief Float PCM to/from compact byte payloads
 */

#pragma once

#include <euph/export_euph.h>
#include <euph/compression_backend.hh>
#include <euph/types.hh>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace euph {

/**
 * @brief Quantization width used by the compact profile
 *
 * 16 bits at level 0 down to 8 bits at level 9.
 */
EUPH_EXPORT unsigned compact_bits_for_level(unsigned level);

/**
 * @class compression_profile
 * @brief One (profile, level) pair and the transform it implies
 *
 * Samples are quantized to signed integers of bits_per_sample() bits and
 * packed LSB-first, which for 16 bits is plain little-endian int16. The
 * packed stream is then wrapped by the byte compressor when
 * uses_backend() is true:
 *
 * | profile  | bits                         | byte compressor  |
 * |----------|------------------------------|------------------|
 * | lossless | 16                           | when level > 0   |
 * | balanced | 16                           | always           |
 * | compact  | compact_bits_for_level(level)| never            |
 *
 * "lossless" is lossless with respect to the 16-bit quantized signal, not
 * to the float input.
 */
class EUPH_EXPORT compression_profile {
public:
    /**
     * @param backend Byte compressor, may be null when uses_backend() is false
     * @throws encoding_error if level is above 9
     */
    compression_profile(encoding_profile profile, unsigned level,
                        std::shared_ptr<compression_backend> backend);

    [[nodiscard]] encoding_profile profile() const { return m_profile; }
    [[nodiscard]] unsigned level() const { return m_level; }
    [[nodiscard]] unsigned bits_per_sample() const { return m_bits; }
    [[nodiscard]] bool uses_backend() const;

    /// Largest absolute difference a sample in [-1, 1] can pick up
    [[nodiscard]] float max_error() const;

    /// Size of the packed stream before the byte compressor
    [[nodiscard]] uint64_t packed_size(uint64_t sample_count) const;

    /**
     * @brief Quantize, pack and (if applicable) compress
     * @throws backend_error if the byte compressor fails or is missing
     */
    [[nodiscard]] std::vector<uint8_t> compress(const float* samples, size_t count) const;

    /**
     * @brief Exact inverse of compress()
     * @param expected_samples Number of samples the payload must hold
     * @throws format_error if the payload is corrupt or holds a different
     *         number of samples
     */
    [[nodiscard]] std::vector<float> decompress(const uint8_t* data, size_t size,
                                                uint64_t expected_samples) const;

    [[nodiscard]] const std::shared_ptr<compression_backend>& backend() const { return m_backend; }

private:
    encoding_profile m_profile;
    unsigned m_level;
    unsigned m_bits;
    std::shared_ptr<compression_backend> m_backend;
};

/**
 * @class sample_unpacker
 * @brief Incremental decompress for payloads split across AUDI chunks
 *
 * Bytes may arrive in pieces of any size; samples are emitted as soon as
 * all of their bits are available.
 *
 * @code
 * euph::sample_unpacker unpacker(profile, header.total_samples());
 * std::vector<float> samples;
 * for (const auto& piece : audio_chunks) {
 *     unpacker.feed(piece.data(), piece.size(), samples);
 * }
 * unpacker.finish();
 * @endcode
 */
class EUPH_EXPORT sample_unpacker {
public:
    sample_unpacker(const compression_profile& profile, uint64_t expected_samples);
    ~sample_unpacker();

    sample_unpacker(const sample_unpacker&) = delete;
    sample_unpacker& operator=(const sample_unpacker&) = delete;

    /**
     * @brief Feed payload bytes, appending completed samples to out
     * @throws format_error on corrupt data or more samples than expected
     */
    void feed(const uint8_t* data, size_t size, std::vector<float>& out);

    /**
     * @brief Check that the payload ended exactly where it should
     * @throws format_error if samples are missing or the compressed
     *         stream is incomplete
     */
    void finish();

    [[nodiscard]] uint64_t samples_decoded() const { return m_decoded; }
    [[nodiscard]] uint64_t expected_samples() const { return m_expected; }

private:
    // Packed bytes that may still arrive without overrunning expected_samples()
    [[nodiscard]] size_t remaining_bytes() const;
    void unpack(const uint8_t* data, size_t size, std::vector<float>& out);

    unsigned m_bits;
    float m_scale;
    uint64_t m_expected;
    uint64_t m_decoded = 0;
    uint64_t m_bit_buffer = 0;
    unsigned m_bit_count = 0;
    std::unique_ptr<inflate_stream> m_inflate;
    std::vector<uint8_t> m_scratch;
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
