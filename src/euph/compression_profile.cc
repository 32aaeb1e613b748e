// This is copyrighted software. More information is at the end of this file.
#include <euph/compression_profile.hh>
#include <euph/error.hh>
#include <euph/format.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cmath>
#include <limits>

namespace euph {

namespace {

constexpr unsigned FULL_BITS = 16;

int32_t quantize(float sample, int32_t max_code) {
    if (!std::isfinite(sample)) {
        return 0;
    }
    const float clamped = std::clamp(sample, -1.0f, 1.0f);
    return static_cast<int32_t>(std::lround(clamped * static_cast<float>(max_code)));
}

} // namespace

unsigned compact_bits_for_level(unsigned level) {
    if (level > MAX_COMPRESSION_LEVEL) {
        level = MAX_COMPRESSION_LEVEL;
    }
    return FULL_BITS - (level * 8) / 9;
}

compression_profile::compression_profile(encoding_profile profile, unsigned level,
                                         std::shared_ptr<compression_backend> backend)
    : m_profile(profile),
      m_level(level),
      m_bits(FULL_BITS),
      m_backend(std::move(backend)) {
    if (level > MAX_COMPRESSION_LEVEL) {
        throw encoding_error("compression level out of range: " + std::to_string(level));
    }
    if (profile == encoding_profile::compact) {
        m_bits = compact_bits_for_level(level);
    }
}

bool compression_profile::uses_backend() const {
    switch (m_profile) {
        case encoding_profile::lossless:
            return m_level > 0;
        case encoding_profile::balanced:
            return true;
        case encoding_profile::compact:
            return false;
    }
    return false;
}

float compression_profile::max_error() const {
    const int32_t max_code = (1 << (m_bits - 1)) - 1;
    // half a quantization step
    return 0.5f / static_cast<float>(max_code);
}

uint64_t compression_profile::packed_size(uint64_t sample_count) const {
    return (sample_count * m_bits + 7) / 8;
}

std::vector<uint8_t> compression_profile::compress(const float* samples, size_t count) const {
    const int32_t max_code = (1 << (m_bits - 1)) - 1;
    const uint32_t mask = (1u << m_bits) - 1u;

    std::vector<uint8_t> packed;
    packed.reserve(static_cast<size_t>(packed_size(count)));

    uint64_t bit_buffer = 0;
    unsigned bit_count = 0;
    for (size_t i = 0; i < count; ++i) {
        const auto code = static_cast<uint32_t>(quantize(samples[i], max_code)) & mask;
        bit_buffer |= static_cast<uint64_t>(code) << bit_count;
        bit_count += m_bits;
        while (bit_count >= 8) {
            packed.push_back(static_cast<uint8_t>(bit_buffer & 0xFF));
            bit_buffer >>= 8;
            bit_count -= 8;
        }
    }
    if (bit_count > 0) {
        packed.push_back(static_cast<uint8_t>(bit_buffer & 0xFF));
    }

    if (!uses_backend()) {
        return packed;
    }
    if (!m_backend) {
        throw backend_error(std::string("profile ") + to_string(m_profile) + " needs a compression backend");
    }
    return m_backend->deflate(packed.data(), packed.size(), static_cast<int>(m_level));
}

std::vector<float> compression_profile::decompress(const uint8_t* data, size_t size,
                                                   uint64_t expected_samples) const {
    std::vector<float> out;
    out.reserve(static_cast<size_t>(expected_samples));
    sample_unpacker unpacker(*this, expected_samples);
    unpacker.feed(data, size, out);
    unpacker.finish();
    return out;
}

// ---------------------------------------------------------------------------

sample_unpacker::sample_unpacker(const compression_profile& profile, uint64_t expected_samples)
    : m_bits(profile.bits_per_sample()),
      m_scale(1.0f / static_cast<float>((1 << (profile.bits_per_sample() - 1)) - 1)),
      m_expected(expected_samples) {
    if (profile.uses_backend()) {
        if (!profile.backend()) {
            throw backend_error(std::string("profile ") + to_string(profile.profile()) +
                                " needs a compression backend");
        }
        m_inflate = profile.backend()->open_inflate();
    }
}

sample_unpacker::~sample_unpacker() = default;

void sample_unpacker::feed(const uint8_t* data, size_t size, std::vector<float>& out) {
    if (size == 0) {
        return;
    }
    if (!m_inflate) {
        unpack(data, size, out);
        return;
    }
    m_scratch.clear();
    m_inflate->feed(data, size, m_scratch, remaining_bytes());
    unpack(m_scratch.data(), m_scratch.size(), out);
}

size_t sample_unpacker::remaining_bytes() const {
    // bits still owed by the payload, less those already buffered
    const uint64_t owed = (m_expected - m_decoded) * m_bits;
    if (owed <= m_bit_count) {
        return 0;
    }
    const uint64_t bytes = (owed - m_bit_count + 7) / 8;
    return static_cast<size_t>(std::min<uint64_t>(bytes, std::numeric_limits<size_t>::max()));
}

void sample_unpacker::unpack(const uint8_t* data, size_t size, std::vector<float>& out) {
    const uint32_t mask = (1u << m_bits) - 1u;
    const uint32_t sign_bit = 1u << (m_bits - 1);

    for (size_t i = 0; i < size; ++i) {
        if (m_decoded == m_expected) {
            // only padding bits of the last byte may follow the final sample
            throw format_error("audio payload holds more samples than declared (" +
                               std::to_string(m_expected) + ")");
        }
        m_bit_buffer |= static_cast<uint64_t>(data[i]) << m_bit_count;
        m_bit_count += 8;
        while (m_bit_count >= m_bits && m_decoded < m_expected) {
            const auto code = static_cast<uint32_t>(m_bit_buffer & mask);
            m_bit_buffer >>= m_bits;
            m_bit_count -= m_bits;

            int32_t value = static_cast<int32_t>(code);
            if (code & sign_bit) {
                value -= static_cast<int32_t>(1u << m_bits);
            }
            out.push_back(std::max(-1.0f, static_cast<float>(value) * m_scale));
            ++m_decoded;
        }
    }
}

void sample_unpacker::finish() {
    if (m_inflate && !m_inflate->finished()) {
        throw format_error("corrupted audio payload");
    }
    if (m_decoded != m_expected) {
        LOG_DEBUG("sample_unpacker", "Expected", m_expected, "samples, decoded", m_decoded);
        throw format_error("audio length mismatch: expected " + std::to_string(m_expected) +
                           " samples, found " + std::to_string(m_decoded));
    }
}

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
