// This is copyrighted software. More information is at the end of this file.
/**
 * @file streaming_decoder.hh
 * @brief Incremental chunk-by-chunk container decoding
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
 * @enum stream_event_kind
 * @brief Which payload field of a stream_event is filled in
 */
enum class stream_event_kind {
    header,     ///< header, or data for a duplicate HEAD
    metadata,   ///< metadata, or data for a duplicate META
    audio,      ///< samples
    ai_data,    ///< data
    dsp_settings, ///< text
    checksum,   ///< integrity
    unknown     ///< data
};

EUPH_EXPORT const char* to_string(stream_event_kind kind);

/**
 * @struct stream_event
 * @brief One fully received chunk
 */
struct stream_event {
    iff::fourcc chunk_type;
    stream_event_kind kind = stream_event_kind::unknown;

    std::optional<header_info> header;
    std::optional<track_metadata> metadata;

    /// Interleaved samples completed by this AUDI chunk
    std::vector<float> samples;

    /// Raw bytes of AIDE, unknown and duplicate chunks
    std::vector<uint8_t> data;

    /// DSPS JSON text
    std::string text;

    /// Integrity of the chunks received before CHKS
    std::optional<integrity_report> integrity;

    /// Percentage of the declared audio decoded so far
    float progress = 0.0f;
};

/**
 * @class streaming_decoder
 * @brief Pull-based decoder over an io_stream
 *
 * Reads the source in segments, only inside next(), and only as far as
 * needed to complete the next chunk. The whole file is never held in
 * memory: at most one chunk plus one segment is buffered.
 *
 * @code
 * auto in = euph::io_from_file("track.euph", "rb");
 * euph::streaming_decoder dec(in.get());
 * while (auto event = dec.next()) {
 *     if (event->kind == euph::stream_event_kind::audio) {
 *         sink.write(event->samples);
 *     }
 *     show_progress(event->progress);
 * }
 * @endcode
 *
 * @note One consumer only; the decoder cannot be restarted or copied.
 *       After next() throws, further calls throw state_error.
 */
class EUPH_EXPORT streaming_decoder {
public:
    static constexpr size_t DEFAULT_SEGMENT_SIZE = 16 * 1024;

    /**
     * @param source Container bytes, must outlive the decoder
     * @param segment_size Bytes requested per read
     * @param backend Byte compressor, the default registry's choice when null
     */
    explicit streaming_decoder(io_stream* source,
                               size_t segment_size = DEFAULT_SEGMENT_SIZE,
                               std::shared_ptr<compression_backend> backend = nullptr);
    ~streaming_decoder();

    streaming_decoder(const streaming_decoder&) = delete;
    streaming_decoder& operator=(const streaming_decoder&) = delete;

    /**
     * @brief Decode the next chunk
     * @return The chunk's event, or an empty optional after the last chunk
     * @throws format_error for malformed or truncated input. An unreadable
     *         META is reported at the end of the stream, and only when no
     *         CHKS chunk marked it as corrupted.
     * @throws unsupported_version_error for an unreadable major version
     * @throws state_error if an earlier call failed
     */
    [[nodiscard]] std::optional<stream_event> next();

    /// True once every declared chunk has been returned
    [[nodiscard]] bool finished() const;

    /// Percentage of the declared audio decoded so far, 0 before HEAD
    [[nodiscard]] float progress() const;

    /// Container version, available after the first next()
    [[nodiscard]] std::optional<format_version> version() const;

private:
    struct impl;
    std::unique_ptr<impl> m_pimpl;
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
