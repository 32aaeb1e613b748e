// This is copyrighted software. More information is at the end of this file.
#include <euph/container_encoder.hh>
#include <euph/chunk.hh>
#include <euph/compression_profile.hh>
#include <euph/error.hh>
#include <euph/format.hh>
#include <failsafe/failsafe.hh>
#include "integrity_check.hh"
#include "metadata_json.hh"
#include <algorithm>
#include <cmath>
#include <limits>

namespace euph {

namespace {

// Overall percentage reached at the end of each stage
float stage_percent(encode_stage stage) {
    switch (stage) {
        case encode_stage::header: return 5.0f;
        case encode_stage::metadata: return 10.0f;
        case encode_stage::audio_compress: return 75.0f;
        case encode_stage::ai_data: return 82.0f;
        case encode_stage::dsp_data: return 88.0f;
        case encode_stage::checksum: return 95.0f;
        case encode_stage::finalize: return 100.0f;
    }
    return 0.0f;
}

void validate(const pcm_data& pcm, const track_metadata& metadata, const encode_options& options) {
    if (pcm.channels.size() > std::numeric_limits<channels_t>::max()) {
        throw encoding_error("too many channels: " + std::to_string(pcm.channels.size()));
    }
    if (pcm.channels.empty() || pcm.frame_count() == 0) {
        throw encoding_error("no audio to encode");
    }
    if (!pcm.is_rectangular()) {
        throw encoding_error("channels have different lengths");
    }
    if (metadata.channel_count != pcm.channel_count()) {
        throw encoding_error("metadata declares " + std::to_string(metadata.channel_count) +
                             " channels but the audio has " + std::to_string(pcm.channel_count()));
    }
    if (!std::isfinite(metadata.duration) || metadata.duration < 0.0) {
        throw encoding_error("duration must be a finite, non-negative number of seconds");
    }
    if (metadata.duration * 1000.0 > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        throw encoding_error("duration too large");
    }
    if (metadata.sample_rate == 0) {
        throw encoding_error("sample rate must not be zero");
    }
    if (options.compression_level > MAX_COMPRESSION_LEVEL) {
        throw encoding_error("compression level out of range: " + std::to_string(options.compression_level));
    }
    if (options.chunk_size == 0) {
        throw encoding_error("chunk size must not be zero");
    }
    if (pcm.frame_count() > std::numeric_limits<uint32_t>::max()) {
        throw encoding_error("audio too large: " + std::to_string(pcm.frame_count()) + " frames");
    }
}

} // namespace

const char* to_string(encode_stage stage) {
    switch (stage) {
        case encode_stage::header: return "header";
        case encode_stage::metadata: return "metadata";
        case encode_stage::audio_compress: return "audio-compress";
        case encode_stage::ai_data: return "ai-data";
        case encode_stage::dsp_data: return "dsp-data";
        case encode_stage::checksum: return "checksum";
        case encode_stage::finalize: return "finalize";
    }
    return "unknown";
}

container_encoder::container_encoder()
    : m_backend(select_default_backend()) {
}

container_encoder::container_encoder(std::shared_ptr<compression_backend> backend)
    : m_backend(std::move(backend)) {
    if (!m_backend) {
        throw backend_error("container_encoder needs a compression backend");
    }
}

std::vector<uint8_t> container_encoder::encode(const pcm_data& pcm,
                                               const track_metadata& metadata,
                                               const encode_options& options,
                                               const progress_callback& on_progress) const {
    validate(pcm, metadata, options);

    auto report = [&on_progress](encode_stage stage) {
        if (on_progress) {
            on_progress(stage, stage_percent(stage));
        }
    };

    const encoding_profile profile = options.profile.value_or(metadata.profile);
    const compression_profile codec(profile, options.compression_level, m_backend);

    std::vector<uint8_t> out(CONTAINER_HEADER_SIZE, 0);
    integrity_tracker integrity;
    uint32_t chunk_count = 0;

    auto emit = [&](const iff::fourcc& type, const uint8_t* payload, size_t size) {
        append_chunk(out, type, payload, size);
        if (type != CHKS_ID) {
            integrity.add(type, payload, size);
        }
        ++chunk_count;
    };

    // HEAD
    header_info head;
    head.sample_rate = metadata.sample_rate;
    head.channel_count = pcm.channel_count();
    head.bit_depth = metadata.bit_depth;
    head.duration_ms = static_cast<uint32_t>(std::llround(metadata.duration * 1000.0));
    head.profile = profile;
    head.compression_level = static_cast<uint8_t>(options.compression_level);
    head.frame_count = static_cast<uint32_t>(pcm.frame_count());
    const auto head_payload = serialize_header(head);
    emit(HEAD_ID, head_payload.data(), head_payload.size());
    report(encode_stage::header);

    // META
    const std::string meta = serialize_metadata(metadata);
    emit(META_ID, reinterpret_cast<const uint8_t*>(meta.data()), meta.size());
    report(encode_stage::metadata);

    // AUDI
    const std::vector<float> interleaved = pcm.interleave();
    const std::vector<uint8_t> audio = codec.compress(interleaved.data(), interleaved.size());
    const size_t piece = std::min<size_t>(options.chunk_size, std::numeric_limits<uint32_t>::max());
    for (size_t offset = 0; offset < audio.size(); offset += piece) {
        emit(AUDI_ID, audio.data() + offset, std::min(piece, audio.size() - offset));
    }
    report(encode_stage::audio_compress);

    // AIDE / DSPS
    if (metadata.enhancement) {
        const auto& enhancement = *metadata.enhancement;
        if (options.include_ai_data && enhancement.spatial_data) {
            const auto& blob = *enhancement.spatial_data;
            emit(AIDE_ID, blob.data(), blob.size());
            report(encode_stage::ai_data);
        }
        if (options.include_dsp_settings && enhancement.dsp_settings) {
            const auto& text = *enhancement.dsp_settings;
            emit(DSPS_ID, reinterpret_cast<const uint8_t*>(text.data()), text.size());
            report(encode_stage::dsp_data);
        }
    }

    // CHKS
    if (options.enable_integrity_check) {
        const auto checksum = integrity.build_payload();
        emit(CHKS_ID, checksum.data(), checksum.size());
        report(encode_stage::checksum);
    }

    container_header preamble;
    preamble.chunk_count = chunk_count;
    write_container_header(out.data(), preamble);

    LOG_DEBUG("container_encoder", "Encoded", interleaved.size(), "samples as", to_string(profile),
              "level", options.compression_level, "into", chunk_count, "chunks,", out.size(), "bytes");
    report(encode_stage::finalize);
    return out;
}

void container_encoder::encode_to(io_stream* stream,
                                  const pcm_data& pcm,
                                  const track_metadata& metadata,
                                  const encode_options& options,
                                  const progress_callback& on_progress) const {
    if (!stream) {
        throw io_error("encode_to: null stream");
    }
    const auto bytes = encode(pcm, metadata, options, on_progress);
    write_all(stream, bytes.data(), bytes.size());
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
