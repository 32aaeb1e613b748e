// This is copyrighted software. More information is at the end of this file.
#include <euph/container_decoder.hh>
#include <euph/chunk.hh>
#include <euph/compression_profile.hh>
#include <euph/error.hh>
#include <failsafe/failsafe.hh>
#include "integrity_check.hh"
#include "metadata_json.hh"
#include <algorithm>
#include <optional>

namespace euph {

namespace {

struct parsed_container {
    container_header preamble;
    std::vector<chunk_view> chunks;
};

parsed_container parse_container(const uint8_t* data, size_t size) {
    parsed_container parsed;
    parsed.preamble = read_container_header(data, size);

    size_t offset = CONTAINER_HEADER_SIZE;
    for (uint32_t i = 0; i < parsed.preamble.chunk_count; ++i) {
        chunk_view chunk = read_chunk(data, size, offset);
        if (!is_known_tag(chunk.type)) {
            LOG_DEBUG("container_decoder", "Skipping unknown chunk", tag_name(chunk.type),
                      "at offset", chunk.offset);
        }
        offset = chunk.next_offset;
        parsed.chunks.push_back(chunk);
    }
    if (offset < size) {
        LOG_DEBUG("container_decoder", "Ignoring", size - offset, "bytes after the last chunk");
    }
    return parsed;
}

const chunk_view* find_first(const std::vector<chunk_view>& chunks, const iff::fourcc& type) {
    auto it = std::find_if(chunks.begin(), chunks.end(),
                           [&type](const chunk_view& c) { return c.type == type; });
    return it == chunks.end() ? nullptr : &*it;
}

const chunk_view& require(const std::vector<chunk_view>& chunks, const iff::fourcc& type) {
    const chunk_view* chunk = find_first(chunks, type);
    if (!chunk) {
        LOG_DEBUG("container_decoder", "No", tag_name(type), "chunk in container");
        throw format_error("missing required chunk");
    }
    return *chunk;
}

// AUDI payloads in file order form one compressed stream. Samples decoded
// before a failure are left in @p samples.
void decode_audio(const header_info& head, const std::vector<chunk_view>& chunks,
                  const std::shared_ptr<compression_backend>& backend, std::vector<float>& samples) {
    const compression_profile codec(head.profile, head.compression_level, backend);
    if (!codec.uses_backend()) {
        uint64_t audio_bytes = 0;
        for (const auto& chunk : chunks) {
            if (chunk.type == AUDI_ID) {
                audio_bytes += chunk.size;
            }
        }
        // HEAD may overstate the length; never reserve more than the payload holds
        const uint64_t available = audio_bytes * 8 / codec.bits_per_sample();
        samples.reserve(static_cast<size_t>(std::min(available, head.total_samples())));
    }
    sample_unpacker unpacker(codec, head.total_samples());
    for (const auto& chunk : chunks) {
        if (chunk.type == AUDI_ID) {
            unpacker.feed(chunk.payload, chunk.size, samples);
        }
    }
    unpacker.finish();
}

} // namespace

container_decoder::container_decoder()
    : m_backend(select_default_backend()) {
}

container_decoder::container_decoder(std::shared_ptr<compression_backend> backend)
    : m_backend(std::move(backend)) {
    if (!m_backend) {
        throw backend_error("container_decoder needs a compression backend");
    }
}

decode_result container_decoder::decode(const uint8_t* data, size_t size,
                                        const decode_options& options) const {
    const parsed_container parsed = parse_container(data, size);
    const auto& chunks = parsed.chunks;

    decode_result result;
    result.version = parsed.preamble.version;
    if (result.version.major != FORMAT_VERSION_MAJOR || result.version.minor != FORMAT_VERSION_MINOR) {
        format_version supported;
        std::string note = "container version " + result.version.to_string() +
                           " differs from supported version " + supported.to_string();
        LOG_WARN("container_decoder", note);
        result.compatibility_notes.push_back(std::move(note));
    }

    const chunk_view& head_chunk = require(chunks, HEAD_ID);
    const chunk_view& meta_chunk = require(chunks, META_ID);
    require(chunks, AUDI_ID);

    // Integrity first, so damaged chunks can be told apart from a bad writer
    integrity_tracker tracker;
    for (const auto& chunk : chunks) {
        if (chunk.type != CHKS_ID) {
            tracker.add(chunk.type, chunk.payload, chunk.size);
        }
    }
    if (options.validate_integrity) {
        if (const chunk_view* chks = find_first(chunks, CHKS_ID)) {
            result.integrity = tracker.verify(chks->payload, chks->size);
            if (!result.integrity.intact()) {
                LOG_WARN("container_decoder", "Integrity check failed, stored crc",
                         result.integrity.stored_checksum, "computed", result.integrity.computed_checksum,
                         "corrupted chunks:", result.integrity.corrupted_chunks.size());
            }
        } else {
            LOG_DEBUG("container_decoder", "No CHKS chunk, integrity not verified");
            result.integrity.verified = false;
            result.integrity.checksum_match = false;
        }
    } else {
        result.integrity.verified = false;
        result.integrity.checksum_match = true;
    }
    result.integrity.computed_checksum = tracker.aggregate();

    // chunk list
    size_t tracked = 0;
    for (const auto& chunk : chunks) {
        chunk_info info;
        info.type = chunk.type;
        info.offset = chunk.offset;
        info.size = chunk.size;
        info.crc = chunk.type == CHKS_ID ? crc32(chunk.payload, chunk.size)
                                         : tracker.chunks()[tracked++].crc;
        result.chunks.push_back(info);
    }

    const auto& corrupted = result.integrity.corrupted_chunks;
    auto flagged = [&corrupted](const iff::fourcc& type) {
        return std::find(corrupted.begin(), corrupted.end(), tag_name(type)) != corrupted.end();
    };

    std::optional<header_info> head;
    try {
        head = parse_header(head_chunk.payload, head_chunk.size);
        apply_header(*head, result.metadata);
    } catch (const format_error& e) {
        if (!flagged(HEAD_ID)) {
            throw;
        }
        LOG_WARN("container_decoder", "HEAD chunk is damaged, audio not decoded:", e.what());
    }

    try {
        parse_metadata(meta_chunk.payload, meta_chunk.size, result.metadata);
    } catch (const format_error& e) {
        if (!flagged(META_ID)) {
            throw;
        }
        LOG_WARN("container_decoder", "META chunk is damaged, descriptive metadata dropped:", e.what());
    }

    if (head) {
        std::vector<float> samples;
        try {
            decode_audio(*head, chunks, m_backend, samples);
        } catch (const format_error& e) {
            if (!flagged(HEAD_ID) && !flagged(AUDI_ID)) {
                throw;
            }
            LOG_WARN("container_decoder", "Audio is damaged, keeping", samples.size() / head->channel_count,
                     "of", head->frame_count, "frames:", e.what());
            samples.resize(samples.size() - samples.size() % head->channel_count);
        }
        result.pcm = pcm_data::from_interleaved(samples.data(), samples.size(), head->channel_count);
    }

    if (options.load_ai_data) {
        if (const chunk_view* aide = find_first(chunks, AIDE_ID)) {
            result.ai_data.emplace(aide->payload, aide->payload + aide->size);
            if (!result.metadata.enhancement) {
                result.metadata.enhancement.emplace();
            }
            result.metadata.enhancement->spatial_data = result.ai_data;
        }
    }
    if (options.load_dsp_settings) {
        if (const chunk_view* dsps = find_first(chunks, DSPS_ID)) {
            result.dsp_settings.emplace(reinterpret_cast<const char*>(dsps->payload), dsps->size);
            if (!result.metadata.enhancement) {
                result.metadata.enhancement.emplace();
            }
            result.metadata.enhancement->dsp_settings = result.dsp_settings;
        }
    }

    LOG_DEBUG("container_decoder", "Decoded", chunks.size(), "chunks,", result.pcm.frame_count(), "frames x",
              result.pcm.channel_count(), "channels");
    return result;
}

decode_result container_decoder::decode(const std::vector<uint8_t>& bytes,
                                        const decode_options& options) const {
    return decode(bytes.data(), bytes.size(), options);
}

decode_result container_decoder::decode(io_stream* stream, const decode_options& options) const {
    const std::vector<uint8_t> bytes = read_all(stream);
    return decode(bytes.data(), bytes.size(), options);
}

bool container_decoder::probe(const uint8_t* data, size_t size) {
    return has_container_magic(data, size);
}

bool container_decoder::probe(const std::vector<uint8_t>& bytes) {
    return has_container_magic(bytes.data(), bytes.size());
}

container_info container_decoder::get_info(const uint8_t* data, size_t size) const {
    const parsed_container parsed = parse_container(data, size);

    container_info info;
    info.version = parsed.preamble.version;
    info.chunk_count = parsed.preamble.chunk_count;
    info.total_size = size;

    const chunk_view& head_chunk = require(parsed.chunks, HEAD_ID);
    const chunk_view& meta_chunk = require(parsed.chunks, META_ID);
    info.header = parse_header(head_chunk.payload, head_chunk.size);
    apply_header(info.header, info.metadata);
    parse_metadata(meta_chunk.payload, meta_chunk.size, info.metadata);
    return info;
}

container_info container_decoder::get_info(const std::vector<uint8_t>& bytes) const {
    return get_info(bytes.data(), bytes.size());
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
