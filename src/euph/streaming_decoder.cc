// This is copyrighted software. More information is at the end of this file.
#include <euph/streaming_decoder.hh>
#include <euph/chunk.hh>
#include <euph/compression_profile.hh>
#include <euph/endian.hh>
#include <euph/error.hh>
#include <failsafe/failsafe.hh>
#include "integrity_check.hh"
#include "metadata_json.hh"
#include <algorithm>
#include <cstring>

namespace euph {

const char* to_string(stream_event_kind kind) {
    switch (kind) {
        case stream_event_kind::header: return "header";
        case stream_event_kind::metadata: return "metadata";
        case stream_event_kind::audio: return "audio";
        case stream_event_kind::ai_data: return "ai-data";
        case stream_event_kind::dsp_settings: return "dsp-settings";
        case stream_event_kind::checksum: return "checksum";
        case stream_event_kind::unknown: return "unknown";
    }
    return "unknown";
}

struct streaming_decoder::impl {
    io_stream* source;
    size_t segment_size;
    std::shared_ptr<compression_backend> backend;

    // carry-over buffer, bytes before consumed are already processed
    std::vector<uint8_t> buffer;
    size_t consumed = 0;
    bool eof = false;

    std::optional<container_header> preamble;
    uint32_t chunks_returned = 0;
    bool done = false;
    bool failed = false;

    std::optional<header_info> head;
    bool seen_meta = false;
    std::optional<std::string> meta_error;
    bool meta_flagged = false;
    bool seen_audio = false;
    std::unique_ptr<compression_profile> codec;
    std::unique_ptr<sample_unpacker> unpacker;
    integrity_tracker integrity;

    impl(io_stream* src, size_t segment, std::shared_ptr<compression_backend> be)
        : source(src),
          segment_size(segment),
          backend(std::move(be)) {
    }

    [[nodiscard]] size_t available() const {
        return buffer.size() - consumed;
    }

    // Read until n unprocessed bytes are buffered; false on end of data
    bool fill(size_t n) {
        while (available() < n) {
            if (eof) {
                return false;
            }
            if (consumed > 0) {
                buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
                consumed = 0;
            }
            const size_t old_size = buffer.size();
            buffer.resize(old_size + segment_size);
            const size_t got = source->read(buffer.data() + old_size, segment_size);
            buffer.resize(old_size + got);
            if (got == 0) {
                eof = true;
            }
        }
        return true;
    }

    [[nodiscard]] float progress() const {
        if (!head || !unpacker || unpacker->expected_samples() == 0) {
            return 0.0f;
        }
        return static_cast<float>(static_cast<double>(unpacker->samples_decoded()) /
                                  static_cast<double>(unpacker->expected_samples()) * 100.0);
    }

    void read_preamble() {
        if (!fill(CONTAINER_HEADER_SIZE)) {
            // a wrong magic is reported before the truncation
            read_container_header(buffer.data() + consumed, available());
            throw format_error("truncated container header");
        }
        preamble = read_container_header(buffer.data() + consumed, available());
        consumed += CONTAINER_HEADER_SIZE;
        if (preamble->version.major != FORMAT_VERSION_MAJOR ||
            preamble->version.minor != FORMAT_VERSION_MINOR) {
            LOG_WARN("streaming_decoder", "Container version", preamble->version.to_string(),
                     "differs from supported version", format_version{}.to_string());
        }
    }

    void handle(const iff::fourcc& type, const uint8_t* payload, uint32_t size, stream_event& event) {
        if (type != CHKS_ID) {
            integrity.add(type, payload, size);
        }

        if ((type == HEAD_ID && head) || (type == META_ID && seen_meta)) {
            LOG_WARN("streaming_decoder", "Ignoring duplicate", tag_name(type), "chunk");
            event.kind = type == HEAD_ID ? stream_event_kind::header : stream_event_kind::metadata;
            event.data.assign(payload, payload + size);
            return;
        }

        if (type == HEAD_ID) {
            head = parse_header(payload, size);
            codec = std::make_unique<compression_profile>(head->profile, head->compression_level, backend);
            unpacker = std::make_unique<sample_unpacker>(*codec, head->total_samples());
            event.kind = stream_event_kind::header;
            event.header = head;
        } else if (type == META_ID) {
            track_metadata metadata;
            if (head) {
                apply_header(*head, metadata);
            }
            try {
                parse_metadata(payload, size, metadata);
            } catch (const format_error& e) {
                // settled by CHKS, or at the end of the stream
                LOG_WARN("streaming_decoder", "META chunk is unreadable:", e.what());
                meta_error = e.what();
                metadata = track_metadata{};
                if (head) {
                    apply_header(*head, metadata);
                }
            }
            seen_meta = true;
            event.kind = stream_event_kind::metadata;
            event.metadata = std::move(metadata);
        } else if (type == AUDI_ID) {
            if (!unpacker) {
                throw format_error("AUDI chunk before HEAD");
            }
            unpacker->feed(payload, size, event.samples);
            seen_audio = true;
            event.kind = stream_event_kind::audio;
        } else if (type == AIDE_ID) {
            event.kind = stream_event_kind::ai_data;
            event.data.assign(payload, payload + size);
        } else if (type == DSPS_ID) {
            event.kind = stream_event_kind::dsp_settings;
            event.text.assign(reinterpret_cast<const char*>(payload), size);
        } else if (type == CHKS_ID) {
            event.kind = stream_event_kind::checksum;
            event.integrity = integrity.verify(payload, size);
            const auto& corrupted = event.integrity->corrupted_chunks;
            if (std::find(corrupted.begin(), corrupted.end(), tag_name(META_ID)) != corrupted.end()) {
                meta_flagged = true;
            }
            if (!event.integrity->intact()) {
                LOG_WARN("streaming_decoder", "Integrity check failed, corrupted chunks:",
                         event.integrity->corrupted_chunks.size());
            }
        } else {
            if (!is_known_tag(type)) {
                LOG_DEBUG("streaming_decoder", "Passing through unknown chunk", tag_name(type));
            }
            event.kind = stream_event_kind::unknown;
            event.data.assign(payload, payload + size);
        }
    }

    void finish() {
        if (!head || !seen_meta || !seen_audio) {
            throw format_error("missing required chunk");
        }
        if (meta_error && !meta_flagged) {
            throw format_error(*meta_error);
        }
        unpacker->finish();
        done = true;
    }

    std::optional<stream_event> step() {
        if (done) {
            return std::nullopt;
        }
        if (!preamble) {
            read_preamble();
        }
        if (chunks_returned == preamble->chunk_count) {
            finish();
            return std::nullopt;
        }

        if (!fill(CHUNK_HEADER_SIZE)) {
            throw format_error("truncated chunk");
        }
        const uint8_t* p = buffer.data() + consumed;
        char id[4];
        std::memcpy(id, p, 4);
        const iff::fourcc type = iff::fourcc::from_bytes(id);
        const uint32_t size = load_u32le(p + 4);
        if (!fill(CHUNK_HEADER_SIZE + static_cast<size_t>(size))) {
            throw format_error("truncated chunk");
        }

        stream_event event;
        event.chunk_type = type;
        handle(type, buffer.data() + consumed + CHUNK_HEADER_SIZE, size, event);
        consumed += CHUNK_HEADER_SIZE + size;
        ++chunks_returned;

        if (chunks_returned == preamble->chunk_count) {
            finish();
        }
        event.progress = progress();
        return event;
    }
};

streaming_decoder::streaming_decoder(io_stream* source, size_t segment_size,
                                     std::shared_ptr<compression_backend> backend) {
    if (!source) {
        throw io_error("streaming_decoder: null source");
    }
    if (segment_size == 0) {
        segment_size = DEFAULT_SEGMENT_SIZE;
    }
    if (!backend) {
        backend = select_default_backend();
    }
    m_pimpl = std::make_unique<impl>(source, segment_size, std::move(backend));
}

streaming_decoder::~streaming_decoder() = default;

std::optional<stream_event> streaming_decoder::next() {
    if (m_pimpl->failed) {
        throw state_error("streaming decoder used after a failure");
    }
    try {
        return m_pimpl->step();
    } catch (const std::exception&) {
        m_pimpl->failed = true;
        throw;
    }
}

bool streaming_decoder::finished() const {
    return m_pimpl->done;
}

float streaming_decoder::progress() const {
    return m_pimpl->progress();
}

std::optional<format_version> streaming_decoder::version() const {
    if (!m_pimpl->preamble) {
        return std::nullopt;
    }
    return m_pimpl->preamble->version;
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
