// This is copyrighted software. More information is at the end of this file.
#include <doctest/doctest.h>
#include <euph/container_decoder.hh>
#include <euph/container_encoder.hh>
#include <euph/error.hh>
#include <euph/streaming_decoder.hh>
#include "../test_helpers.hh"
#include <string>
#include <vector>

using namespace euph::test;

namespace {

struct collected {
    std::vector<euph::stream_event> events;
    std::vector<float> samples;
};

collected drain(euph::streaming_decoder& decoder) {
    collected out;
    while (auto event = decoder.next()) {
        out.samples.insert(out.samples.end(), event->samples.begin(), event->samples.end());
        out.events.push_back(std::move(*event));
    }
    return out;
}

std::vector<uint8_t> sample_container(euph::encoding_profile profile, unsigned level = 6,
                                      size_t chunk_size = 4096) {
    auto pcm = make_sine(2, 12000, 440.0, 48000);
    auto meta = make_metadata(pcm, 48000, profile);
    meta.album = "Streams";
    meta.enhancement = euph::enhancement_data{};
    meta.enhancement->genre_detection = "electronic";
    meta.enhancement->spatial_data = std::vector<uint8_t>(300, 0x5A);
    meta.enhancement->dsp_settings = R"({"limiter":true})";

    euph::encode_options opts;
    opts.compression_level = level;
    opts.chunk_size = chunk_size;
    return euph::container_encoder().encode(pcm, meta, opts);
}

} // namespace

TEST_SUITE("StreamingDecoder") {
    TEST_CASE("matches the whole-buffer decoder for any segment size") {
        for (auto profile : {euph::encoding_profile::lossless, euph::encoding_profile::balanced,
                             euph::encoding_profile::compact}) {
            const auto bytes = sample_container(profile, 4);
            const auto reference = euph::container_decoder().decode(bytes);
            const auto reference_samples = reference.pcm.interleave();

            for (size_t segment : {size_t(1), size_t(7), size_t(1000), size_t(1 << 20)}) {
                CAPTURE(euph::to_string(profile));
                CAPTURE(segment);
                trickle_stream source(bytes, segment);
                euph::streaming_decoder decoder(&source, segment);
                auto out = drain(decoder);

                CHECK(decoder.finished());
                CHECK(out.samples == reference_samples);

                bool saw_meta = false;
                for (const auto& event : out.events) {
                    if (event.kind == euph::stream_event_kind::metadata) {
                        REQUIRE(event.metadata.has_value());
                        CHECK(event.metadata->album == reference.metadata.album);
                        CHECK(event.metadata->sample_rate == reference.metadata.sample_rate);
                        CHECK(event.metadata->enhancement->genre_detection ==
                              reference.metadata.enhancement->genre_detection);
                        saw_meta = true;
                    }
                }
                CHECK(saw_meta);
            }
        }
    }

    TEST_CASE("events arrive in file order with typed payloads") {
        const auto bytes = sample_container(euph::encoding_profile::lossless, 0);
        auto source = euph::io_from_memory(bytes.data(), bytes.size());
        euph::streaming_decoder decoder(source.get(), 512);

        auto first = decoder.next();
        REQUIRE(first);
        CHECK(first->kind == euph::stream_event_kind::header);
        CHECK(euph::tag_name(first->chunk_type) == "HEAD");
        REQUIRE(first->header.has_value());
        CHECK(first->header->sample_rate == 48000);
        CHECK(first->header->frame_count == 12000);
        CHECK(first->progress == 0.0f);
        REQUIRE(decoder.version().has_value());
        CHECK(decoder.version()->major == 2);

        auto rest = drain(decoder);
        REQUIRE(rest.events.size() >= 5);
        CHECK(rest.events.front().kind == euph::stream_event_kind::metadata);

        const auto& checksum = rest.events.back();
        CHECK(checksum.kind == euph::stream_event_kind::checksum);
        REQUIRE(checksum.integrity.has_value());
        CHECK(checksum.integrity->intact());

        const auto& dsp = rest.events[rest.events.size() - 2];
        CHECK(dsp.kind == euph::stream_event_kind::dsp_settings);
        CHECK(dsp.text == R"({"limiter":true})");

        const auto& ai = rest.events[rest.events.size() - 3];
        CHECK(ai.kind == euph::stream_event_kind::ai_data);
        CHECK(ai.data == std::vector<uint8_t>(300, 0x5A));

        CHECK(rest.samples.size() == 24000);
        CHECK_FALSE(decoder.next().has_value());
        CHECK(std::string(euph::to_string(euph::stream_event_kind::audio)) == "audio");
    }

    TEST_CASE("progress is monotonic and ends at 100") {
        const auto bytes = sample_container(euph::encoding_profile::balanced, 6, 1024);
        trickle_stream source(bytes, 333);
        euph::streaming_decoder decoder(&source, 333);

        CHECK(decoder.progress() == 0.0f);
        float last = 0.0f;
        size_t audio_events = 0;
        while (auto event = decoder.next()) {
            CHECK(event->progress >= last);
            last = event->progress;
            if (event->kind == euph::stream_event_kind::audio) {
                ++audio_events;
            }
        }
        CHECK(audio_events > 1);
        CHECK(last == doctest::Approx(100.0f));
        CHECK(decoder.progress() == doctest::Approx(100.0f));
    }

    TEST_CASE("source is read only as far as needed") {
        const auto bytes = sample_container(euph::encoding_profile::lossless, 0);
        trickle_stream source(bytes, 64);
        euph::streaming_decoder decoder(&source, 64);

        CHECK(source.reads() == 0);
        auto head = decoder.next();
        REQUIRE(head);
        // preamble + HEAD chunk, rounded up to whole segments
        CHECK(source.position() <= 128);
        CHECK(source.position() < bytes.size());
    }

    TEST_CASE("unknown chunks are passed through") {
        auto bytes = sample_container(euph::encoding_profile::balanced);
        insert_chunk(bytes, find_chunk(bytes, "AUDI"), "XTRA", {0xCA, 0xFE});

        trickle_stream source(bytes, 100);
        euph::streaming_decoder decoder(&source, 100);
        auto out = drain(decoder);

        bool saw_extra = false;
        for (const auto& event : out.events) {
            if (euph::tag_name(event.chunk_type) == "XTRA") {
                CHECK(event.kind == euph::stream_event_kind::unknown);
                CHECK(event.data == std::vector<uint8_t>{0xCA, 0xFE});
                saw_extra = true;
            }
        }
        CHECK(saw_extra);
        CHECK(out.samples.size() == 24000);
        CHECK_FALSE(out.events.back().integrity->checksum_match);
    }

    TEST_CASE("corruption shows up in the checksum event") {
        auto bytes = sample_container(euph::encoding_profile::balanced);
        flip_payload_byte(bytes, find_chunk(bytes, "DSPS"), 2);

        trickle_stream source(bytes, 4096);
        euph::streaming_decoder decoder(&source);
        auto out = drain(decoder);
        REQUIRE(out.events.back().integrity.has_value());
        CHECK(out.events.back().integrity->corrupted_chunks == std::vector<std::string>{"DSPS"});
    }

    TEST_CASE("unreadable META does not stop the audio") {
        auto bytes = sample_container(euph::encoding_profile::balanced);
        flip_payload_byte(bytes, find_chunk(bytes, "META"), 0);
        const auto reference = euph::container_decoder().decode(bytes);

        trickle_stream source(bytes, 512);
        euph::streaming_decoder decoder(&source, 512);
        auto out = drain(decoder);
        CHECK(decoder.finished());

        const euph::stream_event* meta = nullptr;
        for (const auto& event : out.events) {
            if (event.kind == euph::stream_event_kind::metadata) {
                meta = &event;
            }
        }
        REQUIRE(meta != nullptr);
        REQUIRE(meta->metadata.has_value());
        CHECK(meta->metadata->sample_rate == 48000);
        CHECK(meta->metadata->channel_count == 2);
        CHECK_FALSE(meta->metadata->album.has_value());

        CHECK(out.samples == reference.pcm.interleave());
        REQUIRE(out.events.back().integrity.has_value());
        CHECK(out.events.back().integrity->corrupted_chunks == std::vector<std::string>{"META"});
    }

    TEST_CASE("unreadable META without a checksum fails at the end") {
        auto pcm = make_sine(2, 12000, 440.0, 48000);
        euph::encode_options opts;
        opts.profile = euph::encoding_profile::lossless;
        opts.compression_level = 0;
        opts.enable_integrity_check = false;
        opts.chunk_size = 4096;
        auto bytes = euph::container_encoder().encode(pcm, make_metadata(pcm, 48000), opts);
        flip_payload_byte(bytes, find_chunk(bytes, "META"), 0);

        trickle_stream source(bytes, 512);
        euph::streaming_decoder decoder(&source, 512);
        size_t audio_events = 0;
        bool failed = false;
        try {
            while (auto event = decoder.next()) {
                if (event->kind == euph::stream_event_kind::audio) {
                    ++audio_events;
                }
            }
        } catch (const euph::format_error&) {
            failed = true;
        }
        CHECK(failed);
        CHECK(audio_events > 0);
        CHECK_FALSE(decoder.finished());
    }

    TEST_CASE("duplicate HEAD and META keep their kind") {
        auto bytes = sample_container(euph::encoding_profile::balanced);
        auto payload_of = [&bytes](const std::string& tag) {
            const size_t offset = find_chunk(bytes, tag);
            const auto first = bytes.begin() + static_cast<std::ptrdiff_t>(offset + euph::CHUNK_HEADER_SIZE);
            return std::vector<uint8_t>(first, first + chunk_payload_size(bytes, offset));
        };
        const auto head = payload_of("HEAD");
        const auto meta = payload_of("META");
        insert_chunk(bytes, find_chunk(bytes, "AUDI"), "HEAD", head);
        insert_chunk(bytes, find_chunk(bytes, "AUDI"), "META", meta);

        trickle_stream source(bytes, 300);
        euph::streaming_decoder decoder(&source, 300);
        auto out = drain(decoder);

        size_t headers = 0;
        size_t metas = 0;
        for (const auto& event : out.events) {
            if (event.kind == euph::stream_event_kind::header) {
                if (++headers == 2) {
                    CHECK_FALSE(event.header.has_value());
                    CHECK(event.data == head);
                }
            } else if (event.kind == euph::stream_event_kind::metadata) {
                if (++metas == 2) {
                    CHECK_FALSE(event.metadata.has_value());
                    CHECK(event.data == meta);
                }
            }
        }
        CHECK(headers == 2);
        CHECK(metas == 2);
        CHECK(out.samples.size() == 24000);
    }

    TEST_CASE("truncated source") {
        const auto bytes = sample_container(euph::encoding_profile::balanced);

        for (size_t cut : {size_t(3), size_t(10), size_t(30), bytes.size() / 2, bytes.size() - 1}) {
            CAPTURE(cut);
            std::vector<uint8_t> partial(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(cut));
            trickle_stream source(partial, 256);
            euph::streaming_decoder decoder(&source, 256);
            CHECK_THROWS_AS(drain(decoder), euph::format_error);
            CHECK_THROWS_AS((void)decoder.next(), euph::state_error);
        }

        std::vector<uint8_t> partial(bytes.begin(), bytes.end() - 1);
        trickle_stream source(partial, 256);
        euph::streaming_decoder decoder(&source, 256);
        CHECK_THROWS_WITH_AS(drain(decoder), "truncated chunk", euph::format_error);
    }

    TEST_CASE("audio before HEAD") {
        auto bytes = sample_container(euph::encoding_profile::lossless, 0);
        // move HEAD behind the first AUDI chunk
        const size_t head = find_chunk(bytes, "HEAD");
        const size_t head_size = euph::CHUNK_HEADER_SIZE + chunk_payload_size(bytes, head);
        std::vector<uint8_t> head_chunk(bytes.begin() + static_cast<std::ptrdiff_t>(head),
                                        bytes.begin() + static_cast<std::ptrdiff_t>(head + head_size));
        bytes.erase(bytes.begin() + static_cast<std::ptrdiff_t>(head),
                    bytes.begin() + static_cast<std::ptrdiff_t>(head + head_size));
        const size_t second_audio = find_chunk(bytes, "AUDI", 1);
        bytes.insert(bytes.begin() + static_cast<std::ptrdiff_t>(second_audio),
                     head_chunk.begin(), head_chunk.end());

        trickle_stream source(bytes, 1024);
        euph::streaming_decoder decoder(&source, 1024);
        auto meta = decoder.next();
        REQUIRE(meta);
        CHECK(meta->kind == euph::stream_event_kind::metadata);
        CHECK(meta->progress == 0.0f);
        CHECK_THROWS_AS((void)decoder.next(), euph::format_error);
    }

    TEST_CASE("header errors") {
        auto bytes = sample_container(euph::encoding_profile::balanced);

        SUBCASE("bad magic") {
            bytes[0] = 'X';
            trickle_stream source(bytes, 2);
            euph::streaming_decoder decoder(&source, 2);
            CHECK_THROWS_WITH_AS((void)decoder.next(), "bad magic", euph::format_error);
        }

        SUBCASE("newer major version") {
            bytes[4] = 9;
            trickle_stream source(bytes, 64);
            euph::streaming_decoder decoder(&source, 64);
            CHECK_THROWS_AS((void)decoder.next(), euph::unsupported_version_error);
        }

        SUBCASE("older major version streams") {
            bytes[4] = 1;
            trickle_stream source(bytes, 64);
            euph::streaming_decoder decoder(&source, 64);
            size_t events = 0;
            while (decoder.next()) {
                ++events;
            }
            CHECK(decoder.finished());
            CHECK(events > 0);
            REQUIRE(decoder.version().has_value());
            CHECK(decoder.version()->major == 1);
        }

        SUBCASE("missing audio") {
            size_t offset;
            while ((offset = find_chunk(bytes, "AUDI")) != std::string::npos) {
                remove_chunk(bytes, offset);
            }
            trickle_stream source(bytes, 64);
            euph::streaming_decoder decoder(&source, 64);
            CHECK_THROWS_WITH_AS(drain(decoder), "missing required chunk", euph::format_error);
        }

        SUBCASE("null source") {
            CHECK_THROWS_AS(euph::streaming_decoder(nullptr), euph::io_error);
        }
    }
}


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
