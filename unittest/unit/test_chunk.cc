// This is copyrighted software. More information is at the end of this file.
#include <doctest/doctest.h>
#include <euph/chunk.hh>
#include <euph/error.hh>
#include <vector>

TEST_SUITE("Chunk") {
    TEST_CASE("write_chunk frames tag, size and payload") {
        const std::vector<uint8_t> payload = {1, 2, 3, 4, 5};
        auto bytes = euph::write_chunk(euph::META_ID, payload);

        REQUIRE(bytes.size() == euph::CHUNK_HEADER_SIZE + payload.size());
        CHECK(bytes[0] == 'M');
        CHECK(bytes[1] == 'E');
        CHECK(bytes[2] == 'T');
        CHECK(bytes[3] == 'A');
        CHECK(bytes[4] == 5);
        CHECK(bytes[5] == 0);
        CHECK(bytes[6] == 0);
        CHECK(bytes[7] == 0);
        CHECK(std::vector<uint8_t>(bytes.begin() + 8, bytes.end()) == payload);
    }

    TEST_CASE("empty payloads are allowed") {
        auto bytes = euph::write_chunk(euph::DSPS_ID, nullptr, 0);
        REQUIRE(bytes.size() == euph::CHUNK_HEADER_SIZE);

        auto view = euph::read_chunk(bytes.data(), bytes.size(), 0);
        CHECK(view.type == euph::DSPS_ID);
        CHECK(view.size == 0);
        CHECK(view.next_offset == euph::CHUNK_HEADER_SIZE);
    }

    TEST_CASE("read_chunk returns a view into the buffer") {
        std::vector<uint8_t> buffer = {0xAA, 0xBB};
        const std::vector<uint8_t> first = {9, 8, 7};
        const std::vector<uint8_t> second = {6};
        euph::append_chunk(buffer, euph::HEAD_ID, first.data(), first.size());
        euph::append_chunk(buffer, euph::AUDI_ID, second.data(), second.size());

        auto a = euph::read_chunk(buffer.data(), buffer.size(), 2);
        CHECK(a.type == euph::HEAD_ID);
        CHECK(a.size == 3);
        CHECK(a.payload == buffer.data() + 2 + euph::CHUNK_HEADER_SIZE);
        CHECK(a.payload[0] == 9);
        CHECK(a.offset == 2);
        CHECK(a.next_offset == 2 + euph::CHUNK_HEADER_SIZE + 3);

        auto b = euph::read_chunk(buffer.data(), buffer.size(), a.next_offset);
        CHECK(b.type == euph::AUDI_ID);
        CHECK(b.size == 1);
        CHECK(b.payload[0] == 6);
        CHECK(b.next_offset == buffer.size());
    }

    TEST_CASE("truncated chunks are rejected") {
        const std::vector<uint8_t> payload(16, 0x42);
        auto bytes = euph::write_chunk(euph::AUDI_ID, payload);

        SUBCASE("payload cut short") {
            bytes.resize(bytes.size() - 1);
            CHECK_THROWS_AS(euph::read_chunk(bytes.data(), bytes.size(), 0), euph::format_error);
        }

        SUBCASE("header cut short") {
            CHECK_THROWS_AS(euph::read_chunk(bytes.data(), 7, 0), euph::format_error);
        }

        SUBCASE("offset at end of buffer") {
            CHECK_THROWS_AS(euph::read_chunk(bytes.data(), bytes.size(), bytes.size()), euph::format_error);
        }

        SUBCASE("offset past end of buffer") {
            CHECK_THROWS_AS(euph::read_chunk(bytes.data(), bytes.size(), bytes.size() + 4), euph::format_error);
        }

        SUBCASE("size field near UINT32_MAX") {
            bytes[4] = 0xFF;
            bytes[5] = 0xFF;
            bytes[6] = 0xFF;
            bytes[7] = 0xFF;
            CHECK_THROWS_WITH_AS(euph::read_chunk(bytes.data(), bytes.size(), 0),
                                 "truncated chunk", euph::format_error);
        }
    }

    TEST_CASE("make_tag pads short names with NUL") {
        auto tag = euph::make_tag("AI");
        auto bytes = euph::write_chunk(tag, nullptr, 0);
        CHECK(bytes[0] == 'A');
        CHECK(bytes[1] == 'I');
        CHECK(bytes[2] == 0);
        CHECK(bytes[3] == 0);
        CHECK(euph::tag_name(tag) == "AI");

        auto view = euph::read_chunk(bytes.data(), bytes.size(), 0);
        CHECK(view.type == tag);
    }

    TEST_CASE("make_tag rejects long names") {
        CHECK_THROWS_AS(euph::make_tag("HEADER"), euph::encoding_error);
        CHECK(euph::make_tag("HEAD") == euph::HEAD_ID);
    }

    TEST_CASE("known tags") {
        CHECK(euph::is_known_tag(euph::HEAD_ID));
        CHECK(euph::is_known_tag(euph::CHKS_ID));
        CHECK(euph::is_known_tag(euph::make_tag("AIDE")));
        CHECK_FALSE(euph::is_known_tag(euph::make_tag("XTRA")));
        CHECK(euph::tag_name(euph::AUDI_ID) == "AUDI");
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
