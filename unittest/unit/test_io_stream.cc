// This is copyrighted software. More information is at the end of this file.
#include <doctest/doctest.h>
#include <euph/error.hh>
#include <euph/io_stream.hh>
#include "../test_helpers.hh"
#include <cstdio>
#include <filesystem>
#include <vector>

TEST_SUITE("IOStream") {
    TEST_CASE("memory stream reads and seeks") {
        const uint8_t data[] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
        auto stream = euph::io_from_memory(data, sizeof(data));
        REQUIRE(stream);
        CHECK(stream->get_size() == 7);

        uint8_t buf[4] = {};
        CHECK(stream->read(buf, 1) == 1);
        CHECK(buf[0] == 0x01);
        CHECK(stream->read(buf, 4) == 4);
        CHECK(buf[3] == 0x05);
        CHECK(stream->tell() == 5);
        CHECK(stream->read(buf, 4) == 2);
        CHECK(stream->read(buf, 4) == 0);

        CHECK(stream->seek(-2, euph::seek_origin::end) == 5);
        CHECK(stream->tell() == 5);
        CHECK(stream->seek(100, euph::seek_origin::set) == -1);

        CHECK(stream->write(data, 1) == 0);
    }

    TEST_CASE("vector stream grows on write") {
        std::vector<uint8_t> storage;
        auto stream = euph::io_from_vector(storage);
        const uint8_t a[] = {1, 2, 3};
        euph::write_all(stream.get(), a, sizeof(a));
        CHECK(storage.size() == 3);

        CHECK(stream->seek(1, euph::seek_origin::set) == 1);
        const uint8_t b[] = {9, 9, 9, 9};
        euph::write_all(stream.get(), b, sizeof(b));
        CHECK(storage == std::vector<uint8_t>{1, 9, 9, 9, 9});

        stream->seek(0, euph::seek_origin::set);
        CHECK(euph::read_all(stream.get()) == storage);
    }

    TEST_CASE("read_all drains a stream that hands out small pieces") {
        std::vector<uint8_t> data(100000);
        for (size_t i = 0; i < data.size(); ++i) {
            data[i] = static_cast<uint8_t>(i * 31);
        }
        euph::test::trickle_stream stream(data, 1000);
        CHECK(euph::read_all(&stream) == data);
    }

    TEST_CASE("stream errors") {
        SUBCASE("null stream") {
            CHECK_THROWS_AS(euph::read_all(nullptr), euph::io_error);
        }

        SUBCASE("closed stream") {
            std::vector<uint8_t> storage;
            auto stream = euph::io_from_vector(storage);
            stream->close();
            CHECK_FALSE(stream->is_open());
            CHECK_THROWS_AS(euph::read_all(stream.get()), euph::io_error);
        }

        SUBCASE("short write") {
            euph::test::limited_sink sink(4);
            const uint8_t data[8] = {};
            CHECK_THROWS_AS(euph::write_all(&sink, data, sizeof(data)), euph::io_error);
        }

        SUBCASE("missing file") {
            CHECK(euph::io_from_file("/nonexistent/dir/track.euph", "rb") == nullptr);
        }
    }

    TEST_CASE("file stream round trip") {
        const auto path = std::filesystem::temp_directory_path() / "euph_io_stream_test.bin";
        const std::vector<uint8_t> data = {'E', 'U', 'P', 'H', 0, 1, 2, 3};

        {
            auto out = euph::io_from_file(path.string().c_str(), "wb");
            REQUIRE(out);
            euph::write_all(out.get(), data.data(), data.size());
            out->close();
        }
        {
            auto in = euph::io_from_file(path.string().c_str(), "rb");
            REQUIRE(in);
            CHECK(in->get_size() == static_cast<int64_t>(data.size()));
            CHECK(euph::read_all(in.get()) == data);
        }
        std::filesystem::remove(path);
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
