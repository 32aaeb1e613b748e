// This is copyrighted software. More information is at the end of this file.
#include <doctest/doctest.h>
#include <euph/compression_profile.hh>
#include <euph/error.hh>
#include <cmath>
#include <limits>
#include <vector>

namespace {

std::vector<float> ramp(size_t count) {
    std::vector<float> samples(count);
    for (size_t i = 0; i < count; ++i) {
        samples[i] = -1.0f + 2.0f * static_cast<float>(i) / static_cast<float>(count - 1);
    }
    return samples;
}

float max_abs_error(const std::vector<float>& a, const std::vector<float>& b) {
    float worst = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        worst = std::max(worst, std::fabs(a[i] - b[i]));
    }
    return worst;
}

} // namespace

TEST_SUITE("CompressionProfile") {
    TEST_CASE("compact bit depth per level") {
        CHECK(euph::compact_bits_for_level(0) == 16);
        CHECK(euph::compact_bits_for_level(1) == 16);
        CHECK(euph::compact_bits_for_level(2) == 15);
        CHECK(euph::compact_bits_for_level(3) == 14);
        CHECK(euph::compact_bits_for_level(5) == 12);
        CHECK(euph::compact_bits_for_level(9) == 8);
    }

    TEST_CASE("backend use per profile") {
        auto backend = euph::make_zlib_backend();
        CHECK_FALSE(euph::compression_profile(euph::encoding_profile::lossless, 0, backend).uses_backend());
        CHECK(euph::compression_profile(euph::encoding_profile::lossless, 1, backend).uses_backend());
        CHECK(euph::compression_profile(euph::encoding_profile::balanced, 0, backend).uses_backend());
        CHECK_FALSE(euph::compression_profile(euph::encoding_profile::compact, 9, backend).uses_backend());
    }

    TEST_CASE("level above 9 is rejected") {
        CHECK_THROWS_AS(euph::compression_profile(euph::encoding_profile::balanced, 10, euph::make_zlib_backend()),
                        euph::encoding_error);
    }

    TEST_CASE("lossless level 0 stores little-endian int16") {
        euph::compression_profile profile(euph::encoding_profile::lossless, 0, nullptr);
        const std::vector<float> samples = {0.0f, 0.5f, -1.0f, 1.0f};
        auto bytes = profile.compress(samples.data(), samples.size());

        REQUIRE(bytes.size() == 8);
        CHECK(bytes[0] == 0x00);
        CHECK(bytes[1] == 0x00);
        CHECK(bytes[2] == 0x00); // 16384
        CHECK(bytes[3] == 0x40);
        CHECK(bytes[4] == 0x01); // -32767
        CHECK(bytes[5] == 0x80);
        CHECK(bytes[6] == 0xFF); // 32767
        CHECK(bytes[7] == 0x7F);
    }

    TEST_CASE("out of range and non-finite samples") {
        euph::compression_profile profile(euph::encoding_profile::lossless, 0, nullptr);
        const std::vector<float> samples = {
            2.5f, -7.0f,
            std::numeric_limits<float>::quiet_NaN(),
            std::numeric_limits<float>::infinity()
        };
        auto bytes = profile.compress(samples.data(), samples.size());
        auto decoded = profile.decompress(bytes.data(), bytes.size(), samples.size());

        REQUIRE(decoded.size() == 4);
        CHECK(decoded[0] == 1.0f);
        CHECK(decoded[1] == -1.0f);
        CHECK(decoded[2] == 0.0f);
        CHECK(decoded[3] == 0.0f);
    }

    TEST_CASE("balanced output is a gzip member") {
        euph::compression_profile profile(euph::encoding_profile::balanced, 6, euph::make_zlib_backend());
        auto samples = ramp(1000);
        auto bytes = profile.compress(samples.data(), samples.size());
        REQUIRE(bytes.size() > 2);
        CHECK(bytes[0] == 0x1F);
        CHECK(bytes[1] == 0x8B);
    }

    TEST_CASE("compact packs samples without padding between them") {
        euph::compression_profile eight(euph::encoding_profile::compact, 9, nullptr);
        euph::compression_profile fifteen(euph::encoding_profile::compact, 2, nullptr);
        const std::vector<float> samples = {0.25f, -0.25f, 0.75f};

        CHECK(eight.compress(samples.data(), samples.size()).size() == 3);
        CHECK(fifteen.compress(samples.data(), samples.size()).size() == 6);
        CHECK(fifteen.packed_size(3) == 6);
        CHECK(eight.packed_size(3) == 3);
    }

    TEST_CASE("round trip stays within the quantization step") {
        auto samples = ramp(4097);
        auto backend = euph::make_zlib_backend();

        for (unsigned level = 0; level <= 9; ++level) {
            CAPTURE(level);
            for (auto p : {euph::encoding_profile::lossless, euph::encoding_profile::balanced,
                           euph::encoding_profile::compact}) {
                CAPTURE(euph::to_string(p));
                euph::compression_profile profile(p, level, backend);
                auto bytes = profile.compress(samples.data(), samples.size());
                auto decoded = profile.decompress(bytes.data(), bytes.size(), samples.size());
                REQUIRE(decoded.size() == samples.size());

                const float step = 1.0f / static_cast<float>((1 << (profile.bits_per_sample() - 1)) - 1);
                CHECK(max_abs_error(samples, decoded) <= step);
                CHECK(max_abs_error(samples, decoded) <= profile.max_error() * 1.01f);
            }
        }
    }

    TEST_CASE("decompress rejects a wrong sample count") {
        auto samples = ramp(100);
        auto backend = euph::make_zlib_backend();

        SUBCASE("raw payload too long") {
            euph::compression_profile profile(euph::encoding_profile::lossless, 0, backend);
            auto bytes = profile.compress(samples.data(), samples.size());
            CHECK_THROWS_AS(profile.decompress(bytes.data(), bytes.size(), 99), euph::format_error);
        }

        SUBCASE("raw payload too short") {
            euph::compression_profile profile(euph::encoding_profile::compact, 5, backend);
            auto bytes = profile.compress(samples.data(), samples.size());
            CHECK_THROWS_AS(profile.decompress(bytes.data(), bytes.size(), 101), euph::format_error);
        }

        SUBCASE("compressed payload") {
            euph::compression_profile profile(euph::encoding_profile::balanced, 3, backend);
            auto bytes = profile.compress(samples.data(), samples.size());
            CHECK_THROWS_AS(profile.decompress(bytes.data(), bytes.size(), 50), euph::format_error);
            CHECK_THROWS_AS(profile.decompress(bytes.data(), bytes.size(), 150), euph::format_error);
        }
    }

    TEST_CASE("corrupted compressed payload") {
        auto samples = ramp(2000);
        euph::compression_profile profile(euph::encoding_profile::balanced, 6, euph::make_zlib_backend());
        auto bytes = profile.compress(samples.data(), samples.size());

        SUBCASE("garbage header") {
            bytes[0] = 0x00;
            CHECK_THROWS_WITH_AS(profile.decompress(bytes.data(), bytes.size(), samples.size()),
                                 "corrupted audio payload", euph::format_error);
        }

        SUBCASE("cut short") {
            bytes.resize(bytes.size() / 2);
            CHECK_THROWS_AS(profile.decompress(bytes.data(), bytes.size(), samples.size()),
                            euph::format_error);
        }
    }

    TEST_CASE("sample_unpacker accepts arbitrary pieces") {
        auto samples = ramp(777);
        auto backend = euph::make_zlib_backend();

        for (auto p : {euph::encoding_profile::lossless, euph::encoding_profile::balanced,
                       euph::encoding_profile::compact}) {
            CAPTURE(euph::to_string(p));
            euph::compression_profile profile(p, 7, backend);
            auto bytes = profile.compress(samples.data(), samples.size());
            auto whole = profile.decompress(bytes.data(), bytes.size(), samples.size());

            for (size_t piece : {size_t(1), size_t(3), size_t(64)}) {
                CAPTURE(piece);
                euph::sample_unpacker unpacker(profile, samples.size());
                std::vector<float> out;
                for (size_t offset = 0; offset < bytes.size(); offset += piece) {
                    unpacker.feed(bytes.data() + offset, std::min(piece, bytes.size() - offset), out);
                    CHECK(unpacker.samples_decoded() == out.size());
                }
                unpacker.finish();
                CHECK(out == whole);
            }
        }
    }

    TEST_CASE("sample_unpacker reports missing samples on finish") {
        euph::compression_profile profile(euph::encoding_profile::lossless, 0, nullptr);
        auto samples = ramp(10);
        auto bytes = profile.compress(samples.data(), samples.size());

        euph::sample_unpacker unpacker(profile, 10);
        std::vector<float> out;
        unpacker.feed(bytes.data(), bytes.size() - 2, out);
        CHECK(out.size() == 9);
        CHECK_THROWS_AS(unpacker.finish(), euph::format_error);
    }

    TEST_CASE("sample_unpacker stops inflating past the declared length") {
        auto backend = euph::make_zlib_backend();
        euph::compression_profile profile(euph::encoding_profile::balanced, 9, backend);

        // 8 MiB of zeros deflates to a few KiB
        const std::vector<uint8_t> zeros(8 * 1024 * 1024, 0);
        auto bomb = backend->deflate(zeros.data(), zeros.size(), 9);
        REQUIRE(bomb.size() < 64 * 1024);

        euph::sample_unpacker unpacker(profile, 16);
        std::vector<float> out;
        CHECK_THROWS_AS(unpacker.feed(bomb.data(), bomb.size(), out), euph::format_error);
        CHECK(out.size() <= 16);
    }

    TEST_CASE("sample_unpacker takes a member that ends exactly on the last sample") {
        auto backend = euph::make_zlib_backend();
        euph::compression_profile profile(euph::encoding_profile::balanced, 5, backend);
        auto samples = ramp(40000);
        auto bytes = profile.compress(samples.data(), samples.size());

        euph::sample_unpacker unpacker(profile, samples.size());
        std::vector<float> out;
        unpacker.feed(bytes.data(), bytes.size(), out);
        unpacker.finish();
        CHECK(out.size() == samples.size());
    }

    TEST_CASE("profiles that need a backend refuse to run without one") {
        euph::compression_profile profile(euph::encoding_profile::balanced, 4, nullptr);
        const std::vector<float> samples = {0.1f, 0.2f};
        CHECK_THROWS_AS((void)profile.compress(samples.data(), samples.size()), euph::backend_error);
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
