// This is copyrighted software. More information is at the end of this file.
#include <euph/format.hh>
#include <euph/endian.hh>
#include <euph/error.hh>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace euph {

void write_container_header(uint8_t out[CONTAINER_HEADER_SIZE], const container_header& header) {
    std::memcpy(out, CONTAINER_MAGIC, 4);
    out[4] = header.version.major;
    out[5] = header.version.minor;
    store_u32le(out + 6, header.chunk_count);
}

bool has_container_magic(const uint8_t* data, size_t size) {
    return data != nullptr && size >= CONTAINER_HEADER_SIZE &&
           std::memcmp(data, CONTAINER_MAGIC, 4) == 0;
}

container_header read_container_header(const uint8_t* data, size_t size) {
    if (data == nullptr || size < 4 || std::memcmp(data, CONTAINER_MAGIC, 4) != 0) {
        if (size < 4) {
            throw format_error("truncated container header");
        }
        throw format_error("bad magic");
    }
    if (size < CONTAINER_HEADER_SIZE) {
        throw format_error("truncated container header");
    }

    container_header header;
    header.version.major = data[4];
    header.version.minor = data[5];
    // a newer major may change the layout, so nothing past the version may
    // be interpreted; older majors share it
    if (header.version.major > FORMAT_VERSION_MAJOR) {
        throw unsupported_version_error(header.version.major, header.version.minor);
    }
    header.chunk_count = load_u32le(data + 6);
    return header;
}

std::vector<uint8_t> serialize_header(const header_info& info) {
    std::vector<uint8_t> out(HEADER_PAYLOAD_SIZE, 0);
    uint8_t* p = out.data();
    store_u32le(p + 0, info.sample_rate);
    store_u16le(p + 4, info.channel_count);
    store_u16le(p + 6, info.bit_depth);
    store_u32le(p + 8, info.duration_ms);
    p[12] = static_cast<uint8_t>(info.profile);
    p[13] = info.compression_level;
    store_u16le(p + 14, info.flags);
    store_u32le(p + 16, info.frame_count);
    return out;
}

header_info parse_header(const uint8_t* payload, size_t size) {
    if (size < HEADER_PAYLOAD_MIN_SIZE) {
        throw format_error("HEAD chunk too small: " + std::to_string(size) + " bytes");
    }

    header_info info;
    info.sample_rate = load_u32le(payload + 0);
    info.channel_count = load_u16le(payload + 4);
    info.bit_depth = load_u16le(payload + 6);
    info.duration_ms = load_u32le(payload + 8);
    const uint8_t profile = payload[12];
    info.compression_level = payload[13];
    info.flags = load_u16le(payload + 14);
    info.frame_count = load_u32le(payload + 16);

    if (profile > static_cast<uint8_t>(encoding_profile::compact)) {
        throw format_error("unknown encoding profile: " + std::to_string(profile));
    }
    info.profile = static_cast<encoding_profile>(profile);

    if (info.compression_level > MAX_COMPRESSION_LEVEL) {
        throw format_error("compression level out of range: " + std::to_string(info.compression_level));
    }
    if (info.sample_rate == 0) {
        throw format_error("HEAD chunk declares a zero sample rate");
    }
    if (info.channel_count == 0) {
        throw format_error("HEAD chunk declares zero channels");
    }
    return info;
}

bool has_euph_extension(const std::string& path) {
    const std::string ext(FILE_EXTENSION);
    if (path.size() < ext.size()) {
        return false;
    }
    return std::equal(ext.begin(), ext.end(), path.end() - static_cast<std::ptrdiff_t>(ext.size()),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
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
