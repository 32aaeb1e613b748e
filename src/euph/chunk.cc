// This is copyrighted software. More information is at the end of this file.
#include <euph/chunk.hh>
#include <euph/endian.hh>
#include <euph/error.hh>
#include <cstring>
#include <limits>

namespace euph {

const iff::fourcc HEAD_ID("HEAD");
const iff::fourcc META_ID("META");
const iff::fourcc AUDI_ID("AUDI");
const iff::fourcc AIDE_ID("AIDE");
const iff::fourcc DSPS_ID("DSPS");
const iff::fourcc CHKS_ID("CHKS");

namespace {

// Tag bytes exactly as they go on disk
void tag_bytes(const iff::fourcc& tag, uint8_t out[4]) {
    std::string name = tag.to_string();
    name.resize(4, '\0');
    std::memcpy(out, name.data(), 4);
}

} // namespace

iff::fourcc make_tag(const std::string& name) {
    if (name.size() > 4) {
        throw encoding_error("chunk tag longer than 4 characters: '" + name + "'");
    }
    char bytes[4] = {0, 0, 0, 0};
    std::memcpy(bytes, name.data(), name.size());
    return iff::fourcc::from_bytes(bytes);
}

std::string tag_name(const iff::fourcc& tag) {
    std::string name = tag.to_string();
    while (!name.empty() && name.back() == '\0') {
        name.pop_back();
    }
    return name;
}

bool is_known_tag(const iff::fourcc& tag) {
    return tag == HEAD_ID || tag == META_ID || tag == AUDI_ID ||
           tag == AIDE_ID || tag == DSPS_ID || tag == CHKS_ID;
}

void append_chunk(std::vector<uint8_t>& out, const iff::fourcc& type,
                  const uint8_t* payload, size_t size) {
    if (size > std::numeric_limits<uint32_t>::max()) {
        throw encoding_error("chunk '" + tag_name(type) + "' payload too large: " +
                             std::to_string(size) + " bytes");
    }

    const size_t start = out.size();
    out.resize(start + CHUNK_HEADER_SIZE + size);
    uint8_t* p = out.data() + start;
    tag_bytes(type, p);
    store_u32le(p + 4, static_cast<uint32_t>(size));
    if (size > 0) {
        std::memcpy(p + CHUNK_HEADER_SIZE, payload, size);
    }
}

std::vector<uint8_t> write_chunk(const iff::fourcc& type, const uint8_t* payload, size_t size) {
    std::vector<uint8_t> out;
    out.reserve(CHUNK_HEADER_SIZE + size);
    append_chunk(out, type, payload, size);
    return out;
}

std::vector<uint8_t> write_chunk(const iff::fourcc& type, const std::vector<uint8_t>& payload) {
    return write_chunk(type, payload.data(), payload.size());
}

chunk_view read_chunk(const uint8_t* buffer, size_t buffer_size, size_t offset) {
    if (offset > buffer_size || buffer_size - offset < CHUNK_HEADER_SIZE) {
        throw format_error("truncated chunk");
    }

    const uint8_t* p = buffer + offset;
    const uint32_t size = load_u32le(p + 4);
    // compare against the remainder to stay clear of size_t overflow
    if (size > buffer_size - offset - CHUNK_HEADER_SIZE) {
        throw format_error("truncated chunk");
    }

    chunk_view view;
    char id[4];
    std::memcpy(id, p, 4);
    view.type = iff::fourcc::from_bytes(id);
    view.size = size;
    view.payload = p + CHUNK_HEADER_SIZE;
    view.offset = offset;
    view.next_offset = offset + CHUNK_HEADER_SIZE + size;
    return view;
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
