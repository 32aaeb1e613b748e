// This is copyrighted software. More information is at the end of this file.
#include "integrity_check.hh"
#include <euph/chunk.hh>
#include <euph/endian.hh>
#include <failsafe/failsafe.hh>
#include <zlib.h>
#include <algorithm>
#include <climits>
#include <cstring>
#include <map>

namespace euph {

uint32_t crc32(const uint8_t* data, size_t size, uint32_t seed) {
    uLong crc = seed;
    // zlib takes uInt lengths
    while (size > 0) {
        const uInt block = size > UINT_MAX ? UINT_MAX : static_cast<uInt>(size);
        crc = ::crc32(crc, data, block);
        data += block;
        size -= block;
    }
    return static_cast<uint32_t>(crc);
}

void integrity_tracker::add(const iff::fourcc& type, const uint8_t* payload, size_t size) {
    m_aggregate = crc32(payload, size, m_aggregate);
    m_chunks.push_back({type, crc32(payload, size)});
}

std::vector<uint8_t> integrity_tracker::build_payload() const {
    std::vector<uint8_t> out(LEGACY_CHECKSUM_SIZE + m_chunks.size() * CHECKSUM_ENTRY_SIZE + 4);
    uint8_t* p = out.data();
    store_u32le(p, m_aggregate);
    store_u32le(p + 4, static_cast<uint32_t>(m_chunks.size()));
    p += LEGACY_CHECKSUM_SIZE;
    for (const auto& entry : m_chunks) {
        std::string name = entry.type.to_string();
        name.resize(4, '\0');
        std::memcpy(p, name.data(), 4);
        store_u32le(p + 4, entry.crc);
        p += CHECKSUM_ENTRY_SIZE;
    }
    store_u32le(p, crc32(out.data(), out.size() - 4));
    return out;
}

integrity_report integrity_tracker::verify(const uint8_t* payload, size_t size) const {
    integrity_report report;
    report.verified = true;
    report.computed_checksum = m_aggregate;

    const std::string chks_name = tag_name(CHKS_ID);
    if (size < LEGACY_CHECKSUM_SIZE) {
        LOG_WARN("integrity", "CHKS chunk too small:", size, "bytes");
        report.checksum_match = false;
        report.corrupted_chunks.push_back(chks_name);
        return report;
    }

    report.stored_checksum = load_u32le(payload);
    report.checksum_match = report.stored_checksum == m_aggregate;
    if (size == LEGACY_CHECKSUM_SIZE) {
        return report;
    }

    const uint64_t count = load_u32le(payload + 4);
    const uint64_t expected = LEGACY_CHECKSUM_SIZE + count * CHECKSUM_ENTRY_SIZE + 4;
    if (expected != size) {
        LOG_WARN("integrity", "CHKS layout does not match its entry count", count);
        report.corrupted_chunks.push_back(chks_name);
        return report;
    }
    if (load_u32le(payload + size - 4) != crc32(payload, size - 4)) {
        // entries cannot be trusted
        report.corrupted_chunks.push_back(chks_name);
        return report;
    }

    // the n-th entry of a tag belongs to the n-th chunk of that tag
    std::map<uint32_t, std::vector<size_t>> positions;
    for (size_t k = 0; k < m_chunks.size(); ++k) {
        positions[m_chunks[k].type.to_uint32()].push_back(k);
    }
    std::map<uint32_t, size_t> seen;

    std::vector<bool> mismatch(m_chunks.size(), false);
    std::vector<std::string> missing;
    for (uint64_t i = 0; i < count; ++i) {
        const uint8_t* entry = payload + LEGACY_CHECKSUM_SIZE + i * CHECKSUM_ENTRY_SIZE;
        char id[4];
        std::memcpy(id, entry, 4);
        const iff::fourcc type = iff::fourcc::from_bytes(id);
        const uint32_t crc = load_u32le(entry + 4);

        const size_t occurrence = seen[type.to_uint32()]++;
        auto it = positions.find(type.to_uint32());
        if (it == positions.end() || occurrence >= it->second.size()) {
            missing.push_back(tag_name(type));
            continue;
        }
        const size_t k = it->second[occurrence];
        if (m_chunks[k].crc != crc) {
            mismatch[k] = true;
        }
    }

    auto add_once = [&report](const std::string& name) {
        if (std::find(report.corrupted_chunks.begin(), report.corrupted_chunks.end(), name) ==
            report.corrupted_chunks.end()) {
            report.corrupted_chunks.push_back(name);
        }
    };
    for (size_t k = 0; k < m_chunks.size(); ++k) {
        if (mismatch[k]) {
            add_once(tag_name(m_chunks[k].type));
        }
    }
    for (const auto& name : missing) {
        add_once(name);
    }
    return report;
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
