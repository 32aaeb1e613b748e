// This is copyrighted software. More information is at the end of this file.
#ifndef EUPH_SRC_INTEGRITY_CHECK_HH
#define EUPH_SRC_INTEGRITY_CHECK_HH

#include <euph/integrity.hh>
#include <iff/fourcc.hh>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace euph {

struct chunk_checksum {
    iff::fourcc type;
    uint32_t crc = 0;
};

/**
 * Running CRC bookkeeping over non-CHKS chunk payloads in file order.
 *
 * CHKS payload layout:
 * @code
 * +0        aggregate crc32 over all covered payloads
 * +4        covered count N
 * +8        N x (tag[4], crc32)
 * +8+8N     crc32 of bytes [0, 8+8N)
 * @endcode
 * An 8-byte payload (aggregate and count only) is the legacy form.
 */
class integrity_tracker {
public:
    void add(const iff::fourcc& type, const uint8_t* payload, size_t size);

    [[nodiscard]] uint32_t aggregate() const { return m_aggregate; }
    [[nodiscard]] const std::vector<chunk_checksum>& chunks() const { return m_chunks; }

    /// Serialize a CHKS payload covering everything added so far
    [[nodiscard]] std::vector<uint8_t> build_payload() const;

    /// Compare everything added so far against a CHKS payload
    [[nodiscard]] integrity_report verify(const uint8_t* payload, size_t size) const;

private:
    uint32_t m_aggregate = 0;
    std::vector<chunk_checksum> m_chunks;
};

constexpr size_t LEGACY_CHECKSUM_SIZE = 8;
constexpr size_t CHECKSUM_ENTRY_SIZE = 8;

} // namespace euph

#endif


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
