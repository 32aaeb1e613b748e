// This is copyrighted software. More information is at the end of this file.
/**
 * @file integrity.hh
 * @brief CRC32 integrity results
 */

#pragma once

#include <euph/export_euph.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace euph {

/**
 * @struct integrity_report
 * @brief Outcome of checking chunk payloads against the CHKS chunk
 *
 * Integrity problems never abort decoding. A report with
 * checksum_match == false or a non-empty corrupted_chunks list means some
 * payload changed after encoding; callers decide whether that is fatal.
 *
 * | situation                     | verified | checksum_match |
 * |-------------------------------|----------|----------------|
 * | CHKS present, checked         | true     | computed       |
 * | no CHKS chunk                 | false    | false          |
 * | validation switched off       | false    | true           |
 */
struct integrity_report {
    bool verified = false;
    bool checksum_match = false;

    /// Tags of chunks whose CRC32 differs from the stored one, in file order
    std::vector<std::string> corrupted_chunks;

    uint32_t stored_checksum = 0;
    uint32_t computed_checksum = 0;

    /// True when the check ran and found nothing wrong
    [[nodiscard]] bool intact() const {
        return verified && checksum_match && corrupted_chunks.empty();
    }

    bool operator==(const integrity_report& other) const {
        return verified == other.verified && checksum_match == other.checksum_match &&
               corrupted_chunks == other.corrupted_chunks &&
               stored_checksum == other.stored_checksum &&
               computed_checksum == other.computed_checksum;
    }

    bool operator!=(const integrity_report& other) const {
        return !(*this == other);
    }
};

/**
 * @brief CRC32 (ISO-HDLC polynomial)
 * @param seed Running value from a previous call, 0 to start
 */
EUPH_EXPORT uint32_t crc32(const uint8_t* data, size_t size, uint32_t seed = 0);

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
