// This is copyrighted software. More information is at the end of this file.
#ifndef EUPH_SRC_METADATA_JSON_HH
#define EUPH_SRC_METADATA_JSON_HH

#include <euph/format.hh>
#include <euph/types.hh>
#include <cstddef>
#include <cstdint>
#include <string>

namespace euph {

// Descriptive fields only; HEAD carries the technical ones and the
// AIDE/DSPS chunks carry the large enhancement blobs.
std::string serialize_metadata(const track_metadata& metadata);

/**
 * Fill the descriptive fields of @p metadata from a META payload.
 * Unknown keys are ignored, keys of the wrong JSON type are skipped.
 * @throws format_error if the payload is not a JSON object
 */
void parse_metadata(const uint8_t* payload, size_t size, track_metadata& metadata);

/// Copy the technical fields of a HEAD chunk into @p metadata
void apply_header(const header_info& head, track_metadata& metadata);

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
