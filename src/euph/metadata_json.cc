// This is copyrighted software. More information is at the end of this file.
#include "metadata_json.hh"
#include <euph/error.hh>
#include <failsafe/failsafe.hh>
#include <nlohmann/json.hpp>
#include <limits>

using json = nlohmann::json;

namespace euph {

namespace {

void read_string(const json& root, const char* key, std::optional<std::string>& out) {
    const auto it = root.find(key);
    if (it == root.end()) {
        return;
    }
    if (it->is_string()) {
        out = it->get<std::string>();
    } else if (!it->is_null()) {
        LOG_WARN("metadata", "Ignoring META field with unexpected type:", key);
    }
}

std::optional<int32_t> parse_i32(const json& value) {
    if (value.is_number_unsigned()) {
        const auto raw = value.get<uint64_t>();
        if (raw <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
            return static_cast<int32_t>(raw);
        }
        return std::nullopt;
    }
    if (value.is_number_integer()) {
        const auto raw = value.get<int64_t>();
        if (raw >= std::numeric_limits<int32_t>::min() && raw <= std::numeric_limits<int32_t>::max()) {
            return static_cast<int32_t>(raw);
        }
    }
    return std::nullopt;
}

std::optional<uint32_t> parse_u32(const json& value) {
    if (value.is_number_unsigned()) {
        const auto raw = value.get<uint64_t>();
        if (raw <= std::numeric_limits<uint32_t>::max()) {
            return static_cast<uint32_t>(raw);
        }
    }
    return std::nullopt;
}

} // namespace

std::string serialize_metadata(const track_metadata& metadata) {
    json root = json::object();
    if (metadata.title) root["title"] = *metadata.title;
    if (metadata.artist) root["artist"] = *metadata.artist;
    if (metadata.album) root["album"] = *metadata.album;
    if (metadata.genre) root["genre"] = *metadata.genre;
    if (metadata.year) root["year"] = *metadata.year;
    if (metadata.track_number) root["trackNumber"] = *metadata.track_number;

    if (metadata.enhancement) {
        json enhancement = json::object();
        enhancement["aiProcessed"] = metadata.enhancement->ai_processed;
        if (metadata.enhancement->genre_detection) {
            enhancement["genreDetection"] = *metadata.enhancement->genre_detection;
        }
        root["enhancement"] = std::move(enhancement);
    }

    // invalid UTF-8 in a tag is replaced rather than rejected
    return root.dump(-1, ' ', false, json::error_handler_t::replace);
}

void parse_metadata(const uint8_t* payload, size_t size, track_metadata& metadata) {
    const char* begin = reinterpret_cast<const char*>(payload);
    json root;
    try {
        root = json::parse(begin, begin + size);
    } catch (const json::parse_error& e) {
        throw format_error(std::string("malformed META chunk: ") + e.what());
    }
    if (!root.is_object()) {
        throw format_error("malformed META chunk: not a JSON object");
    }

    read_string(root, "title", metadata.title);
    read_string(root, "artist", metadata.artist);
    read_string(root, "album", metadata.album);
    read_string(root, "genre", metadata.genre);

    if (root.contains("year")) {
        if (const auto year = parse_i32(root["year"])) {
            metadata.year = *year;
        } else {
            LOG_WARN("metadata", "Ignoring META field with unexpected type:", "year");
        }
    }
    if (root.contains("trackNumber")) {
        if (const auto track = parse_u32(root["trackNumber"])) {
            metadata.track_number = *track;
        } else {
            LOG_WARN("metadata", "Ignoring META field with unexpected type:", "trackNumber");
        }
    }

    if (root.contains("enhancement")) {
        const json& node = root["enhancement"];
        if (!node.is_object()) {
            LOG_WARN("metadata", "Ignoring META field with unexpected type:", "enhancement");
            return;
        }
        enhancement_data& enhancement = metadata.enhancement ? *metadata.enhancement
                                                             : metadata.enhancement.emplace();
        if (node.contains("aiProcessed")) {
            if (node["aiProcessed"].is_boolean()) {
                enhancement.ai_processed = node["aiProcessed"].get<bool>();
            } else {
                LOG_WARN("metadata", "Ignoring META field with unexpected type:", "aiProcessed");
            }
        }
        read_string(node, "genreDetection", enhancement.genre_detection);
    }
}

void apply_header(const header_info& head, track_metadata& metadata) {
    metadata.sample_rate = head.sample_rate;
    metadata.channel_count = head.channel_count;
    metadata.bit_depth = head.bit_depth;
    metadata.duration = static_cast<double>(head.duration_ms) / 1000.0;
    metadata.profile = head.profile;
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
