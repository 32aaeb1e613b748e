// This is copyrighted software. More information is at the end of this file.
#include <euph/types.hh>
#include <stdexcept>

namespace euph {

const char* to_string(encoding_profile profile) {
    switch (profile) {
        case encoding_profile::lossless: return "lossless";
        case encoding_profile::balanced: return "balanced";
        case encoding_profile::compact: return "compact";
    }
    return "unknown";
}

std::optional<encoding_profile> profile_from_string(const std::string& name) {
    if (name == "lossless") return encoding_profile::lossless;
    if (name == "balanced") return encoding_profile::balanced;
    if (name == "compact") return encoding_profile::compact;
    return std::nullopt;
}

size_t pcm_data::frame_count() const {
    return channels.empty() ? 0 : channels.front().size();
}

bool pcm_data::empty() const {
    for (const auto& ch : channels) {
        if (!ch.empty()) {
            return false;
        }
    }
    return true;
}

bool pcm_data::is_rectangular() const {
    const size_t frames = frame_count();
    for (const auto& ch : channels) {
        if (ch.size() != frames) {
            return false;
        }
    }
    return true;
}

std::vector<float> pcm_data::interleave() const {
    const size_t num_channels = channels.size();
    const size_t frames = frame_count();
    std::vector<float> out(frames * num_channels);
    for (size_t c = 0; c < num_channels; ++c) {
        const auto& src = channels[c];
        for (size_t i = 0; i < frames; ++i) {
            out[i * num_channels + c] = src[i];
        }
    }
    return out;
}

pcm_data pcm_data::from_interleaved(const float* samples, size_t sample_count, channels_t num_channels) {
    if (num_channels == 0) {
        throw std::invalid_argument("channel count must not be zero");
    }
    if (sample_count % num_channels != 0) {
        throw std::invalid_argument("sample count is not a multiple of the channel count");
    }

    const size_t frames = sample_count / num_channels;
    pcm_data pcm;
    pcm.channels.assign(num_channels, std::vector<float>(frames));
    for (size_t i = 0; i < frames; ++i) {
        for (size_t c = 0; c < num_channels; ++c) {
            pcm.channels[c][i] = samples[i * num_channels + c];
        }
    }
    return pcm;
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
