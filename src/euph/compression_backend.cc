// This is copyrighted software. More information is at the end of this file.
#include <euph/compression_backend.hh>
#include <euph/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <limits>

namespace euph {

std::vector<uint8_t> compression_backend::inflate(const uint8_t* data, size_t size) const {
    auto stream = open_inflate();
    std::vector<uint8_t> out;
    stream->feed(data, size, out, std::numeric_limits<size_t>::max());
    if (!stream->finished()) {
        throw format_error("corrupted audio payload");
    }
    return out;
}

void backend_registry::register_backend(probe_func_t probe, factory_func_t factory, int priority) {
    m_backends.push_back({std::move(probe), std::move(factory), priority});

    // Sort by priority (higher first)
    std::stable_sort(m_backends.begin(), m_backends.end(),
                     [](const backend_entry& a, const backend_entry& b) {
                         return a.priority > b.priority;
                     });
}

std::shared_ptr<compression_backend> backend_registry::select() const {
    for (const auto& entry : m_backends) {
        bool usable = false;
        try {
            usable = entry.probe && entry.probe();
        } catch (const std::exception& e) {
            LOG_WARN("backend_registry", "Backend probe failed:", e.what());
            usable = false;
        }
        if (!usable || !entry.factory) {
            continue;
        }

        auto backend = entry.factory();
        if (backend) {
            LOG_INFO("backend_registry", "Selected compression backend", backend->get_name());
            return backend;
        }
    }
    throw backend_error("no usable compression backend");
}

size_t backend_registry::size() const {
    return m_backends.size();
}

void backend_registry::clear() {
    m_backends.clear();
}

backend_registry default_backend_registry() {
    backend_registry registry;
    registry.register_backend(&zlib_backend_available, &make_zlib_backend, 10);
    return registry;
}

std::shared_ptr<compression_backend> select_default_backend() {
    return default_backend_registry().select();
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
