// This is copyrighted software. More information is at the end of this file.
/**
 * @file compression_backend.hh
 * @brief Generic lossless byte compressor and backend selection
 */

#pragma once

#include <euph/export_euph.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace euph {

/**
 * @class inflate_stream
 * @brief Incremental decompressor for one compressed member
 *
 * Compressed bytes may be fed in pieces of any size. Each call appends the
 * bytes that became available to @p out.
 */
class EUPH_EXPORT inflate_stream {
public:
    virtual ~inflate_stream() = default;

    /**
     * @brief Feed compressed bytes
     * @param max_output Most bytes this call may append to @p out
     * @throws format_error if the data is not a valid compressed member,
     *         if bytes follow the end of the member, or if it expands
     *         past max_output
     */
    virtual void feed(const uint8_t* data, size_t size, std::vector<uint8_t>& out,
                      size_t max_output) = 0;

    /// True once the end of the compressed member has been seen
    [[nodiscard]] virtual bool finished() const = 0;
};

/**
 * @class compression_backend
 * @brief Abstract generic byte compressor
 *
 * Every backend must produce and accept the same stream format (a gzip
 * member, RFC 1952), so containers written through one backend can be read
 * through any other.
 */
class EUPH_EXPORT compression_backend {
public:
    virtual ~compression_backend() = default;

    /// Human-readable backend name, e.g. "zlib 1.3"
    [[nodiscard]] virtual const char* get_name() const = 0;

    /**
     * @brief Compress a whole buffer into one member
     * @param level 0 (store) to 9 (maximum effort)
     * @throws backend_error if compression fails
     */
    [[nodiscard]] virtual std::vector<uint8_t> deflate(const uint8_t* data, size_t size, int level) const = 0;

    /// Start a new incremental decompression
    [[nodiscard]] virtual std::unique_ptr<inflate_stream> open_inflate() const = 0;

    /**
     * @brief One-shot decompression
     * @throws format_error if the data is corrupt or incomplete
     */
    [[nodiscard]] std::vector<uint8_t> inflate(const uint8_t* data, size_t size) const;
};

/// The zlib implementation
EUPH_EXPORT std::shared_ptr<compression_backend> make_zlib_backend();

/// True when the zlib runtime matches the headers the library was built with
EUPH_EXPORT bool zlib_backend_available();

/**
 * @class backend_registry
 * @brief Prioritized list of backends, selected by capability probe
 *
 * @code
 * euph::backend_registry registry;
 * registry.register_backend(
 *     [] { return euph::zlib_backend_available(); },
 *     [] { return euph::make_zlib_backend(); },
 *     10);
 * auto backend = registry.select();
 * @endcode
 *
 * @note Registration is not thread-safe; configure before use
 */
class EUPH_EXPORT backend_registry {
public:
    using probe_func_t = std::function<bool()>;
    using factory_func_t = std::function<std::shared_ptr<compression_backend>()>;

    /**
     * @brief Register a backend
     * @param probe Returns true if the backend can run here
     * @param factory Creates the backend
     * @param priority Higher priorities are probed first
     */
    void register_backend(probe_func_t probe, factory_func_t factory, int priority = 0);

    /**
     * @brief Create the highest-priority backend whose probe succeeds
     * @throws backend_error if no backend is usable
     */
    [[nodiscard]] std::shared_ptr<compression_backend> select() const;

    [[nodiscard]] size_t size() const;

    void clear();

private:
    struct backend_entry {
        probe_func_t probe;
        factory_func_t factory;
        int priority;
    };

    std::vector<backend_entry> m_backends;
};

/// A new registry holding the built-in backends
EUPH_EXPORT backend_registry default_backend_registry();

/// Shorthand for default_backend_registry().select()
EUPH_EXPORT std::shared_ptr<compression_backend> select_default_backend();

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
