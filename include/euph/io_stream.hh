// This is copyrighted software. More information is at the end of this file.
/**
 * @file io_stream.hh
 * @brief Binary I/O stream abstraction
 */

#ifndef EUPH_IO_STREAM_HH
#define EUPH_IO_STREAM_HH

#include <euph/export_euph.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace euph {

/**
 * @enum seek_origin
 * @brief Seek origin for stream positioning
 */
enum class seek_origin : int {
    set = 0,  ///< From beginning of stream (SEEK_SET)
    cur = 1,  ///< From current position (SEEK_CUR)
    end = 2   ///< From end of stream (SEEK_END)
};

/**
 * @class io_stream
 * @brief Abstract interface for binary I/O
 *
 * The streaming decoder pulls container bytes through this interface, and
 * the encoder/decoder file helpers read and write whole containers with it.
 * A read may return fewer bytes than requested, as a socket or pipe would;
 * a return value of 0 means end of data.
 *
 * @code
 * auto in = io_from_file("track.euph", "rb");
 * if (!in) {
 *     // Handle error
 * }
 * euph::streaming_decoder dec(in.get());
 * @endcode
 */
class EUPH_EXPORT io_stream {
public:
    virtual ~io_stream() = default;

    /**
     * @brief Read binary data from stream
     * @param ptr Buffer to read into
     * @param size_bytes Number of bytes to read
     * @return Actual number of bytes read, 0 on end of data or error
     */
    virtual size_t read(void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Write binary data to stream
     * @return Actual number of bytes written
     * @note Not all streams support writing
     */
    virtual size_t write(const void* ptr, size_t size_bytes) = 0;

    /**
     * @brief Seek to a position in the stream
     * @return New position from start, or -1 on error
     */
    virtual int64_t seek(int64_t offset, seek_origin whence) = 0;

    /// Current byte position from start, or -1 on error
    virtual int64_t tell() = 0;

    /// Total size in bytes, or -1 if unknown
    virtual int64_t get_size() = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief Read until the stream is exhausted
 * @throws io_error if the stream is null or closed
 */
EUPH_EXPORT std::vector<uint8_t> read_all(io_stream* stream);

/**
 * @brief Write the whole buffer
 * @throws io_error on a short write
 */
EUPH_EXPORT void write_all(io_stream* stream, const uint8_t* data, size_t size);

/**
 * @brief Open a file stream
 * @param filename Path to file
 * @param mode "rb" to read, "wb" to write
 * @return New io_stream, or nullptr if the file could not be opened
 */
EUPH_EXPORT std::unique_ptr<io_stream> io_from_file(const char* filename, const char* mode);

/**
 * @brief Create a read-only stream over caller memory
 * @note The memory must remain valid for the lifetime of the stream
 */
EUPH_EXPORT std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes);

/**
 * @brief Create a writable stream that appends into a caller vector
 *
 * Writes past the end grow the vector. The vector must outlive the stream.
 */
EUPH_EXPORT std::unique_ptr<io_stream> io_from_vector(std::vector<uint8_t>& storage);

} // namespace euph

#endif // EUPH_IO_STREAM_HH


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
