// This is copyrighted software. More information is at the end of this file.
#include <euph/io_stream.hh>
#include <euph/error.hh>
#include <algorithm>
#include <cstring>
#include <fstream>

namespace euph {

namespace {

// Read-only view over caller memory
class memory_stream : public io_stream {
public:
    memory_stream(const void* data, size_t size_bytes)
        : m_data(static_cast<const uint8_t*>(data))
        , m_size(size_bytes)
        , m_position(0)
        , m_is_open(true) {}

    size_t read(void* ptr, size_t size_bytes) override {
        if (!m_is_open || m_position >= m_size) {
            return 0;
        }

        size_t to_read = std::min(size_bytes, m_size - m_position);
        std::memcpy(ptr, m_data + m_position, to_read);
        m_position += to_read;
        return to_read;
    }

    size_t write(const void*, size_t) override {
        return 0;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!m_is_open) {
            return -1;
        }

        int64_t new_pos = 0;
        switch (whence) {
            case seek_origin::set: new_pos = offset; break;
            case seek_origin::cur: new_pos = static_cast<int64_t>(m_position) + offset; break;
            case seek_origin::end: new_pos = static_cast<int64_t>(m_size) + offset; break;
        }

        if (new_pos < 0 || new_pos > static_cast<int64_t>(m_size)) {
            return -1;
        }

        m_position = static_cast<size_t>(new_pos);
        return new_pos;
    }

    int64_t tell() override {
        return m_is_open ? static_cast<int64_t>(m_position) : -1;
    }

    int64_t get_size() override {
        return m_is_open ? static_cast<int64_t>(m_size) : -1;
    }

    void close() override {
        m_is_open = false;
    }

    bool is_open() const override {
        return m_is_open;
    }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_position;
    bool m_is_open;
};

// Growable stream backed by a caller-owned vector
class vector_stream : public io_stream {
public:
    explicit vector_stream(std::vector<uint8_t>& storage)
        : m_storage(storage)
        , m_position(0)
        , m_is_open(true) {}

    size_t read(void* ptr, size_t size_bytes) override {
        if (!m_is_open || m_position >= m_storage.size()) {
            return 0;
        }
        size_t to_read = std::min(size_bytes, m_storage.size() - m_position);
        std::memcpy(ptr, m_storage.data() + m_position, to_read);
        m_position += to_read;
        return to_read;
    }

    size_t write(const void* ptr, size_t size_bytes) override {
        if (!m_is_open) {
            return 0;
        }
        if (m_position + size_bytes > m_storage.size()) {
            m_storage.resize(m_position + size_bytes);
        }
        std::memcpy(m_storage.data() + m_position, ptr, size_bytes);
        m_position += size_bytes;
        return size_bytes;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!m_is_open) {
            return -1;
        }

        int64_t new_pos = 0;
        switch (whence) {
            case seek_origin::set: new_pos = offset; break;
            case seek_origin::cur: new_pos = static_cast<int64_t>(m_position) + offset; break;
            case seek_origin::end: new_pos = static_cast<int64_t>(m_storage.size()) + offset; break;
        }

        if (new_pos < 0 || new_pos > static_cast<int64_t>(m_storage.size())) {
            return -1;
        }

        m_position = static_cast<size_t>(new_pos);
        return new_pos;
    }

    int64_t tell() override {
        return m_is_open ? static_cast<int64_t>(m_position) : -1;
    }

    int64_t get_size() override {
        return m_is_open ? static_cast<int64_t>(m_storage.size()) : -1;
    }

    void close() override {
        m_is_open = false;
    }

    bool is_open() const override {
        return m_is_open;
    }

private:
    std::vector<uint8_t>& m_storage;
    size_t m_position;
    bool m_is_open;
};

class file_stream : public io_stream {
public:
    file_stream(const char* filename, const char* mode) {
        std::ios::openmode open_mode = std::ios::binary;

        if (std::strchr(mode, 'r')) {
            open_mode |= std::ios::in;
            if (std::strchr(mode, '+')) {
                open_mode |= std::ios::out;
            }
        } else if (std::strchr(mode, 'w')) {
            open_mode |= std::ios::out | std::ios::trunc;
            if (std::strchr(mode, '+')) {
                open_mode |= std::ios::in;
            }
        }

        m_file.open(filename, open_mode);
    }

    size_t read(void* ptr, size_t size_bytes) override {
        if (!is_open()) {
            return 0;
        }
        m_file.read(static_cast<char*>(ptr), static_cast<std::streamsize>(size_bytes));
        return static_cast<size_t>(m_file.gcount());
    }

    size_t write(const void* ptr, size_t size_bytes) override {
        if (!is_open()) {
            return 0;
        }
        m_file.write(static_cast<const char*>(ptr), static_cast<std::streamsize>(size_bytes));
        return m_file.good() ? size_bytes : 0;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!is_open()) {
            return -1;
        }

        std::ios::seekdir dir = std::ios::beg;
        switch (whence) {
            case seek_origin::set: dir = std::ios::beg; break;
            case seek_origin::cur: dir = std::ios::cur; break;
            case seek_origin::end: dir = std::ios::end; break;
        }

        m_file.clear();
        m_file.seekg(offset, dir);
        m_file.seekp(offset, dir);
        return tell();
    }

    int64_t tell() override {
        if (!is_open()) {
            return -1;
        }
        return static_cast<int64_t>(m_file.tellg());
    }

    int64_t get_size() override {
        if (!is_open()) {
            return -1;
        }
        m_file.clear();
        auto cur_pos = m_file.tellg();
        m_file.seekg(0, std::ios::end);
        auto file_size = m_file.tellg();
        m_file.seekg(cur_pos);
        return static_cast<int64_t>(file_size);
    }

    void close() override {
        m_file.close();
    }

    bool is_open() const override {
        return m_file.is_open();
    }

private:
    mutable std::fstream m_file;
};

} // namespace

std::vector<uint8_t> read_all(io_stream* stream) {
    if (!stream || !stream->is_open()) {
        throw io_error("stream is not open");
    }

    std::vector<uint8_t> data;
    const int64_t size = stream->get_size();
    const int64_t pos = stream->tell();
    if (size > 0 && pos >= 0 && size > pos) {
        data.reserve(static_cast<size_t>(size - pos));
    }

    uint8_t block[16 * 1024];
    for (;;) {
        size_t got = stream->read(block, sizeof(block));
        if (got == 0) {
            break;
        }
        data.insert(data.end(), block, block + got);
    }
    return data;
}

void write_all(io_stream* stream, const uint8_t* data, size_t size) {
    if (!stream || !stream->is_open()) {
        throw io_error("stream is not open");
    }
    size_t written = 0;
    while (written < size) {
        size_t n = stream->write(data + written, size - written);
        if (n == 0) {
            throw io_error("short write: " + std::to_string(written) + " of " +
                           std::to_string(size) + " bytes");
        }
        written += n;
    }
}

std::unique_ptr<io_stream> io_from_file(const char* filename, const char* mode) {
    auto stream = std::make_unique<file_stream>(filename, mode);
    if (!stream->is_open()) {
        return nullptr;
    }
    return stream;
}

std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes) {
    return std::make_unique<memory_stream>(mem, size_bytes);
}

std::unique_ptr<io_stream> io_from_vector(std::vector<uint8_t>& storage) {
    return std::make_unique<vector_stream>(storage);
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
