// This is copyrighted software. More information is at the end of this file.
#include <euph/compression_backend.hh>
#include <euph/error.hh>
#include <failsafe/failsafe.hh>
#include <zlib.h>
#include <climits>
#include <string>

namespace euph {

namespace {

// windowBits 15 plus 16 selects the gzip wrapper
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr size_t INFLATE_BLOCK = 16 * 1024;

class zlib_inflate_stream : public inflate_stream {
public:
    zlib_inflate_stream() {
        m_stream.zalloc = Z_NULL;
        m_stream.zfree = Z_NULL;
        m_stream.opaque = Z_NULL;
        m_stream.next_in = Z_NULL;
        m_stream.avail_in = 0;
        int rc = inflateInit2(&m_stream, GZIP_WINDOW_BITS);
        if (rc != Z_OK) {
            throw backend_error("inflateInit2 failed, error code: " + std::to_string(rc));
        }
    }

    ~zlib_inflate_stream() override {
        inflateEnd(&m_stream);
    }

    zlib_inflate_stream(const zlib_inflate_stream&) = delete;
    zlib_inflate_stream& operator=(const zlib_inflate_stream&) = delete;

    void feed(const uint8_t* data, size_t size, std::vector<uint8_t>& out,
              size_t max_output) override {
        if (size == 0) {
            return;
        }
        if (m_finished) {
            throw format_error("trailing bytes after compressed audio");
        }
        if (size > UINT_MAX) {
            throw format_error("compressed block too large");
        }

        m_stream.next_in = const_cast<Bytef*>(data);
        m_stream.avail_in = static_cast<uInt>(size);

        uint8_t block[INFLATE_BLOCK];
        size_t total = 0;
        for (;;) {
            m_stream.next_out = block;
            m_stream.avail_out = sizeof(block);

            int rc = inflate(&m_stream, Z_NO_FLUSH);
            const size_t produced = sizeof(block) - m_stream.avail_out;
            total += produced;
            if (total > max_output) {
                LOG_DEBUG("zlib_backend", "inflate output passed its limit of", max_output, "bytes");
                throw format_error("audio payload holds more samples than declared");
            }
            out.insert(out.end(), block, block + produced);

            if (rc == Z_STREAM_END) {
                m_finished = true;
                if (m_stream.avail_in != 0) {
                    throw format_error("trailing bytes after compressed audio");
                }
                return;
            }
            if (rc == Z_BUF_ERROR) {
                // no progress possible until more input arrives
                return;
            }
            if (rc != Z_OK) {
                LOG_DEBUG("zlib_backend", "inflate failed, error code:", rc);
                throw format_error("corrupted audio payload");
            }
            if (m_stream.avail_in == 0 && m_stream.avail_out != 0) {
                return;
            }
        }
    }

    bool finished() const override {
        return m_finished;
    }

private:
    z_stream m_stream{};
    bool m_finished = false;
};

class zlib_backend : public compression_backend {
public:
    zlib_backend()
        : m_name(std::string("zlib ") + zlibVersion()) {}

    const char* get_name() const override {
        return m_name.c_str();
    }

    std::vector<uint8_t> deflate(const uint8_t* data, size_t size, int level) const override {
        if (level < Z_NO_COMPRESSION || level > Z_BEST_COMPRESSION) {
            throw backend_error("invalid zlib compression level: " + std::to_string(level));
        }
        if (size > UINT_MAX) {
            throw backend_error("buffer too large for a single deflate call");
        }

        z_stream zs{};
        zs.zalloc = Z_NULL;
        zs.zfree = Z_NULL;
        zs.opaque = Z_NULL;
        int rc = deflateInit2(&zs, level, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY);
        if (rc != Z_OK) {
            throw backend_error("deflateInit2 failed, error code: " + std::to_string(rc));
        }

        std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(size)));
        zs.next_in = const_cast<Bytef*>(data);
        zs.avail_in = static_cast<uInt>(size);
        zs.next_out = out.data();
        zs.avail_out = static_cast<uInt>(out.size());

        rc = ::deflate(&zs, Z_FINISH);
        const size_t produced = out.size() - zs.avail_out;
        deflateEnd(&zs);

        if (rc != Z_STREAM_END) {
            throw backend_error("deflate failed, error code: " + std::to_string(rc));
        }
        out.resize(produced);
        return out;
    }

    std::unique_ptr<inflate_stream> open_inflate() const override {
        return std::make_unique<zlib_inflate_stream>();
    }

private:
    std::string m_name;
};

} // namespace

std::shared_ptr<compression_backend> make_zlib_backend() {
    return std::make_shared<zlib_backend>();
}

bool zlib_backend_available() {
    // same check zlib documents for ZLIB_VERSION compatibility
    const char* runtime = zlibVersion();
    return runtime != nullptr && runtime[0] == ZLIB_VERSION[0];
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
