/**********************************************************************
File name: buffer.hpp
This file is part of: userspacefs

LICENSE

This program is free software: you can redistribute it and/or modify it
under the terms of the GNU General Public License as published by the
Free Software Foundation, either version 3 of the License, or (at your
option) any later version.

This program is distributed in the hope that it will be useful, but
WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program.  If not, see <http://www.gnu.org/licenses/>.

FEEDBACK & QUESTIONS

For feedback and questions about userspacefs please e-mail one of the
authors named in the AUTHORS file.
**********************************************************************/
#ifndef USERSPACEFS_FUSE_BUFFER_H
#define USERSPACEFS_FUSE_BUFFER_H

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include "userspacefs/error.hpp"

namespace Userspacefs::Fuse {

/**
 * Sequential reader over the argument part of a request frame.
 */
class FrameReader {
public:
    explicit FrameReader(std::string_view data):
        m_data(data)
    {

    }

private:
    std::string_view m_data;

public:
    template <typename T>
    Result<T> read() {
        if (m_data.size() < sizeof(T)) {
            return make_result(FAILED, Errc::MALFORMED_REQUEST);
        }
        T result;
        std::memcpy(&result, m_data.data(), sizeof(T));
        m_data.remove_prefix(sizeof(T));
        return result;
    }

    /**
     * Read a structure of which older peers only send the first @a min_size
     * bytes. Fields which were not sent are zero.
     */
    template <typename T>
    Result<T> read_prefix(size_t min_size) {
        if (m_data.size() < min_size) {
            return make_result(FAILED, Errc::MALFORMED_REQUEST);
        }
        T result;
        std::memset(&result, 0, sizeof(T));
        const size_t count = std::min(sizeof(T), m_data.size());
        std::memcpy(&result, m_data.data(), count);
        m_data.remove_prefix(count);
        return result;
    }

    /**
     * Read a NUL-terminated string; the terminator must be inside the frame.
     */
    Result<std::string_view> read_name();
    Result<std::string_view> read_bytes(size_t count);

    [[nodiscard]] inline size_t remaining() const {
        return m_data.size();
    }
};


/**
 * Assembles a reply frame: fuse_out_header followed by the payload.
 */
class ReplyBuffer {
public:
    explicit ReplyBuffer(uint64_t unique);

private:
    uint64_t m_unique;
    std::string m_buf;

public:
    void append(const void *data, size_t size);

    inline void append(std::string_view data) {
        append(data.data(), data.size());
    }

    template <typename T>
    inline void append_struct(const T &value, size_t size = sizeof(T)) {
        append(&value, std::min(size, sizeof(T)));
    }

    std::string finish();

    static std::string error(uint64_t unique, int err);
};


/**
 * READDIR reply payload of packed fuse_dirent records.
 */
class DirBuffer {
public:
    explicit DirBuffer(size_t limit);

private:
    std::string m_buf;
    size_t m_limit;

    size_t prepare_add(std::string_view name);

public:
    /**
     * Append one record. Returns false, leaving the buffer unchanged, if the
     * record does not fit into the size the host asked for.
     */
    bool add(std::string_view name, uint64_t ino, uint32_t mode, uint64_t off);

    [[nodiscard]] inline const std::string &get() const {
        return m_buf;
    }

    [[nodiscard]] inline std::size_t length() const {
        return m_buf.size();
    }
};

}

#endif
