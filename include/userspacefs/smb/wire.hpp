/**********************************************************************
File name: wire.hpp
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
#ifndef USERSPACEFS_SMB_WIRE_H
#define USERSPACEFS_SMB_WIRE_H

#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>

#include "userspacefs/error.hpp"

namespace Userspacefs::Smb {

static constexpr size_t HEADER_SIZE = 64;

enum Command: uint16_t {
    NEGOTIATE = 0x00,
    SESSION_SETUP = 0x01,
    LOGOFF = 0x02,
    TREE_CONNECT = 0x03,
    TREE_DISCONNECT = 0x04,
    CREATE = 0x05,
    CLOSE = 0x06,
    FLUSH = 0x07,
    READ = 0x08,
    WRITE = 0x09,
    LOCK = 0x0A,
    IOCTL = 0x0B,
    CANCEL = 0x0C,
    ECHO = 0x0D,
    QUERY_DIRECTORY = 0x0E,
    CHANGE_NOTIFY = 0x0F,
    QUERY_INFO = 0x10,
    SET_INFO = 0x11,
    OPLOCK_BREAK = 0x12,
};

enum HeaderFlag: uint32_t {
    FLAG_SERVER_TO_REDIR = 0x00000001,
    FLAG_ASYNC_COMMAND = 0x00000002,
    FLAG_RELATED_OPERATIONS = 0x00000004,
    FLAG_SIGNED = 0x00000008,
};

static constexpr uint16_t DIALECT_2_0_2 = 0x0202;
static constexpr uint16_t DIALECT_2_1 = 0x0210;
static constexpr uint16_t DIALECT_WILDCARD = 0x02FF;

struct Header {
    uint16_t credit_charge;
    uint32_t status;
    uint16_t command;
    uint16_t credits;
    uint32_t flags;
    uint32_t next_command;
    uint64_t message_id;
    /* sync requests only */
    uint32_t process_id;
    uint32_t tree_id;
    /* async requests only */
    uint64_t async_id;
    uint64_t session_id;
};

/**
 * Bounds-checked little-endian reader over one message.
 */
class Reader {
public:
    explicit Reader(std::string_view data, size_t pos = 0):
        m_data(data),
        m_pos(pos)
    {

    }

private:
    std::string_view m_data;
    size_t m_pos;

    bool check(size_t count) const {
        return m_pos <= m_data.size() && m_data.size() - m_pos >= count;
    }

public:
    Result<uint8_t> u8();
    Result<uint16_t> u16();
    Result<uint32_t> u32();
    Result<uint64_t> u64();
    Result<std::string_view> bytes(size_t count);
    Result<void> skip(size_t count);

    /**
     * Bytes at an absolute @a offset of the message, as used by the offset
     * and length pairs of the request bodies.
     */
    Result<std::string_view> at(size_t offset, size_t count) const;

    [[nodiscard]] inline size_t pos() const {
        return m_pos;
    }
};

/**
 * Little-endian writer building a message.
 */
class Writer {
public:
    Writer() = default;

private:
    std::string m_buf;

public:
    void u8(uint8_t value);
    void u16(uint16_t value);
    void u32(uint32_t value);
    void u64(uint64_t value);
    void bytes(std::string_view data);
    void zeros(size_t count);

    /**
     * Pad with zero bytes up to a multiple of @a alignment.
     */
    void align(size_t alignment);

    void put_u32(size_t offset, uint32_t value);

    [[nodiscard]] inline size_t size() const {
        return m_buf.size();
    }

    [[nodiscard]] inline const std::string &data() const {
        return m_buf;
    }

    inline std::string take() {
        return std::move(m_buf);
    }
};

Result<Header> parse_header(std::string_view message);

/**
 * Append a response header for @a request carrying @a status.
 */
void write_response_header(Writer &writer, const Header &request, uint32_t status,
                           uint16_t credits);

/**
 * Windows FILETIME: 100 ns intervals since 1601-01-01.
 */
uint64_t to_filetime(const struct timespec &ts);
struct timespec from_filetime(uint64_t filetime);

/**
 * Convert UTF-16LE as found on the wire. Unpaired surrogates fail with
 * Errc::INVALID_ARGUMENT.
 */
Result<std::string> utf16_to_utf8(std::string_view data);
std::string utf8_to_utf16(std::string_view text);

}

#endif
