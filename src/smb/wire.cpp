/**********************************************************************
File name: wire.cpp
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
#include "userspacefs/smb/wire.hpp"

#include <cstring>

namespace Userspacefs::Smb {

static constexpr uint64_t FILETIME_EPOCH_OFFSET = 11644473600ULL;
static constexpr uint64_t FILETIME_TICKS = 10000000ULL;

Result<uint8_t> Reader::u8()
{
    if (!check(1)) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }
    return static_cast<uint8_t>(m_data[m_pos++]);
}

Result<uint16_t> Reader::u16()
{
    if (!check(2)) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }
    uint16_t value = 0;
    for (size_t i = 0; i < 2; ++i) {
        value |= static_cast<uint16_t>(static_cast<uint8_t>(m_data[m_pos + i]) << (8 * i));
    }
    m_pos += 2;
    return value;
}

Result<uint32_t> Reader::u32()
{
    if (!check(4)) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(static_cast<uint8_t>(m_data[m_pos + i])) << (8 * i);
    }
    m_pos += 4;
    return value;
}

Result<uint64_t> Reader::u64()
{
    if (!check(8)) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(static_cast<uint8_t>(m_data[m_pos + i])) << (8 * i);
    }
    m_pos += 8;
    return value;
}

Result<std::string_view> Reader::bytes(size_t count)
{
    if (!check(count)) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }
    std::string_view result = m_data.substr(m_pos, count);
    m_pos += count;
    return result;
}

Result<void> Reader::skip(size_t count)
{
    if (!check(count)) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }
    m_pos += count;
    return make_result();
}

Result<std::string_view> Reader::at(size_t offset, size_t count) const
{
    if (count == 0) {
        return std::string_view();
    }
    if (offset > m_data.size() || m_data.size() - offset < count) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }
    return m_data.substr(offset, count);
}

void Writer::u8(uint8_t value)
{
    m_buf.push_back(static_cast<char>(value));
}

void Writer::u16(uint16_t value)
{
    for (size_t i = 0; i < 2; ++i) {
        m_buf.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
    }
}

void Writer::u32(uint32_t value)
{
    for (size_t i = 0; i < 4; ++i) {
        m_buf.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
    }
}

void Writer::u64(uint64_t value)
{
    for (size_t i = 0; i < 8; ++i) {
        m_buf.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
    }
}

void Writer::bytes(std::string_view data)
{
    m_buf.append(data.data(), data.size());
}

void Writer::zeros(size_t count)
{
    m_buf.append(count, '\0');
}

void Writer::align(size_t alignment)
{
    const size_t rest = m_buf.size() % alignment;
    if (rest != 0) {
        zeros(alignment - rest);
    }
}

void Writer::put_u32(size_t offset, uint32_t value)
{
    for (size_t i = 0; i < 4; ++i) {
        m_buf[offset + i] = static_cast<char>((value >> (8 * i)) & 0xff);
    }
}

Result<Header> parse_header(std::string_view message)
{
    if (message.size() < HEADER_SIZE || message.substr(0, 4) != std::string_view("\xfeSMB", 4)) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }

    Reader reader(message, 4);
    auto structure_size = reader.u16();
    if (!structure_size || *structure_size != HEADER_SIZE) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }

    Header header{};
    // the size was checked above, none of these can fail
    header.credit_charge = *reader.u16();
    header.status = *reader.u32();
    header.command = *reader.u16();
    header.credits = *reader.u16();
    header.flags = *reader.u32();
    header.next_command = *reader.u32();
    header.message_id = *reader.u64();
    if (header.flags & FLAG_ASYNC_COMMAND) {
        header.async_id = *reader.u64();
    } else {
        header.process_id = *reader.u32();
        header.tree_id = *reader.u32();
    }
    header.session_id = *reader.u64();
    return header;
}

void write_response_header(Writer &writer, const Header &request, uint32_t status,
                           uint16_t credits)
{
    writer.bytes(std::string_view("\xfeSMB", 4));
    writer.u16(HEADER_SIZE);
    writer.u16(request.credit_charge);
    writer.u32(status);
    writer.u16(request.command);
    writer.u16(credits);
    writer.u32(FLAG_SERVER_TO_REDIR | (request.flags & FLAG_ASYNC_COMMAND));
    writer.u32(0);
    writer.u64(request.message_id);
    if (request.flags & FLAG_ASYNC_COMMAND) {
        writer.u64(request.async_id);
    } else {
        writer.u32(request.process_id);
        writer.u32(request.tree_id);
    }
    writer.u64(request.session_id);
    // unsigned
    writer.zeros(16);
}

uint64_t to_filetime(const struct timespec &ts)
{
    if (ts.tv_sec < 0 && static_cast<uint64_t>(-ts.tv_sec) > FILETIME_EPOCH_OFFSET) {
        return 0;
    }
    return (static_cast<uint64_t>(ts.tv_sec + static_cast<int64_t>(FILETIME_EPOCH_OFFSET))) *
            FILETIME_TICKS + static_cast<uint64_t>(ts.tv_nsec) / 100;
}

struct timespec from_filetime(uint64_t filetime)
{
    struct timespec result;
    const uint64_t seconds = filetime / FILETIME_TICKS;
    result.tv_sec = static_cast<time_t>(static_cast<int64_t>(seconds) -
                                        static_cast<int64_t>(FILETIME_EPOCH_OFFSET));
    result.tv_nsec = static_cast<long>((filetime % FILETIME_TICKS) * 100);
    return result;
}

Result<std::string> utf16_to_utf8(std::string_view data)
{
    if (data.size() % 2 != 0) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }

    std::string result;
    result.reserve(data.size() / 2);
    auto unit = [&data](size_t i) -> uint32_t {
        return static_cast<uint32_t>(static_cast<uint8_t>(data[2 * i])) |
                (static_cast<uint32_t>(static_cast<uint8_t>(data[2 * i + 1])) << 8);
    };

    const size_t units = data.size() / 2;
    for (size_t i = 0; i < units; ++i) {
        uint32_t cp = unit(i);
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (i + 1 >= units) {
                return make_result(FAILED, Errc::INVALID_ARGUMENT);
            }
            const uint32_t low = unit(i + 1);
            if (low < 0xDC00 || low > 0xDFFF) {
                return make_result(FAILED, Errc::INVALID_ARGUMENT);
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            ++i;
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            return make_result(FAILED, Errc::INVALID_ARGUMENT);
        }

        if (cp < 0x80) {
            result.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return result;
}

std::string utf8_to_utf16(std::string_view text)
{
    std::string result;
    result.reserve(text.size() * 2);
    auto put = [&result](uint32_t unit) {
        result.push_back(static_cast<char>(unit & 0xff));
        result.push_back(static_cast<char>((unit >> 8) & 0xff));
    };

    size_t i = 0;
    while (i < text.size()) {
        const uint8_t lead = static_cast<uint8_t>(text[i]);
        uint32_t cp;
        size_t length;
        if (lead < 0x80) {
            cp = lead;
            length = 1;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            length = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            length = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            length = 4;
        } else {
            cp = 0xFFFD;
            length = 1;
        }

        if (length > 1) {
            if (i + length > text.size()) {
                cp = 0xFFFD;
                length = text.size() - i;
            } else {
                static constexpr uint32_t MIN_CP[] = {0, 0, 0x80, 0x800, 0x10000};
                bool complete = true;
                for (size_t k = 1; k < length; ++k) {
                    const uint8_t cont = static_cast<uint8_t>(text[i + k]);
                    if ((cont & 0xC0) != 0x80) {
                        cp = 0xFFFD;
                        length = k;
                        complete = false;
                        break;
                    }
                    cp = (cp << 6) | (cont & 0x3F);
                }
                // overlong forms, surrogates and values beyond U+10FFFF have
                // no UTF-16 encoding
                if (complete && (cp < MIN_CP[length] || cp > 0x10FFFF ||
                                 (cp >= 0xD800 && cp <= 0xDFFF))) {
                    cp = 0xFFFD;
                }
            }
        }
        i += length;

        if (cp >= 0x10000) {
            cp -= 0x10000;
            put(0xD800 + (cp >> 10));
            put(0xDC00 + (cp & 0x3FF));
        } else {
            put(cp);
        }
    }
    return result;
}

}
