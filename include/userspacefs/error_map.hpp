/**********************************************************************
File name: error_map.hpp
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
#ifndef USERSPACEFS_ERROR_MAP_H
#define USERSPACEFS_ERROR_MAP_H

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include "userspacefs/error.hpp"

namespace Userspacefs {

namespace NtStatus {

static constexpr std::uint32_t SUCCESS = 0x00000000;
static constexpr std::uint32_t BUFFER_OVERFLOW = 0x80000005;
static constexpr std::uint32_t NO_MORE_FILES = 0x80000006;
static constexpr std::uint32_t INVALID_INFO_CLASS = 0xC0000003;
static constexpr std::uint32_t INFO_LENGTH_MISMATCH = 0xC0000004;
static constexpr std::uint32_t INVALID_HANDLE = 0xC0000008;
static constexpr std::uint32_t INVALID_PARAMETER = 0xC000000D;
static constexpr std::uint32_t NO_SUCH_FILE = 0xC000000F;
static constexpr std::uint32_t INVALID_DEVICE_REQUEST = 0xC0000010;
static constexpr std::uint32_t END_OF_FILE = 0xC0000011;
static constexpr std::uint32_t ACCESS_DENIED = 0xC0000022;
static constexpr std::uint32_t OBJECT_NAME_INVALID = 0xC0000033;
static constexpr std::uint32_t OBJECT_NAME_NOT_FOUND = 0xC0000034;
static constexpr std::uint32_t OBJECT_NAME_COLLISION = 0xC0000035;
static constexpr std::uint32_t OBJECT_PATH_NOT_FOUND = 0xC000003A;
static constexpr std::uint32_t DISK_FULL = 0xC000007F;
static constexpr std::uint32_t FILE_IS_A_DIRECTORY = 0xC00000BA;
static constexpr std::uint32_t NOT_SUPPORTED = 0xC00000BB;
static constexpr std::uint32_t NETWORK_NAME_DELETED = 0xC00000C9;
static constexpr std::uint32_t BAD_NETWORK_NAME = 0xC00000CC;
static constexpr std::uint32_t CANT_WAIT = 0xC00000D8;
static constexpr std::uint32_t UNEXPECTED_IO_ERROR = 0xC00000E9;
static constexpr std::uint32_t DIRECTORY_NOT_EMPTY = 0xC0000101;
static constexpr std::uint32_t NOT_A_DIRECTORY = 0xC0000103;
static constexpr std::uint32_t TOO_MANY_OPENED_FILES = 0xC000011F;
static constexpr std::uint32_t CANCELLED = 0xC0000120;
static constexpr std::uint32_t FILE_CLOSED = 0xC0000128;
static constexpr std::uint32_t USER_SESSION_DELETED = 0xC0000203;

}

/**
 * Static bidirectional table between the error taxonomy and one host's
 * native error numbering.
 *
 * Values which are not part of the table map to the fallback in both
 * directions, so an unknown error never reaches the host unmapped.
 */
class ErrorTable {
public:
    struct Entry {
        Errc error;
        std::uint32_t native;
    };

public:
    /**
     * @param forward One entry per error kind; used in both directions.
     * @param aliases Additional native values accepted by from_native.
     */
    ErrorTable(std::string name,
               std::initializer_list<Entry> forward,
               std::initializer_list<Entry> aliases,
               std::uint32_t fallback_native);

private:
    std::string m_name;
    std::vector<Entry> m_forward;
    std::vector<Entry> m_aliases;
    std::uint32_t m_fallback_native;

public:
    [[nodiscard]] const std::string &name() const {
        return m_name;
    }

    [[nodiscard]] std::uint32_t to_native(Errc err) const;
    [[nodiscard]] Errc from_native(std::uint32_t native) const;

    /**
     * Throw std::logic_error unless every error kind has a mapping.
     */
    void validate() const;

};

const ErrorTable &errno_table();
const ErrorTable &ntstatus_table();

[[nodiscard]] inline Errc from_errno(int err)
{
    return errno_table().from_native(static_cast<std::uint32_t>(err));
}

[[nodiscard]] inline int to_errno(Errc err)
{
    return static_cast<int>(errno_table().to_native(err));
}

[[nodiscard]] inline std::uint32_t to_ntstatus(Errc err)
{
    return ntstatus_table().to_native(err);
}

}

#endif
