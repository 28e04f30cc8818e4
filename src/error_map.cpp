/**********************************************************************
File name: error_map.cpp
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
#include "userspacefs/error_map.hpp"

#include <cerrno>
#include <stdexcept>

namespace Userspacefs {

const char *errc_name(Errc err)
{
    switch (err) {
    case Errc::NONE:
        return "none";
    case Errc::NOT_FOUND:
        return "not found";
    case Errc::NOT_A_DIRECTORY:
        return "not a directory";
    case Errc::IS_A_DIRECTORY:
        return "is a directory";
    case Errc::EXISTS:
        return "exists";
    case Errc::NOT_EMPTY:
        return "not empty";
    case Errc::PERMISSION_DENIED:
        return "permission denied";
    case Errc::NO_SPACE:
        return "no space";
    case Errc::TOO_MANY_OPEN_FILES:
        return "too many open files";
    case Errc::STALE_HANDLE:
        return "stale handle";
    case Errc::INVALID_ARGUMENT:
        return "invalid argument";
    case Errc::NOT_SUPPORTED:
        return "not supported";
    case Errc::IO_ERROR:
        return "i/o error";
    case Errc::WOULD_BLOCK:
        return "would block";
    case Errc::CANCELLED:
        return "cancelled";
    case Errc::MALFORMED_REQUEST:
        return "malformed request";
    case Errc::UNKNOWN_OPERATION:
        return "unknown operation";
    }
    return "unknown error";
}

std::ostream &operator<<(std::ostream &stream, Errc err)
{
    return stream << errc_name(err);
}

ErrorTable::ErrorTable(std::string name,
                       std::initializer_list<Entry> forward,
                       std::initializer_list<Entry> aliases,
                       std::uint32_t fallback_native):
    m_name(std::move(name)),
    m_forward(forward),
    m_aliases(aliases),
    m_fallback_native(fallback_native)
{

}

std::uint32_t ErrorTable::to_native(Errc err) const
{
    for (const auto &entry: m_forward) {
        if (entry.error == err) {
            return entry.native;
        }
    }
    return m_fallback_native;
}

Errc ErrorTable::from_native(std::uint32_t native) const
{
    for (const auto &entry: m_aliases) {
        if (entry.native == native) {
            return entry.error;
        }
    }
    for (const auto &entry: m_forward) {
        if (entry.native == native) {
            return entry.error;
        }
    }
    return Errc::IO_ERROR;
}

void ErrorTable::validate() const
{
    for (Errc err: ALL_ERRORS) {
        bool found = false;
        for (const auto &entry: m_forward) {
            if (entry.error == err) {
                found = true;
                break;
            }
        }
        if (!found) {
            throw std::logic_error(m_name + " error table has no entry for " +
                                   errc_name(err));
        }
    }
}

const ErrorTable &errno_table()
{
    // Aliases are consulted first on the reverse lookup; codec-only kinds
    // come last so that EINVAL maps back to INVALID_ARGUMENT.
    static const ErrorTable table(
                "errno",
                {
                    {Errc::NOT_FOUND, ENOENT},
                    {Errc::NOT_A_DIRECTORY, ENOTDIR},
                    {Errc::IS_A_DIRECTORY, EISDIR},
                    {Errc::EXISTS, EEXIST},
                    {Errc::NOT_EMPTY, ENOTEMPTY},
                    {Errc::PERMISSION_DENIED, EACCES},
                    {Errc::NO_SPACE, ENOSPC},
                    {Errc::TOO_MANY_OPEN_FILES, EMFILE},
                    {Errc::STALE_HANDLE, ESTALE},
                    {Errc::INVALID_ARGUMENT, EINVAL},
                    {Errc::NOT_SUPPORTED, EOPNOTSUPP},
                    {Errc::IO_ERROR, EIO},
                    {Errc::WOULD_BLOCK, EAGAIN},
                    {Errc::CANCELLED, EINTR},
                    {Errc::MALFORMED_REQUEST, EINVAL},
                    {Errc::UNKNOWN_OPERATION, ENOSYS},
                },
                {
                    {Errc::PERMISSION_DENIED, EPERM},
                    {Errc::PERMISSION_DENIED, EROFS},
                    {Errc::TOO_MANY_OPEN_FILES, ENFILE},
                    {Errc::STALE_HANDLE, EBADF},
                    {Errc::NOT_FOUND, ENXIO},
                    {Errc::NO_SPACE, EDQUOT},
                    {Errc::NO_SPACE, EFBIG},
                    {Errc::INVALID_ARGUMENT, ENAMETOOLONG},
                    {Errc::INVALID_ARGUMENT, EXDEV},
                    {Errc::INVALID_ARGUMENT, ELOOP},
                    {Errc::NOT_SUPPORTED, ENOSYS},
                    {Errc::NOT_SUPPORTED, ENOTSUP},
                    {Errc::CANCELLED, ECANCELED},
                    {Errc::WOULD_BLOCK, EWOULDBLOCK},
                    {Errc::WOULD_BLOCK, EBUSY},
                },
                EIO);
    return table;
}

const ErrorTable &ntstatus_table()
{
    static const ErrorTable table(
                "NTSTATUS",
                {
                    {Errc::NOT_FOUND, NtStatus::OBJECT_NAME_NOT_FOUND},
                    {Errc::NOT_A_DIRECTORY, NtStatus::NOT_A_DIRECTORY},
                    {Errc::IS_A_DIRECTORY, NtStatus::FILE_IS_A_DIRECTORY},
                    {Errc::EXISTS, NtStatus::OBJECT_NAME_COLLISION},
                    {Errc::NOT_EMPTY, NtStatus::DIRECTORY_NOT_EMPTY},
                    {Errc::PERMISSION_DENIED, NtStatus::ACCESS_DENIED},
                    {Errc::NO_SPACE, NtStatus::DISK_FULL},
                    {Errc::TOO_MANY_OPEN_FILES, NtStatus::TOO_MANY_OPENED_FILES},
                    {Errc::STALE_HANDLE, NtStatus::FILE_CLOSED},
                    {Errc::INVALID_ARGUMENT, NtStatus::INVALID_PARAMETER},
                    {Errc::NOT_SUPPORTED, NtStatus::NOT_SUPPORTED},
                    {Errc::IO_ERROR, NtStatus::UNEXPECTED_IO_ERROR},
                    {Errc::WOULD_BLOCK, NtStatus::CANT_WAIT},
                    {Errc::CANCELLED, NtStatus::CANCELLED},
                    {Errc::MALFORMED_REQUEST, NtStatus::INVALID_PARAMETER},
                    {Errc::UNKNOWN_OPERATION, NtStatus::NOT_SUPPORTED},
                },
                {
                    {Errc::NOT_FOUND, NtStatus::OBJECT_PATH_NOT_FOUND},
                    {Errc::NOT_FOUND, NtStatus::NO_SUCH_FILE},
                    {Errc::INVALID_ARGUMENT, NtStatus::OBJECT_NAME_INVALID},
                    {Errc::STALE_HANDLE, NtStatus::INVALID_HANDLE},
                    {Errc::UNKNOWN_OPERATION, NtStatus::INVALID_DEVICE_REQUEST},
                },
                NtStatus::UNEXPECTED_IO_ERROR);
    return table;
}

}
