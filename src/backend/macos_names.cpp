/**********************************************************************
File name: macos_names.cpp
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
#include "userspacefs/backend/macos_names.hpp"

namespace Userspacefs::Backend {

static constexpr char PUNCTUATION[] = {'"', '*', '/', '<', '>', '?', '\\', '|'};

std::string from_macos_name(std::string_view name)
{
    std::string result;
    result.reserve(name.size());

    size_t i = 0;
    while (i < name.size()) {
        // U+F001..U+F027 encode as EF 80 81..A7
        if (i + 2 < name.size() &&
                static_cast<uint8_t>(name[i]) == 0xef &&
                static_cast<uint8_t>(name[i+1]) == 0x80) {
            const uint8_t low = static_cast<uint8_t>(name[i+2]);
            if (low >= 0x81 && low <= 0x9f) {
                result += static_cast<char>(low - 0x80);
                i += 3;
                continue;
            }
            if (low >= 0xa0 && low <= 0xa7 && low != 0xa2) {
                result += PUNCTUATION[low - 0xa0];
                i += 3;
                continue;
            }
        }
        result += name[i];
        ++i;
    }

    return result;
}

MacOSNamesFilesystem::MacOSNamesFilesystem(std::unique_ptr<Filesystem> &&inner):
    m_inner(std::move(inner))
{

}

Result<std::unique_ptr<File>> MacOSNamesFilesystem::open(std::string_view path, int flags, mode_t mode)
{
    return m_inner->open(from_macos_name(path), flags, mode);
}

Result<std::unique_ptr<Dir>> MacOSNamesFilesystem::opendir(std::string_view path)
{
    return m_inner->opendir(from_macos_name(path));
}

Result<Stat> MacOSNamesFilesystem::lstat(std::string_view path)
{
    return m_inner->lstat(from_macos_name(path));
}

Result<void> MacOSNamesFilesystem::setattr(std::string_view path, const SetAttr &attr)
{
    return m_inner->setattr(from_macos_name(path), attr);
}

Result<std::string> MacOSNamesFilesystem::readlink(std::string_view path)
{
    return m_inner->readlink(from_macos_name(path));
}

Result<void> MacOSNamesFilesystem::mkdir(std::string_view path, mode_t mode)
{
    return m_inner->mkdir(from_macos_name(path), mode);
}

Result<void> MacOSNamesFilesystem::rmdir(std::string_view path)
{
    return m_inner->rmdir(from_macos_name(path));
}

Result<void> MacOSNamesFilesystem::unlink(std::string_view path)
{
    return m_inner->unlink(from_macos_name(path));
}

Result<void> MacOSNamesFilesystem::rename(std::string_view from, std::string_view to, bool replace)
{
    return m_inner->rename(from_macos_name(from), from_macos_name(to), replace);
}

Result<void> MacOSNamesFilesystem::symlink(std::string_view target, std::string_view path)
{
    return m_inner->symlink(target, from_macos_name(path));
}

Result<StatVfs> MacOSNamesFilesystem::statfs()
{
    return m_inner->statfs();
}

}
