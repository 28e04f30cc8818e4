/**********************************************************************
File name: backend.cpp
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
#include "userspacefs/backend.hpp"

#include <fcntl.h>

namespace Userspacefs::Backend {

const CancelToken &CancelToken::never()
{
    static const CancelToken token;
    return token;
}

File::~File() = default;

Result<void> File::ftruncate(off_t)
{
    return make_result(FAILED, Errc::NOT_SUPPORTED);
}

Result<void> File::flush()
{
    return make_result(FAILED, Errc::NOT_SUPPORTED);
}

Dir::~Dir() = default;

Result<void> Dir::fsyncdir()
{
    return make_result(FAILED, Errc::NOT_SUPPORTED);
}

Filesystem::~Filesystem() = default;

Result<void> Filesystem::setattr(std::string_view path, const SetAttr &attr)
{
    if (attr.valid != SetAttr::SIZE) {
        return make_result(FAILED, Errc::NOT_SUPPORTED);
    }

    auto file = open(path, O_WRONLY, 0);
    if (!file) {
        return copy_error(file);
    }
    auto truncate_result = (*file)->ftruncate(static_cast<off_t>(attr.size));
    auto close_result = (*file)->close();
    if (!truncate_result) {
        return truncate_result;
    }
    return close_result;
}

Result<std::string> Filesystem::readlink(std::string_view)
{
    return make_result(FAILED, Errc::NOT_SUPPORTED);
}

Result<void> Filesystem::mkdir(std::string_view, mode_t)
{
    return make_result(FAILED, Errc::NOT_SUPPORTED);
}

Result<void> Filesystem::rmdir(std::string_view)
{
    return make_result(FAILED, Errc::NOT_SUPPORTED);
}

Result<void> Filesystem::unlink(std::string_view)
{
    return make_result(FAILED, Errc::NOT_SUPPORTED);
}

Result<void> Filesystem::rename(std::string_view, std::string_view, bool)
{
    return make_result(FAILED, Errc::NOT_SUPPORTED);
}

Result<void> Filesystem::symlink(std::string_view, std::string_view)
{
    return make_result(FAILED, Errc::NOT_SUPPORTED);
}

Result<StatVfs> Filesystem::statfs()
{
    return make_result(FAILED, Errc::NOT_SUPPORTED);
}

std::string join_path(std::string_view parent, std::string_view name)
{
    std::string result(parent);
    if (result.empty() || result.back() != '/') {
        result += '/';
    }
    result += name;
    return result;
}

}
