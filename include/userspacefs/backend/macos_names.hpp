/**********************************************************************
File name: macos_names.hpp
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
#ifndef USERSPACEFS_BACKEND_MACOS_NAMES_H
#define USERSPACEFS_BACKEND_MACOS_NAMES_H

#include <memory>

#include "userspacefs/backend.hpp"

namespace Userspacefs::Backend {

/**
 * Undo the private-use code points the macOS SMB client substitutes for
 * characters Windows does not allow in names.
 *
 * U+F001..U+F01F become 0x01..0x1F and U+F020..U+F027 become the characters
 * `" * / < > ? \ |`, except U+F022 which stays as is because '/' separates
 * path components.
 */
std::string from_macos_name(std::string_view name);

/**
 * Decorator applying from_macos_name() to every path handed to the wrapped
 * file system.
 */
class MacOSNamesFilesystem: public Filesystem {
public:
    explicit MacOSNamesFilesystem(std::unique_ptr<Filesystem> &&inner);

private:
    std::unique_ptr<Filesystem> m_inner;

public:
    [[nodiscard]] Filesystem &inner() {
        return *m_inner;
    }

    // Filesystem interface
public:
    [[nodiscard]] Result<std::unique_ptr<File>> open(std::string_view path, int flags, mode_t mode) override;
    [[nodiscard]] Result<std::unique_ptr<Dir>> opendir(std::string_view path) override;
    [[nodiscard]] Result<Stat> lstat(std::string_view path) override;
    [[nodiscard]] Result<void> setattr(std::string_view path, const SetAttr &attr) override;
    [[nodiscard]] Result<std::string> readlink(std::string_view path) override;
    [[nodiscard]] Result<void> mkdir(std::string_view path, mode_t mode) override;
    [[nodiscard]] Result<void> rmdir(std::string_view path) override;
    [[nodiscard]] Result<void> unlink(std::string_view path) override;
    [[nodiscard]] Result<void> rename(std::string_view from, std::string_view to, bool replace) override;
    [[nodiscard]] Result<void> symlink(std::string_view target, std::string_view path) override;
    [[nodiscard]] Result<StatVfs> statfs() override;
};

}

#endif
