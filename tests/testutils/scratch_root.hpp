/**********************************************************************
File name: scratch_root.hpp
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
#ifndef USERSPACEFS_TESTS_UTILS_SCRATCH_ROOT_H
#define USERSPACEFS_TESTS_UTILS_SCRATCH_ROOT_H

#include <filesystem>
#include <string>

/**
 * A private host directory to serve a local backend from, removed with
 * everything below it on destruction.
 *
 * It is created below $USERSPACEFS_TEST_TMP_DIR, $TMPDIR or /tmp, in that
 * order.
 */
class ScratchRoot {
public:
    ScratchRoot();
    ScratchRoot(const ScratchRoot &src) = delete;
    ScratchRoot &operator=(const ScratchRoot &src) = delete;
    ~ScratchRoot();

private:
    std::filesystem::path m_path;

public:
    [[nodiscard]] const std::filesystem::path &path() const {
        return m_path;
    }

    /**
     * Store @a contents in the host file at the backend path @a name,
     * creating missing parent directories.
     */
    void write_file(const std::string &name, const std::string &contents) const;
    [[nodiscard]] std::string read_file(const std::string &name) const;

};

#endif
