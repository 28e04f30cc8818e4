/**********************************************************************
File name: config.hpp
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
#ifndef USERSPACEFS_CONFIG_H
#define USERSPACEFS_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "userspacefs/error.hpp"
#include "userspacefs/fuse/codec.hpp"
#include "userspacefs/smb/server.hpp"

namespace Userspacefs {

struct Config {
    Config();

    size_t threads;
    size_t max_handles;
    double attr_timeout;
    double entry_timeout;
    uint32_t max_write;
    uint16_t max_background;
    bool macos_names;
    /* file system name of the FUSE mount and name of the SMB share */
    std::string display_name;
    /* -o options not recognized here, passed on to the FUSE mount */
    std::vector<std::string> mount_options;

    [[nodiscard]] std::vector<std::string> fuse_mount_options() const;
    [[nodiscard]] Fuse::CodecOptions fuse_codec_options() const;
    [[nodiscard]] Smb::ServerOptions smb_options() const;
};

using OptionMap = std::map<std::string, std::optional<std::string>>;

/**
 * Parse comma-separated key[=value] lists as given with -o. A later
 * occurrence of a key replaces an earlier one.
 */
Result<OptionMap> parse_options(const std::vector<std::string> &lists);

/**
 * Apply the keys the core understands to @a config and collect all others in
 * Config::mount_options. Fails with Errc::INVALID_ARGUMENT on a malformed or
 * out of range value.
 */
Result<void> apply_options(Config &config, const OptionMap &options);

}

#endif
