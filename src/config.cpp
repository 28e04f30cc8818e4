/**********************************************************************
File name: config.cpp
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
#include "userspacefs/config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <thread>

#include "userspacefs/logging.hpp"

namespace Userspacefs {

static constexpr size_t MIN_THREADS = 2;
static constexpr uint32_t MIN_MAX_WRITE = 4096;
static constexpr uint32_t MAX_MAX_WRITE = 1024 * 1024;

Config::Config():
    threads(std::max<size_t>(MIN_THREADS, std::thread::hardware_concurrency())),
    max_handles(Registry::DEFAULT_MAX_OPEN),
    attr_timeout(1.0),
    entry_timeout(1.0),
    max_write(128 * 1024),
    max_background(12),
    macos_names(false),
    display_name("userspacefs")
{

}

std::vector<std::string> Config::fuse_mount_options() const
{
    std::vector<std::string> result;
    result.emplace_back("default_permissions");
    result.emplace_back("fsname=" + display_name);
    result.insert(result.end(), mount_options.begin(), mount_options.end());
    return result;
}

Fuse::CodecOptions Config::fuse_codec_options() const
{
    Fuse::CodecOptions result;
    result.attr_timeout = attr_timeout;
    result.entry_timeout = entry_timeout;
    result.max_write = max_write;
    result.max_background = max_background;
    return result;
}

Smb::ServerOptions Config::smb_options() const
{
    Smb::ServerOptions result;
    result.codec.share_name = display_name;
    result.codec.max_io = max_write;
    result.max_handles = max_handles;
    return result;
}

Result<OptionMap> parse_options(const std::vector<std::string> &lists)
{
    OptionMap result;
    for (const auto &list: lists) {
        std::string_view rest(list);
        while (true) {
            const size_t comma = rest.find(',');
            const std::string_view item = rest.substr(0, comma);
            if (item.empty()) {
                return make_result(FAILED, Errc::INVALID_ARGUMENT);
            }

            const size_t eq = item.find('=');
            if (eq == 0) {
                return make_result(FAILED, Errc::INVALID_ARGUMENT);
            }
            if (eq == std::string_view::npos) {
                result[std::string(item)] = std::nullopt;
            } else {
                result[std::string(item.substr(0, eq))] = std::string(item.substr(eq + 1));
            }

            if (comma == std::string_view::npos) {
                break;
            }
            rest = rest.substr(comma + 1);
        }
    }
    return result;
}

template <typename T>
static Result<T> parse_unsigned(const std::optional<std::string> &value, T min, T max)
{
    if (!value || value->empty()) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    unsigned long long parsed = 0;
    const char *end = value->data() + value->size();
    auto [ptr, ec] = std::from_chars(value->data(), end, parsed);
    if (ec != std::errc() || ptr != end || parsed < min || parsed > max) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    return static_cast<T>(parsed);
}

static Result<double> parse_seconds(const std::optional<std::string> &value)
{
    if (!value || value->empty()) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    char *end = nullptr;
    const double parsed = std::strtod(value->c_str(), &end);
    if (end != value->c_str() + value->size() || !(parsed >= 0)) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    return parsed;
}

static Result<bool> parse_bool(const std::optional<std::string> &value)
{
    if (!value) {
        // a bare key switches the option on
        return true;
    }
    if (*value == "1" || *value == "true" || *value == "yes") {
        return true;
    }
    if (*value == "0" || *value == "false" || *value == "no") {
        return false;
    }
    return make_result(FAILED, Errc::INVALID_ARGUMENT);
}

Result<void> apply_options(Config &config, const OptionMap &options)
{
    Config result = config;
    result.mount_options.clear();

#define userspacefs_apply(field, expr) { \
        auto parsed = (expr); \
        if (!parsed) { \
            logger().error("invalid value for option {}", key); \
            return copy_error(parsed); \
        } \
        result.field = *parsed; \
    }

    for (const auto &[key, value]: options) {
        if (key == "threads") {
            userspacefs_apply(threads, parse_unsigned<size_t>(value, 1, 1024));
        } else if (key == "max_handles") {
            userspacefs_apply(max_handles, parse_unsigned<size_t>(value, 1, 1 << 24));
        } else if (key == "max_write") {
            userspacefs_apply(max_write, parse_unsigned<uint32_t>(value, MIN_MAX_WRITE,
                                                                  MAX_MAX_WRITE));
        } else if (key == "attr_timeout") {
            userspacefs_apply(attr_timeout, parse_seconds(value));
        } else if (key == "entry_timeout") {
            userspacefs_apply(entry_timeout, parse_seconds(value));
        } else if (key == "macos_names") {
            userspacefs_apply(macos_names, parse_bool(value));
        } else if (value) {
            result.mount_options.push_back(key + "=" + *value);
        } else {
            result.mount_options.push_back(key);
        }
    }

#undef userspacefs_apply

    config = std::move(result);
    return make_result();
}

}
