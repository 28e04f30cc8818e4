/**********************************************************************
File name: logging.cpp
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
#include "userspacefs/logging.hpp"

#include <syslog.h>

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

namespace Userspacefs {

static const char LOGGER_NAME[] = "userspacefs";

static std::shared_ptr<spdlog::logger> make_default_logger()
{
    auto sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    auto result = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    result->set_level(spdlog::level::warn);
    return result;
}

static std::shared_ptr<spdlog::logger> &logger_ptr()
{
    static std::shared_ptr<spdlog::logger> instance = make_default_logger();
    return instance;
}

spdlog::logger &logger()
{
    return *logger_ptr();
}

void setup_logging(bool foreground, int verbosity, const std::string &ident)
{
    std::shared_ptr<spdlog::logger> result;
    if (foreground) {
        auto sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
        sink->set_pattern("%Y-%m-%d %H:%M:%S.%e:%l:%n:%v");
        result = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    } else {
        auto sink = std::make_shared<spdlog::sinks::syslog_sink_mt>(
                    ident, LOG_PID, LOG_USER, false);
        sink->set_pattern("%l:%n:%v");
        result = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    }

    switch (verbosity) {
    case 0:
        result->set_level(spdlog::level::warn);
        break;
    case 1:
        result->set_level(spdlog::level::info);
        break;
    default:
        result->set_level(spdlog::level::debug);
        break;
    }
    result->flush_on(spdlog::level::warn);

    // loggers are only replaced during start-up, before any thread exists
    logger_ptr() = std::move(result);
}

}
