/**********************************************************************
File name: logging.hpp
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
#ifndef USERSPACEFS_LOGGING_H
#define USERSPACEFS_LOGGING_H

#include <string>

#include <spdlog/spdlog.h>

namespace Userspacefs {

/**
 * The logger used throughout the library. Until setup_logging() is called
 * it writes warnings and errors to stderr.
 */
spdlog::logger &logger();

/**
 * Configure logger() for the mount tool.
 *
 * In the foreground records go to stderr with timestamps, otherwise to
 * syslog under @a ident. @a verbosity 0, 1 and 2 select warning, info and
 * debug level.
 */
void setup_logging(bool foreground, int verbosity, const std::string &ident);

}

#endif
