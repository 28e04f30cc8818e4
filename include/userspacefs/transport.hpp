/**********************************************************************
File name: transport.hpp
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
#ifndef USERSPACEFS_TRANSPORT_H
#define USERSPACEFS_TRANSPORT_H

#include <optional>
#include <string>
#include <string_view>

#include "userspacefs/error.hpp"

namespace Userspacefs {

/**
 * Connection to the host carrying whole request and reply frames.
 */
class Transport {
public:
    virtual ~Transport();

public:
    /**
     * Block until the next frame arrives. An empty optional means that the
     * host closed the connection.
     */
    virtual Result<std::optional<std::string>> receive() = 0;

    /**
     * Send one frame. May be called from several threads at once.
     */
    virtual Result<void> send(std::string_view frame) = 0;

    /**
     * Make a blocked receive() return. Safe to call from any thread.
     */
    virtual void shutdown() = 0;

};

}

#endif
