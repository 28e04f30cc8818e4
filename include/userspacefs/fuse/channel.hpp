/**********************************************************************
File name: channel.hpp
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
#ifndef USERSPACEFS_FUSE_CHANNEL_H
#define USERSPACEFS_FUSE_CHANNEL_H

#include <atomic>
#include <string>
#include <vector>

#include "userspacefs/transport.hpp"

struct fuse_session;

namespace Userspacefs::Fuse {

/**
 * Kernel device channel of a FUSE mount.
 *
 * libfuse only sets up and tears down the mount; frames are read from and
 * written to the device descriptor directly.
 */
class Channel: public Transport {
public:
    /**
     * @param mount_options Passed to the mount as -o options.
     * @param max_write Largest WRITE payload that will be negotiated.
     */
    Channel(const std::vector<std::string> &mount_options, bool debug, size_t max_write);
    Channel(const Channel &src) = delete;
    Channel &operator=(const Channel &src) = delete;
    ~Channel() override;

private:
    struct fuse_session *m_session;
    std::vector<char> m_buffer;
    int m_wake_fds[2];
    bool m_mounted;
    bool m_signal_handlers;
    std::atomic<bool> m_shutdown;

public:
    /**
     * Install handlers making SIGINT, SIGTERM and SIGHUP end the session.
     */
    Result<void> set_signal_handlers();
    Result<void> mount(const std::string &mountpoint);
    void unmount();

    Result<std::optional<std::string>> receive() override;
    Result<void> send(std::string_view frame) override;
    void shutdown() override;

};

}

#endif
