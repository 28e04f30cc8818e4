/**********************************************************************
File name: channel.cpp
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
#include "userspacefs/fuse/channel.hpp"

#define FUSE_USE_VERSION 31
#include <fuse_lowlevel.h>

#include <algorithm>
#include <cerrno>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "userspacefs/error_map.hpp"
#include "userspacefs/logging.hpp"

namespace Userspacefs::Fuse {

static constexpr size_t HEADER_ROOM = 4096;
static constexpr size_t MIN_READ_BUFFER = 8192;

static ErrorResultHelper os_error()
{
    return make_result(FAILED, from_errno(errno));
}

Channel::Channel(const std::vector<std::string> &mount_options, bool debug, size_t max_write):
    m_session(nullptr),
    m_buffer(std::max<size_t>(MIN_READ_BUFFER, max_write + HEADER_ROOM)),
    m_wake_fds{-1, -1},
    m_mounted(false),
    m_signal_handlers(false),
    m_shutdown(false)
{
    // construct an argv array to make fuse pick up the options
    std::vector<std::string> shadow_argv;
    shadow_argv.emplace_back("userspacefs");
    if (debug) {
        shadow_argv.emplace_back("-d");
    }
    for (const auto &option: mount_options) {
        shadow_argv.emplace_back("-o");
        shadow_argv.emplace_back(option);
    }

    std::vector<char*> argv;
    argv.reserve(shadow_argv.size());
    for (auto &s: shadow_argv) {
        argv.push_back(s.data());
    }
    struct fuse_args args{static_cast<int>(argv.size()), argv.data(), 0};

    // requests never go through the libfuse loop, so no operations are set
    struct fuse_lowlevel_ops ops{};
    m_session = fuse_session_new(&args, &ops, sizeof(ops), nullptr);
    fuse_opt_free_args(&args);
    if (!m_session) {
        throw std::runtime_error("failed to set up FUSE session");
    }

    if (::pipe2(m_wake_fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        fuse_session_destroy(m_session);
        throw std::runtime_error("failed to create wake-up pipe");
    }
}

Channel::~Channel()
{
    if (m_signal_handlers) {
        fuse_remove_signal_handlers(m_session);
    }
    unmount();
    fuse_session_destroy(m_session);
    ::close(m_wake_fds[0]);
    ::close(m_wake_fds[1]);
}

Result<void> Channel::set_signal_handlers()
{
    if (fuse_set_signal_handlers(m_session) != 0) {
        return make_result(FAILED, Errc::IO_ERROR);
    }
    m_signal_handlers = true;
    return make_result();
}

Result<void> Channel::mount(const std::string &mountpoint)
{
    if (fuse_session_mount(m_session, mountpoint.c_str()) != 0) {
        return make_result(FAILED, Errc::IO_ERROR);
    }
    m_mounted = true;
    logger().info("mounted at {}", mountpoint);
    return make_result();
}

void Channel::unmount()
{
    if (m_mounted) {
        fuse_session_unmount(m_session);
        m_mounted = false;
    }
}

Result<std::optional<std::string>> Channel::receive()
{
    const int fd = fuse_session_fd(m_session);
    while (true) {
        if (m_shutdown || fuse_session_exited(m_session)) {
            return std::optional<std::string>();
        }

        struct pollfd fds[2] = {
            {fd, POLLIN, 0},
            {m_wake_fds[0], POLLIN, 0},
        };
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            return os_error();
        }
        if (fds[1].revents != 0) {
            continue;
        }

        const ssize_t count = ::read(fd, m_buffer.data(), m_buffer.size());
        if (count < 0) {
            switch (errno) {
            case ENOENT:
                // the request was interrupted before we got to read it
            case EINTR:
            case EAGAIN:
                continue;
            case ENODEV:
                return std::optional<std::string>();
            default:
                return os_error();
            }
        }
        if (count == 0) {
            return std::optional<std::string>();
        }
        return std::optional<std::string>(std::in_place, m_buffer.data(),
                                          static_cast<size_t>(count));
    }
}

Result<void> Channel::send(std::string_view frame)
{
    const int fd = fuse_session_fd(m_session);
    while (true) {
        const ssize_t count = ::write(fd, frame.data(), frame.size());
        if (count >= 0) {
            return make_result();
        }
        switch (errno) {
        case EINTR:
            continue;
        case ENOENT:
            // the kernel no longer waits for this reply
            return make_result();
        default:
            return os_error();
        }
    }
}

void Channel::shutdown()
{
    m_shutdown = true;
    fuse_session_exit(m_session);
    const char byte = 0;
    if (::write(m_wake_fds[1], &byte, 1) < 0 && errno != EAGAIN) {
        logger().warn("failed to wake up the receive loop");
    }
}

}
