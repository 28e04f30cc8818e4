/**********************************************************************
File name: server.cpp
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
#include "userspacefs/smb/server.hpp"

#include <cerrno>
#include <cstring>
#include <functional>
#include <random>
#include <stdexcept>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "userspacefs/dispatcher.hpp"
#include "userspacefs/error_map.hpp"
#include "userspacefs/logging.hpp"
#include "userspacefs/session.hpp"

namespace Userspacefs::Smb {

static constexpr uint8_t SESSION_MESSAGE = 0x00;
static constexpr uint8_t SESSION_REQUEST = 0x81;
static constexpr uint8_t POSITIVE_SESSION_RESPONSE = 0x82;
static constexpr uint8_t SESSION_KEEP_ALIVE = 0x85;
static constexpr size_t MAX_FRAME = 0xFFFFFF;
static constexpr int LISTEN_BACKLOG = 16;
static constexpr int RANDOM_PORT_ATTEMPTS = 64;

static ErrorResultHelper os_error()
{
    return make_result(FAILED, from_errno(errno));
}

Connection::Connection(int fd):
    m_fd(fd),
    m_closed(false)
{

}

Connection::~Connection()
{
    ::close(m_fd);
}

Result<bool> Connection::read_exact(char *buf, size_t count)
{
    size_t done = 0;
    while (done < count) {
        const ssize_t got = ::recv(m_fd, buf + done, count - done, 0);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (m_closed) {
                return false;
            }
            return os_error();
        }
        if (got == 0) {
            if (done == 0) {
                return false;
            }
            // connection dropped in the middle of a message
            return make_result(FAILED, Errc::IO_ERROR);
        }
        done += static_cast<size_t>(got);
    }
    return true;
}

Result<void> Connection::write_all(std::string_view data)
{
    while (!data.empty()) {
        const ssize_t sent = ::send(m_fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return os_error();
        }
        data.remove_prefix(static_cast<size_t>(sent));
    }
    return make_result();
}

Result<std::optional<std::string>> Connection::receive()
{
    while (true) {
        if (m_closed) {
            return std::optional<std::string>();
        }

        char header[4];
        auto got = read_exact(header, sizeof(header));
        if (!got) {
            return copy_error(got);
        }
        if (!*got) {
            return std::optional<std::string>();
        }

        const uint8_t type = static_cast<uint8_t>(header[0]);
        const size_t length = (size_t(static_cast<uint8_t>(header[1])) << 16) |
                (size_t(static_cast<uint8_t>(header[2])) << 8) |
                size_t(static_cast<uint8_t>(header[3]));

        std::string frame(length, '\0');
        if (length > 0) {
            auto body = read_exact(frame.data(), length);
            if (!body) {
                return copy_error(body);
            }
            if (!*body) {
                return make_result(FAILED, Errc::IO_ERROR);
            }
        }

        switch (type) {
        case SESSION_MESSAGE:
            return std::optional<std::string>(std::move(frame));
        case SESSION_KEEP_ALIVE:
            continue;
        case SESSION_REQUEST:
        {
            // clients on the NetBIOS port ask for a session first; the called
            // name does not matter
            static const std::string positive{static_cast<char>(POSITIVE_SESSION_RESPONSE),
                                              0, 0, 0};
            std::lock_guard lock(m_send_mutex);
            auto sent = write_all(positive);
            if (!sent) {
                return copy_error(sent);
            }
            continue;
        }
        default:
            logger().warn("unexpected session packet type {:#x}", type);
            return make_result(FAILED, Errc::MALFORMED_REQUEST);
        }
    }
}

Result<void> Connection::send(std::string_view frame)
{
    if (frame.size() > MAX_FRAME) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }

    char header[4] = {
        static_cast<char>(SESSION_MESSAGE),
        static_cast<char>((frame.size() >> 16) & 0xff),
        static_cast<char>((frame.size() >> 8) & 0xff),
        static_cast<char>(frame.size() & 0xff),
    };

    std::lock_guard lock(m_send_mutex);
    auto result = write_all(std::string_view(header, sizeof(header)));
    if (!result) {
        return result;
    }
    return write_all(frame);
}

void Connection::shutdown()
{
    m_closed = true;
    // wakes up a blocked recv()
    ::shutdown(m_fd, SHUT_RDWR);
}

Server::Server(Backend::Filesystem &fs, const ServerOptions &options):
    m_fs(fs),
    m_options(options),
    m_listen_fd(-1),
    m_wake_fds{-1, -1},
    m_port(0),
    m_next_channel(1)
{
    if (::pipe2(m_wake_fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::runtime_error("failed to create wake-up pipe");
    }
}

Server::~Server()
{
    shutdown();
    for (auto &[channel, thread]: m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    if (m_listen_fd >= 0) {
        ::close(m_listen_fd);
    }
    ::close(m_wake_fds[0]);
    ::close(m_wake_fds[1]);
}

int Server::try_bind(uint32_t address, uint16_t port, bool reuse)
{
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return errno;
    }

    if (reuse) {
        const int one = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0) {
            const int err = errno;
            ::close(fd);
            return err;
        }
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = address;
    addr.sin_port = htons(port);
    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd, LISTEN_BACKLOG) != 0) {
        const int err = errno;
        ::close(fd);
        return err;
    }

    m_listen_fd = fd;
    m_port = port;
    return 0;
}

Result<void> Server::bind(const std::string &host, uint16_t port)
{
    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *found = nullptr;
    const int resolved = ::getaddrinfo(host.c_str(), nullptr, &hints, &found);
    if (resolved != 0 || !found) {
        logger().error("cannot resolve listen address {}: {}", host, gai_strerror(resolved));
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    const uint32_t address =
            reinterpret_cast<struct sockaddr_in*>(found->ai_addr)->sin_addr.s_addr;
    ::freeaddrinfo(found);

    char text[INET_ADDRSTRLEN];
    ::inet_ntop(AF_INET, &address, text, sizeof(text));
    m_host = text;

    if (port != 0) {
        const int err = try_bind(address, port, true);
        if (err != 0) {
            logger().error("cannot listen on {}:{}: {}", m_host, port, std::strerror(err));
            return make_result(FAILED, from_errno(err));
        }
        return make_result();
    }

    std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> pick(RANDOM_PORT_MIN, RANDOM_PORT_MAX);
    for (int attempt = 0; attempt < RANDOM_PORT_ATTEMPTS; ++attempt) {
        const uint16_t candidate = static_cast<uint16_t>(pick(rng));
        const int err = try_bind(address, candidate, false);
        if (err == 0) {
            return make_result();
        }
        if (err != EADDRINUSE) {
            logger().error("cannot listen on {}:{}: {}", m_host, candidate, std::strerror(err));
            return make_result(FAILED, from_errno(err));
        }
    }
    logger().error("no free port found on {}", m_host);
    return make_result(FAILED, Errc::WOULD_BLOCK);
}

std::string Server::address() const
{
    return "cifs://guest:@" + m_host + ":" + std::to_string(m_port) + "/" +
            m_options.codec.share_name;
}

void Server::serve_connection(WorkerPool &pool, std::shared_ptr<Connection> connection,
                              ChannelId channel)
{
    try {
        Registry registry(m_fs, m_options.max_handles);
        Dispatcher dispatcher(m_fs, registry, pool);
        Codec codec(registry, m_options.codec);
        Session<Codec> session(*connection, codec, dispatcher, channel);
        auto result = session.run();
        if (!result) {
            logger().warn("SMB2 connection {} ended with {}", channel, errc_name(result.error()));
        }
    } catch (const std::exception &exc) {
        logger().error("SMB2 connection {} failed: {}", channel, exc.what());
    }

    std::lock_guard lock(m_mutex);
    m_connections.erase(channel);
    m_finished.push_back(channel);
}

void Server::reap_finished()
{
    std::vector<std::thread> done;
    {
        std::lock_guard lock(m_mutex);
        for (ChannelId channel: m_finished) {
            auto iter = m_threads.find(channel);
            if (iter != m_threads.end()) {
                done.emplace_back(std::move(iter->second));
                m_threads.erase(iter);
            }
        }
        m_finished.clear();
    }
    for (auto &thread: done) {
        thread.join();
    }
}

Result<void> Server::serve(WorkerPool &pool)
{
    if (m_listen_fd < 0) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    logger().info("serving SMB2 on {}", address());

    Result<void> result = make_result();
    while (true) {
        reap_finished();

        struct pollfd fds[2] = {
            {m_listen_fd, POLLIN, 0},
            {m_wake_fds[0], POLLIN, 0},
        };
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            result = os_error();
            break;
        }
        if (fds[1].revents != 0) {
            break;
        }

        const int fd = ::accept4(m_listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED || errno == EAGAIN) {
                continue;
            }
            result = os_error();
            logger().error("accept failed: {}", errc_name(result.error()));
            break;
        }
        const int one = 1;
        if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
            logger().debug("could not disable Nagle on new connection");
        }

        auto connection = std::make_shared<Connection>(fd);
        std::lock_guard lock(m_mutex);
        const ChannelId channel = m_next_channel++;
        logger().info("accepted SMB2 connection {}", channel);
        m_connections.emplace(channel, connection);
        m_threads.emplace(channel, std::thread(&Server::serve_connection, this,
                                               std::ref(pool), connection, channel));
    }

    {
        std::lock_guard lock(m_mutex);
        for (auto &[channel, connection]: m_connections) {
            connection->shutdown();
        }
    }
    std::map<ChannelId, std::thread> threads;
    {
        std::lock_guard lock(m_mutex);
        threads.swap(m_threads);
        m_finished.clear();
    }
    for (auto &[channel, thread]: threads) {
        thread.join();
    }
    return result;
}

void Server::shutdown()
{
    const char byte = 0;
    if (::write(m_wake_fds[1], &byte, 1) < 0 && errno != EAGAIN) {
        logger().warn("failed to wake up the accept loop");
    }
}

}
