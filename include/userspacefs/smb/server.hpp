/**********************************************************************
File name: server.hpp
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
#ifndef USERSPACEFS_SMB_SERVER_H
#define USERSPACEFS_SMB_SERVER_H

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "userspacefs/backend.hpp"
#include "userspacefs/registry.hpp"
#include "userspacefs/request.hpp"
#include "userspacefs/smb/codec.hpp"
#include "userspacefs/transport.hpp"
#include "userspacefs/worker_pool.hpp"

namespace Userspacefs::Smb {

/**
 * One client connection, framed as direct TCP: a zero byte followed by the
 * 24-bit big-endian message length.
 */
class Connection: public Transport {
public:
    explicit Connection(int fd);
    Connection(const Connection &src) = delete;
    Connection &operator=(const Connection &src) = delete;
    ~Connection() override;

private:
    const int m_fd;
    std::mutex m_send_mutex;
    std::atomic<bool> m_closed;

    Result<bool> read_exact(char *buf, size_t count);
    Result<void> write_all(std::string_view data);

public:
    Result<std::optional<std::string>> receive() override;
    Result<void> send(std::string_view frame) override;
    void shutdown() override;

};

struct ServerOptions {
    CodecOptions codec;
    size_t max_handles = Registry::DEFAULT_MAX_OPEN;
};

/**
 * Loopback SMB2 listener exporting one share.
 *
 * Every connection is served on its own thread with its own registry and
 * dispatcher; all of them share the backend and the worker pool.
 *
 * Binding is separate from serving so that the address can be reported
 * before the process detaches and starts its threads.
 */
class Server {
public:
    static constexpr uint16_t RANDOM_PORT_MIN = 60000;
    static constexpr uint16_t RANDOM_PORT_MAX = 65535;

public:
    Server(Backend::Filesystem &fs, const ServerOptions &options);
    Server(const Server &src) = delete;
    Server &operator=(const Server &src) = delete;
    ~Server();

private:
    Backend::Filesystem &m_fs;
    const ServerOptions m_options;

    int m_listen_fd;
    int m_wake_fds[2];
    std::string m_host;
    uint16_t m_port;

    std::mutex m_mutex;
    ChannelId m_next_channel;
    std::map<ChannelId, std::shared_ptr<Connection>> m_connections;
    std::map<ChannelId, std::thread> m_threads;
    std::vector<ChannelId> m_finished;

    /* returns 0 or the errno value */
    int try_bind(uint32_t address, uint16_t port, bool reuse);
    void serve_connection(WorkerPool &pool, std::shared_ptr<Connection> connection,
                          ChannelId channel);
    void reap_finished();

public:
    /**
     * Listen on @a host. A @a port of 0 picks a free port between
     * RANDOM_PORT_MIN and RANDOM_PORT_MAX.
     */
    Result<void> bind(const std::string &host, uint16_t port);

    /**
     * Accept clients and run their requests on @a pool until shutdown() is
     * called. Returns after all connections ended.
     */
    Result<void> serve(WorkerPool &pool);

    /**
     * Stop serve(). Safe to call from any thread.
     */
    void shutdown();

    [[nodiscard]] inline const std::string &host() const {
        return m_host;
    }

    [[nodiscard]] inline uint16_t port() const {
        return m_port;
    }

    /**
     * The address a client mounts, e.g. cifs://guest:@127.0.0.1:60123/name.
     */
    [[nodiscard]] std::string address() const;

};

}

#endif
