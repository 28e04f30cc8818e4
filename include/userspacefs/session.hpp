/**********************************************************************
File name: session.hpp
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
#ifndef USERSPACEFS_SESSION_H
#define USERSPACEFS_SESSION_H

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

#include "userspacefs/dispatcher.hpp"
#include "userspacefs/logging.hpp"
#include "userspacefs/transport.hpp"

namespace Userspacefs {

/**
 * Binds a transport and its codec to the dispatcher.
 *
 * The codec must provide:
 *
 *     Result<std::vector<Decoded>> decode(std::string_view frame);
 *     std::optional<std::string> reject(std::string_view frame, Errc err);
 *     std::optional<std::string> encode(const Request &req, const Response &response);
 *     std::optional<std::string> encode_cancelled(const Request &req);
 *     void teardown();
 *
 * encode() and encode_cancelled() are called from worker threads.
 */
template <typename Codec>
class Session: private Responder {
public:
    Session(Transport &transport, Codec &codec, Dispatcher &dispatcher, ChannelId channel):
        m_transport(transport),
        m_codec(codec),
        m_dispatcher(dispatcher),
        m_channel(channel),
        m_failed(false)
    {

    }

    Session(const Session &src) = delete;
    Session &operator=(const Session &src) = delete;

private:
    Transport &m_transport;
    Codec &m_codec;
    Dispatcher &m_dispatcher;
    const ChannelId m_channel;

    std::mutex m_send_mutex;
    std::atomic<bool> m_failed;

private:
    void send(std::optional<std::string> &&frame) {
        if (!frame || m_failed) {
            return;
        }

        Result<void> result = make_result();
        {
            std::lock_guard lock(m_send_mutex);
            result = m_transport.send(*frame);
        }
        if (!result && !m_failed.exchange(true)) {
            logger().error("sending to host failed on channel {}: {}",
                           m_channel, errc_name(result.error()));
            m_transport.shutdown();
        }
    }

    void respond(const Request &req, const Response &response) override {
        send(m_codec.encode(req, response));
    }

    void cancelled(const Request &req) override {
        send(m_codec.encode_cancelled(req));
    }

    bool handle(Decoded &item) {
        switch (item.kind) {
        case Decoded::DISPATCH:
        {
            item.request.channel = m_channel;
            auto submitted = m_dispatcher.submit(std::move(item.request), *this);
            if (!submitted) {
                send(m_codec.encode(item.request, copy_error(submitted)));
            }
            return true;
        }
        case Decoded::CANCEL:
        {
            auto outcome = m_dispatcher.cancel(m_channel, item.target);
            logger().debug("cancel of unique={} on channel {}: {}", item.target, m_channel,
                           static_cast<int>(outcome));
            if (outcome == Dispatcher::CancelResult::NOT_FOUND) {
                send(std::move(item.frame));
            }
            return true;
        }
        case Decoded::REPLY:
        {
            send(std::move(item.frame));
            return true;
        }
        case Decoded::SHUTDOWN:
        {
            send(std::move(item.frame));
            return false;
        }
        }
        return true;
    }

public:
    /**
     * Serve the host until it ends the session or the transport fails.
     *
     * Waits for all requests of the session to finish and releases
     * everything the host still held before returning.
     */
    Result<void> run() {
        Result<void> result = make_result();
        bool running = true;
        while (running) {
            auto frame = m_transport.receive();
            if (!frame) {
                if (!m_failed) {
                    logger().error("receiving from host failed on channel {}: {}",
                                   m_channel, errc_name(frame.error()));
                }
                result = copy_error(frame);
                break;
            }
            if (m_failed) {
                result = make_result(FAILED, Errc::IO_ERROR);
                break;
            }
            if (!frame->has_value()) {
                logger().info("host closed channel {}", m_channel);
                break;
            }

            const std::string &data = **frame;
            auto decoded = m_codec.decode(data);
            if (!decoded) {
                logger().warn("rejecting frame of {} bytes on channel {}: {}",
                              data.size(), m_channel, errc_name(decoded.error()));
                send(m_codec.reject(data, decoded.error()));
                continue;
            }

            for (auto &item: *decoded) {
                if (!handle(item)) {
                    running = false;
                }
            }
        }

        if (!result) {
            m_dispatcher.cancel_all(m_channel);
        }
        m_dispatcher.drain(m_channel);
        m_codec.teardown();
        logger().info("session on channel {} ended", m_channel);
        return result;
    }

    [[nodiscard]] inline ChannelId channel() const {
        return m_channel;
    }

};

}

#endif
