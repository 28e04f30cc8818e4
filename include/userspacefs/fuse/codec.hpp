/**********************************************************************
File name: codec.hpp
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
#ifndef USERSPACEFS_FUSE_CODEC_H
#define USERSPACEFS_FUSE_CODEC_H

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "userspacefs/registry.hpp"
#include "userspacefs/request.hpp"

struct fuse_in_header;

namespace Userspacefs::Fuse {

struct CodecOptions {
    double attr_timeout = 1.0;
    double entry_timeout = 1.0;
    uint32_t max_write = 128 * 1024;
    uint16_t max_background = 12;
};

/**
 * Decoder and encoder for the /dev/fuse wire protocol.
 */
class Codec {
public:
    /* oldest protocol minor we can talk to */
    static constexpr uint32_t MIN_MINOR = 12;

public:
    Codec(Registry &registry, const CodecOptions &options);
    Codec(const Codec &src) = delete;
    Codec &operator=(const Codec &src) = delete;

private:
    Registry &m_registry;
    const CodecOptions m_options;
    std::atomic<bool> m_initialized;
    std::atomic<uint32_t> m_minor;

    Result<std::vector<Decoded>> decode_init(const fuse_in_header &header,
                                             std::string_view args);
    Result<Request> decode_request(const fuse_in_header &header,
                                   std::string_view args);
    Result<void> pin(Request &req, Ino ino);

    std::string encode_payload(const Request &req, const Payload &payload);

public:
    Result<std::vector<Decoded>> decode(std::string_view frame);
    std::optional<std::string> reject(std::string_view frame, Errc err);
    std::optional<std::string> encode(const Request &req, const Response &response);
    std::optional<std::string> encode_cancelled(const Request &req);
    void teardown();

    [[nodiscard]] static int native_error(Errc err);

    [[nodiscard]] inline bool initialized() const {
        return m_initialized;
    }

    [[nodiscard]] inline uint32_t minor() const {
        return m_minor;
    }

};

}

#endif
