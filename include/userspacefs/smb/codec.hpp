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
#ifndef USERSPACEFS_SMB_CODEC_H
#define USERSPACEFS_SMB_CODEC_H

#include <array>
#include <cstdint>
#include <ctime>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "userspacefs/registry.hpp"
#include "userspacefs/request.hpp"
#include "userspacefs/smb/wire.hpp"

namespace Userspacefs::Smb {

struct CodecOptions {
    /* name of the one exported share */
    std::string share_name = "userspacefs";
    uint32_t max_io = 128 * 1024;
};

/**
 * Decoder and encoder for SMB 2.0.2 and 2.1 messages of one connection.
 *
 * Negotiation, sessions and tree connects are answered without involving
 * the dispatcher; file operations become requests. Sessions are guest
 * sessions and are never authenticated.
 */
class Codec {
public:
    static constexpr uint16_t MAX_CREDITS = 64;

public:
    Codec(Registry &registry, const CodecOptions &options);
    Codec(const Codec &src) = delete;
    Codec &operator=(const Codec &src) = delete;

private:
    /**
     * What encode() needs to know about a dispatched message.
     */
    struct Pending {
        Header header;
        /* QUERY_DIRECTORY: the open the query was made on */
        uint64_t file_id = 0;
        uint8_t info_type = 0;
        uint8_t info_class = 0;
        uint32_t output_length = 0;
        bool delete_on_close = false;
        bool delete_pending = false;
    };

    /**
     * An open file or directory, keyed by the file id handed to the client.
     */
    struct Open {
        /* registry handle or cursor */
        Fh fh;
        Ino ino;
        bool directory;
        bool delete_pending;
        /* QUERY_DIRECTORY state */
        std::string pattern;
        bool pattern_set = false;
        bool query_started = false;
    };

    Registry &m_registry;
    const CodecOptions m_options;
    std::array<char, 16> m_server_guid;
    struct timespec m_start_time;

    std::mutex m_mutex;
    uint16_t m_dialect;
    uint64_t m_next_session;
    uint32_t m_next_tree;
    uint64_t m_next_file_id;
    std::set<uint64_t> m_sessions;
    std::set<uint32_t> m_trees;
    std::map<uint64_t, Pending> m_pending;
    std::map<Fh, Open> m_opens;

    Result<Decoded> decode_one(const Header &header, std::string_view message);
    Result<std::vector<Decoded>> decode_smb1(std::string_view frame);

    Decoded negotiate_reply(const Header &header, uint16_t dialect);
    Result<Decoded> decode_negotiate(const Header &header, std::string_view message);
    Result<Decoded> decode_session_setup(const Header &header);
    Result<Decoded> decode_tree_connect(const Header &header, std::string_view message);
    Result<Decoded> decode_create(const Header &header, std::string_view message);
    Result<Decoded> decode_close(const Header &header, std::string_view message);
    Result<Decoded> decode_flush(const Header &header, std::string_view message);
    Result<Decoded> decode_read(const Header &header, std::string_view message);
    Result<Decoded> decode_write(const Header &header, std::string_view message);
    Result<Decoded> decode_query_directory(const Header &header, std::string_view message);
    Result<Decoded> decode_query_info(const Header &header, std::string_view message);
    Result<Decoded> decode_set_info(const Header &header, std::string_view message);

    std::optional<uint32_t> check_context(const Header &header, bool needs_tree);
    Result<std::pair<uint64_t, Open>> find_open(Reader &reader);
    Result<void> pin(Request &req, Ino ino);
    Decoded dispatch(const Header &header, Request &&req, Pending &&pending);

    std::string encode_payload(const Pending &pending, const Request &req,
                               const Payload &payload);
    std::string encode_directory(const Pending &pending, const Request &req,
                                 const DirReply &reply);

    uint16_t granted_credits(const Header &header) const;
    std::string reply(const Header &header, uint32_t status, const Writer &body) const;
    std::string error_reply(const Header &header, uint32_t status) const;
    Decoded local_reply(const Header &header, uint32_t status, const Writer &body) const;
    Decoded local_error(const Header &header, uint32_t status) const;

public:
    Result<std::vector<Decoded>> decode(std::string_view frame);
    std::optional<std::string> reject(std::string_view frame, Errc err);
    std::optional<std::string> encode(const Request &req, const Response &response);
    std::optional<std::string> encode_cancelled(const Request &req);
    void teardown();

    [[nodiscard]] static uint32_t native_error(Errc err);

    [[nodiscard]] uint16_t dialect();
    [[nodiscard]] size_t open_files();

};

}

#endif
