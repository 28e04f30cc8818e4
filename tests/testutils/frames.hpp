/**********************************************************************
File name: frames.hpp
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
#ifndef USERSPACEFS_TESTS_TESTUTILS_FRAMES_H
#define USERSPACEFS_TESTS_TESTUTILS_FRAMES_H

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <linux/fuse.h>

#include "userspacefs/smb/wire.hpp"

/* FUSE */

template <typename T>
std::string fuse_struct(const T &value)
{
    return std::string(reinterpret_cast<const char*>(&value), sizeof(T));
}

/**
 * NUL-terminated name as it follows the fixed arguments.
 */
std::string fuse_name(std::string_view name);

std::string fuse_request(uint32_t opcode, uint64_t unique, uint64_t nodeid,
                         std::string_view args = std::string_view());

std::string fuse_init(uint64_t unique,
                      uint32_t major = FUSE_KERNEL_VERSION,
                      uint32_t minor = FUSE_KERNEL_MINOR_VERSION,
                      uint32_t flags = 0);

struct FuseReply {
    fuse_out_header header;
    std::string payload;
};

FuseReply parse_fuse_reply(std::string_view frame);

template <typename T>
T fuse_payload(const FuseReply &reply)
{
    T result;
    std::memset(&result, 0, sizeof(T));
    std::memcpy(&result, reply.payload.data(), std::min(sizeof(T), reply.payload.size()));
    return result;
}

struct FuseDirent {
    std::string name;
    uint64_t ino;
    uint64_t off;
    uint32_t type;
};

std::vector<FuseDirent> parse_fuse_dirents(std::string_view payload);

/* SMB2 */

/**
 * Builds request messages of one client connection, numbering them and
 * filling in the session and tree ids from previous replies.
 */
class SmbClient {
public:
    SmbClient() = default;

public:
    uint64_t session_id = 0;
    uint32_t tree_id = 0;
    uint64_t next_message_id = 0;
    uint16_t credits = 1;

private:
    std::string message(uint16_t command, const Userspacefs::Smb::Writer &body,
                        uint32_t flags = 0);

public:
    [[nodiscard]] uint64_t last_message_id() const {
        return next_message_id - 1;
    }

    std::string negotiate(const std::vector<uint16_t> &dialects);
    std::string session_setup();
    std::string logoff();
    std::string tree_connect(std::string_view path);
    std::string tree_disconnect();
    std::string create(std::string_view name, uint32_t disposition, uint32_t access,
                       uint32_t options = 0, uint32_t attributes = 0);
    std::string close(uint64_t file_id, uint16_t flags = 0);
    std::string flush(uint64_t file_id);
    std::string read(uint64_t file_id, uint32_t length, uint64_t offset);
    std::string write(uint64_t file_id, uint64_t offset, std::string_view data);
    std::string query_directory(uint64_t file_id, uint8_t cls, std::string_view pattern,
                                uint8_t flags = 0, uint32_t output_length = 65536);
    std::string query_info(uint64_t file_id, uint8_t type, uint8_t cls,
                           uint32_t output_length = 4096);
    std::string set_info(uint64_t file_id, uint8_t type, uint8_t cls, std::string_view buffer);
    std::string echo();
    std::string cancel(uint64_t message_id);
    std::string lock(uint64_t file_id);

    /**
     * Chain @a messages into one compound frame.
     */
    static std::string compound(std::vector<std::string> messages, bool related = false);

    /**
     * SMB1 NEGOTIATE offering the given dialect strings.
     */
    static std::string smb1_negotiate(const std::vector<std::string> &dialects);

    /**
     * Take over the session or tree id a reply granted.
     */
    void adopt(std::string_view reply);

};

struct SmbReply {
    Userspacefs::Smb::Header header;
    /* the whole message */
    std::string message;

    [[nodiscard]] uint32_t status() const {
        return header.status;
    }

    uint16_t body_u16(size_t offset) const;
    uint32_t body_u32(size_t offset) const;
    uint64_t body_u64(size_t offset) const;
};

SmbReply parse_smb_reply(std::string_view frame);

/**
 * Split a compound response into its messages.
 */
std::vector<SmbReply> parse_smb_replies(std::string_view frame);

uint64_t smb_create_file_id(const SmbReply &reply);
uint32_t smb_create_action(const SmbReply &reply);
std::string smb_read_data(const SmbReply &reply);
uint32_t smb_write_count(const SmbReply &reply);

/**
 * Output buffer of QUERY_INFO and QUERY_DIRECTORY responses.
 */
std::string smb_info_buffer(const SmbReply &reply);

std::vector<std::string> smb_directory_names(const SmbReply &reply, uint8_t cls);

std::string utf16(std::string_view text);

#endif
