/**********************************************************************
File name: request.hpp
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
#ifndef USERSPACEFS_REQUEST_H
#define USERSPACEFS_REQUEST_H

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "userspacefs/backend.hpp"
#include "userspacefs/error.hpp"
#include "userspacefs/registry.hpp"

namespace Userspacefs {

using ChannelId = uint64_t;

enum class Opcode {
    LOOKUP,
    FORGET,
    BATCH_FORGET,
    GETATTR,
    SETATTR,
    READLINK,
    MKNOD,
    MKDIR,
    UNLINK,
    RMDIR,
    SYMLINK,
    RENAME,
    OPEN,
    CREATE,
    READ,
    WRITE,
    FLUSH,
    RELEASE,
    FSYNC,
    OPENDIR,
    READDIR,
    RELEASEDIR,
    FSYNCDIR,
    STATFS,
    OPEN_PATH,
};

const char *opcode_name(Opcode op);

std::ostream &operator<<(std::ostream &stream, Opcode op);

/**
 * Flags qualifying a request beyond its opcode.
 */
enum RequestFlag: uint32_t {
    /* RELEASE: unlink the object after closing it */
    RELEASE_UNLINK = 1 << 0,
    /* RELEASE: reply with the attributes observed before closing */
    RELEASE_STAT = 1 << 1,
    /* WRITE: ignore the offset and write at the end of the file */
    WRITE_APPEND = 1 << 2,
    /* READDIR: fill in complete attributes for each entry */
    READDIR_ATTRS = 1 << 3,
    /* READDIR: match the pattern ignoring ASCII case */
    READDIR_CASELESS = 1 << 4,
    /* OPEN_PATH: the object must be a directory */
    OPEN_DIRECTORY = 1 << 5,
    /* OPEN_PATH: the object must not be a directory */
    OPEN_NON_DIRECTORY = 1 << 6,
    FSYNC_DATASYNC = 1 << 7,
    /* READDIR: ignore the offset and continue after the last entry delivered */
    READDIR_RESUME = 1 << 8,
};

/**
 * Rename flags, numerically equal to the renameat2() ones.
 */
enum RenameFlag: uint32_t {
    RENAME_FLAG_NOREPLACE = 1 << 0,
    RENAME_FLAG_EXCHANGE = 1 << 1,
    RENAME_FLAG_WHITEOUT = 1 << 2,
};

enum class Disposition {
    SUPERSEDE,
    OPEN,
    CREATE,
    OPEN_IF,
    OVERWRITE,
    OVERWRITE_IF,
};

enum class OpenAction {
    SUPERSEDED,
    OPENED,
    CREATED,
    OVERWRITTEN,
};

/**
 * One decoded operation.
 *
 * Which fields are meaningful depends on op; unused fields keep their
 * defaults. The pins keep every identity the request refers to alive until
 * the request is destroyed.
 */
struct Request {
    Request() = default;
    Request(const Request &src) = delete;
    Request(Request &&src) = default;
    Request &operator=(const Request &src) = delete;
    Request &operator=(Request &&src) = default;

    ChannelId channel = 0;
    uint64_t unique = 0;
    Opcode op = Opcode::GETATTR;

    /* target identity, or the parent for name-addressed operations */
    Ino ino = 0;
    /* entry name; the match pattern for READDIR */
    std::string name;
    Ino newparent = 0;
    std::string newname;
    /* OPEN_PATH: path components of the object; RENAME: of the destination */
    std::optional<std::vector<std::string>> path;

    /* open handle or directory cursor; 0 if none */
    Fh fh = 0;
    /* WRITE: payload; SYMLINK: link target */
    std::string data;
    uint64_t offset = 0;
    uint32_t size = 0;
    uint32_t max_entries = 0;
    /* open(2) flags, or RenameFlag bits for RENAME */
    uint32_t flags = 0;
    uint32_t request_flags = 0;
    uint32_t mode = 0;
    Disposition disposition = Disposition::OPEN;
    Backend::SetAttr attr{};

    /* FORGET / BATCH_FORGET */
    std::vector<std::pair<Ino, uint64_t>> forgets;

    std::vector<Registry::Pin> pins;

    [[nodiscard]] inline bool has(RequestFlag flag) const {
        return (request_flags & flag) != 0;
    }
};

struct EmptyReply {
};

struct EntryReply {
    Ino ino;
    Backend::Stat attr;
};

struct AttrReply {
    Backend::Stat attr;
};

struct OpenReply {
    Fh fh;
    EntryReply entry;
    bool directory;
    OpenAction action;
};

struct DataReply {
    std::string data;
};

struct WriteReply {
    uint32_t count;
};

struct DirItem {
    std::string name;
    uint64_t offset;
    /* backend inode number, for the host's d_ino */
    uint64_t ino;
    Backend::Stat attr;
};

struct DirReply {
    std::vector<DirItem> entries;
    bool eof;
};

struct StatfsReply {
    Backend::StatVfs st;
};

using Payload = std::variant<
    EmptyReply,
    EntryReply,
    AttrReply,
    OpenReply,
    DataReply,
    WriteReply,
    DirReply,
    StatfsReply>;

using Response = Result<Payload>;

/**
 * One unit of work a codec extracted from a frame.
 */
struct Decoded {
    enum Kind {
        /* hand request to the dispatcher */
        DISPATCH,
        /* cancel request (channel, target); send frame if it is unknown */
        CANCEL,
        /* send frame, which the codec answered on its own */
        REPLY,
        /* the host ended the session; frame is sent first if set */
        SHUTDOWN,
    };

    Kind kind = DISPATCH;
    Request request;
    uint64_t target = 0;
    std::optional<std::string> frame;
};

}

#endif
