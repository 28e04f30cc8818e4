/**********************************************************************
File name: codec.cpp
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
#include "userspacefs/fuse/codec.hpp"

#include <cerrno>
#include <cmath>
#include <cstddef>

#include <linux/fuse.h>

#include "userspacefs/error_map.hpp"
#include "userspacefs/fuse/buffer.hpp"
#include "userspacefs/logging.hpp"

namespace Userspacefs::Fuse {

#define userspacefs_fuse_read(var, expr) \
    auto var = (expr); \
    if (!var) { \
        return copy_error(var); \
    }

static constexpr uint32_t PAGE_SIZE_ASSUMED = 4096;

static void split_timeout(double timeout, uint64_t &sec, uint32_t &nsec)
{
    if (timeout <= 0) {
        sec = 0;
        nsec = 0;
        return;
    }
    const double whole = std::floor(timeout);
    sec = static_cast<uint64_t>(whole);
    nsec = static_cast<uint32_t>((timeout - whole) * 1e9);
}

static void fill_attr(fuse_attr &out, const Backend::Stat &attr)
{
    std::memset(&out, 0, sizeof(out));
    out.ino = attr.ino;
    out.size = attr.size;
    out.blocks = (attr.size + 511) / 512;
    out.atime = static_cast<uint64_t>(attr.atime.tv_sec);
    out.mtime = static_cast<uint64_t>(attr.mtime.tv_sec);
    out.ctime = static_cast<uint64_t>(attr.ctime.tv_sec);
    out.atimensec = static_cast<uint32_t>(attr.atime.tv_nsec);
    out.mtimensec = static_cast<uint32_t>(attr.mtime.tv_nsec);
    out.ctimensec = static_cast<uint32_t>(attr.ctime.tv_nsec);
    out.mode = attr.mode;
    out.nlink = attr.nlink;
    out.uid = attr.uid;
    out.gid = attr.gid;
    out.blksize = PAGE_SIZE_ASSUMED;
}

Codec::Codec(Registry &registry, const CodecOptions &options):
    m_registry(registry),
    m_options(options),
    m_initialized(false),
    m_minor(0)
{
    errno_table().validate();
}

int Codec::native_error(Errc err)
{
    return to_errno(err);
}

Result<void> Codec::pin(Request &req, Ino ino)
{
    auto pinned = m_registry.pin(ino);
    if (!pinned) {
        return copy_error(pinned);
    }
    req.pins.emplace_back(std::move(*pinned));
    return make_result();
}

Result<std::vector<Decoded>> Codec::decode(std::string_view frame)
{
    FrameReader reader(frame);
    userspacefs_fuse_read(header, reader.read<fuse_in_header>());
    if (header->len != frame.size()) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }
    const std::string_view args = frame.substr(sizeof(fuse_in_header));

    std::vector<Decoded> result;
    switch (header->opcode) {
    case FUSE_INIT:
        return decode_init(*header, args);
    case FUSE_DESTROY:
    {
        logger().info("host destroyed the session");
        m_initialized = false;
        Decoded item;
        item.kind = Decoded::SHUTDOWN;
        item.frame = ReplyBuffer(header->unique).finish();
        result.emplace_back(std::move(item));
        return result;
    }
    case FUSE_INTERRUPT:
    {
        userspacefs_fuse_read(in, FrameReader(args).read<fuse_interrupt_in>());
        Decoded item;
        item.kind = Decoded::CANCEL;
        item.target = in->unique;
        // makes the kernel queue the interrupt again if the target is not
        // known yet
        item.frame = ReplyBuffer::error(header->unique, EAGAIN);
        result.emplace_back(std::move(item));
        return result;
    }
    default:
        break;
    }

    if (!m_initialized) {
        return make_result(FAILED, Errc::IO_ERROR);
    }

    userspacefs_fuse_read(req, decode_request(*header, args));
    Decoded item;
    item.request = std::move(*req);
    result.emplace_back(std::move(item));
    return result;
}

Result<std::vector<Decoded>> Codec::decode_init(const fuse_in_header &header,
                                                std::string_view args)
{
    FrameReader reader(args);
    userspacefs_fuse_read(in, reader.read_prefix<fuse_init_in>(offsetof(fuse_init_in, flags2)));

    Decoded item;
    item.kind = Decoded::REPLY;

    if (in->major < FUSE_KERNEL_VERSION ||
            (in->major == FUSE_KERNEL_VERSION && in->minor < MIN_MINOR)) {
        logger().error("unsupported FUSE protocol version {}.{}", in->major, in->minor);
        item.frame = ReplyBuffer::error(header.unique, EPROTO);
    } else if (in->major > FUSE_KERNEL_VERSION) {
        // the kernel retries with our major version
        fuse_init_out out;
        std::memset(&out, 0, sizeof(out));
        out.major = FUSE_KERNEL_VERSION;
        out.minor = FUSE_KERNEL_MINOR_VERSION;
        ReplyBuffer reply(header.unique);
        reply.append_struct(out, FUSE_COMPAT_INIT_OUT_SIZE);
        item.frame = reply.finish();
    } else {
        static constexpr uint32_t WANTED_FLAGS =
                FUSE_ASYNC_READ | FUSE_BIG_WRITES | FUSE_ATOMIC_O_TRUNC |
                FUSE_PARALLEL_DIROPS | FUSE_MAX_PAGES;

        fuse_init_out out;
        std::memset(&out, 0, sizeof(out));
        out.major = FUSE_KERNEL_VERSION;
        out.minor = std::min<uint32_t>(in->minor, FUSE_KERNEL_MINOR_VERSION);
        out.max_readahead = in->max_readahead;
        out.flags = in->flags & WANTED_FLAGS;
        out.max_background = m_options.max_background;
        out.congestion_threshold = static_cast<uint16_t>(m_options.max_background * 3 / 4);
        out.max_write = m_options.max_write;
        out.time_gran = 1;
        if (out.flags & FUSE_MAX_PAGES) {
            out.max_pages = static_cast<uint16_t>((m_options.max_write - 1) / PAGE_SIZE_ASSUMED + 1);
        }

        size_t size = sizeof(out);
        if (out.minor < 5) {
            size = FUSE_COMPAT_INIT_OUT_SIZE;
        } else if (out.minor < 23) {
            size = FUSE_COMPAT_22_INIT_OUT_SIZE;
        }

        ReplyBuffer reply(header.unique);
        reply.append_struct(out, size);
        item.frame = reply.finish();

        m_minor = out.minor;
        m_initialized = true;
        logger().info("negotiated FUSE protocol 7.{}, flags {:#x}, max_write {}",
                      out.minor, out.flags, out.max_write);
    }

    std::vector<Decoded> result;
    result.emplace_back(std::move(item));
    return result;
}

Result<Request> Codec::decode_request(const fuse_in_header &header, std::string_view args)
{
    FrameReader reader(args);
    Request req;
    req.unique = header.unique;
    req.ino = header.nodeid;

    switch (header.opcode) {
    case FUSE_LOOKUP:
    {
        req.op = Opcode::LOOKUP;
        userspacefs_fuse_read(name, reader.read_name());
        req.name = *name;
        break;
    }
    case FUSE_FORGET:
    {
        req.op = Opcode::FORGET;
        userspacefs_fuse_read(in, reader.read<fuse_forget_in>());
        req.forgets.emplace_back(header.nodeid, in->nlookup);
        // forgetting a stale number is harmless, nothing to pin
        return std::move(req);
    }
    case FUSE_BATCH_FORGET:
    {
        req.op = Opcode::BATCH_FORGET;
        userspacefs_fuse_read(in, reader.read<fuse_batch_forget_in>());
        if (reader.remaining() / sizeof(fuse_forget_one) < in->count) {
            return make_result(FAILED, Errc::MALFORMED_REQUEST);
        }
        req.forgets.reserve(in->count);
        for (uint32_t i = 0; i < in->count; ++i) {
            userspacefs_fuse_read(one, reader.read<fuse_forget_one>());
            req.forgets.emplace_back(one->nodeid, one->nlookup);
        }
        return std::move(req);
    }
    case FUSE_GETATTR:
    {
        req.op = Opcode::GETATTR;
        userspacefs_fuse_read(in, reader.read<fuse_getattr_in>());
        if (in->getattr_flags & FUSE_GETATTR_FH) {
            req.fh = in->fh;
        }
        break;
    }
    case FUSE_SETATTR:
    {
        req.op = Opcode::SETATTR;
        userspacefs_fuse_read(in, reader.read<fuse_setattr_in>());
        uint32_t valid = 0;
        if (in->valid & FATTR_MODE) {
            valid |= Backend::SetAttr::MODE;
            req.attr.mode = in->mode;
        }
        if (in->valid & FATTR_UID) {
            valid |= Backend::SetAttr::UID;
            req.attr.uid = in->uid;
        }
        if (in->valid & FATTR_GID) {
            valid |= Backend::SetAttr::GID;
            req.attr.gid = in->gid;
        }
        if (in->valid & FATTR_SIZE) {
            valid |= Backend::SetAttr::SIZE;
            req.attr.size = in->size;
        }
        if (in->valid & FATTR_ATIME_NOW) {
            valid |= Backend::SetAttr::ATIME_NOW;
        } else if (in->valid & FATTR_ATIME) {
            valid |= Backend::SetAttr::ATIME;
            req.attr.atime.tv_sec = static_cast<time_t>(in->atime);
            req.attr.atime.tv_nsec = in->atimensec;
        }
        if (in->valid & FATTR_MTIME_NOW) {
            valid |= Backend::SetAttr::MTIME_NOW;
        } else if (in->valid & FATTR_MTIME) {
            valid |= Backend::SetAttr::MTIME;
            req.attr.mtime.tv_sec = static_cast<time_t>(in->mtime);
            req.attr.mtime.tv_nsec = in->mtimensec;
        }
        if (in->valid & FATTR_FH) {
            req.fh = in->fh;
        }
        req.attr.valid = valid;
        break;
    }
    case FUSE_READLINK:
    {
        req.op = Opcode::READLINK;
        break;
    }
    case FUSE_SYMLINK:
    {
        req.op = Opcode::SYMLINK;
        userspacefs_fuse_read(name, reader.read_name());
        userspacefs_fuse_read(target, reader.read_name());
        req.name = *name;
        req.data = *target;
        break;
    }
    case FUSE_MKNOD:
    {
        req.op = Opcode::MKNOD;
        userspacefs_fuse_read(in, reader.read<fuse_mknod_in>());
        userspacefs_fuse_read(name, reader.read_name());
        req.mode = in->mode;
        req.name = *name;
        break;
    }
    case FUSE_MKDIR:
    {
        req.op = Opcode::MKDIR;
        userspacefs_fuse_read(in, reader.read<fuse_mkdir_in>());
        userspacefs_fuse_read(name, reader.read_name());
        req.mode = in->mode;
        req.name = *name;
        break;
    }
    case FUSE_UNLINK:
    case FUSE_RMDIR:
    {
        req.op = header.opcode == FUSE_UNLINK ? Opcode::UNLINK : Opcode::RMDIR;
        userspacefs_fuse_read(name, reader.read_name());
        req.name = *name;
        break;
    }
    case FUSE_RENAME:
    {
        req.op = Opcode::RENAME;
        userspacefs_fuse_read(in, reader.read<fuse_rename_in>());
        req.newparent = in->newdir;
        break;
    }
    case FUSE_RENAME2:
    {
        req.op = Opcode::RENAME;
        userspacefs_fuse_read(in, reader.read<fuse_rename2_in>());
        req.newparent = in->newdir;
        req.flags = in->flags;
        break;
    }
    case FUSE_OPEN:
    case FUSE_OPENDIR:
    {
        req.op = header.opcode == FUSE_OPEN ? Opcode::OPEN : Opcode::OPENDIR;
        userspacefs_fuse_read(in, reader.read<fuse_open_in>());
        req.flags = in->flags;
        break;
    }
    case FUSE_CREATE:
    {
        req.op = Opcode::CREATE;
        userspacefs_fuse_read(in, reader.read<fuse_create_in>());
        userspacefs_fuse_read(name, reader.read_name());
        req.flags = in->flags;
        req.mode = in->mode;
        req.name = *name;
        break;
    }
    case FUSE_READ:
    case FUSE_READDIR:
    {
        req.op = header.opcode == FUSE_READ ? Opcode::READ : Opcode::READDIR;
        userspacefs_fuse_read(in, reader.read<fuse_read_in>());
        req.fh = in->fh;
        req.offset = in->offset;
        req.size = in->size;
        if (req.op == Opcode::READDIR) {
            // upper bound of the records which can fit
            req.max_entries = std::max<uint32_t>(
                        1, in->size / FUSE_DIRENT_ALIGN(FUSE_NAME_OFFSET + 1));
        }
        break;
    }
    case FUSE_WRITE:
    {
        req.op = Opcode::WRITE;
        userspacefs_fuse_read(in, reader.read<fuse_write_in>());
        userspacefs_fuse_read(data, reader.read_bytes(in->size));
        req.fh = in->fh;
        req.offset = in->offset;
        req.data = *data;
        break;
    }
    case FUSE_STATFS:
    {
        req.op = Opcode::STATFS;
        return std::move(req);
    }
    case FUSE_RELEASE:
    case FUSE_RELEASEDIR:
    {
        req.op = header.opcode == FUSE_RELEASE ? Opcode::RELEASE : Opcode::RELEASEDIR;
        userspacefs_fuse_read(in, reader.read<fuse_release_in>());
        req.fh = in->fh;
        break;
    }
    case FUSE_FSYNC:
    case FUSE_FSYNCDIR:
    {
        req.op = header.opcode == FUSE_FSYNC ? Opcode::FSYNC : Opcode::FSYNCDIR;
        userspacefs_fuse_read(in, reader.read<fuse_fsync_in>());
        req.fh = in->fh;
        if (in->fsync_flags & FUSE_FSYNC_FDATASYNC) {
            req.request_flags |= FSYNC_DATASYNC;
        }
        break;
    }
    case FUSE_FLUSH:
    {
        req.op = Opcode::FLUSH;
        userspacefs_fuse_read(in, reader.read<fuse_flush_in>());
        req.fh = in->fh;
        break;
    }
    default:
        return make_result(FAILED, Errc::UNKNOWN_OPERATION);
    }

    if (req.op == Opcode::RENAME) {
        userspacefs_fuse_read(name, reader.read_name());
        userspacefs_fuse_read(newname, reader.read_name());
        req.name = *name;
        req.newname = *newname;
        userspacefs_fuse_read(pinned_newparent, pin(req, req.newparent));
    }

    userspacefs_fuse_read(pinned, pin(req, req.ino));
    return std::move(req);
}

std::optional<std::string> Codec::reject(std::string_view frame, Errc err)
{
    if (frame.size() < sizeof(fuse_in_header)) {
        return std::nullopt;
    }
    fuse_in_header header;
    std::memcpy(&header, frame.data(), sizeof(header));
    if (header.opcode == FUSE_FORGET || header.opcode == FUSE_BATCH_FORGET) {
        return std::nullopt;
    }
    return ReplyBuffer::error(header.unique, native_error(err));
}

std::optional<std::string> Codec::encode(const Request &req, const Response &response)
{
    if (req.op == Opcode::FORGET || req.op == Opcode::BATCH_FORGET) {
        return std::nullopt;
    }
    if (!response) {
        return ReplyBuffer::error(req.unique, native_error(response.error()));
    }
    return encode_payload(req, *response);
}

std::optional<std::string> Codec::encode_cancelled(const Request &req)
{
    if (req.op == Opcode::FORGET || req.op == Opcode::BATCH_FORGET) {
        return std::nullopt;
    }
    return ReplyBuffer::error(req.unique, EINTR);
}

std::string Codec::encode_payload(const Request &req, const Payload &payload)
{
    ReplyBuffer reply(req.unique);

    auto entry_out = [this](const EntryReply &entry) {
        fuse_entry_out out;
        std::memset(&out, 0, sizeof(out));
        out.nodeid = entry.ino;
        split_timeout(m_options.entry_timeout, out.entry_valid, out.entry_valid_nsec);
        split_timeout(m_options.attr_timeout, out.attr_valid, out.attr_valid_nsec);
        fill_attr(out.attr, entry.attr);
        return out;
    };

    switch (req.op) {
    case Opcode::LOOKUP:
    case Opcode::MKNOD:
    case Opcode::MKDIR:
    case Opcode::SYMLINK:
    {
        auto entry = std::get_if<EntryReply>(&payload);
        if (!entry) {
            break;
        }
        reply.append_struct(entry_out(*entry));
        return reply.finish();
    }
    case Opcode::GETATTR:
    case Opcode::SETATTR:
    {
        auto attr = std::get_if<AttrReply>(&payload);
        if (!attr) {
            break;
        }
        fuse_attr_out out;
        std::memset(&out, 0, sizeof(out));
        split_timeout(m_options.attr_timeout, out.attr_valid, out.attr_valid_nsec);
        fill_attr(out.attr, attr->attr);
        reply.append_struct(out);
        return reply.finish();
    }
    case Opcode::READLINK:
    case Opcode::READ:
    {
        auto data = std::get_if<DataReply>(&payload);
        if (!data) {
            break;
        }
        reply.append(data->data);
        return reply.finish();
    }
    case Opcode::OPEN:
    case Opcode::OPENDIR:
    case Opcode::CREATE:
    {
        auto open = std::get_if<OpenReply>(&payload);
        if (!open) {
            break;
        }
        if (req.op == Opcode::CREATE) {
            reply.append_struct(entry_out(open->entry));
        }
        fuse_open_out out;
        std::memset(&out, 0, sizeof(out));
        out.fh = open->fh;
        reply.append_struct(out);
        return reply.finish();
    }
    case Opcode::WRITE:
    {
        auto written = std::get_if<WriteReply>(&payload);
        if (!written) {
            break;
        }
        fuse_write_out out;
        std::memset(&out, 0, sizeof(out));
        out.size = written->count;
        reply.append_struct(out);
        return reply.finish();
    }
    case Opcode::STATFS:
    {
        auto statfs = std::get_if<StatfsReply>(&payload);
        if (!statfs) {
            break;
        }
        fuse_statfs_out out;
        std::memset(&out, 0, sizeof(out));
        out.st.blocks = statfs->st.blocks;
        out.st.bfree = statfs->st.bfree;
        out.st.bavail = statfs->st.bavail;
        out.st.files = statfs->st.files;
        out.st.ffree = statfs->st.ffree;
        out.st.bsize = statfs->st.bsize;
        out.st.namelen = statfs->st.namemax;
        out.st.frsize = statfs->st.frsize;
        reply.append_struct(out);
        return reply.finish();
    }
    case Opcode::READDIR:
    {
        auto dir = std::get_if<DirReply>(&payload);
        if (!dir) {
            break;
        }
        DirBuffer buffer(req.size);
        for (const auto &item: dir->entries) {
            if (!buffer.add(item.name, item.ino, item.attr.mode, item.offset)) {
                // the rest stays in the cursor for the next call
                break;
            }
        }
        reply.append(buffer.get());
        return reply.finish();
    }
    default:
        // operations answered with the bare header
        return reply.finish();
    }

    logger().error("reply payload {} does not fit {}", payload.index(), opcode_name(req.op));
    return ReplyBuffer::error(req.unique, EIO);
}

void Codec::teardown()
{
    m_initialized = false;
    const size_t closed = close_all(m_registry.clear());
    logger().info("released {} open files and directories", closed);
}

#undef userspacefs_fuse_read

}
