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
#include "userspacefs/smb/codec.hpp"

#include <algorithm>
#include <cctype>
#include <random>

#include <fcntl.h>
#include <sys/stat.h>

#include "userspacefs/error_map.hpp"
#include "userspacefs/logging.hpp"

namespace Userspacefs::Smb {

#define userspacefs_smb_read(var, expr) \
    auto var = (expr); \
    if (!var) { \
        return copy_error(var); \
    }

namespace {

enum InfoType: uint8_t {
    INFO_FILE = 0x01,
    INFO_FILESYSTEM = 0x02,
    INFO_SECURITY = 0x03,
};

enum FileInfoClass: uint8_t {
    FILE_DIRECTORY_INFORMATION = 1,
    FILE_FULL_DIRECTORY_INFORMATION = 2,
    FILE_BOTH_DIRECTORY_INFORMATION = 3,
    FILE_BASIC_INFORMATION = 4,
    FILE_STANDARD_INFORMATION = 5,
    FILE_INTERNAL_INFORMATION = 6,
    FILE_EA_INFORMATION = 7,
    FILE_RENAME_INFORMATION = 10,
    FILE_NAMES_INFORMATION = 12,
    FILE_DISPOSITION_INFORMATION = 13,
    FILE_ALL_INFORMATION = 18,
    FILE_ALLOCATION_INFORMATION = 19,
    FILE_END_OF_FILE_INFORMATION = 20,
    FILE_NETWORK_OPEN_INFORMATION = 34,
    FILE_ATTRIBUTE_TAG_INFORMATION = 35,
    FILE_ID_BOTH_DIRECTORY_INFORMATION = 37,
    FILE_ID_FULL_DIRECTORY_INFORMATION = 38,
};

enum FsInfoClass: uint8_t {
    FILE_FS_VOLUME_INFORMATION = 1,
    FILE_FS_SIZE_INFORMATION = 3,
    FILE_FS_DEVICE_INFORMATION = 4,
    FILE_FS_ATTRIBUTE_INFORMATION = 5,
    FILE_FS_FULL_SIZE_INFORMATION = 7,
};

static constexpr uint32_t FILE_ATTRIBUTE_READONLY = 0x00000001;
static constexpr uint32_t FILE_ATTRIBUTE_DIRECTORY = 0x00000010;
static constexpr uint32_t FILE_ATTRIBUTE_NORMAL = 0x00000080;

static constexpr uint32_t FILE_DIRECTORY_FILE = 0x00000001;
static constexpr uint32_t FILE_NON_DIRECTORY_FILE = 0x00000040;
static constexpr uint32_t FILE_DELETE_ON_CLOSE = 0x00001000;

static constexpr uint32_t WRITE_ACCESS =
        0x00000002 /* FILE_WRITE_DATA */ |
        0x00000004 /* FILE_APPEND_DATA */ |
        0x02000000 /* MAXIMUM_ALLOWED */ |
        0x10000000 /* GENERIC_ALL */ |
        0x40000000 /* GENERIC_WRITE */;
static constexpr uint32_t FULL_ACCESS = 0x001F01FF;

static constexpr uint16_t CLOSE_FLAG_POSTQUERY_ATTRIB = 0x0001;

static constexpr uint8_t RESTART_SCANS = 0x01;
static constexpr uint8_t RETURN_SINGLE_ENTRY = 0x02;
static constexpr uint8_t REOPEN = 0x10;

static constexpr uint16_t SESSION_FLAG_IS_GUEST = 0x0001;
static constexpr uint16_t NEGOTIATE_SIGNING_ENABLED = 0x0001;
static constexpr uint32_t GLOBAL_CAP_LARGE_MTU = 0x00000004;
static constexpr uint8_t SHARE_TYPE_DISK = 0x01;

static constexpr uint64_t APPEND_OFFSET = 0xFFFFFFFFFFFFFFFFULL;
static constexpr uint32_t DIALECT_2_0_2_MAX_IO = 65536;
static constexpr uint32_t FILE_DEVICE_DISK = 0x00000007;
static constexpr uint32_t FS_ATTRIBUTES =
        0x00000001 /* FILE_CASE_SENSITIVE_SEARCH */ |
        0x00000002 /* FILE_CASE_PRESERVED_NAMES */ |
        0x00000004 /* FILE_UNICODE_ON_DISK */;
static constexpr uint32_t ALLOCATION_UNIT = 4096;
static constexpr uint32_t SECTOR_SIZE = 512;

/* rough lower bound of one directory record, to size READDIR batches */
static constexpr uint32_t MIN_DIRECTORY_RECORD = 64;

}

static bool is_directory_class(uint8_t cls)
{
    switch (cls) {
    case FILE_DIRECTORY_INFORMATION:
    case FILE_FULL_DIRECTORY_INFORMATION:
    case FILE_BOTH_DIRECTORY_INFORMATION:
    case FILE_NAMES_INFORMATION:
    case FILE_ID_BOTH_DIRECTORY_INFORMATION:
    case FILE_ID_FULL_DIRECTORY_INFORMATION:
        return true;
    default:
        return false;
    }
}

static bool is_file_query_class(uint8_t cls)
{
    switch (cls) {
    case FILE_BASIC_INFORMATION:
    case FILE_STANDARD_INFORMATION:
    case FILE_INTERNAL_INFORMATION:
    case FILE_EA_INFORMATION:
    case FILE_ALL_INFORMATION:
    case FILE_NETWORK_OPEN_INFORMATION:
    case FILE_ATTRIBUTE_TAG_INFORMATION:
        return true;
    default:
        return false;
    }
}

static uint32_t file_attributes(const Backend::Stat &attr)
{
    if (S_ISDIR(attr.mode)) {
        return FILE_ATTRIBUTE_DIRECTORY;
    }
    if ((attr.mode & 0222) == 0) {
        return FILE_ATTRIBUTE_READONLY;
    }
    return FILE_ATTRIBUTE_NORMAL;
}

static uint64_t allocation_size(const Backend::Stat &attr)
{
    return (attr.size + ALLOCATION_UNIT - 1) / ALLOCATION_UNIT * ALLOCATION_UNIT;
}

/**
 * Creation, last access, last write and change time.
 */
static void write_times(Writer &out, const Backend::Stat &attr)
{
    // POSIX has no birth time; the modification time is the closest stable value
    out.u64(to_filetime(attr.mtime));
    out.u64(to_filetime(attr.atime));
    out.u64(to_filetime(attr.mtime));
    out.u64(to_filetime(attr.ctime));
}

static void write_basic(Writer &out, const Backend::Stat &attr)
{
    write_times(out, attr);
    out.u32(file_attributes(attr));
    out.u32(0);
}

static void write_standard(Writer &out, const Backend::Stat &attr, bool delete_pending)
{
    out.u64(allocation_size(attr));
    out.u64(attr.size);
    out.u32(attr.nlink);
    out.u8(delete_pending ? 1 : 0);
    out.u8(S_ISDIR(attr.mode) ? 1 : 0);
    out.u16(0);
}

static void write_network_open(Writer &out, const Backend::Stat &attr)
{
    write_times(out, attr);
    out.u64(allocation_size(attr));
    out.u64(attr.size);
    out.u32(file_attributes(attr));
    out.u32(0);
}

static void write_all(Writer &out, const Backend::Stat &attr, bool delete_pending)
{
    write_basic(out, attr);
    write_standard(out, attr, delete_pending);
    // internal
    out.u64(attr.ino);
    // ea
    out.u32(0);
    // access
    out.u32(FULL_ACCESS);
    // position
    out.u64(0);
    // mode
    out.u32(0);
    // alignment
    out.u32(0);
    // name, left empty
    out.u32(0);
}

static void write_fs_size(Writer &out, const Backend::StatVfs &st, bool full)
{
    const uint32_t unit = st.frsize != 0 ? st.frsize : st.bsize;
    out.u64(st.blocks);
    out.u64(st.bavail);
    if (full) {
        out.u64(st.bfree);
    }
    out.u32(std::max<uint32_t>(1, unit / SECTOR_SIZE));
    out.u32(SECTOR_SIZE);
}

static std::string directory_record(uint8_t cls, const DirItem &item)
{
    const std::string name = utf8_to_utf16(item.name);

    Writer out;
    // next entry offset, patched when the following record is appended
    out.u32(0);
    // file index
    out.u32(0);
    if (cls == FILE_NAMES_INFORMATION) {
        out.u32(static_cast<uint32_t>(name.size()));
        out.bytes(name);
        return out.take();
    }

    write_times(out, item.attr);
    out.u64(item.attr.size);
    out.u64(allocation_size(item.attr));
    out.u32(file_attributes(item.attr));
    out.u32(static_cast<uint32_t>(name.size()));
    if (cls != FILE_DIRECTORY_INFORMATION) {
        // ea size
        out.u32(0);
    }
    if (cls == FILE_BOTH_DIRECTORY_INFORMATION || cls == FILE_ID_BOTH_DIRECTORY_INFORMATION) {
        // no 8.3 short name
        out.u8(0);
        out.u8(0);
        out.zeros(24);
    }
    if (cls == FILE_ID_BOTH_DIRECTORY_INFORMATION) {
        out.u16(0);
        out.u64(item.ino);
    } else if (cls == FILE_ID_FULL_DIRECTORY_INFORMATION) {
        out.u32(0);
        out.u64(item.ino);
    }
    out.bytes(name);
    return out.take();
}

/**
 * Body shared by QUERY_INFO and QUERY_DIRECTORY responses. Returns false if
 * @a info exceeds what the client accepts.
 */
static bool write_info_body(Writer &body, std::string_view info, uint32_t output_length)
{
    if (info.size() > output_length) {
        return false;
    }
    body.u16(9);
    body.u16(static_cast<uint16_t>(HEADER_SIZE + 8));
    body.u32(static_cast<uint32_t>(info.size()));
    body.bytes(info);
    return true;
}

static bool equals_caseless(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
            std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) ==
                        std::tolower(static_cast<unsigned char>(y));
            });
}

/**
 * Split a backslash-separated share path into components.
 */
static Result<std::vector<std::string>> split_path(std::string_view path)
{
    std::vector<std::string> components;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t end = path.find('\\', pos);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        std::string_view component = path.substr(pos, end - pos);
        pos = end + 1;
        if (component.empty()) {
            continue;
        }
        if (component == "." || component == ".." ||
                component.find('/') != std::string_view::npos) {
            return make_result(FAILED, Errc::INVALID_ARGUMENT);
        }
        components.emplace_back(component);
    }
    return components;
}

static bool settable_time(uint64_t filetime)
{
    // 0 leaves the time alone, -1 and -2 suspend and resume automatic updates
    return filetime != 0 && filetime != 0xFFFFFFFFFFFFFFFFULL &&
            filetime != 0xFFFFFFFFFFFFFFFEULL;
}

Codec::Codec(Registry &registry, const CodecOptions &options):
    m_registry(registry),
    m_options(options),
    m_server_guid(),
    m_start_time(),
    m_dialect(0),
    m_next_session(1),
    m_next_tree(1),
    m_next_file_id(1)
{
    ntstatus_table().validate();

    std::random_device random;
    for (auto &byte: m_server_guid) {
        byte = static_cast<char>(random() & 0xff);
    }
    clock_gettime(CLOCK_REALTIME, &m_start_time);
}

uint32_t Codec::native_error(Errc err)
{
    return to_ntstatus(err);
}

uint16_t Codec::dialect()
{
    std::lock_guard lock(m_mutex);
    return m_dialect;
}

size_t Codec::open_files()
{
    std::lock_guard lock(m_mutex);
    return m_opens.size();
}

uint16_t Codec::granted_credits(const Header &header) const
{
    return std::clamp<uint16_t>(header.credits, 1, MAX_CREDITS);
}

std::string Codec::reply(const Header &header, uint32_t status, const Writer &body) const
{
    Writer out;
    write_response_header(out, header, status, granted_credits(header));
    out.bytes(body.data());
    return out.take();
}

std::string Codec::error_reply(const Header &header, uint32_t status) const
{
    Writer body;
    body.u16(9);
    // error context count, reserved
    body.u8(0);
    body.u8(0);
    // byte count
    body.u32(0);
    body.u8(0);
    return reply(header, status, body);
}

Decoded Codec::local_reply(const Header &header, uint32_t status, const Writer &body) const
{
    Decoded item;
    item.kind = Decoded::REPLY;
    item.frame = reply(header, status, body);
    return item;
}

Decoded Codec::local_error(const Header &header, uint32_t status) const
{
    Decoded item;
    item.kind = Decoded::REPLY;
    item.frame = error_reply(header, status);
    return item;
}

std::optional<uint32_t> Codec::check_context(const Header &header, bool needs_tree)
{
    std::lock_guard lock(m_mutex);
    if (m_sessions.count(header.session_id) == 0) {
        return NtStatus::USER_SESSION_DELETED;
    }
    if (needs_tree && m_trees.count(header.tree_id) == 0) {
        return NtStatus::NETWORK_NAME_DELETED;
    }
    return std::nullopt;
}

Result<std::pair<uint64_t, Codec::Open>> Codec::find_open(Reader &reader)
{
    userspacefs_smb_read(persistent, reader.u64());
    userspacefs_smb_read(volatile_id, reader.u64());
    if (*persistent != *volatile_id) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }

    std::lock_guard lock(m_mutex);
    auto iter = m_opens.find(*volatile_id);
    if (iter == m_opens.end()) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    return std::make_pair(iter->first, iter->second);
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

Decoded Codec::dispatch(const Header &header, Request &&req, Pending &&pending)
{
    req.unique = header.message_id;
    pending.header = header;
    {
        std::lock_guard lock(m_mutex);
        m_pending[header.message_id] = std::move(pending);
    }

    Decoded item;
    item.kind = Decoded::DISPATCH;
    item.request = std::move(req);
    return item;
}

Result<std::vector<Decoded>> Codec::decode(std::string_view frame)
{
    if (frame.size() >= 4 && frame.substr(0, 4) == std::string_view("\xffSMB", 4)) {
        return decode_smb1(frame);
    }

    // validate the whole compound chain before acting on any element
    std::vector<std::pair<Header, std::string_view>> elements;
    size_t offset = 0;
    while (true) {
        std::string_view rest = frame.substr(offset);
        userspacefs_smb_read(header, parse_header(rest));
        if (header->next_command == 0) {
            elements.emplace_back(*header, rest);
            break;
        }
        if (header->next_command % 8 != 0 || header->next_command < HEADER_SIZE ||
                header->next_command >= rest.size()) {
            return make_result(FAILED, Errc::MALFORMED_REQUEST);
        }
        elements.emplace_back(*header, rest.substr(0, header->next_command));
        offset += header->next_command;
    }

    std::vector<Decoded> result;
    result.reserve(elements.size());
    for (const auto &[header, message]: elements) {
        auto item = decode_one(header, message);
        if (!item) {
            logger().debug("SMB2 command {:#x} message {} rejected: {}",
                           header.command, header.message_id, errc_name(item.error()));
            result.emplace_back(local_error(header, to_ntstatus(item.error())));
            continue;
        }
        result.emplace_back(std::move(*item));
    }
    return result;
}

Result<std::vector<Decoded>> Codec::decode_smb1(std::string_view frame)
{
    static constexpr size_t SMB1_HEADER_SIZE = 32;
    static constexpr uint8_t SMB1_COM_NEGOTIATE = 0x72;

    if (frame.size() < SMB1_HEADER_SIZE + 3 ||
            static_cast<uint8_t>(frame[4]) != SMB1_COM_NEGOTIATE) {
        return make_result(FAILED, Errc::UNKNOWN_OPERATION);
    }

    Reader reader(frame, SMB1_HEADER_SIZE);
    userspacefs_smb_read(word_count, reader.u8());
    userspacefs_smb_read(skipped, reader.skip(size_t(*word_count) * 2));
    userspacefs_smb_read(byte_count, reader.u16());
    userspacefs_smb_read(dialects, reader.bytes(*byte_count));

    bool wildcard = false;
    bool smb2_002 = false;
    std::string_view rest = *dialects;
    while (!rest.empty()) {
        if (rest[0] != '\x02') {
            return make_result(FAILED, Errc::MALFORMED_REQUEST);
        }
        const size_t end = rest.find('\0', 1);
        if (end == std::string_view::npos) {
            return make_result(FAILED, Errc::MALFORMED_REQUEST);
        }
        const std::string_view dialect = rest.substr(1, end - 1);
        if (dialect == "SMB 2.???") {
            wildcard = true;
        } else if (dialect == "SMB 2.002") {
            smb2_002 = true;
        }
        rest = rest.substr(end + 1);
    }

    if (!wildcard && !smb2_002) {
        logger().warn("client offered no SMB2 dialect");
        return make_result(FAILED, Errc::NOT_SUPPORTED);
    }

    Header header{};
    header.command = NEGOTIATE;
    header.credits = 1;

    std::vector<Decoded> result;
    result.emplace_back(negotiate_reply(header, wildcard ? DIALECT_WILDCARD : DIALECT_2_0_2));
    return result;
}

Result<Decoded> Codec::decode_one(const Header &header, std::string_view message)
{
    logger().trace("SMB2 command {:#x} message {} session {:#x} tree {}",
                   header.command, header.message_id, header.session_id, header.tree_id);

    if (header.flags & FLAG_RELATED_OPERATIONS) {
        return local_error(header, NtStatus::NOT_SUPPORTED);
    }

    switch (header.command) {
    case NEGOTIATE:
        return decode_negotiate(header, message);
    case SESSION_SETUP:
        return decode_session_setup(header);
    case ECHO:
    {
        Writer body;
        body.u16(4);
        body.u16(0);
        return local_reply(header, NtStatus::SUCCESS, body);
    }
    case CANCEL:
    {
        Decoded item;
        item.kind = Decoded::CANCEL;
        item.target = (header.flags & FLAG_ASYNC_COMMAND) ? header.async_id : header.message_id;
        // CANCEL itself is never answered
        return std::move(item);
    }
    default:
        break;
    }

    const bool needs_tree = header.command != LOGOFF && header.command != TREE_CONNECT;
    if (auto status = check_context(header, needs_tree)) {
        return local_error(header, *status);
    }

    switch (header.command) {
    case LOGOFF:
    {
        {
            std::lock_guard lock(m_mutex);
            m_sessions.erase(header.session_id);
        }
        logger().info("SMB2 session {:#x} logged off", header.session_id);
        Writer body;
        body.u16(4);
        body.u16(0);
        return local_reply(header, NtStatus::SUCCESS, body);
    }
    case TREE_CONNECT:
        return decode_tree_connect(header, message);
    case TREE_DISCONNECT:
    {
        {
            std::lock_guard lock(m_mutex);
            m_trees.erase(header.tree_id);
        }
        Writer body;
        body.u16(4);
        body.u16(0);
        return local_reply(header, NtStatus::SUCCESS, body);
    }
    case CREATE:
        return decode_create(header, message);
    case CLOSE:
        return decode_close(header, message);
    case FLUSH:
        return decode_flush(header, message);
    case READ:
        return decode_read(header, message);
    case WRITE:
        return decode_write(header, message);
    case QUERY_DIRECTORY:
        return decode_query_directory(header, message);
    case QUERY_INFO:
        return decode_query_info(header, message);
    case SET_INFO:
        return decode_set_info(header, message);
    case LOCK:
    case IOCTL:
    case CHANGE_NOTIFY:
    case OPLOCK_BREAK:
        return local_error(header, NtStatus::NOT_SUPPORTED);
    default:
        return make_result(FAILED, Errc::UNKNOWN_OPERATION);
    }
}

Decoded Codec::negotiate_reply(const Header &header, uint16_t dialect)
{
    {
        std::lock_guard lock(m_mutex);
        m_dialect = dialect;
    }

    const uint32_t max_io = dialect == DIALECT_2_1
            ? m_options.max_io
            : std::min(m_options.max_io, DIALECT_2_0_2_MAX_IO);

    struct timespec now;
    clock_gettime(CLOCK_REALTIME, &now);

    Writer body;
    body.u16(65);
    body.u16(NEGOTIATE_SIGNING_ENABLED);
    body.u16(dialect);
    body.u16(0);
    body.bytes(std::string_view(m_server_guid.data(), m_server_guid.size()));
    body.u32(dialect == DIALECT_2_1 ? GLOBAL_CAP_LARGE_MTU : 0);
    // max transact, read and write size
    body.u32(max_io);
    body.u32(max_io);
    body.u32(max_io);
    body.u64(to_filetime(now));
    body.u64(to_filetime(m_start_time));
    // empty security buffer: guest sessions only
    body.u16(static_cast<uint16_t>(HEADER_SIZE + 64));
    body.u16(0);
    body.u32(0);

    logger().debug("negotiated SMB2 dialect {:#06x}", dialect);
    return local_reply(header, NtStatus::SUCCESS, body);
}

Result<Decoded> Codec::decode_negotiate(const Header &header, std::string_view message)
{
    Reader reader(message, HEADER_SIZE);
    userspacefs_smb_read(structure_size, reader.u16());
    userspacefs_smb_read(count, reader.u16());
    // security mode, reserved, capabilities, client guid, start time
    userspacefs_smb_read(skipped, reader.skip(2 + 2 + 4 + 16 + 8));

    bool has_2_0_2 = false;
    bool has_2_1 = false;
    for (uint16_t i = 0; i < *count; ++i) {
        userspacefs_smb_read(dialect, reader.u16());
        if (*dialect == DIALECT_2_0_2) {
            has_2_0_2 = true;
        } else if (*dialect == DIALECT_2_1) {
            has_2_1 = true;
        }
    }

    if (has_2_1) {
        return negotiate_reply(header, DIALECT_2_1);
    }
    if (has_2_0_2) {
        return negotiate_reply(header, DIALECT_2_0_2);
    }
    logger().warn("client offered no supported SMB2 dialect");
    return local_error(header, NtStatus::NOT_SUPPORTED);
}

Result<Decoded> Codec::decode_session_setup(const Header &header)
{
    Header response = header;
    {
        std::lock_guard lock(m_mutex);
        if (m_dialect == 0 || m_dialect == DIALECT_WILDCARD) {
            return make_result(FAILED, Errc::INVALID_ARGUMENT);
        }
        if (m_sessions.count(header.session_id) == 0) {
            response.session_id = m_next_session++;
            m_sessions.insert(response.session_id);
        }
    }
    logger().info("granted SMB2 guest session {:#x}", response.session_id);

    Writer body;
    body.u16(9);
    body.u16(SESSION_FLAG_IS_GUEST);
    body.u16(static_cast<uint16_t>(HEADER_SIZE + 8));
    body.u16(0);
    return local_reply(response, NtStatus::SUCCESS, body);
}

Result<Decoded> Codec::decode_tree_connect(const Header &header, std::string_view message)
{
    Reader reader(message, HEADER_SIZE);
    userspacefs_smb_read(structure_size, reader.u16());
    userspacefs_smb_read(flags, reader.u16());
    userspacefs_smb_read(path_offset, reader.u16());
    userspacefs_smb_read(path_length, reader.u16());
    userspacefs_smb_read(raw_path, reader.at(*path_offset, *path_length));
    auto path = utf16_to_utf8(*raw_path);
    if (!path) {
        return local_error(header, NtStatus::BAD_NETWORK_NAME);
    }

    const size_t sep = path->rfind('\\');
    const std::string_view share = sep == std::string::npos
            ? std::string_view(*path)
            : std::string_view(*path).substr(sep + 1);
    if (!equals_caseless(share, m_options.share_name)) {
        logger().info("refusing tree connect to {}", *path);
        return local_error(header, NtStatus::BAD_NETWORK_NAME);
    }

    Header response = header;
    {
        std::lock_guard lock(m_mutex);
        response.tree_id = m_next_tree++;
        m_trees.insert(response.tree_id);
    }

    Writer body;
    body.u16(16);
    body.u8(SHARE_TYPE_DISK);
    body.u8(0);
    // share flags, capabilities
    body.u32(0);
    body.u32(0);
    body.u32(FULL_ACCESS);
    return local_reply(response, NtStatus::SUCCESS, body);
}

Result<Decoded> Codec::decode_create(const Header &header, std::string_view message)
{
    Reader reader(message, HEADER_SIZE);
    userspacefs_smb_read(structure_size, reader.u16());
    // security flags, oplock level, impersonation level, create flags, reserved
    userspacefs_smb_read(skipped, reader.skip(1 + 1 + 4 + 8 + 8));
    userspacefs_smb_read(access, reader.u32());
    userspacefs_smb_read(attributes, reader.u32());
    userspacefs_smb_read(share_access, reader.u32());
    userspacefs_smb_read(disposition, reader.u32());
    userspacefs_smb_read(options, reader.u32());
    userspacefs_smb_read(name_offset, reader.u16());
    userspacefs_smb_read(name_length, reader.u16());
    userspacefs_smb_read(raw_name, reader.at(*name_offset, *name_length));

    auto name = utf16_to_utf8(*raw_name);
    if (!name) {
        return local_error(header, NtStatus::OBJECT_NAME_INVALID);
    }
    if (name->find(':') != std::string::npos) {
        // named streams
        return local_error(header, NtStatus::OBJECT_NAME_NOT_FOUND);
    }
    auto components = split_path(*name);
    if (!components) {
        return local_error(header, NtStatus::OBJECT_NAME_INVALID);
    }
    if (*disposition > static_cast<uint32_t>(Disposition::OVERWRITE_IF)) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    if ((*options & FILE_DIRECTORY_FILE) && (*options & FILE_NON_DIRECTORY_FILE)) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }

    Request req;
    req.op = Opcode::OPEN_PATH;
    req.path = std::move(*components);
    req.disposition = static_cast<Disposition>(*disposition);
    req.flags = (*access & WRITE_ACCESS) ? O_RDWR : O_RDONLY;
    if (*options & FILE_DIRECTORY_FILE) {
        req.request_flags |= OPEN_DIRECTORY;
    }
    if (*options & FILE_NON_DIRECTORY_FILE) {
        req.request_flags |= OPEN_NON_DIRECTORY;
    }
    if ((*attributes & FILE_ATTRIBUTE_READONLY) && !(*options & FILE_DIRECTORY_FILE)) {
        req.mode = 0444;
    }

    Pending pending;
    pending.delete_on_close = (*options & FILE_DELETE_ON_CLOSE) != 0;
    return dispatch(header, std::move(req), std::move(pending));
}

Result<Decoded> Codec::decode_close(const Header &header, std::string_view message)
{
    Reader reader(message, HEADER_SIZE);
    userspacefs_smb_read(structure_size, reader.u16());
    userspacefs_smb_read(flags, reader.u16());
    userspacefs_smb_read(skipped, reader.skip(4));
    userspacefs_smb_read(open, find_open(reader));
    const auto &[id, state] = *open;

    Request req;
    req.op = state.directory ? Opcode::RELEASEDIR : Opcode::RELEASE;
    req.fh = state.fh;
    req.ino = state.ino;
    if (*flags & CLOSE_FLAG_POSTQUERY_ATTRIB) {
        req.request_flags |= RELEASE_STAT;
    }
    if (state.delete_pending) {
        req.request_flags |= RELEASE_UNLINK;
    }
    userspacefs_smb_read(pinned, pin(req, state.ino));

    {
        std::lock_guard lock(m_mutex);
        m_opens.erase(id);
    }
    return dispatch(header, std::move(req), Pending());
}

Result<Decoded> Codec::decode_flush(const Header &header, std::string_view message)
{
    Reader reader(message, HEADER_SIZE);
    userspacefs_smb_read(structure_size, reader.u16());
    userspacefs_smb_read(skipped, reader.skip(2 + 4));
    userspacefs_smb_read(open, find_open(reader));
    const auto &[id, state] = *open;

    Request req;
    req.op = state.directory ? Opcode::FSYNCDIR : Opcode::FSYNC;
    req.fh = state.fh;
    req.ino = state.ino;
    return dispatch(header, std::move(req), Pending());
}

Result<Decoded> Codec::decode_read(const Header &header, std::string_view message)
{
    Reader reader(message, HEADER_SIZE);
    userspacefs_smb_read(structure_size, reader.u16());
    // padding, flags
    userspacefs_smb_read(skipped, reader.skip(2));
    userspacefs_smb_read(length, reader.u32());
    userspacefs_smb_read(offset, reader.u64());
    userspacefs_smb_read(open, find_open(reader));
    const auto &[id, state] = *open;

    if (state.directory) {
        return local_error(header, NtStatus::INVALID_DEVICE_REQUEST);
    }
    if (*length > m_options.max_io) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }

    Request req;
    req.op = Opcode::READ;
    req.fh = state.fh;
    req.ino = state.ino;
    req.offset = *offset;
    req.size = *length;
    return dispatch(header, std::move(req), Pending());
}

Result<Decoded> Codec::decode_write(const Header &header, std::string_view message)
{
    Reader reader(message, HEADER_SIZE);
    userspacefs_smb_read(structure_size, reader.u16());
    userspacefs_smb_read(data_offset, reader.u16());
    userspacefs_smb_read(length, reader.u32());
    userspacefs_smb_read(offset, reader.u64());
    userspacefs_smb_read(open, find_open(reader));
    const auto &[id, state] = *open;
    userspacefs_smb_read(data, reader.at(*data_offset, *length));

    if (state.directory) {
        return local_error(header, NtStatus::INVALID_DEVICE_REQUEST);
    }
    if (*length > m_options.max_io) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }

    Request req;
    req.op = Opcode::WRITE;
    req.fh = state.fh;
    req.ino = state.ino;
    if (*offset == APPEND_OFFSET) {
        req.request_flags |= WRITE_APPEND;
    } else {
        req.offset = *offset;
    }
    req.data = std::string(*data);
    return dispatch(header, std::move(req), Pending());
}

Result<Decoded> Codec::decode_query_directory(const Header &header, std::string_view message)
{
    Reader reader(message, HEADER_SIZE);
    userspacefs_smb_read(structure_size, reader.u16());
    userspacefs_smb_read(cls, reader.u8());
    userspacefs_smb_read(flags, reader.u8());
    userspacefs_smb_read(file_index, reader.u32());
    userspacefs_smb_read(open, find_open(reader));
    const auto &[id, state] = *open;
    userspacefs_smb_read(name_offset, reader.u16());
    userspacefs_smb_read(name_length, reader.u16());
    userspacefs_smb_read(output_length, reader.u32());
    userspacefs_smb_read(raw_pattern, reader.at(*name_offset, *name_length));

    if (!is_directory_class(*cls)) {
        return local_error(header, NtStatus::INVALID_INFO_CLASS);
    }
    if (!state.directory) {
        return local_error(header, NtStatus::INVALID_PARAMETER);
    }
    auto pattern = utf16_to_utf8(*raw_pattern);
    if (!pattern) {
        return local_error(header, NtStatus::OBJECT_NAME_INVALID);
    }
    if (*pattern == "*" || *pattern == "*.*") {
        pattern->clear();
    }

    const bool restart = (*flags & (RESTART_SCANS | REOPEN)) != 0;
    std::string active_pattern;
    {
        std::lock_guard lock(m_mutex);
        auto iter = m_opens.find(id);
        if (iter == m_opens.end()) {
            return make_result(FAILED, Errc::STALE_HANDLE);
        }
        Open &current = iter->second;
        if (restart) {
            current.pattern_set = false;
            current.query_started = false;
        }
        // the first query of a scan fixes its pattern
        if (!current.pattern_set) {
            current.pattern = *pattern;
            current.pattern_set = true;
        }
        active_pattern = current.pattern;
    }

    Request req;
    req.op = Opcode::READDIR;
    req.fh = state.fh;
    req.ino = state.ino;
    req.name = std::move(active_pattern);
    // queries on one handle run one after the other, so where the previous
    // one stopped is only known when this one runs
    req.offset = 0;
    if (!restart) {
        req.request_flags |= READDIR_RESUME;
    }
    req.request_flags |= READDIR_CASELESS;
    if (*cls != FILE_NAMES_INFORMATION) {
        req.request_flags |= READDIR_ATTRS;
    }
    req.max_entries = (*flags & RETURN_SINGLE_ENTRY)
            ? 1
            : std::max<uint32_t>(1, *output_length / MIN_DIRECTORY_RECORD);
    userspacefs_smb_read(pinned, pin(req, state.ino));

    Pending pending;
    pending.file_id = id;
    pending.info_class = *cls;
    pending.output_length = *output_length;
    return dispatch(header, std::move(req), std::move(pending));
}

Result<Decoded> Codec::decode_query_info(const Header &header, std::string_view message)
{
    Reader reader(message, HEADER_SIZE);
    userspacefs_smb_read(structure_size, reader.u16());
    userspacefs_smb_read(type, reader.u8());
    userspacefs_smb_read(cls, reader.u8());
    userspacefs_smb_read(output_length, reader.u32());
    // input buffer offset, reserved, input buffer length, additional information, flags
    userspacefs_smb_read(skipped, reader.skip(2 + 2 + 4 + 4 + 4));
    userspacefs_smb_read(open, find_open(reader));
    const auto &[id, state] = *open;

    Pending pending;
    pending.info_type = *type;
    pending.info_class = *cls;
    pending.output_length = *output_length;
    pending.delete_pending = state.delete_pending;

    Request req;
    req.ino = state.ino;

    switch (*type) {
    case INFO_FILE:
    {
        if (!is_file_query_class(*cls)) {
            return local_error(header, NtStatus::INVALID_INFO_CLASS);
        }
        req.op = Opcode::GETATTR;
        req.fh = state.directory ? 0 : state.fh;
        userspacefs_smb_read(pinned, pin(req, state.ino));
        return dispatch(header, std::move(req), std::move(pending));
    }
    case INFO_FILESYSTEM:
    {
        Writer info;
        switch (*cls) {
        case FILE_FS_SIZE_INFORMATION:
        case FILE_FS_FULL_SIZE_INFORMATION:
            req.op = Opcode::STATFS;
            return dispatch(header, std::move(req), std::move(pending));
        case FILE_FS_VOLUME_INFORMATION:
        {
            const std::string label = utf8_to_utf16(m_options.share_name);
            info.u64(to_filetime(m_start_time));
            info.bytes(std::string_view(m_server_guid.data(), 4));
            info.u32(static_cast<uint32_t>(label.size()));
            // supports objects, reserved
            info.u8(0);
            info.u8(0);
            info.bytes(label);
            break;
        }
        case FILE_FS_DEVICE_INFORMATION:
            info.u32(FILE_DEVICE_DISK);
            info.u32(0);
            break;
        case FILE_FS_ATTRIBUTE_INFORMATION:
        {
            const std::string fs_name = utf8_to_utf16("userspacefs");
            info.u32(FS_ATTRIBUTES);
            info.u32(255);
            info.u32(static_cast<uint32_t>(fs_name.size()));
            info.bytes(fs_name);
            break;
        }
        default:
            return local_error(header, NtStatus::INVALID_INFO_CLASS);
        }

        Writer body;
        if (!write_info_body(body, info.data(), *output_length)) {
            return local_error(header, NtStatus::INFO_LENGTH_MISMATCH);
        }
        return local_reply(header, NtStatus::SUCCESS, body);
    }
    case INFO_SECURITY:
        return local_error(header, NtStatus::NOT_SUPPORTED);
    default:
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
}

Result<Decoded> Codec::decode_set_info(const Header &header, std::string_view message)
{
    Reader reader(message, HEADER_SIZE);
    userspacefs_smb_read(structure_size, reader.u16());
    userspacefs_smb_read(type, reader.u8());
    userspacefs_smb_read(cls, reader.u8());
    userspacefs_smb_read(length, reader.u32());
    userspacefs_smb_read(buffer_offset, reader.u16());
    // reserved, additional information
    userspacefs_smb_read(skipped, reader.skip(2 + 4));
    userspacefs_smb_read(open, find_open(reader));
    const auto &[id, state] = *open;
    userspacefs_smb_read(buffer, reader.at(*buffer_offset, *length));

    if (*type != INFO_FILE) {
        return local_error(header, NtStatus::NOT_SUPPORTED);
    }

    Writer done;
    done.u16(2);

    Reader info(*buffer);
    Request req;
    req.ino = state.ino;

    switch (*cls) {
    case FILE_BASIC_INFORMATION:
    {
        userspacefs_smb_read(creation_time, info.u64());
        userspacefs_smb_read(access_time, info.u64());
        userspacefs_smb_read(write_time, info.u64());
        userspacefs_smb_read(change_time, info.u64());
        userspacefs_smb_read(attributes, info.u32());

        req.op = Opcode::SETATTR;
        req.fh = state.directory ? 0 : state.fh;
        if (settable_time(*access_time)) {
            req.attr.valid |= Backend::SetAttr::ATIME;
            req.attr.atime = from_filetime(*access_time);
        }
        if (settable_time(*write_time)) {
            req.attr.valid |= Backend::SetAttr::MTIME;
            req.attr.mtime = from_filetime(*write_time);
        }
        if (req.attr.valid == 0) {
            // nothing POSIX can represent
            return local_reply(header, NtStatus::SUCCESS, done);
        }
        break;
    }
    case FILE_END_OF_FILE_INFORMATION:
    {
        userspacefs_smb_read(size, info.u64());
        if (state.directory) {
            return local_error(header, NtStatus::INVALID_PARAMETER);
        }
        req.op = Opcode::SETATTR;
        req.fh = state.fh;
        req.attr.valid = Backend::SetAttr::SIZE;
        req.attr.size = *size;
        break;
    }
    case FILE_ALLOCATION_INFORMATION:
        return local_reply(header, NtStatus::SUCCESS, done);
    case FILE_DISPOSITION_INFORMATION:
    {
        userspacefs_smb_read(delete_pending, info.u8());
        std::lock_guard lock(m_mutex);
        auto iter = m_opens.find(id);
        if (iter == m_opens.end()) {
            return make_result(FAILED, Errc::STALE_HANDLE);
        }
        iter->second.delete_pending = *delete_pending != 0;
        return local_reply(header, NtStatus::SUCCESS, done);
    }
    case FILE_RENAME_INFORMATION:
    {
        userspacefs_smb_read(replace, info.u8());
        // reserved, root directory
        userspacefs_smb_read(reserved, info.skip(7 + 8));
        userspacefs_smb_read(name_length, info.u32());
        userspacefs_smb_read(raw_name, info.bytes(*name_length));
        auto name = utf16_to_utf8(*raw_name);
        if (!name) {
            return local_error(header, NtStatus::OBJECT_NAME_INVALID);
        }
        auto components = split_path(*name);
        if (!components) {
            return local_error(header, NtStatus::OBJECT_NAME_INVALID);
        }
        if (components->empty()) {
            return make_result(FAILED, Errc::INVALID_ARGUMENT);
        }
        req.op = Opcode::RENAME;
        req.fh = state.fh;
        req.path = std::move(*components);
        req.flags = *replace ? 0 : RENAME_FLAG_NOREPLACE;
        break;
    }
    default:
        return local_error(header, NtStatus::NOT_SUPPORTED);
    }

    userspacefs_smb_read(pinned, pin(req, state.ino));
    return dispatch(header, std::move(req), Pending());
}

std::optional<std::string> Codec::reject(std::string_view frame, Errc err)
{
    auto header = parse_header(frame);
    if (!header) {
        // not SMB2, nothing to answer to
        return std::nullopt;
    }
    return error_reply(*header, to_ntstatus(err));
}

std::optional<std::string> Codec::encode(const Request &req, const Response &response)
{
    Pending pending;
    {
        std::lock_guard lock(m_mutex);
        auto iter = m_pending.find(req.unique);
        if (iter == m_pending.end()) {
            logger().error("no pending SMB2 message {} to answer", req.unique);
            return std::nullopt;
        }
        pending = std::move(iter->second);
        m_pending.erase(iter);
    }

    if (!response) {
        return error_reply(pending.header, to_ntstatus(response.error()));
    }
    return encode_payload(pending, req, *response);
}

std::optional<std::string> Codec::encode_cancelled(const Request &req)
{
    Pending pending;
    {
        std::lock_guard lock(m_mutex);
        auto iter = m_pending.find(req.unique);
        if (iter == m_pending.end()) {
            return std::nullopt;
        }
        pending = std::move(iter->second);
        m_pending.erase(iter);
    }
    return error_reply(pending.header, NtStatus::CANCELLED);
}

std::string Codec::encode_payload(const Pending &pending, const Request &req,
                                  const Payload &payload)
{
    const Header &header = pending.header;
    Writer body;

    switch (header.command) {
    case CREATE:
    {
        const auto *open = std::get_if<OpenReply>(&payload);
        if (!open) {
            break;
        }
        uint64_t id;
        {
            std::lock_guard lock(m_mutex);
            id = m_next_file_id++;
            m_opens[id] = Open{open->fh, open->entry.ino, open->directory,
                               pending.delete_on_close};
        }

        const Backend::Stat &attr = open->entry.attr;
        body.u16(89);
        // oplock level, flags
        body.u8(0);
        body.u8(0);
        body.u32(static_cast<uint32_t>(open->action));
        write_times(body, attr);
        body.u64(allocation_size(attr));
        body.u64(attr.size);
        body.u32(file_attributes(attr));
        body.u32(0);
        body.u64(id);
        body.u64(id);
        // no create contexts
        body.u32(0);
        body.u32(0);
        return reply(header, NtStatus::SUCCESS, body);
    }
    case CLOSE:
    {
        body.u16(60);
        if (const auto *attr = std::get_if<AttrReply>(&payload)) {
            body.u16(CLOSE_FLAG_POSTQUERY_ATTRIB);
            body.u32(0);
            write_times(body, attr->attr);
            body.u64(allocation_size(attr->attr));
            body.u64(attr->attr.size);
            body.u32(file_attributes(attr->attr));
        } else {
            body.zeros(2 + 4 + 32 + 8 + 8 + 4);
        }
        return reply(header, NtStatus::SUCCESS, body);
    }
    case FLUSH:
    {
        if (!std::holds_alternative<EmptyReply>(payload)) {
            break;
        }
        body.u16(4);
        body.u16(0);
        return reply(header, NtStatus::SUCCESS, body);
    }
    case SET_INFO:
    {
        // SETATTR answers with the new attributes, which SMB2 does not return
        if (!std::holds_alternative<EmptyReply>(payload) &&
                !std::holds_alternative<AttrReply>(payload)) {
            break;
        }
        body.u16(2);
        return reply(header, NtStatus::SUCCESS, body);
    }
    case READ:
    {
        const auto *data = std::get_if<DataReply>(&payload);
        if (!data) {
            break;
        }
        if (data->data.empty() && req.size > 0) {
            return error_reply(header, NtStatus::END_OF_FILE);
        }
        body.u16(17);
        body.u8(static_cast<uint8_t>(HEADER_SIZE + 16));
        body.u8(0);
        body.u32(static_cast<uint32_t>(data->data.size()));
        // remaining, reserved
        body.u32(0);
        body.u32(0);
        body.bytes(data->data);
        return reply(header, NtStatus::SUCCESS, body);
    }
    case WRITE:
    {
        const auto *written = std::get_if<WriteReply>(&payload);
        if (!written) {
            break;
        }
        body.u16(17);
        body.u16(0);
        body.u32(written->count);
        // remaining, channel info offset and length
        body.u32(0);
        body.u16(0);
        body.u16(0);
        return reply(header, NtStatus::SUCCESS, body);
    }
    case QUERY_DIRECTORY:
    {
        const auto *dir = std::get_if<DirReply>(&payload);
        if (!dir) {
            break;
        }
        return encode_directory(pending, req, *dir);
    }
    case QUERY_INFO:
    {
        Writer info;
        if (const auto *attr = std::get_if<AttrReply>(&payload)) {
            switch (pending.info_class) {
            case FILE_BASIC_INFORMATION:
                write_basic(info, attr->attr);
                break;
            case FILE_STANDARD_INFORMATION:
                write_standard(info, attr->attr, pending.delete_pending);
                break;
            case FILE_INTERNAL_INFORMATION:
                info.u64(attr->attr.ino);
                break;
            case FILE_EA_INFORMATION:
                info.u32(0);
                break;
            case FILE_NETWORK_OPEN_INFORMATION:
                write_network_open(info, attr->attr);
                break;
            case FILE_ALL_INFORMATION:
                write_all(info, attr->attr, pending.delete_pending);
                break;
            case FILE_ATTRIBUTE_TAG_INFORMATION:
                info.u32(file_attributes(attr->attr));
                info.u32(0);
                break;
            default:
                return error_reply(header, NtStatus::INVALID_INFO_CLASS);
            }
        } else if (const auto *st = std::get_if<StatfsReply>(&payload)) {
            write_fs_size(info, st->st, pending.info_class == FILE_FS_FULL_SIZE_INFORMATION);
        } else {
            break;
        }

        if (!write_info_body(body, info.data(), pending.output_length)) {
            return error_reply(header, NtStatus::INFO_LENGTH_MISMATCH);
        }
        return reply(header, NtStatus::SUCCESS, body);
    }
    default:
        break;
    }

    logger().error("SMB2 command {:#x} got an unexpected {} payload", header.command,
                   opcode_name(req.op));
    return error_reply(header, NtStatus::UNEXPECTED_IO_ERROR);
}

std::string Codec::encode_directory(const Pending &pending, const Request &req,
                                    const DirReply &reply_data)
{
    const Header &header = pending.header;

    if (reply_data.entries.empty()) {
        bool started = false;
        {
            std::lock_guard lock(m_mutex);
            auto iter = m_opens.find(pending.file_id);
            if (iter != m_opens.end()) {
                started = iter->second.query_started;
            }
        }
        return error_reply(header, started ? NtStatus::NO_MORE_FILES : NtStatus::NO_SUCH_FILE);
    }

    Writer records;
    size_t last_start = 0;
    uint64_t last_offset = 0;
    size_t count = 0;
    for (const auto &item: reply_data.entries) {
        const std::string record = directory_record(pending.info_class, item);
        size_t start = records.size();
        if (count > 0) {
            start = (start + 7) / 8 * 8;
        }
        if (start + record.size() > pending.output_length) {
            // stays buffered in the cursor for the next query
            break;
        }
        if (count > 0) {
            records.align(8);
            records.put_u32(last_start, static_cast<uint32_t>(start - last_start));
        }
        records.bytes(record);
        last_start = start;
        last_offset = item.offset;
        ++count;
    }

    if (count == 0) {
        return error_reply(header, NtStatus::INFO_LENGTH_MISMATCH);
    }

    {
        std::lock_guard lock(m_mutex);
        auto iter = m_opens.find(pending.file_id);
        if (iter != m_opens.end()) {
            iter->second.query_started = true;
        }
    }
    // the cursor is only touched by the query on this handle that is running
    auto cursor = m_registry.cursor(req.fh);
    if (cursor) {
        (*cursor)->resume_offset = last_offset;
    }

    Writer body;
    // the record list was sized to fit above
    write_info_body(body, records.data(), pending.output_length);
    return reply(header, NtStatus::SUCCESS, body);
}

void Codec::teardown()
{
    {
        std::lock_guard lock(m_mutex);
        m_pending.clear();
        m_opens.clear();
        m_trees.clear();
        m_sessions.clear();
    }
    const size_t closed = close_all(m_registry.clear());
    if (closed > 0) {
        logger().info("closed {} objects left open by the SMB2 client", closed);
    }
}

#undef userspacefs_smb_read

}
