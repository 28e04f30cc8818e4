/**********************************************************************
File name: buffer.cpp
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
#include "userspacefs/fuse/buffer.hpp"

#include <cstddef>

#include <sys/stat.h>

#include <linux/fuse.h>

namespace Userspacefs::Fuse {

Result<std::string_view> FrameReader::read_name()
{
    const size_t end = m_data.find('\0');
    if (end == std::string_view::npos) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }
    std::string_view result = m_data.substr(0, end);
    m_data.remove_prefix(end + 1);
    return result;
}

Result<std::string_view> FrameReader::read_bytes(size_t count)
{
    if (m_data.size() < count) {
        return make_result(FAILED, Errc::MALFORMED_REQUEST);
    }
    std::string_view result = m_data.substr(0, count);
    m_data.remove_prefix(count);
    return result;
}

ReplyBuffer::ReplyBuffer(uint64_t unique):
    m_unique(unique),
    m_buf(sizeof(fuse_out_header), '\0')
{

}

void ReplyBuffer::append(const void *data, size_t size)
{
    m_buf.append(static_cast<const char*>(data), size);
}

std::string ReplyBuffer::finish()
{
    fuse_out_header header{
        .len = static_cast<uint32_t>(m_buf.size()),
        .error = 0,
        .unique = m_unique,
    };
    std::memcpy(m_buf.data(), &header, sizeof(header));
    return std::move(m_buf);
}

std::string ReplyBuffer::error(uint64_t unique, int err)
{
    fuse_out_header header{
        .len = sizeof(fuse_out_header),
        .error = -err,
        .unique = unique,
    };
    return std::string(reinterpret_cast<const char*>(&header), sizeof(header));
}

DirBuffer::DirBuffer(size_t limit):
    m_limit(limit)
{

}

size_t DirBuffer::prepare_add(std::string_view name)
{
    const size_t old_size = m_buf.size();
    const size_t new_size = old_size + FUSE_DIRENT_ALIGN(FUSE_NAME_OFFSET + name.size());
    if (new_size > m_limit) {
        return std::string::npos;
    }
    m_buf.resize(new_size, '\0');
    return old_size;
}

bool DirBuffer::add(std::string_view name, uint64_t ino, uint32_t mode, uint64_t off)
{
    const size_t old_size = prepare_add(name);
    if (old_size == std::string::npos) {
        return false;
    }

    // fixed part of fuse_dirent, which ends in a flexible array
    struct {
        uint64_t ino;
        uint64_t off;
        uint32_t namelen;
        uint32_t type;
    } dirent{ino, off, static_cast<uint32_t>(name.size()), (mode & S_IFMT) >> 12};
    static_assert(sizeof(dirent) == FUSE_NAME_OFFSET);
    std::memcpy(&m_buf[old_size], &dirent, FUSE_NAME_OFFSET);
    std::memcpy(&m_buf[old_size + FUSE_NAME_OFFSET], name.data(), name.size());
    return true;
}

}
