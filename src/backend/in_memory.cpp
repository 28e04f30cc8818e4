/**********************************************************************
File name: in_memory.cpp
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
#include "userspacefs/backend/in_memory.hpp"

#include <algorithm>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace Userspacefs::Backend {

static struct timespec now()
{
    struct timespec ts{};
    clock_gettime(CLOCK_REALTIME, &ts);
    return ts;
}

static bool is_writable(int flags)
{
    return (flags & O_ACCMODE) == O_WRONLY || (flags & O_ACCMODE) == O_RDWR;
}

namespace InMemory {

Node::Node(const Stat &attr):
    m_attr(attr)
{

}

void Node::update_attr(const Stat &new_attr)
{
    auto mode_backup = m_attr.mode;
    m_attr = new_attr;
    m_attr.mode = (mode_backup & S_IFMT) | (m_attr.mode & ~S_IFMT);
}

Result<std::shared_ptr<Node>> Node::find(std::string_view)
{
    return make_result(FAILED, Errc::NOT_A_DIRECTORY);
}

Node::~Node() = default;



File::File():
    Node(Stat{
         .mode = S_IFREG,
         .nlink = 1,
    })
{

}

File::~File() = default;


Link::Link():
    Link("")
{

}

Link::Link(std::string_view destination):
    Node(Stat{
         .mode = S_IFLNK | 0777,
         .size = destination.size(),
         .nlink = 1,
    }),
    m_destination(destination)
{

}

Link::~Link() = default;


Directory::Directory():
    Node(Stat{
         .mode = S_IFDIR,
         .nlink = 2,
    })
{

}

Directory::~Directory() = default;

Result<std::shared_ptr<Node>> Directory::find(std::string_view path)
{
    if (path.empty()) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }

    if (path[0] != '/') {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    path.remove_prefix(1);

    if (path.empty()) {
        return shared_from_this();
    }

    auto next_slash = path.find_first_of('/');
    std::string_view child_name;
    std::string_view remainder;
    if (next_slash == std::string_view::npos) {
        child_name = path;
    } else if (next_slash == 0) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    } else {
        child_name = path.substr(0, next_slash);
        remainder = path.substr(next_slash);
    }

    auto child_node_iter = m_children.find(child_name);
    if (child_node_iter == m_children.end()) {
        return make_result(FAILED, Errc::NOT_FOUND);
    }

    if (remainder.empty()) {
        return child_node_iter->second;
    }

    return child_node_iter->second->find(remainder);
}

DirHandle::DirHandle(InMemoryFilesystem &fs, std::shared_ptr<Directory> node):
    m_fs(&fs),
    m_node(std::move(node)),
    m_started(false)
{

}

Result<std::optional<DirEntry>> DirHandle::readdir(const CancelToken &token)
{
    if (token.cancelled()) {
        return make_result(FAILED, Errc::CANCELLED);
    }

    std::lock_guard lock(m_fs->m_mutex);
    auto &children = m_node->children();
    // Resume after the last name handed out so that concurrent changes to
    // the directory never invalidate the position.
    auto iter = m_started ? children.upper_bound(m_last) : children.begin();
    if (iter == children.end()) {
        return std::optional<DirEntry>();
    }

    m_started = true;
    m_last = iter->first;
    return std::optional<DirEntry>(DirEntry{
        iter->second->attr(),
        iter->first,
        true,
    });
}

Result<void> DirHandle::fsyncdir()
{
    return make_result();
}

Result<void> DirHandle::closedir()
{
    m_node.reset();
    return make_result();
}

DirHandle::~DirHandle() = default;

FileHandle::FileHandle(InMemoryFilesystem &fs, std::shared_ptr<InMemory::File> file):
    m_fs(&fs),
    m_file(std::move(file))
{

}

FileHandle::~FileHandle() = default;

Result<Stat> FileHandle::fstat()
{
    std::lock_guard lock(m_fs->m_mutex);
    return m_file->attr();
}

Result<ssize_t> FileHandle::pread(void *buf, size_t count, off_t offset,
                                  const CancelToken &token)
{
    if (offset < 0) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    if (token.cancelled()) {
        return make_result(FAILED, Errc::CANCELLED);
    }

    std::lock_guard lock(m_fs->m_mutex);
    auto &data = m_file->data();
    if (static_cast<size_t>(offset) >= data.size()) {
        return ssize_t(0);
    }
    const std::size_t end_offset = offset + count;
    if (end_offset > data.size()) {
        count -= (end_offset - data.size());
    }
    memcpy(buf, &data[offset], count);
    m_file->attr().atime = now();
    return static_cast<ssize_t>(count);
}

Result<ssize_t> FileHandle::pwrite(const void *buf, size_t count, off_t offset,
                                   const CancelToken &token)
{
    if (offset < 0) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    if (token.cancelled()) {
        return make_result(FAILED, Errc::CANCELLED);
    }

    std::lock_guard lock(m_fs->m_mutex);
    const std::size_t required_size = offset + count;
    auto &data = m_file->data();
    if (data.size() < required_size) {
        auto resize_result = m_fs->resize_locked(*m_file, required_size);
        if (!resize_result) {
            return copy_error(resize_result);
        }
    }
    if (count > 0) {
        memcpy(&data[offset], buf, count);
    }
    auto &attr = m_file->attr();
    attr.mtime = attr.ctime = now();
    return static_cast<ssize_t>(count);
}

Result<void> FileHandle::ftruncate(off_t length)
{
    if (length < 0) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }

    std::lock_guard lock(m_fs->m_mutex);
    auto resize_result = m_fs->resize_locked(*m_file, static_cast<uint64_t>(length));
    if (!resize_result) {
        return resize_result;
    }
    auto &attr = m_file->attr();
    attr.mtime = attr.ctime = now();
    return make_result();
}

Result<void> FileHandle::flush()
{
    return make_result();
}

Result<void> FileHandle::fsync(bool)
{
    return make_result();
}

Result<void> FileHandle::close()
{
    return make_result();
}

}

InMemoryFilesystem::InMemoryFilesystem():
    m_root(std::make_shared<InMemory::Directory>()),
    m_capacity(DEFAULT_CAPACITY),
    m_used(0),
    m_next_ino(2)
{
    m_root->update_attr(make_attr(S_IFDIR | 0755));
    m_root->attr().ino = 1;
}

InMemoryFilesystem::~InMemoryFilesystem() = default;

void InMemoryFilesystem::set_capacity(uint64_t bytes)
{
    std::lock_guard lock(m_mutex);
    m_capacity = bytes;
}

Stat InMemoryFilesystem::make_attr(uint32_t mode)
{
    const auto ts = now();
    return Stat{
        .mode = mode,
        .size = 0,
        .ino = m_next_ino++,
        .nlink = S_ISDIR(mode) ? 2u : 1u,
        .uid = getuid(),
        .gid = getgid(),
        .atime = ts,
        .mtime = ts,
        .ctime = ts,
    };
}

Result<std::shared_ptr<InMemory::Node>> InMemoryFilesystem::find_locked(std::string_view path)
{
    return m_root->find(path);
}

Result<std::shared_ptr<InMemory::Directory>> InMemoryFilesystem::find_parent_locked(
        std::string_view path,
        std::string &leaf)
{
    if (path.empty() || path[0] != '/') {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    const auto last_slash = path.find_last_of('/');
    leaf = std::string(path.substr(last_slash + 1));
    if (leaf.empty()) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }

    auto parent = find_locked(last_slash == 0 ? std::string_view("/") : path.substr(0, last_slash));
    if (!parent) {
        return copy_error(parent);
    }
    auto dir = std::dynamic_pointer_cast<InMemory::Directory>(*parent);
    if (!dir) {
        return make_result(FAILED, Errc::NOT_A_DIRECTORY);
    }
    return dir;
}

Result<void> InMemoryFilesystem::resize_locked(InMemory::File &file, uint64_t new_size)
{
    auto &data = file.data();
    if (new_size > data.size()) {
        const uint64_t growth = new_size - data.size();
        if (m_used + growth > m_capacity) {
            return make_result(FAILED, Errc::NO_SPACE);
        }
        m_used += growth;
    } else {
        m_used -= std::min<uint64_t>(m_used, data.size() - new_size);
    }
    data.resize(new_size);
    file.attr().size = new_size;
    return make_result();
}

Result<std::unique_ptr<File> > InMemoryFilesystem::open(std::string_view path, int flags, mode_t mode)
{
    std::lock_guard lock(m_mutex);

    auto node = find_locked(path);
    if (!node && node.error() == Errc::NOT_FOUND && (flags & O_CREAT)) {
        std::string leaf;
        auto parent = find_parent_locked(path, leaf);
        if (!parent) {
            return copy_error(parent);
        }
        auto &file = (*parent)->emplace<InMemory::File>(leaf);
        file.update_attr(make_attr(S_IFREG | (mode & 07777)));
        (*parent)->attr().mtime = (*parent)->attr().ctime = now();
        return std::make_unique<InMemory::FileHandle>(
                    *this,
                    std::static_pointer_cast<InMemory::File>(file.shared_from_this()));
    }
    if (!node) {
        return copy_error(node);
    }

    if ((flags & O_CREAT) && (flags & O_EXCL)) {
        return make_result(FAILED, Errc::EXISTS);
    }
    if (std::dynamic_pointer_cast<InMemory::Directory>(*node)) {
        return make_result(FAILED, Errc::IS_A_DIRECTORY);
    }
    auto file = std::dynamic_pointer_cast<InMemory::File>(*node);
    if (!file) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    if ((flags & O_TRUNC) && is_writable(flags)) {
        auto resize_result = resize_locked(*file, 0);
        if (!resize_result) {
            return copy_error(resize_result);
        }
        file->attr().mtime = file->attr().ctime = now();
    }
    return std::make_unique<InMemory::FileHandle>(*this, std::move(file));
}

Result<std::unique_ptr<Dir> > InMemoryFilesystem::opendir(std::string_view path)
{
    std::lock_guard lock(m_mutex);

    auto node = find_locked(path);
    if (!node) {
        return copy_error(node);
    }
    auto dir = std::dynamic_pointer_cast<InMemory::Directory>(*node);
    if (!dir) {
        return make_result(FAILED, Errc::NOT_A_DIRECTORY);
    }
    return std::make_unique<InMemory::DirHandle>(*this, std::move(dir));
}

Result<Stat> InMemoryFilesystem::lstat(std::string_view path)
{
    std::lock_guard lock(m_mutex);

    auto node = find_locked(path);
    if (!node) {
        return copy_error(node);
    }
    return (*node)->attr();
}

Result<void> InMemoryFilesystem::setattr(std::string_view path, const SetAttr &attr)
{
    std::lock_guard lock(m_mutex);

    auto node = find_locked(path);
    if (!node) {
        return copy_error(node);
    }

    auto &current = (*node)->attr();
    if (attr.has(SetAttr::SIZE)) {
        auto file = std::dynamic_pointer_cast<InMemory::File>(*node);
        if (!file) {
            return make_result(FAILED, S_ISDIR(current.mode) ? Errc::IS_A_DIRECTORY
                                                            : Errc::INVALID_ARGUMENT);
        }
        auto resize_result = resize_locked(*file, attr.size);
        if (!resize_result) {
            return resize_result;
        }
        current.mtime = now();
    }
    if (attr.has(SetAttr::MODE)) {
        current.mode = (current.mode & S_IFMT) | (attr.mode & 07777);
    }
    if (attr.has(SetAttr::UID)) {
        current.uid = attr.uid;
    }
    if (attr.has(SetAttr::GID)) {
        current.gid = attr.gid;
    }
    if (attr.has(SetAttr::ATIME_NOW)) {
        current.atime = now();
    } else if (attr.has(SetAttr::ATIME)) {
        current.atime = attr.atime;
    }
    if (attr.has(SetAttr::MTIME_NOW)) {
        current.mtime = now();
    } else if (attr.has(SetAttr::MTIME)) {
        current.mtime = attr.mtime;
    }
    current.ctime = now();
    return make_result();
}

Result<std::string> InMemoryFilesystem::readlink(std::string_view path)
{
    std::lock_guard lock(m_mutex);

    auto node = find_locked(path);
    if (!node) {
        return copy_error(node);
    }
    auto link = std::dynamic_pointer_cast<InMemory::Link>(*node);
    if (!link) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    return link->destination();
}

Result<void> InMemoryFilesystem::mkdir(std::string_view path, mode_t mode)
{
    std::lock_guard lock(m_mutex);

    std::string leaf;
    auto parent = find_parent_locked(path, leaf);
    if (!parent) {
        return copy_error(parent);
    }
    auto &children = (*parent)->children();
    if (children.find(leaf) != children.end()) {
        return make_result(FAILED, Errc::EXISTS);
    }
    (*parent)->emplace<InMemory::Directory>(leaf).update_attr(make_attr(S_IFDIR | (mode & 07777)));
    auto &parent_attr = (*parent)->attr();
    parent_attr.nlink += 1;
    parent_attr.mtime = parent_attr.ctime = now();
    return make_result();
}

Result<void> InMemoryFilesystem::rmdir(std::string_view path)
{
    std::lock_guard lock(m_mutex);

    std::string leaf;
    auto parent = find_parent_locked(path, leaf);
    if (!parent) {
        return copy_error(parent);
    }
    auto &children = (*parent)->children();
    auto iter = children.find(leaf);
    if (iter == children.end()) {
        return make_result(FAILED, Errc::NOT_FOUND);
    }
    auto dir = std::dynamic_pointer_cast<InMemory::Directory>(iter->second);
    if (!dir) {
        return make_result(FAILED, Errc::NOT_A_DIRECTORY);
    }
    if (!dir->children().empty()) {
        return make_result(FAILED, Errc::NOT_EMPTY);
    }
    children.erase(iter);
    auto &parent_attr = (*parent)->attr();
    parent_attr.nlink -= 1;
    parent_attr.mtime = parent_attr.ctime = now();
    return make_result();
}

Result<void> InMemoryFilesystem::unlink(std::string_view path)
{
    std::lock_guard lock(m_mutex);

    std::string leaf;
    auto parent = find_parent_locked(path, leaf);
    if (!parent) {
        return copy_error(parent);
    }
    auto &children = (*parent)->children();
    auto iter = children.find(leaf);
    if (iter == children.end()) {
        return make_result(FAILED, Errc::NOT_FOUND);
    }
    if (std::dynamic_pointer_cast<InMemory::Directory>(iter->second)) {
        return make_result(FAILED, Errc::IS_A_DIRECTORY);
    }
    if (auto file = std::dynamic_pointer_cast<InMemory::File>(iter->second)) {
        m_used -= std::min<uint64_t>(m_used, file->data().size());
    }
    iter->second->attr().nlink = 0;
    children.erase(iter);
    (*parent)->attr().mtime = (*parent)->attr().ctime = now();
    return make_result();
}

Result<void> InMemoryFilesystem::rename(std::string_view from, std::string_view to, bool replace)
{
    std::lock_guard lock(m_mutex);

    std::string from_leaf;
    auto from_parent = find_parent_locked(from, from_leaf);
    if (!from_parent) {
        return copy_error(from_parent);
    }
    std::string to_leaf;
    auto to_parent = find_parent_locked(to, to_leaf);
    if (!to_parent) {
        return copy_error(to_parent);
    }

    auto &from_children = (*from_parent)->children();
    auto from_iter = from_children.find(from_leaf);
    if (from_iter == from_children.end()) {
        return make_result(FAILED, Errc::NOT_FOUND);
    }
    if (from == to) {
        return make_result();
    }

    auto source = from_iter->second;
    const bool source_is_dir = S_ISDIR(source->attr().mode);
    if (source_is_dir && to.size() > from.size() &&
            to.substr(0, from.size()) == from && to[from.size()] == '/') {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }

    auto &to_children = (*to_parent)->children();
    auto to_iter = to_children.find(to_leaf);
    if (to_iter != to_children.end()) {
        if (!replace) {
            return make_result(FAILED, Errc::EXISTS);
        }
        auto target_dir = std::dynamic_pointer_cast<InMemory::Directory>(to_iter->second);
        if (target_dir && !source_is_dir) {
            return make_result(FAILED, Errc::IS_A_DIRECTORY);
        }
        if (!target_dir && source_is_dir) {
            return make_result(FAILED, Errc::NOT_A_DIRECTORY);
        }
        if (target_dir && !target_dir->children().empty()) {
            return make_result(FAILED, Errc::NOT_EMPTY);
        }
        if (auto file = std::dynamic_pointer_cast<InMemory::File>(to_iter->second)) {
            m_used -= std::min<uint64_t>(m_used, file->data().size());
        }
        if (target_dir) {
            (*to_parent)->attr().nlink -= 1;
        }
        to_children.erase(to_iter);
    }

    from_children.erase(from_iter);
    to_children.emplace(to_leaf, source);
    if (source_is_dir) {
        (*from_parent)->attr().nlink -= 1;
        (*to_parent)->attr().nlink += 1;
    }
    const auto ts = now();
    (*from_parent)->attr().mtime = (*from_parent)->attr().ctime = ts;
    (*to_parent)->attr().mtime = (*to_parent)->attr().ctime = ts;
    source->attr().ctime = ts;
    return make_result();
}

Result<void> InMemoryFilesystem::symlink(std::string_view target, std::string_view path)
{
    std::lock_guard lock(m_mutex);

    std::string leaf;
    auto parent = find_parent_locked(path, leaf);
    if (!parent) {
        return copy_error(parent);
    }
    auto &children = (*parent)->children();
    if (children.find(leaf) != children.end()) {
        return make_result(FAILED, Errc::EXISTS);
    }
    auto &link = (*parent)->emplace<InMemory::Link>(leaf, target);
    auto attr = make_attr(S_IFLNK | 0777);
    attr.size = target.size();
    link.update_attr(attr);
    link.attr().size = target.size();
    (*parent)->attr().mtime = (*parent)->attr().ctime = now();
    return make_result();
}

Result<StatVfs> InMemoryFilesystem::statfs()
{
    std::lock_guard lock(m_mutex);

    static constexpr uint32_t BLOCK_SIZE = 4096;
    static constexpr uint64_t MAX_FILES = 1 << 20;
    const uint64_t free_blocks = (m_capacity - std::min(m_used, m_capacity)) / BLOCK_SIZE;
    return StatVfs{
        .bsize = BLOCK_SIZE,
        .frsize = BLOCK_SIZE,
        .blocks = m_capacity / BLOCK_SIZE,
        .bfree = free_blocks,
        .bavail = free_blocks,
        .files = MAX_FILES,
        .ffree = MAX_FILES - std::min(m_next_ino, MAX_FILES),
        .namemax = 255,
    };
}

}
