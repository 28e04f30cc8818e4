/**********************************************************************
File name: in_memory.hpp
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
#ifndef USERSPACEFS_BACKEND_IN_MEMORY_H
#define USERSPACEFS_BACKEND_IN_MEMORY_H

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "userspacefs/backend.hpp"

namespace Userspacefs::Backend {

class InMemoryFilesystem;

namespace InMemory {

class Node: public std::enable_shared_from_this<Node> {
public:
    Node() = default;
    explicit Node(const Stat &attr);
    Node(const Node &src) = delete;
    Node(Node &&src) = delete;
    Node &operator=(const Node &src) = delete;
    Node &operator=(Node &&src) = delete;
    virtual ~Node();

private:
    Stat m_attr{};

public:
    [[nodiscard]] Stat &attr() {
        return m_attr;
    }

    void update_attr(const Stat &new_attr);

    virtual Result<std::shared_ptr<Node>> find(std::string_view path);

};

class File: public Node {
public:
    File();
    File(const File &src) = delete;
    File(File &&src) = delete;
    File &operator=(const File &src) = delete;
    File &operator=(File &&src) = delete;
    ~File() override;

private:
    std::basic_string<std::byte> m_data;

public:
    [[nodiscard]] std::basic_string<std::byte> &data() {
        return m_data;
    }

};

class FileHandle: public Userspacefs::Backend::File {
public:
    FileHandle() = delete;
    FileHandle(InMemoryFilesystem &fs, std::shared_ptr<InMemory::File> file);
    ~FileHandle() override;

private:
    InMemoryFilesystem *m_fs;
    std::shared_ptr<InMemory::File> m_file;

    // File interface
public:
    Result<Stat> fstat() override;
    Result<ssize_t> pread(void *buf, size_t count, off_t offset,
                          const CancelToken &token) override;
    Result<ssize_t> pwrite(const void *buf, size_t count, off_t offset,
                           const CancelToken &token) override;
    Result<void> ftruncate(off_t length) override;
    Result<void> flush() override;
    Result<void> fsync(bool datasync) override;
    Result<void> close() override;
};

class Link: public Node {
public:
    Link();
    explicit Link(std::string_view destination);
    Link(const Link &src) = delete;
    Link(Link &&src) = delete;
    Link &operator=(const Link &src) = delete;
    Link &operator=(Link &&src) = delete;
    ~Link() override;

private:
    std::string m_destination;

public:
    [[nodiscard]] std::string &destination() {
        return m_destination;
    }

};

class Directory: public Node {
public:
    using Children = std::map<std::string, std::shared_ptr<Node>, std::less<>>;

public:
    Directory();
    Directory(const Directory &src) = delete;
    Directory(Directory &&src) = delete;
    Directory &operator=(const Directory &src) = delete;
    Directory &operator=(Directory &&src) = delete;
    ~Directory() override;

private:
    Children m_children;

public:
    [[nodiscard]] Children &children() {
        return m_children;
    }

    template<typename T, typename... Args>
    T &emplace(std::string_view name, Args&&... args)
    {
        auto ptr = std::make_shared<T>(std::forward<Args>(args)...);
        T &ref = *ptr;
        m_children.insert_or_assign(std::string(name), std::move(ptr));
        return ref;
    }

    Result<std::shared_ptr<Node>> find(std::string_view path) override;

};

class DirHandle: public Userspacefs::Backend::Dir {
public:
    DirHandle() = delete;
    DirHandle(InMemoryFilesystem &fs, std::shared_ptr<Directory> node);
    ~DirHandle() override;

private:
    InMemoryFilesystem *m_fs;
    std::shared_ptr<Directory> m_node;
    bool m_started;
    std::string m_last;

    // Dir interface
public:
    Result<std::optional<DirEntry>> readdir(const CancelToken &token) override;
    Result<void> fsyncdir() override;
    Result<void> closedir() override;
};

}

/**
 * Thread-safe file system held entirely in memory.
 *
 * All nodes are guarded by a single mutex. Open files keep their node alive
 * after it has been unlinked.
 */
class InMemoryFilesystem: public Filesystem {
public:
    static constexpr uint64_t DEFAULT_CAPACITY = uint64_t(1) << 30;

public:
    InMemoryFilesystem();
    ~InMemoryFilesystem() override;

private:
    std::mutex m_mutex;
    std::shared_ptr<InMemory::Directory> m_root;
    uint64_t m_capacity;
    uint64_t m_used;
    uint64_t m_next_ino;

    Stat make_attr(uint32_t mode);
    Result<std::shared_ptr<InMemory::Node>> find_locked(std::string_view path);
    Result<std::shared_ptr<InMemory::Directory>> find_parent_locked(std::string_view path,
                                                                    std::string &leaf);
    Result<void> resize_locked(InMemory::File &file, uint64_t new_size);

    friend class InMemory::FileHandle;
    friend class InMemory::DirHandle;

public:
    /**
     * Root directory; nodes emplaced here directly bypass locking and are
     * meant for populating the tree before it is shared.
     */
    [[nodiscard]] InMemory::Directory &root() {
        return *m_root;
    }

    void set_capacity(uint64_t bytes);

    [[nodiscard]] uint64_t used() {
        std::lock_guard lock(m_mutex);
        return m_used;
    }

    // Filesystem interface
public:
    [[nodiscard]] Result<std::unique_ptr<File> > open(std::string_view path, int flags, mode_t mode) override;
    [[nodiscard]] Result<std::unique_ptr<Dir> > opendir(std::string_view path) override;
    [[nodiscard]] Result<Stat> lstat(std::string_view path) override;
    [[nodiscard]] Result<void> setattr(std::string_view path, const SetAttr &attr) override;
    [[nodiscard]] Result<std::string> readlink(std::string_view path) override;
    [[nodiscard]] Result<void> mkdir(std::string_view path, mode_t mode) override;
    [[nodiscard]] Result<void> rmdir(std::string_view path) override;
    [[nodiscard]] Result<void> unlink(std::string_view path) override;
    [[nodiscard]] Result<void> rename(std::string_view from, std::string_view to, bool replace) override;
    [[nodiscard]] Result<void> symlink(std::string_view target, std::string_view path) override;
    [[nodiscard]] Result<StatVfs> statfs() override;
};

}

#endif
