/**********************************************************************
File name: backend.hpp
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
#ifndef USERSPACEFS_BACKEND_H
#define USERSPACEFS_BACKEND_H

#include <atomic>
#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

#include "userspacefs/error.hpp"

namespace Userspacefs::Backend {

struct Stat {
    uint32_t mode;
    uint64_t size;
    uint64_t ino;
    uint32_t nlink;
    uint32_t uid;
    uint32_t gid;
    struct timespec atime, mtime, ctime;
};


struct DirEntry: public Stat {
    std::string name;
    /**
     * True if all Stat fields are filled; otherwise only the file type bits
     * of mode are valid.
     */
    bool complete;
};


struct StatVfs {
    uint32_t bsize;
    uint32_t frsize;
    uint64_t blocks;
    uint64_t bfree;
    uint64_t bavail;
    uint64_t files;
    uint64_t ffree;
    uint32_t namemax;
};


struct SetAttr {
    enum Field: uint32_t {
        MODE = 1 << 0,
        UID = 1 << 1,
        GID = 1 << 2,
        SIZE = 1 << 3,
        ATIME = 1 << 4,
        MTIME = 1 << 5,
        ATIME_NOW = 1 << 6,
        MTIME_NOW = 1 << 7,
    };

    uint32_t valid;
    uint32_t mode;
    uint32_t uid;
    uint32_t gid;
    uint64_t size;
    struct timespec atime, mtime;

    [[nodiscard]] inline bool has(Field field) const {
        return (valid & field) != 0;
    }
};


/**
 * Cooperative cancellation flag handed to backend calls which may block.
 *
 * Backends check it at safe points and return Errc::CANCELLED.
 */
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken &src) = delete;
    CancelToken &operator=(const CancelToken &src) = delete;

private:
    std::atomic<bool> m_cancelled{false};

public:
    inline void cancel() {
        m_cancelled.store(true, std::memory_order_release);
    }

    [[nodiscard]] inline bool cancelled() const {
        return m_cancelled.load(std::memory_order_acquire);
    }

    static const CancelToken &never();
};


class File {
public:
    virtual ~File();

public:
    virtual Result<Stat> fstat() = 0;
    virtual Result<ssize_t> pread(void *buf, size_t count, off_t offset,
                                  const CancelToken &token) = 0;
    virtual Result<ssize_t> pwrite(const void *buf, size_t count, off_t offset,
                                   const CancelToken &token) = 0;
    virtual Result<void> ftruncate(off_t length);
    virtual Result<void> flush();
    virtual Result<void> fsync(bool datasync) = 0;
    virtual Result<void> close() = 0;

};


class Dir {
public:
    virtual ~Dir();

public:
    /**
     * Return the next entry, or an empty optional at the end of the stream.
     *
     * "." and ".." are never returned.
     */
    virtual Result<std::optional<DirEntry>> readdir(const CancelToken &token) = 0;
    virtual Result<void> fsyncdir();
    virtual Result<void> closedir() = 0;

};

/**
 * Capability interface a backend implements.
 *
 * All paths are absolute, '/'-separated and relative to the root of the
 * exported file system. Implementations must tolerate concurrent calls for
 * different paths. Every operation a backend does not implement returns
 * Errc::NOT_SUPPORTED.
 */
class Filesystem {
public:
    virtual ~Filesystem();

public:
    virtual Result<std::unique_ptr<File>> open(std::string_view path,
                                               int flags,
                                               mode_t mode) = 0;
    virtual Result<std::unique_ptr<Dir>> opendir(std::string_view path) = 0;
    virtual Result<Stat> lstat(std::string_view path) = 0;

    /**
     * The default implementation handles a pure size change by opening the
     * file for writing and truncating it.
     */
    virtual Result<void> setattr(std::string_view path, const SetAttr &attr);
    virtual Result<std::string> readlink(std::string_view path);
    virtual Result<void> mkdir(std::string_view path, mode_t mode);
    virtual Result<void> rmdir(std::string_view path);
    virtual Result<void> unlink(std::string_view path);

    /**
     * Move @a from to @a to. Without @a replace an existing @a to fails with
     * Errc::EXISTS.
     */
    virtual Result<void> rename(std::string_view from, std::string_view to,
                                bool replace);
    virtual Result<void> symlink(std::string_view target, std::string_view path);
    virtual Result<StatVfs> statfs();

};

std::string join_path(std::string_view parent, std::string_view name);

}

#endif
