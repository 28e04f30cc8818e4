/**********************************************************************
File name: local.cpp
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
#include "userspacefs/backend/local.hpp"

#include "userspacefs/error_map.hpp"

#include <sys/types.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>
#include <fcntl.h>
#include <stdio.h>

#include <cerrno>
#include <cstring>

namespace Userspacefs::Backend {

inline Stat from_os_stat(struct stat &src)
{
    return Stat{
        .mode = src.st_mode,
        .size = static_cast<uint64_t>(src.st_size),
        .ino = src.st_ino,
        .nlink = static_cast<uint32_t>(src.st_nlink),
        .uid = src.st_uid,
        .gid = src.st_gid,
        .atime = src.st_atim,
        .mtime = src.st_mtim,
        .ctime = src.st_ctim,
    };
}

static ErrorResultHelper os_error()
{
    return make_result(FAILED, from_errno(errno));
}

LocalFile::LocalFile(int fd):
    m_fd(fd)
{

}

LocalFile::~LocalFile()
{
    if (m_fd >= 0) {
        ::close(m_fd);
    }
}

Result<Stat> LocalFile::fstat()
{
    struct stat buf;
    memset(&buf, 0, sizeof(buf));
    if (::fstat(m_fd, &buf) < 0) {
        return os_error();
    }

    return from_os_stat(buf);
}

Result<ssize_t> LocalFile::pread(void *buf, size_t count, off_t offset,
                                 const CancelToken &token)
{
    if (token.cancelled()) {
        return make_result(FAILED, Errc::CANCELLED);
    }
    const ssize_t result = ::pread(m_fd, buf, count, offset);
    if (result < 0) {
        return os_error();
    }
    return result;
}

Result<ssize_t> LocalFile::pwrite(const void *buf, size_t count, off_t offset,
                                  const CancelToken &token)
{
    if (token.cancelled()) {
        return make_result(FAILED, Errc::CANCELLED);
    }
    const ssize_t result = ::pwrite(m_fd, buf, count, offset);
    if (result < 0) {
        return os_error();
    }
    return result;
}

Result<void> LocalFile::ftruncate(off_t length)
{
    if (::ftruncate(m_fd, length) < 0) {
        return os_error();
    }
    return Result<void>();
}

Result<void> LocalFile::flush()
{
    // close() on a duplicate reports deferred write errors without
    // giving up the descriptor
    const int dup_fd = ::dup(m_fd);
    if (dup_fd < 0) {
        return os_error();
    }
    if (::close(dup_fd) < 0) {
        return os_error();
    }
    return Result<void>();
}

Result<void> LocalFile::fsync(bool datasync)
{
    if ((datasync ? ::fdatasync(m_fd) : ::fsync(m_fd)) < 0) {
        return os_error();
    }
    return Result<void>();
}

Result<void> LocalFile::close()
{
    const int fd = m_fd;
    m_fd = -1;
    if (::close(fd) < 0) {
        return os_error();
    }
    return Result<void>();
}

LocalDir::LocalDir(DIR *fd):
    m_fd(fd)
{

}

LocalDir::~LocalDir()
{
    if (m_fd) {
        ::closedir(m_fd);
    }
}

Result<std::optional<DirEntry>> LocalDir::readdir(const CancelToken &token)
{
    while (true) {
        if (token.cancelled()) {
            return make_result(FAILED, Errc::CANCELLED);
        }

        errno = 0;
        struct dirent *entry = ::readdir(m_fd);
        if (!entry) {
            if (errno != 0) {
                return os_error();
            }
            return std::optional<DirEntry>();
        }

        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
            continue;
        }

        uint32_t st_mode = 0;
        switch (entry->d_type) {
        case DT_BLK:
            st_mode = S_IFBLK;
            break;
        case DT_CHR:
            st_mode = S_IFCHR;
            break;
        case DT_REG:
            st_mode = S_IFREG;
            break;
        case DT_DIR:
            st_mode = S_IFDIR;
            break;
        case DT_FIFO:
            st_mode = S_IFIFO;
            break;
        case DT_LNK:
            st_mode = S_IFLNK;
            break;
        case DT_SOCK:
            st_mode = S_IFSOCK;
            break;
        }

        return std::optional<DirEntry>(DirEntry{
            Stat{
                .mode = st_mode,
                .ino = entry->d_ino,
            },
            entry->d_name,
            false,
        });
    }
}

Result<void> LocalDir::fsyncdir()
{
    if (::fsync(dirfd(m_fd)) < 0) {
        return os_error();
    }
    return Result<void>();
}

Result<void> LocalDir::closedir()
{
    DIR *fd = m_fd;
    m_fd = nullptr;
    if (::closedir(fd) < 0) {
        return os_error();
    }
    return Result<void>();
}

LocalFilesystem::LocalFilesystem(const std::filesystem::path &root):
    m_root(root)
{

}

Result<std::string> LocalFilesystem::map_path(std::string_view s)
{
    if (s.empty()) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    if (s[0] != '/') {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    s.remove_prefix(1);
    std::filesystem::path inner(s);
    if (!inner.is_relative()) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    for (const auto &component: inner) {
        if (component == "..") {
            return make_result(FAILED, Errc::INVALID_ARGUMENT);
        }
    }

    std::filesystem::path full_path(m_root);
    full_path /= inner;
    return full_path.native();
}

Result<std::unique_ptr<File> > LocalFilesystem::open(std::string_view path,
                                                     int flags,
                                                     mode_t mode)
{
    const Result<std::string> full_path = map_path(path);
    if (!full_path) {
        return copy_error(full_path);
    }

    int fd = ::open(full_path->c_str(), flags | O_NOFOLLOW | O_CLOEXEC, mode);
    if (fd < 0) {
        return os_error();
    }

    return std::make_unique<LocalFile>(fd);
}

Result<std::unique_ptr<Dir>> LocalFilesystem::opendir(std::string_view path)
{
    const auto full_path = map_path(path);
    if (!full_path) {
        return copy_error(full_path);
    }

    DIR *fd = ::opendir(full_path->c_str());
    if (fd == nullptr) {
        return os_error();
    }

    return std::make_unique<LocalDir>(fd);
}

Result<Stat> LocalFilesystem::lstat(std::string_view path)
{
    const auto full_path = map_path(path);
    if (!full_path) {
        return copy_error(full_path);
    }

    struct stat buf{};
    if (::lstat(full_path->c_str(), &buf) < 0) {
        return os_error();
    }

    return from_os_stat(buf);
}

Result<void> LocalFilesystem::setattr(std::string_view path, const SetAttr &attr)
{
    const auto full_path = map_path(path);
    if (!full_path) {
        return copy_error(full_path);
    }
    const char *c_path = full_path->c_str();

    if (attr.has(SetAttr::MODE) && ::chmod(c_path, attr.mode & 07777) < 0) {
        return os_error();
    }
    if (attr.has(SetAttr::UID) || attr.has(SetAttr::GID)) {
        const uid_t uid = attr.has(SetAttr::UID) ? attr.uid : static_cast<uid_t>(-1);
        const gid_t gid = attr.has(SetAttr::GID) ? attr.gid : static_cast<gid_t>(-1);
        if (::lchown(c_path, uid, gid) < 0) {
            return os_error();
        }
    }
    if (attr.has(SetAttr::SIZE) && ::truncate(c_path, static_cast<off_t>(attr.size)) < 0) {
        return os_error();
    }
    if (attr.valid & (SetAttr::ATIME | SetAttr::MTIME | SetAttr::ATIME_NOW | SetAttr::MTIME_NOW)) {
        struct timespec times[2];
        times[0].tv_nsec = UTIME_OMIT;
        times[1].tv_nsec = UTIME_OMIT;
        if (attr.has(SetAttr::ATIME_NOW)) {
            times[0].tv_nsec = UTIME_NOW;
        } else if (attr.has(SetAttr::ATIME)) {
            times[0] = attr.atime;
        }
        if (attr.has(SetAttr::MTIME_NOW)) {
            times[1].tv_nsec = UTIME_NOW;
        } else if (attr.has(SetAttr::MTIME)) {
            times[1] = attr.mtime;
        }
        if (::utimensat(AT_FDCWD, c_path, times, AT_SYMLINK_NOFOLLOW) < 0) {
            return os_error();
        }
    }
    return make_result();
}

Result<std::string> LocalFilesystem::readlink(std::string_view path)
{
    const auto full_path = map_path(path);
    if (!full_path) {
        return copy_error(full_path);
    }

    struct stat stat_buf{};
    if (::lstat(full_path->c_str(), &stat_buf) < 0) {
        return os_error();
    }
    if (!S_ISLNK(stat_buf.st_mode)) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }

    std::string link_buf;
    // one extra byte shows whether the link grew since the lstat
    link_buf.resize(stat_buf.st_size + 1);
    ssize_t link_size = ::readlink(full_path->c_str(), link_buf.data(), link_buf.size());
    if (link_size < 0) {
        return os_error();
    }
    if (static_cast<size_t>(link_size) >= link_buf.size()) {
        return make_result(FAILED, Errc::WOULD_BLOCK);
    }

    link_buf.resize(link_size);
    return link_buf;
}

Result<void> LocalFilesystem::mkdir(std::string_view path, mode_t mode)
{
    const auto full_path = map_path(path);
    if (!full_path) {
        return copy_error(full_path);
    }
    if (::mkdir(full_path->c_str(), mode) < 0) {
        return os_error();
    }
    return make_result();
}

Result<void> LocalFilesystem::rmdir(std::string_view path)
{
    const auto full_path = map_path(path);
    if (!full_path) {
        return copy_error(full_path);
    }
    if (::rmdir(full_path->c_str()) < 0) {
        return os_error();
    }
    return make_result();
}

Result<void> LocalFilesystem::unlink(std::string_view path)
{
    const auto full_path = map_path(path);
    if (!full_path) {
        return copy_error(full_path);
    }
    if (::unlink(full_path->c_str()) < 0) {
        return os_error();
    }
    return make_result();
}

Result<void> LocalFilesystem::rename(std::string_view from, std::string_view to,
                                     bool replace)
{
    const auto full_from = map_path(from);
    if (!full_from) {
        return copy_error(full_from);
    }
    const auto full_to = map_path(to);
    if (!full_to) {
        return copy_error(full_to);
    }

    if (replace) {
        if (::rename(full_from->c_str(), full_to->c_str()) < 0) {
            return os_error();
        }
        return make_result();
    }

    if (::renameat2(AT_FDCWD, full_from->c_str(),
                    AT_FDCWD, full_to->c_str(), RENAME_NOREPLACE) == 0) {
        return make_result();
    }
    if (errno != ENOSYS && errno != EINVAL) {
        return os_error();
    }

    // the underlying file system lacks RENAME_NOREPLACE; this check races
    struct stat buf{};
    if (::lstat(full_to->c_str(), &buf) == 0) {
        return make_result(FAILED, Errc::EXISTS);
    }
    if (errno != ENOENT) {
        return os_error();
    }
    if (::rename(full_from->c_str(), full_to->c_str()) < 0) {
        return os_error();
    }
    return make_result();
}

Result<void> LocalFilesystem::symlink(std::string_view target, std::string_view path)
{
    const auto full_path = map_path(path);
    if (!full_path) {
        return copy_error(full_path);
    }
    if (::symlink(std::string(target).c_str(), full_path->c_str()) < 0) {
        return os_error();
    }
    return make_result();
}

Result<StatVfs> LocalFilesystem::statfs()
{
    struct statvfs buf{};
    if (::statvfs(m_root.c_str(), &buf) < 0) {
        return os_error();
    }
    return StatVfs{
        .bsize = static_cast<uint32_t>(buf.f_bsize),
        .frsize = static_cast<uint32_t>(buf.f_frsize),
        .blocks = buf.f_blocks,
        .bfree = buf.f_bfree,
        .bavail = buf.f_bavail,
        .files = buf.f_files,
        .ffree = buf.f_ffree,
        .namemax = static_cast<uint32_t>(buf.f_namemax),
    };
}

}
