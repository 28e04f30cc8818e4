/**********************************************************************
File name: dispatcher.cpp
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
#include "userspacefs/dispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

#include <fcntl.h>
#include <sys/stat.h>

#include "userspacefs/logging.hpp"

namespace Userspacefs {

static constexpr uint64_t UNKNOWN_DIRENT_INO = 0xffffffff;

static inline Backend::Stat with_ino(Backend::Stat attr, Ino ino)
{
    attr.ino = ino;
    return attr;
}

static Result<std::string> child_path(Registry &registry, Ino parent, std::string_view name)
{
    auto parent_path = registry.path(parent);
    if (!parent_path) {
        return copy_error(parent_path);
    }
    return Backend::join_path(*parent_path, name);
}

static std::string directory_key(const std::vector<std::string> &components, size_t count)
{
    std::string result("d:");
    for (size_t i = 0; i < count; ++i) {
        result += '/';
        result += components[i];
    }
    if (count == 0) {
        result += '/';
    }
    return result;
}

static void close_abandoned(Backend::File &file)
{
    auto result = file.close();
    if (!result) {
        logger().warn("failed to close abandoned file: {}", errc_name(result.error()));
    }
}

static void close_abandoned(Backend::Dir &dir)
{
    auto result = dir.closedir();
    if (!result) {
        logger().warn("failed to close abandoned directory: {}", errc_name(result.error()));
    }
}

Responder::~Responder() = default;

bool match_pattern(std::string_view pattern, std::string_view name, bool caseless)
{
    if (pattern.empty()) {
        return true;
    }

    auto equal = [caseless](char a, char b) {
        if (caseless) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                    std::tolower(static_cast<unsigned char>(b));
        }
        return a == b;
    };

    const size_t npos = std::string_view::npos;
    size_t p = 0;
    size_t n = 0;
    size_t star = npos;
    size_t mark = 0;
    while (n < name.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = n;
        } else if (p < pattern.size() && (pattern[p] == '?' || equal(pattern[p], name[n]))) {
            ++p;
            ++n;
        } else if (star != npos) {
            p = star + 1;
            n = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

Dispatcher::Dispatcher(Backend::Filesystem &fs, Registry &registry, WorkerPool &pool):
    m_fs(fs),
    m_registry(registry),
    m_pool(pool)
{

}

std::vector<std::string> Dispatcher::ordering_keys(const Request &req)
{
    std::vector<std::string> keys;

    auto dir_key = [](Ino ino) {
        return "d:#" + std::to_string(ino);
    };
    // a path-addressed parent is keyed by its path, and by its identity too
    // once the registry knows it, so that it is ordered against both kinds
    auto path_keys = [this, &keys, &dir_key](const std::vector<std::string> &components) {
        const size_t count = components.size() - 1;
        keys.push_back(directory_key(components, count));
        auto parent = m_registry.known(components, count);
        if (parent) {
            keys.push_back(dir_key(*parent));
        }
    };
    auto handle_key = [](Fh fh) {
        return "h:" + std::to_string(fh);
    };

    switch (req.op) {
    case Opcode::GETATTR:
    case Opcode::SETATTR:
    {
        if (req.fh != 0) {
            keys.push_back(handle_key(req.fh));
        }
        break;
    }
    case Opcode::MKNOD:
    case Opcode::MKDIR:
    case Opcode::SYMLINK:
    case Opcode::UNLINK:
    case Opcode::RMDIR:
    case Opcode::CREATE:
    {
        keys.push_back(dir_key(req.ino));
        break;
    }
    case Opcode::RENAME:
    {
        if (req.path) {
            auto location = m_registry.location(req.ino);
            if (location) {
                keys.push_back(dir_key(location->parent));
            }
            if (!req.path->empty()) {
                path_keys(*req.path);
            }
            if (req.fh != 0) {
                keys.push_back(handle_key(req.fh));
            }
        } else {
            keys.push_back(dir_key(req.ino));
            keys.push_back(dir_key(req.newparent));
        }
        break;
    }
    case Opcode::READ:
    case Opcode::WRITE:
    case Opcode::FLUSH:
    case Opcode::FSYNC:
    case Opcode::FSYNCDIR:
    {
        keys.push_back(handle_key(req.fh));
        break;
    }
    case Opcode::RELEASE:
    case Opcode::RELEASEDIR:
    {
        keys.push_back(handle_key(req.fh));
        if (req.has(RELEASE_UNLINK)) {
            auto location = m_registry.location(req.ino);
            if (location) {
                keys.push_back(dir_key(location->parent));
            }
        }
        break;
    }
    case Opcode::READDIR:
    {
        keys.push_back(handle_key(req.fh));
        auto cursor = m_registry.cursor(req.fh);
        if (cursor) {
            keys.push_back(dir_key((*cursor)->ino));
        }
        break;
    }
    case Opcode::OPEN_PATH:
    {
        if (req.path && !req.path->empty() &&
                req.disposition != Disposition::OPEN &&
                req.disposition != Disposition::OVERWRITE) {
            path_keys(*req.path);
        }
        break;
    }
    default:
        break;
    }

    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

bool Dispatcher::is_ready_locked(const EntryPtr &entry)
{
    if (entry->state != Entry::QUEUED) {
        return false;
    }
    for (const auto &key: entry->keys) {
        auto iter = m_queues.find(key);
        if (iter == m_queues.end() || iter->second.front() != entry) {
            return false;
        }
    }
    return true;
}

void Dispatcher::unqueue_locked(const EntryPtr &entry, std::vector<EntryPtr> &ready)
{
    for (const auto &key: entry->keys) {
        auto iter = m_queues.find(key);
        if (iter == m_queues.end()) {
            continue;
        }
        auto &queue = iter->second;
        auto pos = std::find(queue.begin(), queue.end(), entry);
        if (pos != queue.end()) {
            queue.erase(pos);
        }
        if (queue.empty()) {
            m_queues.erase(iter);
            continue;
        }
        const EntryPtr &next = queue.front();
        if (is_ready_locked(next)) {
            next->state = Entry::READY;
            ready.push_back(next);
        }
    }
}

void Dispatcher::schedule(std::vector<EntryPtr> &&ready)
{
    for (auto &entry: ready) {
        auto submitted = m_pool.submit([this, entry]() {
            run(entry);
        });
        if (!submitted) {
            run(entry);
        }
    }
}

void Dispatcher::run(const EntryPtr &entry)
{
    const Request &req = entry->request;

    bool skip;
    {
        std::lock_guard lock(m_mutex);
        skip = entry->cancelled;
        if (!skip) {
            entry->state = Entry::RUNNING;
        }
    }

    if (skip) {
        logger().debug("skipping cancelled {} unique={}", opcode_name(req.op), req.unique);
        entry->responder->cancelled(req);
    } else {
        Response response = execute(entry->request, entry->token);

        bool discarded;
        {
            std::lock_guard lock(m_mutex);
            discarded = entry->cancelled;
            entry->state = Entry::COMPLETING;
        }

        if (discarded) {
            logger().debug("discarding result of cancelled {} unique={}",
                           opcode_name(req.op), req.unique);
            discard(req, response);
            entry->responder->cancelled(req);
        } else {
            logger().debug("completed {} unique={}: {}", opcode_name(req.op), req.unique,
                           response ? "ok" : errc_name(response.error()));
            entry->responder->respond(req, response);
        }
    }
    entry->request.pins.clear();

    std::vector<EntryPtr> ready;
    {
        std::lock_guard lock(m_mutex);
        auto iter = m_pending.find(PendingKey(req.channel, req.unique));
        if (iter != m_pending.end() && iter->second == entry) {
            m_pending.erase(iter);
        }
        unqueue_locked(entry, ready);
        finish_locked(entry);
    }
    m_idle_cv.notify_all();
    schedule(std::move(ready));
}

void Dispatcher::finish_locked(const EntryPtr &entry)
{
    auto iter = m_active.find(entry->request.channel);
    if (iter == m_active.end()) {
        return;
    }
    if (--iter->second == 0) {
        m_active.erase(iter);
    }
}

void Dispatcher::finish_skipped(std::vector<EntryPtr> &&skipped)
{
    for (const auto &entry: skipped) {
        logger().debug("cancelled {} unique={} before it started",
                       opcode_name(entry->request.op), entry->request.unique);
        entry->responder->cancelled(entry->request);
        entry->request.pins.clear();
    }

    {
        std::lock_guard lock(m_mutex);
        for (const auto &entry: skipped) {
            finish_locked(entry);
        }
    }
    m_idle_cv.notify_all();
}

Dispatcher::CancelResult Dispatcher::cancel_locked(const EntryPtr &entry,
                                                   std::vector<EntryPtr> &ready,
                                                   std::vector<EntryPtr> &skipped)
{
    if (entry->request.op == Opcode::RELEASE || entry->request.op == Opcode::RELEASEDIR) {
        // a handle is released whatever the host asks for afterwards
        return CancelResult::TOO_LATE;
    }

    switch (entry->state) {
    case Entry::QUEUED:
    {
        entry->cancelled = true;
        m_pending.erase(PendingKey(entry->request.channel, entry->request.unique));
        unqueue_locked(entry, ready);
        skipped.push_back(entry);
        return CancelResult::SKIPPED;
    }
    case Entry::READY:
    {
        entry->cancelled = true;
        return CancelResult::SKIPPED;
    }
    case Entry::RUNNING:
    {
        entry->cancelled = true;
        entry->token.cancel();
        return CancelResult::MARKED;
    }
    case Entry::COMPLETING:
        break;
    }
    return CancelResult::TOO_LATE;
}

void Dispatcher::discard(const Request &req, const Response &response)
{
    if (!response) {
        return;
    }

    if (auto entry = std::get_if<EntryReply>(&*response)) {
        m_registry.forget(entry->ino, 1);
        return;
    }

    if (auto open = std::get_if<OpenReply>(&*response)) {
        if (open->directory) {
            auto cursor = m_registry.release_cursor(open->fh);
            if (cursor) {
                close_abandoned(*cursor->dir);
            }
        } else {
            auto handle = m_registry.release_handle(open->fh);
            if (handle) {
                close_abandoned(*handle->file);
            }
        }
        if (req.op == Opcode::CREATE) {
            m_registry.forget(open->entry.ino, 1);
        }
    }
}

Result<void> Dispatcher::submit(Request &&req, Responder &responder)
{
    if (req.op == Opcode::FORGET || req.op == Opcode::BATCH_FORGET) {
        Response response = execute(req, Backend::CancelToken::never());
        responder.respond(req, response);
        return make_result();
    }

    auto entry = std::make_shared<Entry>();
    entry->keys = ordering_keys(req);
    entry->responder = &responder;
    logger().debug("dispatching {} unique={} channel={}",
                   opcode_name(req.op), req.unique, req.channel);

    std::vector<EntryPtr> ready;
    {
        std::lock_guard lock(m_mutex);
        const PendingKey key(req.channel, req.unique);
        auto existing = m_pending.find(key);
        if (existing != m_pending.end()) {
            if (existing->second->state != Entry::COMPLETING) {
                logger().warn("rejecting {} with duplicate unique={} on channel {}",
                              opcode_name(req.op), req.unique, req.channel);
                return make_result(FAILED, Errc::INVALID_ARGUMENT);
            }
            // the previous request is answered already; the host reused its number
            m_pending.erase(existing);
        }
        entry->request = std::move(req);
        m_pending.emplace(key, entry);
        ++m_active[key.first];
        for (const auto &ordering_key: entry->keys) {
            m_queues[ordering_key].push_back(entry);
        }
        if (is_ready_locked(entry)) {
            entry->state = Entry::READY;
            ready.push_back(entry);
        }
    }

    schedule(std::move(ready));
    return make_result();
}

Dispatcher::CancelResult Dispatcher::cancel(ChannelId channel, uint64_t unique)
{
    std::vector<EntryPtr> ready;
    std::vector<EntryPtr> skipped;
    CancelResult result;
    {
        std::lock_guard lock(m_mutex);
        auto iter = m_pending.find(PendingKey(channel, unique));
        if (iter == m_pending.end()) {
            return CancelResult::NOT_FOUND;
        }
        const EntryPtr entry = iter->second;
        result = cancel_locked(entry, ready, skipped);
    }

    finish_skipped(std::move(skipped));
    schedule(std::move(ready));
    return result;
}

void Dispatcher::cancel_all(ChannelId channel)
{
    std::vector<EntryPtr> ready;
    std::vector<EntryPtr> skipped;
    {
        std::lock_guard lock(m_mutex);
        std::vector<EntryPtr> entries;
        for (auto iter = m_pending.lower_bound(PendingKey(channel, 0));
             iter != m_pending.end() && iter->first.first == channel;
             ++iter) {
            entries.push_back(iter->second);
        }
        for (const auto &entry: entries) {
            cancel_locked(entry, ready, skipped);
        }
    }

    finish_skipped(std::move(skipped));
    schedule(std::move(ready));
}

void Dispatcher::drain(ChannelId channel)
{
    std::unique_lock lock(m_mutex);
    m_idle_cv.wait(lock, [this, channel]() {
        return m_active.count(channel) == 0;
    });
}

size_t Dispatcher::pending()
{
    std::lock_guard lock(m_mutex);
    size_t result = 0;
    for (const auto &[channel, count]: m_active) {
        result += count;
    }
    return result;
}

Response Dispatcher::execute(Request &req, const Backend::CancelToken &token)
{
    try {
        switch (req.op) {
        case Opcode::LOOKUP:
            return do_lookup(req);
        case Opcode::FORGET:
        case Opcode::BATCH_FORGET:
        {
            for (const auto &[ino, nlookup]: req.forgets) {
                m_registry.forget(ino, nlookup);
            }
            return EmptyReply{};
        }
        case Opcode::GETATTR:
            return do_getattr(req);
        case Opcode::SETATTR:
            return do_setattr(req);
        case Opcode::READLINK:
            return do_readlink(req);
        case Opcode::MKNOD:
            return do_mknod(req);
        case Opcode::MKDIR:
            return do_mkdir(req);
        case Opcode::UNLINK:
            return do_unlink(req);
        case Opcode::RMDIR:
            return do_rmdir(req);
        case Opcode::SYMLINK:
            return do_symlink(req);
        case Opcode::RENAME:
            return do_rename(req);
        case Opcode::OPEN:
            return do_open(req);
        case Opcode::CREATE:
            return do_create(req);
        case Opcode::READ:
            return do_read(req, token);
        case Opcode::WRITE:
            return do_write(req, token);
        case Opcode::FLUSH:
            return do_flush(req);
        case Opcode::RELEASE:
            return do_release(req);
        case Opcode::FSYNC:
            return do_fsync(req);
        case Opcode::OPENDIR:
            return do_opendir(req);
        case Opcode::READDIR:
            return do_readdir(req, token);
        case Opcode::RELEASEDIR:
            return do_releasedir(req);
        case Opcode::FSYNCDIR:
            return do_fsyncdir(req);
        case Opcode::STATFS:
            return do_statfs(req);
        case Opcode::OPEN_PATH:
            return do_open_path(req);
        }
    } catch (const std::exception &exc) {
        logger().error("{} unique={} failed: {}", opcode_name(req.op), req.unique, exc.what());
        return make_result(FAILED, Errc::IO_ERROR);
    }
    return make_result(FAILED, Errc::UNKNOWN_OPERATION);
}

Response Dispatcher::entry_reply(Ino parent, std::string_view name)
{
    auto entry = m_registry.lookup(parent, name);
    if (!entry) {
        return copy_error(entry);
    }
    return EntryReply{entry->ino, with_ino(entry->attr, entry->ino)};
}

Result<void> Dispatcher::remove_object(Ino parent, std::string_view name)
{
    auto path = child_path(m_registry, parent, name);
    if (!path) {
        return copy_error(path);
    }
    auto attr = m_fs.lstat(*path);
    if (!attr) {
        return copy_error(attr);
    }
    auto result = S_ISDIR(attr->mode) ? m_fs.rmdir(*path) : m_fs.unlink(*path);
    if (!result) {
        return result;
    }
    m_registry.detach(parent, name);
    return make_result();
}

Result<bool> Dispatcher::is_empty_dir(const std::string &path)
{
    auto dir = m_fs.opendir(path);
    if (!dir) {
        return copy_error(dir);
    }
    auto entry = (*dir)->readdir(Backend::CancelToken::never());
    auto closed = (*dir)->closedir();
    if (!entry) {
        return copy_error(entry);
    }
    if (!closed) {
        return copy_error(closed);
    }
    return !entry->has_value();
}

Response Dispatcher::do_lookup(Request &req)
{
    if (req.name != "." && req.name != "..") {
        return entry_reply(req.ino, req.name);
    }

    Ino target = req.ino;
    if (req.name == "..") {
        auto parent = m_registry.parent(req.ino);
        if (!parent) {
            return copy_error(parent);
        }
        target = *parent;
    }

    auto path = m_registry.path(target);
    if (!path) {
        return copy_error(path);
    }
    auto attr = m_fs.lstat(*path);
    if (!attr) {
        return copy_error(attr);
    }
    auto referenced = m_registry.reference(target);
    if (!referenced) {
        return copy_error(referenced);
    }
    return EntryReply{target, with_ino(*attr, target)};
}

Response Dispatcher::do_getattr(Request &req)
{
    if (req.fh != 0) {
        auto handle = m_registry.handle(req.fh);
        if (!handle) {
            return copy_error(handle);
        }
        auto attr = (*handle)->file->fstat();
        if (!attr) {
            return copy_error(attr);
        }
        return AttrReply{with_ino(*attr, (*handle)->ino)};
    }

    auto path = m_registry.path(req.ino);
    if (!path) {
        return copy_error(path);
    }
    auto attr = m_fs.lstat(*path);
    if (!attr) {
        return copy_error(attr);
    }
    return AttrReply{with_ino(*attr, req.ino)};
}

Response Dispatcher::do_setattr(Request &req)
{
    Backend::SetAttr rest = req.attr;
    std::shared_ptr<OpenHandle> handle;
    if (req.fh != 0) {
        auto handle_result = m_registry.handle(req.fh);
        if (!handle_result) {
            return copy_error(handle_result);
        }
        handle = *handle_result;
    }

    if (handle && rest.has(Backend::SetAttr::SIZE)) {
        auto truncated = handle->file->ftruncate(static_cast<off_t>(rest.size));
        if (!truncated) {
            return copy_error(truncated);
        }
        rest.valid &= ~Backend::SetAttr::SIZE;
    }

    if (rest.valid != 0) {
        auto path = m_registry.path(req.ino);
        if (!path) {
            return copy_error(path);
        }
        auto result = m_fs.setattr(*path, rest);
        if (!result) {
            return copy_error(result);
        }
    }

    return do_getattr(req);
}

Response Dispatcher::do_readlink(Request &req)
{
    auto path = m_registry.path(req.ino);
    if (!path) {
        return copy_error(path);
    }
    auto target = m_fs.readlink(*path);
    if (!target) {
        return copy_error(target);
    }
    return DataReply{std::move(*target)};
}

Response Dispatcher::do_mknod(Request &req)
{
    const uint32_t type = req.mode & S_IFMT;
    if (type != 0 && type != S_IFREG) {
        return make_result(FAILED, Errc::PERMISSION_DENIED);
    }

    auto path = child_path(m_registry, req.ino, req.name);
    if (!path) {
        return copy_error(path);
    }
    auto file = m_fs.open(*path, O_WRONLY | O_CREAT | O_EXCL, req.mode & 07777);
    if (!file) {
        return copy_error(file);
    }
    auto closed = (*file)->close();
    if (!closed) {
        return copy_error(closed);
    }
    return entry_reply(req.ino, req.name);
}

Response Dispatcher::do_mkdir(Request &req)
{
    auto path = child_path(m_registry, req.ino, req.name);
    if (!path) {
        return copy_error(path);
    }
    auto result = m_fs.mkdir(*path, req.mode & 07777);
    if (!result) {
        return copy_error(result);
    }
    return entry_reply(req.ino, req.name);
}

Response Dispatcher::do_symlink(Request &req)
{
    auto path = child_path(m_registry, req.ino, req.name);
    if (!path) {
        return copy_error(path);
    }
    auto result = m_fs.symlink(req.data, *path);
    if (!result) {
        return copy_error(result);
    }
    return entry_reply(req.ino, req.name);
}

Response Dispatcher::do_unlink(Request &req)
{
    auto path = child_path(m_registry, req.ino, req.name);
    if (!path) {
        return copy_error(path);
    }
    auto attr = m_fs.lstat(*path);
    if (!attr) {
        return copy_error(attr);
    }
    if (S_ISDIR(attr->mode)) {
        return make_result(FAILED, Errc::IS_A_DIRECTORY);
    }
    auto result = m_fs.unlink(*path);
    if (!result) {
        return copy_error(result);
    }
    m_registry.detach(req.ino, req.name);
    return EmptyReply{};
}

Response Dispatcher::do_rmdir(Request &req)
{
    auto path = child_path(m_registry, req.ino, req.name);
    if (!path) {
        return copy_error(path);
    }
    auto attr = m_fs.lstat(*path);
    if (!attr) {
        return copy_error(attr);
    }
    if (!S_ISDIR(attr->mode)) {
        return make_result(FAILED, Errc::NOT_A_DIRECTORY);
    }
    auto result = m_fs.rmdir(*path);
    if (!result) {
        return copy_error(result);
    }
    m_registry.detach(req.ino, req.name);
    return EmptyReply{};
}

Response Dispatcher::do_rename(Request &req)
{
    static constexpr uint32_t KNOWN_FLAGS =
            RENAME_FLAG_NOREPLACE | RENAME_FLAG_EXCHANGE | RENAME_FLAG_WHITEOUT;
    if ((req.flags & ~KNOWN_FLAGS) != 0) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    if ((req.flags & (RENAME_FLAG_EXCHANGE | RENAME_FLAG_WHITEOUT)) != 0) {
        return make_result(FAILED, Errc::NOT_SUPPORTED);
    }
    const bool noreplace = (req.flags & RENAME_FLAG_NOREPLACE) != 0;

    Ino parent = req.ino;
    std::string name = req.name;
    Ino newparent = req.newparent;
    std::string newname = req.newname;
    // keeps the destination directory alive on path-addressed transports
    Registry::Pin destination;

    if (req.path) {
        const auto &components = *req.path;
        if (components.empty()) {
            return make_result(FAILED, Errc::INVALID_ARGUMENT);
        }
        auto location = m_registry.location(req.ino);
        if (!location) {
            return copy_error(location);
        }
        parent = location->parent;
        name = location->name;

        auto resolved = m_registry.resolve(
                    std::vector<std::string>(components.begin(), components.end() - 1));
        if (!resolved) {
            return copy_error(resolved);
        }
        if (!S_ISDIR(resolved->attr.mode)) {
            return make_result(FAILED, Errc::NOT_A_DIRECTORY);
        }
        newparent = resolved->pin.ino();
        newname = components.back();
        destination = std::move(resolved->pin);
    }

    auto from = child_path(m_registry, parent, name);
    if (!from) {
        return copy_error(from);
    }
    auto to = child_path(m_registry, newparent, newname);
    if (!to) {
        return copy_error(to);
    }

    auto src_attr = m_fs.lstat(*from);
    if (!src_attr) {
        return copy_error(src_attr);
    }
    if (*from == *to) {
        return EmptyReply{};
    }
    const bool src_dir = S_ISDIR(src_attr->mode);
    if (src_dir && to->compare(0, from->size() + 1, *from + "/") == 0) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }

    auto dst_attr = m_fs.lstat(*to);
    if (dst_attr) {
        if (noreplace) {
            return make_result(FAILED, Errc::EXISTS);
        }
        const bool dst_dir = S_ISDIR(dst_attr->mode);
        if (!src_dir && dst_dir) {
            return make_result(FAILED, Errc::IS_A_DIRECTORY);
        }
        if (src_dir && !dst_dir) {
            return make_result(FAILED, Errc::NOT_A_DIRECTORY);
        }
        if (dst_dir) {
            auto empty = is_empty_dir(*to);
            if (!empty) {
                return copy_error(empty);
            }
            if (!*empty) {
                return make_result(FAILED, Errc::NOT_EMPTY);
            }
        }
    } else if (dst_attr.error() != Errc::NOT_FOUND) {
        return copy_error(dst_attr);
    }

    auto result = m_fs.rename(*from, *to, !noreplace);
    if (!result && result.error() == Errc::NOT_SUPPORTED && !noreplace) {
        // the backend only knows how to rename without replacing
        if (dst_attr) {
            auto removed = remove_object(newparent, newname);
            if (!removed) {
                return copy_error(removed);
            }
        }
        result = m_fs.rename(*from, *to, false);
    }
    if (!result) {
        return copy_error(result);
    }

    m_registry.move(parent, name, newparent, newname);
    return EmptyReply{};
}

Response Dispatcher::do_open(Request &req)
{
    auto path = m_registry.path(req.ino);
    if (!path) {
        return copy_error(path);
    }
    const int flags = static_cast<int>(req.flags) & ~(O_CREAT | O_EXCL);
    auto file = m_fs.open(*path, flags, 0);
    if (!file) {
        return copy_error(file);
    }
    auto fh = m_registry.allocate_handle(req.ino, flags, std::move(*file));
    if (!fh) {
        close_abandoned(**file);
        return copy_error(fh);
    }
    return OpenReply{*fh, EntryReply{req.ino, Backend::Stat{}}, false, OpenAction::OPENED};
}

Response Dispatcher::do_create(Request &req)
{
    auto path = child_path(m_registry, req.ino, req.name);
    if (!path) {
        return copy_error(path);
    }
    auto file = m_fs.open(*path, static_cast<int>(req.flags) | O_CREAT, req.mode & 07777);
    if (!file) {
        return copy_error(file);
    }

    auto entry = m_registry.lookup(req.ino, req.name);
    if (!entry) {
        close_abandoned(**file);
        return copy_error(entry);
    }

    const int flags = static_cast<int>(req.flags) & ~(O_CREAT | O_EXCL | O_TRUNC);
    auto fh = m_registry.allocate_handle(entry->ino, flags, std::move(*file));
    if (!fh) {
        close_abandoned(**file);
        m_registry.forget(entry->ino, 1);
        return copy_error(fh);
    }
    return OpenReply{
        *fh,
        EntryReply{entry->ino, with_ino(entry->attr, entry->ino)},
        false,
        OpenAction::CREATED
    };
}

Response Dispatcher::do_read(Request &req, const Backend::CancelToken &token)
{
    auto handle = m_registry.handle(req.fh);
    if (!handle) {
        return copy_error(handle);
    }
    if (((*handle)->flags & O_ACCMODE) == O_WRONLY) {
        return make_result(FAILED, Errc::PERMISSION_DENIED);
    }

    std::string data;
    data.resize(req.size);
    size_t done = 0;
    while (done < data.size()) {
        auto count = (*handle)->file->pread(data.data() + done, data.size() - done,
                                            static_cast<off_t>(req.offset + done), token);
        if (!count) {
            return copy_error(count);
        }
        if (*count == 0) {
            break;
        }
        done += static_cast<size_t>(*count);
    }
    data.resize(done);
    return DataReply{std::move(data)};
}

Response Dispatcher::do_write(Request &req, const Backend::CancelToken &token)
{
    auto handle = m_registry.handle(req.fh);
    if (!handle) {
        return copy_error(handle);
    }
    Backend::File &file = *(*handle)->file;
    if (((*handle)->flags & O_ACCMODE) == O_RDONLY) {
        return make_result(FAILED, Errc::PERMISSION_DENIED);
    }

    uint64_t offset = req.offset;
    if (req.has(WRITE_APPEND)) {
        auto attr = file.fstat();
        if (!attr) {
            return copy_error(attr);
        }
        offset = attr->size;
    }

    size_t done = 0;
    while (done < req.data.size()) {
        auto count = file.pwrite(req.data.data() + done, req.data.size() - done,
                                 static_cast<off_t>(offset + done), token);
        if (!count) {
            if (done > 0) {
                break;
            }
            return copy_error(count);
        }
        if (*count == 0) {
            return make_result(FAILED, Errc::IO_ERROR);
        }
        done += static_cast<size_t>(*count);
    }
    return WriteReply{static_cast<uint32_t>(done)};
}

Response Dispatcher::do_flush(Request &req)
{
    auto handle = m_registry.handle(req.fh);
    if (!handle) {
        return copy_error(handle);
    }
    auto result = (*handle)->file->flush();
    if (!result) {
        return copy_error(result);
    }
    return EmptyReply{};
}

Response Dispatcher::do_release(Request &req)
{
    auto handle = m_registry.release_handle(req.fh);
    if (!handle) {
        // released before
        return EmptyReply{};
    }

    Backend::Stat attr{};
    if (req.has(RELEASE_STAT)) {
        auto stat_result = handle->file->fstat();
        if (!stat_result) {
            close_abandoned(*handle->file);
            return copy_error(stat_result);
        }
        attr = with_ino(*stat_result, handle->ino);
    }

    auto closed = handle->file->close();
    if (!closed) {
        return copy_error(closed);
    }

    if (req.has(RELEASE_UNLINK)) {
        auto location = m_registry.location(handle->ino);
        if (!location) {
            return copy_error(location);
        }
        auto removed = remove_object(location->parent, location->name);
        if (!removed) {
            return copy_error(removed);
        }
    }

    if (req.has(RELEASE_STAT)) {
        return AttrReply{attr};
    }
    return EmptyReply{};
}

Response Dispatcher::do_fsync(Request &req)
{
    auto handle = m_registry.handle(req.fh);
    if (!handle) {
        return copy_error(handle);
    }
    auto result = (*handle)->file->fsync(req.has(FSYNC_DATASYNC));
    if (!result) {
        return copy_error(result);
    }
    return EmptyReply{};
}

Response Dispatcher::do_opendir(Request &req)
{
    auto path = m_registry.path(req.ino);
    if (!path) {
        return copy_error(path);
    }
    auto dir = m_fs.opendir(*path);
    if (!dir) {
        return copy_error(dir);
    }
    auto fh = m_registry.allocate_cursor(req.ino, std::move(*dir));
    if (!fh) {
        close_abandoned(**dir);
        return copy_error(fh);
    }
    return OpenReply{*fh, EntryReply{req.ino, Backend::Stat{}}, true, OpenAction::OPENED};
}

Response Dispatcher::do_readdir(Request &req, const Backend::CancelToken &token)
{
    auto cursor_result = m_registry.cursor(req.fh);
    if (!cursor_result) {
        return copy_error(cursor_result);
    }
    DirCursor &cursor = **cursor_result;
    const Result<std::string> dir_path = m_registry.path(cursor.ino);

    if (req.has(READDIR_RESUME)) {
        req.offset = cursor.resume_offset;
    } else if (req.offset == 0 && cursor.progressed) {
        // rewind
        if (!dir_path) {
            return copy_error(dir_path);
        }
        auto dir = m_fs.opendir(*dir_path);
        if (!dir) {
            return copy_error(dir);
        }
        close_abandoned(*cursor.dir);
        cursor.dir = std::move(*dir);
        cursor.buffer.clear();
        cursor.next_offset = 3;
        cursor.resume_offset = 0;
        cursor.eof = false;
    }
    cursor.progressed = true;

    const bool with_attrs = req.has(READDIR_ATTRS);
    const bool caseless = req.has(READDIR_CASELESS);
    const size_t limit = req.max_entries > 0
            ? req.max_entries
            : std::numeric_limits<size_t>::max();

    DirReply reply{{}, false};

    auto synthesize = [&](const char *name, uint64_t offset, Ino ino) -> Result<void> {
        if (req.offset >= offset || reply.entries.size() >= limit ||
                !match_pattern(req.name, name, caseless)) {
            return make_result();
        }
        DirItem item{name, offset, UNKNOWN_DIRENT_INO, Backend::Stat{}};
        item.attr.mode = S_IFDIR;
        if (with_attrs) {
            auto path = m_registry.path(ino);
            if (!path) {
                return copy_error(path);
            }
            auto attr = m_fs.lstat(*path);
            if (!attr) {
                return copy_error(attr);
            }
            item.ino = attr->ino != 0 ? attr->ino : UNKNOWN_DIRENT_INO;
            item.attr = with_ino(*attr, ino);
        }
        reply.entries.push_back(std::move(item));
        return make_result();
    };

    auto parent = m_registry.parent(cursor.ino);
    auto self_result = synthesize(".", 1, cursor.ino);
    if (!self_result) {
        return copy_error(self_result);
    }
    auto parent_result = synthesize("..", 2, parent ? *parent : cursor.ino);
    if (!parent_result) {
        return copy_error(parent_result);
    }

    while (!cursor.buffer.empty() && cursor.buffer.front().first <= req.offset) {
        cursor.buffer.pop_front();
    }

    size_t index = 0;
    while (reply.entries.size() < limit) {
        if (index == cursor.buffer.size()) {
            if (cursor.eof) {
                break;
            }
            auto next = cursor.dir->readdir(token);
            if (!next) {
                if (!reply.entries.empty()) {
                    // report it with the next call
                    break;
                }
                return copy_error(next);
            }
            if (!next->has_value()) {
                cursor.eof = true;
                break;
            }
            cursor.buffer.emplace_back(cursor.next_offset++, std::move(**next));
            continue;
        }

        const auto &[offset, entry] = cursor.buffer[index++];
        if (!match_pattern(req.name, entry.name, caseless)) {
            continue;
        }

        DirItem item{entry.name, offset, entry.ino != 0 ? entry.ino : UNKNOWN_DIRENT_INO, entry};
        if (with_attrs && !entry.complete) {
            if (!dir_path) {
                return copy_error(dir_path);
            }
            auto attr = m_fs.lstat(Backend::join_path(*dir_path, entry.name));
            if (!attr) {
                if (attr.error() == Errc::NOT_FOUND) {
                    // removed since it was enumerated
                    continue;
                }
                return copy_error(attr);
            }
            item.attr = *attr;
            item.ino = attr->ino != 0 ? attr->ino : UNKNOWN_DIRENT_INO;
        }
        reply.entries.push_back(std::move(item));
    }

    reply.eof = cursor.eof && index >= cursor.buffer.size();
    return reply;
}

Response Dispatcher::do_releasedir(Request &req)
{
    auto cursor = m_registry.release_cursor(req.fh);
    if (!cursor) {
        return EmptyReply{};
    }

    Backend::Stat attr{};
    if (req.has(RELEASE_STAT)) {
        auto path = m_registry.path(cursor->ino);
        auto stat_result = path ? m_fs.lstat(*path) : Result<Backend::Stat>(copy_error(path));
        if (!stat_result) {
            close_abandoned(*cursor->dir);
            return copy_error(stat_result);
        }
        attr = with_ino(*stat_result, cursor->ino);
    }

    auto closed = cursor->dir->closedir();
    if (!closed) {
        return copy_error(closed);
    }

    if (req.has(RELEASE_UNLINK)) {
        auto location = m_registry.location(cursor->ino);
        if (!location) {
            return copy_error(location);
        }
        auto removed = remove_object(location->parent, location->name);
        if (!removed) {
            return copy_error(removed);
        }
    }

    if (req.has(RELEASE_STAT)) {
        return AttrReply{attr};
    }
    return EmptyReply{};
}

Response Dispatcher::do_fsyncdir(Request &req)
{
    auto cursor = m_registry.cursor(req.fh);
    if (!cursor) {
        return copy_error(cursor);
    }
    auto result = (*cursor)->dir->fsyncdir();
    if (!result) {
        return copy_error(result);
    }
    return EmptyReply{};
}

Response Dispatcher::do_statfs(Request &)
{
    auto result = m_fs.statfs();
    if (!result) {
        return copy_error(result);
    }
    return StatfsReply{*result};
}

Response Dispatcher::do_open_path(Request &req)
{
    if (!req.path) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    const auto &components = *req.path;

    Ino parent = ROOT_INO;
    Registry::Pin parent_pin;
    std::string path("/");
    if (!components.empty()) {
        auto resolved = m_registry.resolve(
                    std::vector<std::string>(components.begin(), components.end() - 1));
        if (!resolved) {
            return copy_error(resolved);
        }
        if (!S_ISDIR(resolved->attr.mode)) {
            return make_result(FAILED, Errc::NOT_A_DIRECTORY);
        }
        parent = resolved->pin.ino();
        parent_pin = std::move(resolved->pin);

        auto full_path = child_path(m_registry, parent, components.back());
        if (!full_path) {
            return copy_error(full_path);
        }
        path = std::move(*full_path);
    }

    auto existing = m_fs.lstat(path);
    const bool exists = static_cast<bool>(existing);
    if (!exists && existing.error() != Errc::NOT_FOUND) {
        return copy_error(existing);
    }

    const Disposition disposition = req.disposition;
    if (exists && disposition == Disposition::CREATE) {
        return make_result(FAILED, Errc::EXISTS);
    }
    if (!exists && (disposition == Disposition::OPEN ||
                    disposition == Disposition::OVERWRITE)) {
        return make_result(FAILED, Errc::NOT_FOUND);
    }

    const int flags = static_cast<int>(req.flags) & ~(O_CREAT | O_EXCL | O_TRUNC);
    std::unique_ptr<Backend::File> file;
    std::unique_ptr<Backend::Dir> dir;
    bool directory;
    OpenAction action;

    if (exists) {
        directory = S_ISDIR(existing->mode);
        if (directory && req.has(OPEN_NON_DIRECTORY)) {
            return make_result(FAILED, Errc::IS_A_DIRECTORY);
        }
        if (!directory && req.has(OPEN_DIRECTORY)) {
            return make_result(FAILED, Errc::NOT_A_DIRECTORY);
        }

        const bool truncate = disposition == Disposition::SUPERSEDE ||
                disposition == Disposition::OVERWRITE ||
                disposition == Disposition::OVERWRITE_IF;
        if (directory) {
            if (truncate) {
                return make_result(FAILED, Errc::IS_A_DIRECTORY);
            }
            auto opened = m_fs.opendir(path);
            if (!opened) {
                return copy_error(opened);
            }
            dir = std::move(*opened);
            action = OpenAction::OPENED;
        } else {
            auto opened = m_fs.open(path, flags | (truncate ? O_TRUNC : 0), 0);
            if (!opened) {
                return copy_error(opened);
            }
            file = std::move(*opened);
            if (disposition == Disposition::SUPERSEDE) {
                action = OpenAction::SUPERSEDED;
            } else if (truncate) {
                action = OpenAction::OVERWRITTEN;
            } else {
                action = OpenAction::OPENED;
            }
        }
    } else {
        directory = req.has(OPEN_DIRECTORY);
        if (directory) {
            auto made = m_fs.mkdir(path, req.mode != 0 ? req.mode & 07777 : 0777);
            if (!made) {
                return copy_error(made);
            }
            auto opened = m_fs.opendir(path);
            if (!opened) {
                return copy_error(opened);
            }
            dir = std::move(*opened);
        } else {
            auto opened = m_fs.open(path, flags | O_CREAT | O_EXCL,
                                    req.mode != 0 ? req.mode & 07777 : 0666);
            if (!opened) {
                return copy_error(opened);
            }
            file = std::move(*opened);
        }
        action = OpenAction::CREATED;
    }

    auto attr = directory ? m_fs.lstat(path) : file->fstat();
    if (!attr) {
        if (directory) {
            close_abandoned(*dir);
        } else {
            close_abandoned(*file);
        }
        return copy_error(attr);
    }

    Result<Registry::Pin> pin = components.empty()
            ? m_registry.pin(ROOT_INO)
            : m_registry.intern(parent, components.back(), *attr);
    if (!pin) {
        if (directory) {
            close_abandoned(*dir);
        } else {
            close_abandoned(*file);
        }
        return copy_error(pin);
    }
    const Ino ino = pin->ino();

    auto fh = directory
            ? m_registry.allocate_cursor(ino, std::move(dir))
            : m_registry.allocate_handle(ino, flags, std::move(file));
    if (!fh) {
        if (directory) {
            close_abandoned(*dir);
        } else {
            close_abandoned(*file);
        }
        return copy_error(fh);
    }

    return OpenReply{*fh, EntryReply{ino, with_ino(*attr, ino)}, directory, action};
}

}
