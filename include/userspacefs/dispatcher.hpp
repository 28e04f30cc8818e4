/**********************************************************************
File name: dispatcher.hpp
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
#ifndef USERSPACEFS_DISPATCHER_H
#define USERSPACEFS_DISPATCHER_H

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "userspacefs/backend.hpp"
#include "userspacefs/registry.hpp"
#include "userspacefs/request.hpp"
#include "userspacefs/worker_pool.hpp"

namespace Userspacefs {

/**
 * Receives the outcome of dispatched requests. Calls may come from any
 * worker thread.
 */
class Responder {
public:
    virtual ~Responder();

public:
    virtual void respond(const Request &req, const Response &response) = 0;

    /**
     * @a req was cancelled by the host and produced no response.
     */
    virtual void cancelled(const Request &req) = 0;

};

/**
 * Match @a name against a pattern of literal characters, `*` and `?`.
 *
 * An empty pattern matches everything.
 */
bool match_pattern(std::string_view pattern, std::string_view name, bool caseless);

/**
 * Runs decoded requests against the backend on a worker pool.
 *
 * Requests sharing an ordering key (the same open handle, or the same
 * directory for operations changing or enumerating it) run one at a time in
 * submission order; everything else runs in parallel.
 */
class Dispatcher {
public:
    enum class CancelResult {
        /* no such request is pending */
        NOT_FOUND,
        /* the request had not started and will not run */
        SKIPPED,
        /* the request is running; its result will be discarded */
        MARKED,
        /* the response is already on its way */
        TOO_LATE,
    };

public:
    Dispatcher(Backend::Filesystem &fs, Registry &registry, WorkerPool &pool);
    Dispatcher(const Dispatcher &src) = delete;
    Dispatcher &operator=(const Dispatcher &src) = delete;

private:
    struct Entry {
        enum State {
            QUEUED,
            READY,
            RUNNING,
            COMPLETING,
        };

        Request request;
        Responder *responder;
        std::vector<std::string> keys;
        State state = QUEUED;
        bool cancelled = false;
        Backend::CancelToken token;
    };

    using EntryPtr = std::shared_ptr<Entry>;
    using PendingKey = std::pair<ChannelId, uint64_t>;

    Backend::Filesystem &m_fs;
    Registry &m_registry;
    WorkerPool &m_pool;

    std::mutex m_mutex;
    std::condition_variable m_idle_cv;
    std::map<PendingKey, EntryPtr> m_pending;
    /* requests per channel which have not finished yet, including entries
     * replaced in m_pending by a reused unique number */
    std::map<ChannelId, size_t> m_active;
    std::map<std::string, std::deque<EntryPtr>> m_queues;

    std::vector<std::string> ordering_keys(const Request &req);
    bool is_ready_locked(const EntryPtr &entry);
    void unqueue_locked(const EntryPtr &entry, std::vector<EntryPtr> &ready);
    void schedule(std::vector<EntryPtr> &&ready);
    void run(const EntryPtr &entry);
    void finish_locked(const EntryPtr &entry);
    void finish_skipped(std::vector<EntryPtr> &&skipped);
    CancelResult cancel_locked(const EntryPtr &entry, std::vector<EntryPtr> &ready,
                               std::vector<EntryPtr> &skipped);
    void discard(const Request &req, const Response &response);

    Response do_lookup(Request &req);
    Response do_getattr(Request &req);
    Response do_setattr(Request &req);
    Response do_readlink(Request &req);
    Response do_mknod(Request &req);
    Response do_mkdir(Request &req);
    Response do_symlink(Request &req);
    Response do_unlink(Request &req);
    Response do_rmdir(Request &req);
    Response do_rename(Request &req);
    Response do_open(Request &req);
    Response do_create(Request &req);
    Response do_read(Request &req, const Backend::CancelToken &token);
    Response do_write(Request &req, const Backend::CancelToken &token);
    Response do_flush(Request &req);
    Response do_release(Request &req);
    Response do_fsync(Request &req);
    Response do_opendir(Request &req);
    Response do_readdir(Request &req, const Backend::CancelToken &token);
    Response do_releasedir(Request &req);
    Response do_fsyncdir(Request &req);
    Response do_statfs(Request &req);
    Response do_open_path(Request &req);

    Response entry_reply(Ino parent, std::string_view name);
    Result<void> remove_object(Ino parent, std::string_view name);
    Result<bool> is_empty_dir(const std::string &path);

public:
    /**
     * Take ownership of @a req and run it once it is first in line for all
     * its ordering keys.
     *
     * Fails with Errc::INVALID_ARGUMENT if a request with the same channel
     * and unique number is still pending; @a req is left untouched then. A
     * number whose response is already being sent may be reused.
     */
    Result<void> submit(Request &&req, Responder &responder);

    CancelResult cancel(ChannelId channel, uint64_t unique);
    void cancel_all(ChannelId channel);

    /**
     * Block until no request of @a channel is pending and every response or
     * cancellation of it was handed to its responder.
     */
    void drain(ChannelId channel);

    [[nodiscard]] size_t pending();

    /**
     * Execute @a req synchronously on the calling thread, ignoring ordering.
     */
    Response execute(Request &req, const Backend::CancelToken &token);

};

}

#endif
