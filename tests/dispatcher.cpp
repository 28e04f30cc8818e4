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
#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>

#include <fcntl.h>
#include <sys/stat.h>

#include "userspacefs/backend/in_memory.hpp"
#include "userspacefs/dispatcher.hpp"

#include "testutils/gated_backend.hpp"
#include "testutils/result.hpp"

using namespace Userspacefs;
using Backend::CancelToken;
using Backend::InMemoryFilesystem;
namespace InMemory = Backend::InMemory;

namespace {

class Collector: public Responder {
private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<std::pair<uint64_t, Response>> m_responses;
    std::vector<uint64_t> m_cancelled;

public:
    /* called after a response was recorded, on the thread delivering it */
    std::function<void(const Request &)> on_response;

    void respond(const Request &req, const Response &response) override {
        {
            std::lock_guard lock(m_mutex);
            m_responses.emplace_back(req.unique, response);
        }
        m_cv.notify_all();
        if (on_response) {
            on_response(req);
        }
    }

    void cancelled(const Request &req) override {
        {
            std::lock_guard lock(m_mutex);
            m_cancelled.push_back(req.unique);
        }
        m_cv.notify_all();
    }

    bool wait_for(size_t count) {
        std::unique_lock lock(m_mutex);
        return m_cv.wait_for(lock, std::chrono::seconds(5), [this, count]() {
            return m_responses.size() + m_cancelled.size() >= count;
        });
    }

    std::vector<uint64_t> order() {
        std::lock_guard lock(m_mutex);
        std::vector<uint64_t> result;
        for (const auto &[unique, response]: m_responses) {
            result.push_back(unique);
        }
        return result;
    }

    std::vector<uint64_t> cancelled_requests() {
        std::lock_guard lock(m_mutex);
        return m_cancelled;
    }

    Response response_for(uint64_t unique) {
        std::lock_guard lock(m_mutex);
        for (const auto &[id, response]: m_responses) {
            if (id == unique) {
                return response;
            }
        }
        return make_result(FAILED, Errc::NONE);
    }
};

Request make_request(Opcode op, uint64_t unique, Ino ino = ROOT_INO)
{
    Request req;
    req.channel = 1;
    req.unique = unique;
    req.op = op;
    req.ino = ino;
    return req;
}

size_t count_calls(GatedFilesystem &fs, const std::string &call)
{
    const auto calls = fs.calls();
    return static_cast<size_t>(std::count(calls.begin(), calls.end(), call));
}

/**
 * Open the gate on scope exit, so that a failed check never leaves a worker
 * blocked.
 */
struct HoldGuard {
    HoldGuard(GatedFilesystem &fs, std::string path):
        m_fs(fs),
        m_path(std::move(path))
    {
        m_fs.hold(m_path);
    }

    ~HoldGuard() {
        m_fs.release(m_path);
    }

    GatedFilesystem &m_fs;
    std::string m_path;
};

struct PoolStopper {
    WorkerPool &pool;

    ~PoolStopper() {
        pool.shutdown();
    }
};

std::vector<std::string> names_of(const DirReply &reply)
{
    std::vector<std::string> result;
    for (const auto &item: reply.entries) {
        result.push_back(item.name);
    }
    return result;
}

}

TEST_CASE("match_pattern")
{
    CHECK(match_pattern("", "anything", false));
    CHECK(match_pattern("*", "anything", false));
    CHECK(match_pattern("*", "", false));
    CHECK(match_pattern("a*c", "abbbc", false));
    CHECK(match_pattern("a*c", "ac", false));
    CHECK_FALSE(match_pattern("a*c", "abcd", false));
    CHECK(match_pattern("?b?", "abc", false));
    CHECK_FALSE(match_pattern("?b?", "ab", false));
    CHECK(match_pattern("*.txt", "notes.txt", false));
    CHECK_FALSE(match_pattern("*.txt", "notes.txt.bak", false));
    CHECK(match_pattern("*a*b*", "xxaxxbxx", false));
    CHECK_FALSE(match_pattern("README", "readme", false));
    CHECK(match_pattern("README", "readme", true));
    CHECK(match_pattern("R*E", "readme", true));
}

SCENARIO("Executing requests against the backend")
{
    InMemoryFilesystem fs;
    auto &dir = fs.root().emplace<InMemory::Directory>("dir");
    dir.emplace<InMemory::File>("inner");
    fs.root().emplace<InMemory::File>("file");
    Registry registry(fs);
    WorkerPool pool(2);
    Dispatcher dispatcher(fs, registry, pool);

    auto run = [&dispatcher](Request &req) {
        return dispatcher.execute(req, CancelToken::never());
    };
    auto lookup = [&](Ino parent, const std::string &name) {
        Request req = make_request(Opcode::LOOKUP, 1, parent);
        req.name = name;
        auto response = run(req);
        REQUIRE(response);
        return std::get<EntryReply>(*response).ino;
    };
    auto open = [&](Ino ino, int flags) {
        Request req = make_request(Opcode::OPEN, 1, ino);
        req.flags = static_cast<uint32_t>(flags);
        auto response = run(req);
        REQUIRE(response);
        const auto &reply = std::get<OpenReply>(*response);
        CHECK(reply.action == OpenAction::OPENED);
        CHECK_FALSE(reply.directory);
        return reply.fh;
    };

    GIVEN("Name lookups") {
        WHEN("looking up an existing file") {
            Request req = make_request(Opcode::LOOKUP, 1);
            req.name = "file";
            auto response = run(req);

            THEN("an identity with the host attributes is returned") {
                require_result_ok(response);
                const auto &entry = std::get<EntryReply>(*response);
                CHECK(entry.ino != ROOT_INO);
                CHECK(entry.attr.ino == entry.ino);
                CHECK((entry.attr.mode & S_IFMT) == S_IFREG);
                auto count = registry.refcount(entry.ino);
                require_result_ok(count);
                CHECK(*count == 1);
            }
        }

        WHEN("looking up a missing name") {
            Request req = make_request(Opcode::LOOKUP, 1);
            req.name = "missing";

            THEN("NOT_FOUND is returned") {
                check_result_error(run(req), Errc::NOT_FOUND);
            }
        }

        WHEN("looking up below an unknown identity") {
            Request req = make_request(Opcode::LOOKUP, 1, 0xdead);
            req.name = "file";

            THEN("STALE_HANDLE is returned") {
                check_result_error(run(req), Errc::STALE_HANDLE);
            }
        }

        WHEN("looking up . and ..") {
            const Ino dir_ino = lookup(ROOT_INO, "dir");
            Request self = make_request(Opcode::LOOKUP, 1, dir_ino);
            self.name = ".";
            Request parent = make_request(Opcode::LOOKUP, 2, dir_ino);
            parent.name = "..";
            auto self_response = run(self);
            auto parent_response = run(parent);

            THEN("the directory and its parent are returned with a lookup counted") {
                require_result_ok(self_response);
                CHECK(std::get<EntryReply>(*self_response).ino == dir_ino);
                require_result_ok(parent_response);
                CHECK(std::get<EntryReply>(*parent_response).ino == ROOT_INO);
                auto count = registry.refcount(dir_ino);
                require_result_ok(count);
                CHECK(*count == 2);
            }
        }
    }

    GIVEN("Attribute requests") {
        WHEN("getting the attributes of the root") {
            Request req = make_request(Opcode::GETATTR, 1);
            auto response = run(req);

            THEN("the identity number replaces the backend one") {
                require_result_ok(response);
                const auto &attr = std::get<AttrReply>(*response).attr;
                CHECK(attr.ino == ROOT_INO);
                CHECK((attr.mode & S_IFMT) == S_IFDIR);
            }
        }

        WHEN("changing the size by identity") {
            const Ino ino = lookup(ROOT_INO, "file");
            Request req = make_request(Opcode::SETATTR, 1, ino);
            req.attr.valid = Backend::SetAttr::SIZE;
            req.attr.size = 123;
            auto response = run(req);

            THEN("the new attributes are returned") {
                require_result_ok(response);
                CHECK(std::get<AttrReply>(*response).attr.size == 123);
            }
        }

        WHEN("changing the size through an open handle") {
            const Ino ino = lookup(ROOT_INO, "file");
            const Fh fh = open(ino, O_RDWR);
            Request req = make_request(Opcode::SETATTR, 1, ino);
            req.fh = fh;
            req.attr.valid = Backend::SetAttr::SIZE;
            req.attr.size = 7;
            auto response = run(req);

            THEN("the file is truncated") {
                require_result_ok(response);
                CHECK(std::get<AttrReply>(*response).attr.size == 7);
                CHECK(std::get<AttrReply>(*response).attr.ino == ino);
                auto attr = fs.lstat("/file");
                require_result_ok(attr);
                CHECK(attr->size == 7);
            }
        }
    }

    GIVEN("Namespace changes") {
        const Ino dir_ino = lookup(ROOT_INO, "dir");

        WHEN("creating a directory") {
            Request req = make_request(Opcode::MKDIR, 1, dir_ino);
            req.name = "sub";
            req.mode = 0750;
            auto response = run(req);

            THEN("its entry is returned") {
                require_result_ok(response);
                const auto &entry = std::get<EntryReply>(*response);
                CHECK(entry.attr.mode == (S_IFDIR | 0750));
                auto path = registry.path(entry.ino);
                require_result_ok(path);
                CHECK(*path == "/dir/sub");
            }

            THEN("creating it again fails") {
                Request again = make_request(Opcode::MKDIR, 2, dir_ino);
                again.name = "sub";
                check_result_error(run(again), Errc::EXISTS);
            }
        }

        WHEN("creating a regular file node") {
            Request req = make_request(Opcode::MKNOD, 1, dir_ino);
            req.name = "node";
            req.mode = S_IFREG | 0600;
            auto response = run(req);

            THEN("the file exists") {
                require_result_ok(response);
                check_result_ok(fs.lstat("/dir/node"));
            }
        }

        WHEN("creating a device node") {
            Request req = make_request(Opcode::MKNOD, 1, dir_ino);
            req.name = "dev";
            req.mode = S_IFCHR | 0600;

            THEN("PERMISSION_DENIED is returned") {
                check_result_error(run(req), Errc::PERMISSION_DENIED);
            }
        }

        WHEN("creating a symlink") {
            Request req = make_request(Opcode::SYMLINK, 1, dir_ino);
            req.name = "link";
            req.data = "inner";
            auto response = run(req);
            require_result_ok(response);

            THEN("it can be read back") {
                Request readlink = make_request(Opcode::READLINK, 2,
                                                std::get<EntryReply>(*response).ino);
                auto target = run(readlink);
                require_result_ok(target);
                CHECK(std::get<DataReply>(*target).data == "inner");
            }
        }

        WHEN("unlinking a directory") {
            Request req = make_request(Opcode::UNLINK, 1);
            req.name = "dir";

            THEN("IS_A_DIRECTORY is returned") {
                check_result_error(run(req), Errc::IS_A_DIRECTORY);
            }
        }

        WHEN("removing a file as a directory") {
            Request req = make_request(Opcode::RMDIR, 1);
            req.name = "file";

            THEN("NOT_A_DIRECTORY is returned") {
                check_result_error(run(req), Errc::NOT_A_DIRECTORY);
            }
        }

        WHEN("unlinking a known file") {
            const Ino inner = lookup(dir_ino, "inner");
            Request req = make_request(Opcode::UNLINK, 1, dir_ino);
            req.name = "inner";
            auto response = run(req);

            THEN("the identity loses its name") {
                require_result_ok(response);
                check_result_error(fs.lstat("/dir/inner"), Errc::NOT_FOUND);
                check_result_error(registry.path(inner), Errc::NOT_FOUND);
            }

            AND_THEN("the directory can be removed") {
                Request rmdir = make_request(Opcode::RMDIR, 2);
                rmdir.name = "dir";
                check_result_ok(run(rmdir));
            }
        }
    }

    GIVEN("Renames") {
        const Ino dir_ino = lookup(ROOT_INO, "dir");
        const Ino file_ino = lookup(ROOT_INO, "file");
        auto rename = [&](Ino parent, const std::string &name, Ino newparent,
                          const std::string &newname, uint32_t flags) {
            Request req = make_request(Opcode::RENAME, 1, parent);
            req.name = name;
            req.newparent = newparent;
            req.newname = newname;
            req.flags = flags;
            return run(req);
        };

        THEN("unknown flags are rejected") {
            check_result_error(rename(ROOT_INO, "file", ROOT_INO, "x", 1 << 5),
                               Errc::INVALID_ARGUMENT);
        }

        THEN("exchange and whiteout are not supported") {
            check_result_error(rename(ROOT_INO, "file", dir_ino, "inner", RENAME_FLAG_EXCHANGE),
                               Errc::NOT_SUPPORTED);
            check_result_error(rename(ROOT_INO, "file", ROOT_INO, "x", RENAME_FLAG_WHITEOUT),
                               Errc::NOT_SUPPORTED);
        }

        THEN("NOREPLACE refuses an existing target") {
            check_result_error(rename(ROOT_INO, "file", dir_ino, "inner", RENAME_FLAG_NOREPLACE),
                               Errc::EXISTS);
        }

        THEN("a directory cannot move into itself") {
            check_result_error(rename(ROOT_INO, "dir", dir_ino, "self", 0),
                               Errc::INVALID_ARGUMENT);
        }

        THEN("a non-empty directory cannot be replaced") {
            check_result_ok(fs.mkdir("/other", 0755));
            check_result_error(rename(ROOT_INO, "other", ROOT_INO, "dir", 0), Errc::NOT_EMPTY);
        }

        THEN("a file cannot replace a non-empty directory") {
            check_result_error(rename(ROOT_INO, "file", ROOT_INO, "dir", 0),
                               Errc::IS_A_DIRECTORY);
            check_result_ok(fs.lstat("/file"));
            check_result_ok(fs.lstat("/dir/inner"));
        }

        THEN("a directory cannot replace a file") {
            check_result_error(rename(ROOT_INO, "dir", ROOT_INO, "file", 0),
                               Errc::NOT_A_DIRECTORY);
        }

        WHEN("replacing an existing file") {
            auto response = rename(ROOT_INO, "file", dir_ino, "inner", 0);

            THEN("the identity follows the object") {
                require_result_ok(response);
                auto path = registry.path(file_ino);
                require_result_ok(path);
                CHECK(*path == "/dir/inner");
                check_result_error(fs.lstat("/file"), Errc::NOT_FOUND);
            }
        }

        WHEN("renaming an object onto itself") {
            auto response = rename(ROOT_INO, "file", ROOT_INO, "file", RENAME_FLAG_NOREPLACE);

            THEN("nothing happens") {
                require_result_ok(response);
                check_result_ok(fs.lstat("/file"));
            }
        }
    }

    GIVEN("An open file") {
        const Ino ino = lookup(ROOT_INO, "file");

        WHEN("writing and reading through a read-write handle") {
            const Fh fh = open(ino, O_RDWR);
            Request write = make_request(Opcode::WRITE, 1, ino);
            write.fh = fh;
            write.data = "hello";
            auto written = run(write);
            require_result_ok(written);
            CHECK(std::get<WriteReply>(*written).count == 5);

            Request read = make_request(Opcode::READ, 2, ino);
            read.fh = fh;
            read.size = 100;
            read.offset = 1;
            auto data = run(read);

            THEN("the data is returned up to the end of the file") {
                require_result_ok(data);
                CHECK(std::get<DataReply>(*data).data == "ello");
            }

            AND_WHEN("appending") {
                Request append = make_request(Opcode::WRITE, 3, ino);
                append.fh = fh;
                append.data = " world";
                append.offset = 0;
                append.request_flags = WRITE_APPEND;
                require_result_ok(run(append));

                THEN("the offset is ignored") {
                    read.offset = 0;
                    auto all = run(read);
                    require_result_ok(all);
                    CHECK(std::get<DataReply>(*all).data == "hello world");
                }
            }

            AND_WHEN("flushing and syncing") {
                Request flush = make_request(Opcode::FLUSH, 3, ino);
                flush.fh = fh;
                Request fsync = make_request(Opcode::FSYNC, 4, ino);
                fsync.fh = fh;
                fsync.request_flags = FSYNC_DATASYNC;

                THEN("both succeed") {
                    check_result_ok(run(flush));
                    check_result_ok(run(fsync));
                }
            }
        }

        WHEN("writing through a read-only handle") {
            Request write = make_request(Opcode::WRITE, 1, ino);
            write.fh = open(ino, O_RDONLY);
            write.data = "x";

            THEN("PERMISSION_DENIED is returned") {
                check_result_error(run(write), Errc::PERMISSION_DENIED);
            }
        }

        WHEN("reading through a write-only handle") {
            Request read = make_request(Opcode::READ, 1, ino);
            read.fh = open(ino, O_WRONLY);
            read.size = 10;

            THEN("PERMISSION_DENIED is returned") {
                check_result_error(run(read), Errc::PERMISSION_DENIED);
            }
        }

        WHEN("reading through an unknown handle") {
            Request read = make_request(Opcode::READ, 1, ino);
            read.fh = 0x1234;
            read.size = 10;

            THEN("STALE_HANDLE is returned") {
                check_result_error(run(read), Errc::STALE_HANDLE);
            }
        }

        WHEN("releasing it twice") {
            const Fh fh = open(ino, O_RDONLY);
            Request release = make_request(Opcode::RELEASE, 1, ino);
            release.fh = fh;

            THEN("both calls succeed") {
                check_result_ok(run(release));
                check_result_ok(run(release));
                CHECK(registry.open_handles() == 0);
            }
        }

        WHEN("releasing it with the attributes") {
            const Fh fh = open(ino, O_RDWR);
            Request write = make_request(Opcode::WRITE, 1, ino);
            write.fh = fh;
            write.data = "abc";
            require_result_ok(run(write));

            Request release = make_request(Opcode::RELEASE, 2, ino);
            release.fh = fh;
            release.request_flags = RELEASE_STAT;
            auto response = run(release);

            THEN("the attributes before closing are returned") {
                require_result_ok(response);
                const auto &attr = std::get<AttrReply>(*response).attr;
                CHECK(attr.size == 3);
                CHECK(attr.ino == ino);
            }
        }

        WHEN("releasing it with delete-on-close") {
            const Fh fh = open(ino, O_RDONLY);
            Request release = make_request(Opcode::RELEASE, 1, ino);
            release.fh = fh;
            release.request_flags = RELEASE_UNLINK;
            auto response = run(release);

            THEN("the file is removed") {
                require_result_ok(response);
                check_result_error(fs.lstat("/file"), Errc::NOT_FOUND);
                check_result_error(registry.path(ino), Errc::NOT_FOUND);
            }
        }
    }

    GIVEN("File creation") {
        Request req = make_request(Opcode::CREATE, 1);
        req.name = "new";
        req.flags = O_RDWR | O_CREAT | O_EXCL;
        req.mode = 0600;
        auto response = run(req);

        THEN("the entry and an open handle are returned") {
            require_result_ok(response);
            const auto &reply = std::get<OpenReply>(*response);
            CHECK(reply.action == OpenAction::CREATED);
            CHECK(reply.entry.attr.mode == (S_IFREG | 0600));
            auto handle = registry.handle(reply.fh);
            require_result_ok(handle);
            CHECK((*handle)->ino == reply.entry.ino);
            CHECK(((*handle)->flags & O_CREAT) == 0);
        }

        THEN("creating it exclusively again fails") {
            Request again = make_request(Opcode::CREATE, 2);
            again.name = "new";
            again.flags = O_RDWR | O_CREAT | O_EXCL;
            check_result_error(run(again), Errc::EXISTS);
        }
    }

    GIVEN("An open directory") {
        fs.root().emplace<InMemory::File>("beta");
        fs.root().emplace<InMemory::File>("Alpha");
        Request opendir = make_request(Opcode::OPENDIR, 1);
        auto opened = run(opendir);
        require_result_ok(opened);
        REQUIRE(std::get<OpenReply>(*opened).directory);
        const Fh fh = std::get<OpenReply>(*opened).fh;

        auto readdir = [&](uint64_t offset, uint32_t max_entries, const std::string &pattern,
                           uint32_t flags) {
            Request req = make_request(Opcode::READDIR, 2);
            req.fh = fh;
            req.offset = offset;
            req.max_entries = max_entries;
            req.name = pattern;
            req.request_flags = flags;
            auto response = run(req);
            REQUIRE(response);
            return std::get<DirReply>(*response);
        };

        WHEN("reading it in one go") {
            auto reply = readdir(0, 0, "", 0);

            THEN("the dot entries come first and all entries get offsets") {
                CHECK(names_of(reply) == std::vector<std::string>{
                          ".", "..", "Alpha", "beta", "dir", "file"});
                REQUIRE(reply.entries.size() == 6);
                for (size_t i = 0; i < reply.entries.size(); ++i) {
                    CHECK(reply.entries[i].offset == i + 1);
                }
                CHECK(reply.eof);
            }

            AND_WHEN("reading from offset 0 again") {
                auto again = readdir(0, 0, "", 0);

                THEN("the stream is rewound") {
                    CHECK(again.entries.size() == 6);
                    CHECK(again.eof);
                }
            }
        }

        WHEN("reading it in pieces") {
            auto first = readdir(0, 2, "", 0);
            auto second = readdir(2, 2, "", 0);
            auto third = readdir(4, 2, "", 0);
            auto last = readdir(6, 2, "", 0);

            THEN("each piece resumes after the last offset") {
                CHECK(names_of(first) == std::vector<std::string>{".", ".."});
                CHECK_FALSE(first.eof);
                CHECK(names_of(second) == std::vector<std::string>{"Alpha", "beta"});
                CHECK(names_of(third) == std::vector<std::string>{"dir", "file"});
                CHECK(last.entries.empty());
                CHECK(last.eof);
            }
        }

        WHEN("filtering by pattern") {
            auto reply = readdir(0, 0, "*et*", 0);

            THEN("only matching names are returned") {
                CHECK(names_of(reply) == std::vector<std::string>{"beta"});
            }
        }

        WHEN("filtering by pattern ignoring case") {
            auto reply = readdir(0, 0, "a*", READDIR_CASELESS);

            THEN("the case of the names does not matter") {
                CHECK(names_of(reply) == std::vector<std::string>{"Alpha"});
            }
        }

        WHEN("asking for attributes") {
            auto reply = readdir(0, 0, "", READDIR_ATTRS);

            THEN("the dot entries carry the attributes of their identities") {
                REQUIRE(reply.entries.size() >= 2);
                CHECK(reply.entries[0].attr.ino == ROOT_INO);
                CHECK((reply.entries[0].attr.mode & S_IFMT) == S_IFDIR);
                CHECK(reply.entries[0].ino == 1);
                CHECK((reply.entries[5].attr.mode & S_IFMT) == S_IFREG);
            }
        }

        WHEN("syncing and releasing it") {
            Request fsyncdir = make_request(Opcode::FSYNCDIR, 3);
            fsyncdir.fh = fh;
            Request releasedir = make_request(Opcode::RELEASEDIR, 4);
            releasedir.fh = fh;

            THEN("both succeed and the cursor is gone") {
                check_result_ok(run(fsyncdir));
                check_result_ok(run(releasedir));
                check_result_error(registry.cursor(fh), Errc::STALE_HANDLE);
            }
        }
    }

    GIVEN("Opening by path") {
        auto open_path = [&](std::vector<std::string> path, Disposition disposition,
                             uint32_t flags = 0) {
            Request req = make_request(Opcode::OPEN_PATH, 1);
            req.path = std::move(path);
            req.disposition = disposition;
            req.flags = O_RDWR;
            req.request_flags = flags;
            return run(req);
        };

        THEN("creating an existing object fails") {
            check_result_error(open_path({"file"}, Disposition::CREATE), Errc::EXISTS);
        }

        THEN("opening a missing object fails") {
            check_result_error(open_path({"missing"}, Disposition::OPEN), Errc::NOT_FOUND);
            check_result_error(open_path({"missing"}, Disposition::OVERWRITE), Errc::NOT_FOUND);
        }

        THEN("walking through a file fails") {
            check_result_error(open_path({"file", "x"}, Disposition::OPEN_IF),
                               Errc::NOT_A_DIRECTORY);
        }

        THEN("type constraints are checked") {
            check_result_error(open_path({"file"}, Disposition::OPEN, OPEN_DIRECTORY),
                               Errc::NOT_A_DIRECTORY);
            check_result_error(open_path({"dir"}, Disposition::OPEN, OPEN_NON_DIRECTORY),
                               Errc::IS_A_DIRECTORY);
            check_result_error(open_path({"dir"}, Disposition::OVERWRITE_IF),
                               Errc::IS_A_DIRECTORY);
        }

        THEN("the root can be opened") {
            auto response = open_path({}, Disposition::OPEN);
            require_result_ok(response);
            const auto &reply = std::get<OpenReply>(*response);
            CHECK(reply.directory);
            CHECK(reply.entry.ino == ROOT_INO);
        }

        WHEN("opening a missing file with OPEN_IF") {
            auto response = open_path({"dir", "created"}, Disposition::OPEN_IF);

            THEN("the file is created and opened") {
                require_result_ok(response);
                const auto &reply = std::get<OpenReply>(*response);
                CHECK(reply.action == OpenAction::CREATED);
                CHECK_FALSE(reply.directory);
                check_result_ok(fs.lstat("/dir/created"));
                auto path = registry.path(reply.entry.ino);
                require_result_ok(path);
                CHECK(*path == "/dir/created");
            }
        }

        WHEN("creating a missing directory") {
            auto response = open_path({"newdir"}, Disposition::CREATE, OPEN_DIRECTORY);

            THEN("a directory is made and opened") {
                require_result_ok(response);
                const auto &reply = std::get<OpenReply>(*response);
                CHECK(reply.action == OpenAction::CREATED);
                CHECK(reply.directory);
                auto attr = fs.lstat("/newdir");
                require_result_ok(attr);
                CHECK(S_ISDIR(attr->mode));
            }
        }

        WHEN("overwriting and superseding an existing file") {
            auto opened = fs.open("/file", O_WRONLY, 0);
            REQUIRE(opened);
            require_result_ok((*opened)->pwrite("data", 4, 0, CancelToken::never()));
            auto overwritten = open_path({"file"}, Disposition::OVERWRITE_IF);
            auto superseded = open_path({"file"}, Disposition::SUPERSEDE);
            auto plain = open_path({"file"}, Disposition::OPEN_IF);

            THEN("the actions tell them apart") {
                require_result_ok(overwritten);
                CHECK(std::get<OpenReply>(*overwritten).action == OpenAction::OVERWRITTEN);
                CHECK(std::get<OpenReply>(*overwritten).entry.attr.size == 0);
                require_result_ok(superseded);
                CHECK(std::get<OpenReply>(*superseded).action == OpenAction::SUPERSEDED);
                require_result_ok(plain);
                CHECK(std::get<OpenReply>(*plain).action == OpenAction::OPENED);
            }
        }
    }

    GIVEN("A statfs request") {
        Request req = make_request(Opcode::STATFS, 1);
        auto response = run(req);

        THEN("the backend numbers are returned") {
            require_result_ok(response);
            CHECK(std::get<StatfsReply>(*response).st.bsize == 4096);
        }
    }
}

SCENARIO("Ordering and cancellation of dispatched requests")
{
    InMemoryFilesystem backing;
    backing.root().emplace<InMemory::Directory>("d");
    backing.root().emplace<InMemory::File>("f");
    GatedFilesystem fs(backing);
    Registry registry(fs);
    Collector collector;
    WorkerPool pool(4);
    Dispatcher dispatcher(fs, registry, pool);
    // jobs still queued must finish while the dispatcher exists
    PoolStopper stopper{pool};

    auto entry = registry.lookup(ROOT_INO, "f");
    REQUIRE(entry);
    const Ino file_ino = entry->ino;
    auto dir_entry = registry.lookup(ROOT_INO, "d");
    REQUIRE(dir_entry);
    const Ino dir_ino = dir_entry->ino;

    Request open_req = make_request(Opcode::OPEN, 100, file_ino);
    open_req.flags = O_RDWR;
    auto opened = dispatcher.execute(open_req, CancelToken::never());
    REQUIRE(opened);
    const Fh fh = std::get<OpenReply>(*opened).fh;

    auto refs = [&registry](Ino ino) {
        auto count = registry.refcount(ino);
        REQUIRE(count);
        return *count;
    };
    const uint64_t file_refs = refs(file_ino);

    // pinned like a codec pins the identities a request refers to
    auto write = [&](uint64_t unique, std::string data, uint64_t offset) {
        Request req = make_request(Opcode::WRITE, unique, file_ino);
        auto pin = registry.pin(file_ino);
        REQUIRE(pin);
        req.pins.push_back(std::move(*pin));
        req.fh = fh;
        req.data = std::move(data);
        req.offset = offset;
        return req;
    };

    GIVEN("A write blocked in the backend") {
        HoldGuard hold{fs, "/f"};
        require_result_ok(dispatcher.submit(write(1, "a", 0), collector));
        REQUIRE(fs.wait_for_blocked(1));

        WHEN("another write on the same handle and an unrelated request are submitted") {
            require_result_ok(dispatcher.submit(write(2, "b", 1), collector));
            require_result_ok(dispatcher.submit(make_request(Opcode::GETATTR, 3), collector));
            REQUIRE(collector.wait_for(1));

            THEN("only the unrelated request completes") {
                CHECK(collector.order() == std::vector<uint64_t>{3});
                CHECK(count_calls(fs, "pwrite:/f") == 1);
                CHECK(dispatcher.pending() == 2);
            }

            AND_WHEN("the backend continues") {
                fs.release("/f");
                REQUIRE(collector.wait_for(3));
                dispatcher.drain(1);

                THEN("the writes complete in submission order") {
                    CHECK(collector.order() == std::vector<uint64_t>{3, 1, 2});
                    CHECK(dispatcher.pending() == 0);
                    std::string data(2, '\0');
                    auto file = backing.open("/f", O_RDONLY, 0);
                    REQUIRE(file);
                    auto count = (*file)->pread(data.data(), data.size(), 0, CancelToken::never());
                    require_result_ok(count);
                    CHECK(data == "ab");
                }
            }
        }

        WHEN("a request with the same unique number is submitted") {
            Request duplicate = write(1, "x", 0);
            auto result = dispatcher.submit(std::move(duplicate), collector);

            THEN("it is rejected and left untouched") {
                check_result_error(result, Errc::INVALID_ARGUMENT);
                CHECK(duplicate.data == "x");
                CHECK(dispatcher.pending() == 1);
            }
        }

        WHEN("a queued write is cancelled") {
            require_result_ok(dispatcher.submit(write(2, "b", 1), collector));
            const auto result = dispatcher.cancel(1, 2);

            THEN("it is skipped right away and lets go of its identity") {
                CHECK(result == Dispatcher::CancelResult::SKIPPED);
                CHECK(collector.cancelled_requests() == std::vector<uint64_t>{2});
                CHECK(dispatcher.pending() == 1);
                CHECK(refs(file_ino) == file_refs + 1);
            }

            AND_WHEN("the backend continues") {
                fs.release("/f");
                REQUIRE(collector.wait_for(2));
                dispatcher.drain(1);

                THEN("only the first write ran") {
                    CHECK(collector.order() == std::vector<uint64_t>{1});
                    CHECK(count_calls(fs, "pwrite:/f") == 1);
                    CHECK(refs(file_ino) == file_refs);
                }
            }
        }

        WHEN("the running write is cancelled") {
            const auto result = dispatcher.cancel(1, 1);
            REQUIRE(collector.wait_for(1));

            THEN("its token stops the backend and no response is produced") {
                CHECK(result == Dispatcher::CancelResult::MARKED);
                CHECK(collector.cancelled_requests() == std::vector<uint64_t>{1});
                CHECK(collector.order().empty());
                dispatcher.drain(1);
                CHECK(dispatcher.pending() == 0);
                CHECK(refs(file_ino) == file_refs);
            }
        }

        WHEN("a release queued behind it is cancelled") {
            Request release = make_request(Opcode::RELEASE, 2, file_ino);
            release.fh = fh;
            require_result_ok(dispatcher.submit(std::move(release), collector));
            const auto result = dispatcher.cancel(1, 2);

            THEN("the release still runs once the write is done") {
                CHECK(result == Dispatcher::CancelResult::TOO_LATE);
                fs.release("/f");
                REQUIRE(collector.wait_for(2));
                dispatcher.drain(1);
                CHECK(collector.cancelled_requests().empty());
                CHECK(collector.order() == std::vector<uint64_t>{1, 2});
                check_result_error(registry.handle(fh), Errc::STALE_HANDLE);
            }
        }

        WHEN("the unique number of the write is reused as soon as it is answered") {
            std::optional<Request> again(write(1, "b", 1));
            Result<void> reused = make_result(FAILED, Errc::IO_ERROR);
            collector.on_response = [&](const Request &req) {
                if (req.unique == 1 && again) {
                    Request next = std::move(*again);
                    again.reset();
                    reused = dispatcher.submit(std::move(next), collector);
                }
            };
            fs.release("/f");
            REQUIRE(collector.wait_for(2));
            dispatcher.drain(1);
            collector.on_response = nullptr;

            THEN("the new request is accepted and runs after the first") {
                require_result_ok(reused);
                CHECK(collector.order() == std::vector<uint64_t>{1, 1});
                CHECK(dispatcher.pending() == 0);
                CHECK(refs(file_ino) == file_refs);
            }
        }

        WHEN("an unknown request is cancelled") {
            const auto result = dispatcher.cancel(1, 99);

            THEN("nothing is found") {
                CHECK(result == Dispatcher::CancelResult::NOT_FOUND);
                CHECK(dispatcher.pending() == 1);
            }
        }

        WHEN("all requests of the channel are cancelled") {
            require_result_ok(dispatcher.submit(write(2, "b", 1), collector));
            require_result_ok(dispatcher.submit(write(3, "c", 2), collector));
            Request other_channel = make_request(Opcode::GETATTR, 1);
            other_channel.channel = 2;
            other_channel.fh = fh;
            require_result_ok(dispatcher.submit(std::move(other_channel), collector));
            dispatcher.cancel_all(1);
            dispatcher.drain(1);

            THEN("every request of the channel ends without a response") {
                auto cancelled = collector.cancelled_requests();
                std::sort(cancelled.begin(), cancelled.end());
                CHECK(cancelled == std::vector<uint64_t>{1, 2, 3});
            }

            THEN("the other channel is served") {
                REQUIRE(collector.wait_for(4));
                CHECK(collector.order() == std::vector<uint64_t>{1});
                require_result_ok(collector.response_for(1));
            }
        }

        fs.release("/f");
        dispatcher.drain(1);
        dispatcher.drain(2);
    }

    GIVEN("A directory change blocked in the backend") {
        HoldGuard hold{fs, "/d/x"};
        Request first = make_request(Opcode::MKDIR, 1, dir_ino);
        first.name = "x";
        require_result_ok(dispatcher.submit(std::move(first), collector));
        REQUIRE(fs.wait_for_blocked(1));

        Request second = make_request(Opcode::MKDIR, 2, dir_ino);
        second.name = "y";
        require_result_ok(dispatcher.submit(std::move(second), collector));
        Request elsewhere = make_request(Opcode::MKDIR, 3);
        elsewhere.name = "z";
        require_result_ok(dispatcher.submit(std::move(elsewhere), collector));
        REQUIRE(collector.wait_for(1));

        THEN("changes to other directories are not held up") {
            CHECK(collector.order() == std::vector<uint64_t>{3});
            CHECK(count_calls(fs, "mkdir:/d/y") == 0);
        }

        fs.release("/d/x");
        REQUIRE(collector.wait_for(3));
        dispatcher.drain(1);

        THEN("changes to the same directory run in submission order") {
            CHECK(collector.order() == std::vector<uint64_t>{3, 1, 2});
            check_result_ok(backing.lstat("/d/x"));
            check_result_ok(backing.lstat("/d/y"));
        }
    }

    GIVEN("A directory change blocked while its directory is renamed") {
        HoldGuard hold{fs, "/d/x"};
        Request first = make_request(Opcode::MKDIR, 1, dir_ino);
        first.name = "x";
        require_result_ok(dispatcher.submit(std::move(first), collector));
        REQUIRE(fs.wait_for_blocked(1));

        Request rename = make_request(Opcode::RENAME, 2);
        rename.name = "d";
        rename.newparent = ROOT_INO;
        rename.newname = "e";
        require_result_ok(dispatcher.submit(std::move(rename), collector));
        REQUIRE(collector.wait_for(1));
        require_result_ok(collector.response_for(2));

        Request second = make_request(Opcode::MKDIR, 3, dir_ino);
        second.name = "y";
        require_result_ok(dispatcher.submit(std::move(second), collector));
        require_result_ok(dispatcher.submit(make_request(Opcode::GETATTR, 4), collector));
        REQUIRE(collector.wait_for(2));

        THEN("a change under the new name still waits for the first one") {
            CHECK(collector.order() == std::vector<uint64_t>{2, 4});
            CHECK(count_calls(fs, "mkdir:/e/y") == 0);
            CHECK(dispatcher.pending() == 2);
        }

        fs.release("/d/x");
        REQUIRE(collector.wait_for(4));
        dispatcher.drain(1);

        THEN("both changes ran in submission order") {
            CHECK(collector.order() == std::vector<uint64_t>{2, 4, 1, 3});
            check_result_ok(backing.lstat("/e/y"));
        }
    }

    GIVEN("A FORGET request") {
        Request forget = make_request(Opcode::FORGET, 1);
        forget.forgets.emplace_back(dir_ino, 1);
        require_result_ok(dispatcher.submit(std::move(forget), collector));

        THEN("it is answered synchronously") {
            CHECK(collector.order() == std::vector<uint64_t>{1});
            CHECK(dispatcher.pending() == 0);
            check_result_error(registry.path(dir_ino), Errc::STALE_HANDLE);
        }
    }

    close_all(registry.clear());
}
