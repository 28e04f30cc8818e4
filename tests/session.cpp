/**********************************************************************
File name: session.cpp
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

#include <cerrno>
#include <thread>

#include "userspacefs/backend/in_memory.hpp"
#include "userspacefs/error_map.hpp"
#include "userspacefs/fuse/codec.hpp"
#include "userspacefs/session.hpp"
#include "userspacefs/smb/codec.hpp"

#include "testutils/frames.hpp"
#include "testutils/gated_backend.hpp"
#include "testutils/recording_transport.hpp"
#include "testutils/result.hpp"

using namespace Userspacefs;
using Backend::InMemoryFilesystem;
namespace InMemory = Backend::InMemory;

namespace {

struct PoolStopper {
    WorkerPool &pool;

    ~PoolStopper() {
        pool.shutdown();
    }
};

struct HoldGuard {
    HoldGuard(GatedFilesystem &fs, std::string path):
        fs(fs),
        path(std::move(path))
    {
        fs.hold(this->path);
    }

    ~HoldGuard() {
        fs.release(path);
    }

    GatedFilesystem &fs;
    std::string path;
};

/**
 * Runs a session on its own thread for the lifetime of the object.
 */
template <typename Codec>
class SessionThread {
public:
    SessionThread(RecordingTransport &transport, Codec &codec, Dispatcher &dispatcher):
        m_transport(transport),
        m_session(transport, codec, dispatcher, 1),
        m_result(make_result()),
        m_thread([this]() { m_result = m_session.run(); })
    {

    }

    ~SessionThread() {
        m_transport.close();
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

private:
    RecordingTransport &m_transport;
    Session<Codec> m_session;
    Result<void> m_result;
    std::thread m_thread;

public:
    Result<void> join() {
        m_thread.join();
        return m_result;
    }

};

const FuseReply *find_fuse_reply(const std::vector<FuseReply> &replies, uint64_t unique)
{
    for (const auto &reply: replies) {
        if (reply.header.unique == unique) {
            return &reply;
        }
    }
    return nullptr;
}

std::vector<FuseReply> fuse_replies(RecordingTransport &transport)
{
    std::vector<FuseReply> result;
    for (const auto &frame: transport.sent()) {
        result.push_back(parse_fuse_reply(frame));
    }
    return result;
}

}

SCENARIO("Serving a FUSE host")
{
    InMemoryFilesystem backing;
    backing.root().emplace<InMemory::File>("file");
    GatedFilesystem fs(backing);
    Registry registry(fs);
    WorkerPool pool(2);
    Dispatcher dispatcher(fs, registry, pool);
    PoolStopper stopper{pool};
    Fuse::Codec codec(registry, Fuse::CodecOptions());
    RecordingTransport transport;

    GIVEN("A host that initializes, looks up a file and unmounts") {
        transport.push(fuse_init(1));
        transport.push(fuse_request(FUSE_LOOKUP, 2, FUSE_ROOT_ID, fuse_name("file")));
        transport.push(fuse_request(FUSE_LOOKUP, 3, FUSE_ROOT_ID, fuse_name("missing")));
        transport.push(fuse_request(FUSE_DESTROY, 4, 0));

        WHEN("the session runs") {
            SessionThread<Fuse::Codec> thread(transport, codec, dispatcher);
            auto result = thread.join();

            THEN("it ends cleanly after answering every request") {
                require_result_ok(result);
                auto replies = fuse_replies(transport);
                CHECK(replies.size() == 4);

                auto init = find_fuse_reply(replies, 1);
                REQUIRE(init);
                CHECK(init->header.error == 0);

                auto found = find_fuse_reply(replies, 2);
                REQUIRE(found);
                CHECK(found->header.error == 0);
                auto entry = fuse_payload<fuse_entry_out>(*found);
                CHECK(entry.nodeid != 0);
                CHECK(entry.nodeid != FUSE_ROOT_ID);
                CHECK((entry.attr.mode & S_IFMT) == S_IFREG);

                auto missing = find_fuse_reply(replies, 3);
                REQUIRE(missing);
                CHECK(missing->header.error == -ENOENT);

                auto destroyed = find_fuse_reply(replies, 4);
                REQUIRE(destroyed);
                CHECK(destroyed->header.error == 0);
            }

            THEN("the identities handed out are released") {
                CHECK_FALSE(codec.initialized());
                CHECK(registry.pin(ROOT_INO));
            }
        }
    }

    GIVEN("A host sending a request for an identity it never received") {
        transport.push(fuse_init(1));
        transport.push(fuse_request(FUSE_GETATTR, 2, 0x1234, fuse_struct(fuse_getattr_in{})));
        transport.close();

        WHEN("the session runs") {
            SessionThread<Fuse::Codec> thread(transport, codec, dispatcher);
            auto result = thread.join();

            THEN("the request is rejected and the session continues until the host leaves") {
                require_result_ok(result);
                auto replies = fuse_replies(transport);
                REQUIRE(replies.size() == 2);
                auto rejected = find_fuse_reply(replies, 2);
                REQUIRE(rejected);
                CHECK(rejected->header.error == -ESTALE);
            }
        }
    }

    GIVEN("A transport which cannot send") {
        transport.fail_sends();
        transport.push(fuse_init(1));

        WHEN("the session runs") {
            SessionThread<Fuse::Codec> thread(transport, codec, dispatcher);
            auto result = thread.join();

            THEN("it ends with an I/O error") {
                check_result_error(result, Errc::IO_ERROR);
                CHECK(transport.sent().empty());
            }
        }
    }

    GIVEN("A lookup blocked in the backend") {
        SessionThread<Fuse::Codec> thread(transport, codec, dispatcher);
        // released before the session thread is joined
        HoldGuard hold{fs, "/file"};
        transport.push(fuse_init(1));
        REQUIRE(transport.wait_for_sent(1));
        transport.push(fuse_request(FUSE_LOOKUP, 2, FUSE_ROOT_ID, fuse_name("file")));
        REQUIRE(fs.wait_for_blocked(1));

        WHEN("the host interrupts a request which is not pending") {
            fuse_interrupt_in in{};
            in.unique = 99;
            transport.push(fuse_request(FUSE_INTERRUPT, 3, 0, fuse_struct(in)));

            THEN("the host is asked to retry later") {
                REQUIRE(transport.wait_for_sent(2));
                auto replies = fuse_replies(transport);
                auto again = find_fuse_reply(replies, 3);
                REQUIRE(again);
                CHECK(again->header.error == -EAGAIN);
            }

            fs.release("/file");
        }

        WHEN("the host interrupts the lookup") {
            fuse_interrupt_in in{};
            in.unique = 2;
            transport.push(fuse_request(FUSE_INTERRUPT, 3, 0, fuse_struct(in)));

            AND_WHEN("the backend continues") {
                // the interrupt must be seen before the lookup completes
                transport.push(fuse_request(FUSE_DESTROY, 4, 0));
                REQUIRE(transport.wait_for_sent(2));
                fs.release("/file");
                auto result = thread.join();

                THEN("the lookup is answered as interrupted") {
                    require_result_ok(result);
                    auto replies = fuse_replies(transport);
                    CHECK_FALSE(find_fuse_reply(replies, 3));
                    auto interrupted = find_fuse_reply(replies, 2);
                    REQUIRE(interrupted);
                    CHECK(interrupted->header.error == -EINTR);
                }
            }
        }
    }
}

SCENARIO("Serving an SMB2 client")
{
    InMemoryFilesystem fs;
    Registry registry(fs);
    WorkerPool pool(2);
    Dispatcher dispatcher(fs, registry, pool);
    PoolStopper stopper{pool};
    Smb::Codec codec(registry, Smb::CodecOptions());
    RecordingTransport transport;
    SmbClient client;

    size_t expected = 0;
    auto exchange = [&](std::string frame) {
        transport.push(std::move(frame));
        ++expected;
        REQUIRE(transport.wait_for_sent(expected));
        return parse_smb_reply(transport.sent().back());
    };

    GIVEN("A connected client") {
        SessionThread<Smb::Codec> thread(transport, codec, dispatcher);
        REQUIRE(exchange(client.negotiate({Smb::DIALECT_2_1})).status() == NtStatus::SUCCESS);
        auto session = exchange(client.session_setup());
        REQUIRE(session.status() == NtStatus::SUCCESS);
        client.adopt(session.message);
        auto tree = exchange(client.tree_connect("\\\\server\\userspacefs"));
        REQUIRE(tree.status() == NtStatus::SUCCESS);
        client.adopt(tree.message);

        WHEN("it creates, writes and reads back a file") {
            auto created = exchange(client.create("notes.txt", 2, 0xC0000000));
            REQUIRE(created.status() == NtStatus::SUCCESS);
            const uint64_t file_id = smb_create_file_id(created);

            auto written = exchange(client.write(file_id, 0, "hello"));
            REQUIRE(written.status() == NtStatus::SUCCESS);
            CHECK(smb_write_count(written) == 5);

            auto read = exchange(client.read(file_id, 64, 0));
            REQUIRE(read.status() == NtStatus::SUCCESS);
            CHECK(smb_read_data(read) == "hello");

            REQUIRE(exchange(client.close(file_id)).status() == NtStatus::SUCCESS);

            THEN("the file is in the backend") {
                auto st = fs.lstat("/notes.txt");
                require_result_ok(st);
                CHECK(st->size == 5);
            }

            AND_WHEN("the client disconnects") {
                transport.close();
                auto result = thread.join();

                THEN("the session ends cleanly") {
                    require_result_ok(result);
                    CHECK(transport.sent().size() == expected);
                }
            }
        }

        WHEN("a frame is not an SMB2 message") {
            transport.push(std::string("garbage"));
            transport.push(client.echo());
            ++expected;

            THEN("it is ignored and the connection keeps working") {
                REQUIRE(transport.wait_for_sent(expected));
                auto echo = parse_smb_reply(transport.sent().back());
                CHECK(echo.status() == NtStatus::SUCCESS);
                CHECK(echo.header.command == Smb::ECHO);
            }
        }
    }
}
