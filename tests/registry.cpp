/**********************************************************************
File name: registry.cpp
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

#include <fcntl.h>
#include <sys/stat.h>

#include "userspacefs/backend/in_memory.hpp"
#include "userspacefs/registry.hpp"

#include "testutils/result.hpp"

using namespace Userspacefs;

static std::unique_ptr<Backend::File> open_file(Backend::Filesystem &fs, std::string_view path)
{
    auto result = fs.open(path, O_RDONLY, 0);
    REQUIRE(result);
    return std::move(*result);
}

SCENARIO("Identity lookup and reclamation")
{
    Backend::InMemoryFilesystem fs;
    fs.root().emplace<Backend::InMemory::Directory>("dir")
            .emplace<Backend::InMemory::File>("file");
    Registry registry(fs);

    GIVEN("A fresh registry") {
        THEN("only the root is known") {
            auto path = registry.path(ROOT_INO);
            require_result_ok(path);
            CHECK(*path == "/");
            check_result_error(registry.path(2), Errc::STALE_HANDLE);
        }

        THEN("the root has no location") {
            check_result_error(registry.location(ROOT_INO), Errc::INVALID_ARGUMENT);
        }

        WHEN("looking up a missing name") {
            auto result = registry.lookup(ROOT_INO, "missing");

            THEN("the backend error is returned") {
                check_result_error(result, Errc::NOT_FOUND);
            }
        }
    }

    GIVEN("A looked up directory and file") {
        auto dir = registry.lookup(ROOT_INO, "dir");
        require_result_ok(dir);
        auto file = registry.lookup(dir->ino, "file");
        require_result_ok(file);

        THEN("the identities get distinct numbers") {
            CHECK(dir->ino == 2);
            CHECK(file->ino == 3);
            CHECK((dir->attr.mode & S_IFMT) == S_IFDIR);
            CHECK((file->attr.mode & S_IFMT) == S_IFREG);
        }

        THEN("their paths are derived from the tree of names") {
            auto path = registry.path(file->ino);
            require_result_ok(path);
            CHECK(*path == "/dir/file");

            auto location = registry.location(file->ino);
            require_result_ok(location);
            CHECK(location->parent == dir->ino);
            CHECK(location->name == "file");
        }

        THEN("a named child counts as a reference on its parent") {
            auto count = registry.refcount(dir->ino);
            require_result_ok(count);
            CHECK(*count == 2);
        }

        WHEN("looking up the same name again") {
            auto again = registry.lookup(dir->ino, "file");
            require_result_ok(again);

            THEN("the identity is reused") {
                CHECK(again->ino == file->ino);
                auto count = registry.refcount(file->ino);
                require_result_ok(count);
                CHECK(*count == 2);
            }
        }

        WHEN("the file is forgotten") {
            registry.forget(file->ino, 1);

            THEN("it is reclaimed") {
                check_result_error(registry.path(file->ino), Errc::STALE_HANDLE);
            }

            THEN("the directory loses its child reference") {
                auto count = registry.refcount(dir->ino);
                require_result_ok(count);
                CHECK(*count == 1);
            }

            AND_WHEN("the name is looked up again") {
                auto reborn = registry.lookup(dir->ino, "file");
                require_result_ok(reborn);

                THEN("the slot is reused with a new generation") {
                    CHECK(reborn->ino != file->ino);
                    CHECK(static_cast<uint32_t>(reborn->ino) == static_cast<uint32_t>(file->ino));
                    check_result_error(registry.refcount(file->ino), Errc::STALE_HANDLE);
                }
            }
        }

        WHEN("both are forgotten, child first") {
            registry.forget(file->ino, 1);
            registry.forget(dir->ino, 1);

            THEN("both are reclaimed") {
                check_result_error(registry.path(dir->ino), Errc::STALE_HANDLE);
                check_result_error(registry.path(file->ino), Errc::STALE_HANDLE);
            }
        }

        WHEN("the directory is forgotten first") {
            registry.forget(dir->ino, 1);

            THEN("it survives through its child") {
                check_result_ok(registry.path(dir->ino));
            }

            AND_WHEN("the child is forgotten") {
                registry.forget(file->ino, 1);

                THEN("the reclamation cascades to the directory") {
                    check_result_error(registry.path(dir->ino), Errc::STALE_HANDLE);
                }
            }
        }

        WHEN("more lookups are forgotten than were counted") {
            registry.forget(file->ino, 100);

            THEN("the identity is reclaimed once") {
                check_result_error(registry.path(file->ino), Errc::STALE_HANDLE);
            }
        }

        WHEN("an unknown number is forgotten") {
            registry.forget(0xdeadbeef, 1);

            THEN("nothing happens") {
                check_result_ok(registry.path(file->ino));
            }
        }

        WHEN("the file is pinned and forgotten") {
            auto pin = registry.pin(file->ino);
            require_result_ok(pin);
            registry.forget(file->ino, 1);

            THEN("it stays valid while the pin is held") {
                check_result_ok(registry.path(file->ino));
            }

            AND_WHEN("the pin is released") {
                pin->reset();

                THEN("it is reclaimed") {
                    check_result_error(registry.path(file->ino), Errc::STALE_HANDLE);
                }
            }
        }

        WHEN("an identity gains another lookup by number") {
            require_result_ok(registry.reference(file->ino));
            registry.forget(file->ino, 1);

            THEN("it needs a second forget") {
                check_result_ok(registry.path(file->ino));
                registry.forget(file->ino, 1);
                check_result_error(registry.path(file->ino), Errc::STALE_HANDLE);
            }
        }
    }
}

SCENARIO("Identity relinking")
{
    Backend::InMemoryFilesystem fs;
    auto &a = fs.root().emplace<Backend::InMemory::Directory>("a");
    a.emplace<Backend::InMemory::File>("x");
    a.emplace<Backend::InMemory::File>("y");
    fs.root().emplace<Backend::InMemory::Directory>("b");
    Registry registry(fs);

    auto dir_a = registry.lookup(ROOT_INO, "a");
    REQUIRE(dir_a);
    auto dir_b = registry.lookup(ROOT_INO, "b");
    REQUIRE(dir_b);
    auto x = registry.lookup(dir_a->ino, "x");
    REQUIRE(x);

    GIVEN("A rename to another directory") {
        registry.move(dir_a->ino, "x", dir_b->ino, "z");

        THEN("the identity keeps its number under its new name") {
            auto path = registry.path(x->ino);
            require_result_ok(path);
            CHECK(*path == "/b/z");

            auto parent = registry.parent(x->ino);
            require_result_ok(parent);
            CHECK(*parent == dir_b->ino);
        }

        THEN("the child reference moves along") {
            auto count_a = registry.refcount(dir_a->ino);
            require_result_ok(count_a);
            CHECK(*count_a == 1);
            auto count_b = registry.refcount(dir_b->ino);
            require_result_ok(count_b);
            CHECK(*count_b == 2);
        }
    }

    GIVEN("A rename over a known identity") {
        auto y = registry.lookup(dir_a->ino, "y");
        REQUIRE(y);
        registry.move(dir_a->ino, "x", dir_a->ino, "y");

        THEN("the replaced identity is detached but still valid") {
            check_result_error(registry.path(y->ino), Errc::NOT_FOUND);
            check_result_error(registry.parent(y->ino), Errc::NOT_FOUND);
            check_result_ok(registry.refcount(y->ino));
        }

        THEN("the moved identity answers to the name") {
            auto path = registry.path(x->ino);
            require_result_ok(path);
            CHECK(*path == "/a/y");
        }

        AND_WHEN("the replaced identity is forgotten") {
            registry.forget(y->ino, 1);

            THEN("it is reclaimed without touching the new owner of the name") {
                check_result_error(registry.refcount(y->ino), Errc::STALE_HANDLE);
                check_result_ok(registry.path(x->ino));
            }
        }
    }

    GIVEN("An unlinked identity") {
        registry.detach(dir_a->ino, "x");

        THEN("it has no path anymore") {
            check_result_error(registry.path(x->ino), Errc::NOT_FOUND);
        }

        AND_WHEN("the name is interned again") {
            auto attr = fs.lstat("/a/y");
            REQUIRE(attr);
            auto pin = registry.intern(dir_a->ino, "x", *attr);
            require_result_ok(pin);

            THEN("a new identity is created") {
                CHECK(pin->ino() != x->ino);
                auto path = registry.path(pin->ino());
                require_result_ok(path);
                CHECK(*path == "/a/x");
            }
        }
    }

    GIVEN("A name which changed its type") {
        auto attr = fs.lstat("/b");
        REQUIRE(attr);
        auto pin = registry.intern(dir_a->ino, "x", *attr);
        require_result_ok(pin);

        THEN("the old identity is detached") {
            CHECK(pin->ino() != x->ino);
            check_result_error(registry.path(x->ino), Errc::NOT_FOUND);
        }
    }
}

SCENARIO("Path resolution")
{
    Backend::InMemoryFilesystem fs;
    fs.root().emplace<Backend::InMemory::Directory>("a")
            .emplace<Backend::InMemory::File>("f");
    Registry registry(fs);

    WHEN("resolving an existing path") {
        auto result = registry.resolve({"a", "f"});
        require_result_ok(result);

        THEN("the last component is pinned") {
            CHECK((result->attr.mode & S_IFMT) == S_IFREG);
            auto count = registry.refcount(result->pin.ino());
            require_result_ok(count);
            CHECK(*count == 1);
            auto path = registry.path(result->pin.ino());
            require_result_ok(path);
            CHECK(*path == "/a/f");
        }

        AND_WHEN("the pin is dropped") {
            const Ino ino = result->pin.ino();
            result->pin.reset();

            THEN("the whole chain is reclaimed") {
                check_result_error(registry.path(ino), Errc::STALE_HANDLE);
                auto root = registry.refcount(ROOT_INO);
                require_result_ok(root);
                CHECK(*root == 0);
            }
        }
    }

    WHEN("resolving the root") {
        auto result = registry.resolve({});
        require_result_ok(result);

        THEN("the root is returned") {
            CHECK(result->pin.ino() == ROOT_INO);
            CHECK((result->attr.mode & S_IFMT) == S_IFDIR);
        }
    }

    WHEN("walking through a file") {
        auto result = registry.resolve({"a", "f", "g"});

        THEN("it fails") {
            check_result_error(result, Errc::NOT_A_DIRECTORY);
        }
    }

    WHEN("walking to a missing name") {
        auto result = registry.resolve({"a", "missing"});

        THEN("it fails") {
            check_result_error(result, Errc::NOT_FOUND);
        }

        THEN("nothing is left behind") {
            auto root = registry.refcount(ROOT_INO);
            require_result_ok(root);
            CHECK(*root == 0);
        }
    }
}

SCENARIO("Open handles and cursors")
{
    Backend::InMemoryFilesystem fs;
    fs.root().emplace<Backend::InMemory::File>("f");
    Registry registry(fs, 2);

    auto entry = registry.lookup(ROOT_INO, "f");
    REQUIRE(entry);

    GIVEN("An open handle") {
        auto fh = registry.allocate_handle(entry->ino, O_RDONLY, open_file(fs, "/f"));
        require_result_ok(fh);

        THEN("it can be looked up") {
            auto handle = registry.handle(*fh);
            require_result_ok(handle);
            CHECK((*handle)->ino == entry->ino);
            CHECK((*handle)->flags == O_RDONLY);
            CHECK(registry.open_handles() == 1);
        }

        THEN("it references the identity") {
            registry.forget(entry->ino, 1);
            check_result_ok(registry.path(entry->ino));
        }

        WHEN("the limit is reached") {
            auto dir = fs.opendir("/");
            REQUIRE(dir);
            auto cursor = registry.allocate_cursor(ROOT_INO, std::move(*dir));
            require_result_ok(cursor);
            auto third = registry.allocate_handle(entry->ino, O_RDONLY, open_file(fs, "/f"));

            THEN("further handles are refused") {
                check_result_error(third, Errc::TOO_MANY_OPEN_FILES);
            }
        }

        WHEN("it is released") {
            auto handle = registry.release_handle(*fh);

            THEN("it is returned once") {
                REQUIRE(handle);
                check_result_ok(handle->file->close());
                CHECK(registry.release_handle(*fh) == nullptr);
                check_result_error(registry.handle(*fh), Errc::STALE_HANDLE);
            }

            THEN("the number is not reused") {
                auto next = registry.allocate_handle(entry->ino, O_RDONLY, open_file(fs, "/f"));
                require_result_ok(next);
                CHECK(*next != *fh);
            }
        }
    }

    WHEN("allocating a handle for an unknown identity") {
        auto result = registry.allocate_handle(0xdead, O_RDONLY, open_file(fs, "/f"));

        THEN("it fails") {
            check_result_error(result, Errc::STALE_HANDLE);
        }
    }

    GIVEN("Open handles and cursors at teardown") {
        auto fh = registry.allocate_handle(entry->ino, O_RDONLY, open_file(fs, "/f"));
        require_result_ok(fh);
        auto dir = fs.opendir("/");
        REQUIRE(dir);
        auto cursor = registry.allocate_cursor(ROOT_INO, std::move(*dir));
        require_result_ok(cursor);

        WHEN("the registry is cleared") {
            const size_t closed = close_all(registry.clear());

            THEN("everything is closed and forgotten") {
                CHECK(closed == 2);
                CHECK(registry.open_handles() == 0);
                check_result_error(registry.path(entry->ino), Errc::STALE_HANDLE);
                check_result_error(registry.cursor(*cursor), Errc::STALE_HANDLE);
                auto root = registry.refcount(ROOT_INO);
                require_result_ok(root);
                CHECK(*root == 0);
            }
        }
    }
}
