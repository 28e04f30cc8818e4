/**********************************************************************
File name: registry.hpp
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
#ifndef USERSPACEFS_REGISTRY_H
#define USERSPACEFS_REGISTRY_H

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "userspacefs/backend.hpp"
#include "userspacefs/error.hpp"

namespace Userspacefs {

using Ino = uint64_t;
using Fh = uint64_t;

static constexpr Ino ROOT_INO = 1;

struct OpenHandle {
    Ino ino;
    int flags;
    std::unique_ptr<Backend::File> file;
};

struct DirCursor {
    Ino ino;
    std::unique_ptr<Backend::Dir> dir;
    /**
     * Entries read from the backend but not yet returned to the host, with
     * the offset each one was assigned.
     */
    std::deque<std::pair<uint64_t, Backend::DirEntry>> buffer;
    uint64_t next_offset = 3;
    /* offset of the last entry a host received, set by its codec */
    uint64_t resume_offset = 0;
    bool eof = false;
    bool progressed = false;
};

namespace detail {

/**
 * Slot storage handing out (generation << 32) | slot numbers; slot 0 is never
 * used.
 */
template <typename T>
class Arena {
public:
    Arena():
        m_slots(1)
    {

    }

private:
    struct Slot {
        uint32_t generation = 0;
        std::shared_ptr<T> value;
    };

    std::vector<Slot> m_slots;
    std::vector<uint32_t> m_free;
    size_t m_size = 0;

    Slot *find(uint64_t number) {
        const uint32_t slot = static_cast<uint32_t>(number);
        const uint32_t generation = static_cast<uint32_t>(number >> 32);
        if (slot == 0 || slot >= m_slots.size()) {
            return nullptr;
        }
        Slot &entry = m_slots[slot];
        if (!entry.value || entry.generation != generation) {
            return nullptr;
        }
        return &entry;
    }

public:
    uint64_t insert(std::shared_ptr<T> value) {
        uint32_t slot;
        if (!m_free.empty()) {
            slot = m_free.back();
            m_free.pop_back();
        } else {
            slot = static_cast<uint32_t>(m_slots.size());
            m_slots.emplace_back();
        }
        Slot &entry = m_slots[slot];
        entry.value = std::move(value);
        ++m_size;
        return (static_cast<uint64_t>(entry.generation) << 32) | slot;
    }

    std::shared_ptr<T> get(uint64_t number) {
        Slot *entry = find(number);
        return entry ? entry->value : nullptr;
    }

    std::shared_ptr<T> erase(uint64_t number) {
        Slot *entry = find(number);
        if (!entry) {
            return nullptr;
        }
        std::shared_ptr<T> result = std::move(entry->value);
        entry->value = nullptr;
        ++entry->generation;
        m_free.push_back(static_cast<uint32_t>(number));
        --m_size;
        return result;
    }

    template <typename Fn>
    void drain(Fn &&fn) {
        for (uint32_t slot = 1; slot < m_slots.size(); ++slot) {
            Slot &entry = m_slots[slot];
            if (entry.value) {
                fn(std::move(entry.value));
                entry.value = nullptr;
                ++entry.generation;
                m_free.push_back(slot);
            }
        }
        m_size = 0;
    }

    [[nodiscard]] size_t size() const {
        return m_size;
    }
};

}

/**
 * Tracks identities, open handles and directory cursors on behalf of the
 * host.
 *
 * An identity is the pair of a backend path, derived from its position in a
 * tree of names, and a host-facing number. It is reclaimed once its
 * reference count (host lookups, open handles and cursors, pinned requests
 * and named children) drops to zero. The root is never reclaimed.
 *
 * All operations are atomic with respect to each other. The registry never
 * calls into the backend while holding its lock.
 */
class Registry {
public:
    static constexpr size_t DEFAULT_MAX_OPEN = 4096;

    /**
     * Reference to an identity held by an in-flight request.
     */
    class Pin {
    public:
        Pin();
        Pin(const Pin &src) = delete;
        Pin(Pin &&src) noexcept;
        Pin &operator=(const Pin &src) = delete;
        Pin &operator=(Pin &&src) noexcept;
        ~Pin();

    private:
        Pin(Registry &registry, Ino ino);

        Registry *m_registry;
        Ino m_ino;

        friend class Registry;

    public:
        [[nodiscard]] inline Ino ino() const {
            return m_ino;
        }

        void reset();

    };

    struct Entry {
        Ino ino;
        Backend::Stat attr;
    };

    struct Resolved {
        Pin pin;
        Backend::Stat attr;
    };

    struct Location {
        Ino parent;
        std::string name;
    };

    struct Teardown {
        std::vector<std::shared_ptr<OpenHandle>> handles;
        std::vector<std::shared_ptr<DirCursor>> cursors;
    };

public:
    explicit Registry(Backend::Filesystem &fs, size_t max_open = DEFAULT_MAX_OPEN);
    Registry(const Registry &src) = delete;
    Registry(Registry &&src) = delete;
    Registry &operator=(const Registry &src) = delete;
    Registry &operator=(Registry &&src) = delete;

private:
    struct Node {
        uint32_t generation = 0;
        bool live = false;
        bool detached = false;
        Ino parent = 0;
        std::string name;
        uint32_t type = 0;
        uint64_t nlookup = 0;
        uint64_t refs = 0;
        std::map<std::string, Ino, std::less<>> children;
    };

    Backend::Filesystem &m_fs;
    const size_t m_max_open;

    std::mutex m_mutex;
    std::deque<Node> m_nodes;
    std::vector<uint32_t> m_free_nodes;
    detail::Arena<OpenHandle> m_handles;
    detail::Arena<DirCursor> m_cursors;

    Node *find_locked(Ino ino);
    Ino make_node_locked(Ino parent, std::string_view name, uint32_t type);
    Ino intern_locked(Ino parent, std::string_view name, uint32_t type);
    void unlink_child_locked(Ino parent, std::string_view name);
    void maybe_reclaim_locked(Ino ino);
    Result<std::string> path_locked(Ino ino);
    void unpin(Ino ino);

public:
    [[nodiscard]] inline Backend::Filesystem &fs() {
        return m_fs;
    }

    /**
     * Take a reference on @a ino for the duration of a request.
     *
     * Fails with Errc::STALE_HANDLE if the number is unknown or outdated.
     */
    Result<Pin> pin(Ino ino);

    /**
     * Stat @a name below @a parent and count one host lookup on it.
     */
    Result<Entry> lookup(Ino parent, std::string_view name);

    /**
     * Count one more host lookup on an identity that is already known.
     */
    Result<void> reference(Ino ino);

    /**
     * Make sure @a name below @a parent has an identity matching the type of
     * @a attr and pin it, without counting a host lookup.
     */
    Result<Pin> intern(Ino parent, std::string_view name, const Backend::Stat &attr);

    /**
     * Walk @a components from the root, creating identities as needed, and
     * pin the last one.
     */
    Result<Resolved> resolve(const std::vector<std::string> &components);

    /**
     * Identity already interned for the first @a count of @a components,
     * without asking the backend. Fails with Errc::NOT_FOUND if one of them
     * is not known.
     */
    Result<Ino> known(const std::vector<std::string> &components, size_t count);

    /**
     * Drop @a nlookup host lookups from @a ino. Unknown numbers are ignored.
     */
    void forget(Ino ino, uint64_t nlookup);

    Result<std::string> path(Ino ino);
    Result<Ino> parent(Ino ino);
    Result<Location> location(Ino ino);

    /**
     * Re-link the identity known as @a name below @a parent after a rename.
     * An identity already linked at the destination is detached.
     */
    void move(Ino parent, std::string_view name, Ino newparent, std::string_view newname);

    /**
     * Unlink the identity known as @a name below @a parent. It stays valid for
     * the references still held on it.
     */
    void detach(Ino parent, std::string_view name);

    /**
     * Register an open file. @a file is only moved from on success.
     */
    Result<Fh> allocate_handle(Ino ino, int flags, std::unique_ptr<Backend::File> &&file);
    Result<std::shared_ptr<OpenHandle>> handle(Fh fh);

    /**
     * Unregister an open file and return it for closing; returns nullptr if
     * the handle was already released.
     */
    std::shared_ptr<OpenHandle> release_handle(Fh fh);

    Result<Fh> allocate_cursor(Ino ino, std::unique_ptr<Backend::Dir> &&dir);
    Result<std::shared_ptr<DirCursor>> cursor(Fh fh);
    std::shared_ptr<DirCursor> release_cursor(Fh fh);

    Result<uint64_t> refcount(Ino ino);
    size_t open_handles();

    /**
     * Drop every identity except the root and return the handles and
     * cursors still open so that they can be closed.
     */
    Teardown clear();

};

/**
 * Close every handle and cursor of @a teardown, logging failures. Returns the
 * number of objects closed.
 */
size_t close_all(Registry::Teardown &&teardown);

}

#endif
