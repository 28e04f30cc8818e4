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
#include "userspacefs/registry.hpp"

#include <algorithm>

#include <sys/stat.h>

#include "userspacefs/logging.hpp"

namespace Userspacefs {

static inline uint32_t slot_of(Ino ino)
{
    return static_cast<uint32_t>(ino);
}

static inline uint32_t generation_of(Ino ino)
{
    return static_cast<uint32_t>(ino >> 32);
}

static inline Ino make_ino(uint32_t generation, uint32_t slot)
{
    return (static_cast<Ino>(generation) << 32) | slot;
}

Registry::Pin::Pin():
    m_registry(nullptr),
    m_ino(0)
{

}

Registry::Pin::Pin(Registry &registry, Ino ino):
    m_registry(&registry),
    m_ino(ino)
{

}

Registry::Pin::Pin(Pin &&src) noexcept:
    m_registry(src.m_registry),
    m_ino(src.m_ino)
{
    src.m_registry = nullptr;
    src.m_ino = 0;
}

Registry::Pin &Registry::Pin::operator=(Pin &&src) noexcept
{
    if (this != &src) {
        reset();
        m_registry = src.m_registry;
        m_ino = src.m_ino;
        src.m_registry = nullptr;
        src.m_ino = 0;
    }
    return *this;
}

Registry::Pin::~Pin()
{
    reset();
}

void Registry::Pin::reset()
{
    if (m_registry) {
        m_registry->unpin(m_ino);
        m_registry = nullptr;
        m_ino = 0;
    }
}

Registry::Registry(Backend::Filesystem &fs, size_t max_open):
    m_fs(fs),
    m_max_open(max_open),
    m_nodes(2)
{
    Node &root = m_nodes[slot_of(ROOT_INO)];
    root.live = true;
    root.parent = ROOT_INO;
    root.type = S_IFDIR;
}

Registry::Node *Registry::find_locked(Ino ino)
{
    const uint32_t slot = slot_of(ino);
    if (slot == 0 || slot >= m_nodes.size()) {
        return nullptr;
    }
    Node &node = m_nodes[slot];
    if (!node.live || node.generation != generation_of(ino)) {
        return nullptr;
    }
    return &node;
}

Ino Registry::make_node_locked(Ino parent, std::string_view name, uint32_t type)
{
    uint32_t slot;
    if (!m_free_nodes.empty()) {
        slot = m_free_nodes.back();
        m_free_nodes.pop_back();
    } else {
        slot = static_cast<uint32_t>(m_nodes.size());
        m_nodes.emplace_back();
    }

    Node &node = m_nodes[slot];
    node.live = true;
    node.detached = false;
    node.parent = parent;
    node.name = name;
    node.type = type;
    node.nlookup = 0;
    node.refs = 0;
    node.children.clear();
    return make_ino(node.generation, slot);
}

Ino Registry::intern_locked(Ino parent, std::string_view name, uint32_t type)
{
    Node &parent_node = *find_locked(parent);
    auto iter = parent_node.children.find(name);
    if (iter != parent_node.children.end()) {
        const Ino existing = iter->second;
        Node &child = m_nodes[slot_of(existing)];
        if (child.type == type) {
            return existing;
        }
        // a different object of another type took the name
        parent_node.children.erase(iter);
        child.detached = true;
        maybe_reclaim_locked(existing);
    }

    const Ino ino = make_node_locked(parent, name, type);
    parent_node.children.emplace(std::string(name), ino);
    return ino;
}

void Registry::unlink_child_locked(Ino parent, std::string_view name)
{
    Node *parent_node = find_locked(parent);
    if (!parent_node) {
        return;
    }
    auto iter = parent_node->children.find(name);
    if (iter == parent_node->children.end()) {
        return;
    }
    const Ino child = iter->second;
    parent_node->children.erase(iter);
    m_nodes[slot_of(child)].detached = true;
    maybe_reclaim_locked(child);
}

void Registry::maybe_reclaim_locked(Ino ino)
{
    while (ino != ROOT_INO) {
        Node *node = find_locked(ino);
        if (!node) {
            return;
        }
        if (node->nlookup > 0 || node->refs > 0 || !node->children.empty()) {
            return;
        }

        const Ino parent = node->parent;
        const bool detached = node->detached;
        const std::string name = std::move(node->name);
        node->live = false;
        node->name.clear();
        ++node->generation;
        m_free_nodes.push_back(slot_of(ino));

        if (detached) {
            return;
        }

        Node *parent_node = find_locked(parent);
        if (!parent_node) {
            return;
        }
        auto iter = parent_node->children.find(name);
        if (iter != parent_node->children.end() && iter->second == ino) {
            parent_node->children.erase(iter);
        }
        ino = parent;
    }
}

Result<std::string> Registry::path_locked(Ino ino)
{
    std::vector<const std::string*> names;
    Ino current = ino;
    while (current != ROOT_INO) {
        Node *node = find_locked(current);
        if (!node) {
            return make_result(FAILED, Errc::STALE_HANDLE);
        }
        if (node->detached) {
            return make_result(FAILED, Errc::NOT_FOUND);
        }
        names.push_back(&node->name);
        current = node->parent;
    }

    if (names.empty()) {
        return std::string("/");
    }

    std::string result;
    for (auto iter = names.rbegin(); iter != names.rend(); ++iter) {
        result += '/';
        result += **iter;
    }
    return result;
}

void Registry::unpin(Ino ino)
{
    std::lock_guard lock(m_mutex);
    Node *node = find_locked(ino);
    if (!node) {
        return;
    }
    if (node->refs > 0) {
        --node->refs;
    }
    maybe_reclaim_locked(ino);
}

Result<Registry::Pin> Registry::pin(Ino ino)
{
    std::lock_guard lock(m_mutex);
    Node *node = find_locked(ino);
    if (!node) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    ++node->refs;
    return Pin(*this, ino);
}

Result<Registry::Entry> Registry::lookup(Ino parent, std::string_view name)
{
    Result<std::string> parent_path = path(parent);
    if (!parent_path) {
        return copy_error(parent_path);
    }

    auto stat_result = m_fs.lstat(Backend::join_path(*parent_path, name));
    if (!stat_result) {
        return copy_error(stat_result);
    }

    std::lock_guard lock(m_mutex);
    if (!find_locked(parent)) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    const Ino ino = intern_locked(parent, name, stat_result->mode & S_IFMT);
    ++m_nodes[slot_of(ino)].nlookup;
    return Entry{ino, *stat_result};
}

Result<void> Registry::reference(Ino ino)
{
    std::lock_guard lock(m_mutex);
    Node *node = find_locked(ino);
    if (!node) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    ++node->nlookup;
    return make_result();
}

Result<Registry::Pin> Registry::intern(Ino parent, std::string_view name, const Backend::Stat &attr)
{
    std::lock_guard lock(m_mutex);
    if (!find_locked(parent)) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    const Ino ino = intern_locked(parent, name, attr.mode & S_IFMT);
    ++m_nodes[slot_of(ino)].refs;
    return Pin(*this, ino);
}

Result<Registry::Resolved> Registry::resolve(const std::vector<std::string> &components)
{
    auto attr = m_fs.lstat("/");
    if (!attr) {
        return copy_error(attr);
    }

    auto current = pin(ROOT_INO);
    if (!current) {
        return copy_error(current);
    }

    std::string path("/");
    for (const std::string &component: components) {
        if (!S_ISDIR(attr->mode)) {
            return make_result(FAILED, Errc::NOT_A_DIRECTORY);
        }

        path = Backend::join_path(path, component);
        attr = m_fs.lstat(path);
        if (!attr) {
            return copy_error(attr);
        }

        Pin next;
        {
            std::lock_guard lock(m_mutex);
            if (!find_locked(current->ino())) {
                return make_result(FAILED, Errc::STALE_HANDLE);
            }
            const Ino child = intern_locked(current->ino(), component, attr->mode & S_IFMT);
            ++m_nodes[slot_of(child)].refs;
            next = Pin(*this, child);
        }
        *current = std::move(next);
    }

    return Resolved{std::move(*current), *attr};
}

Result<Ino> Registry::known(const std::vector<std::string> &components, size_t count)
{
    std::lock_guard lock(m_mutex);
    Ino current = ROOT_INO;
    for (size_t i = 0; i < count && i < components.size(); ++i) {
        Node *node = find_locked(current);
        if (!node) {
            return make_result(FAILED, Errc::NOT_FOUND);
        }
        auto iter = node->children.find(components[i]);
        if (iter == node->children.end()) {
            return make_result(FAILED, Errc::NOT_FOUND);
        }
        current = iter->second;
    }
    return current;
}

void Registry::forget(Ino ino, uint64_t nlookup)
{
    std::lock_guard lock(m_mutex);
    Node *node = find_locked(ino);
    if (!node) {
        return;
    }
    node->nlookup -= std::min(node->nlookup, nlookup);
    maybe_reclaim_locked(ino);
}

Result<std::string> Registry::path(Ino ino)
{
    std::lock_guard lock(m_mutex);
    return path_locked(ino);
}

Result<Ino> Registry::parent(Ino ino)
{
    std::lock_guard lock(m_mutex);
    Node *node = find_locked(ino);
    if (!node) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    if (node->detached) {
        return make_result(FAILED, Errc::NOT_FOUND);
    }
    return node->parent;
}

Result<Registry::Location> Registry::location(Ino ino)
{
    std::lock_guard lock(m_mutex);
    Node *node = find_locked(ino);
    if (!node) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    if (node->detached) {
        return make_result(FAILED, Errc::NOT_FOUND);
    }
    if (ino == ROOT_INO) {
        return make_result(FAILED, Errc::INVALID_ARGUMENT);
    }
    return Location{node->parent, node->name};
}

void Registry::move(Ino parent, std::string_view name, Ino newparent, std::string_view newname)
{
    std::lock_guard lock(m_mutex);
    if (parent == newparent && name == newname) {
        return;
    }

    Node *parent_node = find_locked(parent);
    if (!parent_node) {
        unlink_child_locked(newparent, newname);
        return;
    }
    auto iter = parent_node->children.find(name);
    if (iter == parent_node->children.end()) {
        unlink_child_locked(newparent, newname);
        return;
    }
    const Ino child = iter->second;
    parent_node->children.erase(iter);

    unlink_child_locked(newparent, newname);

    Node &child_node = m_nodes[slot_of(child)];
    Node *newparent_node = find_locked(newparent);
    if (!newparent_node) {
        child_node.detached = true;
        maybe_reclaim_locked(child);
        maybe_reclaim_locked(parent);
        return;
    }

    child_node.parent = newparent;
    child_node.name = newname;
    newparent_node->children.emplace(std::string(newname), child);
    maybe_reclaim_locked(parent);
}

void Registry::detach(Ino parent, std::string_view name)
{
    std::lock_guard lock(m_mutex);
    unlink_child_locked(parent, name);
    maybe_reclaim_locked(parent);
}

Result<Fh> Registry::allocate_handle(Ino ino, int flags, std::unique_ptr<Backend::File> &&file)
{
    std::lock_guard lock(m_mutex);
    Node *node = find_locked(ino);
    if (!node) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    if (m_handles.size() + m_cursors.size() >= m_max_open) {
        return make_result(FAILED, Errc::TOO_MANY_OPEN_FILES);
    }

    auto handle = std::make_shared<OpenHandle>();
    handle->ino = ino;
    handle->flags = flags;
    handle->file = std::move(file);
    ++node->refs;
    return m_handles.insert(std::move(handle));
}

Result<std::shared_ptr<OpenHandle>> Registry::handle(Fh fh)
{
    std::lock_guard lock(m_mutex);
    auto result = m_handles.get(fh);
    if (!result) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    return result;
}

std::shared_ptr<OpenHandle> Registry::release_handle(Fh fh)
{
    std::lock_guard lock(m_mutex);
    auto result = m_handles.erase(fh);
    if (!result) {
        return nullptr;
    }
    Node *node = find_locked(result->ino);
    if (node && node->refs > 0) {
        --node->refs;
        maybe_reclaim_locked(result->ino);
    }
    return result;
}

Result<Fh> Registry::allocate_cursor(Ino ino, std::unique_ptr<Backend::Dir> &&dir)
{
    std::lock_guard lock(m_mutex);
    Node *node = find_locked(ino);
    if (!node) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    if (m_handles.size() + m_cursors.size() >= m_max_open) {
        return make_result(FAILED, Errc::TOO_MANY_OPEN_FILES);
    }

    auto cursor = std::make_shared<DirCursor>();
    cursor->ino = ino;
    cursor->dir = std::move(dir);
    ++node->refs;
    return m_cursors.insert(std::move(cursor));
}

Result<std::shared_ptr<DirCursor>> Registry::cursor(Fh fh)
{
    std::lock_guard lock(m_mutex);
    auto result = m_cursors.get(fh);
    if (!result) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    return result;
}

std::shared_ptr<DirCursor> Registry::release_cursor(Fh fh)
{
    std::lock_guard lock(m_mutex);
    auto result = m_cursors.erase(fh);
    if (!result) {
        return nullptr;
    }
    Node *node = find_locked(result->ino);
    if (node && node->refs > 0) {
        --node->refs;
        maybe_reclaim_locked(result->ino);
    }
    return result;
}

Result<uint64_t> Registry::refcount(Ino ino)
{
    std::lock_guard lock(m_mutex);
    Node *node = find_locked(ino);
    if (!node) {
        return make_result(FAILED, Errc::STALE_HANDLE);
    }
    return node->nlookup + node->refs + node->children.size();
}

size_t Registry::open_handles()
{
    std::lock_guard lock(m_mutex);
    return m_handles.size() + m_cursors.size();
}

Registry::Teardown Registry::clear()
{
    std::lock_guard lock(m_mutex);
    Teardown result;
    m_handles.drain([&result](std::shared_ptr<OpenHandle> &&handle){
        result.handles.emplace_back(std::move(handle));
    });
    m_cursors.drain([&result](std::shared_ptr<DirCursor> &&cursor){
        result.cursors.emplace_back(std::move(cursor));
    });

    for (uint32_t slot = 2; slot < m_nodes.size(); ++slot) {
        Node &node = m_nodes[slot];
        if (!node.live) {
            continue;
        }
        node.live = false;
        node.name.clear();
        node.children.clear();
        ++node.generation;
        m_free_nodes.push_back(slot);
    }

    Node &root = m_nodes[slot_of(ROOT_INO)];
    root.children.clear();
    root.nlookup = 0;
    root.refs = 0;
    return result;
}

size_t close_all(Registry::Teardown &&teardown)
{
    size_t count = 0;
    for (auto &handle: teardown.handles) {
        auto result = handle->file->close();
        if (!result) {
            logger().warn("closing file of ino {} failed: {}", handle->ino, errc_name(result.error()));
        }
        ++count;
    }
    for (auto &cursor: teardown.cursors) {
        auto result = cursor->dir->closedir();
        if (!result) {
            logger().warn("closing directory of ino {} failed: {}", cursor->ino, errc_name(result.error()));
        }
        ++count;
    }
    return count;
}

}
