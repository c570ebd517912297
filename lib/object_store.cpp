#include "ipod/runtime/object_store.hpp"

#include <format>
#include <stdexcept>

#include "ipod/exceptions.hpp"

namespace ipod::runtime {

ObjectId ObjectStore::put_erased(std::shared_ptr<const void> value,
                                 std::type_index type) {
    error_check::check_not_null(value.get(),
                                "ObjectStore: cannot store a null value");
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto id = m_next_id++;
    m_objects.emplace(id, Entry{.value = std::move(value), .type = type});
    ++m_num_puts;
    return id;
}

std::shared_ptr<const void> ObjectStore::get_erased(ObjectId id,
                                                    std::type_index type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_objects.find(id);
    if (it == m_objects.end()) {
        throw std::out_of_range(
            std::format("ObjectStore: no object with id {}", id));
    }
    if (it->second.type != type) {
        throw std::invalid_argument(std::format(
            "ObjectStore: object {} holds a {}, requested a {}", id,
            it->second.type.name(), type.name()));
    }
    return it->second.value;
}

SizeType ObjectStore::free(std::span<const ObjectId> ids) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_num_free_calls;
    SizeType removed = 0;
    for (const auto id : ids) {
        removed += m_objects.erase(id);
    }
    return removed;
}

bool ObjectStore::contains(ObjectId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_objects.contains(id);
}

SizeType ObjectStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_objects.size();
}

SizeType ObjectStore::get_num_puts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_num_puts;
}

SizeType ObjectStore::get_num_free_calls() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_num_free_calls;
}

} // namespace ipod::runtime
