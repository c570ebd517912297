#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

#include "ipod/common/types.hpp"

namespace ipod::runtime {

using ObjectId = std::uint64_t;

/**
 * @brief Typed handle to a value placed in an ObjectStore.
 *
 * Copying a reference does not copy the value. Resolving the same reference
 * on any worker returns the same value.
 */
template <typename T> class ObjectRef {
public:
    ObjectRef() = default;
    explicit ObjectRef(ObjectId id) : m_id(id) {}

    [[nodiscard]] ObjectId id() const noexcept { return m_id; }
    [[nodiscard]] bool valid() const noexcept { return m_id != 0; }

    bool operator==(const ObjectRef&) const = default;

private:
    ObjectId m_id{};
};

/**
 * @brief In-process shared object store.
 *
 * Values are immutable once placed and are held by shared ownership, so a
 * value fetched by a worker stays alive until that worker drops it even if
 * the entry is freed in the meantime. All members are thread safe.
 */
class ObjectStore {
public:
    ObjectStore()                              = default;
    ~ObjectStore()                             = default;
    ObjectStore(const ObjectStore&)            = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;
    ObjectStore(ObjectStore&&)                 = delete;
    ObjectStore& operator=(ObjectStore&&)      = delete;

    template <typename T>
    [[nodiscard]] ObjectRef<T> put(std::shared_ptr<const T> value) {
        return ObjectRef<T>(put_erased(
            std::static_pointer_cast<const void>(std::move(value)),
            std::type_index(typeid(T))));
    }

    /**
     * @brief Resolve @p ref to its value.
     *
     * @throws std::out_of_range if the reference is unknown or freed.
     * @throws std::invalid_argument if the stored value has another type.
     */
    template <typename T>
    [[nodiscard]] std::shared_ptr<const T> get(const ObjectRef<T>& ref) const {
        return std::static_pointer_cast<const T>(
            get_erased(ref.id(), std::type_index(typeid(T))));
    }

    // Drop the entries for ids in one call; unknown ids are ignored
    SizeType free(std::span<const ObjectId> ids);

    [[nodiscard]] bool contains(ObjectId id) const;
    [[nodiscard]] SizeType size() const;
    [[nodiscard]] SizeType get_num_puts() const;
    [[nodiscard]] SizeType get_num_free_calls() const;

private:
    struct Entry {
        std::shared_ptr<const void> value;
        std::type_index type;
    };

    ObjectId put_erased(std::shared_ptr<const void> value,
                        std::type_index type);
    std::shared_ptr<const void> get_erased(ObjectId id,
                                           std::type_index type) const;

    mutable std::mutex m_mutex;
    std::unordered_map<ObjectId, Entry> m_objects;
    ObjectId m_next_id{1};
    SizeType m_num_puts{};
    SizeType m_num_free_calls{};
};

} // namespace ipod::runtime
