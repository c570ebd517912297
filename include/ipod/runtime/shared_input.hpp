#pragma once

#include <memory>
#include <variant>
#include <vector>

#include "ipod/common/types.hpp"
#include "ipod/runtime/object_store.hpp"

namespace ipod::runtime {

/**
 * @brief A run input given either by value or as a reference already placed
 * in the object store.
 */
template <typename T> class SharedInput {
public:
    SharedInput(std::shared_ptr<const T> value) // NOLINT
        : m_input(std::move(value)) {}
    SharedInput(ObjectRef<T> ref) : m_input(ref) {} // NOLINT

    [[nodiscard]] bool is_reference() const noexcept {
        return std::holds_alternative<ObjectRef<T>>(m_input);
    }
    [[nodiscard]] const ObjectRef<T>& reference() const {
        return std::get<ObjectRef<T>>(m_input);
    }
    [[nodiscard]] const std::shared_ptr<const T>& value() const {
        return std::get<std::shared_ptr<const T>>(m_input);
    }

    // The underlying value, read from store when this is a reference
    [[nodiscard]] std::shared_ptr<const T>
    materialize(const ObjectStore& store) const {
        if (is_reference()) {
            return store.get(reference());
        }
        return value();
    }

private:
    std::variant<std::shared_ptr<const T>, ObjectRef<T>> m_input;
};

/**
 * @brief Places run inputs in the object store at most once and frees the
 * references it created.
 *
 * References supplied by the caller pass through and are never freed.
 * release() frees everything placed so far in a single store call; the
 * destructor releases too, so aborted runs do not leak.
 */
class Broadcaster {
public:
    explicit Broadcaster(ObjectStore& store) : m_store(store) {}
    ~Broadcaster();
    Broadcaster(const Broadcaster&)            = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;
    Broadcaster(Broadcaster&&)                 = delete;
    Broadcaster& operator=(Broadcaster&&)      = delete;

    template <typename T>
    [[nodiscard]] ObjectRef<T> place(const SharedInput<T>& input) {
        if (input.is_reference()) {
            return input.reference();
        }
        auto ref = m_store.put(input.value());
        m_owned.push_back(ref.id());
        return ref;
    }

    // Free the references placed by this broadcaster; returns how many
    SizeType release();

    [[nodiscard]] SizeType num_owned() const noexcept {
        return m_owned.size();
    }

private:
    ObjectStore& m_store;
    std::vector<ObjectId> m_owned;
};

} // namespace ipod::runtime
