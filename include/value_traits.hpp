#pragma once

#include <memory>
#include <optional>

namespace tracked {

/**
 * @brief Policy describing how TrackedMap compares stored values.
 *
 * A TrackedMap asks its traits two questions on every write:
 *  - IsAbsent(v): does `v` stand for "no value" (treated like a missing key)?
 *  - ShallowEqual(a, b): are two present values the same, without looking
 *    inside composite values?
 *
 * The primary template treats every value as present and falls back to
 * operator==. Specialize it for your own types, or pass a custom traits
 * type as TrackedMap's last template argument.
 *
 * @tparam T The stored value type
 */
template <typename T>
struct ValueTraits {
    static bool IsAbsent(const T&) { return false; }

    static bool ShallowEqual(const T& lhs, const T& rhs) { return lhs == rhs; }
};

// std::nullopt is absent; engaged values use the traits of T.
template <typename T>
struct ValueTraits<std::optional<T>> {
    static bool IsAbsent(const std::optional<T>& value) { return !value.has_value(); }

    static bool ShallowEqual(const std::optional<T>& lhs, const std::optional<T>& rhs) {
        if (lhs.has_value() != rhs.has_value()) return false;
        if (!lhs.has_value()) return true;
        return ValueTraits<T>::ShallowEqual(*lhs, *rhs);
    }
};

// Shared objects compare by identity; the pointee is never inspected.
template <typename T>
struct ValueTraits<std::shared_ptr<T>> {
    static bool IsAbsent(const std::shared_ptr<T>& value) { return value == nullptr; }

    static bool ShallowEqual(const std::shared_ptr<T>& lhs, const std::shared_ptr<T>& rhs) {
        return lhs.get() == rhs.get();
    }
};

template <typename T>
struct ValueTraits<T*> {
    static bool IsAbsent(T* value) { return value == nullptr; }

    static bool ShallowEqual(T* lhs, T* rhs) { return lhs == rhs; }
};

/**
 * @brief Returns true when writing `next` over `previous` is a change.
 *
 * `previous` is nullptr when the key is missing. A change is either a
 * presence flip (exactly one side absent) or two present values that are
 * not shallow-equal.
 */
template <typename Traits, typename T>
bool IsShallowChange(const T* previous, const T& next) {
    const bool previous_absent = previous == nullptr || Traits::IsAbsent(*previous);
    const bool next_absent = Traits::IsAbsent(next);
    if (previous_absent != next_absent) return true;
    if (previous_absent) return false;
    return !Traits::ShallowEqual(*previous, next);
}

}  // namespace tracked
