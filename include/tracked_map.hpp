#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include "logger.hpp"
#include "options.hpp"
#include "value_traits.hpp"

namespace tracked {

/**
 * @brief A key/value map that remembers which keys changed since the last reset.
 *
 * Every write goes through Set() (or Remove()), which compares the previous
 * and the new value shallowly and, when they differ, adds the key to the
 * dirty set. Reads never touch the dirty set. Dirtiness is sticky: only
 * Reset() clears it, even if a key is written back to its original value.
 *
 * The map owns its storage. The seeding constructor takes the initial
 * mapping by value, so callers choose between copying and moving it in.
 * Seeding does not mark anything dirty.
 *
 * TrackedMap is not synchronized. Callers sharing an instance between
 * threads must guard every call, reads included, with their own mutex.
 *
 * @tparam Key The key type, hashable with Hash
 * @tparam Value The stored value type
 * @tparam Hash Hash function for keys
 * @tparam KeyEqual Equality for keys
 * @tparam Traits Absence and shallow-equality policy for values
 */
template <typename Key,
          typename Value,
          typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>,
          typename Traits = ValueTraits<Value>>
class TrackedMap {
public:
    using KeyType = Key;
    using ValueType = Value;
    using StorageMap = std::unordered_map<Key, Value, Hash, KeyEqual>;
    using DirtyMap = std::unordered_map<Key, bool, Hash, KeyEqual>;
    using SliceMap = std::unordered_map<Key, std::optional<Value>, Hash, KeyEqual>;

    /**
     * @brief Creates an empty map with default options.
     */
    TrackedMap() = default;

    /**
     * @brief Creates an empty map.
     *
     * @param options Instance configuration
     */
    explicit TrackedMap(TrackedMapOptions options)
        : options_(std::move(options)) {
        ReserveStorage();
    }

    /**
     * @brief Creates a map seeded from an existing mapping.
     *
     * No key is marked dirty. Pass an rvalue to hand the mapping over
     * without a copy.
     *
     * @param initial Initial contents
     * @param options Instance configuration
     */
    explicit TrackedMap(StorageMap initial, TrackedMapOptions options = TrackedMapOptions())
        : options_(std::move(options)),
          storage_(std::move(initial)) {
        ReserveStorage();
    }

    TrackedMap(std::initializer_list<typename StorageMap::value_type> initial,
               TrackedMapOptions options = TrackedMapOptions())
        : options_(std::move(options)),
          storage_(initial) {
        ReserveStorage();
    }

    /**
     * @brief Gets the value stored at a key.
     *
     * @param key The key to look up
     * @return std::optional<Value> A copy of the value if found, std::nullopt otherwise
     */
    std::optional<Value> Get(const Key& key) const {
        auto it = storage_.find(key);
        if (it == storage_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Returns a reference to the value stored at a key.
     *
     * @throws std::out_of_range if the key is not present
     */
    const Value& At(const Key& key) const {
        auto it = storage_.find(key);
        if (it == storage_.end()) {
            throw std::out_of_range("TrackedMap::At: key not found");
        }
        return it->second;
    }

    bool Contains(const Key& key) const { return storage_.find(key) != storage_.end(); }

    /**
     * @brief Stores a value and updates the dirty set.
     *
     * The key becomes dirty when exactly one of the old and new values is
     * absent, or when both are present and not shallow-equal. A key that is
     * already dirty stays dirty whatever is written.
     *
     * @param key The key to write
     * @param value The value to store
     * @return const Value& The stored value, valid until the next mutation
     */
    const Value& Set(const Key& key, Value value) {
        auto it = storage_.find(key);
        const bool changed = IsShallowChange<Traits>(
            it == storage_.end() ? nullptr : &it->second, value);

        if (it == storage_.end()) {
            it = storage_.emplace(key, std::move(value)).first;
        } else {
            it->second = std::move(value);
        }

        if (changed) {
            MarkDirty(key);
        }
        return it->second;
    }

    /**
     * @brief Removes a key from storage.
     *
     * Removing a present value is a presence change and marks the key dirty.
     * A removed dirty key shows up as std::nullopt in DirtyValues() and
     * DirtySlice().
     *
     * @param key The key to remove
     * @return true if the key was present, false otherwise
     */
    bool Remove(const Key& key) {
        auto it = storage_.find(key);
        if (it == storage_.end()) {
            return false;
        }
        if (!Traits::IsAbsent(it->second)) {
            MarkDirty(key);
        }
        storage_.erase(it);
        if (options_.log_transitions) {
            TRACKED_LOG_DEBUG("[%s] removed key, %zu stored", options_.name.c_str(), storage_.size());
        }
        return true;
    }

    /**
     * @brief Whether any key is dirty.
     */
    bool IsDirty() const { return !dirty_.empty(); }

    /**
     * @brief Whether the given key is dirty.
     */
    bool IsDirty(const Key& key) const { return IsKeyDirty(key); }

    /**
     * @brief Whether at least one of the given keys is dirty.
     *
     * Stops at the first dirty key.
     */
    template <typename... Keys>
    bool IsDirty(const Key& first, const Keys&... rest) const {
        return IsKeyDirty(first) || (IsKeyDirty(rest) || ...);
    }

    /**
     * @brief Whether at least one key in [first, last) is dirty.
     */
    template <typename InputIt>
    bool IsAnyDirty(InputIt first, InputIt last) const {
        for (; first != last; ++first) {
            if (IsKeyDirty(*first)) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Clears every dirty flag. Storage is left untouched.
     */
    void Reset() {
        const size_t cleared = dirty_.size();
        dirty_.clear();
        if (options_.log_transitions) {
            TRACKED_LOG_DEBUG("[%s] reset cleared %zu dirty keys", options_.name.c_str(), cleared);
        }
    }

    /**
     * @brief Clears the dirty flag of a single key.
     *
     * @return true if the key was dirty
     */
    bool Reset(const Key& key) {
        const bool cleared = dirty_.erase(key) > 0;
        if (cleared && options_.log_transitions) {
            TRACKED_LOG_DEBUG("[%s] reset cleared 1 dirty key, %zu dirty", options_.name.c_str(), dirty_.size());
        }
        return cleared;
    }

    /**
     * @brief Returns a copy of the dirty set, every marker being true.
     */
    DirtyMap Dirty() const { return dirty_; }

    /**
     * @brief Returns the dirty keys in unspecified order.
     */
    std::vector<Key> DirtyKeys() const {
        std::vector<Key> keys;
        keys.reserve(dirty_.size());
        for (const auto& entry : dirty_) {
            keys.push_back(entry.first);
        }
        return keys;
    }

    /**
     * @brief Returns the current values of the dirty keys.
     *
     * The order matches DirtyKeys() as long as the map is not mutated in
     * between. Values are the ones stored now, not the ones stored when the
     * key became dirty; keys removed since are reported as std::nullopt.
     */
    std::vector<std::optional<Value>> DirtyValues() const {
        std::vector<std::optional<Value>> values;
        values.reserve(dirty_.size());
        for (const auto& entry : dirty_) {
            values.push_back(Get(entry.first));
        }
        return values;
    }

    /**
     * @brief Returns a copy of the storage restricted to the dirty keys.
     */
    SliceMap DirtySlice() const {
        SliceMap slice;
        slice.reserve(dirty_.size());
        for (const auto& entry : dirty_) {
            slice.emplace(entry.first, Get(entry.first));
        }
        return slice;
    }

    size_t DirtyCount() const { return dirty_.size(); }

    size_t Size() const { return storage_.size(); }

    bool IsEmpty() const { return storage_.empty(); }

    /**
     * @brief Applies a function to each stored key-value pair.
     *
     * @tparam Func Function type that accepts (const Key&, const Value&)
     * @param func Function to apply to each key-value pair
     */
    template <typename Func>
    void ForEach(Func func) const {
        for (const auto& entry : storage_) {
            func(entry.first, entry.second);
        }
    }

    const StorageMap& Storage() const { return storage_; }

    const TrackedMapOptions& GetOptions() const { return options_; }

private:
    void ReserveStorage() {
        if (options_.initial_capacity > 0) {
            storage_.reserve(options_.initial_capacity);
        }
    }

    bool IsKeyDirty(const Key& key) const { return dirty_.find(key) != dirty_.end(); }

    void MarkDirty(const Key& key) {
        const bool inserted = dirty_.emplace(key, true).second;
        if (inserted && options_.log_transitions) {
            TRACKED_LOG_DEBUG("[%s] key became dirty, %zu dirty", options_.name.c_str(), dirty_.size());
        }
    }

    TrackedMapOptions options_;

    // Primary key -> value storage
    StorageMap storage_;

    // Keys written with a change since the last reset; markers are always true
    DirtyMap dirty_;
};

}  // namespace tracked
