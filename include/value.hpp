#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "value_traits.hpp"

namespace tracked {

/**
 * @brief A dynamically typed value with shallow comparison semantics.
 *
 * Value holds a null, a scalar (bool, 64-bit integer, double, string) or a
 * shared composite (list or string-keyed map). Composites are held by
 * std::shared_ptr: copying a Value copies the handle, not the contents, and
 * two Values holding composites are equal only if they share the same
 * container.
 *
 * Value is the natural payload for TrackedMap when the stored fields are
 * heterogeneous, e.g. the columns of a database row.
 */
class Value {
public:
    using List = std::vector<Value>;
    using Map = std::map<std::string, Value>;

    enum class Kind { kNull, kBool, kInt, kDouble, kString, kList, kMap };

    /**
     * @brief Creates a null value
     */
    Value() = default;
    Value(std::nullptr_t) {}

    Value(bool value) : data_(value) {}

    /**
     * @brief Stores any integral type other than bool as a 64-bit integer.
     *
     * @throws std::out_of_range for unsigned values above INT64_MAX
     */
    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                      !std::is_same<T, bool>::value, int>::type = 0>
    Value(T value) : data_(ToInt64(value)) {}

    Value(double value) : data_(value) {}
    Value(const char* value) : data_(std::string(value)) {}
    Value(std::string value) : data_(std::move(value)) {}

    /**
     * @brief Wraps an existing shared list without copying it.
     */
    explicit Value(std::shared_ptr<List> list);

    /**
     * @brief Wraps an existing shared map without copying it.
     */
    explicit Value(std::shared_ptr<Map> map);

    static Value Null() { return Value(); }

    /**
     * @brief Creates a value holding a newly allocated list.
     *
     * @param items Initial elements
     */
    static Value MakeList(List items = {});

    /**
     * @brief Creates a value holding a newly allocated map.
     *
     * @param entries Initial entries
     */
    static Value MakeMap(Map entries = {});

    Kind GetKind() const;

    bool IsNull() const { return GetKind() == Kind::kNull; }
    bool IsBool() const { return GetKind() == Kind::kBool; }
    bool IsInt() const { return GetKind() == Kind::kInt; }
    bool IsDouble() const { return GetKind() == Kind::kDouble; }
    bool IsNumber() const { return IsInt() || IsDouble(); }
    bool IsString() const { return GetKind() == Kind::kString; }
    bool IsList() const { return GetKind() == Kind::kList; }
    bool IsMap() const { return GetKind() == Kind::kMap; }

    // Checked accessors; each throws std::runtime_error on a kind mismatch.
    bool AsBool() const;
    int64_t AsInt() const;
    double AsDouble() const;  // accepts kInt as well
    const std::string& AsString() const;

    /**
     * @brief Returns the shared list handle.
     *
     * Mutating the list through the handle changes every Value that shares
     * it, and is invisible to shallow comparison.
     */
    std::shared_ptr<List> AsList() const;

    /**
     * @brief Returns the shared map handle.
     */
    std::shared_ptr<Map> AsMap() const;

    /**
     * @brief Shallow comparison.
     *
     * Null equals null, numbers compare numerically (int and double mix,
     * exactly, with no rounding of the int), NaN equals NaN, bools and
     * strings compare by value, and lists/maps compare by identity of the
     * shared container. Values of unrelated kinds are never equal, so the
     * string "1" differs from the number 1.
     */
    bool ShallowEquals(const Value& other) const;

    /**
     * @brief Renders a debug string; composites render as LIST(0x...) / MAP(0x...).
     */
    std::string ToString() const;

    friend bool operator==(const Value& lhs, const Value& rhs) { return lhs.ShallowEquals(rhs); }
    friend bool operator!=(const Value& lhs, const Value& rhs) { return !lhs.ShallowEquals(rhs); }

private:
    template <typename T>
    static int64_t ToInt64(T value) {
        if (std::is_unsigned<T>::value &&
            static_cast<unsigned long long>(value) >
                static_cast<unsigned long long>(std::numeric_limits<int64_t>::max())) {
            throw std::out_of_range("Value: unsigned integer does not fit in int64");
        }
        return static_cast<int64_t>(value);
    }

    std::variant<std::monostate, bool, int64_t, double, std::string,
                 std::shared_ptr<List>, std::shared_ptr<Map>> data_;
};

const char* KindName(Value::Kind kind);

template <>
struct ValueTraits<Value> {
    static bool IsAbsent(const Value& value) { return value.IsNull(); }

    static bool ShallowEqual(const Value& lhs, const Value& rhs) { return lhs.ShallowEquals(rhs); }
};

}  // namespace tracked
