#include "../include/value.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tracked {

namespace {

[[noreturn]] void ThrowKindMismatch(const char* wanted, Value::Kind actual) {
    throw std::runtime_error(std::string("Value is not ") + wanted + " (holds " +
                             KindName(actual) + ")");
}

// Exact comparison: the integer is never rounded through a double.
bool IntEqualsDouble(int64_t i, double d) {
    if (!std::isfinite(d) || std::trunc(d) != d) return false;
    // int64 covers [-2^63, 2^63)
    if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) return false;
    return static_cast<int64_t>(d) == i;
}

// NaN is the same NaN, so rewriting it is not a change.
bool DoublesEqual(double lhs, double rhs) {
    if (std::isnan(lhs) && std::isnan(rhs)) return true;
    return lhs == rhs;
}

}  // namespace

const char* KindName(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::kNull: return "null";
        case Value::Kind::kBool: return "bool";
        case Value::Kind::kInt: return "int";
        case Value::Kind::kDouble: return "double";
        case Value::Kind::kString: return "string";
        case Value::Kind::kList: return "list";
        case Value::Kind::kMap: return "map";
    }
    return "unknown";
}

Value::Value(std::shared_ptr<List> list) {
    if (list) {
        data_ = std::move(list);
    }
}

Value::Value(std::shared_ptr<Map> map) {
    if (map) {
        data_ = std::move(map);
    }
}

Value Value::MakeList(List items) {
    return Value(std::make_shared<List>(std::move(items)));
}

Value Value::MakeMap(Map entries) {
    return Value(std::make_shared<Map>(std::move(entries)));
}

Value::Kind Value::GetKind() const {
    // Alternative order of data_ matches Kind.
    return static_cast<Kind>(data_.index());
}

bool Value::AsBool() const {
    if (auto p = std::get_if<bool>(&data_)) return *p;
    ThrowKindMismatch("a bool", GetKind());
}

int64_t Value::AsInt() const {
    if (auto p = std::get_if<int64_t>(&data_)) return *p;
    ThrowKindMismatch("an int", GetKind());
}

double Value::AsDouble() const {
    if (auto p = std::get_if<double>(&data_)) return *p;
    if (auto p = std::get_if<int64_t>(&data_)) return static_cast<double>(*p);
    ThrowKindMismatch("a number", GetKind());
}

const std::string& Value::AsString() const {
    if (auto p = std::get_if<std::string>(&data_)) return *p;
    ThrowKindMismatch("a string", GetKind());
}

std::shared_ptr<Value::List> Value::AsList() const {
    if (auto p = std::get_if<std::shared_ptr<List>>(&data_)) return *p;
    ThrowKindMismatch("a list", GetKind());
}

std::shared_ptr<Value::Map> Value::AsMap() const {
    if (auto p = std::get_if<std::shared_ptr<Map>>(&data_)) return *p;
    ThrowKindMismatch("a map", GetKind());
}

bool Value::ShallowEquals(const Value& other) const {
    if (IsNumber() && other.IsNumber()) {
        if (IsInt() && other.IsInt()) {
            return AsInt() == other.AsInt();
        }
        if (IsInt()) {
            return IntEqualsDouble(AsInt(), other.AsDouble());
        }
        if (other.IsInt()) {
            return IntEqualsDouble(other.AsInt(), AsDouble());
        }
        return DoublesEqual(AsDouble(), other.AsDouble());
    }
    if (GetKind() != other.GetKind()) return false;

    switch (GetKind()) {
        case Kind::kNull:
            return true;
        case Kind::kBool:
            return AsBool() == other.AsBool();
        case Kind::kString:
            return AsString() == other.AsString();
        case Kind::kList:
            return AsList().get() == other.AsList().get();
        case Kind::kMap:
            return AsMap().get() == other.AsMap().get();
        case Kind::kInt:
        case Kind::kDouble:
            break;  // handled above
    }
    return false;
}

std::string Value::ToString() const {
    std::ostringstream oss;
    switch (GetKind()) {
        case Kind::kNull:
            oss << "null";
            break;
        case Kind::kBool:
            oss << (AsBool() ? "true" : "false");
            break;
        case Kind::kInt:
            oss << AsInt();
            break;
        case Kind::kDouble:
            oss << std::setprecision(std::numeric_limits<double>::max_digits10) << AsDouble();
            break;
        case Kind::kString:
            oss << '"' << AsString() << '"';
            break;
        case Kind::kList:
            oss << "LIST(" << static_cast<const void*>(AsList().get()) << ")";
            break;
        case Kind::kMap:
            oss << "MAP(" << static_cast<const void*>(AsMap().get()) << ")";
            break;
    }
    return oss.str();
}

}  // namespace tracked
