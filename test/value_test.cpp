#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "../include/value.hpp"
#include "../include/value_traits.hpp"

using tracked::IsShallowChange;
using tracked::Value;
using tracked::ValueTraits;

TEST(ValueTest, KindsFromConstructors) {
    EXPECT_EQ(Value::Kind::kNull, Value().GetKind());
    EXPECT_EQ(Value::Kind::kNull, Value(nullptr).GetKind());
    EXPECT_EQ(Value::Kind::kBool, Value(true).GetKind());
    EXPECT_EQ(Value::Kind::kInt, Value(3).GetKind());
    EXPECT_EQ(Value::Kind::kInt, Value(int64_t{1} << 40).GetKind());
    EXPECT_EQ(Value::Kind::kDouble, Value(1.5).GetKind());
    EXPECT_EQ(Value::Kind::kString, Value("abc").GetKind());
    EXPECT_EQ(Value::Kind::kString, Value(std::string("abc")).GetKind());
    EXPECT_EQ(Value::Kind::kList, Value::MakeList().GetKind());
    EXPECT_EQ(Value::Kind::kMap, Value::MakeMap().GetKind());
}

TEST(ValueTest, NullHandlesWrapToNull) {
    EXPECT_TRUE(Value(std::shared_ptr<Value::List>()).IsNull());
    EXPECT_TRUE(Value(std::shared_ptr<Value::Map>()).IsNull());
}

TEST(ValueTest, CheckedAccessors) {
    EXPECT_TRUE(Value(true).AsBool());
    EXPECT_EQ(7, Value(7).AsInt());
    EXPECT_DOUBLE_EQ(7.0, Value(7).AsDouble());
    EXPECT_DOUBLE_EQ(0.25, Value(0.25).AsDouble());
    EXPECT_EQ("s", Value("s").AsString());

    EXPECT_THROW(Value("s").AsInt(), std::runtime_error);
    EXPECT_THROW(Value(1.5).AsInt(), std::runtime_error);
    EXPECT_THROW(Value().AsBool(), std::runtime_error);
    EXPECT_THROW(Value(1).AsString(), std::runtime_error);
    EXPECT_THROW(Value(1).AsList(), std::runtime_error);
    EXPECT_THROW(Value::MakeList().AsMap(), std::runtime_error);
}

TEST(ValueTest, ScalarsCompareByValue) {
    EXPECT_EQ(Value(), Value(nullptr));
    EXPECT_EQ(Value(1), Value(1));
    EXPECT_EQ(Value(1), Value(1.0));
    EXPECT_EQ(Value(2.5), Value(2.5));
    EXPECT_EQ(Value("x"), Value(std::string("x")));
    EXPECT_EQ(Value(false), Value(false));

    EXPECT_NE(Value(1), Value(2));
    EXPECT_NE(Value(1), Value(1.5));
    EXPECT_NE(Value("1"), Value(1));
    EXPECT_NE(Value(true), Value(1));
    EXPECT_NE(Value(), Value(0));
    EXPECT_NE(Value(), Value(""));
}

TEST(ValueTest, IntAndDoubleCompareExactly) {
    // 2^53 + 1 has no double representation; 2^53 is the nearest double.
    Value big_int(int64_t{9007199254740993});
    Value near_double(9007199254740992.0);
    EXPECT_NE(big_int, near_double);
    EXPECT_NE(near_double, big_int);
    EXPECT_EQ(Value(int64_t{9007199254740992}), near_double);

    EXPECT_NE(Value(std::numeric_limits<int64_t>::max()), Value(9223372036854775808.0));
    EXPECT_EQ(Value(std::numeric_limits<int64_t>::min()), Value(-9223372036854775808.0));
    EXPECT_NE(Value(0), Value(std::numeric_limits<double>::infinity()));
    EXPECT_NE(Value(0), Value(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_EQ(Value(-3), Value(-3.0));
    EXPECT_NE(Value(-3), Value(-3.5));
}

TEST(ValueTest, NaNEqualsNaN) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(Value(nan), Value(nan));
    EXPECT_EQ(Value(nan), Value(-nan));
    EXPECT_NE(Value(nan), Value(1.0));
}

TEST(ValueTest, StringsNeverEqualNumbers) {
    EXPECT_NE(Value("1"), Value(1));
    EXPECT_NE(Value("1.5"), Value(1.5));
    EXPECT_NE(Value("NaN"), Value(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_NE(Value(""), Value(0));
}

TEST(ValueTest, AcceptsEveryIntegralType) {
    EXPECT_EQ(5, Value(5u).AsInt());
    EXPECT_EQ(6, Value(6LL).AsInt());
    EXPECT_EQ(7, Value(std::size_t{7}).AsInt());
    EXPECT_EQ(8, Value(static_cast<short>(8)).AsInt());
    EXPECT_EQ(9, Value(static_cast<std::uint8_t>(9)).AsInt());
    EXPECT_EQ(Value::Kind::kInt, Value(0).GetKind());
    EXPECT_EQ(Value::Kind::kBool, Value(false).GetKind());
    EXPECT_EQ(std::numeric_limits<int64_t>::max(),
              Value(static_cast<std::uint64_t>(std::numeric_limits<int64_t>::max())).AsInt());
    EXPECT_THROW(Value(std::numeric_limits<std::uint64_t>::max()), std::out_of_range);
}

TEST(ValueTest, CompositesCompareByIdentity) {
    Value a = Value::MakeList({1, 2});
    Value b = Value::MakeList({1, 2});
    Value a_copy = a;

    EXPECT_EQ(a, a_copy);
    EXPECT_NE(a, b);

    // Copies share the container.
    a_copy.AsList()->push_back(3);
    EXPECT_EQ(3u, a.AsList()->size());

    auto shared = std::make_shared<Value::Map>();
    EXPECT_EQ(Value(shared), Value(shared));
    EXPECT_NE(Value::MakeMap(), Value::MakeMap());
    EXPECT_NE(Value::MakeMap(), Value::MakeList());
}

TEST(ValueTest, ToStringRendersScalarsAndIdentity) {
    EXPECT_EQ("null", Value().ToString());
    EXPECT_EQ("true", Value(true).ToString());
    EXPECT_EQ("42", Value(42).ToString());
    EXPECT_EQ("\"hi\"", Value("hi").ToString());
    EXPECT_EQ("1.5", Value(1.5).ToString());
    EXPECT_EQ("9007199254740992", Value(9007199254740992.0).ToString());
    EXPECT_EQ(0.1, std::stod(Value(0.1).ToString()));

    Value list = Value::MakeList();
    EXPECT_EQ(0u, list.ToString().rfind("LIST(", 0));
    EXPECT_EQ(list.ToString(), Value(list).ToString());
    EXPECT_EQ(0u, Value::MakeMap().ToString().rfind("MAP(", 0));
}

TEST(ValueTraitsTest, DefaultTraitsUseOperatorEquals) {
    using Traits = ValueTraits<std::string>;
    EXPECT_FALSE(Traits::IsAbsent(""));
    EXPECT_TRUE(Traits::ShallowEqual("a", "a"));
    EXPECT_FALSE(Traits::ShallowEqual("a", "b"));
}

TEST(ValueTraitsTest, PointersCompareByAddress) {
    int x = 1;
    int y = 1;
    EXPECT_TRUE(ValueTraits<int*>::ShallowEqual(&x, &x));
    EXPECT_FALSE(ValueTraits<int*>::ShallowEqual(&x, &y));
    EXPECT_TRUE(ValueTraits<int*>::IsAbsent(nullptr));

    auto p = std::make_shared<int>(1);
    auto q = std::make_shared<int>(1);
    EXPECT_TRUE(ValueTraits<std::shared_ptr<int>>::ShallowEqual(p, p));
    EXPECT_FALSE(ValueTraits<std::shared_ptr<int>>::ShallowEqual(p, q));
    EXPECT_TRUE(ValueTraits<std::shared_ptr<int>>::IsAbsent(nullptr));
}

TEST(ValueTraitsTest, ShallowChangeRule) {
    using Traits = ValueTraits<Value>;
    Value one(1);
    Value null;
    const Value* missing = nullptr;

    // missing -> present / missing -> absent
    EXPECT_TRUE(IsShallowChange<Traits>(missing, one));
    EXPECT_FALSE(IsShallowChange<Traits>(missing, null));

    // present -> absent / absent -> absent
    EXPECT_TRUE(IsShallowChange<Traits>(&one, null));
    EXPECT_FALSE(IsShallowChange<Traits>(&null, Value()));

    // present -> present
    EXPECT_FALSE(IsShallowChange<Traits>(&one, Value(1.0)));
    EXPECT_TRUE(IsShallowChange<Traits>(&one, Value(2)));

    using OptTraits = ValueTraits<std::optional<int>>;
    std::optional<int> five = 5;
    EXPECT_FALSE(IsShallowChange<OptTraits>(&five, std::optional<int>(5)));
    EXPECT_TRUE(IsShallowChange<OptTraits>(&five, std::optional<int>()));
}
