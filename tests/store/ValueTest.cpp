#include "livestore/Value.hpp"
#include <gtest/gtest.h>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using namespace livestore;

TEST(ValueTest, DefaultIsNil) {
    Value v;
    EXPECT_TRUE(v.isNil());
    EXPECT_EQ(v, Value{});
}

TEST(ValueTest, HoldsEachAlternative) {
    EXPECT_TRUE(Value(true).is<bool>());
    EXPECT_TRUE(Value(7).is<int>());
    EXPECT_TRUE(Value(2.5).is<double>());
    EXPECT_TRUE(Value("text").is<std::string>());
    EXPECT_TRUE(Value(std::vector<int>{1, 2}).is<std::vector<int>>());
    EXPECT_TRUE(Value(std::vector<double>{1.5}).is<std::vector<double>>());
    EXPECT_TRUE(Value(std::vector<Value>{1, "x"}).is<std::vector<Value>>());
}

TEST(ValueTest, AsThrowsOnMismatch) {
    Value v(1);
    EXPECT_EQ(v.as<int>(), 1);
    EXPECT_THROW(v.as<std::string>(), std::bad_variant_access);
    EXPECT_EQ(v.getIf<std::string>(), nullptr);
    ASSERT_NE(v.getIf<int>(), nullptr);
}

TEST(ValueTest, EqualityIsStructural) {
    Value a(std::vector<Value>{1, std::vector<Value>{"deep"}});
    Value b(std::vector<Value>{1, std::vector<Value>{"deep"}});
    Value c(std::vector<Value>{1, std::vector<Value>{"other"}});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(Value(1), Value(1.0));
}

TEST(ValueTest, ToAssignsLastWriteWins) {
    Assigns m = toAssigns(AssignList{{"a", 1}, {"b", 2}, {"a", 3}});
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m.at("a").as<int>(), 3);
}

TEST(ValueTest, ToStringRendersNested) {
    EXPECT_EQ(toString(Value{}), "nil");
    EXPECT_EQ(toString(Value(true)), "true");
    EXPECT_EQ(toString(Value(5)), "5");
    EXPECT_EQ(toString(Value("hi")), "\"hi\"");
    EXPECT_EQ(toString(Value(std::vector<int>{1, 2})), "[1, 2]");
    EXPECT_EQ(toString(Value(std::vector<Value>{1, "a", Value{}})), "[1, \"a\", nil]");
}

TEST(ValueTest, ConvertsOnlyFromHeldAlternatives) {
    EXPECT_TRUE((std::is_convertible_v<int, Value>));
    EXPECT_TRUE((std::is_convertible_v<std::vector<double>, Value>));
    EXPECT_TRUE((std::is_convertible_v<const char*, Value>));
    EXPECT_FALSE((std::is_convertible_v<std::vector<std::string>, Value>));
    EXPECT_FALSE((std::is_convertible_v<std::pair<int, int>, Value>));
}
