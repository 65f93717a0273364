/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <predcomb/predicates/predicates.hpp>

#include <memory>
#include <stdexcept>
#include <string>

using namespace predcomb;

using IntTriPredicate = TriPredicate<int, int, int>;

namespace {

IntTriPredicate sum_is_zero() {
    return make_predicate<int, int, int>("sum is zero", [](const int& a, const int& b, const int& c) {
        return a + b + c == 0;
    });
}

IntTriPredicate ascending() {
    return make_predicate<int, int, int>("ascending", [](const int& a, const int& b, const int& c) {
        return a < b && b < c;
    });
}

struct CountingPredicate {
    std::shared_ptr<int> calls = std::make_shared<int>(0);
    bool result;

    explicit CountingPredicate(bool result) : result(result) {}

    IntTriPredicate predicate() const {
        return make_predicate<int, int, int>("counting", [calls = calls, result = result](const int&, const int&, const int&) {
            ++*calls;
            return result;
        });
    }
};

IntTriPredicate throwing() {
    return make_predicate<int, int, int>("throwing", [](const int&, const int&, const int&) -> bool {
        throw std::logic_error("should not have been evaluated");
    });
}

} // namespace

TEST(TriPredicate, And) {
    auto both = sum_is_zero().and_(ascending());
    ASSERT_TRUE(both.test(-1, 0, 1));
    ASSERT_FALSE(both.test(1, 0, -1));
    ASSERT_FALSE(both.test(1, 2, 3));
    ASSERT_EQ(both.to_string(), "(sum is zero and ascending)");
}

TEST(TriPredicate, Or) {
    auto either = sum_is_zero().or_(ascending());
    ASSERT_TRUE(either.test(1, 0, -1));
    ASSERT_TRUE(either.test(1, 2, 3));
    ASSERT_FALSE(either.test(3, 2, 1));
    ASSERT_EQ(either.to_string(), "(sum is zero or ascending)");
}

TEST(TriPredicate, Negate) {
    auto not_ascending = ascending().negate();
    ASSERT_FALSE(not_ascending.test(1, 2, 3));
    ASSERT_TRUE(not_ascending.test(3, 2, 1));
    ASSERT_EQ(not_ascending.to_string(), "not ascending");
    ASSERT_TRUE(tri_always_false<int, int, int>().negate().test(0, 0, 0));
}

TEST(TriPredicate, AndShortCircuits) {
    auto never = tri_always_false<int, int, int>().and_(throwing());
    ASSERT_NO_THROW(never.test(1, 2, 3));
    ASSERT_FALSE(never.test(1, 2, 3));

    CountingPredicate right(true);
    auto counted = tri_always_false<int, int, int>().and_(right.predicate());
    counted.test(1, 2, 3);
    ASSERT_EQ(*right.calls, 0);

    auto evaluated = tri_always_true<int, int, int>().and_(right.predicate());
    ASSERT_TRUE(evaluated.test(1, 2, 3));
    ASSERT_EQ(*right.calls, 1);
}

TEST(TriPredicate, OrShortCircuits) {
    auto anything = tri_always_true<int, int, int>().or_(throwing());
    ASSERT_NO_THROW(anything.test(1, 2, 3));
    ASSERT_TRUE(anything.test(1, 2, 3));

    CountingPredicate right(false);
    auto counted = tri_always_true<int, int, int>().or_(right.predicate());
    counted.test(1, 2, 3);
    ASSERT_EQ(*right.calls, 0);

    auto evaluated = tri_always_false<int, int, int>().or_(right.predicate());
    ASSERT_FALSE(evaluated.test(1, 2, 3));
    ASSERT_EQ(*right.calls, 1);
}

TEST(TriPredicate, LeftOperandEvaluatedFirst) {
    CountingPredicate right(true);
    auto composed = throwing().and_(right.predicate());
    ASSERT_THROW(composed.test(1, 2, 3), std::logic_error);
    ASSERT_EQ(*right.calls, 0);
}

TEST(TriPredicate, CombinatorsRejectEmptyPartner) {
    ASSERT_THROW(sum_is_zero().and_(IntTriPredicate{}), InvalidArgumentException);
    ASSERT_THROW(sum_is_zero().or_(IntTriPredicate{}), InvalidArgumentException);
    ASSERT_THROW(IntTriPredicate{}.and_(sum_is_zero()), InvalidArgumentException);
    ASSERT_THROW(IntTriPredicate{}.negate(), InvalidArgumentException);
}

TEST(TriPredicate, WithArguments) {
    auto concat_equals = make_predicate<std::string, std::string, std::string>(
        "concat equals",
        [](const std::string& a, const std::string& b, const std::string& c) { return a + b == c; });

    BiPredicate<std::string, std::string> first = concat_equals.with_arg1("ab");
    ASSERT_TRUE(first.test("cd", "abcd"));
    ASSERT_FALSE(first.test("abcd", "cd"));
    ASSERT_EQ(first.to_string(), "with arg1 ab");

    BiPredicate<std::string, std::string> second = concat_equals.with_arg2("cd");
    ASSERT_TRUE(second.test("ab", "abcd"));
    ASSERT_FALSE(second.test("abcd", "ab"));
    ASSERT_EQ(second.to_string(), "with arg2 cd");

    BiPredicate<std::string, std::string> third = concat_equals.with_arg3("abcd");
    ASSERT_TRUE(third.test("ab", "cd"));
    ASSERT_FALSE(third.test("cd", "ab"));
    ASSERT_EQ(third.to_string(), "with arg3 abcd");
}

TEST(TriPredicate, WithArgumentsOfMixedTypes) {
    auto repeated = make_predicate<char, std::size_t, std::string>(
        "repeated",
        [](const char& ch, const std::size_t& count, const std::string& s) { return std::string(count, ch) == s; });

    BiPredicate<std::size_t, std::string> of_x = repeated.with_arg1('x');
    ASSERT_TRUE(of_x.test(3, "xxx"));
    ASSERT_EQ(of_x.to_string(), "with arg1 x");

    BiPredicate<char, std::string> twice = repeated.with_arg2(2);
    ASSERT_TRUE(twice.test('y', "yy"));
    ASSERT_FALSE(twice.test('y', "yyy"));

    BiPredicate<char, std::size_t> makes_zz = repeated.with_arg3("zz");
    ASSERT_TRUE(makes_zz.test('z', 2));
    ASSERT_FALSE(makes_zz.test('z', 3));

    // Binding twice reduces all the way down to a unary predicate
    Predicate<std::size_t> x_three_times = of_x.with_arg2("xxx");
    ASSERT_TRUE(x_three_times.test(3));
    ASSERT_FALSE(x_three_times.test(2));
}

TEST(TriPredicate, WithArgumentRejectsEmptyPredicate) {
    ASSERT_THROW(IntTriPredicate{}.with_arg1(1), InvalidArgumentException);
    ASSERT_THROW(IntTriPredicate{}.with_arg2(1), InvalidArgumentException);
    ASSERT_THROW(IntTriPredicate{}.with_arg3(1), InvalidArgumentException);
}

TEST(TriPredicate, IgnoreThenBindRoundTrip) {
    auto equal = make_predicate<int, int>("equal", [](const int& a, const int& b) { return a == b; });
    auto widened = ignore_arg2<std::string>(equal);
    auto narrowed = widened.with_arg2("ignored");
    ASSERT_TRUE(narrowed.test(7, 7));
    ASSERT_FALSE(narrowed.test(7, 8));
    ASSERT_EQ(narrowed.to_string(), "with arg2 ignored");
}
