/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <predcomb/predicates/predicate.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

/*
 * Factories for named predicates. Unlike a bare lambda, everything built here has a
 * readable label, and the constants compare equal and hash alike by value:
 *
 *     auto p = predcomb::bi_always_true<int, std::string>();
 *     auto q = predcomb::ignore_arg3<double>(p);   // TriPredicate<int, std::string, double>
 *     auto r = q.with_arg2("x");                   // BiPredicate<int, double>, "with arg2 x"
 */
namespace predcomb {

namespace detail {

template<std::size_t Ignored, typename Inner, typename Tuple, std::size_t... Positions>
bool invoke_skipping(const Inner& inner, const Tuple& args, std::index_sequence<Positions...>) {
    return inner.test(std::get<(Positions < Ignored ? Positions : Positions + 1)>(args)...);
}

template<std::size_t Ignored, typename... Inner, typename... Outer>
BasicPredicate<Outer...> make_ignoring(const BasicPredicate<Inner...>& inner, TypeList<Outer...>) {
    return BasicPredicate<Outer...>::from_callable(
        ignored_argument_label(Ignored + 1),
        [inner](const Outer&... args) {
            return invoke_skipping<Ignored>(inner, std::forward_as_tuple(args...), std::index_sequence_for<Inner...>{});
        });
}

template<typename... Args>
BasicPredicate<Args...> make_constant(bool value, std::string label) {
    PREDCOMB_TRACE(log::predicate(), "Creating constant predicate '{}' ({})", label, value);
    return BasicPredicate<Args...>{std::make_shared<ConstantPredicateImpl<Args...>>(value, std::move(label))};
}

} // namespace detail

template<typename T>
Predicate<T> always(bool value, std::string label) {
    return detail::make_constant<T>(value, std::move(label));
}

template<typename T>
Predicate<T> always_false() {
    return always<T>(false, std::string{FALSE_LABEL});
}

template<typename T>
Predicate<T> always_true() {
    return always<T>(true, std::string{TRUE_LABEL});
}

template<typename T, typename U>
BiPredicate<T, U> bi_always(bool value, std::string label) {
    return detail::make_constant<T, U>(value, std::move(label));
}

template<typename T, typename U>
BiPredicate<T, U> bi_always_false() {
    return bi_always<T, U>(false, std::string{FALSE_LABEL});
}

template<typename T, typename U>
BiPredicate<T, U> bi_always_true() {
    return bi_always<T, U>(true, std::string{TRUE_LABEL});
}

template<typename T, typename U, typename V>
TriPredicate<T, U, V> tri_always(bool value, std::string label) {
    return detail::make_constant<T, U, V>(value, std::move(label));
}

template<typename T, typename U, typename V>
TriPredicate<T, U, V> tri_always_false() {
    return tri_always<T, U, V>(false, std::string{FALSE_LABEL});
}

template<typename T, typename U, typename V>
TriPredicate<T, U, V> tri_always_true() {
    return tri_always<T, U, V>(true, std::string{TRUE_LABEL});
}

/// Wraps a callable returning bool under the given label. Empty callables are rejected.
template<typename... Args, typename Func>
BasicPredicate<Args...> make_predicate(std::string label, Func&& func) {
    if constexpr (std::is_constructible_v<bool, const std::decay_t<Func>&>) {
        util::check_arg(static_cast<bool>(func), "Predicate '{}' requires a callable", label);
    }
    return BasicPredicate<Args...>::from_callable(std::move(label), std::forward<Func>(func));
}

/*
 * Adapts a predicate to take one more argument, of type Extra, at zero-based position
 * Ignored. That argument is dropped on every call and the others are forwarded in order.
 */
template<std::size_t Ignored, typename Extra, typename... Inner>
auto ignore_arg(const BasicPredicate<Inner...>& predicate) {
    static_assert(Ignored <= sizeof...(Inner), "Ignored argument position out of range");
    using Outer = typename detail::InsertNth<Ignored, Extra, detail::TypeList<Inner...>>::type;

    util::check_arg(static_cast<bool>(predicate), "ignore arg{} requires a non-empty predicate", Ignored + 1);
    return detail::make_ignoring<Ignored>(predicate, Outer{});
}

template<typename T, typename U, typename V>
TriPredicate<T, U, V> ignore_arg1(const BiPredicate<U, V>& predicate) {
    return ignore_arg<0, T>(predicate);
}

template<typename U, typename T, typename V>
TriPredicate<T, U, V> ignore_arg2(const BiPredicate<T, V>& predicate) {
    return ignore_arg<1, U>(predicate);
}

template<typename V, typename T, typename U>
TriPredicate<T, U, V> ignore_arg3(const BiPredicate<T, U>& predicate) {
    return ignore_arg<2, V>(predicate);
}

template<typename T, typename U>
BiPredicate<T, U> ignore_arg1(const Predicate<U>& predicate) {
    return ignore_arg<0, T>(predicate);
}

template<typename U, typename T>
BiPredicate<T, U> ignore_arg2(const Predicate<T>& predicate) {
    return ignore_arg<1, U>(predicate);
}

template<typename U, typename V, typename Value>
Predicate<V> with_arg1(const BiPredicate<U, V>& predicate, Value&& value) {
    return predicate.with_arg1(std::forward<Value>(value));
}

template<typename U, typename V, typename Value>
Predicate<U> with_arg2(const BiPredicate<U, V>& predicate, Value&& value) {
    return predicate.with_arg2(std::forward<Value>(value));
}

} // namespace predcomb
