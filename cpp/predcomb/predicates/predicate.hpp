/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <predcomb/log/log.hpp>
#include <predcomb/util/constructors.hpp>
#include <predcomb/util/preconditions.hpp>
#include <predcomb/predicates/label.hpp>
#include <predcomb/predicates/predicate_impl.hpp>
#include <predcomb/predicates/type_list.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace predcomb {

namespace detail {

template<std::size_t Position, std::size_t Bound, typename BoundType, typename Tuple>
const auto& pick_argument(const BoundType& bound, const Tuple& rest) {
    if constexpr (Position < Bound)
        return std::get<Position>(rest);
    else if constexpr (Position == Bound)
        return bound;
    else
        return std::get<Position - 1>(rest);
}

template<std::size_t Bound, typename Inner, typename BoundType, typename Tuple, std::size_t... Positions>
bool invoke_with_bound(const Inner& inner, const BoundType& bound, const Tuple& rest, std::index_sequence<Positions...>) {
    return inner.test(pick_argument<Positions, Bound>(bound, rest)...);
}

} // namespace detail

/*
 * Handle to an immutable, named predicate taking one to three arguments.
 *
 * Copies share the wrapped implementation. A default-constructed handle is empty and
 * is rejected by every combinator. Two handles are equal if they share an
 * implementation, or if both wrap constants with the same value.
 */
template<typename... Args>
class BasicPredicate {
    static_assert(sizeof...(Args) >= 1 && sizeof...(Args) <= 3, "Predicates take one, two or three arguments");

  public:
    using Impl = detail::PredicateImpl<Args...>;
    static constexpr std::size_t arity = sizeof...(Args);

    BasicPredicate() = default;

    explicit BasicPredicate(std::shared_ptr<const Impl> impl) :
        impl_(std::move(impl)) {
    }

    PREDCOMB_MOVE_COPY_DEFAULT(BasicPredicate)

    template<typename Func>
    static BasicPredicate from_callable(std::string label, Func&& func) {
        PREDCOMB_TRACE(log::predicate(), "Creating predicate '{}'", label);
        return BasicPredicate{std::make_shared<detail::FunctionPredicateImpl<Args...>>(
            typename detail::FunctionPredicateImpl<Args...>::FunctionType{std::forward<Func>(func)},
            std::move(label))};
    }

    bool test(const Args&... args) const {
        util::check(static_cast<bool>(impl_), "Cannot evaluate an empty predicate");
        return impl_->test(args...);
    }

    bool operator()(const Args&... args) const {
        return test(args...);
    }

    [[nodiscard]] const std::string& to_string() const {
        util::check(static_cast<bool>(impl_), "Empty predicate has no label");
        return impl_->label();
    }

    [[nodiscard]] bool is_constant() const {
        return impl_ && impl_->is_constant();
    }

    [[nodiscard]] std::size_t hash() const {
        return impl_ ? impl_->hash() : 0;
    }

    explicit operator bool() const {
        return static_cast<bool>(impl_);
    }

    /// Short-circuiting: other is not evaluated when this predicate is false
    BasicPredicate and_(const BasicPredicate& other) const {
        util::check_arg(static_cast<bool>(impl_), "and_ called on an empty predicate");
        util::check_arg(static_cast<bool>(other), "and_ requires a non-empty partner for {}", to_string());
        return from_callable(
            and_label(to_string(), other.to_string()),
            [left = impl_, right = other.impl_](const Args&... args) {
                return left->test(args...) && right->test(args...);
            });
    }

    /// Short-circuiting: other is not evaluated when this predicate is true
    BasicPredicate or_(const BasicPredicate& other) const {
        util::check_arg(static_cast<bool>(impl_), "or_ called on an empty predicate");
        util::check_arg(static_cast<bool>(other), "or_ requires a non-empty partner for {}", to_string());
        return from_callable(
            or_label(to_string(), other.to_string()),
            [left = impl_, right = other.impl_](const Args&... args) {
                return left->test(args...) || right->test(args...);
            });
    }

    BasicPredicate negate() const {
        util::check_arg(static_cast<bool>(impl_), "negate called on an empty predicate");
        return from_callable(
            negate_label(to_string()),
            [inner = impl_](const Args&... args) {
                return !inner->test(args...);
            });
    }

    /*
     * Fixes the argument at zero-based Position to value, giving a predicate of one
     * lower arity that takes the remaining arguments in their original order.
     */
    template<std::size_t Position, typename Value>
    auto with_arg(Value&& value) const {
        static_assert(arity > 1, "Binding an argument requires a predicate of at least two arguments");
        static_assert(Position < arity, "Bound argument position out of range");
        using BoundType = std::decay_t<detail::NthArg<Position, Args...>>;
        using Remaining = typename detail::DropNth<Position, detail::TypeList<Args...>>::type;

        util::check_arg(static_cast<bool>(impl_), "with arg{} called on an empty predicate", Position + 1);
        BoundType bound(std::forward<Value>(value));
        auto label = bound_argument_label(Position + 1, bound);
        return bind<Position>(Remaining{}, std::move(bound), std::move(label));
    }

    template<typename Value>
    auto with_arg1(Value&& value) const {
        return with_arg<0>(std::forward<Value>(value));
    }

    template<typename Value>
    auto with_arg2(Value&& value) const {
        return with_arg<1>(std::forward<Value>(value));
    }

    template<typename Value>
    auto with_arg3(Value&& value) const {
        return with_arg<2>(std::forward<Value>(value));
    }

    friend bool operator==(const BasicPredicate& left, const BasicPredicate& right) {
        if (left.impl_ == right.impl_)
            return true;

        if (!left.impl_ || !right.impl_)
            return false;

        return left.impl_->equals(*right.impl_);
    }

    friend bool operator!=(const BasicPredicate& left, const BasicPredicate& right) {
        return !(left == right);
    }

  private:
    template<std::size_t Position, typename BoundType, typename... Remaining>
    BasicPredicate<Remaining...> bind(detail::TypeList<Remaining...>, BoundType&& bound, std::string label) const {
        return BasicPredicate<Remaining...>::from_callable(
            std::move(label),
            [inner = impl_, bound = std::forward<BoundType>(bound)](const Remaining&... rest) {
                return detail::invoke_with_bound<Position>(
                    *inner,
                    bound,
                    std::forward_as_tuple(rest...),
                    std::index_sequence_for<Args...>{});
            });
    }

    std::shared_ptr<const Impl> impl_;
};

template<typename T>
using Predicate = BasicPredicate<T>;

template<typename T, typename U>
using BiPredicate = BasicPredicate<T, U>;

template<typename T, typename U, typename V>
using TriPredicate = BasicPredicate<T, U, V>;

} // namespace predcomb

namespace std {
template<typename... Args>
struct hash<predcomb::BasicPredicate<Args...>> {
    std::size_t operator()(const predcomb::BasicPredicate<Args...>& predicate) const {
        return predicate.hash();
    }
};
} // namespace std

namespace fmt {
template<typename... Args>
struct formatter<predcomb::BasicPredicate<Args...>> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const predcomb::BasicPredicate<Args...>& predicate, FormatContext& ctx) const {
        if (!predicate)
            return fmt::format_to(ctx.out(), "{}", predcomb::EMPTY_PREDICATE_LABEL);

        return fmt::format_to(ctx.out(), "{}", predicate.to_string());
    }
};
} // namespace fmt
