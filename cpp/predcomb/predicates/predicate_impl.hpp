/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <predcomb/util/constructors.hpp>

#include <folly/Function.h>

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace predcomb::detail {

/*
 * Shared, immutable state behind a BasicPredicate handle. Equality and hash default
 * to the identity of the implementation; only constants compare by value.
 */
template<typename... Args>
class PredicateImpl {
  public:
    explicit PredicateImpl(std::string label) :
        label_(std::move(label)) {
    }

    virtual ~PredicateImpl() = default;

    PREDCOMB_NO_MOVE_OR_COPY(PredicateImpl)

    virtual bool test(const Args&... args) const = 0;

    virtual bool equals(const PredicateImpl& other) const {
        return this == &other;
    }

    virtual std::size_t hash() const {
        return std::hash<const PredicateImpl*>{}(this);
    }

    virtual bool is_constant() const {
        return false;
    }

    [[nodiscard]] const std::string& label() const {
        return label_;
    }

  private:
    const std::string label_;
};

template<typename... Args>
class ConstantPredicateImpl final : public PredicateImpl<Args...> {
  public:
    ConstantPredicateImpl(bool value, std::string label) :
        PredicateImpl<Args...>(std::move(label)),
        value_(value) {
    }

    bool test(const Args&...) const override {
        return value_;
    }

    // The label is cosmetic and takes no part in equality
    bool equals(const PredicateImpl<Args...>& other) const override {
        if (this == &other)
            return true;

        const auto* constant = dynamic_cast<const ConstantPredicateImpl*>(&other);
        return constant != nullptr && constant->value_ == value_;
    }

    std::size_t hash() const override {
        return value_ ? 1 : 0;
    }

    bool is_constant() const override {
        return true;
    }

  private:
    const bool value_;
};

template<typename... Args>
class FunctionPredicateImpl final : public PredicateImpl<Args...> {
  public:
    using FunctionType = folly::Function<bool(const Args&...) const>;

    FunctionPredicateImpl(FunctionType&& func, std::string label) :
        PredicateImpl<Args...>(std::move(label)),
        func_(std::move(func)) {
    }

    bool test(const Args&... args) const override {
        return func_(args...);
    }

  private:
    FunctionType func_;
};

} // namespace predcomb::detail
