/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace predcomb {

constexpr std::string_view TRUE_LABEL = "TRUE";
constexpr std::string_view FALSE_LABEL = "FALSE";
constexpr std::string_view UNFORMATTABLE_LABEL = "<unformattable>";
constexpr std::string_view EMPTY_PREDICATE_LABEL = "<empty>";

std::string ignored_argument_label(std::size_t position);

std::string and_label(std::string_view left, std::string_view right);

std::string or_label(std::string_view left, std::string_view right);

std::string negate_label(std::string_view operand);

template<typename T>
std::string display_value(const T& value) {
    if constexpr (fmt::is_formattable<T>::value)
        return fmt::format("{}", value);
    else
        return std::string{UNFORMATTABLE_LABEL};
}

/// Positions are 1-based, "with arg2 5" binds the second argument to 5
template<typename T>
std::string bound_argument_label(std::size_t position, const T& value) {
    return fmt::format("with arg{} {}", position, display_value(value));
}

} // namespace predcomb
