/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <predcomb/predicates/label.hpp>

namespace predcomb {

std::string ignored_argument_label(std::size_t position) {
    return fmt::format("ignore arg{}", position);
}

std::string and_label(std::string_view left, std::string_view right) {
    return fmt::format("({} and {})", left, right);
}

std::string or_label(std::string_view left, std::string_view right) {
    return fmt::format("({} or {})", left, right);
}

std::string negate_label(std::string_view operand) {
    return fmt::format("not {}", operand);
}

} // namespace predcomb
