/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <fmt/format.h>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <string>

namespace predcomb {

namespace detail {
using BaseType = std::uint32_t;
constexpr BaseType error_category_scale = 1000u;
}

enum class ErrorCategory : detail::BaseType {
    INTERNAL = 1,
    USER_INPUT = 7
};

// A macro that will be expanded in different ways by redefining ERROR_CODE():
#define PREDCOMB_ERROR_CODES \
    ERROR_CODE(1000, E_ASSERTION_FAILURE) \
    ERROR_CODE(7000, E_INVALID_ARGUMENT) \
    ERROR_CODE(7001, E_INVALID_LOGGER_CONFIG)

enum class ErrorCode : detail::BaseType {
#define ERROR_CODE(code, Name, ...) Name = code,
    PREDCOMB_ERROR_CODES
#undef ERROR_CODE
};

struct ErrorCodeData {
    std::string_view name_;
    std::string_view as_string_;
};

template<ErrorCode code>
inline constexpr ErrorCodeData error_code_data{};

#define ERROR_CODE(code, Name, ...) template<> inline constexpr ErrorCodeData error_code_data<ErrorCode::Name> \
    { #Name, "E" #code };
PREDCOMB_ERROR_CODES
#undef ERROR_CODE

ErrorCodeData get_error_code_data(ErrorCode code);

constexpr ErrorCategory get_error_category(ErrorCode code) {
    return static_cast<ErrorCategory>(static_cast<detail::BaseType>(code) / detail::error_category_scale);
}

struct PredcombException : public std::runtime_error {
    explicit PredcombException(const std::string& msg_with_error_code):
            std::runtime_error(msg_with_error_code) {
    }
};

template<ErrorCategory error_category>
struct PredcombCategorizedException : public PredcombException {
    using PredcombException::PredcombException;
};

template<ErrorCode specific_code>
struct PredcombSpecificException : public PredcombCategorizedException<get_error_category(specific_code)> {
    static constexpr ErrorCategory category = get_error_category(specific_code);

    explicit PredcombSpecificException(const std::string& msg_with_error_code) :
            PredcombCategorizedException<category>(msg_with_error_code) {
        static_assert(get_error_category(specific_code) == category);
    }
};

using InternalException = PredcombCategorizedException<ErrorCategory::INTERNAL>;
using UserInputException = PredcombCategorizedException<ErrorCategory::USER_INPUT>;
using InvalidArgumentException = PredcombSpecificException<ErrorCode::E_INVALID_ARGUMENT>;
using InvalidLoggerConfigException = PredcombSpecificException<ErrorCode::E_INVALID_LOGGER_CONFIG>;

template<ErrorCode error_code>
[[noreturn]] void throw_error(const std::string& msg) {
    throw PredcombCategorizedException<get_error_category(error_code)>(msg);
}

template<>
[[noreturn]] inline void throw_error<ErrorCode::E_INVALID_ARGUMENT>(const std::string& msg) {
    throw PredcombSpecificException<ErrorCode::E_INVALID_ARGUMENT>(msg);
}

template<>
[[noreturn]] inline void throw_error<ErrorCode::E_INVALID_LOGGER_CONFIG>(const std::string& msg) {
    throw PredcombSpecificException<ErrorCode::E_INVALID_LOGGER_CONFIG>(msg);
}

}

namespace fmt {
template<>
struct formatter<predcomb::ErrorCode> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(predcomb::ErrorCode code, FormatContext &ctx) const {
        std::string_view str = predcomb::get_error_code_data(code).as_string_;
        return std::copy(str.begin(), str.end(), ctx.out());
    }
};
}
