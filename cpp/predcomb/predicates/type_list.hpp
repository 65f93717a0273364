/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <cstddef>
#include <tuple>

namespace predcomb::detail {

template<typename... Ts>
struct TypeList {};

template<std::size_t I, typename... Ts>
using NthArg = std::tuple_element_t<I, std::tuple<Ts...>>;

// Removes the I-th type of a TypeList
template<std::size_t I, typename List, typename Acc = TypeList<>>
struct DropNth;

template<std::size_t I, typename Head, typename... Tail, typename... Acc>
struct DropNth<I, TypeList<Head, Tail...>, TypeList<Acc...>>
    : DropNth<I - 1, TypeList<Tail...>, TypeList<Acc..., Head>> {};

template<typename Head, typename... Tail, typename... Acc>
struct DropNth<0, TypeList<Head, Tail...>, TypeList<Acc...>> {
    using type = TypeList<Acc..., Tail...>;
};

// Inserts T so that it becomes the I-th type of a TypeList
template<std::size_t I, typename T, typename List, typename Acc = TypeList<>>
struct InsertNth;

template<std::size_t I, typename T, typename Head, typename... Tail, typename... Acc>
requires (I > 0)
struct InsertNth<I, T, TypeList<Head, Tail...>, TypeList<Acc...>>
    : InsertNth<I - 1, T, TypeList<Tail...>, TypeList<Acc..., Head>> {};

template<typename T, typename... Rest, typename... Acc>
struct InsertNth<0, T, TypeList<Rest...>, TypeList<Acc...>> {
    using type = TypeList<Acc..., T, Rest...>;
};

} // namespace predcomb::detail
