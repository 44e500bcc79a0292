// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

#include <type_traits>
#include <variant>

namespace rangekv::utils {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/// True when T is one of the alternatives of the variant TVariant.
template <typename T, typename TVariant>
struct IsVariantMember;

template <typename T, typename... Ts>
struct IsVariantMember<T, std::variant<Ts...>> : std::disjunction<std::is_same<T, Ts>...> {};

template <typename T, typename TVariant>
inline constexpr bool IsVariantMemberV = IsVariantMember<T, TVariant>::value;

}  // namespace rangekv::utils
