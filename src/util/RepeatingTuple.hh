/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//

#pragma once

#include <string_view>
#include <tuple>
#include <utility>

namespace shg {

template<typename Dependent, std::size_t>
using DependOn = Dependent;

/// std::tuple<T, T, ... T> with N elements
template<typename T, std::size_t N, typename Indices = std::make_index_sequence<N>>
struct RepeatingTuple;

template<typename T, std::size_t N, std::size_t... Indices>
struct RepeatingTuple<T, N, std::index_sequence<Indices...>>
{
    using type = std::tuple<DependOn<T, Indices>...>;
};

template <typename ResultTuple, std::size_t remain>
constexpr std::size_t match_index()
{
	static_assert(remain < std::tuple_size<ResultTuple>::value);
	return std::tuple_size<ResultTuple>::value - remain - 1;
}

template <typename Field, typename Value, typename ResultTuple>
void match_field(ResultTuple& result, std::string_view name, Value&& value, Field field)
{
	if (name == field)
		std::get<match_index<ResultTuple, 0>()>(result) = std::forward<Value>(value);
}

template <typename... Fields, typename Field, typename Value, typename ResultTuple>
void match_field(ResultTuple& result, std::string_view name, Value&& value, Field field, Fields... remain)
{
	if (name == field)
		std::get<match_index<ResultTuple, sizeof...(remain)>()>(result) = std::forward<Value>(value);
	else
		match_field(result, name, value, remain...);
}

} // end of namespace
