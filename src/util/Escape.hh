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

#include "RepeatingTuple.hh"

#include <boost/algorithm/hex.hpp>

#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace shg {

template <std::size_t N>
std::string to_hex(const std::array<unsigned char, N>& arr)
{
	std::string result(arr.size()*2, '\0');
	boost::algorithm::hex_lower(arr.begin(), arr.end(), result.begin());
	return result;
}

template <std::size_t N>
std::string to_quoted_hex(const std::array<unsigned char, N>& id, char quote = '\"')
{
	std::string result(id.size()*2 + 2, quote);
	boost::algorithm::hex_lower(id.begin(), id.end(), result.begin()+1);
	return result;
}

template <std::size_t N>
std::optional<std::array<unsigned char, N>> hex_to_array(std::string_view hex)
{
	try
	{
		std::array<unsigned char, N> result{};
		if (hex.size() == result.size()*2)
		{
			boost::algorithm::unhex(hex.begin(), hex.end(), result.begin());
			return result;
		}
	}
	catch (boost::algorithm::hex_decode_error&)
	{
	}
	return std::nullopt;
}

/// Decode percent-encoding. '+' is decoded as a space only for form bodies.
std::string url_decode(std::string_view in, bool form = false);

std::tuple<std::string_view, char> split_left(std::string_view& in, std::string_view value);

std::string_view trim(std::string_view in);
std::string to_lower(std::string_view in);

/// Case-insensitive substring search. An empty needle matches everything.
bool icontains(std::string_view haystack, std::string_view needle);

template <typename OutType, typename... Fields>
auto basic_find_fields(std::string_view remain, Fields... fields)
{
	typename RepeatingTuple<OutType, sizeof...(fields)>::type result;
	while (!remain.empty())
	{
		// Don't remove the temporary variables because the order
		// of execution in function parameters is undefined.
		auto [name, match]  = split_left(remain, "=;&");
		auto value = (match == '=' ? std::get<0>(split_left(remain, ";&")) : std::string_view{});

		match_field(result, name, value, fields...);
	}
	return result;
}

/// Find the named fields in an URL query string or an urlencoded form.
/// The values are not decoded.
template <typename... Fields>
auto find_fields(std::string_view remain, Fields... fields)
{
	return basic_find_fields<std::string_view>(remain, std::forward<Fields>(fields)...);
}

template <typename... Fields>
auto find_optional_fields(std::string_view remain, Fields... fields)
{
	return basic_find_fields<std::optional<std::string_view>>(remain, std::forward<Fields>(fields)...);
}

} // end of namespace
