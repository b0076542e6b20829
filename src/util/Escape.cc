/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//

#include "Escape.hh"

#include <algorithm>

namespace {

std::optional<char> hex_digit(char c)
{
	if      ( c >= '0' && c <= '9' ) return c - '0';
	else if ( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
	else if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
	else return std::nullopt;
}

std::optional<char> from_hex(char msb, char lsb)
{
	auto big = hex_digit(msb);
	auto sml = hex_digit(lsb);
	if (big && sml)
		return static_cast<char>(*big * 16 + *sml);
	else
		return std::nullopt;
}

} // end of local namespace

namespace shg {

std::string url_decode(std::string_view in, bool form)
{
	std::string result;
	while (!in.empty())
	{
		if (form && in.front() == '+')
		{
			result.push_back(' ');
			in.remove_prefix(1);
		}
		else if (in.front() != '%')
		{
			result.push_back(in.front());
			in.remove_prefix(1);
		}
		else if (in.size() >= 3)
		{
			auto ch = from_hex(in[1], in[2]);
			if (!ch)
				break;

			result.push_back(*ch);
			in.remove_prefix(3);
		}
		else
			break;
	}
	return result;
}

std::tuple<std::string_view, char> split_left(std::string_view& in, std::string_view value)
{
	// substr() will not throw even if "in" is empty and location==npos
	auto location = in.find_first_of(value);
	auto result   = in.substr(0, location);

	in.remove_prefix(result.size());

	// Remove the matching character, if any
	char match = '\0';
	if (location != in.npos)
	{
		match = in.front();
		in.remove_prefix(1);
	}

	return std::make_tuple(result, match);
}

std::string_view trim(std::string_view in)
{
	while (!in.empty() && std::isspace(static_cast<unsigned char>(in.front())))
		in.remove_prefix(1);
	while (!in.empty() && std::isspace(static_cast<unsigned char>(in.back())))
		in.remove_suffix(1);
	return in;
}

std::string to_lower(std::string_view in)
{
	std::string result{in};
	std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
	{
		return static_cast<char>(std::tolower(c));
	});
	return result;
}

bool icontains(std::string_view haystack, std::string_view needle)
{
	return std::search(
		haystack.begin(), haystack.end(),
		needle.begin(), needle.end(),
		[](unsigned char a, unsigned char b) {return std::tolower(a) == std::tolower(b);}
	) != haystack.end() || needle.empty();
}

} // end of shg namespace
