/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include <catch2/catch.hpp>

#include "util/Escape.hh"

#include <optional>

using namespace shg;

TEST_CASE("split left", "[normal]")
{
	std::string_view in{"name=value"};
	REQUIRE(split_left(in, "=&;") == std::make_tuple("name", '='));
	REQUIRE(in == "value");
	REQUIRE(split_left(in, "&;")  == std::make_tuple("value", '\0'));
	REQUIRE(in.empty());
	REQUIRE(split_left(in, "=&;") == std::make_tuple("", '\0'));
	REQUIRE(in.empty());

	std::string_view url{"user/name/file"};
	REQUIRE(split_left(url, "/") == std::make_tuple("user", '/'));
	REQUIRE(url == "name/file");
}

TEST_CASE("find fields in query strings", "[normal]")
{
	SECTION("simple 2 fields")
	{
		auto [name, other] = find_fields("name=value&other=same", "name", "other");
		REQUIRE(name == "value");
		REQUIRE(other == "same");
	}
	SECTION("field without value")
	{
		auto [user, name] = find_fields("user&name=nestal", "user", "name");
		REQUIRE(user == "");
		REQUIRE(name == "nestal");
	}
	SECTION("optional fields tell absent from empty")
	{
		auto [present, empty, absent] = find_optional_fields("present=1&empty=", "present", "empty", "absent");
		REQUIRE(present == "1");
		REQUIRE(empty.has_value());
		REQUIRE(empty->empty());
		REQUIRE_FALSE(absent.has_value());
	}
}

TEST_CASE("url decode", "[normal]")
{
	REQUIRE(url_decode("roof%20photo%20%231.jpg") == "roof photo #1.jpg");

	SECTION("'+' is a space only in forms")
	{
		REQUIRE(url_decode("a+b") == "a+b");
		REQUIRE(url_decode("a+b", true) == "a b");
	}
	SECTION("invalid percent-encoding stops decoding")
	{
		REQUIRE(url_decode("abc%zz") == "abc");
		REQUIRE(url_decode("abc%2") == "abc");
	}
}

TEST_CASE("hex conversion", "[normal]")
{
	std::array<unsigned char, 4> arr{0xde, 0xad, 0xbe, 0xef};
	REQUIRE(to_hex(arr) == "deadbeef");
	REQUIRE(to_quoted_hex(arr) == "\"deadbeef\"");
	REQUIRE(hex_to_array<4>("deadbeef") == arr);
	REQUIRE(hex_to_array<4>("DEADBEEF") == arr);

	REQUIRE_FALSE(hex_to_array<4>("deadbee").has_value());
	REQUIRE_FALSE(hex_to_array<4>("deadbeefff").has_value());
	REQUIRE_FALSE(hex_to_array<4>("deadbeeg").has_value());
}

TEST_CASE("trim, to_lower and icontains", "[normal]")
{
	REQUIRE(trim("  abc \r\n") == "abc");
	REQUIRE(trim("   ").empty());
	REQUIRE(to_lower("Image/JPEG") == "image/jpeg");

	REQUIRE(icontains("Roof_Photo.JPG", "photo.jpg"));
	REQUIRE(icontains("anything", ""));
	REQUIRE_FALSE(icontains("roof.jpg", "wall"));
}
