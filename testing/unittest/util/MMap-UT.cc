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

#include "util/MMap.hh"

#include <fstream>

using namespace shg;

TEST_CASE("mmap self", "[normal]")
{
	std::error_code ec;
	auto subject = MMap::open(fs::path{__FILE__}, ec);
	REQUIRE(!ec);
	REQUIRE(subject.is_opened());
	REQUIRE(subject.size() > 2);
	REQUIRE(subject.string().substr(0,2) == "/*");

	// moved
	auto other = std::move(subject);
	REQUIRE_FALSE(subject.is_opened());
	REQUIRE(other.string().substr(0,2) == "/*");

	other.clear();
	REQUIRE(other.string().empty());
}

TEST_CASE("mmap empty file", "[normal]")
{
	fs::path empty{"/tmp/MMap-UT.empty"};
	std::ofstream{empty.string(), std::ios::trunc};

	std::error_code ec;
	auto subject = MMap::open(empty, ec);
	REQUIRE(!ec);
	REQUIRE_FALSE(subject.is_opened());
	REQUIRE(subject.size() == 0);
	REQUIRE(subject.string().empty());
}

TEST_CASE("mmap non-exist", "[error]")
{
	std::error_code ec;
	auto subject = MMap::open(fs::path{"/tmp/MMap-UT/no/such/file"}, ec);
	INFO("error_code is " << ec);
	REQUIRE(ec == std::errc::no_such_file_or_directory);
	REQUIRE_FALSE(subject.is_opened());

	ec.clear();
	subject = MMap::open(0x10000, ec);
	REQUIRE(ec == std::errc::bad_file_descriptor);
}
