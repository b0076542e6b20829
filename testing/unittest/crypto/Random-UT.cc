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

#include "crypto/Random.hh"

#include <cstdint>
#include <future>

using namespace shg;

TEST_CASE("secure random arrays are different", "[normal]")
{
	auto first  = secure_random_array<unsigned char, 16>();
	auto second = secure_random_array<unsigned char, 16>();
	REQUIRE(first != second);
}

TEST_CASE("insecure_random() generates random numbers", "[normal]")
{
	REQUIRE(insecure_random<std::uint64_t>() != insecure_random<std::uint64_t>());
	REQUIRE(insecure_random<std::uint64_t>() != insecure_random<std::uint64_t>());
}

TEST_CASE("multithreaded calls to insecure_random() generated different random numbers", "[normal]")
{
	auto fut_arr1 = std::async(std::launch::async, []{return insecure_random<std::array<std::uint64_t, 4>>();});
	auto fut_arr2 = std::async(std::launch::async, []{return insecure_random<std::array<std::uint64_t, 4>>();});

	auto arr1 = fut_arr1.get();
	auto arr2 = fut_arr2.get();
	REQUIRE(arr1 != arr2);
}
