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

#include "store/ObjectID.hh"

#include <ctime>
#include <unordered_set>

using namespace shg;

TEST_CASE("ObjectID from and to hex", "[normal]")
{
	auto id = ObjectID::from_hex("0123456789abcdef01234567");
	REQUIRE(id.has_value());
	REQUIRE(id->hex() == "0123456789abcdef01234567");
	REQUIRE((*id)[0] == 0x01);
	REQUIRE((*id)[11] == 0x67);

	REQUIRE(ObjectID::from_hex("0123456789ABCDEF01234567") == id);
	REQUIRE_FALSE(ObjectID::from_hex("0123456789abcdef0123456").has_value());
	REQUIRE_FALSE(ObjectID::from_hex("0123456789abcdef0123456x").has_value());
	REQUIRE_FALSE(ObjectID::from_hex("").has_value());

	nlohmann::json json = *id;
	REQUIRE(json == "0123456789abcdef01234567");
	REQUIRE(json.get<ObjectID>() == *id);
	REQUIRE_THROWS(nlohmann::json("not hex").get<ObjectID>());
}

TEST_CASE("random ObjectIDs start with the creation time", "[normal]")
{
	auto before = static_cast<std::uint32_t>(std::time(nullptr));
	auto id = ObjectID::randomize();
	auto after = static_cast<std::uint32_t>(std::time(nullptr));

	std::uint32_t secs = 0;
	for (int i = 0; i < 4; i++)
		secs = (secs << 8) | id[i];
	REQUIRE(secs >= before);
	REQUIRE(secs <= after);

	std::unordered_set<ObjectID> ids;
	for (int i = 0; i < 100; i++)
		ids.insert(ObjectID::randomize());
	REQUIRE(ids.size() == 100);
}

TEST_CASE("derived ObjectIDs are deterministic", "[normal]")
{
	auto id = *ObjectID::from_hex("0123456789abcdef01234567");

	REQUIRE(id.derive("thumbnail") == id.derive("thumbnail"));
	REQUIRE(id.derive("thumbnail") != id);
	REQUIRE(id.derive("thumbnail") != id.derive("preview"));

	auto other = *ObjectID::from_hex("0123456789abcdef01234568");
	REQUIRE(id.derive("thumbnail") != other.derive("thumbnail"));
}
