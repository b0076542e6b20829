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

#include "StoreFixture.hh"

#include "store/LegacyResolver.hh"
#include "util/Error.hh"

using namespace shg;

namespace {

BlobInfo named(const std::string& filename, const std::string& original = {})
{
	BlobInfo info;
	info.filename = filename;
	if (!original.empty())
		info.metadata[meta::original_name] = original;
	return info;
}

}

TEST_CASE("legacy name matching strategies", "[normal]")
{
	using S = LegacyResolver::Strategy;
	auto blob = named("r1_1589000000123_Roof-Photo 01.jpg", "Roof-Photo 01.jpg");

	REQUIRE(LegacyResolver::match(S::exact, "r1_1589000000123_Roof-Photo 01.jpg", blob));
	REQUIRE(LegacyResolver::match(S::exact, "Roof-Photo 01.jpg", blob));
	REQUIRE_FALSE(LegacyResolver::match(S::exact, "roof-photo 01.jpg", blob));

	REQUIRE(LegacyResolver::match(S::strip_number, "1600000000-Roof-Photo 01.jpg", blob));
	REQUIRE_FALSE(LegacyResolver::match(S::strip_number, "1600000000_Roof.jpg", blob));

	REQUIRE(LegacyResolver::match(S::after_dash, "old-Photo 01.jpg", blob));
	REQUIRE_FALSE(LegacyResolver::match(S::after_dash, "no dash here", blob));

	REQUIRE(LegacyResolver::match(S::tokens, "roof photo 01", blob));
	REQUIRE_FALSE(LegacyResolver::match(S::tokens, "photo roof", blob));
	REQUIRE_FALSE(LegacyResolver::match(S::tokens, "--", blob));

	REQUIRE(LegacyResolver::match(S::normalized, "ROOF_PHOTO_01.JPG", blob));
	REQUIRE(LegacyResolver::match(S::normalized, "report__roofphoto01", blob));
	REQUIRE_FALSE(LegacyResolver::match(S::normalized, "wall.jpg", blob));

	REQUIRE(LegacyResolver::normalize("Roof-Photo 01.JPG") == "roofphoto01jpg");
}

class LegacyResolverUTFixture : public StoreFixture
{
public:
	LegacyResolverUTFixture() : StoreFixture{"LegacyResolver-UT"}
	{
	}

protected:
	BlobDatabase    m_db{m_cfg};
	LegacyResolver  m_subject{m_db};
};

TEST_CASE_METHOD(LegacyResolverUTFixture, "resolve legacy names", "[normal]")
{
	std::error_code ec;
	auto roof = m_db.put("roof", target("r1_1589000000123_roof.jpg"), ec);
	REQUIRE(!ec);
	auto wall = m_db.put("wall", target("r1_1589000000456_wall.jpg"), ec);
	REQUIRE(!ec);

	SECTION("exact name wins")
	{
		auto found = m_subject.resolve("r1_1589000000123_roof.jpg", "photos", ec);
		REQUIRE(!ec);
		REQUIRE(found.size() == 1);
		REQUIRE(found.front().id == roof.id);
	}
	SECTION("the first strategy that finds anything wins")
	{
		auto found = m_subject.resolve("1589000000-wall.jpg", "photos", ec);
		REQUIRE(!ec);
		REQUIRE(found.size() == 1);
		REQUIRE(found.front().id == wall.id);
	}
	SECTION("several candidates")
	{
		auto found = m_subject.resolve("r1 jpg", "photos", ec);
		REQUIRE(!ec);
		REQUIRE(found.size() == 2);
	}
	SECTION("nothing found is not an error")
	{
		auto found = m_subject.resolve("kitchen.png", "photos", ec);
		REQUIRE(!ec);
		REQUIRE(found.empty());
	}
	SECTION("empty name")
	{
		m_subject.resolve("  ", "photos", ec);
		REQUIRE(ec == Error::invalid_argument);
	}
}
