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

#include "store/BlobInfo.hh"
#include "store/BlobQuery.hh"

using namespace shg;

namespace {

BlobInfo photo(const std::string& filename, const std::string& owner)
{
	BlobInfo info;
	info.filename = filename;
	info.mime     = "image/jpeg";
	info.metadata = {{meta::owner_id, owner}, {"stage", "inspection"}};
	return info;
}

}

TEST_CASE("empty query matches everything except variants", "[normal]")
{
	BlobQuery subject;
	REQUIRE(subject.match(photo("roof.jpg", "r1")));

	auto thumb = photo("roof.jpg", "r1");
	thumb.metadata[meta::variant_of] = "0123456789abcdef01234567";
	REQUIRE(thumb.is_variant());
	REQUIRE_FALSE(subject.match(thumb));

	subject.include_variants = true;
	REQUIRE(subject.match(thumb));
}

TEST_CASE("query by filename, mime, owner and fields", "[normal]")
{
	auto info = photo("R1_1589000000_Roof.JPG", "r1");

	BlobQuery subject;
	subject.filename = "roof.jpg";
	REQUIRE(subject.match(info));

	subject.mime = "JPEG";
	REQUIRE(subject.match(info));

	subject.owner = "r1";
	REQUIRE(subject.match(info));
	subject.owner = "r";
	REQUIRE_FALSE(subject.match(info));
	subject.owner.clear();

	subject.fields = {{"stage", "inspection"}};
	REQUIRE(subject.match(info));
	subject.fields = {{"stage", "repair"}};
	REQUIRE_FALSE(subject.match(info));
	subject.fields = {{"missing", "inspection"}};
	REQUIRE_FALSE(subject.match(info));
}

TEST_CASE("query from URL", "[normal]")
{
	auto subject = BlobQuery::from_url("filename=roof+photo&contentType=image%2Fjpeg&ownerId=r1&bucket=photos");
	REQUIRE(subject.filename == "roof photo");
	REQUIRE(subject.mime == "image/jpeg");
	REQUIRE(subject.owner == "r1");
	REQUIRE(subject.fields.empty());
	REQUIRE_FALSE(subject.include_variants);

	auto empty = BlobQuery::from_url("");
	REQUIRE(empty.match(photo("anything", "anyone")));
}
