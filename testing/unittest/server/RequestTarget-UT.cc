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

#include "server/RequestTarget.hh"

using namespace shg;

TEST_CASE("path segments of request targets", "[normal]")
{
	RequestTarget subject{"/api/photos/0123456789abcdef01234567/thumbnail"};
	REQUIRE(subject.size() == 4);
	REQUIRE(subject[0] == "api");
	REQUIRE(subject[3] == "thumbnail");
	REQUIRE(subject.query().empty());

	REQUIRE(subject.match({"api", "photos", "*", "thumbnail"}));
	REQUIRE_FALSE(subject.match({"api", "photos", "*"}));
	REQUIRE_FALSE(subject.match({"api", "files", "*", "thumbnail"}));

	SECTION("percent-encoded and repeated slashes")
	{
		RequestTarget encoded{"//api/files/resolve%20me/"};
		REQUIRE(encoded.segments() == std::vector<std::string>{"api", "files", "resolve me"});
	}
	SECTION("root")
	{
		RequestTarget root{"/"};
		REQUIRE(root.size() == 0);
		REQUIRE(root.match({}));
	}
}

TEST_CASE("query options of request targets", "[normal]")
{
	RequestTarget subject{"/api/files/search?filename=roof+photo&bucket=&contentType=image%2Fjpeg"};
	REQUIRE(subject.match({"api", "files", "search"}));
	REQUIRE(subject.query() == "filename=roof+photo&bucket=&contentType=image%2Fjpeg");

	REQUIRE(subject.option("filename") == "roof photo");
	REQUIRE(subject.option("contentType") == "image/jpeg");
	REQUIRE(subject.option("bucket") == "");
	REQUIRE_FALSE(subject.option("size").has_value());

	// empty means the default
	REQUIRE(subject.option("bucket", "photos") == "photos");
	REQUIRE(subject.option("size", "original") == "original");
	REQUIRE(subject.option("filename", "none") == "roof photo");
}
