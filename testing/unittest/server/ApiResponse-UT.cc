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

#include "server/ApiResponse.hh"
#include "net/Redis.hh"
#include "util/Error.hh"

using namespace shg;

TEST_CASE("HTTP status of errors", "[normal]")
{
	REQUIRE(http_status({}) == http::status::ok);
	REQUIRE(http_status(Error::invalid_argument) == http::status::bad_request);
	REQUIRE(http_status(Error::not_found) == http::status::not_found);
	REQUIRE(http_status(Error::incomplete_upload) == http::status::conflict);
	REQUIRE(http_status(Error::already_exists) == http::status::conflict);
	REQUIRE(http_status(Error::too_large) == http::status::payload_too_large);
	REQUIRE(http_status(Error::unsupported_type) == http::status::unsupported_media_type);
	REQUIRE(http_status(Error::storage_full) == http::status::service_unavailable);
	REQUIRE(http_status(Error::storage_unavailable) == http::status::service_unavailable);
	REQUIRE(http_status(Error::assembly_error) == http::status::internal_server_error);
	REQUIRE(http_status(Error::redis_command_error) == http::status::internal_server_error);

	// errors from elsewhere
	REQUIRE(http_status(std::make_error_code(std::errc::io_error)) == http::status::internal_server_error);
	REQUIRE(http_status(redis::Error::timeout) == http::status::internal_server_error);
}

TEST_CASE("success and failure envelopes", "[normal]")
{
	auto ok = success({{"id", "abc"}});
	REQUIRE(ok["success"] == true);
	REQUIRE(ok["data"]["id"] == "abc");
	REQUIRE_FALSE(ok.contains("message"));
	REQUIRE_FALSE(ok.contains("meta"));

	auto with_meta = success(nlohmann::json::array(), "done", {{"total", 2}});
	REQUIRE(with_meta["message"] == "done");
	REQUIRE(with_meta["meta"]["total"] == 2);

	auto fail = failure("not found");
	REQUIRE(fail["success"] == false);
	REQUIRE(fail["error"] == "not found");
	REQUIRE_FALSE(fail.contains("details"));

	auto detailed = failure("incomplete", {{"missing", {1, 2}}});
	REQUIRE(detailed["details"]["missing"].size() == 2);
}

TEST_CASE("JSON responses", "[normal]")
{
	auto res = error_response(Error::too_large, 11, {{"max", 100}});
	REQUIRE(res.result() == http::status::payload_too_large);
	REQUIRE(res.version() == 11);
	REQUIRE(res[http::field::content_type] == "application/json");
	REQUIRE(res[http::field::cache_control] == "no-store");

	auto json = nlohmann::json::parse(res.body());
	REQUIRE(json["success"] == false);
	REQUIRE(json["error"] == "too large");
	REQUIRE(json["details"]["max"] == 100);
}
