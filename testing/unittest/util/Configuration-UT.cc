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

#include "util/Configuration.hh"

#include <boost/exception/get_error_info.hpp>

#include <fstream>

using namespace shg;

class ConfigurationUTFixture
{
public:
	ConfigurationUTFixture()
	{
		fs::remove_all(m_dir);
		fs::create_directories(m_dir);
	}

protected:
	Configuration load(const std::string& json)
	{
		std::ofstream{m_file.string()} << json;

		auto path = m_file.string();
		const char *argv[] = {"shingle", "--cfg", path.c_str()};
		return Configuration{3, argv, nullptr};
	}

protected:
	const fs::path m_dir{"/tmp/Configuration-UT"};
	const fs::path m_file{m_dir / "shingle.json"};
};

TEST_CASE_METHOD(ConfigurationUTFixture, "minimal configuration uses the defaults", "[normal]")
{
	auto subject = load(R"({
		"blob_path": "blobs",
		"http": {"address": "127.0.0.1", "port": 8080}
	})");

	REQUIRE(subject.blob_path() == m_dir / "blobs");
	REQUIRE(subject.spill_path() == m_dir / "blobs" / ".spill");
	REQUIRE(subject.listen_http().port() == 8080);
	REQUIRE(subject.redis().port() == 6379);

	REQUIRE(subject.buckets() == std::vector<std::string>{"photos", "pdf_report"});
	REQUIRE(subject.default_bucket() == "photos");
	REQUIRE(subject.valid_bucket("pdf_report"));
	REQUIRE_FALSE(subject.valid_bucket("Photos"));
	REQUIRE_FALSE(subject.valid_bucket(""));

	REQUIRE(subject.max_chunk_size() == 1024 * 1024);
	REQUIRE(subject.max_object_size() == 15 * 1024 * 1024);
	REQUIRE(subject.allowed_type("image/jpeg"));
	REQUIRE_FALSE(subject.allowed_type("text/html"));

	REQUIRE(subject.session_max_age() == std::chrono::hours{1});
	REQUIRE(subject.cleanup_interval() == std::chrono::minutes{30});
	REQUIRE_FALSE(subject.help());
}

TEST_CASE_METHOD(ConfigurationUTFixture, "everything configured", "[normal]")
{
	auto subject = load(R"({
		"blob_path": "/srv/blobs",
		"spill_path": "spill",
		"thread_count": 8,
		"http": {"address": "0.0.0.0", "port": 5000},
		"redis": {"address": "10.0.0.1", "port": 6380},
		"buckets": ["images"],
		"segment_size_kb": 64,
		"max_chunk_size_kb": 512,
		"max_object_size_mb": 4,
		"max_chunks": 100,
		"allowed_types": ["image/png"],
		"session_max_age_sec": 60,
		"cleanup_interval_sec": 10,
		"put_retries": 0
	})");

	REQUIRE(subject.blob_path() == "/srv/blobs");
	REQUIRE(subject.spill_path() == m_dir / "spill");
	REQUIRE(subject.thread_count() == 8);
	REQUIRE(subject.redis().port() == 6380);
	REQUIRE(subject.default_bucket() == "images");
	REQUIRE(subject.segment_size() == 64 * 1024);
	REQUIRE(subject.max_chunk_size() == 512 * 1024);
	REQUIRE(subject.max_object_size() == 4 * 1024 * 1024);
	REQUIRE(subject.max_chunks() == 100);
	REQUIRE(subject.allowed_types() == std::vector<std::string>{"image/png"});
	REQUIRE(subject.session_max_age() == std::chrono::seconds{60});
	REQUIRE(subject.cleanup_interval() == std::chrono::seconds{10});
	REQUIRE(subject.put_retries() == 0);
}

TEST_CASE_METHOD(ConfigurationUTFixture, "invalid configurations", "[error]")
{
	SECTION("invalid bucket name")
	{
		REQUIRE_THROWS_AS(load(R"({
			"blob_path": "blobs", "http": {"address": "127.0.0.1", "port": 8080},
			"buckets": ["../etc"]
		})"), Configuration::InvalidValue);
	}
	SECTION("no bucket")
	{
		REQUIRE_THROWS_AS(load(R"({
			"blob_path": "blobs", "http": {"address": "127.0.0.1", "port": 8080},
			"buckets": []
		})"), Configuration::InvalidValue);
	}
	SECTION("zero interval")
	{
		REQUIRE_THROWS_AS(load(R"({
			"blob_path": "blobs", "http": {"address": "127.0.0.1", "port": 8080},
			"cleanup_interval_sec": 0
		})"), Configuration::InvalidValue);
	}
	SECTION("missing blob_path")
	{
		REQUIRE_THROWS(load(R"({"http": {"address": "127.0.0.1", "port": 8080}})"));
	}
}

TEST_CASE("missing configuration file", "[error]")
{
	const char *argv[] = {"shingle", "--cfg", "/tmp/Configuration-UT/no/such/file.json"};
	try
	{
		Configuration subject{3, argv, nullptr};
		FAIL("no exception thrown");
	}
	catch (Configuration::FileError& e)
	{
		auto path = boost::get_error_info<Configuration::Path>(e);
		REQUIRE(path);
		REQUIRE(*path == "/tmp/Configuration-UT/no/such/file.json");
	}
}

TEST_CASE("--help skips the configuration file", "[normal]")
{
	const char *argv[] = {"shingle", "--help"};
	Configuration subject{2, argv, "/tmp/Configuration-UT/no/such/file.json"};
	REQUIRE(subject.help());
}
