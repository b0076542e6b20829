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

#include "util/Error.hh"
#include "util/Exception.hh"

#include <fstream>

using namespace shg;

class BlobDatabaseUTFixture : public StoreFixture
{
public:
	BlobDatabaseUTFixture() : StoreFixture{"BlobDatabase-UT"}
	{
	}
};

TEST_CASE_METHOD(BlobDatabaseUTFixture, "put and get a blob", "[normal]")
{
	BlobDatabase subject{m_cfg};
	auto bytes = pattern(100);

	std::error_code ec;
	auto info = subject.put(bytes, target("roof.jpg"), ec);
	REQUIRE(!ec);
	REQUIRE(info.id != ObjectID{});
	REQUIRE(info.size == 100);
	REQUIRE(info.segment_size == 16);
	REQUIRE(info.segments == 7);
	REQUIRE(info.upload_date != Timestamp{});

	auto dir = subject.dest(info.id, "photos");
	REQUIRE(dir.parent_path().filename() == info.id.hex().substr(0, 2));
	REQUIRE(fs::exists(dir / "meta.json"));
	REQUIRE(fs::exists(dir / BlobDatabase::segment_name(6)));
	REQUIRE_FALSE(fs::exists(dir / BlobDatabase::segment_name(7)));
	REQUIRE(fs::file_size(dir / BlobDatabase::segment_name(6)) == 4);

	auto stream = subject.get(info.id, "photos", ec);
	REQUIRE(!ec);
	REQUIRE(stream.size() == 100);
	REQUIRE(stream.segment_count() == 7);
	REQUIRE(stream.info().filename == "roof.jpg");
	REQUIRE(stream.info().mime == "image/jpeg");
	REQUIRE(read_all(stream) == bytes);
	REQUIRE(stream.position() == 100);

	auto meta = subject.info(info.id, "photos", ec);
	REQUIRE(!ec);
	REQUIRE(meta.id == info.id);
	REQUIRE(meta.upload_date == info.upload_date);

	SECTION("the blob is in one bucket only")
	{
		subject.get(info.id, "pdf_report", ec);
		REQUIRE(ec == Error::not_found);
	}
	SECTION("the stream survives removal")
	{
		auto again = subject.get(info.id, "photos", ec);
		REQUIRE(!ec);

		subject.remove(info.id, "photos", ec);
		REQUIRE(!ec);
		REQUIRE_FALSE(fs::exists(dir));
		REQUIRE(read_all(again) == bytes);

		subject.get(info.id, "photos", ec);
		REQUIRE(ec == Error::not_found);

		// removing twice is fine
		subject.remove(info.id, "photos", ec);
		REQUIRE(!ec);
	}
}

TEST_CASE_METHOD(BlobDatabaseUTFixture, "empty and exact segment-size blobs", "[normal]")
{
	BlobDatabase subject{m_cfg};

	std::error_code ec;
	auto empty = subject.put(std::string_view{}, target("empty.bin"), ec);
	REQUIRE(!ec);
	REQUIRE(empty.size == 0);
	REQUIRE(empty.segments == 0);

	auto stream = subject.get(empty.id, "photos", ec);
	REQUIRE(!ec);
	REQUIRE(read_all(stream).empty());

	auto exact = subject.put(pattern(32), target("exact.bin"), ec);
	REQUIRE(!ec);
	REQUIRE(exact.segments == 2);
}

TEST_CASE_METHOD(BlobDatabaseUTFixture, "invalid bucket", "[error]")
{
	BlobDatabase subject{m_cfg};

	std::error_code ec;
	subject.put("abc", target("abc.txt", "no_such_bucket"), ec);
	REQUIRE(ec == Error::invalid_argument);

	auto id = ObjectID::randomize();
	subject.get(id, "../photos", ec);
	REQUIRE(ec == Error::invalid_argument);

	subject.remove(id, "", ec);
	REQUIRE(ec == Error::invalid_argument);

	subject.find(BlobQuery{}, "no_such_bucket", ec);
	REQUIRE(ec == Error::invalid_argument);

	REQUIRE(fs::is_empty(m_root / "blobs" / "photos"));
}

TEST_CASE_METHOD(BlobDatabaseUTFixture, "put_at never overwrites", "[normal]")
{
	BlobDatabase subject{m_cfg};
	auto id = ObjectID::randomize().derive("thumbnail");

	std::error_code ec;
	StringSource first{"first"};
	auto info = subject.put_at(id, first, target("first.jpg"), ec);
	REQUIRE(!ec);
	REQUIRE(info.id == id);

	StringSource second{"second"};
	subject.put_at(id, second, target("second.jpg"), ec);
	REQUIRE(ec == Error::already_exists);

	auto stream = subject.get(id, "photos", ec);
	REQUIRE(!ec);
	REQUIRE(read_all(stream) == "first");

	// no temporary directory left behind
	for (auto&& entry : fs::directory_iterator{m_root / "blobs"})
		REQUIRE(entry.path().filename().string().rfind(".tmp-", 0) != 0);
}

TEST_CASE_METHOD(BlobDatabaseUTFixture, "find blobs", "[normal]")
{
	BlobDatabase subject{m_cfg};

	std::error_code ec;
	auto old_roof = target("r1_1_roof.jpg");
	old_roof.upload_date = Timestamp{std::chrono::milliseconds{1000}};
	old_roof.metadata[meta::owner_id] = "r1";
	auto roof1 = subject.put("old roof", old_roof, ec);
	REQUIRE(!ec);

	auto new_roof = target("r1_2_roof.jpg");
	new_roof.upload_date = Timestamp{std::chrono::milliseconds{2000}};
	new_roof.metadata[meta::owner_id] = "r1";
	auto roof2 = subject.put("new roof", new_roof, ec);
	REQUIRE(!ec);

	auto report = subject.put("%PDF", target("r1_report.pdf", "pdf_report"), ec);
	REQUIRE(!ec);

	SECTION("newest first")
	{
		BlobQuery query;
		query.filename = "roof";
		auto found = subject.find(query, "photos", ec);
		REQUIRE(!ec);
		REQUIRE(found.size() == 2);
		REQUIRE(found[0].id == roof2.id);
		REQUIRE(found[1].id == roof1.id);
	}
	SECTION("all buckets")
	{
		auto found = subject.find(BlobQuery{}, "", ec);
		REQUIRE(!ec);
		REQUIRE(found.size() == 3);
	}
	SECTION("one bucket")
	{
		auto found = subject.find(BlobQuery{}, "pdf_report", ec);
		REQUIRE(!ec);
		REQUIRE(found.size() == 1);
		REQUIRE(found.front().id == report.id);
	}
	SECTION("by owner")
	{
		BlobQuery query;
		query.owner = "r1";
		REQUIRE(subject.find(query, "", ec).size() == 2);
		REQUIRE(!ec);
	}
	SECTION("blobs with corrupted metadata are skipped")
	{
		std::ofstream{(subject.dest(roof1.id, "photos") / "meta.json").string(), std::ios::trunc} << "{corrupted";
		auto found = subject.find(BlobQuery{}, "photos", ec);
		REQUIRE(!ec);
		REQUIRE(found.size() == 1);

		subject.info(roof1.id, "photos", ec);
		REQUIRE(ec == Error::storage_unavailable);
	}
}

TEST_CASE_METHOD(BlobDatabaseUTFixture, "damaged blobs", "[error]")
{
	BlobDatabase subject{m_cfg};

	std::error_code ec;
	auto info = subject.put(pattern(40), target("damaged.jpg"), ec);
	REQUIRE(!ec);
	auto dir = subject.dest(info.id, "photos");

	SECTION("missing segment")
	{
		fs::remove(dir / BlobDatabase::segment_name(1));
		subject.get(info.id, "photos", ec);
		REQUIRE(ec == Error::not_found);
	}
	SECTION("truncated segment")
	{
		fs::resize_file(dir / BlobDatabase::segment_name(1), 10);
		subject.get(info.id, "photos", ec);
		REQUIRE(ec == Error::storage_unavailable);
	}
}

TEST_CASE_METHOD(BlobDatabaseUTFixture, "leftovers are removed at start up", "[normal]")
{
	fs::create_directories(m_root / "blobs" / ".tmp-abcdef" / "nested");
	fs::create_directories(m_root / "blobs" / ".trash-0123-456");

	BlobDatabase subject{m_cfg};
	REQUIRE_FALSE(fs::exists(m_root / "blobs" / ".tmp-abcdef"));
	REQUIRE_FALSE(fs::exists(m_root / "blobs" / ".trash-0123-456"));
	REQUIRE(fs::is_directory(m_root / "blobs" / "photos"));
	REQUIRE(fs::is_directory(m_root / "blobs" / "pdf_report"));
}

TEST_CASE_METHOD(BlobDatabaseUTFixture, "blob path is not a directory", "[error]")
{
	auto file = m_root / "file";
	std::ofstream{file.string()} << "not a directory";

	m_cfg.blob_path(file);
	REQUIRE_THROWS_AS(BlobDatabase{m_cfg}, SystemError);
}
