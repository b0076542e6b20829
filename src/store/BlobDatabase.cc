/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "BlobDatabase.hh"

#include "crypto/Random.hh"
#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Exception.hh"
#include "util/Log.hh"
#include "util/MMap.hh"

#include <boost/beast/core/file_posix.hpp>
#include <boost/exception/info.hpp>
#include <boost/format.hpp>
#include <boost/throw_exception.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <vector>

#include <unistd.h>

namespace shg {
namespace {

const std::string meta_filename = "meta.json";
const std::string tmp_prefix    = ".tmp-";
const std::string trash_prefix  = ".trash-";

std::error_code storage_error(const boost::system::error_code& bec)
{
	if (bec.value() == ENOSPC || bec.value() == EDQUOT)
		return Error::storage_full;
	return to_std(bec);
}

void write_file(const fs::path& path, const void *data, std::size_t size, std::error_code& ec)
{
	boost::system::error_code bec;
	boost::beast::file_posix file;
	file.open(path.string().c_str(), boost::beast::file_mode::write_new, bec);
	if (!bec && size > 0)
		file.write(data, size, bec);

	if (!bec && ::fdatasync(file.native_handle()) != 0)
		bec.assign(errno, boost::system::generic_category());

	if (bec)
	{
		Log(LOG_WARNING, "cannot write file %1% (%2% %3%)", path, bec, bec.message());
		ec = storage_error(bec);
	}
}

// Read from the source until the buffer is full or the source is exhausted.
std::size_t fill(BlobSource& src, std::vector<char>& buf, std::error_code& ec)
{
	std::size_t count = 0;
	while (count < buf.size())
	{
		auto n = src.read(buf.data() + count, buf.size() - count, ec);
		if (ec || n == 0)
			break;
		count += n;
	}
	return count;
}

} // end of local namespace

BlobDatabase::BlobDatabase(const Configuration& cfg) :
	m_root{cfg.blob_path()},
	m_buckets{cfg.buckets()},
	m_segment_size{cfg.segment_size()}
{
	if (exists(m_root) && !is_directory(m_root))
		BOOST_THROW_EXCEPTION(SystemError()
			<< ErrorCode{std::make_error_code(std::errc::not_a_directory)}
			<< Location{m_root.string()}
		);

	for (auto&& bucket : m_buckets)
		create_directories(m_root / bucket);

	purge_leftovers();
}

void BlobDatabase::purge_leftovers() const
{
	for (auto&& entry : fs::directory_iterator{m_root})
	{
		auto name = entry.path().filename().string();
		if (name.rfind(tmp_prefix, 0) == 0 || name.rfind(trash_prefix, 0) == 0)
		{
			boost::system::error_code bec;
			fs::remove_all(entry.path(), bec);
			if (bec)
				Log(LOG_WARNING, "cannot remove leftover %1% (%2%)", entry.path(), bec.message());
			else
				Log(LOG_NOTICE, "removed leftover %1%", entry.path());
		}
	}
}

bool BlobDatabase::valid_bucket(const std::string& bucket) const
{
	return std::find(m_buckets.begin(), m_buckets.end(), bucket) != m_buckets.end();
}

fs::path BlobDatabase::dest(const ObjectID& id, const std::string& bucket) const
{
	auto hex = to_hex(id);
	return m_root / bucket / hex.substr(0, 2) / hex;
}

std::string BlobDatabase::segment_name(std::size_t index)
{
	return (boost::format{"seg.%06d"} % index).str();
}

BlobInfo BlobDatabase::put(BlobSource& src, BlobInfo info, std::error_code& ec)
{
	// ObjectIDs are mostly random. Collisions are not expected, but they are
	// checked anyway when renaming the blob into place.
	return save(ObjectID::randomize(), src, std::move(info), ec);
}

BlobInfo BlobDatabase::put_at(const ObjectID& id, BlobSource& src, BlobInfo info, std::error_code& ec)
{
	return save(id, src, std::move(info), ec);
}

BlobInfo BlobDatabase::save(const ObjectID& id, BlobSource& src, BlobInfo&& info, std::error_code& ec)
{
	ec.clear();
	if (!valid_bucket(info.bucket))
	{
		ec = Error::invalid_argument;
		return {};
	}

	auto dir = dest(id, info.bucket);
	if (exists(dir))
	{
		ec = Error::already_exists;
		return {};
	}

	auto tmpl = (m_root / (tmp_prefix + "XXXXXX")).string();
	if (::mkdtemp(tmpl.data()) == nullptr)
	{
		ec = storage_error({errno, boost::system::generic_category()});
		return {};
	}
	fs::path tmp{tmpl};

	info.id           = id;
	info.size         = 0;
	info.segments     = 0;
	info.segment_size = m_segment_size;
	if (info.upload_date == Timestamp{})
		info.upload_date = Timestamp::now();

	std::vector<char> buf(m_segment_size);
	while (!ec)
	{
		auto count = fill(src, buf, ec);
		if (ec || count == 0)
			break;

		write_file(tmp / segment_name(info.segments), buf.data(), count, ec);
		info.segments++;
		info.size += count;
	}

	if (!ec)
	{
		auto meta = nlohmann::json(info).dump();
		write_file(tmp / meta_filename, meta.data(), meta.size(), ec);
	}
	if (!ec)
		sync_directory(tmp, ec);

	boost::system::error_code bec;
	if (!ec)
		fs::create_directories(dir.parent_path(), bec);

	// rename() refuses to replace a non-empty directory, so an existing blob
	// is never overwritten
	if (!ec && !bec)
		fs::rename(tmp, dir, bec);

	if (bec)
	{
		ec = (bec.value() == ENOTEMPTY || bec.value() == EEXIST) ?
			std::error_code{Error::already_exists} : storage_error(bec);
	}
	if (!ec)
		sync_directory(dir.parent_path(), ec);

	if (ec)
	{
		Log(LOG_WARNING, "cannot save blob %1% in bucket %2%: %3%", id, info.bucket, ec.message());
		fs::remove_all(tmp, bec);
		return {};
	}
	return std::move(info);
}

BlobInfo BlobDatabase::load_meta(const fs::path& dir, std::error_code& ec)
{
	auto mmap = MMap::open(dir / meta_filename, ec);
	if (ec)
	{
		if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
			ec = Error::not_found;
		return {};
	}

	auto json = nlohmann::json::parse(mmap.string(), nullptr, false);
	if (!json.is_discarded())
	{
		try
		{
			return json.get<BlobInfo>();
		}
		catch (std::exception& e)
		{
			Log(LOG_WARNING, "invalid metadata in %1%: %2%", dir, e.what());
		}
	}
	else
		Log(LOG_WARNING, "cannot parse metadata in %1%", dir);

	ec = Error::storage_unavailable;
	return {};
}

BlobInfo BlobDatabase::info(const ObjectID& id, const std::string& bucket, std::error_code& ec) const
{
	ec.clear();
	if (!valid_bucket(bucket))
	{
		ec = Error::invalid_argument;
		return {};
	}
	return load_meta(dest(id, bucket), ec);
}

BlobStream BlobDatabase::get(const ObjectID& id, const std::string& bucket, std::error_code& ec) const
{
	auto meta = info(id, bucket, ec);
	if (ec)
		return {};

	auto dir = dest(id, bucket);

	std::size_t total = 0;
	std::vector<MMap> segments;
	for (std::size_t i = 0; i < meta.segments; i++)
	{
		auto seg = MMap::open(dir / segment_name(i), ec);

		// the blob was removed after we read its metadata
		if (ec == std::errc::no_such_file_or_directory)
			ec = Error::not_found;
		if (ec)
			return {};

		total += seg.size();
		segments.push_back(std::move(seg));
	}

	if (total != meta.size)
	{
		Log(LOG_ERR, "blob %1% in bucket %2% is corrupted: expected %3% bytes but found %4%", id, bucket, meta.size, total);
		ec = Error::storage_unavailable;
		return {};
	}

	return BlobStream{std::move(meta), std::move(segments)};
}

void BlobDatabase::remove(const ObjectID& id, const std::string& bucket, std::error_code& ec)
{
	ec.clear();
	if (!valid_bucket(bucket))
	{
		ec = Error::invalid_argument;
		return;
	}

	// Move the blob out of its place first. After that it can't be found even
	// if removing its files is interrupted.
	auto dir   = dest(id, bucket);
	auto trash = m_root / (trash_prefix + to_hex(id) + "-" + std::to_string(insecure_random<unsigned>()));

	boost::system::error_code bec;
	fs::rename(dir, trash, bec);
	if (bec)
	{
		if (bec.value() != ENOENT)
			ec = storage_error(bec);
		return;
	}

	sync_directory(dir.parent_path(), ec);
	if (ec)
		Log(LOG_WARNING, "cannot sync directory %1% after removing %2%: %3%", dir.parent_path(), id, ec.message());

	fs::remove_all(trash, bec);
	if (bec)
		Log(LOG_WARNING, "cannot remove %1% (%2%). It will be removed at next start up.", trash, bec.message());
}

std::vector<BlobInfo> BlobDatabase::find(const BlobQuery& query, const std::string& bucket, std::error_code& ec) const
{
	ec.clear();
	if (!bucket.empty() && !valid_bucket(bucket))
	{
		ec = Error::invalid_argument;
		return {};
	}

	std::vector<BlobInfo> result;
	for (auto&& b : m_buckets)
	{
		if (!bucket.empty() && b != bucket)
			continue;

		boost::system::error_code bec;
		for (fs::recursive_directory_iterator it{m_root / b, bec}, end; !bec && it != end; it.increment(bec))
		{
			// stop at the blob directories: <bucket>/<prefix>/<hex>
			if (it.depth() < 1)
				continue;
			it.disable_recursion_pending();

			std::error_code meta_ec;
			auto meta = load_meta(it->path(), meta_ec);
			if (meta_ec)
				Log(LOG_WARNING, "skipping %1% in search: %2%", it->path(), meta_ec.message());
			else if (query.match(meta))
				result.push_back(std::move(meta));
		}
		if (bec)
		{
			Log(LOG_WARNING, "cannot scan bucket %1%: %2%", b, bec.message());
			ec = storage_error(bec);
			return {};
		}
	}

	// newest first
	std::sort(result.begin(), result.end(), [](auto& a, auto& b)
	{
		return a.upload_date > b.upload_date;
	});
	return result;
}

} // end of namespace shg
