/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "BlobReader.hh"
#include "BlobStore.hh"

#include "util/Error.hh"
#include "util/Log.hh"

namespace shg {

const std::string BlobReader::original{"original"};
const std::string BlobReader::thumbnail{"thumbnail"};

BlobReader::BlobReader(const BlobStore& store, std::vector<std::string> buckets) :
	m_store{store}, m_buckets{std::move(buckets)}
{
}

bool BlobReader::valid_variant(std::string_view variant)
{
	return variant.empty() || variant == original || variant == thumbnail;
}

BlobStream BlobReader::stream(std::string_view id, std::string_view variant, const std::string& bucket, std::error_code& ec) const
{
	if (auto oid = ObjectID::from_hex(id); oid.has_value())
		return stream(*oid, variant, bucket, ec);

	ec = Error::invalid_argument;
	return {};
}

BlobStream BlobReader::stream(const ObjectID& id, std::string_view variant, const std::string& bucket, std::error_code& ec) const
{
	ec.clear();
	if (!valid_variant(variant))
	{
		ec = Error::invalid_argument;
		return {};
	}

	if (variant == thumbnail)
	{
		auto result = locate(id.derive(thumbnail), bucket, ec);
		if (ec != Error::not_found)
			return result;

		Log(LOG_DEBUG, "no thumbnail for %1%, returning the original", id);
	}
	return locate(id, bucket, ec);
}

BlobStream BlobReader::locate(const ObjectID& id, const std::string& bucket, std::error_code& ec) const
{
	auto& first = bucket.empty() ? m_buckets.front() : bucket;

	auto result = m_store.get(id, first, ec);
	if (ec != Error::not_found)
		return result;

	for (auto&& other : m_buckets)
	{
		if (other == first)
			continue;

		result = m_store.get(id, other, ec);
		if (!ec)
			Log(LOG_DEBUG, "%1% not found in bucket %2% but found in %3%", id, first, other);
		if (ec != Error::not_found)
			return result;
	}
	return {};
}

} // end of namespace shg
