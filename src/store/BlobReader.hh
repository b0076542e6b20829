/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#pragma once

#include "BlobStream.hh"
#include "ObjectID.hh"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace shg {

class BlobStore;

/// \brief  Resolves a blob ID and an optional variant to a readable stream
class BlobReader
{
public:
	static const std::string original;
	static const std::string thumbnail;

public:
	BlobReader(const BlobStore& store, std::vector<std::string> buckets);

	/// Open the stream of a blob, or of one of its variants.
	/// \param  variant "original", "thumbnail" or empty for "original". A missing
	///                 thumbnail is not an error: the original is returned instead.
	/// \param  bucket  The bucket to look in first. Empty means the default bucket.
	///                 The other buckets are searched if the blob is not there.
	BlobStream stream(std::string_view id, std::string_view variant, const std::string& bucket, std::error_code& ec) const;

	BlobStream stream(const ObjectID& id, std::string_view variant, const std::string& bucket, std::error_code& ec) const;

	static bool valid_variant(std::string_view variant);

private:
	BlobStream locate(const ObjectID& id, const std::string& bucket, std::error_code& ec) const;

private:
	const BlobStore&            m_store;
	std::vector<std::string>    m_buckets;
};

} // end of namespace shg
