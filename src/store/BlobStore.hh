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

#include "BlobInfo.hh"
#include "BlobQuery.hh"
#include "BlobStream.hh"
#include "ObjectID.hh"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace shg {

/// \brief  Durable storage of immutable blobs, separated into buckets
/// Every put() and remove() is durable when it returns. Implementations must be
/// safe to call from multiple threads.
class BlobStore
{
public:
	virtual ~BlobStore() = default;

	/// Store a new blob in info.bucket with a newly allocated ID.
	/// \return the BlobInfo of the stored blob, including its ID and size
	virtual BlobInfo put(BlobSource& src, BlobInfo info, std::error_code& ec) = 0;

	/// Store a blob under a given ID. Used for derived variants only.
	/// Fails with Error::already_exists if the ID is taken.
	virtual BlobInfo put_at(const ObjectID& id, BlobSource& src, BlobInfo info, std::error_code& ec) = 0;

	virtual BlobStream get(const ObjectID& id, const std::string& bucket, std::error_code& ec) const = 0;
	virtual BlobInfo info(const ObjectID& id, const std::string& bucket, std::error_code& ec) const = 0;

	/// Removing a blob that does not exist is not an error.
	virtual void remove(const ObjectID& id, const std::string& bucket, std::error_code& ec) = 0;

	/// An empty bucket searches all buckets.
	virtual std::vector<BlobInfo> find(const BlobQuery& query, const std::string& bucket, std::error_code& ec) const = 0;

	BlobInfo put(std::string_view bytes, BlobInfo info, std::error_code& ec)
	{
		StringSource src{bytes};
		return put(src, std::move(info), ec);
	}
};

} // end of namespace shg
