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

#include "BlobStore.hh"

#include "util/FS.hh"

#include <string>
#include <vector>

namespace shg {

class Configuration;

/// \brief  On-disk database that stores the blobs in files and directories
/// Each blob is a directory <blob_path>/<bucket>/<first 2 hex digits>/<hex ID> with
/// a "meta.json" and its bytes split into fixed-size segment files. A blob is
/// prepared in a temporary directory and renamed into place, so readers never see
/// a partially written blob.
class BlobDatabase : public BlobStore
{
public:
	explicit BlobDatabase(const Configuration& cfg);

	using BlobStore::put;
	BlobInfo put(BlobSource& src, BlobInfo info, std::error_code& ec) override;
	BlobInfo put_at(const ObjectID& id, BlobSource& src, BlobInfo info, std::error_code& ec) override;

	BlobStream get(const ObjectID& id, const std::string& bucket, std::error_code& ec) const override;
	BlobInfo info(const ObjectID& id, const std::string& bucket, std::error_code& ec) const override;
	void remove(const ObjectID& id, const std::string& bucket, std::error_code& ec) override;
	std::vector<BlobInfo> find(const BlobQuery& query, const std::string& bucket, std::error_code& ec) const override;

	fs::path dest(const ObjectID& id, const std::string& bucket) const;

	static std::string segment_name(std::size_t index);

private:
	bool valid_bucket(const std::string& bucket) const;
	BlobInfo save(const ObjectID& id, BlobSource& src, BlobInfo&& info, std::error_code& ec);
	static BlobInfo load_meta(const fs::path& dir, std::error_code& ec);
	void purge_leftovers() const;

private:
	fs::path                    m_root;
	std::vector<std::string>    m_buckets;
	std::size_t                 m_segment_size;
};

} // end of namespace shg
