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

#include "store/BlobDatabase.hh"
#include "util/Configuration.hh"

#include <string>

namespace shg {

/// Configuration of a BlobDatabase in an empty directory under /tmp, with tiny
/// segments so that small test blobs span many of them.
class StoreFixture
{
public:
	explicit StoreFixture(const std::string& name) : m_root{fs::path{"/tmp"} / name}
	{
		fs::remove_all(m_root);
		fs::create_directories(m_root);

		m_cfg.blob_path(m_root / "blobs");
		m_cfg.spill_path(m_root / "spill");
		m_cfg.segment_size(16);
	}

	/// A string of \a size bytes that is different at every offset of a segment
	static std::string pattern(std::size_t size)
	{
		std::string result(size, '\0');
		for (std::size_t i = 0; i < size; i++)
			result[i] = static_cast<char>('a' + (i * 7) % 26);
		return result;
	}

	static BlobInfo target(const std::string& filename, const std::string& bucket = "photos")
	{
		BlobInfo info;
		info.bucket   = bucket;
		info.filename = filename;
		info.mime     = "image/jpeg";
		return info;
	}

	static std::string read_all(BlobStream& stream)
	{
		std::string result;
		char buf[7];
		while (auto count = stream.read(buf, sizeof(buf)))
			result.append(buf, count);
		return result;
	}

protected:
	fs::path        m_root;
	Configuration   m_cfg;
};

} // end of namespace shg
