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

#include "util/MMap.hh"

#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

namespace shg {

/// \brief  The bytes of a stored blob, ready to be read
/// All segments are memory-mapped when the stream is created, so deleting the blob
/// afterwards does not affect the bytes already handed out.
class BlobStream
{
public:
	BlobStream() = default;
	BlobStream(BlobInfo info, std::vector<MMap>&& segments);

	BlobStream(BlobStream&&) = default;
	BlobStream& operator=(BlobStream&&) = default;

	[[nodiscard]] const BlobInfo& info() const {return m_info;}
	[[nodiscard]] std::size_t size() const {return m_info.size;}

	[[nodiscard]] std::size_t segment_count() const {return m_segments.size();}
	[[nodiscard]] const MMap& segment(std::size_t index) const {return m_segments.at(index);}

	/// Sequential read. Returns 0 at the end of the blob.
	std::size_t read(void *buf, std::size_t size);

	[[nodiscard]] std::size_t position() const {return m_pos;}

private:
	BlobInfo            m_info;
	std::vector<MMap>   m_segments;

	std::size_t m_seg{};        //!< index of the segment being read
	std::size_t m_seg_pos{};    //!< offset within that segment
	std::size_t m_pos{};
};

/// \brief  A sequence of bytes to be written to a BlobStore
class BlobSource
{
public:
	virtual ~BlobSource() = default;

	/// Read at most \a size bytes. Returns 0 at the end of the source.
	virtual std::size_t read(void *buf, std::size_t size, std::error_code& ec) = 0;
};

class StringSource : public BlobSource
{
public:
	explicit StringSource(std::string_view bytes) : m_remain{bytes} {}

	std::size_t read(void *buf, std::size_t size, std::error_code& ec) override;

private:
	std::string_view m_remain;
};

} // end of namespace shg
