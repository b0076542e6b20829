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

#include "SessionID.hh"

#include "util/FS.hh"

#include <atomic>
#include <cstddef>
#include <string_view>
#include <system_error>

namespace shg {

/// \brief  Bounded staging area on local disk for the chunks of upload sessions
/// Every session has its own directory. Each chunk is a file named after its index.
/// The total size of all chunks is limited. A write that would exceed the limit fails
/// with Error::storage_full.
class ChunkSpill
{
public:
	ChunkSpill(fs::path root, std::size_t limit);

	ChunkSpill(const ChunkSpill&) = delete;
	ChunkSpill& operator=(const ChunkSpill&) = delete;

	fs::path create(const SessionID& id, std::error_code& ec);

	/// Write the bytes of a chunk, replacing the existing chunk of the same index.
	/// \param  replaced    size of the chunk being replaced, 0 if none
	void write(const fs::path& dir, std::size_t index, std::string_view bytes, std::size_t replaced, std::error_code& ec);

	/// Remove the directory of a session and release its \a bytes from the usage.
	void discard(const fs::path& dir, std::size_t bytes, std::error_code& ec);

	static fs::path chunk_path(const fs::path& dir, std::size_t index);

	[[nodiscard]] std::size_t usage() const {return m_usage.load();}
	[[nodiscard]] std::size_t limit() const {return m_limit;}
	[[nodiscard]] const fs::path& root() const {return m_root;}

private:
	bool reserve(std::size_t bytes);
	void release(std::size_t bytes);

private:
	fs::path    m_root;
	std::size_t m_limit;

	std::atomic<std::size_t> m_usage{0};
};

} // end of namespace shg
