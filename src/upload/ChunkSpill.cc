/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "ChunkSpill.hh"

#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

#include <boost/beast/core/file_posix.hpp>

namespace shg {

ChunkSpill::ChunkSpill(fs::path root, std::size_t limit) :
	m_root{std::move(root)},
	m_limit{limit}
{
	// The sessions are lost when the process stops, so are their chunks.
	if (exists(m_root))
	{
		for (auto&& entry : fs::directory_iterator{m_root})
			fs::remove_all(entry.path());
	}
	else
		create_directories(m_root);
}

fs::path ChunkSpill::create(const SessionID& id, std::error_code& ec)
{
	auto dir = m_root / to_hex(id);

	boost::system::error_code bec;
	fs::create_directory(dir, bec);
	if (bec)
	{
		Log(LOG_WARNING, "cannot create spill directory %1% (%2%)", dir, bec.message());
		ec = to_std(bec);
	}
	return dir;
}

fs::path ChunkSpill::chunk_path(const fs::path& dir, std::size_t index)
{
	return dir / std::to_string(index);
}

bool ChunkSpill::reserve(std::size_t bytes)
{
	auto current = m_usage.load();
	do
	{
		if (current + bytes > m_limit)
			return false;
	} while (!m_usage.compare_exchange_weak(current, current + bytes));
	return true;
}

void ChunkSpill::release(std::size_t bytes)
{
	m_usage.fetch_sub(bytes);
}

void ChunkSpill::write(const fs::path& dir, std::size_t index, std::string_view bytes, std::size_t replaced, std::error_code& ec)
{
	if (!reserve(bytes.size()))
	{
		Log(LOG_WARNING, "spill area is full (%1% of %2% bytes used)", usage(), m_limit);
		ec = Error::storage_full;
		return;
	}

	// write to a temporary file and rename, so a failed write does not destroy
	// the chunk it was going to replace
	auto dest = chunk_path(dir, index);
	auto tmp  = fs::path{dest}.concat(".tmp");

	boost::system::error_code bec;
	{
		boost::beast::file_posix file;
		file.open(tmp.string().c_str(), boost::beast::file_mode::write, bec);
		if (!bec && !bytes.empty())
			file.write(bytes.data(), bytes.size(), bec);
	}
	if (!bec)
		fs::rename(tmp, dest, bec);

	if (bec)
	{
		Log(LOG_WARNING, "cannot write chunk %1% (%2%)", dest, bec.message());
		ec = (bec.value() == ENOSPC) ? std::error_code{Error::storage_full} : to_std(bec);

		fs::remove(tmp, bec);
		release(bytes.size());
		return;
	}

	release(replaced);
	ec.clear();
}

void ChunkSpill::discard(const fs::path& dir, std::size_t bytes, std::error_code& ec)
{
	boost::system::error_code bec;
	fs::remove_all(dir, bec);
	release(bytes);

	if (bec)
	{
		Log(LOG_WARNING, "cannot remove spill directory %1% (%2%)", dir, bec.message());
		ec = to_std(bec);
	}
}

} // end of namespace shg
