/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "ChunkWriter.hh"
#include "SessionRegistry.hh"

#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

#include <shared_mutex>

namespace shg {

ChunkWriter::ChunkWriter(SessionRegistry& registry, ChunkSpill& spill, std::size_t max_chunk_size, std::size_t max_object_size) :
	m_registry{registry}, m_spill{spill}, m_max_chunk{max_chunk_size}, m_max_object{max_object_size}
{
}

ChunkWriter::Progress ChunkWriter::write(const SessionID& id, std::int64_t index, std::string_view chunk, std::error_code& ec)
{
	auto session = m_registry.find(id, ec);
	if (!session)
		return {};

	std::shared_lock lock{session->mutex()};

	// completed or expired after we found it
	if (session->closed())
	{
		ec = Error::not_found;
		return {};
	}

	// touch before anything else, so an expiry sweep waiting for the lock sees it
	session->touch();

	if (index < 0 || static_cast<std::uint64_t>(index) >= session->total())
	{
		ec = Error::invalid_argument;
		return {};
	}
	if (chunk.size() > m_max_chunk)
	{
		ec = Error::too_large;
		return {};
	}

	session->save(static_cast<std::size_t>(index), chunk, m_spill, m_max_object, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot save chunk %1% of upload %2%: %3%", index, to_hex(id), ec.message());
		return {};
	}

	return {session->received(), session->total()};
}

} // end of namespace shg
