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

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace shg {

class ChunkSpill;
class SessionRegistry;

/// \brief  Accepts the chunks of upload sessions
class ChunkWriter
{
public:
	struct Progress
	{
		std::size_t received{};
		std::size_t total{};
	};

public:
	ChunkWriter(SessionRegistry& registry, ChunkSpill& spill, std::size_t max_chunk_size, std::size_t max_object_size);

	/// Save a chunk of a session. Writing the same index again replaces the
	/// previous bytes.
	Progress write(const SessionID& id, std::int64_t index, std::string_view chunk, std::error_code& ec);

	[[nodiscard]] std::size_t max_chunk_size() const {return m_max_chunk;}

private:
	SessionRegistry&    m_registry;
	ChunkSpill&         m_spill;
	std::size_t         m_max_chunk;
	std::size_t         m_max_object;
};

} // end of namespace shg
