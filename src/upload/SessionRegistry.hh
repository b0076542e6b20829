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
#include "UploadSession.hh"

#include "store/BlobInfo.hh"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <system_error>

namespace shg {

class ChunkSpill;

/// \brief  All upload sessions in progress
/// Lock order: the mutex of a session before the mutex of the registry.
class SessionRegistry
{
public:
	SessionRegistry(ChunkSpill& spill, std::size_t max_chunks);

	SessionRegistry(const SessionRegistry&) = delete;
	SessionRegistry& operator=(const SessionRegistry&) = delete;

	/// Start a new session. Nothing is written to the BlobStore until it is completed.
	/// \param  target  filename, mime, bucket and metadata of the blob to be assembled
	SessionID create(std::int64_t total_chunks, BlobInfo target, std::error_code& ec);

	std::shared_ptr<UploadSession> find(const SessionID& id, std::error_code& ec) const;
	std::shared_ptr<UploadSession> find(std::string_view hex, std::error_code& ec) const;

	void touch(const SessionID& id, std::error_code& ec);
	void remove(const SessionID& id, std::error_code& ec);

	/// Drop a session and its chunks.
	/// \pre    The caller holds the mutex of the session exclusively.
	void discard(UploadSession& session, std::error_code& ec);

	/// Remove all sessions that have been idle for longer than \a max_age.
	/// Sessions being written to are skipped, as they are obviously not idle.
	/// \return number of sessions removed
	std::size_t expire(UploadSession::Clock::time_point now, UploadSession::Clock::duration max_age);

	[[nodiscard]] std::size_t size() const;
	[[nodiscard]] std::size_t max_chunks() const {return m_max_chunks;}

private:
	ChunkSpill&         m_spill;
	const std::size_t   m_max_chunks;

	mutable std::mutex m_mutex;
	std::map<SessionID, std::shared_ptr<UploadSession>> m_sessions;
};

} // end of namespace shg
