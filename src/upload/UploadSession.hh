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

#include "store/BlobInfo.hh"
#include "util/FS.hh"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <system_error>
#include <vector>

namespace shg {

class ChunkSpill;

/// \brief  One file being uploaded in chunks
/// Chunk writers hold mutex() in shared mode and lock the slot of their index,
/// so writes to different indices do not block each other. Completion, removal
/// and expiry hold mutex() exclusively. Once closed, a session accepts nothing.
class UploadSession
{
public:
	using Clock = std::chrono::steady_clock;

public:
	UploadSession(const SessionID& id, std::size_t total, BlobInfo target, fs::path dir);

	UploadSession(const UploadSession&) = delete;
	UploadSession& operator=(const UploadSession&) = delete;

	[[nodiscard]] const SessionID& id() const {return m_id;}
	[[nodiscard]] std::size_t total() const {return m_total;}
	[[nodiscard]] const BlobInfo& target() const {return m_target;}
	[[nodiscard]] const fs::path& dir() const {return m_dir;}
	[[nodiscard]] Timestamp created() const {return m_created;}

	[[nodiscard]] std::size_t received() const {return m_received.load();}
	[[nodiscard]] std::size_t bytes() const {return m_bytes.load();}

	[[nodiscard]] Clock::time_point last_activity() const {return m_last_activity.load();}
	void touch(Clock::time_point now = Clock::now());
	[[nodiscard]] bool expired(Clock::time_point now, Clock::duration max_age) const;

	std::shared_mutex& mutex() {return m_mutex;}

	// The following must be called with mutex() held
	[[nodiscard]] bool closed() const {return m_closed;}
	void close() {m_closed = true;}

	/// Indices that have not been received, in ascending order.
	std::vector<std::size_t> missing() const;

	/// Save the bytes of a chunk to the spill area, replacing the previous chunk of
	/// the same index. The total size of all chunks may not exceed \a max_bytes.
	/// \pre    mutex() is held in shared mode and \a index < total()
	void save(std::size_t index, std::string_view chunk, ChunkSpill& spill, std::size_t max_bytes, std::error_code& ec);

private:
	const SessionID     m_id;
	const std::size_t   m_total;
	const BlobInfo      m_target;
	const fs::path      m_dir;
	const Timestamp     m_created{Timestamp::now()};

	std::shared_mutex   m_mutex;
	bool                m_closed{false};

	mutable std::vector<std::mutex>         m_slot_mutex;
	std::vector<std::optional<std::size_t>> m_slots;        //!< size of received chunks

	std::atomic<std::size_t>        m_received{0};
	std::atomic<std::size_t>        m_bytes{0};
	std::atomic<Clock::time_point>  m_last_activity{Clock::now()};
};

} // end of namespace shg
