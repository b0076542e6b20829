/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "SessionRegistry.hh"
#include "ChunkSpill.hh"

#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

#include <shared_mutex>
#include <vector>

namespace shg {

SessionRegistry::SessionRegistry(ChunkSpill& spill, std::size_t max_chunks) :
	m_spill{spill}, m_max_chunks{max_chunks}
{
}

SessionID SessionRegistry::create(std::int64_t total_chunks, BlobInfo target, std::error_code& ec)
{
	if (total_chunks <= 0 || static_cast<std::uint64_t>(total_chunks) > m_max_chunks)
	{
		ec = Error::invalid_argument;
		return {};
	}

	auto id  = random_session_id();
	auto dir = m_spill.create(id, ec);
	if (ec)
		return {};

	auto session = std::make_shared<UploadSession>(id, static_cast<std::size_t>(total_chunks), std::move(target), std::move(dir));

	std::lock_guard lock{m_mutex};
	m_sessions.emplace(id, std::move(session));
	return id;
}

std::shared_ptr<UploadSession> SessionRegistry::find(const SessionID& id, std::error_code& ec) const
{
	std::lock_guard lock{m_mutex};
	if (auto it = m_sessions.find(id); it != m_sessions.end())
		return it->second;

	ec = Error::not_found;
	return {};
}

std::shared_ptr<UploadSession> SessionRegistry::find(std::string_view hex, std::error_code& ec) const
{
	// a malformed ID can't be a session we know
	if (auto id = parse_session_id(hex); id.has_value())
		return find(*id, ec);

	ec = Error::not_found;
	return {};
}

void SessionRegistry::touch(const SessionID& id, std::error_code& ec)
{
	if (auto session = find(id, ec); session)
	{
		std::shared_lock lock{session->mutex()};
		if (session->closed())
			ec = Error::not_found;
		else
			session->touch();
	}
}

void SessionRegistry::remove(const SessionID& id, std::error_code& ec)
{
	if (auto session = find(id, ec); session)
	{
		std::unique_lock lock{session->mutex()};
		if (session->closed())
			ec = Error::not_found;
		else
			discard(*session, ec);
	}
}

void SessionRegistry::discard(UploadSession& session, std::error_code& ec)
{
	session.close();
	m_spill.discard(session.dir(), session.bytes(), ec);

	std::lock_guard lock{m_mutex};
	m_sessions.erase(session.id());
}

std::size_t SessionRegistry::expire(UploadSession::Clock::time_point now, UploadSession::Clock::duration max_age)
{
	std::vector<std::shared_ptr<UploadSession>> candidates;
	{
		std::lock_guard lock{m_mutex};
		for (auto&& [id, session] : m_sessions)
			if (session->expired(now, max_age))
				candidates.push_back(session);
	}

	std::size_t count = 0;
	for (auto&& session : candidates)
	{
		try
		{
			std::unique_lock lock{session->mutex(), std::try_to_lock};

			// check again: a chunk may have arrived before we got the lock
			if (!lock.owns_lock() || session->closed() || !session->expired(now, max_age))
				continue;

			std::error_code ec;
			discard(*session, ec);
			if (ec)
				Log(LOG_WARNING, "expired upload session %1% removed but its chunks remain: %2%", to_hex(session->id()), ec.message());

			Log(LOG_INFO, "upload session %1% expired with %2% of %3% chunks received",
				to_hex(session->id()), session->received(), session->total());
			count++;
		}
		catch (std::exception& e)
		{
			Log(LOG_WARNING, "cannot expire upload session %1%: %2%", to_hex(session->id()), e.what());
		}
	}
	return count;
}

std::size_t SessionRegistry::size() const
{
	std::lock_guard lock{m_mutex};
	return m_sessions.size();
}

} // end of namespace shg
