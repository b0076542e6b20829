/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "UploadSession.hh"
#include "ChunkSpill.hh"

#include "util/Error.hh"

namespace shg {

UploadSession::UploadSession(const SessionID& id, std::size_t total, BlobInfo target, fs::path dir) :
	m_id{id},
	m_total{total},
	m_target{std::move(target)},
	m_dir{std::move(dir)},
	m_slot_mutex(total),
	m_slots(total)
{
}

void UploadSession::touch(Clock::time_point now)
{
	m_last_activity.store(now);
}

bool UploadSession::expired(Clock::time_point now, Clock::duration max_age) const
{
	return now - last_activity() > max_age;
}

std::vector<std::size_t> UploadSession::missing() const
{
	std::vector<std::size_t> result;
	for (std::size_t i = 0; i < m_total; i++)
	{
		std::lock_guard lock{m_slot_mutex[i]};
		if (!m_slots[i].has_value())
			result.push_back(i);
	}
	return result;
}

void UploadSession::save(std::size_t index, std::string_view chunk, ChunkSpill& spill, std::size_t max_bytes, std::error_code& ec)
{
	std::lock_guard lock{m_slot_mutex.at(index)};

	auto replaced = m_slots[index].value_or(0);

	// Reserve the new size first. Another writer may be doing the same thing
	// on a different index.
	auto before = m_bytes.fetch_add(chunk.size());
	if (before + chunk.size() - replaced > max_bytes)
	{
		m_bytes.fetch_sub(chunk.size());
		ec = Error::too_large;
		return;
	}

	spill.write(m_dir, index, chunk, replaced, ec);
	if (ec)
	{
		m_bytes.fetch_sub(chunk.size());
		return;
	}

	m_bytes.fetch_sub(replaced);
	if (!m_slots[index].has_value())
		m_received++;
	m_slots[index] = chunk.size();
}

} // end of namespace shg
