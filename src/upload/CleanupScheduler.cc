/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "CleanupScheduler.hh"
#include "SessionRegistry.hh"

#include "util/Log.hh"

#include <boost/asio/post.hpp>

namespace shg {

CleanupScheduler::CleanupScheduler(
	boost::asio::io_context& ioc,
	SessionRegistry& registry,
	std::chrono::seconds interval,
	std::chrono::seconds max_age
) :
	m_strand{ioc.get_executor()},
	m_timer{m_strand},
	m_registry{registry},
	m_interval{interval},
	m_max_age{max_age}
{
}

void CleanupScheduler::start()
{
	boost::asio::post(m_strand, [this]
	{
		if (!m_running)
		{
			m_running = true;
			schedule();
		}
	});
}

void CleanupScheduler::stop()
{
	boost::asio::post(m_strand, [this]
	{
		m_running = false;
		m_timer.cancel();
	});
}

void CleanupScheduler::schedule()
{
	m_timer.expires_after(m_interval);
	m_timer.async_wait([this](auto&& ec){on_timer(ec);});
}

void CleanupScheduler::on_timer(const boost::system::error_code& ec)
{
	if (ec == boost::asio::error::operation_aborted || !m_running)
		return;

	try
	{
		sweep();
	}
	catch (std::exception& e)
	{
		Log(LOG_ERR, "upload session sweep failed: %1%", e.what());
	}

	schedule();
}

std::size_t CleanupScheduler::sweep(UploadSession::Clock::time_point now)
{
	auto removed = m_registry.expire(now, m_max_age);

	m_total_removed += removed;
	m_sweep_count++;

	Log(LOG_INFO, "upload session sweep removed %1% idle session(s), %2% remain", removed, m_registry.size());
	return removed;
}

} // end of namespace shg
