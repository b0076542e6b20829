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

#include "UploadSession.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>

namespace shg {

class SessionRegistry;

/// \brief  Periodically removes upload sessions which have been idle for too long
/// The timer runs in the io_context. A failed sweep does not stop the next one.
class CleanupScheduler
{
public:
	CleanupScheduler(
		boost::asio::io_context& ioc,
		SessionRegistry& registry,
		std::chrono::seconds interval,
		std::chrono::seconds max_age
	);

	void start();
	void stop();

	/// Run one sweep immediately.
	/// \return number of sessions removed
	std::size_t sweep(UploadSession::Clock::time_point now = UploadSession::Clock::now());

	[[nodiscard]] std::size_t total_removed() const {return m_total_removed.load();}
	[[nodiscard]] std::size_t sweep_count() const {return m_sweep_count.load();}

private:
	void schedule();
	void on_timer(const boost::system::error_code& ec);

private:
	boost::asio::strand<boost::asio::io_context::executor_type> m_strand;
	boost::asio::steady_timer   m_timer;

	SessionRegistry&            m_registry;
	std::chrono::seconds        m_interval;
	std::chrono::seconds        m_max_age;

	bool m_running{false};      //!< only accessed in m_strand

	std::atomic<std::size_t> m_total_removed{0};
	std::atomic<std::size_t> m_sweep_count{0};
};

} // end of namespace shg
