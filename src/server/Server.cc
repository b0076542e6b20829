/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "Server.hh"

#include "net/Listener.hh"
#include "net/Session.hh"

#include "util/Configuration.hh"
#include "util/Log.hh"

#include <algorithm>
#include <csignal>
#include <thread>
#include <vector>

namespace shg {

Server::Server(const Configuration& cfg) :
	m_cfg{cfg},
	m_ioc{static_cast<int>(std::max(std::size_t{1}, cfg.thread_count()))},
	m_signals{m_ioc, SIGINT, SIGTERM},
	m_blob_db{cfg},
	m_spill{cfg.spill_path(), cfg.spill_limit()},
	m_registry{m_spill, cfg.max_chunks()},
	m_writer{m_registry, m_spill, cfg.max_chunk_size(), cfg.max_object_size()},
	m_assembler{m_registry, m_blob_db, cfg.put_retries()},
	m_cleanup{m_ioc, m_registry, cfg.cleanup_interval(), cfg.session_max_age()},
	m_reader{m_blob_db, cfg.buckets()},
	m_resolver{m_blob_db},
	m_db{m_ioc, cfg.redis(), cfg.redis_timeout()},
	m_linker{m_db}
{
}

boost::asio::io_context& Server::get_io_context()
{
	return m_ioc;
}

Services Server::services()
{
	return {m_cfg, m_blob_db, m_registry, m_writer, m_assembler, m_reader, m_resolver, m_linker};
}

void Server::listen()
{
	m_listener = std::make_shared<Listener>(
		m_ioc,
		m_cfg.listen_http(),
		[this](auto&& sock, auto nth)
		{
			return std::make_shared<Session>(std::move(sock), services(), nth);
		}
	);
	m_listener->run();

	Log(LOG_NOTICE, "listening to %1%", m_listener->local_endpoint());
}

void Server::run()
{
	m_signals.async_wait([this](auto ec, int signal)
	{
		if (!ec)
		{
			Log(LOG_NOTICE, "received signal %1%, shutting down", signal);
			stop();
		}
	});

	m_cleanup.start();

	// Run the I/O service on the requested number of threads
	auto const threads = std::max(std::size_t{1}, m_cfg.thread_count());
	std::vector<std::thread> v;
	v.reserve(threads - 1);
	for (auto i = threads - 1; i > 0; --i)
		v.emplace_back([this]{m_ioc.run();});

	m_ioc.run();

	for (auto&& t : v)
		t.join();
}

void Server::stop()
{
	m_cleanup.stop();
	if (m_listener)
		m_listener->stop();
	m_ioc.stop();
}

} // end of namespace
