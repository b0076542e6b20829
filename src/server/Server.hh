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

#include "Services.hh"

#include "net/Redis.hh"
#include "report/RedisReportLinker.hh"
#include "store/BlobDatabase.hh"
#include "store/BlobReader.hh"
#include "store/LegacyResolver.hh"
#include "upload/ChunkSpill.hh"
#include "upload/ChunkWriter.hh"
#include "upload/CleanupScheduler.hh"
#include "upload/SessionRegistry.hh"
#include "upload/UploadAssembler.hh"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <memory>

namespace shg {

class Configuration;
class Listener;

/// The main application logic of shingle.
/// It owns the blob store, the upload sessions and the connection to the report
/// database, and runs them on a pool of threads.
class Server
{
public:
	explicit Server(const Configuration& cfg);

	boost::asio::io_context& get_io_context();

	/// Start accepting connections on the configured endpoint.
	void listen();

	/// Run the I/O service on the configured number of threads until stop() is called.
	void run();
	void stop();

	Services services();

private:
	const Configuration&    m_cfg;
	boost::asio::io_context m_ioc;
	boost::asio::signal_set m_signals;

	BlobDatabase        m_blob_db;
	ChunkSpill          m_spill;
	SessionRegistry     m_registry;
	ChunkWriter         m_writer;
	UploadAssembler     m_assembler;
	CleanupScheduler    m_cleanup;
	BlobReader          m_reader;
	LegacyResolver      m_resolver;

	redis::Pool         m_db;
	RedisReportLinker   m_linker;

	std::shared_ptr<Listener> m_listener;
};

} // end of namespace
