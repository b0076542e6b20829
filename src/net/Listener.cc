/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "Listener.hh"
#include "Session.hh"

#include "util/Exception.hh"
#include "util/Log.hh"

#include <boost/asio/post.hpp>
#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

namespace shg {

Listener::Listener(
	boost::asio::io_context &ioc,
	boost::asio::ip::tcp::endpoint endpoint,
	SessionFactory session_factory
) :
	m_acceptor{ioc},
	m_socket{ioc},
	m_session_factory{std::move(session_factory)}
{
	boost::system::error_code ec;

	// Open the acceptor
	m_acceptor.open(endpoint.protocol(), ec);
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError() << ErrorCode{ec} << Endpoint{endpoint} << Location{"open"});

	m_acceptor.set_option(boost::asio::socket_base::reuse_address{true});

	// Bind to the server address
	m_acceptor.bind(endpoint, ec);
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError() << ErrorCode{ec} << Endpoint{endpoint} << Location{"bind"});

	// Start listening for connections
	m_acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError() << ErrorCode{ec} << Endpoint{endpoint} << Location{"listen"});
}

void Listener::run()
{
	if (m_acceptor.is_open())
		do_accept();
}

void Listener::stop()
{
	boost::asio::post(m_acceptor.get_executor(), [self=shared_from_this()]
	{
		boost::system::error_code ec;
		self->m_acceptor.close(ec);
		if (ec)
			Log(LOG_WARNING, "cannot close listener: %1%", ec.message());
	});
}

boost::asio::ip::tcp::endpoint Listener::local_endpoint() const
{
	return m_acceptor.local_endpoint();
}

void Listener::do_accept()
{
	m_acceptor.async_accept(
		m_socket,
		[self = shared_from_this()](auto ec)
		{
			self->on_accept(ec);
		}
	);
}

void Listener::on_accept(boost::system::error_code ec)
{
	if (ec == boost::asio::error::operation_aborted)
		return;

	if (ec)
	{
		Log(LOG_WARNING, "accept error: %1%", ec);
	}
	else
	{
		// Create the session and run it
		m_session_factory(std::move(m_socket), m_session_count)->run();
		m_session_count++;
	}

	// Accept another connection
	do_accept();
}

} // end of namespace
