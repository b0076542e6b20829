/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "Session.hh"

#include "server/ApiResponse.hh"
#include "server/SessionHandler.ipp"

#include "util/Error.hh"
#include "util/Log.hh"

#include "config.hh"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <boost/format.hpp>

namespace shg {

Session::Session(
	tcp::socket socket,
	const Services& services,
	std::size_t nth
) :
	m_socket{std::move(socket)},
	m_strand{m_socket.get_executor()},
	m_handler{services},
	m_nth_session{nth}
{
}

// Start the asynchronous operation
void Session::run()
{
	boost::asio::dispatch(m_strand, [self=shared_from_this()]{self->do_read();});
}

void Session::do_read()
{
	// Destroy and re-construct the parser for a new HTTP transaction
	m_parser.emplace();

	// Read the header of a request
	async_read_header(m_socket, m_buffer, *m_parser, boost::asio::bind_executor(
		m_strand,
		[self=shared_from_this()](auto ec, auto bytes) {self->on_read_header(ec, bytes);}
	));
}

void Session::on_read_header(boost::system::error_code ec, std::size_t)
{
	if (ec)
		return handle_read_error(ec);

	// Get the HTTP header from the partially parsed request message from the parser.
	// The body of the request message has not parsed yet.
	auto&& header = m_parser->get();
	m_keep_alive = header.keep_alive();

	if (!validate_request(header))
		return;

	auto limit = m_handler.body_limit(header);

	// Choose a parser for the body and let it continue from the header parser.
	// Call async_read() using the chosen parser to read and parse the request body.
	if (m_handler.body_type(header) == SessionHandler::RequestBodyType::string)
	{
		m_string_body.emplace(std::move(*m_parser));
		m_string_body->body_limit(limit);
		async_read(m_socket, m_buffer, *m_string_body, boost::asio::bind_executor(
			m_strand,
			[self=shared_from_this()](auto ec, auto bytes){self->on_read(ec, bytes);}
		));
	}
	else
	{
		m_string_body.reset();
		m_parser->body_limit(limit);
		async_read(m_socket, m_buffer, *m_parser, boost::asio::bind_executor(
			m_strand,
			[self=shared_from_this()](auto ec, auto bytes){self->on_read(ec, bytes);}
		));
	}
}

void Session::on_read(boost::system::error_code ec, std::size_t)
{
	if (ec)
		return handle_read_error(ec);

	auto send = [self=shared_from_this()](auto&& response)
	{
		self->send_response(std::forward<decltype(response)>(response));
	};

	if (m_string_body)
		m_handler.on_request_body(m_string_body->release(), send);
	else
		m_handler.on_request_body(m_parser->release(), send);

	m_nth_transaction++;
}

template <class Request>
bool Session::validate_request(const Request& req)
{
	boost::system::error_code ec;
	auto endpoint = m_socket.remote_endpoint(ec);
	if (ec)
		Log(LOG_WARNING, "remote_endpoint() error: %1% %2%", ec, ec.message());

	Log(
		LOG_INFO,
		"%1%:%2% %3% request %4% from %5% %6% bytes",
		m_nth_session,
		m_nth_transaction,
		req.method_string(),
		req.target(),
		endpoint,
		req[http::field::content_length].empty() ? "0" : req[http::field::content_length]
	);

	// Make sure we can handle the method
	if (req.method() != http::verb::get  &&
	    req.method() != http::verb::post &&
	    req.method() != http::verb::put &&
		req.method() != http::verb::delete_)
	{
		m_keep_alive = false;
		send_response(json_response(http::status::method_not_allowed, failure("Unknown HTTP-method"), req.version()));
		return false;
	}

	// Request path must be absolute and not contain "..".
	if (req.target().empty() ||
	    req.target()[0] != '/' ||
	    req.target().find("..") != boost::beast::string_view::npos)
	{
		m_keep_alive = false;
		send_response(error_response(Error::invalid_argument, req.version(), "Illegal request-target"));
		return false;
	}

	return true;
}

template <class Response>
void Session::send_response(Response&& response)
{
	// The response may come from another thread, e.g. the callback of a Redis command.
	// The lifetime of the message has to extend for the duration of the async operation
	// so we use a shared_ptr to manage it.
	auto sp = std::make_shared<std::remove_reference_t<Response>>(std::forward<Response>(response));
	boost::asio::dispatch(m_strand, [self=shared_from_this(), sp]
	{
		sp->set(http::field::server, (boost::format{"%1% shingle/%2%"} % BOOST_BEAST_VERSION_STRING % constants::version).str());
		sp->keep_alive(self->m_keep_alive);
		sp->prepare_payload();

		async_write(self->m_socket, *sp, boost::asio::bind_executor(
			self->m_strand,
			[self, sp](auto ec, auto bytes)
			{
				self->on_write(ec, bytes, sp->need_eof());
			}
		));
	});
}

void Session::handle_read_error(boost::system::error_code ec)
{
	// This means they closed the connection
	if (ec == http::error::end_of_stream)
		return do_close();

	// The body is not read, so the connection cannot be reused.
	m_keep_alive = false;

	if (ec == http::error::body_limit)
	{
		Log(LOG_NOTICE, "%1%:%2% request body too large", m_nth_session, m_nth_transaction);
		send_response(error_response(Error::too_large, 11));
	}
	else if (ec == boost::asio::error::operation_aborted || ec == boost::asio::error::connection_reset)
		do_close();
	else
	{
		Log(LOG_NOTICE, "%1%:%2% read error: %3% (%4%)", m_nth_session, m_nth_transaction, ec, ec.message());
		send_response(json_response(http::status::bad_request, failure(ec.message()), 11));
	}
}

void Session::on_write(boost::system::error_code ec, std::size_t, bool close)
{
	if (ec)
		Log(LOG_NOTICE, "%1%:%2% write error: %3% (%4%)", m_nth_session, m_nth_transaction, ec, ec.message());

	// This means we should close the connection, usually because
	// the response indicated the "Connection: close" semantic.
	if (close || ec)
		return do_close();

	// Read another request
	do_read();
}

void Session::do_close()
{
	// Send a TCP shutdown
	boost::system::error_code ec;
	m_socket.shutdown(tcp::socket::shutdown_send, ec);

	// At this point the connection is closed gracefully
}

} // end of namespace
