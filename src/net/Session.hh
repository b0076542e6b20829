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

#include "Request.hh"

#include "server/SessionHandler.hh"

#include <boost/beast/core/flat_buffer.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <memory>
#include <optional>

namespace shg {

// Handles an HTTP server connection
class Session : public std::enable_shared_from_this<Session>
{
public:
	// Take ownership of the socket
	Session(
		tcp::socket socket,
		const Services& services,
		std::size_t nth
	);

	// Start the asynchronous operation
	void run();

private:
	void do_read();
	void on_read_header(boost::system::error_code ec, std::size_t bytes_transferred);
	void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
	void on_write(boost::system::error_code ec, std::size_t bytes_transferred, bool close);
	void do_close();

	void handle_read_error(boost::system::error_code ec);

	template <class Request>
	bool validate_request(const Request& req);

	template <class Response>
	void send_response(Response&& response);

private:
	tcp::socket		                                            m_socket;
	boost::asio::strand<tcp::socket::executor_type>             m_strand;
	boost::beast::flat_buffer                                   m_buffer;

	// The parsed message are stored inside the parsers.
	// Use parser::get() or release() to get the message.
	// The header parser reads the body too if the request has no body.
	std::optional<EmptyRequestParser>  m_parser;
	std::optional<StringRequestParser> m_string_body;

	SessionHandler m_handler;
	bool m_keep_alive{false};

	// stats
	std::size_t m_nth_session;
	std::size_t m_nth_transaction{};
};

} // end of namespace
