/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "Redis.hh"

#include "util/Log.hh"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

namespace shg {
namespace redis {

Connection::Connection(
	PoolBase& parent,
	boost::asio::ip::tcp::socket socket,
	std::chrono::milliseconds timeout
) :
	m_socket{std::move(socket)},
	m_strand{m_socket.get_executor()},
	m_deadline{m_strand},
	m_timeout{timeout},
	m_read_buf(64*1024),
	m_parent{parent}
{
}

Connection::~Connection()
{
	// only healthy connections go back to the pool
	if (!m_broken && m_callbacks.empty() && m_socket.is_open())
		m_parent.dealloc(std::move(m_socket));
}

void Connection::do_write(CommandString&& cmd, Completion&& completion)
{
	boost::asio::post(m_strand, [
		this,
		self=shared_from_this(),
		cmd=std::move(cmd),
		comp=std::move(completion)
	]() mutable
	{
		if (m_broken)
		{
			comp(Reply{}, Error::io);
			return;
		}

		m_writing.emplace_back(std::move(cmd), std::move(comp));
		if (m_writing.size() == 1)
			write_next();
	});
}

void Connection::write_next()
{
	auto cmd = std::get<CommandString>(m_writing.front()).str();
	boost::asio::async_write(
		m_socket,
		boost::asio::buffer(cmd.data(), cmd.size()),
		boost::asio::bind_executor(
			m_strand,
			[this, self=shared_from_this()](auto ec, std::size_t)
			{
				auto comp = std::move(std::get<Completion>(m_writing.front()));
				m_writing.pop_front();

				// the read side failed while this command was being written
				if (!ec && m_broken)
					ec = boost::asio::error::operation_aborted;

				if (ec)
				{
					if (!m_broken)
						Log(LOG_WARNING, "Redis write error: %1% (%2%). Disconnecting.", ec, ec.message());

					// fail_all() has already run if the connection is broken: comp is
					// empty unless this write is the one that failed. It goes after the
					// commands that were written before it.
					if (comp)
						m_callbacks.push_back(std::move(comp));
					fail_all(m_timed_out ? Error::timeout : Error::io);
					disconnect();

					// no more writes are in progress
					m_writing.clear();
					return;
				}

				m_callbacks.push_back(std::move(comp));
				if (!m_reading)
					do_read();

				if (!m_writing.empty())
					write_next();
			}
		)
	);
}

void Connection::do_read()
{
	m_reading = true;
	auto gen = ++m_read_gen;

	m_deadline.expires_after(m_timeout);
	m_deadline.async_wait(boost::asio::bind_executor(
		m_strand,
		[this, self=shared_from_this(), gen](auto ec)
		{
			// the handler may have been queued just before on_read() cancelled the timer
			if (!ec && m_reading && gen == m_read_gen)
			{
				Log(LOG_WARNING, "Redis command timed out after %1% ms. Disconnecting.", m_timeout.count());
				m_timed_out = true;
				disconnect();
			}
		}
	));

	m_socket.async_read_some(
		boost::asio::buffer(m_read_buf),
		boost::asio::bind_executor(
			m_strand,
			[this, self=shared_from_this()](auto ec, auto read){ on_read(ec, read); }
		)
	);
}

void Connection::on_read(boost::system::error_code ec, std::size_t bytes)
{
	m_reading = false;
	m_deadline.cancel();

	if (ec)
	{
		if (!m_timed_out)
			Log(LOG_WARNING, "Redis read error: %1% (%2%). Disconnecting.", ec, ec.message());

		fail_all(m_timed_out ? Error::timeout : Error::io);
		disconnect();
		return;
	}

	m_reader.feed(m_read_buf.data(), bytes);

	auto [reply, result] = m_reader.get();
	while (!m_callbacks.empty() && result == ReplyReader::Result::ok)
	{
		auto callback = std::move(m_callbacks.front());
		m_callbacks.pop_front();
		callback(std::move(reply), std::error_code{});

		std::tie(reply, result) = m_reader.get();
	}

	if (result == ReplyReader::Result::ok)
		Log(LOG_WARNING, "Redis sends more replies than requested. Ignoring reply.");

	if (result == ReplyReader::Result::error)
	{
		Log(LOG_WARNING, "Redis reply parse error. Disconnecting.");
		fail_all(Error::protocol);
		disconnect();
	}

	// Keep reading until all outstanding commands are finished
	else if (!m_callbacks.empty())
		do_read();
}

void Connection::fail_all(std::error_code ec)
{
	m_broken = true;

	auto callbacks = std::move(m_callbacks);
	m_callbacks.clear();

	// Commands waiting to be written will never get a reply either. Their entries stay
	// in m_writing until the write in progress finishes, because it still refers to
	// the front command string.
	for (auto&& writing : m_writing)
	{
		if (auto& comp = std::get<Completion>(writing))
		{
			callbacks.push_back(std::move(comp));
			comp = nullptr;
		}
	}

	for (auto&& callback : callbacks)
		callback(Reply{}, ec);
}

void Connection::disconnect()
{
	m_broken = true;

	boost::system::error_code ec;
	m_socket.close(ec);
	if (ec)
		Log(LOG_NOTICE, "cannot close Redis connection: %1%", ec.message());
}

Reply::Reply(::redisReply *r) noexcept :
	m_reply{r, [](::redisReply *r){if (r) ::freeReplyObject(r);}}
{
	// Special handling for arrays
	for (std::size_t i = 0 ; m_reply && m_reply->type == REDIS_REPLY_ARRAY && i < m_reply->elements; i++)
	{
		// Steal the element pointer and assign it to the shared_ptr of
		// our vector. Basically takes the ownership of the array element.
		m_array.emplace_back(m_reply->element[i]);
		m_reply->element[i] = nullptr;
	}
}

void Reply::swap(Reply& other) noexcept
{
	m_reply.swap(other.m_reply);
	m_array.swap(other.m_array);
}

std::string_view Reply::as_string() const noexcept
{
	return (m_reply && m_reply->type == REDIS_REPLY_STRING) ? as_any_string() : std::string_view{};
}

std::string_view Reply::as_error() const noexcept
{
	return (m_reply && m_reply->type == REDIS_REPLY_ERROR) ? as_any_string() : std::string_view{};
}

std::string_view Reply::as_any_string() const noexcept
{
	return (m_reply && (
		m_reply->type == REDIS_REPLY_STRING ||
		m_reply->type == REDIS_REPLY_STATUS ||
		m_reply->type == REDIS_REPLY_ERROR
	)) ?
		std::string_view{m_reply->str, static_cast<std::size_t>(m_reply->len)} : std::string_view{};
}

Reply::iterator Reply::begin() const
{
	return m_array.begin();
}

Reply::iterator Reply::end() const
{
	return m_array.end();
}

Reply::operator bool() const noexcept
{
	return m_reply && m_reply->type != REDIS_REPLY_ERROR;
}

const std::error_category& redis_error_category()
{
	struct Cat : std::error_category
	{
		const char *name() const noexcept override { return "redis"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "success";
				case Error::io: return "IO error";
				case Error::eof: return "EOF error";
				case Error::protocol: return "protocol error";
				case Error::oom: return "out-of-memory error";
				case Error::other: return "other error";
				case Error::command_error: return "command error";
				case Error::field_not_found: return "field not found";
				case Error::timeout: return "timeout";
				default: return "unknown error";
			}
		}
	};
	static const Cat cat{};
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), redis_error_category());
}

CommandString::CommandString(CommandString&& other) noexcept
{
	swap(other);
}

CommandString::~CommandString()
{
	if (m_cmd)
		::redisFreeCommand(m_cmd);
}

CommandString& CommandString::operator=(CommandString&& other) noexcept
{
	CommandString tmp{std::move(other)};
	swap(tmp);
	return *this;
}

void CommandString::swap(CommandString& other) noexcept
{
	std::swap(m_cmd, other.m_cmd);
	std::swap(m_length, other.m_length);
}

void ReplyReader::feed(const char *data, std::size_t size)
{
	::redisReaderFeed(m_reader.get(), data, size);
}

std::tuple<Reply, ReplyReader::Result> ReplyReader::get()
{
	void *reply{};
	auto result = ::redisReaderGetReply(m_reader.get(), &reply);
	return std::make_tuple(
		Reply{static_cast<::redisReply*>(reply)},
		result == REDIS_OK ? (reply ? Result::ok : Result::not_ready) : Result::error
	);
}

void ReplyReader::Deleter::operator()(::redisReader *reader) const noexcept
{
	::redisReaderFree(reader);
}

Pool::Pool(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& remote, std::chrono::milliseconds timeout) :
	m_ioc{ioc},
	m_remote{remote},
	m_timeout{timeout}
{
}

boost::asio::ip::tcp::socket Pool::get_sock()
{
	{
		std::unique_lock<std::mutex> lock{m_mx};
		if (!m_socks.empty())
		{
			auto sock = std::move(m_socks.back());
			m_socks.pop_back();
			return sock;
		}
	}

	boost::system::error_code ec;
	boost::asio::ip::tcp::socket sock{m_ioc};
	sock.connect(m_remote, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot connect to Redis at %1%: %2%", m_remote, ec.message());
		throw std::system_error(std::error_code{ec.value(), std::generic_category()});
	}
	return sock;
}

std::shared_ptr<Connection> Pool::alloc()
{
	return std::make_shared<Connection>(*this, get_sock(), m_timeout);
}

void Pool::dealloc(boost::asio::ip::tcp::socket socket)
{
	std::unique_lock<std::mutex> lock{m_mx};
	m_socks.push_back(std::move(socket));
}

std::size_t Pool::idle() const
{
	std::unique_lock<std::mutex> lock{m_mx};
	return m_socks.size();
}

}} // end of namespace
