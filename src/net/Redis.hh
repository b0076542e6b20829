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


#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <hiredis/hiredis.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <vector>

namespace shg {
namespace redis {

// Error enum
enum class Error
{
	ok = REDIS_OK,
	io = REDIS_ERR_IO,
	eof = REDIS_ERR_EOF,
	protocol = REDIS_ERR_PROTOCOL,
	oom = REDIS_ERR_OOM,
	other = REDIS_ERR_OTHER,

	// other logical errors
	command_error = 1000,
	field_not_found,
	timeout
};

std::error_code make_error_code(Error err);
const std::error_category& redis_error_category();

class Reply
{
public:
	explicit Reply(redisReply *r = nullptr) noexcept;
	Reply(const Reply&) = default;
	Reply(Reply&& other) = default ;
	~Reply() = default;

	Reply& operator=(const Reply&) = default;
	Reply& operator=(Reply&& other) = default ;
	void swap(Reply& other) noexcept ;

	using iterator = std::vector<Reply>::const_iterator;
	iterator begin() const;
	iterator end() const;

	bool is_string() const {return m_reply && m_reply->type == REDIS_REPLY_STRING;}
	bool is_nil() const {return !m_reply || m_reply->type == REDIS_REPLY_NIL;}
	bool is_error() const {return m_reply && m_reply->type == REDIS_REPLY_ERROR;}

	std::string_view as_string() const noexcept;
	std::string_view as_error() const noexcept;

	/// False for error replies and when there is no reply at all
	explicit operator bool() const noexcept ;

private:
	std::string_view as_any_string() const noexcept;

private:
	std::shared_ptr<::redisReply> m_reply;

	std::vector<Reply> m_array;
};

class ReplyReader
{
public:
	enum class Result {ok, error, not_ready};

public:
	ReplyReader() = default;
	ReplyReader(ReplyReader&&) = default;
	ReplyReader(const ReplyReader&) = delete;
	~ReplyReader() = default;
	ReplyReader& operator=(ReplyReader&&) = default;
	ReplyReader& operator=(const ReplyReader&) = delete;

	void feed(const char *data, std::size_t size);
	std::tuple<Reply, Result> get();

private:
	struct Deleter {void operator()(::redisReader*) const noexcept; };
	std::unique_ptr<::redisReader, Deleter> m_reader{::redisReaderCreate()};
};

class CommandString
{
public:
	/// The first argument MUST be the command string. For security
	/// reason, this class does not accept std::string and const char*.
	/// It expects a hard-coded string literal.
	template <std::size_t N, typename... Args>
	explicit CommandString(const char (&cmd)[N], Args... args) :
		m_length{::redisFormatCommand(&m_cmd, cmd, args...)}
	{
		if (m_length < 0)
			throw std::logic_error("invalid command string");
	}
	CommandString(CommandString&& other) noexcept ;
	CommandString(const CommandString&) = delete;
	~CommandString();
	CommandString& operator=(CommandString&& other) noexcept ;
	CommandString& operator=(const CommandString&) = delete;

	void swap(CommandString& other) noexcept ;

	char* get() const {return m_cmd;}
	std::size_t length() const {return static_cast<std::size_t>(m_length);}
	std::string_view str() const {return {m_cmd, length()};}

private:
	char    *m_cmd{};
	int     m_length{};
};

class PoolBase
{
public:
	virtual ~PoolBase() = default;
	virtual void dealloc(boost::asio::ip::tcp::socket socket) = 0;
};

/// \brief  One connection to the redis server
/// Commands are written in the order they are issued and their callbacks are
/// invoked in the same order. A command that gets no reply within the timeout
/// fails with Error::timeout, together with all other pending commands, and
/// the connection is closed.
class Connection : public std::enable_shared_from_this<Connection>
{
public:
	using Completion = std::function<void(Reply, std::error_code)>;

public:
	Connection(
		PoolBase& parent,
		boost::asio::ip::tcp::socket socket,
		std::chrono::milliseconds timeout
	);

	Connection(Connection&&) = delete;
	Connection(const Connection&) = delete;
	~Connection();

	Connection& operator=(Connection&&) = delete;
	Connection& operator=(const Connection&) = delete;

	// The callback must be copy-constructible, as it is stored in a std::function.
	template <typename Callback, std::size_t N, typename... Args>
	typename std::enable_if_t<std::is_invocable<Callback, Reply, std::error_code>::value>
	command(Callback&& callback, const char (&cmd)[N], Args... args)
	{
		std::optional<CommandString> formatted;
		try
		{
			formatted.emplace(cmd, args...);
		}
		catch (std::logic_error&)
		{
			callback(Reply{}, std::error_code{Error::protocol});
			return;
		}
		do_write(std::move(*formatted), std::forward<Callback>(callback));
	}

	void disconnect();

private:
	void do_write(CommandString&& cmd, Completion&& completion);
	void write_next();
	void do_read();
	void on_read(boost::system::error_code ec, std::size_t bytes);
	void fail_all(std::error_code ec);

private:
	boost::asio::ip::tcp::socket m_socket;
	boost::asio::strand<boost::asio::ip::tcp::socket::executor_type> m_strand;
	boost::asio::steady_timer   m_deadline;
	std::chrono::milliseconds   m_timeout;

	std::vector<char> m_read_buf;

	// commands waiting to be written, and commands waiting for replies
	std::deque<std::tuple<CommandString, Completion>> m_writing;
	std::deque<Completion> m_callbacks;
	bool m_reading{false};
	bool m_timed_out{false};

	// incremented by every do_read(), so a stale deadline does not close a healthy connection
	std::uint64_t m_read_gen{};
	bool m_broken{false};

	ReplyReader m_reader;
	PoolBase&   m_parent;
};

/// \brief  Reuses connected sockets to the redis server
/// alloc() connects synchronously when there is no idle socket, and throws
/// std::system_error if it fails.
class Pool : public PoolBase
{
public:
	Pool(
		boost::asio::io_context& ioc,
		const boost::asio::ip::tcp::endpoint& remote,
		std::chrono::milliseconds timeout = std::chrono::seconds{5}
	);

	std::shared_ptr<Connection> alloc();
	void dealloc(boost::asio::ip::tcp::socket socket) override;

	std::size_t idle() const;

private:
	boost::asio::ip::tcp::socket get_sock();

private:
	boost::asio::io_context&                    m_ioc;
	boost::asio::ip::tcp::endpoint              m_remote;
	std::chrono::milliseconds                   m_timeout;
	std::vector<boost::asio::ip::tcp::socket>   m_socks;

	mutable std::mutex  m_mx;
};

}} // end of namespace

namespace std
{
	template <> struct is_error_code_enum<shg::redis::Error> : true_type {};
}
