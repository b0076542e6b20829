/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include <catch2/catch.hpp>

#include "net/Redis.hh"
#include "net/FakeRedis.hh"

#include <boost/asio/ip/address.hpp>

#include <functional>
#include <iterator>
#include <optional>

using namespace shg;
using namespace std::chrono_literals;

namespace {

const boost::asio::ip::tcp::endpoint local_redis{boost::asio::ip::make_address("127.0.0.1"), 6379};

}

TEST_CASE("parse replies in pieces", "[normal]")
{
	redis::ReplyReader subject;

	SECTION("status")
	{
		subject.feed("+O", 2);
		auto [partial, not_ready] = subject.get();
		REQUIRE(not_ready == redis::ReplyReader::Result::not_ready);

		subject.feed("K\r\n", 3);
		auto [reply, ok] = subject.get();
		REQUIRE(ok == redis::ReplyReader::Result::ok);
		REQUIRE(reply);
		REQUIRE_FALSE(reply.is_error());
		REQUIRE_FALSE(reply.is_nil());

		// status replies are not strings
		REQUIRE_FALSE(reply.is_string());
		REQUIRE(reply.as_string().empty());
	}
	SECTION("bulk string")
	{
		subject.feed("$8\r\nroof", 8);
		auto [partial, not_ready] = subject.get();
		REQUIRE(not_ready == redis::ReplyReader::Result::not_ready);

		subject.feed(".jpg\r\n", 6);
		auto [reply, ok] = subject.get();
		REQUIRE(ok == redis::ReplyReader::Result::ok);
		REQUIRE(reply.is_string());
		REQUIRE(reply.as_string() == "roof.jpg");
	}
	SECTION("nil")
	{
		subject.feed("$-1\r\n", 5);
		auto [reply, ok] = subject.get();
		REQUIRE(ok == redis::ReplyReader::Result::ok);
		REQUIRE(reply.is_nil());
		REQUIRE(reply);
	}
	SECTION("array with an error inside")
	{
		// what EXEC returns when a command in the transaction fails
		std::string_view exec{"*3\r\n$5\r\nfield\r\n-WRONGTYPE wrong kind of value\r\n:1\r\n"};
		subject.feed(exec.data(), exec.size());

		auto [reply, result] = subject.get();
		REQUIRE(result == redis::ReplyReader::Result::ok);
		REQUIRE(reply);
		REQUIRE(std::distance(reply.begin(), reply.end()) == 3);

		auto it = reply.begin();
		REQUIRE(it->as_string() == "field");
		++it;
		REQUIRE(it->is_error());
		REQUIRE_FALSE(*it);
		REQUIRE(it->as_error() == "WRONGTYPE wrong kind of value");
		++it;
		REQUIRE(*it);
		REQUIRE_FALSE(it->is_error());
	}
	SECTION("error reply")
	{
		std::string_view error{"-ERR unknown command\r\n"};
		subject.feed(error.data(), error.size());

		auto [reply, result] = subject.get();
		REQUIRE(result == redis::ReplyReader::Result::ok);
		REQUIRE(reply.is_error());
		REQUIRE(reply.as_error() == "ERR unknown command");
	}
	SECTION("garbage")
	{
		subject.feed("?what\r\n", 7);
		auto [reply, result] = subject.get();
		REQUIRE(result == redis::ReplyReader::Result::error);
	}
}

TEST_CASE("format commands", "[normal]")
{
	std::string_view key{"photo-report:abc"};
	redis::CommandString subject{"GET %b", key.data(), key.size()};
	REQUIRE(subject.str() == "*2\r\n$3\r\nGET\r\n$16\r\nphoto-report:abc\r\n");

	auto moved = std::move(subject);
	REQUIRE(moved.length() == 36);
	REQUIRE(subject.get() == nullptr);
}

TEST_CASE("redis error codes", "[normal]")
{
	std::error_code ec = redis::Error::timeout;
	REQUIRE(ec.category() == redis::redis_error_category());
	REQUIRE_FALSE(ec.message().empty());
}

TEST_CASE("cannot connect to redis", "[error]")
{
	boost::asio::io_context ioc;
	redis::Pool subject{ioc, {boost::asio::ip::make_address("127.0.0.1"), 1}};
	REQUIRE_THROWS_AS(subject.alloc(), std::system_error);
	REQUIRE(subject.idle() == 0);
}

TEST_CASE("command timeout", "[error]")
{
	boost::asio::io_context ioc;

	// never replies
	FakeRedis server{ioc, [](auto&&){return std::string{};}};
	redis::Pool pool{ioc, server.endpoint(), 100ms};

	std::optional<std::error_code> result;
	auto conn = pool.alloc();
	conn->command([&result](auto&& reply, std::error_code ec)
	{
		REQUIRE_FALSE(reply);
		result = ec;
	}, "GET photo-report:abc");

	// pipelined behind the first one
	std::optional<std::error_code> next;
	conn->command([&result, &next](auto&&, std::error_code ec)
	{
		REQUIRE(result.has_value());
		next = ec;
	}, "GET photo-report:def");
	conn.reset();

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(result == std::error_code{redis::Error::timeout});
	REQUIRE(next == std::error_code{redis::Error::timeout});

	// timed out connections are not reused
	REQUIRE(pool.idle() == 0);
	REQUIRE(server.commands().size() >= 1);
	REQUIRE(server.commands().front() == std::vector<std::string>{"GET", "photo-report:abc"});
}

TEST_CASE("replies within the timeout keep the connection", "[normal]")
{
	boost::asio::io_context ioc;
	FakeRedis server{ioc, [](auto&&){return std::string{"$5\r\nvalue\r\n"};}};
	redis::Pool pool{ioc, server.endpoint(), 100ms};

	// the connection stays idle for longer than the timeout between commands
	auto conn = pool.alloc();
	boost::asio::steady_timer gap{ioc};
	int replied = 0;

	std::function<void()> next = [&]
	{
		conn->command([&](auto&& reply, std::error_code ec)
		{
			REQUIRE_FALSE(ec);
			REQUIRE(reply.as_string() == "value");
			if (++replied < 3)
			{
				gap.expires_after(150ms);
				gap.async_wait([&next](auto){next();});
			}
			else
				conn.reset();
		}, "GET shingle-test:string");
	};
	next();

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(replied == 3);
	REQUIRE(server.commands().size() == 3);
	REQUIRE(pool.idle() == 1);
}

TEST_CASE("peer closes in the middle of a pipeline", "[error]")
{
	boost::asio::io_context ioc;
	FakeRedis server{ioc, [](auto&& cmd) -> std::optional<std::string>
	{
		if (cmd.front() == "MULTI")
			return std::string{"+OK\r\n"};
		return std::nullopt;
	}};
	redis::Pool pool{ioc, server.endpoint()};

	std::vector<std::string> called;
	std::optional<std::error_code> exec;

	auto conn = pool.alloc();
	conn->command([&called](auto&&, auto&&){called.push_back("MULTI");}, "MULTI");
	conn->command([&called](auto&&, auto&&){called.push_back("HSET");}, "HSET report-photos:r1 abc {}");
	conn->command([&called](auto&&, auto&&){called.push_back("SET");}, "SET photo-report:abc r1");
	conn->command([&called, &exec](auto&& reply, std::error_code ec)
	{
		REQUIRE_FALSE(reply);
		called.push_back("EXEC");
		exec = ec;
	}, "EXEC");
	conn.reset();

	REQUIRE(ioc.run_for(10s) > 0);

	// every callback runs exactly once, in order
	REQUIRE(called == std::vector<std::string>{"MULTI", "HSET", "SET", "EXEC"});
	REQUIRE(exec == std::error_code{redis::Error::io});
	REQUIRE(pool.idle() == 0);
}

TEST_CASE("string and hash commands", "[.redis]")
{
	boost::asio::io_context ioc;
	redis::Pool pool{ioc, local_redis};

	auto conn = pool.alloc();
	int tested = 0;

	conn->command([](auto&&, auto&&){}, "DEL shingle-test:string shingle-test:hash");
	conn->command([&tested](auto&& reply, std::error_code ec)
	{
		REQUIRE_FALSE(ec);
		REQUIRE(reply);
		tested++;
	}, "SET shingle-test:string %s", "value");
	conn->command([&tested](auto&& reply, std::error_code ec)
	{
		REQUIRE_FALSE(ec);
		REQUIRE(reply.as_string() == "value");
		tested++;
	}, "GET shingle-test:string");
	conn->command([&tested](auto&& reply, std::error_code ec)
	{
		REQUIRE_FALSE(ec);
		REQUIRE(reply);
		tested++;
	}, "HSET shingle-test:hash a 1 b 2");
	conn->command([&tested](auto&& reply, std::error_code ec)
	{
		REQUIRE_FALSE(ec);
		REQUIRE(reply.as_string() == "2");
		tested++;
	}, "HGET shingle-test:hash b");
	conn->command([&tested](auto&& reply, std::error_code ec)
	{
		REQUIRE_FALSE(ec);
		REQUIRE(reply.is_nil());
		tested++;
	}, "GET shingle-test:missing");
	conn->command([&tested](auto&& reply, std::error_code ec)
	{
		REQUIRE_FALSE(ec);
		REQUIRE(reply.is_error());
		REQUIRE_FALSE(reply);
		REQUIRE(reply.as_error().substr(0, 9) == "WRONGTYPE");
		tested++;
	}, "GET shingle-test:hash");
	conn->command([&tested](auto&& reply, std::error_code ec)
	{
		REQUIRE_FALSE(ec);
		REQUIRE(reply);
		tested++;
	}, "DEL shingle-test:string shingle-test:hash");

	conn.reset();

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 7);

	// the connection is back in the pool
	REQUIRE(pool.idle() == 1);
}
