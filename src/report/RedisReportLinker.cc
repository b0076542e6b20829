/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "RedisReportLinker.hh"

#include "net/Redis.hh"
#include "util/Error.hh"
#include "util/Log.hh"

namespace shg {
namespace {

const auto ignore_reply = [](auto&&, auto&&){};

// Errors from the redis connection mean the storage can't be reached
std::error_code linker_error(const redis::Reply& reply, std::error_code ec)
{
	if (ec)
		return ec.category() == redis::redis_error_category() ?
			std::error_code{Error::storage_unavailable} : ec;

	// EXEC returns nil if the transaction is aborted, and an error reply (e.g. EXECABORT)
	// if a queued command was rejected
	if (!reply || reply.is_nil())
		return Error::redis_command_error;

	// commands that failed inside the transaction
	for (auto&& result : reply)
		if (result.is_error())
			return Error::redis_command_error;

	return {};
}

std::string_view error_message(const redis::Reply& reply)
{
	if (reply.is_error())
		return reply.as_error();

	for (auto&& result : reply)
		if (result.is_error())
			return result.as_error();

	return {};
}

} // end of local namespace

RedisReportLinker::RedisReportLinker(redis::Pool& pool) : m_pool{pool}
{
}

void RedisReportLinker::link_photo(const std::string& report_id, const ObjectID& blob, const nlohmann::json& photo, Completion&& comp)
{
	std::shared_ptr<redis::Connection> conn;
	try
	{
		conn = m_pool.alloc();
	}
	catch (std::system_error& e)
	{
		Log(LOG_WARNING, "cannot link photo %1% to report %2%: %3%", blob, report_id, e.what());
		comp(Error::storage_unavailable);
		return;
	}

	auto hex  = blob.hex();
	auto json = photo.dump();

	conn->command(ignore_reply, "MULTI");
	conn->command(ignore_reply, "HSET report-photos:%b %b %b",
		report_id.data(), report_id.size(),
		hex.data(), hex.size(),
		json.data(), json.size()
	);
	conn->command(ignore_reply, "SET photo-report:%b %b",
		hex.data(), hex.size(),
		report_id.data(), report_id.size()
	);
	conn->command([comp=std::move(comp), blob, report_id](auto&& reply, std::error_code ec)
	{
		ec = linker_error(reply, ec);
		if (ec)
			Log(LOG_WARNING, "cannot link photo %1% to report %2%: %3% %4%", blob, report_id, ec.message(), error_message(reply));
		comp(ec);
	}, "EXEC");
}

void RedisReportLinker::unlink_photo(const ObjectID& blob, Completion&& comp)
{
	std::shared_ptr<redis::Connection> conn;
	try
	{
		conn = m_pool.alloc();
	}
	catch (std::system_error& e)
	{
		Log(LOG_WARNING, "cannot unlink photo %1%: %2%", blob, e.what());
		comp(Error::storage_unavailable);
		return;
	}

	auto hex = blob.hex();
	conn->command([conn, comp=std::move(comp), hex](auto&& reply, std::error_code ec)
	{
		if (ec)
		{
			comp(linker_error(reply, ec));
			return;
		}

		// not linked to any report
		if (reply.is_nil())
		{
			comp({});
			return;
		}

		// e.g. WRONGTYPE
		if (!reply.is_string())
		{
			Log(LOG_WARNING, "cannot find the report of photo %1%: %2%", hex, error_message(reply));
			comp(Error::redis_command_error);
			return;
		}

		auto report_id = std::string{reply.as_string()};
		conn->command(ignore_reply, "MULTI");
		conn->command(ignore_reply, "HDEL report-photos:%b %b",
			report_id.data(), report_id.size(),
			hex.data(), hex.size()
		);
		conn->command(ignore_reply, "DEL photo-report:%b", hex.data(), hex.size());
		conn->command([comp, report_id](auto&& exec, std::error_code ec)
		{
			ec = linker_error(exec, ec);
			if (ec)
				Log(LOG_WARNING, "cannot unlink photo from report %1%: %2% %3%", report_id, ec.message(), error_message(exec));
			comp(ec);
		}, "EXEC");
	}, "GET photo-report:%b", hex.data(), hex.size());
}

} // end of namespace shg
