/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//

#include "Configuration.hh"

#include "config.hh"

#include <nlohmann/json.hpp>

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/throw_exception.hpp>

#include <algorithm>
#include <fstream>

namespace po = boost::program_options;
namespace ip = boost::asio::ip;

namespace shg {
namespace {

ip::tcp::endpoint parse_endpoint(const nlohmann::json& json)
{
	return {
		ip::make_address(json["address"].get<std::string>()),
		json["port"].get<unsigned short>()
	};
}

bool valid_bucket_name(std::string_view name)
{
	return !name.empty() && name.size() <= 64 && std::all_of(name.begin(), name.end(), [](unsigned char c)
	{
		return std::isalnum(c) || c == '_' || c == '-';
	});
}

} // end of local namespace

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	m_desc.add_options()
		("help",      "produce help message")
		("cfg",       po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable SHINGLE_CONFIG to set default path.")
	;

	if (argc > 0)
	{
		store(po::parse_command_line(argc, argv, m_desc), m_args);
		po::notify(m_args);
	}

	// no need for other options when --help is specified
	if (!help())
		load_config(
			m_args.count("cfg") > 0 ? m_args["cfg"].as<std::string>() : std::string{env ? env : constants::config_filename}
	    );
}

void Configuration::usage(std::ostream &out) const
{
	out << m_desc;
}

void Configuration::load_config(const fs::path& path)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		auto json = nlohmann::json::parse(config_file);
		using jptr = nlohmann::json::json_pointer;

		// Paths are relative to the configuration file
		m_blob_path = fs::weakly_canonical(fs::absolute(json.at(jptr{"/blob_path"}).get<std::string>(), path.parent_path()));
		if (auto spill = json.value(jptr{"/spill_path"}, std::string{}); !spill.empty())
			m_spill_path = fs::weakly_canonical(fs::absolute(spill, path.parent_path()));

		m_thread_count  = json.value(jptr{"/thread_count"}, m_thread_count);

		if (json.contains("buckets"))
		{
			m_buckets = json["buckets"].get<std::vector<std::string>>();
			if (m_buckets.empty() || !std::all_of(m_buckets.begin(), m_buckets.end(), [](auto&& b){return valid_bucket_name(b);}))
				BOOST_THROW_EXCEPTION(InvalidValue() << Message{"buckets"});
		}

		m_segment_size    = json.value(jptr{"/segment_size_kb"},    m_segment_size/1024)    * 1024;
		m_max_chunk_size  = json.value(jptr{"/max_chunk_size_kb"},  m_max_chunk_size/1024)  * 1024;
		m_max_object_size = json.value(jptr{"/max_object_size_mb"}, m_max_object_size/1024/1024) * 1024 * 1024;
		m_spill_limit     = json.value(jptr{"/spill_limit_mb"},     m_spill_limit/1024/1024) * 1024 * 1024;
		m_max_request_size = json.value(jptr{"/max_request_size_mb"}, m_max_request_size/1024/1024) * 1024 * 1024;
		m_max_chunks      = json.value(jptr{"/max_chunks"}, m_max_chunks);
		if (m_segment_size == 0 || m_max_chunk_size == 0 || m_max_object_size == 0 || m_max_chunks == 0)
			BOOST_THROW_EXCEPTION(InvalidValue() << Message{"size limits must be positive"});

		if (json.contains("allowed_types"))
			m_allowed_types = json["allowed_types"].get<std::vector<std::string>>();

		m_session_max_age  = std::chrono::seconds{json.value(jptr{"/session_max_age_sec"},  m_session_max_age.count())};
		m_cleanup_interval = std::chrono::seconds{json.value(jptr{"/cleanup_interval_sec"}, m_cleanup_interval.count())};
		if (m_session_max_age.count() <= 0 || m_cleanup_interval.count() <= 0)
			BOOST_THROW_EXCEPTION(InvalidValue() << Message{"session_max_age_sec and cleanup_interval_sec must be positive"});

		m_put_retries = json.value(jptr{"/put_retries"}, m_put_retries);

		m_listen_http = parse_endpoint(json.at(jptr{"/http"}));

		if (auto redis = json.value(jptr{"/redis"}, nlohmann::json::object_t{}); !redis.empty())
			m_redis = parse_endpoint(redis);
		m_redis_timeout = std::chrono::seconds{json.value(jptr{"/redis_timeout_sec"}, m_redis_timeout.count())};
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
	catch (std::exception& e)
	{
		throw boost::enable_error_info(e) << Path{path};
	}
}

bool Configuration::valid_bucket(std::string_view bucket) const
{
	return std::find(m_buckets.begin(), m_buckets.end(), bucket) != m_buckets.end();
}

bool Configuration::allowed_type(std::string_view mime) const
{
	return std::find(m_allowed_types.begin(), m_allowed_types.end(), mime) != m_allowed_types.end();
}

} // end of namespace
