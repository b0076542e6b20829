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

#include "Exception.hh"
#include "FS.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace shg {

/// \brief  Parsing command line options and configuration file
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	struct InvalidValue : virtual Error {};
	using Path      = boost::error_info<struct tag_path,    fs::path>;
	using Message   = boost::error_info<struct tag_message, std::string>;

public:
	Configuration() = default;
	Configuration(int argc, const char *const *argv, const char *env);

	boost::asio::ip::tcp::endpoint listen_http() const { return m_listen_http;}
	boost::asio::ip::tcp::endpoint redis() const {return m_redis;}
	std::chrono::seconds redis_timeout() const {return m_redis_timeout;}

	fs::path blob_path() const {return m_blob_path;}
	fs::path spill_path() const {return m_spill_path.empty() ? m_blob_path / ".spill" : m_spill_path;}
	std::size_t thread_count() const {return m_thread_count;}

	const std::vector<std::string>& buckets() const {return m_buckets;}
	const std::string& default_bucket() const {return m_buckets.front();}
	bool valid_bucket(std::string_view bucket) const;

	std::size_t segment_size() const {return m_segment_size;}
	std::size_t max_chunk_size() const {return m_max_chunk_size;}
	std::size_t max_object_size() const {return m_max_object_size;}
	std::size_t spill_limit() const {return m_spill_limit;}
	std::size_t max_request_size() const {return m_max_request_size;}
	std::size_t max_chunks() const {return m_max_chunks;}
	const std::vector<std::string>& allowed_types() const {return m_allowed_types;}
	bool allowed_type(std::string_view mime) const;

	std::chrono::seconds session_max_age() const {return m_session_max_age;}
	std::chrono::seconds cleanup_interval() const {return m_cleanup_interval;}
	unsigned put_retries() const {return m_put_retries;}

	bool help() const {return m_args.count("help") > 0;}
	void usage(std::ostream& out) const;

	// for unit tests
	void blob_path(fs::path path) {m_blob_path = std::move(path);}
	void spill_path(fs::path path) {m_spill_path = std::move(path);}
	void segment_size(std::size_t size) {m_segment_size = size;}
	void max_chunk_size(std::size_t size) {m_max_chunk_size = size;}
	void max_object_size(std::size_t size) {m_max_object_size = size;}
	void spill_limit(std::size_t size) {m_spill_limit = size;}
	void max_chunks(std::size_t count) {m_max_chunks = count;}
	void session_max_age(std::chrono::seconds age) {m_session_max_age = age;}

private:
	void load_config(const fs::path& path);

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	boost::asio::ip::tcp::endpoint m_listen_http{
		boost::asio::ip::make_address("127.0.0.1"),
		5000
	};
	boost::asio::ip::tcp::endpoint m_redis{
		boost::asio::ip::make_address("127.0.0.1"),
		6379
	};
	std::chrono::seconds m_redis_timeout{5};

	fs::path m_blob_path, m_spill_path;
	std::size_t m_thread_count{1};

	std::vector<std::string> m_buckets{"photos", "pdf_report"};

	std::size_t m_segment_size{255 * 1024};
	std::size_t m_max_chunk_size{1024 * 1024};
	std::size_t m_max_object_size{15 * 1024 * 1024};
	std::size_t m_spill_limit{512 * 1024 * 1024};
	std::size_t m_max_request_size{150 * 1024 * 1024};
	std::size_t m_max_chunks{10000};
	std::vector<std::string> m_allowed_types{
		"image/jpeg", "image/png", "image/jpg", "image/heic", "image/heif", "application/octet-stream"
	};

	std::chrono::seconds m_session_max_age{3600};
	std::chrono::seconds m_cleanup_interval{1800};
	unsigned m_put_retries{2};
};

} // end of namespace
