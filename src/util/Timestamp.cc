/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the shingle
	distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//

#include "Timestamp.hh"

#include <boost/format.hpp>

#include <ctime>
#include <iomanip>
#include <locale>
#include <ostream>
#include <sstream>

namespace shg {

using namespace std::chrono;

void to_json(nlohmann::json& json, const Timestamp& input)
{
	json = input.time_since_epoch().count();
}

void from_json(const nlohmann::json& json, Timestamp& output)
{
	output = Timestamp{Timestamp::duration{json.get<Timestamp::duration::rep>()}};
}

std::ostream& operator<<(std::ostream& os, Timestamp tp)
{
	return os << tp.time_since_epoch().count();
}

Timestamp Timestamp::now()
{
	return time_point_cast<Timestamp::duration>(Timestamp::clock::now());
}

std::string Timestamp::http_format() const
{
	auto tt = std::chrono::system_clock::to_time_t(*this);

	// put_time() is locale dependent, so use the classic locale to avoid surprises.
	std::ostringstream ss;
	ss.imbue(std::locale::classic());

	std::tm tm_{};
	if (auto tm = ::gmtime_r(&tt, &tm_); tm)
		ss << std::put_time(tm, "%a, %d %b %Y %H:%M:%S GMT");

	return ss.str();
}

std::string Timestamp::iso8601() const
{
	auto tt = std::chrono::system_clock::to_time_t(*this);
	auto ms = time_since_epoch().count() % 1000;

	std::tm tm_{};
	if (auto tm = ::gmtime_r(&tt, &tm_); tm)
		return (boost::format{"%04d-%02d-%02dT%02d:%02d:%02d.%03dZ"}
			% (tm->tm_year + 1900) % (tm->tm_mon + 1) % tm->tm_mday
			% tm->tm_hour % tm->tm_min % tm->tm_sec % ms).str();

	return {};
}

} // end of namespace shg
