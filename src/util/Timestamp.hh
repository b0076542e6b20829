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

#include <nlohmann/json.hpp>

#include <chrono>
#include <iosfwd>
#include <string>

namespace shg {

using TimePointBase = std::chrono::time_point<
    std::chrono::system_clock,
	std::chrono::milliseconds
>;

/// \brief  The unit of timestamp stored in the blob metadata.
/// It is the number of milliseconds since the unix epoch
struct Timestamp : TimePointBase
{
	using time_point::time_point;
	Timestamp(TimePointBase tp) : Timestamp{tp.time_since_epoch()} {}

	static Timestamp now();

	std::string http_format() const;
	std::string iso8601() const;
};

void to_json(nlohmann::json& json, const Timestamp& input);
void from_json(const nlohmann::json& json, Timestamp& output);

std::ostream& operator<<(std::ostream& os, Timestamp tp);

} // end of namespace shg
