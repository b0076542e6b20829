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

#include "store/ObjectID.hh"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <system_error>

namespace shg {

/// \brief  The owner of the reports, which keeps the list of photos of each report
/// The completion callbacks may be invoked in any thread.
class ReportLinker
{
public:
	using Completion = std::function<void(std::error_code)>;

public:
	virtual ~ReportLinker() = default;

	/// Add a photo to the photo list of a report.
	virtual void link_photo(const std::string& report_id, const ObjectID& blob, const nlohmann::json& photo, Completion&& comp) = 0;

	/// Remove a photo from the report it belongs to. It is not an error if the
	/// photo is not linked to any report.
	virtual void unlink_photo(const ObjectID& blob, Completion&& comp) = 0;
};

} // end of namespace shg
