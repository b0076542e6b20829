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

#include <string>
#include <string_view>

namespace shg {

struct BlobInfo;

/// \brief  Metadata query for BlobStore::find()
/// Empty criteria match everything. filename and mime are case-insensitive
/// partial matches. owner and the metadata fields are exact matches.
struct BlobQuery
{
	std::string filename;
	std::string mime;
	std::string owner;
	nlohmann::json fields = nlohmann::json::object();

	bool include_variants{false};

	[[nodiscard]] bool match(const BlobInfo& info) const;

	/// Build a query from the "filename", "contentType" and "ownerId"
	/// parameters of an URL query string.
	static BlobQuery from_url(std::string_view query_string);
};

} // end of namespace shg
