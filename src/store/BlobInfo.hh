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

#include "ObjectID.hh"
#include "util/Timestamp.hh"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace shg {

/// Well-known keys in BlobInfo::metadata
namespace meta {
const std::string owner_id      = "ownerId";
const std::string original_name = "originalName";
const std::string upload_date   = "uploadDate";
const std::string client_id     = "clientId";
const std::string variant_of    = "variantOf";
const std::string variant       = "variant";
}

/// \brief  Everything about a blob except its bytes
/// This is what is saved as "meta.json" beside the segments of the blob.
struct BlobInfo
{
	ObjectID    id{};
	std::string bucket;
	std::string filename;
	std::string mime{"application/octet-stream"};
	std::size_t size{};
	Timestamp   upload_date{};

	std::size_t segment_size{};
	std::size_t segments{};

	nlohmann::json metadata = nlohmann::json::object();

	[[nodiscard]] bool is_variant() const;

	/// The value of a string metadata field, or empty if absent.
	[[nodiscard]] std::string field(const std::string& key) const;
};

void to_json(nlohmann::json& dest, const BlobInfo& src);
void from_json(const nlohmann::json& src, BlobInfo& dest);

} // end of namespace shg
