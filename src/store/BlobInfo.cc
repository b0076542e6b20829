/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "BlobInfo.hh"

namespace shg {

bool BlobInfo::is_variant() const
{
	return metadata.is_object() && metadata.contains(meta::variant_of);
}

std::string BlobInfo::field(const std::string& key) const
{
	if (metadata.is_object())
	{
		if (auto it = metadata.find(key); it != metadata.end() && it->is_string())
			return it->get<std::string>();
	}
	return {};
}

void to_json(nlohmann::json& dest, const BlobInfo& src)
{
	dest = nlohmann::json{
		{"id",          src.id},
		{"bucket",      src.bucket},
		{"filename",    src.filename},
		{"contentType", src.mime},
		{"size",        src.size},
		{"uploadDate",  src.upload_date},
		{"segmentSize", src.segment_size},
		{"segments",    src.segments},
		{"metadata",    src.metadata}
	};
}

void from_json(const nlohmann::json& src, BlobInfo& dest)
{
	BlobInfo result;
	result.id           = src.at("id").get<ObjectID>();
	result.bucket       = src.at("bucket").get<std::string>();
	result.filename     = src.at("filename").get<std::string>();
	result.mime         = src.at("contentType").get<std::string>();
	result.size         = src.at("size").get<std::size_t>();
	result.upload_date  = src.at("uploadDate").get<Timestamp>();
	result.segment_size = src.at("segmentSize").get<std::size_t>();
	result.segments     = src.at("segments").get<std::size_t>();
	result.metadata     = src.value("metadata", nlohmann::json::object());
	dest = std::move(result);
}

} // end of namespace shg
