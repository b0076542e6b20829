/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "BlobQuery.hh"
#include "BlobInfo.hh"

#include "util/Escape.hh"

namespace shg {

bool BlobQuery::match(const BlobInfo& info) const
{
	if (!include_variants && info.is_variant())
		return false;

	if (!icontains(info.filename, filename) || !icontains(info.mime, mime))
		return false;

	if (!owner.empty() && info.field(meta::owner_id) != owner)
		return false;

	for (auto&& [key, value] : fields.items())
	{
		auto it = info.metadata.find(key);
		if (it == info.metadata.end() || *it != value)
			return false;
	}
	return true;
}

BlobQuery BlobQuery::from_url(std::string_view query_string)
{
	auto [filename, mime, owner] = find_fields(query_string, "filename", "contentType", "ownerId");

	BlobQuery result;
	result.filename = url_decode(filename, true);
	result.mime     = url_decode(mime, true);
	result.owner    = url_decode(owner, true);
	return result;
}

} // end of namespace shg
