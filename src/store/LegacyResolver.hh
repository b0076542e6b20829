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

#include "BlobInfo.hh"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace shg {

class BlobStore;

/// \brief  Finds blobs by the names used by old records which do not know the blob ID
/// This is a full scan of the bucket. Never use it when the ID is known.
class LegacyResolver
{
public:
	enum class Strategy {exact, strip_number, after_dash, tokens, normalized};

public:
	explicit LegacyResolver(const BlobStore& store);

	/// Try the strategies in the order of the Strategy enum and return the
	/// candidates found by the first one that finds anything.
	std::vector<BlobInfo> resolve(std::string_view name, const std::string& bucket, std::error_code& ec) const;

	static bool match(Strategy strategy, std::string_view name, const BlobInfo& blob);

	static std::string normalize(std::string_view name);

private:
	const BlobStore& m_store;
};

} // end of namespace shg
