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

#include <boost/functional/hash.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstring>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace shg {

/// \brief  Opaque 12-byte identifier of a blob, written as 24 hex digits.
/// The first 4 bytes are the creation time in seconds (big endian), the rest are random.
/// Derived variants (e.g. thumbnails) use a hash of the original ID instead.
struct ObjectID : std::array<unsigned char, 12>
{
	static std::optional<ObjectID> from_hex(std::string_view hex);

	static ObjectID randomize();

	/// Deterministic ID of a rendition of this blob.
	[[nodiscard]] ObjectID derive(std::string_view variant) const;

	[[nodiscard]] std::string hex() const;
};
static_assert(std::is_standard_layout<ObjectID>::value);

std::ostream& operator<<(std::ostream& os, const ObjectID& id);

void from_json(const nlohmann::json& src, ObjectID& dest);
void to_json(nlohmann::json& dest, const ObjectID& src);

} // end of namespace

// inject hash<> to std namespace for unordered_map
namespace std
{
    template<> struct hash<shg::ObjectID>
    {
        typedef shg::ObjectID argument_type;
        typedef std::size_t result_type;
        result_type operator()(const argument_type& s) const noexcept
		{
			return boost::hash_range(s.begin(), s.end());
		}
	};
}
