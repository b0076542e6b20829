/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//

#include "ObjectID.hh"

#include "crypto/Blake2.hh"
#include "crypto/Random.hh"
#include "util/Escape.hh"

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <chrono>
#include <ostream>

namespace shg {

std::optional<ObjectID> ObjectID::from_hex(std::string_view hex)
{
	auto opt_array = hex_to_array<ObjectID{}.size()>(hex);
	if (opt_array.has_value())
	{
		ObjectID result{};
		std::copy(opt_array->begin(), opt_array->end(), result.begin());
		return result;
	}
	else
		return std::nullopt;
}

ObjectID ObjectID::randomize()
{
	using namespace std::chrono;
	auto secs = boost::endian::native_to_big(static_cast<std::uint32_t>(
		duration_cast<seconds>(system_clock::now().time_since_epoch()).count()
	));

	ObjectID result{};
	std::memcpy(result.data(), &secs, sizeof(secs));
	insecure_random(result.data() + sizeof(secs), result.size() - sizeof(secs));
	return result;
}

ObjectID ObjectID::derive(std::string_view variant) const
{
	Blake2 hash;
	hash.update(variant.data(), variant.size());
	hash.update(":", 1);
	hash.update(data(), size());
	auto digest = hash.finalize();

	ObjectID result{};
	std::copy_n(digest.begin(), result.size(), result.begin());
	return result;
}

std::string ObjectID::hex() const
{
	return to_hex(*this);
}

std::ostream& operator<<(std::ostream& os, const ObjectID& id)
{
	return os << to_hex(id);
}

void from_json(const nlohmann::json& src, ObjectID& dest)
{
	if (auto opt = ObjectID::from_hex(src.get<std::string>()); opt.has_value())
		dest = *opt;
	else
		throw std::invalid_argument("invalid object ID");
}

void to_json(nlohmann::json& dest, const ObjectID& src)
{
	dest = to_hex(src);
}

} // end of namespace
