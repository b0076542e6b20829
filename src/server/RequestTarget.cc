/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "RequestTarget.hh"

#include "util/Escape.hh"

namespace shg {

RequestTarget::RequestTarget(std::string_view target)
{
	auto path = std::get<0>(split_left(target, "?"));
	m_query = std::string{target};

	while (!path.empty())
	{
		auto seg = std::get<0>(split_left(path, "/"));
		if (!seg.empty())
			m_segments.push_back(url_decode(seg));
	}
}

bool RequestTarget::match(std::initializer_list<std::string_view> pattern) const
{
	if (pattern.size() != m_segments.size())
		return false;

	auto seg = m_segments.begin();
	for (auto&& p : pattern)
	{
		if (p != "*" && p != *seg)
			return false;
		++seg;
	}
	return true;
}

std::optional<std::string> RequestTarget::option(std::string_view name) const
{
	auto [value] = find_optional_fields(m_query, name);
	if (value.has_value())
		return url_decode(*value, true);
	return std::nullopt;
}

std::string RequestTarget::option(std::string_view name, std::string_view def) const
{
	auto value = option(name);
	return value.has_value() && !value->empty() ? *value : std::string{def};
}

} // end of namespace shg
