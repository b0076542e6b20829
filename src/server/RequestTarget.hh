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

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shg {

/// \brief  The path segments and query string of a request-target
/// "/api/photos/abc?size=thumbnail" has segments {"api", "photos", "abc"}.
/// The segments are percent-decoded. The query string is not.
class RequestTarget
{
public:
	explicit RequestTarget(std::string_view target);

	[[nodiscard]] const std::vector<std::string>& segments() const {return m_segments;}
	[[nodiscard]] std::string_view query() const {return m_query;}

	[[nodiscard]] std::size_t size() const {return m_segments.size();}
	[[nodiscard]] const std::string& operator[](std::size_t i) const {return m_segments.at(i);}

	/// True if the path is exactly the given segments, with "*" matching any one segment.
	[[nodiscard]] bool match(std::initializer_list<std::string_view> pattern) const;

	/// Decoded value of a query string parameter.
	[[nodiscard]] std::optional<std::string> option(std::string_view name) const;
	[[nodiscard]] std::string option(std::string_view name, std::string_view def) const;

private:
	std::vector<std::string> m_segments;
	std::string m_query;
};

} // end of namespace shg
