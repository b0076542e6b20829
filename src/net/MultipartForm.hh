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

#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace shg {

/// \brief  One part of a multipart/form-data body
/// The data refers to the body it is parsed from.
struct FormPart
{
	std::string name;
	std::string filename;
	std::string content_type;
	std::string_view data;

	[[nodiscard]] bool is_file() const {return !filename.empty();}
};

/// \brief  Parser of multipart/form-data request bodies (RFC 7578)
class MultipartForm
{
public:
	MultipartForm() = default;
	MultipartForm(std::string_view body, std::string_view boundary, std::error_code& ec);

	/// Extract the boundary from the Content-Type header.
	static std::optional<std::string> boundary(std::string_view content_type);

	[[nodiscard]] const std::vector<FormPart>& parts() const {return m_parts;}

	[[nodiscard]] const FormPart* find(std::string_view name) const;
	[[nodiscard]] std::vector<const FormPart*> find_all(std::string_view name) const;

	/// The value of a field, or std::nullopt if absent.
	[[nodiscard]] std::optional<std::string> field(std::string_view name) const;

private:
	std::vector<FormPart> m_parts;
};

} // end of namespace shg
