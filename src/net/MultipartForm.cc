/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "MultipartForm.hh"

#include "util/Error.hh"
#include "util/Escape.hh"

namespace shg {
namespace {

const std::string_view crlf{"\r\n"};

// Parameters of a header value like: form-data; name="photo"; filename="a.jpg"
std::optional<std::string> header_param(std::string_view value, std::string_view param)
{
	// skip the media type
	split_left(value, ";");
	while (!value.empty())
	{
		auto field = std::get<0>(split_left(value, ";"));
		auto key = trim(std::get<0>(split_left(field, "=")));
		field = trim(field);

		if (to_lower(key) == param)
		{
			if (field.size() >= 2 && field.front() == '\"' && field.back() == '\"')
				field = field.substr(1, field.size() - 2);
			return std::string{field};
		}
	}
	return std::nullopt;
}

} // end of local namespace

std::optional<std::string> MultipartForm::boundary(std::string_view content_type)
{
	auto remain = content_type;
	if (to_lower(trim(std::get<0>(split_left(remain, ";")))) != "multipart/form-data")
		return std::nullopt;

	auto result = header_param(content_type, "boundary");
	if (result && result->empty())
		result.reset();
	return result;
}

MultipartForm::MultipartForm(std::string_view body, std::string_view boundary, std::error_code& ec)
{
	auto delimiter = "--" + std::string{boundary};

	// skip the preamble
	if (auto first = body.find(delimiter); first != body.npos)
		body.remove_prefix(first + delimiter.size());
	else
	{
		ec = Error::invalid_argument;
		return;
	}

	auto separator = std::string{crlf} + delimiter;
	while (true)
	{
		// close delimiter
		if (body.substr(0, 2) == "--")
			break;

		if (body.substr(0, crlf.size()) != crlf)
		{
			ec = Error::invalid_argument;
			return;
		}
		body.remove_prefix(crlf.size());

		FormPart part;
		while (true)
		{
			auto end = body.find(crlf);
			if (end == body.npos)
			{
				ec = Error::invalid_argument;
				return;
			}
			auto line = body.substr(0, end);
			body.remove_prefix(end + crlf.size());

			// blank line separates the headers and the data
			if (line.empty())
				break;

			auto field = to_lower(trim(std::get<0>(split_left(line, ":"))));
			if (field == "content-disposition")
			{
				part.name     = header_param(line, "name").value_or("");
				part.filename = header_param(line, "filename").value_or("");
			}
			else if (field == "content-type")
				part.content_type = std::string{trim(line)};
		}

		auto end = body.find(separator);
		if (end == body.npos)
		{
			ec = Error::invalid_argument;
			return;
		}
		part.data = body.substr(0, end);
		body.remove_prefix(end + separator.size());

		m_parts.push_back(std::move(part));
	}
}

const FormPart* MultipartForm::find(std::string_view name) const
{
	for (auto&& part : m_parts)
		if (part.name == name)
			return &part;
	return nullptr;
}

std::vector<const FormPart*> MultipartForm::find_all(std::string_view name) const
{
	std::vector<const FormPart*> result;
	for (auto&& part : m_parts)
		if (part.name == name)
			result.push_back(&part);
	return result;
}

std::optional<std::string> MultipartForm::field(std::string_view name) const
{
	if (auto part = find(name); part)
		return std::string{part->data};
	return std::nullopt;
}

} // end of namespace shg
