/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "ApiResponse.hh"

#include "util/Error.hh"

namespace shg {

http::status http_status(std::error_code ec)
{
	if (!ec)
		return http::status::ok;
	if (ec.category() != shg_error_category())
		return http::status::internal_server_error;

	switch (static_cast<Error>(ec.value()))
	{
		case Error::invalid_argument:       return http::status::bad_request;
		case Error::not_found:              return http::status::not_found;
		case Error::incomplete_upload:      return http::status::conflict;
		case Error::already_exists:         return http::status::conflict;
		case Error::too_large:              return http::status::payload_too_large;
		case Error::unsupported_type:       return http::status::unsupported_media_type;
		case Error::storage_full:
		case Error::storage_unavailable:    return http::status::service_unavailable;
		default:                            return http::status::internal_server_error;
	}
}

nlohmann::json success(nlohmann::json&& data, std::string_view message, nlohmann::json&& meta)
{
	nlohmann::json result{
		{"success", true},
		{"data",    std::move(data)}
	};
	if (!message.empty())
		result.emplace("message", std::string{message});
	if (!meta.is_null())
		result.emplace("meta", std::move(meta));
	return result;
}

nlohmann::json failure(std::string_view error, nlohmann::json&& details)
{
	nlohmann::json result{
		{"success", false},
		{"error",   std::string{error}}
	};
	if (!details.is_null())
		result.emplace("details", std::move(details));
	return result;
}

http::response<http::string_body> json_response(http::status status, const nlohmann::json& body, unsigned version)
{
	http::response<http::string_body> res{
		std::piecewise_construct,
		std::make_tuple(body.dump()),
		std::make_tuple(status, version)
	};
	res.set(http::field::content_type, "application/json");
	res.set(http::field::cache_control, "no-store");
	return res;
}

http::response<http::string_body> error_response(std::error_code ec, unsigned version, nlohmann::json&& details)
{
	return json_response(http_status(ec), failure(ec.message(), std::move(details)), version);
}

} // end of namespace shg
