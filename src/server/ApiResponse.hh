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

#include "net/Request.hh"

#include <nlohmann/json.hpp>

#include <string_view>
#include <system_error>

namespace shg {

/// HTTP status of the error codes returned by the upload and blob operations.
http::status http_status(std::error_code ec);

/// {"success": true, "data": ..., "message": ..., "meta": ...}
/// The message and meta are omitted if empty.
nlohmann::json success(nlohmann::json&& data, std::string_view message = {}, nlohmann::json&& meta = nullptr);

/// {"success": false, "error": ..., "details": ...}
nlohmann::json failure(std::string_view error, nlohmann::json&& details = nullptr);

http::response<http::string_body> json_response(http::status status, const nlohmann::json& body, unsigned version);

/// Failure response with the status and message of an error code.
http::response<http::string_body> error_response(std::error_code ec, unsigned version, nlohmann::json&& details = nullptr);

} // end of namespace shg
