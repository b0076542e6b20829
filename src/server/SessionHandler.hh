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

#include "Services.hh"

#include "net/BlobResponseBody.hh"
#include "net/Request.hh"
#include "store/ObjectID.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace shg {

class BlobStream;
class RequestTarget;

/// \brief  Handles the HTTP requests of one connection
class SessionHandler
{
public:
	enum class RequestBodyType {string, empty};

	using StringResponseSender = std::function<void(http::response<http::string_body>&&)>;
	using BlobResponseSender   = std::function<void(http::response<BlobResponseBody>&&)>;

	/// The two kinds of response a request may produce
	struct Responder
	{
		StringResponseSender json;
		BlobResponseSender   blob;
		unsigned             version;

		void send(http::status status, const nlohmann::json& body) const;

		/// Failure response with the status of \a ec. An empty message means ec.message().
		void error(std::error_code ec, std::string_view message = {}, nlohmann::json&& details = nullptr) const;
	};

public:
	explicit SessionHandler(const Services& services);

	/// Which body parser to use for the request, and how large the body can be.
	RequestBodyType body_type(const RequestHeader& header) const;
	std::uint64_t body_limit(const RequestHeader& header) const;

	// This function produces an HTTP response for the given
	// request. The type of the response object depends on the
	// contents of the request, so the interface requires the
	// caller to pass a generic lambda for receiving the response.
	template<class Request, class Send>
	void on_request_body(Request&& req, Send&& send);

	void handle(const RequestHeader& header, std::string_view body, Responder&& res);

	static http::response<BlobResponseBody> blob_response(BlobStream&& blob, unsigned version);

private:
	// upload
	void on_init(const RequestHeader& header, std::string_view body, const RequestTarget& target, const Responder& res);
	void on_chunk(const RequestHeader& header, std::string_view body, const RequestTarget& target, const Responder& res);
	void on_complete(const RequestHeader& header, std::string_view body, const RequestTarget& target, const Responder& res);
	void on_status(const RequestTarget& target, const Responder& res);
	void on_batch_upload(const RequestHeader& header, std::string_view body, const RequestTarget& target, const Responder& res);

	// photos
	void on_get_photo(const RequestTarget& target, const Responder& res);
	void on_put_thumbnail(const RequestHeader& header, std::string_view body, const RequestTarget& target, const Responder& res);
	void on_delete_photo(const RequestTarget& target, const Responder& res);

	// files
	void on_get_file(const RequestTarget& target, const Responder& res);
	void on_info(const RequestTarget& target, const Responder& res);
	void on_delete_file(const RequestTarget& target, const Responder& res);
	void on_search(const RequestTarget& target, const Responder& res);
	void on_resolve(const RequestTarget& target, const Responder& res);

	std::string bucket_of(const std::optional<std::string>& requested, std::error_code& ec) const;
	bool chunk_type_allowed(std::string_view mime) const;
	void remove_with_variants(const ObjectID& id, const std::string& bucket, std::error_code& ec);

private:
	Services m_svc;
};

} // end of namespace shg
