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

#include "SessionHandler.hh"

#include <utility>

namespace shg {

namespace detail {
inline std::string_view body_of(const StringRequest& req) {return req.body();}
inline std::string_view body_of(const EmptyRequest&) {return {};}
}

template<class Request, class Send>
void SessionHandler::on_request_body(Request&& req, Send&& send)
{
	Responder res{
		[send](http::response<http::string_body>&& r) mutable {send(std::move(r));},
		[send](http::response<BlobResponseBody>&& r) mutable {send(std::move(r));},
		req.version()
	};
	handle(req, detail::body_of(req), std::move(res));
}

} // end of namespace shg
