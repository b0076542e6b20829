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

#include "store/BlobStream.hh"

#include <boost/beast/http/message.hpp>
#include <boost/optional.hpp>

#include <cstdint>
#include <utility>

namespace shg {

/// \brief  Beast body that sends a BlobStream one segment at a time
/// The segments are memory-mapped, so the whole blob is never copied into memory.
class BlobResponseBody
{
public:
	using value_type = BlobStream;

	static std::uint64_t size(const value_type& body);

	class writer
	{
	public:
		using const_buffers_type = boost::asio::const_buffer;

		template<bool isRequest, class Fields>
		explicit
		writer(boost::beast::http::header<isRequest, Fields> const&, value_type const& body)
			: m_body(body)
		{
		}

		void init(boost::beast::error_code& ec);

		boost::optional<std::pair<const_buffers_type, bool>>
		get(boost::beast::error_code& ec);

	private:
		const value_type& m_body;
		std::size_t m_next{0};
	};
};

} // end of namespace shg
