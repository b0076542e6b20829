/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "BlobResponseBody.hh"

namespace shg {

std::uint64_t BlobResponseBody::size(const value_type& body)
{
	return body.size();
}

void BlobResponseBody::writer::init(boost::beast::error_code& ec)
{
	m_next = 0;
	ec = {};
}

boost::optional<std::pair<BlobResponseBody::writer::const_buffers_type, bool>>
BlobResponseBody::writer::get(boost::beast::error_code& ec)
{
	ec = {};

	// skip empty segments, and stop after the last one
	while (m_next < m_body.segment_count())
	{
		auto buf = m_body.segment(m_next++).blob();
		if (buf.size() > 0)
			return {{buf, m_next < m_body.segment_count()}};
	}
	return boost::none;
}

} // end of namespace shg
