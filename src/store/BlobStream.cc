/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "BlobStream.hh"

#include <algorithm>
#include <cstring>

namespace shg {

BlobStream::BlobStream(BlobInfo info, std::vector<MMap>&& segments) :
	m_info{std::move(info)}, m_segments{std::move(segments)}
{
	for (auto&& seg : m_segments)
		seg.sequential();
}

std::size_t BlobStream::read(void *buf, std::size_t size)
{
	auto out = static_cast<char*>(buf);
	std::size_t count = 0;
	while (count < size && m_seg < m_segments.size())
	{
		auto seg = m_segments[m_seg].string();
		auto n = std::min(size - count, seg.size() - m_seg_pos);
		std::memcpy(out + count, seg.data() + m_seg_pos, n);

		count     += n;
		m_seg_pos += n;
		if (m_seg_pos == seg.size())
		{
			m_seg++;
			m_seg_pos = 0;
		}
	}
	m_pos += count;
	return count;
}

std::size_t StringSource::read(void *buf, std::size_t size, std::error_code& ec)
{
	auto n = std::min(size, m_remain.size());
	std::memcpy(buf, m_remain.data(), n);
	m_remain.remove_prefix(n);
	ec.clear();
	return n;
}

} // end of namespace shg
