/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "UploadAssembler.hh"
#include "ChunkSpill.hh"
#include "SessionRegistry.hh"

#include "store/BlobStore.hh"
#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

#include <boost/beast/core/file_posix.hpp>

#include <mutex>

namespace shg {
namespace {

/// Reads the chunk files of a session one after another, in index order.
class ChunkSource : public BlobSource
{
public:
	ChunkSource(const fs::path& dir, std::size_t total) : m_dir{dir}, m_total{total} {}

	std::size_t read(void *buf, std::size_t size, std::error_code& ec) override
	{
		boost::system::error_code bec;
		while (m_index < m_total)
		{
			if (!m_file.is_open())
			{
				m_file.open(ChunkSpill::chunk_path(m_dir, m_index).string().c_str(), boost::beast::file_mode::scan, bec);
				if (bec)
					break;
			}

			auto count = m_file.read(buf, size, bec);
			if (bec)
				break;

			if (count > 0)
			{
				m_count += count;
				return count;
			}

			// end of this chunk
			m_file.close(bec);
			m_index++;
		}

		if (bec)
		{
			Log(LOG_WARNING, "cannot read chunk %1% in %2% (%3%)", m_index, m_dir, bec.message());
			ec = to_std(bec);
		}
		return 0;
	}

	[[nodiscard]] std::size_t count() const {return m_count;}

private:
	fs::path    m_dir;
	std::size_t m_total;

	std::size_t m_index{0};
	std::size_t m_count{0};
	boost::beast::file_posix m_file;
};

} // end of local namespace

UploadAssembler::UploadAssembler(SessionRegistry& registry, BlobStore& store, unsigned put_retries) :
	m_registry{registry}, m_store{store}, m_retries{put_retries}
{
}

BlobInfo UploadAssembler::complete(const SessionID& id, std::error_code& ec, std::vector<std::size_t> *missing)
{
	auto session = m_registry.find(id, ec);
	if (!session)
		return {};

	// only one caller can pass this point at a time
	std::unique_lock lock{session->mutex()};
	if (session->closed())
	{
		ec = Error::not_found;
		return {};
	}

	if (auto holes = session->missing(); !holes.empty())
	{
		ec = Error::incomplete_upload;
		if (missing)
			*missing = std::move(holes);
		return {};
	}

	auto expected = session->bytes();
	BlobInfo blob;
	for (unsigned attempt = 0; attempt <= m_retries; attempt++)
	{
		ChunkSource src{session->dir(), session->total()};
		blob = m_store.put(src, session->target(), ec);

		if (!ec && (src.count() != expected || blob.size != expected))
		{
			Log(LOG_ERR, "upload %1%: assembled %2% bytes but the chunks have %3% bytes",
				to_hex(id), blob.size, expected);

			std::error_code rm_ec;
			m_store.remove(blob.id, blob.bucket, rm_ec);
			if (rm_ec)
				Log(LOG_WARNING, "cannot remove the inconsistent blob %1%: %2%", blob.id, rm_ec.message());
			ec = Error::assembly_error;
			return {};
		}

		if (!ec || !is_transient(ec))
			break;

		Log(LOG_WARNING, "upload %1%: cannot store assembled blob (%2%), attempt %3% of %4%",
			to_hex(id), ec.message(), attempt + 1, m_retries + 1);
	}

	if (ec)
	{
		Log(LOG_ERR, "upload %1%: assembly failed: %2%. The session is kept for retrying.", to_hex(id), ec.message());
		ec = Error::assembly_error;
		return {};
	}

	std::error_code discard_ec;
	m_registry.discard(*session, discard_ec);
	if (discard_ec)
		Log(LOG_WARNING, "upload %1%: cannot remove its chunks: %2%", to_hex(id), discard_ec.message());
	Log(LOG_INFO, "upload %1% assembled into blob %2% (%3% bytes in %4% chunks)", to_hex(id), blob.id, blob.size, session->total());
	return blob;
}

} // end of namespace shg
