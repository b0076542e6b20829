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

#include "SessionID.hh"

#include "store/BlobInfo.hh"

#include <cstddef>
#include <system_error>
#include <vector>

namespace shg {

class BlobStore;
class SessionRegistry;

/// \brief  Concatenates the chunks of a complete upload session into a blob
class UploadAssembler
{
public:
	UploadAssembler(SessionRegistry& registry, BlobStore& store, unsigned put_retries);

	/// Assemble the session into a blob and remove the session.
	/// Only one of many concurrent calls for the same session can succeed. The
	/// others fail with Error::not_found.
	/// \param  missing     if not null, receives the missing indices when the
	///                     session is incomplete (Error::incomplete_upload)
	/// \return the new blob. On Error::assembly_error the session is kept.
	BlobInfo complete(const SessionID& id, std::error_code& ec, std::vector<std::size_t> *missing = nullptr);

private:
	SessionRegistry&    m_registry;
	BlobStore&          m_store;
	unsigned            m_retries;
};

} // end of namespace shg
