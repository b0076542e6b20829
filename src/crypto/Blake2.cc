/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//

#include "Blake2.hh"

namespace shg {

Blake2::Blake2()
{
	::EVP_DigestInit_ex(m_ctx.get(), ::EVP_blake2s256(), nullptr);
}

void Blake2::update(const void *data, std::size_t len)
{
	::EVP_DigestUpdate(m_ctx.get(), data, len);
}

std::array<unsigned char, Blake2::size> Blake2::finalize()
{
	std::array<unsigned char, Blake2::size> result{};
	unsigned len = result.size();
	::EVP_DigestFinal_ex(m_ctx.get(), &result[0], &len);
	return result;
}

void Blake2::Deleter::operator()(::EVP_MD_CTX *ctx)
{
	if (ctx)
		::EVP_MD_CTX_free(ctx);
}

} // end of namespace shg
