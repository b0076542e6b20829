/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//

#include "Random.hh"

#include <cassert>
#include <limits>
#include <system_error>

#include <openssl/rand.h>
#include <openssl/err.h>

namespace {
template <typename OpenSSLRandomFunction>
inline void open_ssl_rand(void *buf, std::size_t size, OpenSSLRandomFunction&& func)
{
	assert(size <= static_cast<std::size_t>(std::numeric_limits<int>::max()));

	if (func(reinterpret_cast<unsigned char*>(buf), static_cast<int>(size)) != 1)
		throw std::system_error(static_cast<int>(::ERR_get_error()), std::generic_category());
}
}

namespace shg {

void secure_random(void *buf, std::size_t size)
{
	open_ssl_rand(buf, size, ::RAND_priv_bytes);
}

void insecure_random(void *buf, std::size_t size)
{
	open_ssl_rand(buf, size, ::RAND_bytes);
}

} // end of namespace shg
