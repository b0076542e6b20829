/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <openssl/evp.h>

int main( int argc, char* argv[] )
{
	OpenSSL_add_all_digests();

	return Catch::Session().run(argc, argv);
}
