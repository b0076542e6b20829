/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "SessionID.hh"

#include "crypto/Random.hh"
#include "util/Escape.hh"

namespace shg {

SessionID random_session_id()
{
	return secure_random_array<unsigned char, SessionID{}.size()>();
}

std::optional<SessionID> parse_session_id(std::string_view hex)
{
	return hex_to_array<SessionID{}.size()>(hex);
}

} // end of namespace shg
