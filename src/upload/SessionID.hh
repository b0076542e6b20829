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

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace shg {

/// Opaque identifier of an upload session, the "fileId" known by clients.
using SessionID = std::array<unsigned char, 16>;

SessionID random_session_id();
std::optional<SessionID> parse_session_id(std::string_view hex);

} // end of namespace shg
