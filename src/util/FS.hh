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

#include <boost/filesystem.hpp>

#include <system_error>

namespace shg {
namespace fs = boost::filesystem;

// boost::system::error_code -> std::error_code
inline std::error_code to_std(const boost::system::error_code& bec)
{
	return bec ? std::error_code{bec.value(), std::generic_category()} : std::error_code{};
}

/// Flush the directory entry of \a dir to disk, so that a rename() inside it survives a crash.
void sync_directory(const fs::path& dir, std::error_code& ec);

} // end of namespace
