/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//

#include "FS.hh"

#include <fcntl.h>
#include <unistd.h>

namespace shg {

void sync_directory(const fs::path& dir, std::error_code& ec)
{
	auto fd = ::open(dir.string().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
	if (fd < 0)
	{
		ec.assign(errno, std::generic_category());
		return;
	}

	if (::fsync(fd) != 0)
		ec.assign(errno, std::generic_category());
	::close(fd);
}

} // end of namespace
