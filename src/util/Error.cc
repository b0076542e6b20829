/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//

#include "Error.hh"

#include <cerrno>
#include <string>

namespace shg {

const std::error_category& shg_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "shingle"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::invalid_argument: return "invalid argument";
				case Error::not_found: return "not found";
				case Error::incomplete_upload: return "incomplete upload";
				case Error::assembly_error: return "assembly error";
				case Error::storage_unavailable: return "storage unavailable";
				case Error::storage_full: return "storage full";
				case Error::too_large: return "too large";
				case Error::unsupported_type: return "unsupported content type";
				case Error::already_exists: return "object already exists";
				case Error::redis_command_error: return "redis command error";
				case Error::redis_field_not_found: return "redis field not found";
				default: return "unknown error " + std::to_string(ev);
			}
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), shg_error_category());
}

bool is_transient(std::error_code ec)
{
	if (ec == Error::storage_unavailable)
		return true;

	if (ec.category() == std::generic_category() || ec.category() == std::system_category())
	{
		switch (ec.value())
		{
			case EINTR: case EAGAIN: case EIO: case EBUSY:
				return true;
			default:
				break;
		}
	}
	return false;
}

} // end of namespace
