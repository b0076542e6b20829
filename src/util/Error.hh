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

#include <system_error>

namespace shg {

enum class Error
{
	ok,
	invalid_argument,
	not_found,
	incomplete_upload,
	assembly_error,
	storage_unavailable,
	storage_full,
	too_large,
	unsupported_type,
	already_exists,
	redis_command_error,
	redis_field_not_found,

	unknown_error
};

const std::error_category& shg_error_category();
std::error_code make_error_code(Error err);

/// Transient storage errors are worth a bounded retry. Everything else is not.
bool is_transient(std::error_code ec);

} // end of namespace shg

namespace std
{
	template <> struct is_error_code_enum<shg::Error> : true_type {};
}
