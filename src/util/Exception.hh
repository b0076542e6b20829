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

#include <boost/exception/exception.hpp>
#include <boost/exception/error_info.hpp>

#include <boost/asio/ip/tcp.hpp>

#include <string>
#include <system_error>

namespace shg {

struct Exception : virtual boost::exception, virtual std::exception
{
	const char* what() const noexcept override ;
};

/// Start-up failures of the OS resources the server needs: the listening socket
/// and the blob directory.
struct SystemError : virtual Exception {};

using ErrorCode = boost::error_info<struct tag_error_code, std::error_code>;
using Endpoint  = boost::error_info<struct tag_endpoint,   boost::asio::ip::tcp::endpoint>;
using Location  = boost::error_info<struct tag_location,   std::string>;

} // end of namespace
