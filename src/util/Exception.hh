/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/2/21.
//

#pragma once

#include <boost/exception/exception.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/exception/info.hpp>

#include <string>
#include <system_error>

namespace volley {

struct Exception : virtual boost::exception, virtual std::exception
{
	const char* what() const noexcept override ;
};

using ErrorCode = boost::error_info<struct tag_error_code, std::error_code>;

} // end of namespace
