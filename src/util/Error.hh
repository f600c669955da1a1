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

#include <system_error>

namespace volley {

enum class Error
{
	ok,
	invalid_url,
	unsupported_scheme,
	tls_setup_failed,
	encoding_failed,
	not_executed,
	transport_failure,

	unknown_error
};

const std::error_category& volley_error_category();
std::error_code make_error_code(Error err);

} // end of namespace volley

namespace std
{
	template <> struct is_error_code_enum<volley::Error> : true_type {};
}
