/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/2/21.
//

#include "Error.hh"

#include <string>

namespace volley {

const std::error_category& volley_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "volley"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::invalid_url: return "malformed URL";
				case Error::unsupported_scheme: return "unsupported URL scheme";
				case Error::tls_setup_failed: return "cannot set up TLS context";
				case Error::encoding_failed: return "cannot encode request";
				case Error::not_executed: return "request was not executed";
				case Error::transport_failure: return "transport failure";
				default: return "unknown error " + std::to_string(ev);
			}
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), volley_error_category());
}

} // end of namespace
