/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/3/21.
//

#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace volley {

/// \brief  Absolute http:// or https:// URL split into what the transport needs.
class URL
{
public:
	URL() = default;

	// Returns Error::invalid_url or Error::unsupported_scheme in "ec" on failure.
	static URL parse(std::string_view url, std::error_code& ec);

	const std::string& scheme() const {return m_scheme;}
	const std::string& host() const {return m_host;}
	const std::string& port() const {return m_port;}

	// origin-form request target: path and query, never empty
	const std::string& target() const {return m_target;}

	bool secure() const {return m_scheme == "https";}
	bool default_port() const;

	// value of the Host header field
	std::string host_field() const;

private:
	std::string m_scheme;
	std::string m_host;
	std::string m_port;
	std::string m_target{"/"};
};

} // end of namespace volley
