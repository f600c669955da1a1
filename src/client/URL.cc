/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/3/21.
//

#include "URL.hh"

#include "util/Error.hh"
#include "util/Escape.hh"

#include <algorithm>
#include <cctype>

namespace volley {
namespace {

bool valid_port(std::string_view port)
{
	if (port.empty() || port.size() > 5)
		return false;
	if (!std::all_of(port.begin(), port.end(), [](unsigned char c){return std::isdigit(c);}))
		return false;

	auto value = std::stoul(std::string{port});
	return value > 0 && value <= 65535;
}

bool valid_host(std::string_view host)
{
	return !host.empty() && std::none_of(host.begin(), host.end(), [](unsigned char c)
	{
		return std::isspace(c) || std::iscntrl(c) || c == '@';
	});
}

} // end of local namespace

URL URL::parse(std::string_view url, std::error_code& ec)
{
	URL result;

	auto scheme_end = url.find("://");
	if (scheme_end == url.npos || scheme_end == 0)
	{
		ec = Error::invalid_url;
		return {};
	}

	result.m_scheme = std::string{url.substr(0, scheme_end)};
	std::transform(result.m_scheme.begin(), result.m_scheme.end(), result.m_scheme.begin(),
		[](unsigned char c){return static_cast<char>(std::tolower(c));}
	);
	if (result.m_scheme != "http" && result.m_scheme != "https")
	{
		ec = Error::unsupported_scheme;
		return {};
	}
	url.remove_prefix(scheme_end + 3);

	// drop the fragment: it is never sent to the server
	url = url.substr(0, url.find('#'));

	auto [authority, delim] = split_front(url, "/?");

	// bracketed IPv6 literal, e.g. [::1]:8080
	std::string_view port;
	if (!authority.empty() && authority.front() == '[')
	{
		auto close = authority.find(']');
		if (close == authority.npos)
		{
			ec = Error::invalid_url;
			return {};
		}
		result.m_host = std::string{authority.substr(1, close - 1)};
		auto rest = authority.substr(close + 1);
		if (!rest.empty())
		{
			if (rest.front() != ':')
			{
				ec = Error::invalid_url;
				return {};
			}
			port = rest.substr(1);
		}
	}
	else
	{
		auto [host, colon] = split_front(authority, ":");
		result.m_host = std::string{host};
		if (colon == ':')
			port = authority;
	}

	if (!valid_host(result.m_host))
	{
		ec = Error::invalid_url;
		return {};
	}

	if (port.empty())
		result.m_port = result.secure() ? "443" : "80";
	else if (valid_port(port))
		result.m_port = std::string{port};
	else
	{
		ec = Error::invalid_url;
		return {};
	}

	if (delim == '/')
		result.m_target = "/" + std::string{url};
	else if (delim == '?')
		result.m_target = "/?" + std::string{url};

	if (result.m_target.find_first_of(" \r\n\t") != result.m_target.npos)
	{
		ec = Error::invalid_url;
		return {};
	}

	ec.clear();
	return result;
}

bool URL::default_port() const
{
	return secure() ? m_port == "443" : m_port == "80";
}

std::string URL::host_field() const
{
	auto host = m_host.find(':') != m_host.npos ? "[" + m_host + "]" : m_host;
	return default_port() ? host : host + ":" + m_port;
}

} // end of namespace volley
