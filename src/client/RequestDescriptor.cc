/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/3/21.
//

#include "RequestDescriptor.hh"

#include <algorithm>
#include <cctype>

namespace volley {

RequestDescriptor::RequestDescriptor(
	std::string id,
	std::string url,
	std::string_view method,
	RequestBody body,
	Headers headers,
	Options options
) :
	m_id{std::move(id)},
	m_url{std::move(url)},
	m_method{normalize_method(method)},
	m_body{std::move(body)},
	m_headers{std::move(headers)},
	m_options{std::move(options)}
{
}

std::optional<std::string> RequestDescriptor::option(const std::string& key) const
{
	auto it = m_options.find(key);
	return it != m_options.end() ? std::optional<std::string>{it->second} : std::nullopt;
}

std::string RequestDescriptor::normalize_method(std::string_view method)
{
	if (method.empty())
		return "GET";

	std::string result{method};
	std::transform(result.begin(), result.end(), result.begin(),
		[](unsigned char c){return static_cast<char>(std::toupper(c));}
	);
	return result;
}

} // end of namespace volley
