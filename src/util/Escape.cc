/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.

    Copyright (C) 1998 - 2017, Daniel Stenberg, <daniel@haxx.se>, et al.
*/

#include "Escape.hh"

namespace {

// Copied from libcurl
// See https://tools.ietf.org/html/rfc3986#section-2.3
bool is_unreserved(unsigned char in)
{
	switch (in)
	{
		case '0': case '1': case '2': case '3': case '4':
		case '5': case '6': case '7': case '8': case '9':
		case 'a': case 'b': case 'c': case 'd': case 'e':
		case 'f': case 'g': case 'h': case 'i': case 'j':
		case 'k': case 'l': case 'm': case 'n': case 'o':
		case 'p': case 'q': case 'r': case 's': case 't':
		case 'u': case 'v': case 'w': case 'x': case 'y': case 'z':
		case 'A': case 'B': case 'C': case 'D': case 'E':
		case 'F': case 'G': case 'H': case 'I': case 'J':
		case 'K': case 'L': case 'M': case 'N': case 'O':
		case 'P': case 'Q': case 'R': case 'S': case 'T':
		case 'U': case 'V': case 'W': case 'X': case 'Y': case 'Z':
		case '-': case '.': case '_': case '~':
			return true;
		default:
			break;
	}
	return false;
}

} // end of local namespace

namespace volley {

std::string url_encode(std::string_view in)
{
	static const char hex[] = "0123456789ABCDEF";

	std::string result;
	result.reserve(in.size());
	for (unsigned char ch : in)
	{
		if (is_unreserved(ch))
			result.push_back(static_cast<char>(ch));
		else
		{
			result.push_back('%');
			result.push_back(hex[ch >> 4]);
			result.push_back(hex[ch & 0x0f]);
		}
	}
	return result;
}

std::string build_query(const std::map<std::string, std::string>& fields)
{
	std::string result;
	for (auto&& [name, value] : fields)
	{
		if (!result.empty())
			result.push_back('&');
		result += url_encode(name);
		result.push_back('=');
		result += url_encode(value);
	}
	return result;
}

std::string append_query(std::string url, const std::map<std::string, std::string>& fields)
{
	if (fields.empty())
		return url;

	// the fragment, if any, must stay at the end
	auto fragment = url.find('#');
	std::string tail;
	if (fragment != url.npos)
	{
		tail = url.substr(fragment);
		url.erase(fragment);
	}

	auto query = url.find('?');
	if (query == url.npos)
		url.push_back('?');
	else if (query + 1 < url.size() && url.back() != '&')
		url.push_back('&');

	return url + build_query(fields) + tail;
}

std::tuple<std::string_view, char> split_front(std::string_view& in, std::string_view value)
{
	// substr() will not throw even if "in" is empty and location==npos
	auto location = in.find_first_of(value);
	auto result   = in.substr(0, location);

	in.remove_prefix(result.size());

	// Remove the matching character, if any
	char match = '\0';
	if (location != in.npos)
	{
		match = in.front();
		in.remove_prefix(1);
	}

	return std::make_tuple(result, match);
}

} // end of volley namespace
