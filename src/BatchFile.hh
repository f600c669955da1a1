/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/9/21.
//

#pragma once

#include "util/Exception.hh"

#include <boost/exception/error_info.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace volley {

class Volley;

/// \brief  A list of requests loaded from a JSON array.
///
/// Each entry is an object with "id" and "url" and optionally "method",
/// "headers", "options" and one of the body keys "query", "form",
/// "multipart", "raw" or "json". The body key decides which Volley::add_*()
/// function queues the request. "method" and "options" are only accepted
/// without "query", "form", "multipart" and "raw", because those entries
/// go through add_get() and the add_post_*() functions.
class BatchFile
{
public:
	struct Error : virtual Exception {};
	using Index   = boost::error_info<struct tag_index,   std::size_t>;
	using Path    = boost::error_info<struct tag_path,    std::filesystem::path>;
	using Message = boost::error_info<struct tag_message, std::string>;

public:
	// Relative multipart file paths are resolved against "base".
	explicit BatchFile(nlohmann::json entries, std::filesystem::path base = {});

	// Relative multipart file paths are resolved against the directory of
	// the batch file.
	static BatchFile load(const std::filesystem::path& path);

	std::size_t size() const {return m_entries.size();}

	// Queue all requests in "volley".
	void enqueue(Volley& volley) const;

private:
	static void check(const nlohmann::json& entry);

private:
	nlohmann::json          m_entries;
	std::filesystem::path   m_base;
};

} // end of namespace
