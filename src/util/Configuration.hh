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

#include "Exception.hh"

#include "client/ExecutorConfig.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/exception/error_info.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <iosfwd>
#include <optional>

namespace volley {

/// \brief  Parsing command line options and configuration file
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	using Path      = boost::error_info<struct tag_path,    std::filesystem::path>;
	using Message   = boost::error_info<struct tag_message, std::string>;

public:
	Configuration(int argc, const char *const *argv, const char *env);

	bool help() const {return m_args.count("help") > 0;}
	bool verbose() const {return m_args.count("verbose") > 0;}
	bool fire_and_forget() const {return m_args.count("fire-and-forget") > 0;}
	std::optional<std::filesystem::path> batch() const;

	const ExecutorConfig& executor() const {return m_executor;}

	void usage(std::ostream& out) const;

	// Apply the settings in a configuration JSON to "cfg". Relative paths
	// are resolved against "base". Keys not present leave "cfg" unchanged.
	static void apply(const nlohmann::json& json, ExecutorConfig& cfg, const std::filesystem::path& base);

private:
	void load_config(const std::filesystem::path& path, bool required);

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	ExecutorConfig m_executor;
};

} // end of namespace
