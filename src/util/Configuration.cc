/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

//
// Created by nestal on 10/9/21.
//

#include "Configuration.hh"

#include "config.hh"

#include <nlohmann/json.hpp>

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace volley {
namespace {

std::filesystem::path resolve(const std::string& path, const std::filesystem::path& base)
{
	std::filesystem::path result{path};
	return result.is_absolute() ? result : (base / result).lexically_normal();
}

std::optional<std::filesystem::path> optional_path(
	const nlohmann::json& json, const char *key, const std::filesystem::path& base
)
{
	if (auto it = json.find(key); it != json.end() && !it->is_null())
		return resolve(it->get<std::string>(), base);
	return std::nullopt;
}

} // end of local namespace

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	m_desc.add_options()
		("help",            "produce help message")
		("cfg",             po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable VOLLEY_CONFIG to set default path.")
		("batch",           po::value<std::string>()->value_name("path"), "JSON file listing the requests to execute")
		("fire-and-forget", "dispatch the requests without waiting for the results")
		("concurrency",     po::value<int>()->value_name("N"), "maximum number of concurrent requests, 0 for unlimited")
		("verbose",         "print log messages to stderr")
	;

	// skip argv[0]
	std::vector<std::string> args;
	if (argc > 1)
		args.assign(argv + 1, argv + argc);

	store(po::command_line_parser(args).options(m_desc).run(), m_args);
	po::notify(m_args);

	// no need for other options when --help is specified
	if (help())
		return;

	// only the built-in default file is allowed to be missing
	auto& cfg = m_args["cfg"];
	load_config(cfg.as<std::string>(), !cfg.defaulted() || env != nullptr);

	if (m_args.count("concurrency") > 0)
		m_executor.set_max_concurrency(m_args["concurrency"].as<int>());
}

std::optional<std::filesystem::path> Configuration::batch() const
{
	if (m_args.count("batch") > 0)
		return m_args["batch"].as<std::string>();
	return std::nullopt;
}

void Configuration::usage(std::ostream &out) const
{
	out << m_desc;
}

void Configuration::load_config(const std::filesystem::path& path, bool required)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			if (!required)
				return;

			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		apply(nlohmann::json::parse(config_file), m_executor, path.parent_path());
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(Error() << Message{e.what()} << Path{path});
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
}

void Configuration::apply(const nlohmann::json& json, ExecutorConfig& cfg, const std::filesystem::path& base)
{
	if (!json.is_object())
		BOOST_THROW_EXCEPTION(Error() << Message{"configuration must be a JSON object"});

	cfg.set_timeouts(
		json.value("connect_timeout", static_cast<int>(cfg.connect_timeout().count())),
		json.value("timeout",         static_cast<int>(cfg.total_timeout().count()))
	);

	if (json.contains("max_concurrency"))
		cfg.set_max_concurrency(json["max_concurrency"].get<int>());
	if (json.contains("user_agent"))
		cfg.set_user_agent(json["user_agent"].get<std::string>());

	if (json.contains("headers"))
	{
		for (auto&& [field, value] : json["headers"].items())
			cfg.set_default_header(field, value.get<std::string>());
	}

	if (json.contains("ssl"))
	{
		auto& ssl = json["ssl"];
		auto tls  = cfg.tls();
		if (auto cert = optional_path(ssl, "cert", base))
			tls.cert = std::move(cert);
		if (auto key = optional_path(ssl, "key", base))
			tls.key = std::move(key);
		if (auto ca = optional_path(ssl, "ca", base))
			tls.ca = std::move(ca);
		tls.verify_peer = ssl.value("verify_peer", tls.verify_peer);
		tls.verify_host = ssl.value("verify_host", tls.verify_host);
		cfg.set_tls(std::move(tls));
	}

	if (json.contains("retry"))
	{
		auto& retry = json["retry"];
		cfg.retry().set(
			retry.value("max_retries", static_cast<int>(cfg.retry().max_retries())),
			retry.value("delay_ms",    static_cast<int>(cfg.retry().delay().count())),
			retry.value("http_codes",  std::vector<int>{})
		);
		cfg.retry().retry_on_network_error(retry.value("network_error", cfg.retry().retry_on_network_error()));
	}

	if (json.contains("body_limit_mb"))
		cfg.set_body_limit(static_cast<std::size_t>(std::max(0.0, json["body_limit_mb"].get<double>()) * 1024 * 1024));
}

} // end of namespace
