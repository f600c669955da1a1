/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the volley
    distribution for more details.
*/

#include "BatchFile.hh"
#include "client/BeastTransport.hh"
#include "client/Volley.hh"
#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include "config.hh"

#include <boost/exception/diagnostic_information.hpp>
#include <boost/format.hpp>

#include <cstdlib>
#include <iostream>
#include <map>

namespace volley {

int Run(const Configuration& cfg)
{
	auto batch = BatchFile::load(*cfg.batch());

	Volley volley{cfg.executor(), std::make_shared<BeastTransport>()};
	batch.enqueue(volley);

	Log(LOG_NOTICE, "volley (version %1%) executing %2% requests", constants::version, volley.queue_size());

	if (cfg.fire_and_forget())
	{
		volley.fire_and_forget();
		return EXIT_SUCCESS;
	}

	auto results = volley.execute_all();

	// sorted by ID
	bool all_ok = true;
	for (auto&& [id, result] : std::map<std::string, ExecutionResult>{results.begin(), results.end()})
	{
		std::cout << boost::format("%1% %2% %3% %4$.3fs %5%\n")
			% id % result.http_code % (result.success ? "ok" : "FAIL") % result.duration % result.error;
		all_ok = all_ok && result.success;
	}
	return all_ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // end of namespace

int main(int argc, char *argv[])
{
	using namespace volley;
	try
	{
		Configuration cfg{argc, argv, ::getenv("VOLLEY_CONFIG")};
		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}

		open_log("volley", cfg.verbose());
		if (!cfg.batch())
		{
			std::cerr << "missing --batch\n";
			cfg.usage(std::cerr);
			return EXIT_FAILURE;
		}

		return Run(cfg);
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		std::cerr << boost::diagnostic_information(e) << std::endl;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		std::cerr << e.what() << std::endl;
	}
	return EXIT_FAILURE;
}
