/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//


#include "server/Server.hh"

#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include "config.hh"

#include <boost/exception/diagnostic_information.hpp>

#include <iostream>
#include <cstdlib>

namespace shg {

int StartServer(const Configuration& cfg)
{
	Server server{cfg};
	server.listen();

	Log(LOG_NOTICE, "shingle (version %1%) starting", constants::version);
	server.run();

	Log(LOG_NOTICE, "shingle stopped");
	return EXIT_SUCCESS;
}

} // end of namespace

int main(int argc, char *argv[])
{
	using namespace shg;
	try
	{
		Configuration cfg{argc, argv, ::getenv("SHINGLE_CONFIG")};
		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}

		return StartServer(cfg);
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		return EXIT_FAILURE;
	}
	catch (...)
	{
		Log(LOG_CRIT, "Uncaught unknown exception");
		return EXIT_FAILURE;
	}
}
