#include "CLI/CLI.hpp"
#include "fmt/format.h"
#include "sat/dimacs.h"
#include "util/logging.h"
#include <cstdio>
#include <iostream>

using namespace dmcr;

void setup_check_command(CLI::App &app);

int main(int argc, char *argv[])
{
	CLI::App app{"DIMACS-format Model Checker", "dmcr"};
	app.set_version_flag("-V,--version", DMCR_VERSION);

	// the checker is quiet unless asked otherwise. Anything it logs is a
	// dimacs comment line, so output stays machine readable.
	util::Logger::set_level(util::Logger::Level::warning);

	setup_check_command(app);

	try
	{
		app.parse(argc, argv);
	}
	catch (const CLI::ParseError &e)
	{
		return app.exit(e);
	}
	catch (const IllegalFormat &e)
	{
		fmt::print(stderr, "{}\n", e.what());
		return 1;
	}
	catch (const std::exception &e)
	{
		std::cerr << "Error: " << e.what() << std::endl;
		return -1;
	}

	// every verdict (including 'invalid') is a regular result
	return 0;
}
