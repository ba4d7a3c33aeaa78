#include "CLI/CLI.hpp"
#include "check.h"
#include "fmt/format.h"
#include "util/logging.h"
#include <iostream>

using namespace dmcr;

namespace {

struct Options
{
	std::string problem, assign;
	bool noColor = false;
};

void run_check_command(const Options &opt)
{
	auto check = CheckOptions{};
	check.problem = opt.problem;
	check.assign = opt.assign;
	check.color = !opt.noColor;

	auto result = run_check(check, std::cin);
	fmt::print("{}\n", result.message);
}

} // namespace

void setup_check_command(CLI::App &app)
{
	auto opt = std::make_shared<Options>();

	// input
	app.add_option("problem", opt->problem, "a CNF file")
	    ->required()
	    ->check(CLI::ExistingFile)
	    ->type_name("<problem>");
	app.add_option("-a,--assign", opt->assign,
	               "an assign file generated by a SAT solver (default: "
	               "'ans_<problem>', then stdin)")
	    ->type_name("<assign>");

	// output
	app.add_flag("-C,--no-color", opt->noColor, "disable colorized output");

	// verbosity
	auto g = "Verbosity";
	app.add_flag_function(
	       "--verbose",
	       [](int64_t) { util::Logger::set_level(util::Logger::Level::info); },
	       "log what is read and checked")
	    ->group(g);
	app.add_option("--debug", "increase verbosity of some component (reader, "
	                          "parser, solution, checker, driver)")
	    ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll)
	    ->each([](std::string s) {
		    util::Logger::set_level(s, util::Logger::Level::debug);
	    })
	    ->group(g);

	app.callback([opt]() { run_check_command(*opt); });
}
