#include "check.h"

#include "fmt/format.h"
#include "sat/checker.h"
#include "sat/dimacs.h"
#include "util/logging.h"
#include <filesystem>
#include <fstream>
#include <istream>

namespace dmcr {

namespace {

constexpr const char *RED = "\x1B[001m\x1B[031m";
constexpr const char *GREEN = "\x1B[001m\x1B[032m";
constexpr const char *BLUE = "\x1B[001m\x1B[034m";
constexpr const char *RESET = "\x1B[000m";

SolverOutput read_solution(std::istream &in, std::string const &source)
{
	try
	{
		return parseSolution(in);
	}
	catch (IllegalFormat const &e)
	{
		throw IllegalFormat(
		    fmt::format("{} seems an illegal format file. ({})", source,
		                e.what()));
	}
}

} // namespace

std::string default_assign_path(std::string const &problem)
{
	auto name = std::filesystem::path(problem).filename().string();
	return "ans_" + name;
}

CheckResult run_check(CheckOptions const &opt, std::istream &fallback)
{
	auto log = util::Logger("driver");

	// without color, all escape sequences collapse to nothing
	auto red = opt.color ? RED : "";
	auto green = opt.color ? GREEN : "";
	auto blue = opt.color ? BLUE : "";
	auto reset = opt.color ? RESET : "";

	auto checker = Checker::load(opt.problem);

	auto path = opt.assign.empty() ? default_assign_path(opt.problem)
	                               : opt.assign;
	SolverOutput sol;
	std::string source;
	if (auto file = std::ifstream(path); file)
	{
		log.info("reading assignment from '{}'", path);
		source = path;
		sol = read_solution(file, source);
	}
	else
	{
		log.info("could not open '{}', reading assignment from stdin", path);
		sol = read_solution(fallback, "<stdin>");
	}

	auto result = CheckResult{};
	result.source = source;

	if (sol.status == SolverOutput::Status::unsatisfiable)
	{
		result.verdict = Verdict::unsat_claimed;
		result.message = fmt::format(
		    "{} seems an unsatisfiable problem. I can't handle it.",
		    opt.problem);
		return result;
	}

	if (sol.values.empty())
	{
		result.verdict = Verdict::no_input;
		result.message = "There's no assign file.";
		return result;
	}

	if (!checker.inject_assignment(sol.values))
	{
		result.verdict = Verdict::unsat_without_proof;
		result.message =
		    fmt::format("{}{} seems an unsat problem but no proof.{}", blue,
		                opt.problem, reset);
		return result;
	}

	if (auto cl = checker.validate())
	{
		result.verdict = Verdict::invalid;
		result.message =
		    fmt::format("{}An invalid assignment set for {}{} due to {}.", red,
		                opt.problem, reset, *cl);
	}
	else if (!source.empty())
	{
		result.verdict = Verdict::valid;
		result.message =
		    fmt::format("{}A valid assignment set for {}{} is found in {}",
		                green, opt.problem, reset, source);
	}
	else
	{
		result.verdict = Verdict::valid;
		result.message = fmt::format("{}A valid assignment set for {}.{}",
		                             green, opt.problem, reset);
	}
	return result;
}

} // namespace dmcr
