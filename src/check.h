#pragma once

#include <iosfwd>
#include <string>

namespace dmcr {

enum class Verdict
{
	valid,
	invalid,
	unsat_claimed,       // solver said 's UNSATISFIABLE', nothing to check
	unsat_without_proof, // assignment contradicts a unit clause
	no_input,
};

struct CheckOptions
{
	std::string problem; // CNF file
	std::string assign;  // solver output. empty means 'ans_<problem>'
	bool color = true;
};

struct CheckResult
{
	Verdict verdict;
	std::string message; // one line, no trailing newline

	// where the assignment was read from ("" for the fallback stream)
	std::string source;
};

// 'ans_<basename>' in the current directory
std::string default_assign_path(std::string const &problem);

// Check the assignment for 'opt.problem'. The assignment is read from
// 'opt.assign' (or its default), or from 'fallback' if that can not be
// opened. Throws on I/O and format errors.
CheckResult run_check(CheckOptions const &opt, std::istream &fallback);

} // namespace dmcr
