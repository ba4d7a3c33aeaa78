#pragma once

#include "sat/clause.h"
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dmcr {

/** filename = "" means reading from stdin */
std::pair<ClauseStorage, int> parseCnf(std::string filename);

/** same as parseCnf, but from a string in memory */
std::pair<ClauseStorage, int> parseCnfString(std::string content);

// thrown when solver output contains a line that is neither comment, status
// nor value line
class IllegalFormat : public std::runtime_error
{
  public:
	using std::runtime_error::runtime_error;
};

// what a SAT solver printed about a problem
struct SolverOutput
{
	enum class Status
	{
		unknown,        // no 's' line seen
		satisfiable,    // 's SATISFIABLE'
		unsatisfiable,  // 's UNSATISFIABLE', nothing after it is read
	};

	Status status = Status::unknown;

	// literals of the 'v' lines in dimacs numbering, without the final '0'.
	// empty if no 'v' line was found
	std::vector<int> values;
};

/**
 * Read solver output ('c', 's' and 'v' lines). Consecutive 'v' lines are
 * joined until a '0' is found.
 * Throws IllegalFormat on unexpected lines and std::runtime_error on
 * non-integer values.
 */
SolverOutput parseSolution(std::istream &in);

} // namespace dmcr
