#pragma once

#include "sat/assignment.h"
#include "sat/clause.h"
#include "util/logging.h"
#include <span>
#include <string>
#include <vector>

namespace dmcr {

// A CNF problem together with a candidate assignment to check against it.
//   - clauses are kept exactly as written in the input, in input order
//   - unit clauses of the problem are bound before the candidate assignment,
//     so variables they fix count as assigned during validation
class Checker
{
	int varCount_;
	ClauseStorage clauses_;
	std::vector<Lit> units_; // unit clauses, in input order
	Assignment assign_;
	util::Logger log_ = util::Logger("checker");

  public:
	Checker(ClauseStorage clauses, int varCount);

	// load a problem in dimacs format. filename = "" means stdin
	static Checker load(std::string const &filename);

	// problems are never copied, only moved into place
	Checker(Checker const &) = delete;
	Checker &operator=(Checker const &) = delete;
	Checker(Checker &&) = default;
	Checker &operator=(Checker &&) = default;

	int var_count() const noexcept { return varCount_; }
	ClauseStorage const &clauses() const noexcept { return clauses_; }
	Assignment const &assignment() const noexcept { return assign_; }

	// Bind a candidate assignment (dimacs literals) to the variables,
	// replacing any previous one. Returns false if it contradicts a unit
	// clause of the problem (or itself). Throws on literals outside of the
	// problem's variable range.
	bool inject_assignment(std::span<const int> lits);

	// First clause not satisfied by the current assignment, nullptr if all
	// are satisfied. Unassigned variables never satisfy a literal.
	Clause const *validate() const;
};

} // namespace dmcr
