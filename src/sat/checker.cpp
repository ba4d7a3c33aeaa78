#include "sat/checker.h"

#include "fmt/format.h"
#include "sat/dimacs.h"
#include <stdexcept>

namespace dmcr {

Checker::Checker(ClauseStorage clauses, int varCount)
    : varCount_(varCount), clauses_(std::move(clauses)), assign_(varCount)
{
	for (auto &cl : clauses_)
		if (cl.size() == 1)
			units_.push_back(cl[0]);
	log_.debug("{} vars, {} clauses, {} units, {:.2f} MiB of clause storage",
	           varCount_, clauses_.count(), units_.size(),
	           clauses_.memory_usage() / 1024. / 1024.);
}

Checker Checker::load(std::string const &filename)
{
	auto [clauses, varCount] = parseCnf(filename);
	return Checker(std::move(clauses), varCount);
}

bool Checker::inject_assignment(std::span<const int> lits)
{
	assign_ = Assignment(varCount_);

	// root level: the units of the problem itself
	for (Lit a : units_)
	{
		if (assign_.satisfied(a.neg()))
		{
			log_.info("unit clauses {} and {} contradict each other", a,
			          a.neg());
			return false;
		}
		if (!assign_.satisfied(a))
			assign_.set(a);
	}

	for (int x : lits)
	{
		if (x == 0 || x > varCount_ || x < -varCount_)
			throw std::runtime_error(
			    fmt::format("invalid literal in assignment: {} (problem has "
			                "{} variables)",
			                x, varCount_));
		auto a = Lit::fromDimacs(x);
		if (assign_.satisfied(a.neg()))
		{
			log_.info("literal {} contradicts an earlier binding of {}", a,
			          a.neg());
			return false;
		}
		if (!assign_.satisfied(a))
			assign_.set(a);
	}

	if (!assign_.complete())
		log_.info("partial assignment: {} of {} variables assigned",
		          assign_.assigned_count(), varCount_);
	log_.debug("bound assignment: {}", assign_);
	return true;
}

Clause const *Checker::validate() const
{
	for (auto &cl : clauses_)
		if (assign_(cl) != ltrue)
		{
			log_.debug("clause {} at index {} is not satisfied", cl,
			           (uint32_t)clauses_.get_index(cl));
			return &cl;
		}
	return nullptr;
}

} // namespace dmcr
