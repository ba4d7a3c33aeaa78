#pragma once

#include "fmt/format.h"
#include "sat/clause.h"
#include "util/bit_vector.h"
#include <cassert>
#include <span>

namespace dmcr {

class lbool
{
	// 0=undef, 1=true, 2=false
	uint8_t v_ = 0;

  public:
	static constexpr lbool unchecked(uint8_t v)
	{
		lbool b;
		b.v_ = v;
		return b;
	}

	lbool() = default;
	constexpr explicit lbool(bool b) noexcept : v_(1 << !b) {}
	constexpr explicit operator bool() const noexcept { return v_ == 1; }

	constexpr bool operator==(lbool b) const noexcept { return v_ == b.v_; }
	constexpr bool operator!=(lbool b) const noexcept { return v_ != b.v_; }

	constexpr lbool operator|(lbool b) const noexcept
	{
		return unchecked((0b100100010101000100 >> (v_ * 2 + b.v_ * 6)) & 3);
	}

	constexpr lbool operator^(bool b) const noexcept
	{
		return unchecked((0b011000100100 >> (v_ * 2 + b * 6)) & 3);
	}

	constexpr void operator|=(lbool b) noexcept { *this = *this | b; }
};

constexpr lbool lundef = lbool::unchecked(0);
constexpr lbool ltrue = lbool::unchecked(1);
constexpr lbool lfalse = lbool::unchecked(2);

// partial assignment of variables with some convenience functions
class Assignment
{
	// invariant: variables can be un-assgined, but not contradictory
	util::bit_vector assign_;

  public:
	Assignment() = default;

	explicit Assignment(int n) : assign_(2 * size_t(n)) {}

	// number of variables
	int var_count() const noexcept;

	// number of assigned variables
	int assigned_count() const noexcept;

	// set a variable (assuming it was previously unset)
	void set(Lit a) noexcept;

	// returns true if all variables have been assigned
	bool complete() const noexcept;

	// current value of a variable
	lbool operator()(int v) const noexcept;

	// current value of literal/clause
	lbool operator()(Lit a) const noexcept;
	lbool operator()(std::span<const Lit> cl) const noexcept;

	// check if a literal is currently satisfied
	bool satisfied(Lit a) const noexcept;
};

inline int Assignment::var_count() const noexcept
{
	return (int)(assign_.size() / 2);
}

inline int Assignment::assigned_count() const noexcept
{
	return (int)assign_.count();
}

inline void Assignment::set(Lit a) noexcept
{
	assert(a.var() < var_count());
	assert(!assign_[a] && !assign_[a.neg()]);
	assign_[a] = true;
}

inline bool Assignment::complete() const noexcept
{
	return assigned_count() == var_count();
}

inline lbool Assignment::operator()(int v) const noexcept
{
	if (assign_[2 * v])
		return ltrue;
	if (assign_[2 * v + 1])
		return lfalse;
	return lundef;
}

inline lbool Assignment::operator()(Lit a) const noexcept
{
	return (*this)(a.var()) ^ a.sign();
}

// unassigned literals never make a clause true, the empty clause is false
inline lbool Assignment::operator()(std::span<const Lit> cl) const noexcept
{
	auto r = lfalse;
	for (auto a : cl)
		r |= (*this)(a);
	return r;
}

inline bool Assignment::satisfied(Lit a) const noexcept { return assign_[a]; }

} // namespace dmcr

template <> struct fmt::formatter<dmcr::Assignment>
{
	constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

	template <typename FormatContext>
	auto format(dmcr::Assignment const &a, FormatContext &ctx) const
	{
		auto it = ctx.out();
		bool first = true;
		for (int i = 0; i < a.var_count() * 2; ++i)
			if (a.satisfied(dmcr::Lit(i)))
			{
				if (!first)
					*it++ = ' ';
				it = fmt::format_to(it, "{}", dmcr::Lit(i));
				first = false;
			}
		return it;
	}
};
