/**
 * Basic definitions and Clause Storage.
 */

#pragma once

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "util/vector.h"
#include <cassert>
#include <cstdint>
#include <iterator>
#include <memory>
#include <span>
#include <stdexcept>

namespace dmcr {

// A literal is a variable number + sign.
// Variables are 0-based internally, 1-based in dimacs.
class Lit
{
	uint32_t val_;

  public:
	// largest number of variables. Keeps '2 * var_count' inside of an int
	static constexpr int max_var() { return (1 << 30) - 1; }

	// constructors
	Lit() = default;
	explicit constexpr Lit(uint32_t val) : val_(val) {}
	constexpr Lit(int var, bool s) : val_(2 * var + (s ? 1 : 0)) {}

	// basic accesors and properties
	constexpr operator int() const { return (int)val_; }
	constexpr int var() const { return val_ >> 1; }
	constexpr bool sign() const { return (val_ & 1) != 0; }
	constexpr bool proper() const { return (int32_t)val_ >= 0; }

	// IO in dimacs convention
	constexpr static Lit fromDimacs(int x)
	{
		return Lit(x > 0 ? 2 * x - 2 : -2 * x - 1);
	}
	constexpr int toDimacs() const { return sign() ? -var() - 1 : var() + 1; }

	// misc
	constexpr bool operator==(Lit b) const { return val_ == b.val_; }
	constexpr Lit neg() const { return Lit(val_ ^ 1); }
};

class Clause
{
	// 4 byte header, literals follow directly after it
	uint32_t size_;

  public:
	Clause(const Clause &) = delete;
	Clause &operator=(const Clause &) = delete;

	explicit Clause(size_t size) : size_((uint32_t)size) {}

	// array-like access to literals
	std::span<Lit> lits() { return std::span<Lit>{(Lit *)(this + 1), size()}; }
	std::span<const Lit> lits() const
	{
		return std::span<const Lit>{(Lit *)(this + 1), size()};
	}

	// make Clause usable as span<Lit> without calling '.lits()' explicitly
	uint32_t size() const { return size_; }
	bool empty() const { return size_ == 0; }
	Lit &operator[](size_t i) { return lits()[i]; }
	Lit operator[](size_t i) const { return lits()[i]; }
	operator std::span<Lit>() { return lits(); }
	operator std::span<const Lit>() const { return lits(); }
	auto begin() { return lits().begin(); }
	auto begin() const { return lits().begin(); }
	auto end() { return lits().end(); }
	auto end() const { return lits().end(); }

	// pointer to next clause, assuming dense storage in 'ClauseStorage'
	Clause *next() { return (Clause *)((Lit *)(this + 1) + size_); }
	Clause const *next() const
	{
		return (Clause const *)((Lit const *)(this + 1) + size_);
	}
};

// iterator that advances by calling 'p->next()'.
template <class T> class NextIterator
{
	T *ptr_;

  public:
	using value_type = T;
	using reference = T &;
	using pointer = T *;
	using difference_type = ptrdiff_t;

	NextIterator() = default;
	NextIterator(T *ptr) : ptr_(ptr) {}
	NextIterator &operator++()
	{
		ptr_ = ptr_->next();
		return *this;
	}
	NextIterator operator++(int)
	{
		auto tmp = *this;
		ptr_ = ptr_->next();
		return tmp;
	}
	T &operator*() const { return *ptr_; }
	T *operator->() const { return ptr_; }
	constexpr bool operator==(NextIterator const &) const = default;
};

static_assert(std::forward_iterator<NextIterator<Clause>>);
static_assert(std::forward_iterator<NextIterator<Clause const>>);

// Reference to a clause inside a ClauseStorage object.
// Technically just an index into the literal arena.
class CRef
{
	uint32_t _val = 0;

  public:
	CRef() = default;
	constexpr explicit CRef(uint32_t val) : _val(val) {}

	static constexpr uint32_t max() { return UINT32_MAX >> 2; }

	constexpr operator uint32_t() const { return _val; }
};

// All clauses of a problem in one contiguous arena. Clauses are kept in the
// order they were added, so iteration order is the order of the input file.
class ClauseStorage
{
	util::vector<Lit> store_;
	size_t count_ = 0;

  public:
	using iterator = NextIterator<Clause>;
	using const_iterator = NextIterator<Clause const>;

	iterator begin() { return (Clause *)store_.begin(); }
	iterator end() { return (Clause *)store_.end(); }
	const_iterator begin() const { return (Clause *)store_.begin(); }
	const_iterator end() const { return (Clause *)store_.end(); }

	// index of a clause in the store
	CRef get_index(Clause const &cl) const
	{
		auto p = ptrdiff_t(&cl);
		auto start = ptrdiff_t(store_.begin());
		auto end = ptrdiff_t(store_.end());
		assert(start <= p && p <= end);
		return CRef((uint32_t)((p - start) / sizeof(Lit)));
	}

	// add a new clause, no checking of lits done
	CRef add_clause(std::span<const Lit> lits)
	{
		// allocate space for the new clause
		store_.reserve_with_spare(store_.size() + lits.size() +
		                          sizeof(Clause) / sizeof(Lit));
		if (store_.size() > CRef::max())
			throw std::runtime_error("clause storage overflow");
		auto r = CRef((uint32_t)store_.size());
		Clause &cl = *(Clause *)(store_.end());
		store_.set_size_unsafe(store_.size() + lits.size() +
		                       sizeof(Clause) / sizeof(Lit));

		// copy it over
		std::construct_at<Clause>(&cl, lits.size());
		for (size_t i = 0; i < lits.size(); ++i)
			cl[i] = lits[i];

		++count_;
		return r;
	}

	Clause &operator[](CRef i) { return *(Clause *)&store_[i]; }
	const Clause &operator[](CRef i) const { return *(Clause *)&store_[i]; }

	// number of clauses
	size_t count() const { return count_; }
	bool empty() const { return count_ == 0; }

	size_t memory_usage() const { return store_.capacity() * sizeof(Lit); }
};

static_assert(sizeof(Lit) == 4);
static_assert(sizeof(Clause) % sizeof(Lit) == 0);

} // namespace dmcr

template <> struct fmt::formatter<dmcr::Lit>
{
	constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

	template <typename FormatContext>
	auto format(dmcr::Lit a, FormatContext &ctx) const
	{
		assert(a.proper());
		return fmt::format_to(ctx.out(), "{}", a.toDimacs());
	}
};

// formats as '{1, -2, 3}', the way diagnostics quote an offending clause
template <> struct fmt::formatter<dmcr::Clause>
{
	constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

	template <typename FormatContext>
	auto format(dmcr::Clause const &cl, FormatContext &ctx) const
	{
		return fmt::format_to(ctx.out(), "{{{}}}", fmt::join(cl.lits(), ", "));
	}
};
