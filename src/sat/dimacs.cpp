#include "sat/dimacs.h"

#include "util/io.h"
#include "util/logging.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <cstring>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace dmcr {

namespace {

// Custom text parser
class Parser
{
	std::string content;
	size_t pos = 0;

  public:
	Parser(const Parser &) = delete;
	Parser &operator=(const Parser &) = delete;

	explicit Parser(std::string content_) : content(std::move(content_)) {}

	inline char operator*() { return pos < content.size() ? content[pos] : 0; }

	inline void operator++() { ++pos; }

	inline int parseInt()
	{
		int r = 0;
		int s = 1;
		if (**this == '-')
		{
			s = -1;
			++*this;
		}

		if (!isdigit((unsigned char)**this))
			throw std::runtime_error("unexpected character (not a digit)");

		while (isdigit((unsigned char)**this))
		{
			int d = **this - '0';
			++*this;
			if (r > (INT_MAX - d) / 10)
				throw std::runtime_error("integer overflow while parsing CNF");
			r = 10 * r + d;
		}
		return r * s;
	}

	std::string parseString()
	{
		std::string r;
		if (!isalpha((unsigned char)**this))
			throw std::runtime_error("unexpected character (not an alphabet)");
		while (isalpha((unsigned char)**this))
		{
			r += **this;
			++*this;
		}
		return r;
	}

	/** skip whitespace (including newlines) */
	inline void skipWhite()
	{
		while (isspace((unsigned char)**this))
			++*this;
	}

	/** advances the stream to the next line */
	inline void skipLine()
	{
		while (**this != 0 && **this != '\n')
			++*this;
		if (**this == '\n')
			++*this;
	}
};

std::string read_input(std::string const &filename)
{
	auto log = util::Logger("reader");
	std::string content;
	if (!filename.empty())
	{
		content = util::read_file(filename);
		log.info("read {:.2f} MiB from '{}'", content.size() / 1024. / 1024,
		         filename);
	}
	else
	{
		std::istreambuf_iterator<char> begin(std::cin), end;
		content = std::string(begin, end);
		if (std::cin.bad())
			throw std::runtime_error("failed to read from stdin");
		log.info("read {:.2f} MiB from stdin", content.size() / 1024. / 1024);
	}
	return content;
}

// strict signed integer, as printed on 'v' lines. A leading '+' is allowed.
int parseValue(std::string_view tok)
{
	auto s = tok;
	if (s.size() > 1 && s[0] == '+' && s[1] != '-')
		s.remove_prefix(1);
	int x = 0;
	auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), x);
	if (ec != std::errc() || ptr != s.data() + s.size())
		throw std::runtime_error(
		    fmt::format("invalid value '{}' in assignment", tok));
	return x;
}

bool isBlank(std::string_view line)
{
	for (char c : line)
		if (!isspace((unsigned char)c))
			return false;
	return true;
}

} // namespace

std::pair<ClauseStorage, int> parseCnf(std::string filename)
{
	return parseCnfString(read_input(filename));
}

std::pair<ClauseStorage, int> parseCnfString(std::string content)
{
	auto parser = Parser(std::move(content));
	auto log = util::Logger("parser");
	ClauseStorage clauses;

	int headerVarCount = -1;
	int headerClauseCount = -1;
	int varCount = 0;
	int clauseCount = 0;
	std::vector<Lit> clause;
	while (true)
	{
		parser.skipWhite();

		// end of file
		if (*parser == 0)
			break;

		// comment lines
		else if (*parser == 'c')
		{
			parser.skipLine();
			continue;
		}

		// header in format 'p cnf <varCount> <clauseCount>'
		else if (*parser == 'p')
		{
			++parser;
			parser.skipWhite();
			if (parser.parseString() != "cnf")
				throw std::runtime_error("invalid 'p' line");
			if (headerVarCount != -1 || headerClauseCount != -1)
				throw std::runtime_error("duplicate 'p' line");
			parser.skipWhite();
			headerVarCount = parser.parseInt();
			parser.skipWhite();
			headerClauseCount = parser.parseInt();
			if (headerVarCount < 0 || headerClauseCount < 0)
				throw std::runtime_error("negative count in 'p' line");
			if (headerVarCount > Lit::max_var())
				throw std::runtime_error("too many variables in 'p' line");
			continue;
		}

		// integer
		else if (isdigit((unsigned char)*parser) || *parser == '-')
		{
			auto x = parser.parseInt();
			if (x == 0)
			{
				clauseCount++;
				clauses.add_clause(clause);
				clause.resize(0);
			}
			else
			{
				if (x > Lit::max_var() || x < -Lit::max_var())
					throw std::runtime_error(
					    fmt::format("variable out of range: {}", x));
				auto lit = Lit::fromDimacs(x);
				varCount = std::max(varCount, lit.var() + 1);
				clause.push_back(lit);
			}
			continue;
		}

		else
			throw std::runtime_error(std::string("unexpected character: '") +
			                         *parser + "'");
	}

	if (!clause.empty())
		throw std::runtime_error("incomplete clause at end of file");

	// there might be unused variables. In that case, respect the header
	if (headerVarCount > varCount)
		varCount = headerVarCount;

	if (headerVarCount != -1 && headerVarCount != varCount)
		throw std::runtime_error(
		    fmt::format("wrong number of variables: header said {}, "
		                "actually got {}",
		                headerVarCount, varCount));
	if (headerClauseCount != -1 && headerClauseCount != clauseCount)
		throw std::runtime_error(
		    fmt::format("wrong number of clauses: header said {}, "
		                "actually got {}",
		                headerClauseCount, clauseCount));

	log.info("parsed {} vars and {} clauses", varCount, clauseCount);

	return {std::move(clauses), varCount};
}

SolverOutput parseSolution(std::istream &in)
{
	auto log = util::Logger("solution");
	SolverOutput r;
	std::string line;
	int lineNumber = 0;

	while (std::getline(in, line))
	{
		++lineNumber;
		if (!line.empty() && line.back() == '\r')
			line.pop_back();

		// comment lines
		if (line.starts_with('c'))
			continue;

		// status line. Only 'SATISFIABLE' allows us to go on
		else if (line.starts_with("s "))
		{
			if (line.starts_with("s SATISFIABLE"))
			{
				r.status = SolverOutput::Status::satisfiable;
				continue;
			}
			if (line.starts_with("s UNSATISFIABLE"))
			{
				log.info("solver claims unsatisfiability (line {})",
				         lineNumber);
				r.status = SolverOutput::Status::unsatisfiable;
				return r;
			}
			throw IllegalFormat(
			    fmt::format("unexpected status on line {}: '{}'", lineNumber,
			                line));
		}

		// 'v' line. might be continued on the next 'v' line until '0'
		else if (line.starts_with('v') &&
		         (line.size() == 1 || isspace((unsigned char)line[1])))
		{
			auto rest = std::string_view(line).substr(1);
			while (true)
			{
				auto start = rest.find_first_not_of(" \t\r\f\v");
				if (start == std::string_view::npos)
					break;
				rest.remove_prefix(start);
				auto len = std::min(rest.find_first_of(" \t\r\f\v"), rest.size());
				int x = parseValue(rest.substr(0, len));
				rest.remove_prefix(len);
				if (x == 0)
				{
					log.debug("read {} values, terminated on line {}",
					          r.values.size(), lineNumber);
					return r;
				}
				r.values.push_back(x);
			}
		}

		else if (isBlank(line))
			continue;

		else
			throw IllegalFormat(fmt::format("unexpected line {}: '{}'",
			                                lineNumber, line));
	}

	if (in.bad())
		throw std::runtime_error("failed to read assignment");

	if (!r.values.empty())
		log.warning("assignment is not terminated by '0'");
	return r;
}

} // namespace dmcr
