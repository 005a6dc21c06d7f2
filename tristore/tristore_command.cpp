#include <sstream>
#include "tristore_assert.h"
#include "tristore_command.h"
#include "tristore_parse_helper.h"


namespace tristore
{


namespace
{


/*
* Read a bracketed block of turtles, separated by full stops,
* e.g. `{ <s> <p> <o> . <p2> <o2> . <o3> }`. The final full
* stop is optional. Turtles are not validated beyond their
* syntax (in particular, the first one may be narrower than
* a full triple); that is left to the graph.
*/
std::variant<BadCommand, std::vector<TurtlePattern>> parse_turtle_block(std::istream& in)
{
	char delimiter = 'x';
	in >> std::ws >> delimiter;
	if (delimiter != '{')
		return BadCommand("Missing opening bracket.");

	std::vector<TurtlePattern> turtles;
	TurtlePattern turtle;

	while (true)
	{
		in >> std::ws;
		const int c = in.peek();

		if (c == std::char_traits<char>::eof())
			return BadCommand("Missing closing bracket.");

		if (c == '.' || c == '}')
		{
			in.get();

			if (!turtle.empty())
			{
				turtles.push_back(std::move(turtle));
				turtle.clear();
			}
			else if (c == '.')
			{
				std::stringstream errmsg;
				errmsg << "Empty turtle at index " << turtles.size() << '.';
				return BadCommand(errmsg.str());
			}

			if (c == '}')
				break;
			else
				continue;
		}

		auto maybe_term = parse_term(in);
		if (!maybe_term)
		{
			std::stringstream errmsg;
			errmsg << "Bad term at index " << turtle.size()
				<< " of turtle at index " << turtles.size() << '.';
			return BadCommand(errmsg.str());
		}

		turtle.push_back(std::move(*maybe_term));

		if (turtle.size() > 3)
		{
			std::stringstream errmsg;
			errmsg << "Turtle at index " << turtles.size() << " has more than three terms.";
			return BadCommand(errmsg.str());
		}
	}

	return std::move(turtles);
}


std::variant<BadCommand, TriplePattern> parse_pattern(std::istream& in)
{
	TriplePattern pattern;
	Term* const slots[] = { &pattern.sub, &pattern.pred, &pattern.obj };
	const char* const slot_names[] = { "subject", "predicate", "object" };

	for (size_t i = 0; i < 3; ++i)
	{
		auto maybe_term = parse_term(in);
		if (!maybe_term)
			return BadCommand(std::string("Bad ") + slot_names[i] + " in pattern.");
		*slots[i] = std::move(*maybe_term);
	}

	return std::move(pattern);
}


}  // namespace


AnyCommand parse_command(std::istream& in)
{
	if (!in)
		return EmptyCommand();

	std::string first_word;
	in >> first_word;

	if (first_word.empty())
		return EmptyCommand();

	if (first_word == "QUIT")
		return QuitCommand();

	if (first_word == "SIZE")
		return SizeCommand();

	// skip any whitespace after the command,
	// because we expect there to be more
	in >> std::ws;

	if (first_word == "LOAD")
	{
		LoadCommand lc;
		std::getline(in, lc.filename);

		// drop trailing whitespace, e.g. a carriage return
		const auto last = lc.filename.find_last_not_of(" \t\r\n");
		lc.filename.erase(last == std::string::npos ? 0 : last + 1);

		if (lc.filename.empty())
			return BadCommand("Missing filename after LOAD.");

		return lc;
	}

	if (first_word == "ASSERT" || first_word == "RETRACT")
	{
		auto block = parse_turtle_block(in);
		if (auto* bad = std::get_if<BadCommand>(&block))
			return BadCommand(first_word + ": " + bad->error);

		auto& patterns = std::get<std::vector<TurtlePattern>>(block);

		if (first_word == "RETRACT")
			return RetractCommand{ std::move(patterns) };

		AssertCommand ac;
		for (const auto& pattern : patterns)
		{
			Turtle turtle;
			for (const auto& term : pattern)
			{
				if (!term)
					return BadCommand("ASSERT: Wildcards cannot be asserted.");
				turtle.push_back(*term);
			}
			ac.turtles.push_back(std::move(turtle));
		}
		return ac;
	}

	if (first_word != "SELECT" && first_word != "TURTLE" && first_word != "HAS")
		return BadCommand("Invalid command: " + first_word
			+ ", must be QUIT/SIZE/LOAD/ASSERT/RETRACT/SELECT/TURTLE/HAS.");

	auto maybe_pattern = parse_pattern(in);
	if (auto* bad = std::get_if<BadCommand>(&maybe_pattern))
		return BadCommand(first_word + ": " + bad->error);

	auto& pattern = std::get<TriplePattern>(maybe_pattern);

	if (first_word == "SELECT")
		return SelectCommand{ std::move(pattern) };

	if (first_word == "TURTLE")
		return TurtleCommand{ std::move(pattern) };

	TRISTORE_CHECK_INVARIANT(first_word == "HAS");

	if (!pattern.sub || !pattern.pred || !pattern.obj)
		return BadCommand("HAS: All three terms must be given, wildcards are not allowed.");

	return HasCommand{ Triple{ *pattern.sub, *pattern.pred, *pattern.obj } };
}


}  // namespace tristore
