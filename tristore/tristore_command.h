#ifndef TRISTORE_COMMAND_H
#define TRISTORE_COMMAND_H


#include <vector>
#include <string>
#include <variant>
#include <istream>
#include "tristore_types.h"


namespace tristore
{


struct BadCommand
{
	BadCommand(std::string e) :
		error(std::move(e))
	{ }
	std::string error;
};


// ASSERT { <s> <p> <o> . <p2> <o2> . <o3> }
struct AssertCommand
{
	std::vector<Turtle> turtles;
};


// RETRACT { <s> ?p ?o . <o2> }
struct RetractCommand
{
	std::vector<TurtlePattern> turtles;
};


// SELECT <s> ?p ?o
struct SelectCommand
{
	TriplePattern pattern;
};


// TURTLE <s> ?p ?o
struct TurtleCommand
{
	TriplePattern pattern;
};


// HAS <s> <p> <o>
struct HasCommand
{
	Triple triple;
};


struct SizeCommand {};


struct LoadCommand
{
	std::string filename;
};


struct QuitCommand {};


struct EmptyCommand {};


typedef std::variant<BadCommand, AssertCommand, RetractCommand, SelectCommand,
	TurtleCommand, HasCommand, SizeCommand, LoadCommand, QuitCommand, EmptyCommand> AnyCommand;


/*
* Read a single command from the given input string, which
* may contain zero, one, or multiple commands. In the case
* of any error `BadCommand` is returned. In case of no command
* at all, `EmptyCommand` is returned.
* In all other cases, the foremost command in the string is
* read and returned.
*/
AnyCommand parse_command(std::istream& in);


}  // namespace tristore


#endif  // TRISTORE_COMMAND_H
