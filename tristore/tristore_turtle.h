#ifndef TRISTORE_TURTLE_H
#define TRISTORE_TURTLE_H


#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tristore_types.h"
#include "tristore_iterator.h"
#include "tristore_assert.h"


/*
* Delta encoding of triple sequences ("turtles").
* A sequence of triples grouped by subject, then by predicate,
* is written as one turtle per triple, each omitting the
* leading components it shares with the triple before it.
* See `GeneralTurtle` in tristore_types.h for the format.
*
* Encoding never reorders its input, and is lossless for any
* sequence; the grouping only affects how compact it is.
*/


namespace tristore
{


/*
* Check that a batch of turtles can be decoded: it must be
* nonempty, start with a 3-slot turtle, and every turtle must
* have 1, 2 or 3 slots.
* Returns a description of the first problem found, or
* std::nullopt if the batch is fine.
*/
template<typename ResT>
std::optional<std::string> validate_turtles(const std::vector<GeneralTurtle<ResT>>& turtles)
{
	if (turtles.empty())
		return std::string("the batch is empty");

	if (turtles.front().size() != 3)
		return "the first turtle has " + std::to_string(turtles.front().size())
			+ " slots, but must be a full triple with 3";

	for (size_t i = 1; i < turtles.size(); ++i)
	{
		if (turtles[i].empty() || turtles[i].size() > 3)
		{
			return "the turtle at index " + std::to_string(i) + " has "
				+ std::to_string(turtles[i].size()) + " slots, but must have 1, 2 or 3";
		}
	}

	return std::nullopt;
}


/*
* Turns turtles back into full triples (or triple patterns),
* carrying forward the components each turtle omits from the
* last triple it decoded.
*/
template<typename ResT>
class GeneralTurtleDecoder
{
public:
	/*
	* pre: the turtle has 1, 2 or 3 slots, and the first turtle
	* since construction (or `reset`) has 3.
	*/
	const GeneralTriple<ResT>& decode(const GeneralTurtle<ResT>& turtle)
	{
		TRISTORE_CHECK_PRECOND(!turtle.empty() && turtle.size() <= 3);
		TRISTORE_CHECK_PRECOND(m_started || turtle.size() == 3);

		switch (turtle.size())
		{
		case 3:
			m_current.sub = turtle[0];
			m_current.pred = turtle[1];
			m_current.obj = turtle[2];
			break;
		case 2:
			m_current.pred = turtle[0];
			m_current.obj = turtle[1];
			break;
		case 1:
			m_current.obj = turtle[0];
			break;
		}

		m_started = true;
		return m_current;
	}

	void reset() { m_started = false; }

private:
	GeneralTriple<ResT> m_current;
	bool m_started = false;
};


typedef GeneralTurtleDecoder<Resource> TurtleDecoder;
typedef GeneralTurtleDecoder<Term> TurtlePatternDecoder;


/*
* Decode a whole batch.
* pre: `validate_turtles(turtles)` returns std::nullopt
*/
template<typename ResT>
std::vector<GeneralTriple<ResT>> decode_turtles(const std::vector<GeneralTurtle<ResT>>& turtles)
{
	TRISTORE_CHECK_PRECOND(!validate_turtles(turtles));

	GeneralTurtleDecoder<ResT> decoder;
	std::vector<GeneralTriple<ResT>> triples;
	triples.reserve(turtles.size());
	for (const auto& t : turtles)
		triples.push_back(decoder.decode(t));
	return triples;
}


/*
* Turns triples into turtles, one turtle per triple, each as
* narrow as the previous triple allows.
*/
class TurtleEncoder
{
public:
	Turtle encode(const Triple& t);

	// forget the previous triple, so the next turtle is a full one
	void reset() { m_last.reset(); }

private:
	std::optional<Triple> m_last;
};


std::vector<Turtle> encode_turtles(const std::vector<Triple>& triples);


/*
* Wrap a triple iterator with one which lazily encodes its
* outputs as turtles. Subsumes management of the given iterator.
* Restarting this iterator restarts the encoding, so the first
* turtle is always a full triple.
*/
std::unique_ptr<ITurtleIterator> create_turtle_encoder(std::unique_ptr<ITripleIterator> triples);


}  // namespace tristore


#endif  // TRISTORE_TURTLE_H
