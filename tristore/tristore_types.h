#ifndef TRISTORE_TYPES_H
#define TRISTORE_TYPES_H


#include <string>
#include <vector>
#include <optional>


namespace tristore
{


/*
* Resources are opaque strings. The store imposes no structure
* on them; IRIs and literals are kept in whatever lexical form
* the caller gives (the command parser keeps the `<...>` or
* `"..."` delimiters, for example).
*/
typedef std::string Resource;


/*
* A term is either a bound resource or a wildcard, which
* is represented by `std::nullopt` and matches anything.
*/
typedef std::optional<Resource> Term;


template<typename ResT>
struct GeneralTriple
{
	ResT sub, pred, obj;

	inline bool operator == (const GeneralTriple<ResT>& other) const
	{
		return sub == other.sub && pred == other.pred && obj == other.obj;
	}
	inline bool operator != (const GeneralTriple<ResT>& other) const { return !(*this == other); }
	inline bool operator < (const GeneralTriple<ResT>& other) const
	{
		if (sub != other.sub)
			return sub < other.sub;
		if (pred != other.pred)
			return pred < other.pred;
		return obj < other.obj;
	}
};


typedef GeneralTriple<Resource> Triple;
typedef GeneralTriple<Term> TriplePattern;


/*
* A turtle is a delta-encoded triple, relative to the triple
* before it in a sequence:
* 3 slots = (sub, pred, obj), i.e. the subject changed,
* 2 slots = (pred, obj), subject carried over,
* 1 slot = (obj), subject and predicate carried over.
* The first turtle of any sequence must have 3 slots.
*/
template<typename ResT>
using GeneralTurtle = std::vector<ResT>;


typedef GeneralTurtle<Resource> Turtle;
typedef GeneralTurtle<Term> TurtlePattern;


/*
* The three orderings of a triple's components which are
* each kept as an index, named by (primary, secondary, ternary).
*/
enum class Rotation
{
	SPO, POS, OSP
};


/*
* A triple's components in the order of a given rotation.
*/
template<typename ResT>
struct GeneralIndexEntry
{
	ResT primary, secondary, ternary;
};


template<typename ResT>
GeneralIndexEntry<ResT> rotate(const GeneralTriple<ResT>& t, Rotation rot)
{
	switch (rot)
	{
	case Rotation::POS:
		return { t.pred, t.obj, t.sub };
	case Rotation::OSP:
		return { t.obj, t.sub, t.pred };
	case Rotation::SPO:
	default:
		return { t.sub, t.pred, t.obj };
	}
}


// inverse of `rotate`
template<typename ResT>
GeneralTriple<ResT> unrotate(const GeneralIndexEntry<ResT>& e, Rotation rot)
{
	switch (rot)
	{
	case Rotation::POS:
		return { e.ternary, e.primary, e.secondary };
	case Rotation::OSP:
		return { e.secondary, e.ternary, e.primary };
	case Rotation::SPO:
	default:
		return { e.primary, e.secondary, e.ternary };
	}
}


/*
* Which components of a pattern are bound. `V` marks a wildcard
* in that position, otherwise S, P or O marks a bound component.
*/
enum class TriplePatternType
{
	VVV, VVO, VPV, SVV, VPO, SVO, SPV, SPO
};


TriplePatternType pattern_type(const TriplePattern& pattern);


/*
* Get a string reprsentation of a triple pattern type.
*/
std::string trip_pat_type_str(TriplePatternType type);


std::string rotation_str(Rotation rot);


// works on resources, terms, triples and turtles, via calling
struct TristoreToStringVisitor
{
	std::string operator()(const Resource& r) const
	{
		return r;
	}
	std::string operator()(const Term& t) const
	{
		return t ? *t : std::string("?");
	}
	std::string operator()(const Triple& t) const
	{
		return t.sub + ' ' + t.pred + ' ' + t.obj;
	}
	std::string operator()(const TriplePattern& t) const
	{
		return (*this)(t.sub) + ' ' + (*this)(t.pred) + ' ' + (*this)(t.obj);
	}
	std::string operator()(const Turtle& t) const
	{
		std::string result;
		for (const auto& r : t)
		{
			if (!result.empty())
				result += ' ';
			result += r;
		}
		return result;
	}
};


}  // namespace tristore


#endif  // TRISTORE_TYPES_H
