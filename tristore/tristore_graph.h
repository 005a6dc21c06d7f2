#ifndef TRISTORE_GRAPH_H
#define TRISTORE_GRAPH_H


#include <iostream>
#include <memory>
#include <vector>
#include "tristore_types.h"
#include "tristore_iterator.h"
#include "tristore_triple_index.h"


namespace tristore
{


/*
* This holds the entire graph, as three indices over the same
* set of triples (SPO, POS and OSP), which are always kept in
* agreement with each other.
*
* Mutations come in as batches of turtles (see tristore_turtle.h).
* A malformed batch is rejected as a whole: a notice is written
* to the diagnostics stream and the graph is left unchanged.
*
* Not thread safe. Mutating the graph invalidates any iterators
* created from it, so drain (or `collect`) query results first.
*/
class Graph
{
private:
	/*
	* Walks one index, for a pattern whose bound components form
	* a prefix in that index's rotation. Unbound levels visit
	* every key, bound levels look up their one key, so the walk
	* never scans more than the bound prefix's subtree.
	*/
	class IndexIterator :
		public ITripleIterator
	{
	public:
		IndexIterator(
			const TripleIndex& index,
			Rotation rot,
			GeneralIndexEntry<Term> key);

		void start() override;
		Triple current() const override;
		void next() override;
		bool valid() const override;

	private:
		bool settle_secondary();
		void settle_primary();

	private:
		typedef TripleIndex::PrimaryMap::const_iterator PrimaryIterator;
		typedef TripleIndex::SecondaryMap::const_iterator SecondaryIterator;
		typedef TripleIndex::TernarySet::const_iterator TernaryIterator;

		const TripleIndex& m_index;
		const Rotation m_rot;
		const GeneralIndexEntry<Term> m_key;

		/*
		* invariant: if valid(), each iterator points into the
		* container pointed to by the level above, and m_t is
		* dereferenceable.
		*/
		PrimaryIterator m_p, m_p_end;
		SecondaryIterator m_s, m_s_end;
		TernaryIterator m_t, m_t_end;
	};

public:
	explicit Graph(std::ostream& diagnostics = std::cerr);

	/*
	* Create a graph and assert the given turtles into it,
	* exactly as `assert_turtles` would.
	*/
	Graph(const std::vector<Turtle>& turtles, std::ostream& diagnostics = std::cerr);

	/*
	* Assert every triple the turtles decode to. Duplicates are
	* ignored. The first turtle must be a full triple.
	* WARNING: invalidates any currently-alive iterators.
	*/
	Graph& assert_turtles(const std::vector<Turtle>& turtles);

	/*
	* Retract every triple matching any of the patterns the turtles
	* decode to. Wildcards carry forward like any other component.
	* WARNING: invalidates any currently-alive iterators.
	*/
	Graph& retract_turtles(const std::vector<TurtlePattern>& turtles);

	/*
	* Add a single triple to all three indices.
	* Returns true iff it was not already present.
	*/
	bool add(const Triple& t);

	/*
	* Remove every triple matching the pattern from all three
	* indices. Returns the number of triples removed.
	*/
	size_t remove(const TriplePattern& pattern);

	// true iff exactly this triple has been asserted
	bool has(const Resource& s, const Resource& p, const Resource& o) const;

	// the exact number of distinct triples
	size_t size() const { return m_size; }

	bool empty() const { return m_size == 0; }

	/*
	* Create an iterator over the triples matching the pattern,
	* where `std::nullopt` components match anything. Each call
	* creates an independent traversal. The graph must outlive it.
	*/
	std::unique_ptr<ITripleIterator> query(const Term& s, const Term& p, const Term& o) const;
	std::unique_ptr<ITripleIterator> evaluate(const TriplePattern& pattern) const;

	/*
	* As `query`, but with the results delta encoded as turtles.
	*/
	std::unique_ptr<ITurtleIterator> turtle(const Term& s, const Term& p, const Term& o) const;

	const TripleIndex& index(Rotation rot) const;

	/*
	* Choose the index whose rotation puts the bound components
	* of the pattern first, so evaluation is a direct lookup.
	*/
	static Rotation plan_pattern(const TriplePattern& pattern);

	/*
	* Returns true iff the three indices hold exactly the same
	* triples, are free of empty branches, and agree with `size`.
	* This walks the whole graph, so is for checking only.
	*/
	bool is_consistent() const;

private:
	std::ostream& m_diagnostics;
	TripleIndex m_spo, m_pos, m_osp;
	size_t m_size = 0;
};


}  // namespace tristore


#endif  // TRISTORE_GRAPH_H
