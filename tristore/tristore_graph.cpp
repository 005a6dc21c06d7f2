#include <initializer_list>
#include <iterator>
#include <tuple>
#include <utility>
#include "tristore_graph.h"
#include "tristore_turtle.h"
#include "tristore_pattern_utils.h"
#include "tristore_assert.h"


namespace tristore
{


namespace
{


/*
* The range of a container's elements that match a term:
* everything if the term is a wildcard, else the one element
* with that key (or nothing if there isn't one).
*/
template<typename ContainerT>
std::pair<typename ContainerT::const_iterator, typename ContainerT::const_iterator>
	key_range(const ContainerT& c, const Term& key)
{
	if (!key)
		return { c.cbegin(), c.cend() };

	auto iter = c.find(*key);
	if (iter == c.cend())
		return { iter, iter };
	else
		return { iter, std::next(iter) };
}


}  // namespace


Graph::Graph(std::ostream& diagnostics) :
	m_diagnostics(diagnostics)
{ }


Graph::Graph(const std::vector<Turtle>& turtles, std::ostream& diagnostics) :
	m_diagnostics(diagnostics)
{
	assert_turtles(turtles);
}


Graph& Graph::assert_turtles(const std::vector<Turtle>& turtles)
{
	// validate the entire batch before touching the indices, so
	// a bad batch leaves no partial writes behind
	if (auto problem = validate_turtles(turtles))
	{
		m_diagnostics << "Nothing asserted, because " << *problem << '.' << std::endl;
		return *this;
	}

	TurtleDecoder decoder;
	for (const auto& turtle : turtles)
		add(decoder.decode(turtle));

	return *this;
}


Graph& Graph::retract_turtles(const std::vector<TurtlePattern>& turtles)
{
	if (auto problem = validate_turtles(turtles))
	{
		m_diagnostics << "Nothing retracted, because " << *problem << '.' << std::endl;
		return *this;
	}

	TurtlePatternDecoder decoder;
	for (const auto& turtle : turtles)
		remove(decoder.decode(turtle));

	return *this;
}


bool Graph::add(const Triple& t)
{
	const bool is_new = m_spo.insert(rotate(t, Rotation::SPO));
	const bool is_new_pos = m_pos.insert(rotate(t, Rotation::POS));
	const bool is_new_osp = m_osp.insert(rotate(t, Rotation::OSP));

	// if this fails, the indices have drifted apart
	TRISTORE_CHECK_INVARIANT(is_new == is_new_pos && is_new == is_new_osp);

	if (is_new)
		++m_size;

	TRISTORE_CHECK_POSTCOND(has(t.sub, t.pred, t.obj));

	return is_new;
}


size_t Graph::remove(const TriplePattern& pattern)
{
	const size_t num_removed = m_spo.remove_matching(rotate(pattern, Rotation::SPO));
	const size_t num_removed_pos = m_pos.remove_matching(rotate(pattern, Rotation::POS));
	const size_t num_removed_osp = m_osp.remove_matching(rotate(pattern, Rotation::OSP));

	TRISTORE_CHECK_INVARIANT(num_removed == num_removed_pos && num_removed == num_removed_osp);
	TRISTORE_CHECK_INVARIANT(num_removed <= m_size);

	m_size -= num_removed;

	TRISTORE_CHECK_INVARIANT(m_size == m_spo.num_entries()
		&& m_size == m_pos.num_entries()
		&& m_size == m_osp.num_entries());
	TRISTORE_CHECK_INVARIANT(is_consistent());

	return num_removed;
}


bool Graph::has(const Resource& s, const Resource& p, const Resource& o) const
{
	const bool result = m_spo.contains(s, p, o);

	TRISTORE_CHECK_INVARIANT(result == m_pos.contains(p, o, s)
		&& result == m_osp.contains(o, s, p));

	return result;
}


std::unique_ptr<ITripleIterator> Graph::query(const Term& s, const Term& p, const Term& o) const
{
	return evaluate(TriplePattern{ s, p, o });
}


std::unique_ptr<ITripleIterator> Graph::evaluate(const TriplePattern& pattern) const
{
	const Rotation rot = plan_pattern(pattern);
	auto key = rotate(pattern, rot);

	// if this fails, `plan_pattern` is faulty
	TRISTORE_CHECK_POSTCOND(is_bound_prefix(key));

	return std::make_unique<IndexIterator>(index(rot), rot, std::move(key));
}


std::unique_ptr<ITurtleIterator> Graph::turtle(const Term& s, const Term& p, const Term& o) const
{
	return create_turtle_encoder(query(s, p, o));
}


const TripleIndex& Graph::index(Rotation rot) const
{
	switch (rot)
	{
	case Rotation::POS:
		return m_pos;
	case Rotation::OSP:
		return m_osp;
	case Rotation::SPO:
	default:
		return m_spo;
	}
}


Rotation Graph::plan_pattern(const TriplePattern& pattern)
{
	/*
	* Pick the rotation in which the bound components come first
	*/
	switch (pattern_type(pattern))
	{
	case TriplePatternType::VVV:  // full scan, subject-major
	case TriplePatternType::SVV:
	case TriplePatternType::SPV:
	case TriplePatternType::SPO:  // existence check on SPO[s][p]
		return Rotation::SPO;

	case TriplePatternType::VPV:
	case TriplePatternType::VPO:
		return Rotation::POS;

	case TriplePatternType::VVO:
	case TriplePatternType::SVO:
		return Rotation::OSP;

	default:
		TRISTORE_CHECK_POSTCOND(false);  // ???
		return Rotation::SPO;
	}
}


bool Graph::is_consistent() const
{
	for (const TripleIndex* idx : { &m_spo, &m_pos, &m_osp })
	{
		if (!idx->is_pruned() || idx->num_entries() != m_size)
			return false;
	}

	// the counts agree and the sets hold no duplicates, so it
	// suffices to check that SPO is contained in the others
	for (const auto& s : m_spo.entries())
	{
		for (const auto& p : s.second)
		{
			for (const auto& o : p.second)
			{
				if (!m_pos.contains(p.first, o, s.first)
					|| !m_osp.contains(o, s.first, p.first))
					return false;
			}
		}
	}

	return true;
}


Graph::IndexIterator::IndexIterator(
	const TripleIndex& index,
	Rotation rot,
	GeneralIndexEntry<Term> key) :
	m_index(index), m_rot(rot), m_key(std::move(key)),
	m_p(index.entries().cend()), m_p_end(index.entries().cend())
{
	TRISTORE_CHECK_PRECOND(is_bound_prefix(m_key));
}


void Graph::IndexIterator::start()
{
	std::tie(m_p, m_p_end) = key_range(m_index.entries(), m_key.primary);
	settle_primary();
}


Triple Graph::IndexIterator::current() const
{
	TRISTORE_CHECK_PRECOND(valid());

	const Triple t = unrotate(GeneralIndexEntry<Resource>{ m_p->first, m_s->first, *m_t }, m_rot);

	// if this fails then the traversal is faulty
	TRISTORE_CHECK_POSTCOND(pattern_matches(unrotate(m_key, m_rot), t));

	return t;
}


void Graph::IndexIterator::next()
{
	TRISTORE_CHECK_PRECOND(valid());

	++m_t;
	if (m_t != m_t_end)
		return;

	// this secondary is exhausted, so move on to the next one
	++m_s;
	if (settle_secondary())
		return;

	// and likewise for the primary
	++m_p;
	settle_primary();
}


bool Graph::IndexIterator::valid() const
{
	return m_p != m_p_end;
}


bool Graph::IndexIterator::settle_secondary()
{
	// find the first secondary, at or after `m_s`, with a ternary to visit
	for (; m_s != m_s_end; ++m_s)
	{
		std::tie(m_t, m_t_end) = key_range(m_s->second, m_key.ternary);
		if (m_t != m_t_end)
			return true;
	}
	return false;
}


void Graph::IndexIterator::settle_primary()
{
	// find the first primary, at or after `m_p`, with a triple to visit
	for (; m_p != m_p_end; ++m_p)
	{
		std::tie(m_s, m_s_end) = key_range(m_p->second, m_key.secondary);
		if (settle_secondary())
			return;
	}
}


}  // namespace tristore
