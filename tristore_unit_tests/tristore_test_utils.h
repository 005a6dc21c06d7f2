#ifndef TRISTORE_TEST_UTILS_H
#define TRISTORE_TEST_UTILS_H


#include <ostream>
#include <set>
#include <vector>
#include "tristore_types.h"
#include "tristore_iterator.h"
#include "tristore_graph.h"


namespace tristore
{


// so that Boost.Test can print triples when a check fails
inline std::ostream& operator<<(std::ostream& os, const Triple& t)
{
    return os << '(' << TristoreToStringVisitor()(t) << ')';
}


inline std::ostream& operator<<(std::ostream& os, const TriplePattern& t)
{
    return os << '(' << TristoreToStringVisitor()(t) << ')';
}


/*
* Iterates over a copy of the given vector, for feeding
* known sequences into iterator adaptors.
*/
template<typename T>
class VectorIterator :
    public IIterator<T>
{
public:
    VectorIterator(std::vector<T> values) :
        m_values(std::move(values)), m_idx(m_values.size())
    { }

    void start() override { m_idx = 0; }
    T current() const override { return m_values[m_idx]; }
    void next() override { ++m_idx; }
    bool valid() const override { return m_idx < m_values.size(); }

private:
    std::vector<T> m_values;
    size_t m_idx;
};


inline std::set<Triple> query_set(const Graph& g, const Term& s, const Term& p, const Term& o)
{
    auto iter = g.query(s, p, o);
    auto triples = collect(*iter);
    return std::set<Triple>(triples.begin(), triples.end());
}


inline std::set<Triple> all_triples(const Graph& g)
{
    return query_set(g, std::nullopt, std::nullopt, std::nullopt);
}


}  // namespace tristore


#endif  // TRISTORE_TEST_UTILS_H
