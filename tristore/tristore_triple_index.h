#ifndef TRISTORE_TRIPLE_INDEX_H
#define TRISTORE_TRIPLE_INDEX_H


#include <unordered_map>
#include <unordered_set>
#include "tristore_types.h"


namespace tristore
{


/*
* One rotation of the triple set, stored as a three-level
* nested map: primary -> secondary -> set of ternary.
* The store keeps three of these (SPO, POS, OSP) so that any
* bound prefix of a pattern can be looked up directly.
*
* Intermediate maps are created on demand by `insert`, and
* pruned by `remove_matching` as soon as they become empty,
* so the structure never holds an empty secondary map or an
* empty ternary set.
*/
class TripleIndex
{
public:
	typedef std::unordered_set<Resource> TernarySet;
	typedef std::unordered_map<Resource, TernarySet> SecondaryMap;
	typedef std::unordered_map<Resource, SecondaryMap> PrimaryMap;

public:
	/*
	* Add an entry. Returns true iff it was not already present
	* (re-inserting is a no-op).
	* WARNING: invalidates any currently-alive iterators.
	*/
	bool insert(const Resource& primary, const Resource& secondary, const Resource& ternary);
	bool insert(const GeneralIndexEntry<Resource>& e) { return insert(e.primary, e.secondary, e.ternary); }

	/*
	* Remove every entry matching the given components, where
	* `std::nullopt` matches every key at that level. Returns
	* the number of entries removed.
	* WARNING: invalidates any currently-alive iterators.
	*/
	size_t remove_matching(const Term& primary, const Term& secondary, const Term& ternary);
	size_t remove_matching(const GeneralIndexEntry<Term>& e) { return remove_matching(e.primary, e.secondary, e.ternary); }

	/*
	* Lookups by prefix. These return nullptr if there is
	* no entry with that prefix.
	*/
	const SecondaryMap* find(const Resource& primary) const;
	const TernarySet* find(const Resource& primary, const Resource& secondary) const;

	bool contains(const Resource& primary, const Resource& secondary, const Resource& ternary) const;

	const PrimaryMap& entries() const { return m_entries; }

	// the exact number of (primary, secondary, ternary) entries
	size_t num_entries() const { return m_num_entries; }

	size_t num_primaries() const { return m_entries.size(); }

	bool empty() const { return m_entries.empty(); }

	/*
	* Returns true iff there are no empty secondary maps or ternary
	* sets, and the entry counter agrees with the contents.
	* This walks the whole index, so is for checking only.
	*/
	bool is_pruned() const;

private:
	PrimaryMap m_entries;
	size_t m_num_entries = 0;
};


}  // namespace tristore


#endif  // TRISTORE_TRIPLE_INDEX_H
