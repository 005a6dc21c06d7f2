#include <vector>
#include "tristore_triple_index.h"
#include "tristore_assert.h"


namespace tristore
{


namespace
{


/*
* Copy the keys out of a map, so we can erase from the map
* while visiting them.
*/
template<typename MapT>
std::vector<Resource> keys_of(const MapT& m)
{
	std::vector<Resource> keys;
	keys.reserve(m.size());
	for (const auto& kv : m)
		keys.push_back(kv.first);
	return keys;
}


// the keys to visit at one level: either just the bound one, or all of them
template<typename MapT>
std::vector<Resource> keys_matching(const Term& t, const MapT& m)
{
	if (t)
		return { *t };
	else
		return keys_of(m);
}


}  // namespace


bool TripleIndex::insert(const Resource& primary, const Resource& secondary, const Resource& ternary)
{
	// operator[] creates the intermediate maps on demand
	const bool is_new = m_entries[primary][secondary].insert(ternary).second;

	if (is_new)
		++m_num_entries;

	TRISTORE_CHECK_POSTCOND(contains(primary, secondary, ternary));

	return is_new;
}


size_t TripleIndex::remove_matching(const Term& primary, const Term& secondary, const Term& ternary)
{
	size_t num_removed = 0;

	for (const auto& p : keys_matching(primary, m_entries))
	{
		auto p_iter = m_entries.find(p);
		if (p_iter == m_entries.end())
			continue;  // nothing to remove

		SecondaryMap& secondaries = p_iter->second;

		for (const auto& s : keys_matching(secondary, secondaries))
		{
			auto s_iter = secondaries.find(s);
			if (s_iter == secondaries.end())
				continue;  // nothing to remove

			TernarySet& ternaries = s_iter->second;

			if (ternary)
			{
				num_removed += ternaries.erase(*ternary);
			}
			else
			{
				num_removed += ternaries.size();
				ternaries.clear();
			}

			if (ternaries.empty())
				secondaries.erase(s_iter);
		}

		if (secondaries.empty())
			m_entries.erase(p_iter);
	}

	TRISTORE_CHECK_INVARIANT(num_removed <= m_num_entries);
	m_num_entries -= num_removed;

	return num_removed;
}


const TripleIndex::SecondaryMap* TripleIndex::find(const Resource& primary) const
{
	auto iter = m_entries.find(primary);
	if (iter == m_entries.end())
		return nullptr;
	return &iter->second;
}


const TripleIndex::TernarySet* TripleIndex::find(const Resource& primary, const Resource& secondary) const
{
	const SecondaryMap* secondaries = find(primary);
	if (secondaries == nullptr)
		return nullptr;

	auto iter = secondaries->find(secondary);
	if (iter == secondaries->end())
		return nullptr;
	return &iter->second;
}


bool TripleIndex::contains(const Resource& primary, const Resource& secondary, const Resource& ternary) const
{
	const TernarySet* ternaries = find(primary, secondary);
	return ternaries != nullptr && ternaries->count(ternary) > 0;
}


bool TripleIndex::is_pruned() const
{
	size_t count = 0;
	for (const auto& p : m_entries)
	{
		if (p.second.empty())
			return false;
		for (const auto& s : p.second)
		{
			if (s.second.empty())
				return false;
			count += s.second.size();
		}
	}
	return count == m_num_entries;
}


}  // namespace tristore
