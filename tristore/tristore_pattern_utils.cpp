#include "tristore_pattern_utils.h"


namespace tristore
{


bool pattern_matches(const Term& t, const Resource& r)
{
	return !t || *t == r;
}


bool pattern_matches(const TriplePattern& pat, const Triple& t)
{
	return pattern_matches(pat.sub, t.sub) &&
		pattern_matches(pat.pred, t.pred) &&
		pattern_matches(pat.obj, t.obj);
}


TriplePattern to_pattern(const Triple& t)
{
	return { t.sub, t.pred, t.obj };
}


bool is_bound_prefix(const GeneralIndexEntry<Term>& e)
{
	if (!e.primary)
		return !e.secondary && !e.ternary;
	if (!e.secondary)
		return !e.ternary;
	return true;
}


}  // namespace tristore
