#ifndef TRISTORE_PATTERN_UTILS_H
#define TRISTORE_PATTERN_UTILS_H


#include "tristore_types.h"


namespace tristore
{


/*
* These functions return true iff the wildcards in the left
* argument can be filled in to make it equal to the right argument.
*/
bool pattern_matches(const Term& t, const Resource& r);
bool pattern_matches(const TriplePattern& pat, const Triple& t);


/*
* The fully-bound pattern which matches exactly `t`.
*/
TriplePattern to_pattern(const Triple& t);


/*
* Returns true iff the bound components of this index entry
* form a prefix, i.e. no bound component follows a wildcard.
* Every pattern the query engine walks an index with has this
* property, which is what makes the lookup sub-linear.
*/
bool is_bound_prefix(const GeneralIndexEntry<Term>& e);


}  // namespace tristore


#endif  // TRISTORE_PATTERN_UTILS_H
