#ifndef TRISTORE_ASSERT_H
#define TRISTORE_ASSERT_H


// always check asserts, except where the build switches them off below
#ifdef NDEBUG
#undef NDEBUG
#define UNDEF_NDEBUG
#endif
#include <cassert>
#ifdef UNDEF_NDEBUG
#define NDEBUG
#undef UNDEF_NDEBUG
#endif


/*
* Contract checks for the store. They sit where the three
* indices could drift apart or where a caller could break an
* internal precondition:
*
* - TRISTORE_CHECK_PRECOND: arguments the library never passes
*   badly itself, e.g. an index walk with a key that is not a
*   bound prefix, or `current()` on an exhausted iterator.
* - TRISTORE_CHECK_POSTCOND: results, e.g. a triple being
*   present in the graph straight after `Graph::add`.
* - TRISTORE_CHECK_INVARIANT: cross-index agreement. `Graph::add`
*   and `Graph::remove` compare the per-index results, and
*   `Graph::remove` also walks the whole graph via
*   `Graph::is_consistent`, which is linear in its size.
*
* Each group is switched off by defining the matching
* TRISTORE_DISABLE_CHECK_* macro, or all at once with
* TRISTORE_DISABLE_ALL_CHECKS (a CMake option), which is
* what to do before timing large loads and retracts.
*/


// #define TRISTORE_DISABLE_ALL_CHECKS


#ifdef TRISTORE_DISABLE_ALL_CHECKS
#define TRISTORE_DISABLE_CHECK_PRECOND
#define TRISTORE_DISABLE_CHECK_POSTCOND
#define TRISTORE_DISABLE_CHECK_INVARIANT
#endif


#ifndef TRISTORE_DISABLE_CHECK_PRECOND
#define TRISTORE_CHECK_PRECOND(expr) assert(expr)
#define TRISTORE_CHECKING_PRECONDS
#else
#define TRISTORE_CHECK_PRECOND(expr) ((void)0)
#endif


#ifndef TRISTORE_DISABLE_CHECK_POSTCOND
#define TRISTORE_CHECK_POSTCOND(expr) assert(expr)
#define TRISTORE_CHECKING_POSTCONDS
#else
#define TRISTORE_CHECK_POSTCOND(expr) ((void)0)
#endif


#ifndef TRISTORE_DISABLE_CHECK_INVARIANT
#define TRISTORE_CHECK_INVARIANT(expr) assert(expr)
#define TRISTORE_CHECKING_INVARIANTS
#else
#define TRISTORE_CHECK_INVARIANT(expr) ((void)0)
#endif


#endif  // TRISTORE_ASSERT_H
