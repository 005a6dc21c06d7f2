#ifndef TRISTORE_PARSE_HELPER_H
#define TRISTORE_PARSE_HELPER_H


#include <istream>
#include <optional>
#include "tristore_types.h"


namespace tristore
{


/*
* Skips all current whitespace in the stream `in`,
* and outputs the first non-whitespace character
* to `out_c` if it exists (and returns true), or
* returns false if EOF happened earlier. In either
* case, `out_c` has the possibility of being modified.
*/
bool next_nonws_char(char& out_c, std::istream& in);


/*
* Try to parse a resource from the given input stream.
* If bad syntax, return std::nullopt.
* A resource is either an IRI `<...>` or a literal `"..."`,
* and is returned verbatim, delimiters included, since the
* store treats resources as opaque strings. Inside a literal,
* a backslash escapes the next character, and a literal may be
* followed by a language tag `@en` or a datatype `^^<...>`,
* both of which are kept as part of the resource.
* It does not necessarily consume whitespace afterwards,
* but will consume whitespace beforehand.
*/
std::optional<Resource> parse_resource(std::istream& in);


/*
* Try to parse a term from the given input stream.
* If bad syntax, return std::nullopt. Otherwise the result
* holds either a resource, or a wildcard (an empty Term),
* which is written `?` optionally followed by a name made of
* letters, digits and underscores. The name is ignored.
* It does not necessarily consume whitespace afterwards,
* but will consume whitespace beforehand.
*/
std::optional<Term> parse_term(std::istream& in);


}  // namespace tristore


#endif  // TRISTORE_PARSE_HELPER_H
