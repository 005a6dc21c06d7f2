#ifndef TRISTORE_NTRIPLES_H
#define TRISTORE_NTRIPLES_H


#include <memory>
#include <istream>
#include <iostream>
#include "tristore_iterator.h"


namespace tristore
{


/*
* Creates a parser for a file of triples, one `<s> <p> <o> .`
* statement after another (objects may also be `"literals"`),
* with `#` starting a comment line.
* The stream must be kept alive for the entire lifetime of this
* iterator, and is not managed by this iterator. However, nobody
* else should use it while the iterator is using it. Restarting
* the iterator seeks back to the start of the stream.
*
* Behaviour on errors:
* If the file is detected to be corrupted, parsing will stop
* immediately, a notice is written to `diagnostics`, and the
* iterator will become invalid in a "controlled" way. As a user
* of the iterator, this will be indistinguishable from seeing
* an EOF. Restarting an iterator that has stopped due to an
* error is also perfectly acceptable.
*/
std::unique_ptr<ITripleIterator> create_ntriples_file_parser(
	std::istream& in, std::ostream& diagnostics = std::cerr);


}  // namespace tristore


#endif  // TRISTORE_NTRIPLES_H
