#ifndef TRISTORE_ITERATOR_H
#define TRISTORE_ITERATOR_H


#include <vector>
#include "tristore_types.h"


namespace tristore
{


/*
* This is an interface to an object which iterates over values
* of a generic type T.
* These iterators are initialised to be invalid.
* You can call `current` and `next` if and only if the iterator is `valid`.
* `start` can be called at any time to validate the iterator and restart it.
* Calling `next` will result in invalidating the iterator once the end is reached.
* Abandoning an iterator before it reaches the end is always fine.
*/
template<typename T>
class IIterator
{
public:
	virtual ~IIterator() = default;

	virtual void start() = 0;  // post: points to first element, if there is one
	virtual T current() const = 0;  // pre: `valid()`
	virtual void next() = 0;  // pre: `valid()`
	virtual bool valid() const = 0;
};


typedef IIterator<Triple> ITripleIterator;
typedef IIterator<Turtle> ITurtleIterator;


/*
* Restart the iterator and drain all of its values into a vector.
* Use this to take a stable snapshot of query results before
* mutating the store the iterator reads from.
*/
template<typename T>
std::vector<T> collect(IIterator<T>& iter)
{
	std::vector<T> result;
	iter.start();
	while (iter.valid())
	{
		result.push_back(iter.current());
		iter.next();
	}
	return result;
}


}  // namespace tristore


#endif  // TRISTORE_ITERATOR_H
