#include <limits>
#include "tristore_ntriples.h"
#include "tristore_assert.h"
#include "tristore_parse_helper.h"


namespace tristore
{


/*
* Key invariants here:
* Each triple, if it exists, is read before the call to `current`, and
* the stream always points to the full stop at the end of the current
* triple.
* Calling `next` reads this full stop, then consumes whitespace and
* comments, until either EOF or next triple starts in which case it is
* immediately read.
*/
class NTriplesIterator :
	public ITripleIterator
{
public:
	NTriplesIterator(std::istream& in, std::ostream& diagnostics) :
		m_in(in),
		m_diagnostics(diagnostics),
		m_started(false),
		m_finished(false),
		m_error(false)
	{ }

	void start() override
	{
		// seek to beginning, clearing EOF from any previous pass
		m_in.clear();
		m_in.seekg(0);

		m_started = true;
		m_finished = false;
		m_error = false;

		read_triple();
	}

	Triple current() const override
	{
		TRISTORE_CHECK_PRECOND(valid());

		return m_current;
	}

	void next() override
	{
		TRISTORE_CHECK_PRECOND(valid());

		// finish off last triple:
		read_end();

		// if not finished, read next triple:
		if (valid())
			read_triple();
	}

	bool valid() const override
	{
		return m_started && !m_finished && !m_error;
	}

private:
	void read_triple()
	{
		TRISTORE_CHECK_INVARIANT(valid());

		skip_ws_and_comments();
		if (m_in.peek() == std::char_traits<char>::eof())
		{
			m_finished = true;  // EOF, so don't carry on, but this is not an error
			return;
		}

		// read subject
		auto maybe_resource = parse_resource(m_in);
		if (!maybe_resource)
		{
			set_error("subject");
			return;
		}
		m_current.sub = std::move(*maybe_resource);

		// read predicate
		maybe_resource = parse_resource(m_in);
		if (!maybe_resource)
		{
			set_error("predicate");
			return;
		}
		m_current.pred = std::move(*maybe_resource);

		// read object
		maybe_resource = parse_resource(m_in);
		if (!maybe_resource)
		{
			set_error("object");
			return;
		}
		m_current.obj = std::move(*maybe_resource);
	}

	void read_end()
	{
		TRISTORE_CHECK_INVARIANT(valid());

		char c;

		// file is corrupt if this fails
		if (!next_nonws_char(c, m_in) || c != '.')
			set_error("triple delimiter");
	}

	void skip_ws_and_comments()
	{
		m_in >> std::ws;
		while (m_in.peek() == '#')
		{
			m_in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
			m_in >> std::ws;
		}
	}

	void set_error(const char* what_is_invalid)
	{
		m_error = true;
		m_in.clear();
		m_diagnostics << "Encountered an invalid "
			<< what_is_invalid
			<< " while loading. Stopping parsing the file. Current file stream position is "
			<< m_in.tellg()
			<< std::endl;
	}

private:
	// references must remain valid while this iterator
	// lives
	std::istream& m_in;
	std::ostream& m_diagnostics;
	bool m_started, m_finished, m_error;
	Triple m_current;
};


std::unique_ptr<ITripleIterator> create_ntriples_file_parser(
	std::istream& in, std::ostream& diagnostics)
{
	return std::make_unique<NTriplesIterator>(in, diagnostics);
}


}  // namespace tristore
