#include "tristore_turtle.h"


namespace tristore
{


Turtle TurtleEncoder::encode(const Triple& t)
{
	Turtle turtle;

	if (!m_last || m_last->sub != t.sub)
		turtle = { t.sub, t.pred, t.obj };
	else if (m_last->pred != t.pred)
		turtle = { t.pred, t.obj };
	else
		turtle = { t.obj };

	m_last = t;

	TRISTORE_CHECK_POSTCOND(!turtle.empty() && turtle.size() <= 3);

	return turtle;
}


std::vector<Turtle> encode_turtles(const std::vector<Triple>& triples)
{
	TurtleEncoder encoder;
	std::vector<Turtle> turtles;
	turtles.reserve(triples.size());
	for (const auto& t : triples)
		turtles.push_back(encoder.encode(t));
	return turtles;
}


class TurtleEncodingIterator :
	public ITurtleIterator
{
public:
	TurtleEncodingIterator(std::unique_ptr<ITripleIterator> p_triples) :
		m_triples(std::move(p_triples))
	{ }

	void start() override
	{
		m_encoder.reset();
		m_triples->start();
		encode_current();
	}

	Turtle current() const override
	{
		TRISTORE_CHECK_PRECOND(valid());
		return m_current;
	}

	void next() override
	{
		TRISTORE_CHECK_PRECOND(valid());
		m_triples->next();
		encode_current();
	}

	bool valid() const override
	{
		return m_triples->valid();
	}

private:
	void encode_current()
	{
		// the encoder must see each triple exactly once, in order,
		// so encode here rather than in `current`
		if (valid())
			m_current = m_encoder.encode(m_triples->current());
	}

private:
	std::unique_ptr<ITripleIterator> m_triples;
	TurtleEncoder m_encoder;
	Turtle m_current;
};


std::unique_ptr<ITurtleIterator> create_turtle_encoder(std::unique_ptr<ITripleIterator> triples)
{
	return std::make_unique<TurtleEncodingIterator>(std::move(triples));
}


}  // namespace tristore
