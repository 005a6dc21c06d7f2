#include <cctype>
#include <string>
#include "tristore_parse_helper.h"


namespace tristore
{


namespace
{


/*
* Append an IRI whose `<` has just been read, up to and
* including its `>`. Returns false if the stream ends first.
*/
bool read_iri_rest(Resource& out, std::istream& in)
{
	out.push_back('<');
	int c;
	while ((c = in.get()) != std::char_traits<char>::eof())
	{
		out.push_back(static_cast<char>(c));
		if (c == '>')
			return true;
	}
	return false;
}


/*
* Append the body of a literal whose opening quote has just
* been read, up to and including its closing quote. A backslash
* escapes the character after it, which is kept verbatim (so
* `\"` does not close the literal). Returns false if the stream
* ends first.
*/
bool read_literal_rest(Resource& out, std::istream& in)
{
	int c;
	while ((c = in.get()) != std::char_traits<char>::eof())
	{
		out.push_back(static_cast<char>(c));

		if (c == '"')
			return true;

		if (c == '\\')
		{
			const int escaped = in.get();
			if (escaped == std::char_traits<char>::eof())
				return false;
			out.push_back(static_cast<char>(escaped));
		}
	}
	return false;
}


}  // namespace


bool next_nonws_char(char& out_c, std::istream& in)
{
	int c;
	while ((c = in.get()) != std::char_traits<char>::eof()
		&& std::isspace(static_cast<unsigned char>(c)));

	if (c == std::char_traits<char>::eof())
		return false;

	out_c = static_cast<char>(c);
	return true;
}


std::optional<Resource> parse_resource(std::istream& in)
{
	// the first character tells us whether this is
	// a literal/IRI
	char start_char;
	if (!next_nonws_char(start_char, in))
		return std::nullopt;

	Resource str;
	if (start_char == '<')
	{
		if (!read_iri_rest(str, in))
			return std::nullopt;
		return str;
	}

	if (start_char != '"')
		return std::nullopt;

	str.push_back('"');
	if (!read_literal_rest(str, in))
		return std::nullopt;

	// optional language tag or datatype, kept as part of the resource
	if (in.peek() == '@')
	{
		str.push_back(static_cast<char>(in.get()));

		const size_t tag_start = str.size();
		int c;
		while ((c = in.peek()) != std::char_traits<char>::eof()
			&& (std::isalnum(static_cast<unsigned char>(c)) || c == '-'))
			str.push_back(static_cast<char>(in.get()));

		if (str.size() == tag_start)
			return std::nullopt;  // `@` with no tag
	}
	else if (in.peek() == '^')
	{
		in.get();
		if (in.get() != '^' || in.get() != '<')
			return std::nullopt;

		str += "^^";
		if (!read_iri_rest(str, in))
			return std::nullopt;
	}

	return str;
}


std::optional<Term> parse_term(std::istream& in)
{
	// this loop is similar to `next_nonws_char`, except
	// that it doesn't read the last char
	int start_char;
	while ((start_char = in.peek()) != std::char_traits<char>::eof()
		&& std::isspace(static_cast<unsigned char>(start_char)))
		in.get();  // advance by 1

	if (start_char == std::char_traits<char>::eof())
		return std::nullopt;

	if (start_char == '?')
	{
		in.get();

		// skip the variable's name, if it has one
		int c;
		while ((c = in.peek()) != std::char_traits<char>::eof()
			&& (std::isalnum(static_cast<unsigned char>(c)) || c == '_'))
			in.get();

		return std::make_optional<Term>();  // a wildcard
	}
	else
	{
		auto maybe_resource = parse_resource(in);
		if (!maybe_resource)
			return std::nullopt;
		return Term(std::move(*maybe_resource));
	}
}


}  // namespace tristore
