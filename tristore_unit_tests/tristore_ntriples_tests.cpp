#include <sstream>
#include <boost/test/unit_test.hpp>
#include "tristore_ntriples.h"
#include "tristore_test_utils.h"


using namespace tristore;


BOOST_AUTO_TEST_SUITE(NTriplesTests);


BOOST_AUTO_TEST_CASE(TestParseFile)
{
    std::stringstream file(
        "# a comment\n"
        "<http://a> <http://p> <http://b> .\n"
        "\n"
        "<http://a> <http://p> \"a literal, with punctuation.\" .\n"
    );
    std::stringstream diagnostics;
    auto parser = create_ntriples_file_parser(file, diagnostics);

    BOOST_CHECK(!parser->valid());

    const auto triples = collect(*parser);
    const std::vector<Triple> expected = {
        { "<http://a>", "<http://p>", "<http://b>" },
        { "<http://a>", "<http://p>", "\"a literal, with punctuation.\"" }
    };
    BOOST_CHECK(triples == expected);
    BOOST_CHECK(diagnostics.str().empty());
}


BOOST_AUTO_TEST_CASE(TestRestart)
{
    std::stringstream file("<a> <p> <b> .\n<c> <p> <d> .");
    std::stringstream diagnostics;
    auto parser = create_ntriples_file_parser(file, diagnostics);

    const auto first = collect(*parser);
    const auto second = collect(*parser);
    BOOST_CHECK_EQUAL(first.size(), 2);
    BOOST_CHECK(first == second);
}


BOOST_AUTO_TEST_CASE(TestEmptyFile)
{
    std::stringstream file("  \n# nothing here\n");
    std::stringstream diagnostics;
    auto parser = create_ntriples_file_parser(file, diagnostics);

    parser->start();
    BOOST_CHECK(!parser->valid());
    BOOST_CHECK(diagnostics.str().empty());
}


BOOST_AUTO_TEST_CASE(TestCorruptTripleStops)
{
    std::stringstream file(
        "<a> <p> <b> .\n"
        "<c> bad <d> .\n"
        "<e> <p> <f> .\n"
    );
    std::stringstream diagnostics;
    auto parser = create_ntriples_file_parser(file, diagnostics);

    const auto triples = collect(*parser);
    BOOST_REQUIRE_EQUAL(triples.size(), 1);
    BOOST_CHECK_EQUAL(triples[0], (Triple{ "<a>", "<p>", "<b>" }));
    BOOST_CHECK(!diagnostics.str().empty());
}


BOOST_AUTO_TEST_CASE(TestMissingFullStopStops)
{
    std::stringstream file(
        "<a> <p> <b>\n"
        "<c> <p> <d> .\n"
    );
    std::stringstream diagnostics;
    auto parser = create_ntriples_file_parser(file, diagnostics);

    const auto triples = collect(*parser);
    BOOST_CHECK_EQUAL(triples.size(), 1);
    BOOST_CHECK(!diagnostics.str().empty());
}


BOOST_AUTO_TEST_CASE(TestUnterminatedIRIStops)
{
    std::stringstream file("<a> <p> <b");
    std::stringstream diagnostics;
    auto parser = create_ntriples_file_parser(file, diagnostics);

    parser->start();
    BOOST_CHECK(!parser->valid());
    BOOST_CHECK(!diagnostics.str().empty());
}


BOOST_AUTO_TEST_CASE(TestEscapedQuoteInLiteral)
{
    std::stringstream file("<a> <p> \"say \\\"hi\\\"\" .\n<c> <p> <d> .");
    std::stringstream diagnostics;
    auto parser = create_ntriples_file_parser(file, diagnostics);

    const auto triples = collect(*parser);
    const std::vector<Triple> expected = {
        { "<a>", "<p>", "\"say \\\"hi\\\"\"" },
        { "<c>", "<p>", "<d>" }
    };
    BOOST_CHECK(triples == expected);
    BOOST_CHECK(diagnostics.str().empty());
}


BOOST_AUTO_TEST_CASE(TestLiteralSuffixesKeptVerbatim)
{
    std::stringstream file(
        "<a> <p> \"x\"@en-GB .\n"
        "<b> <p> \"1\"^^<http://www.w3.org/2001/XMLSchema#int> .\n"
        "<c> <p> \"x\" .\n"
    );
    std::stringstream diagnostics;
    auto parser = create_ntriples_file_parser(file, diagnostics);

    const auto triples = collect(*parser);
    const std::vector<Triple> expected = {
        { "<a>", "<p>", "\"x\"@en-GB" },
        { "<b>", "<p>", "\"1\"^^<http://www.w3.org/2001/XMLSchema#int>" },
        { "<c>", "<p>", "\"x\"" }
    };
    BOOST_CHECK(triples == expected);
    BOOST_CHECK(diagnostics.str().empty());
}


BOOST_AUTO_TEST_CASE(TestMixedLiteralFormsAllRead)
{
    std::stringstream file(
        "<a> <p> \"say \\\"hi\\\"\" .\n"
        "<b> <p> \"x\"@en .\n"
        "<c> <p> <d> .\n"
    );
    std::stringstream diagnostics;
    auto parser = create_ntriples_file_parser(file, diagnostics);

    const auto triples = collect(*parser);
    BOOST_REQUIRE_EQUAL(triples.size(), 3);
    BOOST_CHECK_EQUAL(triples[1].obj, "\"x\"@en");
    BOOST_CHECK_EQUAL(triples[2].sub, "<c>");
    BOOST_CHECK(diagnostics.str().empty());
}


BOOST_AUTO_TEST_CASE(TestBadLiteralSuffixStops)
{
    std::stringstream file("<a> <p> \"x\"@ .\n<c> <p> <d> .");
    std::stringstream diagnostics;
    auto parser = create_ntriples_file_parser(file, diagnostics);

    parser->start();
    BOOST_CHECK(!parser->valid());
    BOOST_CHECK(!diagnostics.str().empty());
}


BOOST_AUTO_TEST_CASE(TestLoadIntoGraph)
{
    std::stringstream file("<a> <p> <b> .\n<a> <p> <b> .\n<a> <q> <c> .\n");
    std::stringstream diagnostics;
    auto parser = create_ntriples_file_parser(file, diagnostics);

    Graph g(diagnostics);
    size_t num_new = 0;
    parser->start();
    while (parser->valid())
    {
        if (g.add(parser->current()))
            ++num_new;
        parser->next();
    }

    BOOST_CHECK_EQUAL(num_new, 2);
    BOOST_CHECK_EQUAL(g.size(), 2);
    BOOST_CHECK(g.has("<a>", "<q>", "<c>"));
}


BOOST_AUTO_TEST_SUITE_END();  // NTriplesTests
