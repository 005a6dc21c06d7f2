#include <sstream>
#include <boost/test/unit_test.hpp>
#include "tristore_command.h"
#include "tristore_test_utils.h"


using namespace tristore;


BOOST_AUTO_TEST_SUITE(CommandTests);


BOOST_AUTO_TEST_CASE(TestEmpty)
{
    std::stringstream command(
        ""
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<EmptyCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestQuit)
{
    std::stringstream command(
        "QUIT"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<QuitCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestSize)
{
    std::stringstream command(
        "SIZE"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<SizeCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestLoad)
{
    std::stringstream command(
        "LOAD myfolder/myfile.nt \r\n"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<LoadCommand>(&result) != nullptr);
    BOOST_CHECK_EQUAL(std::get<LoadCommand>(result).filename, "myfolder/myfile.nt");
}


BOOST_AUTO_TEST_CASE(TestLoadWithoutFilename)
{
    std::stringstream command(
        "LOAD"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<BadCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestBadCommand)
{
    std::stringstream command(
        "BADCOMMAND"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<BadCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestLeadingWhitespace)
{
    std::stringstream command(
        " \n  \tQUIT"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<QuitCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestWhitespaceAfterwards)
{
    std::stringstream command(
        "QUIT \n  \t"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<QuitCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestEOS)
{
    std::stringstream command(
        "QUIT"
    );
    parse_command(command);
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<EmptyCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestAssert)
{
    std::stringstream command(
        "ASSERT { <a> <p1> \"b\" . <p2> <c> . <d> }"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<AssertCommand>(&result) != nullptr);

    const std::vector<Turtle> expected = {
        { "<a>", "<p1>", "\"b\"" },
        { "<p2>", "<c>" },
        { "<d>" }
    };
    BOOST_CHECK(std::get<AssertCommand>(result).turtles == expected);
}


BOOST_AUTO_TEST_CASE(TestAssertLiteralForms)
{
    std::stringstream command(
        "ASSERT { <a> <p> \"say \\\"hi\\\"\" . <q> \"x\"@en . \"1\"^^<int> }"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<AssertCommand>(&result) != nullptr);

    const std::vector<Turtle> expected = {
        { "<a>", "<p>", "\"say \\\"hi\\\"\"" },
        { "<q>", "\"x\"@en" },
        { "\"1\"^^<int>" }
    };
    BOOST_CHECK(std::get<AssertCommand>(result).turtles == expected);
}


BOOST_AUTO_TEST_CASE(TestAssertTrailingFullStop)
{
    std::stringstream command(
        "ASSERT {<a> <p> <b>.}"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<AssertCommand>(&result) != nullptr);
    BOOST_CHECK_EQUAL(std::get<AssertCommand>(result).turtles.size(), 1);
}


BOOST_AUTO_TEST_CASE(TestAssertNarrowFirstTurtleIsLeftToGraph)
{
    // syntactically fine, the graph is the one to reject it
    std::stringstream command(
        "ASSERT { <p> <o> }"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<AssertCommand>(&result) != nullptr);
    BOOST_CHECK_EQUAL(std::get<AssertCommand>(result).turtles.front().size(), 2);
}


BOOST_AUTO_TEST_CASE(TestAssertWildcard)
{
    std::stringstream command(
        "ASSERT { <a> ?p <b> }"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<BadCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestAssertTooManyTerms)
{
    std::stringstream command(
        "ASSERT { <a> <p> <b> <c> }"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<BadCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestAssertMissingBrackets)
{
    std::stringstream no_open(
        "ASSERT <a> <p> <b> }"
    );
    auto result = parse_command(no_open);
    BOOST_REQUIRE(std::get_if<BadCommand>(&result) != nullptr);

    std::stringstream no_close(
        "ASSERT { <a> <p> <b> ."
    );
    result = parse_command(no_close);
    BOOST_REQUIRE(std::get_if<BadCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestAssertEmptyTurtle)
{
    std::stringstream command(
        "ASSERT { <a> <p> <b> . . <c> }"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<BadCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestRetract)
{
    std::stringstream command(
        "RETRACT { <a> ?p ? . ?o }"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<RetractCommand>(&result) != nullptr);

    const std::vector<TurtlePattern> expected = {
        { "<a>", std::nullopt, std::nullopt },
        { std::nullopt }
    };
    BOOST_CHECK(std::get<RetractCommand>(result).turtles == expected);
}


BOOST_AUTO_TEST_CASE(TestEmptyBlockIsLeftToGraph)
{
    std::stringstream command(
        "RETRACT { }"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<RetractCommand>(&result) != nullptr);
    BOOST_CHECK(std::get<RetractCommand>(result).turtles.empty());
}


BOOST_AUTO_TEST_CASE(TestSelect)
{
    std::stringstream command(
        "SELECT ?s <p> \"o\""
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<SelectCommand>(&result) != nullptr);
    BOOST_CHECK(std::get<SelectCommand>(result).pattern
        == (TriplePattern{ std::nullopt, "<p>", "\"o\"" }));
}


BOOST_AUTO_TEST_CASE(TestSelectMissingTerm)
{
    std::stringstream command(
        "SELECT ?s <p>"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<BadCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestTurtle)
{
    std::stringstream command(
        "TURTLE ? ? ?"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<TurtleCommand>(&result) != nullptr);
    BOOST_CHECK(std::get<TurtleCommand>(result).pattern
        == (TriplePattern{ std::nullopt, std::nullopt, std::nullopt }));
}


BOOST_AUTO_TEST_CASE(TestHas)
{
    std::stringstream command(
        "HAS <a> <p> <b>"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<HasCommand>(&result) != nullptr);
    BOOST_CHECK_EQUAL(std::get<HasCommand>(result).triple, (Triple{ "<a>", "<p>", "<b>" }));
}


BOOST_AUTO_TEST_CASE(TestHasWildcard)
{
    std::stringstream command(
        "HAS <a> ?p <b>"
    );
    auto result = parse_command(command);
    BOOST_REQUIRE(std::get_if<BadCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_CASE(TestSequenceOfCommands)
{
    std::stringstream command(
        "ASSERT { <a> <p> <b> } SELECT ?s ?p ?o\nSIZE QUIT"
    );
    auto result = parse_command(command);
    BOOST_CHECK(std::get_if<AssertCommand>(&result) != nullptr);
    result = parse_command(command);
    BOOST_CHECK(std::get_if<SelectCommand>(&result) != nullptr);
    result = parse_command(command);
    BOOST_CHECK(std::get_if<SizeCommand>(&result) != nullptr);
    result = parse_command(command);
    BOOST_CHECK(std::get_if<QuitCommand>(&result) != nullptr);
    result = parse_command(command);
    BOOST_CHECK(std::get_if<EmptyCommand>(&result) != nullptr);
}


BOOST_AUTO_TEST_SUITE_END();  // CommandTests
