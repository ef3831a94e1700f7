// tests/test_parser.cpp
#include <catch2/catch_test_macros.hpp>
#include "abstractchain/parser/expression_parser.h"
#include <string>

using namespace abstractchain;

namespace {

ExpressionParser make_parser() {
    return ExpressionParser(std::vector<std::string>{"add", "multiply", "echo", "search", "lookup", "now"});
}

} // namespace

TEST_CASE("Plan without markers yields no calls", "[parser]") {
    auto out = make_parser().parse("Paris is the capital of France.");
    REQUIRE(out.calls.empty());
    REQUIRE(out.diagnostics.empty());
    REQUIRE_FALSE(ExpressionParser::contains_markers("Paris is the capital of France."));
}

TEST_CASE("Sally plan is parsed in textual order", "[parser]") {
    const std::string text =
        "Sally has [FUNC add(3, 2) = y1] apples... multiplies by 3, [FUNC multiply(y1, 3) = y2] apples.";
    auto out = make_parser().parse(text);

    REQUIRE(out.diagnostics.empty());
    REQUIRE(out.calls.size() == 2);

    const auto& first = out.calls[0];
    REQUIRE(first.function_name == "add");
    REQUIRE(first.output_placeholder == "y1");
    REQUIRE(first.arguments.size() == 2);
    REQUIRE_FALSE(first.arguments[0].is_reference());
    REQUIRE(first.arguments[0].literal == 3);
    REQUIRE(first.arguments[1].literal == 2);
    REQUIRE(text.substr(first.source_span.begin, first.source_span.length) == "[FUNC add(3, 2) = y1]");

    const auto& second = out.calls[1];
    REQUIRE(second.function_name == "multiply");
    REQUIRE(second.arguments[0].is_reference());
    REQUIRE(second.arguments[0].reference == "y1");
    REQUIRE(second.arguments[1].literal == 3);
    REQUIRE(text.substr(second.source_span.begin, second.source_span.length) == "[FUNC multiply(y1, 3) = y2]");
}

TEST_CASE("Quoted arguments keep commas and escapes", "[parser]") {
    auto out = make_parser().parse(R"(Look up [FUNC search("a, b", 'it\'s') = y1] now.)");
    REQUIRE(out.calls.size() == 1);
    const auto& args = out.calls[0].arguments;
    REQUIRE(args.size() == 2);
    REQUIRE(args[0].literal == "a, b");
    REQUIRE(args[1].literal == "it's");
}

TEST_CASE("Nested brackets stay inside one argument", "[parser]") {
    auto out = make_parser().parse(R"([FUNC lookup(["a", "b"], {"k": 1}, (x, y)) = y1])");
    REQUIRE(out.diagnostics.empty());
    REQUIRE(out.calls.size() == 1);
    const auto& args = out.calls[0].arguments;
    REQUIRE(args.size() == 3);
    REQUIRE(args[0].literal.is_array());
    REQUIRE(args[0].literal.size() == 2);
    REQUIRE(args[1].literal.is_object());
    REQUIRE(args[1].literal["k"] == 1);
    REQUIRE(args[2].literal == "(x, y)");
}

TEST_CASE("Empty argument list", "[parser]") {
    auto out = make_parser().parse("It is [FUNC now() = y1].");
    REQUIRE(out.calls.size() == 1);
    REQUIRE(out.calls[0].arguments.empty());
}

TEST_CASE("Unknown function is inert", "[parser]") {
    auto out = make_parser().parse("Fly [FUNC teleport(1) = y1] and add [FUNC add(1, 1) = y2].");
    REQUIRE(out.calls.size() == 1);
    REQUIRE(out.calls[0].output_placeholder == "y2");
    REQUIRE(out.diagnostics.size() == 1);
    REQUIRE(out.diagnostics[0].kind == ParseDiagnostic::Kind::UNKNOWN_FUNCTION);
    REQUIRE(out.diagnostics[0].offset == 4);
}

TEST_CASE("Malformed marker is reported and skipped", "[parser]") {
    SECTION("missing closing paren") {
        auto out = make_parser().parse("[FUNC add(3, 2 = y1] then [FUNC add(1, 1) = y2]");
        REQUIRE(out.calls.size() == 1);
        REQUIRE(out.calls[0].output_placeholder == "y2");
        REQUIRE(out.diagnostics.size() == 1);
        REQUIRE(out.diagnostics[0].kind == ParseDiagnostic::Kind::MALFORMED);
        REQUIRE(out.diagnostics[0].offset == 0);
    }
    SECTION("empty argument") {
        auto out = make_parser().parse("[FUNC add(1, , 2) = y1]");
        REQUIRE(out.calls.empty());
        REQUIRE(out.diagnostics.size() == 1);
    }
    SECTION("missing placeholder") {
        auto out = make_parser().parse("[FUNC add(1, 2) = ]");
        REQUIRE(out.calls.empty());
        REQUIRE(out.diagnostics.size() == 1);
    }
    SECTION("unterminated string") {
        auto out = make_parser().parse(R"([FUNC echo("never closed) = y1])");
        REQUIRE(out.calls.empty());
        REQUIRE(out.diagnostics.size() == 1);
        REQUIRE(out.diagnostics[0].message.find("unterminated") != std::string::npos);
    }
    SECTION("no whitespace after marker") {
        auto out = make_parser().parse("[FUNCadd(1, 2) = y1]");
        REQUIRE(out.calls.empty());
        REQUIRE(out.diagnostics.size() == 1);
    }
}

TEST_CASE("Argument classification", "[parser]") {
    SECTION("quoted placeholder name is a string literal") {
        auto out = make_parser().parse(R"([FUNC add(1, 2) = y1] [FUNC echo("y1") = y2])");
        REQUIRE(out.calls.size() == 2);
        const auto& arg = out.calls[1].arguments[0];
        REQUIRE_FALSE(arg.is_reference());
        REQUIRE(arg.literal == "y1");
    }
    SECTION("forward reference is a reference") {
        auto out = make_parser().parse("[FUNC multiply(y2, 3) = y1] [FUNC add(1, 2) = y2]");
        REQUIRE(out.calls[0].arguments[0].is_reference());
        REQUIRE(out.calls[0].arguments[0].reference == "y2");
    }
    SECTION("undefined placeholder of the same shape is a reference") {
        auto out = make_parser().parse("[FUNC add(1, 2) = y1] [FUNC multiply(y5, 2) = y2]");
        REQUIRE(out.calls[1].arguments[0].is_reference());
        REQUIRE(out.calls[1].arguments[0].reference == "y5");
    }
    SECTION("bare words are string literals") {
        auto out = make_parser().parse("[FUNC echo(hello, x) = y1]");
        REQUIRE_FALSE(out.calls[0].arguments[0].is_reference());
        REQUIRE(out.calls[0].arguments[0].literal == "hello");
        REQUIRE(out.calls[0].arguments[1].literal == "x");
    }
    SECTION("scalar coercion") {
        auto out = make_parser().parse("[FUNC echo(42, 2.5, true, False, -7, 1e3) = y1]");
        const auto& args = out.calls[0].arguments;
        REQUIRE(args.size() == 6);
        REQUIRE(args[0].literal.is_number_integer());
        REQUIRE(args[0].literal == 42);
        REQUIRE(args[1].literal.is_number_float());
        REQUIRE(args[1].literal == 2.5);
        REQUIRE(args[2].literal == true);
        REQUIRE(args[3].literal == false);
        REQUIRE(args[4].literal == -7);
        REQUIRE(args[5].literal == 1000.0);
    }
    SECTION("apostrophe inside a bare word") {
        auto out = make_parser().parse("[FUNC search(Uber's revenue) = y1]");
        REQUIRE(out.diagnostics.empty());
        REQUIRE(out.calls[0].arguments[0].literal == "Uber's revenue");
    }
}
