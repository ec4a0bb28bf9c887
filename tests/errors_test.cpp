#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "sexp/parser.hpp"

using namespace sexp;

namespace {

using strings = std::vector<std::string>;

syntax_error expect_syntax_error(const std::string& src, const parse_options& opts = {}){
    try {
        parse_program(src, opts);
    } catch (const syntax_error& e) {
        return e;
    }
    ADD_FAILURE() << "no syntax_error for: " << src;
    return syntax_error("", 0, 0, 0, {});
}

} // namespace

TEST(SyntaxErrors, StrayCloserAtTopLevel){
    auto e = expect_syntax_error(")");
    EXPECT_EQ(e.offset(), 0u);
    EXPECT_EQ(e.line(), 1u);
    EXPECT_EQ(e.column(), 1u);
    EXPECT_EQ(e.expected(), (strings{"prefix", "list", "string", "ident", "end of input"}));
}

TEST(SyntaxErrors, StrayCloserAfterAtoms){
    auto e = expect_syntax_error("(a) b ]");
    EXPECT_EQ(e.offset(), 6u);
    EXPECT_EQ(e.expected().back(), "end of input");
}

TEST(SyntaxErrors, UnclosedList){
    auto e = expect_syntax_error("(a");
    EXPECT_EQ(e.offset(), 2u);
    EXPECT_EQ(e.expected(), (strings{"prefix", "list", "string", "ident", "')'"}));

    auto nested = expect_syntax_error("(a (b c)");
    EXPECT_EQ(nested.offset(), 8u);
    EXPECT_EQ(nested.expected().back(), "')'");
}

TEST(SyntaxErrors, MismatchedCloser){
    auto round = expect_syntax_error("(a]");
    EXPECT_EQ(round.offset(), 2u);
    EXPECT_EQ(round.expected().back(), "')'");

    auto square = expect_syntax_error("[a)");
    EXPECT_EQ(square.offset(), 2u);
    EXPECT_EQ(square.expected().back(), "']'");

    auto curly = expect_syntax_error("{a b)");
    EXPECT_EQ(curly.offset(), 4u);
    EXPECT_EQ(curly.expected().back(), "'}'");
}

TEST(SyntaxErrors, DanglingPrefix){
    const strings body{"list", "string", "ident"};

    auto e = expect_syntax_error("'");
    EXPECT_EQ(e.offset(), 1u);
    EXPECT_EQ(e.expected(), body);

    // whitespace after the marker is consumed before the failure
    auto inside = expect_syntax_error("(' )");
    EXPECT_EQ(inside.offset(), 3u);
    EXPECT_EQ(inside.expected(), body);

    auto splice = expect_syntax_error(",@");
    EXPECT_EQ(splice.offset(), 2u);
    EXPECT_EQ(splice.expected(), body);
}

TEST(SyntaxErrors, LineAndColumn){
    auto e = expect_syntax_error("a\n)");
    EXPECT_EQ(e.offset(), 2u);
    EXPECT_EQ(e.line(), 2u);
    EXPECT_EQ(e.column(), 1u);

    auto deeper = expect_syntax_error("(x\n  y\n  ]");
    EXPECT_EQ(deeper.offset(), 9u);
    EXPECT_EQ(deeper.line(), 3u);
    EXPECT_EQ(deeper.column(), 3u);
}

TEST(SyntaxErrors, MessageNamesSourceAndAlternatives){
    parse_options opts;
    opts.source_name = "forms.sx";
    auto e = expect_syntax_error("(a", opts);
    EXPECT_EQ(e.source(), "forms.sx");
    EXPECT_EQ(std::string(e.what()),
              "forms.sx:1:3: syntax error at byte 2: expected one of: prefix, list, string, ident, ')'");
}

TEST(SyntaxErrors, SameInputSameError){
    const std::string src = "(define (f x) [x y)";
    auto first = expect_syntax_error(src);
    for(int i = 0; i < 5; ++i){
        auto again = expect_syntax_error(src);
        EXPECT_EQ(again.offset(), first.offset());
        EXPECT_EQ(again.expected(), first.expected());
        EXPECT_EQ(std::string(again.what()), std::string(first.what()));
    }
}

TEST(SyntaxErrors, CaughtAsParseError){
    EXPECT_THROW(parse_program("("), parse_error);
    EXPECT_THROW(parse_program("("), std::runtime_error);
}

TEST(FormatExpected, SingleAndMany){
    EXPECT_EQ(format_expected({"ident"}), "expected ident");
    EXPECT_EQ(format_expected({"list", "string"}), "expected one of: list, string");
}

TEST(NestingLimit, ConfiguredDepth){
    parse_options opts;
    opts.max_depth = 3;
    EXPECT_NO_THROW(parse_program("(((a)))", opts));
    EXPECT_NO_THROW(parse_program("((a) [b] {c})", opts));
    try {
        parse_program("((((a))))", opts);
        FAIL() << "expected nesting_error";
    } catch (const nesting_error& e) {
        EXPECT_EQ(e.offset(), 3u);
        EXPECT_EQ(e.limit(), 3u);
    }
}

TEST(NestingLimit, DefaultStopsRunawayInput){
    const std::string deep(10000, '(');
    try {
        parse_program(deep);
        FAIL() << "expected nesting_error";
    } catch (const nesting_error& e) {
        EXPECT_EQ(e.offset(), 256u);
        EXPECT_EQ(e.limit(), 256u);
    }
}

TEST(NestingLimit, DepthCountsOnlyOpenLists){
    parse_options opts;
    opts.max_depth = 2;
    // many siblings at depth 2 are fine
    EXPECT_NO_THROW(parse_program("((a) (b) (c) (d)) ((e))", opts));
}

TEST(SpanOverflow, LongIdent){
    const std::string src(70000, 'x');
    try {
        parse_program(src);
        FAIL() << "expected span_range_error";
    } catch (const span_range_error& e) {
        EXPECT_EQ(e.start(), 0u);
        EXPECT_EQ(e.length(), 70000u);
    }
}

TEST(SpanOverflow, LongListOfShortAtoms){
    std::string src = "(";
    for(int i = 0; i < 40000; ++i) src += "a ";
    src += ")";
    try {
        parse_program(src);
        FAIL() << "expected span_range_error";
    } catch (const span_range_error& e) {
        EXPECT_EQ(e.start(), 0u);
        EXPECT_EQ(e.length(), src.size());
    }
}

TEST(SpanOverflow, LongString){
    const std::string src = "\"" + std::string(70000, 's') + "\"";
    try {
        parse_program(src);
        FAIL() << "expected span_range_error";
    } catch (const span_range_error& e) {
        EXPECT_EQ(e.start(), 0u);
        EXPECT_EQ(e.length(), 70002u);
    }
}

TEST(SpanOverflow, PrefixPushesShortBodyPastTheLimit){
    // the body alone fits; marker plus padding plus body does not
    const std::string src = "'" + std::string(max_span_length, ' ') + "a";
    try {
        parse_program(src);
        FAIL() << "expected span_range_error";
    } catch (const span_range_error& e) {
        EXPECT_EQ(e.start(), 0u);
        EXPECT_EQ(e.length(), max_span_length + 2);
    }
}

TEST(SpanOverflow, AtomAtTheLimitIsAccepted){
    const std::string src(max_span_length, 'x');
    auto p = parse_program(src);
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p[0]->loc.len(), max_span_length);
}

TEST(TryParse, Success){
    auto r = try_parse("(a) b");
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.atoms.size(), 2u);
    EXPECT_FALSE(r.diagnostic);
}

TEST(TryParse, SyntaxDiagnostic){
    auto r = try_parse("(a");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.atoms.empty());
    ASSERT_TRUE(r.diagnostic);
    EXPECT_EQ(r.diagnostic->code, code_syntax_error);
    EXPECT_EQ(r.diagnostic->offset, 2u);
    EXPECT_EQ(r.diagnostic->line, 1u);
    EXPECT_EQ(r.diagnostic->column, 3u);
    EXPECT_EQ(r.diagnostic->expected.back(), "')'");
}

TEST(TryParse, NestingDiagnostic){
    parse_options opts;
    opts.max_depth = 3;
    auto r = try_parse("a\n((((a))))", opts);
    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.diagnostic);
    EXPECT_EQ(r.diagnostic->code, code_nesting_limit);
    EXPECT_EQ(r.diagnostic->offset, 5u);
    EXPECT_EQ(r.diagnostic->line, 2u);
    EXPECT_EQ(r.diagnostic->column, 4u);
    EXPECT_TRUE(r.diagnostic->expected.empty());
}

TEST(TryParse, SpanRangeDiagnostic){
    auto r = try_parse("ok " + std::string(70000, 'y'));
    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.diagnostic);
    EXPECT_EQ(r.diagnostic->code, code_span_range);
    EXPECT_EQ(r.diagnostic->offset, 3u);
    EXPECT_EQ(r.diagnostic->column, 4u);
}
