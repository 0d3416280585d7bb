#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "compose/error.hpp"
#include "compose/redact.hpp"

using namespace compose;

static error redact_failure(const std::string& src){
    try { (void)redact_source(src); }
    catch(const error& e){ return e; }
    ADD_FAILURE() << "expected redaction of:\n" << src << "to fail";
    return error("no failure");
}

TEST(SplitLines, NewlinesAndCarriageReturns){
    EXPECT_TRUE(split_lines("").empty());
    EXPECT_EQ(split_lines("a\nb\n"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(split_lines("a\r\nb"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(split_lines("a\n\n"), (std::vector<std::string>{"a", ""}));
}

TEST(Redact, DirectiveFreeInputIsUnchanged){
    const std::string src = "fn main() {\n    // just a comment\n\n    run();\n}\n";
    EXPECT_EQ(redact_source(src), src);
    EXPECT_EQ(redact_source(redact_source(src)), src);
    EXPECT_EQ(redact_source(""), "");
}

TEST(Redact, MissingFinalNewlineIsAdded){
    EXPECT_EQ(redact_source("a\nb"), "a\nb\n");
}

TEST(Redact, PrivateLineGetsHint){
    const std::vector<std::string> in = {"fn f() -> u32 {", "    7 // compose::private", "}"};
    const std::vector<std::string> want = {"fn f() -> u32 {", "    // TODO: your code here.", "}"};
    EXPECT_EQ(redact_lines(in), want);
}

TEST(Redact, PrivateLineUnimplemented){
    const std::vector<std::string> in = {"fn f() {", "\tgo(); // compose::private(unimplemented)", "}"};
    const std::vector<std::string> want = {"fn f() {", "\t// TODO: your code here.", "\tunimplemented!()", "}"};
    EXPECT_EQ(redact_lines(in), want);
}

TEST(Redact, PrivateLineNoHint){
    const std::vector<std::string> in = {"struct S {", "    a: u8,", "    b: u8, // compose::private(no_hint)", "}"};
    const std::vector<std::string> want = {"struct S {", "    a: u8,", "}"};
    EXPECT_EQ(redact_lines(in), want);
}

TEST(Redact, NoHintAlsoSuppressesUnimplemented){
    const std::vector<std::string> in = {"a", "b // compose::private(no_hint, unimplemented)", "c"};
    EXPECT_EQ(redact_lines(in), (std::vector<std::string>{"a", "c"}));
}

TEST(Redact, BlockCollapsesToHint){
    const std::vector<std::string> in = {
        "fn f() {",
        "    // compose::begin_private(unimplemented)",
        "    let secret = 1;",
        "    let x = 2; // compose::private",
        "    secret + x",
        "    // compose::end_private",
        "}",
    };
    const std::vector<std::string> want = {"fn f() {", "    // TODO: your code here.", "    unimplemented!()", "}"};
    EXPECT_EQ(redact_lines(in), want);
}

TEST(Redact, NoHintBlockBetweenBlankLinesLeavesOneBlank){
    const std::vector<std::string> in = {
        "fn a() {}", "", "// compose::begin_private(no_hint)", "fn hidden() {}", "// compose::end_private", "", "fn b() {}",
    };
    EXPECT_EQ(redact_lines(in), (std::vector<std::string>{"fn a() {}", "", "fn b() {}"}));
}

TEST(Redact, NoHintCollapsesWhitespaceOnlyNeighbours){
    const std::vector<std::string> in = {
        "fn a() {}", "    ", "// compose::begin_private(no_hint)", "x", "// compose::end_private", "\t", "fn b() {}",
    };
    EXPECT_EQ(redact_lines(in), (std::vector<std::string>{"fn a() {}", "    ", "fn b() {}"}));
}

TEST(Redact, NoHintKeepsBlankLinesWhenOnlyOneSideIsBlank){
    const std::vector<std::string> in = {"fn a() {}", "", "// compose::begin_private(no_hint)", "x", "// compose::end_private", "fn b() {}"};
    EXPECT_EQ(redact_lines(in), (std::vector<std::string>{"fn a() {}", "", "fn b() {}"}));

    // Region at the very start or end of the file has no neighbour on that side.
    const std::vector<std::string> at_start = {"x // compose::private(no_hint)", "", "y"};
    EXPECT_EQ(redact_lines(at_start), (std::vector<std::string>{"", "y"}));
    const std::vector<std::string> at_end = {"y", "", "x // compose::private(no_hint)"};
    EXPECT_EQ(redact_lines(at_end), (std::vector<std::string>{"y", ""}));
}

TEST(Redact, ConsecutiveRegions){
    const std::vector<std::string> in = {"a // compose::private", "b // compose::private(no_hint)", "  c // compose::private"};
    EXPECT_EQ(redact_lines(in), (std::vector<std::string>{"// TODO: your code here.", "  // TODO: your code here."}));
}

TEST(Redact, UnpairedEndReportsLine){
    auto e = redact_failure("foo();\n// compose::end_private\n");
    const std::string msg = format_error(e);
    EXPECT_NE(msg.find("unpaired 'end_private'"), std::string::npos) << msg;
    EXPECT_NE(msg.find("line 2"), std::string::npos) << msg;
    EXPECT_EQ(e.line(), 2);
}

TEST(Redact, UnpairedEndAfterClosedBlock){
    auto e = redact_failure("// compose::begin_private\nx\n// compose::end_private\n// compose::end_private\n");
    EXPECT_EQ(e.line(), 4);
}

TEST(Redact, NestedBeginFails){
    auto e = redact_failure("// compose::begin_private\n// compose::begin_private\n// compose::end_private\n");
    const std::string msg = format_error(e);
    EXPECT_NE(msg.find("nested"), std::string::npos) << msg;
    EXPECT_EQ(e.line(), 2);
}

TEST(Redact, UnclosedBeginFails){
    auto e = redact_failure("a\n  // compose::begin_private\nb\n// compose::private\n");
    const std::string msg = format_error(e);
    EXPECT_NE(msg.find("unclosed 'begin_private'"), std::string::npos) << msg;
    EXPECT_EQ(e.line(), 2);
}

TEST(Redact, MalformedDirectiveNamesLine){
    auto e = redact_failure("a\nb\nc // compose::private(secret)\n");
    const auto chain = e.chain();
    ASSERT_EQ(chain.size(), 2u);
    EXPECT_EQ(chain[0], "failed to parse directive on line 3");
    EXPECT_EQ(chain[1], "unknown property: secret");
    EXPECT_EQ(e.line(), 3);
}

TEST(Redact, MalformedDirectiveInsideBlockFails){
    auto e = redact_failure("// compose::begin_private\n// compose::bogus\n// compose::end_private\n");
    EXPECT_EQ(e.line(), 2);
}
