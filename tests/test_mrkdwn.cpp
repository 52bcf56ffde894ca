#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "mrkdwn.hpp"
#include <string>
#include <vector>

using namespace gesbot;

// Wraps content lines in the code fence used for reflowed tables.
std::string fenced(const std::vector<std::string>& lines) {
    std::string result = "```\n";
    for (const auto& line : lines) {
        result += line + "\n";
    }
    return result + "```";
}

// ============================================================================
// Bold rewriting
// ============================================================================

TEST_CASE("Bold span becomes single asterisks", "[mrkdwn][bold]") {
    std::string result = translate_markdown_for_slack("**hi**");
    REQUIRE(result == "*hi*");
    REQUIRE(result.find("**hi**") == std::string::npos);
}

TEST_CASE("Multiple bold spans on one line", "[mrkdwn][bold]") {
    REQUIRE(rewrite_bold("**hi** and **there**") == "*hi* and *there*");
}

TEST_CASE("Adjacent bold spans are matched independently", "[mrkdwn][bold]") {
    REQUIRE(rewrite_bold("**a****b**") == "*a**b*");
}

TEST_CASE("Unclosed bold marker is left alone", "[mrkdwn][bold]") {
    REQUIRE(translate_markdown_for_slack("**unclosed") == "**unclosed");
}

TEST_CASE("Empty bold span collapses", "[mrkdwn][bold]") {
    REQUIRE(rewrite_bold("****") == "**");
}

TEST_CASE("Bold span does not cross a line break", "[mrkdwn][bold]") {
    REQUIRE(rewrite_bold("**a\nb**") == "**a\nb**");
}

TEST_CASE("Bold span may contain a carriage return", "[mrkdwn][bold]") {
    REQUIRE(rewrite_bold("**a\rb**") == "*a\rb*");
}

TEST_CASE("Unclosed marker on one line does not pair with the next", "[mrkdwn][bold]") {
    REQUIRE(rewrite_bold("**open\n**closed**") == "**open\n*closed*");
}

TEST_CASE("Very long unclosed bold line is copied through", "[mrkdwn][bold][long]") {
    std::string input = "**" + std::string(200000, 'a');
    REQUIRE(translate_markdown_for_slack(input) == input);
}

TEST_CASE("Very long bold span is rewritten", "[mrkdwn][bold][long]") {
    std::string content(200000, 'a');
    REQUIRE(translate_markdown_for_slack("**" + content + "**") == "*" + content + "*");
}

TEST_CASE("Single asterisks are untouched", "[mrkdwn][bold]") {
    REQUIRE(rewrite_bold("*already* slack") == "*already* slack");
}

// ============================================================================
// Row classification
// ============================================================================

TEST_CASE("Table row detection", "[mrkdwn][table]") {
    REQUIRE(is_table_row("|a|b|"));
    REQUIRE(is_table_row("   | a | b |  "));
    REQUIRE(is_table_row("|a|b|\r"));
    REQUIRE(is_table_row("|"));
    REQUIRE_FALSE(is_table_row("a | b"));
    REQUIRE_FALSE(is_table_row("| a | b"));
    REQUIRE_FALSE(is_table_row(""));
}

TEST_CASE("Separator row detection", "[mrkdwn][table]") {
    REQUIRE(is_separator_row("|---|---|"));
    REQUIRE(is_separator_row("|:--|--:|"));
    REQUIRE(is_separator_row("| :---: | --- |"));
    REQUIRE(is_separator_row("| |"));
    REQUIRE_FALSE(is_separator_row("|a|---|"));
    REQUIRE_FALSE(is_separator_row("||"));
    REQUIRE_FALSE(is_separator_row("|"));
}

TEST_CASE("Very long separator row is discarded", "[mrkdwn][table][long]") {
    std::string row = "|" + std::string(200000, '-') + "|";
    REQUIRE(is_separator_row(row));
    REQUIRE(translate_markdown_for_slack("|H|\n" + row + "\n|x|") ==
            "```\nH\n-\nx\n```");
}

TEST_CASE("Cells are split and trimmed", "[mrkdwn][table]") {
    REQUIRE(split_table_cells("| Name | Age |") == TableRow{"Name", "Age"});
    REQUIRE(split_table_cells("|a||c|") == TableRow{"a", "", "c"});
    REQUIRE(split_table_cells("|").empty());
}

// ============================================================================
// Widths and formatting
// ============================================================================

TEST_CASE("Width ignores emphasis markers", "[mrkdwn][width]") {
    std::vector<TableRow> rows = {{"Name"}, {"*Bob*"}, {"*Al*"}};
    REQUIRE(column_widths(rows) == std::vector<size_t>{4});

    std::vector<TableRow> wide = {{"A"}, {"*Bobby*"}};
    REQUIRE(column_widths(wide) == std::vector<size_t>{5});
}

TEST_CASE("Width counts UTF-8 code points", "[mrkdwn][width]") {
    REQUIRE(display_width("caf\xC3\xA9") == 4);
    std::vector<TableRow> rows = {{"x"}, {"caf\xC3\xA9"}};
    REQUIRE(column_widths(rows) == std::vector<size_t>{4});
}

TEST_CASE("Header decides column count", "[mrkdwn][width]") {
    std::vector<TableRow> rows = {{"A"}, {"1", "22222", "3"}};
    REQUIRE(column_widths(rows) == std::vector<size_t>{1});
}

TEST_CASE("Format table pads cells and adds dash line", "[mrkdwn][format]") {
    std::vector<TableRow> rows = {{"Name", "Age"}, {"Bob", "30"}};
    std::vector<std::string> expected = {"Name | Age", "-----|----", "Bob  | 30 "};
    REQUIRE(format_table(rows) == expected);
}

TEST_CASE("Format table strips asterisks from cells", "[mrkdwn][format]") {
    std::vector<TableRow> rows = {{"*Total*", "5"}, {"x", "10"}};
    std::vector<std::string> expected = {"Total | 5 ", "------|---", "x     | 10"};
    REQUIRE(format_table(rows) == expected);
}

TEST_CASE("Format table of no rows is empty", "[mrkdwn][format]") {
    REQUIRE(format_table({}).empty());
}

// ============================================================================
// Table reflow
// ============================================================================

TEST_CASE("Single row table has no dash line", "[mrkdwn][table]") {
    REQUIRE(translate_markdown_for_slack("|a|bb|") == fenced({"a | bb"}));
}

TEST_CASE("Header, separator and data row", "[mrkdwn][table]") {
    std::string input = "|Name|Age|\n|---|---|\n|Bob|30|";
    REQUIRE(translate_markdown_for_slack(input) ==
            fenced({"Name | Age", "-----|----", "Bob  | 30 "}));
}

TEST_CASE("Bold cell is measured without markers", "[mrkdwn][table]") {
    std::string input = "|Name|\n|---|\n|**Bob**|";
    REQUIRE(translate_markdown_for_slack(input) == fenced({"Name", "----", "Bob "}));
}

TEST_CASE("Short data row renders only its own cells", "[mrkdwn][table]") {
    std::string input = "|A|B|C|\n|---|---|---|\n|1|\n|22|333|";
    REQUIRE(translate_markdown_for_slack(input) ==
            fenced({"A  | B   | C", "---|-----|--", "1 ", "22 | 333"}));
}

TEST_CASE("Cells beyond the header are dropped", "[mrkdwn][table]") {
    std::string input = "|A|\n|---|\n|1|2|3|";
    REQUIRE(translate_markdown_for_slack(input) == fenced({"A", "-", "1"}));
}

TEST_CASE("Table of only separator rows gives an empty fence", "[mrkdwn][table]") {
    REQUIRE(translate_markdown_for_slack("|---|---|\n|:-:|:-:|") == "```\n```");
}

TEST_CASE("Lone pipe renders as one empty row", "[mrkdwn][table]") {
    REQUIRE(translate_markdown_for_slack("|") == "```\n\n```");
}

TEST_CASE("Indented table is detected", "[mrkdwn][table]") {
    REQUIRE(translate_markdown_for_slack("  | a | b |  ") == fenced({"a | b"}));
}

TEST_CASE("Text between tables separates blocks", "[mrkdwn][table]") {
    std::string input = "|a|\n|b|\nbreak\n|c|";
    REQUIRE(translate_markdown_for_slack(input) ==
            "```\na\n-\nb\n```\nbreak\n```\nc\n```");
}

TEST_CASE("Line without closing pipe ends the table", "[mrkdwn][table]") {
    std::string input = "|x|y|\n| not a row";
    REQUIRE(translate_markdown_for_slack(input) == "```\nx | y\n```\n| not a row");
}

// ============================================================================
// Whole documents
// ============================================================================

TEST_CASE("Plain text passes through unchanged", "[mrkdwn]") {
    std::string input = "Hello world\n\n- item one\n- item two\n`code` and a | pipe\n";
    REQUIRE(translate_markdown_for_slack(input) == input);
}

TEST_CASE("Empty input stays empty", "[mrkdwn]") {
    REQUIRE(translate_markdown_for_slack("").empty());
}

TEST_CASE("Paragraphs around a table keep their order", "[mrkdwn]") {
    std::string input = "Intro\n|H1|H2|\n|--|--|\n|x|y|\nOutro";
    REQUIRE(translate_markdown_for_slack(input) ==
            "Intro\n```\nH1 | H2\n---|---\nx  | y \n```\nOutro");
}

TEST_CASE("Trailing newline is preserved after a table", "[mrkdwn]") {
    std::string input = "|Name|Age|\n|---|---|\n|Bob|30|\n";
    REQUIRE(translate_markdown_for_slack(input) ==
            fenced({"Name | Age", "-----|----", "Bob  | 30 "}) + "\n");
}

TEST_CASE("Bold outside and inside a table", "[mrkdwn]") {
    std::string input = "**Report**\n|**Total**|5|\n|x|10|";
    REQUIRE(translate_markdown_for_slack(input) ==
            "*Report*\n" + fenced({"Total | 5 ", "------|---", "x     | 10"}));
}

TEST_CASE("Carriage returns on plain lines are kept", "[mrkdwn]") {
    REQUIRE(translate_markdown_for_slack("one\r\ntwo") == "one\r\ntwo");
}

// ============================================================================
// Text helpers
// ============================================================================

TEST_CASE("Split and join lines round trip", "[mrkdwn][text]") {
    REQUIRE(split_lines("a\nb\n") == std::vector<std::string>{"a", "b", ""});
    REQUIRE(split_lines("") == std::vector<std::string>{""});
    REQUIRE(join_lines({"a", "b", ""}) == "a\nb\n");
}

TEST_CASE("Trim strips all ASCII whitespace", "[mrkdwn][text]") {
    REQUIRE(trim(" \t x y \r\n") == "x y");
    REQUIRE(trim("   ").empty());
}
