#pragma once

/**
 * Markdown to Slack mrkdwn translation.
 *
 * Rewrites **bold** spans to Slack's *bold* form and reflows pipe tables into
 * monospace-aligned blocks inside a code fence, since Slack has no table
 * support. Everything else passes through untouched.
 */

#include <string>
#include <vector>

namespace gesbot {

using TableRow = std::vector<std::string>;

constexpr const char* CODE_FENCE = "```";  // Opens and closes a reflowed table.

// Translates standard markdown to Slack mrkdwn (bold rewrite, then table reflow).
std::string translate_markdown_for_slack(const std::string& text);

// Rewrites every complete **content** span on a line to *content*.
std::string rewrite_bold(const std::string& text);

// Replaces every table block with a fenced, column-aligned rendering.
std::string reflow_tables(const std::string& text);

// ========== Table Helpers ==========

// Returns true if the trimmed line starts and ends with '|'.
bool is_table_row(const std::string& line);

// Returns true for header/body separator rows such as |---|:--:|.
bool is_separator_row(const std::string& line);

// Splits a table row into trimmed cells, dropping the outer pipe segments.
TableRow split_table_cells(const std::string& line);

// Removes every '*' so emphasis markup takes no room in a column.
std::string strip_bold_markers(const std::string& text);

// Computes per-column widths; the header row decides the column count.
std::vector<size_t> column_widths(const std::vector<TableRow>& rows);

/**
 * Formats parsed table rows as aligned lines (without fences).
 *
 * Cells are left-justified to their column width and joined with " | ".
 * A dash line (runs joined with "-|-") follows the header when there is
 * more than one row. Cells past the header's column count are dropped.
 */
std::vector<std::string> format_table(const std::vector<TableRow>& rows);

// ========== Text Helpers ==========

// Strips leading and trailing whitespace (space, \t, \n, \r, \v, \f).
std::string trim(const std::string& text);

// Counts UTF-8 code points.
size_t display_width(const std::string& text);

// Splits on '\n'; a trailing newline yields a trailing empty line.
std::vector<std::string> split_lines(const std::string& text);

// Joins lines with '\n'.
std::string join_lines(const std::vector<std::string>& lines);

} // namespace gesbot
