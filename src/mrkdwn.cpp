#include "mrkdwn.hpp"
#include <algorithm>
#include <iterator>

namespace gesbot {

namespace {
    constexpr const char* WHITESPACE = " \t\n\r\v\f";
    constexpr const char* SEPARATOR_CHARS = " \t\n\r\v\f-|:";

    // Left-justifies text to the given display width.
    std::string pad_right(const std::string& text, size_t width) {
        size_t current = display_width(text);
        if (current >= width) {
            return text;
        }
        return text + std::string(width - current, ' ');
    }

    std::string join(const std::vector<std::string>& parts, const std::string& separator) {
        std::string result;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) result += separator;
            result += parts[i];
        }
        return result;
    }

    // Renders one table block, fences included, onto out.
    void emit_table(const std::vector<std::string>& block, std::vector<std::string>& out) {
        std::vector<TableRow> rows;
        for (const auto& line : block) {
            std::string trimmed = trim(line);
            if (is_separator_row(trimmed)) {
                continue;
            }
            rows.push_back(split_table_cells(trimmed));
        }

        out.push_back(CODE_FENCE);
        for (auto& formatted : format_table(rows)) {
            out.push_back(std::move(formatted));
        }
        out.push_back(CODE_FENCE);
    }
}

std::string translate_markdown_for_slack(const std::string& text) {
    return reflow_tables(rewrite_bold(text));
}

std::string rewrite_bold(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    size_t line_end = 0;
    while (pos < text.size()) {
        size_t open = text.find("**", pos);
        if (open == std::string::npos) {
            break;
        }
        if (open >= line_end) {
            line_end = text.find('\n', open);
            if (line_end == std::string::npos) {
                line_end = text.size();
            }
        }

        result.append(text, pos, open - pos);

        // Nearest closing marker on the same line.
        size_t close = open + 2;
        while (close + 1 < line_end && !(text[close] == '*' && text[close + 1] == '*')) {
            ++close;
        }

        if (close + 1 < line_end) {
            result += '*';
            result.append(text, open + 2, close - open - 2);
            result += '*';
            pos = close + 2;
        } else {
            // No closing marker before the line ends, so nothing later on it matches either.
            result.append(text, open, line_end - open);
            pos = line_end;
        }
    }

    if (pos < text.size()) {
        result.append(text, pos, std::string::npos);
    }
    return result;
}

std::string reflow_tables(const std::string& text) {
    enum class State { Normal, Table };

    std::vector<std::string> lines = split_lines(text);
    std::vector<std::string> result;
    std::vector<std::string> block;
    State state = State::Normal;

    for (const auto& line : lines) {
        bool row = is_table_row(line);

        if (state == State::Table && !row) {
            emit_table(block, result);
            block.clear();
            state = State::Normal;
        }

        if (row) {
            block.push_back(line);
            state = State::Table;
        } else {
            result.push_back(line);
        }
    }

    if (state == State::Table) {
        emit_table(block, result);
    }

    return join_lines(result);
}

bool is_table_row(const std::string& line) {
    std::string trimmed = trim(line);
    return !trimmed.empty() && trimmed.front() == '|' && trimmed.back() == '|';
}

bool is_separator_row(const std::string& line) {
    std::string trimmed = trim(line);
    return trimmed.size() >= 3 && trimmed.front() == '|' && trimmed.back() == '|' &&
           trimmed.find_first_not_of(SEPARATOR_CHARS, 1) >= trimmed.size() - 1;
}

TableRow split_table_cells(const std::string& line) {
    std::string trimmed = trim(line);

    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t pipe = trimmed.find('|', start);
        if (pipe == std::string::npos) {
            segments.push_back(trimmed.substr(start));
            break;
        }
        segments.push_back(trimmed.substr(start, pipe - start));
        start = pipe + 1;
    }

    // Outer segments sit before the leading and after the trailing pipe.
    TableRow cells;
    for (size_t i = 1; i + 1 < segments.size(); ++i) {
        cells.push_back(trim(segments[i]));
    }
    return cells;
}

std::string strip_bold_markers(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(result),
                 [](char c) { return c != '*'; });
    return result;
}

std::vector<size_t> column_widths(const std::vector<TableRow>& rows) {
    if (rows.empty()) {
        return {};
    }

    size_t num_cols = rows.front().size();
    std::vector<size_t> widths(num_cols, 0);

    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < num_cols; ++i) {
            widths[i] = std::max(widths[i], display_width(strip_bold_markers(row[i])));
        }
    }
    return widths;
}

std::vector<std::string> format_table(const std::vector<TableRow>& rows) {
    std::vector<std::string> formatted_rows;
    if (rows.empty()) {
        return formatted_rows;
    }

    std::vector<size_t> widths = column_widths(rows);
    size_t num_cols = widths.size();

    for (size_t row_idx = 0; row_idx < rows.size(); ++row_idx) {
        const TableRow& row = rows[row_idx];

        std::vector<std::string> cells;
        for (size_t i = 0; i < row.size() && i < num_cols; ++i) {
            cells.push_back(pad_right(strip_bold_markers(row[i]), widths[i]));
        }
        formatted_rows.push_back(join(cells, " | "));

        // Header gets a dash line when a body follows.
        if (row_idx == 0 && rows.size() > 1) {
            std::vector<std::string> dashes;
            for (size_t w : widths) {
                dashes.emplace_back(w, '-');
            }
            formatted_rows.push_back(join(dashes, "-|-"));
        }
    }

    return formatted_rows;
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(WHITESPACE);
    return text.substr(start, end - start + 1);
}

size_t display_width(const std::string& text) {
    size_t width = 0;
    for (size_t i = 0; i < text.length(); ) {
        unsigned char c = text[i];
        if ((c & 0x80) == 0) {
            // ASCII (1 byte)
            i++;
        } else if ((c & 0xE0) == 0xC0) {
            i += 2;
        } else if ((c & 0xF0) == 0xE0) {
            i += 3;
        } else if ((c & 0xF8) == 0xF0) {
            i += 4;
        } else {
            // Stray continuation byte, count it as its own column
            i++;
        }
        width++;
    }
    return width;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t pos;
    while ((pos = text.find('\n', start)) != std::string::npos) {
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    lines.push_back(text.substr(start));
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    return join(lines, "\n");
}

} // namespace gesbot
