#include "console.hpp"
#include "terminal.hpp"

namespace gesbot {

Console::Console()
    : out_(&std::cerr),
      colors_enabled_(terminal::term_supports_color() && terminal::stderr_is_tty()) {}

Console::Console(std::ostream& out, bool colors_enabled)
    : out_(&out), colors_enabled_(colors_enabled) {}

void Console::println(const std::string& text) const {
    *out_ << text << std::endl;
}

void Console::print_line(const char* color, const std::string& text) const {
    if (colors_enabled_) {
        *out_ << color << text << ansi::RESET << std::endl;
    } else {
        *out_ << text << std::endl;
    }
}

void Console::print_error(const std::string& text) const {
    print_line(ansi::RED, "❌ " + text);
}

void Console::print_hint(const std::string& text) const {
    print_line(ansi::YELLOW, "💡 " + text);
}

void Console::print_success(const std::string& text) const {
    print_line(ansi::GREEN, "✅ " + text);
}

} // namespace gesbot
