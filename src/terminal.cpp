#include "terminal.hpp"

#ifdef _WIN32
#include <io.h>
#include <cstdio>
#define isatty _isatty
#define STDIN_FILENO 0
#define STDERR_FILENO 2
#else
#include <unistd.h>
#endif

#include <cstdlib>
#include <string>

namespace gesbot {
namespace terminal {

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) != 0;
}

bool stderr_is_tty() {
    return isatty(STDERR_FILENO) != 0;
}

bool term_supports_color() {
    const char* term = std::getenv("TERM");
    return term && std::string(term) != "dumb";
}

} // namespace terminal
} // namespace gesbot
