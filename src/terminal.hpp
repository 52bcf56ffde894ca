#pragma once

namespace gesbot {
namespace terminal {

/**
 * Check if stdin is attached to a TTY.
 * Input is expected via pipeline, so a TTY here means nothing was piped in.
 */
bool stdin_is_tty();

/**
 * Check if stderr is a TTY (status messages are written there).
 */
bool stderr_is_tty();

/**
 * Check whether TERM allows ANSI colours (set and not "dumb").
 */
bool term_supports_color();

} // namespace terminal
} // namespace gesbot
