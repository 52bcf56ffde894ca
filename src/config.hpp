#pragma once

/**
 * Application configuration constants.
 *
 * Defines environment variable names, .env lookup paths and Slack API
 * settings for the gesbot CLI.
 */

namespace gesbot {

// ========== Environment ==========

constexpr const char* TOKEN_ENV = "SLACK_BOT_TOKEN";    // Bot token (xoxb-...).
constexpr const char* CHANNEL_ENV = "SLACK_CHANNEL";    // Default destination.
constexpr const char* DEFAULT_CHANNEL = "#general";     // Used when SLACK_CHANNEL is unset.

// ========== .env Files ==========

constexpr const char* ENV_FILE = ".env";  // Checked in cwd, then $HOME, then parent dirs.

// ========== API Configuration ==========

constexpr const char* SLACK_API_BASE = "https://slack.com/api";  // Slack Web API base URL.
constexpr long REQUEST_TIMEOUT_SECONDS = 30;                     // Whole-request timeout.

// ========== Bot Identity ==========

constexpr const char* BOT_NAME = "GESBot";  // Name used in hints and usage text.

} // namespace gesbot
