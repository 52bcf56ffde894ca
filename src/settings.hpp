#pragma once

/**
 * Configuration loading for the gesbot CLI.
 *
 * Settings come from the process environment, optionally seeded from .env
 * files. Variables that are already set are never overridden.
 */

#include <string>
#include <vector>
#include <utility>

namespace gesbot {

using EnvEntries = std::vector<std::pair<std::string, std::string>>;

/**
 * Settings needed to deliver a message.
 */
struct Settings {
    std::string bot_token;        // Slack bot token from SLACK_BOT_TOKEN.
    std::string default_channel;  // SLACK_CHANNEL, or #general.

    // Returns true if a bot token is available.
    bool is_valid() const {
        return !bot_token.empty();
    }
};

/**
 * Parses .env content into ordered key/value pairs.
 *
 * Supports KEY=VALUE lines, an optional "export " prefix, # comments, single
 * and double quoted values (double quotes honour \n, \t, \" and \\), and
 * trailing " # comment" on unquoted values. Malformed lines are skipped.
 */
EnvEntries parse_env(const std::string& content);

// Applies a .env file to the environment without overriding existing
// variables. Returns false if the file could not be read.
bool load_env_file(const std::string& path);

/**
 * Loads .env files in order until SLACK_BOT_TOKEN is set:
 *   1. ./.env (always applied if present)
 *   2. ~/.env
 *   3. the nearest .env in a parent of the current directory
 */
void load_env_with_fallback();

// Reads settings from the environment.
Settings load_settings();

} // namespace gesbot
