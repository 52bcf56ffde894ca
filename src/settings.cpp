#include "settings.hpp"
#include "config.hpp"
#include "mrkdwn.hpp"
#include "verbose.hpp"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <cstdlib>

namespace gesbot {

namespace fs = std::filesystem;

namespace {
    bool token_is_set() {
        const char* token = std::getenv(TOKEN_ENV);
        return token && *token;
    }

    // Reads a double-quoted value starting after the opening quote.
    std::string unquote_double(const std::string& raw) {
        std::string value;
        for (size_t i = 0; i < raw.size(); ++i) {
            char c = raw[i];
            if (c == '"') {
                break;
            }
            if (c == '\\' && i + 1 < raw.size()) {
                char next = raw[++i];
                switch (next) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case 'r': value += '\r'; break;
                    case '"': value += '"'; break;
                    case '\\': value += '\\'; break;
                    default:
                        value += '\\';
                        value += next;
                }
                continue;
            }
            value += c;
        }
        return value;
    }

    std::string parse_value(const std::string& raw) {
        if (raw.empty()) {
            return raw;
        }
        if (raw[0] == '"') {
            return unquote_double(raw.substr(1));
        }
        if (raw[0] == '\'') {
            size_t close = raw.find('\'', 1);
            return raw.substr(1, close == std::string::npos ? std::string::npos : close - 1);
        }

        std::string value = raw;
        size_t comment = value.find(" #");
        if (comment != std::string::npos) {
            value.erase(comment);
        }
        return trim(value);
    }
}

EnvEntries parse_env(const std::string& content) {
    EnvEntries entries;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            verbose_log("ENV", "Skipping line without '=': " + truncate(line, 40));
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        if (key.empty()) {
            continue;
        }

        entries.emplace_back(key, parse_value(trim(line.substr(eq + 1))));
    }

    return entries;
}

bool load_env_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    for (const auto& [key, value] : parse_env(buffer.str())) {
        if (std::getenv(key.c_str())) {
            verbose_log("ENV", key + " already set, keeping existing value");
            continue;
        }
        setenv(key.c_str(), value.c_str(), 0);
    }

    verbose_log("ENV", "Loaded " + path);
    return true;
}

void load_env_with_fallback() {
    if (fs::exists(ENV_FILE)) {
        load_env_file(ENV_FILE);
    }

    if (!token_is_set()) {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            fs::path home_env = fs::path(home) / ENV_FILE;
            if (fs::exists(home_env)) {
                load_env_file(home_env.string());
            }
        }
    }

    if (!token_is_set()) {
        std::error_code ec;
        fs::path dir = fs::current_path(ec);
        if (ec) {
            verbose_err("ENV", "Cannot determine current directory: " + ec.message());
            return;
        }

        // Walk up the parents looking for the nearest .env.
        while (dir.has_parent_path() && dir.parent_path() != dir) {
            dir = dir.parent_path();
            fs::path candidate = dir / ENV_FILE;
            if (fs::exists(candidate)) {
                load_env_file(candidate.string());
                break;
            }
        }
    }
}

Settings load_settings() {
    Settings settings;

    const char* token = std::getenv(TOKEN_ENV);
    if (token) {
        settings.bot_token = token;
    }

    const char* channel = std::getenv(CHANNEL_ENV);
    settings.default_channel = (channel && *channel) ? channel : DEFAULT_CHANNEL;

    return settings;
}

} // namespace gesbot
