#pragma once

/**
 * Slack Web API client for the gesbot CLI.
 *
 * Posts messages through chat.postMessage using libcurl for HTTP transport.
 */

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace gesbot {

/**
 * Slack answered with "ok": false.
 */
class SlackApiError : public std::runtime_error {
public:
    explicit SlackApiError(const std::string& error)
        : std::runtime_error("Slack API error: " + error), error_(error) {}

    // Slack error code, e.g. "channel_not_found".
    const std::string& error() const { return error_; }

private:
    std::string error_;
};

/**
 * User-facing description of a failed delivery.
 */
struct ErrorReport {
    std::string message;  // Main error line.
    std::string hint;     // Optional follow-up suggestion (empty if none).
};

// Maps a Slack error code to a message and hint for the given channel.
// formatted selects the wording for block messages.
ErrorReport describe_slack_error(const std::string& error,
                                 const std::string& channel,
                                 bool formatted);

// Builds a chat.postMessage body. Blocks are included only if non-null.
nlohmann::json build_post_body(const std::string& channel,
                               const std::string& text,
                               const nlohmann::json& blocks = nullptr);

/**
 * HTTP client for Slack's chat.postMessage.
 */
class SlackClient {
public:
    // Creates a client with the given bot token.
    explicit SlackClient(const std::string& bot_token);

    // Cleans up CURL global state.
    ~SlackClient();

    SlackClient(const SlackClient&) = delete;
    SlackClient& operator=(const SlackClient&) = delete;

    // Sends a mrkdwn text message. Returns Slack's reply.
    nlohmann::json send_message(const std::string& text, const std::string& channel);

    // Sends a Block Kit message with fallback text. Returns Slack's reply.
    nlohmann::json send_message_with_blocks(const nlohmann::json& blocks,
                                            const std::string& text,
                                            const std::string& channel);

private:
    std::string bot_token_;

    // Posts to chat.postMessage and checks the "ok" flag.
    nlohmann::json post_message(const nlohmann::json& body);

    // Performs an HTTP POST with JSON body.
    std::string http_post_json(const std::string& url, const nlohmann::json& body);
};

} // namespace gesbot
