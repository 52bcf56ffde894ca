#pragma once

/**
 * Turns piped input into a Slack message.
 *
 * Input is either a JSON message ({"text": ...} or {"blocks": [...]}) sent
 * as-is, or plain markdown translated to Slack mrkdwn.
 */

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace gesbot {

enum class MessageKind {
    Text,    // Plain chat.postMessage text.
    Blocks   // Block Kit layout with fallback text.
};

struct OutgoingMessage {
    MessageKind kind = MessageKind::Text;
    std::string text;       // Message text, or notification fallback for blocks.
    nlohmann::json blocks;  // Block Kit array when kind is Blocks.
};

// Raised when the input is JSON but not a usable message.
class MessageError : public std::runtime_error {
public:
    explicit MessageError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Builds the outgoing message for the given input.
 *
 * With text_only, or when input is not valid JSON, the input is treated as
 * markdown and translated. JSON objects must carry "blocks" or "text";
 * anything else throws MessageError.
 */
OutgoingMessage prepare_message(const std::string& input, bool text_only);

} // namespace gesbot
