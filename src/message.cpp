#include "message.hpp"
#include "mrkdwn.hpp"
#include "verbose.hpp"

namespace gesbot {

using json = nlohmann::json;

namespace {
    OutgoingMessage markdown_message(const std::string& input) {
        OutgoingMessage message;
        message.kind = MessageKind::Text;
        message.text = translate_markdown_for_slack(input);
        return message;
    }
}

OutgoingMessage prepare_message(const std::string& input, bool text_only) {
    if (text_only) {
        return markdown_message(input);
    }

    json data = json::parse(input, nullptr, false);
    if (data.is_discarded()) {
        verbose_log("MESSAGE", "Input is not JSON, translating markdown");
        return markdown_message(input);
    }

    if (!data.is_object()) {
        throw MessageError("Message data must be a dictionary");
    }

    OutgoingMessage message;
    if (data.contains("blocks")) {
        message.kind = MessageKind::Blocks;
        message.blocks = data["blocks"];
        if (data.contains("text") && data["text"].is_string()) {
            message.text = data["text"].get<std::string>();
        }
        verbose_log("MESSAGE", "Block message with " + std::to_string(message.blocks.size()) + " blocks");
        return message;
    }

    if (data.contains("text")) {
        message.kind = MessageKind::Text;
        // Non-string text is sent as its JSON rendering.
        message.text = data["text"].is_string() ? data["text"].get<std::string>()
                                                : data["text"].dump();
        return message;
    }

    throw MessageError("Invalid message structure");
}

} // namespace gesbot
