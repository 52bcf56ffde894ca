#include "slack_client.hpp"
#include "config.hpp"
#include "verbose.hpp"
#include <curl/curl.h>

namespace gesbot {

using json = nlohmann::json;

// CURL write callback for collecting response data into a string.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

ErrorReport describe_slack_error(const std::string& error,
                                 const std::string& channel,
                                 bool formatted) {
    std::string what = formatted ? "formatted message" : "message";

    if (error == "missing_scope") {
        return {"Error sending " + what + ": " + error,
                "Your token needs 'chat:write' scope to send messages"};
    }
    if (error == "channel_not_found") {
        return {"Channel " + channel + " not found or bot doesn't have access", ""};
    }
    if (error == "not_in_channel") {
        return {std::string(BOT_NAME) + " is not a member of " + channel,
                std::string("Add ") + BOT_NAME + " to the channel first: /invite @" + BOT_NAME};
    }
    return {"Error sending " + what + ": " + error, ""};
}

json build_post_body(const std::string& channel, const std::string& text, const json& blocks) {
    json body = {
        {"channel", channel},
        {"text", text},
        {"mrkdwn", true}
    };
    if (!blocks.is_null()) {
        body["blocks"] = blocks;
    }
    return body;
}

SlackClient::SlackClient(const std::string& bot_token) : bot_token_(bot_token) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

SlackClient::~SlackClient() {
    curl_global_cleanup();
}

json SlackClient::send_message(const std::string& text, const std::string& channel) {
    return post_message(build_post_body(channel, text));
}

json SlackClient::send_message_with_blocks(const json& blocks,
                                           const std::string& text,
                                           const std::string& channel) {
    return post_message(build_post_body(channel, text, blocks));
}

json SlackClient::post_message(const json& body) {
    std::string response = http_post_json(std::string(SLACK_API_BASE) + "/chat.postMessage", body);

    json reply = json::parse(response, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        throw std::runtime_error("Unexpected response from Slack: " + truncate(response, 200));
    }

    if (!reply.value("ok", false)) {
        std::string error = reply.value("error", "unknown_error");
        verbose_err("SLACK", "chat.postMessage failed: " + error);
        throw SlackApiError(error);
    }

    if (reply.contains("warning")) {
        verbose_log("SLACK", "Warning: " + reply["warning"].dump());
    }
    return reply;
}

std::string SlackClient::http_post_json(const std::string& url, const json& body) {
    std::string body_str = body.dump();
    verbose_out("CURL", "POST " + url);
    verbose_out("CURL", "Authorization: Bearer " + redact(bot_token_));
    verbose_out("CURL", "Body: " + format_json_compact(body_str));

    CURL* curl = curl_easy_init();
    if (!curl) {
        verbose_err("CURL", "Failed to initialize CURL");
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string response;

    struct curl_slist* headers = nullptr;
    std::string auth_header = "Authorization: Bearer " + bot_token_;
    headers = curl_slist_append(headers, auth_header.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json; charset=utf-8");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body_str.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, REQUEST_TIMEOUT_SECONDS);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        verbose_err("CURL", std::string("POST failed: ") + curl_easy_strerror(res));
        throw std::runtime_error(std::string("HTTP POST failed: ") + curl_easy_strerror(res));
    }

    verbose_in("CURL", "HTTP " + std::to_string(http_code) + " - " + truncate(response, 500));
    return response;
}

} // namespace gesbot
