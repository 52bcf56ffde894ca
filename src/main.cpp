#include "config.hpp"
#include "console.hpp"
#include "settings.hpp"
#include "message.hpp"
#include "mrkdwn.hpp"
#include "slack_client.hpp"
#include "terminal.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <iostream>
#include <iterator>
#include <string>

using namespace gesbot;

// ========== Input ==========

// Reads all of stdin.
std::string read_stdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
}

// ========== Delivery ==========

// Sends the prepared message. Returns the process exit code.
int deliver(const OutgoingMessage& message, const std::string& channel,
            SlackClient& client, Console& console) {
    bool formatted = message.kind == MessageKind::Blocks;

    try {
        if (formatted) {
            client.send_message_with_blocks(message.blocks, message.text, channel);
            console.print_success("Formatted message sent to " + channel);
        } else {
            client.send_message(message.text, channel);
            console.print_success("Message sent to " + channel);
        }
        return 0;
    } catch (const SlackApiError& e) {
        ErrorReport report = describe_slack_error(e.error(), channel, formatted);
        console.print_error(report.message);
        if (!report.hint.empty()) {
            console.print_hint(report.hint);
        }
    } catch (const std::exception& e) {
        console.print_error(std::string("Error sending message: ") + e.what());
    }
    return 1;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Send piped text or JSON messages to Slack"};
    app.footer("\nExamples:\n"
               "  echo 'message text' | gesbot             Send to the default channel\n"
               "  echo '**done**' | gesbot '#ops'          Send to #ops\n"
               "  gesbot @kim < message.json               Send a Block Kit message\n"
               "  cat report.md | gesbot --text-only       Never parse input as JSON\n");

    std::string destination;
    app.add_option("destination", destination, "Slack channel or user (e.g., #channel, @user)");

    bool text_only = false;
    app.add_flag("--text-only", text_only, "Send as plain text instead of blocks");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log configuration and Slack API traffic to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);
    Console console;

    if (terminal::stdin_is_tty()) {
        console.println("Error: No input provided. This script expects input via pipeline.");
        console.println("Usage: echo 'message' | gesbot [destination]");
        return 1;
    }

    std::string input = trim(read_stdin());
    if (input.empty()) {
        console.println("Error: Empty input received");
        return 1;
    }

    load_env_with_fallback();
    Settings settings = load_settings();
    if (!settings.is_valid()) {
        console.print_error(std::string("Error: ") + TOKEN_ENV + " environment variable not set");
        return 1;
    }

    std::string channel = destination.empty() ? settings.default_channel : destination;
    verbose_log("MAIN", "Destination: " + channel);

    OutgoingMessage message;
    try {
        message = prepare_message(input, text_only);
    } catch (const MessageError& e) {
        console.println(std::string("Error: ") + e.what());
        return 1;
    }

    SlackClient client(settings.bot_token);
    return deliver(message, channel, client, console);
}
