#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_bridge/backend/client.hpp"
#include "voice_bridge/utils/cancellation.hpp"

namespace voice_bridge {
namespace backend {

struct ChatMessage {
    std::string role;
    std::string content;
};

nlohmann::json to_json(const std::vector<ChatMessage>& messages);

class ChatCompletions {
public:
    virtual ~ChatCompletions() = default;

    // Returns the complete assistant reply. A streamed reply is reassembled
    // before returning. Throws BackendError, also when token is canceled
    // before the reply is complete.
    virtual std::string complete(const std::vector<ChatMessage>& messages,
                                 bool stream,
                                 Seconds timeout,
                                 const utils::CancellationToken& token) = 0;
};

// Incremental parser for an OpenAI-style server-sent event stream. Bytes may
// be fed split anywhere, including inside a line.
class SseParser {
public:
    void feed(const char* data, size_t size);
    void feed(const std::string& data) { feed(data.data(), data.size()); }
    // Processes a final unterminated line.
    void finish();

    const std::string& content() const { return content_; }
    bool done() const { return done_; }

private:
    void handle_line(const std::string& line);

    std::string pending_;
    std::string content_;
    bool done_ = false;
};

class OpenAiChatClient : public ChatCompletions {
public:
    OpenAiChatClient(std::string base_url,
                     std::optional<std::string> api_key,
                     std::string model,
                     BackendRequestOptions options);

    std::string complete(const std::vector<ChatMessage>& messages,
                         bool stream,
                         Seconds timeout,
                         const utils::CancellationToken& token) override;

private:
    BackendClient client_;
    std::string model_;
};

}
}
