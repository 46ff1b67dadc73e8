#include "voice_bridge/backend/llm.hpp"

#include <chrono>
#include <utility>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::backend {

namespace {

constexpr const char* kDataPrefix = "data:";

}

nlohmann::json to_json(const std::vector<ChatMessage>& messages) {
    auto array = nlohmann::json::array();
    for (const auto& message : messages) {
        array.push_back({{"role", message.role}, {"content", message.content}});
    }
    return array;
}

void SseParser::feed(const char* data, size_t size) {
    pending_.append(data, size);
    size_t start = 0;
    while (true) {
        const auto newline = pending_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        handle_line(pending_.substr(start, newline - start));
        start = newline + 1;
    }
    pending_.erase(0, start);
}

void SseParser::finish() {
    if (!pending_.empty()) {
        handle_line(pending_);
        pending_.clear();
    }
}

void SseParser::handle_line(const std::string& raw_line) {
    if (done_) {
        return;
    }
    std::string line = raw_line;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.rfind(kDataPrefix, 0) != 0) {
        return;
    }
    const auto payload = utils::trim(line.substr(std::char_traits<char>::length(kDataPrefix)));
    if (payload == "[DONE]") {
        done_ = true;
        return;
    }
    const auto chunk = nlohmann::json::parse(payload, nullptr, false);
    if (chunk.is_discarded() || !chunk.is_object()) {
        return;
    }
    const auto choices = chunk.find("choices");
    if (choices == chunk.end() || !choices->is_array() || choices->empty()) {
        return;
    }
    const auto& choice = choices->front();
    const auto delta = choice.find("delta");
    if (delta == choice.end() || !delta->is_object()) {
        return;
    }
    const auto content = delta->find("content");
    if (content != delta->end() && content->is_string()) {
        content_ += content->get<std::string>();
    }
}

OpenAiChatClient::OpenAiChatClient(std::string base_url,
                                   std::optional<std::string> api_key,
                                   std::string model,
                                   BackendRequestOptions options)
    : client_(std::move(base_url), std::move(api_key), options),
      model_(std::move(model)) {}

std::string OpenAiChatClient::complete(const std::vector<ChatMessage>& messages,
                                       bool stream,
                                       Seconds timeout,
                                       const utils::CancellationToken& token) {
    const nlohmann::json body = {
        {"model", model_},
        {"messages", to_json(messages)},
        {"stream", stream},
    };
    const auto start = std::chrono::steady_clock::now();
    std::string reply;
    if (stream) {
        SseParser parser;
        client_.post_stream(
            "/chat/completions",
            body,
            [&parser, &token](const char* data, size_t size) {
                if (token.is_canceled()) {
                    return false;
                }
                parser.feed(data, size);
                return !parser.done();
            },
            timeout,
            &token);
        if (token.is_canceled()) {
            throw BackendError("Chat completion canceled");
        }
        parser.finish();
        reply = parser.content();
    } else {
        const auto response = client_.post_json("/chat/completions", body, timeout, &token);
        const auto choices = response.find("choices");
        if (choices != response.end() && choices->is_array() && !choices->empty()) {
            const auto& message = choices->front().value("message", nlohmann::json::object());
            if (message.contains("content") && message["content"].is_string()) {
                reply = message["content"].get<std::string>();
            }
        }
    }
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    Metrics::instance().observe_backend_latency("llm", elapsed);
    debug("LLM reply received", {kv("chars", reply.size()), kv("stream", stream)});
    return reply;
}

}
