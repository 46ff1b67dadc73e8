#include "voice_bridge/call/directive.hpp"

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::call {

namespace {

constexpr const char* kFence = "```";
constexpr size_t kFenceSize = 3;

struct Candidate {
    size_t begin = 0;
    size_t end = 0;
    std::string body;
};

std::optional<Candidate> last_fenced_block(const std::string& text) {
    const auto close = text.rfind(kFence);
    if (close == std::string::npos || close < kFenceSize) {
        return std::nullopt;
    }
    const auto open = text.rfind(kFence, close - kFenceSize);
    if (open == std::string::npos) {
        return std::nullopt;
    }
    std::string body = text.substr(open + kFenceSize, close - open - kFenceSize);
    // Optional language tag on the opening fence line.
    const auto first_newline = body.find('\n');
    if (first_newline != std::string::npos) {
        const auto tag = utils::trim(body.substr(0, first_newline));
        if (!tag.empty() && tag.find('{') == std::string::npos) {
            body = body.substr(first_newline + 1);
        }
    } else if (utils::to_lower(body.substr(0, 4)) == "json") {
        body = body.substr(4);
    }
    return Candidate{open, close + kFenceSize, utils::trim(body)};
}

std::optional<Candidate> trailing_bare_object(const std::string& text) {
    const auto last = text.find_last_not_of(" \t\r\n");
    if (last == std::string::npos || text[last] != '}') {
        return std::nullopt;
    }
    size_t pos = last;
    while (true) {
        const auto open = text.rfind('{', pos);
        if (open == std::string::npos) {
            return std::nullopt;
        }
        auto body = text.substr(open, last + 1 - open);
        const auto parsed = nlohmann::json::parse(body, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            return Candidate{open, last + 1, std::move(body)};
        }
        if (open == 0) {
            return std::nullopt;
        }
        pos = open - 1;
    }
}

ParsedReply keep_full_text(const std::string& reply) {
    ParsedReply result;
    result.spoken = utils::trim(reply);
    return result;
}

}

ParsedReply parse_reply(const std::string& reply) {
    auto candidate = last_fenced_block(reply);
    if (!candidate) {
        candidate = trailing_bare_object(reply);
    }
    if (!candidate) {
        return keep_full_text(reply);
    }

    const auto parsed = nlohmann::json::parse(candidate->body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        warn("Reply directive is not valid JSON", {kv("chars", candidate->body.size())});
        return keep_full_text(reply);
    }

    ParsedReply result;
    result.directive = parsed;
    result.spoken = utils::trim(reply.substr(0, candidate->begin) + reply.substr(candidate->end));
    const auto action = parsed.find("action");
    if (action != parsed.end() && action->is_string() && action->get<std::string>() == "hangup") {
        result.hangup = true;
        const auto reason = parsed.find("reason");
        if (reason != parsed.end() && reason->is_string()) {
            result.hangup_reason = reason->get<std::string>();
        }
    }
    return result;
}

}
