#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_bridge {
namespace call {

struct ParsedReply {
    std::string spoken;
    bool hangup = false;
    std::optional<std::string> hangup_reason;
    std::optional<nlohmann::json> directive;
};

// Splits a complete model reply into spoken text and an optional trailing
// JSON directive. The last fenced code block is tried first, then a bare
// object ending the reply. A directive that parses as a JSON object is
// always removed from the spoken text; only {"action": "hangup"} sets the
// hangup flag. Malformed JSON leaves the reply untouched.
ParsedReply parse_reply(const std::string& reply);

}
}
