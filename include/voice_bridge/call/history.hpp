#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "voice_bridge/backend/llm.hpp"

namespace voice_bridge {
namespace call {

// Append-only conversation of one call plus its readable transcript.
class ConversationHistory {
public:
    void add_user(const std::string& text);
    void add_assistant(const std::string& text);

    std::vector<backend::ChatMessage> messages() const;
    std::vector<std::string> transcript_lines() const;
    std::string transcript() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<backend::ChatMessage> messages_;
    std::vector<std::string> transcript_;
};

}
}
