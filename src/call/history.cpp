#include "voice_bridge/call/history.hpp"

#include "voice_bridge/utils/text.hpp"

namespace voice_bridge::call {

void ConversationHistory::add_user(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back({"user", text});
    transcript_.push_back("User: " + text);
}

void ConversationHistory::add_assistant(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back({"assistant", text});
    transcript_.push_back("Assistant: " + text);
}

std::vector<backend::ChatMessage> ConversationHistory::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::vector<std::string> ConversationHistory::transcript_lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_;
}

std::string ConversationHistory::transcript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return utils::join(transcript_, "\n");
}

size_t ConversationHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

}
