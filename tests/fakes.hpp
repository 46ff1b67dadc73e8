#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_bridge/audio/wav.hpp"
#include "voice_bridge/backend/alerts.hpp"
#include "voice_bridge/backend/call_control.hpp"
#include "voice_bridge/backend/llm.hpp"
#include "voice_bridge/backend/speech.hpp"
#include "voice_bridge/call/media.hpp"
#include "voice_bridge/utils/cancellation.hpp"

namespace voice_bridge {
namespace test {

// Scripted provider socket. receive() blocks until a frame is queued or the
// socket is closed from either side.
class FakeSocket : public call::MediaSocket {
public:
    void push(const std::string& text) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbound_.push_back(text);
        }
        cv_.notify_all();
    }

    void push(const nlohmann::json& message) { push(message.dump()); }

    // Simulates the provider hanging up the socket.
    void remote_close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            remote_closed_ = true;
        }
        cv_.notify_all();
    }

    std::optional<std::string> receive() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !inbound_.empty() || closed_ || remote_closed_; });
        if (!inbound_.empty()) {
            auto text = inbound_.front();
            inbound_.pop_front();
            return text;
        }
        return std::nullopt;
    }

    bool send_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || remote_closed_) {
            return false;
        }
        sent_.push_back(text);
        return true;
    }

    void close(int code, const std::string& reason) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++close_calls_;
            if (closed_) {
                return;
            }
            closed_ = true;
            close_code_ = code;
            close_reason_ = reason;
        }
        cv_.notify_all();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !closed_ && !remote_closed_;
    }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    size_t sent_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

    std::optional<int> close_code() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_code_;
    }

    std::string close_reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_reason_;
    }

    int close_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_calls_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbound_;
    std::vector<std::string> sent_;
    bool closed_ = false;
    bool remote_closed_ = false;
    std::optional<int> close_code_;
    std::string close_reason_;
    int close_calls_ = 0;
};

class FakeSpeechToText : public backend::SpeechToText {
public:
    explicit FakeSpeechToText(std::string transcript = "hello there")
        : transcript_(std::move(transcript)) {}

    std::string transcribe(const std::string& wav, Seconds) override {
        last_wav_size = wav.size();
        ++calls;
        if (fail) {
            throw BackendError("stt unavailable");
        }
        return transcript_;
    }

    std::atomic<int> calls{0};
    std::atomic<size_t> last_wav_size{0};
    bool fail = false;

private:
    std::string transcript_;
};

// Streams an 8 kHz WAV of samples_per_call samples in uneven chunks.
class FakeTextToSpeech : public backend::TextToSpeech {
public:
    explicit FakeTextToSpeech(size_t samples_per_call = 1600)
        : samples_per_call_(samples_per_call) {}

    void synthesize(const std::string& text,
                    const std::string& voice,
                    Seconds,
                    const utils::CancellationToken& token,
                    const ChunkHandler& on_chunk) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            texts_.push_back(text);
            last_voice_ = voice;
        }
        if (fail) {
            throw BackendError("tts unavailable");
        }
        const auto wav = audio::encode_wav(std::vector<int16_t>(samples_per_call_, 1200));
        size_t offset = 0;
        size_t chunk = 37;
        while (offset < wav.size()) {
            if (token.is_canceled()) {
                throw BackendError("tts canceled");
            }
            const auto take = std::min(chunk, wav.size() - offset);
            if (!on_chunk(wav.data() + offset, take)) {
                return;
            }
            offset += take;
            chunk = chunk == 37 ? 501 : 37;
        }
    }

    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_;
    }

    std::string last_voice() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_voice_;
    }

    bool fail = false;

private:
    size_t samples_per_call_;
    mutable std::mutex mutex_;
    std::vector<std::string> texts_;
    std::string last_voice_;
};

class FakeChat : public backend::ChatCompletions {
public:
    explicit FakeChat(std::string reply = "Sure, happy to help.") : reply_(std::move(reply)) {}

    std::string complete(const std::vector<backend::ChatMessage>& messages,
                         bool stream,
                         Seconds,
                         const utils::CancellationToken& token) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(messages);
            streamed_.push_back(stream);
        }
        if (fail) {
            throw BackendError("llm unavailable");
        }
        if (stall) {
            // Behaves like a backend that never answers until the request
            // is aborted.
            stalled = true;
            token.wait_for(std::chrono::seconds(30));
            throw BackendError("llm canceled");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return reply_;
    }

    void set_reply(std::string reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        reply_ = std::move(reply);
    }

    std::vector<std::vector<backend::ChatMessage>> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<bool> streamed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return streamed_;
    }

    bool fail = false;
    std::atomic<bool> stall{false};
    std::atomic<bool> stalled{false};

private:
    mutable std::mutex mutex_;
    std::string reply_;
    std::vector<std::vector<backend::ChatMessage>> requests_;
    std::vector<bool> streamed_;
};

class FakeCallControl : public backend::CallControl {
public:
    backend::CallControlResult dial(const std::string& to,
                                    const std::string& from,
                                    const std::string& app_id,
                                    const std::optional<std::string>& stream_url,
                                    const std::optional<std::string>& codec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_dial_to = to;
        last_dial_from = from;
        last_app_id = app_id;
        last_stream_url = stream_url;
        last_codec = codec;
        backend::CallControlResult result;
        if (fail_dial) {
            result.error = "dial rejected";
            return result;
        }
        result.ok = true;
        result.call_id = next_call_id;
        return result;
    }

    backend::CallControlResult answer(const std::string& call_id,
                                      const std::optional<std::string>& stream_url,
                                      const std::optional<std::string>& mode,
                                      const std::optional<std::string>& codec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        answered.push_back(call_id);
        last_stream_url = stream_url;
        last_mode = mode;
        last_codec = codec;
        backend::CallControlResult result;
        result.ok = true;
        result.call_id = call_id;
        return result;
    }

    backend::CallControlResult hangup(const std::string& call_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        hangups.push_back(call_id);
        backend::CallControlResult result;
        result.ok = true;
        result.call_id = call_id;
        return result;
    }

    size_t hangup_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hangups.size();
    }

    std::string next_call_id = "call-1";
    bool fail_dial = false;
    std::string last_dial_to;
    std::string last_dial_from;
    std::string last_app_id;
    std::optional<std::string> last_stream_url;
    std::optional<std::string> last_mode;
    std::optional<std::string> last_codec;
    std::vector<std::string> answered;
    std::vector<std::string> hangups;

private:
    mutable std::mutex mutex_;
};

class FakeAlerts : public backend::AlertSink {
public:
    bool notify_user(const std::string& user_id, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        alerts.emplace_back(user_id, message);
        return true;
    }

    std::vector<std::pair<std::string, std::string>> alerts;

private:
    std::mutex mutex_;
};

// Polls pred every few milliseconds until it holds or timeout passes.
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}
}
