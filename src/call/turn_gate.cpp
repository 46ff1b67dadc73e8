#include "voice_bridge/call/turn_gate.hpp"

#include <utility>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::call {

TurnGate::Lease::~Lease() {
    release();
}

TurnGate::Lease::Lease(Lease&& other) noexcept : gate_(other.gate_) {
    other.gate_ = nullptr;
}

TurnGate::Lease& TurnGate::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void TurnGate::Lease::release() {
    if (gate_) {
        auto* gate = gate_;
        gate_ = nullptr;
        gate->release();
    }
}

std::optional<TurnGate::Lease> TurnGate::try_acquire(const std::string& holder) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Speaking) {
        return std::nullopt;
    }
    state_ = State::Speaking;
    holder_ = holder;
    debug("Speaking gate held", {kv("holder", holder)});
    return Lease(this);
}

bool TurnGate::is_speaking() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == State::Speaking;
}

TurnGate::State TurnGate::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string TurnGate::holder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return holder_;
}

void TurnGate::set_on_release(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_release_ = std::move(callback);
}

void TurnGate::release() {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        debug("Speaking gate released", {kv("holder", holder_)});
        state_ = State::Idle;
        holder_.clear();
        callback = on_release_;
    }
    if (callback) {
        try {
            callback();
        } catch (const std::exception& ex) {
            error("Gate release callback failed", {kv("error", ex.what())});
        }
    }
}

}
