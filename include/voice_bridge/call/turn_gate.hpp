#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace voice_bridge {
namespace call {

// Bot-speaking gate of one session. Speaking is held by exactly one Lease;
// destroying or releasing the lease returns the gate to Idle on every exit
// path of its holder.
class TurnGate {
public:
    enum class State {
        Idle,
        Speaking
    };

    class Lease {
    public:
        Lease() = default;
        ~Lease();
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        void release();
        bool active() const { return gate_ != nullptr; }

    private:
        friend class TurnGate;
        explicit Lease(TurnGate* gate) : gate_(gate) {}

        TurnGate* gate_ = nullptr;
    };

    TurnGate() = default;
    TurnGate(const TurnGate&) = delete;
    TurnGate& operator=(const TurnGate&) = delete;

    // nullopt while another holder is speaking.
    std::optional<Lease> try_acquire(const std::string& holder);

    bool is_speaking() const;
    State state() const;
    std::string holder() const;

    // Runs after every transition back to Idle, outside the gate lock.
    void set_on_release(std::function<void()> callback);

private:
    void release();

    mutable std::mutex mutex_;
    State state_ = State::Idle;
    std::string holder_;
    std::function<void()> on_release_;
};

}
}
