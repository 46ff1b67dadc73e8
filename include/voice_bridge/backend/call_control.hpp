#pragma once

#include <optional>
#include <string>

#include "voice_bridge/backend/client.hpp"

namespace voice_bridge {
namespace backend {

struct CallControlResult {
    bool ok = false;
    std::string call_id;
    std::string error;
};

// Narrow call-control surface of the telephony provider. Implementations
// report failures in the result instead of throwing.
class CallControl {
public:
    virtual ~CallControl() = default;

    virtual CallControlResult dial(const std::string& to,
                                   const std::string& from,
                                   const std::string& app_id,
                                   const std::optional<std::string>& stream_url,
                                   const std::optional<std::string>& codec) = 0;
    virtual CallControlResult answer(const std::string& call_id,
                                     const std::optional<std::string>& stream_url,
                                     const std::optional<std::string>& mode,
                                     const std::optional<std::string>& codec) = 0;
    virtual CallControlResult hangup(const std::string& call_id) = 0;
};

// Telnyx v2 call-control REST client.
class TelnyxCallControl : public CallControl {
public:
    TelnyxCallControl(std::string api_url, std::string api_key, BackendRequestOptions options);

    CallControlResult dial(const std::string& to,
                           const std::string& from,
                           const std::string& app_id,
                           const std::optional<std::string>& stream_url,
                           const std::optional<std::string>& codec) override;
    CallControlResult answer(const std::string& call_id,
                             const std::optional<std::string>& stream_url,
                             const std::optional<std::string>& mode,
                             const std::optional<std::string>& codec) override;
    CallControlResult hangup(const std::string& call_id) override;

private:
    BackendClient client_;
};

}
}
