#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "voice_bridge/config.hpp"

namespace voice_bridge {
namespace server {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

class RestServer {
public:
    using JsonHandler = std::function<RestResponse(const nlohmann::json&)>;

    RestServer(const Config& config, JsonHandler on_call, JsonHandler on_webhook);
    ~RestServer();

    void start();
    void stop();

    // Bearer check for POST /voice/call. Open when no token is configured.
    static bool authorize(const std::optional<std::string>& expected_token,
                          const httplib::Request& request,
                          httplib::Response& response);

private:
    void handle_json(const httplib::Request& request,
                     httplib::Response& response,
                     const JsonHandler& handler,
                     const char* route);
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    JsonHandler on_call_;
    JsonHandler on_webhook_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
}
