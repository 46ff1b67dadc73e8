#include "voice_bridge/server/rest_server.hpp"

#include <stdexcept>
#include <utility>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge::server {

RestServer::RestServer(const Config& config, JsonHandler on_call, JsonHandler on_webhook)
    : config_(config),
      on_call_(std::move(on_call)),
      on_webhook_(std::move(on_webhook)) {}

RestServer::~RestServer() {
    stop();
}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/voice/call", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize(config_.authorization_token, req, res)) {
            return;
        }
        handle_json(req, res, on_call_, "/voice/call");
    });

    server_->Post("/voice/webhook", [this](const httplib::Request& req, httplib::Response& res) {
        const auto token = req.get_param_value("token");
        if (token.empty() || token != config_.stream_secret) {
            warn("Webhook rejected, bad token");
            res.status = 403;
            res.set_content(R"({"message":"invalid token"})", "application/json");
            return;
        }
        handle_json(req, res, on_webhook_, "/voice/webhook");
    });

    if (!server_->bind_to_port(config_.bind_address, config_.rest_api_port)) {
        throw std::runtime_error("REST server failed to bind port " +
                                 std::to_string(config_.rest_api_port));
    }
    server_thread_ = std::thread([this]() {
        info("REST server listening",
             {kv("address", config_.bind_address), kv("port", config_.rest_api_port)});
        server_->listen_after_bind();
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize(const std::optional<std::string>& expected_token,
                           const httplib::Request& request,
                           httplib::Response& response) {
    if (!expected_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *expected_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::handle_json(const httplib::Request& request,
                             httplib::Response& response,
                             const JsonHandler& handler,
                             const char* route) {
    auto body = nlohmann::json::parse(request.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        warn("Invalid request body", {kv("route", route)});
        response.status = 400;
        response.set_content(R"({"message":"invalid request body"})", "application/json");
        return;
    }
    try {
        write_json(response, handler(body));
    } catch (const std::exception& ex) {
        error("Request failed", {kv("route", route), kv("error", ex.what())});
        response.status = 500;
        response.set_content(R"({"message":"internal error"})", "application/json");
    }
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
