#include "voice_bridge/server/media_server.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge::server {

namespace {

constexpr const char* kStreamPrefix = "/voice/stream/";

}

WsMediaSocket::WsMediaSocket(WsServer& server, websocketpp::connection_hdl hdl)
    : server_(server), hdl_(std::move(hdl)) {}

std::optional<std::string> WsMediaSocket::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !inbound_.empty() || closed_; });
    if (inbound_.empty()) {
        return std::nullopt;
    }
    auto text = std::move(inbound_.front());
    inbound_.pop_front();
    return text;
}

bool WsMediaSocket::send_text(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || close_sent_) {
            return false;
        }
    }
    websocketpp::lib::error_code ec;
    server_.send(hdl_, text, websocketpp::frame::opcode::text, ec);
    if (ec) {
        debug("Media send failed", {kv("error", ec.message())});
        return false;
    }
    return true;
}

void WsMediaSocket::close(int code, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_sent_ || closed_) {
            closed_ = true;
            cv_.notify_all();
            return;
        }
        close_sent_ = true;
        closed_ = true;
    }
    cv_.notify_all();
    websocketpp::lib::error_code ec;
    server_.close(hdl_, static_cast<websocketpp::close::status::value>(code), reason, ec);
    if (ec) {
        debug("Media close failed", {kv("error", ec.message())});
    }
}

bool WsMediaSocket::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_;
}

void WsMediaSocket::push_message(std::string text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        inbound_.push_back(std::move(text));
    }
    cv_.notify_all();
}

void WsMediaSocket::mark_closed() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<StreamRequest> parse_stream_resource(const std::string& resource,
                                                   const std::string& secret) {
    std::map<std::string, std::string> query;
    const auto path = utils::split_resource(resource, query);
    const std::string prefix = kStreamPrefix;
    if (path.rfind(prefix, 0) != 0 || path.size() == prefix.size()) {
        return std::nullopt;
    }
    const auto token = query.find("token");
    if (secret.empty() || token == query.end() || token->second != secret) {
        return std::nullopt;
    }
    StreamRequest request;
    request.stream_id = path.substr(prefix.size());
    if (request.stream_id.find('/') != std::string::npos) {
        return std::nullopt;
    }
    const auto delay = query.find("delay_ms");
    if (delay != query.end() && !delay->second.empty()) {
        try {
            request.delay_ms = std::max(0, std::stoi(delay->second));
        } catch (const std::exception&) {
            request.delay_ms = 0;
        }
    }
    return request;
}

MediaServer::MediaServer(const Config& config, AttachHandler on_attach)
    : config_(config), on_attach_(std::move(on_attach)), sessions_("media_sessions") {}

MediaServer::~MediaServer() {
    stop();
}

void MediaServer::start() {
    server_ = std::make_unique<WsServer>();
    server_->set_access_channels(websocketpp::log::alevel::none);
    server_->set_error_channels(websocketpp::log::elevel::warn);
    server_->init_asio();
    server_->set_reuse_addr(true);

    server_->set_validate_handler([this](websocketpp::connection_hdl hdl) { return validate(hdl); });
    server_->set_open_handler([this](websocketpp::connection_hdl hdl) { on_open(hdl); });
    server_->set_message_handler(
        [this](websocketpp::connection_hdl hdl, WsServer::message_ptr message) {
            on_message(hdl, message);
        });
    server_->set_close_handler([this](websocketpp::connection_hdl hdl) { on_close(hdl); });
    server_->set_fail_handler([this](websocketpp::connection_hdl hdl) { on_close(hdl); });

    websocketpp::lib::error_code ec;
    server_->listen(config_.bind_address, std::to_string(config_.media_ws_port), ec);
    if (ec) {
        throw std::runtime_error("Media server failed to listen: " + ec.message());
    }
    server_->start_accept();
    server_thread_ = std::thread([this]() {
        info("Media server listening",
             {kv("address", config_.bind_address), kv("port", config_.media_ws_port)});
        try {
            server_->run();
        } catch (const std::exception& ex) {
            error("Media server stopped", {kv("error", ex.what())});
        }
    });
}

void MediaServer::stop() {
    if (server_) {
        websocketpp::lib::error_code ec;
        server_->stop_listening(ec);
        std::map<websocketpp::connection_hdl,
                 std::shared_ptr<WsMediaSocket>,
                 std::owner_less<websocketpp::connection_hdl>>
            sockets;
        {
            std::lock_guard<std::mutex> lock(sockets_mutex_);
            stopping_ = true;
            sockets.swap(sockets_);
        }
        for (auto& entry : sockets) {
            entry.second->close(websocketpp::close::status::going_away, "Server shutdown");
        }
        // Sessions see their socket closed, cancel their own tasks and
        // return; the event loop keeps running so their close frames go out.
        sessions_.cancel_and_join();
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool MediaServer::validate(websocketpp::connection_hdl hdl) {
    auto connection = server_->get_con_from_hdl(hdl);
    const auto resource = connection->get_resource();
    if (!parse_stream_resource(resource, config_.stream_secret)) {
        std::map<std::string, std::string> query;
        warn("Media connection rejected", {kv("path", utils::split_resource(resource, query))});
        connection->set_status(websocketpp::http::status_code::forbidden);
        return false;
    }
    return true;
}

void MediaServer::on_open(websocketpp::connection_hdl hdl) {
    auto connection = server_->get_con_from_hdl(hdl);
    const auto request = parse_stream_resource(connection->get_resource(), config_.stream_secret);
    auto socket = std::make_shared<WsMediaSocket>(*server_, hdl);
    if (!request) {
        socket->close(call::kClosePolicyViolation, "Invalid stream");
        return;
    }
    bool stopping = false;
    {
        std::lock_guard<std::mutex> lock(sockets_mutex_);
        stopping = stopping_;
        if (!stopping) {
            sockets_[hdl] = socket;
        }
    }
    if (stopping) {
        socket->close(websocketpp::close::status::going_away, "Server shutdown");
        return;
    }
    debug("Media connection opened", {kv("stream_id", request->stream_id)});
    const bool spawned = sessions_.spawn(
        "session", [this, request = *request, socket](const utils::CancellationToken&) {
            try {
                on_attach_(request, socket);
            } catch (const std::exception& ex) {
                error("Media session failed",
                      {kv("stream_id", request.stream_id), kv("error", ex.what())});
            }
            socket->close(call::kCloseNormal, "Session ended");
        });
    if (!spawned) {
        socket->close(websocketpp::close::status::going_away, "Server shutdown");
    }
}

void MediaServer::on_message(websocketpp::connection_hdl hdl, WsServer::message_ptr message) {
    if (message->get_opcode() != websocketpp::frame::opcode::text) {
        return;
    }
    if (auto socket = find_socket(hdl)) {
        socket->push_message(message->get_payload());
    }
}

void MediaServer::on_close(websocketpp::connection_hdl hdl) {
    std::shared_ptr<WsMediaSocket> socket;
    {
        std::lock_guard<std::mutex> lock(sockets_mutex_);
        const auto it = sockets_.find(hdl);
        if (it == sockets_.end()) {
            return;
        }
        socket = it->second;
        sockets_.erase(it);
    }
    socket->mark_closed();
}

std::shared_ptr<WsMediaSocket> MediaServer::find_socket(websocketpp::connection_hdl hdl) {
    std::lock_guard<std::mutex> lock(sockets_mutex_);
    const auto it = sockets_.find(hdl);
    return it == sockets_.end() ? nullptr : it->second;
}

}
