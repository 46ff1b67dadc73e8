#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "voice_bridge/call/media.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/utils/task_group.hpp"

namespace voice_bridge {
namespace server {

using WsServer = websocketpp::server<websocketpp::config::asio>;

// MediaSocket over one accepted websocketpp connection. Frames received on
// the asio thread are queued until the session thread asks for them.
class WsMediaSocket : public call::MediaSocket {
public:
    WsMediaSocket(WsServer& server, websocketpp::connection_hdl hdl);

    std::optional<std::string> receive() override;
    bool send_text(const std::string& text) override;
    void close(int code, const std::string& reason) override;
    bool is_open() const override;

    void push_message(std::string text);
    void mark_closed();

private:
    WsServer& server_;
    websocketpp::connection_hdl hdl_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbound_;
    bool closed_ = false;
    bool close_sent_ = false;
};

struct StreamRequest {
    std::string stream_id;
    int delay_ms = 0;
};

// Parses /voice/stream/<id>?token=..&delay_ms=.. and checks the token.
// Returns nullopt for any other resource or a wrong token.
std::optional<StreamRequest> parse_stream_resource(const std::string& resource,
                                                   const std::string& secret);

class MediaServer {
public:
    // Invoked on a session thread owned by the server; may block for the
    // whole call and must return once the socket is closed.
    using AttachHandler = std::function<void(const StreamRequest& request,
                                             std::shared_ptr<WsMediaSocket> socket)>;

    MediaServer(const Config& config, AttachHandler on_attach);
    ~MediaServer();

    void start();
    // Closes every media socket and joins their sessions before stopping
    // the event loop.
    void stop();

private:
    bool validate(websocketpp::connection_hdl hdl);
    void on_open(websocketpp::connection_hdl hdl);
    void on_message(websocketpp::connection_hdl hdl, WsServer::message_ptr message);
    void on_close(websocketpp::connection_hdl hdl);
    std::shared_ptr<WsMediaSocket> find_socket(websocketpp::connection_hdl hdl);

    const Config& config_;
    AttachHandler on_attach_;
    std::unique_ptr<WsServer> server_;
    std::thread server_thread_;
    std::mutex sockets_mutex_;
    std::map<websocketpp::connection_hdl,
             std::shared_ptr<WsMediaSocket>,
             std::owner_less<websocketpp::connection_hdl>>
        sockets_;
    bool stopping_ = false;
    utils::TaskGroup sessions_;
};

}
}
