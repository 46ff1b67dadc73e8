#include "voice_bridge/backend/client.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>
#include <utility>

#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {

namespace {

void split_seconds(Seconds value, time_t& sec, time_t& usec) {
    const double total = value.count() > 0.0 ? value.count() : 0.0;
    sec = static_cast<time_t>(std::floor(total));
    usec = static_cast<time_t>(std::llround((total - std::floor(total)) * 1000000.0));
}

constexpr std::chrono::milliseconds kWatchInterval{50};

// Stops the client from a side thread once the request deadline passes or
// the token is canceled. httplib's own timeouts only bound a single read.
class RequestWatch {
public:
    RequestWatch(httplib::Client& client, Seconds timeout, const utils::CancellationToken* token)
        : deadline_(std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout)),
          token_(token),
          watcher_([this, &client]() { watch(client); }) {}

    ~RequestWatch() {
        finished_.cancel();
        watcher_.join();
    }

    RequestWatch(const RequestWatch&) = delete;
    RequestWatch& operator=(const RequestWatch&) = delete;

    bool canceled() const { return token_ != nullptr && token_->is_canceled(); }
    bool past_deadline() const { return std::chrono::steady_clock::now() >= deadline_; }
    bool expired() const { return expired_.load(); }

private:
    void watch(httplib::Client& client) {
        // Keeps stopping until the request returns: a stop() issued before
        // the socket is open has nothing to shut down.
        while (finished_.wait_for(kWatchInterval)) {
            if (canceled()) {
                client.stop();
            } else if (past_deadline()) {
                expired_.store(true);
                client.stop();
            }
        }
    }

    const std::chrono::steady_clock::time_point deadline_;
    const utils::CancellationToken* token_;
    utils::CancellationToken finished_;
    std::atomic<bool> expired_{false};
    std::thread watcher_;
};

void raise_for_interruption(const RequestWatch& watch, bool timed_out, const std::string& path,
                            Seconds timeout) {
    if (watch.canceled()) {
        throw BackendError(path + " canceled");
    }
    if (timed_out || watch.expired()) {
        throw BackendError(path + " timed out after " + std::to_string(timeout.count()) + "s");
    }
}

void raise_for_status(int status, const std::string& body, const std::string& path) {
    if (status == 401 || status == 403) {
        throw BackendPermissionError(path + " returned " + std::to_string(status) + ": " + body);
    }
    if (status < 200 || status >= 300) {
        throw BackendError(path + " returned " + std::to_string(status) + ": " + body);
    }
}

}

BackendClient::BackendClient(std::string base_url,
                             std::optional<std::string> authorization_token,
                             BackendRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {
    utils::parse_url(base_url_, scheme_, host_, port_, base_path_);
    if (host_.empty()) {
        throw BackendError("Backend URL has no host: " + base_url_);
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https") {
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
    }
#endif
}

nlohmann::json BackendClient::get_json(const std::string& path,
                                       std::optional<Seconds> timeout) const {
    const auto limit = timeout.value_or(options_.request_timeout);
    auto client = make_client(limit);
    const auto full_path = build_path(path);
    RequestWatch watch(client, limit, nullptr);
    auto response = client.Get(full_path, make_headers(false));
    raise_for_interruption(watch, false, full_path, limit);
    return handle_response(response, full_path);
}

nlohmann::json BackendClient::post_json(const std::string& path,
                                        const nlohmann::json& body,
                                        std::optional<Seconds> timeout,
                                        const utils::CancellationToken* token) const {
    const auto limit = timeout.value_or(options_.request_timeout);
    auto client = make_client(limit);
    const auto full_path = build_path(path);
    RequestWatch watch(client, limit, token);
    auto response = client.Post(full_path, make_headers(false), body.dump(), "application/json");
    raise_for_interruption(watch, false, full_path, limit);
    return handle_response(response, full_path);
}

nlohmann::json BackendClient::put_json(const std::string& path,
                                       const nlohmann::json& body,
                                       std::optional<Seconds> timeout) const {
    const auto limit = timeout.value_or(options_.request_timeout);
    auto client = make_client(limit);
    const auto full_path = build_path(path);
    RequestWatch watch(client, limit, nullptr);
    auto response = client.Put(full_path, make_headers(false), body.dump(), "application/json");
    raise_for_interruption(watch, false, full_path, limit);
    return handle_response(response, full_path);
}

nlohmann::json BackendClient::post_multipart_file(const std::string& path,
                                                  const std::string& field_name,
                                                  const std::string& filename,
                                                  const std::string& content_type,
                                                  const std::string& content,
                                                  std::optional<Seconds> timeout) const {
    const auto limit = timeout.value_or(options_.request_timeout);
    auto client = make_client(limit);
    const auto full_path = build_path(path);
    httplib::MultipartFormDataItems items;
    items.push_back({field_name, content, filename, content_type});
    RequestWatch watch(client, limit, nullptr);
    auto response = client.Post(full_path, make_headers(false), items);
    raise_for_interruption(watch, false, full_path, limit);
    return handle_response(response, full_path);
}

void BackendClient::post_stream(const std::string& path,
                                const nlohmann::json& body,
                                const ChunkHandler& on_chunk,
                                std::optional<Seconds> timeout,
                                const utils::CancellationToken* token) const {
    const auto limit = timeout.value_or(options_.request_timeout);
    auto client = make_client(limit);
    const auto full_path = build_path(path);

    int status = 0;
    std::string error_body;
    bool stopped = false;
    bool timed_out = false;
    RequestWatch watch(client, limit, token);

    httplib::Request request;
    request.method = "POST";
    request.path = full_path;
    request.headers = make_headers(true);
    request.body = body.dump();
    request.response_handler = [&status](const httplib::Response& response) {
        status = response.status;
        return true;
    };
    request.content_receiver = [&](const char* data, size_t size, uint64_t, uint64_t) {
        if (watch.canceled()) {
            return false;
        }
        if (watch.past_deadline()) {
            timed_out = true;
            return false;
        }
        if (status < 200 || status >= 300) {
            error_body.append(data, size);
            return true;
        }
        if (!on_chunk(data, size)) {
            stopped = true;
            return false;
        }
        return true;
    };

    auto result = client.send(request);
    if (stopped) {
        return;
    }
    raise_for_interruption(watch, timed_out, full_path, limit);
    if (!result) {
        throw BackendError(full_path + " failed: " + httplib::to_string(result.error()));
    }
    raise_for_status(result->status, error_body, full_path);
}

std::string BackendClient::build_path(const std::string& path) const {
    if (base_path_.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path_;
    }
    if (base_path_.back() == '/' && path.front() == '/') {
        return base_path_ + path.substr(1);
    }
    if (base_path_.back() != '/' && path.front() != '/') {
        return base_path_ + "/" + path;
    }
    return base_path_ + path;
}

httplib::Headers BackendClient::make_headers(bool json_body) const {
    httplib::Headers headers{{"Accept", "application/json"}};
    if (json_body) {
        headers.emplace("Content-Type", "application/json");
    }
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    return headers;
}

httplib::Client BackendClient::make_client(Seconds timeout) const {
    httplib::Client client(scheme_ + "://" + host_ + ":" + std::to_string(port_));
    time_t sec = 0;
    time_t usec = 0;
    split_seconds(options_.connect_timeout, sec, usec);
    client.set_connection_timeout(sec, usec);
    split_seconds(timeout, sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    client.enable_server_certificate_verification(false);
#endif
    return client;
}

nlohmann::json BackendClient::handle_response(const httplib::Result& response,
                                              const std::string& path) const {
    if (!response) {
        throw BackendError(path + " failed: " + httplib::to_string(response.error()));
    }
    raise_for_status(response->status, response->body, path);
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(response->body, nullptr, false);
    if (parsed.is_discarded()) {
        throw BackendError(path + " returned invalid JSON");
    }
    return parsed;
}

}
