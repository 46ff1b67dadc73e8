#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "voice_bridge/utils/cancellation.hpp"

namespace voice_bridge {

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

class BackendPermissionError : public BackendError {
public:
    explicit BackendPermissionError(const std::string& message) : BackendError(message) {}
};

using Seconds = std::chrono::duration<double>;

struct BackendRequestOptions {
    Seconds connect_timeout{10};
    Seconds request_timeout{60};
};

// Thin JSON-over-HTTP client for one backend base URL. Every call opens its
// own connection so one instance can be shared by concurrent sessions. The
// timeout of a call bounds the whole request, not a single socket read; a
// call that runs past it, or whose token is canceled, throws BackendError.
class BackendClient {
public:
    // Receives body chunks in arrival order. Returning false stops the
    // transfer without raising.
    using ChunkHandler = std::function<bool(const char* data, size_t size)>;

    BackendClient(std::string base_url,
                  std::optional<std::string> authorization_token,
                  BackendRequestOptions options);

    nlohmann::json get_json(const std::string& path,
                            std::optional<Seconds> timeout = std::nullopt) const;
    nlohmann::json post_json(const std::string& path,
                             const nlohmann::json& body,
                             std::optional<Seconds> timeout = std::nullopt,
                             const utils::CancellationToken* token = nullptr) const;
    nlohmann::json put_json(const std::string& path,
                            const nlohmann::json& body,
                            std::optional<Seconds> timeout = std::nullopt) const;
    nlohmann::json post_multipart_file(const std::string& path,
                                       const std::string& field_name,
                                       const std::string& filename,
                                       const std::string& content_type,
                                       const std::string& content,
                                       std::optional<Seconds> timeout = std::nullopt) const;

    // POSTs a JSON body and streams the 2xx response body into on_chunk.
    void post_stream(const std::string& path,
                     const nlohmann::json& body,
                     const ChunkHandler& on_chunk,
                     std::optional<Seconds> timeout = std::nullopt,
                     const utils::CancellationToken* token = nullptr) const;

    const std::string& base_url() const { return base_url_; }

private:
    std::string build_path(const std::string& path) const;
    httplib::Headers make_headers(bool json_body) const;
    httplib::Client make_client(Seconds timeout) const;
    nlohmann::json handle_response(const httplib::Result& response,
                                   const std::string& path) const;

    std::string base_url_;
    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    std::optional<std::string> authorization_token_;
    BackendRequestOptions options_;
};

}
