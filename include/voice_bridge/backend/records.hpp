#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/backend/client.hpp"

namespace voice_bridge {
namespace backend {

struct CallRecord {
    std::string id;
    std::string call_id;
    std::string direction = "outbound";
    std::string from_number;
    std::string to_number;
    std::string status = "initiated";
    int duration_seconds = 0;
    std::string transcript;
    double cost = 0.0;
    std::optional<std::string> user_id;
    std::optional<std::string> chat_id;
    std::optional<std::string> user_label;
    std::string created_at;
};

void to_json(nlohmann::json& j, const CallRecord& record);
void from_json(const nlohmann::json& j, CallRecord& record);

class RecordNotFound : public std::runtime_error {
public:
    explicit RecordNotFound(const std::string& id)
        : std::runtime_error("Call record not found: " + id) {}
};

class CallRecordStore {
public:
    virtual ~CallRecordStore() = default;

    // Stores a new record and returns it with id and created_at assigned.
    virtual CallRecord create(const CallRecord& record) = 0;
    virtual std::optional<CallRecord> find(const std::string& id) = 0;
    virtual std::optional<CallRecord> find_latest_by_call_id(const std::string& call_id) = 0;
    // Replaces the stored record with the same id.
    virtual void update(const CallRecord& record) = 0;
};

// In-process store used when no record service is configured.
class MemoryCallRecordStore : public CallRecordStore {
public:
    CallRecord create(const CallRecord& record) override;
    std::optional<CallRecord> find(const std::string& id) override;
    std::optional<CallRecord> find_latest_by_call_id(const std::string& call_id) override;
    void update(const CallRecord& record) override;

    size_t size() const;

private:
    struct Entry {
        uint64_t sequence = 0;
        CallRecord record;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> records_;
    uint64_t next_sequence_ = 1;
};

// JSON record service: POST/GET/PUT under /call_records.
class HttpCallRecordStore : public CallRecordStore {
public:
    HttpCallRecordStore(std::string base_url,
                        std::optional<std::string> token,
                        BackendRequestOptions options);

    CallRecord create(const CallRecord& record) override;
    std::optional<CallRecord> find(const std::string& id) override;
    std::optional<CallRecord> find_latest_by_call_id(const std::string& call_id) override;
    void update(const CallRecord& record) override;

private:
    BackendClient client_;
};

std::string utc_timestamp();

}
}
