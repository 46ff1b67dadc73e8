#include "voice_bridge/backend/records.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge::backend {

namespace {

template <typename T>
void set_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::string id_string(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    }
    return "";
}

}

std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

void to_json(nlohmann::json& j, const CallRecord& record) {
    j = nlohmann::json{
        {"call_id", record.call_id},
        {"direction", record.direction},
        {"from_number", record.from_number},
        {"to_number", record.to_number},
        {"status", record.status},
        {"duration", record.duration_seconds},
        {"transcript", record.transcript},
        {"cost", record.cost},
    };
    if (!record.id.empty()) {
        j["id"] = record.id;
    }
    if (!record.created_at.empty()) {
        j["created_at"] = record.created_at;
    }
    set_optional(j, "user_id", record.user_id);
    set_optional(j, "chat_id", record.chat_id);
    set_optional(j, "user_label", record.user_label);
}

void from_json(const nlohmann::json& j, CallRecord& record) {
    record.id = j.contains("id") ? id_string(j["id"]) : "";
    record.call_id = j.value("call_id", "");
    record.direction = j.value("direction", "outbound");
    record.from_number = j.value("from_number", "");
    record.to_number = j.value("to_number", "");
    record.status = j.value("status", "");
    record.duration_seconds = j.value("duration", 0);
    record.transcript = j.contains("transcript") && j["transcript"].is_string()
                            ? j["transcript"].get<std::string>()
                            : "";
    record.cost = j.value("cost", 0.0);
    record.user_id = optional_string(j, "user_id");
    record.chat_id = optional_string(j, "chat_id");
    record.user_label = optional_string(j, "user_label");
    record.created_at = j.value("created_at", "");
}

CallRecord MemoryCallRecordStore::create(const CallRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry;
    entry.sequence = next_sequence_++;
    entry.record = record;
    entry.record.id = std::to_string(entry.sequence);
    entry.record.created_at = utc_timestamp();
    records_[entry.record.id] = entry;
    return entry.record;
}

std::optional<CallRecord> MemoryCallRecordStore::find(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::optional<CallRecord> MemoryCallRecordStore::find_latest_by_call_id(
    const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* latest = nullptr;
    for (const auto& [id, entry] : records_) {
        if (entry.record.call_id != call_id) {
            continue;
        }
        if (!latest || entry.sequence > latest->sequence) {
            latest = &entry;
        }
    }
    if (!latest) {
        return std::nullopt;
    }
    return latest->record;
}

void MemoryCallRecordStore::update(const CallRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = records_.find(record.id);
    if (it == records_.end()) {
        throw RecordNotFound(record.id);
    }
    it->second.record = record;
}

size_t MemoryCallRecordStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

HttpCallRecordStore::HttpCallRecordStore(std::string base_url,
                                         std::optional<std::string> token,
                                         BackendRequestOptions options)
    : client_(std::move(base_url), std::move(token), options) {}

CallRecord HttpCallRecordStore::create(const CallRecord& record) {
    CallRecord pending = record;
    pending.created_at = utc_timestamp();
    const auto response = client_.post_json("/call_records", pending);
    auto created = response.get<CallRecord>();
    if (created.id.empty()) {
        throw BackendError("Record service returned no id");
    }
    return created;
}

std::optional<CallRecord> HttpCallRecordStore::find(const std::string& id) {
    try {
        return client_.get_json("/call_records/" + utils::url_encode(id)).get<CallRecord>();
    } catch (const BackendPermissionError&) {
        throw;
    } catch (const BackendError& ex) {
        debug("Call record lookup failed", {kv("record_id", id), kv("error", ex.what())});
        return std::nullopt;
    }
}

std::optional<CallRecord> HttpCallRecordStore::find_latest_by_call_id(
    const std::string& call_id) {
    const auto response =
        client_.get_json("/call_records?call_id=" + utils::url_encode(call_id));
    if (!response.is_array() || response.empty()) {
        return std::nullopt;
    }
    std::optional<CallRecord> latest;
    for (const auto& item : response) {
        auto record = item.get<CallRecord>();
        if (!latest || record.created_at >= latest->created_at) {
            latest = std::move(record);
        }
    }
    return latest;
}

void HttpCallRecordStore::update(const CallRecord& record) {
    if (record.id.empty()) {
        throw RecordNotFound(record.id);
    }
    client_.put_json("/call_records/" + utils::url_encode(record.id), record);
}

}
