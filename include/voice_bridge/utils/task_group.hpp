#pragma once

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/cancellation.hpp"

namespace voice_bridge::utils {

// Owns a set of worker threads that share one lifetime. cancel_and_join()
// signals every task and waits for all of them; once it has run the group
// refuses new work.
class TaskGroup {
public:
    explicit TaskGroup(std::string name);
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // Fn is invoked as fn(const CancellationToken&). Returns false when the
    // group is already closed; fn is then destroyed without running.
    template <typename Fn>
    bool spawn(const std::string& task_name, Fn&& fn) {
        auto token = std::make_shared<CancellationToken>();
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        reap_finished_locked();
        std::thread worker(
            [fn = std::forward<Fn>(fn), token, done, group = name_, task_name]() mutable {
                try {
                    fn(static_cast<const CancellationToken&>(*token));
                } catch (const std::exception& ex) {
                    logging::error(
                        "Task failed",
                        {kv("group", group),
                         kv("task", task_name),
                         kv("error", ex.what())});
                }
                done->store(true);
            });
        tasks_.push_back({task_name, token, done, std::move(worker)});
        return true;
    }

    void cancel();
    void cancel_and_join();
    size_t active_count() const;

private:
    struct Task {
        std::string name;
        std::shared_ptr<CancellationToken> token;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread worker;
    };

    void reap_finished_locked();

    std::string name_;
    mutable std::mutex mutex_;
    std::vector<Task> tasks_;
    bool closed_ = false;
};

}
