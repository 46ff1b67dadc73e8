#include "voice_bridge/utils/task_group.hpp"

#include <algorithm>

namespace voice_bridge::utils {

TaskGroup::TaskGroup(std::string name) : name_(std::move(name)) {}

TaskGroup::~TaskGroup() {
    cancel_and_join();
}

void TaskGroup::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& task : tasks_) {
        task.token->cancel();
    }
}

void TaskGroup::cancel_and_join() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        for (auto& task : tasks_) {
            task.token->cancel();
        }
        tasks.swap(tasks_);
    }
    const auto self = std::this_thread::get_id();
    for (auto& task : tasks) {
        if (!task.worker.joinable()) {
            continue;
        }
        if (task.worker.get_id() == self) {
            // A task tearing down its own group cannot join itself.
            task.worker.detach();
            continue;
        }
        task.worker.join();
    }
    if (!tasks.empty()) {
        logging::debug(
            "Task group joined",
            {kv("group", name_),
             kv("tasks", tasks.size())});
    }
}

size_t TaskGroup::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(), [](const Task& task) {
        return !task.done->load();
    }));
}

void TaskGroup::reap_finished_locked() {
    auto it = tasks_.begin();
    while (it != tasks_.end()) {
        if (it->done->load() && it->worker.joinable()) {
            it->worker.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

}
