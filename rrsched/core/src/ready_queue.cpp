#include <rrsched/core/ready_queue.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace rrsched::core {

void ReadyQueue::push(std::shared_ptr<Task> task) {
    tasks_.push_back(std::move(task));
    sort_by_priority();
}

bool ReadyQueue::remove(const Task& task) {
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&task](const auto& queued) { return queued.get() == &task; });
    if (it == tasks_.end()) {
        return false;
    }
    tasks_.erase(it);
    return true;
}

bool ReadyQueue::reprioritize(const TaskId& id) {
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&id](const auto& task) { return task->id() == id; });
    if (it == tasks_.end()) {
        return false;
    }
    auto task = std::move(*it);
    tasks_.erase(it);
    push(std::move(task));
    return true;
}

std::shared_ptr<Task> ReadyQueue::rotate_head() {
    if (tasks_.empty()) {
        return nullptr;
    }

    auto head = tasks_.front();
    const int priority = head->priority();
    auto same_priority = std::count_if(tasks_.begin(), tasks_.end(),
                                       [priority](const auto& task) { return task->priority() == priority; });
    if (same_priority < 2) {
        return head;
    }

    tasks_.erase(tasks_.begin());

    // Insert right after the last remaining task of the same priority.
    auto last = std::find_if(tasks_.rbegin(), tasks_.rend(),
                             [priority](const auto& task) { return task->priority() == priority; });
    tasks_.insert(last.base(), head);
    return head;
}

std::vector<TaskId> ReadyQueue::ids() const {
    std::vector<TaskId> result;
    result.reserve(tasks_.size());
    std::transform(tasks_.begin(), tasks_.end(), std::back_inserter(result),
                   [](const auto& task) { return task->id(); });
    return result;
}

void ReadyQueue::sort_by_priority() {
    std::stable_sort(tasks_.begin(), tasks_.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs->priority() > rhs->priority(); });
}

} // namespace rrsched::core
