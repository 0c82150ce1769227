#include "task-queue.h"

#include <algorithm>

namespace swarm {

int task_priority_weight(task_priority priority) {
    switch (priority) {
        case TASK_PRIORITY_CRITICAL: return 5;
        case TASK_PRIORITY_URGENT:   return 4;
        case TASK_PRIORITY_HIGH:     return 3;
        case TASK_PRIORITY_NORMAL:   return 2;
        case TASK_PRIORITY_LOW:      return 1;
        default:                     return 2;
    }
}

static bool queued_before(const queued_task & a, const queued_task & b) {
    if (a.weight != b.weight) {
        return a.weight > b.weight;
    }
    return a.seq < b.seq;
}

void task_queue::insert_sorted(queued_task entry) {
    auto pos = std::upper_bound(entries.begin(), entries.end(), entry, queued_before);
    entries.insert(pos, std::move(entry));
}

uint64_t task_queue::enqueue(const task_definition & task) {
    queued_task entry;
    entry.task   = task;
    entry.weight = task_priority_weight(task.priority);
    entry.seq    = next_seq++;
    insert_sorted(entry);
    return entry.seq;
}

void task_queue::requeue(const queued_task & entry) {
    queued_task copy = entry;
    copy.weight = task_priority_weight(entry.task.priority);
    insert_sorted(std::move(copy));
}

std::vector<queued_task> task_queue::get_next(size_t count, const ready_fn & is_ready) {
    std::vector<queued_task> out;
    for (auto it = entries.begin(); it != entries.end() && out.size() < count;) {
        if (is_ready && !is_ready(it->task)) {
            ++it;
            continue;
        }
        out.push_back(std::move(*it));
        it = entries.erase(it);
    }
    return out;
}

std::vector<task_definition> task_queue::peek(size_t count) const {
    std::vector<task_definition> out;
    for (size_t i = 0; i < entries.size() && i < count; i++) {
        out.push_back(entries[i].task);
    }
    return out;
}

bool task_queue::remove(const std::string & task_id) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&task_id](const queued_task & e) { return e.task.id == task_id; });
    if (it == entries.end()) {
        return false;
    }
    entries.erase(it);
    return true;
}

bool task_queue::contains(const std::string & task_id) const {
    return std::any_of(entries.begin(), entries.end(),
                       [&task_id](const queued_task & e) { return e.task.id == task_id; });
}

std::vector<std::string> task_queue::ids() const {
    std::vector<std::string> out;
    out.reserve(entries.size());
    for (const auto & e : entries) {
        out.push_back(e.task.id);
    }
    return out;
}

} // namespace swarm
