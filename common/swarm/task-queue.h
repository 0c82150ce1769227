#pragma once

#include "task.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace swarm {

// critical 5, urgent 4, high 3, normal 2, low 1
int task_priority_weight(task_priority priority);

struct queued_task {
    task_definition task;
    int weight = 0;
    uint64_t seq = 0;  // submission order, kept across re-enqueues
};

// ============================================================================
// Task Queue
// ============================================================================

// Ordered by weight, then submission sequence (FIFO within a band).
class task_queue {
private:
    std::vector<queued_task> entries;  // kept sorted
    uint64_t next_seq = 0;

    void insert_sorted(queued_task entry);

public:
    using ready_fn = std::function<bool(const task_definition &)>;

    task_queue() = default;

    uint64_t enqueue(const task_definition & task);

    // put back a task taken by get_next without losing its place in line
    void requeue(const queued_task & entry);

    // Removes and returns at most count tasks in priority order. When is_ready is
    // given, tasks it rejects are skipped and stay queued.
    std::vector<queued_task> get_next(size_t count, const ready_fn & is_ready = nullptr);

    std::vector<task_definition> peek(size_t count) const;

    bool remove(const std::string & task_id);
    bool contains(const std::string & task_id) const;

    std::vector<std::string> ids() const;
    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
    void clear() { entries.clear(); }
};

} // namespace swarm
