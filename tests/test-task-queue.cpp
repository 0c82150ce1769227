// Task queue ordering and decomposition tests

#include "test-helpers.h"

#include "decomposer.h"
#include "task-queue.h"

#include <set>

using namespace swarm;

static task_definition make_task(const std::string & id, task_priority priority = TASK_PRIORITY_NORMAL) {
    task_definition t;
    t.id       = id;
    t.name     = id;
    t.type     = "analysis";
    t.priority = priority;
    return t;
}

static std::vector<std::string> drain_ids(task_queue & q, size_t count) {
    std::vector<std::string> out;
    for (const auto & e : q.get_next(count)) {
        out.push_back(e.task.id);
    }
    return out;
}

// ============================================================================
// Queue
// ============================================================================

static bool test_priority_order() {
    task_queue q;
    q.enqueue(make_task("low", TASK_PRIORITY_LOW));
    q.enqueue(make_task("critical", TASK_PRIORITY_CRITICAL));
    q.enqueue(make_task("normal", TASK_PRIORITY_NORMAL));

    const std::vector<std::string> expected = {"critical", "normal", "low"};
    TEST_ASSERT(drain_ids(q, 3) == expected, "tasks drain by priority weight");
    TEST_ASSERT(q.empty(), "queue is empty after draining");
    return true;
}

static bool test_fifo_within_band() {
    task_queue q;
    q.enqueue(make_task("h1", TASK_PRIORITY_HIGH));
    q.enqueue(make_task("n1"));
    q.enqueue(make_task("h2", TASK_PRIORITY_HIGH));
    q.enqueue(make_task("n2"));
    q.enqueue(make_task("h3", TASK_PRIORITY_HIGH));

    const std::vector<std::string> expected = {"h1", "h2", "h3", "n1", "n2"};
    TEST_ASSERT(drain_ids(q, 10) == expected, "equal weights keep submission order");
    return true;
}

static bool test_priority_weights() {
    TEST_ASSERT(task_priority_weight(TASK_PRIORITY_CRITICAL) == 5, "critical weight");
    TEST_ASSERT(task_priority_weight(TASK_PRIORITY_URGENT) == 4, "urgent weight");
    TEST_ASSERT(task_priority_weight(TASK_PRIORITY_HIGH) == 3, "high weight");
    TEST_ASSERT(task_priority_weight(TASK_PRIORITY_NORMAL) == 2, "normal weight");
    TEST_ASSERT(task_priority_weight(TASK_PRIORITY_LOW) == 1, "low weight");
    return true;
}

static bool test_requeue_keeps_place() {
    task_queue q;
    q.enqueue(make_task("first"));
    q.enqueue(make_task("second"));
    q.enqueue(make_task("third"));

    auto taken = q.get_next(1);
    TEST_ASSERT(taken.size() == 1 && taken[0].task.id == "first", "first task taken");

    q.enqueue(make_task("fourth"));
    q.requeue(taken[0]);

    const std::vector<std::string> expected = {"first", "second", "third", "fourth"};
    TEST_ASSERT(q.ids() == expected, "requeued task returns to the front of its band");
    return true;
}

static bool test_ready_gate() {
    task_queue q;
    q.enqueue(make_task("blocked", TASK_PRIORITY_CRITICAL));
    q.enqueue(make_task("ready-1"));
    q.enqueue(make_task("ready-2", TASK_PRIORITY_LOW));

    auto out = q.get_next(2, [](const task_definition & t) { return t.id != "blocked"; });
    TEST_ASSERT(out.size() == 2, "two ready tasks returned");
    TEST_ASSERT(out[0].task.id == "ready-1" && out[1].task.id == "ready-2", "gated task is skipped");
    TEST_ASSERT(q.size() == 1 && q.contains("blocked"), "gated task stays queued");
    return true;
}

static bool test_remove_and_peek() {
    task_queue q;
    q.enqueue(make_task("a", TASK_PRIORITY_HIGH));
    q.enqueue(make_task("b"));
    q.enqueue(make_task("c"));

    const auto top = q.peek(2);
    TEST_ASSERT(top.size() == 2 && top[0].id == "a" && top[1].id == "b", "peek shows the head");
    TEST_ASSERT(q.size() == 3, "peek does not remove");

    TEST_ASSERT(q.remove("b"), "queued task can be removed");
    TEST_ASSERT(!q.remove("b"), "second removal finds nothing");
    TEST_ASSERT(!q.contains("b"), "removed task is gone");
    TEST_ASSERT(q.size() == 2, "two tasks left");
    return true;
}

// ============================================================================
// Decomposition
// ============================================================================

static bool test_requires_decomposition() {
    task_definition t = make_task("t");
    t.complexity = TASK_COMPLEXITY_MODERATE;
    TEST_ASSERT(!requires_decomposition(t), "moderate tasks are queued whole");
    t.complexity = TASK_COMPLEXITY_COMPLEX;
    TEST_ASSERT(requires_decomposition(t), "complex tasks are split");
    t.complexity = TASK_COMPLEXITY_EXPERT;
    TEST_ASSERT(requires_decomposition(t), "expert tasks are split");
    return true;
}

static bool test_complex_parallel_plan() {
    task_definition t = make_task("index");
    t.complexity = TASK_COMPLEXITY_COMPLEX;
    t.requirements.capabilities = {"crawl", "parse"};
    t.estimated_duration_ms = 30000;

    default_decomposer decomposer;
    const decomposed_task d = decomposer.decompose(t);

    TEST_ASSERT(d.parent_id == "index", "decomposition names its parent");
    TEST_ASSERT(d.subtasks.size() == 3, "one subtask per capability plus integration");
    TEST_ASSERT(d.subtasks[0].required_capabilities == std::vector<std::string>{"crawl"}, "first subtask needs crawl");
    TEST_ASSERT(d.subtasks[1].required_capabilities == std::vector<std::string>{"parse"}, "second subtask needs parse");
    TEST_ASSERT(d.subtasks[0].dependencies.empty() && d.subtasks[1].dependencies.empty(),
                "parallel work has no sibling dependencies");
    TEST_ASSERT(d.subtasks[0].parallelizable, "work subtasks are parallelizable");

    const sub_task & integration = d.subtasks.back();
    TEST_ASSERT(integration.dependencies.size() == 2, "integration waits for all work");
    TEST_ASSERT(integration.critical_path, "integration is on the critical path");

    TEST_ASSERT(d.plan.strategy == EXECUTION_PARALLEL, "complex tasks run in parallel");
    TEST_ASSERT(d.plan.phases.size() == 2, "work phase and integration phase");
    TEST_ASSERT(d.plan.phases[0].parallel, "work phase is parallel");
    TEST_ASSERT(d.coordination.type == COORDINATION_CENTRALIZED, "central coordination");
    TEST_ASSERT(d.total_estimated_ms == 20000, "two phases of a third of the estimate");
    TEST_ASSERT(d.plan.rollback_steps.front() == "cancel " + integration.id, "rollback starts from the end");

    std::set<std::string> ids;
    for (const auto & s : d.subtasks) {
        ids.insert(s.id);
    }
    TEST_ASSERT(ids.size() == d.subtasks.size(), "subtask ids are unique");
    return true;
}

static bool test_expert_pipeline_plan() {
    task_definition t = make_task("train");
    t.complexity = TASK_COMPLEXITY_EXPERT;

    default_decomposer decomposer;
    const decomposed_task d = decomposer.decompose(t);

    TEST_ASSERT(d.subtasks.size() == 6, "five generic parts plus integration");
    TEST_ASSERT(d.plan.strategy == EXECUTION_PIPELINE, "expert tasks run as a pipeline");
    TEST_ASSERT(d.coordination.type == COORDINATION_HIERARCHICAL, "hierarchical coordination");
    TEST_ASSERT(d.plan.phases.size() == d.subtasks.size(), "one phase per pipeline stage");

    for (size_t i = 1; i + 1 < d.subtasks.size(); i++) {
        TEST_ASSERT(d.subtasks[i].dependencies.size() == 1, "each stage depends on one predecessor");
        TEST_ASSERT(d.subtasks[i].dependencies[0] == d.subtasks[i - 1].id, "stages chain in order");
    }
    TEST_ASSERT(d.subtasks[0].dependencies.empty(), "first stage starts immediately");
    TEST_ASSERT(d.subtasks.back().dependencies.size() == 5, "integration waits for every stage");

    // short estimates still get a floor per slice
    TEST_ASSERT(d.subtasks[0].estimated_duration_ms == 1000, "slice has a one second floor");
    return true;
}

static bool test_subtask_to_task() {
    task_definition parent = make_task("report", TASK_PRIORITY_URGENT);
    parent.complexity = TASK_COMPLEXITY_COMPLEX;
    parent.requirements.capabilities = {"write"};
    parent.requirements.excluded_agents = {"agent-bad"};
    parent.submitted_by = "alice";
    parent.estimated_duration_ms = 10000;

    default_decomposer decomposer;
    const decomposed_task d = decomposer.decompose(parent);
    const task_definition work = subtask_to_task(d.subtasks[0], parent, 1234);
    const task_definition integ = subtask_to_task(d.subtasks[1], parent, 1234);

    TEST_ASSERT(work.parent_id() == "report", "metadata carries the parent id");
    TEST_ASSERT(work.metadata["order"] == 1, "metadata carries the order");
    TEST_ASSERT(work.priority == TASK_PRIORITY_URGENT, "priority is inherited");
    TEST_ASSERT(work.complexity == TASK_COMPLEXITY_SIMPLE, "subtasks are simple");
    TEST_ASSERT(work.requirements.excluded_agents == parent.requirements.excluded_agents, "exclusions are inherited");
    TEST_ASSERT(work.constraints.timeout_ms == 2 * work.estimated_duration_ms, "timeout is twice the estimate");
    TEST_ASSERT(work.created == 1234, "creation time is stamped");
    TEST_ASSERT(work.submitted_by == "alice", "submitter is inherited");

    TEST_ASSERT(integ.dependencies.size() == 1, "integration has one dependency");
    TEST_ASSERT(integ.dependencies[0].task_id == work.id, "dependency points at the work subtask");
    TEST_ASSERT(integ.dependencies[0].type == DEPENDENCY_BLOCKING, "sibling dependencies block");

    TEST_ASSERT(make_task("plain").parent_id().empty(), "top-level tasks have no parent");
    return true;
}

static bool test_task_json_round_trip() {
    task_definition t = make_task("json-task", TASK_PRIORITY_HIGH);
    t.complexity = TASK_COMPLEXITY_MODERATE;
    t.requirements.capabilities = {"sql"};
    t.requirements.resources.gpu = 0.5;
    t.dependencies.push_back({"dep-1", DEPENDENCY_DATA, 0.5});
    t.constraints.max_retries = 1;

    const task_definition back = task_definition::from_json(json::parse(t.to_json().dump()));
    TEST_ASSERT(back.priority == TASK_PRIORITY_HIGH, "priority survives");
    TEST_ASSERT(back.complexity == TASK_COMPLEXITY_MODERATE, "complexity survives");
    TEST_ASSERT(back.requirements.resources.gpu.has_value(), "gpu requirement survives");
    TEST_ASSERT(back.dependencies.size() == 1 && back.dependencies[0].type == DEPENDENCY_DATA, "dependency survives");
    TEST_ASSERT(back.dependencies[0].gates(), "data dependencies gate");
    TEST_ASSERT(back.constraints.max_retries == 1, "retry budget survives");
    return true;
}

int main() {
    quiet_logs();

    std::cout << "=== Task Queue Tests ===" << std::endl << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Queue
    RUN_TEST(test_priority_order);
    RUN_TEST(test_fifo_within_band);
    RUN_TEST(test_priority_weights);
    RUN_TEST(test_requeue_keeps_place);
    RUN_TEST(test_ready_gate);
    RUN_TEST(test_remove_and_peek);

    // Decomposition
    RUN_TEST(test_requires_decomposition);
    RUN_TEST(test_complex_parallel_plan);
    RUN_TEST(test_expert_pipeline_plan);
    RUN_TEST(test_subtask_to_task);
    RUN_TEST(test_task_json_round_trip);

    return report_results(total, passed, failed);
}
