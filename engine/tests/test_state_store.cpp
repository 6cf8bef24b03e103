#include <iostream>
#include <cassert>
#include <chrono>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>
#include "flowcore/workflow/errors.hpp"
#include "flowcore/workflow/state_store.hpp"
#include "flowcore/workflow/time_utils.hpp"

using namespace flowcore::workflow;

StateRecord make_record(const std::string& workflow_id) {
    StateRecord record;
    record.workflow_id = workflow_id;
    record.execution_id = "exec-1";
    record.status = ExecutionStatus::running;
    record.steps_remaining = {"A", "B", "C"};
    return record;
}

void test_save_get_remove() {
    std::cout << "Testing save/get/remove..." << std::endl;

    MemoryStateStore store;
    assert(!store.get("wf"));

    store.save("wf", make_record("wf"));
    auto record = store.get("wf");
    assert(record);
    assert(record->execution_id == "exec-1");
    assert(record->status == ExecutionStatus::running);
    assert(store.size() == 1);

    assert(store.remove("wf"));
    assert(!store.remove("wf"));
    assert(!store.get("wf"));
    assert(store.size() == 0);

    std::cout << "✓ save/get/remove test passed" << std::endl;
}

void test_mark_step_completed_is_idempotent() {
    std::cout << "Testing mark_step_completed idempotency..." << std::endl;

    MemoryStateStore store;
    store.save("wf", make_record("wf"));

    store.mark_step_completed("wf", "A", nlohmann::json{{"a", 1}});
    store.mark_step_completed("wf", "A", nlohmann::json{{"a", 1}});
    store.mark_step_completed("wf", "B");

    auto record = store.get("wf");
    assert((record->steps_completed == std::vector<std::string>{"A", "B"}));
    assert(record->steps_remaining.count("A") == 0);
    assert(record->steps_remaining.count("B") == 0);
    assert(record->steps_remaining.count("C") == 1);
    assert(record->data["step_A"]["a"] == 1);
    assert(!record->data.contains("step_B"));

    // Completed and remaining stay disjoint
    for (const auto& step : record->steps_completed) {
        assert(record->steps_remaining.count(step) == 0);
    }

    bool threw = false;
    try {
        store.mark_step_completed("missing", "A");
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓ mark_step_completed idempotency test passed" << std::endl;
}

void test_update_progress_range() {
    std::cout << "Testing update_progress range check..." << std::endl;

    MemoryStateStore store;
    store.save("wf", make_record("wf"));

    store.update_progress("wf", 0.5, std::string("B"));
    auto record = store.get("wf");
    assert(record->progress == 0.5);
    assert(record->current_step == "B");

    for (double bad : {1.5, -0.1, std::numeric_limits<double>::quiet_NaN()}) {
        bool threw = false;
        try {
            store.update_progress("wf", bad);
        } catch (const StateError&) {
            threw = true;
        }
        assert(threw);
        auto unchanged = store.get("wf");
        assert(unchanged->progress == 0.5);
        assert(unchanged->current_step == "B");
    }

    store.update_progress("wf", 0.0);
    store.update_progress("wf", 1.0);
    assert(store.get("wf")->progress == 1.0);

    bool threw = false;
    try {
        store.update_progress("missing", 0.5);
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓ update_progress range check test passed" << std::endl;
}

void test_update_status_follows_state_machine() {
    std::cout << "Testing update_status transitions..." << std::endl;

    MemoryStateStore store;
    auto record = make_record("wf");
    record.status = ExecutionStatus::pending;
    store.save("wf", record);

    store.update_status("wf", ExecutionStatus::running);
    store.update_status("wf", ExecutionStatus::waiting);
    store.update_status("wf", ExecutionStatus::running);
    store.update_status("wf", ExecutionStatus::failed, std::string("boom"));
    auto saved = store.get("wf");
    assert(saved->status == ExecutionStatus::failed);
    assert(saved->error && *saved->error == "boom");

    bool threw = false;
    try {
        store.update_status("wf", ExecutionStatus::running);
    } catch (const StateError&) {
        threw = true;
    }
    assert(threw);
    assert(store.get("wf")->status == ExecutionStatus::failed);

    std::cout << "✓ update_status transitions test passed" << std::endl;
}

void test_updated_at_never_decreases() {
    std::cout << "Testing updated_at monotonicity..." << std::endl;

    MemoryStateStore store;
    store.save("wf", make_record("wf"));
    auto first = store.get("wf")->updated_at;

    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    store.mark_step_completed("wf", "A");
    auto second = store.get("wf")->updated_at;
    assert(second >= first);

    // Replacing with a stale record keeps the newer timestamp
    auto stale = make_record("wf");
    stale.created_at = Clock::now() - std::chrono::hours(1);
    stale.updated_at = stale.created_at;
    store.save("wf", stale);
    assert(store.get("wf")->updated_at >= second);

    std::cout << "✓ updated_at monotonicity test passed" << std::endl;
}

void test_cleanup_expired() {
    std::cout << "Testing cleanup_expired..." << std::endl;

    MemoryStateStore store;
    auto old_record = make_record("old");
    old_record.created_at = Clock::now() - std::chrono::hours(48);
    store.save("old", old_record);
    store.save("fresh", make_record("fresh"));

    assert(store.cleanup_expired(std::chrono::hours(24)) == 1);
    assert(!store.get("old"));
    assert(store.get("fresh"));

    // Zero max age removes everything
    store.save("another", make_record("another"));
    assert(store.cleanup_expired(std::chrono::milliseconds(0)) == 2);
    assert(store.size() == 0);
    assert(store.list().empty());

    std::cout << "✓ cleanup_expired test passed" << std::endl;
}

void test_record_json_shape() {
    std::cout << "Testing state record JSON..." << std::endl;

    auto record = make_record("wf");
    record.apply_step_completed("A", nlohmann::json{{"a", 1}});
    record.apply_progress(0.25, std::string("B"));
    record.error = "partial";
    record.metadata = {{"strategy", "parallel"}};

    auto j = record.to_json();
    assert(j["workflow_id"] == "wf");
    assert(j["status"] == "running");
    assert(j["steps_completed"].size() == 1);
    assert(j["steps_remaining"].size() == 2);
    assert(j["progress"] == 0.25);
    assert(j["error"] == "partial");
    assert(parse_iso8601(j["created_at"].get<std::string>()));

    auto parsed = StateRecord::from_json(j);
    assert(parsed.workflow_id == record.workflow_id);
    assert(parsed.steps_completed == record.steps_completed);
    assert(parsed.steps_remaining == record.steps_remaining);
    assert(parsed.current_step == "B");
    assert(parsed.data["step_A"]["a"] == 1);
    assert(parsed.metadata["strategy"] == "parallel");
    assert(std::abs(std::chrono::duration<double>(parsed.created_at - record.created_at).count()) < 0.001);

    bool threw = false;
    try {
        auto bad = j;
        bad["status"] = "exploded";
        StateRecord::from_json(bad);
    } catch (const StateError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓ state record JSON test passed" << std::endl;
}

void test_concurrent_mark_step_completed() {
    std::cout << "Testing concurrent updates..." << std::endl;

    MemoryStateStore store;
    auto record = make_record("wf");
    record.steps_remaining.clear();
    for (int i = 0; i < 50; ++i) {
        record.steps_remaining.insert("step" + std::to_string(i));
    }
    store.save("wf", record);

    std::vector<std::thread> threads;
    for (int t = 0; t < 5; ++t) {
        threads.emplace_back([&store]() {
            for (int i = 0; i < 50; ++i) {
                store.mark_step_completed("wf", "step" + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto final_record = store.get("wf");
    assert(final_record->steps_completed.size() == 50);
    assert(final_record->steps_remaining.empty());

    std::cout << "✓ concurrent updates test passed" << std::endl;
}

void test_execution_scoped_writes() {
    std::cout << "Testing execution-scoped writes..." << std::endl;

    MemoryStateStore store;
    assert(!store.record_step("wf", "exec-1", "A", nlohmann::json{{"a", 1}}, 0.5));
    assert(!store.finalize("wf", "exec-1", ExecutionStatus::completed));

    store.save("wf", make_record("wf"));
    assert(store.record_step("wf", "exec-1", "A", nlohmann::json{{"a", 1}}, 1.0 / 3.0));
    auto record = store.get("wf");
    assert((record->steps_completed == std::vector<std::string>{"A"}));
    assert(record->current_step == "A");
    assert(record->data["step_A"]["a"] == 1);

    // Another execution took over the record
    auto replacement = make_record("wf");
    replacement.execution_id = "exec-2";
    store.save("wf", replacement);

    assert(!store.record_step("wf", "exec-1", "B", nlohmann::json{{"b", 2}}, 2.0 / 3.0));
    assert(!store.finalize("wf", "exec-1", ExecutionStatus::failed, std::string("late")));
    record = store.get("wf");
    assert(record->execution_id == "exec-2");
    assert(record->steps_completed.empty());
    assert(record->status == ExecutionStatus::running);
    assert(!record->error);

    assert(store.finalize("wf", "exec-2", ExecutionStatus::completed));
    record = store.get("wf");
    assert(record->status == ExecutionStatus::completed);
    assert(record->progress == 1.0);

    // Still bound by the state machine
    bool threw = false;
    try {
        store.finalize("wf", "exec-2", ExecutionStatus::running);
    } catch (const StateError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓ execution-scoped writes test passed" << std::endl;
}

int main() {
    std::cout << "Running State Store Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        test_save_get_remove();
        test_mark_step_completed_is_idempotent();
        test_update_progress_range();
        test_update_status_follows_state_machine();
        test_updated_at_never_decreases();
        test_cleanup_expired();
        test_record_json_shape();
        test_concurrent_mark_step_completed();
        test_execution_scoped_writes();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All state store tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
