#include <iostream>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <string>
#include <unistd.h>
#include "flowcore/workflow/errors.hpp"
#include "flowcore/workflow/sqlite_state_store.hpp"

using namespace flowcore::workflow;

StateRecord make_record(const std::string& workflow_id) {
    StateRecord record;
    record.workflow_id = workflow_id;
    record.execution_id = "exec-42";
    record.status = ExecutionStatus::running;
    record.steps_remaining = {"A", "B"};
    record.data = {{"topic", "storage"}};
    return record;
}

std::string temp_db_path() {
    return "/tmp/flowcore_state_test_" + std::to_string(getpid()) + ".db";
}

void test_in_memory_contract() {
    std::cout << "Testing SQLite store contract..." << std::endl;

    SqliteStateStore store(":memory:");
    assert(!store.get("wf"));

    store.save("wf", make_record("wf"));
    store.mark_step_completed("wf", "A", nlohmann::json{{"result", "ok"}});
    store.mark_step_completed("wf", "A", nlohmann::json{{"result", "ok"}});
    store.update_progress("wf", 0.5, std::string("B"));

    auto record = store.get("wf");
    assert(record);
    assert(record->execution_id == "exec-42");
    assert((record->steps_completed == std::vector<std::string>{"A"}));
    assert((record->steps_remaining == std::set<std::string>{"B"}));
    assert(record->progress == 0.5);
    assert(record->current_step == "B");
    assert(record->data["topic"] == "storage");
    assert(record->data["step_A"]["result"] == "ok");

    bool threw = false;
    try {
        store.update_progress("wf", 2.0);
    } catch (const StateError&) {
        threw = true;
    }
    assert(threw);
    assert(store.get("wf")->progress == 0.5);

    threw = false;
    try {
        store.mark_step_completed("nope", "A");
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert(threw);

    store.update_status("wf", ExecutionStatus::completed);
    threw = false;
    try {
        store.update_status("wf", ExecutionStatus::running);
    } catch (const StateError&) {
        threw = true;
    }
    assert(threw);

    assert(store.size() == 1);
    assert(store.remove("wf"));
    assert(!store.remove("wf"));
    assert(store.size() == 0);

    std::cout << "✓ SQLite store contract test passed" << std::endl;
}

void test_cleanup_expired() {
    std::cout << "Testing SQLite cleanup_expired..." << std::endl;

    SqliteStateStore store;
    auto old_record = make_record("old");
    old_record.created_at = Clock::now() - std::chrono::hours(2);
    store.save("old", old_record);
    store.save("fresh", make_record("fresh"));

    assert(store.cleanup_expired(std::chrono::hours(1)) == 1);
    assert(!store.get("old"));
    assert(store.cleanup_expired(std::chrono::milliseconds(0)) == 1);
    assert(store.list().empty());

    std::cout << "✓ SQLite cleanup_expired test passed" << std::endl;
}

void test_records_survive_reopen() {
    std::cout << "Testing SQLite persistence..." << std::endl;

    auto path = temp_db_path();
    std::remove(path.c_str());

    {
        SqliteStateStore store(path);
        store.save("wf", make_record("wf"));
        store.mark_step_completed("wf", "A");
        store.update_status("wf", ExecutionStatus::failed, std::string("disk full"));
    }

    {
        SqliteStateStore reopened(path);
        auto record = reopened.get("wf");
        assert(record);
        assert(record->status == ExecutionStatus::failed);
        assert(record->error && *record->error == "disk full");
        assert((record->steps_completed == std::vector<std::string>{"A"}));
        assert(reopened.list().size() == 1);
    }

    std::remove(path.c_str());

    std::cout << "✓ SQLite persistence test passed" << std::endl;
}

void test_open_failure_raises() {
    std::cout << "Testing SQLite open failure..." << std::endl;

    bool threw = false;
    try {
        SqliteStateStore store("/nonexistent-dir/flowcore/state.db");
    } catch (const StateError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓ SQLite open failure test passed" << std::endl;
}

int main() {
    std::cout << "Running SQLite State Store Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        test_in_memory_contract();
        test_cleanup_expired();
        test_records_survive_reopen();
        test_open_failure_raises();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All SQLite state store tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
