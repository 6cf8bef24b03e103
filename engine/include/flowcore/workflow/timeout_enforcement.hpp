#pragma once

#include "flowcore/workflow/worker_pool.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <memory>

namespace flowcore {
namespace workflow {

/**
 * Step timeout enforcement
 *
 * Runs an operation on the worker pool and waits for it for at most
 * `timeout_ms`, counted from the moment the operation starts running. A
 * timeout only abandons the wait: the operation keeps its thread until it
 * returns on its own, and its result is dropped. The pool starts a surplus
 * thread for new work while abandoned operations are still running.
 */
class TimeoutEnforcement {
public:
    /**
     * Execute operation with timeout
     *
     * Returns true if the operation completed within the timeout, false if
     * the timeout elapsed first. Exceptions thrown by the operation are
     * rethrown here. A non-positive timeout waits without limit.
     */
    template<typename Result>
    static bool execute_with_timeout(
        WorkerPool& pool,
        std::function<Result()> operation,
        int64_t timeout_ms,
        Result& result) {

        auto started = std::make_shared<std::promise<void>>();
        auto started_future = started->get_future();
        auto future = pool.submit([started, operation = std::move(operation)]() {
            started->set_value();
            return operation();
        });

        if (timeout_ms > 0) {
            started_future.wait();
            auto status = future.wait_for(std::chrono::milliseconds(timeout_ms));
            if (status == std::future_status::timeout) {
                return false;
            }
        }

        result = future.get();
        return true;
    }

    static int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - since).count();
    }
};

} // namespace workflow
} // namespace flowcore
