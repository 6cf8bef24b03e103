#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace flowcore {
namespace workflow {

// Thread pool that runs step attempts off the engine thread.
//
// `concurrency` threads stay up for the pool's lifetime. When a task is
// submitted while every thread is busy (for example still running an
// attempt whose timeout was abandoned), a surplus thread is started for it
// and exits once the queue is empty, so a queued task never waits behind a
// hung one. Tasks are wrapped in packaged_tasks, so exceptions travel
// through the returned future instead of escaping the worker thread.
class WorkerPool {
 public:
  explicit WorkerPool(int concurrency) : concurrency_(concurrency < 1 ? 1 : concurrency), stop_(false) {
    std::unique_lock<std::mutex> lk(mu_);
    for (int i = 0; i < concurrency_; ++i) {
      spawn_locked(true);
    }
  }

  // Drains queued tasks, then joins every thread, surplus ones included
  ~WorkerPool() {
    {
      std::unique_lock<std::mutex> lk(mu_);
      stop_ = true;
    }
    cv_.notify_all();
    std::map<std::thread::id, std::thread> threads;
    {
      std::unique_lock<std::mutex> lk(mu_);
      threads.swap(threads_);
    }
    for (auto &entry : threads) entry.second.join();
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  template <class F>
  auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    auto future = task->get_future();
    {
      std::unique_lock<std::mutex> lk(mu_);
      reap_locked();
      q_.push([task]() { (*task)(); });
      if (q_.size() > idle_) {
        spawn_locked(false);
      }
    }
    cv_.notify_one();
    return future;
  }

  int concurrency() const { return concurrency_; }

  // Threads currently alive, surplus ones included
  size_t thread_count() const {
    std::unique_lock<std::mutex> lk(mu_);
    return threads_.size() - finished_.size();
  }

 private:
  // Called with mu_ held
  void spawn_locked(bool core) {
    std::thread thread([this, core]() { this->run(core); });
    auto id = thread.get_id();
    threads_.emplace(id, std::move(thread));
  }

  // Joins surplus threads that already left run(); called with mu_ held
  void reap_locked() {
    for (const auto& id : finished_) {
      auto it = threads_.find(id);
      if (it != threads_.end()) {
        it->second.join();
        threads_.erase(it);
      }
    }
    finished_.clear();
  }

  void run(bool core) {
    while (true) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lk(mu_);
        if (!core && q_.empty()) {
          finished_.push_back(std::this_thread::get_id());
          return;
        }
        ++idle_;
        cv_.wait(lk, [this]{ return stop_ || !q_.empty(); });
        --idle_;
        if (stop_ && q_.empty()) return;
        task = std::move(q_.front());
        q_.pop();
      }
      task();
    }
  }

  int concurrency_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> q_;
  size_t idle_ = 0;
  bool stop_;
  std::map<std::thread::id, std::thread> threads_;
  std::vector<std::thread::id> finished_;
};

} // namespace workflow
} // namespace flowcore
