#include "utilities/worker_pool.hpp"
#include "utilities/logger.h"
#include <exception>

namespace ledgerproof {

WorkerPool::WorkerPool(std::size_t threads) {
  if (threads == 0)
    threads = 1;
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i)
    workers_.emplace_back(&WorkerPool::threadFunc, this);
}

WorkerPool::~WorkerPool() { stop(); }

bool WorkerPool::submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lg(mtx_);
    if (!running_)
      return false;
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void WorkerPool::stop() {
  {
    std::lock_guard<std::mutex> lg(mtx_);
    if (!running_)
      return;
    running_ = false;
  }
  cv_.notify_all();
  for (auto &t : workers_) {
    if (t.joinable())
      t.join();
  }
}

void WorkerPool::threadFunc() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait(lk, [this] { return !running_ || !queue_.empty(); });
      if (queue_.empty())
        return;
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    try {
      task();
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                std::string("Worker task failed: ") + e.what());
    }
  }
}

} // namespace ledgerproof
