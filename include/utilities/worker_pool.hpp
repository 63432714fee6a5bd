#ifndef LEDGERPROOF_WORKER_POOL_HPP
#define LEDGERPROOF_WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace ledgerproof {

/**
 * @brief Fixed set of threads draining a FIFO task queue.
 *
 * Exceptions escaping a task are logged and do not stop the worker.
 */
class WorkerPool {
public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Queue @p task. Returns false once the pool is stopping.
  bool submit(std::function<void()> task);

  /// Finish queued tasks and join all threads.
  void stop();

  std::size_t size() const { return workers_.size(); }

private:
  void threadFunc();

  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> queue_;
  std::mutex mtx_;
  std::condition_variable cv_;
  std::atomic<bool> running_{true};
};

} // namespace ledgerproof

#endif // LEDGERPROOF_WORKER_POOL_HPP
