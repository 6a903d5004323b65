#ifndef BUCKETDL_DOWNLOAD_MANAGER_HPP_
#define BUCKETDL_DOWNLOAD_MANAGER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

#include "Connection/ConnectionPool.hpp"
#include "Contract/Contract.hpp"
#include "Progress/ProgressMap.hpp"
#include "Progress/ProgressTracker.hpp"
#include "Storage/StorageClient.hpp"
#include "Task/Task.hpp"
#include "utils/logger.hpp"

namespace bucketdl {

struct ManagerOptions {
  size_t workers = 1;
  RetryPolicy retry;
  PoolOptions pool;
  TrackerOptions tracker;
};

/**
 * @brief Moves tasks pending -> ready -> complete (or failed).
 *
 * pending -> ready happens only in drainPending(); ready -> complete only in
 * the completion listener; ready -> failed only in the failure listener.
 * Submissions made after start() are drained immediately.
 */
class DownloadManager {
 public:
  DownloadManager(ManagerOptions options, const ClientFactory& clientFactory,
                  utils::LoggerPtr logger);
  ~DownloadManager();

  DownloadManager(const DownloadManager&) = delete;
  DownloadManager& operator=(const DownloadManager&) = delete;

  TaskPtr submit(const Contract& contract);
  void start();
  // Best effort: the pool is stopped first, then the tracker, and a failure
  // in one step does not skip the other.
  void stop(int signal = 0);

  // True once every submitted task is complete or failed.
  bool waitUntilSettled(std::chrono::milliseconds timeout);

  TaskQueue& pendingQueue() { return *pending_; }
  TaskQueue& readyQueue() { return *ready_; }
  TaskQueue& completeQueue() { return *complete_; }
  TaskQueue& failedQueue() { return *failed_; }
  const std::shared_ptr<ProgressMap>& progressMap() const { return progress_; }
  ConnectionPool& connectionPool() { return *pool_; }

  size_t submittedCount() const { return submitted_.load(); }
  size_t completedCount() const { return ledger_->completed.load(); }
  size_t failedCount() const { return ledger_->failed.load(); }
  size_t settledCount() const { return completedCount() + failedCount(); }
  bool isStarted() const { return started_.load(); }

 private:
  // Outcome counters shared with the listeners, which may outlive the
  // manager if a connection had to be detached.
  struct Ledger {
    std::atomic<size_t> completed{0};
    std::atomic<size_t> failed{0};
    std::mutex mutex;
    std::condition_variable cv;
  };

  size_t drainPending();
  void attachObservers(const TaskPtr& task);

  ManagerOptions options_;
  utils::LoggerPtr logger_;

  std::shared_ptr<TaskQueue> pending_;
  std::shared_ptr<TaskQueue> ready_;
  std::shared_ptr<TaskQueue> complete_;
  std::shared_ptr<TaskQueue> failed_;
  std::shared_ptr<ProgressMap> progress_;

  std::unique_ptr<ConnectionPool> pool_;
  std::unique_ptr<ProgressTracker> tracker_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<size_t> submitted_{0};
  std::shared_ptr<Ledger> ledger_;

  std::mutex drainMutex_;
};

}  // namespace bucketdl

#endif  // BUCKETDL_DOWNLOAD_MANAGER_HPP_
