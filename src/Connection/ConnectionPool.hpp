#ifndef BUCKETDL_CONNECTION_POOL_HPP_
#define BUCKETDL_CONNECTION_POOL_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "Storage/StorageClient.hpp"
#include "Task/Task.hpp"
#include "utils/blocking_queue.hpp"
#include "utils/logger.hpp"

namespace bucketdl {

using TaskQueue = utils::BlockingQueue<TaskPtr>;

struct PoolOptions {
  // How long an idle connection waits on the ready queue before re-checking
  // whether it should stop.
  std::chrono::milliseconds pollInterval{200};
  // Upper bound for stop() waiting on in-flight transfers.
  std::chrono::milliseconds joinTimeout{30000};
};

/**
 * @brief Worker thread bound to one storage client.
 *
 * Claims tasks from the ready queue and runs each to the end before taking
 * the next. The loop only exits once stop has been requested; until then an
 * idle connection keeps polling, so work submitted late is still picked up.
 */
class Connection : public std::enable_shared_from_this<Connection> {
 public:
  Connection(size_t index, std::unique_ptr<StorageClient> client,
             std::shared_ptr<TaskQueue> readyQueue, PoolOptions options,
             utils::LoggerPtr logger);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  void start();
  void requestStop();
  // Joins if the thread exits before the deadline, otherwise detaches it.
  bool waitForExit(std::chrono::steady_clock::time_point deadline);

  size_t index() const { return index_; }
  bool isBusy() const { return busy_.load(); }
  size_t tasksRun() const { return tasksRun_.load(); }

 private:
  void run();
  void runTask(const TaskPtr& task);

  const size_t index_;
  std::unique_ptr<StorageClient> client_;
  std::shared_ptr<TaskQueue> readyQueue_;
  PoolOptions options_;
  utils::LoggerPtr logger_;

  std::atomic<bool> running_{false};
  std::atomic<bool> busy_{false};
  std::atomic<size_t> tasksRun_{0};

  std::mutex exitMutex_;
  std::condition_variable exitCv_;
  bool exited_;
  std::thread thread_;
};

// Fixed set of connections sharing one ready queue. The pool size is the
// only bound on concurrent transfers.
class ConnectionPool {
 public:
  // Builds every client up front; a throwing factory aborts construction.
  ConnectionPool(std::shared_ptr<TaskQueue> readyQueue, size_t size,
                 const ClientFactory& clientFactory,
                 PoolOptions options = PoolOptions(),
                 utils::LoggerPtr logger = nullptr);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  void start();
  // Stops claiming new tasks and waits for in-flight ones, bounded by
  // PoolOptions::joinTimeout. Returns false if some connection overran.
  bool stop();

  size_t size() const { return connections_.size(); }
  bool isRunning() const { return running_.load(); }
  size_t busyCount() const;

 private:
  std::vector<std::shared_ptr<Connection>> connections_;
  PoolOptions options_;
  utils::LoggerPtr logger_;
  std::mutex lifecycleMutex_;
  std::atomic<bool> running_{false};
  bool stopped_;
};

}  // namespace bucketdl

#endif  // BUCKETDL_CONNECTION_POOL_HPP_
