#include "ConnectionPool.hpp"

#include <exception>
#include <stdexcept>

namespace bucketdl {

Connection::Connection(size_t index, std::unique_ptr<StorageClient> client,
                       std::shared_ptr<TaskQueue> readyQueue,
                       PoolOptions options, utils::LoggerPtr logger)
    : index_(index),
      client_(std::move(client)),
      readyQueue_(std::move(readyQueue)),
      options_(options),
      logger_(std::move(logger)),
      exited_(false) {
  if (!client_) {
    throw std::invalid_argument("Connection requires a storage client");
  }
}

Connection::~Connection() {
  // only reachable with a live thread when that thread held the last
  // reference, i.e. we are running on it
  if (thread_.joinable()) thread_.detach();
}

void Connection::start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard<std::mutex> lock(exitMutex_);
    exited_ = false;
  }
  auto self = shared_from_this();
  thread_ = std::thread([self]() { self->run(); });
}

void Connection::requestStop() { running_.store(false); }

bool Connection::waitForExit(std::chrono::steady_clock::time_point deadline) {
  bool exited = false;
  {
    std::unique_lock<std::mutex> lock(exitMutex_);
    exited = exitCv_.wait_until(lock, deadline, [this]() { return exited_; });
  }
  if (!thread_.joinable()) return exited;
  if (exited) {
    thread_.join();
    return true;
  }
  LOG(logger_, WARN) << "[Connection " << index_
                     << "] still transferring after the join timeout, "
                        "detaching";
  thread_.detach();
  return false;
}

void Connection::run() {
  LOG(logger_, DEBUG) << "[Connection " << index_ << "] started";
  while (running_.load()) {
    TaskPtr task;
    if (!readyQueue_->popFor(task, options_.pollInterval)) continue;
    if (!task) continue;
    if (!running_.load()) {
      // stop arrived while we were waiting; leave the task for a later run
      readyQueue_->push(std::move(task));
      break;
    }
    runTask(task);
  }
  LOG(logger_, DEBUG) << "[Connection " << index_ << "] exiting after "
                      << tasksRun_.load() << " tasks";
  {
    std::lock_guard<std::mutex> lock(exitMutex_);
    exited_ = true;
  }
  exitCv_.notify_all();
}

void Connection::runTask(const TaskPtr& task) {
  busy_.store(true);
  LOG(logger_, INFO) << "[Connection " << index_ << "] claimed task "
                     << task->id() << " (" << task->bucket() << "/"
                     << task->key() << ")";
  try {
    task->start(*client_);
  } catch (const std::exception& e) {
    LOG(logger_, ERROR) << "[Connection " << index_ << "] task " << task->id()
                        << " escaped with: " << e.what();
  } catch (...) {
    LOG(logger_, ERROR) << "[Connection " << index_ << "] task " << task->id()
                        << " escaped with an unknown exception";
  }
  tasksRun_.fetch_add(1);
  busy_.store(false);
}

ConnectionPool::ConnectionPool(std::shared_ptr<TaskQueue> readyQueue,
                               size_t size, const ClientFactory& clientFactory,
                               PoolOptions options, utils::LoggerPtr logger)
    : options_(options), logger_(std::move(logger)), stopped_(false) {
  if (!readyQueue) {
    throw std::invalid_argument("ConnectionPool requires a ready queue");
  }
  if (!clientFactory) {
    throw std::invalid_argument("ConnectionPool requires a client factory");
  }
  if (size == 0) {
    LOG(logger_, WARN) << "[ConnectionPool] size 0 requested, using 1";
    size = 1;
  }
  connections_.reserve(size);
  for (size_t i = 0; i < size; ++i) {
    connections_.push_back(std::make_shared<Connection>(
        i, clientFactory(), readyQueue, options_, logger_));
  }
  LOG(logger_, INFO) << "[ConnectionPool] created " << size << " connections";
}

ConnectionPool::~ConnectionPool() { stop(); }

void ConnectionPool::start() {
  std::lock_guard<std::mutex> lock(lifecycleMutex_);
  if (running_.load() || stopped_) return;
  running_.store(true);
  for (auto& connection : connections_) connection->start();
  LOG(logger_, INFO) << "[ConnectionPool] started " << connections_.size()
                     << " connections";
}

bool ConnectionPool::stop() {
  std::lock_guard<std::mutex> lock(lifecycleMutex_);
  if (stopped_) return true;
  stopped_ = true;
  if (!running_.exchange(false)) return true;

  for (auto& connection : connections_) connection->requestStop();

  const auto deadline = std::chrono::steady_clock::now() + options_.joinTimeout;
  bool clean = true;
  for (auto& connection : connections_) {
    if (!connection->waitForExit(deadline)) clean = false;
  }
  if (clean) {
    LOG(logger_, INFO) << "[ConnectionPool] all connections joined";
  } else {
    LOG(logger_, WARN) << "[ConnectionPool] join timeout of "
                       << options_.joinTimeout.count()
                       << " ms exceeded, some transfers left running";
  }
  return clean;
}

size_t ConnectionPool::busyCount() const {
  size_t busy = 0;
  for (const auto& connection : connections_) {
    if (connection->isBusy()) ++busy;
  }
  return busy;
}

}  // namespace bucketdl
