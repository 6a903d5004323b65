#include "DownloadManager.hpp"

#include <exception>

namespace bucketdl {

DownloadManager::DownloadManager(ManagerOptions options,
                                 const ClientFactory& clientFactory,
                                 utils::LoggerPtr logger)
    : options_(options),
      logger_(std::move(logger)),
      pending_(std::make_shared<TaskQueue>()),
      ready_(std::make_shared<TaskQueue>()),
      complete_(std::make_shared<TaskQueue>()),
      failed_(std::make_shared<TaskQueue>()),
      progress_(std::make_shared<ProgressMap>()),
      ledger_(std::make_shared<Ledger>()) {
  pool_ = std::make_unique<ConnectionPool>(ready_, options_.workers,
                                           clientFactory, options_.pool,
                                           logger_);
  tracker_ = std::make_unique<ProgressTracker>(progress_, options_.tracker,
                                               logger_);
}

DownloadManager::~DownloadManager() { stop(); }

TaskPtr DownloadManager::submit(const Contract& contract) {
  TaskPtr task = Task::create(contract, options_.retry, logger_);
  pending_->push(task);
  submitted_.fetch_add(1);
  LOG(logger_, INFO) << "Submitted " << task->id() << " " << task->bucket()
                     << "/" << task->key() << " -> " << task->destination();
  // a late submission must not wait for another start()
  if (started_.load() && !stopped_.load()) drainPending();
  return task;
}

void DownloadManager::start() {
  if (started_.exchange(true)) {
    LOG(logger_, WARN) << "DownloadManager already started";
    return;
  }
  size_t drained = drainPending();
  LOG(logger_, INFO) << "Starting " << drained << " downloads on "
                     << pool_->size() << " connections";

  tracker_->start();
  pool_->start();
}

void DownloadManager::stop(int signal) {
  if (stopped_.exchange(true)) return;
  if (signal != 0) {
    LOG(logger_, INFO) << "Received signal " << signal
                       << ", joining connections";
  } else {
    LOG(logger_, INFO) << "Joining connections";
  }

  try {
    pool_->stop();
  } catch (const std::exception& e) {
    LOG(logger_, ERROR) << "Failed to stop connection pool: " << e.what();
  }

  try {
    tracker_->stop();
    if (started_.load()) tracker_->renderOnce();
  } catch (const std::exception& e) {
    LOG(logger_, ERROR) << "Failed to stop progress tracker: " << e.what();
  }

  LOG(logger_, INFO) << "Exiting: " << ledger_->completed.load()
                     << " complete, " << ledger_->failed.load()
                     << " failed, " << ready_->size() << " still queued";
}

bool DownloadManager::waitUntilSettled(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(ledger_->mutex);
  return ledger_->cv.wait_for(lock, timeout, [this]() {
    return ledger_->completed.load() + ledger_->failed.load() >=
           submitted_.load();
  });
}

size_t DownloadManager::drainPending() {
  std::lock_guard<std::mutex> lock(drainMutex_);
  size_t drained = 0;
  TaskPtr task;
  while (pending_->tryPop(task)) {
    attachObservers(task);
    task->markReady();
    ready_->push(std::move(task));
    ++drained;
  }
  if (drained > 0) {
    LOG(logger_, DEBUG) << "Moved " << drained << " tasks to the ready queue";
  }
  return drained;
}

void DownloadManager::attachObservers(const TaskPtr& task) {
  // weak: the queues own the tasks that own these listeners
  std::weak_ptr<TaskQueue> complete = complete_;
  std::weak_ptr<TaskQueue> failed = failed_;
  auto progress = progress_;
  auto ledger = ledger_;
  auto logger = logger_;

  // progress first: the final status is in the map before the task counts as
  // settled, and the "failed: ..." status below is never overwritten
  task->attach(std::make_shared<ProgressObserver>(progress));

  task->attach(std::make_shared<CompletionObserver>(
      [complete, ledger, logger](const TaskPtr& done) {
        if (auto queue = complete.lock()) queue->push(done);
        LOG(logger, INFO) << "Download " << done->id() << " complete.";
        {
          std::lock_guard<std::mutex> lock(ledger->mutex);
          ledger->completed.fetch_add(1);
        }
        ledger->cv.notify_all();
      }));

  task->attach(std::make_shared<FailureObserver>(
      [failed, progress, ledger, logger](const TaskPtr& broken) {
        if (auto queue = failed.lock()) queue->push(broken);
        progress->set(broken->id(), "failed: " + broken->error());
        LOG(logger, ERROR) << "Download " << broken->id() << " failed after "
                           << broken->attempts()
                           << " attempt(s): " << broken->error();
        {
          std::lock_guard<std::mutex> lock(ledger->mutex);
          ledger->failed.fetch_add(1);
        }
        ledger->cv.notify_all();
      }));
}

}  // namespace bucketdl
