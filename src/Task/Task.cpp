#include "Task.hpp"

#include <algorithm>
#include <exception>

namespace bucketdl {

const char* taskStateName(TaskState state) {
  switch (state) {
    case TaskState::Pending:
      return "pending";
    case TaskState::Ready:
      return "ready";
    case TaskState::Running:
      return "running";
    case TaskState::Completed:
      return "completed";
    case TaskState::Failed:
      return "failed";
  }
  return "unknown";
}

TaskPtr Task::create(const Contract& contract, RetryPolicy retry,
                     utils::LoggerPtr logger) {
  return std::make_shared<Task>(contract, retry, std::move(logger));
}

Task::Task(const Contract& contract, RetryPolicy retry,
           utils::LoggerPtr logger)
    : id_(contract.id()),
      bucket_(contract.bucket()),
      key_(contract.key()),
      destination_(contract.destination()),
      options_(contract.options()),
      retry_(retry),
      bytesTransferred_(0),
      state_(TaskState::Pending),
      attempts_(0),
      notifier_(logger),
      logger_(std::move(logger)) {}

void Task::start(StorageClient& client) {
  const int maxAttempts = std::max(1, retry_.maxAttempts);
  while (true) {
    int attempt = 0;
    uint64_t before = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == TaskState::Completed || state_ == TaskState::Failed) {
        LOG(logger_, WARN) << "[Task] " << id_ << " already "
                           << taskStateName(state_) << ", not restarting";
        return;
      }
      state_ = TaskState::Running;
      attempt = ++attempts_;
      before = bytesTransferred_;
    }
    LOG(logger_, DEBUG) << "[Task] " << id_ << " attempt " << attempt << "/"
                        << maxAttempts << " " << bucket_ << "/" << key_
                        << " -> " << destination_;

    probeSize(client);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!startTime_) startTime_ = std::chrono::steady_clock::now();
    }

    std::string reason;
    try {
      client.downloadFile(bucket_, key_, destination_, options_,
                          [this](uint64_t delta) { onProgress(delta); });
      finishTransfer();
      return;
    } catch (const StorageError& e) {
      reason = std::string(e.kindName()) + ": " + e.what();
    } catch (const std::exception& e) {
      reason = std::string("TransferError: ") + e.what();
    } catch (...) {
      reason = "TransferError: unknown error";
    }

    LOG(logger_, ERROR) << "[Task] " << id_ << " transfer of " << bucket_
                        << "/" << key_ << " failed: " << reason;

    bool moved = false;
    bool allArrived = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      moved = bytesTransferred_ != before;
      allArrived = size_ && bytesTransferred_ == *size_;
    }
    if (allArrived) {
      // every byte is on disk; the error came from the tail of the exchange
      LOG(logger_, WARN) << "[Task] " << id_
                         << " error reported after every byte arrived, "
                            "keeping the transfer";
      finishTransfer();
      return;
    }
    if (!moved && attempt < maxAttempts) {
      LOG(logger_, WARN) << "[Task] " << id_ << " retrying ("
                         << attempt + 1 << "/" << maxAttempts << ")";
      continue;
    }
    fail(reason);
    return;
  }
}

void Task::probeSize(StorageClient& client) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (size_) return;
  }
  try {
    uint64_t probed = client.headObject(bucket_, key_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!size_) size_ = probed;
  } catch (const StorageError& e) {
    LOG(logger_, WARN) << "[Task] SizeProbeError for " << id_ << " ("
                       << bucket_ << "/" << key_ << "): " << e.kindName()
                       << ": " << e.what();
  } catch (const std::exception& e) {
    LOG(logger_, WARN) << "[Task] SizeProbeError for " << id_ << " ("
                       << bucket_ << "/" << key_ << "): " << e.what();
  } catch (...) {
    LOG(logger_, WARN) << "[Task] SizeProbeError for " << id_ << " ("
                       << bucket_ << "/" << key_ << "): unknown error";
  }
}

void Task::onProgress(uint64_t delta) {
  bool clamped = false;
  uint64_t total = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t next = bytesTransferred_ + delta;
    if (size_ && next > *size_) {
      next = *size_;
      clamped = true;
    }
    bytesTransferred_ = next;
    total = next;
  }
  if (clamped) {
    LOG(logger_, WARN) << "[Task] " << id_
                       << " received more bytes than the probed size, "
                          "holding at "
                       << total;
  }
  notify();
}

void Task::finishTransfer() {
  std::string shortfall;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!size_) size_ = bytesTransferred_;
    if (bytesTransferred_ < *size_) {
      shortfall = "short transfer: " + std::to_string(bytesTransferred_) +
                  " of " + std::to_string(*size_) + " bytes";
    } else {
      state_ = TaskState::Completed;
    }
  }
  if (!shortfall.empty()) {
    LOG(logger_, ERROR) << "[Task] " << id_ << " " << shortfall;
    fail(shortfall);
    return;
  }
  LOG(logger_, DEBUG) << "[Task] " << id_ << " finished in "
                      << std::chrono::duration_cast<std::chrono::milliseconds>(
                             elapsed())
                             .count()
                      << " ms";
  // zero-length objects never produce a progress callback
  notify();
}

void Task::fail(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = TaskState::Failed;
    error_ = reason;
  }
  notify();
}

void Task::notify() { notifier_.notify(shared_from_this()); }

bool Task::markReady() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != TaskState::Pending) return false;
  state_ = TaskState::Ready;
  return true;
}

std::optional<uint64_t> Task::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return size_;
}

uint64_t Task::bytesTransferred() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytesTransferred_;
}

TaskState Task::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

int Task::attempts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return attempts_;
}

std::string Task::error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

std::chrono::steady_clock::duration Task::elapsed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!startTime_) return std::chrono::steady_clock::duration::zero();
  return std::chrono::steady_clock::now() - *startTime_;
}

TaskSnapshot Task::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  TaskSnapshot snap;
  snap.id = id_;
  snap.size = size_;
  snap.bytesTransferred = bytesTransferred_;
  snap.state = state_;
  snap.attempts = attempts_;
  snap.error = error_;
  snap.startTime = startTime_;
  return snap;
}

}  // namespace bucketdl
