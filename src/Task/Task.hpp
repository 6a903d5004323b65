#ifndef BUCKETDL_TASK_HPP_
#define BUCKETDL_TASK_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "Contract/Contract.hpp"
#include "Observer.hpp"
#include "Storage/StorageClient.hpp"
#include "utils/logger.hpp"

namespace bucketdl {

enum class TaskState { Pending, Ready, Running, Completed, Failed };

const char* taskStateName(TaskState state);

// An attempt is repeated only if it failed before moving any bytes; partial
// transfers are never restarted. Default: one attempt.
struct RetryPolicy {
  int maxAttempts = 1;
};

struct TaskSnapshot {
  std::string id;
  std::optional<uint64_t> size;
  uint64_t bytesTransferred = 0;
  TaskState state = TaskState::Pending;
  int attempts = 0;
  std::string error;
  std::optional<std::chrono::steady_clock::time_point> startTime;
};

/**
 * @brief One object transfer and the listeners interested in it.
 *
 * Counters, size and state are guarded by a per-task mutex. Listeners run
 * synchronously on the thread executing start(), after the mutex has been
 * released.
 */
class Task : public std::enable_shared_from_this<Task> {
 public:
  static TaskPtr create(const Contract& contract,
                        RetryPolicy retry = RetryPolicy(),
                        utils::LoggerPtr logger = nullptr);

  Task(const Contract& contract, RetryPolicy retry, utils::LoggerPtr logger);

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  // Probes the object size, then downloads it through client. Never throws
  // for storage failures; those end in the Failed state.
  void start(StorageClient& client);

  // Adds delta to the transferred count and notifies listeners.
  void onProgress(uint64_t delta);

  bool attach(ListenerPtr listener) { return notifier_.attach(std::move(listener)); }
  bool detach(const ListenerPtr& listener) { return notifier_.detach(listener); }
  void notify();
  size_t listenerCount() const { return notifier_.size(); }

  // Pending -> Ready. Returns false from any other state.
  bool markReady();

  const std::string& id() const { return id_; }
  const std::string& bucket() const { return bucket_; }
  const std::string& key() const { return key_; }
  const std::string& destination() const { return destination_; }
  const TransferOptions& options() const { return options_; }

  std::optional<uint64_t> size() const;
  uint64_t bytesTransferred() const;
  TaskState state() const;
  int attempts() const;
  std::string error() const;
  std::chrono::steady_clock::duration elapsed() const;
  TaskSnapshot snapshot() const;

 private:
  void probeSize(StorageClient& client);
  void finishTransfer();
  void fail(const std::string& reason);

  const std::string id_;
  const std::string bucket_;
  const std::string key_;
  const std::string destination_;
  const TransferOptions options_;
  const RetryPolicy retry_;

  mutable std::mutex mutex_;
  std::optional<uint64_t> size_;
  uint64_t bytesTransferred_;
  TaskState state_;
  int attempts_;
  std::string error_;
  std::optional<std::chrono::steady_clock::time_point> startTime_;

  Notifier notifier_;
  utils::LoggerPtr logger_;
};

}  // namespace bucketdl

#endif  // BUCKETDL_TASK_HPP_
