#include "Observer.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>

#include "Task.hpp"

namespace bucketdl {

Notifier::Notifier(utils::LoggerPtr logger) : logger_(std::move(logger)) {}

bool Notifier::attach(ListenerPtr listener) {
  if (!listener) return false;
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(listeners_.begin(), listeners_.end(), listener) !=
      listeners_.end()) {
    return false;
  }
  listeners_.push_back(std::move(listener));
  return true;
}

bool Notifier::detach(const ListenerPtr& listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find(listeners_.begin(), listeners_.end(), listener);
  if (it == listeners_.end()) return false;
  listeners_.erase(it);
  return true;
}

void Notifier::notify(const TaskPtr& task) const {
  std::vector<ListenerPtr> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners = listeners_;
  }
  for (const auto& listener : listeners) {
    try {
      listener->update(task);
    } catch (const std::exception& e) {
      LOG(logger_, ERROR) << "[Notifier] ObserverError on task "
                          << (task ? task->id() : std::string("<null>"))
                          << ": " << e.what();
    } catch (...) {
      LOG(logger_, ERROR) << "[Notifier] ObserverError on task "
                          << (task ? task->id() : std::string("<null>"))
                          << ": unknown exception";
    }
  }
}

size_t Notifier::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

CompletionObserver::CompletionObserver(TaskCallback callback)
    : callback_(std::move(callback)) {}

void CompletionObserver::update(const TaskPtr& task) {
  if (fired_.load()) return;
  TaskSnapshot snap = task->snapshot();
  if (snap.state != TaskState::Completed || !snap.size ||
      snap.bytesTransferred != *snap.size) {
    return;
  }
  if (fired_.exchange(true)) return;
  if (callback_) callback_(task);
}

FailureObserver::FailureObserver(TaskCallback callback)
    : callback_(std::move(callback)) {}

void FailureObserver::update(const TaskPtr& task) {
  if (fired_.load() || task->state() != TaskState::Failed) return;
  if (fired_.exchange(true)) return;
  if (callback_) callback_(task);
}

ProgressObserver::ProgressObserver(std::shared_ptr<ProgressMap> progress,
                                   TaskCallback callback)
    : progress_(std::move(progress)), callback_(std::move(callback)) {}

void ProgressObserver::update(const TaskPtr& task) {
  TaskSnapshot snap = task->snapshot();
  if (progress_) {
    progress_->set(snap.id,
                   formatStatus(snap, std::chrono::steady_clock::now()));
  }
  if (callback_) callback_(task);
}

std::string ProgressObserver::formatStatus(
    const TaskSnapshot& snapshot, std::chrono::steady_clock::time_point now) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << "transferred ";
  if (snapshot.size && *snapshot.size > 0) {
    oss << static_cast<double>(snapshot.bytesTransferred) * 100.0 /
               static_cast<double>(*snapshot.size)
        << "%";
  } else {
    oss << snapshot.bytesTransferred << " bytes";
  }

  double rate = 0.0;
  if (snapshot.startTime) {
    double seconds =
        std::chrono::duration<double>(now - *snapshot.startTime).count();
    if (seconds > 0.0) {
      rate = static_cast<double>(snapshot.bytesTransferred) / seconds /
             1000000.0;
    }
  }
  oss << "  " << rate << "MB/s";
  return oss.str();
}

}  // namespace bucketdl
