#include "timer.hpp"

#include <exception>

namespace utils {

Timer::Timer(LoggerPtr logger)
    : nextId_(1), running_(false), logger_(std::move(logger)) {}

Timer::~Timer() { stop(); }

Timer::TaskId Timer::addOnceTask(const std::string& name,
                                 std::chrono::milliseconds delay,
                                 std::function<void()> callback) {
  auto execution_time = std::chrono::steady_clock::now() + delay;
  std::lock_guard<std::mutex> lock(tasksMutex_);
  TaskId id = nextId_++;
  taskQueue_.push(TimerTask(id, name, execution_time, std::move(callback)));
  queued_.insert(id);
  tasksCv_.notify_one();
  return id;
}

Timer::TaskId Timer::addPeriodicTask(const std::string& name,
                                     std::chrono::milliseconds delay,
                                     std::chrono::milliseconds period,
                                     std::function<void()> callback) {
  if (period <= std::chrono::milliseconds::zero()) {
    period = std::chrono::milliseconds(1);
  }
  auto execution_time = std::chrono::steady_clock::now() + delay;
  std::lock_guard<std::mutex> lock(tasksMutex_);
  TaskId id = nextId_++;
  taskQueue_.push(
      TimerTask(id, name, execution_time, std::move(callback), true, period));
  queued_.insert(id);
  tasksCv_.notify_one();
  return id;
}

bool Timer::cancel(TaskId id) {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  if (queued_.count(id) == 0) return false;
  cancelled_.insert(id);
  tasksCv_.notify_one();
  return true;
}

void Timer::start() {
  // reap a thread that exited after a stop() issued from its own callback
  if (timerThread_.joinable() &&
      timerThread_.get_id() != std::this_thread::get_id()) {
    bool idle = false;
    {
      std::lock_guard<std::mutex> lock(tasksMutex_);
      idle = !running_;
    }
    if (idle) timerThread_.join();
  }

  std::lock_guard<std::mutex> lock(tasksMutex_);
  if (running_ || timerThread_.joinable()) return;
  running_ = true;
  timerThread_ = std::thread([this]() { run(); });
}

void Timer::stop() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    running_ = false;
    tasksCv_.notify_all();
  }

  // from one of our own callbacks: the loop exits once it returns, and the
  // next stop() or the destructor joins it
  if (!timerThread_.joinable() ||
      timerThread_.get_id() == std::this_thread::get_id()) {
    return;
  }
  timerThread_.join();
}

bool Timer::isRunning() const {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  return running_;
}

void Timer::run() {
  std::unique_lock<std::mutex> lock(tasksMutex_);
  while (running_) {
    if (taskQueue_.empty()) {
      tasksCv_.wait(lock,
                    [this]() { return !taskQueue_.empty() || !running_; });
      continue;
    }

    auto nextTask = taskQueue_.top();
    if (cancelled_.count(nextTask.id) != 0) {
      taskQueue_.pop();
      cancelled_.erase(nextTask.id);
      queued_.erase(nextTask.id);
      continue;
    }

    auto now = std::chrono::steady_clock::now();
    if (nextTask.execTimestamp > now) {
      tasksCv_.wait_until(lock, nextTask.execTimestamp, [this, &nextTask]() {
        return !running_ || cancelled_.count(nextTask.id) != 0 ||
               (!taskQueue_.empty() &&
                taskQueue_.top().execTimestamp < nextTask.execTimestamp);
      });
      continue;
    }

    taskQueue_.pop();
    if (nextTask.isPeriodic) {
      TimerTask again = nextTask;
      again.execTimestamp += again.period;
      if (again.execTimestamp < now) again.execTimestamp = now + again.period;
      taskQueue_.push(std::move(again));
    } else {
      queued_.erase(nextTask.id);
    }

    lock.unlock();  // callbacks run without the queue lock
    execute(nextTask);
    lock.lock();
  }
}

void Timer::execute(TimerTask& task) {
  try {
    task.callback();
  } catch (const std::exception& e) {
    LOG(logger_, ERROR) << "[Timer] Task '" << task.name
                        << "' threw: " << e.what();
  } catch (...) {
    LOG(logger_, ERROR) << "[Timer] Task '" << task.name
                        << "' threw an unknown exception";
  }
}

}  // namespace utils
