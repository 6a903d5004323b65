#include "ProgressTracker.hpp"

#include <sstream>

namespace bucketdl {

namespace {
constexpr const char kClearScreen[] = "\033[2J\033[H";
}  // namespace

ProgressTracker::ProgressTracker(std::shared_ptr<ProgressMap> progress,
                                 TrackerOptions options,
                                 utils::LoggerPtr logger)
    : progress_(std::move(progress)),
      options_(options),
      logger_(std::move(logger)),
      timer_(logger_),
      renders_(0),
      started_(false) {
  if (!progress_) progress_ = std::make_shared<ProgressMap>();
  if (options_.interval <= std::chrono::milliseconds::zero()) {
    options_.interval = std::chrono::milliseconds(2000);
  }
}

ProgressTracker::~ProgressTracker() { timer_.stop(); }

void ProgressTracker::start() {
  {
    std::lock_guard<std::mutex> lock(renderMutex_);
    if (started_) return;
    started_ = true;
  }
  timer_.addPeriodicTask("progress", std::chrono::milliseconds(0),
                         options_.interval, [this]() { renderOnce(); });
  timer_.start();
  LOG(logger_, DEBUG) << "[ProgressTracker] rendering every "
                      << options_.interval.count() << " ms";
}

void ProgressTracker::stop() {
  timer_.stop();
  LOG(logger_, DEBUG) << "[ProgressTracker] stopped after " << renderCount()
                      << " renders";
}

bool ProgressTracker::isRunning() const { return timer_.isRunning(); }

void ProgressTracker::renderOnce() {
  auto entries = progress_->snapshot();
  std::ostringstream frame;
  if (options_.clearScreen) frame << kClearScreen;
  frame << "Progress:\n";
  for (const auto& entry : entries) {
    frame << entry.first << ": " << entry.second << "\n";
  }

  std::lock_guard<std::mutex> lock(renderMutex_);
  if (options_.sink) {
    *options_.sink << frame.str();
    options_.sink->flush();
  }
  ++renders_;
}

size_t ProgressTracker::renderCount() const {
  std::lock_guard<std::mutex> lock(renderMutex_);
  return renders_;
}

}  // namespace bucketdl
