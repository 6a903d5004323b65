#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace utils {

namespace {

std::string getCurrentTime() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm;
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

const char* baseName(const char* path) {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

}  // namespace

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
    default:
      return "UNKNOWN";
  }
}

Logger::Logger(const LogConfig& config)
    : config_(config), console_(config.toConsole ? &std::clog : nullptr) {
  if (config_.logFilePath.empty()) config_.logFilePath = "logs";
  if (config_.fileName.empty()) config_.fileName = "bucketdl.log";
  if (config_.maxFileSize == 0) config_.maxFileSize = 10 * 1024 * 1024;
  if (config_.toFile) {
    std::lock_guard<std::mutex> lock(mutex_);
    openLogFile();
  }
}

Logger::~Logger() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (logFile_.is_open()) logFile_.close();
}

void Logger::setConsoleStream(std::ostream* stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  console_ = stream;
}

void Logger::setMinLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_.minLevel = level;
}

bool Logger::enabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level >= config_.minLevel;
}

void Logger::write(LogLevel level, const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < config_.minLevel) return;
  if (console_) {
    *console_ << line;
    console_->flush();
  }
  if (!config_.toFile) return;
  if (!logFile_.is_open()) openLogFile();
  rotateLogsIfNeeded();
  if (logFile_.is_open()) logFile_ << line, logFile_.flush();
}

void Logger::openLogFile() {
  std::error_code ec;
  std::filesystem::create_directories(config_.logFilePath, ec);
  logFilePath_ = config_.logFilePath + "/" + config_.fileName;
  logFile_.open(logFilePath_, std::ios::app);
  if (!logFile_.is_open()) {
    std::cerr << "Failed to open log file: " << logFilePath_ << std::endl;
  }
}

void Logger::rotateLogsIfNeeded() {
  std::error_code ec;
  if (logFilePath_.empty() || !std::filesystem::exists(logFilePath_, ec) ||
      std::filesystem::file_size(logFilePath_, ec) < config_.maxFileSize) {
    return;
  }
  logFile_.close();
  for (int i = static_cast<int>(config_.maxBackupFiles) - 1; i >= 0; --i) {
    std::string old_name =
        logFilePath_ + (i == 0 ? "" : ("." + std::to_string(i)));
    std::string new_name = logFilePath_ + "." + std::to_string(i + 1);
    if (std::filesystem::exists(old_name, ec)) {
      std::filesystem::rename(old_name, new_name, ec);
    }
  }
  logFile_.open(logFilePath_, std::ios::trunc);
}

LoggerPtr makeNullLogger() {
  LogConfig config;
  config.toFile = false;
  config.toConsole = false;
  return std::make_shared<Logger>(config);
}

Logger::LogStream::LogStream(Logger* logger, LogLevel level, const char* file,
                             const char* func, int line)
    : logger_(logger),
      level_(level),
      active_(logger != nullptr && logger->enabled(level)),
      oss_() {
  if (!active_) return;
  oss_ << "[" << logLevelName(level) << "] " << getCurrentTime() << " "
       << baseName(file) << ":" << line << " " << func << ": ";
}

Logger::LogStream::~LogStream() {
  if (!active_) return;
  oss_ << "\n";
  logger_->write(level_, oss_.str());
}

}  // namespace utils
