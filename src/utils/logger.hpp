#pragma once

#include <cstddef>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace utils {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

const char* logLevelName(LogLevel level);

struct LogConfig {
  std::string logFilePath;  // log directory, e.g. "logs"
  std::string fileName;     // file inside logFilePath
  size_t maxFileSize;       // rotate once the file reaches this many bytes
  size_t maxBackupFiles;    // keep name.1 .. name.N
  LogLevel minLevel;
  bool toFile;
  bool toConsole;
  LogConfig()
      : logFilePath("logs"),
        fileName("bucketdl.log"),
        maxFileSize(10 * 1024 * 1024),  // 10 MB
        maxBackupFiles(3),
        minLevel(LogLevel::INFO),
        toFile(true),
        toConsole(true) {}
};

/**
 * @brief Logger handle owned by the caller and shared with every component.
 *
 * Each instance keeps its own sinks; nothing is process-global.
 */
class Logger {
 public:
  explicit Logger(const LogConfig& config = LogConfig());
  ~Logger();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Console output goes to std::clog unless replaced; nullptr disables it.
  void setConsoleStream(std::ostream* stream);
  void setMinLevel(LogLevel level);

  bool enabled(LogLevel level) const;
  void write(LogLevel level, const std::string& line);

  class LogStream {
   public:
    LogStream(Logger* logger, LogLevel level, const char* file,
              const char* function, int line);
    ~LogStream();

    template <typename T>
    LogStream& operator<<(const T& msg) {
      if (active_) oss_ << msg;
      return *this;
    }

   private:
    Logger* logger_;
    LogLevel level_;
    bool active_;
    std::ostringstream oss_;
  };

 private:
  void openLogFile();
  void rotateLogsIfNeeded();

  LogConfig config_;
  std::string logFilePath_;
  std::ofstream logFile_;
  std::ostream* console_;
  mutable std::mutex mutex_;
};

using LoggerPtr = std::shared_ptr<Logger>;

// Logger that writes nowhere; handy default for components built in tests.
LoggerPtr makeNullLogger();

}  // namespace utils

// Usage: LOG(logger_, INFO) << "message";
#define LOG(logger, level)                                          \
  utils::Logger::LogStream((logger).get(), utils::LogLevel::level, \
                           __FILE__, __FUNCTION__, __LINE__)
