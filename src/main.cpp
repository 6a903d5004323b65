#include <gflags/gflags.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "Config/SpacesConfig.hpp"
#include "Contract/Contract.hpp"
#include "Downloader/DownloadManager.hpp"
#include "Storage/CurlStorageClient.hpp"
#include "utils/logger.hpp"

DEFINE_string(config, "boto3.conf",
              "KEY=VALUE file with SPACES_NAME, ACCESS_KEY, SECRET_KEY, "
              "REGION_NAME and ENDPOINT");
DEFINE_string(bucket, "", "Bucket to read from (overrides SPACES_NAME)");
DEFINE_int32(workers, 1, "Number of concurrent connections");
DEFINE_string(dest_dir, ".", "Directory downloads are written into");
DEFINE_int32(progress_interval_ms, 2000, "Progress redraw interval");
DEFINE_int32(join_timeout_ms, 30000,
             "How long shutdown waits for in-flight transfers");
DEFINE_int32(max_attempts, 1,
             "Attempts per object; only failures before the first byte are "
             "retried");
DEFINE_string(log_dir, "logs", "Directory for bucketdl.log");
DEFINE_bool(clear_screen, true, "Clear the terminal before each redraw");

namespace {

volatile std::sig_atomic_t g_signal = 0;

void onSignal(int sig) { g_signal = sig; }

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(
      "bucketdl [flags] <key>[=<destination>] [<key>[=<destination>] ...]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (argc < 2) {
    std::cerr << "Usage: " << argv[0]
              << " [--workers=N] [--config=boto3.conf] <key>[=<destination>]"
                 " ..."
              << std::endl;
    return 2;
  }

  utils::LogConfig logCfg;
  logCfg.logFilePath = FLAGS_log_dir;
  logCfg.maxFileSize = 10 * 1024 * 1024;
  logCfg.maxBackupFiles = 3;
  auto logger = std::make_shared<utils::Logger>(logCfg);

  bucketdl::SpacesConfig config =
      bucketdl::SpacesConfig::load(FLAGS_config, logger);
  std::string bucket =
      FLAGS_bucket.empty() ? config.bucketName() : FLAGS_bucket;
  if (bucket.empty()) {
    LOG(logger, FATAL) << "No bucket given: set SPACES_NAME in "
                       << FLAGS_config << " or pass --bucket";
    return 2;
  }

  bucketdl::ManagerOptions options;
  options.workers = FLAGS_workers > 0 ? FLAGS_workers : 1;
  options.retry.maxAttempts = FLAGS_max_attempts;
  options.pool.joinTimeout = std::chrono::milliseconds(FLAGS_join_timeout_ms);
  options.tracker.interval =
      std::chrono::milliseconds(FLAGS_progress_interval_ms);
  options.tracker.clearScreen = FLAGS_clear_screen;

  std::unique_ptr<bucketdl::DownloadManager> manager;
  try {
    manager = std::make_unique<bucketdl::DownloadManager>(
        options,
        [config, logger]() {
          return std::make_unique<bucketdl::CurlStorageClient>(config, logger);
        },
        logger);
  } catch (const std::exception& e) {
    LOG(logger, FATAL) << "Cannot create storage clients: " << e.what();
    return 2;
  }

  bucketdl::ContractFactory factory(bucket);
  const std::filesystem::path destDir(FLAGS_dest_dir);
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string key = arg;
    std::string destination;
    auto pos = arg.find('=');
    if (pos != std::string::npos) {
      key = arg.substr(0, pos);
      destination = arg.substr(pos + 1);
    }
    if (key.empty()) {
      LOG(logger, WARN) << "Skipping argument without a key: " << arg;
      continue;
    }
    if (destination.empty()) {
      destination = std::filesystem::path(key).filename().string();
    }
    manager->submit(
        factory.newContract(key, (destDir / destination).string()));
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  manager->start();
  while (g_signal == 0 &&
         !manager->waitUntilSettled(std::chrono::milliseconds(250))) {
  }
  manager->stop(static_cast<int>(g_signal));

  bool allDone = manager->completedCount() == manager->submittedCount();
  return allDone ? 0 : 1;
}
