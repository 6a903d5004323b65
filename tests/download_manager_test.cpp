#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "Downloader/DownloadManager.hpp"
#include "fake_storage_client.hpp"

using namespace bucketdl;
using namespace std::chrono_literals;
using bucketdl::fakes::FakeObject;
using bucketdl::fakes::FakeStore;
using bucketdl::fakes::makeFakeFactory;

namespace {

class DownloadManagerTest : public ::testing::Test {
 protected:
  std::unique_ptr<DownloadManager> makeManager(size_t workers,
                                               int maxAttempts = 1) {
    return makeManager(workers, maxAttempts, makeFakeFactory(store_));
  }

  std::unique_ptr<DownloadManager> makeManager(size_t workers, int maxAttempts,
                                               const ClientFactory& factory) {
    ManagerOptions options;
    options.workers = workers;
    options.retry.maxAttempts = maxAttempts;
    options.pool.pollInterval = 10ms;
    options.pool.joinTimeout = 5000ms;
    options.tracker.interval = 20ms;
    options.tracker.clearScreen = false;
    options.tracker.sink = &screen_;
    return std::make_unique<DownloadManager>(options, factory,
                                             utils::makeNullLogger());
  }

  static std::vector<TaskPtr> drain(TaskQueue& queue) { return queue.drain(); }

  std::shared_ptr<FakeStore> store_ = std::make_shared<FakeStore>();
  ContractFactory contracts_{"karim-storage"};
  std::ostringstream screen_;
};

}  // namespace

TEST_F(DownloadManagerTest, SubmitBeforeStartStaysPending) {
  auto manager = makeManager(1);
  store_->put("a", FakeObject{10});
  auto task = manager->submit(contracts_.newContract("a"));

  EXPECT_EQ(manager->submittedCount(), 1u);
  EXPECT_EQ(manager->pendingQueue().size(), 1u);
  EXPECT_TRUE(manager->readyQueue().empty());
  EXPECT_EQ(task->state(), TaskState::Pending);
  EXPECT_EQ(task->listenerCount(), 0u);
  EXPECT_FALSE(manager->isStarted());
}

TEST_F(DownloadManagerTest, SingleWorkerRunsDownloadsOneAtATime) {
  store_->put("first.bin", FakeObject{100});
  store_->put("second.bin", FakeObject{200});
  store_->put("third.bin", FakeObject{50});

  auto manager = makeManager(1);
  std::vector<TaskPtr> tasks = {
      manager->submit(contracts_.newContract("first.bin")),
      manager->submit(contracts_.newContract("second.bin")),
      manager->submit(contracts_.newContract("third.bin"))};

  manager->start();
  EXPECT_TRUE(manager->pendingQueue().empty());
  ASSERT_TRUE(manager->waitUntilSettled(10000ms));
  manager->stop();

  EXPECT_EQ(store_->maxActive(), 1);
  EXPECT_EQ(manager->completedCount(), 3u);
  EXPECT_EQ(manager->failedCount(), 0u);
  EXPECT_EQ(manager->settledCount(), manager->submittedCount());
  EXPECT_EQ(manager->completeQueue().size(), 3u);
  EXPECT_TRUE(manager->failedQueue().empty());

  for (const auto& task : tasks) {
    EXPECT_EQ(task->state(), TaskState::Completed);
    EXPECT_EQ(task->bytesTransferred(), *task->size());
    auto status = manager->progressMap()->get(task->id());
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->rfind("transferred 100.00%", 0), 0u) << *status;
  }
  EXPECT_NE(screen_.str().find("Progress:"), std::string::npos);
}

TEST_F(DownloadManagerTest, EachTaskIsDownloadedExactlyOnce) {
  auto manager = makeManager(4);
  std::vector<TaskPtr> tasks;
  for (int i = 0; i < 20; ++i) {
    std::string key = "parts/" + std::to_string(i);
    store_->put(key, FakeObject{static_cast<uint64_t>(10 * (i + 1))});
    tasks.push_back(manager->submit(contracts_.newContract(key)));
  }
  manager->start();
  ASSERT_TRUE(manager->waitUntilSettled(10000ms));
  manager->stop();

  EXPECT_LE(store_->maxActive(), 4);
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(store_->downloadCalls("parts/" + std::to_string(i)), 1);
  }
  auto done = drain(manager->completeQueue());
  EXPECT_EQ(done.size(), 20u);
}

TEST_F(DownloadManagerTest, SettledTasksAreCompletedWithoutStopping) {
  // delivers every byte, then keeps the transfer open a while longer
  class SlowCloseClient : public StorageClient {
   public:
    uint64_t headObject(const std::string&, const std::string&) override {
      return 100;
    }
    void downloadFile(const std::string&, const std::string&,
                      const std::string&, const TransferOptions&,
                      const ProgressCallback& progress) override {
      progress(100);
      std::this_thread::sleep_for(300ms);
    }
  };

  auto manager = makeManager(1, 1, []() -> std::unique_ptr<StorageClient> {
    return std::make_unique<SlowCloseClient>();
  });
  auto task = manager->submit(contracts_.newContract("video.mkv"));
  manager->start();
  ASSERT_TRUE(manager->waitUntilSettled(5000ms));

  EXPECT_EQ(task->state(), TaskState::Completed);
  EXPECT_EQ(manager->completeQueue().size(), 1u);
  auto status = manager->progressMap()->get(task->id());
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->rfind("transferred 100.00%", 0), 0u) << *status;
  manager->stop();
}

TEST_F(DownloadManagerTest, ListenerThrowingNonStandardValueIsContained) {
  class IntListener : public Listener {
   public:
    void update(const TaskPtr&) override { throw 42; }
  };
  store_->put("a", FakeObject{50});
  store_->put("b", FakeObject{50});

  auto manager = makeManager(1);
  auto a = manager->submit(contracts_.newContract("a"));
  a->attach(std::make_shared<IntListener>());
  auto b = manager->submit(contracts_.newContract("b"));
  manager->start();
  ASSERT_TRUE(manager->waitUntilSettled(10000ms));
  manager->stop();

  EXPECT_EQ(a->state(), TaskState::Completed);
  EXPECT_EQ(b->state(), TaskState::Completed);
  EXPECT_EQ(manager->completedCount(), 2u);
}

TEST_F(DownloadManagerTest, SizeProbeFailureDoesNotBlockOthers) {
  FakeObject unsized{80};
  unsized.probeFails = true;
  store_->put("unsized", unsized);
  store_->put("sized", FakeObject{40});

  auto manager = makeManager(1);
  auto a = manager->submit(contracts_.newContract("unsized"));
  auto b = manager->submit(contracts_.newContract("sized"));
  manager->start();
  ASSERT_TRUE(manager->waitUntilSettled(10000ms));
  manager->stop();

  EXPECT_EQ(a->state(), TaskState::Completed);
  EXPECT_EQ(*a->size(), 80u);
  EXPECT_EQ(b->state(), TaskState::Completed);
  EXPECT_EQ(manager->completedCount(), 2u);
}

TEST_F(DownloadManagerTest, FailedTransfersLandInFailedQueue) {
  FakeObject flaky{100};
  flaky.failAfter = 20;
  store_->put("flaky", flaky);
  store_->put("ok", FakeObject{30});

  auto manager = makeManager(2);
  auto bad = manager->submit(contracts_.newContract("flaky"));
  auto good = manager->submit(contracts_.newContract("ok"));
  manager->start();
  ASSERT_TRUE(manager->waitUntilSettled(10000ms));
  manager->stop();

  EXPECT_EQ(manager->failedCount(), 1u);
  EXPECT_EQ(manager->completedCount(), 1u);
  auto failed = drain(manager->failedQueue());
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0], bad);
  EXPECT_EQ(good->state(), TaskState::Completed);

  auto status = manager->progressMap()->get(bad->id());
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->rfind("failed: ", 0), 0u) << *status;
}

TEST_F(DownloadManagerTest, ZeroByteFailuresAreRetriedWhenAllowed) {
  FakeObject refused{25};
  refused.failFirstAttempts = 1;
  store_->put("refused", refused);

  auto manager = makeManager(1, 2);
  auto task = manager->submit(contracts_.newContract("refused"));
  manager->start();
  ASSERT_TRUE(manager->waitUntilSettled(10000ms));
  manager->stop();

  EXPECT_EQ(task->state(), TaskState::Completed);
  EXPECT_EQ(task->attempts(), 2);
  EXPECT_EQ(manager->failedCount(), 0u);
}

TEST_F(DownloadManagerTest, LateSubmissionsAreDrained) {
  auto manager = makeManager(2);
  manager->start();
  EXPECT_TRUE(manager->waitUntilSettled(10ms));

  store_->put("late", FakeObject{30});
  auto task = manager->submit(contracts_.newContract("late"));
  EXPECT_TRUE(manager->pendingQueue().empty());
  ASSERT_TRUE(manager->waitUntilSettled(10000ms));
  manager->stop();
  EXPECT_EQ(task->state(), TaskState::Completed);
}

TEST_F(DownloadManagerTest, StopWaitsForInFlightAndLeavesRestReady) {
  store_->put("one", FakeObject{100});
  store_->put("two", FakeObject{100});
  store_->put("three", FakeObject{100});
  store_->holdTransfers();

  auto manager = makeManager(2);
  manager->submit(contracts_.newContract("one"));
  manager->submit(contracts_.newContract("two"));
  manager->submit(contracts_.newContract("three"));
  manager->start();
  ASSERT_TRUE(store_->waitForActive(2, 5000ms));

  std::thread releaser([this]() {
    std::this_thread::sleep_for(100ms);
    store_->releaseTransfers();
  });
  auto begin = std::chrono::steady_clock::now();
  manager->stop(2);
  auto waited = std::chrono::steady_clock::now() - begin;
  releaser.join();

  EXPECT_GE(waited, 90ms);
  EXPECT_EQ(manager->completeQueue().size(), 2u);
  EXPECT_EQ(manager->completedCount(), 2u);
  auto leftover = drain(manager->readyQueue());
  ASSERT_EQ(leftover.size(), 1u);
  EXPECT_EQ(leftover[0]->state(), TaskState::Ready);
  EXPECT_EQ(store_->downloadCalls(leftover[0]->key()), 0);
  EXPECT_FALSE(manager->waitUntilSettled(10ms));
}

TEST_F(DownloadManagerTest, StopIsIdempotent) {
  auto manager = makeManager(1);
  manager->start();
  manager->start();
  manager->stop();
  manager->stop();
  EXPECT_FALSE(manager->connectionPool().isRunning());
}

TEST_F(DownloadManagerTest, StopWithoutStartIsHarmless) {
  auto manager = makeManager(3);
  store_->put("x", FakeObject{5});
  manager->submit(contracts_.newContract("x"));
  manager->stop();
  EXPECT_EQ(manager->pendingQueue().size(), 1u);
  EXPECT_EQ(manager->completedCount(), 0u);
  EXPECT_TRUE(screen_.str().empty());
}

TEST_F(DownloadManagerTest, FactoryErrorsSurfaceFromConstructor) {
  ManagerOptions options;
  options.workers = 2;
  ClientFactory broken = []() -> std::unique_ptr<StorageClient> {
    throw StorageError(StorageError::Kind::Config, "missing endpoint");
  };
  EXPECT_THROW(DownloadManager(options, broken, utils::makeNullLogger()),
               StorageError);
}
