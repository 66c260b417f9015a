#include <gtest/gtest.h>
#include <chrono>
#include <memory>

#include "application/worker_pool.hpp"
#include "fake_transcoder.hpp"
#include "test_support.hpp"

namespace ingest_service {
namespace {

using test_support::FakeTranscoder;
using test_support::TempDir;
using test_support::countEntries;

class WorkerPoolTest : public ::testing::Test {
protected:
  TempDir root_{"workers"};
  std::shared_ptr<FileStore> files_ =
    std::make_shared<FileStore>(root_ / "tmp", root_ / "final", ".mp4");
  std::shared_ptr<FakeTranscoder> transcoder_ = std::make_shared<FakeTranscoder>();
  VideoProcessor processor_{transcoder_, files_};

  void SetUp() override {
    ASSERT_TRUE(files_->bootstrap().has_value());
  }

  void admit(JobStore& store, const std::string& name) {
    ASSERT_TRUE(store.tryAdmit());
    auto staged = files_->stage(name, "content of " + name);
    ASSERT_TRUE(staged.has_value());
    Job job;
    job.id = "id-" + name;
    job.staged_path = *staged;
    job.display_name = name;
    ASSERT_TRUE(store.enqueue(std::move(job)).has_value());
  }
};

TEST_F(WorkerPoolTest, ZeroWorkersIsRejected) {
  JobStore store(1);
  EXPECT_THROW(WorkerPool(store, processor_, 0), std::invalid_argument);
}

TEST_F(WorkerPoolTest, ProcessesEveryJobAndReleasesCapacity) {
  JobStore store(8);
  WorkerPool pool(store, processor_, 3);
  pool.start();

  for (int i = 0; i < 8; ++i) {
    admit(store, "clip" + std::to_string(i) + ".mp4");
  }
  ASSERT_TRUE(store.waitUntilIdle(std::chrono::seconds(10)));
  EXPECT_EQ(store.occupancy(), 0u);
  EXPECT_EQ(transcoder_->calls(), 8);
  EXPECT_EQ(files_->listPublished().size(), 8u);

  pool.stop();
  EXPECT_EQ(pool.processed(), 8u);
  EXPECT_EQ(countEntries(files_->tempDir()), 0u);
}

TEST_F(WorkerPoolTest, StopDrainsQueuedJobs) {
  JobStore store(4);
  for (int i = 0; i < 4; ++i) {
    admit(store, "queued" + std::to_string(i) + ".mp4");
  }
  WorkerPool pool(store, processor_, 2);
  pool.start();
  pool.stop();

  EXPECT_EQ(pool.processed(), 4u);
  EXPECT_EQ(store.occupancy(), 0u);
  EXPECT_EQ(files_->listPublished().size(), 4u);
}

TEST_F(WorkerPoolTest, FailedJobsStillReleaseTheirSlot) {
  auto failing = std::make_shared<FakeTranscoder>(FakeTranscoder::Mode::LaunchFailure);
  VideoProcessor processor(failing, files_);
  JobStore store(2);
  WorkerPool pool(store, processor, 1);
  pool.start();

  admit(store, "a.mp4");
  admit(store, "b.mp4");
  ASSERT_TRUE(store.waitUntilIdle(std::chrono::seconds(10)));
  EXPECT_TRUE(store.tryAdmit());
  EXPECT_TRUE(store.tryAdmit());
  EXPECT_FALSE(store.tryAdmit());
  store.release();
  store.release();
  pool.stop();
}

} // namespace
} // namespace ingest_service
