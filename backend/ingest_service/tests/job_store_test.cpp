#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <latch>
#include <stdexcept>
#include <thread>
#include <vector>

#include "application/job_store.hpp"

namespace ingest_service {
namespace {

Job makeJob(const std::string& id) {
  Job job;
  job.id = id;
  job.display_name = id + ".mp4";
  return job;
}

TEST(JobStoreTest, ZeroCapacityIsRejected) {
  EXPECT_THROW(JobStore(0), std::invalid_argument);
}

TEST(JobStoreTest, AdmissionStopsAtCapacity) {
  JobStore store(2);
  EXPECT_TRUE(store.tryAdmit());
  EXPECT_TRUE(store.tryAdmit());
  EXPECT_FALSE(store.tryAdmit());
  EXPECT_EQ(store.occupancy(), 2u);

  store.release();
  EXPECT_EQ(store.occupancy(), 1u);
  EXPECT_TRUE(store.tryAdmit());
  EXPECT_FALSE(store.tryAdmit());
}

TEST(JobStoreTest, ReleaseWithoutAdmissionThrows) {
  JobStore store(1);
  EXPECT_THROW(store.release(), std::logic_error);
  EXPECT_EQ(store.occupancy(), 0u);
}

TEST(JobStoreTest, ConcurrentAdmissionNeverExceedsCapacity) {
  for (int round = 0; round < 200; ++round) {
    JobStore store(2);
    std::atomic<int> admitted{0};
    std::latch start(3);
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
      threads.emplace_back([&]() {
        start.arrive_and_wait();
        if (store.tryAdmit()) {
          admitted++;
        }
      });
    }
    for (auto& t : threads) {
      t.join();
    }
    ASSERT_EQ(admitted.load(), 2) << "round " << round;
    ASSERT_EQ(store.occupancy(), 2u);
  }
}

TEST(JobStoreTest, DequeuesInFifoOrder) {
  JobStore store(3);
  for (const char* id : {"a", "b", "c"}) {
    ASSERT_TRUE(store.tryAdmit());
    ASSERT_TRUE(store.enqueue(makeJob(id)).has_value());
  }
  EXPECT_EQ(store.queued(), 3u);
  EXPECT_EQ(store.dequeue()->id, "a");
  EXPECT_EQ(store.dequeue()->id, "b");
  EXPECT_EQ(store.tryDequeue()->id, "c");
  EXPECT_FALSE(store.tryDequeue().has_value());
  // Dequeue does not free capacity; release does.
  EXPECT_EQ(store.occupancy(), 3u);
}

TEST(JobStoreTest, DequeueBlocksUntilJobArrives) {
  JobStore store(1);
  std::atomic<bool> got{false};
  std::thread consumer([&]() {
    auto job = store.dequeue();
    got = job.has_value() && job->id == "late";
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(got.load());
  ASSERT_TRUE(store.tryAdmit());
  ASSERT_TRUE(store.enqueue(makeJob("late")).has_value());
  consumer.join();
  EXPECT_TRUE(got.load());
}

TEST(JobStoreTest, ShutdownDrainsThenWakesConsumers) {
  JobStore store(2);
  ASSERT_TRUE(store.tryAdmit());
  ASSERT_TRUE(store.enqueue(makeJob("pending")).has_value());
  store.shutdown();

  auto job = store.dequeue();
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->id, "pending");
  EXPECT_FALSE(store.dequeue().has_value());
}

TEST(JobStoreTest, ShutdownThenWaitUntilIdleCoversAdmittedJobs) {
  JobStore store(2);
  for (const auto* id : {"a", "b"}) {
    ASSERT_TRUE(store.tryAdmit());
    ASSERT_TRUE(store.enqueue(makeJob(id)).has_value());
  }
  store.shutdown();
  EXPECT_FALSE(store.waitUntilIdle(std::chrono::milliseconds(20)));

  std::thread worker([&store]() {
    while (auto job = store.dequeue()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      store.release();
    }
  });
  EXPECT_TRUE(store.waitUntilIdle(std::chrono::seconds(5)));
  EXPECT_EQ(store.occupancy(), 0u);
  EXPECT_EQ(store.queued(), 0u);
  worker.join();
}

TEST(JobStoreTest, EnqueueAfterShutdownHandsJobBack) {
  JobStore store(1);
  store.shutdown();
  ASSERT_TRUE(store.tryAdmit());
  auto result = store.enqueue(makeJob("refused"));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().id, "refused");
  EXPECT_EQ(store.queued(), 0u);
}

TEST(JobStoreTest, WaitUntilIdle) {
  JobStore store(1);
  EXPECT_TRUE(store.waitUntilIdle(std::chrono::milliseconds(0)));
  ASSERT_TRUE(store.tryAdmit());
  EXPECT_FALSE(store.waitUntilIdle(std::chrono::milliseconds(20)));

  std::thread releaser([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    store.release();
  });
  EXPECT_TRUE(store.waitUntilIdle(std::chrono::seconds(5)));
  releaser.join();
}

} // namespace
} // namespace ingest_service
