#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "application/video_processor.hpp"
#include "infrastructure/duplicate_detectors.hpp"
#include "fake_transcoder.hpp"
#include "test_support.hpp"

namespace ingest_service {
namespace {

using test_support::FakeTranscoder;
using test_support::TempDir;
using test_support::countEntries;
using test_support::readFile;
using test_support::writeFile;

class VideoProcessorTest : public ::testing::Test {
protected:
  TempDir root_{"processor"};
  std::shared_ptr<FileStore> store_ =
    std::make_shared<FileStore>(root_ / "tmp", root_ / "final", ".mp4");
  NameRegistry registry_;

  void SetUp() override {
    ASSERT_TRUE(store_->bootstrap().has_value());
  }

  Job stagedJob(const std::string& staged_name, const std::string& content) {
    auto staged = store_->stage(staged_name, content);
    EXPECT_TRUE(staged.has_value());
    Job job;
    job.id = "job-" + std::to_string(next_id_++);
    job.staged_path = *staged;
    job.display_name = FileStore::sanitize(staged_name);
    if (auto reservation = registry_.reserve(job.display_name)) {
      job.reservation = std::move(*reservation);
    }
    return job;
  }

  ProcessReport run(FakeTranscoder::Mode mode, Job job) {
    VideoProcessor processor(std::make_shared<FakeTranscoder>(mode), store_);
    return processor.process(std::move(job));
  }

private:
  int next_id_{0};
};

TEST_F(VideoProcessorTest, TranscodedOutputTakesMp4Extension) {
  auto report = run(FakeTranscoder::Mode::Succeed, stagedJob("clip.avi", "raw"));
  ASSERT_EQ(report.outcome, ProcessOutcome::Transcoded) << report.message;
  EXPECT_EQ(report.published->filename(), "clip.mp4");
  EXPECT_EQ(store_->listPublished(), std::vector<std::string>{"clip.mp4"});
  EXPECT_EQ(VideoProcessor::transcodedName("noext"), "noext.mp4");
}

TEST_F(VideoProcessorTest, FallbackKeepsOriginalExtension) {
  auto report = run(FakeTranscoder::Mode::ExitNonZero, stagedJob("clip.avi", "raw"));
  ASSERT_EQ(report.outcome, ProcessOutcome::Fallback);
  EXPECT_EQ(report.published->filename(), "clip.avi");
}

TEST_F(VideoProcessorTest, RecordsUploadedSourceBesideTranscodedOutput) {
  auto job = stagedJob("clip.avi", "uploaded bytes");
  job.source_name = "clip.avi";
  auto report = run(FakeTranscoder::Mode::Succeed, std::move(job));
  ASSERT_EQ(report.outcome, ProcessOutcome::Transcoded);

  auto source = store_->sourceOf(*report.published);
  ASSERT_TRUE(source.has_value());
  EXPECT_EQ(source->name, "clip.avi");
  EXPECT_EQ(source->sha256, ContentDuplicateDetector::sha256Hex("uploaded bytes"));
}

TEST_F(VideoProcessorTest, PublishesTranscodedOutput) {
  auto report = run(FakeTranscoder::Mode::Succeed, stagedJob("clip.mp4", "raw"));
  ASSERT_EQ(report.outcome, ProcessOutcome::Transcoded) << report.message;
  ASSERT_TRUE(report.published.has_value());
  EXPECT_EQ(report.published->filename(), "clip.mp4");
  EXPECT_EQ(readFile(store_->finalDir() / "clip.mp4"), "transcoded");
  EXPECT_EQ(countEntries(store_->tempDir()), 0u);
}

TEST_F(VideoProcessorTest, FallsBackToOriginalOnNonZeroExit) {
  auto report = run(FakeTranscoder::Mode::ExitNonZero, stagedJob("clip.mp4", "raw bytes"));
  ASSERT_EQ(report.outcome, ProcessOutcome::Fallback);
  EXPECT_NE(report.message.find("code 1"), std::string::npos);
  EXPECT_EQ(readFile(store_->finalDir() / "clip.mp4"), "raw bytes");
  EXPECT_EQ(countEntries(store_->finalDir()), 1u);
  EXPECT_EQ(countEntries(store_->tempDir()), 0u);
}

TEST_F(VideoProcessorTest, FallsBackToOriginalWhenLaunchFails) {
  auto report = run(FakeTranscoder::Mode::LaunchFailure, stagedJob("clip.mp4", "raw"));
  ASSERT_EQ(report.outcome, ProcessOutcome::Fallback);
  EXPECT_NE(report.message.find("launch"), std::string::npos);
  EXPECT_EQ(readFile(store_->finalDir() / "clip.mp4"), "raw");
  EXPECT_EQ(countEntries(store_->tempDir()), 0u);
}

TEST_F(VideoProcessorTest, FallsBackToOriginalOnTimeout) {
  auto report = run(FakeTranscoder::Mode::TimeOut, stagedJob("clip.mp4", "raw"));
  ASSERT_EQ(report.outcome, ProcessOutcome::Fallback);
  EXPECT_NE(report.message.find("timed out"), std::string::npos);
  EXPECT_EQ(countEntries(store_->tempDir()), 0u);
}

TEST_F(VideoProcessorTest, FallsBackWhenNoOutputWasWritten) {
  auto report = run(FakeTranscoder::Mode::SucceedWithoutOutput, stagedJob("clip.mp4", "raw"));
  ASSERT_EQ(report.outcome, ProcessOutcome::Fallback);
  EXPECT_EQ(readFile(store_->finalDir() / "clip.mp4"), "raw");
}

TEST_F(VideoProcessorTest, SanitizesNameBeforeTranscoding) {
  auto transcoder = std::make_shared<FakeTranscoder>(FakeTranscoder::Mode::Succeed);
  VideoProcessor processor(transcoder, store_);
  auto report = processor.process(stagedJob("my holiday:1.mp4", "raw"));

  ASSERT_EQ(report.outcome, ProcessOutcome::Transcoded);
  EXPECT_EQ(report.published->filename(), "my_holiday_1.mp4");
  ASSERT_EQ(transcoder->inputs().size(), 1u);
  EXPECT_EQ(transcoder->inputs()[0].filename(), "my_holiday_1.mp4");
  EXPECT_EQ(countEntries(store_->tempDir()), 0u);
}

TEST_F(VideoProcessorTest, DoesNotOverwriteExistingArtifact) {
  writeFile(store_->finalDir() / "clip.mp4", "first");
  auto report = run(FakeTranscoder::Mode::Succeed, stagedJob("clip.mp4", "second"));
  ASSERT_EQ(report.outcome, ProcessOutcome::Transcoded);
  EXPECT_EQ(report.published->filename(), "clip_1.mp4");
  EXPECT_EQ(readFile(store_->finalDir() / "clip.mp4"), "first");
}

TEST_F(VideoProcessorTest, DropsJobWhoseStagedFileVanished) {
  auto job = stagedJob("gone.mp4", "raw");
  std::filesystem::remove(job.staged_path);
  auto transcoder = std::make_shared<FakeTranscoder>();
  VideoProcessor processor(transcoder, store_);

  auto report = processor.process(std::move(job));
  EXPECT_EQ(report.outcome, ProcessOutcome::Dropped);
  EXPECT_EQ(transcoder->calls(), 0);
  EXPECT_EQ(countEntries(store_->finalDir()), 0u);
}

TEST_F(VideoProcessorTest, ReservationIsFreedWhenJobIsDone) {
  auto job = stagedJob("clip.mp4", "raw");
  EXPECT_TRUE(registry_.contains("clip.mp4"));
  run(FakeTranscoder::Mode::Succeed, std::move(job));
  EXPECT_FALSE(registry_.contains("clip.mp4"));
}

} // namespace
} // namespace ingest_service
