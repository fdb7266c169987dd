#include <healthcam/app/collaborators.hpp>
#include <healthcam/app/config.hpp>
#include <healthcam/app/realtime_analyzer.hpp>
#include <healthcam/app/render_loop.hpp>
#include <healthcam/storage/file_storage_backend.hpp>
#include <healthcam/vision/heuristic_scorer.hpp>
#include <healthcam/vision/mock_face_detector.hpp>
#include <healthcam/vision/region_feature_extractor.hpp>
#include <gtest/gtest.h>
#include "support/fakes.hpp"
#include "support/sample_records.hpp"
#include <chrono>
#include <condition_variable>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

using namespace healthcam::core;
using namespace healthcam::vision;
using namespace healthcam::app;
namespace hs = healthcam::storage;
namespace ht = healthcam::test;
namespace fs = std::filesystem;

/// Mock detector with a face filling most of the fake camera's 64x48 frame,
/// feeding the real extractor and scorer.
PipelineFactory demo_factory() {
  PipelineFactory factory;
  factory.make_detector = [] {
    auto detector = std::make_unique<MockFaceDetector>();
    detector->set_regions({DetectedRegion{{8.f, 4.f, 48.f, 40.f}, 1.f}});
    return detector;
  };
  factory.make_extractor = [] { return std::make_unique<RegionFeatureExtractor>(); };
  factory.make_scorer = [] { return std::make_unique<HeuristicScorer>(); };
  return factory;
}

AppConfig test_config(const fs::path& output_dir, RunMode mode) {
  AppConfig c = default_config();
  c.mode = mode;
  c.detector = DetectorType::Mock;
  c.output_dir = output_dir.string();
  c.output_format = hs::OutputFormat::Json;
  c.flush_interval_s = 60.0;  // everything lands in the final flush
  c.countdown_s = 0.05;
  c.idle_sleep_ms = 1;
  c.flush_poll_ms = 5;
  return c;
}

std::vector<fs::path> files_with_extension(const fs::path& dir, const std::string& ext) {
  std::vector<fs::path> out;
  if (!fs::exists(dir)) return out;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().extension() == ext) out.push_back(entry.path());
  }
  return out;
}

/// Holds every detect() call until released (or for at most five seconds).
class Gate {
 public:
  void release() {
    {
      std::lock_guard lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  void wait() {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, std::chrono::seconds(5), [this] { return open_; });
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_{false};
};

class GatedDetector : public IFaceDetector {
 public:
  explicit GatedDetector(std::shared_ptr<Gate> gate) : gate_(std::move(gate)) {}

  std::expected<std::vector<DetectedRegion>, PipelineError> detect(const Frame&) override {
    gate_->wait();
    return std::vector<DetectedRegion>{{{8.f, 4.f, 48.f, 40.f}, 1.f}};
  }

 private:
  std::shared_ptr<Gate> gate_;
};

std::unique_ptr<ht::FakeDisplay> display_quitting_after(std::size_t polls, int first_key = -1) {
  auto display = std::make_unique<ht::FakeDisplay>();
  display->keys.push_back(first_key);
  for (std::size_t i = 1; i < polls; ++i) display->keys.push_back(-1);
  display->keys.push_back(keys::kQuit);
  return display;
}

}  // namespace

TEST(FullPipeline, ContinuousRunPersistsEveryPublishedResult) {
  ht::ScratchDir dir;
  RealtimeAnalyzer analyzer(test_config(dir.path(), RunMode::Continuous),
                            std::make_unique<ht::FakeCapture>(0, true, std::chrono::milliseconds(5)),
                            display_quitting_after(40), demo_factory(),
                            std::make_unique<hs::FileStorageBackend>());
  auto summary = analyzer.run();
  ASSERT_TRUE(summary.has_value()) << error_name(summary.error());
  EXPECT_FALSE(analyzer.running());
  EXPECT_EQ(summary->frames_read, 41u);
  EXPECT_GE(summary->results, 1u);
  EXPECT_EQ(summary->records_saved, summary->results);
  EXPECT_EQ(summary->records_unsaved, 0u);

  const auto files = files_with_extension(dir.path(), ".json");
  ASSERT_EQ(files.size(), 1u);
  hs::FileStorageBackend storage;
  auto loaded = storage.load(files[0]);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), summary->results);
  for (const auto& record : *loaded) {
    EXPECT_GT(record.frame_id, 0u);
    EXPECT_FLOAT_EQ(record.region.bbox.w, 48.f);
    EXPECT_TRUE(record.indicators.contains(indicators::kFacialSymmetry));
    EXPECT_FALSE(record.recommendations.empty());
  }
  // Frames are analysed in capture order and never twice.
  for (std::size_t i = 1; i < loaded->size(); ++i) {
    EXPECT_GT((*loaded)[i].frame_id, (*loaded)[i - 1].frame_id);
  }
}

TEST(FullPipeline, SessionCaptureWritesOneRecordAndReport) {
  ht::ScratchDir dir;
  RealtimeAnalyzer analyzer(test_config(dir.path(), RunMode::Session),
                            std::make_unique<ht::FakeCapture>(0, true, std::chrono::milliseconds(5)),
                            display_quitting_after(40, keys::kCapture), demo_factory(),
                            std::make_unique<hs::FileStorageBackend>());
  auto summary = analyzer.run();
  ASSERT_TRUE(summary.has_value()) << error_name(summary.error());
  EXPECT_EQ(summary->results, 1u);
  EXPECT_EQ(summary->records_saved, 1u);

  EXPECT_EQ(files_with_extension(dir.path(), ".json").size(), 1u);
  EXPECT_EQ(files_with_extension(dir.path(), ".md").size(), 1u);
}

TEST(FullPipeline, RepeatedSessionCapturesKeepEveryReport) {
  ht::ScratchDir dir;
  auto display = std::make_unique<ht::FakeDisplay>();
  for (int round = 0; round < 2; ++round) {
    display->keys.push_back(keys::kCapture);
    for (int i = 0; i < 30; ++i) display->keys.push_back(-1);  // outlasts the countdown
  }
  display->keys.push_back(keys::kQuit);
  RealtimeAnalyzer analyzer(test_config(dir.path(), RunMode::Session),
                            std::make_unique<ht::FakeCapture>(0, true, std::chrono::milliseconds(5)),
                            std::move(display), demo_factory(),
                            std::make_unique<hs::FileStorageBackend>());
  auto summary = analyzer.run();
  ASSERT_TRUE(summary.has_value()) << error_name(summary.error());
  EXPECT_EQ(summary->results, 2u);
  EXPECT_EQ(summary->records_saved, 2u);
  EXPECT_EQ(files_with_extension(dir.path(), ".md").size(), 2u);
}

TEST(FullPipeline, StuckDetectorDoesNotHoldUpShutdown) {
  ht::ScratchDir dir;
  auto gate = std::make_shared<Gate>();
  PipelineFactory factory = demo_factory();
  factory.make_detector = [gate] { return std::make_unique<GatedDetector>(gate); };
  AppConfig config = test_config(dir.path(), RunMode::Continuous);
  config.shutdown_timeout_ms = 100;
  RealtimeAnalyzer analyzer(config,
                            std::make_unique<ht::FakeCapture>(0, true, std::chrono::milliseconds(5)),
                            display_quitting_after(10), std::move(factory),
                            std::make_unique<hs::FileStorageBackend>());

  const auto start = std::chrono::steady_clock::now();
  auto summary = analyzer.run();
  const auto elapsed = std::chrono::steady_clock::now() - start;
  gate->release();

  ASSERT_TRUE(summary.has_value()) << error_name(summary.error());
  EXPECT_LT(elapsed, std::chrono::seconds(2));
  EXPECT_EQ(summary->results, 0u);
  EXPECT_EQ(summary->records_unsaved, 0u);
}

TEST(FullPipeline, CaptureErrorStillFlushes) {
  ht::ScratchDir dir;
  RealtimeAnalyzer analyzer(test_config(dir.path(), RunMode::Continuous),
                            std::make_unique<ht::FakeCapture>(40, true, std::chrono::milliseconds(5)),
                            std::make_unique<ht::FakeDisplay>(), demo_factory(),
                            std::make_unique<hs::FileStorageBackend>());
  auto summary = analyzer.run();
  ASSERT_FALSE(summary.has_value());
  EXPECT_EQ(summary.error(), PipelineError::CaptureError);
  EXPECT_EQ(files_with_extension(dir.path(), ".json").size(), 1u);
}

TEST(FullPipeline, UnavailableDeviceFailsFast) {
  ht::ScratchDir dir;
  RealtimeAnalyzer analyzer(test_config(dir.path(), RunMode::Continuous),
                            std::make_unique<ht::FakeCapture>(0, false),
                            std::make_unique<ht::FakeDisplay>(), demo_factory(),
                            std::make_unique<ht::FakeStorage>());
  auto summary = analyzer.run();
  ASSERT_FALSE(summary.has_value());
  EXPECT_EQ(summary.error(), PipelineError::DeviceUnavailable);
}

TEST(FullPipeline, StorageFailureReportsUnsavedRecords) {
  ht::ScratchDir dir;
  auto storage = std::make_unique<ht::FakeStorage>();
  storage->fail_next = 1000;
  RealtimeAnalyzer analyzer(test_config(dir.path(), RunMode::Continuous),
                            std::make_unique<ht::FakeCapture>(0, true, std::chrono::milliseconds(5)),
                            display_quitting_after(20), demo_factory(), std::move(storage));
  auto summary = analyzer.run();
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->records_saved, 0u);
  EXPECT_EQ(summary->records_unsaved, summary->results);
}
