#include <healthcam/app/capture_session.hpp>
#include <healthcam/app/persistence.hpp>
#include <healthcam/app/render_loop.hpp>
#include <healthcam/core/latest_slot.hpp>
#include <healthcam/vision/mock_face_detector.hpp>
#include <gtest/gtest.h>
#include "support/fakes.hpp"
#include <atomic>
#include <chrono>
#include <vector>

namespace ha = healthcam::app;
namespace hc = healthcam::core;
namespace hv = healthcam::vision;
namespace ht = healthcam::test;

namespace {

ha::RenderOptions raw_options(std::uint32_t frame_skip = 1) {
  ha::RenderOptions options;
  options.frame_skip = frame_skip;
  options.overlay = false;
  options.key_wait_ms = 0;
  return options;
}

}  // namespace

TEST(RenderLoop, CaptureErrorStopsEverything) {
  ht::FakeCapture capture(3);
  ASSERT_TRUE(capture.open(0).has_value());
  ht::FakeDisplay display;
  hc::LatestSlot<hc::Frame> frames;
  hc::LatestSlot<hc::SessionResult> results;
  ha::RenderLoop loop(capture, display, frames, results, raw_options());

  std::atomic<bool> running{true};
  auto status = loop.run(running);
  ASSERT_FALSE(status.has_value());
  EXPECT_EQ(status.error(), hc::PipelineError::CaptureError);
  EXPECT_FALSE(running.load());
  EXPECT_TRUE(display.closed);
  EXPECT_EQ(loop.frames_read(), 3u);
  EXPECT_EQ(frames.take_latest()->sequence(), 3u);
}

TEST(RenderLoop, QuitKeyClearsRunning) {
  ht::FakeCapture capture;
  ASSERT_TRUE(capture.open(0).has_value());
  ht::FakeDisplay display;
  display.keys = {-1, ha::keys::kQuit};
  hc::LatestSlot<hc::Frame> frames;
  hc::LatestSlot<hc::SessionResult> results;
  ha::RenderLoop loop(capture, display, frames, results, raw_options());

  std::atomic<bool> running{true};
  auto status = loop.run(running);
  EXPECT_TRUE(status.has_value());
  EXPECT_FALSE(running.load());
  EXPECT_EQ(loop.frames_read(), 2u);
}

TEST(RenderLoop, EscapeAlsoQuits) {
  ht::FakeCapture capture;
  ASSERT_TRUE(capture.open(0).has_value());
  ht::FakeDisplay display;
  display.keys = {ha::keys::kEscape};
  hc::LatestSlot<hc::Frame> frames;
  hc::LatestSlot<hc::SessionResult> results;
  ha::RenderLoop loop(capture, display, frames, results, raw_options());
  std::atomic<bool> running{true};
  EXPECT_TRUE(loop.run(running).has_value());
  EXPECT_EQ(loop.frames_read(), 1u);
}

TEST(RenderLoop, FrameSkipShowsEveryNthFrame) {
  ht::FakeCapture capture(6);
  ASSERT_TRUE(capture.open(0).has_value());
  ht::FakeDisplay display;
  hc::LatestSlot<hc::Frame> frames;
  hc::LatestSlot<hc::SessionResult> results;
  ha::RenderLoop loop(capture, display, frames, results, raw_options(3));
  std::atomic<bool> running{true};
  (void)loop.run(running);
  EXPECT_EQ(display.shown, (std::vector<std::uint64_t>{3, 6}));
  EXPECT_EQ(loop.frames_shown(), 2u);
  // Every frame is published regardless of display cadence.
  EXPECT_EQ(frames.version(), 6u);
}

TEST(RenderLoop, OverlayToggleAndRendering) {
  ht::FakeCapture capture(3);
  ASSERT_TRUE(capture.open(0).has_value());
  ht::FakeDisplay display;
  display.keys = {ha::keys::kToggleOverlay};
  hc::LatestSlot<hc::Frame> frames;
  hc::LatestSlot<hc::SessionResult> results;
  hc::SessionResult published;
  published.region.bbox = {5.f, 5.f, 20.f, 20.f};
  results.publish(published);

  ha::RenderOptions options = raw_options();
  options.overlay = true;
  ha::RenderLoop loop(capture, display, frames, results, options);
  std::atomic<bool> running{true};
  (void)loop.run(running);
  EXPECT_FALSE(loop.overlay_enabled());
  EXPECT_EQ(display.shown.size(), 3u);
}

TEST(RenderLoop, SpaceArmsCaptureSession) {
  ht::FakeCapture capture(2);
  ASSERT_TRUE(capture.open(0).has_value());
  ht::FakeDisplay display;
  display.keys = {ha::keys::kCapture};
  hc::LatestSlot<hc::Frame> frames;
  hc::LatestSlot<hc::SessionResult> results;

  ha::PersistenceQueue queue;
  hv::MockFaceDetector detector;
  ht::FakeExtractor extractor;
  ht::FakeScorer scorer;
  ha::CaptureSession session({detector, extractor, scorer}, queue, std::chrono::seconds(60),
                             "session");

  ha::RenderLoop loop(capture, display, frames, results, raw_options(), &session);
  std::atomic<bool> running{true};
  (void)loop.run(running);
  EXPECT_EQ(session.state(), ha::SessionState::Armed);
  // The frame read after arming went through detection.
  EXPECT_EQ(detector.detect_calls(), 1u);
}
