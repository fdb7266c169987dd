#include <healthcam/app/capture_session.hpp>
#include <healthcam/app/persistence.hpp>
#include <healthcam/vision/mock_face_detector.hpp>
#include <gtest/gtest.h>
#include "support/fakes.hpp"
#include <chrono>
#include <vector>

namespace ha = healthcam::app;
namespace hc = healthcam::core;
namespace hv = healthcam::vision;
namespace ht = healthcam::test;

using namespace std::chrono_literals;

namespace {

hc::DetectedRegion square(float side) { return {{0.f, 0.f, side, side}, 1.f}; }

struct SessionFixture {
  ha::PersistenceQueue queue;
  hv::MockFaceDetector detector;
  ht::FakeExtractor extractor;
  ht::FakeScorer scorer;
  ha::CaptureSession session{{detector, extractor, scorer}, queue, 3s, "session"};
  const ha::CaptureSession::Clock::time_point t0{};

  SessionFixture() { scorer.indicators = ht::healthy_indicators(); }

  std::size_t queued() {
    std::vector<hc::SessionResult> out;
    return queue.drain_into(out);
  }
};

}  // namespace

TEST(CaptureSession, StartsIdle) {
  SessionFixture f;
  EXPECT_EQ(f.session.state(), ha::SessionState::Idle);
  EXPECT_FALSE(f.session.remaining(f.t0).has_value());
  // Frames are ignored until armed.
  EXPECT_EQ(f.session.on_frame(ht::make_bgr_frame(8, 8, 1), f.t0), ha::SessionState::Idle);
  EXPECT_EQ(f.detector.detect_calls(), 0u);
}

TEST(CaptureSession, KeepsFrameWithLargestFace) {
  SessionFixture f;
  ASSERT_TRUE(f.session.trigger(f.t0));
  EXPECT_EQ(f.session.state(), ha::SessionState::Armed);
  EXPECT_DOUBLE_EQ(f.session.remaining(f.t0 + 1s).value_or(0.0), 2.0);

  f.detector.set_regions({square(50.f)});
  f.session.on_frame(ht::make_bgr_frame(8, 8, 1), f.t0 + 500ms);
  f.detector.set_regions({square(80.f)});
  f.session.on_frame(ht::make_bgr_frame(8, 8, 2), f.t0 + 1s);
  f.detector.set_regions({square(80.f)});
  f.session.on_frame(ht::make_bgr_frame(8, 8, 3), f.t0 + 2s);
  f.detector.set_regions({square(60.f)});
  f.session.on_frame(ht::make_bgr_frame(8, 8, 4), f.t0 + 2500ms);

  EXPECT_TRUE(f.extractor.frames().empty());
  EXPECT_EQ(f.session.on_frame(ht::make_bgr_frame(8, 8, 5), f.t0 + 3s),
            ha::SessionState::Captured);

  // Equal later face does not displace the earlier one.
  EXPECT_EQ(f.extractor.frames(), (std::vector<std::uint64_t>{2}));
  ASSERT_TRUE(f.session.result().has_value());
  EXPECT_EQ(f.session.result()->frame_id, 2u);
  EXPECT_EQ(f.queued(), 1u);

  // Further frames neither analyse nor enqueue again.
  f.session.on_frame(ht::make_bgr_frame(8, 8, 6), f.t0 + 4s);
  EXPECT_EQ(f.queued(), 0u);
}

TEST(CaptureSession, NoFaceReturnsToIdle) {
  SessionFixture f;
  f.session.trigger(f.t0);
  f.session.on_frame(ht::make_bgr_frame(8, 8, 1), f.t0 + 1s);
  EXPECT_EQ(f.session.on_frame(ht::make_bgr_frame(8, 8, 2), f.t0 + 3100ms),
            ha::SessionState::Idle);
  EXPECT_EQ(f.session.last_failure(), hc::PipelineError::NoFaceDetected);
  EXPECT_FALSE(f.session.result().has_value());
  EXPECT_EQ(f.queued(), 0u);

  // Can be re-armed.
  EXPECT_TRUE(f.session.trigger(f.t0 + 4s));
  EXPECT_FALSE(f.session.last_failure().has_value());
}

TEST(CaptureSession, AnalysisFailureReturnsToIdle) {
  SessionFixture f;
  f.detector.set_regions({square(50.f)});
  f.extractor.failure = hc::PipelineError::ExtractionFailed;
  f.session.trigger(f.t0);
  f.session.on_frame(ht::make_bgr_frame(8, 8, 1), f.t0 + 1s);
  f.session.on_frame(ht::make_bgr_frame(8, 8, 2), f.t0 + 3s);
  EXPECT_EQ(f.session.state(), ha::SessionState::Idle);
  EXPECT_EQ(f.session.last_failure(), hc::PipelineError::ExtractionFailed);
  EXPECT_EQ(f.queued(), 0u);
}

TEST(CaptureSession, ThrowingScorerIsReportedAsScoringFailure) {
  SessionFixture f;
  f.detector.set_regions({square(50.f)});
  f.scorer.throw_on_score = true;
  f.session.trigger(f.t0);
  f.session.on_frame(ht::make_bgr_frame(8, 8, 1), f.t0 + 1s);
  f.session.on_frame(ht::make_bgr_frame(8, 8, 2), f.t0 + 3s);
  EXPECT_EQ(f.session.state(), ha::SessionState::Idle);
  EXPECT_EQ(f.session.last_failure(), hc::PipelineError::ScoringFailed);
  EXPECT_EQ(f.queued(), 0u);
}

TEST(CaptureSession, QuitAborts) {
  SessionFixture f;
  f.session.trigger(f.t0);
  f.session.quit();
  EXPECT_EQ(f.session.state(), ha::SessionState::Aborted);
  EXPECT_FALSE(f.session.trigger(f.t0 + 1s));
  EXPECT_EQ(f.session.on_frame(ht::make_bgr_frame(8, 8, 1), f.t0 + 5s),
            ha::SessionState::Aborted);
  EXPECT_EQ(f.queued(), 0u);
}

TEST(CaptureSession, RetriggerAfterCapture) {
  SessionFixture f;
  int callbacks = 0;
  f.session.set_on_captured([&](const hc::SessionResult&) { ++callbacks; });
  f.detector.set_regions({square(50.f)});
  f.session.trigger(f.t0);
  f.session.on_frame(ht::make_bgr_frame(8, 8, 1), f.t0 + 1s);
  f.session.on_frame(ht::make_bgr_frame(8, 8, 2), f.t0 + 3s);
  ASSERT_EQ(f.session.state(), ha::SessionState::Captured);
  EXPECT_EQ(callbacks, 1);

  // quit() has no effect once captured.
  f.session.quit();
  EXPECT_EQ(f.session.state(), ha::SessionState::Captured);

  EXPECT_TRUE(f.session.trigger(f.t0 + 10s));
  EXPECT_EQ(f.session.state(), ha::SessionState::Armed);
  EXPECT_FALSE(f.session.result().has_value());
}
