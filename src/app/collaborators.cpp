#include <healthcam/app/collaborators.hpp>
#include <healthcam/vision/cascade_face_detector.hpp>
#include <healthcam/vision/heuristic_scorer.hpp>
#include <healthcam/vision/mock_face_detector.hpp>
#include <healthcam/vision/onnx_face_detector.hpp>
#include <healthcam/vision/region_feature_extractor.hpp>

namespace healthcam::app {

namespace hv = healthcam::vision;

PipelineFactory make_pipeline_factory(const AppConfig& config) {
  PipelineFactory factory;
  switch (config.detector) {
    case DetectorType::Cascade:
      factory.make_detector = [path = config.cascade_path] {
        return std::make_unique<hv::CascadeFaceDetector>(path);
      };
      break;
    case DetectorType::Onnx:
      factory.make_detector = [path = config.model_path, threshold = config.confidence_threshold,
                               gpu = config.use_gpu] {
        hv::OnnxDetectorOptions options;
        options.confidence_threshold = threshold;
        options.use_gpu = gpu;
        auto detector = std::make_unique<hv::OnnxFaceDetector>(path, options);
        detector->warmup();
        return detector;
      };
      break;
    case DetectorType::Mock:
      factory.make_detector = [] {
        auto detector = std::make_unique<hv::MockFaceDetector>();
        detector->set_regions({healthcam::core::DetectedRegion{{440.f, 160.f, 400.f, 400.f}, 1.f}});
        return detector;
      };
      break;
  }
  factory.make_extractor = [path = config.eye_cascade_path] {
    hv::RegionExtractorOptions options;
    options.eye_cascade_path = path;
    return std::make_unique<hv::RegionFeatureExtractor>(options);
  };
  factory.make_scorer = [] { return std::make_unique<hv::HeuristicScorer>(); };
  return factory;
}

}  // namespace healthcam::app
