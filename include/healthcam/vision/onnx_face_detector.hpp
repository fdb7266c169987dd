#pragma once

#include <healthcam/core/error.hpp>
#include <healthcam/core/frame.hpp>
#include <healthcam/vision/face_detector.hpp>
#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace healthcam::vision {

struct OnnxDetectorOptions {
  float confidence_threshold{0.5f};
  /// Try the CUDA execution provider first; falls back to CPU when unavailable.
  bool use_gpu{false};
  /// Keep only detections of this class; -1 keeps every class.
  std::int64_t face_class_id{-1};
  /// Optional input tensor name; if empty, the first input is used.
  std::string input_name;
  /// Optional {boxes, scores, class_ids}; if any empty, names are inferred
  /// from the model (first three outputs in order).
  std::array<std::string, 3> output_names;
};

/// ONNX Runtime face detector.
///
/// Expected model: detection model with one float image input and either:
/// - **One output (YOLO-style)**: [1, N, 6] or [1, 6, N] with
///   (xmin, ymin, xmax, ymax, score, class_id) per detection, or
/// - **Three outputs**: boxes [1,N,4] / [1,4,N] / [N,4], scores [1,N], class_ids [1,N].
/// Boxes are in model-input pixels. Frames of any size and BGR/RGB/BGRA/grey
/// format are resized to the model input, scaled to [0,1] RGB, and the decoded
/// boxes are mapped back to frame pixels.
class OnnxFaceDetector : public IFaceDetector {
 public:
  /// \throws Ort::Exception if the model cannot be loaded,
  ///         std::runtime_error if its input/output layout is unsupported.
  explicit OnnxFaceDetector(std::string model_path, OnnxDetectorOptions options = {});

  ~OnnxFaceDetector() override;

  OnnxFaceDetector(const OnnxFaceDetector&) = delete;
  OnnxFaceDetector& operator=(const OnnxFaceDetector&) = delete;

  [[nodiscard]] std::expected<std::vector<healthcam::core::DetectedRegion>,
                              healthcam::core::PipelineError>
  detect(const healthcam::core::Frame& input) override;

  [[nodiscard]] std::string backend_name() const override;

  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace healthcam::vision
