#include <healthcam/vision/onnx_face_detector.hpp>
#include "frame_cv_utils.hpp"
#include <healthcam/core/error.hpp>
#include <healthcam/core/frame.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace healthcam::vision {

namespace {

constexpr int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      nchw[0 * hw + y * w + x] = hwc[src_idx + 0];
      nchw[1 * hw + y * w + x] = hwc[src_idx + 1];
      nchw[2 * hw + y * w + x] = hwc[src_idx + 2];
    }
  }
}

/// One raw detection in model-input pixels.
struct RawBox {
  float x1, y1, x2, y2, score;
  std::int64_t class_id;
};

}  // namespace

struct OnnxFaceDetector::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "healthcam"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};
  OnnxDetectorOptions options;

  std::string input_name;
  std::array<std::string, 3> output_names;
  std::vector<const char*> output_name_ptrs;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};
  /// True if model has a single output with [1, N, 6] or [1, 6, N] (xmin, ymin, xmax, ymax, score, class_id).
  bool use_yolo_single_output{false};
  bool on_gpu{false};

  std::vector<float> hwc_buffer;   // scratch: resized, normalised RGB
  std::vector<float> nchw_buffer;  // scratch for HWC -> NCHW

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  std::expected<std::vector<RawBox>, healthcam::core::PipelineError> run(
      std::vector<Ort::Value>& outputs) const;
};

OnnxFaceDetector::OnnxFaceDetector(std::string model_path, OnnxDetectorOptions options)
    : impl_(std::make_unique<Impl>()) {
  impl_->options = std::move(options);
  if (impl_->options.use_gpu) {
    try {
      OrtCUDAProviderOptions cuda_options{};
      impl_->session_options.AppendExecutionProvider_CUDA(cuda_options);
      impl_->on_gpu = true;
    } catch (const Ort::Exception& e) {
      spdlog::warn("OnnxFaceDetector: CUDA provider unavailable ({}); using CPU", e.what());
    }
  }
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  const size_t num_inputs = impl_->session.GetInputCount();
  if (num_inputs == 0) {
    throw std::runtime_error("OnnxFaceDetector: model has no inputs");
  }
  if (impl_->options.input_name.empty()) {
    impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  } else {
    impl_->input_name = impl_->options.input_name;
  }

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  std::vector<int64_t> dims = shape_info.GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxFaceDetector: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = static_cast<std::uint32_t>(dims[2]);
    impl_->input_width = static_cast<std::uint32_t>(dims[3]);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = static_cast<std::uint32_t>(dims[1]);
    impl_->input_width = static_cast<std::uint32_t>(dims[2]);
  } else {
    throw std::runtime_error("OnnxFaceDetector: expected input shape [1,3,H,W] or [1,H,W,3]");
  }
  if (impl_->input_height == 0 || impl_->input_width == 0 ||
      dims[impl_->input_is_nchw ? 2 : 1] < 0 || dims[impl_->input_is_nchw ? 3 : 2] < 0) {
    throw std::runtime_error("OnnxFaceDetector: dynamic input size is not supported");
  }

  const size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 1u) {
    impl_->use_yolo_single_output = true;
    impl_->output_names[0] = impl_->session.GetOutputNameAllocated(0, allocator).get();
    impl_->output_name_ptrs.push_back(impl_->output_names[0].c_str());
  } else if (num_outputs >= 3u) {
    for (std::size_t i = 0; i < 3u; ++i) {
      if (impl_->options.output_names[i].empty()) {
        impl_->output_names[i] = impl_->session.GetOutputNameAllocated(i, allocator).get();
      } else {
        impl_->output_names[i] = impl_->options.output_names[i];
      }
      impl_->output_name_ptrs.push_back(impl_->output_names[i].c_str());
    }
  } else {
    throw std::runtime_error(
        "OnnxFaceDetector: model must have 1 output (YOLO-style) or at least 3 outputs "
        "(boxes, scores, class_ids)");
  }
  spdlog::info("OnnxFaceDetector: loaded {} ({}x{}, {})", model_path, impl_->input_width,
               impl_->input_height, impl_->on_gpu ? "CUDA" : "CPU");
}

OnnxFaceDetector::~OnnxFaceDetector() = default;

std::string OnnxFaceDetector::backend_name() const { return impl_->on_gpu ? "CUDA" : "CPU"; }

std::expected<std::vector<RawBox>, healthcam::core::PipelineError>
OnnxFaceDetector::Impl::run(std::vector<Ort::Value>& outputs) const {
  std::vector<RawBox> boxes;

  if (use_yolo_single_output) {
    if (outputs.size() != 1u) {
      return std::unexpected(healthcam::core::PipelineError::DetectionFailed);
    }
    Ort::Value& out = outputs[0];
    const auto shape = out.GetTensorTypeAndShapeInfo().GetShape();
    const float* data = out.GetTensorData<float>();
    int64_t n = 0;
    bool rows_are_n6 = false;  // true: [1, N, 6]; false: [1, 6, N]
    if (shape.size() == 3u && shape[0] == 1 && shape[2] == 6) {
      n = shape[1];
      rows_are_n6 = true;
    } else if (shape.size() == 3u && shape[0] == 1 && shape[1] == 6) {
      n = shape[2];
    }
    if (n < 0) {
      return std::unexpected(healthcam::core::PipelineError::DetectionFailed);
    }
    boxes.reserve(static_cast<std::size_t>(n));
    const int64_t stride = rows_are_n6 ? 6 : n;
    for (int64_t i = 0; i < n; ++i) {
      if (rows_are_n6) {
        const float* row = data + i * 6;
        boxes.push_back({row[0], row[1], row[2], row[3], row[4],
                         static_cast<std::int64_t>(row[5])});
      } else {
        boxes.push_back({data[0 * stride + i], data[1 * stride + i], data[2 * stride + i],
                         data[3 * stride + i], data[4 * stride + i],
                         static_cast<std::int64_t>(data[5 * stride + i])});
      }
    }
    return boxes;
  }

  // Three-output path: boxes, scores, class_ids
  if (outputs.size() < 3u) {
    return std::unexpected(healthcam::core::PipelineError::DetectionFailed);
  }
  const std::vector<int64_t> boxes_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();

  // Support [1, N, 4], [1, 4, N], or [N, 4].
  int64_t n = -1;
  bool boxes_is_n4 = true;
  if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[2] == 4) {
    n = boxes_shape[1];
  } else if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[1] == 4) {
    n = boxes_shape[2];
    boxes_is_n4 = false;
  } else if (boxes_shape.size() == 2u && boxes_shape[1] == 4) {
    n = boxes_shape[0];
  }
  if (n < 0) {
    return std::unexpected(healthcam::core::PipelineError::DetectionFailed);
  }

  const float* boxes_data = outputs[0].GetTensorData<float>();
  const float* scores_data = outputs[1].GetTensorData<float>();
  const int64_t* classes_data = outputs[2].GetTensorData<int64_t>();
  const std::int64_t boxes_stride = boxes_is_n4 ? 4 : n;

  boxes.reserve(static_cast<std::size_t>(n));
  for (int64_t i = 0; i < n; ++i) {
    if (boxes_is_n4) {
      const float* row = boxes_data + i * 4;
      boxes.push_back({row[0], row[1], row[2], row[3], scores_data[i], classes_data[i]});
    } else {
      boxes.push_back({boxes_data[0 * boxes_stride + i], boxes_data[1 * boxes_stride + i],
                       boxes_data[2 * boxes_stride + i], boxes_data[3 * boxes_stride + i],
                       scores_data[i], classes_data[i]});
    }
  }
  return boxes;
}

std::expected<std::vector<healthcam::core::DetectedRegion>, healthcam::core::PipelineError>
OnnxFaceDetector::detect(const healthcam::core::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto bgr = detail::frame_to_bgr(input);
  if (!bgr) {
    return std::unexpected(healthcam::core::PipelineError::InvalidFrame);
  }

  const std::uint32_t h = impl_->input_height;
  const std::uint32_t w = impl_->input_width;

  cv::Mat resized;
  cv::resize(*bgr, resized, cv::Size(static_cast<int>(w), static_cast<int>(h)), 0, 0,
             cv::INTER_LINEAR);
  cv::cvtColor(resized, resized, cv::COLOR_BGR2RGB);
  cv::Mat normalised;
  resized.convertTo(normalised, CV_32FC3, 1.0 / 255.0);

  const std::size_t num_floats = static_cast<std::size_t>(h) * w * kNumChannels;
  impl_->hwc_buffer.resize(num_floats);
  std::memcpy(impl_->hwc_buffer.data(), normalised.ptr<float>(), num_floats * sizeof(float));

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor{nullptr};
  if (impl_->input_is_nchw) {
    impl_->nchw_buffer.resize(num_floats);
    HwcToNchw(impl_->hwc_buffer.data(), h, w, impl_->nchw_buffer.data());
    const std::array<int64_t, 4> shape{1, kNumChannels, static_cast<int64_t>(h),
                                       static_cast<int64_t>(w)};
    input_tensor = Ort::Value::CreateTensor<float>(mem_info, impl_->nchw_buffer.data(),
                                                   num_floats, shape.data(), shape.size());
  } else {
    const std::array<int64_t, 4> shape{1, static_cast<int64_t>(h), static_cast<int64_t>(w),
                                       kNumChannels};
    input_tensor = Ort::Value::CreateTensor<float>(mem_info, impl_->hwc_buffer.data(),
                                                   num_floats, shape.data(), shape.size());
  }

  const char* input_names_c[] = {impl_->input_name.c_str()};
  Ort::RunOptions run_options;

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 impl_->output_name_ptrs.data(),
                                 impl_->output_name_ptrs.size());
  } catch (const Ort::Exception& e) {
    spdlog::warn("OnnxFaceDetector: inference failed: {}", e.what());
    return std::unexpected(healthcam::core::PipelineError::DetectionFailed);
  }

  auto raw = impl_->run(outputs);
  if (!raw) {
    return std::unexpected(raw.error());
  }

  const float sx = static_cast<float>(input.width()) / static_cast<float>(w);
  const float sy = static_cast<float>(input.height()) / static_cast<float>(h);
  std::vector<healthcam::core::DetectedRegion> regions;
  for (const auto& b : *raw) {
    if (b.score < impl_->options.confidence_threshold) continue;
    if (impl_->options.face_class_id >= 0 && b.class_id != impl_->options.face_class_id) continue;
    healthcam::core::DetectedRegion r;
    r.bbox.x = b.x1 * sx;
    r.bbox.y = b.y1 * sy;
    r.bbox.w = (b.x2 - b.x1) * sx;
    r.bbox.h = (b.y2 - b.y1) * sy;
    r.confidence = std::min(1.f, std::max(0.f, b.score));
    if (r.bbox.w <= 0.f || r.bbox.h <= 0.f) continue;
    regions.push_back(r);
  }
  return regions;
}

void OnnxFaceDetector::warmup() {
  const std::size_t num_bytes =
      healthcam::core::Frame::min_bytes(impl_->input_width, impl_->input_height,
                                        healthcam::core::PixelFormat::BGR8);
  std::vector<std::byte> buffer(num_bytes, std::byte{0});
  healthcam::core::Frame frame(impl_->input_width, impl_->input_height,
                               healthcam::core::PixelFormat::BGR8, std::move(buffer));
  if (auto result = detect(frame); !result) {
    spdlog::warn("OnnxFaceDetector: warmup failed: {}", healthcam::core::error_name(result.error()));
  }
}

}  // namespace healthcam::vision
