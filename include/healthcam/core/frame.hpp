#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace healthcam::core {

/// Pixel layouts a capture device or test can hand to the pipeline.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  BGRA8,
};

/// Bytes per pixel for packed 8-bit layouts; 0 for Unknown.
[[nodiscard]] std::size_t bytes_per_pixel(PixelFormat format) noexcept;

/// One captured video frame.
///
/// The pixel buffer is owned by value. Copying a Frame deep-copies the pixels,
/// so whoever copies a frame out of the shared slot owns it outright and the
/// slot may be overwritten immediately afterwards. Distinct instances are
/// independent across threads; one instance is not synchronised.
class Frame {
 public:
  using Clock = std::chrono::steady_clock;

  Frame() = default;

  Frame(std::uint32_t width, std::uint32_t height, PixelFormat format,
        std::vector<std::byte> pixels, std::uint64_t sequence = 0,
        Clock::time_point captured_at = Clock::now())
      : width_(width),
        height_(height),
        format_(format),
        pixels_(std::move(pixels)),
        sequence_(sequence),
        captured_at_(captured_at) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  /// Read order assigned by the capture source, starting at 1; 0 when unnumbered.
  [[nodiscard]] std::uint64_t sequence() const noexcept { return sequence_; }
  [[nodiscard]] Clock::time_point captured_at() const noexcept { return captured_at_; }

  [[nodiscard]] std::span<std::byte> data() noexcept { return pixels_; }
  [[nodiscard]] std::span<const std::byte> data() const noexcept { return pixels_; }

  [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return pixels_.size(); }

  /// Bytes per row, including any padding the producer kept.
  [[nodiscard]] std::size_t row_bytes() const noexcept {
    return height_ == 0 ? 0 : pixels_.size() / height_;
  }

  /// True when the format is known and the buffer covers every pixel.
  [[nodiscard]] bool is_complete() const noexcept;

  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width, std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> pixels_;
  std::uint64_t sequence_{0};
  Clock::time_point captured_at_{};
};

}  // namespace healthcam::core
