#pragma once

#include <healthcam/core/error.hpp>
#include <healthcam/core/session_result.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace healthcam::storage {

/// Persisted file format. Spreadsheet output is tab-separated (.tsv).
enum class OutputFormat : std::uint8_t {
  Json,
  Csv,
  Spreadsheet,
};

[[nodiscard]] std::string_view format_name(OutputFormat format) noexcept;
[[nodiscard]] std::optional<OutputFormat> parse_format(std::string_view name) noexcept;
/// File extension including the dot.
[[nodiscard]] std::string_view format_extension(OutputFormat format) noexcept;
/// Format implied by a file extension; nullopt when unknown.
[[nodiscard]] std::optional<OutputFormat> format_from_path(const std::filesystem::path& path);

/// Durable sink for batches of SessionResults.
/// save() is all-or-nothing: either the whole batch is visible at the returned
/// path or nothing is written and StorageError is returned.
class IStorageBackend {
 public:
  virtual ~IStorageBackend() = default;

  /// Writes \p records to \p base_path plus the extension of \p format.
  [[nodiscard]] virtual std::expected<std::filesystem::path, healthcam::core::PipelineError>
  save(std::span<const healthcam::core::SessionResult> records,
       const std::filesystem::path& base_path,
       OutputFormat format) = 0;

  [[nodiscard]] virtual std::expected<std::vector<healthcam::core::SessionResult>,
                                      healthcam::core::PipelineError>
  load(const std::filesystem::path& path) = 0;
};

}  // namespace healthcam::storage
