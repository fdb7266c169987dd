#pragma once

#include <healthcam/storage/storage_backend.hpp>

namespace healthcam::storage {

/// Local-file backend: JSON (array of records), CSV, and tab-separated
/// spreadsheet output. Each batch is written to a temporary file in the
/// target directory and renamed into place. Missing directories are created.
/// Stateless; concurrent calls must target different base paths.
class FileStorageBackend : public IStorageBackend {
 public:
  [[nodiscard]] std::expected<std::filesystem::path, healthcam::core::PipelineError>
  save(std::span<const healthcam::core::SessionResult> records,
       const std::filesystem::path& base_path,
       OutputFormat format) override;

  /// Format is chosen by extension. CSV/TSV files load the flattened columns
  /// only, so single-element vector samples come back as scalars.
  [[nodiscard]] std::expected<std::vector<healthcam::core::SessionResult>,
                              healthcam::core::PipelineError>
  load(const std::filesystem::path& path) override;
};

}  // namespace healthcam::storage
