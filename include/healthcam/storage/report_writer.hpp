#pragma once

#include <healthcam/core/error.hpp>
#include <healthcam/core/session_result.hpp>
#include <expected>
#include <filesystem>
#include <string>

namespace healthcam::storage {

/// Markdown health report for one captured result. Sections without
/// measurements say so instead of showing values.
[[nodiscard]] std::string format_health_report(const healthcam::core::SessionResult& result);

/// Writes format_health_report(\p result) to \p path (temporary file + rename).
[[nodiscard]] std::expected<std::filesystem::path, healthcam::core::PipelineError>
write_health_report(const healthcam::core::SessionResult& result,
                    const std::filesystem::path& path);

}  // namespace healthcam::storage
