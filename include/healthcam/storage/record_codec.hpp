#pragma once

#include <healthcam/core/error.hpp>
#include <healthcam/core/session_result.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace healthcam::storage {

[[nodiscard]] nlohmann::json record_to_json(const healthcam::core::SessionResult& record);

/// StorageError if required fields are missing or mistyped.
[[nodiscard]] std::expected<healthcam::core::SessionResult, healthcam::core::PipelineError>
record_from_json(const nlohmann::json& json);

/// One flat row: ordered (column, value) pairs.
///
/// Fixed columns come first (timestamp, frame_id, session_id, region_*,
/// score, status, recommendations, notes), then `m.<group>.<key>`
/// measurements (vector samples space-separated), `i.<name>` indicators
/// (`i.<name>.note` for the note of a structured indicator) and
/// `t.<metric>` trends. List fields are joined with "; ".
using FlatRow = std::vector<std::pair<std::string, std::string>>;

[[nodiscard]] FlatRow flatten_record(const healthcam::core::SessionResult& record);

/// Union of the columns of \p rows: fixed columns first, then the rest sorted.
[[nodiscard]] std::vector<std::string> collect_columns(std::span<const FlatRow> rows);

/// Inverse of flatten_record for one row of a table with \p columns.
/// Empty cells are treated as absent.
[[nodiscard]] std::expected<healthcam::core::SessionResult, healthcam::core::PipelineError>
unflatten_record(std::span<const std::string> columns, std::span<const std::string> cells);

}  // namespace healthcam::storage
