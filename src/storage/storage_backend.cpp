#include <healthcam/storage/storage_backend.hpp>

namespace healthcam::storage {

namespace fs = std::filesystem;

std::string_view format_name(OutputFormat format) noexcept {
  switch (format) {
    case OutputFormat::Json:
      return "json";
    case OutputFormat::Csv:
      return "csv";
    case OutputFormat::Spreadsheet:
      return "spreadsheet";
  }
  return "unknown";
}

std::optional<OutputFormat> parse_format(std::string_view name) noexcept {
  if (name == "json") return OutputFormat::Json;
  if (name == "csv") return OutputFormat::Csv;
  if (name == "spreadsheet" || name == "excel" || name == "tsv") return OutputFormat::Spreadsheet;
  return std::nullopt;
}

std::string_view format_extension(OutputFormat format) noexcept {
  switch (format) {
    case OutputFormat::Json:
      return ".json";
    case OutputFormat::Csv:
      return ".csv";
    case OutputFormat::Spreadsheet:
      return ".tsv";
  }
  return "";
}

std::optional<OutputFormat> format_from_path(const fs::path& path) {
  const auto ext = path.extension().string();
  if (ext == ".json") return OutputFormat::Json;
  if (ext == ".csv") return OutputFormat::Csv;
  if (ext == ".tsv") return OutputFormat::Spreadsheet;
  return std::nullopt;
}

}  // namespace healthcam::storage
