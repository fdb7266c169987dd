#include <healthcam/storage/file_storage_backend.hpp>
#include <healthcam/storage/record_codec.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <system_error>

namespace healthcam::storage {

namespace hc = healthcam::core;
namespace fs = std::filesystem;

namespace {

char delimiter_for(OutputFormat format) { return format == OutputFormat::Spreadsheet ? '\t' : ','; }

/// CSV cells are quoted when needed; TSV cells have tabs and line breaks
/// replaced by spaces.
std::string encode_cell(const std::string& value, char delimiter) {
  if (delimiter == '\t') {
    std::string out = value;
    for (char& c : out) {
      if (c == '\t' || c == '\n' || c == '\r') c = ' ';
    }
    return out;
  }
  if (value.find_first_of(",\"\n\r") == std::string::npos) return value;
  std::string out = "\"";
  for (char c : value) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

/// Splits one record of \p text starting at \p pos; advances \p pos past it.
std::vector<std::string> parse_row(const std::string& text, std::size_t& pos, char delimiter) {
  std::vector<std::string> cells;
  std::string cell;
  bool quoted = false;
  while (pos < text.size()) {
    const char c = text[pos++];
    if (quoted) {
      if (c == '"') {
        if (pos < text.size() && text[pos] == '"') {
          cell += '"';
          ++pos;
        } else {
          quoted = false;
        }
      } else {
        cell += c;
      }
    } else if (c == '"' && delimiter != '\t' && cell.empty()) {
      quoted = true;
    } else if (c == delimiter) {
      cells.push_back(std::move(cell));
      cell.clear();
    } else if (c == '\n') {
      break;
    } else if (c != '\r') {
      cell += c;
    }
  }
  cells.push_back(std::move(cell));
  return cells;
}

std::string encode_table(std::span<const hc::SessionResult> records, char delimiter) {
  std::vector<FlatRow> rows;
  rows.reserve(records.size());
  for (const auto& record : records) {
    rows.push_back(flatten_record(record));
  }
  const auto columns = collect_columns(rows);

  std::ostringstream out;
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) out << delimiter;
    out << encode_cell(columns[i], delimiter);
  }
  out << '\n';
  for (const auto& row : rows) {
    std::map<std::string, const std::string*> by_column;
    for (const auto& [column, value] : row) {
      by_column[column] = &value;
    }
    for (std::size_t i = 0; i < columns.size(); ++i) {
      if (i > 0) out << delimiter;
      const auto it = by_column.find(columns[i]);
      if (it != by_column.end()) out << encode_cell(*it->second, delimiter);
    }
    out << '\n';
  }
  return out.str();
}

std::expected<std::vector<hc::SessionResult>, hc::PipelineError> decode_table(
    const std::string& text, char delimiter) {
  std::vector<hc::SessionResult> records;
  std::size_t pos = 0;
  if (text.empty()) return records;
  const auto columns = parse_row(text, pos, delimiter);
  while (pos < text.size()) {
    const auto cells = parse_row(text, pos, delimiter);
    if (cells.size() == 1 && cells[0].empty()) continue;
    auto record = unflatten_record(columns, cells);
    if (!record) return std::unexpected(record.error());
    records.push_back(std::move(*record));
  }
  return records;
}

}  // namespace

std::expected<fs::path, hc::PipelineError> FileStorageBackend::save(
    std::span<const hc::SessionResult> records, const fs::path& base_path, OutputFormat format) {
  fs::path target = base_path;
  target += format_extension(format);
  fs::path temp = target;
  temp += ".tmp";

  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      spdlog::warn("Storage: cannot create {}: {}", target.parent_path().string(), ec.message());
      return std::unexpected(hc::PipelineError::StorageError);
    }
  }

  std::string payload;
  if (format == OutputFormat::Json) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& record : records) {
      array.push_back(record_to_json(record));
    }
    payload = array.dump(2);
  } else {
    payload = encode_table(records, delimiter_for(format));
  }

  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      spdlog::warn("Storage: cannot open {}", temp.string());
      return std::unexpected(hc::PipelineError::StorageError);
    }
    out << payload;
    out.flush();
    if (!out) {
      out.close();
      fs::remove(temp, ec);
      spdlog::warn("Storage: write to {} failed", temp.string());
      return std::unexpected(hc::PipelineError::StorageError);
    }
  }

  fs::rename(temp, target, ec);
  if (ec) {
    spdlog::warn("Storage: cannot move {} into place: {}", target.string(), ec.message());
    std::error_code ignored;
    fs::remove(temp, ignored);
    return std::unexpected(hc::PipelineError::StorageError);
  }
  return target;
}

std::expected<std::vector<hc::SessionResult>, hc::PipelineError> FileStorageBackend::load(
    const fs::path& path) {
  const auto format = format_from_path(path);
  if (!format) {
    return std::unexpected(hc::PipelineError::UnsupportedFormat);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(hc::PipelineError::StorageError);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  const std::string text = buffer.str();

  if (*format != OutputFormat::Json) {
    return decode_table(text, delimiter_for(*format));
  }

  const auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded() || !parsed.is_array()) {
    return std::unexpected(hc::PipelineError::StorageError);
  }
  std::vector<hc::SessionResult> records;
  records.reserve(parsed.size());
  for (const auto& item : parsed) {
    auto record = record_from_json(item);
    if (!record) return std::unexpected(record.error());
    records.push_back(std::move(*record));
  }
  return records;
}

}  // namespace healthcam::storage
