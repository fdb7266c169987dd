#include <healthcam/storage/file_storage_backend.hpp>
#include <gtest/gtest.h>
#include "support/sample_records.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace hc = healthcam::core;
namespace hs = healthcam::storage;
namespace ht = healthcam::test;
namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
  std::ifstream in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

}  // namespace

TEST(OutputFormat, NamesAndExtensions) {
  EXPECT_EQ(hs::parse_format("json"), hs::OutputFormat::Json);
  EXPECT_EQ(hs::parse_format("excel"), hs::OutputFormat::Spreadsheet);
  EXPECT_FALSE(hs::parse_format("xml").has_value());
  EXPECT_EQ(hs::format_extension(hs::OutputFormat::Csv), ".csv");
  EXPECT_EQ(hs::format_from_path("a/b.tsv"), hs::OutputFormat::Spreadsheet);
  EXPECT_FALSE(hs::format_from_path("a/b.txt").has_value());
}

TEST(FileStorageBackend, JsonBatchLoadsBack) {
  ht::ScratchDir dir;
  hs::FileStorageBackend storage;
  std::vector<hc::SessionResult> batch{ht::sample_record(1), ht::sample_record(2),
                                       ht::sample_record(3)};
  auto path = storage.save(batch, dir.path() / "nested" / "health_analysis_x",
                           hs::OutputFormat::Json);
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->extension().string(), ".json");
  EXPECT_TRUE(fs::exists(*path));
  EXPECT_FALSE(fs::exists(fs::path(path->string() + ".tmp")));

  auto loaded = storage.load(*path);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 3u);
  EXPECT_EQ((*loaded)[2].frame_id, 3u);
  EXPECT_EQ((*loaded)[0].indicators.notes.size(), 2u);
}

TEST(FileStorageBackend, CsvHasHeaderAndOneRowPerRecord) {
  ht::ScratchDir dir;
  hs::FileStorageBackend storage;
  std::vector<hc::SessionResult> batch{ht::sample_record(1), ht::sample_record(2)};
  auto path = storage.save(batch, dir.path() / "out", hs::OutputFormat::Csv);
  ASSERT_TRUE(path.has_value());

  const auto text = read_file(*path);
  EXPECT_EQ(text.rfind("timestamp,frame_id,session_id", 0), 0u);
  // Quoted cell with embedded quotes and comma.
  EXPECT_NE(text.find("\"Normal, \"\"even\"\" tone\""), std::string::npos);

  auto loaded = storage.load(*path);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 2u);
  EXPECT_EQ((*loaded)[1].frame_id, 2u);
  EXPECT_EQ((*loaded)[0].indicators.label("skin_tone_note").value_or(""), "Normal, \"even\" tone");
  EXPECT_EQ((*loaded)[0].recommendations.size(), 2u);
  EXPECT_EQ((*loaded)[0].measurements.vector("skin", "skin_tone")->size(), 3u);
}

TEST(FileStorageBackend, SpreadsheetIsTabSeparated) {
  ht::ScratchDir dir;
  hs::FileStorageBackend storage;
  std::vector<hc::SessionResult> batch{ht::sample_record(4)};
  auto path = storage.save(batch, dir.path() / "sheet", hs::OutputFormat::Spreadsheet);
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->extension().string(), ".tsv");
  const auto text = read_file(*path);
  EXPECT_EQ(text.rfind("timestamp\tframe_id\t", 0), 0u);

  auto loaded = storage.load(*path);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 1u);
  EXPECT_EQ((*loaded)[0].status, hc::HealthStatus::Good);
}

TEST(FileStorageBackend, UnwritableDirectoryIsStorageError) {
  ht::ScratchDir dir;
  // A regular file where a directory is needed.
  const auto blocker = dir.path() / "blocker";
  std::ofstream(blocker) << "x";
  hs::FileStorageBackend storage;
  std::vector<hc::SessionResult> batch{ht::sample_record(1)};
  auto path = storage.save(batch, blocker / "sub" / "out", hs::OutputFormat::Json);
  ASSERT_FALSE(path.has_value());
  EXPECT_EQ(path.error(), hc::PipelineError::StorageError);
}

TEST(FileStorageBackend, LoadRejectsUnknownExtension) {
  hs::FileStorageBackend storage;
  auto loaded = storage.load("results.xml");
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), hc::PipelineError::UnsupportedFormat);
}

TEST(FileStorageBackend, LoadRejectsMalformedJson) {
  ht::ScratchDir dir;
  const auto path = dir.path() / "broken.json";
  std::ofstream(path) << "{ not json";
  hs::FileStorageBackend storage;
  auto loaded = storage.load(path);
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), hc::PipelineError::StorageError);
}
