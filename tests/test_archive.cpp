#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <kdm/kdm.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class ArchiveTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "kdm_test_archive";
    fs::remove_all(tempDir_);
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path writeTestFile(const fs::path &path, const std::vector<uint8_t> &content) {
    fs::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char *>(content.data()), content.size());
    return path;
  }

  static std::vector<uint8_t> readTestFile(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
  }

  static kdm::Payload makePayload(const std::string &name, std::vector<uint8_t> data,
                                  uint32_t flags = 0) {
    kdm::Payload payload;
    payload.name = name;
    payload.flags = flags;
    payload.data = std::move(data);
    return payload;
  }

  struct Pair {
    std::vector<uint8_t> info;
    std::vector<uint8_t> data;
  };

  // A well-formed info/data pair laid out with the given alignment
  static Pair makeArchive(const std::vector<kdm::Payload> &payloads, uint32_t alignment) {
    auto block = kdm::DataBlockCodec::writeAll(payloads, alignment);
    EXPECT_TRUE(block.has_value());
    auto info = kdm::InfoCodec::serialize(block->table);
    EXPECT_TRUE(info.has_value());
    return {*info, block->bytes};
  }

  static std::vector<kdm::Payload> samplePayloads() {
    return {makePayload("tex_title", {0x11, 0x22, 0x33, 0x44, 0x55}, 0),
            makePayload("tex_font", {0x01, 0x02, 0x03}, 1),
            makePayload("tex_empty", {}, 0),
            makePayload("tex_logo", std::vector<uint8_t>(40, 0x7F), 2)};
  }

  fs::path tempDir_;
};

// One entry {a, 0, 4, 0} over data 01 02 03 04
TEST_F(ArchiveTest, MinimalArchive) {
  std::vector<uint8_t> info = {
      0x01, 0x00, 0x00, 0x00,                         // entry count
      0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, // name 0, offset 0
      0x00, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00, // flags 0, size 4
      'a',  0x00,
  };
  std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};

  fs::path manifestPath = tempDir_ / "EUR_en_tex.json";
  kdm::Error error;
  auto manifest = kdm::ArchiveExtractor::extract(info, data, manifestPath, {}, &error);
  ASSERT_TRUE(manifest.has_value()) << error.describe();

  ASSERT_EQ(manifest->entries.size(), 1);
  EXPECT_EQ(manifest->entries[0].name, "a");
  EXPECT_EQ(manifest->entries[0].size, 4u);
  EXPECT_EQ(manifest->entries[0].flags, 0);
  EXPECT_EQ(manifest->alignment, 1);
  EXPECT_EQ(readTestFile(tempDir_ / "EUR_en_tex" / "a"), data);

  auto loaded = kdm::ManifestBridge::load(manifestPath, &error);
  ASSERT_TRUE(loaded.has_value()) << error.describe();
  loaded->alignment = 1;

  auto built = kdm::ArchiveBuilder::rebuild(*loaded, &error);
  ASSERT_TRUE(built.has_value()) << error.describe();
  EXPECT_EQ(built->data, data);
  EXPECT_EQ(built->info, info);
}

TEST_F(ArchiveTest, RoundTripPacked) {
  auto source = makeArchive(samplePayloads(), 1);

  fs::path manifestPath = tempDir_ / "EUR_en_tex.json";
  kdm::Error error;
  ASSERT_TRUE(
      kdm::ArchiveExtractor::extract(source.info, source.data, manifestPath, {}, &error))
      << error.describe();

  auto manifest = kdm::ManifestBridge::load(manifestPath, &error);
  ASSERT_TRUE(manifest.has_value()) << error.describe();

  auto built = kdm::ArchiveBuilder::rebuild(*manifest, &error);
  ASSERT_TRUE(built.has_value()) << error.describe();
  EXPECT_EQ(built->info, source.info);
  EXPECT_EQ(built->data, source.data);
}

TEST_F(ArchiveTest, RoundTripPadded) {
  auto source = makeArchive(samplePayloads(), 32);

  fs::path manifestPath = tempDir_ / "EUR_de_tex.json";
  kdm::Error error;
  auto extracted =
      kdm::ArchiveExtractor::extract(source.info, source.data, manifestPath, {}, &error);
  ASSERT_TRUE(extracted.has_value()) << error.describe();
  EXPECT_EQ(extracted->alignment, 32);

  auto manifest = kdm::ManifestBridge::load(manifestPath, &error);
  ASSERT_TRUE(manifest.has_value()) << error.describe();
  EXPECT_EQ(manifest->alignment, 32);

  auto built = kdm::ArchiveBuilder::rebuild(*manifest, &error);
  ASSERT_TRUE(built.has_value()) << error.describe();
  EXPECT_EQ(built->info, source.info);
  EXPECT_EQ(built->data, source.data);
}

// Aligned entry starts, but no padding after the last payload
TEST_F(ArchiveTest, RoundTripUnpaddedTail) {
  std::vector<kdm::Entry> entries = {{"a", 0, 3, 0}, {"b", 4, 3, 6}};
  auto info = kdm::InfoCodec::serialize(kdm::EntryTable(entries));
  ASSERT_TRUE(info.has_value());
  std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x00, 0x04, 0x05, 0x06};

  fs::path manifestPath = tempDir_ / "EUR_it_tex.json";
  kdm::Error error;
  auto extracted = kdm::ArchiveExtractor::extract(*info, data, manifestPath, {}, &error);
  ASSERT_TRUE(extracted.has_value()) << error.describe();
  EXPECT_FALSE(extracted->padTail);

  auto manifest = kdm::ManifestBridge::load(manifestPath, &error);
  ASSERT_TRUE(manifest.has_value()) << error.describe();
  EXPECT_FALSE(manifest->padTail);

  auto built = kdm::ArchiveBuilder::rebuild(*manifest, &error);
  ASSERT_TRUE(built.has_value()) << error.describe();
  EXPECT_EQ(built->data, data);
  EXPECT_EQ(built->info, *info);
}

TEST_F(ArchiveTest, ManifestKeepsTableOrder) {
  auto source = makeArchive({makePayload("zeta", {1}), makePayload("alpha", {2}),
                               makePayload("mu", {3})},
                              1);

  kdm::Error error;
  auto manifest = kdm::ArchiveExtractor::extract(source.info, source.data,
                                                 tempDir_ / "order_tex.json", {}, &error);
  ASSERT_TRUE(manifest.has_value()) << error.describe();
  ASSERT_EQ(manifest->entries.size(), 3);
  EXPECT_EQ(manifest->entries[0].name, "zeta");
  EXPECT_EQ(manifest->entries[1].name, "alpha");
  EXPECT_EQ(manifest->entries[2].name, "mu");
}

// Two payloads of 3 bytes with alignment 4 give an 8-byte data file
TEST_F(ArchiveTest, AlignmentPadding) {
  fs::path dir = tempDir_ / "pad_tex";
  writeTestFile(dir / "one", {0xA1, 0xA2, 0xA3});
  writeTestFile(dir / "two", {0xB1, 0xB2, 0xB3});

  kdm::Manifest manifest;
  manifest.alignment = 4;
  manifest.payloadDirectory = dir;
  manifest.entries = {{"one", 3u, 0}, {"two", std::nullopt, 0}};

  kdm::Error error;
  auto built = kdm::ArchiveBuilder::rebuild(manifest, &error);
  ASSERT_TRUE(built.has_value()) << error.describe();

  EXPECT_EQ(built->data, std::vector<uint8_t>({0xA1, 0xA2, 0xA3, 0x00, 0xB1, 0xB2, 0xB3, 0x00}));
  EXPECT_EQ(built->table[1].offset, 4);

  auto reparsed = kdm::InfoCodec::parse(built->info, &error);
  ASSERT_TRUE(reparsed.has_value()) << error.describe();
  EXPECT_EQ(*reparsed, built->table);
}

TEST_F(ArchiveTest, NameCollisionWritesNothing) {
  fs::path manifestPath = tempDir_ / "dup_tex.json";
  writeTestFile(tempDir_ / "dup_tex" / "x", {1, 2});

  kdm::Manifest manifest;
  manifest.payloadDirectory = tempDir_ / "dup_tex";
  manifest.entries = {{"x", 2u, 0}, {"x", 2u, 1}};
  kdm::Error error;
  ASSERT_TRUE(kdm::ManifestBridge::save(manifest, manifestPath, &error)) << error.describe();

  fs::path dataPath = tempDir_ / "dup.bin";
  fs::path infoPath = tempDir_ / "dup_info.bin";
  EXPECT_FALSE(kdm::ArchiveBuilder::rebuildFiles(manifestPath, dataPath, infoPath, {}, &error));
  EXPECT_EQ(error.code, kdm::ErrorCode::MalformedTable);
  EXPECT_NE(error.message.find("'x'"), std::string::npos) << error.message;
  EXPECT_FALSE(fs::exists(dataPath));
  EXPECT_FALSE(fs::exists(infoPath));
}

TEST_F(ArchiveTest, MissingPayloadWritesNothing) {
  fs::path manifestPath = tempDir_ / "miss_tex.json";
  writeTestFile(tempDir_ / "miss_tex" / "here.bcrez", {1});

  kdm::Manifest manifest;
  manifest.payloadDirectory = tempDir_ / "miss_tex";
  manifest.payloadExtension = ".bcrez";
  manifest.entries = {{"here", 1u, 0}, {"gone", 1u, 0}};
  kdm::Error error;
  ASSERT_TRUE(kdm::ManifestBridge::save(manifest, manifestPath, &error)) << error.describe();

  fs::path dataPath = tempDir_ / "miss.bin";
  fs::path infoPath = tempDir_ / "miss_info.bin";
  EXPECT_FALSE(kdm::ArchiveBuilder::rebuildFiles(manifestPath, dataPath, infoPath, {}, &error));
  EXPECT_EQ(error.code, kdm::ErrorCode::MissingPayloadFile);
  EXPECT_NE(error.message.find("gone"), std::string::npos) << error.message;
  EXPECT_FALSE(fs::exists(dataPath));
  EXPECT_FALSE(fs::exists(infoPath));
}

TEST_F(ArchiveTest, TruncatedInfoWritesNothing) {
  auto source = makeArchive(samplePayloads(), 1);
  source.info.resize(20);

  fs::path manifestPath = tempDir_ / "trunc_tex.json";
  kdm::Error error;
  EXPECT_FALSE(
      kdm::ArchiveExtractor::extract(source.info, source.data, manifestPath, {}, &error));
  EXPECT_EQ(error.code, kdm::ErrorCode::TruncatedInfo);
  EXPECT_FALSE(fs::exists(manifestPath));
  EXPECT_FALSE(fs::exists(tempDir_ / "trunc_tex"));
}

TEST_F(ArchiveTest, ExtentBeyondDataFile) {
  auto source = makeArchive(samplePayloads(), 1);
  source.data.pop_back();

  kdm::Error error;
  EXPECT_FALSE(kdm::ArchiveExtractor::extract(source.info, source.data,
                                              tempDir_ / "short_tex.json", {}, &error));
  EXPECT_EQ(error.code, kdm::ErrorCode::MalformedTable);
  EXPECT_NE(error.message.find("tex_logo"), std::string::npos) << error.message;
}

// Files with gaps still extract; rebuild packs them at the default alignment
TEST_F(ArchiveTest, IrregularLayoutExtracts) {
  std::vector<kdm::Entry> entries = {{"a", 0, 2, 0}, {"b", 5, 2, 0}};
  auto info = kdm::InfoCodec::serialize(kdm::EntryTable(entries));
  ASSERT_TRUE(info.has_value());
  std::vector<uint8_t> data = {1, 2, 0xEE, 0xEE, 0xEE, 3, 4};

  kdm::Error error;
  auto manifest =
      kdm::ArchiveExtractor::extract(*info, data, tempDir_ / "gap_tex.json", {}, &error);
  ASSERT_TRUE(manifest.has_value()) << error.describe();
  EXPECT_EQ(manifest->alignment, kdm::kDefaultAlignment);

  auto built = kdm::ArchiveBuilder::rebuild(*manifest, &error);
  ASSERT_TRUE(built.has_value()) << error.describe();
  EXPECT_EQ(built->data, std::vector<uint8_t>({1, 2, 3, 4}));
}

TEST_F(ArchiveTest, RefusesNonEmptyOutput) {
  auto source = makeArchive(samplePayloads(), 1);
  fs::path manifestPath = tempDir_ / "EUR_en_tex.json";
  fs::path stale = writeTestFile(tempDir_ / "EUR_en_tex" / "stale.bcrez", {9});

  kdm::Error error;
  EXPECT_FALSE(
      kdm::ArchiveExtractor::extract(source.info, source.data, manifestPath, {}, &error));
  EXPECT_EQ(error.code, kdm::ErrorCode::OutputNotEmpty);
  EXPECT_TRUE(fs::exists(stale));

  kdm::ExtractOptions options;
  options.overwrite = true;
  ASSERT_TRUE(
      kdm::ArchiveExtractor::extract(source.info, source.data, manifestPath, options, &error))
      << error.describe();
  EXPECT_FALSE(fs::exists(stale));
  EXPECT_TRUE(fs::exists(tempDir_ / "EUR_en_tex" / "tex_title"));
}

// Remove, reorder and resize entries, then rebuild
TEST_F(ArchiveTest, RebuildEditedManifest) {
  auto source = makeArchive(samplePayloads(), 4);
  fs::path manifestPath = tempDir_ / "EUR_en_tex.json";

  kdm::ExtractOptions options;
  options.payloadExtension = ".bcrez";

  kdm::Error error;
  auto manifest =
      kdm::ArchiveExtractor::extract(source.info, source.data, manifestPath, options, &error);
  ASSERT_TRUE(manifest.has_value()) << error.describe();
  EXPECT_EQ(manifest->alignment, 4);

  // Drop tex_empty, move tex_logo first, grow tex_font and add a new entry
  std::vector<kdm::ManifestEntry> edited = {manifest->entries[3], manifest->entries[1],
                                            manifest->entries[0], {"tex_new", std::nullopt, 5}};
  edited[1].size = std::nullopt;
  manifest->entries = edited;
  writeTestFile(manifest->payloadDirectory / "tex_font.bcrez", {1, 2, 3, 4, 5, 6});
  writeTestFile(manifest->payloadDirectory / "tex_new.bcrez", {0xCC});
  ASSERT_TRUE(kdm::ManifestBridge::save(*manifest, manifestPath, &error)) << error.describe();

  fs::path dataPath = tempDir_ / "EUR_en.bin";
  fs::path infoPath = tempDir_ / "EUR_en_info.bin";
  ASSERT_TRUE(kdm::ArchiveBuilder::rebuildFiles(manifestPath, dataPath, infoPath, {}, &error))
      << error.describe();

  auto table = kdm::InfoCodec::parse(readTestFile(infoPath), &error);
  ASSERT_TRUE(table.has_value()) << error.describe();
  auto data = readTestFile(dataPath);
  ASSERT_TRUE(table->validate(data.size(), &error)) << error.describe();

  ASSERT_EQ(table->size(), 4);
  EXPECT_EQ((*table)[0], (kdm::Entry{"tex_logo", 0, 40, 2}));
  EXPECT_EQ((*table)[1], (kdm::Entry{"tex_font", 40, 6, 1}));
  EXPECT_EQ((*table)[2], (kdm::Entry{"tex_title", 48, 5, 0}));
  EXPECT_EQ((*table)[3], (kdm::Entry{"tex_new", 56, 1, 5}));
  EXPECT_EQ(data.size(), 60);

  auto payloads = kdm::DataBlockCodec::readAll(data, *table, &error);
  ASSERT_TRUE(payloads.has_value()) << error.describe();
  auto font = payloads->at("tex_font");
  EXPECT_EQ(std::vector<uint8_t>(font.begin(), font.end()),
            std::vector<uint8_t>({1, 2, 3, 4, 5, 6}));
}

// A failed write leaves the previous pair untouched and no staging files behind
TEST_F(ArchiveTest, RebuildFilesKeepsOldPairOnWriteFailure) {
  auto source = makeArchive(samplePayloads(), 1);
  fs::path manifestPath = tempDir_ / "EUR_en_tex.json";

  kdm::Error error;
  ASSERT_TRUE(kdm::ArchiveExtractor::extract(source.info, source.data, manifestPath, {}, &error))
      << error.describe();

  fs::path dataPath = writeTestFile(tempDir_ / "out" / "EUR_en.bin", {0xDE, 0xAD});
  fs::path infoPath = writeTestFile(tempDir_ / "out" / "EUR_en_info.bin", {0xBE, 0xEF});

  // Occupy the info file's staging name so it cannot be created
  fs::path blocker = infoPath;
  blocker += ".partial";
  writeTestFile(blocker / "keep", {0});

  EXPECT_FALSE(kdm::ArchiveBuilder::rebuildFiles(manifestPath, dataPath, infoPath, {}, &error));
  EXPECT_EQ(error.code, kdm::ErrorCode::IoError);

  EXPECT_EQ(readTestFile(dataPath), std::vector<uint8_t>({0xDE, 0xAD}));
  EXPECT_EQ(readTestFile(infoPath), std::vector<uint8_t>({0xBE, 0xEF}));

  fs::path stagedData = dataPath;
  stagedData += ".partial";
  EXPECT_FALSE(fs::exists(stagedData));
  EXPECT_TRUE(fs::exists(blocker / "keep"));

  // Once the path is free the rebuild replaces both files
  fs::remove_all(blocker);
  ASSERT_TRUE(kdm::ArchiveBuilder::rebuildFiles(manifestPath, dataPath, infoPath, {}, &error))
      << error.describe();
  EXPECT_EQ(readTestFile(dataPath), source.data);
  EXPECT_EQ(readTestFile(infoPath), source.info);
  EXPECT_FALSE(fs::exists(blocker));
}

TEST_F(ArchiveTest, RebuildAlignmentOverride) {
  auto source = makeArchive(samplePayloads(), 1);
  fs::path manifestPath = tempDir_ / "EUR_en_tex.json";

  kdm::Error error;
  ASSERT_TRUE(
      kdm::ArchiveExtractor::extract(source.info, source.data, manifestPath, {}, &error))
      << error.describe();

  kdm::RebuildOptions options;
  options.alignment = 16;
  fs::path dataPath = tempDir_ / "out" / "EUR_en.bin";
  fs::path infoPath = tempDir_ / "out" / "EUR_en_info.bin";
  ASSERT_TRUE(
      kdm::ArchiveBuilder::rebuildFiles(manifestPath, dataPath, infoPath, options, &error))
      << error.describe();

  auto table = kdm::InfoCodec::parse(readTestFile(infoPath), &error);
  ASSERT_TRUE(table.has_value()) << error.describe();
  for (const auto &entry : *table) {
    EXPECT_EQ(entry.offset % 16, 0) << entry.name;
  }
  EXPECT_EQ(readTestFile(dataPath).size() % 16, 0);
}

TEST_F(ArchiveTest, ExtractFilesThenRebuildFiles) {
  auto source = makeArchive(samplePayloads(), 8);
  fs::path dataPath = writeTestFile(tempDir_ / "game" / "EUR_en.bin", source.data);
  writeTestFile(tempDir_ / "game" / "EUR_en_info.bin", source.info);

  fs::path manifestPath = kdm::paths::defaultManifestPath(dataPath);
  kdm::ExtractOptions options;
  options.payloadExtension = ".bcrez";

  kdm::Error error;
  auto manifest = kdm::ArchiveExtractor::extractFiles(dataPath, manifestPath, options, &error);
  ASSERT_TRUE(manifest.has_value()) << error.describe();
  EXPECT_TRUE(fs::exists(tempDir_ / "game" / "EUR_en_tex" / "tex_logo.bcrez"));

  fs::path rebuiltData = tempDir_ / "rebuilt" / "EUR_en.bin";
  fs::path rebuiltInfo = kdm::paths::companionInfoPath(rebuiltData);
  ASSERT_TRUE(
      kdm::ArchiveBuilder::rebuildFiles(manifestPath, rebuiltData, rebuiltInfo, {}, &error))
      << error.describe();

  EXPECT_EQ(readTestFile(rebuiltData), source.data);
  EXPECT_EQ(readTestFile(rebuiltInfo), source.info);
}

TEST_F(ArchiveTest, ExtractFilesMissingInfo) {
  fs::path dataPath = writeTestFile(tempDir_ / "lonely.bin", {1, 2, 3});

  kdm::Error error;
  EXPECT_FALSE(kdm::ArchiveExtractor::extractFiles(dataPath, tempDir_ / "lonely_tex.json", {},
                                                   &error));
  EXPECT_EQ(error.code, kdm::ErrorCode::IoError);
  EXPECT_NE(error.message.find("lonely_info.bin"), std::string::npos) << error.message;
}

TEST_F(ArchiveTest, OpenAndLookup) {
  auto source = makeArchive(samplePayloads(), 1);
  fs::path dataPath = writeTestFile(tempDir_ / "EUR_en.bin", source.data);
  writeTestFile(tempDir_ / "EUR_en_info.bin", source.info);

  kdm::Error error;
  auto archive = kdm::Archive::open(dataPath, &error);
  ASSERT_TRUE(archive.has_value()) << error.describe();
  EXPECT_TRUE(archive->isOpen());
  EXPECT_EQ(archive->entryCount(), 4);

  const auto *font = archive->lookup("tex_font", &error);
  ASSERT_NE(font, nullptr) << error.describe();
  EXPECT_EQ(font->flags, 1);

  auto view = archive->payload(*font);
  EXPECT_EQ(std::vector<uint8_t>(view.begin(), view.end()), std::vector<uint8_t>({1, 2, 3}));

  auto copy = archive->payloadCopy(*font, &error);
  ASSERT_TRUE(copy.has_value()) << error.describe();
  EXPECT_EQ(*copy, std::vector<uint8_t>({1, 2, 3}));

  EXPECT_EQ(archive->lookup("tex_missing", &error), nullptr);
  EXPECT_EQ(error.code, kdm::ErrorCode::NotFound);

  kdm::Entry bogus{"bogus", 0, 1000, 0};
  EXPECT_TRUE(archive->payload(bogus).empty());
  EXPECT_FALSE(archive->payloadCopy(bogus, &error).has_value());
  EXPECT_EQ(error.code, kdm::ErrorCode::OutOfBounds);

  archive->close();
  EXPECT_FALSE(archive->isOpen());
  EXPECT_EQ(archive->entryCount(), 0);
}

TEST_F(ArchiveTest, OpenEmptyArchive) {
  auto source = makeArchive({}, 1);
  fs::path dataPath = writeTestFile(tempDir_ / "EUR_xx.bin", source.data);
  writeTestFile(tempDir_ / "EUR_xx_info.bin", source.info);

  kdm::Error error;
  auto archive = kdm::Archive::open(dataPath, &error);
  ASSERT_TRUE(archive.has_value()) << error.describe();
  EXPECT_EQ(archive->entryCount(), 0);
}

TEST_F(ArchiveTest, MoveSemantics) {
  auto source = makeArchive(samplePayloads(), 1);
  fs::path dataPath = writeTestFile(tempDir_ / "EUR_en.bin", source.data);
  writeTestFile(tempDir_ / "EUR_en_info.bin", source.info);

  auto opened = kdm::Archive::open(dataPath);
  ASSERT_TRUE(opened.has_value());

  kdm::Archive a = std::move(*opened);
  EXPECT_TRUE(a.isOpen());

  std::vector<kdm::Archive> archives;
  archives.push_back(std::move(a));
  EXPECT_TRUE(archives.front().isOpen());
  EXPECT_EQ(archives.front().entryCount(), 4);
}
