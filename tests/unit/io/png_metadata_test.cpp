#include <lolcommits/core/commit_metadata.hpp>
#include <lolcommits/core/composite_image.hpp>
#include <lolcommits/core/error.hpp>
#include <lolcommits/io/png_metadata.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <unistd.h>

namespace lc = lolcommits::core;
namespace li = lolcommits::io;
namespace fs = std::filesystem;

namespace {

lc::CompositeImage gradient(std::uint32_t w, std::uint32_t h) {
  lc::CompositeImage img(w, h);
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      std::uint8_t* p = img.pixel(x, y);
      p[0] = static_cast<std::uint8_t>(x * 7);
      p[1] = static_cast<std::uint8_t>(y * 13);
      p[2] = static_cast<std::uint8_t>(x + y);
    }
  }
  return img;
}

lc::CommitMetadata sample_commit() {
  lc::CommitMetadata c;
  c.repo_name = "my-repo";
  c.sha = "0123456789abcdef0123456789abcdef01234567";
  c.message = "feat(i18n): 日本語 support 🎉\n\nBody with ümlauts.";
  c.commit_type = "feat";
  c.scope = "i18n";
  c.timestamp = "2026-10-19 12:34:56";
  c.branch_name = "feature/i18n";
  c.author = "Zoë Dev <zoe@example.com>";
  c.stats = {3, 1500, 42};
  return c;
}

std::string value_of(const std::vector<std::pair<std::string, std::string>>& entries,
                     const std::string& key) {
  for (const auto& [k, v] : entries) {
    if (k == key) return v;
  }
  return "<missing>";
}

bool has_key(const std::vector<std::pair<std::string, std::string>>& entries, const std::string& key) {
  for (const auto& [k, v] : entries) {
    if (k == key) return true;
  }
  return false;
}

}  // namespace

TEST(PngMetadata, TextEntries) {
  auto entries = li::metadata_text_entries(sample_commit());
  ASSERT_FALSE(entries.empty());
  EXPECT_EQ(entries.front().first, "lolcommit:revision");
  EXPECT_EQ(value_of(entries, "lolcommit:type"), "feat");
  EXPECT_EQ(value_of(entries, "lolcommit:scope"), "i18n");
  EXPECT_EQ(value_of(entries, "lolcommit:insertions"), "1500");
  EXPECT_EQ(value_of(entries, "lolcommit:diff"), "3 files changed, 1500 insertions(+), 42 deletions(-)");
  for (const auto& [k, v] : entries) {
    EXPECT_EQ(k.rfind(li::kMetadataKeyPrefix, 0), 0u) << k;
  }
}

TEST(PngMetadata, EmptyScopeAndUnsetAuthorAreOmitted) {
  auto c = sample_commit();
  c.scope.clear();
  c.author.reset();
  auto entries = li::metadata_text_entries(c);
  EXPECT_FALSE(has_key(entries, "lolcommit:scope"));
  EXPECT_FALSE(has_key(entries, "lolcommit:author"));
  EXPECT_TRUE(has_key(entries, "lolcommit:revision"));
}

TEST(PngMetadata, RoundTripPixelsAndUnicodeMetadata) {
  const auto image = gradient(37, 21);
  const auto commit = sample_commit();

  auto artifact = li::encode_png_with_metadata(image, commit);
  ASSERT_TRUE(artifact.has_value());
  ASSERT_GT(artifact->png_bytes.size(), 8u);

  auto decoded = li::decode_png_artifact(artifact->png_bytes);
  ASSERT_TRUE(decoded.has_value());
  ASSERT_EQ(decoded->image.width(), 37u);
  ASSERT_EQ(decoded->image.height(), 21u);
  EXPECT_TRUE(std::equal(image.data().begin(), image.data().end(), decoded->image.data().begin()));

  EXPECT_EQ(decoded->text.at("lolcommit:message"), commit.message);
  auto restored = li::commit_metadata_from_text(decoded->text);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(*restored, commit);
}

TEST(PngMetadata, RoundTripWithoutOptionalFields) {
  auto commit = sample_commit();
  commit.scope.clear();
  commit.author.reset();
  commit.stats = {};

  auto artifact = li::encode_png_with_metadata(gradient(4, 4), commit);
  ASSERT_TRUE(artifact.has_value());
  auto decoded = li::decode_png_artifact(artifact->png_bytes);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->text.count("lolcommit:scope"), 0u);
  EXPECT_EQ(decoded->text.count("lolcommit:author"), 0u);
  auto restored = li::commit_metadata_from_text(decoded->text);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(*restored, commit);
}

TEST(PngMetadata, EmptyRecordRoundTrips) {
  const lc::CommitMetadata empty{};

  auto artifact = li::encode_png_with_metadata(gradient(4, 3), empty);
  ASSERT_TRUE(artifact.has_value());
  auto decoded = li::decode_png_artifact(artifact->png_bytes);
  ASSERT_TRUE(decoded.has_value());
  auto restored = li::commit_metadata_from_text(decoded->text);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(*restored, empty);
}

TEST(PngMetadata, SingleEmptyCommitKeyIsARecord) {
  const std::map<std::string, std::string> text{{"lolcommit:repo", ""}};
  auto restored = li::commit_metadata_from_text(text);
  ASSERT_TRUE(restored.has_value());
  EXPECT_TRUE(restored->repo_name.empty());
  EXPECT_FALSE(restored->author.has_value());
}

TEST(PngMetadata, InvalidUtf8IsMetadataEncodingError) {
  auto commit = sample_commit();
  commit.message = "broken \xC3\x28 bytes";
  auto artifact = li::encode_png_with_metadata(gradient(4, 4), commit);
  ASSERT_FALSE(artifact.has_value());
  EXPECT_EQ(artifact.error(), lc::PipelineError::MetadataEncodingError);
}

TEST(PngMetadata, EmbeddedNulIsMetadataEncodingError) {
  auto commit = sample_commit();
  commit.branch_name = std::string("main\0evil", 9);
  auto artifact = li::encode_png_with_metadata(gradient(4, 4), commit);
  ASSERT_FALSE(artifact.has_value());
  EXPECT_EQ(artifact.error(), lc::PipelineError::MetadataEncodingError);
}

TEST(PngMetadata, EmptyImageIsInvalidFrame) {
  auto artifact = li::encode_png_with_metadata(lc::CompositeImage(), sample_commit());
  ASSERT_FALSE(artifact.has_value());
  EXPECT_EQ(artifact.error(), lc::PipelineError::InvalidFrame);
}

TEST(PngMetadata, GarbageIsArtifactDecodeError) {
  const std::vector<std::uint8_t> garbage{'n', 'o', 't', ' ', 'a', ' ', 'p', 'n', 'g', '!'};
  auto decoded = li::decode_png_artifact(garbage);
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error(), lc::PipelineError::ArtifactDecodeError);
}

TEST(PngMetadata, TruncatedIsArtifactDecodeError) {
  auto artifact = li::encode_png_with_metadata(gradient(16, 16), sample_commit());
  ASSERT_TRUE(artifact.has_value());
  std::vector<std::uint8_t> cut(artifact->png_bytes.begin(),
                                artifact->png_bytes.begin() + artifact->png_bytes.size() / 2);
  auto decoded = li::decode_png_artifact(cut);
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error(), lc::PipelineError::ArtifactDecodeError);
}

TEST(PngMetadata, TextWithoutCommitFieldsIsNullopt) {
  std::map<std::string, std::string> text{{"Software", "something"}};
  EXPECT_FALSE(li::commit_metadata_from_text(text).has_value());
}

TEST(PngMetadata, ParseImageFileName) {
  auto c = li::parse_image_filename("/images/my-cool-repo-20261019-083015-abc1234.png");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->repo_name, "my-cool-repo");
  EXPECT_EQ(c->sha, "abc1234");
  EXPECT_EQ(c->timestamp, "2026-10-19 08:30:15");

  EXPECT_FALSE(li::parse_image_filename("random.png").has_value());
  EXPECT_FALSE(li::parse_image_filename("repo-2026-083015-abc.png").has_value());
  EXPECT_FALSE(li::parse_image_filename("repo-20261019-083015-abc.jpg").has_value());
}

TEST(PngMetadata, LoadCommitMetadataFromFile) {
  const fs::path dir = fs::temp_directory_path() / ("lolcommits_png_" + std::to_string(::getpid()));
  fs::create_directories(dir);
  const fs::path with_meta = dir / "my-repo-20261019-123456-0123456.png";
  const fs::path no_meta = dir / "other-20250101-000000-deadbee.png";

  auto artifact = li::encode_png_with_metadata(gradient(8, 8), sample_commit());
  ASSERT_TRUE(artifact.has_value());
  {
    std::ofstream out(with_meta, std::ios::binary);
    out.write(reinterpret_cast<const char*>(artifact->png_bytes.data()),
              static_cast<std::streamsize>(artifact->png_bytes.size()));
    std::ofstream junk(no_meta, std::ios::binary);
    junk << "not a png";
  }

  auto embedded = li::load_commit_metadata(with_meta);
  ASSERT_TRUE(embedded.has_value());
  EXPECT_EQ(embedded->message, sample_commit().message);
  EXPECT_EQ(embedded->author, sample_commit().author);

  auto read = li::read_png_metadata(no_meta);
  ASSERT_FALSE(read.has_value());
  EXPECT_EQ(read.error(), lc::PipelineError::ArtifactDecodeError);

  auto fallback = li::load_commit_metadata(no_meta);
  ASSERT_TRUE(fallback.has_value());
  EXPECT_EQ(fallback->repo_name, "other");
  EXPECT_EQ(fallback->sha, "deadbee");
  EXPECT_EQ(fallback->timestamp, "2025-01-01 00:00:00");

  fs::remove_all(dir);
}
