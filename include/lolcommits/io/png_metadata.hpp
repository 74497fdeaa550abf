#pragma once

#include <lolcommits/core/commit_metadata.hpp>
#include <lolcommits/core/composite_image.hpp>
#include <lolcommits/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lolcommits::io {

/// Keyword prefix of every text chunk written for a lolcommit.
inline constexpr std::string_view kMetadataKeyPrefix = "lolcommit:";

/// (keyword, UTF-8 value) pairs in chunk order. scope is omitted when empty,
/// author when unset.
[[nodiscard]] std::vector<std::pair<std::string, std::string>> metadata_text_entries(
    const lolcommits::core::CommitMetadata& commit);

/// Encodes an RGBA8 PNG with one uncompressed iTXt chunk per metadata entry.
/// MetadataEncodingError when a value is not valid UTF-8 or contains NUL, or libpng fails.
[[nodiscard]] std::expected<lolcommits::core::OutputArtifact, lolcommits::core::PipelineError>
encode_png_with_metadata(const lolcommits::core::CompositeImage& image,
                         const lolcommits::core::CommitMetadata& commit);

/// Decoded PNG: pixels expanded to RGBA8 plus all text chunks (UTF-8; iTXt wins
/// over tEXt/zTXt for the same keyword).
struct DecodedArtifact {
  lolcommits::core::CompositeImage image;
  std::map<std::string, std::string> text;
};

/// ArtifactDecodeError for anything libpng rejects (bad signature, truncation, CRC).
[[nodiscard]] std::expected<DecodedArtifact, lolcommits::core::PipelineError>
decode_png_artifact(std::span<const std::uint8_t> png_bytes);

/// Rebuilds the commit record from text chunks. nullopt when none of
/// revision / message / type is present.
[[nodiscard]] std::optional<lolcommits::core::CommitMetadata> commit_metadata_from_text(
    const std::map<std::string, std::string>& text);

/// Reads a PNG from disk and extracts its commit record (nullopt: no metadata).
[[nodiscard]] std::expected<std::optional<lolcommits::core::CommitMetadata>,
                            lolcommits::core::PipelineError>
read_png_metadata(const std::filesystem::path& path);

/// Fallback for images without metadata: "{repo}-{YYYYmmdd-HHMMSS}-{sha}.png".
/// Recovers repo_name, timestamp ("%Y-%m-%d %H:%M:%S") and sha.
[[nodiscard]] std::optional<lolcommits::core::CommitMetadata> parse_image_filename(
    const std::filesystem::path& path);

/// Embedded metadata if present, else parse_image_filename.
[[nodiscard]] std::optional<lolcommits::core::CommitMetadata> load_commit_metadata(
    const std::filesystem::path& path);

}  // namespace lolcommits::io
