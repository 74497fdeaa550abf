#include <lolcommits/io/png_metadata.hpp>
#include <lolcommits/core/utf8.hpp>
#include <png.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <csetjmp>
#include <cstring>
#include <fstream>
#include <iterator>
#include <new>

namespace lolcommits::io {

namespace {

namespace lc = lolcommits::core;

// libpng reports errors through longjmp; only trivially destructible locals may
// live in the functions that call setjmp.

void on_png_error(png_structp png, png_const_charp message) {
  spdlog::error("libpng: {}", message);
  png_longjmp(png, 1);
}

void on_png_warning(png_structp, png_const_charp message) {
  spdlog::debug("libpng warning: {}", message);
}

void write_to_vector(png_structp png, png_bytep data, png_size_t length) {
  auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
  bool out_of_memory = false;
  try {
    out->insert(out->end(), data, data + length);
  } catch (const std::bad_alloc&) {
    out_of_memory = true;
  }
  // png_error longjmps; never from inside the handler.
  if (out_of_memory) png_error(png, "out of memory");
}

void flush_noop(png_structp) {}

struct ReadCursor {
  const std::uint8_t* data;
  std::size_t size;
  std::size_t offset;
};

void read_from_cursor(png_structp png, png_bytep out, png_size_t length) {
  auto* cursor = static_cast<ReadCursor*>(png_get_io_ptr(png));
  if (length > cursor->size - cursor->offset) {
    png_error(png, "unexpected end of data");
  }
  std::memcpy(out, cursor->data + cursor->offset, length);
  cursor->offset += length;
}

bool write_png(std::uint32_t width,
               std::uint32_t height,
               png_bytep* rows,
               png_text* texts,
               int num_texts,
               std::vector<std::uint8_t>* out) {
  png_structp png =
      png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, on_png_error, on_png_warning);
  if (!png) return false;
  png_infop info = png_create_info_struct(png);
  if (!info) {
    png_destroy_write_struct(&png, nullptr);
    return false;
  }
  if (setjmp(png_jmpbuf(png))) {
    png_destroy_write_struct(&png, &info);
    return false;
  }

  png_set_write_fn(png, out, write_to_vector, flush_noop);
  png_set_IHDR(png, info, width, height, 8, PNG_COLOR_TYPE_RGB_ALPHA, PNG_INTERLACE_NONE,
               PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
  png_set_text(png, info, texts, num_texts);
  png_write_info(png, info);
  png_write_image(png, rows);
  png_write_end(png, info);
  png_destroy_write_struct(&png, &info);
  return true;
}

struct RawText {
  std::string key;
  std::string value;
  bool international;
};

/// Reads header, pixels (as RGBA8 into pixels) and all text chunks.
bool read_png(ReadCursor* cursor,
              std::uint32_t* width,
              std::uint32_t* height,
              std::vector<std::uint8_t>* pixels,
              std::vector<png_bytep>* rows,
              std::vector<RawText>* texts) {
  png_structp png =
      png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, on_png_error, on_png_warning);
  if (!png) return false;
  png_infop info = png_create_info_struct(png);
  png_infop end_info = info ? png_create_info_struct(png) : nullptr;
  if (!info || !end_info) {
    png_destroy_read_struct(&png, info ? &info : nullptr, nullptr);
    return false;
  }
  if (setjmp(png_jmpbuf(png))) {
    png_destroy_read_struct(&png, &info, &end_info);
    return false;
  }

  png_set_read_fn(png, cursor, read_from_cursor);
  png_read_info(png, info);

  *width = png_get_image_width(png, info);
  *height = png_get_image_height(png, info);
  const png_byte color_type = png_get_color_type(png, info);

  png_set_expand(png);
  png_set_strip_16(png);
  if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
    png_set_gray_to_rgb(png);
  }
  if ((color_type & PNG_COLOR_MASK_ALPHA) == 0 && !png_get_valid(png, info, PNG_INFO_tRNS)) {
    png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
  }
  png_set_interlace_handling(png);
  png_read_update_info(png, info);

  const std::size_t row_bytes = png_get_rowbytes(png, info);
  if (row_bytes != static_cast<std::size_t>(*width) * lc::CompositeImage::kChannels) {
    png_error(png, "unexpected row size after expansion");
  }
  pixels->resize(row_bytes * *height);
  rows->resize(*height);
  for (std::uint32_t y = 0; y < *height; ++y) {
    (*rows)[y] = pixels->data() + static_cast<std::size_t>(y) * row_bytes;
  }
  png_read_image(png, rows->data());
  png_read_end(png, end_info);

  for (png_infop source : {info, end_info}) {
    png_textp text = nullptr;
    int count = 0;
    png_get_text(png, source, &text, &count);
    for (int i = 0; i < count; ++i) {
      const bool itxt = text[i].compression == PNG_ITXT_COMPRESSION_NONE ||
                        text[i].compression == PNG_ITXT_COMPRESSION_zTXt;
      const std::size_t length = itxt ? text[i].itxt_length : text[i].text_length;
      texts->push_back(RawText{text[i].key,
                               text[i].text ? std::string(text[i].text, length) : std::string(),
                               itxt});
    }
  }

  png_destroy_read_struct(&png, &info, &end_info);
  return true;
}

std::string latin1_to_utf8(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back(static_cast<char>(0xC0 | (c >> 6)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
  }
  return out;
}

std::uint32_t parse_count(const std::map<std::string, std::string>& text, const std::string& key) {
  const auto it = text.find(key);
  if (it == text.end()) return 0;
  std::uint32_t value = 0;
  const auto [ptr, ec] =
      std::from_chars(it->second.data(), it->second.data() + it->second.size(), value);
  if (ec != std::errc() || ptr != it->second.data() + it->second.size()) return 0;
  return value;
}

std::string key(std::string_view name) {
  return std::string(kMetadataKeyPrefix) + std::string(name);
}

bool all_digits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

}  // namespace

std::vector<std::pair<std::string, std::string>> metadata_text_entries(
    const lc::CommitMetadata& commit) {
  std::vector<std::pair<std::string, std::string>> entries;
  entries.emplace_back(key("revision"), commit.sha);
  entries.emplace_back(key("message"), commit.message);
  entries.emplace_back(key("type"), commit.commit_type);
  if (!commit.scope.empty()) entries.emplace_back(key("scope"), commit.scope);
  entries.emplace_back(key("timestamp"), commit.timestamp);
  entries.emplace_back(key("repo"), commit.repo_name);
  entries.emplace_back(key("branch"), commit.branch_name);
  if (commit.author) entries.emplace_back(key("author"), *commit.author);
  entries.emplace_back(key("diff"), commit.diff_stats_string());
  entries.emplace_back(key("files_changed"), std::to_string(commit.stats.files_changed));
  entries.emplace_back(key("insertions"), std::to_string(commit.stats.insertions));
  entries.emplace_back(key("deletions"), std::to_string(commit.stats.deletions));
  return entries;
}

std::expected<lc::OutputArtifact, lc::PipelineError> encode_png_with_metadata(
    const lc::CompositeImage& image,
    const lc::CommitMetadata& commit) {
  if (image.empty() ||
      image.data().size() != image.stride() * static_cast<std::size_t>(image.height())) {
    return std::unexpected(lc::PipelineError::InvalidFrame);
  }

  auto entries = metadata_text_entries(commit);
  for (const auto& [name, value] : entries) {
    if (value.find('\0') != std::string::npos || !lc::is_valid_utf8(value)) {
      spdlog::error("metadata field {} is not valid UTF-8 text", name);
      return std::unexpected(lc::PipelineError::MetadataEncodingError);
    }
  }

  std::vector<png_text> texts(entries.size());
  for (std::size_t i = 0; i < entries.size(); ++i) {
    png_text& t = texts[i];
    std::memset(&t, 0, sizeof(t));
    t.compression = PNG_ITXT_COMPRESSION_NONE;
    t.key = entries[i].first.data();
    t.text = entries[i].second.data();
    t.text_length = 0;
    t.itxt_length = entries[i].second.size();
    t.lang = nullptr;
    t.lang_key = nullptr;
  }

  std::vector<png_bytep> rows(image.height());
  auto* base = const_cast<std::uint8_t*>(image.data().data());
  for (std::uint32_t y = 0; y < image.height(); ++y) {
    rows[y] = base + static_cast<std::size_t>(y) * image.stride();
  }

  lc::OutputArtifact artifact;
  artifact.png_bytes.reserve(image.data().size() / 2);
  if (!write_png(image.width(), image.height(), rows.data(), texts.data(),
                 static_cast<int>(texts.size()), &artifact.png_bytes)) {
    return std::unexpected(lc::PipelineError::MetadataEncodingError);
  }
  spdlog::debug("encoded {}x{} PNG, {} bytes, {} text chunks", image.width(), image.height(),
                artifact.png_bytes.size(), texts.size());
  return artifact;
}

std::expected<DecodedArtifact, lc::PipelineError> decode_png_artifact(
    std::span<const std::uint8_t> png_bytes) {
  constexpr std::size_t kSignatureBytes = 8;
  if (png_bytes.size() < kSignatureBytes ||
      png_sig_cmp(png_bytes.data(), 0, kSignatureBytes) != 0) {
    return std::unexpected(lc::PipelineError::ArtifactDecodeError);
  }

  ReadCursor cursor{png_bytes.data(), png_bytes.size(), 0};
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::vector<std::uint8_t> pixels;
  std::vector<png_bytep> rows;
  std::vector<RawText> raw;
  if (!read_png(&cursor, &width, &height, &pixels, &rows, &raw)) {
    return std::unexpected(lc::PipelineError::ArtifactDecodeError);
  }

  DecodedArtifact out{lc::CompositeImage(width, height, std::move(pixels)), {}};
  for (const RawText& t : raw) {
    if (!t.international) out.text[t.key] = latin1_to_utf8(t.value);
  }
  for (const RawText& t : raw) {
    if (t.international) out.text[t.key] = t.value;
  }
  return out;
}

std::optional<lc::CommitMetadata> commit_metadata_from_text(
    const std::map<std::string, std::string>& text) {
  auto get = [&](std::string_view name) -> std::string {
    const auto it = text.find(key(name));
    return it == text.end() ? std::string() : it->second;
  };

  const bool has_commit_key = std::any_of(text.begin(), text.end(), [](const auto& entry) {
    return std::string_view(entry.first).starts_with(kMetadataKeyPrefix);
  });
  if (!has_commit_key) return std::nullopt;

  lc::CommitMetadata commit;
  commit.sha = get("revision");
  commit.message = get("message");
  commit.commit_type = get("type");
  commit.scope = get("scope");
  commit.timestamp = get("timestamp");
  commit.repo_name = get("repo");
  commit.branch_name = get("branch");
  if (const auto it = text.find(key("author")); it != text.end()) {
    commit.author = it->second;
  }
  commit.stats.files_changed = parse_count(text, key("files_changed"));
  commit.stats.insertions = parse_count(text, key("insertions"));
  commit.stats.deletions = parse_count(text, key("deletions"));
  return commit;
}

std::expected<std::optional<lc::CommitMetadata>, lc::PipelineError> read_png_metadata(
    const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    spdlog::debug("cannot open {}", path.string());
    return std::unexpected(lc::PipelineError::ArtifactDecodeError);
  }
  const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                        std::istreambuf_iterator<char>());
  auto decoded = decode_png_artifact(bytes);
  if (!decoded) return std::unexpected(decoded.error());
  return commit_metadata_from_text(decoded->text);
}

std::optional<lc::CommitMetadata> parse_image_filename(const std::filesystem::path& path) {
  if (path.extension() != ".png") return std::nullopt;
  const std::string stem = path.stem().string();

  // Split from the right: the repo name itself may contain '-'.
  const auto sha_dash = stem.rfind('-');
  if (sha_dash == std::string::npos || sha_dash == 0) return std::nullopt;
  const auto time_dash = stem.rfind('-', sha_dash - 1);
  if (time_dash == std::string::npos || time_dash == 0) return std::nullopt;
  const auto date_dash = stem.rfind('-', time_dash - 1);
  if (date_dash == std::string::npos || date_dash == 0) return std::nullopt;

  const std::string_view view(stem);
  const std::string_view sha = view.substr(sha_dash + 1);
  const std::string_view time = view.substr(time_dash + 1, sha_dash - time_dash - 1);
  const std::string_view date = view.substr(date_dash + 1, time_dash - date_dash - 1);
  if (sha.empty() || date.size() != 8 || time.size() != 6 || !all_digits(date) ||
      !all_digits(time)) {
    return std::nullopt;
  }

  lc::CommitMetadata commit;
  commit.repo_name = std::string(view.substr(0, date_dash));
  commit.sha = std::string(sha);
  commit.timestamp = std::string(date.substr(0, 4)) + "-" + std::string(date.substr(4, 2)) + "-" +
                     std::string(date.substr(6, 2)) + " " + std::string(time.substr(0, 2)) + ":" +
                     std::string(time.substr(2, 2)) + ":" + std::string(time.substr(4, 2));
  return commit;
}

std::optional<lc::CommitMetadata> load_commit_metadata(const std::filesystem::path& path) {
  auto embedded = read_png_metadata(path);
  if (embedded && *embedded) {
    return std::move(**embedded);
  }
  spdlog::debug("{}: no embedded metadata, parsing file name", path.filename().string());
  return parse_image_filename(path);
}

}  // namespace lolcommits::io
