#include <lolcommits/vision/font_resolver.hpp>
#include <fontconfig/fontconfig.h>
#include <spdlog/spdlog.h>
#include <array>
#include <cctype>
#include <stdexcept>
#include <system_error>

namespace lolcommits::vision {

namespace {

namespace lc = lolcommits::core;

struct PatternDeleter {
  void operator()(FcPattern* p) const noexcept { FcPatternDestroy(p); }
};
using PatternPtr = std::unique_ptr<FcPattern, PatternDeleter>;

bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool has_family(FcPattern* pattern, std::string_view family) {
  FcChar8* value = nullptr;
  for (int i = 0; FcPatternGetString(pattern, FC_FAMILY, i, &value) == FcResultMatch; ++i) {
    if (iequals(reinterpret_cast<const char*>(value), family)) return true;
  }
  return false;
}

}  // namespace

bool is_generic_font_family(std::string_view family) noexcept {
  static constexpr std::array<std::string_view, 9> kGeneric = {
      "monospace", "mono", "sans-serif", "sans", "serif",
      "system-ui", "emoji", "cursive", "fantasy"};
  for (std::string_view g : kGeneric) {
    if (iequals(family, g)) return true;
  }
  return false;
}

struct FontconfigFontResolver::Impl {
  FcConfig* config{nullptr};

  ~Impl() {
    if (config) FcConfigDestroy(config);
  }
};

FontconfigFontResolver::FontconfigFontResolver() : impl_(std::make_unique<Impl>()) {
  impl_->config = FcInitLoadConfigAndFonts();
  if (!impl_->config) {
    throw std::runtime_error("FontconfigFontResolver: could not load fontconfig configuration");
  }
}

FontconfigFontResolver::~FontconfigFontResolver() = default;

std::expected<std::shared_ptr<const FontconfigFontResolver>, lc::PipelineError>
FontconfigFontResolver::create() {
  try {
    return std::make_shared<const FontconfigFontResolver>();
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return std::unexpected(lc::PipelineError::FontResolutionError);
  }
}

std::expected<FontAsset, lc::PipelineError> FontconfigFontResolver::resolve(
    std::string_view name) const {
  if (name.empty()) return std::unexpected(lc::PipelineError::FontResolutionError);

  const std::string name_str(name);
  PatternPtr pattern(FcNameParse(reinterpret_cast<const FcChar8*>(name_str.c_str())));
  if (!pattern) {
    spdlog::debug("fontconfig could not parse font name '{}'", name);
    return std::unexpected(lc::PipelineError::FontResolutionError);
  }

  std::string requested_family;
  FcChar8* family = nullptr;
  if (FcPatternGetString(pattern.get(), FC_FAMILY, 0, &family) == FcResultMatch) {
    requested_family = reinterpret_cast<const char*>(family);
  }

  FcConfigSubstitute(impl_->config, pattern.get(), FcMatchPattern);
  FcDefaultSubstitute(pattern.get());

  FcResult result = FcResultNoMatch;
  PatternPtr match(FcFontMatch(impl_->config, pattern.get(), &result));
  if (!match || result != FcResultMatch) {
    spdlog::debug("no fontconfig match for '{}'", name);
    return std::unexpected(lc::PipelineError::FontResolutionError);
  }

  if (!requested_family.empty() && !is_generic_font_family(requested_family) &&
      !has_family(match.get(), requested_family)) {
    spdlog::debug("font '{}' is not installed", requested_family);
    return std::unexpected(lc::PipelineError::FontResolutionError);
  }

  FontAsset asset;
  FcChar8* file = nullptr;
  if (FcPatternGetString(match.get(), FC_FILE, 0, &file) != FcResultMatch || !file) {
    return std::unexpected(lc::PipelineError::FontResolutionError);
  }
  asset.file = reinterpret_cast<const char*>(file);
  if (FcPatternGetInteger(match.get(), FC_INDEX, 0, &asset.face_index) != FcResultMatch) {
    asset.face_index = 0;
  }
  if (FcPatternGetString(match.get(), FC_FAMILY, 0, &family) == FcResultMatch) {
    asset.family = reinterpret_cast<const char*>(family);
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(asset.file, ec)) {
    spdlog::debug("font file {} for '{}' does not exist", asset.file.string(), name);
    return std::unexpected(lc::PipelineError::FontResolutionError);
  }

  spdlog::debug("font '{}' -> {} ({}, face {})", name, asset.file.string(), asset.family,
                asset.face_index);
  return asset;
}

}  // namespace lolcommits::vision
