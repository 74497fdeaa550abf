#pragma once

#include <lolcommits/core/error.hpp>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace lolcommits::vision {

/// A font file on disk, as located by a resolver.
struct FontAsset {
  std::filesystem::path file;
  int face_index{0};
  std::string family;
};

/// Maps a font name ("monospace", "DejaVu Sans:bold") to a font file.
class IFontResolver {
 public:
  virtual ~IFontResolver() = default;

  /// FontResolutionError when nothing matching the name is installed.
  [[nodiscard]] virtual std::expected<FontAsset, lolcommits::core::PipelineError>
  resolve(std::string_view name) const = 0;
};

/// Fontconfig-backed resolver.
///
/// Fontconfig always returns its best match, so a named family is accepted only if
/// the match actually carries that family (case-insensitive). Generic aliases
/// (monospace, sans-serif, serif, ...) accept whatever the system maps them to.
class FontconfigFontResolver : public IFontResolver {
 public:
  /// Loads the system Fontconfig configuration. Throws std::runtime_error on failure.
  FontconfigFontResolver();
  ~FontconfigFontResolver() override;

  FontconfigFontResolver(const FontconfigFontResolver&) = delete;
  FontconfigFontResolver& operator=(const FontconfigFontResolver&) = delete;

  /// Non-throwing factory: a Fontconfig initialization failure is FontResolutionError.
  [[nodiscard]] static std::expected<std::shared_ptr<const FontconfigFontResolver>,
                                     lolcommits::core::PipelineError>
  create();

  [[nodiscard]] std::expected<FontAsset, lolcommits::core::PipelineError>
  resolve(std::string_view name) const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/// True for fontconfig generic family aliases (monospace, sans-serif, serif, ...).
[[nodiscard]] bool is_generic_font_family(std::string_view family) noexcept;

}  // namespace lolcommits::vision
