#include <lolcommits/io/output_path.hpp>
#include <algorithm>
#include <cstdlib>
#include <ctime>

namespace lolcommits::io {

namespace {

std::string format_local(std::chrono::system_clock::time_point when, const char* pattern) {
  const std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&t, &local);
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), pattern, &local);
  return std::string(buf, n);
}

// Keeps a name component from turning into a path.
std::string file_component(std::string_view value) {
  std::string out(value);
  std::replace(out.begin(), out.end(), '/', '_');
  std::replace(out.begin(), out.end(), '\\', '_');
  std::replace(out.begin(), out.end(), '\0', '_');
  return out;
}

}  // namespace

std::string output_filename(std::string_view repo_name,
                            std::string_view sha,
                            std::chrono::system_clock::time_point when) {
  const std::string repo = file_component(repo_name.empty() ? std::string_view("lolcommit") : repo_name);
  return repo + "-" + format_local(when, "%Y%m%d-%H%M%S") + "-" + file_component(sha) + ".png";
}

std::string format_commit_timestamp(std::chrono::system_clock::time_point when) {
  return format_local(when, "%Y-%m-%d %H:%M:%S");
}

std::filesystem::path default_images_dir() {
  const char* data_home = std::getenv("XDG_DATA_HOME");
  if (data_home && data_home[0] != '\0') {
    return std::filesystem::path(data_home) / "lolcommits" / "images";
  }
  const char* home = std::getenv("HOME");
  const std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::path(".");
  return base / ".local" / "share" / "lolcommits" / "images";
}

}  // namespace lolcommits::io
