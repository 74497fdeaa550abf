#include <lolcommits/io/atomic_persister.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace lolcommits::io {

namespace {

namespace lc = lolcommits::core;
namespace fs = std::filesystem;

/// Owns the temporary file until commit(): closes the descriptor and unlinks the path.
class TempFileGuard {
 public:
  TempFileGuard(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
  ~TempFileGuard() {
    if (fd_ >= 0) ::close(fd_);
    if (!committed_) ::unlink(path_.c_str());
  }
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

  [[nodiscard]] int fd() const noexcept { return fd_; }
  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  /// Closes the descriptor, reporting errors (close can surface delayed write errors).
  [[nodiscard]] bool close() noexcept {
    const int fd = fd_;
    fd_ = -1;
    return ::close(fd) == 0;
  }

  void commit() noexcept { committed_ = true; }

 private:
  int fd_;
  std::string path_;
  bool committed_{false};
};

bool write_all(int fd, std::span<const std::uint8_t> bytes) {
  std::size_t written = 0;
  while (written < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

std::unexpected<lc::PipelineError> fail(std::string_view what, const fs::path& path) {
  const int err = errno;
  spdlog::error("{} {}: {}", what, path.string(), std::strerror(err));
  return std::unexpected(lc::PipelineError::PersistError);
}

}  // namespace

std::expected<fs::path, lc::PipelineError> AtomicPersister::persist(
    std::span<const std::uint8_t> bytes,
    const fs::path& target) const {
  if (target.filename().empty()) {
    spdlog::error("invalid output path '{}'", target.string());
    return std::unexpected(lc::PipelineError::PersistError);
  }
  const fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");

  std::string tmpl = (dir / ("." + target.filename().string() + ".XXXXXX")).string();
  std::vector<char> name(tmpl.begin(), tmpl.end());
  name.push_back('\0');
  const int fd = ::mkstemp(name.data());
  if (fd < 0) return fail("cannot create temporary file in", dir);
  TempFileGuard temp(fd, std::string(name.data()));

  if (!write_all(temp.fd(), bytes)) return fail("write failed for", temp.path());
  if (::fsync(temp.fd()) != 0) return fail("fsync failed for", temp.path());
  if (::fchmod(temp.fd(), 0644) != 0) return fail("chmod failed for", temp.path());
  if (!temp.close()) return fail("close failed for", temp.path());

  if (hook_) {
    auto hooked = hook_(fs::path(temp.path()));
    if (!hooked) {
      spdlog::error("pre-commit check failed for {}: {}", target.string(),
                    lc::to_string(hooked.error()));
      return std::unexpected(lc::PipelineError::PersistError);
    }
  }

  if (::rename(temp.path().c_str(), target.c_str()) != 0) {
    return fail("rename failed for", target);
  }
  temp.commit();

  const int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dir_fd < 0 || ::fsync(dir_fd) != 0) {
    spdlog::warn("could not sync directory {}: {}", dir.string(), std::strerror(errno));
  }
  if (dir_fd >= 0) ::close(dir_fd);

  spdlog::info("wrote {} ({} bytes)", target.string(), bytes.size());
  return target;
}

}  // namespace lolcommits::io
