#pragma once
//
// Uniquely named temp directory removed with its contents on scope exit
//

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace asset_matrix::runtime {

class ScopedTempDir {
public:
  explicit ScopedTempDir(const std::string &prefix,
                         const std::filesystem::path &root =
                             std::filesystem::temp_directory_path()) {
    const auto pattern = (root / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
      throw std::runtime_error(std::format("Failed to create temp directory {}: {}",
                                           pattern, std::strerror(errno)));
    }
    m_path = buffer.data();
  }

  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
    if (ec) {
      SPDLOG_WARN("Could not clean temp dir {}: {}", m_path.string(), ec.message());
    } else {
      SPDLOG_DEBUG("Cleaned up temp directory {}", m_path.string());
    }
  }

  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir &operator=(const ScopedTempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &Path() const { return m_path; }

private:
  std::filesystem::path m_path;
};

} // namespace asset_matrix::runtime
