#ifndef CORESIDENCY_TESTS_COMMON_TEMP_DIR_HPP_
#define CORESIDENCY_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace coresidency::tests::common {

// Fresh directory under the system temp root for configuration and batch
// files. Removed on destruction; removal failures are ignored.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            (std::string(prefix) + "-" + std::to_string(stamp));

    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
      Fail("cannot create temp dir " + path_.string() + ": " + ec.message());
    }
  }

  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path operator/(std::string_view name) const { return path_ / name; }

private:
  std::filesystem::path path_;
};

} // namespace coresidency::tests::common

#endif // CORESIDENCY_TESTS_COMMON_TEMP_DIR_HPP_
