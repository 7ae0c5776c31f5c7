// Repository: Sanchez
// Component: Temporary Directory for Testing
// Purpose: Scoped scratch directory removed with its contents.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_TESTS_FIXTURES_TEMP_DIR_H_
#define SANCHEZ_TESTS_FIXTURES_TEMP_DIR_H_

#include <atomic>
#include <filesystem>
#include <string>
#include <system_error>

#include <unistd.h>

namespace sanchez::tests::fixtures {

class TempDir {
 public:
  TempDir() {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("sanchez_test_" + std::to_string(::getpid()) + "_" +
             std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string File(const std::string& name) const { return (path_ / name).string(); }

 private:
  std::filesystem::path path_;
};

}  // namespace sanchez::tests::fixtures

#endif  // SANCHEZ_TESTS_FIXTURES_TEMP_DIR_H_
