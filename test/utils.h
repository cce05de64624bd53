#ifndef RENJU_TEST_UTILS_H_
#define RENJU_TEST_UTILS_H_

#include <atomic>
#include <filesystem>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;

// Per-test scratch directory, removed on destruction
class TempDir {
 public:
  TempDir() {
    static std::atomic<int> counter{0};
    path_ = fs::temp_directory_path() /
            ("renju_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& path() const { return path_; }
  bool IsEmpty() const { return fs::is_empty(path_); }

 private:
  fs::path path_;
};

#endif  // RENJU_TEST_UTILS_H_
