#ifndef RENJU_TEST_FAKE_PROVIDER_H_
#define RENJU_TEST_FAKE_PROVIDER_H_

#include <chrono>
#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "renju/core/environment_provider.hpp"

// Scripted provider: every step does what the script says and records what
// the broker asked for.
class FakeProvider : public renju::core::EnvironmentProvider {
 public:
  struct Script {
    bool create_fails = false;
    std::string create_error = "Cannot connect to the Docker daemon";
    bool wait_fails = false;
    bool wait_times_out = false;
    bool wait_throws = false;
    int exit_code = 0;
    bool oom_killed = false;
    bool capture_fails = false;
    std::string stdout_output;
    std::string stderr_output;
    bool truncated = false;
    bool remove_fails = false;
    bool available = true;
    bool image_present = true;
  };

  Script script;

  std::vector<renju::core::LaunchSpec> launches;
  std::vector<std::string> removed;
  std::vector<std::string> artifact_contents;  // read from the mount at Create time
  std::chrono::milliseconds last_time_limit{0};
  std::size_t last_max_bytes = 0;
  bool pulled = false;

  renju::core::Outcome<renju::core::SandboxHandle> Create(
      const renju::core::LaunchSpec& spec) override;
  renju::core::Outcome<renju::core::WaitStatus> Wait(
      const renju::core::SandboxHandle& handle,
      std::chrono::milliseconds time_limit) override;
  renju::core::Outcome<renju::core::CapturedOutput> CaptureOutput(
      const renju::core::SandboxHandle& handle, std::size_t max_bytes) override;
  bool ForceRemove(const renju::core::SandboxHandle& handle) override;
  bool IsAvailable() override { return script.available; }
  renju::core::Outcome<bool> EnsureImage(const std::string& image,
                                         bool pull_if_missing) override;

  std::size_t LiveCount() const { return live_.size(); }

 private:
  std::set<std::string> live_;
  int next_id_ = 0;
};

#endif  // RENJU_TEST_FAKE_PROVIDER_H_
