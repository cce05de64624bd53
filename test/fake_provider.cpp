#include "fake_provider.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace renju::core;

Outcome<SandboxHandle> FakeProvider::Create(const LaunchSpec& spec) {
  launches.push_back(spec);

  std::ifstream fin(spec.host_directory / spec.command.back());
  std::ostringstream content;
  content << fin.rdbuf();
  artifact_contents.push_back(fin ? content.str() : std::string("<missing>"));

  if (script.create_fails) return Outcome<SandboxHandle>::Failure(script.create_error);

  SandboxHandle handle{"fake-" + std::to_string(next_id_++), spec.name};
  live_.insert(handle.id);
  return Outcome<SandboxHandle>::Success(handle);
}

Outcome<WaitStatus> FakeProvider::Wait(const SandboxHandle&,
                                       std::chrono::milliseconds time_limit) {
  last_time_limit = time_limit;
  if (script.wait_throws) throw std::runtime_error("wait exploded");
  if (script.wait_fails) return Outcome<WaitStatus>::Failure("docker wait failed");

  WaitStatus status;
  status.timed_out = script.wait_times_out;
  status.exit_code = script.wait_times_out ? -1 : script.exit_code;
  status.oom_killed = script.oom_killed;
  return Outcome<WaitStatus>::Success(status);
}

Outcome<CapturedOutput> FakeProvider::CaptureOutput(const SandboxHandle&,
                                                    std::size_t max_bytes) {
  last_max_bytes = max_bytes;
  if (script.capture_fails) return Outcome<CapturedOutput>::Failure("docker logs failed");

  CapturedOutput output;
  output.stdout_output = script.stdout_output;
  output.stderr_output = script.stderr_output;
  output.truncated = script.truncated;
  return Outcome<CapturedOutput>::Success(output);
}

bool FakeProvider::ForceRemove(const SandboxHandle& handle) {
  removed.push_back(handle.id);
  if (script.remove_fails) return false;
  live_.erase(handle.id);
  return true;
}

Outcome<bool> FakeProvider::EnsureImage(const std::string& image, bool pull_if_missing) {
  if (script.image_present) return Outcome<bool>::Success(true);
  if (!pull_if_missing) return Outcome<bool>::Failure("image '" + image + "' is not available locally");
  pulled = true;
  return Outcome<bool>::Success(true);
}
