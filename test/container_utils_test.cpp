#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include <nlohmann/json.hpp>

#include "renju/core/docker_provider.hpp"
#include "renju/utils/container_utils.hpp"

using namespace renju;
using namespace renju::utils;

namespace {

bool HasPair(const std::vector<std::string>& args, const std::string& flag,
             const std::string& value) {
  for (size_t i = 0; i + 1 < args.size(); i++) {
    if (args[i] == flag && args[i + 1] == value) return true;
  }
  return false;
}

bool Has(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

core::LaunchSpec DefaultSpec() {
  core::LaunchSpec spec;
  spec.name = "renju_1_0_abcdef";
  spec.image = "python:3.9-slim";
  spec.command = {"python", "user_code.py"};
  spec.host_directory = "/tmp/renju_AbC123";
  spec.mount_point = "/code";
  spec.working_dir = "/code";
  spec.user = "1000:1000";
  return spec;
}

}  // namespace

TEST(ContainerUtils, CreateArgsCarryHardening) {
  ContainerUtils docker;
  auto args = docker.BuildCreateArgs(core::DockerProvider::ToContainerConfig(DefaultSpec()));

  ASSERT_FALSE(args.empty());
  EXPECT_EQ(args.front(), "create");
  EXPECT_TRUE(HasPair(args, "--name", "renju_1_0_abcdef"));
  EXPECT_TRUE(HasPair(args, "--network", "none"));
  EXPECT_TRUE(HasPair(args, "--memory", "128m"));
  EXPECT_TRUE(HasPair(args, "--memory-swap", "128m"));
  EXPECT_TRUE(HasPair(args, "--cpu-period", "100000"));
  EXPECT_TRUE(HasPair(args, "--cpu-quota", "50000"));
  EXPECT_TRUE(HasPair(args, "--pids-limit", "10"));
  EXPECT_TRUE(HasPair(args, "--cap-drop", "ALL"));
  EXPECT_TRUE(HasPair(args, "--security-opt", "no-new-privileges"));
  EXPECT_TRUE(HasPair(args, "--user", "1000:1000"));
  EXPECT_TRUE(Has(args, "--read-only"));
  EXPECT_TRUE(HasPair(args, "--tmpfs", "/tmp:rw,noexec,nosuid,size=64m"));
  EXPECT_TRUE(HasPair(args, "-v", "/tmp/renju_AbC123:/code:ro"));
  EXPECT_TRUE(HasPair(args, "-w", "/code"));

  // Image, then the command, at the very end
  ASSERT_GE(args.size(), 3u);
  EXPECT_EQ(args[args.size() - 3], "python:3.9-slim");
  EXPECT_EQ(args[args.size() - 2], "python");
  EXPECT_EQ(args[args.size() - 1], "user_code.py");
}

TEST(ContainerUtils, RelaxedSpecDropsRestrictions) {
  auto spec = DefaultSpec();
  spec.network_enabled = true;
  spec.filesystem_writable = true;
  spec.memory_limit_mb = 256;

  ContainerUtils docker;
  auto args = docker.BuildCreateArgs(core::DockerProvider::ToContainerConfig(spec));
  EXPECT_TRUE(HasPair(args, "--network", "bridge"));
  EXPECT_FALSE(Has(args, "--read-only"));
  EXPECT_TRUE(HasPair(args, "-v", "/tmp/renju_AbC123:/code"));
  EXPECT_TRUE(HasPair(args, "--memory", "256m"));
  EXPECT_TRUE(HasPair(args, "--memory-swap", "256m"));
}

TEST(ContainerUtils, BuilderSetsCpuQuotaFromPercent) {
  auto config = ContainerBuilder().WithCpuPercent(25).Build();
  EXPECT_EQ(config.cpu_period_us, 100000);
  EXPECT_EQ(config.cpu_quota_us, 25000);
}

TEST(ContainerUtils, ParsesInspectArray) {
  nlohmann::json inspect = nlohmann::json::array({{
      {"Id", "0123456789abcdef"},
      {"Name", "/renju_1_0_abcdef"},
      {"Config", {{"Image", "python:3.9-slim"}}},
      {"State", {{"Status", "exited"}, {"ExitCode", 137}, {"OOMKilled", true}, {"Error", ""}}},
  }});

  auto info = ContainerUtils::ParseInspectOutput(inspect.dump());
  EXPECT_EQ(info.id, "0123456789abcdef");
  EXPECT_EQ(info.name, "renju_1_0_abcdef");
  EXPECT_EQ(info.image, "python:3.9-slim");
  EXPECT_EQ(info.state, ContainerState::EXITED);
  EXPECT_EQ(info.exit_code, 137);
  EXPECT_TRUE(info.oom_killed);
}

TEST(ContainerUtils, RejectsMalformedInspect) {
  EXPECT_THROW(ContainerUtils::ParseInspectOutput("not json"), nlohmann::json::exception);
  EXPECT_THROW(ContainerUtils::ParseInspectOutput("[]"), std::runtime_error);
}

TEST(ContainerUtils, ParsesStates) {
  EXPECT_EQ(ContainerUtils::ParseState("running"), ContainerState::RUNNING);
  EXPECT_EQ(ContainerUtils::ParseState("exited"), ContainerState::EXITED);
  EXPECT_EQ(ContainerUtils::ParseState("dead"), ContainerState::DEAD);
  EXPECT_EQ(ContainerUtils::ParseState("bogus"), ContainerState::UNKNOWN);
  EXPECT_EQ(ContainerUtils::StateToString(ContainerState::CREATED), "created");
}

TEST(ContainerUtils, GeneratesUniqueNames) {
  std::set<std::string> names;
  for (int i = 0; i < 1000; i++) {
    auto name = ContainerUtils::GenerateContainerName("renju");
    EXPECT_EQ(name.rfind("renju_", 0), 0u);
    names.insert(name);
  }
  EXPECT_EQ(names.size(), 1000u);
}

TEST(ContainerUtils, MissingDockerBinaryFailsFast) {
  ContainerUtils docker("renju-no-such-docker", std::chrono::seconds(2),
                        std::chrono::seconds(2));
  EXPECT_FALSE(docker.IsRuntimeAvailable());
  EXPECT_EQ(docker.GetRuntimeVersion(), "unknown");

  std::string error;
  auto id = docker.CreateContainer(ContainerBuilder().WithCommand({"true"}).Build(), error);
  EXPECT_TRUE(id.empty());
  EXPECT_NE(error.find("could not be executed"), std::string::npos);
  EXPECT_FALSE(docker.RemoveContainer("abc"));
}

TEST(DockerProvider, UnreachableRuntimeIsCreateFailure) {
  core::DockerProvider provider("renju-no-such-docker", std::chrono::seconds(2),
                                std::chrono::seconds(2));
  EXPECT_FALSE(provider.IsAvailable());

  auto created = provider.Create(DefaultSpec());
  EXPECT_FALSE(created.ok());
  EXPECT_FALSE(created.error.empty());
}
