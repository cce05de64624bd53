// Runs real containers; skipped when no docker daemon or image is available.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "renju/core/docker_provider.hpp"
#include "renju/core/sandbox_broker.hpp"
#include "renju/utils/container_utils.hpp"
#include "utils.h"

using namespace renju;

class DockerIntegrationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    utils::ContainerUtils docker;
    if (!docker.IsRuntimeAvailable()) {
      GTEST_SKIP() << "docker daemon not reachable";
    }
    if (!docker.ImageExists(core::SandboxConfig{}.image)) {
      GTEST_SKIP() << "image " << core::SandboxConfig{}.image << " not present";
    }
    broker_ = std::make_unique<core::SandboxBroker>(
        core::SandboxBuilder().WithArtifactRoot(root_.path()).Build());
  }

  // Every run must leave neither its container nor its artifact behind
  core::ExecutionReport Run(const std::string& code) {
    auto report = broker_->Execute(code);
    EXPECT_TRUE(root_.IsEmpty());
    if (!report.sandbox_name.empty()) {
      EXPECT_FALSE(docker_.ContainerExists(report.sandbox_name));
    }
    EXPECT_TRUE(report.teardown_errors.empty());
    return report;
  }

  TempDir root_;
  utils::ContainerUtils docker_;
  std::unique_ptr<core::SandboxBroker> broker_;
};

TEST_F(DockerIntegrationTest, HelloWorld) {
  auto report = Run("print('Hello, World!')");
  EXPECT_EQ(report.status, core::ExecutionStatus::COMPLETED);
  EXPECT_EQ(report.output, "Hello, World!\n");
}

TEST_F(DockerIntegrationTest, RuntimeError) {
  auto report = Run("1/0");
  EXPECT_EQ(report.status, core::ExecutionStatus::RUNTIME_FAILURE);
  EXPECT_EQ(report.output.rfind("Execution failed (exit code: 1)", 0), 0u);
  EXPECT_NE(report.output.find("ZeroDivisionError"), std::string::npos);
}

TEST_F(DockerIntegrationTest, InfiniteLoopTimesOut) {
  auto start = std::chrono::steady_clock::now();
  auto report = Run("while True:\n    pass\n");
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(report.status, core::ExecutionStatus::TIMEOUT);
  EXPECT_EQ(report.output, "Execution timed out (exceeded 2 seconds)");
  // Container startup plus forced removal, but nowhere near unbounded
  EXPECT_LT(elapsed, std::chrono::seconds(20));
}

TEST_F(DockerIntegrationTest, NetworkIsUnreachable) {
  auto report = Run(
      "import socket\n"
      "socket.create_connection(('1.1.1.1', 53), timeout=1)\n"
      "print('connected')\n");
  EXPECT_FALSE(report.Succeeded());
  EXPECT_EQ(report.output.find("connected\n"), std::string::npos);
}

TEST_F(DockerIntegrationTest, MemoryBlowupFails) {
  auto report = Run("data = bytearray(512 * 1024 * 1024)\nprint(len(data))\n");
  EXPECT_FALSE(report.Succeeded());
  EXPECT_NE(report.status, core::ExecutionStatus::INFRASTRUCTURE_ERROR);
}

TEST_F(DockerIntegrationTest, CodeMountIsReadOnly) {
  auto report = Run("open('/code/escape.txt', 'w').write('x')\n");
  EXPECT_EQ(report.status, core::ExecutionStatus::RUNTIME_FAILURE);
  EXPECT_NE(report.output.find("Read-only file system"), std::string::npos);
}

TEST_F(DockerIntegrationTest, RootFilesystemIsReadOnly) {
  auto report = Run("open('/etc/escape.txt', 'w').write('x')\n");
  EXPECT_EQ(report.status, core::ExecutionStatus::RUNTIME_FAILURE);
}

TEST_F(DockerIntegrationTest, RunsDoNotShareState) {
  auto first = Run(
      "open('/tmp/marker', 'w').write('left behind')\n"
      "print('written')\n");
  ASSERT_EQ(first.status, core::ExecutionStatus::COMPLETED);

  auto second = Run("import os\nprint(os.path.exists('/tmp/marker'))\n");
  ASSERT_EQ(second.status, core::ExecutionStatus::COMPLETED);
  EXPECT_EQ(second.output, "False\n");
}
