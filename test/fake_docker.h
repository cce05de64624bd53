#ifndef RENJU_TEST_FAKE_DOCKER_H_
#define RENJU_TEST_FAKE_DOCKER_H_

#include <fstream>
#include <map>
#include <string>
#include <vector>

#include "utils.h"

// Shell script standing in for the docker CLI. Every invocation appends its
// arguments to a log; each subcommand runs a replaceable shell snippet.
class FakeDocker {
 public:
  FakeDocker() {
    bodies_["create"] = "echo 0123456789abcdef0123";
    bodies_["start"] = "exit 0";
    bodies_["wait"] = "echo 0";
    bodies_["inspect"] = "echo '[{\"State\":{\"Status\":\"exited\",\"OOMKilled\":false}}]'";
    bodies_["logs"] = "printf 'out\\n'; printf 'err\\n' >&2";
    bodies_["rm"] = "exit 0";
    bodies_["version"] = "echo 24.0.0";
    bodies_["image"] = "exit 0";
  }

  void On(const std::string& subcommand, const std::string& body) {
    bodies_[subcommand] = body;
  }

  // Writes the script; call after the last On()
  std::string Install() {
    const fs::path script = dir_.path() / "docker";
    {
      std::ofstream out(script);
      out << "#!/bin/sh\n"
          << "echo \"$*\" >> '" << LogPath().string() << "'\n"
          << "case \"$1\" in\n";
      for (const auto& [subcommand, body] : bodies_) {
        out << "  " << subcommand << ")\n    " << body << "\n    ;;\n";
      }
      out << "esac\n";
    }
    fs::permissions(script, fs::perms::owner_all);
    return script.string();
  }

  std::vector<std::string> Calls() const {
    std::vector<std::string> calls;
    std::ifstream in(LogPath());
    std::string line;
    while (std::getline(in, line)) calls.push_back(line);
    return calls;
  }

  bool Called(const std::string& command_line) const {
    for (const auto& call : Calls()) {
      if (call == command_line) return true;
    }
    return false;
  }

  bool CalledWithPrefix(const std::string& prefix) const {
    for (const auto& call : Calls()) {
      if (call.rfind(prefix, 0) == 0) return true;
    }
    return false;
  }

 private:
  fs::path LogPath() const { return dir_.path() / "calls.log"; }

  TempDir dir_;
  std::map<std::string, std::string> bodies_;
};

#endif  // RENJU_TEST_FAKE_DOCKER_H_
