#ifndef SANDBOX_DOCKER_HPP
#define SANDBOX_DOCKER_HPP

#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs instances with the docker command-line client.
class Docker : public Sandbox {
 public:
  static const constexpr char* kName = "docker";
  static Sandbox* Create(kj::LowLevelAsyncIoProvider* io, kj::Timer* timer);
  static int Score();

  // client is either a command looked up in PATH or an absolute path. Removals
  // taking longer than remove_timeout are abandoned.
  Docker(kj::LowLevelAsyncIoProvider* io, kj::Timer* timer, std::string client,
         kj::Duration remove_timeout);

  // Arguments of the client invocation that launches options.
  static std::vector<std::string> RunArgs(const ExecutionOptions& options);
  // Arguments of the client invocation that forcibly removes name.
  static std::vector<std::string> RemoveArgs(const std::string& name);

  kj::Promise<void> Remove(const std::string& name) override;

 protected:
  kj::Promise<ExecutionInfo> ExecuteInternal(
      const ExecutionOptions& options) override;

  // Prefix of the errors the client itself writes to stderr.
  virtual const char* ErrorPrefix() const { return "docker:"; }

 private:
  std::vector<std::string> Command(std::vector<std::string> args);

  kj::LowLevelAsyncIoProvider* io_;
  kj::Timer* timer_;
  std::string client_;
  kj::Duration remove_timeout_;
};

// Podman accepts the same command line as docker.
class Podman : public Docker {
 public:
  static const constexpr char* kName = "podman";
  static Sandbox* Create(kj::LowLevelAsyncIoProvider* io, kj::Timer* timer);
  static int Score();

  using Docker::Docker;

 protected:
  const char* ErrorPrefix() const override { return "Error:"; }
};

}  // namespace sandbox

#endif
