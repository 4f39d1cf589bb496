#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <kj/async-io.h>
#include <kj/timer.h>

namespace sandbox {

// Settings to launch a program inside an isolated container.
struct ExecutionOptions {
  // Identity of the instance, used to remove it by name.
  std::string name;

  std::string image;
  std::string interpreter;
  // File name of the script, relative to mount_target.
  std::string script;

  // Host directory bound read-only at mount_target.
  std::string mount_source;
  std::string mount_target;

  // Required limits. An instance is never launched without them.
  int64_t memory_limit_mb = 0;
  int32_t max_procs = 0;
  std::string cpus;

  // Captured bytes per stream, 0 means unlimited.
  size_t max_output_bytes = 0;
};

// Results of the execution, as reported by the runtime client.
struct ExecutionInfo {
  int32_t status_code = 0;
  int32_t signal = 0;
  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
};

// Container runtime interface. Implementations need to register themselves by
// creating a global object of type Sandbox::Register<SandboxImpl> and should
// define the static kName, Create and Score members. Create should return a
// pointer to a newly allocated instance of the given implementation, while
// Score should return a value that defines how "good" that sandbox is:
// negative if the sandbox should not/cannot be used in the current
// configuration, positive otherwise (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t =
      std::function<Sandbox*(kj::LowLevelAsyncIoProvider*, kj::Timer*)>;
  using score_t = std::function<int()>;

  // Creates the registered sandbox with the best score, or the one called
  // name if name is not empty. Returns nullptr if none can be used.
  static std::unique_ptr<Sandbox> Create(kj::LowLevelAsyncIoProvider* io,
                                         kj::Timer* timer,
                                         const std::string& name = "");

  // Names of the registered sandboxes.
  static std::vector<std::string> Available();

  // Launches the instance described by options. The promise resolves when the
  // runtime client exits, and is rejected if the client cannot be started.
  // Dropping the promise kills the runtime client, but not necessarily the
  // instance: use Remove for that.
  kj::Promise<ExecutionInfo> Execute(const ExecutionOptions& options)
      KJ_WARN_UNUSED_RESULT;

  // Forcibly removes the instance called name. This does not depend on a
  // pending Execute. The promise is rejected if the removal failed.
  virtual kj::Promise<void> Remove(const std::string& name) = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(T::kName, &T::Create, &T::Score); }
  };

 protected:
  virtual kj::Promise<ExecutionInfo> ExecuteInternal(
      const ExecutionOptions& options) = 0;

 private:
  struct Entry {
    std::string name;
    create_t create;
    score_t score;
  };
  using store_t = std::vector<Entry>;
  static store_t* Boxes_();
  static void Register_(std::string name, create_t create, score_t score);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
