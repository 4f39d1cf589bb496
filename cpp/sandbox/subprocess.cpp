#include "sandbox/subprocess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <cstring>

#include <kj/debug.h>
#include <kj/io.h>

extern char** environ;

namespace sandbox {
namespace {

const constexpr auto kReapInterval = 10 * kj::MILLISECONDS;

// Owns a spawned process. If the process was not reaped yet on destruction,
// its process group is killed and the process is reaped.
class Child {
 public:
  explicit Child(pid_t pid) : pid_(pid) {}
  KJ_DISALLOW_COPY(Child);

  ~Child() {
    if (pid_ == -1) return;
    if (kill(-pid_, SIGKILL) == -1 && errno != ESRCH) {
      KJ_LOG(WARNING, "kill", pid_, strerror(errno));
    }
    int status = 0;
    while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
    }
  }

  // Returns the wait status if the process has exited.
  kj::Maybe<int> TryWait() {
    KJ_ASSERT(pid_ != -1, "Process already reaped");
    int status = 0;
    pid_t ret;
    KJ_SYSCALL(ret = waitpid(pid_, &status, WNOHANG), pid_);
    if (ret == 0) return nullptr;
    pid_ = -1;
    return status;
  }

 private:
  pid_t pid_;
};

struct Capture {
  Capture(kj::Own<kj::AsyncInputStream> stream, size_t limit)
      : stream(kj::mv(stream)), limit(limit) {}
  kj::Own<kj::AsyncInputStream> stream;
  size_t limit;
  std::string data;
  bool truncated = false;
  std::array<kj::byte, 4096> buf;
};

kj::Promise<void> Drain(Capture* capture) {
  return capture->stream
      ->tryRead(capture->buf.data(), 1, capture->buf.size())
      .then([capture](size_t amount) -> kj::Promise<void> {
        if (amount == 0) return kj::READY_NOW;
        size_t keep = amount;
        if (capture->limit != 0) {
          size_t room = capture->limit > capture->data.size()
                            ? capture->limit - capture->data.size()
                            : 0;
          if (keep > room) {
            keep = room;
            capture->truncated = true;
          }
        }
        capture->data.append(
            reinterpret_cast<const char*>(capture->buf.data()),  // NOLINT
            keep);
        return Drain(capture);
      });
}

kj::Promise<int> WaitForExit(Child* child, kj::Timer* timer) {
  KJ_IF_MAYBE(status, child->TryWait()) { return *status; }
  // The streams are closed but the process is still around: poll.
  return timer->afterDelay(kReapInterval).then([child, timer]() {
    return WaitForExit(child, timer);
  });
}

pid_t Spawn(const std::vector<std::string>& args, int stdout_fd,
            int stderr_fd) {
  std::vector<std::vector<char>> args_mut;
  for (const std::string& arg : args) {
    args_mut.emplace_back(arg.c_str(), arg.c_str() + arg.size() + 1);
  }
  std::vector<char*> argv;
  for (auto& arg : args_mut) argv.push_back(arg.data());
  argv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawnattr_t attr;
  int ret = posix_spawn_file_actions_init(&actions);
  if (ret != 0) KJ_FAIL_SYSCALL("posix_spawn_file_actions_init", ret);
  KJ_DEFER(posix_spawn_file_actions_destroy(&actions));
  ret = posix_spawnattr_init(&attr);
  if (ret != 0) KJ_FAIL_SYSCALL("posix_spawnattr_init", ret);
  KJ_DEFER(posix_spawnattr_destroy(&attr));

  auto check = [](int ret, const char* what) {
    if (ret != 0) KJ_FAIL_SYSCALL(what, ret);
  };
  check(posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                         O_RDONLY, 0),
        "posix_spawn_file_actions_addopen");
  check(posix_spawn_file_actions_adddup2(&actions, stdout_fd, STDOUT_FILENO),
        "posix_spawn_file_actions_adddup2");
  check(posix_spawn_file_actions_adddup2(&actions, stderr_fd, STDERR_FILENO),
        "posix_spawn_file_actions_adddup2");

  // A new process group, so that the whole tree can be killed and we do not
  // forward Ctrl-Cs from the terminal. Signals are reset to a sane state.
  sigset_t no_signals;
  sigset_t default_signals;
  sigemptyset(&no_signals);
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  sigaddset(&default_signals, SIGINT);
  sigaddset(&default_signals, SIGTERM);
  sigaddset(&default_signals, SIGCHLD);
  check(posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP |
                                            POSIX_SPAWN_SETSIGMASK |
                                            POSIX_SPAWN_SETSIGDEF),
        "posix_spawnattr_setflags");
  check(posix_spawnattr_setpgroup(&attr, 0), "posix_spawnattr_setpgroup");
  check(posix_spawnattr_setsigmask(&attr, &no_signals),
        "posix_spawnattr_setsigmask");
  check(posix_spawnattr_setsigdefault(&attr, &default_signals),
        "posix_spawnattr_setsigdefault");

  pid_t pid = -1;
  ret = posix_spawn(&pid, argv[0], &actions, &attr, argv.data(), environ);
  if (ret != 0) KJ_FAIL_SYSCALL("posix_spawn", ret, args[0]);
  return pid;
}

}  // namespace

kj::Promise<ExecutionInfo> RunProcess(const std::vector<std::string>& args,
                                      kj::LowLevelAsyncIoProvider* io,
                                      kj::Timer* timer,
                                      size_t max_output_bytes) {
  return kj::evalNow([&]() {
    KJ_REQUIRE(!args.empty(), "Empty command");
    KJ_REQUIRE(args[0][0] == '/', "Executables need an absolute path", args[0]);

    int stdout_pipe[2];
    int stderr_pipe[2];
    KJ_SYSCALL(pipe2(stdout_pipe, O_CLOEXEC));
    kj::AutoCloseFd stdout_read(stdout_pipe[0]);
    kj::AutoCloseFd stdout_write(stdout_pipe[1]);
    KJ_SYSCALL(pipe2(stderr_pipe, O_CLOEXEC));
    kj::AutoCloseFd stderr_read(stderr_pipe[0]);
    kj::AutoCloseFd stderr_write(stderr_pipe[1]);

    auto child = kj::heap<Child>(Spawn(args, stdout_write, stderr_write));
    stdout_write = nullptr;
    stderr_write = nullptr;

    const uint flags = kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
                       kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC;
    auto out = kj::heap<Capture>(
        io->wrapInputFd(stdout_read.releaseFd(), flags), max_output_bytes);
    auto err = kj::heap<Capture>(
        io->wrapInputFd(stderr_read.releaseFd(), flags), max_output_bytes);

    auto streams = kj::heapArrayBuilder<kj::Promise<void>>(2);
    streams.add(Drain(out.get()));
    streams.add(Drain(err.get()));
    return kj::joinPromises(streams.finish())
        .then([child = child.get(), timer]() {
          return WaitForExit(child, timer);
        })
        .then([out = out.get(), err = err.get()](int status) {
          ExecutionInfo info;
          info.status_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
          info.signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
          info.stdout_data = kj::mv(out->data);
          info.stderr_data = kj::mv(err->data);
          info.stdout_truncated = out->truncated;
          info.stderr_truncated = err->truncated;
          return info;
        })
        .attach(kj::mv(child), kj::mv(out), kj::mv(err));
  });
}

}  // namespace sandbox
