// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file posix_process_runner.cpp
 * @brief fork/execv implementation of IProcessRunner.
 */

#include "dumpconform/harness/process_runner.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "internal/deadline.h"
#include "internal/unique_fd.h"

namespace dumpconform::harness {

namespace {

using internal::Clock;
using internal::RemainingMs;
using internal::UniqueFd;

std::string ErrnoMessage(const char* what, int err) {
  return std::string(what) + ": " + std::strerror(err);
}

bool MakePipe(UniqueFd& read_end, UniqueFd& write_end) {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return false;
  }
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
  return true;
}

// Reads whatever is available on @p fd. Returns false once the write side is closed.
bool DrainOnce(int fd, std::string& out) {
  char buf[4096];
  while (true) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<std::size_t>(n));
      return true;
    }
    if (n == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    // EAGAIN cannot happen on a blocking pipe after POLLIN; anything else ends the stream.
    return false;
  }
}

// Kills the child's whole process group so helpers it spawned do not keep running.
void KillAndReap(pid_t pid) {
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return -WTERMSIG(status);
  }
  return -1;
}

[[noreturn]] void ExecChild(const std::string& program,
                            std::vector<char*>& argv,
                            int stdout_fd,
                            int stderr_fd,
                            int status_fd) {
  // The status pipe is close-on-exec, so a successful exec writes nothing to it.
  auto report_and_exit = [status_fd]() {
    const int err = errno;
    while (::write(status_fd, &err, sizeof(err)) < 0 && errno == EINTR) {
    }
    ::_exit(127);
  };

  // Own process group, so a timeout can take down anything the subject forks.
  if (::setpgid(0, 0) != 0) {
    report_and_exit();
  }

  const int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull < 0 || ::dup2(devnull, STDIN_FILENO) < 0) {
    report_and_exit();
  }
  if (::dup2(stdout_fd, STDOUT_FILENO) < 0 || ::dup2(stderr_fd, STDERR_FILENO) < 0) {
    report_and_exit();
  }

  ::execv(program.c_str(), argv.data());
  report_and_exit();
  ::_exit(127);
}

} // namespace

class PosixProcessRunner final : public IProcessRunner {
 public:
  InvocationOutcome RunWithTimeout(const std::string& program,
                                   const std::vector<std::string>& args,
                                   std::uint32_t timeout_ms) const override {
    UniqueFd out_read, out_write, err_read, err_write, status_read, status_write;
    if (!MakePipe(out_read, out_write) || !MakePipe(err_read, err_write) || !MakePipe(status_read, status_write)) {
      return InvocationOutcome::Error(ErrnoMessage("pipe2() failed", errno));
    }

    // Build argv before forking; the child must not allocate.
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(program);
    storage.insert(storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage) {
      argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    const pid_t pid = ::fork();
    if (pid < 0) {
      return InvocationOutcome::Error(ErrnoMessage("fork() failed", errno));
    }
    if (pid == 0) {
      ExecChild(program, argv, out_write.Get(), err_write.Get(), status_write.Get());
    }

    out_write.Reset();
    err_write.Reset();
    status_write.Reset();

    int exec_errno = 0;
    ssize_t n = 0;
    do {
      n = ::read(status_read.Get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
      int status = 0;
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      return InvocationOutcome::Error(ErrnoMessage(("failed to execute " + program).c_str(), exec_errno));
    }

    std::string stdout_text;
    std::string stderr_text;

    pollfd fds[2] = {
        {out_read.Get(), POLLIN, 0},
        {err_read.Get(), POLLIN, 0},
    };
    int open_streams = 2;

    while (open_streams > 0) {
      const int wait_ms = RemainingMs(deadline);
      if (wait_ms == 0) {
        KillAndReap(pid);
        return InvocationOutcome::Timeout();
      }

      const int ready = ::poll(fds, 2, wait_ms);
      if (ready < 0) {
        if (errno == EINTR) {
          continue;
        }
        const int err = errno;
        KillAndReap(pid);
        return InvocationOutcome::Error(ErrnoMessage("poll() failed", err));
      }

      for (int i = 0; i < 2; ++i) {
        if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
          continue;
        }
        std::string& sink = (i == 0) ? stdout_text : stderr_text;
        if (!DrainOnce(fds[i].fd, sink)) {
          // Negative fds are ignored by poll().
          fds[i].fd = -1;
          --open_streams;
        }
      }
    }

    // Both streams are closed; the child may still be running.
    int status = 0;
    while (true) {
      const pid_t w = ::waitpid(pid, &status, WNOHANG);
      if (w == pid) {
        break;
      }
      if (w < 0 && errno != EINTR) {
        return InvocationOutcome::Error(ErrnoMessage("waitpid() failed", errno));
      }
      if (RemainingMs(deadline) == 0) {
        KillAndReap(pid);
        return InvocationOutcome::Timeout();
      }
      ::usleep(10 * 1000);
    }

    return InvocationOutcome::Completed(std::move(stdout_text), std::move(stderr_text), DecodeWaitStatus(status));
  }
};

const IProcessRunner& GetDefaultProcessRunner() {
  static PosixProcessRunner r;
  return r;
}

} // namespace dumpconform::harness
