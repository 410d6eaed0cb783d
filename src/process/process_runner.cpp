#include "process/process_runner.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace modforge::process {

namespace {

using core::errors::ErrorKind;
using core::errors::MakeError;

void CloseFd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Splits the byte stream on '\n' and hands complete lines to the sink as they
// arrive. Runs until EOF, i.e. until every writer of the pipe has exited.
void DrainOutput(int fd, const LineSink& sink, ProcessResult& result) {
  std::array<char, 4096> buffer{};
  std::string pending;

  const auto emit = [&](std::string line) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (sink) {
      sink(line);
    }
    result.lines.push_back(std::move(line));
  };

  while (true) {
    const ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }

    result.output.append(buffer.data(), static_cast<std::size_t>(n));
    pending.append(buffer.data(), static_cast<std::size_t>(n));

    std::size_t start = 0;
    std::size_t newline = 0;
    while ((newline = pending.find('\n', start)) != std::string::npos) {
      emit(pending.substr(start, newline - start));
      start = newline + 1;
    }
    pending.erase(0, start);
  }

  if (!pending.empty()) {
    emit(std::move(pending));
  }
}

int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}

bool WaitBlocking(pid_t pid, int& status) {
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return false;
    }
  }
  return true;
}

// Polls the child until it exits or the deadline passes. On timeout the whole
// process group led by the child is killed, so helpers it forked cannot keep
// the output pipe open, and the child is reaped.
bool WaitWithDeadline(pid_t pid, std::chrono::seconds timeout, int& status, bool& timed_out) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    const pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == pid) {
      return true;
    }
    if (ret < 0 && errno != EINTR) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  timed_out = true;
  if (kill(-pid, SIGKILL) != 0) {
    kill(pid, SIGKILL);
  }
  return WaitBlocking(pid, status);
}

} // namespace

std::string DescribeCommand(const ProcessRequest& request) {
  std::string text = request.executable.string();
  for (const auto& arg : request.arguments) {
    text.push_back(' ');
    text += arg;
  }
  return text;
}

bool PosixProcessRunner::Run(const ProcessRequest& request, ProcessResult& result,
                             core::errors::Error& error) {
  result = ProcessResult{};
  error.Clear();

  if (request.executable.empty()) {
    error = MakeError(ErrorKind::kProcessLaunch, "executable path cannot be empty");
    return false;
  }

  // argv must be built before fork; the child only calls async-signal-safe code.
  const std::string exe_path = request.executable.string();
  std::vector<char*> argv;
  argv.reserve(request.arguments.size() + 2);
  argv.push_back(const_cast<char*>(exe_path.c_str()));
  for (const auto& arg : request.arguments) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  int output_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (pipe2(output_pipe, O_CLOEXEC) != 0) {
    error = MakeError(ErrorKind::kProcessLaunch, "failed to create output pipe for " + exe_path +
                                                     ": " + std::strerror(errno));
    return false;
  }
  if (pipe2(status_pipe, O_CLOEXEC) != 0) {
    const int saved_errno = errno;
    CloseFd(output_pipe[0]);
    CloseFd(output_pipe[1]);
    error = MakeError(ErrorKind::kProcessLaunch, "failed to create status pipe for " + exe_path +
                                                     ": " + std::strerror(saved_errno));
    return false;
  }

  // The reader starts before fork: it sees EOF once every copy of the write end
  // is closed, and a failure to start it leaves no child behind.
  std::thread drain;
  try {
    drain = std::thread(DrainOutput, output_pipe[0], std::cref(request.on_line), std::ref(result));
  } catch (const std::system_error& ex) {
    CloseFd(output_pipe[0]);
    CloseFd(output_pipe[1]);
    CloseFd(status_pipe[0]);
    CloseFd(status_pipe[1]);
    error = MakeError(ErrorKind::kProcessLaunch,
                      "failed to start output reader for " + exe_path + ": " + ex.what());
    return false;
  }

  // A bounded run gets its own process group so a timeout reaches grandchildren.
  const bool own_group = request.timeout.count() > 0;
  const pid_t pid = fork();
  if (pid < 0) {
    const int saved_errno = errno;
    CloseFd(output_pipe[1]);
    CloseFd(status_pipe[0]);
    CloseFd(status_pipe[1]);
    drain.join();
    CloseFd(output_pipe[0]);
    error = MakeError(ErrorKind::kProcessLaunch,
                      "failed to fork for " + exe_path + ": " + std::strerror(saved_errno));
    return false;
  }

  if (pid == 0) {
    // Child process. dup2 clears close-on-exec on the target descriptors.
    if (own_group) {
      setpgid(0, 0);
    }
    dup2(output_pipe[1], STDOUT_FILENO);
    if (request.merge_stderr) {
      dup2(output_pipe[1], STDERR_FILENO);
    }
    execv(exe_path.c_str(), argv.data());
    const int exec_errno = errno;
    ssize_t ignored = write(status_pipe[1], &exec_errno, sizeof(exec_errno));
    (void)ignored;
    _exit(127);
  }

  if (own_group) {
    // Also set from the parent so the group exists before any kill, whichever
    // side runs first. EACCES after exec is expected and harmless.
    setpgid(pid, pid);
  }
  CloseFd(output_pipe[1]);
  CloseFd(status_pipe[1]);

  int exec_errno = 0;
  ssize_t status_read = 0;
  do {
    status_read = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (status_read < 0 && errno == EINTR);
  CloseFd(status_pipe[0]);
  const bool launch_failed = status_read == static_cast<ssize_t>(sizeof(exec_errno));

  int status = 0;
  bool waited = false;
  if (launch_failed || request.timeout.count() <= 0) {
    waited = WaitBlocking(pid, status);
  } else {
    waited = WaitWithDeadline(pid, request.timeout, status, result.timed_out);
  }
  const int wait_errno = errno;

  drain.join();
  CloseFd(output_pipe[0]);

  if (launch_failed) {
    error = MakeError(ErrorKind::kProcessLaunch,
                      "unable to start " + exe_path + ": " + std::strerror(exec_errno));
    return false;
  }
  if (!waited) {
    error = MakeError(ErrorKind::kProcessLaunch,
                      "failed to wait for " + exe_path + ": " + std::strerror(wait_errno));
    return false;
  }

  result.exit_code = DecodeWaitStatus(status);
  return true;
}

} // namespace modforge::process
