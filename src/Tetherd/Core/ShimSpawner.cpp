/**
 * Copyright (c) 2024 Peking University and Peking University
 * Changsha Institute for Computing and Digital Economy
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "ShimSpawner.h"

#include <poll.h>
#include <sys/wait.h>

namespace Tetherd {

namespace {

int PollTimeoutMs(absl::Time deadline) {
  if (deadline == absl::InfiniteFuture()) return -1;
  absl::Duration left = deadline - absl::Now();
  if (left <= absl::ZeroDuration()) return 0;
  return static_cast<int>(absl::ToInt64Milliseconds(absl::Ceil(
      left, absl::Milliseconds(1))));
}

void ClosePipe(std::array<int, 2>& fds) {
  for (int& fd : fds) {
    if (fd != -1) close(fd);
    fd = -1;
  }
}

}  // namespace

ShimProcess::ShimProcess(pid_t pid, int pidfd, int log_fd)
    : m_pid_(pid), m_pidfd_(pidfd), m_log_fd_(log_fd) {}

ShimProcess::~ShimProcess() {
  absl::MutexLock lk(&m_mtx_);
  if (m_log_fd_ != -1) close(m_log_fd_);
  if (m_pidfd_ != -1) close(m_pidfd_);
}

int ShimProcess::LogFd() const {
  absl::MutexLock lk(&m_mtx_);
  return m_log_fd_;
}

void ShimProcess::CloseLogFd() {
  absl::MutexLock lk(&m_mtx_);
  if (m_log_fd_ != -1) close(m_log_fd_);
  m_log_fd_ = -1;
}

std::optional<int> ShimProcess::ReapLocked_(int options) {
  if (m_wait_status_.has_value()) return m_wait_status_;

  int status;
  pid_t r;
  do {
    r = waitpid(m_pid_, &status, options);
  } while (r == -1 && errno == EINTR);

  if (r == m_pid_) {
    m_wait_status_ = status;
  } else if (r == -1 && errno == ECHILD) {
    // Reaped elsewhere, nothing more to learn about it.
    m_wait_status_ = 0;
  }
  return m_wait_status_;
}

std::optional<int> ShimProcess::TryReap() {
  absl::MutexLock lk(&m_mtx_);
  return ReapLocked_(WNOHANG);
}

std::optional<int> ShimProcess::WaitExit(absl::Time deadline) {
  {
    absl::MutexLock lk(&m_mtx_);
    if (m_wait_status_.has_value()) return m_wait_status_;
  }

  pollfd pfd{.fd = m_pidfd_, .events = POLLIN, .revents = 0};
  while (true) {
    int r = poll(&pfd, 1, PollTimeoutMs(deadline));
    if (r == -1 && errno == EINTR) continue;
    if (r <= 0) break;

    absl::MutexLock lk(&m_mtx_);
    return ReapLocked_(0);
  }

  return TryReap();
}

int ShimProcess::KillAndReap() {
  absl::MutexLock lk(&m_mtx_);
  if (m_wait_status_.has_value()) return m_wait_status_.value();

  if (kill(m_pid_, SIGKILL) != 0 && errno != ESRCH)
    TETHER_WARN("Failed to kill shim #{}: {}", m_pid_, strerror(errno));

  return ReapLocked_(0).value_or(0);
}

std::string ShimProcess::DrainLog() {
  absl::MutexLock lk(&m_mtx_);
  std::string out;
  if (m_log_fd_ == -1) return out;

  std::array<char, 4096> buf{};
  while (true) {
    pollfd pfd{.fd = m_log_fd_, .events = POLLIN, .revents = 0};
    if (poll(&pfd, 1, 0) <= 0) break;
    ssize_t n = read(m_log_fd_, buf.data(), buf.size());
    if (n <= 0) break;
    out.append(buf.data(), n);
  }

  return out;
}

TetherExpectedRich<SpawnedShim> ProcessSpawner::Spawn(const ShimCommand& cmd,
                                                      absl::Time deadline) {
  std::array<int, 2> stdout_pipe{-1, -1};
  std::array<int, 2> log_pipe{-1, -1};

  if (pipe2(stdout_pipe.data(), O_CLOEXEC) == -1) {
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                         "Pipe creation failed: {}",
                                         strerror(errno)));
  }

  if (pipe2(log_pipe.data(), O_CLOEXEC) == -1) {
    int err = errno;
    ClosePipe(stdout_pipe);
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                         "Pipe creation failed: {}",
                                         strerror(err)));
  }

  // Build argv before fork. The child only reports exec failures on stderr,
  // which is the log pipe by then.
  std::vector<std::string> arg_strs;
  arg_strs.emplace_back(cmd.Runtime.string());
  arg_strs.emplace_back("--address");
  arg_strs.emplace_back(cmd.DaemonAddress);
  if (cmd.Debug) arg_strs.emplace_back("--debug");
  arg_strs.insert(arg_strs.end(), cmd.Args.begin(), cmd.Args.end());

  std::vector<char*> argv;
  argv.reserve(arg_strs.size() + 1);
  for (auto& arg : arg_strs) argv.push_back(arg.data());
  argv.push_back(nullptr);

  std::string work_dir = cmd.WorkDir.empty() ? "/" : cmd.WorkDir.string();

  pid_t child_pid = fork();
  if (child_pid == -1) {
    int err = errno;
    ClosePipe(stdout_pipe);
    ClosePipe(log_pipe);
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SPAWN_FAILED,
                                         "fork() failed: {}", strerror(err)));
  }

  if (child_pid == 0) {  // Child proc
    signal(SIGABRT, SIG_DFL);

    // The signal mask survives exec.
    sigset_t empty_set;
    sigemptyset(&empty_set);
    sigprocmask(SIG_SETMASK, &empty_set, nullptr);

    // Detach from the daemon's process group so that terminal signals sent
    // to the daemon do not hit the shims.
    setsid();

    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd == -1 || dup2(null_fd, STDIN_FILENO) == -1 ||
        dup2(stdout_pipe[1], STDOUT_FILENO) == -1 ||
        dup2(log_pipe[1], STDERR_FILENO) == -1)
      _exit(127);

    util::os::CloseFdFrom(3);

    if (chdir(work_dir.c_str()) == -1) {
      fmt::print(stderr, "Failed to chdir to {}: {}\n", work_dir,
                 strerror(errno));
      _exit(127);
    }

    execv(argv[0], argv.data());

    fmt::print(stderr, "Failed to execv {}: {}\n", argv[0], strerror(errno));
    _exit(127);
  }

  // Parent proc
  close(stdout_pipe[1]);
  close(log_pipe[1]);
  int stdout_fd = stdout_pipe[0];
  int log_fd = log_pipe[0];

  int pidfd = util::os::PidfdOpen(child_pid);
  auto process = std::make_unique<ShimProcess>(child_pid, pidfd, log_fd);
  if (pidfd == -1) {
    int err = errno;
    close(stdout_fd);
    process->KillAndReap();
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                         "pidfd_open({}) failed: {}",
                                         child_pid, strerror(err)));
  }

  util::os::SetFdNonBlocking(log_fd);

  TETHER_TRACE("Shim #{} spawned: {}", child_pid, absl::StrJoin(arg_strs, " "));

  // The shim closes its stdout right after writing the handshake.
  std::string handshake;
  std::array<char, 4096> buf{};
  bool eof = false;
  bool timed_out = false;
  while (!eof) {
    pollfd pfd{.fd = stdout_fd, .events = POLLIN, .revents = 0};
    int r = poll(&pfd, 1, PollTimeoutMs(deadline));
    if (r == -1) {
      if (errno == EINTR) continue;
      break;
    }
    if (r == 0) {
      timed_out = true;
      break;
    }

    ssize_t n = read(stdout_fd, buf.data(), buf.size());
    if (n > 0) {
      handshake.append(buf.data(), n);
    } else if (n == 0) {
      eof = true;
    } else if (errno != EINTR && errno != EAGAIN) {
      break;
    }
  }
  close(stdout_fd);

  if (timed_out) {
    process->KillAndReap();
    return std::unexpected(FormatRichErr(
        tether::grpc::ERR_CONNECTION_TIMEOUT,
        "Timed out waiting for the handshake of shim #{} ({})", child_pid,
        cmd.Runtime.string()));
  }

  if (!eof || handshake.empty()) {
    auto status = process->WaitExit(absl::Now() + kShimExitGracePeriod);
    if (!status.has_value()) status = process->KillAndReap();
    std::string log = process->DrainLog();
    return std::unexpected(FormatRichErr(
        tether::grpc::ERR_SPAWN_FAILED,
        "Shim #{} ({}) exited without handshake, status {}: {}", child_pid,
        cmd.Runtime.string(), status.value(), log));
  }

  return SpawnedShim{.Handshake = std::move(handshake),
                     .Process = std::move(process)};
}

}  // namespace Tetherd
