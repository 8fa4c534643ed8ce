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

#include "ContainerRuntime.h"

#include <absl/strings/str_join.h>
#include <sys/wait.h>

namespace Tetherd::Shim {

namespace {

int OpenStdio(const std::string& path, int flags) {
  return open(path.empty() ? "/dev/null" : path.c_str(), flags | O_CLOEXEC,
              0644);
}

void CloseFds(std::initializer_list<int> fds) {
  for (int fd : fds)
    if (fd != -1) close(fd);
}

}  // namespace

ProcessRuntime::ProcessRuntime(ExitCb on_exit)
    : m_on_exit_(std::move(on_exit)) {}

ProcessRuntime::~ProcessRuntime() {
  {
    absl::MutexLock lk(&m_mtx_);
    if (m_start_fd_ != -1) {
      // The held child reads EOF and leaves.
      close(m_start_fd_);
      m_start_fd_ = -1;
    } else if (m_pid_ != 0 && !m_exit_.has_value()) {
      kill(-m_pid_, SIGKILL);
    }
  }

  if (m_monitor_thread_.joinable()) m_monitor_thread_.join();
}

TetherExpectedRich<pid_t> ProcessRuntime::Create(
    const tether::grpc::shim::CreateRequest& request) {
  if (request.terminal())
    return std::unexpected(FormatRichErr(tether::grpc::ERR_NOT_SUPPORTED,
                                         "Terminal mode is not supported"));

  if (request.spec().args().empty())
    return std::unexpected(FormatRichErr(tether::grpc::ERR_INVALID_PARAM,
                                         "No command given for task {}",
                                         request.id()));

  absl::MutexLock lk(&m_mtx_);
  if (m_pid_ != 0)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_EXISTING_TASK,
                                         "Task {} already created",
                                         request.id()));

  for (const auto& mount : request.rootfs())
    TETHER_DEBUG("Rootfs mount recorded: {} {} -> {} [{}]", mount.type(),
                 mount.source(), mount.target(),
                 absl::StrJoin(mount.options(), ","));

  std::vector<std::string> arg_strs(request.spec().args().begin(),
                                    request.spec().args().end());
  std::vector<char*> argv;
  for (auto& arg : arg_strs) argv.push_back(arg.data());
  argv.push_back(nullptr);

  std::vector<std::string> env_strs;
  for (const auto& [key, value] : request.spec().env())
    env_strs.emplace_back(fmt::format("{}={}", key, value));
  std::vector<char*> envp;
  for (auto& env : env_strs) envp.push_back(env.data());
  envp.push_back(nullptr);
  char** child_env = env_strs.empty() ? environ : envp.data();

  std::string bundle = request.bundle();

  // Opened here so that bad paths are reported to the caller.
  int in_fd = OpenStdio(request.stdin(), O_RDONLY);
  int out_fd = OpenStdio(request.stdout(), O_WRONLY | O_CREAT | O_APPEND);
  int err_fd = OpenStdio(request.stderr(), O_WRONLY | O_CREAT | O_APPEND);
  if (in_fd == -1 || out_fd == -1 || err_fd == -1) {
    int err = errno;
    CloseFds({in_fd, out_fd, err_fd});
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                         "Failed to open task stdio: {}",
                                         strerror(err)));
  }

  std::array<int, 2> start_pipe{};
  if (pipe2(start_pipe.data(), O_CLOEXEC) == -1) {
    int err = errno;
    CloseFds({in_fd, out_fd, err_fd});
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                         "Pipe creation failed: {}",
                                         strerror(err)));
  }

  pid_t child_pid = fork();
  if (child_pid == -1) {
    int err = errno;
    CloseFds({in_fd, out_fd, err_fd, start_pipe[0], start_pipe[1]});
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                         "fork() failed: {}", strerror(err)));
  }

  if (child_pid == 0) {  // Child proc
    // Dispositions ignored by the shim survive exec.
    for (int sig : {SIGINT, SIGTERM, SIGTSTP, SIGQUIT, SIGPIPE, SIGUSR1,
                    SIGUSR2, SIGALRM, SIGHUP})
      signal(sig, SIG_DFL);
    sigset_t empty_set;
    sigemptyset(&empty_set);
    sigprocmask(SIG_SETMASK, &empty_set, nullptr);

    // Own process group, so that Kill with all=true reaches every process.
    setpgid(0, 0);

    close(start_pipe[1]);
    char c;
    ssize_t n;
    do {
      n = read(start_pipe[0], &c, 1);
    } while (n == -1 && errno == EINTR);
    // EOF: the task was deleted or the shim died before Start.
    if (n != 1) _exit(1);

    if (dup2(in_fd, STDIN_FILENO) == -1 || dup2(out_fd, STDOUT_FILENO) == -1 ||
        dup2(err_fd, STDERR_FILENO) == -1)
      _exit(127);

    util::os::CloseFdFrom(3);

    if (!bundle.empty() && chdir(bundle.c_str()) == -1) {
      fmt::print(stderr, "Failed to chdir to {}: {}\n", bundle,
                 strerror(errno));
      _exit(127);
    }

    execvpe(argv[0], argv.data(), child_env);

    fmt::print(stderr, "Failed to exec {}: {}\n", argv[0], strerror(errno));
    _exit(127);
  }

  // Parent proc
  CloseFds({in_fd, out_fd, err_fd, start_pipe[0]});

  m_pid_ = child_pid;
  m_start_fd_ = start_pipe[1];
  m_bundle_ = bundle;
  m_exited_ = std::make_unique<absl::Notification>();

  if (!bundle.empty() &&
      !util::os::WriteFileAtomically(
          std::filesystem::path(bundle) / kShimInitPidFileName,
          std::to_string(child_pid), 0644))
    TETHER_WARN("Failed to record pid of task {} in {}", request.id(),
                bundle);

  m_monitor_thread_ = std::thread([this, child_pid] {
    MonitorThread_(child_pid);
  });

  TETHER_INFO("Task {} created, pid #{}: {}", request.id(), child_pid,
              absl::StrJoin(arg_strs, " "));
  return child_pid;
}

TetherExpectedRich<pid_t> ProcessRuntime::Start() {
  absl::MutexLock lk(&m_mtx_);
  if (m_pid_ == 0)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_NON_EXISTENT,
                                         "No task created"));

  if (m_started_)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_EXISTING_TASK,
                                         "Task #{} already started", m_pid_));

  if (m_exit_.has_value())
    return std::unexpected(FormatRichErr(tether::grpc::ERR_GENERIC_FAILURE,
                                         "Task #{} exited before start",
                                         m_pid_));

  char c = 1;
  if (write(m_start_fd_, &c, 1) != 1)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                         "Failed to start task #{}: {}",
                                         m_pid_, strerror(errno)));

  close(m_start_fd_);
  m_start_fd_ = -1;
  m_started_ = true;

  TETHER_INFO("Task #{} started.", m_pid_);
  return m_pid_;
}

TetherExpectedRich<void> ProcessRuntime::Kill(uint32_t signal, bool all) {
  absl::MutexLock lk(&m_mtx_);
  if (m_pid_ == 0)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_NON_EXISTENT,
                                         "No task created"));

  if (m_exit_.has_value())
    return std::unexpected(FormatRichErr(tether::grpc::ERR_NON_EXISTENT,
                                         "Task #{} already exited", m_pid_));

  pid_t target = all ? -m_pid_ : m_pid_;
  if (kill(target, static_cast<int>(signal)) != 0)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                         "kill({}, {}) failed: {}", target,
                                         signal, strerror(errno)));

  return {};
}

TetherExpectedRich<TaskExitStatus> ProcessRuntime::Wait(absl::Time deadline) {
  absl::Notification* exited;
  {
    absl::MutexLock lk(&m_mtx_);
    if (m_pid_ == 0)
      return std::unexpected(FormatRichErr(tether::grpc::ERR_NON_EXISTENT,
                                           "No task created"));
    exited = m_exited_.get();
  }

  if (!exited->WaitForNotificationWithDeadline(deadline))
    return std::unexpected(FormatRichErr(tether::grpc::ERR_GENERIC_FAILURE,
                                         "Timed out waiting for the task"));

  absl::MutexLock lk(&m_mtx_);
  return m_exit_.value();
}

TetherExpectedRich<TaskExitStatus> ProcessRuntime::Delete() {
  absl::Notification* exited;
  std::filesystem::path bundle;
  {
    absl::MutexLock lk(&m_mtx_);
    if (m_pid_ == 0)
      return std::unexpected(FormatRichErr(tether::grpc::ERR_NON_EXISTENT,
                                           "No task created"));

    if (m_started_ && !m_exit_.has_value())
      return std::unexpected(FormatRichErr(tether::grpc::ERR_INVALID_PARAM,
                                           "Task #{} is still running",
                                           m_pid_));

    if (m_start_fd_ != -1) {
      close(m_start_fd_);
      m_start_fd_ = -1;
    }
    exited = m_exited_.get();
    bundle = m_bundle_;
  }

  exited->WaitForNotification();

  if (!bundle.empty()) util::os::DeleteFile(bundle / kShimInitPidFileName);

  absl::MutexLock lk(&m_mtx_);
  return m_exit_.value();
}

bool ProcessRuntime::IsRunning() const {
  absl::MutexLock lk(&m_mtx_);
  return m_started_ && !m_exit_.has_value();
}

void ProcessRuntime::MonitorThread_(pid_t pid) {
  int status = 0;
  pid_t r;
  do {
    r = waitpid(pid, &status, 0);
  } while (r == -1 && errno == EINTR);

  TaskExitStatus exit{.Pid = pid, .ExitStatus = 0, .ExitedAt = absl::Now()};
  if (r == -1)
    exit.ExitStatus = 255;
  else if (WIFSIGNALED(status))
    exit.ExitStatus = 128 + WTERMSIG(status);
  else
    exit.ExitStatus = WEXITSTATUS(status);

  TETHER_INFO("Task #{} exited with status {}.", pid, exit.ExitStatus);

  {
    absl::MutexLock lk(&m_mtx_);
    m_exit_ = exit;
  }
  m_exited_->Notify();

  if (m_on_exit_) m_on_exit_(exit);
}

}  // namespace Tetherd::Shim
