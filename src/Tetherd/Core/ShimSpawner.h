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

#pragma once

#include "TetherdPublicDefs.h"
// Precompiled header comes first.

namespace Tetherd {

// What to run for one shim launch.
struct ShimCommand {
  std::filesystem::path Runtime;
  std::string DaemonAddress;
  // Empty means "/", used by warm shims which have no bundle yet.
  std::filesystem::path WorkDir;
  // Action specific arguments, the action keyword last.
  std::vector<std::string> Args;
  bool Debug{false};
};

/**
 * A spawned shim process. Owns the pidfd and the read end of the pipe bound
 * to the child's stderr. The process is reaped at most once.
 */
class ShimProcess {
 public:
  ShimProcess(pid_t pid, int pidfd, int log_fd);
  ~ShimProcess();

  ShimProcess(const ShimProcess&) = delete;
  ShimProcess& operator=(const ShimProcess&) = delete;

  pid_t Pid() const { return m_pid_; }
  int Pidfd() const { return m_pidfd_; }
  int LogFd() const;

  void CloseLogFd();

  // Non-blocking reap. Returns the wait status if the process is gone.
  std::optional<int> TryReap();

  // Wait until the process exits or the deadline passes.
  std::optional<int> WaitExit(absl::Time deadline);

  // SIGKILL and reap, unless it is already reaped.
  int KillAndReap();

  // Whatever the child has written to stderr so far, without blocking.
  std::string DrainLog();

 private:
  std::optional<int> ReapLocked_(int options)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(m_mtx_);

  const pid_t m_pid_;
  const int m_pidfd_;

  mutable absl::Mutex m_mtx_;
  int m_log_fd_ ABSL_GUARDED_BY(m_mtx_);
  std::optional<int> m_wait_status_ ABSL_GUARDED_BY(m_mtx_);
};

struct SpawnedShim {
  // Everything the shim wrote on stdout before closing it.
  std::string Handshake;
  // Null for shims which are not child processes of this daemon.
  std::unique_ptr<ShimProcess> Process;
};

class ShimSpawner {
 public:
  virtual ~ShimSpawner() = default;

  /**
   * @brief Launch a shim and collect its handshake.
   * @return ERR_SPAWN_FAILED when the process can not be started or exits
   * without a handshake, ERR_CONNECTION_TIMEOUT when the deadline passes
   * first. The child is killed and reaped on every failure.
   */
  virtual TetherExpectedRich<SpawnedShim> Spawn(const ShimCommand& cmd,
                                                absl::Time deadline) = 0;
};

// fork/exec of the runtime binary, handshake read from its stdout.
class ProcessSpawner final : public ShimSpawner {
 public:
  TetherExpectedRich<SpawnedShim> Spawn(const ShimCommand& cmd,
                                        absl::Time deadline) override;
};

}  // namespace Tetherd
