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

#include "ShimPublicDefs.h"
// Precompiled header comes first.

#include "protos/Shim.pb.h"

namespace Tetherd::Shim {

struct TaskExitStatus {
  pid_t Pid{0};
  uint32_t ExitStatus{0};
  absl::Time ExitedAt;
};

/**
 * The single task a shim supervises.
 * Create() prepares the task without running it, Start() lets it run.
 */
class ContainerRuntime {
 public:
  using ExitCb = std::function<void(const TaskExitStatus&)>;

  virtual ~ContainerRuntime() = default;

  virtual TetherExpectedRich<pid_t> Create(
      const tether::grpc::shim::CreateRequest& request) = 0;

  virtual TetherExpectedRich<pid_t> Start() = 0;

  virtual TetherExpectedRich<void> Kill(uint32_t signal, bool all) = 0;

  virtual TetherExpectedRich<TaskExitStatus> Wait(absl::Time deadline) = 0;

  // Forget a task which is not running.
  virtual TetherExpectedRich<TaskExitStatus> Delete() = 0;

  // True between Start() and the exit of the task.
  virtual bool IsRunning() const = 0;
};

/**
 * Runs the task as a plain child process. The child is forked at Create()
 * and held on a pipe until Start(). Rootfs mounts are recorded only.
 */
class ProcessRuntime final : public ContainerRuntime {
 public:
  explicit ProcessRuntime(ExitCb on_exit);
  ~ProcessRuntime() override;

  TetherExpectedRich<pid_t> Create(
      const tether::grpc::shim::CreateRequest& request) override;
  TetherExpectedRich<pid_t> Start() override;
  TetherExpectedRich<void> Kill(uint32_t signal, bool all) override;
  TetherExpectedRich<TaskExitStatus> Wait(absl::Time deadline) override;
  TetherExpectedRich<TaskExitStatus> Delete() override;
  bool IsRunning() const override;

 private:
  void MonitorThread_(pid_t pid);

  ExitCb m_on_exit_;

  mutable absl::Mutex m_mtx_;
  pid_t m_pid_ ABSL_GUARDED_BY(m_mtx_){0};
  int m_start_fd_ ABSL_GUARDED_BY(m_mtx_){-1};
  bool m_started_ ABSL_GUARDED_BY(m_mtx_){false};
  std::filesystem::path m_bundle_ ABSL_GUARDED_BY(m_mtx_);
  std::optional<TaskExitStatus> m_exit_ ABSL_GUARDED_BY(m_mtx_);

  std::unique_ptr<absl::Notification> m_exited_;
  std::thread m_monitor_thread_;
};

}  // namespace Tetherd::Shim
