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

#include "Bundle.h"
#include "ShimConnection.h"
#include "ShimSpawner.h"

namespace Tetherd {

// What the manager hands down to pools and launchers.
struct ShimLaunchEnv {
  std::filesystem::path StateRoot;
  std::string DaemonAddress;
  bool Debug{false};
  absl::Duration StartTimeout{kDefaultShimStartTimeout};
  absl::Duration RpcTimeout{kDefaultShimRpcTimeout};
  PrewarmConfig Prewarm;

  std::function<TetherExpectedRich<std::filesystem::path>(
      const std::string& runtime)>
      ResolveRuntimePath;

  std::shared_ptr<ShimSpawner> Spawner;
};

/**
 * Launches a shim binary for a bundle and turns its handshake into a
 * connection.
 */
class ShimBinary {
 public:
  ShimBinary(Bundle bundle, std::string runtime,
             std::filesystem::path runtime_path, const ShimLaunchEnv& env);

  /**
   * @brief Cold start. Runs the attempt plan (prewarm then start when
   * prewarming applies to the runtime, otherwise start alone) and records
   * the runtime path in the bundle.
   */
  TetherExpectedRich<std::unique_ptr<ShimConnection>> Start(
      std::shared_ptr<spdlog::logger> logger,
      const ShimConnection::OnCloseCb& on_close, absl::Time deadline);

  // Start an unbound shim listening in the (warm) bundle directory.
  TetherExpectedRich<std::unique_ptr<ShimConnection>> StartWarm(
      std::shared_ptr<spdlog::logger> logger,
      const ShimConnection::OnCloseCb& on_close, absl::Time deadline);

  // Run the delete action for a shim which is gone, then remove the bundle.
  TetherExpectedRich<ExitInfo> Delete(absl::Time deadline);

 private:
  struct LaunchAttempt {
    const char* Action;
    bool Recoverable;
  };

  std::vector<LaunchAttempt> AttemptPlan_() const;

  ShimCommand BuildCommand_(const char* action,
                            const std::filesystem::path& work_dir) const;

  TetherExpectedRich<std::unique_ptr<ShimConnection>> Launch_(
      const char* action, const std::filesystem::path& work_dir,
      std::shared_ptr<spdlog::logger> logger,
      const ShimConnection::OnCloseCb& on_close, absl::Time deadline);

  void Adopt_(ShimConnection* conn, absl::Time deadline) const;

  absl::Time LaunchDeadline_(absl::Time deadline) const;

  Bundle m_bundle_;
  std::string m_runtime_;
  std::filesystem::path m_runtime_path_;
  const ShimLaunchEnv& m_env_;
};

}  // namespace Tetherd
