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

#include "ShimBinary.h"
#include "ShimHandle.h"
#include "WarmPool.h"

namespace Tetherd {

struct ShimManagerOptions {
  // ResolveRuntimePath is provided by the manager and may be left empty.
  ShimLaunchEnv Env;
  // Runtime name -> shim binary path.
  std::unordered_map<std::string, std::filesystem::path> Runtimes;
  std::string DefaultRuntime;
  WarmPoolConfig WarmPool;
};

/**
 * @brief Look a runtime up by name. An unknown absolute path is accepted as
 * the binary itself. An empty name means the default runtime.
 */
TetherExpectedRich<std::filesystem::path> ResolveRuntimePathIn(
    const std::unordered_map<std::string, std::filesystem::path>& runtimes,
    const std::string& default_runtime, const std::string& runtime);

/**
 * Owns the live shim table and the warm pools.
 *
 * Start() takes a warm shim when pooling is enabled and one is available
 * within the take timeout, and falls back to a cold start on a miss or on any
 * bind failure. A shim which exits on its own is dropped from the table and
 * its bundle is cleaned up in the background.
 */
class ShimManager {
 public:
  explicit ShimManager(ShimManagerOptions options);
  ~ShimManager();

  ShimManager(const ShimManager&) = delete;
  ShimManager& operator=(const ShimManager&) = delete;

  ShimManager(ShimManager&&) = delete;
  ShimManager& operator=(ShimManager&&) = delete;

  /**
   * @return ERR_EXISTING_TASK if (ns, id) is live or being started.
   * ERR_SHUTTING_DOWN if Shutdown() began before the shim was registered.
   * Warm path failures are never returned; cold start failures are.
   */
  TetherExpectedRich<std::shared_ptr<ShimHandle>> Start(
      const std::string& ns, const std::string& id, const std::string& runtime,
      const CreateOpts& opts, absl::Time deadline = absl::InfiniteFuture());

  std::shared_ptr<ShimHandle> Get(const std::string& ns,
                                  const std::string& id) const;

  /**
   * @brief Delete the task of (ns, id), then shut the shim down. The entry
   * is kept if the shim refuses the deletion.
   */
  TetherExpectedRich<ExitInfo> Delete(
      const std::string& ns, const std::string& id,
      absl::Time deadline = absl::InfiniteFuture());

  // Drop (ns, id) without deleting its task, e.g. when Create failed.
  void Remove(const std::string& ns, const std::string& id,
              absl::Time deadline = absl::InfiniteFuture());

  // Later starts go the cold path.
  void CloseWarmPools();

  // Close pools and every live shim.
  void Shutdown();

  TetherExpectedRich<std::filesystem::path> ResolveRuntimePath(
      const std::string& runtime) const;

  std::shared_ptr<WarmPool> GetWarmPool(const std::string& ns,
                                        const std::string& runtime) const;

  size_t LiveCount() const;

 private:
  using PoolKey = std::pair<std::string, std::string>;

  TetherExpectedRich<void> Reserve_(const ShimKey& key);
  void ReleaseReservation_(const ShimKey& key);

  std::shared_ptr<WarmPool> GetOrCreatePool_(const std::string& ns,
                                             const std::string& runtime);

  // nullptr when the cold path has to take over.
  std::shared_ptr<ShimHandle> TryWarmStart_(const ShimKey& key,
                                            const std::string& runtime,
                                            const CreateOpts& opts,
                                            absl::Time deadline);

  TetherExpectedRich<std::shared_ptr<ShimHandle>> ColdStart_(
      const ShimKey& key, const std::string& runtime, absl::Time deadline);

  // ERR_SHUTTING_DOWN once Shutdown() began. The caller owns the cleanup.
  TetherExpectedRich<void> Register_(const ShimKey& key,
                                     const std::shared_ptr<ShimHandle>& handle);

  void OnShimClosed_(const ShimKey& key, const ShimHandle* handle);

  const ShimManagerOptions m_options_;
  // Shared with pools and background cleanups which may outlive a call.
  std::shared_ptr<const ShimLaunchEnv> m_env_;

  std::atomic_bool m_shutting_down_{false};

  mutable absl::Mutex m_mtx_;
  absl::flat_hash_map<ShimKey, std::shared_ptr<ShimHandle>> m_shims_
      ABSL_GUARDED_BY(m_mtx_);
  absl::flat_hash_set<ShimKey> m_starting_ ABSL_GUARDED_BY(m_mtx_);

  mutable absl::Mutex m_pool_mtx_;
  absl::flat_hash_map<PoolKey, std::shared_ptr<WarmPool>> m_pools_
      ABSL_GUARDED_BY(m_pool_mtx_);
  bool m_pools_closed_ ABSL_GUARDED_BY(m_pool_mtx_){false};
};

/**
 * @brief Clean up after a shim that is gone: run the delete action of the
 * binary recorded in the bundle, then remove the bundle.
 */
TetherExpectedRich<ExitInfo> CleanupDeadShim(
    const ShimLaunchEnv& env, const std::shared_ptr<ShimHandle>& handle,
    absl::Time deadline);

}  // namespace Tetherd

inline std::unique_ptr<Tetherd::ShimManager> g_shim_manager;
