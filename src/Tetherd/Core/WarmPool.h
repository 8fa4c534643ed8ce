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
#include "tether/BoundedChannel.h"

namespace Tetherd {

/**
 * A shim started ahead of any container. It listens in its warm bundle until
 * Bind() attaches it to a real container bundle.
 */
class WarmShimInstance : public ShimHandle {
 public:
  WarmShimInstance(Bundle warm_bundle, std::unique_ptr<ShimConnection> conn,
                   std::shared_ptr<spdlog::logger> logger,
                   absl::Duration rpc_timeout,
                   std::filesystem::path state_root);

  /**
   * @brief Attach the shim to container id. The shim moves its socket into
   * <state-root>/<namespace>/<id> and this instance follows it there.
   * @return ERR_WARM_STATE without touching anything if the instance is not
   * Warming. Any other failure leaves the instance unusable; discard it.
   */
  TetherExpectedRich<void> Bind(const std::string& id, const CreateOpts& opts,
                                absl::Time deadline = absl::InfiniteFuture());

  void MarkActive();

  // Close the shim and remove every directory created for it. The bundle of
  // an Active instance belongs to its container and is kept.
  void Discard();

  ShimState State() const;
  const std::string& WarmID() const { return m_warm_id_; }
  std::string BoundID() const;

 private:
  const std::string m_warm_id_;
  const std::filesystem::path m_warm_bundle_path_;
  const std::filesystem::path m_state_root_;

  ShimState m_state_ ABSL_GUARDED_BY(m_mtx_){ShimState::Warming};
  bool m_bind_attempted_ ABSL_GUARDED_BY(m_mtx_){false};
  std::string m_bound_id_ ABSL_GUARDED_BY(m_mtx_);
  // Where a failed bind may have left a directory behind.
  std::filesystem::path m_bind_target_ ABSL_GUARDED_BY(m_mtx_);
};

// Non-positive size or take timeout fall back to the defaults.
WarmPoolConfig NormalizeWarmPoolConfig(WarmPoolConfig config);

/**
 * Bounded set of warm shims for one (namespace, runtime) pair.
 * Must be owned by a std::shared_ptr: Take() schedules a refill which keeps
 * the pool alive until it finishes.
 */
class WarmPool : public std::enable_shared_from_this<WarmPool> {
 public:
  WarmPool(std::string ns, std::string runtime, WarmPoolConfig config,
           ShimLaunchEnv env);
  ~WarmPool();

  WarmPool(const WarmPool&) = delete;
  WarmPool& operator=(const WarmPool&) = delete;

  // Warm up to Size shims. Individual failures are logged and skipped.
  TetherExpectedRich<void> Start();

  /**
   * @brief Hand out one idle shim, waiting at most the take timeout.
   * @return nullptr when nothing is available in time or the pool is closed.
   */
  std::shared_ptr<WarmShimInstance> Take(
      absl::Time deadline = absl::InfiniteFuture());

  void Close();

  bool IsClosed() const;
  size_t IdleCount() const { return m_shims_.Size(); }
  const WarmPoolConfig& Config() const { return m_config_; }

 private:
  TetherExpectedRich<void> WarmOne_();
  void ScheduleRefill_();
  std::string NextWarmID_() const;

  const std::string m_ns_;
  const std::string m_runtime_;
  const WarmPoolConfig m_config_;
  const ShimLaunchEnv m_env_;

  util::BoundedChannel<std::shared_ptr<WarmShimInstance>> m_shims_;

  // Serializes launches.
  absl::Mutex m_warm_mtx_;

  mutable absl::Mutex m_mtx_;
  bool m_closed_ ABSL_GUARDED_BY(m_mtx_){false};
};

}  // namespace Tetherd
