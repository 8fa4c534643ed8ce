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

#include "ShimManager.h"

#include "tether/String.h"

namespace Tetherd {

TetherExpectedRich<std::filesystem::path> ResolveRuntimePathIn(
    const std::unordered_map<std::string, std::filesystem::path>& runtimes,
    const std::string& default_runtime, const std::string& runtime) {
  const std::string& name = runtime.empty() ? default_runtime : runtime;

  if (auto it = runtimes.find(name); it != runtimes.end()) return it->second;

  std::filesystem::path path(name);
  if (path.is_absolute()) return path;

  return std::unexpected(FormatRichErr(tether::grpc::ERR_RUNTIME_NOT_FOUND,
                                       "Runtime '{}' is not configured",
                                       name));
}

TetherExpectedRich<ExitInfo> CleanupDeadShim(
    const ShimLaunchEnv& env, const std::shared_ptr<ShimHandle>& handle,
    absl::Time deadline) {
  handle->Close();

  Bundle bundle = handle->GetBundle();
  std::string runtime_path =
      util::ReadFileIntoString(bundle.Path / kShimBinaryPathFileName);
  if (runtime_path.empty()) {
    TETHER_LOGGER_WARN(handle->Logger(),
                       "No shim binary recorded in {}, removing the bundle.",
                       bundle.Path.string());
    if (!bundle.Delete())
      TETHER_LOGGER_WARN(handle->Logger(), "Failed to remove bundle {}",
                         bundle.Path.string());
    return ExitInfo{.Pid = 0, .ExitStatus = 0, .ExitedAt = absl::Now()};
  }

  ShimBinary binary(bundle, "", runtime_path, env);
  auto r = binary.Delete(deadline);
  if (!r) {
    TETHER_LOGGER_WARN(handle->Logger(), "Shim delete action failed: {}",
                       r.error().description());
    if (!bundle.Delete())
      TETHER_LOGGER_WARN(handle->Logger(), "Failed to remove bundle {}",
                         bundle.Path.string());
  }
  return r;
}

ShimManager::ShimManager(ShimManagerOptions options)
    : m_options_(std::move(options)) {
  ShimLaunchEnv env = m_options_.Env;
  if (!env.ResolveRuntimePath) {
    env.ResolveRuntimePath = [runtimes = m_options_.Runtimes,
                              default_runtime = m_options_.DefaultRuntime](
                                 const std::string& runtime) {
      return ResolveRuntimePathIn(runtimes, default_runtime, runtime);
    };
  }
  if (!env.Spawner) env.Spawner = std::make_shared<ProcessSpawner>();

  m_env_ = std::make_shared<const ShimLaunchEnv>(std::move(env));
}

ShimManager::~ShimManager() { Shutdown(); }

TetherExpectedRich<std::filesystem::path> ShimManager::ResolveRuntimePath(
    const std::string& runtime) const {
  return m_env_->ResolveRuntimePath(runtime);
}

TetherExpectedRich<void> ShimManager::Reserve_(const ShimKey& key) {
  absl::MutexLock lk(&m_mtx_);
  if (m_shims_.contains(key) || m_starting_.contains(key))
    return std::unexpected(FormatRichErr(tether::grpc::ERR_EXISTING_TASK,
                                         "Task {}/{} already exists",
                                         key.first, key.second));

  m_starting_.insert(key);
  return {};
}

void ShimManager::ReleaseReservation_(const ShimKey& key) {
  absl::MutexLock lk(&m_mtx_);
  m_starting_.erase(key);
}

TetherExpectedRich<std::shared_ptr<ShimHandle>> ShimManager::Start(
    const std::string& ns, const std::string& id, const std::string& runtime,
    const CreateOpts& opts, absl::Time deadline) {
  if (m_shutting_down_.load(std::memory_order_acquire))
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SHUTTING_DOWN,
                                         "Shim manager is shutting down"));

  if (!IsValidBundleComponent(ns) || !IsValidBundleComponent(id) ||
      ns == kWarmBundleDirName)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_INVALID_PARAM,
                                         "Invalid namespace or id: '{}/{}'",
                                         ns, id));

  std::string runtime_name =
      runtime.empty() ? m_options_.DefaultRuntime : runtime;

  ShimKey key{ns, id};
  if (auto r = Reserve_(key); !r) return std::unexpected(r.error());

  if (m_options_.WarmPool.Enabled) {
    auto handle = TryWarmStart_(key, runtime_name, opts, deadline);
    if (handle) {
      ReleaseReservation_(key);
      return handle;
    }
    if (m_shutting_down_.load(std::memory_order_acquire)) {
      ReleaseReservation_(key);
      return std::unexpected(FormatRichErr(tether::grpc::ERR_SHUTTING_DOWN,
                                           "Shim manager is shutting down"));
    }
  }

  auto handle = ColdStart_(key, runtime_name, deadline);
  ReleaseReservation_(key);
  return handle;
}

std::shared_ptr<WarmPool> ShimManager::GetOrCreatePool_(
    const std::string& ns, const std::string& runtime) {
  PoolKey key{ns, runtime};
  {
    absl::ReaderMutexLock lk(&m_pool_mtx_);
    if (m_pools_closed_) return nullptr;
    if (auto it = m_pools_.find(key); it != m_pools_.end()) return it->second;
  }

  std::shared_ptr<WarmPool> pool;
  {
    absl::MutexLock lk(&m_pool_mtx_);
    if (m_pools_closed_) return nullptr;

    auto [it, inserted] = m_pools_.try_emplace(key, nullptr);
    if (!inserted) return it->second;

    it->second = std::make_shared<WarmPool>(ns, runtime, m_options_.WarmPool,
                                            *m_env_);
    pool = it->second;
  }

  TETHER_INFO("Created warm pool for {}/{} of size {}.", ns, runtime,
              pool->Config().Size);

  g_thread_pool->detach_task([pool] {
    if (auto r = pool->Start(); !r)
      TETHER_DEBUG("Warm pool did not start: {}", r.error().description());
  });

  return pool;
}

std::shared_ptr<WarmPool> ShimManager::GetWarmPool(
    const std::string& ns, const std::string& runtime) const {
  absl::ReaderMutexLock lk(&m_pool_mtx_);
  auto it = m_pools_.find(PoolKey{ns, runtime});
  return it == m_pools_.end() ? nullptr : it->second;
}

std::shared_ptr<ShimHandle> ShimManager::TryWarmStart_(
    const ShimKey& key, const std::string& runtime, const CreateOpts& opts,
    absl::Time deadline) {
  const auto& [ns, id] = key;

  auto pool = GetOrCreatePool_(ns, runtime);
  if (!pool) return nullptr;

  auto instance = pool->Take(deadline);
  if (!instance) {
    TETHER_DEBUG("No warm shim for {}/{} ({}), starting cold.", ns, id,
                 runtime);
    return nullptr;
  }

  if (auto r = instance->Bind(id, opts, deadline); !r) {
    TETHER_WARN("Failed to bind warm shim {} to {}/{}, starting cold: {}",
                instance->WarmID(), ns, id, r.error().description());
    instance->Discard();
    return nullptr;
  }

  // Let a later cleanup find the binary, as for cold bundles.
  if (auto runtime_path = ResolveRuntimePath(runtime); runtime_path) {
    auto marker = instance->GetBundle().Path / kShimBinaryPathFileName;
    if (!util::os::WriteFileAtomically(marker, runtime_path.value().string(),
                                       0644))
      TETHER_LOGGER_WARN(instance->Logger(), "Failed to write {}",
                         marker.string());
  }

  if (auto r = Register_(key, instance); !r) {
    TETHER_LOGGER_WARN(instance->Logger(),
                       "Bound warm shim lost before registration: {}",
                       r.error().description());
    instance->Discard();
    return nullptr;
  }

  instance->MarkActive();
  TETHER_LOGGER_INFO(instance->Logger(), "Started from warm shim {}.",
                     instance->WarmID());
  return instance;
}

TetherExpectedRich<std::shared_ptr<ShimHandle>> ShimManager::ColdStart_(
    const ShimKey& key, const std::string& runtime, absl::Time deadline) {
  const auto& [ns, id] = key;

  auto runtime_path = ResolveRuntimePath(runtime);
  if (!runtime_path) return std::unexpected(runtime_path.error());

  auto bundle = NewBundle(m_env_->StateRoot, ns, id);
  if (!bundle) return std::unexpected(bundle.error());

  auto logger = CreateChildLogger(fmt::format("{}/{}", ns, id));

  ShimBinary binary(bundle.value(), runtime, runtime_path.value(), *m_env_);
  auto conn = binary.Start(
      logger, [logger] { TETHER_LOGGER_DEBUG(logger, "Shim disconnected."); },
      deadline);
  if (!conn) {
    if (!bundle.value().Delete())
      TETHER_WARN("Failed to remove bundle {}", bundle.value().Path.string());
    return std::unexpected(conn.error());
  }

  auto handle = std::make_shared<ShimHandle>(
      bundle.value(), std::move(conn.value()), logger, m_env_->RpcTimeout);

  if (auto r = Register_(key, handle); !r) {
    handle->Close();
    if (!bundle.value().Delete())
      TETHER_WARN("Failed to remove bundle {}", bundle.value().Path.string());
    return std::unexpected(r.error());
  }

  TETHER_LOGGER_INFO(logger, "Started cold, shim #{}.", handle->ShimPid());
  return handle;
}

TetherExpectedRich<void> ShimManager::Register_(
    const ShimKey& key, const std::shared_ptr<ShimHandle>& handle) {
  // Checked under the same lock Shutdown() swaps the table with.
  absl::MutexLock lk(&m_mtx_);
  if (m_shutting_down_.load(std::memory_order_acquire))
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SHUTTING_DOWN,
                                         "Shim manager is shutting down"));

  // Live handles are all closed by Shutdown(), so the callback never
  // outlives the manager. A callback fired meanwhile waits for m_mtx_.
  const ShimHandle* raw = handle.get();
  if (!handle->SetOnClose([this, key, raw] { OnShimClosed_(key, raw); }))
    return std::unexpected(FormatRichErr(tether::grpc::ERR_CONNECTION_ABORTED,
                                         "Shim of {}/{} exited during start",
                                         key.first, key.second));

  m_shims_.insert_or_assign(key, handle);
  return {};
}

void ShimManager::OnShimClosed_(const ShimKey& key, const ShimHandle* handle) {
  std::shared_ptr<ShimHandle> dead;
  {
    absl::MutexLock lk(&m_mtx_);
    auto it = m_shims_.find(key);
    // Removed on purpose before being closed.
    if (it == m_shims_.end() || it->second.get() != handle) return;

    dead = std::move(it->second);
    m_shims_.erase(it);
  }

  TETHER_LOGGER_WARN(dead->Logger(), "Shim exited unexpectedly.");

  // Also moves the last reference off the monitor thread.
  g_thread_pool->detach_task([env = m_env_, dead = std::move(dead)] {
    auto r = CleanupDeadShim(*env, dead, absl::Now() + env->StartTimeout);
    if (!r)
      TETHER_LOGGER_WARN(dead->Logger(), "Cleanup of dead shim failed: {}",
                         r.error().description());
  });
}

std::shared_ptr<ShimHandle> ShimManager::Get(const std::string& ns,
                                             const std::string& id) const {
  absl::ReaderMutexLock lk(&m_mtx_);
  auto it = m_shims_.find(ShimKey{ns, id});
  return it == m_shims_.end() ? nullptr : it->second;
}

size_t ShimManager::LiveCount() const {
  absl::ReaderMutexLock lk(&m_mtx_);
  return m_shims_.size();
}

TetherExpectedRich<ExitInfo> ShimManager::Delete(const std::string& ns,
                                                 const std::string& id,
                                                 absl::Time deadline) {
  ShimKey key{ns, id};
  std::shared_ptr<ShimHandle> handle;
  {
    absl::MutexLock lk(&m_mtx_);
    auto it = m_shims_.find(key);
    if (it == m_shims_.end())
      return std::unexpected(FormatRichErr(tether::grpc::ERR_NON_EXISTENT,
                                           "Task {}/{} not found", ns, id));
    handle = std::move(it->second);
    m_shims_.erase(it);
  }

  if (handle->IsClosed()) return CleanupDeadShim(*m_env_, handle, deadline);

  auto r = handle->Delete(deadline);
  if (!r) {
    if (!handle->IsClosed()) {
      bool restored;
      {
        absl::MutexLock lk(&m_mtx_);
        restored = m_shims_.try_emplace(key, handle).second;
      }
      if (!restored) {
        TETHER_LOGGER_WARN(handle->Logger(),
                           "Task {}/{} was started again during a refused "
                           "delete, closing the old shim.",
                           ns, id);
        handle->Close();
      }
    }
    return r;
  }

  if (auto s = handle->Shutdown(deadline); !s)
    TETHER_LOGGER_DEBUG(handle->Logger(), "Shutdown after delete: {}",
                        s.error().description());
  handle->Close();

  return r;
}

void ShimManager::Remove(const std::string& ns, const std::string& id,
                         absl::Time deadline) {
  std::shared_ptr<ShimHandle> handle;
  {
    absl::MutexLock lk(&m_mtx_);
    auto it = m_shims_.find(ShimKey{ns, id});
    if (it == m_shims_.end()) return;
    handle = std::move(it->second);
    m_shims_.erase(it);
  }

  if (auto s = handle->Shutdown(deadline); !s)
    TETHER_LOGGER_DEBUG(handle->Logger(), "Shutdown on removal: {}",
                        s.error().description());
  handle->Close();

  Bundle bundle = handle->GetBundle();
  if (!bundle.Delete())
    TETHER_LOGGER_WARN(handle->Logger(), "Failed to remove bundle {}",
                       bundle.Path.string());
}

void ShimManager::CloseWarmPools() {
  absl::flat_hash_map<PoolKey, std::shared_ptr<WarmPool>> pools;
  {
    absl::MutexLock lk(&m_pool_mtx_);
    m_pools_closed_ = true;
    pools.swap(m_pools_);
  }

  for (auto& [key, pool] : pools) pool->Close();
}

void ShimManager::Shutdown() {
  {
    absl::MutexLock lk(&m_mtx_);
    m_shutting_down_.store(true, std::memory_order_release);
  }

  CloseWarmPools();

  absl::flat_hash_map<ShimKey, std::shared_ptr<ShimHandle>> shims;
  {
    absl::MutexLock lk(&m_mtx_);
    shims.swap(m_shims_);
  }

  for (auto& [key, handle] : shims) handle->Close();

  if (!shims.empty())
    TETHER_INFO("Shim manager closed {} live shim(s).", shims.size());
}

}  // namespace Tetherd
