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

#include "TetherdPreCompiledHeader.h"
// Precompiled header comes first

#include "protos/PublicDefs.pb.h"

namespace Tetherd {

enum class ShimState : std::uint8_t {
  // Pre-started, not bound to any container yet.
  Warming = 0,
  Bound,
  Active,
};

inline std::string_view ShimStateName(ShimState state) {
  switch (state) {
  case ShimState::Warming:
    return "Warming";
  case ShimState::Bound:
    return "Bound";
  case ShimState::Active:
    return "Active";
  }
  return "Unknown";
}

struct WarmPoolConfig {
  bool Enabled{false};
  int Size{kDefaultWarmPoolSize};
  absl::Duration TakeTimeout{kDefaultWarmPoolTakeTimeout};
};

struct PrewarmConfig {
  bool Enabled{false};
  // Empty means every runtime.
  std::unordered_set<std::string> Runtimes;

  [[nodiscard]] bool AppliesTo(const std::string& runtime) const {
    return Enabled && (Runtimes.empty() || Runtimes.contains(runtime));
  }
};

// Options of a container creation request which the shim needs either at
// Bind time (warm path) or at Create time.
struct CreateOpts {
  std::vector<tether::grpc::Mount> Rootfs;
  std::string Stdin;
  std::string Stdout;
  std::string Stderr;
  bool Terminal{false};
  // Opaque runtime options, passed through untouched.
  std::string RuntimeOptions;
  tether::grpc::ContainerSpec Spec;
};

struct ExitInfo {
  pid_t Pid{0};
  uint32_t ExitStatus{0};
  absl::Time ExitedAt;
};

struct Config {
  struct ShimConfig {
    // Runtime name -> shim binary path.
    std::unordered_map<std::string, std::filesystem::path> Runtimes;
    std::string DefaultRuntime;
    std::string DebugLevel;
    absl::Duration StartTimeout{kDefaultShimStartTimeout};
    absl::Duration RpcTimeout{kDefaultShimRpcTimeout};
    PrewarmConfig Prewarm;
    WarmPoolConfig WarmPool;
  };
  ShimConfig Shim;

  std::string TetherdDebugLevel;
  std::filesystem::path StateRoot;
  std::filesystem::path TetherdLogFile;
  std::filesystem::path TetherdUnixSockPath;
  std::filesystem::path TetherdMutexFilePath;
  uint64_t TetherdMaxLogFileSize{kDefaultTetherdMaxLogFileSize};
  uint64_t TetherdMaxLogFileNum{kDefaultTetherdMaxLogFileNum};
  bool TetherdForeground{};
};

inline Config g_config{};

}  // namespace Tetherd

inline std::unique_ptr<BS::thread_pool> g_thread_pool;
