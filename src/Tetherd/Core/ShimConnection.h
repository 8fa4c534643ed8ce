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

#include "ShimSpawner.h"
#include "protos/Shim.grpc.pb.h"

namespace Tetherd {

using ShimStub = tether::grpc::shim::Shim::Stub;

struct ShimConnectParams {
  uint32_t Version{0};
  std::string Address;
  pid_t Pid{0};
};

// Decode the delimited ShimReady a shim writes on stdout.
TetherExpectedRich<ShimConnectParams> ParseStartResponse(
    const std::string& handshake);

/**
 * gRPC channel to one shim plus the supervision of its process.
 *
 * A monitor thread relays the shim's stderr line by line into the shim
 * logger and watches the pidfd. The on-close callback fires exactly once,
 * either when the process exits or when Close() is called, and the log pipe
 * is released right after it.
 */
class ShimConnection {
 public:
  using OnCloseCb = std::function<void()>;

  ShimConnection(std::string address, std::shared_ptr<grpc::Channel> channel,
                 std::unique_ptr<ShimProcess> process,
                 std::shared_ptr<spdlog::logger> logger, OnCloseCb on_close);
  ~ShimConnection();

  ShimConnection(const ShimConnection&) = delete;
  ShimConnection& operator=(const ShimConnection&) = delete;

  // Nullptr once closed. Callers keep the returned stub for one RPC.
  std::shared_ptr<ShimStub> GetStub() const;

  std::string Address() const;

  // Point the channel at a new address, e.g. after the socket moved.
  TetherExpectedRich<void> Reconnect(const std::string& address,
                                     absl::Time deadline);

  void SetLogger(std::shared_ptr<spdlog::logger> logger);

  // Returns false if on-close has already fired, in which case cb is dropped.
  bool SetOnClose(OnCloseCb cb);

  // Close() waits for the process to leave on its own for a grace period
  // before killing it.
  void MarkShutdownRequested();

  void Close();
  bool IsClosed() const;

  // 0 when the shim is not a child of this daemon.
  pid_t Pid() const;

 private:
  void MonitorThread_();
  void RelayLogLines_(std::string_view chunk, bool flush);
  void FireOnClose_();

  std::shared_ptr<spdlog::logger> GetLogger_() const;

  std::unique_ptr<ShimProcess> m_process_;
  int m_stop_efd_{-1};
  std::thread m_monitor_thread_;
  std::string m_log_partial_line_;

  std::atomic_bool m_shutdown_requested_{false};

  mutable absl::Mutex m_mtx_;
  bool m_closed_ ABSL_GUARDED_BY(m_mtx_){false};
  bool m_on_close_fired_ ABSL_GUARDED_BY(m_mtx_){false};
  OnCloseCb m_on_close_ ABSL_GUARDED_BY(m_mtx_);
  std::string m_address_ ABSL_GUARDED_BY(m_mtx_);
  std::shared_ptr<grpc::Channel> m_channel_ ABSL_GUARDED_BY(m_mtx_);
  std::shared_ptr<ShimStub> m_stub_ ABSL_GUARDED_BY(m_mtx_);
  std::shared_ptr<spdlog::logger> m_logger_ ABSL_GUARDED_BY(m_mtx_);
};

/**
 * @brief Open a channel to the address of a freshly launched shim and wait
 * until it is connected, at most kShimConnectTimeout and never past the
 * deadline.
 * @return ERR_CONNECTION_TIMEOUT if the shim can not be reached. The
 * process is not touched in this case; the caller decides its fate.
 */
TetherExpectedRich<std::unique_ptr<ShimConnection>> MakeConnection(
    const ShimConnectParams& params, std::unique_ptr<ShimProcess>& process,
    std::shared_ptr<spdlog::logger> logger, ShimConnection::OnCloseCb on_close,
    absl::Time deadline);

}  // namespace Tetherd
