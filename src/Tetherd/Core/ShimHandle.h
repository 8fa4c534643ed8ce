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

namespace Tetherd {

// CreateRequest and BindRequest carry the same io and rootfs fields.
template <typename Request>
void FillRequestFromCreateOpts(const CreateOpts& opts, Request* request) {
  request->mutable_rootfs()->Add(opts.Rootfs.begin(), opts.Rootfs.end());
  request->set_stdin(opts.Stdin);
  request->set_stdout(opts.Stdout);
  request->set_stderr(opts.Stderr);
  request->set_terminal(opts.Terminal);
  request->set_options(opts.RuntimeOptions);
}

/**
 * Per-shim proxy: forwards task operations over the shim connection.
 * Every call takes the caller's deadline, tightened by the RPC timeout.
 * Once the connection is closed all calls fail with ERR_SHIM_CLOSED.
 */
class ShimHandle {
 public:
  ShimHandle(Bundle bundle, std::unique_ptr<ShimConnection> conn,
             std::shared_ptr<spdlog::logger> logger,
             absl::Duration rpc_timeout);
  virtual ~ShimHandle();

  ShimHandle(const ShimHandle&) = delete;
  ShimHandle& operator=(const ShimHandle&) = delete;

  std::string ID() const;
  std::string Namespace() const;
  Bundle GetBundle() const;

  std::shared_ptr<spdlog::logger> Logger() const;

  TetherExpectedRich<pid_t> Create(
      const CreateOpts& opts, absl::Time deadline = absl::InfiniteFuture());

  TetherExpectedRich<pid_t> Start(absl::Time deadline = absl::InfiniteFuture());

  TetherExpectedRich<void> Kill(uint32_t signal, bool all,
                                absl::Time deadline = absl::InfiniteFuture());

  // Blocks until the task exits. Not bounded by the RPC timeout.
  TetherExpectedRich<ExitInfo> Wait(
      absl::Time deadline = absl::InfiniteFuture());

  // Removes the bundle directory once the shim has deleted the task.
  TetherExpectedRich<ExitInfo> Delete(
      absl::Time deadline = absl::InfiniteFuture());

  // Ask the shim process to exit.
  TetherExpectedRich<void> Shutdown(
      absl::Time deadline = absl::InfiniteFuture());

  void Close();
  bool IsClosed() const;

  bool SetOnClose(ShimConnection::OnCloseCb cb);

  pid_t ShimPid() const;

 protected:
  std::shared_ptr<ShimStub> GetStub_() const;
  void SetLogger_(std::shared_ptr<spdlog::logger> logger);

  TetherRichError RpcError_(std::string_view method,
                            const grpc::Status& status) const;

  mutable absl::Mutex m_mtx_;
  Bundle m_bundle_ ABSL_GUARDED_BY(m_mtx_);
  std::shared_ptr<spdlog::logger> m_logger_ ABSL_GUARDED_BY(m_mtx_);

  const std::unique_ptr<ShimConnection> m_conn_;
  const absl::Duration m_rpc_timeout_;
};

}  // namespace Tetherd
