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

#include "ContainerRuntime.h"
#include "protos/Shim.grpc.pb.h"
#include "protos/Shim.pb.h"

namespace Tetherd::Shim {

using grpc::Server;
using grpc::ServerContext;
using grpc::Status;

// Which container this shim serves. A warm shim has none until Bind.
struct ShimIdentity {
  bool Bound{false};
  std::string Id;
  std::string Namespace;
  std::filesystem::path Bundle;
};

class ShimServiceImpl : public tether::grpc::shim::Shim::Service {
 public:
  ShimServiceImpl(ShimIdentity identity, std::filesystem::path socket_path);

  grpc::Status Create(grpc::ServerContext* context,
                      const tether::grpc::shim::CreateRequest* request,
                      tether::grpc::shim::CreateReply* response) override;

  grpc::Status Start(grpc::ServerContext* context,
                     const tether::grpc::shim::StartRequest* request,
                     tether::grpc::shim::StartReply* response) override;

  grpc::Status Delete(grpc::ServerContext* context,
                      const tether::grpc::shim::DeleteRequest* request,
                      tether::grpc::shim::DeleteReply* response) override;

  grpc::Status Kill(grpc::ServerContext* context,
                    const tether::grpc::shim::KillRequest* request,
                    tether::grpc::shim::KillReply* response) override;

  grpc::Status Wait(grpc::ServerContext* context,
                    const tether::grpc::shim::WaitRequest* request,
                    tether::grpc::shim::WaitReply* response) override;

  grpc::Status Bind(grpc::ServerContext* context,
                    const tether::grpc::shim::BindRequest* request,
                    tether::grpc::shim::BindReply* response) override;

  grpc::Status Adopt(grpc::ServerContext* context,
                     const tether::grpc::shim::AdoptRequest* request,
                     tether::grpc::shim::AdoptReply* response) override;

  grpc::Status CheckStatus(
      grpc::ServerContext* context,
      const tether::grpc::shim::CheckStatusRequest* request,
      tether::grpc::shim::CheckStatusReply* response) override;

  grpc::Status Shutdown(grpc::ServerContext* context,
                        const tether::grpc::shim::ShutdownRequest* request,
                        tether::grpc::shim::ShutdownReply* response) override;

  ShimIdentity Identity() const;

 private:
  // Checks that the shim is bound and that id names its container.
  TetherExpectedRich<void> CheckTarget_(const std::string& id) const;

  void OnTaskExit_(const TaskExitStatus& exit);

  mutable absl::Mutex m_mtx_;
  ShimIdentity m_identity_ ABSL_GUARDED_BY(m_mtx_);
  std::filesystem::path m_socket_path_ ABSL_GUARDED_BY(m_mtx_);

  std::unique_ptr<ContainerRuntime> m_runtime_;
};

class ShimServer {
 public:
  ShimServer(const std::filesystem::path& socket_path, ShimIdentity identity);

  inline void Shutdown() { m_server_->Shutdown(); }

  inline void Wait() { m_server_->Wait(); }

 private:
  std::unique_ptr<ShimServiceImpl> m_service_impl_;
  std::unique_ptr<Server> m_server_;

  friend class ShimServiceImpl;
};

}  // namespace Tetherd::Shim

inline std::unique_ptr<Tetherd::Shim::ShimServer> g_server;
