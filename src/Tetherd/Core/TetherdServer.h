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

#include "protos/Tether.grpc.pb.h"
#include "protos/Tether.pb.h"

namespace Tetherd {

using grpc::Server;
using grpc::ServerContext;
using grpc::Status;

class TetherdServiceImpl : public tether::grpc::Tetherd::Service {
 public:
  TetherdServiceImpl() = default;

  grpc::Status CreateTask(grpc::ServerContext* context,
                          const tether::grpc::CreateTaskRequest* request,
                          tether::grpc::CreateTaskReply* response) override;

  grpc::Status StartTask(grpc::ServerContext* context,
                         const tether::grpc::TaskRef* request,
                         tether::grpc::StartTaskReply* response) override;

  grpc::Status KillTask(grpc::ServerContext* context,
                        const tether::grpc::KillTaskRequest* request,
                        tether::grpc::KillTaskReply* response) override;

  grpc::Status WaitTask(grpc::ServerContext* context,
                        const tether::grpc::TaskRef* request,
                        tether::grpc::WaitTaskReply* response) override;

  grpc::Status DeleteTask(grpc::ServerContext* context,
                          const tether::grpc::TaskRef* request,
                          tether::grpc::DeleteTaskReply* response) override;

  grpc::Status PublishTaskExit(
      grpc::ServerContext* context, const tether::grpc::TaskExit* request,
      tether::grpc::PublishTaskExitReply* response) override;
};

class TetherdServer {
 public:
  explicit TetherdServer(const std::filesystem::path& unix_socket_path);

  inline void Shutdown() { m_server_->Shutdown(); }

  inline void Wait() { m_server_->Wait(); }

 private:
  std::unique_ptr<TetherdServiceImpl> m_service_impl_;
  std::unique_ptr<Server> m_server_;

  friend class TetherdServiceImpl;
};

}  // namespace Tetherd

inline std::unique_ptr<Tetherd::TetherdServer> g_server;
