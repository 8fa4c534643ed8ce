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

#include "ShimServer.h"

#include <absl/strings/str_join.h>
#include <sys/stat.h>

#include "DaemonClient.h"

namespace Tetherd::Shim {

namespace {

template <typename Reply>
void SetReplyErr(const TetherRichError& err, Reply* response) {
  response->set_code(err.code());
  response->set_reason(err.description());
}

}  // namespace

ShimServiceImpl::ShimServiceImpl(ShimIdentity identity,
                                 std::filesystem::path socket_path)
    : m_identity_(std::move(identity)),
      m_socket_path_(std::move(socket_path)) {
  m_runtime_ = std::make_unique<ProcessRuntime>(
      [this](const TaskExitStatus& exit) { OnTaskExit_(exit); });
}

ShimIdentity ShimServiceImpl::Identity() const {
  absl::MutexLock lk(&m_mtx_);
  return m_identity_;
}

TetherExpectedRich<void> ShimServiceImpl::CheckTarget_(
    const std::string& id) const {
  absl::MutexLock lk(&m_mtx_);
  if (!m_identity_.Bound)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SHIM_NOT_BOUND,
                                         "Shim is not bound to a container"));

  if (!id.empty() && id != m_identity_.Id)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_INVALID_PARAM,
                                         "Shim serves {}, not {}",
                                         m_identity_.Id, id));
  return {};
}

void ShimServiceImpl::OnTaskExit_(const TaskExitStatus& exit) {
  ShimIdentity identity = Identity();

  tether::grpc::TaskExit event;
  event.set_namespace_(identity.Namespace);
  event.set_id(identity.Id);
  event.set_pid(exit.Pid);
  event.set_exit_status(exit.ExitStatus);
  *event.mutable_exited_at() =
      ToProtoTimestamp(absl::ToChronoTime(exit.ExitedAt));

  if (g_daemon_client) g_daemon_client->TaskExitAsync(std::move(event));
}

grpc::Status ShimServiceImpl::Create(
    grpc::ServerContext* context,
    const tether::grpc::shim::CreateRequest* request,
    tether::grpc::shim::CreateReply* response) {
  if (auto r = CheckTarget_(request->id()); !r) {
    SetReplyErr(r.error(), response);
    return Status::OK;
  }

  tether::grpc::shim::CreateRequest req = *request;
  if (req.bundle().empty()) req.set_bundle(Identity().Bundle.string());

  auto pid = m_runtime_->Create(req);
  if (!pid) {
    TETHER_WARN("Failed to create task {}: {}", req.id(),
                pid.error().description());
    SetReplyErr(pid.error(), response);
    return Status::OK;
  }

  response->set_code(tether::grpc::SUCCESS);
  response->set_pid(pid.value());
  return Status::OK;
}

grpc::Status ShimServiceImpl::Start(
    grpc::ServerContext* context,
    const tether::grpc::shim::StartRequest* request,
    tether::grpc::shim::StartReply* response) {
  if (auto r = CheckTarget_(request->id()); !r) {
    SetReplyErr(r.error(), response);
    return Status::OK;
  }

  auto pid = m_runtime_->Start();
  if (!pid) {
    SetReplyErr(pid.error(), response);
    return Status::OK;
  }

  response->set_code(tether::grpc::SUCCESS);
  response->set_pid(pid.value());
  return Status::OK;
}

grpc::Status ShimServiceImpl::Delete(
    grpc::ServerContext* context,
    const tether::grpc::shim::DeleteRequest* request,
    tether::grpc::shim::DeleteReply* response) {
  if (auto r = CheckTarget_(request->id()); !r) {
    SetReplyErr(r.error(), response);
    return Status::OK;
  }

  auto exit = m_runtime_->Delete();
  if (!exit) {
    // Nothing was ever created: deleting the container is trivially done.
    if (exit.error().code() == tether::grpc::ERR_NON_EXISTENT) {
      response->set_code(tether::grpc::SUCCESS);
      *response->mutable_exited_at() =
          ToProtoTimestamp(std::chrono::system_clock::now());
      return Status::OK;
    }
    SetReplyErr(exit.error(), response);
    return Status::OK;
  }

  response->set_code(tether::grpc::SUCCESS);
  response->set_pid(exit.value().Pid);
  response->set_exit_status(exit.value().ExitStatus);
  *response->mutable_exited_at() =
      ToProtoTimestamp(absl::ToChronoTime(exit.value().ExitedAt));
  return Status::OK;
}

grpc::Status ShimServiceImpl::Kill(
    grpc::ServerContext* context,
    const tether::grpc::shim::KillRequest* request,
    tether::grpc::shim::KillReply* response) {
  if (auto r = CheckTarget_(request->id()); !r) {
    SetReplyErr(r.error(), response);
    return Status::OK;
  }

  auto r = m_runtime_->Kill(request->signal(), request->all());
  if (!r) {
    SetReplyErr(r.error(), response);
    return Status::OK;
  }

  response->set_code(tether::grpc::SUCCESS);
  return Status::OK;
}

grpc::Status ShimServiceImpl::Wait(
    grpc::ServerContext* context,
    const tether::grpc::shim::WaitRequest* request,
    tether::grpc::shim::WaitReply* response) {
  if (auto r = CheckTarget_(request->id()); !r) {
    SetReplyErr(r.error(), response);
    return Status::OK;
  }

  auto exit = m_runtime_->Wait(ServerContextDeadline(context));
  if (!exit) {
    SetReplyErr(exit.error(), response);
    return Status::OK;
  }

  response->set_code(tether::grpc::SUCCESS);
  response->set_exit_status(exit.value().ExitStatus);
  *response->mutable_exited_at() =
      ToProtoTimestamp(absl::ToChronoTime(exit.value().ExitedAt));
  return Status::OK;
}

grpc::Status ShimServiceImpl::Bind(
    grpc::ServerContext* context,
    const tether::grpc::shim::BindRequest* request,
    tether::grpc::shim::BindReply* response) {
  absl::MutexLock lk(&m_mtx_);

  response->set_ready(false);
  if (g_config.Action != kShimActionWarmStart) {
    response->set_reason("Shim was not started warm");
    return Status::OK;
  }

  if (m_identity_.Bound) {
    response->set_reason(
        fmt::format("Shim is already bound to {}", m_identity_.Id));
    return Status::OK;
  }

  std::filesystem::path bundle = request->bundle();
  if (request->id().empty() || bundle.empty() || !bundle.is_absolute()) {
    response->set_reason("Bind needs an id and an absolute bundle path");
    return Status::OK;
  }

  if (!util::os::CreateFoldersWithMode(bundle, 0711)) {
    response->set_reason(fmt::format("Failed to create bundle {}", bundle));
    return Status::OK;
  }

  // The listening socket keeps working under its new name.
  std::filesystem::path new_socket = bundle / kShimSocketFileName;
  std::filesystem::path old_socket = m_socket_path_;
  if (rename(old_socket.c_str(), new_socket.c_str()) != 0) {
    response->set_reason(fmt::format("Failed to move {} to {}: {}", old_socket,
                                     new_socket, strerror(errno)));
    return Status::OK;
  }

  if (!util::os::WriteFileAtomically(
          bundle / kShimAddressFileName,
          fmt::format("unix://{}", new_socket.string()), 0644)) {
    // Put the socket back so that the daemon may still discard this shim.
    if (rename(new_socket.c_str(), old_socket.c_str()) != 0)
      TETHER_WARN("Failed to move {} back to {}", new_socket, old_socket);
    response->set_reason("Failed to write the address file");
    return Status::OK;
  }

  std::error_code ec;
  std::filesystem::remove(old_socket.parent_path(), ec);
  if (ec)
    TETHER_DEBUG("Warm bundle {} not removed: {}", old_socket.parent_path(),
                 ec.message());

  if (chdir(bundle.c_str()) != 0)
    TETHER_WARN("Failed to chdir to {}: {}", bundle, strerror(errno));

  for (const auto& mount : request->rootfs())
    TETHER_TRACE("Bind rootfs {} {} -> {} [{}]", mount.type(), mount.source(),
                 mount.target(), absl::StrJoin(mount.options(), ","));

  m_identity_.Bound = true;
  m_identity_.Id = request->id();
  m_identity_.Bundle = bundle;
  m_socket_path_ = new_socket;

  TETHER_INFO("Bound to container {} at {}.", request->id(), bundle);
  response->set_ready(true);
  return Status::OK;
}

grpc::Status ShimServiceImpl::Adopt(
    grpc::ServerContext* context,
    const tether::grpc::shim::AdoptRequest* request,
    tether::grpc::shim::AdoptReply* response) {
  absl::MutexLock lk(&m_mtx_);

  if (g_config.Action != kShimActionPrewarm) {
    response->set_ok(false);
    response->set_reason("Shim was not prewarmed");
    return Status::OK;
  }

  if (request->id() != m_identity_.Id ||
      request->namespace_() != m_identity_.Namespace ||
      std::filesystem::path(request->bundle()) != m_identity_.Bundle) {
    response->set_ok(false);
    response->set_reason(fmt::format("Shim serves {}/{}, not {}/{}",
                                     m_identity_.Namespace, m_identity_.Id,
                                     request->namespace_(), request->id()));
    return Status::OK;
  }

  if (chdir(m_identity_.Bundle.c_str()) != 0) {
    response->set_ok(false);
    response->set_reason(fmt::format("Failed to chdir to {}: {}",
                                     m_identity_.Bundle, strerror(errno)));
    return Status::OK;
  }

  TETHER_DEBUG("Adopted by the daemon for {}/{}.", m_identity_.Namespace,
               m_identity_.Id);
  response->set_ok(true);
  return Status::OK;
}

grpc::Status ShimServiceImpl::CheckStatus(
    grpc::ServerContext* context,
    const tether::grpc::shim::CheckStatusRequest* request,
    tether::grpc::shim::CheckStatusReply* response) {
  ShimIdentity identity = Identity();
  response->set_ok(true);
  response->set_id(identity.Id);
  response->set_bundle(identity.Bundle.string());
  response->set_shim_pid(getpid());
  response->set_bound(identity.Bound);
  return Status::OK;
}

grpc::Status ShimServiceImpl::Shutdown(
    grpc::ServerContext* context,
    const tether::grpc::shim::ShutdownRequest* request,
    tether::grpc::shim::ShutdownReply* response) {
  if (m_runtime_->IsRunning()) {
    TETHER_INFO("Shutdown ignored: the task is still running.");
    return Status::OK;
  }

  TETHER_INFO("Grpc shutdown request received.");
  g_thread_pool->detach_task([] { g_server->Shutdown(); });
  return Status::OK;
}

ShimServer::ShimServer(const std::filesystem::path& socket_path,
                       ShimIdentity identity) {
  m_service_impl_ =
      std::make_unique<ShimServiceImpl>(std::move(identity), socket_path);

  // A socket left by an earlier shim of the same bundle blocks bind().
  std::error_code ec;
  std::filesystem::remove(socket_path, ec);

  auto unix_socket_path = fmt::format("unix://{}", socket_path.string());
  grpc::ServerBuilder builder;
  ServerBuilderAddUnixInsecureListeningPort(&builder, unix_socket_path);
  builder.RegisterService(m_service_impl_.get());

  m_server_ = builder.BuildAndStart();
  if (!m_server_) {
    TETHER_ERROR("Failed to listen on {}.", unix_socket_path);
    std::exit(1);
  }

  chmod(socket_path.c_str(), 0600);
}

}  // namespace Tetherd::Shim
