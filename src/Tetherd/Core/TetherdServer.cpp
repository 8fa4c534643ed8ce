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

#include "TetherdServer.h"

#include <sys/stat.h>

#include "ShimManager.h"

namespace Tetherd {

namespace {

CreateOpts CreateOptsFromRequest(const tether::grpc::CreateTaskRequest& req) {
  CreateOpts opts;
  opts.Rootfs.assign(req.rootfs().begin(), req.rootfs().end());
  opts.Stdin = req.stdin();
  opts.Stdout = req.stdout();
  opts.Stderr = req.stderr();
  opts.Terminal = req.terminal();
  opts.RuntimeOptions = req.options();
  opts.Spec = req.spec();
  return opts;
}

TetherRichError NotFound(const std::string& ns, const std::string& id) {
  return FormatRichErr(tether::grpc::ERR_NON_EXISTENT, "Task {}/{} not found",
                       ns, id);
}

}  // namespace

grpc::Status TetherdServiceImpl::CreateTask(
    grpc::ServerContext* context,
    const tether::grpc::CreateTaskRequest* request,
    tether::grpc::CreateTaskReply* response) {
  absl::Time deadline = ServerContextDeadline(context);
  CreateOpts opts = CreateOptsFromRequest(*request);

  auto handle = g_shim_manager->Start(request->namespace_(), request->id(),
                                      request->runtime(), opts, deadline);
  if (!handle) {
    TETHER_WARN("Failed to start shim for {}/{}: {}", request->namespace_(),
                request->id(), handle.error().description());
    response->set_ok(false);
    *response->mutable_err() = handle.error();
    return Status::OK;
  }

  auto pid = handle.value()->Create(opts, deadline);
  if (!pid) {
    TETHER_LOGGER_WARN(handle.value()->Logger(), "Failed to create task: {}",
                       pid.error().description());
    g_shim_manager->Remove(request->namespace_(), request->id(), deadline);
    response->set_ok(false);
    *response->mutable_err() = pid.error();
    return Status::OK;
  }

  response->set_ok(true);
  response->set_pid(pid.value());
  return Status::OK;
}

grpc::Status TetherdServiceImpl::StartTask(
    grpc::ServerContext* context, const tether::grpc::TaskRef* request,
    tether::grpc::StartTaskReply* response) {
  auto handle = g_shim_manager->Get(request->namespace_(), request->id());
  if (!handle) {
    response->set_ok(false);
    *response->mutable_err() = NotFound(request->namespace_(), request->id());
    return Status::OK;
  }

  auto pid = handle->Start(ServerContextDeadline(context));
  if (!pid) {
    response->set_ok(false);
    *response->mutable_err() = pid.error();
    return Status::OK;
  }

  response->set_ok(true);
  response->set_pid(pid.value());
  return Status::OK;
}

grpc::Status TetherdServiceImpl::KillTask(
    grpc::ServerContext* context, const tether::grpc::KillTaskRequest* request,
    tether::grpc::KillTaskReply* response) {
  auto handle = g_shim_manager->Get(request->namespace_(), request->id());
  if (!handle) {
    response->set_ok(false);
    *response->mutable_err() = NotFound(request->namespace_(), request->id());
    return Status::OK;
  }

  auto r = handle->Kill(request->signal(), request->all(),
                        ServerContextDeadline(context));
  response->set_ok(r.has_value());
  if (!r) *response->mutable_err() = r.error();
  return Status::OK;
}

grpc::Status TetherdServiceImpl::WaitTask(
    grpc::ServerContext* context, const tether::grpc::TaskRef* request,
    tether::grpc::WaitTaskReply* response) {
  auto handle = g_shim_manager->Get(request->namespace_(), request->id());
  if (!handle) {
    response->set_ok(false);
    *response->mutable_err() = NotFound(request->namespace_(), request->id());
    return Status::OK;
  }

  auto exit_info = handle->Wait(ServerContextDeadline(context));
  if (!exit_info) {
    response->set_ok(false);
    *response->mutable_err() = exit_info.error();
    return Status::OK;
  }

  response->set_ok(true);
  response->set_exit_status(exit_info.value().ExitStatus);
  *response->mutable_exited_at() =
      ToProtoTimestamp(absl::ToChronoTime(exit_info.value().ExitedAt));
  return Status::OK;
}

grpc::Status TetherdServiceImpl::DeleteTask(
    grpc::ServerContext* context, const tether::grpc::TaskRef* request,
    tether::grpc::DeleteTaskReply* response) {
  auto exit_info = g_shim_manager->Delete(request->namespace_(), request->id(),
                                          ServerContextDeadline(context));
  if (!exit_info) {
    response->set_ok(false);
    *response->mutable_err() = exit_info.error();
    return Status::OK;
  }

  response->set_ok(true);
  response->set_pid(exit_info.value().Pid);
  response->set_exit_status(exit_info.value().ExitStatus);
  *response->mutable_exited_at() =
      ToProtoTimestamp(absl::ToChronoTime(exit_info.value().ExitedAt));
  return Status::OK;
}

grpc::Status TetherdServiceImpl::PublishTaskExit(
    grpc::ServerContext* context, const tether::grpc::TaskExit* request,
    tether::grpc::PublishTaskExitReply* response) {
  auto handle = g_shim_manager->Get(request->namespace_(), request->id());
  if (handle)
    TETHER_LOGGER_INFO(handle->Logger(), "Task #{} exited with status {}.",
                       request->pid(), request->exit_status());
  else
    TETHER_INFO("Task {}/{} #{} exited with status {}.", request->namespace_(),
                request->id(), request->pid(), request->exit_status());

  response->set_ok(true);
  return Status::OK;
}

TetherdServer::TetherdServer(const std::filesystem::path& unix_socket_path) {
  m_service_impl_ = std::make_unique<TetherdServiceImpl>();

  if (std::filesystem::exists(unix_socket_path) &&
      !util::os::DeleteFile(unix_socket_path))
    TETHER_WARN("Failed to remove stale socket {}", unix_socket_path.string());

  auto unix_socket_addr = fmt::format("unix://{}", unix_socket_path.string());
  grpc::ServerBuilder builder;
  ServerBuilderAddUnixInsecureListeningPort(&builder, unix_socket_addr);
  builder.RegisterService(m_service_impl_.get());

  m_server_ = builder.BuildAndStart();
  if (!m_server_) {
    TETHER_ERROR("Failed to listen on {}", unix_socket_addr);
    std::exit(1);
  }

  chmod(unix_socket_path.c_str(), 0600);
  TETHER_INFO("Tetherd is listening on {}", unix_socket_addr);
}

}  // namespace Tetherd
