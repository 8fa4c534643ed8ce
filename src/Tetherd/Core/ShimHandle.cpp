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

#include "ShimHandle.h"

namespace Tetherd {

ShimHandle::ShimHandle(Bundle bundle, std::unique_ptr<ShimConnection> conn,
                       std::shared_ptr<spdlog::logger> logger,
                       absl::Duration rpc_timeout)
    : m_bundle_(std::move(bundle)),
      m_logger_(std::move(logger)),
      m_conn_(std::move(conn)),
      m_rpc_timeout_(rpc_timeout) {}

ShimHandle::~ShimHandle() { Close(); }

std::string ShimHandle::ID() const {
  absl::MutexLock lk(&m_mtx_);
  return m_bundle_.ID;
}

std::string ShimHandle::Namespace() const {
  absl::MutexLock lk(&m_mtx_);
  return m_bundle_.Namespace;
}

Bundle ShimHandle::GetBundle() const {
  absl::MutexLock lk(&m_mtx_);
  return m_bundle_;
}

std::shared_ptr<spdlog::logger> ShimHandle::Logger() const {
  absl::MutexLock lk(&m_mtx_);
  return m_logger_;
}

void ShimHandle::SetLogger_(std::shared_ptr<spdlog::logger> logger) {
  m_conn_->SetLogger(logger);
  absl::MutexLock lk(&m_mtx_);
  m_logger_ = std::move(logger);
}

std::shared_ptr<ShimStub> ShimHandle::GetStub_() const {
  if (m_conn_->IsClosed()) return nullptr;
  return m_conn_->GetStub();
}

TetherRichError ShimHandle::RpcError_(std::string_view method,
                                      const grpc::Status& status) const {
  auto code = status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED
                  ? tether::grpc::ERR_CONNECTION_TIMEOUT
                  : tether::grpc::ERR_RPC_FAILURE;
  return FormatRichErr(code, "Shim {} RPC failed: {} ({})", method,
                       status.error_message(),
                       static_cast<int>(status.error_code()));
}

namespace {

TetherRichError ClosedError() {
  return FormatRichErr(tether::grpc::ERR_SHIM_CLOSED,
                       "The shim connection is closed");
}

}  // namespace

TetherExpectedRich<pid_t> ShimHandle::Create(const CreateOpts& opts,
                                             absl::Time deadline) {
  auto stub = GetStub_();
  if (!stub) return std::unexpected(ClosedError());

  grpc::ClientContext context;
  SetClientContextDeadline(&context, deadline, m_rpc_timeout_);

  tether::grpc::shim::CreateRequest request;
  tether::grpc::shim::CreateReply reply;
  {
    absl::MutexLock lk(&m_mtx_);
    request.set_id(m_bundle_.ID);
    request.set_bundle(m_bundle_.Path.string());
  }
  FillRequestFromCreateOpts(opts, &request);
  *request.mutable_spec() = opts.Spec;

  grpc::Status status = stub->Create(&context, request, &reply);
  if (!status.ok()) return std::unexpected(RpcError_("Create", status));
  if (reply.code() != tether::grpc::SUCCESS)
    return std::unexpected(FormatRichErr(reply.code(), "{}", reply.reason()));

  TETHER_LOGGER_DEBUG(Logger(), "Task created, pid #{}.", reply.pid());
  return reply.pid();
}

TetherExpectedRich<pid_t> ShimHandle::Start(absl::Time deadline) {
  auto stub = GetStub_();
  if (!stub) return std::unexpected(ClosedError());

  grpc::ClientContext context;
  SetClientContextDeadline(&context, deadline, m_rpc_timeout_);

  tether::grpc::shim::StartRequest request;
  tether::grpc::shim::StartReply reply;
  request.set_id(ID());

  grpc::Status status = stub->Start(&context, request, &reply);
  if (!status.ok()) return std::unexpected(RpcError_("Start", status));
  if (reply.code() != tether::grpc::SUCCESS)
    return std::unexpected(FormatRichErr(reply.code(), "{}", reply.reason()));

  return reply.pid();
}

TetherExpectedRich<void> ShimHandle::Kill(uint32_t signal, bool all,
                                          absl::Time deadline) {
  auto stub = GetStub_();
  if (!stub) return std::unexpected(ClosedError());

  grpc::ClientContext context;
  SetClientContextDeadline(&context, deadline, m_rpc_timeout_);

  tether::grpc::shim::KillRequest request;
  tether::grpc::shim::KillReply reply;
  request.set_id(ID());
  request.set_signal(signal);
  request.set_all(all);

  grpc::Status status = stub->Kill(&context, request, &reply);
  if (!status.ok()) return std::unexpected(RpcError_("Kill", status));
  if (reply.code() != tether::grpc::SUCCESS)
    return std::unexpected(FormatRichErr(reply.code(), "{}", reply.reason()));

  return {};
}

TetherExpectedRich<ExitInfo> ShimHandle::Wait(absl::Time deadline) {
  auto stub = GetStub_();
  if (!stub) return std::unexpected(ClosedError());

  grpc::ClientContext context;
  if (deadline != absl::InfiniteFuture())
    context.set_deadline(absl::ToChronoTime(deadline));

  tether::grpc::shim::WaitRequest request;
  tether::grpc::shim::WaitReply reply;
  request.set_id(ID());

  grpc::Status status = stub->Wait(&context, request, &reply);
  if (!status.ok()) return std::unexpected(RpcError_("Wait", status));
  if (reply.code() != tether::grpc::SUCCESS)
    return std::unexpected(FormatRichErr(reply.code(), "{}", reply.reason()));

  return ExitInfo{
      .Pid = 0,
      .ExitStatus = reply.exit_status(),
      .ExitedAt = absl::FromChrono(ChronoFromProtoTimestamp(reply.exited_at())),
  };
}

TetherExpectedRich<ExitInfo> ShimHandle::Delete(absl::Time deadline) {
  auto stub = GetStub_();
  if (!stub) return std::unexpected(ClosedError());

  grpc::ClientContext context;
  SetClientContextDeadline(&context, deadline, m_rpc_timeout_);

  tether::grpc::shim::DeleteRequest request;
  tether::grpc::shim::DeleteReply reply;
  request.set_id(ID());

  grpc::Status status = stub->Delete(&context, request, &reply);
  if (!status.ok()) return std::unexpected(RpcError_("Delete", status));
  if (reply.code() != tether::grpc::SUCCESS)
    return std::unexpected(FormatRichErr(reply.code(), "{}", reply.reason()));

  Bundle bundle = GetBundle();
  if (!bundle.Delete())
    TETHER_LOGGER_WARN(Logger(), "Failed to remove bundle {}",
                       bundle.Path.string());

  return ExitInfo{
      .Pid = static_cast<pid_t>(reply.pid()),
      .ExitStatus = reply.exit_status(),
      .ExitedAt = absl::FromChrono(ChronoFromProtoTimestamp(reply.exited_at())),
  };
}

TetherExpectedRich<void> ShimHandle::Shutdown(absl::Time deadline) {
  auto stub = GetStub_();
  if (!stub) return std::unexpected(ClosedError());

  m_conn_->MarkShutdownRequested();

  grpc::ClientContext context;
  SetClientContextDeadline(&context, deadline, m_rpc_timeout_);

  tether::grpc::shim::ShutdownRequest request;
  tether::grpc::shim::ShutdownReply reply;
  grpc::Status status = stub->Shutdown(&context, request, &reply);
  if (!status.ok()) return std::unexpected(RpcError_("Shutdown", status));

  return {};
}

void ShimHandle::Close() { m_conn_->Close(); }

bool ShimHandle::IsClosed() const { return m_conn_->IsClosed(); }

bool ShimHandle::SetOnClose(ShimConnection::OnCloseCb cb) {
  return m_conn_->SetOnClose(std::move(cb));
}

pid_t ShimHandle::ShimPid() const { return m_conn_->Pid(); }

}  // namespace Tetherd
