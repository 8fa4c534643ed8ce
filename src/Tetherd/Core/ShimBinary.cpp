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

#include "ShimBinary.h"

#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/delimited_message_util.h>
#include <sys/wait.h>

namespace Tetherd {

ShimBinary::ShimBinary(Bundle bundle, std::string runtime,
                       std::filesystem::path runtime_path,
                       const ShimLaunchEnv& env)
    : m_bundle_(std::move(bundle)),
      m_runtime_(std::move(runtime)),
      m_runtime_path_(std::move(runtime_path)),
      m_env_(env) {}

absl::Time ShimBinary::LaunchDeadline_(absl::Time deadline) const {
  return std::min(deadline, absl::Now() + m_env_.StartTimeout);
}

std::vector<ShimBinary::LaunchAttempt> ShimBinary::AttemptPlan_() const {
  if (m_env_.Prewarm.AppliesTo(m_runtime_))
    return {{kShimActionPrewarm, true}, {kShimActionStart, false}};
  return {{kShimActionStart, false}};
}

ShimCommand ShimBinary::BuildCommand_(
    const char* action, const std::filesystem::path& work_dir) const {
  return ShimCommand{
      .Runtime = m_runtime_path_,
      .DaemonAddress = m_env_.DaemonAddress,
      .WorkDir = work_dir,
      .Args = {"--id", m_bundle_.ID, "--namespace", m_bundle_.Namespace,
               "--bundle", m_bundle_.Path.string(), action},
      .Debug = m_env_.Debug,
  };
}

TetherExpectedRich<std::unique_ptr<ShimConnection>> ShimBinary::Start(
    std::shared_ptr<spdlog::logger> logger,
    const ShimConnection::OnCloseCb& on_close, absl::Time deadline) {
  absl::Time launch_deadline = LaunchDeadline_(deadline);

  for (const auto& attempt : AttemptPlan_()) {
    // A prewarmed shim starts outside the bundle and moves in on Adopt.
    std::filesystem::path work_dir =
        std::string_view(attempt.Action) == kShimActionPrewarm
            ? std::filesystem::path{}
            : m_bundle_.Path;

    auto conn =
        Launch_(attempt.Action, work_dir, logger, on_close, launch_deadline);
    if (!conn) {
      if (attempt.Recoverable) {
        TETHER_LOGGER_WARN(logger,
                           "Shim action '{}' failed, trying the next one: {}",
                           attempt.Action, conn.error().description());
        continue;
      }
      return conn;
    }

    auto marker = m_bundle_.Path / kShimBinaryPathFileName;
    if (!util::os::WriteFileAtomically(marker, m_runtime_path_.string(),
                                       0644)) {
      conn.value()->Close();
      return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                           "Failed to write {}",
                                           marker.string()));
    }

    return conn;
  }

  return std::unexpected(FormatRichErr(tether::grpc::ERR_SPAWN_FAILED,
                                       "No launch attempt left"));
}

TetherExpectedRich<std::unique_ptr<ShimConnection>> ShimBinary::StartWarm(
    std::shared_ptr<spdlog::logger> logger,
    const ShimConnection::OnCloseCb& on_close, absl::Time deadline) {
  return Launch_(kShimActionWarmStart, {}, std::move(logger), on_close,
                 LaunchDeadline_(deadline));
}

TetherExpectedRich<std::unique_ptr<ShimConnection>> ShimBinary::Launch_(
    const char* action, const std::filesystem::path& work_dir,
    std::shared_ptr<spdlog::logger> logger,
    const ShimConnection::OnCloseCb& on_close, absl::Time deadline) {
  auto spawned =
      m_env_.Spawner->Spawn(BuildCommand_(action, work_dir), deadline);
  if (!spawned) return std::unexpected(spawned.error());

  auto& process = spawned.value().Process;

  auto params = ParseStartResponse(spawned.value().Handshake);
  if (!params) {
    if (process) process->KillAndReap();
    return std::unexpected(params.error());
  }

  TETHER_LOGGER_TRACE(logger, "Shim #{} ({}) listening on {}, version {}.",
                      params.value().Pid, action, params.value().Address,
                      params.value().Version);

  auto conn =
      MakeConnection(params.value(), process, logger, on_close, deadline);
  if (!conn) {
    if (process) process->KillAndReap();
    return conn;
  }

  if (std::string_view(action) == kShimActionPrewarm &&
      params.value().Version >= kShimAdoptProtocolVersion)
    Adopt_(conn.value().get(), deadline);

  return conn;
}

void ShimBinary::Adopt_(ShimConnection* conn, absl::Time deadline) const {
  auto stub = conn->GetStub();
  if (!stub) return;

  grpc::ClientContext context;
  SetClientContextDeadline(&context, deadline, m_env_.RpcTimeout);

  tether::grpc::shim::AdoptRequest request;
  tether::grpc::shim::AdoptReply reply;
  request.set_id(m_bundle_.ID);
  request.set_bundle(m_bundle_.Path.string());
  request.set_namespace_(m_bundle_.Namespace);

  grpc::Status status = stub->Adopt(&context, request, &reply);
  if (!status.ok()) {
    TETHER_WARN("Adopt of prewarmed shim for {}/{} failed: {}",
                m_bundle_.Namespace, m_bundle_.ID, status.error_message());
  } else if (!reply.ok()) {
    TETHER_WARN("Prewarmed shim refused to adopt {}/{}: {}",
                m_bundle_.Namespace, m_bundle_.ID, reply.reason());
  }
}

TetherExpectedRich<ExitInfo> ShimBinary::Delete(absl::Time deadline) {
  using google::protobuf::io::ArrayInputStream;
  using google::protobuf::util::ParseDelimitedFromZeroCopyStream;

  std::filesystem::path work_dir;
  std::error_code ec;
  if (std::filesystem::is_directory(m_bundle_.Path, ec))
    work_dir = m_bundle_.Path;

  absl::Time launch_deadline = LaunchDeadline_(deadline);
  auto spawned = m_env_.Spawner->Spawn(
      BuildCommand_(kShimActionDelete, work_dir), launch_deadline);
  if (!spawned) return std::unexpected(spawned.error());

  if (auto& process = spawned.value().Process; process) {
    auto status = process->WaitExit(launch_deadline);
    if (!status.has_value()) status = process->KillAndReap();
    if (!WIFEXITED(status.value()) || WEXITSTATUS(status.value()) != 0)
      TETHER_WARN("Shim delete for {}/{} exited with status {}: {}",
                  m_bundle_.Namespace, m_bundle_.ID, status.value(),
                  process->DrainLog());
  }

  const std::string& out = spawned.value().Handshake;
  ArrayInputStream istream(out.data(), static_cast<int>(out.size()));
  tether::grpc::shim::DeleteReply reply;
  bool clean_eof{false};
  if (!ParseDelimitedFromZeroCopyStream(&reply, &istream, &clean_eof))
    return std::unexpected(FormatRichErr(tether::grpc::ERR_PROTOBUF,
                                         "Malformed delete response"));

  if (reply.code() != tether::grpc::SUCCESS)
    return std::unexpected(
        FormatRichErr(reply.code(), "Shim delete failed: {}", reply.reason()));

  if (!m_bundle_.Delete())
    TETHER_WARN("Failed to remove bundle {}", m_bundle_.Path.string());

  return ExitInfo{
      .Pid = static_cast<pid_t>(reply.pid()),
      .ExitStatus = reply.exit_status(),
      .ExitedAt = absl::FromChrono(ChronoFromProtoTimestamp(reply.exited_at())),
  };
}

}  // namespace Tetherd
