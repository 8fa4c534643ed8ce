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

#include "tether/GrpcHelper.h"

std::string GrpcConnectivityStateName(grpc_connectivity_state state) {
  switch (state) {
  case GRPC_CHANNEL_IDLE:
    return "IDLE";
  case GRPC_CHANNEL_CONNECTING:
    return "CONNECTING";
  case GRPC_CHANNEL_READY:
    return "READY";
  case GRPC_CHANNEL_TRANSIENT_FAILURE:
    return "TRANSIENT_FAILURE";
  case GRPC_CHANNEL_SHUTDOWN:
    return "SHUTDOWN";
  default:
    return "UNKNOWN";
  }
}

std::chrono::system_clock::time_point ChronoFromProtoTimestamp(
    const google::protobuf::Timestamp& timestamp) {
  std::chrono::seconds seconds(timestamp.seconds());
  std::chrono::nanoseconds nanos(timestamp.nanos());
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(seconds +
                                                                      nanos));
}

void ServerBuilderAddUnixInsecureListeningPort(grpc::ServerBuilder* builder,
                                               const std::string& address) {
  builder->AddListeningPort(address, grpc::InsecureServerCredentials());
}

std::shared_ptr<grpc::Channel> CreateUnixInsecureChannel(
    const std::string& socket_addr) {
  return grpc::CreateChannel(socket_addr, grpc::InsecureChannelCredentials());
}

void SetClientContextDeadline(grpc::ClientContext* context,
                              absl::Time caller_deadline,
                              absl::Duration timeout) {
  absl::Time deadline = std::min(caller_deadline, absl::Now() + timeout);
  context->set_deadline(absl::ToChronoTime(deadline));
}

absl::Time ServerContextDeadline(const grpc::ServerContext* context) {
  auto deadline = context->deadline();
  if (deadline == std::chrono::system_clock::time_point::max())
    return absl::InfiniteFuture();
  return absl::FromChrono(deadline);
}
