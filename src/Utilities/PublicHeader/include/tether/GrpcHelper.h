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

#include <absl/time/time.h>
#include <google/protobuf/timestamp.pb.h>
#include <grpc++/grpc++.h>

#include <algorithm>
#include <chrono>

std::string GrpcConnectivityStateName(grpc_connectivity_state state);

template <typename T>
google::protobuf::Timestamp ToProtoTimestamp(
    const std::chrono::time_point<T>& time) {
  google::protobuf::Timestamp timestamp;
  auto duration_since_epoch = time.time_since_epoch();
  auto seconds =
      std::chrono::duration_cast<std::chrono::seconds>(duration_since_epoch);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
      duration_since_epoch - seconds);
  timestamp.set_seconds(seconds.count());
  timestamp.set_nanos(nanos.count());
  return timestamp;
}

std::chrono::system_clock::time_point ChronoFromProtoTimestamp(
    const google::protobuf::Timestamp& timestamp);

void ServerBuilderAddUnixInsecureListeningPort(grpc::ServerBuilder* builder,
                                               const std::string& address);

std::shared_ptr<grpc::Channel> CreateUnixInsecureChannel(
    const std::string& socket_addr);

// Deadline of an outgoing call: the caller's deadline, tightened by the
// per-call timeout.
void SetClientContextDeadline(grpc::ClientContext* context,
                              absl::Time caller_deadline,
                              absl::Duration timeout);

// Deadline set by the remote caller, or absl::InfiniteFuture() if none.
absl::Time ServerContextDeadline(const grpc::ServerContext* context);
