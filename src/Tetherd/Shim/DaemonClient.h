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

#include "protos/Tether.grpc.pb.h"
#include "protos/Tether.pb.h"

namespace Tetherd::Shim {

/**
 * Reports task exits to the daemon which started this shim. Events are
 * queued and sent in order by a background thread, which retries while the
 * daemon is unreachable.
 */
class DaemonClient {
 public:
  ~DaemonClient();

  void InitChannelAndStub(const std::string& endpoint);

  void TaskExitAsync(tether::grpc::TaskExit event);

  // Lets the send thread leave once the queue is empty.
  void Shutdown();

 private:
  void AsyncSendThread_();

  absl::Mutex m_mutex_;
  std::list<tether::grpc::TaskExit> m_task_exit_queue_
      ABSL_GUARDED_BY(m_mutex_);

  std::thread m_async_send_thread_;
  std::atomic_bool m_thread_stop_{false};
  std::shared_ptr<grpc::Channel> m_channel_;
  std::shared_ptr<tether::grpc::Tetherd::Stub> m_stub_;
};

}  // namespace Tetherd::Shim

inline std::unique_ptr<Tetherd::Shim::DaemonClient> g_daemon_client;
