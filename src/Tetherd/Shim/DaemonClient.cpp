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

#include "DaemonClient.h"

namespace Tetherd::Shim {

using grpc::ClientContext;
using grpc::Status;

DaemonClient::~DaemonClient() {
  Shutdown();
  if (m_async_send_thread_.joinable()) m_async_send_thread_.join();
}

void DaemonClient::Shutdown() { m_thread_stop_ = true; }

void DaemonClient::InitChannelAndStub(const std::string& endpoint) {
  m_channel_ = CreateUnixInsecureChannel(endpoint);
  m_stub_ = tether::grpc::Tetherd::NewStub(m_channel_);
  m_async_send_thread_ = std::thread([this] { AsyncSendThread_(); });
}

void DaemonClient::TaskExitAsync(tether::grpc::TaskExit event) {
  absl::MutexLock lock(&m_mutex_);
  m_task_exit_queue_.push_back(std::move(event));
}

void DaemonClient::AsyncSendThread_() {
  while (true) {
    {
      absl::MutexLock lock(&m_mutex_);
      if (m_task_exit_queue_.empty() && m_thread_stop_) break;
    }

    // Nothing is kept for a daemon that went away for good.
    if (m_thread_stop_) {
      bool connected = m_channel_->WaitForConnected(
          std::chrono::system_clock::now() + std::chrono::seconds(1));
      if (!connected) {
        absl::MutexLock lock(&m_mutex_);
        TETHER_WARN("Daemon unreachable, dropping {} task exit event(s).",
                    m_task_exit_queue_.size());
        m_task_exit_queue_.clear();
        break;
      }
    }

    std::list<tether::grpc::TaskExit> elems;
    {
      absl::MutexLock lock(&m_mutex_);
      if (!m_task_exit_queue_.empty())
        elems.splice(elems.end(), m_task_exit_queue_);
    }

    if (elems.empty()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      continue;
    }

    bool connected = m_channel_->WaitForConnected(
        std::chrono::system_clock::now() + std::chrono::seconds(3));
    if (!connected) {
      TETHER_INFO("Channel to the daemon is not connected. Reconnecting...");
      m_channel_->GetState(true);
    }

    while (connected && !elems.empty()) {
      auto& elem = elems.front();
      ClientContext context;
      context.set_deadline(std::chrono::system_clock::now() +
                           std::chrono::seconds(5));
      tether::grpc::PublishTaskExitReply reply;

      TETHER_TRACE("Sending PublishTaskExit for {}/{}, status {}.",
                   elem.namespace_(), elem.id(), elem.exit_status());

      Status status = m_stub_->PublishTaskExit(&context, elem, &reply);
      if (!status.ok()) {
        TETHER_ERROR("Failed to send PublishTaskExit for {}/{}: {} | {}",
                     elem.namespace_(), elem.id(), status.error_message(),
                     context.debug_error_string());
        break;
      }
      elems.pop_front();
    }

    if (!elems.empty()) {
      {
        absl::MutexLock lock(&m_mutex_);
        m_task_exit_queue_.splice(m_task_exit_queue_.begin(), elems);
      }
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
  }
}

}  // namespace Tetherd::Shim
