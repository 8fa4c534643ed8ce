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

#include "ShimConnection.h"

#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/delimited_message_util.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/wait.h>

namespace Tetherd {

TetherExpectedRich<ShimConnectParams> ParseStartResponse(
    const std::string& handshake) {
  using google::protobuf::io::ArrayInputStream;
  using google::protobuf::util::ParseDelimitedFromZeroCopyStream;

  ArrayInputStream istream(handshake.data(),
                           static_cast<int>(handshake.size()));
  tether::grpc::shim::ShimReady ready;
  bool clean_eof{false};
  if (!ParseDelimitedFromZeroCopyStream(&ready, &istream, &clean_eof))
    return std::unexpected(FormatRichErr(tether::grpc::ERR_HANDSHAKE,
                                         "Malformed handshake of {} bytes",
                                         handshake.size()));

  if (!ready.ok())
    return std::unexpected(FormatRichErr(tether::grpc::ERR_HANDSHAKE,
                                         "Shim reported failure: {}",
                                         ready.reason()));

  if (ready.address().empty())
    return std::unexpected(FormatRichErr(tether::grpc::ERR_HANDSHAKE,
                                         "Shim reported an empty address"));

  if (ready.version() < kShimMinProtocolVersion ||
      ready.version() > kShimMaxProtocolVersion)
    return std::unexpected(
        FormatRichErr(tether::grpc::ERR_HANDSHAKE,
                      "Unsupported shim protocol version {}", ready.version()));

  return ShimConnectParams{.Version = ready.version(),
                           .Address = ready.address(),
                           .Pid = static_cast<pid_t>(ready.pid())};
}

ShimConnection::ShimConnection(std::string address,
                               std::shared_ptr<grpc::Channel> channel,
                               std::unique_ptr<ShimProcess> process,
                               std::shared_ptr<spdlog::logger> logger,
                               OnCloseCb on_close)
    : m_process_(std::move(process)),
      m_on_close_(std::move(on_close)),
      m_address_(std::move(address)),
      m_channel_(std::move(channel)),
      m_logger_(std::move(logger)) {
  m_stub_ = tether::grpc::shim::Shim::NewStub(m_channel_);

  if (m_process_) {
    m_stop_efd_ = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (m_stop_efd_ == -1)
      TETHER_ERROR("Failed to create eventfd for shim #{}: {}",
                   m_process_->Pid(), strerror(errno));
    else
      m_monitor_thread_ = std::thread([this] { MonitorThread_(); });
  }
}

ShimConnection::~ShimConnection() {
  Close();
  if (m_monitor_thread_.joinable()) m_monitor_thread_.detach();
  if (m_stop_efd_ != -1) close(m_stop_efd_);
}

std::shared_ptr<ShimStub> ShimConnection::GetStub() const {
  absl::MutexLock lk(&m_mtx_);
  return m_stub_;
}

std::string ShimConnection::Address() const {
  absl::MutexLock lk(&m_mtx_);
  return m_address_;
}

TetherExpectedRich<void> ShimConnection::Reconnect(const std::string& address,
                                                   absl::Time deadline) {
  auto channel = CreateUnixInsecureChannel(address);
  absl::Time connect_deadline =
      std::min(deadline, absl::Now() + kShimConnectTimeout);
  if (!channel->WaitForConnected(absl::ToChronoTime(connect_deadline)))
    return std::unexpected(FormatRichErr(
        tether::grpc::ERR_CONNECTION_TIMEOUT,
        "Failed to reconnect to shim at {}, channel state: {}", address,
        GrpcConnectivityStateName(channel->GetState(false))));

  absl::MutexLock lk(&m_mtx_);
  if (m_closed_)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SHIM_CLOSED,
                                         "Connection closed during reconnect"));

  m_address_ = address;
  m_channel_ = std::move(channel);
  m_stub_ = tether::grpc::shim::Shim::NewStub(m_channel_);
  return {};
}

void ShimConnection::SetLogger(std::shared_ptr<spdlog::logger> logger) {
  absl::MutexLock lk(&m_mtx_);
  m_logger_ = std::move(logger);
}

std::shared_ptr<spdlog::logger> ShimConnection::GetLogger_() const {
  absl::MutexLock lk(&m_mtx_);
  return m_logger_;
}

bool ShimConnection::SetOnClose(OnCloseCb cb) {
  absl::MutexLock lk(&m_mtx_);
  if (m_on_close_fired_) return false;
  m_on_close_ = std::move(cb);
  return true;
}

void ShimConnection::MarkShutdownRequested() {
  m_shutdown_requested_.store(true, std::memory_order_release);
}

bool ShimConnection::IsClosed() const {
  absl::MutexLock lk(&m_mtx_);
  return m_closed_ || m_on_close_fired_;
}

pid_t ShimConnection::Pid() const {
  return m_process_ ? m_process_->Pid() : 0;
}

void ShimConnection::Close() {
  {
    absl::MutexLock lk(&m_mtx_);
    if (m_closed_) return;
    m_closed_ = true;
    m_stub_.reset();
    m_channel_.reset();
  }

  if (m_monitor_thread_.joinable()) {
    uint64_t one = 1;
    if (write(m_stop_efd_, &one, sizeof(one)) != sizeof(one))
      TETHER_WARN("Failed to stop the monitor of shim #{}: {}", Pid(),
                  strerror(errno));

    // Close() may be called by on-close itself.
    if (m_monitor_thread_.get_id() == std::this_thread::get_id())
      m_monitor_thread_.detach();
    else
      m_monitor_thread_.join();
  }

  if (m_process_) {
    std::optional<int> status;
    if (m_shutdown_requested_.load(std::memory_order_acquire))
      status = m_process_->WaitExit(absl::Now() + kShimExitGracePeriod);
    else
      status = m_process_->TryReap();

    if (!status.has_value()) {
      TETHER_LOGGER_DEBUG(GetLogger_(), "Killing shim #{}.", Pid());
      m_process_->KillAndReap();
    }

    RelayLogLines_(m_process_->DrainLog(), true);
  }

  FireOnClose_();
}

void ShimConnection::FireOnClose_() {
  OnCloseCb cb;
  {
    absl::MutexLock lk(&m_mtx_);
    if (m_on_close_fired_) return;
    m_on_close_fired_ = true;
    cb = std::move(m_on_close_);
  }

  if (m_process_) m_process_->CloseLogFd();

  // Nothing may touch this object after the callback when it runs on the
  // monitor thread.
  if (cb) cb();
}

void ShimConnection::RelayLogLines_(std::string_view chunk, bool flush) {
  auto logger = GetLogger_();
  m_log_partial_line_.append(chunk);

  size_t begin = 0;
  size_t pos;
  while ((pos = m_log_partial_line_.find('\n', begin)) != std::string::npos) {
    if (pos > begin)
      TETHER_LOGGER_INFO(logger, "{}",
                         std::string_view(m_log_partial_line_)
                             .substr(begin, pos - begin));
    begin = pos + 1;
  }
  m_log_partial_line_.erase(0, begin);

  if (flush && !m_log_partial_line_.empty()) {
    TETHER_LOGGER_INFO(logger, "{}", m_log_partial_line_);
    m_log_partial_line_.clear();
  }
}

void ShimConnection::MonitorThread_() {
  std::array<pollfd, 3> fds{{
      {.fd = m_stop_efd_, .events = POLLIN, .revents = 0},
      {.fd = m_process_->Pidfd(), .events = POLLIN, .revents = 0},
      {.fd = m_process_->LogFd(), .events = POLLIN, .revents = 0},
  }};

  std::array<char, 4096> buf{};
  bool exited = false;

  while (true) {
    int r = poll(fds.data(), fds.size(), -1);
    if (r == -1) {
      if (errno == EINTR) continue;
      TETHER_ERROR("poll() failed in the monitor of shim #{}: {}", Pid(),
                   strerror(errno));
      return;
    }

    if (fds[2].revents != 0) {
      ssize_t n = read(fds[2].fd, buf.data(), buf.size());
      if (n > 0) {
        RelayLogLines_(std::string_view(buf.data(), n), false);
      } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        RelayLogLines_({}, true);
        // Negative fds are ignored by poll().
        fds[2].fd = -1;
      }
    }

    if (fds[1].revents != 0) {
      exited = true;
      break;
    }

    if (fds[0].revents != 0) return;
  }

  if (exited) {
    RelayLogLines_(m_process_->DrainLog(), true);

    auto status = m_process_->TryReap();
    auto logger = GetLogger_();
    if (status.has_value() && WIFSIGNALED(status.value()))
      TETHER_LOGGER_INFO(logger, "Shim #{} was killed by signal {}.", Pid(),
                         WTERMSIG(status.value()));
    else
      TETHER_LOGGER_INFO(logger, "Shim #{} exited with code {}.", Pid(),
                         status.has_value() ? WEXITSTATUS(status.value()) : -1);

    FireOnClose_();
  }
}

TetherExpectedRich<std::unique_ptr<ShimConnection>> MakeConnection(
    const ShimConnectParams& params, std::unique_ptr<ShimProcess>& process,
    std::shared_ptr<spdlog::logger> logger, ShimConnection::OnCloseCb on_close,
    absl::Time deadline) {
  auto channel = CreateUnixInsecureChannel(params.Address);

  absl::Time connect_deadline =
      std::min(deadline, absl::Now() + kShimConnectTimeout);
  if (!channel->WaitForConnected(absl::ToChronoTime(connect_deadline)))
    return std::unexpected(FormatRichErr(
        tether::grpc::ERR_CONNECTION_TIMEOUT,
        "Failed to connect to shim #{} at {}, channel state: {}", params.Pid,
        params.Address, GrpcConnectivityStateName(channel->GetState(false))));

  return std::make_unique<ShimConnection>(params.Address, std::move(channel),
                                          std::move(process), std::move(logger),
                                          std::move(on_close));
}

}  // namespace Tetherd
