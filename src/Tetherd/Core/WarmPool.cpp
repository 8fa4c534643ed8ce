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

#include "WarmPool.h"

namespace Tetherd {

namespace {

std::atomic_uint64_t s_warm_seq{0};

}  // namespace

WarmShimInstance::WarmShimInstance(Bundle warm_bundle,
                                   std::unique_ptr<ShimConnection> conn,
                                   std::shared_ptr<spdlog::logger> logger,
                                   absl::Duration rpc_timeout,
                                   std::filesystem::path state_root)
    : ShimHandle(warm_bundle, std::move(conn), std::move(logger), rpc_timeout),
      m_warm_id_(warm_bundle.ID),
      m_warm_bundle_path_(warm_bundle.Path),
      m_state_root_(std::move(state_root)) {}

TetherExpectedRich<void> WarmShimInstance::Bind(const std::string& id,
                                                const CreateOpts& opts,
                                                absl::Time deadline) {
  std::string ns;
  std::filesystem::path bundle_path;
  {
    absl::MutexLock lk(&m_mtx_);
    if (m_state_ != ShimState::Warming)
      return std::unexpected(FormatRichErr(
          tether::grpc::ERR_WARM_STATE, "Warm shim {} is {}, not Warming",
          m_warm_id_, ShimStateName(m_state_)));

    if (m_bind_attempted_)
      return std::unexpected(FormatRichErr(tether::grpc::ERR_WARM_STATE,
                                           "Warm shim {} was already bound",
                                           m_warm_id_));

    if (!IsValidBundleComponent(id))
      return std::unexpected(FormatRichErr(tether::grpc::ERR_INVALID_PARAM,
                                           "Invalid container id '{}'", id));

    m_bind_attempted_ = true;
    ns = m_bundle_.Namespace;
    bundle_path = BundlePathOf(m_state_root_, ns, id);
    m_bind_target_ = bundle_path;
  }

  auto stub = GetStub_();
  if (!stub)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SHIM_CLOSED,
                                         "Warm shim {} is closed", m_warm_id_));

  grpc::ClientContext context;
  SetClientContextDeadline(&context, deadline, m_rpc_timeout_);

  tether::grpc::shim::BindRequest request;
  tether::grpc::shim::BindReply reply;
  request.set_id(id);
  request.set_bundle(bundle_path.string());
  FillRequestFromCreateOpts(opts, &request);

  grpc::Status status = stub->Bind(&context, request, &reply);
  if (!status.ok()) return std::unexpected(RpcError_("Bind", status));
  if (!reply.ready())
    return std::unexpected(FormatRichErr(tether::grpc::ERR_BIND_NOT_READY,
                                         "Warm shim {} not ready: {}",
                                         m_warm_id_, reply.reason()));

  std::string address =
      fmt::format("unix://{}", (bundle_path / kShimSocketFileName).string());
  if (auto r = m_conn_->Reconnect(address, deadline); !r)
    return std::unexpected(r.error());

  {
    absl::MutexLock lk(&m_mtx_);
    m_state_ = ShimState::Bound;
    m_bound_id_ = id;
    m_bundle_.ID = id;
    m_bundle_.Path = bundle_path;
  }

  SetLogger_(CreateChildLogger(fmt::format("{}/{}", ns, id)));
  TETHER_LOGGER_DEBUG(Logger(), "Bound warm shim {}.", m_warm_id_);

  return {};
}

void WarmShimInstance::MarkActive() {
  absl::MutexLock lk(&m_mtx_);
  if (m_state_ == ShimState::Bound) m_state_ = ShimState::Active;
}

void WarmShimInstance::Discard() {
  Close();

  if (!util::os::DeleteFolders(m_warm_bundle_path_))
    TETHER_WARN("Failed to remove warm bundle {}",
                m_warm_bundle_path_.string());

  // Until it is Active the bound bundle belongs to no container.
  std::filesystem::path bind_target;
  {
    absl::MutexLock lk(&m_mtx_);
    if (m_state_ != ShimState::Active) bind_target = m_bind_target_;
  }

  if (!bind_target.empty() && !util::os::DeleteFolders(bind_target))
    TETHER_WARN("Failed to remove bundle {}", bind_target.string());
}

ShimState WarmShimInstance::State() const {
  absl::MutexLock lk(&m_mtx_);
  return m_state_;
}

std::string WarmShimInstance::BoundID() const {
  absl::MutexLock lk(&m_mtx_);
  return m_bound_id_;
}

WarmPoolConfig NormalizeWarmPoolConfig(WarmPoolConfig config) {
  if (config.Size <= 0) config.Size = kDefaultWarmPoolSize;
  if (config.TakeTimeout <= absl::ZeroDuration())
    config.TakeTimeout = kDefaultWarmPoolTakeTimeout;
  return config;
}

WarmPool::WarmPool(std::string ns, std::string runtime, WarmPoolConfig config,
                   ShimLaunchEnv env)
    : m_ns_(std::move(ns)),
      m_runtime_(std::move(runtime)),
      m_config_(NormalizeWarmPoolConfig(config)),
      m_env_(std::move(env)),
      m_shims_(m_config_.Size) {}

WarmPool::~WarmPool() { Close(); }

bool WarmPool::IsClosed() const {
  absl::MutexLock lk(&m_mtx_);
  return m_closed_;
}

std::string WarmPool::NextWarmID_() const {
  return fmt::format("warm-{}-{}-{}", m_ns_, absl::ToUnixNanos(absl::Now()),
                     s_warm_seq.fetch_add(1, std::memory_order_relaxed));
}

TetherExpectedRich<void> WarmPool::Start() {
  if (IsClosed())
    return std::unexpected(FormatRichErr(tether::grpc::ERR_POOL_CLOSED,
                                         "Warm pool {}/{} is closed", m_ns_,
                                         m_runtime_));

  for (int i = 0; i < m_config_.Size; i++) {
    auto r = WarmOne_();
    if (r) continue;
    if (r.error().code() == tether::grpc::ERR_POOL_CLOSED) return r;

    TETHER_WARN("Failed to warm shim {}/{} for {}: {}", i + 1, m_config_.Size,
                m_runtime_, r.error().description());
  }

  TETHER_DEBUG("Warm pool {}/{} started with {} idle shim(s).", m_ns_,
               m_runtime_, IdleCount());
  return {};
}

TetherExpectedRich<void> WarmPool::WarmOne_() {
  absl::MutexLock warm_lk(&m_warm_mtx_);

  if (IsClosed())
    return std::unexpected(FormatRichErr(tether::grpc::ERR_POOL_CLOSED,
                                         "Warm pool {}/{} is closed", m_ns_,
                                         m_runtime_));

  auto runtime_path = m_env_.ResolveRuntimePath(m_runtime_);
  if (!runtime_path) return std::unexpected(runtime_path.error());

  std::string warm_id = NextWarmID_();
  auto bundle = NewWarmBundle(m_env_.StateRoot, m_ns_, warm_id);
  if (!bundle) return std::unexpected(bundle.error());

  auto logger = CreateChildLogger(fmt::format("{}/{}", m_ns_, warm_id));

  ShimBinary binary(bundle.value(), m_runtime_, runtime_path.value(), m_env_);
  auto conn = binary.StartWarm(
      logger,
      [logger] { TETHER_LOGGER_DEBUG(logger, "Warm shim disconnected."); },
      absl::InfiniteFuture());
  if (!conn) {
    if (!bundle.value().Delete())
      TETHER_WARN("Failed to remove warm bundle {}",
                  bundle.value().Path.string());
    return std::unexpected(conn.error());
  }

  auto instance = std::make_shared<WarmShimInstance>(
      bundle.value(), std::move(conn.value()), logger, m_env_.RpcTimeout,
      m_env_.StateRoot);

  if (!m_shims_.TryPush(instance)) {
    TETHER_LOGGER_DEBUG(logger, "Warm pool full or closed, discarding shim.");
    instance->Discard();
  }

  return {};
}

void WarmPool::ScheduleRefill_() {
  g_thread_pool->detach_task([self = shared_from_this()] {
    auto r = self->WarmOne_();
    if (!r && r.error().code() != tether::grpc::ERR_POOL_CLOSED)
      TETHER_WARN("Failed to refill warm pool {}/{}: {}", self->m_ns_,
                  self->m_runtime_, r.error().description());
  });
}

std::shared_ptr<WarmShimInstance> WarmPool::Take(absl::Time deadline) {
  if (IsClosed()) return nullptr;

  absl::Time take_deadline =
      std::min(deadline, absl::Now() + m_config_.TakeTimeout);

  while (true) {
    auto instance = m_shims_.PopUntil(take_deadline);
    if (!instance.has_value()) return nullptr;

    ScheduleRefill_();

    if (instance.value()->IsClosed()) {
      TETHER_WARN("Warm shim {} died while idle, discarding it.",
                  instance.value()->WarmID());
      instance.value()->Discard();
      continue;
    }

    return std::move(instance.value());
  }
}

void WarmPool::Close() {
  {
    absl::MutexLock lk(&m_mtx_);
    if (m_closed_) return;
    m_closed_ = true;
  }

  auto idle = m_shims_.CloseAndDrain();
  for (auto& instance : idle) instance->Discard();

  TETHER_DEBUG("Warm pool {}/{} closed, {} idle shim(s) discarded.", m_ns_,
               m_runtime_, idle.size());
}

}  // namespace Tetherd
