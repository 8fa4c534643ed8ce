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

#include <gtest/gtest.h>

#include <thread>

#include "SharedTestImpl/FakeShim.h"
#include "SharedTestImpl/GlobalDefs.h"
#include "SharedTestImpl/TestEnv.h"

using namespace Tetherd;

class WarmPoolTest : public testing::Test {
 public:
  void SetUp() override {
    ASSERT_FALSE(m_root_.Path().empty());
    g_thread_pool = std::make_unique<BS::thread_pool>(4);
    m_spawner_ = std::make_shared<test::FakeSpawner>();

    m_env_.StateRoot = m_root_.Path();
    m_env_.DaemonAddress = "unix:///nonexistent/tetherd.sock";
    m_env_.RpcTimeout = absl::Seconds(2);
    m_env_.Spawner = m_spawner_;
    m_env_.ResolveRuntimePath = [](const std::string&) {
      return TetherExpectedRich<std::filesystem::path>(
          "/opt/tether/fake-shim");
    };
  }

  void TearDown() override {
    for (auto& pool : m_pools_) pool->Close();
    m_pools_.clear();
    // Refills may still run and hold the last pool reference.
    g_thread_pool->wait();
    g_thread_pool.reset();
  }

 protected:
  std::shared_ptr<WarmPool> MakePool(int size,
                                     absl::Duration take_timeout =
                                         absl::Milliseconds(100)) {
    auto pool = std::make_shared<WarmPool>(
        "ns", "fake",
        WarmPoolConfig{
            .Enabled = true, .Size = size, .TakeTimeout = take_timeout},
        m_env_);
    m_pools_.push_back(pool);
    return pool;
  }

  static absl::Time Soon() { return absl::Now() + absl::Seconds(5); }

  test::ScopedTempDir m_root_;
  std::shared_ptr<test::FakeSpawner> m_spawner_;
  ShimLaunchEnv m_env_;
  std::vector<std::shared_ptr<WarmPool>> m_pools_;
};

TEST(WarmPoolConfig, Normalize) {
  auto config = NormalizeWarmPoolConfig(WarmPoolConfig{
      .Enabled = true, .Size = 0, .TakeTimeout = -absl::Seconds(1)});
  EXPECT_TRUE(config.Enabled);
  EXPECT_EQ(config.Size, kDefaultWarmPoolSize);
  EXPECT_EQ(config.TakeTimeout, kDefaultWarmPoolTakeTimeout);

  config = NormalizeWarmPoolConfig(WarmPoolConfig{
      .Enabled = true, .Size = 5, .TakeTimeout = absl::Seconds(1)});
  EXPECT_EQ(config.Size, 5);
  EXPECT_EQ(config.TakeTimeout, absl::Seconds(1));
}

TEST_F(WarmPoolTest, StartFillsThePool) {
  auto pool = MakePool(3);
  ASSERT_TRUE(pool->Start().has_value());

  EXPECT_EQ(pool->IdleCount(), 3u);
  EXPECT_EQ(m_spawner_->LaunchCount(kShimActionWarmStart), 3);

  std::error_code ec;
  auto warm_ns_dir = m_root_.Path() / kWarmBundleDirName / "ns";
  size_t dirs = 0;
  for (const auto& entry :
       std::filesystem::directory_iterator(warm_ns_dir, ec)) {
    EXPECT_TRUE(
        std::filesystem::exists(entry.path() / kShimSocketFileName));
    dirs++;
  }
  EXPECT_EQ(dirs, 3u);
}

TEST_F(WarmPoolTest, StartSkipsFailedLaunches) {
  m_spawner_->Behavior().SpawnFailures = 1;
  auto pool = MakePool(2);

  ASSERT_TRUE(pool->Start().has_value());
  EXPECT_EQ(pool->IdleCount(), 1u);
}

TEST_F(WarmPoolTest, TakeHandsOutWarmingShimAndRefills) {
  auto pool = MakePool(2);
  ASSERT_TRUE(pool->Start().has_value());

  auto instance = pool->Take(Soon());
  ASSERT_NE(instance, nullptr);
  EXPECT_EQ(instance->State(), ShimState::Warming);
  EXPECT_FALSE(instance->IsClosed());

  EXPECT_TRUE(test::WaitUntil([&] { return pool->IdleCount() == 2; }));
  EXPECT_EQ(m_spawner_->LaunchCount(kShimActionWarmStart), 3);

  instance->Discard();
}

TEST_F(WarmPoolTest, TakeOnEmptyPoolTimesOut) {
  auto pool = MakePool(1, absl::Milliseconds(100));

  absl::Time start = absl::Now();
  EXPECT_EQ(pool->Take(), nullptr);
  absl::Duration waited = absl::Now() - start;
  EXPECT_GE(waited, absl::Milliseconds(90));
  EXPECT_LT(waited, absl::Seconds(2));
}

TEST_F(WarmPoolTest, CallerDeadlineShortensTake) {
  auto pool = MakePool(1, absl::Seconds(10));

  absl::Time start = absl::Now();
  EXPECT_EQ(pool->Take(start + absl::Milliseconds(50)), nullptr);
  EXPECT_LT(absl::Now() - start, absl::Seconds(2));
}

TEST_F(WarmPoolTest, PoolNeverExceedsItsSize) {
  auto pool = MakePool(2, absl::Seconds(5));
  ASSERT_TRUE(pool->Start().has_value());

  // Every take schedules a refill, and extra launches find the pool full.
  std::vector<std::shared_ptr<WarmShimInstance>> taken;
  for (int i = 0; i < 5; i++) {
    auto instance = pool->Take(Soon());
    ASSERT_NE(instance, nullptr);
    taken.push_back(instance);
    EXPECT_LE(pool->IdleCount(), 2u);
  }

  g_thread_pool->wait();
  EXPECT_LE(pool->IdleCount(), 2u);
  for (auto& instance : taken) instance->Discard();
}

TEST_F(WarmPoolTest, TakenShimsAreDistinct) {
  auto pool = MakePool(2);
  ASSERT_TRUE(pool->Start().has_value());

  auto a = pool->Take(Soon());
  auto b = pool->Take(Soon());
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_NE(a.get(), b.get());
  EXPECT_NE(a->WarmID(), b->WarmID());

  a->Discard();
  b->Discard();
}

TEST_F(WarmPoolTest, BindMovesTheShim) {
  auto pool = MakePool(1);
  ASSERT_TRUE(pool->Start().has_value());
  auto instance = pool->Take(Soon());
  ASSERT_NE(instance, nullptr);

  CreateOpts opts;
  opts.Stdout = "/tmp/c1.out";
  auto r = instance->Bind("c1", opts, Soon());
  ASSERT_TRUE(r.has_value()) << r.error().description();

  auto bundle = BundlePathOf(m_root_.Path(), "ns", "c1");
  EXPECT_EQ(instance->State(), ShimState::Bound);
  EXPECT_EQ(instance->BoundID(), "c1");
  EXPECT_EQ(instance->ID(), "c1");
  EXPECT_EQ(instance->GetBundle().Path, bundle);
  EXPECT_TRUE(std::filesystem::exists(bundle / kShimSocketFileName));

  // RPCs follow the moved socket.
  auto pid = instance->Create(opts, Soon());
  ASSERT_TRUE(pid.has_value()) << pid.error().description();
  EXPECT_EQ(pid.value(), test::kFakeTaskPid);

  instance->MarkActive();
  EXPECT_EQ(instance->State(), ShimState::Active);
}

TEST_F(WarmPoolTest, BindOnlyOnce) {
  auto pool = MakePool(1);
  ASSERT_TRUE(pool->Start().has_value());
  auto instance = pool->Take(Soon());
  ASSERT_NE(instance, nullptr);

  ASSERT_TRUE(instance->Bind("c1", {}, Soon()).has_value());

  auto again = instance->Bind("c2", {}, Soon());
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code(), tether::grpc::ERR_WARM_STATE);
  EXPECT_EQ(instance->BoundID(), "c1");
  EXPECT_FALSE(
      std::filesystem::exists(BundlePathOf(m_root_.Path(), "ns", "c2")));

  instance->MarkActive();
  auto active = instance->Bind("c3", {}, Soon());
  ASSERT_FALSE(active.has_value());
  EXPECT_EQ(active.error().code(), tether::grpc::ERR_WARM_STATE);
}

TEST_F(WarmPoolTest, FailedBindIsCleanedUpByDiscard) {
  m_spawner_->Behavior().BindFailures = 1;
  auto pool = MakePool(1);
  ASSERT_TRUE(pool->Start().has_value());
  auto instance = pool->Take(Soon());
  ASSERT_NE(instance, nullptr);
  auto warm_path = instance->GetBundle().Path;

  auto r = instance->Bind("c1", {}, Soon());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code(), tether::grpc::ERR_BIND_NOT_READY);
  EXPECT_EQ(instance->State(), ShimState::Warming);

  // A failed bind is final.
  auto retry = instance->Bind("c1", {}, Soon());
  ASSERT_FALSE(retry.has_value());
  EXPECT_EQ(retry.error().code(), tether::grpc::ERR_WARM_STATE);

  auto target = BundlePathOf(m_root_.Path(), "ns", "c1");
  EXPECT_TRUE(std::filesystem::exists(target));

  instance->Discard();
  EXPECT_TRUE(instance->IsClosed());
  EXPECT_FALSE(std::filesystem::exists(target));
  EXPECT_FALSE(std::filesystem::exists(warm_path));
}

TEST_F(WarmPoolTest, BoundShimIsCleanedUpByDiscard) {
  auto pool = MakePool(1);
  ASSERT_TRUE(pool->Start().has_value());
  auto instance = pool->Take(Soon());
  ASSERT_NE(instance, nullptr);
  auto warm_path = instance->GetBundle().Path;

  ASSERT_TRUE(instance->Bind("c1", {}, Soon()).has_value());
  EXPECT_EQ(instance->State(), ShimState::Bound);
  auto target = BundlePathOf(m_root_.Path(), "ns", "c1");
  ASSERT_TRUE(std::filesystem::exists(target));

  instance->Discard();
  EXPECT_TRUE(instance->IsClosed());
  EXPECT_FALSE(std::filesystem::exists(target));
  EXPECT_FALSE(std::filesystem::exists(warm_path));

  // The id can be used again.
  auto bundle = NewBundle(m_root_.Path(), "ns", "c1");
  ASSERT_TRUE(bundle.has_value()) << bundle.error().description();
  EXPECT_TRUE(bundle.value().Delete());
}

TEST_F(WarmPoolTest, ActiveShimKeepsItsBundleOnDiscard) {
  auto pool = MakePool(1);
  ASSERT_TRUE(pool->Start().has_value());
  auto instance = pool->Take(Soon());
  ASSERT_NE(instance, nullptr);

  ASSERT_TRUE(instance->Bind("c1", {}, Soon()).has_value());
  instance->MarkActive();

  instance->Discard();
  EXPECT_TRUE(
      std::filesystem::exists(BundlePathOf(m_root_.Path(), "ns", "c1")));
}

TEST_F(WarmPoolTest, InvalidIdIsRejectedBeforeBind) {
  auto pool = MakePool(1);
  ASSERT_TRUE(pool->Start().has_value());
  auto instance = pool->Take(Soon());
  ASSERT_NE(instance, nullptr);

  auto r = instance->Bind("../escape", {}, Soon());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code(), tether::grpc::ERR_INVALID_PARAM);
  EXPECT_EQ(instance->State(), ShimState::Warming);

  // The instance is still usable.
  EXPECT_TRUE(instance->Bind("c1", {}, Soon()).has_value());
}

TEST_F(WarmPoolTest, CloseDiscardsIdleShims) {
  auto pool = MakePool(2);
  ASSERT_TRUE(pool->Start().has_value());

  pool->Close();
  EXPECT_TRUE(pool->IsClosed());
  EXPECT_EQ(pool->IdleCount(), 0u);
  EXPECT_EQ(pool->Take(Soon()), nullptr);

  auto r = pool->Start();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code(), tether::grpc::ERR_POOL_CLOSED);

  std::error_code ec;
  auto warm_ns_dir = m_root_.Path() / kWarmBundleDirName / "ns";
  EXPECT_TRUE(std::filesystem::is_empty(warm_ns_dir, ec));

  pool->Close();
}

TEST_F(WarmPoolTest, CloseDiscardsLateRefill) {
  auto pool = MakePool(1);
  ASSERT_TRUE(pool->Start().has_value());

  m_spawner_->Behavior().SpawnDelayMs = 300;
  auto taken = pool->Take(Soon());
  ASSERT_NE(taken, nullptr);
  taken->Discard();

  // The refill is launching when the pool closes.
  ASSERT_TRUE(test::WaitUntil([&] {
    return m_spawner_->LaunchCount(kShimActionWarmStart) == 2;
  }));
  pool->Close();
  g_thread_pool->wait();

  EXPECT_EQ(pool->IdleCount(), 0u);
  std::error_code ec;
  auto warm_ns_dir = m_root_.Path() / kWarmBundleDirName / "ns";
  EXPECT_TRUE(std::filesystem::is_empty(warm_ns_dir, ec));
}

TEST_F(WarmPoolTest, ConcurrentTakesGetDistinctShimsAndRefill) {
  auto pool = MakePool(2, absl::Seconds(5));
  ASSERT_TRUE(pool->Start().has_value());

  std::shared_ptr<WarmShimInstance> a;
  std::shared_ptr<WarmShimInstance> b;
  std::thread ta([&] { a = pool->Take(Soon()); });
  std::thread tb([&] { b = pool->Take(Soon()); });
  ta.join();
  tb.join();

  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_NE(a.get(), b.get());
  EXPECT_NE(a->WarmID(), b->WarmID());

  EXPECT_TRUE(test::WaitUntil([&] { return pool->IdleCount() == 2; }));
  EXPECT_EQ(m_spawner_->LaunchCount(kShimActionWarmStart), 4);

  auto c = pool->Take(Soon());
  auto d = pool->Take(Soon());
  ASSERT_NE(c, nullptr);
  ASSERT_NE(d, nullptr);
  for (const auto& other : {a, b}) {
    EXPECT_NE(c->WarmID(), other->WarmID());
    EXPECT_NE(d->WarmID(), other->WarmID());
  }

  for (auto& instance : {a, b, c, d}) instance->Discard();
}
