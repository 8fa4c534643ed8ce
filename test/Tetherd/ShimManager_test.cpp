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

#include "ShimManager.h"

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <thread>

#include "SharedTestImpl/FakeShim.h"
#include "SharedTestImpl/GlobalDefs.h"
#include "SharedTestImpl/TestEnv.h"
#include "tether/String.h"

using namespace Tetherd;

namespace {

constexpr const char* kRuntime = "fake";
constexpr const char* kFakeRuntimePath = "/opt/tether/fake-shim";

absl::Time Soon() { return absl::Now() + absl::Seconds(10); }

}  // namespace

TEST(ResolveRuntimePath, LookupOrder) {
  std::unordered_map<std::string, std::filesystem::path> runtimes{
      {"fake", "/opt/fake"}, {"other", "/opt/other"}};

  auto by_name = ResolveRuntimePathIn(runtimes, "fake", "other");
  ASSERT_TRUE(by_name.has_value());
  EXPECT_EQ(by_name.value(), "/opt/other");

  auto by_default = ResolveRuntimePathIn(runtimes, "fake", "");
  ASSERT_TRUE(by_default.has_value());
  EXPECT_EQ(by_default.value(), "/opt/fake");

  auto by_path = ResolveRuntimePathIn(runtimes, "fake", "/usr/bin/tshim");
  ASSERT_TRUE(by_path.has_value());
  EXPECT_EQ(by_path.value(), "/usr/bin/tshim");

  auto unknown = ResolveRuntimePathIn(runtimes, "fake", "nope");
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().code(), tether::grpc::ERR_RUNTIME_NOT_FOUND);
}

class ShimManagerTest : public testing::Test {
 public:
  void SetUp() override {
    ASSERT_FALSE(m_root_.Path().empty());
    g_thread_pool = std::make_unique<BS::thread_pool>(4);
    m_spawner_ = std::make_shared<test::FakeSpawner>();
  }

  void TearDown() override {
    m_manager_.reset();
    g_thread_pool->wait();
    g_thread_pool.reset();
  }

 protected:
  void MakeManager(bool pool_enabled, int pool_size = 2,
                   absl::Duration take_timeout = absl::Milliseconds(100)) {
    ShimManagerOptions options;
    options.Env.StateRoot = m_root_.Path();
    options.Env.DaemonAddress = "unix:///nonexistent/tetherd.sock";
    options.Env.RpcTimeout = absl::Seconds(2);
    options.Env.Spawner = m_spawner_;
    options.Runtimes = {{kRuntime, kFakeRuntimePath}};
    options.DefaultRuntime = kRuntime;
    options.WarmPool = WarmPoolConfig{.Enabled = pool_enabled,
                                      .Size = pool_size,
                                      .TakeTimeout = take_timeout};

    m_manager_ = std::make_unique<ShimManager>(std::move(options));
  }

  // Start one container so that the pool of ns gets created, then wait
  // for it to be full.
  std::shared_ptr<WarmPool> PrimePool(int size) {
    auto handle = m_manager_->Start("ns", "primer", kRuntime, {}, Soon());
    EXPECT_TRUE(handle.has_value());

    auto pool = m_manager_->GetWarmPool("ns", kRuntime);
    EXPECT_NE(pool, nullptr);
    if (!pool) return nullptr;

    EXPECT_TRUE(test::WaitUntil([&] {
      return pool->IdleCount() == static_cast<size_t>(size);
    }));
    return pool;
  }

  std::filesystem::path BundleOf(const std::string& id) const {
    return BundlePathOf(m_root_.Path(), "ns", id);
  }

  test::ScopedTempDir m_root_;
  std::shared_ptr<test::FakeSpawner> m_spawner_;
  std::unique_ptr<ShimManager> m_manager_;
};

// Pooling disabled: every start is cold.
TEST_F(ShimManagerTest, ColdStartWhenPoolDisabled) {
  MakeManager(false);

  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(handle.has_value()) << handle.error().description();

  EXPECT_EQ(m_spawner_->Actions(), std::vector<std::string>{"start"});
  EXPECT_EQ(m_manager_->GetWarmPool("ns", kRuntime), nullptr);
  EXPECT_FALSE(std::filesystem::exists(m_root_.Path() / kWarmBundleDirName));
  EXPECT_EQ(m_manager_->Get("ns", "c1"), handle.value());
  EXPECT_EQ(m_manager_->LiveCount(), 1u);
  EXPECT_EQ(util::ReadFileIntoString(BundleOf("c1") / kShimBinaryPathFileName),
            kFakeRuntimePath);

  auto pid = handle.value()->Create({}, Soon());
  ASSERT_TRUE(pid.has_value()) << pid.error().description();
  EXPECT_EQ(pid.value(), test::kFakeTaskPid);
}

// Pooling enabled with idle shims: the start is served from the pool.
TEST_F(ShimManagerTest, WarmStartTakesFromPool) {
  MakeManager(true, 2);
  auto pool = PrimePool(2);
  ASSERT_NE(pool, nullptr);
  int cold_before = m_spawner_->LaunchCount(kShimActionStart);

  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(handle.has_value()) << handle.error().description();

  EXPECT_EQ(m_spawner_->LaunchCount(kShimActionStart), cold_before);
  auto* warm = dynamic_cast<WarmShimInstance*>(handle.value().get());
  ASSERT_NE(warm, nullptr);
  EXPECT_EQ(warm->State(), ShimState::Active);
  EXPECT_EQ(warm->BoundID(), "c1");

  EXPECT_TRUE(std::filesystem::exists(BundleOf("c1") / kShimSocketFileName));
  EXPECT_EQ(util::ReadFileIntoString(BundleOf("c1") / kShimBinaryPathFileName),
            kFakeRuntimePath);

  auto pid = handle.value()->Create({}, Soon());
  ASSERT_TRUE(pid.has_value()) << pid.error().description();

  // The pool refills in the background.
  EXPECT_TRUE(test::WaitUntil([&] { return pool->IdleCount() == 2; }));
}

// A bind failure falls back to a cold start in the same bundle location.
TEST_F(ShimManagerTest, BindFailureFallsBackToCold) {
  MakeManager(true, 1);
  auto pool = PrimePool(1);
  ASSERT_NE(pool, nullptr);
  int cold_before = m_spawner_->LaunchCount(kShimActionStart);

  m_spawner_->Behavior().BindFailures = 1;
  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(handle.has_value()) << handle.error().description();

  EXPECT_EQ(m_spawner_->LaunchCount(kShimActionStart), cold_before + 1);
  EXPECT_EQ(dynamic_cast<WarmShimInstance*>(handle.value().get()), nullptr);
  EXPECT_EQ(handle.value()->GetBundle().Path, BundleOf("c1"));
  EXPECT_EQ(m_manager_->Get("ns", "c1"), handle.value());

  auto pid = handle.value()->Create({}, Soon());
  ASSERT_TRUE(pid.has_value()) << pid.error().description();
}

// No warm shim within the take timeout: cold start.
TEST_F(ShimManagerTest, PoolTimeoutFallsBackToCold) {
  m_spawner_->Behavior().SpawnDelayMs = 500;
  MakeManager(true, 1, absl::Milliseconds(50));

  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(handle.has_value()) << handle.error().description();

  EXPECT_EQ(m_spawner_->LaunchCount(kShimActionStart), 1);
  EXPECT_EQ(dynamic_cast<WarmShimInstance*>(handle.value().get()), nullptr);
}

TEST_F(ShimManagerTest, ColdFailureIsReturned) {
  MakeManager(false);
  m_spawner_->Behavior().SpawnFailures = 1;

  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_FALSE(handle.has_value());
  EXPECT_EQ(handle.error().code(), tether::grpc::ERR_SPAWN_FAILED);
  EXPECT_EQ(m_manager_->LiveCount(), 0u);
  EXPECT_FALSE(std::filesystem::exists(BundleOf("c1")));

  // Nothing is left behind that blocks a retry.
  auto retry = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(retry.has_value()) << retry.error().description();
}

TEST_F(ShimManagerTest, UnknownRuntime) {
  MakeManager(false);

  auto handle = m_manager_->Start("ns", "c1", "missing", {}, Soon());
  ASSERT_FALSE(handle.has_value());
  EXPECT_EQ(handle.error().code(), tether::grpc::ERR_RUNTIME_NOT_FOUND);
}

TEST_F(ShimManagerTest, InvalidKeys) {
  MakeManager(false);

  for (const auto& [ns, id] : std::vector<ShimKey>{
           {"ns", ""}, {"", "c1"}, {"ns", "a/b"}, {kWarmBundleDirName, "c1"}}) {
    auto handle = m_manager_->Start(ns, id, kRuntime, {}, Soon());
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code(), tether::grpc::ERR_INVALID_PARAM);
  }
  EXPECT_TRUE(m_spawner_->Actions().empty());
}

TEST_F(ShimManagerTest, DuplicateStartIsRejected) {
  MakeManager(false);

  ASSERT_TRUE(m_manager_->Start("ns", "c1", kRuntime, {}, Soon()).has_value());
  auto again = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code(), tether::grpc::ERR_EXISTING_TASK);

  // Same id in another namespace is a different container.
  EXPECT_TRUE(
      m_manager_->Start("other", "c1", kRuntime, {}, Soon()).has_value());
  EXPECT_EQ(m_manager_->LiveCount(), 2u);
}

TEST_F(ShimManagerTest, ConcurrentStartsOfOneIdYieldOneShim) {
  MakeManager(true, 2);

  std::atomic_int ok_count{0};
  std::atomic_int existing_count{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&] {
      auto r = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
      if (r)
        ok_count++;
      else if (r.error().code() == tether::grpc::ERR_EXISTING_TASK)
        existing_count++;
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(ok_count, 1);
  EXPECT_EQ(existing_count, 7);
  EXPECT_EQ(m_manager_->LiveCount(), 1u);
}

TEST_F(ShimManagerTest, DistinctIdsGetDistinctShims) {
  MakeManager(true, 2);
  ASSERT_NE(PrimePool(2), nullptr);

  std::vector<std::thread> threads;
  std::vector<std::shared_ptr<ShimHandle>> handles(4);
  for (int i = 0; i < 4; i++) {
    threads.emplace_back([&, i] {
      auto r = m_manager_->Start("ns", fmt::format("c{}", i), kRuntime, {},
                                 Soon());
      if (r) handles[i] = r.value();
    });
  }
  for (auto& t : threads) t.join();

  std::set<ShimHandle*> distinct;
  for (int i = 0; i < 4; i++) {
    ASSERT_NE(handles[i], nullptr) << i;
    EXPECT_EQ(handles[i]->ID(), fmt::format("c{}", i));
    distinct.insert(handles[i].get());

    auto* shim = m_spawner_->FindShim(fmt::format("c{}", i));
    ASSERT_NE(shim, nullptr) << i;
  }
  EXPECT_EQ(distinct.size(), 4u);
  EXPECT_EQ(m_manager_->LiveCount(), 5u);
}

// Handing out a warm shim does not wait for its replacement.
TEST_F(ShimManagerTest, RefillDoesNotBlockStart) {
  MakeManager(true, 1, absl::Seconds(1));
  auto pool = PrimePool(1);
  ASSERT_NE(pool, nullptr);

  m_spawner_->Behavior().SpawnDelayMs = 3000;
  absl::Time begin = absl::Now();
  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(handle.has_value()) << handle.error().description();
  EXPECT_LT(absl::Now() - begin, absl::Seconds(2));
  EXPECT_NE(dynamic_cast<WarmShimInstance*>(handle.value().get()), nullptr);
  EXPECT_EQ(pool->IdleCount(), 0u);
}

TEST_F(ShimManagerTest, DeleteShutsTheShimDown) {
  MakeManager(false);
  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(handle.has_value());
  ASSERT_TRUE(handle.value()->Create({}, Soon()).has_value());
  auto* shim = m_spawner_->FindShim("c1");
  ASSERT_NE(shim, nullptr);

  auto exit_info = m_manager_->Delete("ns", "c1", Soon());
  ASSERT_TRUE(exit_info.has_value()) << exit_info.error().description();
  EXPECT_EQ(exit_info->Pid, test::kFakeTaskPid);

  EXPECT_EQ(m_manager_->Get("ns", "c1"), nullptr);
  EXPECT_EQ(m_manager_->LiveCount(), 0u);
  EXPECT_TRUE(handle.value()->IsClosed());
  EXPECT_EQ(shim->ShutdownCount(), 1);
  EXPECT_FALSE(std::filesystem::exists(BundleOf("c1")));

  auto missing = m_manager_->Delete("ns", "c1", Soon());
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code(), tether::grpc::ERR_NON_EXISTENT);

  // The id is free again.
  EXPECT_TRUE(m_manager_->Start("ns", "c1", kRuntime, {}, Soon()).has_value());
}

TEST_F(ShimManagerTest, RefusedDeleteKeepsTheEntry) {
  MakeManager(false);
  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(handle.has_value());

  m_spawner_->Behavior().RefuseDelete = true;
  auto r = m_manager_->Delete("ns", "c1", Soon());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code(), tether::grpc::ERR_INVALID_PARAM);
  EXPECT_EQ(m_manager_->Get("ns", "c1"), handle.value());
  EXPECT_FALSE(handle.value()->IsClosed());
}

TEST_F(ShimManagerTest, StartDuringRefusedDeleteIsRejected) {
  MakeManager(false);
  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(handle.has_value());

  m_spawner_->Behavior().RefuseDelete = true;
  m_spawner_->Behavior().DeleteDelayMs = 300;
  TetherExpectedRich<ExitInfo> deleted;
  std::thread deleter(
      [&] { deleted = m_manager_->Delete("ns", "c1", Soon()); });

  // The entry is out of the table while the shim answers.
  ASSERT_TRUE(
      test::WaitUntil([&] { return m_manager_->Get("ns", "c1") == nullptr; }));
  auto again = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  deleter.join();

  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code(), tether::grpc::ERR_EXISTING_TASK);
  ASSERT_FALSE(deleted.has_value());
  EXPECT_EQ(m_manager_->Get("ns", "c1"), handle.value());
  EXPECT_FALSE(handle.value()->IsClosed());
  EXPECT_EQ(m_manager_->LiveCount(), 1u);
}

TEST_F(ShimManagerTest, DeleteOfClosedShimRunsDeleteAction) {
  MakeManager(false);
  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(handle.has_value());

  // Fake the shim going away: the close callback drops the entry and
  // cleans up in the background.
  handle.value()->Close();
  EXPECT_TRUE(test::WaitUntil([&] {
    return m_spawner_->LaunchCount(kShimActionDelete) == 1;
  }));
  g_thread_pool->wait();

  EXPECT_EQ(m_manager_->Get("ns", "c1"), nullptr);
  EXPECT_FALSE(std::filesystem::exists(BundleOf("c1")));
}

TEST_F(ShimManagerTest, RemoveDropsWithoutDelete) {
  MakeManager(false);
  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(handle.has_value());
  auto* shim = m_spawner_->FindShim("c1");
  ASSERT_NE(shim, nullptr);

  m_manager_->Remove("ns", "c1", Soon());

  EXPECT_EQ(m_manager_->Get("ns", "c1"), nullptr);
  EXPECT_TRUE(handle.value()->IsClosed());
  EXPECT_EQ(shim->ShutdownCount(), 1);
  EXPECT_FALSE(std::filesystem::exists(BundleOf("c1")));
  EXPECT_EQ(m_spawner_->LaunchCount(kShimActionDelete), 0);

  // Removing an unknown key is a no-op.
  m_manager_->Remove("ns", "c1", Soon());
}

TEST_F(ShimManagerTest, ClosedPoolsMeanColdStarts) {
  MakeManager(true, 1);
  auto pool = PrimePool(1);
  ASSERT_NE(pool, nullptr);

  m_manager_->CloseWarmPools();
  EXPECT_TRUE(pool->IsClosed());
  EXPECT_EQ(m_manager_->GetWarmPool("ns", kRuntime), nullptr);

  int cold_before = m_spawner_->LaunchCount(kShimActionStart);
  auto handle = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_TRUE(handle.has_value()) << handle.error().description();
  EXPECT_EQ(m_spawner_->LaunchCount(kShimActionStart), cold_before + 1);
  EXPECT_EQ(m_manager_->GetWarmPool("ns", kRuntime), nullptr);
}

TEST_F(ShimManagerTest, ShutdownClosesEverything) {
  MakeManager(true, 1);
  auto pool = PrimePool(1);
  ASSERT_NE(pool, nullptr);
  auto handle = m_manager_->Get("ns", "primer");
  ASSERT_NE(handle, nullptr);

  m_manager_->Shutdown();

  EXPECT_TRUE(pool->IsClosed());
  EXPECT_TRUE(handle->IsClosed());
  EXPECT_EQ(m_manager_->LiveCount(), 0u);

  auto r = m_manager_->Start("ns", "c1", kRuntime, {}, Soon());
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code(), tether::grpc::ERR_SHUTTING_DOWN);

  m_manager_->Shutdown();
}

TEST_F(ShimManagerTest, ShutdownDuringColdStartRollsBack) {
  MakeManager(false);
  m_spawner_->Behavior().SpawnDelayMs = 300;

  TetherExpectedRich<std::shared_ptr<ShimHandle>> started;
  std::thread starter(
      [&] { started = m_manager_->Start("ns", "c1", kRuntime, {}, Soon()); });

  ASSERT_TRUE(test::WaitUntil(
      [&] { return m_spawner_->LaunchCount(kShimActionStart) == 1; }));
  m_manager_->Shutdown();
  starter.join();

  ASSERT_FALSE(started.has_value());
  EXPECT_EQ(started.error().code(), tether::grpc::ERR_SHUTTING_DOWN);
  EXPECT_EQ(m_manager_->LiveCount(), 0u);
  EXPECT_EQ(m_manager_->Get("ns", "c1"), nullptr);
  EXPECT_FALSE(std::filesystem::exists(BundleOf("c1")));
}

TEST_F(ShimManagerTest, ShutdownDuringWarmStartRollsBack) {
  MakeManager(true, 1, absl::Seconds(1));
  auto pool = PrimePool(1);
  ASSERT_NE(pool, nullptr);

  int cold_before = m_spawner_->LaunchCount(kShimActionStart);
  int warm_before = m_spawner_->LaunchCount(kShimActionWarmStart);

  m_spawner_->Behavior().BindDelayMs = 300;
  TetherExpectedRich<std::shared_ptr<ShimHandle>> started;
  std::thread starter(
      [&] { started = m_manager_->Start("ns", "c1", kRuntime, {}, Soon()); });

  // The refill launch follows the take, so the bind is under way.
  ASSERT_TRUE(test::WaitUntil([&] {
    return m_spawner_->LaunchCount(kShimActionWarmStart) > warm_before;
  }));
  m_manager_->Shutdown();
  starter.join();

  ASSERT_FALSE(started.has_value());
  EXPECT_EQ(started.error().code(), tether::grpc::ERR_SHUTTING_DOWN);
  EXPECT_EQ(m_manager_->LiveCount(), 0u);
  EXPECT_FALSE(std::filesystem::exists(BundleOf("c1")));
  // No cold start after the warm shim was rolled back.
  EXPECT_EQ(m_spawner_->LaunchCount(kShimActionStart), cold_before);
}
