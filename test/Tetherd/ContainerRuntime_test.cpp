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

#include "ContainerRuntime.h"

#include <gtest/gtest.h>

#include "SharedTestImpl/GlobalDefs.h"
#include "SharedTestImpl/TestEnv.h"
#include "tether/String.h"

using Tetherd::Shim::ProcessRuntime;
using Tetherd::Shim::TaskExitStatus;

class ProcessRuntimeTest : public testing::Test {
 public:
  void SetUp() override { ASSERT_FALSE(m_dir_.Path().empty()); }

 protected:
  tether::grpc::shim::CreateRequest Request(
      std::initializer_list<std::string> args) const {
    tether::grpc::shim::CreateRequest request;
    request.set_id("c1");
    request.set_bundle(m_dir_.Path().string());
    for (const auto& arg : args) request.mutable_spec()->add_args(arg);
    return request;
  }

  std::unique_ptr<ProcessRuntime> MakeRuntime() {
    return std::make_unique<ProcessRuntime>(
        [this](const TaskExitStatus& exit) {
          m_exit_status_ = exit.ExitStatus;
          m_exit_count_++;
        });
  }

  test::ScopedTempDir m_dir_;
  std::atomic_uint32_t m_exit_status_{0};
  std::atomic_int m_exit_count_{0};
};

TEST_F(ProcessRuntimeTest, RejectedRequests) {
  auto runtime = MakeRuntime();

  auto empty = runtime->Create(Request({}));
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().code(), tether::grpc::ERR_INVALID_PARAM);

  auto terminal_request = Request({"/bin/true"});
  terminal_request.set_terminal(true);
  auto terminal = runtime->Create(terminal_request);
  ASSERT_FALSE(terminal.has_value());
  EXPECT_EQ(terminal.error().code(), tether::grpc::ERR_NOT_SUPPORTED);

  auto start = runtime->Start();
  ASSERT_FALSE(start.has_value());
  EXPECT_EQ(start.error().code(), tether::grpc::ERR_NON_EXISTENT);

  auto bad_stdout = Request({"/bin/true"});
  bad_stdout.set_stdout((m_dir_.Path() / "missing" / "out").string());
  auto r = runtime->Create(bad_stdout);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code(), tether::grpc::ERR_SYSTEM_ERR);
}

TEST_F(ProcessRuntimeTest, TaskRunsOnlyAfterStart) {
  auto runtime = MakeRuntime();
  auto out_path = m_dir_.Path() / "out";

  auto request = Request({"/bin/sh", "-c", "pwd; echo hello; exit 3"});
  request.set_stdout(out_path.string());

  auto pid = runtime->Create(request);
  ASSERT_TRUE(pid.has_value()) << pid.error().description();
  EXPECT_EQ(util::ReadFileIntoString(m_dir_.Path() / kShimInitPidFileName),
            std::to_string(pid.value()));

  // Held until Start.
  absl::SleepFor(absl::Milliseconds(100));
  EXPECT_EQ(util::ReadFileIntoString(out_path), "");
  EXPECT_FALSE(runtime->IsRunning());

  auto started = runtime->Start();
  ASSERT_TRUE(started.has_value()) << started.error().description();
  EXPECT_EQ(started.value(), pid.value());

  auto again = runtime->Start();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code(), tether::grpc::ERR_EXISTING_TASK);

  auto exit = runtime->Wait(absl::Now() + absl::Seconds(5));
  ASSERT_TRUE(exit.has_value()) << exit.error().description();
  EXPECT_EQ(exit->Pid, pid.value());
  EXPECT_EQ(exit->ExitStatus, 3u);
  EXPECT_FALSE(runtime->IsRunning());

  EXPECT_EQ(util::ReadFileIntoString(out_path),
            fmt::format("{}\nhello\n",
                        std::filesystem::canonical(m_dir_.Path()).string()));

  EXPECT_TRUE(test::WaitUntil([&] { return m_exit_count_ == 1; }));
  EXPECT_EQ(m_exit_status_, 3u);

  auto deleted = runtime->Delete();
  ASSERT_TRUE(deleted.has_value()) << deleted.error().description();
  EXPECT_EQ(deleted->ExitStatus, 3u);
  EXPECT_FALSE(std::filesystem::exists(m_dir_.Path() / kShimInitPidFileName));
}

TEST_F(ProcessRuntimeTest, KillAndWait) {
  auto runtime = MakeRuntime();

  ASSERT_TRUE(runtime->Create(Request({"sleep", "30"})).has_value());
  ASSERT_TRUE(runtime->Start().has_value());
  EXPECT_TRUE(runtime->IsRunning());

  auto timeout = runtime->Wait(absl::Now() + absl::Milliseconds(100));
  ASSERT_FALSE(timeout.has_value());
  EXPECT_EQ(timeout.error().code(), tether::grpc::ERR_GENERIC_FAILURE);

  auto running = runtime->Delete();
  ASSERT_FALSE(running.has_value());
  EXPECT_EQ(running.error().code(), tether::grpc::ERR_INVALID_PARAM);

  ASSERT_TRUE(runtime->Kill(SIGKILL, true).has_value());

  auto exit = runtime->Wait(absl::Now() + absl::Seconds(5));
  ASSERT_TRUE(exit.has_value()) << exit.error().description();
  EXPECT_EQ(exit->ExitStatus, 128u + SIGKILL);

  auto gone = runtime->Kill(SIGTERM, false);
  ASSERT_FALSE(gone.has_value());
  EXPECT_EQ(gone.error().code(), tether::grpc::ERR_NON_EXISTENT);

  EXPECT_TRUE(runtime->Delete().has_value());
}

TEST_F(ProcessRuntimeTest, DeleteBeforeStartReleasesTheChild) {
  auto runtime = MakeRuntime();
  auto marker = m_dir_.Path() / "ran";

  ASSERT_TRUE(
      runtime
          ->Create(Request({"/bin/sh", "-c",
                            fmt::format("touch {}", marker.string())}))
          .has_value());

  auto exit = runtime->Delete();
  ASSERT_TRUE(exit.has_value()) << exit.error().description();
  EXPECT_EQ(exit->ExitStatus, 1u);
  EXPECT_FALSE(std::filesystem::exists(marker));

  auto start = runtime->Start();
  ASSERT_FALSE(start.has_value());
}

TEST_F(ProcessRuntimeTest, MissingCommandExitsWith127) {
  auto runtime = MakeRuntime();

  ASSERT_TRUE(
      runtime->Create(Request({"/nonexistent/command"})).has_value());
  ASSERT_TRUE(runtime->Start().has_value());

  auto exit = runtime->Wait(absl::Now() + absl::Seconds(5));
  ASSERT_TRUE(exit.has_value());
  EXPECT_EQ(exit->ExitStatus, 127u);
}
