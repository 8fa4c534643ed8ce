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

#include "ShimSpawner.h"

#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/delimited_message_util.h>
#include <gtest/gtest.h>
#include <sys/stat.h>

#include "SharedTestImpl/GlobalDefs.h"
#include "SharedTestImpl/TestEnv.h"
#include "ShimConnection.h"
#include "tether/String.h"

using namespace Tetherd;

class ProcessSpawnerTest : public testing::Test {
 public:
  void SetUp() override { ASSERT_FALSE(m_dir_.Path().empty()); }

 protected:
  std::filesystem::path WriteScript(const std::string& name,
                                    const std::string& body) {
    auto path = m_dir_.Path() / name;
    EXPECT_TRUE(util::os::WriteFileAtomically(
        path, fmt::format("#!/bin/sh\n{}\n", body), 0755));
    return path;
  }

  ShimCommand Command(const std::filesystem::path& runtime) {
    return ShimCommand{
        .Runtime = runtime,
        .DaemonAddress = "unix:///run/tether/tetherd.sock",
        .WorkDir = m_dir_.Path(),
        .Args = {"--id", "c1", "--namespace", "ns", "--bundle", "/b",
                 kShimActionStart},
        .Debug = true,
    };
  }

  test::ScopedTempDir m_dir_;
  ProcessSpawner m_spawner_;
};

TEST_F(ProcessSpawnerTest, MissingBinary) {
  auto r = m_spawner_.Spawn(Command("/nonexistent/tshim"),
                            absl::Now() + absl::Seconds(5));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code(), tether::grpc::ERR_SPAWN_FAILED);
}

TEST_F(ProcessSpawnerTest, ArgumentsAndWorkDir) {
  auto script = WriteScript(
      "record", fmt::format("echo \"$@\" > {0}/args\npwd > {0}/cwd",
                            m_dir_.Path().string()));

  auto r = m_spawner_.Spawn(Command(script), absl::Now() + absl::Seconds(5));
  // No handshake is written.
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code(), tether::grpc::ERR_SPAWN_FAILED);

  EXPECT_EQ(util::ReadFileIntoString(m_dir_.Path() / "args"),
            "--address unix:///run/tether/tetherd.sock --debug --id c1 "
            "--namespace ns --bundle /b start\n");
  EXPECT_EQ(util::ReadFileIntoString(m_dir_.Path() / "cwd"),
            m_dir_.Path().string() + "\n");
}

TEST_F(ProcessSpawnerTest, StderrIsReportedOnFailure) {
  auto script = WriteScript("fail", "echo boom >&2\nexit 3");

  auto r = m_spawner_.Spawn(Command(script), absl::Now() + absl::Seconds(5));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code(), tether::grpc::ERR_SPAWN_FAILED);
  EXPECT_NE(r.error().description().find("boom"), std::string::npos)
      << r.error().description();
}

TEST_F(ProcessSpawnerTest, HandshakeTimeout) {
  auto script = WriteScript("hang", "exec sleep 30");

  absl::Time start = absl::Now();
  auto r =
      m_spawner_.Spawn(Command(script), start + absl::Milliseconds(300));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code(), tether::grpc::ERR_CONNECTION_TIMEOUT);
  EXPECT_LT(absl::Now() - start, absl::Seconds(10));
}

TEST_F(ProcessSpawnerTest, JunkHandshake) {
  auto script = WriteScript("junk", "echo hello");

  auto r = m_spawner_.Spawn(Command(script), absl::Now() + absl::Seconds(5));
  ASSERT_TRUE(r.has_value()) << r.error().description();
  ASSERT_NE(r->Process, nullptr);
  r->Process->WaitExit(absl::Now() + absl::Seconds(5));

  auto params = ParseStartResponse(r->Handshake);
  ASSERT_FALSE(params.has_value());
  EXPECT_EQ(params.error().code(), tether::grpc::ERR_HANDSHAKE);
}

namespace {

std::string Delimited(const tether::grpc::shim::ShimReady& msg) {
  std::string out;
  {
    google::protobuf::io::StringOutputStream ostream(&out);
    google::protobuf::util::SerializeDelimitedToZeroCopyStream(msg, &ostream);
  }
  return out;
}

}  // namespace

TEST(ParseStartResponse, Valid) {
  tether::grpc::shim::ShimReady ready;
  ready.set_ok(true);
  ready.set_version(kShimAdoptProtocolVersion);
  ready.set_address("unix:///run/tether/ns/c1/shim.sock");
  ready.set_pid(1234);

  auto params = ParseStartResponse(Delimited(ready));
  ASSERT_TRUE(params.has_value()) << params.error().description();
  EXPECT_EQ(params->Version, kShimAdoptProtocolVersion);
  EXPECT_EQ(params->Address, "unix:///run/tether/ns/c1/shim.sock");
  EXPECT_EQ(params->Pid, 1234);
}

TEST(ParseStartResponse, Rejections) {
  tether::grpc::shim::ShimReady not_ok;
  not_ok.set_ok(false);
  not_ok.set_reason("bad bundle");
  auto r = ParseStartResponse(Delimited(not_ok));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code(), tether::grpc::ERR_HANDSHAKE);
  EXPECT_NE(r.error().description().find("bad bundle"), std::string::npos);

  tether::grpc::shim::ShimReady no_address;
  no_address.set_ok(true);
  no_address.set_version(kShimMinProtocolVersion);
  EXPECT_FALSE(ParseStartResponse(Delimited(no_address)).has_value());

  for (uint32_t version : {1u, 4u}) {
    tether::grpc::shim::ShimReady bad_version;
    bad_version.set_ok(true);
    bad_version.set_version(version);
    bad_version.set_address("unix:///x.sock");
    EXPECT_FALSE(ParseStartResponse(Delimited(bad_version)).has_value())
        << version;
  }

  EXPECT_FALSE(ParseStartResponse("").has_value());
}
