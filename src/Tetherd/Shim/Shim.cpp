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

#include "ShimPublicDefs.h"
// Precompiled header comes first.

#include <absl/strings/numbers.h>
#include <absl/strings/strip.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/util/delimited_message_util.h>

#include <backward.hpp>
#include <cxxopts.hpp>

#include "DaemonClient.h"
#include "ShimServer.h"
#include "tether/String.h"

using Tetherd::Shim::g_config;

namespace {

bool IsKnownAction(const std::string& action) {
  return action == kShimActionStart || action == kShimActionWarmStart ||
         action == kShimActionPrewarm || action == kShimActionDelete;
}

}  // namespace

void ParseConfig(int argc, char** argv) {
  cxxopts::Options options("tshim");

  // clang-format off
  options.add_options()
      ("address", "gRPC address of the daemon",
       cxxopts::value<std::string>())
      ("id", "ID of the container or of the warm shim",
       cxxopts::value<std::string>())
      ("namespace", "Namespace of the container",
       cxxopts::value<std::string>())
      ("bundle", "Bundle directory",
       cxxopts::value<std::string>())
      ("debug", "Enable debug logging")
      ("action", "start, warmstart, prewarm or delete",
       cxxopts::value<std::string>())
      ("v,version", "Display version information")
      ("h,help", "Display help for tshim")
      ;
  // clang-format on
  options.parse_positional({"action"});
  options.positional_help("<action>");

  cxxopts::ParseResult parsed_args;
  try {
    parsed_args = options.parse(argc, argv);
  } catch (cxxopts::OptionException& e) {
    fmt::print(stderr, "{}\n{}", e.what(), options.help());
    std::exit(1);
  }

  if (parsed_args.count("help") > 0) {
    fmt::print("{}\n", options.help());
    std::exit(0);
  }

  if (parsed_args.count("version") > 0) {
    fmt::print("Version: {}\n", TETHER_VERSION_STRING);
    std::exit(0);
  }

  for (const char* required : {"id", "namespace", "bundle", "action"}) {
    if (parsed_args.count(required) == 0) {
      fmt::print(stderr, "Missing --{}\n{}", required, options.help());
      std::exit(1);
    }
  }

  g_config.Id = parsed_args["id"].as<std::string>();
  g_config.Namespace = parsed_args["namespace"].as<std::string>();
  g_config.Bundle = parsed_args["bundle"].as<std::string>();
  g_config.Action = parsed_args["action"].as<std::string>();
  g_config.Debug = parsed_args.count("debug") > 0;
  if (parsed_args.count("address") > 0)
    g_config.DaemonAddress = parsed_args["address"].as<std::string>();

  if (!IsKnownAction(g_config.Action)) {
    fmt::print(stderr, "Unknown action '{}'\n", g_config.Action);
    std::exit(1);
  }

  g_config.SocketPath = g_config.Bundle / kShimSocketFileName;

  // stdout carries the handshake, so every log line goes to stderr.
  InitLogger(g_config.Debug ? spdlog::level::debug : spdlog::level::info, {},
             true);
}

[[noreturn]] void ReplyNotReady(const std::string& reason) {
  using google::protobuf::io::FileOutputStream;
  using google::protobuf::util::SerializeDelimitedToZeroCopyStream;

  TETHER_ERROR("{}", reason);

  auto ostream = FileOutputStream(STDOUT_FILENO);
  tether::grpc::shim::ShimReady msg;
  msg.set_ok(false);
  msg.set_pid(getpid());
  msg.set_reason(reason);
  SerializeDelimitedToZeroCopyStream(msg, &ostream);
  ostream.Flush();

  spdlog::shutdown();
  std::exit(1);
}

// Kill what a dead shim left behind in its bundle.
tether::grpc::shim::DeleteReply CleanupBundle() {
  tether::grpc::shim::DeleteReply reply;
  reply.set_code(tether::grpc::SUCCESS);
  *reply.mutable_exited_at() =
      ToProtoTimestamp(std::chrono::system_clock::now());

  std::filesystem::path pid_file = g_config.Bundle / kShimInitPidFileName;
  std::string content = util::ReadFileIntoString(pid_file);
  if (content.empty()) return reply;

  pid_t pid = 0;
  if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(content), &pid) ||
      pid <= 0) {
    TETHER_WARN("Malformed pid file {}: '{}'", pid_file, content);
    return reply;
  }

  reply.set_pid(pid);
  kill(-pid, SIGKILL);
  if (kill(pid, SIGKILL) == 0) {
    TETHER_INFO("Killed left-over task #{} of {}.", pid, g_config.Id);
    reply.set_exit_status(128 + SIGKILL);
  } else if (errno != ESRCH) {
    reply.set_code(tether::grpc::ERR_SYSTEM_ERR);
    reply.set_reason(fmt::format("Failed to kill task #{}: {}", pid,
                                 strerror(errno)));
    return reply;
  }

  std::error_code ec;
  std::filesystem::remove(pid_file, ec);
  return reply;
}

void DoDelete() {
  using google::protobuf::io::FileOutputStream;
  using google::protobuf::util::SerializeDelimitedToZeroCopyStream;

  tether::grpc::shim::DeleteReply reply = CleanupBundle();

  auto ostream = FileOutputStream(STDOUT_FILENO);
  bool ok = SerializeDelimitedToZeroCopyStream(reply, &ostream);
  ok &= ostream.Flush();

  spdlog::shutdown();
  std::exit(ok ? 0 : 1);
}

void GlobalVariableInit() {
  using google::protobuf::io::FileOutputStream;
  using google::protobuf::util::SerializeDelimitedToZeroCopyStream;

  bool warm = g_config.Action == kShimActionWarmStart;
  if (g_config.Action == kShimActionStart &&
      chdir(g_config.Bundle.c_str()) != 0)
    ReplyNotReady(fmt::format("Failed to chdir to {}: {}", g_config.Bundle,
                              strerror(errno)));

  // Ignore following sig
  signal(SIGINT, SIG_IGN);
  signal(SIGTERM, SIG_IGN);
  signal(SIGTSTP, SIG_IGN);
  signal(SIGQUIT, SIG_IGN);
  // The task's stdio may be a pipe whose reader is gone.
  signal(SIGPIPE, SIG_IGN);
  signal(SIGUSR1, SIG_IGN);
  signal(SIGUSR2, SIG_IGN);
  signal(SIGALRM, SIG_IGN);
  signal(SIGHUP, SIG_IGN);

  g_thread_pool =
      std::make_unique<BS::thread_pool>(std::thread::hardware_concurrency());

  g_daemon_client = std::make_unique<Tetherd::Shim::DaemonClient>();
  if (!g_config.DaemonAddress.empty())
    g_daemon_client->InitChannelAndStub(g_config.DaemonAddress);

  Tetherd::Shim::ShimIdentity identity{
      .Bound = !warm,
      .Id = warm ? std::string{} : g_config.Id,
      .Namespace = g_config.Namespace,
      .Bundle = warm ? std::filesystem::path{} : g_config.Bundle,
  };
  g_server = std::make_unique<Tetherd::Shim::ShimServer>(g_config.SocketPath,
                                                         std::move(identity));

  std::string address =
      fmt::format("unix://{}", g_config.SocketPath.string());
  if (!warm &&
      !util::os::WriteFileAtomically(g_config.Bundle / kShimAddressFileName,
                                     address, 0644))
    ReplyNotReady("Failed to write the address file");

  tether::grpc::shim::ShimReady msg;
  msg.set_ok(true);
  msg.set_version(g_config.Action == kShimActionPrewarm
                      ? kShimAdoptProtocolVersion
                      : kShimMinProtocolVersion);
  msg.set_address(address);
  msg.set_pid(getpid());

  auto ostream = FileOutputStream(STDOUT_FILENO);
  bool ok = SerializeDelimitedToZeroCopyStream(msg, &ostream);
  ok &= ostream.Flush();
  if (!ok) {
    TETHER_ERROR("Failed to write the handshake.");
    std::exit(1);
  }

  // The daemon reads stdout until EOF.
  int null_fd = open("/dev/null", O_WRONLY | O_CLOEXEC);
  if (null_fd == -1 || dup2(null_fd, STDOUT_FILENO) == -1) {
    TETHER_ERROR("Failed to redirect stdout: {}", strerror(errno));
    std::exit(1);
  }
  close(null_fd);
}

void StartServer() {
  GlobalVariableInit();

  util::os::SetCloseOnExecOnFdRange(STDIN_FILENO, STDERR_FILENO + 1);

  TETHER_INFO("Shim for {}/{} started ({}).", g_config.Namespace, g_config.Id,
              g_config.Action);

  g_server->Wait();
  g_server.reset();

  g_daemon_client->Shutdown();
  g_daemon_client.reset();

  g_thread_pool->wait();
  g_thread_pool.reset();

  TETHER_INFO("Shim for {}/{} exited.", g_config.Namespace, g_config.Id);
  spdlog::shutdown();
  std::exit(0);
}

void InstallStackTraceHooks() {
  static backward::SignalHandling sh;
  if (!sh.loaded()) {
    TETHER_ERROR("Failed to install stacktrace hooks.");
    std::exit(1);
  }
}

int main(int argc, char** argv) {
  ParseConfig(argc, argv);
  InstallStackTraceHooks();

  if (g_config.Action == kShimActionDelete) DoDelete();

  StartServer();
}
