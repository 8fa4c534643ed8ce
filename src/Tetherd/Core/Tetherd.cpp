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

#include <backward.hpp>
#include <cxxopts.hpp>
#include <sys/file.h>
#include <yaml-cpp/yaml.h>

#include "ShimManager.h"
#include "TetherdPublicDefs.h"
#include "TetherdServer.h"
#include "tether/String.h"

using Tetherd::g_config;

void ParseShimConfig(const YAML::Node& shim_config) {
  using util::YamlValueOr;
  auto& conf = g_config.Shim;

  if (shim_config["Runtimes"]) {
    for (const auto& it : shim_config["Runtimes"])
      conf.Runtimes.emplace(it.first.as<std::string>(),
                            it.second.as<std::string>());
  }
  conf.DefaultRuntime =
      YamlValueOr(shim_config["DefaultRuntime"], kDefaultRuntimeName);
  if (!conf.Runtimes.contains(conf.DefaultRuntime))
    conf.Runtimes.emplace(conf.DefaultRuntime, kDefaultShimPath);

  for (const auto& [name, path] : conf.Runtimes) {
    if (!std::filesystem::exists(path)) {
      fmt::print(stderr, "Shim binary {} of runtime {} does not exist\n",
                 path, name);
      std::exit(1);
    }
  }

  conf.DebugLevel = YamlValueOr(shim_config["DebugLevel"], "info");
  if (!StrToLogLevel(conf.DebugLevel).has_value()) {
    fmt::print(stderr,
               "Illegal Shim debug-level: {}, should be one of trace,"
               ", debug, info, warn, error, off.\n",
               conf.DebugLevel);
    std::exit(1);
  }

  conf.StartTimeout = absl::Milliseconds(YamlValueOr<int64_t>(
      shim_config["StartTimeoutMs"],
      absl::ToInt64Milliseconds(kDefaultShimStartTimeout)));
  conf.RpcTimeout = absl::Milliseconds(
      YamlValueOr<int64_t>(shim_config["RpcTimeoutMs"],
                           absl::ToInt64Milliseconds(kDefaultShimRpcTimeout)));

  if (auto prewarm = shim_config["Prewarm"]; prewarm) {
    conf.Prewarm.Enabled = YamlValueOr<bool>(prewarm["Enabled"], false);
    if (prewarm["Runtimes"]) {
      for (const auto& rt : prewarm["Runtimes"])
        conf.Prewarm.Runtimes.emplace(rt.as<std::string>());
    }
  }

  if (auto pool = shim_config["WarmPool"]; pool) {
    conf.WarmPool.Enabled = YamlValueOr<bool>(pool["Enabled"], false);
    conf.WarmPool.Size = YamlValueOr<int>(pool["Size"], kDefaultWarmPoolSize);
    conf.WarmPool.TakeTimeout = absl::Milliseconds(YamlValueOr<int64_t>(
        pool["TakeTimeoutMs"],
        absl::ToInt64Milliseconds(kDefaultWarmPoolTakeTimeout)));
    conf.WarmPool = Tetherd::NormalizeWarmPoolConfig(conf.WarmPool);
  }
}

void ParseConfig(int argc, char** argv) {
  cxxopts::Options options("tetherd");

  // clang-format off
  options.add_options()
      ("f,config-file", "Path to configuration file",
      cxxopts::value<std::string>()->default_value(kDefaultConfigPath))
      ("L,log-file", "Path to Tetherd log file",
       cxxopts::value<std::string>())
      ("D,debug-level", "Logging level of Tetherd, format: <trace|debug|info|warn|error>",
       cxxopts::value<std::string>())
      ("F,foreground", "Do not daemonize")
      ("v,version", "Display version information")
      ("h,help", "Display help for Tetherd")
      ;
  // clang-format on

  cxxopts::ParseResult parsed_args;
  try {
    parsed_args = options.parse(argc, argv);
  } catch (cxxopts::OptionException& e) {
    fmt::print(stderr, "{}\n{}\n", e.what(), options.help());
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

  std::string config_path = parsed_args["config-file"].as<std::string>();
  YAML::Node config;
  if (std::filesystem::exists(config_path)) {
    try {
      config = YAML::LoadFile(config_path);
    } catch (YAML::BadFile& e) {
      fmt::print(stderr, "Can't open config file {}: {}\n", config_path,
                 e.what());
      std::exit(1);
    } catch (YAML::ParserException& e) {
      fmt::print(stderr, "Malformed config file {}: {}\n", config_path,
                 e.what());
      std::exit(1);
    }
  } else {
    fmt::print(stderr, "Config file {} not existed, using defaults.\n",
               config_path);
  }

  try {
    using util::YamlValueOr;

    g_config.StateRoot = YamlValueOr(config["StateRoot"], kDefaultStateRoot);

    if (parsed_args.count("log-file"))
      g_config.TetherdLogFile = parsed_args["log-file"].as<std::string>();
    else
      g_config.TetherdLogFile =
          YamlValueOr(config["TetherdLogFile"], kDefaultTetherdLogPath);

    if (parsed_args.count("debug-level"))
      g_config.TetherdDebugLevel =
          parsed_args["debug-level"].as<std::string>();
    else
      g_config.TetherdDebugLevel =
          YamlValueOr(config["TetherdDebugLevel"], "info");

    g_config.TetherdMaxLogFileSize = YamlValueOr<uint64_t>(
        config["TetherdMaxLogFileSize"], kDefaultTetherdMaxLogFileSize);
    g_config.TetherdMaxLogFileNum = YamlValueOr<uint64_t>(
        config["TetherdMaxLogFileNum"], kDefaultTetherdMaxLogFileNum);

    g_config.TetherdForeground =
        parsed_args.count("foreground") > 0 ||
        YamlValueOr<bool>(config["TetherdForeground"], false);

    // spdlog should be initialized as soon as possible
    std::optional log_level = StrToLogLevel(g_config.TetherdDebugLevel);
    if (log_level.has_value()) {
      InitLogger(log_level.value(), g_config.TetherdLogFile,
                 g_config.TetherdForeground, g_config.TetherdMaxLogFileSize,
                 g_config.TetherdMaxLogFileNum);
    } else {
      fmt::print(stderr, "Illegal Tetherd debug-level format: {}.\n",
                 g_config.TetherdDebugLevel);
      std::exit(1);
    }

    g_config.TetherdUnixSockPath =
        g_config.StateRoot / YamlValueOr(config["TetherdUnixSockPath"],
                                         kDefaultTetherdUnixSockPath);
    g_config.TetherdMutexFilePath =
        g_config.StateRoot / YamlValueOr(config["TetherdMutexFilePath"],
                                         kDefaultTetherdMutexFile);

    ParseShimConfig(config["Shim"] ? config["Shim"] : YAML::Node());
  } catch (YAML::BadConversion& e) {
    fmt::print(stderr, "Config error: {}\n", e.what());
    std::exit(1);
  }
}

void CreateRequiredDirectories() {
  bool ok;
  ok = util::os::CreateFoldersWithMode(g_config.StateRoot, 0711);
  if (!ok) std::exit(1);

  ok = util::os::CreateFoldersWithMode(g_config.StateRoot / kWarmBundleDirName,
                                       0700);
  if (!ok) std::exit(1);
}

void GlobalVariableInit() {
  CreateRequiredDirectories();

  // Mask SIGPIPE to prevent Tetherd from crushing due to
  // SIGPIPE while reading the pipes of spawned shims.
  signal(SIGPIPE, SIG_IGN);

  // It is always ok to create thread pool first.
  g_thread_pool =
      std::make_unique<BS::thread_pool>(std::thread::hardware_concurrency());

  Tetherd::ShimManagerOptions options;
  options.Env.StateRoot = g_config.StateRoot;
  options.Env.DaemonAddress =
      fmt::format("unix://{}", g_config.TetherdUnixSockPath.string());
  options.Env.Debug = g_config.Shim.DebugLevel == "debug" ||
                      g_config.Shim.DebugLevel == "trace";
  options.Env.StartTimeout = g_config.Shim.StartTimeout;
  options.Env.RpcTimeout = g_config.Shim.RpcTimeout;
  options.Env.Prewarm = g_config.Shim.Prewarm;
  options.Runtimes = g_config.Shim.Runtimes;
  options.DefaultRuntime = g_config.Shim.DefaultRuntime;
  options.WarmPool = g_config.Shim.WarmPool;

  g_shim_manager = std::make_unique<Tetherd::ShimManager>(std::move(options));

  g_server =
      std::make_unique<Tetherd::TetherdServer>(g_config.TetherdUnixSockPath);
}

void WaitForStopAndDoGvarFini() {
  // Shutdown() of the server is called from the signal waiting thread.
  g_server->Wait();
  g_server.reset();

  // Pools and live shims are closed here, before the thread pool goes.
  g_shim_manager->Shutdown();

  g_thread_pool->wait();
  g_shim_manager.reset();
  g_thread_pool.reset();

  std::exit(0);
}

sigset_t TerminationSignals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

// Must run before any thread is created, the logger's included, so that all
// of them inherit the mask.
void BlockTerminationSignals() {
  sigset_t set = TerminationSignals();
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

void StartSignalWaiter() {
  std::thread([set = TerminationSignals()] {
    int sig = 0;
    sigwait(&set, &sig);
    TETHER_INFO("Signal {} received, shutting down.", sig);
    g_server->Shutdown();
  }).detach();
}

void StartServer() {
  constexpr uint64_t file_max = 640000;
  if (!util::os::SetMaxFileDescriptorNumber(file_max)) {
    TETHER_ERROR("Unable to set file descriptor limits to {}", file_max);
    std::exit(1);
  }

  GlobalVariableInit();
  StartSignalWaiter();

  // Set FD_CLOEXEC on stdin, stdout, stderr
  util::os::SetCloseOnExecOnFdRange(STDIN_FILENO, STDERR_FILENO + 1);

  WaitForStopAndDoGvarFini();
}

void StartDaemon() {
  /* Our process ID and Session ID */
  pid_t pid, sid;

  /* Fork off the parent process */
  pid = fork();
  if (pid < 0) {
    TETHER_ERROR("Error: fork()");
    exit(1);
  }
  /* If we got a good PID, then
     we can exit the parent process. */
  if (pid > 0) {
    exit(0);
  }

  /* Change the file mode mask */
  umask(0);

  /* Create a new SID for the child process */
  sid = setsid();
  if (sid < 0) {
    TETHER_ERROR("Error: setsid()");
    exit(1);
  }

  /* Change the current working directory */
  if ((chdir("/")) < 0) {
    TETHER_ERROR("Error: chdir()");
    exit(1);
  }

  /* Close out the standard file descriptors */
  close(STDIN_FILENO);
  close(STDOUT_FILENO);
  close(STDERR_FILENO);

  StartServer();

  exit(EXIT_SUCCESS);
}

void CheckSingleton() {
  bool ok = util::os::CreateFoldersForFile(g_config.TetherdMutexFilePath);
  if (!ok) std::exit(1);

  int pid_file =
      open(g_config.TetherdMutexFilePath.c_str(), O_CREAT | O_RDWR, 0666);
  int rc = flock(pid_file, LOCK_EX | LOCK_NB);
  if (rc) {
    if (EWOULDBLOCK == errno) {
      TETHER_CRITICAL("There is another Tetherd instance running. Exiting...");
      std::exit(1);
    } else {
      TETHER_CRITICAL("Failed to lock {}: {}. Exiting...",
                      g_config.TetherdMutexFilePath, strerror(errno));
      std::exit(1);
    }
  }
}

void InstallStackTraceHooks() {
  static backward::SignalHandling sh;
  if (!sh.loaded()) {
    TETHER_ERROR("Failed to install stacktrace hooks.");
    std::exit(1);
  }
}

int main(int argc, char** argv) {
  BlockTerminationSignals();

  // If config parsing fails, this function will not return and will call
  // std::exit(1) instead.
  ParseConfig(argc, argv);
  CheckSingleton();
  InstallStackTraceHooks();

  if (g_config.TetherdForeground)
    StartServer();
  else
    StartDaemon();

  return 0;
}
