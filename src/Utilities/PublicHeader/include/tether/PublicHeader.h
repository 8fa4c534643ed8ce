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

#include <absl/time/time.h>

#include <array>
#include <expected>
#include <format>
#include <string>
#include <string_view>

#include "protos/PublicDefs.pb.h"

#if !defined(TETHER_VERSION_STRING)
#  define TETHER_VERSION_STRING "Unknown"
#endif

using TetherErrCode = tether::grpc::ErrCode;

using TetherRichError = tether::grpc::RichError;

template <typename T>
using TetherExpected = std::expected<T, TetherErrCode>;

template <typename T>
using TetherExpectedRich = std::expected<T, TetherRichError>;

constexpr const char* kLogPattern =
    "[%^%L%$ %C-%m-%d %H:%M:%S.%e %s:%#][%n] %v";

inline const char* const kDefaultConfigPath = "/etc/tether/config.yaml";

inline const char* const kDefaultStateRoot = "/run/tether/";
inline const char* const kDefaultTetherdUnixSockPath = "tetherd.sock";
inline const char* const kDefaultTetherdLogPath = "/var/log/tether/tetherd.log";
inline const char* const kDefaultTetherdMutexFile = "tetherd.lock";

inline const char* const kDefaultShimPath = "/usr/libexec/tshim";
inline const char* const kDefaultRuntimeName = "io.tether.process.v1";

// Sub-directory of the state root holding bundles of unbound warm shims.
inline const char* const kWarmBundleDirName = "warm";
inline const char* const kShimSocketFileName = "shim.sock";
inline const char* const kShimAddressFileName = "address";
inline const char* const kShimBinaryPathFileName = "shim-binary-path";
inline const char* const kShimInitPidFileName = "init.pid";

// Actions passed to the shim binary as its last argument.
inline const char* const kShimActionStart = "start";
inline const char* const kShimActionWarmStart = "warmstart";
inline const char* const kShimActionPrewarm = "prewarm";
inline const char* const kShimActionDelete = "delete";

// Protocol versions a shim may announce in its handshake.
// Version 3 shims accept Adopt after a prewarm start.
inline constexpr uint32_t kShimMinProtocolVersion = 2;
inline constexpr uint32_t kShimMaxProtocolVersion = 3;
inline constexpr uint32_t kShimAdoptProtocolVersion = 3;

inline constexpr uint64_t kDefaultTetherdMaxLogFileSize =
    1024 * 1024 * 50;  // 50 MB
inline constexpr uint64_t kDefaultTetherdMaxLogFileNum = 3;

inline constexpr int kDefaultWarmPoolSize = 2;
inline constexpr absl::Duration kDefaultWarmPoolTakeTimeout =
    absl::Milliseconds(100);
inline constexpr absl::Duration kDefaultShimStartTimeout = absl::Seconds(10);
inline constexpr absl::Duration kDefaultShimRpcTimeout = absl::Seconds(5);
inline constexpr absl::Duration kShimConnectTimeout = absl::Seconds(3);
inline constexpr absl::Duration kShimExitGracePeriod = absl::Seconds(2);

namespace Internal {
// clang-format off
constexpr std::array<std::string_view, tether::grpc::ErrCode_ARRAYSIZE>
    kTetherErrStrArr = {
        // 0 - 4
        "Success",
        "Generic failure",
        "Invalid parameter",
        "Non-existent error",
        "Existing task",

        // 5 - 9
        "System error",
        "Permission denied",
        "Operation not supported",
        "Failed to spawn the shim process",
        "Shim handshake failed",

        // 10 - 14
        "Protobuf error",
        "Connection timeout",
        "Connection aborted",
        "RPC failure",
        "Invalid stub",

        // 15 - 19
        "The shim connection is closed",
        "The shim is not bound to a container",
        "The warm shim is not in warming state",
        "The warm pool is closed",
        "The warm shim was not ready after bind",

        // 20 - 21
        "Runtime not found",
        "Service shutting down",
    };
// clang-format on
}  // namespace Internal

inline std::string_view TetherErrStr(TetherErrCode err) {
  return Internal::kTetherErrStrArr[static_cast<uint16_t>(err)];
}

template <typename... Args>
inline TetherRichError FormatRichErr(TetherErrCode code, const std::string& fmt,
                                     Args&&... args) {
  TetherRichError rich_err;

  rich_err.set_code(code);
  rich_err.set_description(
      std::vformat(fmt, std::make_format_args(args...)));

  return rich_err;
}

/* ----------- Public definitions for all components */

// Key of the live shim table: (namespace, container id).
using ShimKey = std::pair<std::string, std::string>;
