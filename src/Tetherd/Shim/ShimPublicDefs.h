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

#include "ShimPreCompiledHeader.h"
// Precompiled header comes first

namespace Tetherd::Shim {

struct Config {
  std::string Id;
  std::string Namespace;
  // For warm shims this is the warm bundle, which only holds the socket.
  std::filesystem::path Bundle;
  std::string DaemonAddress;
  std::string Action;
  bool Debug{false};

  std::filesystem::path SocketPath;
};

inline Config g_config;

}  // namespace Tetherd::Shim

inline std::unique_ptr<BS::thread_pool> g_thread_pool;
