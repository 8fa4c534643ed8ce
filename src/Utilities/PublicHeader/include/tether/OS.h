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

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <filesystem>
#include <string>

#include "tether/Logger.h"

namespace util {

namespace os {

bool DeleteFile(std::filesystem::path const& p);

bool DeleteFolders(std::filesystem::path const& p);

bool CreateFolders(std::filesystem::path const& p);

// Create p and its missing parents. The last component gets the given mode,
// which is applied with chmod so that the umask does not narrow it.
bool CreateFoldersWithMode(std::filesystem::path const& p, mode_t mode);

bool CreateFoldersForFile(std::filesystem::path const& p);

// Write content to p, replacing it, with the given permission bits.
bool WriteFileAtomically(std::filesystem::path const& p,
                         std::string_view content, mode_t mode = 0600);

bool SetFdNonBlocking(int fd);

// Close file descriptors from fd_begin to the max fd.
// This may be slow if fd_max is too large.
void CloseFdFrom(int fd_begin);

// Set close-on-exec flag on [fd_begin, fd_end).
void SetCloseOnExecOnFdRange(int fd_begin, int fd_end);

bool SetMaxFileDescriptorNumber(uint64_t num);

// Returns -1 and sets errno on failure.
int PidfdOpen(pid_t pid);

}  // namespace os

}  // namespace util
