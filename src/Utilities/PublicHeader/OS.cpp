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

#include "tether/OS.h"

#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>

#include <cerrno>
#include <cstring>

namespace util::os {

bool DeleteFile(std::filesystem::path const& p) {
  std::error_code ec;
  bool ok = std::filesystem::remove(p, ec);

  if (!ok) TETHER_ERROR("Failed to remove file {}: {}", p, ec.message());

  return ok;
}

bool DeleteFolders(std::filesystem::path const& p) {
  std::error_code ec;
  std::filesystem::remove_all(p, ec);
  if (ec) {
    TETHER_ERROR("Failed to remove folder {}: {}", p, ec.message());
    return false;
  }

  return true;
}

bool CreateFolders(std::filesystem::path const& p) {
  if (std::filesystem::exists(p)) return true;

  std::error_code ec;
  bool ok = std::filesystem::create_directories(p, ec);

  if (!ok) TETHER_ERROR("Failed to create folder {}: {}", p, ec.message());

  return ok;
}

bool CreateFoldersWithMode(std::filesystem::path const& p, mode_t mode) {
  if (!CreateFolders(p)) return false;

  if (chmod(p.c_str(), mode) != 0) {
    TETHER_ERROR("Failed to chmod {} to {:o}: {}", p, mode, strerror(errno));
    return false;
  }

  return true;
}

bool CreateFoldersForFile(std::filesystem::path const& p) {
  try {
    auto dir = p.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir))
      std::filesystem::create_directories(dir);
  } catch (const std::exception& e) {
    TETHER_ERROR("Failed to create folder for {}: {}", p, e.what());
    return false;
  }

  return true;
}

bool WriteFileAtomically(std::filesystem::path const& p,
                         std::string_view content, mode_t mode) {
  std::filesystem::path tmp = p;
  tmp += ".tmp";

  int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  if (fd == -1) {
    TETHER_ERROR("Failed to open {}: {}", tmp, strerror(errno));
    return false;
  }
  // The umask must not narrow the requested bits.
  fchmod(fd, mode);

  size_t written = 0;
  while (written < content.size()) {
    ssize_t n = write(fd, content.data() + written, content.size() - written);
    if (n == -1) {
      if (errno == EINTR) continue;
      TETHER_ERROR("Failed to write {}: {}", tmp, strerror(errno));
      close(fd);
      unlink(tmp.c_str());
      return false;
    }
    written += n;
  }
  close(fd);

  if (rename(tmp.c_str(), p.c_str()) != 0) {
    TETHER_ERROR("Failed to rename {} to {}: {}", tmp, p, strerror(errno));
    unlink(tmp.c_str());
    return false;
  }

  return true;
}

// NOLINTNEXTLINE(misc-use-internal-linkage)
int GetFdOpenMax() { return static_cast<int>(sysconf(_SC_OPEN_MAX)); }

bool SetFdNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

void CloseFdFrom(int fd_begin) {
  int fd_max = GetFdOpenMax();
  for (int i = fd_begin; i < fd_max; i++) close(i);
}

void SetCloseOnExecOnFdRange(int fd_begin, int fd_end) {
  int fd_max;
  int flag;

  fd_max = std::min(GetFdOpenMax(), fd_end);
  for (int i = fd_begin; i < fd_max; i++) {
    flag = fcntl(i, F_GETFD);

    if (flag != -1) {
      fcntl(i, F_SETFD, flag | FD_CLOEXEC);
    }
  }
}

bool SetMaxFileDescriptorNumber(uint64_t num) {
  struct rlimit rlim{};
  rlim.rlim_cur = num;
  rlim.rlim_max = num;

  return setrlimit(RLIMIT_NOFILE, &rlim) == 0;
}

int PidfdOpen(pid_t pid) {
  return static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
}

}  // namespace util::os
