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

#include "Bundle.h"

#include <sys/stat.h>

namespace Tetherd {

namespace {

TetherExpectedRich<Bundle> MakeBundleDir(const std::filesystem::path& path,
                                         const std::string& ns,
                                         const std::string& id, mode_t mode) {
  if (!IsValidBundleComponent(ns) || !IsValidBundleComponent(id))
    return std::unexpected(FormatRichErr(tether::grpc::ERR_INVALID_PARAM,
                                         "Invalid namespace or id: '{}/{}'",
                                         ns, id));

  if (!util::os::CreateFolders(path.parent_path()))
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                         "Failed to create {}",
                                         path.parent_path().string()));

  // mkdir instead of create_directories: the bundle must not exist yet.
  if (mkdir(path.c_str(), mode) != 0) {
    int err = errno;
    if (err == EEXIST)
      return std::unexpected(FormatRichErr(tether::grpc::ERR_EXISTING_TASK,
                                           "Bundle {} already exists",
                                           path.string()));
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                         "Failed to create bundle {}: {}",
                                         path.string(), strerror(err)));
  }

  if (chmod(path.c_str(), mode) != 0) {
    int err = errno;
    util::os::DeleteFolders(path);
    return std::unexpected(FormatRichErr(tether::grpc::ERR_SYSTEM_ERR,
                                         "Failed to chmod bundle {}: {}",
                                         path.string(), strerror(err)));
  }

  return Bundle{.ID = id, .Path = path, .Namespace = ns};
}

}  // namespace

bool Bundle::Delete() const {
  if (Path.empty()) return true;
  return util::os::DeleteFolders(Path);
}

std::filesystem::path BundlePathOf(const std::filesystem::path& state_root,
                                   const std::string& ns,
                                   const std::string& id) {
  return state_root / ns / id;
}

std::filesystem::path WarmBundlePathOf(const std::filesystem::path& state_root,
                                       const std::string& ns,
                                       const std::string& warm_id) {
  return state_root / kWarmBundleDirName / ns / warm_id;
}

bool IsValidBundleComponent(const std::string& s) {
  return !s.empty() && s != "." && s != ".." &&
         s.find('/') == std::string::npos &&
         s.find('\0') == std::string::npos;
}

TetherExpectedRich<Bundle> NewBundle(const std::filesystem::path& state_root,
                                     const std::string& ns,
                                     const std::string& id) {
  // The namespace directory "warm" is reserved for warm bundles.
  if (ns == kWarmBundleDirName)
    return std::unexpected(FormatRichErr(tether::grpc::ERR_INVALID_PARAM,
                                         "Namespace '{}' is reserved", ns));

  return MakeBundleDir(BundlePathOf(state_root, ns, id), ns, id, 0711);
}

TetherExpectedRich<Bundle> NewWarmBundle(
    const std::filesystem::path& state_root, const std::string& ns,
    const std::string& warm_id) {
  return MakeBundleDir(WarmBundlePathOf(state_root, ns, warm_id), ns, warm_id,
                       0700);
}

}  // namespace Tetherd
