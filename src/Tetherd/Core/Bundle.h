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

#include "TetherdPublicDefs.h"
// Precompiled header comes first.

namespace Tetherd {

/**
 * On-disk working area of one shim.
 * Cold bundles live at <state-root>/<namespace>/<id>, warm ones at
 * <state-root>/warm/<namespace>/<warm-id>.
 */
struct Bundle {
  std::string ID;
  std::filesystem::path Path;
  std::string Namespace;

  // Remove the bundle directory. A missing directory is not an error.
  [[nodiscard]] bool Delete() const;
};

std::filesystem::path BundlePathOf(const std::filesystem::path& state_root,
                                   const std::string& ns,
                                   const std::string& id);

std::filesystem::path WarmBundlePathOf(const std::filesystem::path& state_root,
                                       const std::string& ns,
                                       const std::string& warm_id);

// Namespaces and ids become path components.
[[nodiscard]] bool IsValidBundleComponent(const std::string& s);

/**
 * @brief Create the directory of a new container bundle.
 * @return ERR_INVALID_PARAM for an id or namespace that is not a plain path
 * component, ERR_EXISTING_TASK when the directory already exists.
 */
TetherExpectedRich<Bundle> NewBundle(const std::filesystem::path& state_root,
                                     const std::string& ns,
                                     const std::string& id);

// Same as NewBundle for a warm placeholder, with owner-only permissions.
TetherExpectedRich<Bundle> NewWarmBundle(
    const std::filesystem::path& state_root, const std::string& ns,
    const std::string& warm_id);

}  // namespace Tetherd
