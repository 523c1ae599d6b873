/*
 * Copyright 2026 The Aliasreg Authors. All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef ALIASREG_CXX_COMMON_ALIAS_STATUS_H_
#define ALIASREG_CXX_COMMON_ALIAS_STATUS_H_

#include <optional>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace aliasreg {

/// \brief The kinds of failure reported by an alias registry.
///
/// Each kind is carried by a canonical status code and, for the kinds which
/// are specific to alias bookkeeping, a `kAliasErrorPayloadUrl` payload.
enum class AliasErrorKind {
  kConflictingAlias,  ///< The alias is already bound to another name.
  kCircularAlias,     ///< The binding would close a cycle.
  kResolutionLoop,    ///< Canonical name resolution exceeded its depth cap.
};

/// Type URL of the status payload naming the AliasErrorKind.
inline constexpr absl::string_view kAliasErrorPayloadUrl =
    "type.aliasreg.io/aliasreg.AliasError";

/// \brief Returns a kAlreadyExists status describing a conflicting alias.
/// \param alias The alias which could not be bound.
/// \param name The name the caller attempted to bind `alias` to.
/// \param registered_name The name `alias` is currently bound to.
absl::Status ConflictingAliasError(absl::string_view alias,
                                   absl::string_view name,
                                   absl::string_view registered_name);

/// \brief Returns a kAlreadyExists status for an alias produced by a
/// resolution pass which collides with an existing binding.
absl::Status ConflictingResolvedAliasError(absl::string_view resolved_alias,
                                           absl::string_view original_alias,
                                           absl::string_view resolved_name,
                                           absl::string_view registered_name);

/// \brief Returns a kFailedPrecondition status describing a would-be cycle.
absl::Status CircularAliasError(absl::string_view alias,
                                absl::string_view name);

/// \brief Returns a kInternal status for a canonical name lookup which did not
/// terminate within `max_depth` steps.
absl::Status ResolutionLoopError(absl::string_view name, int max_depth);

/// \brief Returns the AliasErrorKind attached to `status`, if any.
std::optional<AliasErrorKind> GetAliasErrorKind(const absl::Status& status);

inline bool IsConflictingAlias(const absl::Status& status) {
  return GetAliasErrorKind(status) == AliasErrorKind::kConflictingAlias;
}

inline bool IsCircularAlias(const absl::Status& status) {
  return GetAliasErrorKind(status) == AliasErrorKind::kCircularAlias;
}

inline bool IsResolutionLoop(const absl::Status& status) {
  return GetAliasErrorKind(status) == AliasErrorKind::kResolutionLoop;
}

}  // namespace aliasreg

#endif  // ALIASREG_CXX_COMMON_ALIAS_STATUS_H_
