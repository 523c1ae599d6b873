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

#include "aliasreg/cxx/common/alias_status.h"

#include <optional>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace aliasreg {
namespace {

absl::string_view KindName(AliasErrorKind kind) {
  switch (kind) {
    case AliasErrorKind::kConflictingAlias:
      return "ConflictingAlias";
    case AliasErrorKind::kCircularAlias:
      return "CircularAlias";
    case AliasErrorKind::kResolutionLoop:
      return "ResolutionLoop";
  }
  return "";
}

absl::Status WithKind(absl::Status status, AliasErrorKind kind) {
  status.SetPayload(kAliasErrorPayloadUrl, absl::Cord(KindName(kind)));
  return status;
}

}  // namespace

absl::Status ConflictingAliasError(absl::string_view alias,
                                   absl::string_view name,
                                   absl::string_view registered_name) {
  return WithKind(
      absl::AlreadyExistsError(absl::StrCat(
          "Cannot define alias '", alias, "' for name '", name,
          "': It is already registered for name '", registered_name, "'.")),
      AliasErrorKind::kConflictingAlias);
}

absl::Status ConflictingResolvedAliasError(absl::string_view resolved_alias,
                                           absl::string_view original_alias,
                                           absl::string_view resolved_name,
                                           absl::string_view registered_name) {
  return WithKind(
      absl::AlreadyExistsError(absl::StrCat(
          "Cannot register resolved alias '", resolved_alias, "' (original: '",
          original_alias, "') for name '", resolved_name,
          "': It is already registered for name '", registered_name, "'.")),
      AliasErrorKind::kConflictingAlias);
}

absl::Status CircularAliasError(absl::string_view alias,
                                absl::string_view name) {
  return WithKind(
      absl::FailedPreconditionError(absl::StrCat(
          "Cannot register alias '", alias, "' for name '", name,
          "': Circular reference - '", name,
          "' is a direct or indirect alias for '", alias, "' already")),
      AliasErrorKind::kCircularAlias);
}

absl::Status ResolutionLoopError(absl::string_view name, int max_depth) {
  return WithKind(
      absl::InternalError(absl::StrCat("Resolving canonical name for '", name,
                                       "' did not terminate after ", max_depth,
                                       " steps")),
      AliasErrorKind::kResolutionLoop);
}

std::optional<AliasErrorKind> GetAliasErrorKind(const absl::Status& status) {
  auto payload = status.GetPayload(kAliasErrorPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  for (AliasErrorKind kind :
       {AliasErrorKind::kConflictingAlias, AliasErrorKind::kCircularAlias,
        AliasErrorKind::kResolutionLoop}) {
    if (*payload == KindName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace aliasreg
