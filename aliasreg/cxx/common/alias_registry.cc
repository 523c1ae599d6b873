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

#include "aliasreg/cxx/common/alias_registry.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/functional/function_ref.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "aliasreg/cxx/common/alias_status.h"

namespace aliasreg {

absl::Status SimpleAliasRegistry::RegisterAlias(absl::string_view name,
                                                absl::string_view alias) {
  if (name.empty()) {
    return absl::InvalidArgumentError("'name' must not be empty");
  }
  if (alias.empty()) {
    return absl::InvalidArgumentError("'alias' must not be empty");
  }

  absl::MutexLock lock(&mu_);
  if (alias == name) {
    alias_map_.erase(alias);
    DLOG(INFO) << "Alias definition '" << alias
               << "' ignored since it points to same name";
    return absl::OkStatus();
  }

  std::optional<std::string> overridden;
  if (auto found = alias_map_.find(alias); found != alias_map_.end()) {
    if (found->second == name) {
      // An existing alias; no need to re-register.
      return absl::OkStatus();
    }
    if (!AllowAliasOverriding()) {
      return ConflictingAliasError(alias, name, found->second);
    }
    overridden = found->second;
  }
  if (absl::Status status = CheckForAliasCircle(name, alias); !status.ok()) {
    return status;
  }
  alias_map_.insert_or_assign(std::string(alias), std::string(name));
  if (overridden.has_value()) {
    LOG(INFO) << "Overriding alias '" << alias
              << "' definition for registered name '" << *overridden
              << "' with new target name '" << name << "'";
  } else {
    DLOG(INFO) << "Alias definition '" << alias << "' registered for name '"
               << name << "'";
  }
  return absl::OkStatus();
}

absl::Status SimpleAliasRegistry::RemoveAlias(absl::string_view alias) {
  absl::MutexLock lock(&mu_);
  if (alias_map_.erase(alias) == 0) {
    return absl::NotFoundError(
        absl::StrCat("No alias '", alias, "' registered"));
  }
  return absl::OkStatus();
}

bool SimpleAliasRegistry::IsAlias(absl::string_view name) const {
  absl::ReaderMutexLock lock(&mu_);
  return alias_map_.contains(name);
}

std::vector<std::string> SimpleAliasRegistry::GetAliases(
    absl::string_view name) const {
  std::vector<std::string> result;
  absl::ReaderMutexLock lock(&mu_);
  VisitAliasesLocked(name, [&result](absl::string_view alias) {
    result.emplace_back(alias);
    return true;
  });
  return result;
}

bool SimpleAliasRegistry::HasAlias(absl::string_view name,
                                   absl::string_view alias) const {
  absl::ReaderMutexLock lock(&mu_);
  return HasAliasLocked(name, alias);
}

absl::StatusOr<std::string> SimpleAliasRegistry::CanonicalName(
    absl::string_view name) const {
  absl::ReaderMutexLock lock(&mu_);
  std::string canonical_name(name);
  int depth = 0;
  for (auto found = alias_map_.find(canonical_name); found != alias_map_.end();
       found = alias_map_.find(canonical_name)) {
    if (options_.max_resolution_depth > 0 &&
        ++depth > options_.max_resolution_depth) {
      return ResolutionLoopError(name, options_.max_resolution_depth);
    }
    canonical_name = found->second;
  }
  return canonical_name;
}

absl::Status SimpleAliasRegistry::ResolveAliases(NameTransformer transform) {
  absl::MutexLock lock(&mu_);
  const absl::flat_hash_map<std::string, std::string> alias_copy = alias_map_;
  for (const auto& [alias, registered_name] : alias_copy) {
    std::optional<std::string> resolved_alias = transform(alias);
    std::optional<std::string> resolved_name = transform(registered_name);
    if (!resolved_alias.has_value() || !resolved_name.has_value()) {
      LOG(WARNING) << "Dropping alias '" << alias << "' for name '"
                   << registered_name << "': it did not resolve";
      alias_map_.erase(alias);
    } else if (*resolved_alias == *resolved_name) {
      alias_map_.erase(alias);
    } else if (*resolved_alias != alias) {
      if (auto existing = alias_map_.find(*resolved_alias);
          existing != alias_map_.end()) {
        if (existing->second == *resolved_name) {
          // Already bound as resolved; the unresolved entry is redundant.
          alias_map_.erase(alias);
          continue;
        }
        return ConflictingResolvedAliasError(*resolved_alias, alias,
                                             *resolved_name, existing->second);
      }
      if (absl::Status status =
              CheckForAliasCircle(*resolved_name, *resolved_alias);
          !status.ok()) {
        return status;
      }
      alias_map_.erase(alias);
      alias_map_.insert_or_assign(*std::move(resolved_alias),
                                  *std::move(resolved_name));
    } else if (registered_name != *resolved_name) {
      if (absl::Status status = CheckForAliasCircle(*resolved_name, alias);
          !status.ok()) {
        return status;
      }
      alias_map_.insert_or_assign(alias, *std::move(resolved_name));
    }
  }
  return absl::OkStatus();
}

absl::flat_hash_map<std::string, std::string> SimpleAliasRegistry::Snapshot()
    const {
  absl::ReaderMutexLock lock(&mu_);
  return alias_map_;
}

std::size_t SimpleAliasRegistry::size() const {
  absl::ReaderMutexLock lock(&mu_);
  return alias_map_.size();
}

absl::Status SimpleAliasRegistry::CheckForAliasCircle(
    absl::string_view name, absl::string_view alias) const {
  if (HasAliasLocked(alias, name)) {
    return CircularAliasError(alias, name);
  }
  return absl::OkStatus();
}

bool SimpleAliasRegistry::HasAliasLocked(absl::string_view name,
                                         absl::string_view alias) const {
  return !VisitAliasesLocked(
      name, [alias](absl::string_view found) { return found != alias; });
}

bool SimpleAliasRegistry::VisitAliasesLocked(
    absl::string_view name,
    absl::FunctionRef<bool(absl::string_view)> visit) const {
  absl::flat_hash_map<absl::string_view, std::vector<absl::string_view>>
      aliases_by_name;
  for (const auto& [alias, registered_name] : alias_map_) {
    aliases_by_name[registered_name].push_back(alias);
  }

  std::vector<absl::string_view> pending;
  auto push_aliases_of = [&](absl::string_view target) {
    auto found = aliases_by_name.find(target);
    if (found == aliases_by_name.end()) return;
    // Pushed in reverse so they pop in map order.
    pending.insert(pending.end(), found->second.rbegin(),
                   found->second.rend());
  };

  // A well-formed map is acyclic; `visited` only guards a corrupted one.
  absl::flat_hash_set<absl::string_view> visited;
  push_aliases_of(name);
  while (!pending.empty()) {
    absl::string_view alias = pending.back();
    pending.pop_back();
    if (!visited.insert(alias).second) continue;
    if (!visit(alias)) return false;
    push_aliases_of(alias);
  }
  return true;
}

}  // namespace aliasreg
