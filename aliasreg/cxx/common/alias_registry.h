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

#ifndef ALIASREG_CXX_COMMON_ALIAS_REGISTRY_H_
#define ALIASREG_CXX_COMMON_ALIAS_REGISTRY_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"

namespace aliasreg {

/// \brief Manages alternate names ("aliases") for canonical names.
class AliasRegistry {
 public:
  virtual ~AliasRegistry() = default;

  /// \brief Registers `alias` as an alternate name for `name`.
  /// \return kInvalidArgument if either argument is empty, or an alias error
  /// (see alias_status.h) if the alias may not be bound.
  virtual absl::Status RegisterAlias(absl::string_view name,
                                     absl::string_view alias) = 0;

  /// \brief Removes the given alias.
  /// \return kNotFound if `alias` is not registered.
  virtual absl::Status RemoveAlias(absl::string_view alias) = 0;

  /// \brief Returns true if `name` is registered as an alias.
  virtual bool IsAlias(absl::string_view name) const = 0;

  /// \brief Returns every alias, direct or transitive, for `name`.
  virtual std::vector<std::string> GetAliases(absl::string_view name) const = 0;
};

/// \brief Rewrites a stored name, or returns std::nullopt to drop the entry.
///
/// Invoked while the registry is locked; it must not call back into the
/// registry.
using NameTransformer =
    absl::FunctionRef<std::optional<std::string>(absl::string_view)>;

/// \brief A thread-safe AliasRegistry backed by a single alias -> name map.
///
/// The map never contains a cycle and never maps a name to itself. All
/// multi-step operations run under one registry-wide lock, so a conflict or
/// circularity check is atomic with the mutation it guards.
class SimpleAliasRegistry : public AliasRegistry {
 public:
  struct Options {
    /// Whether an alias may be rebound to a different name.
    bool allow_overriding = true;
    /// If positive, the number of alias hops after which CanonicalName gives
    /// up with a ResolutionLoop error. Zero means unbounded.
    int max_resolution_depth = 0;
  };

  SimpleAliasRegistry() : SimpleAliasRegistry(Options()) {}
  explicit SimpleAliasRegistry(Options options) : options_(options) {}

  SimpleAliasRegistry(const SimpleAliasRegistry&) = delete;
  SimpleAliasRegistry& operator=(const SimpleAliasRegistry&) = delete;

  absl::Status RegisterAlias(absl::string_view name,
                             absl::string_view alias) override
      ABSL_LOCKS_EXCLUDED(mu_);

  absl::Status RemoveAlias(absl::string_view alias) override
      ABSL_LOCKS_EXCLUDED(mu_);

  bool IsAlias(absl::string_view name) const override ABSL_LOCKS_EXCLUDED(mu_);

  /// Aliases are listed in pre-order: each alias precedes its own aliases.
  std::vector<std::string> GetAliases(absl::string_view name) const override
      ABSL_LOCKS_EXCLUDED(mu_);

  /// \brief Returns true if `alias` is a direct or transitive alias of `name`.
  bool HasAlias(absl::string_view name, absl::string_view alias) const
      ABSL_LOCKS_EXCLUDED(mu_);

  /// \brief Follows alias bindings from `name` to the terminal name.
  /// \return `name` itself if it is not an alias, or a ResolutionLoop error if
  /// `max_resolution_depth` is set and was exceeded.
  absl::StatusOr<std::string> CanonicalName(absl::string_view name) const
      ABSL_LOCKS_EXCLUDED(mu_);

  /// \brief Rewrites every stored alias and name through `transform`.
  ///
  /// Pairs are taken from a snapshot of the map made before the pass, while
  /// conflict and circularity checks see the rewrites already applied. The
  /// first failure aborts the pass; earlier rewrites are kept.
  ///
  /// Each rewritten pair is checked for circularity against the whole map,
  /// so a pass over n aliases takes O(n^2) time.
  absl::Status ResolveAliases(NameTransformer transform)
      ABSL_LOCKS_EXCLUDED(mu_);

  /// \brief Returns a consistent copy of the alias -> name map.
  absl::flat_hash_map<std::string, std::string> Snapshot() const
      ABSL_LOCKS_EXCLUDED(mu_);

  /// \brief Returns the number of registered aliases.
  std::size_t size() const ABSL_LOCKS_EXCLUDED(mu_);

 protected:
  /// \brief Returns whether an alias may be rebound to a different name.
  virtual bool AllowAliasOverriding() const {
    return options_.allow_overriding;
  }

  /// \brief Fails with CircularAlias if `name` already is, directly or
  /// indirectly, an alias for `alias`.
  absl::Status CheckForAliasCircle(absl::string_view name,
                                   absl::string_view alias) const
      ABSL_SHARED_LOCKS_REQUIRED(mu_);

 private:
  /// Walks the aliases of `name` in pre-order, calling `visit` for each until
  /// it returns false. Returns false if the walk was stopped early.
  bool VisitAliasesLocked(absl::string_view name,
                          absl::FunctionRef<bool(absl::string_view)> visit)
      const ABSL_SHARED_LOCKS_REQUIRED(mu_);

  bool HasAliasLocked(absl::string_view name, absl::string_view alias) const
      ABSL_SHARED_LOCKS_REQUIRED(mu_);

  const Options options_;
  mutable absl::Mutex mu_;
  /// Maps from alias to the name it was registered for.
  absl::flat_hash_map<std::string, std::string> alias_map_ ABSL_GUARDED_BY(mu_);
};

}  // namespace aliasreg

#endif  // ALIASREG_CXX_COMMON_ALIAS_REGISTRY_H_
