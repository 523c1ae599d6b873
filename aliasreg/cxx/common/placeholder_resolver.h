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

#ifndef ALIASREG_CXX_COMMON_PLACEHOLDER_RESOLVER_H_
#define ALIASREG_CXX_COMMON_PLACEHOLDER_RESOLVER_H_

#include <optional>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace aliasreg {

/// \brief Substitutes `${key}` placeholders in names from a property table.
///
/// `${key:default}` substitutes `default` when `key` has no property. Values
/// and defaults are themselves resolved, so properties may refer to other
/// properties; a property which refers back to itself is an error. Keys may
/// be assembled from other placeholders, as in `${db.${env}}`.
class PlaceholderResolver {
 public:
  struct Options {
    /// If true, placeholders with neither a property nor a default are left
    /// in place instead of failing the resolution.
    bool ignore_unresolvable = false;
  };

  explicit PlaceholderResolver(
      absl::flat_hash_map<std::string, std::string> properties)
      : PlaceholderResolver(std::move(properties), Options()) {}
  PlaceholderResolver(absl::flat_hash_map<std::string, std::string> properties,
                      Options options)
      : properties_(std::move(properties)), options_(options) {}

  /// \brief Returns `text` with every placeholder substituted.
  /// \return kNotFound for an unresolvable placeholder, or
  /// kFailedPrecondition for a circular property reference.
  absl::StatusOr<std::string> ResolveOrError(absl::string_view text) const;

  /// \brief Returns `text` with every placeholder substituted, or
  /// std::nullopt if it could not be resolved.
  ///
  /// Suitable as a NameTransformer for SimpleAliasRegistry::ResolveAliases.
  std::optional<std::string> Resolve(absl::string_view text) const;

 private:
  /// Repeats ResolvePass until no placeholder is substituted, so that
  /// placeholders assembled from substitutions are resolved too.
  absl::StatusOr<std::string> ResolveText(
      absl::string_view text, absl::flat_hash_set<std::string>* active) const;

  /// Substitutes each innermost placeholder of `text` once. Sets
  /// `*substituted` if any placeholder was replaced.
  absl::StatusOr<std::string> ResolvePass(
      absl::string_view text, absl::flat_hash_set<std::string>* active,
      bool* substituted) const;

  absl::StatusOr<std::string> ResolvePlaceholder(
      absl::string_view placeholder,
      absl::flat_hash_set<std::string>* active) const;

  absl::flat_hash_map<std::string, std::string> properties_;
  Options options_;
};

}  // namespace aliasreg

#endif  // ALIASREG_CXX_COMMON_PLACEHOLDER_RESOLVER_H_
