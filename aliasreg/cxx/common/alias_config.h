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

#ifndef ALIASREG_CXX_COMMON_ALIAS_CONFIG_H_
#define ALIASREG_CXX_COMMON_ALIAS_CONFIG_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "aliasreg/cxx/common/alias_registry.h"
#include "aliasreg/cxx/common/placeholder_resolver.h"
#include "aliasreg/proto/alias_config.pb.h"

namespace aliasreg {

/// \brief Parses a JSON-encoded AliasConfiguration.
absl::StatusOr<proto::AliasConfiguration> ParseAliasConfiguration(
    absl::string_view json);

/// \brief Reads and parses the JSON-encoded AliasConfiguration at `path`.
absl::StatusOr<proto::AliasConfiguration> LoadAliasConfigurationFile(
    const std::string& path);

/// \brief Registers every alias definition in `config` with `registry`, in
/// order, stopping at the first failure.
/// \return The first failure, annotated with the index of the definition.
absl::Status ApplyAliasConfiguration(const proto::AliasConfiguration& config,
                                     AliasRegistry* registry);

/// \brief Returns a resolver for the placeholders described by `config`.
PlaceholderResolver MakePlaceholderResolver(
    const proto::AliasConfiguration& config);

/// \brief Returns the current bindings of `registry`, ordered by alias.
proto::AliasConfiguration ExportAliasConfiguration(
    const SimpleAliasRegistry& registry);

}  // namespace aliasreg

#endif  // ALIASREG_CXX_COMMON_ALIAS_CONFIG_H_
