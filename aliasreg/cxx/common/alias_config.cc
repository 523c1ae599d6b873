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

#include "aliasreg/cxx/common/alias_config.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "aliasreg/cxx/common/alias_registry.h"
#include "aliasreg/cxx/common/json_proto.h"
#include "aliasreg/cxx/common/placeholder_resolver.h"
#include "aliasreg/proto/alias_config.pb.h"

namespace aliasreg {
namespace {

absl::StatusOr<std::string> ReadFile(const std::string& path) {
  FILE* handle = fopen(path.c_str(), "rb");
  if (handle == nullptr) {
    return absl::NotFoundError(
        absl::StrCat("Couldn't open ", path, ": ", std::strerror(errno)));
  }
  std::string content;
  char buffer[4096];
  size_t read;
  while ((read = fread(buffer, 1, sizeof(buffer), handle)) > 0) {
    content.append(buffer, read);
  }
  bool failed = ferror(handle) != 0;
  if (fclose(handle) == EOF || failed) {
    return absl::DataLossError(absl::StrCat("Couldn't read ", path));
  }
  return content;
}

}  // namespace

absl::StatusOr<proto::AliasConfiguration> ParseAliasConfiguration(
    absl::string_view json) {
  proto::AliasConfiguration config;
  if (absl::Status status = ParseFromJsonString(json, &config); !status.ok()) {
    return status;
  }
  return config;
}

absl::StatusOr<proto::AliasConfiguration> LoadAliasConfigurationFile(
    const std::string& path) {
  absl::StatusOr<std::string> content = ReadFile(path);
  if (!content.ok()) {
    return content.status();
  }
  absl::StatusOr<proto::AliasConfiguration> config =
      ParseAliasConfiguration(*content);
  if (!config.ok()) {
    return absl::Status(config.status().code(),
                        absl::StrCat(path, ": ", config.status().message()));
  }
  return config;
}

absl::Status ApplyAliasConfiguration(const proto::AliasConfiguration& config,
                                     AliasRegistry* registry) {
  for (int i = 0; i < config.aliases_size(); ++i) {
    const proto::AliasDefinition& definition = config.aliases(i);
    absl::Status status =
        registry->RegisterAlias(definition.name(), definition.alias());
    if (!status.ok()) {
      // Rebuild rather than copy so the alias error payload survives.
      absl::Status annotated(
          status.code(),
          absl::StrCat("aliases[", i, "]: ", status.message()));
      status.ForEachPayload(
          [&annotated](absl::string_view url, const absl::Cord& payload) {
            annotated.SetPayload(url, payload);
          });
      return annotated;
    }
  }
  return absl::OkStatus();
}

PlaceholderResolver MakePlaceholderResolver(
    const proto::AliasConfiguration& config) {
  absl::flat_hash_map<std::string, std::string> properties;
  for (const auto& property : config.properties()) {
    properties.emplace(property.first, property.second);
  }
  PlaceholderResolver::Options options;
  options.ignore_unresolvable = config.ignore_unresolvable_placeholders();
  return PlaceholderResolver(std::move(properties), options);
}

proto::AliasConfiguration ExportAliasConfiguration(
    const SimpleAliasRegistry& registry) {
  absl::flat_hash_map<std::string, std::string> snapshot = registry.Snapshot();
  std::vector<std::pair<std::string, std::string>> entries(snapshot.begin(),
                                                           snapshot.end());
  std::sort(entries.begin(), entries.end());

  proto::AliasConfiguration config;
  for (auto& [alias, name] : entries) {
    proto::AliasDefinition* definition = config.add_aliases();
    definition->set_name(std::move(name));
    definition->set_alias(std::move(alias));
  }
  return config;
}

}  // namespace aliasreg
