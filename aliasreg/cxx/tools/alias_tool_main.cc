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

// alias_tool
//   loads a JSON alias configuration, resolves placeholders in it and reports
//   the canonical name and aliases of each name given on the command line

#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "aliasreg/cxx/common/alias_config.h"
#include "aliasreg/cxx/common/alias_registry.h"
#include "aliasreg/cxx/common/json_proto.h"
#include "aliasreg/cxx/common/placeholder_resolver.h"
#include "aliasreg/proto/alias_config.pb.h"

ABSL_FLAG(std::string, config, "", "Path to a JSON alias configuration.");
ABSL_FLAG(bool, allow_overriding, true,
          "Allow an alias to be rebound to a different name.");
ABSL_FLAG(bool, resolve_placeholders, true,
          "Substitute ${key} placeholders using the configuration properties.");
ABSL_FLAG(bool, dump, false,
          "Print the resulting alias bindings as a JSON configuration.");

namespace {

absl::Status Run(const std::vector<char*>& names) {
  absl::StatusOr<aliasreg::proto::AliasConfiguration> config =
      aliasreg::LoadAliasConfigurationFile(absl::GetFlag(FLAGS_config));
  if (!config.ok()) {
    return config.status();
  }

  aliasreg::SimpleAliasRegistry::Options options;
  options.allow_overriding = absl::GetFlag(FLAGS_allow_overriding);
  aliasreg::SimpleAliasRegistry registry(options);
  if (absl::Status status = aliasreg::ApplyAliasConfiguration(*config,
                                                              &registry);
      !status.ok()) {
    return status;
  }

  if (absl::GetFlag(FLAGS_resolve_placeholders)) {
    const aliasreg::PlaceholderResolver resolver =
        aliasreg::MakePlaceholderResolver(*config);
    if (absl::Status status = registry.ResolveAliases(
            [&resolver](absl::string_view text) {
              return resolver.Resolve(text);
            });
        !status.ok()) {
      return status;
    }
  }

  for (const char* name : names) {
    absl::StatusOr<std::string> canonical = registry.CanonicalName(name);
    if (!canonical.ok()) {
      return canonical.status();
    }
    std::cout << name << "\t" << *canonical << "\t"
              << absl::StrJoin(registry.GetAliases(*canonical), ",")
              << std::endl;
  }

  if (absl::GetFlag(FLAGS_dump)) {
    absl::StatusOr<std::string> json = aliasreg::WriteMessageAsJsonToString(
        aliasreg::ExportAliasConfiguration(registry));
    if (!json.ok()) {
      return json.status();
    }
    std::cout << *json << std::endl;
  }
  return absl::OkStatus();
}

}  // namespace

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(
      R"(resolve names through an alias configuration

usage: alias_tool --config=aliases.json [--dump] [name ...])");
  std::vector<char*> remain = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  if (absl::GetFlag(FLAGS_config).empty()) {
    LOG(ERROR) << "--config is required";
    return 1;
  }
  std::vector<char*> names(remain.begin() + 1, remain.end());
  if (absl::Status status = Run(names); !status.ok()) {
    LOG(ERROR) << status;
    return 1;
  }
  return 0;
}
