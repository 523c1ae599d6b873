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

#include "aliasreg/cxx/common/placeholder_resolver.h"

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace aliasreg {
namespace {
using ::testing::Optional;

PlaceholderResolver MakeResolver(bool ignore_unresolvable = false) {
  PlaceholderResolver::Options options;
  options.ignore_unresolvable = ignore_unresolvable;
  return PlaceholderResolver(
      {
          {"env", "prod"},
          {"service", "db-${env}"},
          {"loop", "${loop}"},
          {"ping", "${pong}"},
          {"pong", "${ping}"},
          {"suffix", "prod"},
          {"db.prod", "primary"},
          {"self", "${open}self}"},
          {"open", "${"},
      },
      options);
}

TEST(PlaceholderResolverTest, LeavesPlainTextAlone) {
  EXPECT_THAT(MakeResolver().Resolve("plainName"),
              Optional(std::string("plainName")));
  EXPECT_THAT(MakeResolver().Resolve(""), Optional(std::string("")));
  EXPECT_THAT(MakeResolver().Resolve("$env {env}"),
              Optional(std::string("$env {env}")));
}

TEST(PlaceholderResolverTest, SubstitutesProperties) {
  PlaceholderResolver resolver = MakeResolver();
  EXPECT_THAT(resolver.Resolve("${env}"), Optional(std::string("prod")));
  EXPECT_THAT(resolver.Resolve("bean.${env}.main"),
              Optional(std::string("bean.prod.main")));
  EXPECT_THAT(resolver.Resolve("${env}-${env}"),
              Optional(std::string("prod-prod")));
}

TEST(PlaceholderResolverTest, SubstitutesNestedProperties) {
  EXPECT_THAT(MakeResolver().Resolve("${service}"),
              Optional(std::string("db-prod")));
}

TEST(PlaceholderResolverTest, ResolvesAssembledKeys) {
  PlaceholderResolver resolver = MakeResolver();
  EXPECT_THAT(resolver.Resolve("${db.${suffix}}"),
              Optional(std::string("primary")));
  EXPECT_THAT(resolver.Resolve("bean.${db.${env}}.ro"),
              Optional(std::string("bean.primary.ro")));
  EXPECT_EQ(std::nullopt, resolver.Resolve("${db.${missing:dev}}"));
}

TEST(PlaceholderResolverTest, KeepsUnresolvableAssembledKeysWhenIgnored) {
  PlaceholderResolver resolver = MakeResolver(/*ignore_unresolvable=*/true);
  EXPECT_THAT(resolver.Resolve("${db.${missing:dev}}"),
              Optional(std::string("${db.dev}")));
}

TEST(PlaceholderResolverTest, FailsOnAssembledSelfReference) {
  EXPECT_EQ(absl::StatusCode::kFailedPrecondition,
            MakeResolver().ResolveOrError("${self}").status().code());
}

TEST(PlaceholderResolverTest, UsesDefaults) {
  PlaceholderResolver resolver = MakeResolver();
  EXPECT_THAT(resolver.Resolve("${region:us}"), Optional(std::string("us")));
  EXPECT_THAT(resolver.Resolve("${env:dev}"), Optional(std::string("prod")));
  EXPECT_THAT(resolver.Resolve("${region:}"), Optional(std::string("")));
  EXPECT_THAT(resolver.Resolve("${region:$x}"), Optional(std::string("$x")));
}

TEST(PlaceholderResolverTest, FailsOnUnresolvable) {
  PlaceholderResolver resolver = MakeResolver();
  EXPECT_EQ(std::nullopt, resolver.Resolve("${missing}"));
  EXPECT_EQ(absl::StatusCode::kNotFound,
            resolver.ResolveOrError("a.${missing}").status().code());
}

TEST(PlaceholderResolverTest, KeepsUnresolvableWhenIgnored) {
  PlaceholderResolver resolver = MakeResolver(/*ignore_unresolvable=*/true);
  EXPECT_THAT(resolver.Resolve("${missing}.${env}"),
              Optional(std::string("${missing}.prod")));
}

TEST(PlaceholderResolverTest, FailsOnCircularProperties) {
  for (bool ignore_unresolvable : {false, true}) {
    PlaceholderResolver resolver = MakeResolver(ignore_unresolvable);
    EXPECT_EQ(absl::StatusCode::kFailedPrecondition,
              resolver.ResolveOrError("${loop}").status().code());
    EXPECT_EQ(absl::StatusCode::kFailedPrecondition,
              resolver.ResolveOrError("${ping}").status().code());
    EXPECT_EQ(std::nullopt, resolver.Resolve("${ping}"));
  }
}

}  // namespace
}  // namespace aliasreg
