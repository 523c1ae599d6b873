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
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace aliasreg {
namespace {
using ::testing::HasSubstr;
using ::testing::Optional;

TEST(AliasStatusTest, ConflictingAlias) {
  absl::Status status = ConflictingAliasError("a", "n2", "n1");
  EXPECT_EQ(absl::StatusCode::kAlreadyExists, status.code());
  EXPECT_EQ(
      "Cannot define alias 'a' for name 'n2': It is already registered for "
      "name 'n1'.",
      status.message());
  EXPECT_THAT(GetAliasErrorKind(status),
              Optional(AliasErrorKind::kConflictingAlias));
  EXPECT_FALSE(IsCircularAlias(status));
}

TEST(AliasStatusTest, CircularAlias) {
  absl::Status status = CircularAliasError("a", "n");
  EXPECT_EQ(absl::StatusCode::kFailedPrecondition, status.code());
  EXPECT_THAT(status.message(),
              HasSubstr("'n' is a direct or indirect alias for 'a' already"));
  EXPECT_TRUE(IsCircularAlias(status));
}

TEST(AliasStatusTest, ResolutionLoop) {
  absl::Status status = ResolutionLoopError("n", 3);
  EXPECT_EQ(absl::StatusCode::kInternal, status.code());
  EXPECT_TRUE(IsResolutionLoop(status));
}

TEST(AliasStatusTest, PlainStatusHasNoKind) {
  EXPECT_EQ(std::nullopt, GetAliasErrorKind(absl::AlreadyExistsError("a")));
  EXPECT_EQ(std::nullopt, GetAliasErrorKind(absl::OkStatus()));
  EXPECT_FALSE(IsConflictingAlias(absl::AlreadyExistsError("a")));
}

}  // namespace
}  // namespace aliasreg
