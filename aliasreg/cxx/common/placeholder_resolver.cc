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

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "re2/re2.h"

namespace aliasreg {
namespace {

// Matches an innermost `${...}`; group 1 is the placeholder body.
const LazyRE2 kPlaceholderPattern = {R"(\$\{([^{}]*)\})"};

constexpr char kDefaultSeparator = ':';

// Upper bound on rescans of substituted text, e.g. for `${a${b}}`.
constexpr int kMaxPasses = 32;

}  // namespace

absl::StatusOr<std::string> PlaceholderResolver::ResolveOrError(
    absl::string_view text) const {
  absl::flat_hash_set<std::string> active;
  return ResolveText(text, &active);
}

std::optional<std::string> PlaceholderResolver::Resolve(
    absl::string_view text) const {
  absl::StatusOr<std::string> resolved = ResolveOrError(text);
  if (!resolved.ok()) {
    LOG(WARNING) << "Unable to resolve '" << text
                 << "': " << resolved.status();
    return std::nullopt;
  }
  return *std::move(resolved);
}

absl::StatusOr<std::string> PlaceholderResolver::ResolveText(
    absl::string_view text, absl::flat_hash_set<std::string>* active) const {
  std::string current(text);
  for (int pass = 0; pass < kMaxPasses; ++pass) {
    bool substituted = false;
    absl::StatusOr<std::string> resolved =
        ResolvePass(current, active, &substituted);
    if (!resolved.ok() || !substituted) {
      return resolved;
    }
    current = *std::move(resolved);
  }
  return absl::FailedPreconditionError(
      absl::StrCat("Placeholders in '", text, "' did not settle after ",
                   kMaxPasses, " passes"));
}

absl::StatusOr<std::string> PlaceholderResolver::ResolvePass(
    absl::string_view text, absl::flat_hash_set<std::string>* active,
    bool* substituted) const {
  std::string result;
  absl::string_view input = text;
  re2::StringPiece groups[2];
  while (kPlaceholderPattern->Match(re2::StringPiece(input.data(), input.size()),
                                    0, input.size(), RE2::UNANCHORED, groups,
                                    2)) {
    absl::string_view match(groups[0].data(), groups[0].size());
    absl::string_view body(groups[1].data(), groups[1].size());
    absl::string_view prefix = input.substr(0, match.data() - input.data());
    absl::StrAppend(&result, prefix);
    input.remove_prefix(prefix.size() + match.size());

    absl::StatusOr<std::string> value = ResolvePlaceholder(body, active);
    if (value.ok()) {
      absl::StrAppend(&result, *value);
      *substituted = true;
    } else if (absl::IsNotFound(value.status()) &&
               options_.ignore_unresolvable) {
      absl::StrAppend(&result, match);
    } else {
      return value.status();
    }
  }
  // Include the unmatched tail.
  absl::StrAppend(&result, input);
  return result;
}

absl::StatusOr<std::string> PlaceholderResolver::ResolvePlaceholder(
    absl::string_view placeholder,
    absl::flat_hash_set<std::string>* active) const {
  absl::string_view key = placeholder;
  std::optional<absl::string_view> fallback;
  if (auto pos = placeholder.find(kDefaultSeparator);
      pos != absl::string_view::npos) {
    key = placeholder.substr(0, pos);
    fallback = placeholder.substr(pos + 1);
  }

  absl::string_view value;
  if (auto found = properties_.find(key); found != properties_.end()) {
    value = found->second;
  } else if (fallback.has_value()) {
    value = *fallback;
  } else {
    return absl::NotFoundError(
        absl::StrCat("Could not resolve placeholder '", key, "'"));
  }

  if (!active->insert(std::string(key)).second) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Circular placeholder reference '", key, "' in property definitions"));
  }
  absl::StatusOr<std::string> resolved = ResolveText(value, active);
  active->erase(key);
  return resolved;
}

}  // namespace aliasreg
