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

#include "aliasreg/cxx/common/json_proto.h"

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/util/json_util.h"

namespace aliasreg {
namespace {

// Converts the status type returned by the protobuf JSON utilities.
template <typename ProtoStatus>
absl::Status ToAbslStatus(const ProtoStatus& status) {
  if (status.ok()) {
    return absl::OkStatus();
  }
  return absl::Status(static_cast<absl::StatusCode>(status.code()),
                      std::string(status.message()));
}

}  // namespace

absl::Status ParseFromJsonString(absl::string_view input,
                                 google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.case_insensitive_enum_parsing = false;
  return ToAbslStatus(google::protobuf::util::JsonStringToMessage(
      std::string(input), message, options));
}

absl::StatusOr<std::string> WriteMessageAsJsonToString(
    const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string result;
  if (absl::Status status = ToAbslStatus(
          google::protobuf::util::MessageToJsonString(message, &result,
                                                      options));
      !status.ok()) {
    return status;
  }
  return result;
}

}  // namespace aliasreg
