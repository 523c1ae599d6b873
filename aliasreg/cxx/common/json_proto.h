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

#ifndef ALIASREG_CXX_COMMON_JSON_PROTO_H_
#define ALIASREG_CXX_COMMON_JSON_PROTO_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"

namespace aliasreg {

/// \brief Deserializes a protobuf from JSON text.
/// \param input The input text to parse.
/// \param message The message to parse.
/// \return The status message result of parsing.
absl::Status ParseFromJsonString(absl::string_view input,
                                 google::protobuf::Message* message);

/// \brief Serializes a protobuf to JSON form using the proto field names.
/// \param message The protobuf to serialize.
/// \return JSON string on success; Status on failure.
absl::StatusOr<std::string> WriteMessageAsJsonToString(
    const google::protobuf::Message& message);

}  // namespace aliasreg

#endif  // ALIASREG_CXX_COMMON_JSON_PROTO_H_
