// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BOARDLINK_UTIL_STATUS_MACROS_H_
#define BOARDLINK_UTIL_STATUS_MACROS_H_

#include <utility>

#include <absl/base/optimization.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

// Evaluates an expression that produces an `absl::Status`. If the status is
// not OK, returns it from the current function.
#define RETURN_IF_ERROR(expr)                                      \
  do {                                                             \
    if (absl::Status boardlink_status_ = (expr);                   \
        ABSL_PREDICT_FALSE(!boardlink_status_.ok())) {             \
      return boardlink_status_;                                    \
    }                                                              \
  } while (false)

#define BOARDLINK_STATUS_MACROS_CONCAT_INNER_(x, y) x##y
#define BOARDLINK_STATUS_MACROS_CONCAT_(x, y) \
  BOARDLINK_STATUS_MACROS_CONCAT_INNER_(x, y)

#define BOARDLINK_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                     \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                    \
    return std::move(statusor).status();                       \
  }                                                            \
  lhs = *std::move(statusor)

// Evaluates an expression that produces an `absl::StatusOr<T>`. If the result
// is OK, moves its value into `lhs`, otherwise returns the status from the
// current function.
//
//   ASSIGN_OR_RETURN(SessionDescription offer, pc->CreateLocalDescription(...));
#define ASSIGN_OR_RETURN(lhs, rexpr)                                      \
  BOARDLINK_ASSIGN_OR_RETURN_IMPL_(                                       \
      BOARDLINK_STATUS_MACROS_CONCAT_(boardlink_statusor_, __LINE__), lhs, \
      rexpr)

#endif  // BOARDLINK_UTIL_STATUS_MACROS_H_
