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

#ifndef BOARDLINK_ERRORS_ERRORS_H_
#define BOARDLINK_ERRORS_ERRORS_H_

#include <string_view>

#include <absl/status/status.h>

/**
 * @file
 * @brief
 *   The boardlink error taxonomy.
 *
 * Every error is an `absl::Status` with a canonical code and a payload under
 * `kErrorKindPayloadUrl` naming the precise kind. Code that only cares about
 * the broad class of failure can use the canonical code; code that must tell
 * the user what to do next uses `GetFailureCategory()`.
 */

namespace boardlink {

inline constexpr std::string_view kErrorKindPayloadUrl =
    "type.boardlink.dev/boardlink.ErrorKind";

enum class ErrorKind {
  kUnknown = 0,
  // Signalling I/O.
  kRelayWrite,
  kRelayRead,
  kSessionNotFound,
  // Negotiation.
  kNegotiationTimeout,
  kNegotiationFailed,
  // Transfer.
  kTransportNotOpen,
  kTransferInProgress,
  kTransferAborted,
  kDataIntegrity,
};

// What the user should be told, since each implies a different action:
// check the network, rescan the board's code, retry the connection, or
// resend the file.
enum class FailureCategory {
  kNone = 0,
  kRelayUnreachable,
  kSessionNotFound,
  kNegotiationFailed,
  kTransferFailed,
};

absl::Status RelayWriteError(std::string_view message);
absl::Status RelayReadError(std::string_view message);
absl::Status SessionNotFoundError(std::string_view message);
absl::Status NegotiationTimeoutError(std::string_view message);
absl::Status NegotiationFailedError(std::string_view message);
absl::Status TransportNotOpenError(std::string_view message);
absl::Status TransferInProgressError(std::string_view message);
absl::Status TransferAbortedError(std::string_view message);
absl::Status DataIntegrityError(std::string_view message);

// Returns kUnknown for OK statuses and for statuses produced outside
// boardlink.
ErrorKind GetErrorKind(const absl::Status& status);

bool IsErrorKind(const absl::Status& status, ErrorKind kind);

std::string_view ErrorKindName(ErrorKind kind);

// Untagged statuses map to kTransferFailed when they carry a transport-level
// code (kAborted, kDataLoss) and to kNegotiationFailed otherwise.
FailureCategory GetFailureCategory(const absl::Status& status);

// A short, user-facing description of the corrective action.
std::string_view DescribeFailure(FailureCategory category);

}  // namespace boardlink

#endif  // BOARDLINK_ERRORS_ERRORS_H_
