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

#include "boardlink/errors/errors.h"

#include <optional>

#include <absl/strings/cord.h>

namespace boardlink {

static absl::Status Tagged(absl::StatusCode code, ErrorKind kind,
                           std::string_view message) {
  absl::Status status(code, message);
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

absl::Status RelayWriteError(std::string_view message) {
  return Tagged(absl::StatusCode::kUnavailable, ErrorKind::kRelayWrite,
                message);
}

absl::Status RelayReadError(std::string_view message) {
  return Tagged(absl::StatusCode::kUnavailable, ErrorKind::kRelayRead,
                message);
}

absl::Status SessionNotFoundError(std::string_view message) {
  return Tagged(absl::StatusCode::kNotFound, ErrorKind::kSessionNotFound,
                message);
}

absl::Status NegotiationTimeoutError(std::string_view message) {
  return Tagged(absl::StatusCode::kDeadlineExceeded,
                ErrorKind::kNegotiationTimeout, message);
}

absl::Status NegotiationFailedError(std::string_view message) {
  return Tagged(absl::StatusCode::kUnavailable, ErrorKind::kNegotiationFailed,
                message);
}

absl::Status TransportNotOpenError(std::string_view message) {
  return Tagged(absl::StatusCode::kFailedPrecondition,
                ErrorKind::kTransportNotOpen, message);
}

absl::Status TransferInProgressError(std::string_view message) {
  return Tagged(absl::StatusCode::kFailedPrecondition,
                ErrorKind::kTransferInProgress, message);
}

absl::Status TransferAbortedError(std::string_view message) {
  return Tagged(absl::StatusCode::kAborted, ErrorKind::kTransferAborted,
                message);
}

absl::Status DataIntegrityError(std::string_view message) {
  return Tagged(absl::StatusCode::kDataLoss, ErrorKind::kDataIntegrity,
                message);
}

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kRelayWrite:
      return "relay_write";
    case ErrorKind::kRelayRead:
      return "relay_read";
    case ErrorKind::kSessionNotFound:
      return "session_not_found";
    case ErrorKind::kNegotiationTimeout:
      return "negotiation_timeout";
    case ErrorKind::kNegotiationFailed:
      return "negotiation_failed";
    case ErrorKind::kTransportNotOpen:
      return "transport_not_open";
    case ErrorKind::kTransferInProgress:
      return "transfer_in_progress";
    case ErrorKind::kTransferAborted:
      return "transfer_aborted";
    case ErrorKind::kDataIntegrity:
      return "data_integrity";
    case ErrorKind::kUnknown:
      break;
  }
  return "unknown";
}

ErrorKind GetErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return ErrorKind::kUnknown;
  }
  const std::optional<absl::Cord> payload =
      status.GetPayload(kErrorKindPayloadUrl);
  if (!payload.has_value()) {
    return ErrorKind::kUnknown;
  }
  for (const ErrorKind kind :
       {ErrorKind::kRelayWrite, ErrorKind::kRelayRead,
        ErrorKind::kSessionNotFound, ErrorKind::kNegotiationTimeout,
        ErrorKind::kNegotiationFailed, ErrorKind::kTransportNotOpen,
        ErrorKind::kTransferInProgress, ErrorKind::kTransferAborted,
        ErrorKind::kDataIntegrity}) {
    if (*payload == ErrorKindName(kind)) {
      return kind;
    }
  }
  return ErrorKind::kUnknown;
}

bool IsErrorKind(const absl::Status& status, ErrorKind kind) {
  return GetErrorKind(status) == kind;
}

FailureCategory GetFailureCategory(const absl::Status& status) {
  if (status.ok()) {
    return FailureCategory::kNone;
  }
  switch (GetErrorKind(status)) {
    case ErrorKind::kRelayWrite:
    case ErrorKind::kRelayRead:
      return FailureCategory::kRelayUnreachable;
    case ErrorKind::kSessionNotFound:
      return FailureCategory::kSessionNotFound;
    case ErrorKind::kNegotiationTimeout:
    case ErrorKind::kNegotiationFailed:
      return FailureCategory::kNegotiationFailed;
    case ErrorKind::kTransportNotOpen:
    case ErrorKind::kTransferInProgress:
    case ErrorKind::kTransferAborted:
    case ErrorKind::kDataIntegrity:
      return FailureCategory::kTransferFailed;
    case ErrorKind::kUnknown:
      break;
  }
  if (status.code() == absl::StatusCode::kAborted ||
      status.code() == absl::StatusCode::kDataLoss) {
    return FailureCategory::kTransferFailed;
  }
  return FailureCategory::kNegotiationFailed;
}

std::string_view DescribeFailure(FailureCategory category) {
  switch (category) {
    case FailureCategory::kNone:
      return "ok";
    case FailureCategory::kRelayUnreachable:
      return "Could not reach the relay. Check the network connection.";
    case FailureCategory::kSessionNotFound:
      return "Board not found. Scan the board's code again.";
    case FailureCategory::kNegotiationFailed:
      return "Could not establish a direct connection to the board. Retry.";
    case FailureCategory::kTransferFailed:
      return "The transfer failed after connecting. Send the file again.";
  }
  return "unknown failure";
}

}  // namespace boardlink
