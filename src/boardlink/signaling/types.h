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

#ifndef BOARDLINK_SIGNALING_TYPES_H_
#define BOARDLINK_SIGNALING_TYPES_H_

#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <boost/json/value.hpp>

namespace boardlink {

// The two namespaces of a session. The handheld that scans the board's code
// is the initiator and sends the offer; the board answers.
enum class PeerRole {
  kInitiator,
  kResponder,
};

std::string_view PeerRoleName(PeerRole role);

PeerRole RemoteRole(PeerRole role);

struct SessionDescription {
  enum class Kind {
    kOffer,
    kAnswer,
  };

  bool operator==(const SessionDescription& other) const {
    return kind == other.kind && body == other.body;
  }

  Kind kind = Kind::kOffer;
  // Opaque SDP blob.
  std::string body;
};

std::string_view SessionDescriptionKindName(SessionDescription::Kind kind);

absl::StatusOr<SessionDescription::Kind> ParseSessionDescriptionKind(
    std::string_view name);

struct IceCandidate {
  bool operator==(const IceCandidate& other) const {
    return candidate == other.candidate && mid == other.mid &&
           mline_index == other.mline_index;
  }

  std::string candidate;
  std::string mid;
  int mline_index = 0;
};

// {"type": "offer", "sdp": "..."}
boost::json::value SessionDescriptionToJson(
    const SessionDescription& description);
absl::StatusOr<SessionDescription> SessionDescriptionFromJson(
    const boost::json::value& json);

// {"candidate": "...", "sdpMid": "0", "sdpMLineIndex": 0}
boost::json::value IceCandidateToJson(const IceCandidate& candidate);
absl::StatusOr<IceCandidate> IceCandidateFromJson(
    const boost::json::value& json);

// Parses `text` as JSON, returning InvalidArgument on malformed input.
absl::StatusOr<boost::json::value> ParseJson(std::string_view text);

}  // namespace boardlink

#endif  // BOARDLINK_SIGNALING_TYPES_H_
