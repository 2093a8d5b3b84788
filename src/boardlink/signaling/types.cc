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

#include "boardlink/signaling/types.h"

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/string.hpp>
#include <boost/system/error_code.hpp>

namespace boardlink {

std::string_view PeerRoleName(PeerRole role) {
  switch (role) {
    case PeerRole::kInitiator:
      return "initiator";
    case PeerRole::kResponder:
      return "responder";
  }
  return "unknown";
}

PeerRole RemoteRole(PeerRole role) {
  return role == PeerRole::kInitiator ? PeerRole::kResponder
                                      : PeerRole::kInitiator;
}

std::string_view SessionDescriptionKindName(SessionDescription::Kind kind) {
  switch (kind) {
    case SessionDescription::Kind::kOffer:
      return "offer";
    case SessionDescription::Kind::kAnswer:
      return "answer";
  }
  return "unknown";
}

absl::StatusOr<SessionDescription::Kind> ParseSessionDescriptionKind(
    std::string_view name) {
  if (name == "offer") {
    return SessionDescription::Kind::kOffer;
  }
  if (name == "answer") {
    return SessionDescription::Kind::kAnswer;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown session description type: ", name));
}

boost::json::value SessionDescriptionToJson(
    const SessionDescription& description) {
  boost::json::object json;
  json["type"] = SessionDescriptionKindName(description.kind);
  json["sdp"] = description.body;
  return json;
}

absl::StatusOr<SessionDescription> SessionDescriptionFromJson(
    const boost::json::value& json) {
  const boost::json::object* object = json.if_object();
  if (object == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Session description is not an object: ",
                     boost::json::serialize(json)));
  }

  const boost::json::value* type = object->if_contains("type");
  const boost::json::value* sdp = object->if_contains("sdp");
  if (type == nullptr || !type->is_string() || sdp == nullptr ||
      !sdp->is_string()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Session description needs string 'type' and 'sdp': ",
                     boost::json::serialize(json)));
  }

  absl::StatusOr<SessionDescription::Kind> kind =
      ParseSessionDescriptionKind(type->get_string());
  if (!kind.ok()) {
    return kind.status();
  }

  return SessionDescription{.kind = *kind,
                            .body = std::string(sdp->get_string())};
}

boost::json::value IceCandidateToJson(const IceCandidate& candidate) {
  boost::json::object json;
  json["candidate"] = candidate.candidate;
  json["sdpMid"] = candidate.mid;
  json["sdpMLineIndex"] = candidate.mline_index;
  return json;
}

absl::StatusOr<IceCandidate> IceCandidateFromJson(
    const boost::json::value& json) {
  const boost::json::object* object = json.if_object();
  if (object == nullptr) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Candidate is not an object: ", boost::json::serialize(json)));
  }

  const boost::json::value* candidate = object->if_contains("candidate");
  if (candidate == nullptr || !candidate->is_string() ||
      candidate->get_string().empty()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "No 'candidate' field in candidate: ", boost::json::serialize(json)));
  }

  IceCandidate result;
  result.candidate = std::string(candidate->get_string());
  if (const boost::json::value* mid = object->if_contains("sdpMid");
      mid != nullptr && mid->is_string()) {
    result.mid = std::string(mid->get_string());
  }
  if (const boost::json::value* index = object->if_contains("sdpMLineIndex");
      index != nullptr && index->is_int64()) {
    result.mline_index = static_cast<int>(index->get_int64());
  }
  return result;
}

absl::StatusOr<boost::json::value> ParseJson(std::string_view text) {
  boost::system::error_code error;
  boost::json::value value = boost::json::parse(text, error);
  if (error) {
    return absl::InvalidArgumentError(
        absl::StrCat("Malformed JSON (", error.message(), "): ", text));
  }
  return value;
}

}  // namespace boardlink
