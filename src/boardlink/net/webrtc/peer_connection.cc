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

#include "boardlink/net/webrtc/peer_connection.h"

namespace boardlink::net {

std::string_view LinkStateName(LinkState state) {
  switch (state) {
    case LinkState::kNew:
      return "new";
    case LinkState::kConnecting:
      return "connecting";
    case LinkState::kConnected:
      return "connected";
    case LinkState::kDisconnected:
      return "disconnected";
    case LinkState::kFailed:
      return "failed";
    case LinkState::kClosed:
      return "closed";
  }
  return "unknown";
}

std::string_view IceLinkStateName(IceLinkState state) {
  switch (state) {
    case IceLinkState::kNew:
      return "new";
    case IceLinkState::kChecking:
      return "checking";
    case IceLinkState::kConnected:
      return "connected";
    case IceLinkState::kCompleted:
      return "completed";
    case IceLinkState::kFailed:
      return "failed";
    case IceLinkState::kDisconnected:
      return "disconnected";
    case IceLinkState::kClosed:
      return "closed";
  }
  return "unknown";
}

}  // namespace boardlink::net
