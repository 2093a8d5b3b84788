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

#ifndef BOARDLINK_NET_WEBRTC_PEER_CONNECTION_H_
#define BOARDLINK_NET_WEBRTC_PEER_CONNECTION_H_

#include <functional>
#include <memory>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "boardlink/net/transport.h"
#include "boardlink/signaling/types.h"

namespace boardlink::net {

enum class LinkState {
  kNew,
  kConnecting,
  kConnected,
  kDisconnected,
  kFailed,
  kClosed,
};

enum class IceLinkState {
  kNew,
  kChecking,
  kConnected,
  kCompleted,
  kFailed,
  kDisconnected,
  kClosed,
};

std::string_view LinkStateName(LinkState state);
std::string_view IceLinkStateName(IceLinkState state);

/**
 * The point-to-point connection the negotiator drives: it produces local
 * descriptions and candidates, consumes the remote ones, and yields data
 * channels.
 *
 * Handlers are called on threads owned by the implementation. They must be
 * registered before CreateLocalDescription() so that no candidate is lost.
 *
 * @headerfile boardlink/net/webrtc/peer_connection.h
 */
class PeerConnection {
 public:
  using LocalCandidateHandler = std::function<void(IceCandidate candidate)>;
  using StateHandler = std::function<void(LinkState state)>;
  using IceStateHandler = std::function<void(IceLinkState state)>;
  using DataChannelHandler =
      std::function<void(std::shared_ptr<DataChannelTransport> channel)>;

  virtual ~PeerConnection() = default;

  virtual void OnLocalCandidate(LocalCandidateHandler handler) = 0;
  virtual void OnStateChange(StateHandler handler) = 0;
  virtual void OnIceStateChange(IceStateHandler handler) = 0;
  // Channels opened by the remote peer.
  virtual void OnDataChannel(DataChannelHandler handler) = 0;

  // Creates a reliable, ordered channel. Must precede the offer.
  virtual absl::StatusOr<std::shared_ptr<DataChannelTransport>>
  CreateDataChannel(std::string_view label) = 0;

  // Sets and returns the local offer or answer. An answer requires the
  // remote offer to have been applied.
  virtual absl::StatusOr<SessionDescription> CreateLocalDescription(
      SessionDescription::Kind kind) = 0;

  virtual absl::Status SetRemoteDescription(
      const SessionDescription& description) = 0;

  virtual absl::Status AddRemoteCandidate(const IceCandidate& candidate) = 0;

  // After this returns no handler is called again.
  virtual void ResetCallbacks() = 0;

  virtual void Close() = 0;
};

using PeerConnectionFactory =
    std::function<absl::StatusOr<std::unique_ptr<PeerConnection>>()>;

}  // namespace boardlink::net

#endif  // BOARDLINK_NET_WEBRTC_PEER_CONNECTION_H_
