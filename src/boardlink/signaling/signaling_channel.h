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

#ifndef BOARDLINK_SIGNALING_SIGNALING_CHANNEL_H_
#define BOARDLINK_SIGNALING_SIGNALING_CHANNEL_H_

#include <functional>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "boardlink/signaling/types.h"

namespace boardlink {

using DescriptionHandler =
    std::function<void(const SessionDescription& description)>;
using CandidateHandler = std::function<void(const IceCandidate& candidate)>;
using StatusValueHandler = std::function<void(std::string_view status)>;
using SignalingErrorHandler = std::function<void(const absl::Status& status)>;

/**
 * The publish/subscribe side of a session ("room"), seen from one peer.
 *
 * Each peer publishes its own description and an append-only list of
 * candidates, and subscribes to the other peer's. Handlers are called on
 * threads owned by the implementation and may run concurrently with any
 * method of this class.
 *
 * @headerfile boardlink/signaling/signaling_channel.h
 */
class SignalingChannel {
 public:
  virtual ~SignalingChannel() = default;

  /**
   * Publishes this peer's description, overwriting any earlier one.
   *
   * @return
   *   RelayWriteError if the relay could not be written. The write is not
   *   retried.
   */
  virtual absl::Status PublishLocalDescription(
      const SessionDescription& description) = 0;

  /** Appends a candidate to this peer's list. Never overwrites. */
  virtual absl::Status PublishCandidate(const IceCandidate& candidate) = 0;

  /**
   * Calls `handler` whenever the remote peer's description is present. The
   * relay may redeliver the same description, so `handler` must tolerate
   * being called more than once.
   */
  virtual absl::Status SubscribeRemoteDescription(
      DescriptionHandler handler) = 0;

  /**
   * Calls `handler` exactly once per distinct remote candidate, in the order
   * the remote peer published them.
   */
  virtual absl::Status SubscribeRemoteCandidates(CandidateHandler handler) = 0;

  /** Single-shot check that the session has been published to. */
  virtual absl::StatusOr<bool> SessionExists() = 0;

  virtual absl::Status PublishStatus(std::string_view status) = 0;

  virtual absl::Status SubscribeStatus(StatusValueHandler handler) = 0;

  /**
   * Registers a handler for relay failures that happen outside of a method
   * call, such as a subscription losing its connection (RelayReadError).
   */
  virtual void OnError(SignalingErrorHandler handler) = 0;

  /**
   * Cancels all subscriptions and removes this peer's namespace from the
   * session. The remote peer's data is left untouched. Safe to call more
   * than once; only the first call touches the relay.
   */
  virtual absl::Status Teardown() = 0;
};

}  // namespace boardlink

#endif  // BOARDLINK_SIGNALING_SIGNALING_CHANNEL_H_
