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

#ifndef BOARDLINK_SIGNALING_RELAY_SIGNALING_CHANNEL_H_
#define BOARDLINK_SIGNALING_RELAY_SIGNALING_CHANNEL_H_

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "boardlink/concurrency/concurrency.h"
#include "boardlink/signaling/relay_store.h"
#include "boardlink/signaling/signaling_channel.h"
#include "boardlink/signaling/types.h"

namespace boardlink {

/**
 * A SignalingChannel over any RelayStore, with the session laid out as:
 *
 *   session/{id}/initiator/description
 *   session/{id}/initiator/candidates     (append-only list)
 *   session/{id}/responder/description
 *   session/{id}/responder/candidates     (append-only list)
 *   session/{id}/status
 *
 * The relay redelivers the whole candidate list on every change; this class
 * remembers which entry keys each subscriber has seen, so every candidate
 * reaches a subscriber once.
 *
 * @headerfile boardlink/signaling/relay_signaling_channel.h
 */
class RelaySignalingChannel final : public SignalingChannel {
 public:
  RelaySignalingChannel(std::shared_ptr<RelayStore> store,
                        std::string_view session_id, PeerRole local_role);

  // Cancels subscriptions. Does not remove anything from the relay: call
  // Teardown() for that.
  ~RelaySignalingChannel() override;

  RelaySignalingChannel(const RelaySignalingChannel&) = delete;
  RelaySignalingChannel& operator=(const RelaySignalingChannel&) = delete;

  absl::Status PublishLocalDescription(
      const SessionDescription& description) override;
  absl::Status PublishCandidate(const IceCandidate& candidate) override;
  absl::Status SubscribeRemoteDescription(DescriptionHandler handler) override;
  absl::Status SubscribeRemoteCandidates(CandidateHandler handler) override;
  absl::StatusOr<bool> SessionExists() override;
  absl::Status PublishStatus(std::string_view status) override;
  absl::Status SubscribeStatus(StatusValueHandler handler) override;
  void OnError(SignalingErrorHandler handler) override;
  absl::Status Teardown() override;

  [[nodiscard]] const std::string& session_id() const { return session_id_; }
  [[nodiscard]] PeerRole local_role() const { return local_role_; }

  static std::string SessionPath(std::string_view session_id);
  static std::string PeerPath(std::string_view session_id, PeerRole role);
  static std::string DescriptionPath(std::string_view session_id,
                                     PeerRole role);
  static std::string CandidatesPath(std::string_view session_id,
                                    PeerRole role);
  static std::string StatusPath(std::string_view session_id);

 private:
  struct CandidateSubscription;

  absl::Status AddWatch(absl::StatusOr<std::unique_ptr<RelayWatch>> watch);
  absl::Status CheckNotTornDown() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void ReportError(const absl::Status& status);
  RelayErrorHandler MakeErrorForwarder();

  const std::shared_ptr<RelayStore> store_;
  const std::string session_id_;
  const PeerRole local_role_;

  mutable Mutex mu_;
  std::vector<std::unique_ptr<RelayWatch>> watches_ ABSL_GUARDED_BY(mu_);
  std::vector<SignalingErrorHandler> error_handlers_ ABSL_GUARDED_BY(mu_);
  bool torn_down_ ABSL_GUARDED_BY(mu_) = false;
};

}  // namespace boardlink

#endif  // BOARDLINK_SIGNALING_RELAY_SIGNALING_CHANNEL_H_
