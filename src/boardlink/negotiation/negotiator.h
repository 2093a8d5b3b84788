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

#ifndef BOARDLINK_NEGOTIATION_NEGOTIATOR_H_
#define BOARDLINK_NEGOTIATION_NEGOTIATOR_H_

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/time/time.h>

#include "boardlink/concurrency/concurrency.h"
#include "boardlink/net/transport.h"
#include "boardlink/net/webrtc/peer_connection.h"
#include "boardlink/signaling/signaling_channel.h"
#include "boardlink/signaling/types.h"

namespace boardlink {

enum class ConnectionState {
  kNew,
  kOfferSent,
  kNegotiating,
  kConnected,
  kDisconnected,
  kFailed,
};

std::string_view ConnectionStateName(ConnectionState state);

class NegotiatorObserver {
 public:
  virtual ~NegotiatorObserver() = default;

  // The data channel exists but may not be open yet. The initiator reports
  // it from inside Connect(), before the offer is generated.
  virtual void OnTransportCreated(
      const std::shared_ptr<net::DataChannelTransport>& transport) {}
  virtual void OnStateChanged(ConnectionState state) {}
  virtual void OnConnected() {}
  virtual void OnError(const absl::Status& status) {}
};

struct NegotiatorOptions {
  PeerRole role = PeerRole::kInitiator;
  // How long an attempt may take once the offer is out (initiator) or has
  // been applied (responder).
  absl::Duration timeout = absl::Seconds(30);
  std::string label = "media";
};

/**
 * Brings a point-to-point connection to data-ready by exchanging
 * descriptions and candidates through a SignalingChannel.
 *
 *   new --Connect()--> offer_sent --answer applied--> negotiating
 *   negotiating --channel open / link connected--> connected
 *   offer_sent, negotiating --timeout--> failed
 *   connected --channel closed / link lost--> disconnected
 *   any --Disconnect()--> disconnected
 *
 * The responder stays in `new` until the offer arrives, then goes straight
 * to `negotiating`. Remote candidates that arrive before the remote
 * description are buffered and replayed right after it is applied.
 *
 * The timeout fires at most once per attempt: it reports
 * NegotiationTimeoutError and leaves the attempt in `failed` without
 * retrying or closing anything.
 *
 * @headerfile boardlink/negotiation/negotiator.h
 */
class ConnectionNegotiator final : public net::TransportObserver {
 public:
  ConnectionNegotiator(std::shared_ptr<SignalingChannel> signaling,
                       net::PeerConnectionFactory peer_connection_factory,
                       NegotiatorOptions options = {});

  // Disconnects and waits for the timeout thread. Must not run on a
  // transport or peer connection thread, nor inside an observer method.
  ~ConnectionNegotiator() override;

  ConnectionNegotiator(const ConnectionNegotiator&) = delete;
  ConnectionNegotiator& operator=(const ConnectionNegotiator&) = delete;

  /**
   * Starts the attempt. May be called once.
   *
   * Returns as soon as the local side is set up: for the initiator, once the
   * offer is published; for the responder, once it listens for the offer.
   * The outcome is reported through observers.
   */
  absl::Status Connect();

  /**
   * Closes the data channel, then the connection, then tears down this
   * peer's relay state. Idempotent and safe in any state; before the attempt
   * completes it also cancels the timeout.
   *
   * @return
   *   The status of the relay teardown on the first call, OK afterwards.
   */
  absl::Status Disconnect();

  [[nodiscard]] ConnectionState state() const;

  // The error that moved the attempt to `failed`, kept after a later
  // Disconnect(). OK if the attempt never failed. Errors reported to
  // observers without failing the attempt are not recorded here.
  [[nodiscard]] absl::Status failure() const;

  // Null until the data channel has been created or received.
  [[nodiscard]] std::shared_ptr<net::DataChannelTransport> transport() const;

  [[nodiscard]] PeerRole role() const { return options_.role; }

  // Observers are not owned and must outlive the negotiator. Observers may
  // call Disconnect() from their methods.
  void AddObserver(NegotiatorObserver* observer);
  void RemoveObserver(NegotiatorObserver* observer);

  void OnOpen() override;
  void OnClosed() override;
  void OnError(const absl::Status& status) override;

 private:
  void RegisterPeerConnectionHooks();
  void AdoptTransport(std::shared_ptr<net::DataChannelTransport> transport);

  void HandleRemoteDescription(const SessionDescription& description);
  void HandleRemoteCandidate(const IceCandidate& candidate);
  void HandleLocalCandidate(const IceCandidate& candidate);
  void HandleLinkState(net::LinkState state);
  void HandleIceState(net::IceLinkState state);

  void MarkConnected();
  void MarkDisconnected(std::string_view reason);
  // Moves an unfinished attempt to `failed` and reports `status`.
  void Fail(const absl::Status& status);
  void ReportError(const absl::Status& status);

  // Returns false if the transition is not allowed from the current state.
  bool TransitionTo(ConnectionState next) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void NotifyStateChanged(ConnectionState state);

  void ArmTimeout();
  void RunTimeout(absl::Time deadline);

  void ForEachObserver(const std::function<void(NegotiatorObserver*)>& fn);

  const std::shared_ptr<SignalingChannel> signaling_;
  const net::PeerConnectionFactory peer_connection_factory_;
  const NegotiatorOptions options_;

  // Serializes applying the remote description with applying candidates.
  Mutex apply_mu_ ABSL_ACQUIRED_BEFORE(mu_);
  bool remote_description_applied_ ABSL_GUARDED_BY(apply_mu_) = false;
  std::vector<IceCandidate> buffered_candidates_ ABSL_GUARDED_BY(apply_mu_);

  mutable Mutex mu_;
  CondVar cv_;
  ConnectionState state_ ABSL_GUARDED_BY(mu_) = ConnectionState::kNew;
  bool connect_called_ ABSL_GUARDED_BY(mu_) = false;
  bool disconnect_called_ ABSL_GUARDED_BY(mu_) = false;
  std::unique_ptr<net::PeerConnection> peer_connection_ ABSL_GUARDED_BY(mu_);
  std::shared_ptr<net::DataChannelTransport> transport_ ABSL_GUARDED_BY(mu_);
  std::thread timeout_thread_ ABSL_GUARDED_BY(mu_);
  bool timeout_cancelled_ ABSL_GUARDED_BY(mu_) = false;
  absl::Status failure_ ABSL_GUARDED_BY(mu_);

  mutable Mutex observers_mu_;
  std::vector<NegotiatorObserver*> observers_ ABSL_GUARDED_BY(observers_mu_);
};

}  // namespace boardlink

#endif  // BOARDLINK_NEGOTIATION_NEGOTIATOR_H_
