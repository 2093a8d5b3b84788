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

#include "boardlink/negotiation/negotiator.h"

#include <algorithm>
#include <utility>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>

#include "boardlink/errors/errors.h"

namespace boardlink {

namespace {

bool IsUnfinished(ConnectionState state) {
  return state == ConnectionState::kNew ||
         state == ConnectionState::kOfferSent ||
         state == ConnectionState::kNegotiating;
}

}  // namespace

std::string_view ConnectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::kNew:
      return "new";
    case ConnectionState::kOfferSent:
      return "offer_sent";
    case ConnectionState::kNegotiating:
      return "negotiating";
    case ConnectionState::kConnected:
      return "connected";
    case ConnectionState::kDisconnected:
      return "disconnected";
    case ConnectionState::kFailed:
      return "failed";
  }
  return "unknown";
}

ConnectionNegotiator::ConnectionNegotiator(
    std::shared_ptr<SignalingChannel> signaling,
    net::PeerConnectionFactory peer_connection_factory,
    NegotiatorOptions options)
    : signaling_(std::move(signaling)),
      peer_connection_factory_(std::move(peer_connection_factory)),
      options_(std::move(options)) {
  CHECK(signaling_ != nullptr) << "ConnectionNegotiator needs a signaling "
                                  "channel.";
  CHECK(peer_connection_factory_ != nullptr)
      << "ConnectionNegotiator needs a peer connection factory.";
}

ConnectionNegotiator::~ConnectionNegotiator() {
  Disconnect().IgnoreError();

  std::unique_ptr<net::PeerConnection> peer_connection;
  std::shared_ptr<net::DataChannelTransport> transport;
  std::thread timeout_thread;
  {
    MutexLock lock(&mu_);
    peer_connection = std::move(peer_connection_);
    transport = std::move(transport_);
    // Still set if Disconnect() ran on the timeout thread itself.
    timeout_thread = std::move(timeout_thread_);
  }
  if (timeout_thread.joinable()) {
    timeout_thread.join();
  }
  if (transport != nullptr) {
    transport->RemoveObserver(this);
  }
}

absl::Status ConnectionNegotiator::Connect() {
  {
    MutexLock lock(&mu_);
    if (connect_called_ || disconnect_called_) {
      return absl::FailedPreconditionError(
          "ConnectionNegotiator::Connect() may only be called once.");
    }
    connect_called_ = true;
  }

  // Failures while setting up leave the attempt in `failed` and are returned
  // to the caller rather than reported to observers.
  auto fail = [this](absl::Status status) {
    LOG(ERROR) << "Could not start negotiating: " << status;
    bool changed;
    {
      MutexLock lock(&mu_);
      changed = TransitionTo(ConnectionState::kFailed);
      if (changed) {
        failure_ = status;
      }
    }
    if (changed) {
      NotifyStateChanged(ConnectionState::kFailed);
    }
    return status;
  };

  absl::StatusOr<std::unique_ptr<net::PeerConnection>> created =
      peer_connection_factory_();
  if (!created.ok()) {
    return fail(created.status());
  }
  net::PeerConnection* peer_connection = created->get();
  {
    MutexLock lock(&mu_);
    peer_connection_ = *std::move(created);
  }
  RegisterPeerConnectionHooks();

  if (options_.role == PeerRole::kInitiator) {
    absl::StatusOr<std::shared_ptr<net::DataChannelTransport>> channel =
        peer_connection->CreateDataChannel(options_.label);
    if (!channel.ok()) {
      return fail(channel.status());
    }
    AdoptTransport(*std::move(channel));
  }

  if (absl::Status status = signaling_->SubscribeRemoteCandidates(
          [this](const IceCandidate& candidate) {
            HandleRemoteCandidate(candidate);
          });
      !status.ok()) {
    return fail(status);
  }

  if (options_.role == PeerRole::kInitiator) {
    absl::StatusOr<SessionDescription> offer =
        peer_connection->CreateLocalDescription(
            SessionDescription::Kind::kOffer);
    if (!offer.ok()) {
      return fail(offer.status());
    }
    if (absl::Status status = signaling_->PublishLocalDescription(*offer);
        !status.ok()) {
      return fail(status);
    }
    LOG(INFO) << "Published the offer.";

    bool changed;
    {
      MutexLock lock(&mu_);
      changed = TransitionTo(ConnectionState::kOfferSent);
    }
    if (changed) {
      NotifyStateChanged(ConnectionState::kOfferSent);
    }
    ArmTimeout();
  } else {
    LOG(INFO) << "Waiting for an offer.";
  }

  // Subscribed last so that the initiator never sees an answer before its
  // own offer is in place.
  if (absl::Status status = signaling_->SubscribeRemoteDescription(
          [this](const SessionDescription& description) {
            HandleRemoteDescription(description);
          });
      !status.ok()) {
    return fail(status);
  }

  return absl::OkStatus();
}

absl::Status ConnectionNegotiator::Disconnect() {
  net::PeerConnection* peer_connection;
  std::shared_ptr<net::DataChannelTransport> transport;
  std::thread timeout_thread;
  ConnectionState previous;
  {
    MutexLock lock(&mu_);
    if (disconnect_called_) {
      return absl::OkStatus();
    }
    disconnect_called_ = true;
    timeout_cancelled_ = true;
    cv_.SignalAll();
    previous = state_;
    state_ = ConnectionState::kDisconnected;
    peer_connection = peer_connection_.get();
    transport = transport_;
    // The timeout thread cannot join itself; the destructor joins it.
    if (timeout_thread_.get_id() != std::this_thread::get_id()) {
      timeout_thread = std::move(timeout_thread_);
    }
  }

  if (timeout_thread.joinable()) {
    timeout_thread.join();
  }

  if (peer_connection != nullptr) {
    peer_connection->ResetCallbacks();
  }
  if (transport != nullptr) {
    transport->Close();
  }
  if (peer_connection != nullptr) {
    peer_connection->Close();
  }

  absl::Status status = signaling_->Teardown();
  if (!status.ok()) {
    LOG(ERROR) << "Could not remove this peer's relay state: " << status;
  }

  LOG(INFO) << "Disconnected from state " << ConnectionStateName(previous)
            << ".";
  if (previous != ConnectionState::kDisconnected) {
    NotifyStateChanged(ConnectionState::kDisconnected);
  }
  return status;
}

ConnectionState ConnectionNegotiator::state() const {
  MutexLock lock(&mu_);
  return state_;
}

absl::Status ConnectionNegotiator::failure() const {
  MutexLock lock(&mu_);
  return failure_;
}

std::shared_ptr<net::DataChannelTransport> ConnectionNegotiator::transport()
    const {
  MutexLock lock(&mu_);
  return transport_;
}

void ConnectionNegotiator::AddObserver(NegotiatorObserver* observer) {
  MutexLock lock(&observers_mu_);
  observers_.push_back(observer);
}

void ConnectionNegotiator::RemoveObserver(NegotiatorObserver* observer) {
  MutexLock lock(&observers_mu_);
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                   observers_.end());
}

void ConnectionNegotiator::OnOpen() { MarkConnected(); }

void ConnectionNegotiator::OnClosed() {
  MarkDisconnected("The data channel closed.");
}

void ConnectionNegotiator::OnError(const absl::Status& status) {
  ReportError(status);
}

void ConnectionNegotiator::RegisterPeerConnectionHooks() {
  net::PeerConnection* peer_connection;
  {
    MutexLock lock(&mu_);
    peer_connection = peer_connection_.get();
  }

  peer_connection->OnLocalCandidate(
      [this](IceCandidate candidate) { HandleLocalCandidate(candidate); });
  peer_connection->OnStateChange(
      [this](net::LinkState state) { HandleLinkState(state); });
  peer_connection->OnIceStateChange(
      [this](net::IceLinkState state) { HandleIceState(state); });
  peer_connection->OnDataChannel(
      [this](std::shared_ptr<net::DataChannelTransport> channel) {
        AdoptTransport(std::move(channel));
      });
}

void ConnectionNegotiator::AdoptTransport(
    std::shared_ptr<net::DataChannelTransport> transport) {
  {
    MutexLock lock(&mu_);
    if (transport_ != nullptr) {
      LOG(WARNING) << "Ignoring extra data channel " << transport->GetLabel()
                   << ".";
      return;
    }
    transport_ = transport;
  }
  transport->AddObserver(this);
  LOG(INFO) << "Data channel " << transport->GetLabel() << " created.";

  ForEachObserver([&transport](NegotiatorObserver* observer) {
    observer->OnTransportCreated(transport);
  });
  transport->StartDelivery();

  // A channel received from the remote peer may already be open.
  if (transport->IsOpen()) {
    MarkConnected();
  }
}

void ConnectionNegotiator::HandleRemoteDescription(
    const SessionDescription& description) {
  const SessionDescription::Kind expected =
      options_.role == PeerRole::kInitiator ? SessionDescription::Kind::kAnswer
                                            : SessionDescription::Kind::kOffer;
  if (description.kind != expected) {
    LOG(WARNING) << "Ignoring a remote "
                 << SessionDescriptionKindName(description.kind)
                 << ", expected an " << SessionDescriptionKindName(expected)
                 << ".";
    return;
  }

  net::PeerConnection* peer_connection;
  {
    MutexLock lock(&mu_);
    if (disconnect_called_ || !IsUnfinished(state_)) {
      return;
    }
    peer_connection = peer_connection_.get();
  }

  MutexLock apply_lock(&apply_mu_);
  if (remote_description_applied_) {
    DLOG(INFO) << "Ignoring a redelivered remote description.";
    return;
  }

  if (absl::Status status = peer_connection->SetRemoteDescription(description);
      !status.ok()) {
    Fail(status);
    return;
  }
  remote_description_applied_ = true;
  LOG(INFO) << "Applied the remote "
            << SessionDescriptionKindName(description.kind) << ".";

  if (options_.role == PeerRole::kResponder) {
    absl::StatusOr<SessionDescription> answer =
        peer_connection->CreateLocalDescription(
            SessionDescription::Kind::kAnswer);
    if (!answer.ok()) {
      Fail(answer.status());
      return;
    }
    if (absl::Status status = signaling_->PublishLocalDescription(*answer);
        !status.ok()) {
      Fail(status);
      return;
    }
    LOG(INFO) << "Published the answer.";
  }

  if (!buffered_candidates_.empty()) {
    DLOG(INFO) << "Replaying " << buffered_candidates_.size()
               << " buffered remote candidates.";
  }
  for (const IceCandidate& candidate : buffered_candidates_) {
    if (absl::Status status = peer_connection->AddRemoteCandidate(candidate);
        !status.ok()) {
      LOG(WARNING) << "Ignoring a remote candidate: " << status;
    }
  }
  buffered_candidates_.clear();

  bool changed;
  {
    MutexLock lock(&mu_);
    changed = TransitionTo(ConnectionState::kNegotiating);
  }
  if (changed) {
    NotifyStateChanged(ConnectionState::kNegotiating);
  }
  if (options_.role == PeerRole::kResponder) {
    ArmTimeout();
  }
}

void ConnectionNegotiator::HandleRemoteCandidate(
    const IceCandidate& candidate) {
  net::PeerConnection* peer_connection;
  {
    MutexLock lock(&mu_);
    if (disconnect_called_) {
      return;
    }
    peer_connection = peer_connection_.get();
  }

  MutexLock apply_lock(&apply_mu_);
  if (!remote_description_applied_) {
    DLOG(INFO) << "Buffering a remote candidate until the remote description "
                  "is applied.";
    buffered_candidates_.push_back(candidate);
    return;
  }
  if (absl::Status status = peer_connection->AddRemoteCandidate(candidate);
      !status.ok()) {
    LOG(WARNING) << "Ignoring a remote candidate: " << status;
  }
}

void ConnectionNegotiator::HandleLocalCandidate(
    const IceCandidate& candidate) {
  DLOG(INFO) << "Publishing local candidate " << candidate.candidate;
  if (absl::Status status = signaling_->PublishCandidate(candidate);
      !status.ok()) {
    ReportError(status);
  }
}

void ConnectionNegotiator::HandleLinkState(net::LinkState state) {
  DLOG(INFO) << "Peer connection state: " << net::LinkStateName(state);
  switch (state) {
    case net::LinkState::kConnected:
      MarkConnected();
      break;
    case net::LinkState::kFailed:
      Fail(NegotiationFailedError("The peer connection failed."));
      MarkDisconnected("The peer connection failed.");
      break;
    case net::LinkState::kDisconnected:
    case net::LinkState::kClosed:
      MarkDisconnected(absl::StrCat("The peer connection is ",
                                    net::LinkStateName(state), "."));
      break;
    case net::LinkState::kNew:
    case net::LinkState::kConnecting:
      break;
  }
}

void ConnectionNegotiator::HandleIceState(net::IceLinkState state) {
  DLOG(INFO) << "ICE state: " << net::IceLinkStateName(state);
  switch (state) {
    case net::IceLinkState::kConnected:
    case net::IceLinkState::kCompleted:
      MarkConnected();
      break;
    case net::IceLinkState::kFailed:
      Fail(NegotiationFailedError("ICE failed to find a path to the peer."));
      MarkDisconnected("ICE failed.");
      break;
    case net::IceLinkState::kDisconnected:
    case net::IceLinkState::kClosed:
      MarkDisconnected(absl::StrCat("ICE is ",
                                    net::IceLinkStateName(state), "."));
      break;
    case net::IceLinkState::kNew:
    case net::IceLinkState::kChecking:
      break;
  }
}

void ConnectionNegotiator::MarkConnected() {
  {
    MutexLock lock(&mu_);
    if (!TransitionTo(ConnectionState::kConnected)) {
      return;
    }
  }
  LOG(INFO) << "Connected as " << PeerRoleName(options_.role) << ".";
  NotifyStateChanged(ConnectionState::kConnected);
  ForEachObserver(
      [](NegotiatorObserver* observer) { observer->OnConnected(); });
}

void ConnectionNegotiator::MarkDisconnected(std::string_view reason) {
  {
    MutexLock lock(&mu_);
    if (!TransitionTo(ConnectionState::kDisconnected)) {
      return;
    }
  }
  LOG(INFO) << reason;
  NotifyStateChanged(ConnectionState::kDisconnected);
}

void ConnectionNegotiator::Fail(const absl::Status& status) {
  bool changed;
  {
    MutexLock lock(&mu_);
    changed = TransitionTo(ConnectionState::kFailed);
    if (changed) {
      failure_ = status;
    }
  }
  if (!changed) {
    return;
  }
  NotifyStateChanged(ConnectionState::kFailed);
  ReportError(status);
}

void ConnectionNegotiator::ReportError(const absl::Status& status) {
  LOG(ERROR) << status;
  ForEachObserver(
      [&status](NegotiatorObserver* observer) { observer->OnError(status); });
}

bool ConnectionNegotiator::TransitionTo(ConnectionState next) {
  if (disconnect_called_ || state_ == next) {
    return false;
  }

  bool allowed = false;
  switch (next) {
    case ConnectionState::kOfferSent:
      allowed = state_ == ConnectionState::kNew;
      break;
    case ConnectionState::kNegotiating:
      allowed = state_ == ConnectionState::kNew ||
                state_ == ConnectionState::kOfferSent;
      break;
    case ConnectionState::kConnected:
    case ConnectionState::kFailed:
      allowed = IsUnfinished(state_);
      break;
    case ConnectionState::kDisconnected:
      allowed = state_ == ConnectionState::kConnected;
      break;
    case ConnectionState::kNew:
      break;
  }
  if (!allowed) {
    return false;
  }

  state_ = next;
  cv_.SignalAll();
  return true;
}

void ConnectionNegotiator::NotifyStateChanged(ConnectionState state) {
  ForEachObserver([state](NegotiatorObserver* observer) {
    observer->OnStateChanged(state);
  });
}

void ConnectionNegotiator::ArmTimeout() {
  MutexLock lock(&mu_);
  if (timeout_thread_.joinable() || timeout_cancelled_) {
    return;
  }
  const absl::Time deadline = absl::Now() + options_.timeout;
  timeout_thread_ = std::thread([this, deadline]() { RunTimeout(deadline); });
}

void ConnectionNegotiator::RunTimeout(absl::Time deadline) {
  absl::Status status;
  {
    MutexLock lock(&mu_);
    while (!timeout_cancelled_ && IsUnfinished(state_)) {
      if (cv_.WaitWithDeadline(&mu_, deadline)) {
        break;
      }
    }
    if (timeout_cancelled_ || !TransitionTo(ConnectionState::kFailed)) {
      return;
    }
    failure_ = NegotiationTimeoutError(
        absl::StrCat("No connection within ",
                     absl::FormatDuration(options_.timeout), "."));
    status = failure_;
  }

  // Observers may call Disconnect() from here; the destructor joins this
  // thread.
  NotifyStateChanged(ConnectionState::kFailed);
  ReportError(status);
}

void ConnectionNegotiator::ForEachObserver(
    const std::function<void(NegotiatorObserver*)>& fn) {
  // Dispatched from a copy so that an observer may call Disconnect(), which
  // notifies again.
  std::vector<NegotiatorObserver*> observers;
  {
    absl::ReaderMutexLock lock(&observers_mu_);
    observers = observers_;
  }
  for (NegotiatorObserver* observer : observers) {
    fn(observer);
  }
}

}  // namespace boardlink
