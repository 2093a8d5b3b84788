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

#include "boardlink/testing/fake_peer_connection.h"

#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "boardlink/errors/errors.h"

namespace boardlink::testing {

void FakeNetwork::SetBlocked(bool blocked) {
  MutexLock lock(&mu_);
  blocked_ = blocked;
}

void FakeNetwork::Register(PeerRole role, FakePeerConnection* connection) {
  MutexLock lock(&mu_);
  peers_[static_cast<int>(role)] = connection;
}

void FakeNetwork::Unregister(PeerRole role, FakePeerConnection* connection) {
  MutexLock lock(&mu_);
  if (peers_[static_cast<int>(role)] == connection) {
    peers_[static_cast<int>(role)] = nullptr;
  }
}

void FakeNetwork::MaybeConnect() {
  FakePeerConnection* initiator;
  FakePeerConnection* responder;
  std::shared_ptr<net::InMemoryTransport> responder_end;
  {
    MutexLock lock(&mu_);
    initiator = peers_[static_cast<int>(PeerRole::kInitiator)];
    responder = peers_[static_cast<int>(PeerRole::kResponder)];
    if (connected_ || blocked_ || initiator == nullptr ||
        responder == nullptr || !initiator->has_remote_description() ||
        !responder->has_remote_description()) {
      return;
    }
    responder_end = initiator->remote_channel_end();
    if (responder_end == nullptr) {
      return;
    }
    connected_ = true;
  }

  initiator->EmitState(net::LinkState::kConnecting);
  responder->EmitState(net::LinkState::kConnecting);
  responder->EmitDataChannel(responder_end);
  // Opens both ends.
  responder_end->Open();
  initiator->EmitIceState(net::IceLinkState::kConnected);
  responder->EmitIceState(net::IceLinkState::kConnected);
}

FakePeerConnection::FakePeerConnection(std::shared_ptr<FakeNetwork> network,
                                       PeerRole role)
    : network_(std::move(network)), role_(role) {
  if (network_ != nullptr) {
    network_->Register(role_, this);
  }
}

FakePeerConnection::~FakePeerConnection() {
  if (network_ != nullptr) {
    network_->Unregister(role_, this);
  }
}

void FakePeerConnection::OnLocalCandidate(LocalCandidateHandler handler) {
  Record("on_local_candidate");
  MutexLock lock(&mu_);
  on_local_candidate_ = std::move(handler);
}

void FakePeerConnection::OnStateChange(StateHandler handler) {
  Record("on_state_change");
  MutexLock lock(&mu_);
  on_state_ = std::move(handler);
}

void FakePeerConnection::OnIceStateChange(IceStateHandler handler) {
  Record("on_ice_state_change");
  MutexLock lock(&mu_);
  on_ice_state_ = std::move(handler);
}

void FakePeerConnection::OnDataChannel(DataChannelHandler handler) {
  Record("on_data_channel");
  MutexLock lock(&mu_);
  on_data_channel_ = std::move(handler);
}

absl::StatusOr<std::shared_ptr<net::DataChannelTransport>>
FakePeerConnection::CreateDataChannel(std::string_view label) {
  Record(absl::StrCat("create_channel:", label));
  // The responder's end holds messages until its negotiator starts delivery,
  // as a channel announced through onDataChannel does.
  auto [local_end, remote_end] = net::InMemoryTransport::CreatePair(
      label, {.hold_second_end = true});
  MutexLock lock(&mu_);
  local_channel_end_ = local_end;
  remote_channel_end_ = std::move(remote_end);
  return std::shared_ptr<net::DataChannelTransport>(std::move(local_end));
}

absl::StatusOr<SessionDescription> FakePeerConnection::CreateLocalDescription(
    SessionDescription::Kind kind) {
  Record(absl::StrCat("create_local:", SessionDescriptionKindName(kind)));
  SessionDescription description{
      .kind = kind,
      .body = absl::StrCat("v=0\r\ns=fake-", PeerRoleName(role_), "-",
                           SessionDescriptionKindName(kind), "\r\n")};

  const int candidates =
      network_ != nullptr ? network_->candidates_per_peer() : 0;
  for (int i = 0; i < candidates; ++i) {
    EmitLocalCandidate(IceCandidate{
        .candidate = absl::StrFormat(
            "candidate:%d 1 udp 2122260223 10.0.%d.1 %d typ host", i + 1,
            static_cast<int>(role_), 50000 + i),
        .mid = "0",
        .mline_index = 0});
  }
  return description;
}

absl::Status FakePeerConnection::SetRemoteDescription(
    const SessionDescription& description) {
  Record(absl::StrCat("set_remote:",
                      SessionDescriptionKindName(description.kind)));
  {
    MutexLock lock(&mu_);
    if (!next_set_remote_status_.ok()) {
      return std::exchange(next_set_remote_status_, absl::OkStatus());
    }
    remote_description_ = description;
  }
  if (network_ != nullptr) {
    network_->MaybeConnect();
  }
  return absl::OkStatus();
}

absl::Status FakePeerConnection::AddRemoteCandidate(
    const IceCandidate& candidate) {
  Record(absl::StrCat("add_candidate:", candidate.candidate));
  MutexLock lock(&mu_);
  if (!remote_description_.has_value()) {
    return NegotiationFailedError(
        "A remote candidate was added before the remote description.");
  }
  remote_candidates_.push_back(candidate);
  return absl::OkStatus();
}

void FakePeerConnection::ResetCallbacks() {
  Record("reset_callbacks");
  MutexLock lock(&mu_);
  on_local_candidate_ = nullptr;
  on_state_ = nullptr;
  on_ice_state_ = nullptr;
  on_data_channel_ = nullptr;
}

void FakePeerConnection::Close() {
  Record("close");
  MutexLock lock(&mu_);
  closed_ = true;
}

void FakePeerConnection::EmitLocalCandidate(const IceCandidate& candidate) {
  LocalCandidateHandler handler;
  {
    MutexLock lock(&mu_);
    handler = on_local_candidate_;
  }
  if (handler) {
    handler(candidate);
  }
}

void FakePeerConnection::EmitState(net::LinkState state) {
  StateHandler handler;
  {
    MutexLock lock(&mu_);
    handler = on_state_;
  }
  if (handler) {
    handler(state);
  }
}

void FakePeerConnection::EmitIceState(net::IceLinkState state) {
  IceStateHandler handler;
  {
    MutexLock lock(&mu_);
    handler = on_ice_state_;
  }
  if (handler) {
    handler(state);
  }
}

void FakePeerConnection::EmitDataChannel(
    std::shared_ptr<net::DataChannelTransport> channel) {
  DataChannelHandler handler;
  {
    MutexLock lock(&mu_);
    handler = on_data_channel_;
  }
  if (handler) {
    handler(std::move(channel));
  }
}

void FakePeerConnection::FailNextSetRemoteDescription(absl::Status status) {
  MutexLock lock(&mu_);
  next_set_remote_status_ = std::move(status);
}

std::vector<std::string> FakePeerConnection::events() const {
  MutexLock lock(&mu_);
  return events_;
}

bool FakePeerConnection::has_remote_description() const {
  MutexLock lock(&mu_);
  return remote_description_.has_value();
}

std::vector<IceCandidate> FakePeerConnection::remote_candidates() const {
  MutexLock lock(&mu_);
  return remote_candidates_;
}

bool FakePeerConnection::closed() const {
  MutexLock lock(&mu_);
  return closed_;
}

std::shared_ptr<net::InMemoryTransport> FakePeerConnection::remote_channel_end()
    const {
  MutexLock lock(&mu_);
  return remote_channel_end_;
}

void FakePeerConnection::Record(std::string event) {
  MutexLock lock(&mu_);
  events_.push_back(std::move(event));
}

net::PeerConnectionFactory MakeFakePeerConnectionFactory(
    std::shared_ptr<FakeNetwork> network, PeerRole role,
    FakePeerConnection** created) {
  return [network = std::move(network), role,
          created]() -> absl::StatusOr<std::unique_ptr<net::PeerConnection>> {
    auto connection = std::make_unique<FakePeerConnection>(network, role);
    if (created != nullptr) {
      *created = connection.get();
    }
    return connection;
  };
}

}  // namespace boardlink::testing
