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

#include "boardlink/net/webrtc/rtc_peer_connection.h"

#include <exception>
#include <optional>
#include <utility>
#include <variant>

#include <absl/log/log.h>
#include <absl/strings/str_cat.h>
#include <rtc/candidate.hpp>
#include <rtc/common.hpp>
#include <rtc/description.hpp>
#include <rtc/reliability.hpp>

#include "boardlink/errors/errors.h"

namespace boardlink::net {

namespace {

LinkState ToLinkState(rtc::PeerConnection::State state) {
  switch (state) {
    case rtc::PeerConnection::State::New:
      return LinkState::kNew;
    case rtc::PeerConnection::State::Connecting:
      return LinkState::kConnecting;
    case rtc::PeerConnection::State::Connected:
      return LinkState::kConnected;
    case rtc::PeerConnection::State::Disconnected:
      return LinkState::kDisconnected;
    case rtc::PeerConnection::State::Failed:
      return LinkState::kFailed;
    case rtc::PeerConnection::State::Closed:
      return LinkState::kClosed;
  }
  return LinkState::kFailed;
}

IceLinkState ToIceLinkState(rtc::PeerConnection::IceState state) {
  switch (state) {
    case rtc::PeerConnection::IceState::New:
      return IceLinkState::kNew;
    case rtc::PeerConnection::IceState::Checking:
      return IceLinkState::kChecking;
    case rtc::PeerConnection::IceState::Connected:
      return IceLinkState::kConnected;
    case rtc::PeerConnection::IceState::Completed:
      return IceLinkState::kCompleted;
    case rtc::PeerConnection::IceState::Failed:
      return IceLinkState::kFailed;
    case rtc::PeerConnection::IceState::Disconnected:
      return IceLinkState::kDisconnected;
    case rtc::PeerConnection::IceState::Closed:
      return IceLinkState::kClosed;
  }
  return IceLinkState::kFailed;
}

}  // namespace

RtcDataChannelTransport::RtcDataChannelTransport(
    std::shared_ptr<rtc::DataChannel> data_channel, bool hold_inbound)
    : DataChannelTransport(hold_inbound),
      label_(data_channel->label()),
      data_channel_(std::move(data_channel)) {
  data_channel_->onOpen([this]() {
    LOG(INFO) << "Data channel " << label_ << " is open.";
    NotifyOpen();
  });

  data_channel_->onClosed([this]() {
    LOG(INFO) << "Data channel " << label_ << " closed.";
    NotifyClosed();
  });

  data_channel_->onError([this](std::string error) {
    LOG(ERROR) << "Data channel " << label_ << " error: " << error;
    NotifyError(absl::UnavailableError(
        absl::StrCat("Data channel ", label_, " error: ", error)));
  });

  data_channel_->onMessage(
      [this](rtc::binary message) {
        const auto* data = reinterpret_cast<const Byte*>(message.data());
        NotifyMessage(Bytes(data, data + message.size()));
      },
      [this](rtc::string message) { NotifyMessage(std::move(message)); });

  data_channel_->onBufferedAmountLow([this]() { NotifyBufferedAmountLow(); });
}

RtcDataChannelTransport::~RtcDataChannelTransport() {
  data_channel_->resetCallbacks();
  data_channel_->close();
}

std::string RtcDataChannelTransport::GetLabel() const { return label_; }

bool RtcDataChannelTransport::IsOpen() const {
  return data_channel_->isOpen();
}

absl::Status RtcDataChannelTransport::SendText(std::string_view text) {
  if (!data_channel_->isOpen()) {
    return TransportNotOpenError(
        absl::StrCat("Data channel ", label_, " is not open."));
  }
  try {
    data_channel_->send(std::string(text));
  } catch (const std::exception& e) {
    return TransportNotOpenError(
        absl::StrCat("Could not send on data channel ", label_, ": ", e.what()));
  }
  return absl::OkStatus();
}

absl::Status RtcDataChannelTransport::SendBinary(absl::Span<const Byte> data) {
  if (!data_channel_->isOpen()) {
    return TransportNotOpenError(
        absl::StrCat("Data channel ", label_, " is not open."));
  }
  try {
    data_channel_->send(reinterpret_cast<const rtc::byte*>(data.data()),
                        data.size());
  } catch (const std::exception& e) {
    return TransportNotOpenError(
        absl::StrCat("Could not send on data channel ", label_, ": ", e.what()));
  }
  return absl::OkStatus();
}

size_t RtcDataChannelTransport::GetBufferedAmount() const {
  return data_channel_->bufferedAmount();
}

void RtcDataChannelTransport::SetBufferedAmountLowThreshold(size_t threshold) {
  data_channel_->setBufferedAmountLowThreshold(threshold);
}

void RtcDataChannelTransport::Close() { data_channel_->close(); }

RtcPeerConnection::RtcPeerConnection(const RtcConfig& config)
    : connection_(std::make_shared<rtc::PeerConnection>(
          config.BuildLibdatachannelConfig())) {}

RtcPeerConnection::~RtcPeerConnection() {
  connection_->resetCallbacks();
  connection_->close();
}

void RtcPeerConnection::OnLocalCandidate(LocalCandidateHandler handler) {
  connection_->onLocalCandidate(
      [handler = std::move(handler)](rtc::Candidate candidate) {
        // libdatachannel does not expose the m-line index; a data-only
        // session has a single m-line.
        handler(IceCandidate{.candidate = candidate.candidate(),
                             .mid = candidate.mid(),
                             .mline_index = 0});
      });
}

void RtcPeerConnection::OnStateChange(StateHandler handler) {
  connection_->onStateChange(
      [handler = std::move(handler)](rtc::PeerConnection::State state) {
        handler(ToLinkState(state));
      });
}

void RtcPeerConnection::OnIceStateChange(IceStateHandler handler) {
  connection_->onIceStateChange(
      [handler = std::move(handler)](rtc::PeerConnection::IceState state) {
        handler(ToIceLinkState(state));
      });
}

void RtcPeerConnection::OnDataChannel(DataChannelHandler handler) {
  connection_->onDataChannel([handler = std::move(handler)](
                                 std::shared_ptr<rtc::DataChannel> channel) {
    handler(std::make_shared<RtcDataChannelTransport>(std::move(channel),
                                                      /*hold_inbound=*/true));
  });
}

absl::StatusOr<std::shared_ptr<DataChannelTransport>>
RtcPeerConnection::CreateDataChannel(std::string_view label) {
  // Reliable and ordered: chunks carry no sequence numbers.
  rtc::DataChannelInit init;
  init.reliability.unordered = false;
  try {
    std::shared_ptr<rtc::DataChannel> channel =
        connection_->createDataChannel(std::string(label), std::move(init));
    return std::make_shared<RtcDataChannelTransport>(std::move(channel));
  } catch (const std::exception& e) {
    return NegotiationFailedError(
        absl::StrCat("Could not create data channel: ", e.what()));
  }
}

absl::StatusOr<SessionDescription> RtcPeerConnection::CreateLocalDescription(
    SessionDescription::Kind kind) {
  const rtc::Description::Type type = kind == SessionDescription::Kind::kOffer
                                          ? rtc::Description::Type::Offer
                                          : rtc::Description::Type::Answer;
  try {
    connection_->setLocalDescription(type);
    std::optional<rtc::Description> description =
        connection_->localDescription();
    if (!description.has_value()) {
      return NegotiationFailedError("No local description was generated.");
    }
    return SessionDescription{.kind = kind,
                              .body = description->generateSdp("\r\n")};
  } catch (const std::exception& e) {
    return NegotiationFailedError(absl::StrCat(
        "Could not create local ", SessionDescriptionKindName(kind), ": ",
        e.what()));
  }
}

absl::Status RtcPeerConnection::SetRemoteDescription(
    const SessionDescription& description) {
  try {
    connection_->setRemoteDescription(rtc::Description(
        description.body,
        std::string(SessionDescriptionKindName(description.kind))));
  } catch (const std::exception& e) {
    return NegotiationFailedError(
        absl::StrCat("Could not apply remote ",
                     SessionDescriptionKindName(description.kind), ": ",
                     e.what()));
  }
  return absl::OkStatus();
}

absl::Status RtcPeerConnection::AddRemoteCandidate(
    const IceCandidate& candidate) {
  try {
    connection_->addRemoteCandidate(
        rtc::Candidate(candidate.candidate, candidate.mid));
  } catch (const std::exception& e) {
    return NegotiationFailedError(
        absl::StrCat("Could not add remote candidate: ", e.what()));
  }
  return absl::OkStatus();
}

void RtcPeerConnection::ResetCallbacks() { connection_->resetCallbacks(); }

void RtcPeerConnection::Close() { connection_->close(); }

PeerConnectionFactory MakeRtcPeerConnectionFactory(RtcConfig config) {
  return [config = std::move(config)]()
             -> absl::StatusOr<std::unique_ptr<PeerConnection>> {
    try {
      return std::make_unique<RtcPeerConnection>(config);
    } catch (const std::exception& e) {
      return NegotiationFailedError(
          absl::StrCat("Could not create peer connection: ", e.what()));
    }
  };
}

}  // namespace boardlink::net
