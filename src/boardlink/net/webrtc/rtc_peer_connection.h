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

#ifndef BOARDLINK_NET_WEBRTC_RTC_PEER_CONNECTION_H_
#define BOARDLINK_NET_WEBRTC_RTC_PEER_CONNECTION_H_

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/types/span.h>
#include <rtc/datachannel.hpp>
#include <rtc/peerconnection.hpp>

#include "boardlink/net/transport.h"
#include "boardlink/net/webrtc/peer_connection.h"
#include "boardlink/net/webrtc/rtc_config.h"

namespace boardlink::net {

/**
 * A DataChannelTransport over a libdatachannel data channel.
 *
 * @headerfile boardlink/net/webrtc/rtc_peer_connection.h
 */
class RtcDataChannelTransport final : public DataChannelTransport {
 public:
  // A channel received from the remote peer is built with `hold_inbound`, so
  // that nothing it carries is lost before observers attach.
  explicit RtcDataChannelTransport(
      std::shared_ptr<rtc::DataChannel> data_channel,
      bool hold_inbound = false);

  ~RtcDataChannelTransport() override;

  [[nodiscard]] std::string GetLabel() const override;
  [[nodiscard]] bool IsOpen() const override;
  absl::Status SendText(std::string_view text) override;
  absl::Status SendBinary(absl::Span<const Byte> data) override;
  [[nodiscard]] size_t GetBufferedAmount() const override;
  void SetBufferedAmountLowThreshold(size_t threshold) override;
  void Close() override;

 private:
  const std::string label_;
  std::shared_ptr<rtc::DataChannel> data_channel_;
};

/**
 * A PeerConnection backed by rtc::PeerConnection.
 *
 * @headerfile boardlink/net/webrtc/rtc_peer_connection.h
 */
class RtcPeerConnection final : public PeerConnection {
 public:
  explicit RtcPeerConnection(const RtcConfig& config);

  ~RtcPeerConnection() override;

  void OnLocalCandidate(LocalCandidateHandler handler) override;
  void OnStateChange(StateHandler handler) override;
  void OnIceStateChange(IceStateHandler handler) override;
  void OnDataChannel(DataChannelHandler handler) override;

  absl::StatusOr<std::shared_ptr<DataChannelTransport>> CreateDataChannel(
      std::string_view label) override;
  absl::StatusOr<SessionDescription> CreateLocalDescription(
      SessionDescription::Kind kind) override;
  absl::Status SetRemoteDescription(
      const SessionDescription& description) override;
  absl::Status AddRemoteCandidate(const IceCandidate& candidate) override;

  void ResetCallbacks() override;
  void Close() override;

 private:
  std::shared_ptr<rtc::PeerConnection> connection_;
};

PeerConnectionFactory MakeRtcPeerConnectionFactory(RtcConfig config = {});

}  // namespace boardlink::net

#endif  // BOARDLINK_NET_WEBRTC_RTC_PEER_CONNECTION_H_
