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

#include "boardlink/net/webrtc/rtc_config.h"

namespace boardlink::net {

rtc::Configuration RtcConfig::BuildLibdatachannelConfig() const {
  rtc::Configuration config;
  config.maxMessageSize = max_message_size;
  if (port_range_begin != 0) {
    config.portRangeBegin = port_range_begin;
  }
  if (port_range_end != 0) {
    config.portRangeEnd = port_range_end;
  }
  config.enableIceUdpMux = enable_ice_udp_mux;
  // Offers and answers are produced explicitly by the negotiator.
  config.disableAutoNegotiation = true;

  for (const auto& server : stun_servers) {
    config.iceServers.emplace_back(server);
  }

  return config;
}

}  // namespace boardlink::net
