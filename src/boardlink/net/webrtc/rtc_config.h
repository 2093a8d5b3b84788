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

#ifndef BOARDLINK_NET_WEBRTC_RTC_CONFIG_H_
#define BOARDLINK_NET_WEBRTC_RTC_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <rtc/configuration.hpp>

namespace boardlink::net {

struct RtcConfig {
  static constexpr int kDefaultMaxMessageSize =
      65536;  // 64 KiB, the chunk size of a transfer

  [[nodiscard]] rtc::Configuration BuildLibdatachannelConfig() const;

  std::optional<size_t> max_message_size = kDefaultMaxMessageSize;

  // Zero leaves the choice to libdatachannel.
  uint16_t port_range_begin = 0;
  uint16_t port_range_end = 0;

  bool enable_ice_udp_mux = false;

  // STUN only: peers without a direct path fail negotiation.
  std::vector<std::string> stun_servers = {
      "stun:stun.l.google.com:19302",
      "stun:stun1.l.google.com:19302",
      "stun:stun2.l.google.com:19302",
  };
};

}  // namespace boardlink::net

#endif  // BOARDLINK_NET_WEBRTC_RTC_CONFIG_H_
