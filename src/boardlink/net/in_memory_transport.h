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

#ifndef BOARDLINK_NET_IN_MEMORY_TRANSPORT_H_
#define BOARDLINK_NET_IN_MEMORY_TRANSPORT_H_

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <absl/status/status.h>
#include <absl/types/span.h>

#include "boardlink/net/transport.h"

namespace boardlink::net {

struct InMemoryTransportOptions {
  // Deliver binary frames as DeferredBinary instead of Bytes.
  bool deliver_deferred_binary = false;
  // The second end of the pair holds inbound messages until StartDelivery(),
  // like a channel opened by the remote peer.
  bool hold_second_end = false;
};

/**
 * One end of a process-local DataChannelTransport pair.
 *
 * Each direction has its own queue and delivery thread, so a sender blocked
 * on backpressure inside a callback does not stall the opposite direction.
 * Bytes stay buffered on the sending end until the delivery thread hands
 * them to the receiving end's observers, which makes the buffered amount
 * observable in tests.
 *
 * @headerfile boardlink/net/in_memory_transport.h
 */
class InMemoryTransport final : public DataChannelTransport {
 public:
  using Pair = std::pair<std::shared_ptr<InMemoryTransport>,
                         std::shared_ptr<InMemoryTransport>>;

  // Both ends start closed; call Open() on either.
  static Pair CreatePair(std::string_view label,
                         InMemoryTransportOptions options = {});

  ~InMemoryTransport() override;

  [[nodiscard]] std::string GetLabel() const override;
  [[nodiscard]] bool IsOpen() const override;
  absl::Status SendText(std::string_view text) override;
  absl::Status SendBinary(absl::Span<const Byte> data) override;
  [[nodiscard]] size_t GetBufferedAmount() const override;
  void SetBufferedAmountLowThreshold(size_t threshold) override;

  // Stops accepting sends, delivers what is queued in both directions, then
  // notifies OnClosed() on both ends.
  void Close() override;

  // Opens the link and notifies OnOpen() on both ends.
  void Open();

  // While paused, messages sent from this end stay buffered.
  void SetDeliveryPaused(bool paused);

  // The highest buffered amount this end has reached.
  [[nodiscard]] size_t GetMaxBufferedAmount() const;

  // Reports `status` to this end's observers.
  void InjectError(const absl::Status& status);

 private:
  class Link;

  InMemoryTransport(std::shared_ptr<Link> link, int side, bool hold_inbound);

  const std::shared_ptr<Link> link_;
  const int side_;
};

}  // namespace boardlink::net

#endif  // BOARDLINK_NET_IN_MEMORY_TRANSPORT_H_
