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

#ifndef BOARDLINK_NET_TRANSPORT_H_
#define BOARDLINK_NET_TRANSPORT_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/types/span.h>

#include "boardlink/concurrency/concurrency.h"

namespace boardlink::net {

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

// A binary message whose bytes are not in memory yet (for example a browser
// Blob). Receivers call `materialize` synchronously before looking at the
// next message, so ordering is preserved.
struct DeferredBinary {
  std::function<absl::StatusOr<Bytes>()> materialize;
};

// Text frames carry JSON control messages; binary frames carry chunks.
using InboundMessage = std::variant<std::string, Bytes, DeferredBinary>;

size_t InboundMessageSize(const InboundMessage& message);

/**
 * Receives the events of a DataChannelTransport. All methods are called on
 * transport-owned threads. OnMessage() calls for one transport are serialized
 * and arrive in send order; other events may arrive concurrently with them.
 */
class TransportObserver {
 public:
  virtual ~TransportObserver() = default;

  virtual void OnOpen() {}
  virtual void OnClosed() {}
  virtual void OnError(const absl::Status& status) {}
  virtual void OnMessage(const InboundMessage& message) {}
  // The buffered amount dropped to or below the low threshold.
  virtual void OnBufferedAmountLow() {}
};

/**
 * A reliable, ordered, message-oriented channel between two peers.
 *
 * @headerfile boardlink/net/transport.h
 */
class DataChannelTransport {
 public:
  virtual ~DataChannelTransport() = default;

  [[nodiscard]] virtual std::string GetLabel() const = 0;

  [[nodiscard]] virtual bool IsOpen() const = 0;

  virtual absl::Status SendText(std::string_view text) = 0;

  virtual absl::Status SendBinary(absl::Span<const Byte> data) = 0;

  // Bytes accepted by Send*() that have not left the local buffer yet.
  [[nodiscard]] virtual size_t GetBufferedAmount() const = 0;

  virtual void SetBufferedAmountLowThreshold(size_t threshold) = 0;

  virtual void Close() = 0;

  // Observers are not owned. RemoveObserver() waits for any event being
  // delivered to finish, so it must not be called from an observer method.
  void AddObserver(TransportObserver* observer);
  void RemoveObserver(TransportObserver* observer);

  // Delivers the messages held since construction, in order, and every later
  // message as it arrives. Does nothing for a transport that does not hold.
  void StartDelivery();

 protected:
  DataChannelTransport() = default;
  // With `hold_inbound`, messages are kept until StartDelivery(). Channels
  // announced by the remote peer can carry data before anyone observes them.
  explicit DataChannelTransport(bool hold_inbound);

  void NotifyOpen();
  void NotifyClosed();
  void NotifyError(const absl::Status& status);
  void NotifyMessage(const InboundMessage& message);
  void NotifyBufferedAmountLow();

 private:
  void ForEachObserver(const std::function<void(TransportObserver*)>& fn);

  mutable Mutex observers_mu_;
  std::vector<TransportObserver*> observers_ ABSL_GUARDED_BY(observers_mu_);

  // Serializes message dispatch with the release of held messages.
  Mutex delivery_mu_;
  bool holding_ ABSL_GUARDED_BY(delivery_mu_) = false;
  std::vector<InboundMessage> held_ ABSL_GUARDED_BY(delivery_mu_);
};

}  // namespace boardlink::net

#endif  // BOARDLINK_NET_TRANSPORT_H_
