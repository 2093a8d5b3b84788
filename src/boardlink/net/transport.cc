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

#include "boardlink/net/transport.h"

#include <algorithm>
#include <vector>

namespace boardlink::net {

size_t InboundMessageSize(const InboundMessage& message) {
  if (const auto* text = std::get_if<std::string>(&message)) {
    return text->size();
  }
  if (const auto* bytes = std::get_if<Bytes>(&message)) {
    return bytes->size();
  }
  return 0;
}

DataChannelTransport::DataChannelTransport(bool hold_inbound)
    : holding_(hold_inbound) {}

void DataChannelTransport::AddObserver(TransportObserver* observer) {
  MutexLock lock(&observers_mu_);
  observers_.push_back(observer);
}

void DataChannelTransport::RemoveObserver(TransportObserver* observer) {
  MutexLock lock(&observers_mu_);
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                   observers_.end());
}

void DataChannelTransport::StartDelivery() {
  MutexLock lock(&delivery_mu_);
  if (!holding_) {
    return;
  }
  holding_ = false;
  std::vector<InboundMessage> held;
  held.swap(held_);
  for (const InboundMessage& message : held) {
    ForEachObserver([&message](TransportObserver* observer) {
      observer->OnMessage(message);
    });
  }
}

void DataChannelTransport::ForEachObserver(
    const std::function<void(TransportObserver*)>& fn) {
  // Held shared for the whole dispatch so that RemoveObserver() cannot return
  // while an observer is still running.
  absl::ReaderMutexLock lock(&observers_mu_);
  for (TransportObserver* observer : observers_) {
    fn(observer);
  }
}

void DataChannelTransport::NotifyOpen() {
  ForEachObserver([](TransportObserver* observer) { observer->OnOpen(); });
}

void DataChannelTransport::NotifyClosed() {
  ForEachObserver([](TransportObserver* observer) { observer->OnClosed(); });
}

void DataChannelTransport::NotifyError(const absl::Status& status) {
  ForEachObserver(
      [&status](TransportObserver* observer) { observer->OnError(status); });
}

void DataChannelTransport::NotifyMessage(const InboundMessage& message) {
  MutexLock lock(&delivery_mu_);
  if (holding_) {
    held_.push_back(message);
    return;
  }
  ForEachObserver(
      [&message](TransportObserver* observer) { observer->OnMessage(message); });
}

void DataChannelTransport::NotifyBufferedAmountLow() {
  ForEachObserver(
      [](TransportObserver* observer) { observer->OnBufferedAmountLow(); });
}

}  // namespace boardlink::net
