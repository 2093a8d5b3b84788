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

#include "boardlink/net/in_memory_transport.h"

#include <algorithm>
#include <array>
#include <deque>
#include <thread>
#include <utility>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/log/log.h>
#include <absl/strings/str_cat.h>

#include "boardlink/concurrency/concurrency.h"
#include "boardlink/errors/errors.h"

namespace boardlink::net {

class InMemoryTransport::Link {
 public:
  Link(std::string label, InMemoryTransportOptions options)
      : label_(std::move(label)), options_(options) {}

  static void Start(const std::shared_ptr<Link>& link) {
    for (int from = 0; from < 2; ++from) {
      link->workers_[from] =
          std::thread([link, from]() { link->DeliveryLoop(from); });
    }
  }

  [[nodiscard]] const std::string& label() const { return label_; }

  void Attach(int side, InMemoryTransport* end) {
    MutexLock lock(&mu_);
    ends_[side] = end;
  }

  void Detach(int side) {
    mu_.Lock();
    ends_[side] = nullptr;
    closing_ = true;
    cv_.SignalAll();
    if (!IsWorkerThread()) {
      while (active_callbacks_ > 0) {
        cv_.Wait(&mu_);
      }
    }
    if (ends_[0] != nullptr || ends_[1] != nullptr) {
      mu_.Unlock();
      return;
    }
    shutdown_ = true;
    cv_.SignalAll();
    mu_.Unlock();

    for (std::thread& worker : workers_) {
      if (!worker.joinable()) {
        continue;
      }
      if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
      } else {
        worker.join();
      }
    }
  }

  void Open() {
    std::array<InMemoryTransport*, 2> ends{};
    {
      MutexLock lock(&mu_);
      if (open_ || closing_) {
        return;
      }
      open_ = true;
      ends = {ends_[0], ends_[1]};
      ++active_callbacks_;
    }
    for (InMemoryTransport* end : ends) {
      if (end != nullptr) {
        end->NotifyOpen();
      }
    }
    MutexLock lock(&mu_);
    --active_callbacks_;
    cv_.SignalAll();
  }

  bool IsOpen() const {
    MutexLock lock(&mu_);
    return open_ && !closing_;
  }

  absl::Status Enqueue(int from, InboundMessage message) {
    MutexLock lock(&mu_);
    if (!open_ || closing_) {
      return TransportNotOpenError(
          absl::StrCat("Data channel ", label_, " is not open."));
    }
    Direction& direction = directions_[from];
    direction.buffered += InboundMessageSize(message);
    direction.max_buffered =
        std::max(direction.max_buffered, direction.buffered);
    direction.queue.push_back(std::move(message));
    cv_.SignalAll();
    return absl::OkStatus();
  }

  void Close() {
    MutexLock lock(&mu_);
    closing_ = true;
    directions_[0].paused = false;
    directions_[1].paused = false;
    cv_.SignalAll();
  }

  size_t GetBufferedAmount(int from) const {
    MutexLock lock(&mu_);
    return directions_[from].buffered;
  }

  size_t GetMaxBufferedAmount(int from) const {
    MutexLock lock(&mu_);
    return directions_[from].max_buffered;
  }

  void SetLowThreshold(int from, size_t threshold) {
    MutexLock lock(&mu_);
    directions_[from].low_threshold = threshold;
  }

  void SetPaused(int from, bool paused) {
    MutexLock lock(&mu_);
    directions_[from].paused = paused && !closing_;
    cv_.SignalAll();
  }

 private:
  struct Direction {
    std::deque<InboundMessage> queue;
    size_t buffered = 0;
    size_t max_buffered = 0;
    size_t low_threshold = 0;
    bool paused = false;
    bool in_flight = false;
  };

  bool IsWorkerThread() const {
    return std::any_of(workers_.begin(), workers_.end(),
                       [](const std::thread& worker) {
                         return worker.get_id() == std::this_thread::get_id();
                       });
  }

  bool ReadyToFinishClose() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
    if (!closing_ || closed_) {
      return false;
    }
    for (const Direction& direction : directions_) {
      if (!direction.queue.empty() || direction.in_flight) {
        return false;
      }
    }
    return true;
  }

  InboundMessage PrepareForDelivery(InboundMessage message) const {
    if (!options_.deliver_deferred_binary) {
      return message;
    }
    auto* bytes = std::get_if<Bytes>(&message);
    if (bytes == nullptr) {
      return message;
    }
    auto payload = std::make_shared<Bytes>(std::move(*bytes));
    return DeferredBinary{
        .materialize = [payload]() -> absl::StatusOr<Bytes> {
          return *payload;
        }};
  }

  void DeliveryLoop(int from) {
    const int to = 1 - from;
    mu_.Lock();
    while (!shutdown_) {
      if (ReadyToFinishClose()) {
        closed_ = true;
        open_ = false;
        const std::array<InMemoryTransport*, 2> ends = {ends_[0], ends_[1]};
        ++active_callbacks_;
        mu_.Unlock();
        for (InMemoryTransport* end : ends) {
          if (end != nullptr) {
            end->NotifyClosed();
          }
        }
        mu_.Lock();
        --active_callbacks_;
        cv_.SignalAll();
        continue;
      }

      Direction& direction = directions_[from];
      if (direction.paused || direction.queue.empty()) {
        cv_.Wait(&mu_);
        continue;
      }

      InboundMessage message = std::move(direction.queue.front());
      direction.queue.pop_front();
      const size_t before = direction.buffered;
      direction.buffered -= InboundMessageSize(message);
      const bool became_low = before > direction.low_threshold &&
                              direction.buffered <= direction.low_threshold;
      direction.in_flight = true;
      InMemoryTransport* receiver = ends_[to];
      InMemoryTransport* sender = ends_[from];
      ++active_callbacks_;
      mu_.Unlock();

      if (receiver != nullptr) {
        receiver->NotifyMessage(PrepareForDelivery(std::move(message)));
      } else {
        DLOG(INFO) << "Dropping message on " << label_
                   << ": receiving end is gone.";
      }
      if (became_low && sender != nullptr) {
        sender->NotifyBufferedAmountLow();
      }

      mu_.Lock();
      direction.in_flight = false;
      --active_callbacks_;
      cv_.SignalAll();
    }
    mu_.Unlock();
  }

  const std::string label_;
  const InMemoryTransportOptions options_;

  mutable Mutex mu_;
  CondVar cv_;

  std::array<InMemoryTransport*, 2> ends_ ABSL_GUARDED_BY(mu_) = {nullptr,
                                                                  nullptr};
  std::array<Direction, 2> directions_ ABSL_GUARDED_BY(mu_);
  int active_callbacks_ ABSL_GUARDED_BY(mu_) = 0;

  bool open_ ABSL_GUARDED_BY(mu_) = false;
  bool closing_ ABSL_GUARDED_BY(mu_) = false;
  bool closed_ ABSL_GUARDED_BY(mu_) = false;
  bool shutdown_ ABSL_GUARDED_BY(mu_) = false;

  std::array<std::thread, 2> workers_;
};

InMemoryTransport::Pair InMemoryTransport::CreatePair(
    std::string_view label, InMemoryTransportOptions options) {
  auto link = std::make_shared<Link>(std::string(label), options);
  std::shared_ptr<InMemoryTransport> first(
      new InMemoryTransport(link, 0, /*hold_inbound=*/false));
  std::shared_ptr<InMemoryTransport> second(
      new InMemoryTransport(link, 1, options.hold_second_end));
  Link::Start(link);
  return {std::move(first), std::move(second)};
}

InMemoryTransport::InMemoryTransport(std::shared_ptr<Link> link, int side,
                                     bool hold_inbound)
    : DataChannelTransport(hold_inbound), link_(std::move(link)), side_(side) {
  link_->Attach(side_, this);
}

InMemoryTransport::~InMemoryTransport() { link_->Detach(side_); }

std::string InMemoryTransport::GetLabel() const { return link_->label(); }

bool InMemoryTransport::IsOpen() const { return link_->IsOpen(); }

absl::Status InMemoryTransport::SendText(std::string_view text) {
  return link_->Enqueue(side_, std::string(text));
}

absl::Status InMemoryTransport::SendBinary(absl::Span<const Byte> data) {
  return link_->Enqueue(side_, Bytes(data.begin(), data.end()));
}

size_t InMemoryTransport::GetBufferedAmount() const {
  return link_->GetBufferedAmount(side_);
}

void InMemoryTransport::SetBufferedAmountLowThreshold(size_t threshold) {
  link_->SetLowThreshold(side_, threshold);
}

void InMemoryTransport::Close() { link_->Close(); }

void InMemoryTransport::Open() { link_->Open(); }

void InMemoryTransport::SetDeliveryPaused(bool paused) {
  link_->SetPaused(side_, paused);
}

size_t InMemoryTransport::GetMaxBufferedAmount() const {
  return link_->GetMaxBufferedAmount(side_);
}

void InMemoryTransport::InjectError(const absl::Status& status) {
  NotifyError(status);
}

}  // namespace boardlink::net
