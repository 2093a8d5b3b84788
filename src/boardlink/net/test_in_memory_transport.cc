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

#include <string>
#include <variant>
#include <vector>

#include <absl/status/status_matchers.h>
#include <absl/time/time.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "boardlink/concurrency/concurrency.h"
#include "boardlink/errors/errors.h"
#include "boardlink/net/in_memory_transport.h"

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::absl_testing::IsOk())

namespace {

using ::boardlink::net::Bytes;
using ::boardlink::net::InMemoryTransport;
using ::boardlink::net::InboundMessage;

class RecordingObserver : public boardlink::net::TransportObserver {
 public:
  void OnOpen() override { opened.Notify(); }
  void OnClosed() override { closed.Notify(); }
  void OnError(const absl::Status& status) override {
    boardlink::MutexLock lock(&mu);
    errors.push_back(status);
  }
  void OnMessage(const InboundMessage& message) override {
    boardlink::MutexLock lock(&mu);
    if (const auto* text = std::get_if<std::string>(&message)) {
      texts.push_back(*text);
    } else if (const auto* bytes = std::get_if<Bytes>(&message)) {
      frames.push_back(*bytes);
    } else {
      const auto& deferred = std::get<boardlink::net::DeferredBinary>(message);
      absl::StatusOr<Bytes> materialized = deferred.materialize();
      if (materialized.ok()) {
        frames.push_back(*materialized);
        ++deferred_frames;
      }
    }
  }
  void OnBufferedAmountLow() override {
    boardlink::MutexLock lock(&mu);
    ++low_signals;
  }

  bool WaitForMessages(size_t count,
                       absl::Duration timeout = absl::Seconds(5)) {
    boardlink::MutexLock lock(&mu);
    auto enough = [this, count]() {
      return texts.size() + frames.size() >= count;
    };
    return mu.AwaitWithTimeout(absl::Condition(&enough), timeout);
  }

  boardlink::Notification opened;
  boardlink::Notification closed;

  boardlink::Mutex mu;
  std::vector<std::string> texts ABSL_GUARDED_BY(mu);
  std::vector<Bytes> frames ABSL_GUARDED_BY(mu);
  std::vector<absl::Status> errors ABSL_GUARDED_BY(mu);
  int deferred_frames ABSL_GUARDED_BY(mu) = 0;
  int low_signals ABSL_GUARDED_BY(mu) = 0;
};

TEST(InMemoryTransportTest, HeldEndKeepsMessagesUntilDeliveryStarts) {
  auto [a, b] = InMemoryTransport::CreatePair("media",
                                              {.hold_second_end = true});
  b->Open();
  EXPECT_OK(a->SendText("header"));
  EXPECT_OK(a->SendBinary(Bytes{7, 7}));
  while (a->GetBufferedAmount() > 0) {
    boardlink::SleepFor(absl::Milliseconds(1));
  }

  // Attached only after the messages reached the receiving end.
  RecordingObserver b_observer;
  b->AddObserver(&b_observer);
  {
    boardlink::MutexLock lock(&b_observer.mu);
    EXPECT_TRUE(b_observer.texts.empty());
    EXPECT_TRUE(b_observer.frames.empty());
  }

  b->StartDelivery();
  EXPECT_OK(a->SendText("complete"));
  ASSERT_TRUE(b_observer.WaitForMessages(3));
  {
    boardlink::MutexLock lock(&b_observer.mu);
    EXPECT_THAT(b_observer.texts,
                ::testing::ElementsAre("header", "complete"));
    EXPECT_THAT(b_observer.frames, ::testing::ElementsAre(Bytes{7, 7}));
  }

  // Starting again changes nothing.
  b->StartDelivery();
  b->RemoveObserver(&b_observer);
}

TEST(InMemoryTransportTest, SendBeforeOpenFails) {
  auto [a, b] = InMemoryTransport::CreatePair("media");
  EXPECT_FALSE(a->IsOpen());
  EXPECT_EQ(a->GetLabel(), "media");
  EXPECT_TRUE(boardlink::IsErrorKind(a->SendText("hello"),
                                     boardlink::ErrorKind::kTransportNotOpen));
}

TEST(InMemoryTransportTest, DeliversInOrder) {
  auto [a, b] = InMemoryTransport::CreatePair("media");
  RecordingObserver a_observer;
  RecordingObserver b_observer;
  a->AddObserver(&a_observer);
  b->AddObserver(&b_observer);

  b->Open();
  EXPECT_TRUE(a_observer.opened.HasBeenNotified());
  EXPECT_TRUE(b_observer.opened.HasBeenNotified());
  EXPECT_TRUE(a->IsOpen());

  EXPECT_OK(a->SendText("first"));
  const Bytes frame = {1, 2, 3};
  EXPECT_OK(a->SendBinary(frame));
  EXPECT_OK(a->SendText("last"));

  ASSERT_TRUE(b_observer.WaitForMessages(3));
  {
    boardlink::MutexLock lock(&b_observer.mu);
    EXPECT_THAT(b_observer.texts, ::testing::ElementsAre("first", "last"));
    EXPECT_THAT(b_observer.frames, ::testing::ElementsAre(frame));
  }
  {
    boardlink::MutexLock lock(&a_observer.mu);
    EXPECT_TRUE(a_observer.texts.empty());
  }

  a->RemoveObserver(&a_observer);
  b->RemoveObserver(&b_observer);
}

TEST(InMemoryTransportTest, PausedDeliveryKeepsMessagesBuffered) {
  auto [a, b] = InMemoryTransport::CreatePair("media");
  RecordingObserver a_observer;
  RecordingObserver b_observer;
  a->AddObserver(&a_observer);
  b->AddObserver(&b_observer);
  a->Open();

  a->SetBufferedAmountLowThreshold(0);
  a->SetDeliveryPaused(true);
  EXPECT_OK(a->SendBinary(Bytes(100, 7)));
  EXPECT_OK(a->SendBinary(Bytes(50, 7)));
  EXPECT_EQ(a->GetBufferedAmount(), 150u);
  EXPECT_EQ(b->GetBufferedAmount(), 0u);

  a->SetDeliveryPaused(false);
  ASSERT_TRUE(b_observer.WaitForMessages(2));
  a->Close();
  ASSERT_TRUE(a_observer.closed.WaitForNotificationWithTimeout(
      absl::Seconds(5)));

  EXPECT_EQ(a->GetBufferedAmount(), 0u);
  EXPECT_EQ(a->GetMaxBufferedAmount(), 150u);
  {
    boardlink::MutexLock lock(&a_observer.mu);
    EXPECT_EQ(a_observer.low_signals, 1);
  }

  a->RemoveObserver(&a_observer);
  b->RemoveObserver(&b_observer);
}

TEST(InMemoryTransportTest, CloseFlushesQueuedMessages) {
  auto [a, b] = InMemoryTransport::CreatePair("media");
  RecordingObserver b_observer;
  b->AddObserver(&b_observer);
  a->Open();

  a->SetDeliveryPaused(true);
  EXPECT_OK(a->SendText("queued"));
  a->Close();
  EXPECT_FALSE(a->IsOpen());
  EXPECT_FALSE(a->SendText("late").ok());

  ASSERT_TRUE(b_observer.closed.WaitForNotificationWithTimeout(
      absl::Seconds(5)));
  {
    boardlink::MutexLock lock(&b_observer.mu);
    EXPECT_THAT(b_observer.texts, ::testing::ElementsAre("queued"));
  }

  b->RemoveObserver(&b_observer);
}

TEST(InMemoryTransportTest, DeferredBinary) {
  auto [a, b] = InMemoryTransport::CreatePair(
      "media", {.deliver_deferred_binary = true});
  RecordingObserver b_observer;
  b->AddObserver(&b_observer);
  a->Open();

  EXPECT_OK(a->SendBinary(Bytes{9, 8, 7}));
  ASSERT_TRUE(b_observer.WaitForMessages(1));
  {
    boardlink::MutexLock lock(&b_observer.mu);
    EXPECT_EQ(b_observer.deferred_frames, 1);
    EXPECT_THAT(b_observer.frames, ::testing::ElementsAre(Bytes{9, 8, 7}));
  }

  b->RemoveObserver(&b_observer);
}

TEST(InMemoryTransportTest, InjectedErrorsReachOneEnd) {
  auto [a, b] = InMemoryTransport::CreatePair("media");
  RecordingObserver a_observer;
  RecordingObserver b_observer;
  a->AddObserver(&a_observer);
  b->AddObserver(&b_observer);

  a->InjectError(absl::UnavailableError("ICE failed"));
  {
    boardlink::MutexLock lock(&a_observer.mu);
    ASSERT_EQ(a_observer.errors.size(), 1u);
    EXPECT_EQ(a_observer.errors[0].message(), "ICE failed");
  }
  {
    boardlink::MutexLock lock(&b_observer.mu);
    EXPECT_TRUE(b_observer.errors.empty());
  }

  a->RemoveObserver(&a_observer);
  b->RemoveObserver(&b_observer);
}

TEST(InMemoryTransportTest, DestroyingOneEndClosesTheOther) {
  auto [a, b] = InMemoryTransport::CreatePair("media");
  RecordingObserver b_observer;
  b->AddObserver(&b_observer);
  a->Open();

  a.reset();
  EXPECT_TRUE(b_observer.closed.WaitForNotificationWithTimeout(
      absl::Seconds(5)));
  EXPECT_FALSE(b->IsOpen());

  b->RemoveObserver(&b_observer);
}

}  // namespace
