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

#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <absl/status/status_matchers.h>
#include <absl/time/time.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "boardlink/concurrency/concurrency.h"
#include "boardlink/errors/errors.h"
#include "boardlink/net/in_memory_transport.h"
#include "boardlink/transfer/receiver.h"
#include "boardlink/transfer/sender.h"
#include "boardlink/transfer/wire.h"

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::absl_testing::IsOk())

namespace {

using ::boardlink::ErrorKind;
using ::boardlink::ReceivedTransfer;
using ::boardlink::TransferHeader;
using ::boardlink::TransferKind;
using ::boardlink::net::Bytes;
using ::boardlink::net::InMemoryTransport;
using ::testing::ElementsAre;
using ::testing::DoubleEq;

Bytes MakePayload(size_t size) {
  Bytes payload(size);
  for (size_t i = 0; i < size; ++i) {
    payload[i] = static_cast<boardlink::net::Byte>((i * 31 + 7) % 251);
  }
  return payload;
}

// Records the raw message sizes arriving at one end.
class FrameRecorder : public boardlink::net::TransportObserver {
 public:
  void OnMessage(const boardlink::net::InboundMessage& message) override {
    boardlink::MutexLock lock(&mu);
    if (const auto* bytes = std::get_if<Bytes>(&message)) {
      frame_sizes.push_back(bytes->size());
    } else if (const auto* text = std::get_if<std::string>(&message)) {
      texts.push_back(*text);
    }
  }

  bool WaitForTexts(size_t count, absl::Duration timeout = absl::Seconds(5)) {
    boardlink::MutexLock lock(&mu);
    auto done = [this, count]() { return texts.size() >= count; };
    return mu.AwaitWithTimeout(absl::Condition(&done), timeout);
  }

  boardlink::Mutex mu;
  std::vector<size_t> frame_sizes ABSL_GUARDED_BY(mu);
  std::vector<std::string> texts ABSL_GUARDED_BY(mu);
};

class RecordingTransferObserver : public boardlink::TransferObserver {
 public:
  void OnTransferStarted(const TransferHeader& header) override {
    boardlink::MutexLock lock(&mu);
    started.push_back(header);
  }
  void OnTransferProgress(const TransferHeader& header,
                          double fraction) override {
    boardlink::MutexLock lock(&mu);
    progress.push_back(fraction);
  }
  void OnTransferReceived(const ReceivedTransfer& transfer) override {
    boardlink::MutexLock lock(&mu);
    received.push_back(transfer);
  }
  void OnTransferFailed(const absl::Status& status) override {
    boardlink::MutexLock lock(&mu);
    failures.push_back(status);
  }
  void OnDocumentRequested() override {
    boardlink::MutexLock lock(&mu);
    ++document_requests;
  }

  // Waits until `count` transfers have either arrived or failed.
  bool WaitForOutcomes(size_t count,
                       absl::Duration timeout = absl::Seconds(10)) {
    boardlink::MutexLock lock(&mu);
    auto done = [this, count]() {
      return received.size() + failures.size() >= count;
    };
    return mu.AwaitWithTimeout(absl::Condition(&done), timeout);
  }

  bool WaitForDocumentRequest(absl::Duration timeout = absl::Seconds(5)) {
    boardlink::MutexLock lock(&mu);
    auto done = [this]() { return document_requests > 0; };
    return mu.AwaitWithTimeout(absl::Condition(&done), timeout);
  }

  boardlink::Mutex mu;
  std::vector<TransferHeader> started ABSL_GUARDED_BY(mu);
  std::vector<double> progress ABSL_GUARDED_BY(mu);
  std::vector<ReceivedTransfer> received ABSL_GUARDED_BY(mu);
  std::vector<absl::Status> failures ABSL_GUARDED_BY(mu);
  int document_requests ABSL_GUARDED_BY(mu) = 0;
};

class TransferTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto pair = InMemoryTransport::CreatePair("media");
    sending_end_ = pair.first;
    receiving_end_ = pair.second;
    receiver_.AddObserver(&observer_);
    receiver_.Attach(receiving_end_);
    sending_end_->Open();
  }

  void TearDown() override {
    receiver_.Detach();
    receiver_.RemoveObserver(&observer_);
  }

  std::shared_ptr<InMemoryTransport> sending_end_;
  std::shared_ptr<InMemoryTransport> receiving_end_;
  boardlink::TransferReceiver receiver_;
  RecordingTransferObserver observer_;
};

TEST_F(TransferTest, SplitsIntoChunkSizedFrames) {
  FrameRecorder recorder;
  receiving_end_->AddObserver(&recorder);
  boardlink::TransferSender sender(sending_end_);

  std::vector<double> progress;
  EXPECT_OK(sender.SendImage(MakePayload(200000), "photo.jpg",
                             [&progress](double fraction) {
                               progress.push_back(fraction);
                             }));
  ASSERT_TRUE(observer_.WaitForOutcomes(1));
  ASSERT_TRUE(recorder.WaitForTexts(2));

  EXPECT_THAT(progress,
              ElementsAre(DoubleEq(0.25), DoubleEq(0.5), DoubleEq(0.75),
                          DoubleEq(1.0)));
  {
    boardlink::MutexLock lock(&recorder.mu);
    EXPECT_THAT(recorder.frame_sizes,
                ElementsAre(65536u, 65536u, 65536u, 3392u));
    ASSERT_EQ(recorder.texts.size(), 2u);
    EXPECT_EQ(recorder.texts[1], R"({"complete":true})");
  }

  boardlink::MutexLock lock(&observer_.mu);
  ASSERT_EQ(observer_.started.size(), 1u);
  EXPECT_EQ(observer_.started[0].total_size, 200000u);
  EXPECT_EQ(observer_.started[0].total_chunks, 4u);
  EXPECT_EQ(observer_.progress.size(), 4u);
  EXPECT_DOUBLE_EQ(observer_.progress.back(), 1.0);
  receiving_end_->RemoveObserver(&recorder);
}

TEST_F(TransferTest, PayloadArrivesByteIdentical) {
  boardlink::TransferSender sender(sending_end_);
  const Bytes payload = MakePayload(3 * boardlink::kChunkSize + 17);

  EXPECT_OK(sender.SendFile(TransferKind::kPdf, "notes.pdf", payload));
  ASSERT_TRUE(observer_.WaitForOutcomes(1));

  boardlink::MutexLock lock(&observer_.mu);
  ASSERT_EQ(observer_.received.size(), 1u);
  EXPECT_TRUE(observer_.failures.empty());
  EXPECT_EQ(observer_.received[0].kind, TransferKind::kPdf);
  EXPECT_EQ(observer_.received[0].filename, "notes.pdf");
  EXPECT_EQ(observer_.received[0].payload, payload);
}

TEST_F(TransferTest, EmptyPayload) {
  boardlink::TransferSender sender(sending_end_);

  EXPECT_OK(sender.SendAudio({}));
  ASSERT_TRUE(observer_.WaitForOutcomes(1));

  boardlink::MutexLock lock(&observer_.mu);
  ASSERT_EQ(observer_.received.size(), 1u);
  EXPECT_EQ(observer_.received[0].kind, TransferKind::kAudio);
  EXPECT_EQ(observer_.received[0].filename, "recording.webm");
  EXPECT_TRUE(observer_.received[0].payload.empty());
}

TEST_F(TransferTest, BufferedAmountStaysBounded) {
  boardlink::TransferOptions options;
  options.poll_interval = absl::Milliseconds(1);
  boardlink::TransferSender sender(sending_end_, options);

  // Hold delivery back so that the sender has to wait for the buffer to
  // drain.
  sending_end_->SetDeliveryPaused(true);
  std::thread resume([this]() {
    boardlink::SleepFor(absl::Milliseconds(50));
    sending_end_->SetDeliveryPaused(false);
  });

  const Bytes payload = MakePayload(20 * boardlink::kChunkSize);
  EXPECT_OK(sender.SendImage(payload));
  resume.join();
  ASSERT_TRUE(observer_.WaitForOutcomes(1));

  EXPECT_LE(sending_end_->GetMaxBufferedAmount(),
            options.max_buffered_amount);
  EXPECT_GE(sending_end_->GetMaxBufferedAmount(), 2 * boardlink::kChunkSize);

  boardlink::MutexLock lock(&observer_.mu);
  ASSERT_EQ(observer_.received.size(), 1u);
  EXPECT_EQ(observer_.received[0].payload, payload);
}

TEST_F(TransferTest, SendingOnClosedChannelFails) {
  boardlink::TransferSender sender(sending_end_);
  sending_end_->Close();

  const absl::Status status = sender.SendImage(MakePayload(10));
  EXPECT_TRUE(boardlink::IsErrorKind(status, ErrorKind::kTransportNotOpen))
      << status;
  EXPECT_TRUE(boardlink::IsErrorKind(sender.RequestDocument(),
                                     ErrorKind::kTransportNotOpen));
}

TEST_F(TransferTest, OneTransferAtATime) {
  boardlink::TransferSender sender(sending_end_);
  sending_end_->SetDeliveryPaused(true);

  const Bytes payload = MakePayload(10 * boardlink::kChunkSize);
  absl::Status first_status;
  std::thread first([&]() { first_status = sender.SendImage(payload); });

  while (!sender.IsSending()) {
    boardlink::SleepFor(absl::Milliseconds(1));
  }
  const absl::Status second_status = sender.SendImage(MakePayload(10));
  EXPECT_TRUE(
      boardlink::IsErrorKind(second_status, ErrorKind::kTransferInProgress))
      << second_status;

  sending_end_->SetDeliveryPaused(false);
  first.join();
  EXPECT_OK(first_status);
  EXPECT_FALSE(sender.IsSending());
}

TEST_F(TransferTest, NewHeaderAbortsPendingTransfer) {
  EXPECT_OK(sending_end_->SendText(boardlink::SerializeControlMessage(
      boardlink::MakeTransferHeader(TransferKind::kImage, "first.jpg",
                                    100000))));
  EXPECT_OK(sending_end_->SendBinary(MakePayload(boardlink::kChunkSize)));

  boardlink::TransferSender sender(sending_end_);
  const Bytes payload = MakePayload(1000);
  EXPECT_OK(sender.SendImage(payload, "second.jpg"));
  ASSERT_TRUE(observer_.WaitForOutcomes(2));

  boardlink::MutexLock lock(&observer_.mu);
  ASSERT_EQ(observer_.failures.size(), 1u);
  EXPECT_TRUE(boardlink::IsErrorKind(observer_.failures[0],
                                     ErrorKind::kTransferAborted));
  ASSERT_EQ(observer_.received.size(), 1u);
  EXPECT_EQ(observer_.received[0].filename, "second.jpg");
  EXPECT_EQ(observer_.received[0].payload, payload);
}

TEST_F(TransferTest, OversizedFrameFailsIntegrity) {
  EXPECT_OK(sending_end_->SendText(boardlink::SerializeControlMessage(
      boardlink::MakeTransferHeader(TransferKind::kImage, "photo.jpg", 10))));
  EXPECT_OK(sending_end_->SendBinary(MakePayload(11)));
  // Trailing data of the broken transfer is dropped without further errors.
  EXPECT_OK(sending_end_->SendBinary(MakePayload(5)));
  EXPECT_OK(sending_end_->SendText(
      boardlink::SerializeControlMessage(boardlink::TransferComplete{})));

  boardlink::TransferSender sender(sending_end_);
  EXPECT_OK(sender.SendImage(MakePayload(10), "next.jpg"));
  ASSERT_TRUE(observer_.WaitForOutcomes(2));

  boardlink::MutexLock lock(&observer_.mu);
  ASSERT_EQ(observer_.failures.size(), 1u);
  EXPECT_TRUE(boardlink::IsErrorKind(observer_.failures[0],
                                     ErrorKind::kDataIntegrity));
  ASSERT_EQ(observer_.received.size(), 1u);
  EXPECT_EQ(observer_.received[0].filename, "next.jpg");
}

TEST_F(TransferTest, ShortTransferFailsIntegrity) {
  EXPECT_OK(sending_end_->SendText(boardlink::SerializeControlMessage(
      boardlink::MakeTransferHeader(TransferKind::kAudio, "a.webm", 100))));
  EXPECT_OK(sending_end_->SendBinary(MakePayload(60)));
  EXPECT_OK(sending_end_->SendText(
      boardlink::SerializeControlMessage(boardlink::TransferComplete{})));
  ASSERT_TRUE(observer_.WaitForOutcomes(1));

  boardlink::MutexLock lock(&observer_.mu);
  ASSERT_EQ(observer_.failures.size(), 1u);
  EXPECT_TRUE(boardlink::IsErrorKind(observer_.failures[0],
                                     ErrorKind::kDataIntegrity));
  EXPECT_TRUE(observer_.received.empty());
}

TEST_F(TransferTest, ImplausibleChunkCountFailsIntegrity) {
  EXPECT_OK(sending_end_->SendText(
      R"({"header": {"type": "image", "filename": "x.jpg",
                     "totalSize": 1, "totalChunks": 1e15}})"));
  EXPECT_OK(sending_end_->SendBinary(MakePayload(1)));
  EXPECT_OK(sending_end_->SendText(
      boardlink::SerializeControlMessage(boardlink::TransferComplete{})));

  boardlink::TransferSender sender(sending_end_);
  EXPECT_OK(sender.SendImage(MakePayload(10), "next.jpg"));
  ASSERT_TRUE(observer_.WaitForOutcomes(2));

  boardlink::MutexLock lock(&observer_.mu);
  ASSERT_EQ(observer_.failures.size(), 1u);
  EXPECT_TRUE(boardlink::IsErrorKind(observer_.failures[0],
                                     ErrorKind::kDataIntegrity));
  ASSERT_EQ(observer_.started.size(), 1u);
  EXPECT_EQ(observer_.started[0].filename, "next.jpg");
  ASSERT_EQ(observer_.received.size(), 1u);
  EXPECT_EQ(observer_.received[0].filename, "next.jpg");
}

TEST_F(TransferTest, HeaderWithTooFewChunksFailsIntegrity) {
  EXPECT_OK(sending_end_->SendText(boardlink::SerializeControlMessage(
      TransferHeader{.kind = TransferKind::kImage,
                     .filename = "big.jpg",
                     .total_size = 200000,
                     .total_chunks = 1})));
  EXPECT_OK(sending_end_->SendBinary(MakePayload(200000)));
  EXPECT_OK(sending_end_->SendText(
      boardlink::SerializeControlMessage(boardlink::TransferComplete{})));

  boardlink::TransferSender sender(sending_end_);
  EXPECT_OK(sender.SendImage(MakePayload(10), "next.jpg"));
  ASSERT_TRUE(observer_.WaitForOutcomes(2));

  boardlink::MutexLock lock(&observer_.mu);
  ASSERT_EQ(observer_.failures.size(), 1u);
  EXPECT_TRUE(boardlink::IsErrorKind(observer_.failures[0],
                                     ErrorKind::kDataIntegrity));
  ASSERT_EQ(observer_.received.size(), 1u);
  EXPECT_EQ(observer_.received[0].filename, "next.jpg");
}

TEST_F(TransferTest, FrameLargerThanChunkSizeFailsIntegrity) {
  EXPECT_OK(sending_end_->SendText(boardlink::SerializeControlMessage(
      boardlink::MakeTransferHeader(TransferKind::kImage, "big.jpg",
                                    200000))));
  EXPECT_OK(sending_end_->SendBinary(MakePayload(boardlink::kChunkSize + 1)));
  ASSERT_TRUE(observer_.WaitForOutcomes(1));

  boardlink::MutexLock lock(&observer_.mu);
  ASSERT_EQ(observer_.failures.size(), 1u);
  EXPECT_TRUE(boardlink::IsErrorKind(observer_.failures[0],
                                     ErrorKind::kDataIntegrity));
  EXPECT_TRUE(observer_.progress.empty());
  EXPECT_TRUE(observer_.received.empty());
}

TEST_F(TransferTest, MalformedControlMessagesAreIgnored) {
  EXPECT_OK(sending_end_->SendText("{not json"));
  EXPECT_OK(sending_end_->SendText(R"({"type": "hello"})"));

  boardlink::TransferSender sender(sending_end_);
  EXPECT_OK(sender.SendImage(MakePayload(5)));
  ASSERT_TRUE(observer_.WaitForOutcomes(1));

  boardlink::MutexLock lock(&observer_.mu);
  EXPECT_TRUE(observer_.failures.empty());
  EXPECT_EQ(observer_.received.size(), 1u);
}

TEST_F(TransferTest, ClosingMidTransferAborts) {
  EXPECT_OK(sending_end_->SendText(boardlink::SerializeControlMessage(
      boardlink::MakeTransferHeader(TransferKind::kImage, "photo.jpg",
                                    200000))));
  EXPECT_OK(sending_end_->SendBinary(MakePayload(boardlink::kChunkSize)));
  sending_end_->Close();
  ASSERT_TRUE(observer_.WaitForOutcomes(1));

  boardlink::MutexLock lock(&observer_.mu);
  ASSERT_EQ(observer_.failures.size(), 1u);
  EXPECT_TRUE(boardlink::IsErrorKind(observer_.failures[0],
                                     ErrorKind::kTransferAborted));
  EXPECT_TRUE(observer_.received.empty());
}

TEST_F(TransferTest, DocumentRequest) {
  boardlink::TransferSender sender(sending_end_);
  EXPECT_OK(sender.RequestDocument());
  EXPECT_TRUE(observer_.WaitForDocumentRequest());
  EXPECT_FALSE(receiver_.HasPendingTransfer());
}

TEST(DeferredTransferTest, DeferredFramesAreMaterialized) {
  auto [sending_end, receiving_end] = InMemoryTransport::CreatePair(
      "media", {.deliver_deferred_binary = true});
  boardlink::TransferReceiver receiver;
  RecordingTransferObserver observer;
  receiver.AddObserver(&observer);
  receiver.Attach(receiving_end);
  sending_end->Open();

  boardlink::TransferSender sender(sending_end);
  const Bytes payload = MakePayload(boardlink::kChunkSize + 1);
  EXPECT_OK(sender.SendImage(payload));
  ASSERT_TRUE(observer.WaitForOutcomes(1));
  {
    boardlink::MutexLock lock(&observer.mu);
    ASSERT_EQ(observer.received.size(), 1u);
    EXPECT_EQ(observer.received[0].payload, payload);
  }

  receiver.Detach();
  receiver.RemoveObserver(&observer);
}

}  // namespace
