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

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status_matchers.h>
#include <absl/time/time.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "boardlink/concurrency/concurrency.h"
#include "boardlink/errors/errors.h"
#include "boardlink/session/session.h"
#include "boardlink/signaling/in_memory_relay_store.h"
#include "boardlink/testing/fake_peer_connection.h"

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::absl_testing::IsOk())

namespace {

using ::absl_testing::IsOkAndHolds;
using ::boardlink::BoardLinkSession;
using ::boardlink::ConnectionState;
using ::boardlink::ErrorKind;
using ::boardlink::FailureCategory;
using ::boardlink::InMemoryRelayStore;
using ::boardlink::PeerRole;
using ::boardlink::ReceivedTransfer;
using ::boardlink::SessionOptions;
using ::boardlink::TransferKind;
using ::boardlink::net::Bytes;
using ::boardlink::testing::FakeNetwork;
using ::boardlink::testing::FakePeerConnection;
using ::boardlink::testing::MakeFakePeerConnectionFactory;

class RecordingSessionObserver : public boardlink::SessionObserver {
 public:
  void OnError(const absl::Status& status) override {
    boardlink::MutexLock lock(&mu);
    errors.push_back(status);
  }
  void OnRemoteStatus(std::string_view status) override {
    boardlink::MutexLock lock(&mu);
    remote_statuses.emplace_back(status);
  }
  void OnTransferReceived(const ReceivedTransfer& transfer) override {
    boardlink::MutexLock lock(&mu);
    received.push_back(transfer);
  }
  void OnDocumentRequested() override {
    boardlink::MutexLock lock(&mu);
    ++document_requests;
  }

  bool WaitForTransfers(size_t count,
                        absl::Duration timeout = absl::Seconds(10)) {
    boardlink::MutexLock lock(&mu);
    auto done = [this, count]() { return received.size() >= count; };
    return mu.AwaitWithTimeout(absl::Condition(&done), timeout);
  }

  bool WaitForRemoteStatus(std::string_view status,
                           absl::Duration timeout = absl::Seconds(10)) {
    boardlink::MutexLock lock(&mu);
    auto done = [this, status]() {
      return !remote_statuses.empty() && remote_statuses.back() == status;
    };
    return mu.AwaitWithTimeout(absl::Condition(&done), timeout);
  }

  bool WaitForErrors(size_t count, absl::Duration timeout = absl::Seconds(10)) {
    boardlink::MutexLock lock(&mu);
    auto done = [this, count]() { return errors.size() >= count; };
    return mu.AwaitWithTimeout(absl::Condition(&done), timeout);
  }

  bool WaitForDocumentRequest(absl::Duration timeout = absl::Seconds(10)) {
    boardlink::MutexLock lock(&mu);
    auto done = [this]() { return document_requests > 0; };
    return mu.AwaitWithTimeout(absl::Condition(&done), timeout);
  }

  boardlink::Mutex mu;
  std::vector<absl::Status> errors ABSL_GUARDED_BY(mu);
  std::vector<std::string> remote_statuses ABSL_GUARDED_BY(mu);
  std::vector<ReceivedTransfer> received ABSL_GUARDED_BY(mu);
  int document_requests ABSL_GUARDED_BY(mu) = 0;
};

Bytes MakePayload(size_t size) {
  Bytes payload(size);
  for (size_t i = 0; i < size; ++i) {
    payload[i] = static_cast<boardlink::net::Byte>(i % 253);
  }
  return payload;
}

class SessionTest : public ::testing::Test {
 protected:
  std::unique_ptr<BoardLinkSession> MakeSession(
      PeerRole role, absl::Duration timeout = absl::Seconds(30),
      FakePeerConnection** connection = nullptr) {
    SessionOptions options;
    options.session_id = "4711";
    options.role = role;
    options.negotiation_timeout = timeout;
    return BoardLinkSession::OverRelay(
        store_, MakeFakePeerConnectionFactory(network_, role, connection),
        std::move(options));
  }

  std::shared_ptr<InMemoryRelayStore> store_ =
      std::make_shared<InMemoryRelayStore>();
  std::shared_ptr<FakeNetwork> network_ = std::make_shared<FakeNetwork>();
  RecordingSessionObserver board_observer_;
  RecordingSessionObserver handheld_observer_;
};

TEST_F(SessionTest, MissingBoardIsReported) {
  std::unique_ptr<BoardLinkSession> handheld =
      MakeSession(PeerRole::kInitiator);
  handheld->AddObserver(&handheld_observer_);

  const absl::Status status = handheld->Open();
  EXPECT_TRUE(boardlink::IsErrorKind(status, ErrorKind::kSessionNotFound))
      << status;
  EXPECT_EQ(boardlink::GetFailureCategory(status),
            FailureCategory::kSessionNotFound);
  EXPECT_EQ(handheld->state(), ConnectionState::kNew);

  {
    boardlink::MutexLock lock(&handheld_observer_.mu);
    ASSERT_EQ(handheld_observer_.errors.size(), 1u);
    EXPECT_EQ(handheld_observer_.errors[0], status);
  }
  handheld->RemoveObserver(&handheld_observer_);
}

TEST_F(SessionTest, UnreachableRelayIsReported) {
  std::unique_ptr<BoardLinkSession> board = MakeSession(PeerRole::kResponder);
  store_->SetWritesFail(true);

  const absl::Status status = board->Open();
  EXPECT_EQ(boardlink::GetFailureCategory(status),
            FailureCategory::kRelayUnreachable)
      << status;
}

TEST_F(SessionTest, WaitUntilConnectedReturnsTheOpenFailure) {
  std::unique_ptr<BoardLinkSession> handheld =
      MakeSession(PeerRole::kInitiator);
  EXPECT_FALSE(handheld->Open().ok());

  const absl::Status status = handheld->WaitUntilConnected(absl::Seconds(10));
  EXPECT_TRUE(boardlink::IsErrorKind(status, ErrorKind::kSessionNotFound))
      << status;
}

TEST_F(SessionTest, SendingBeforeConnectingFails) {
  std::unique_ptr<BoardLinkSession> board = MakeSession(PeerRole::kResponder);
  EXPECT_OK(board->Open());

  EXPECT_TRUE(boardlink::IsErrorKind(board->SendImage(MakePayload(10)),
                                     ErrorKind::kTransportNotOpen));
  EXPECT_TRUE(boardlink::IsErrorKind(board->RequestDocument(),
                                     ErrorKind::kTransportNotOpen));
}

TEST_F(SessionTest, HandheldSendsPhotoAndPullsDocument) {
  std::unique_ptr<BoardLinkSession> board = MakeSession(PeerRole::kResponder);
  std::unique_ptr<BoardLinkSession> handheld =
      MakeSession(PeerRole::kInitiator);
  board->AddObserver(&board_observer_);
  handheld->AddObserver(&handheld_observer_);

  EXPECT_OK(board->Open());
  EXPECT_THAT(store_->Get("session/4711/status"),
              IsOkAndHolds(std::optional<std::string>("waiting")));
  EXPECT_OK(handheld->Open());

  EXPECT_OK(handheld->WaitUntilConnected(absl::Seconds(10)));
  EXPECT_OK(board->WaitUntilConnected(absl::Seconds(10)));
  ASSERT_TRUE(handheld_observer_.WaitForRemoteStatus("connected"));
  EXPECT_THAT(store_->Get("session/4711/status"),
              IsOkAndHolds(std::optional<std::string>("connected")));

  const Bytes photo = MakePayload(200000);
  std::vector<double> progress;
  EXPECT_OK(handheld->SendImage(photo, "photo.jpg",
                                [&progress](double fraction) {
                                  progress.push_back(fraction);
                                }));
  EXPECT_EQ(progress.size(), 4u);
  ASSERT_TRUE(board_observer_.WaitForTransfers(1));
  {
    boardlink::MutexLock lock(&board_observer_.mu);
    EXPECT_EQ(board_observer_.received[0].kind, TransferKind::kImage);
    EXPECT_EQ(board_observer_.received[0].payload, photo);
  }

  EXPECT_OK(handheld->RequestDocument());
  ASSERT_TRUE(board_observer_.WaitForDocumentRequest());
  const Bytes document = MakePayload(100000);
  EXPECT_OK(board->SendFile(TransferKind::kPdf, "board.pdf", document));
  ASSERT_TRUE(handheld_observer_.WaitForTransfers(1));
  {
    boardlink::MutexLock lock(&handheld_observer_.mu);
    EXPECT_EQ(handheld_observer_.received[0].kind, TransferKind::kPdf);
    EXPECT_EQ(handheld_observer_.received[0].filename, "board.pdf");
    EXPECT_EQ(handheld_observer_.received[0].payload, document);
    EXPECT_TRUE(handheld_observer_.errors.empty());
  }

  EXPECT_OK(handheld->Disconnect());
  EXPECT_EQ(handheld->state(), ConnectionState::kDisconnected);
  EXPECT_THAT(store_->Exists("session/4711/initiator"), IsOkAndHolds(false));

  handheld->RemoveObserver(&handheld_observer_);
  board->RemoveObserver(&board_observer_);
}

TEST_F(SessionTest, BlockedNetworkTimesOut) {
  network_->SetBlocked(true);
  std::unique_ptr<BoardLinkSession> board = MakeSession(PeerRole::kResponder);
  std::unique_ptr<BoardLinkSession> handheld =
      MakeSession(PeerRole::kInitiator, absl::Milliseconds(200));

  EXPECT_OK(board->Open());
  EXPECT_OK(handheld->Open());

  const absl::Status status = handheld->WaitUntilConnected(absl::Seconds(10));
  EXPECT_TRUE(boardlink::IsErrorKind(status, ErrorKind::kNegotiationTimeout))
      << status;
  EXPECT_EQ(handheld->state(), ConnectionState::kFailed);
}

TEST_F(SessionTest, LaterRelayErrorDoesNotMaskTheTimeout) {
  network_->SetBlocked(true);
  std::unique_ptr<BoardLinkSession> board = MakeSession(PeerRole::kResponder);
  FakePeerConnection* connection = nullptr;
  std::unique_ptr<BoardLinkSession> handheld = MakeSession(
      PeerRole::kInitiator, absl::Milliseconds(100), &connection);
  handheld->AddObserver(&handheld_observer_);

  EXPECT_OK(board->Open());
  EXPECT_OK(handheld->Open());
  ASSERT_NE(connection, nullptr);
  EXPECT_TRUE(
      boardlink::IsErrorKind(handheld->WaitUntilConnected(absl::Seconds(10)),
                             ErrorKind::kNegotiationTimeout));
  ASSERT_TRUE(handheld_observer_.WaitForErrors(1));

  // A candidate trickled after the failure cannot be published.
  store_->SetWritesFail(true);
  connection->EmitLocalCandidate(boardlink::IceCandidate{
      .candidate = "candidate:9 1 udp 1 10.0.0.9 50009 typ host",
      .mid = "0",
      .mline_index = 0});
  store_->SetWritesFail(false);
  {
    boardlink::MutexLock lock(&handheld_observer_.mu);
    ASSERT_EQ(handheld_observer_.errors.size(), 2u);
    EXPECT_TRUE(boardlink::IsErrorKind(handheld_observer_.errors[1],
                                       ErrorKind::kRelayWrite));
  }

  const absl::Status status = handheld->WaitUntilConnected(absl::Seconds(1));
  EXPECT_TRUE(boardlink::IsErrorKind(status, ErrorKind::kNegotiationTimeout))
      << status;
  EXPECT_EQ(boardlink::GetFailureCategory(status),
            FailureCategory::kNegotiationFailed);

  EXPECT_OK(handheld->Disconnect());
  EXPECT_TRUE(boardlink::IsErrorKind(
      handheld->WaitUntilConnected(absl::Seconds(1)),
      ErrorKind::kNegotiationTimeout));
  handheld->RemoveObserver(&handheld_observer_);
}

TEST_F(SessionTest, WaitUntilConnectedHonoursItsTimeout) {
  std::unique_ptr<BoardLinkSession> board = MakeSession(PeerRole::kResponder);
  EXPECT_OK(board->Open());

  EXPECT_THAT(board->WaitUntilConnected(absl::Milliseconds(50)),
              ::absl_testing::StatusIs(absl::StatusCode::kDeadlineExceeded));
}

}  // namespace
