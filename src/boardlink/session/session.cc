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

#include "boardlink/session/session.h"

#include <algorithm>
#include <utility>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>

#include "boardlink/errors/errors.h"
#include "boardlink/signaling/relay_signaling_channel.h"

namespace boardlink {

BoardLinkSession::BoardLinkSession(
    std::shared_ptr<SignalingChannel> signaling,
    net::PeerConnectionFactory peer_connection_factory, SessionOptions options)
    : signaling_(std::move(signaling)), options_(std::move(options)) {
  CHECK(signaling_ != nullptr) << "BoardLinkSession needs a signaling channel.";
  negotiator_ = std::make_unique<ConnectionNegotiator>(
      signaling_, std::move(peer_connection_factory),
      NegotiatorOptions{.role = options_.role,
                        .timeout = options_.negotiation_timeout,
                        .label = options_.channel_label});
  negotiator_->AddObserver(this);
  receiver_.AddObserver(this);
  signaling_->OnError([this](const absl::Status& status) { OnError(status); });
}

std::unique_ptr<BoardLinkSession> BoardLinkSession::OverRelay(
    std::shared_ptr<RelayStore> store,
    net::PeerConnectionFactory peer_connection_factory,
    SessionOptions options) {
  auto signaling = std::make_shared<RelaySignalingChannel>(
      std::move(store), options.session_id, options.role);
  return std::make_unique<BoardLinkSession>(std::move(signaling),
                                            std::move(peer_connection_factory),
                                            std::move(options));
}

BoardLinkSession::~BoardLinkSession() {
  negotiator_->Disconnect().IgnoreError();
  receiver_.Detach();
  {
    MutexLock lock(&mu_);
    sender_.reset();
  }
  negotiator_.reset();
}

absl::Status BoardLinkSession::Open() {
  if (options_.role == PeerRole::kInitiator) {
    absl::StatusOr<bool> exists = signaling_->SessionExists();
    if (!exists.ok()) {
      return FailOpen(exists.status());
    }
    if (!*exists) {
      return FailOpen(SessionNotFoundError(absl::StrCat(
          "No board is waiting in session ", options_.session_id, ".")));
    }
  } else {
    if (absl::Status status = signaling_->PublishStatus("waiting");
        !status.ok()) {
      return FailOpen(status);
    }
  }

  if (absl::Status status =
          signaling_->SubscribeStatus([this](std::string_view remote_status) {
            ForEachObserver([remote_status](SessionObserver* observer) {
              observer->OnRemoteStatus(remote_status);
            });
          });
      !status.ok()) {
    return FailOpen(status);
  }

  LOG(INFO) << "Opening session " << options_.session_id << " as "
            << PeerRoleName(options_.role) << ".";
  if (absl::Status status = negotiator_->Connect(); !status.ok()) {
    return FailOpen(status);
  }
  return absl::OkStatus();
}

absl::Status BoardLinkSession::FailOpen(absl::Status status) {
  {
    MutexLock lock(&mu_);
    open_error_ = status;
    cv_.SignalAll();
  }
  OnError(status);
  return status;
}

absl::Status BoardLinkSession::WaitUntilConnected(absl::Duration timeout) {
  const absl::Time deadline = absl::Now() + timeout;
  MutexLock lock(&mu_);
  while (true) {
    if (!open_error_.ok()) {
      return open_error_;
    }
    switch (negotiator_->state()) {
      case ConnectionState::kConnected:
        return absl::OkStatus();
      case ConnectionState::kFailed:
        // Recorded together with the state change.
        return negotiator_->failure();
      case ConnectionState::kDisconnected:
        if (absl::Status failure = negotiator_->failure(); !failure.ok()) {
          return failure;
        }
        return NegotiationFailedError(
            absl::StrCat("Session ", options_.session_id,
                         " ended before connecting."));
      case ConnectionState::kNew:
      case ConnectionState::kOfferSent:
      case ConnectionState::kNegotiating:
        break;
    }
    if (cv_.WaitWithDeadline(&mu_, deadline)) {
      return absl::DeadlineExceededError(
          absl::StrCat("Session ", options_.session_id,
                       " did not connect within ",
                       absl::FormatDuration(timeout), "."));
    }
  }
}

absl::Status BoardLinkSession::SendFile(TransferKind kind,
                                        std::string_view filename,
                                        absl::Span<const net::Byte> payload,
                                        ProgressCallback on_progress) {
  ASSIGN_OR_RETURN(TransferSender * sender, GetSender());
  return sender->SendFile(kind, filename, payload, std::move(on_progress));
}

absl::Status BoardLinkSession::SendImage(absl::Span<const net::Byte> payload,
                                         std::string_view filename,
                                         ProgressCallback on_progress) {
  return SendFile(TransferKind::kImage, filename, payload,
                  std::move(on_progress));
}

absl::Status BoardLinkSession::SendAudio(absl::Span<const net::Byte> payload,
                                         std::string_view filename,
                                         ProgressCallback on_progress) {
  return SendFile(TransferKind::kAudio, filename, payload,
                  std::move(on_progress));
}

absl::Status BoardLinkSession::RequestDocument() {
  ASSIGN_OR_RETURN(TransferSender * sender, GetSender());
  return sender->RequestDocument();
}

absl::Status BoardLinkSession::Disconnect() {
  return negotiator_->Disconnect();
}

ConnectionState BoardLinkSession::state() const {
  return negotiator_->state();
}

void BoardLinkSession::AddObserver(SessionObserver* observer) {
  MutexLock lock(&observers_mu_);
  observers_.push_back(observer);
}

void BoardLinkSession::RemoveObserver(SessionObserver* observer) {
  MutexLock lock(&observers_mu_);
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                   observers_.end());
}

void BoardLinkSession::OnTransportCreated(
    const std::shared_ptr<net::DataChannelTransport>& transport) {
  receiver_.Attach(transport);
  MutexLock lock(&mu_);
  sender_ = std::make_unique<TransferSender>(transport, options_.transfer);
}

void BoardLinkSession::OnStateChanged(ConnectionState state) {
  {
    MutexLock lock(&mu_);
    cv_.SignalAll();
  }
  ForEachObserver(
      [state](SessionObserver* observer) { observer->OnStateChanged(state); });
}

void BoardLinkSession::OnConnected() {
  {
    MutexLock lock(&mu_);
    cv_.SignalAll();
  }
  if (absl::Status status = signaling_->PublishStatus("connected");
      !status.ok()) {
    OnError(status);
  }
  ForEachObserver([](SessionObserver* observer) { observer->OnConnected(); });
}

void BoardLinkSession::OnError(const absl::Status& status) {
  ForEachObserver(
      [&status](SessionObserver* observer) { observer->OnError(status); });
}

void BoardLinkSession::OnTransferStarted(const TransferHeader& header) {
  ForEachObserver([&header](SessionObserver* observer) {
    observer->OnTransferStarted(header);
  });
}

void BoardLinkSession::OnTransferProgress(const TransferHeader& header,
                                          double fraction) {
  ForEachObserver([&header, fraction](SessionObserver* observer) {
    observer->OnTransferProgress(header, fraction);
  });
}

void BoardLinkSession::OnTransferReceived(const ReceivedTransfer& transfer) {
  ForEachObserver([&transfer](SessionObserver* observer) {
    observer->OnTransferReceived(transfer);
  });
}

void BoardLinkSession::OnTransferFailed(const absl::Status& status) {
  ForEachObserver([&status](SessionObserver* observer) {
    observer->OnTransferFailed(status);
  });
}

void BoardLinkSession::OnDocumentRequested() {
  ForEachObserver(
      [](SessionObserver* observer) { observer->OnDocumentRequested(); });
}

absl::StatusOr<TransferSender*> BoardLinkSession::GetSender() {
  MutexLock lock(&mu_);
  if (sender_ == nullptr) {
    return TransportNotOpenError(absl::StrCat(
        "Session ", options_.session_id, " has no data channel yet."));
  }
  return sender_.get();
}

void BoardLinkSession::ForEachObserver(
    const std::function<void(SessionObserver*)>& fn) {
  absl::ReaderMutexLock lock(&observers_mu_);
  for (SessionObserver* observer : observers_) {
    fn(observer);
  }
}

}  // namespace boardlink
