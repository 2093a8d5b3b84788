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

#ifndef BOARDLINK_SESSION_SESSION_H_
#define BOARDLINK_SESSION_SESSION_H_

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/time/time.h>
#include <absl/types/span.h>

#include "boardlink/concurrency/concurrency.h"
#include "boardlink/negotiation/negotiator.h"
#include "boardlink/net/transport.h"
#include "boardlink/net/webrtc/peer_connection.h"
#include "boardlink/signaling/relay_store.h"
#include "boardlink/signaling/signaling_channel.h"
#include "boardlink/transfer/receiver.h"
#include "boardlink/transfer/sender.h"
#include "boardlink/transfer/wire.h"

namespace boardlink {

struct SessionOptions {
  std::string session_id;
  PeerRole role = PeerRole::kInitiator;
  absl::Duration negotiation_timeout = absl::Seconds(30);
  std::string channel_label = "media";
  TransferOptions transfer;
};

/**
 * Everything a user interface needs to hear about a session. Methods are
 * called on library threads.
 */
class SessionObserver {
 public:
  virtual ~SessionObserver() = default;

  virtual void OnStateChanged(ConnectionState state) {}
  virtual void OnConnected() {}
  // Use GetFailureCategory() to decide what to tell the user.
  virtual void OnError(const absl::Status& status) {}
  virtual void OnRemoteStatus(std::string_view status) {}

  virtual void OnTransferStarted(const TransferHeader& header) {}
  virtual void OnTransferProgress(const TransferHeader& header,
                                  double fraction) {}
  virtual void OnTransferReceived(const ReceivedTransfer& transfer) {}
  virtual void OnTransferFailed(const absl::Status& status) {}
  virtual void OnDocumentRequested() {}
};

/**
 * One peer's side of a session: the signaling channel, the negotiator, the
 * data channel, and a sender and receiver on it.
 *
 * The handheld opens the session as the initiator after scanning the board's
 * code; the board opens it as the responder and waits.
 *
 * @headerfile boardlink/session/session.h
 */
class BoardLinkSession final : public NegotiatorObserver,
                               public TransferObserver {
 public:
  BoardLinkSession(std::shared_ptr<SignalingChannel> signaling,
                   net::PeerConnectionFactory peer_connection_factory,
                   SessionOptions options);

  // A session signaling through `store` with the standard path layout.
  static std::unique_ptr<BoardLinkSession> OverRelay(
      std::shared_ptr<RelayStore> store,
      net::PeerConnectionFactory peer_connection_factory,
      SessionOptions options);

  // Disconnects. Must not run on a library thread or while SendFile() runs.
  ~BoardLinkSession() override;

  BoardLinkSession(const BoardLinkSession&) = delete;
  BoardLinkSession& operator=(const BoardLinkSession&) = delete;

  /**
   * Starts connecting.
   *
   * The initiator first checks that the board has created the session and
   * fails with SessionNotFoundError otherwise. The responder publishes the
   * "waiting" status so that the initiator can find it.
   */
  absl::Status Open();

  // OK once connected; the error that made Open() or the attempt fail, not
  // errors reported along the way; DeadlineExceeded if `timeout` passes
  // first.
  absl::Status WaitUntilConnected(absl::Duration timeout);

  absl::Status SendFile(TransferKind kind, std::string_view filename,
                        absl::Span<const net::Byte> payload,
                        ProgressCallback on_progress = nullptr);
  absl::Status SendImage(absl::Span<const net::Byte> payload,
                         std::string_view filename = "photo.jpg",
                         ProgressCallback on_progress = nullptr);
  absl::Status SendAudio(absl::Span<const net::Byte> payload,
                         std::string_view filename = "recording.webm",
                         ProgressCallback on_progress = nullptr);
  absl::Status RequestDocument();

  // See ConnectionNegotiator::Disconnect().
  absl::Status Disconnect();

  [[nodiscard]] ConnectionState state() const;
  [[nodiscard]] const SessionOptions& options() const { return options_; }

  void AddObserver(SessionObserver* observer);
  void RemoveObserver(SessionObserver* observer);

  // NegotiatorObserver
  void OnTransportCreated(
      const std::shared_ptr<net::DataChannelTransport>& transport) override;
  void OnStateChanged(ConnectionState state) override;
  void OnConnected() override;
  void OnError(const absl::Status& status) override;

  // TransferObserver
  void OnTransferStarted(const TransferHeader& header) override;
  void OnTransferProgress(const TransferHeader& header,
                          double fraction) override;
  void OnTransferReceived(const ReceivedTransfer& transfer) override;
  void OnTransferFailed(const absl::Status& status) override;
  void OnDocumentRequested() override;

 private:
  absl::StatusOr<TransferSender*> GetSender();
  // Records `status` for WaitUntilConnected(), reports it, and returns it.
  absl::Status FailOpen(absl::Status status);

  void ForEachObserver(const std::function<void(SessionObserver*)>& fn);

  const std::shared_ptr<SignalingChannel> signaling_;
  const SessionOptions options_;

  TransferReceiver receiver_;
  std::unique_ptr<ConnectionNegotiator> negotiator_;

  mutable Mutex mu_;
  CondVar cv_;
  std::unique_ptr<TransferSender> sender_ ABSL_GUARDED_BY(mu_);
  // Why Open() failed before the negotiator could record a failure.
  absl::Status open_error_ ABSL_GUARDED_BY(mu_);

  mutable Mutex observers_mu_;
  std::vector<SessionObserver*> observers_ ABSL_GUARDED_BY(observers_mu_);
};

}  // namespace boardlink

#endif  // BOARDLINK_SESSION_SESSION_H_
