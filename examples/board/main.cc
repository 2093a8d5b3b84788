// The board side: waits in a session for a handheld, saves every file it
// receives, and serves its document on request.
//
//   board --session=abc123 --output_dir=/srv/board --document=slides.pdf

#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <absl/debugging/failure_signal_handler.h>
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/strings/str_cat.h>
#include <absl/synchronization/mutex.h>
#include <absl/synchronization/notification.h>
#include <boardlink/errors/errors.h>
#include <boardlink/net/webrtc/rtc_config.h>
#include <boardlink/net/webrtc/rtc_peer_connection.h>
#include <boardlink/session/session.h>
#include <boardlink/signaling/redis_relay_store.h>
#include <boardlink/util/files.h>

ABSL_FLAG(std::string, session, "",
          "Identifier of the session to wait in. Handhelds scan it from the "
          "board's code.");

ABSL_FLAG(std::string, redis_host, "127.0.0.1", "Relay (Redis) host.");

ABSL_FLAG(uint16_t, redis_port, 6379, "Relay (Redis) port.");

ABSL_FLAG(std::string, redis_key_prefix, "boardlink:",
          "Prefix of every relay key. Must match the handheld's.");

ABSL_FLAG(std::vector<std::string>, stun_servers,
          boardlink::net::RtcConfig().stun_servers,
          "Comma-separated STUN server URLs.");

ABSL_FLAG(absl::Duration, timeout, absl::Seconds(30),
          "How long negotiation may take once an offer has arrived.");

ABSL_FLAG(std::string, output_dir, ".", "Where to save received files.");

ABSL_FLAG(std::string, document, "",
          "PDF served to handhelds that request the document.");

namespace {

class BoardObserver final : public boardlink::SessionObserver {
 public:
  void SetSession(boardlink::BoardLinkSession* session) { session_ = session; }

  void OnStateChanged(boardlink::ConnectionState state) override {
    LOG(INFO) << "Session is " << boardlink::ConnectionStateName(state) << ".";
    if (state == boardlink::ConnectionState::kDisconnected ||
        state == boardlink::ConnectionState::kFailed) {
      if (!done_.HasBeenNotified()) {
        done_.Notify();
      }
    }
  }

  void OnError(const absl::Status& status) override {
    std::cerr << boardlink::DescribeFailure(
                     boardlink::GetFailureCategory(status))
              << " (" << status << ")" << std::endl;
  }

  void OnTransferStarted(const boardlink::TransferHeader& header) override {
    LOG(INFO) << "Receiving " << header.filename << ".";
  }

  void OnTransferReceived(const boardlink::ReceivedTransfer& transfer) override {
    const std::string path =
        absl::StrCat(absl::GetFlag(FLAGS_output_dir), "/",
                     boardlink::SanitizeFilename(transfer.filename));
    if (absl::Status status =
            boardlink::WriteFileBytes(path, transfer.payload);
        !status.ok()) {
      LOG(ERROR) << status;
      return;
    }
    std::cout << "Saved " << boardlink::TransferKindName(transfer.kind)
              << " to " << path << std::endl;
  }

  void OnTransferFailed(const absl::Status& status) override {
    OnError(status);
  }

  void OnDocumentRequested() override {
    // Sending blocks on backpressure, which must not happen on the thread
    // delivering inbound messages.
    absl::MutexLock lock(&mu_);
    senders_.emplace_back([this]() { ServeDocument(); });
  }

  ~BoardObserver() override { JoinSenders(); }

  void WaitUntilDone() { done_.WaitForNotification(); }

  void JoinSenders() {
    std::vector<std::thread> senders;
    {
      absl::MutexLock lock(&mu_);
      senders.swap(senders_);
    }
    for (std::thread& sender : senders) {
      sender.join();
    }
  }

 private:
  void ServeDocument() {
    const std::string path = absl::GetFlag(FLAGS_document);
    if (path.empty()) {
      LOG(WARNING) << "A document was requested but --document is not set.";
      return;
    }
    absl::StatusOr<boardlink::net::Bytes> payload =
        boardlink::ReadFileBytes(path);
    if (!payload.ok()) {
      LOG(ERROR) << payload.status();
      return;
    }
    if (absl::Status status = session_->SendFile(
            boardlink::TransferKind::kPdf, boardlink::SanitizeFilename(path),
            *payload);
        !status.ok()) {
      OnError(status);
    }
  }

  boardlink::BoardLinkSession* session_ = nullptr;
  absl::Notification done_;
  absl::Mutex mu_;
  std::vector<std::thread> senders_ ABSL_GUARDED_BY(mu_);
};

}  // namespace

int main(int argc, char** argv) {
  absl::InstallFailureSignalHandler({});
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  const std::string session_id = absl::GetFlag(FLAGS_session);
  if (session_id.empty()) {
    std::cerr << "--session is required." << std::endl;
    return 2;
  }

  absl::StatusOr<std::unique_ptr<boardlink::RedisRelayStore>> store =
      boardlink::RedisRelayStore::Connect(
          {.host = absl::GetFlag(FLAGS_redis_host),
           .port = absl::GetFlag(FLAGS_redis_port),
           .key_prefix = absl::GetFlag(FLAGS_redis_key_prefix)});
  if (!store.ok()) {
    std::cerr << boardlink::DescribeFailure(
                     boardlink::GetFailureCategory(store.status()))
              << " (" << store.status() << ")" << std::endl;
    return 1;
  }

  boardlink::net::RtcConfig rtc_config;
  rtc_config.stun_servers = absl::GetFlag(FLAGS_stun_servers);

  BoardObserver observer;
  std::unique_ptr<boardlink::BoardLinkSession> session =
      boardlink::BoardLinkSession::OverRelay(
          *std::move(store),
          boardlink::net::MakeRtcPeerConnectionFactory(rtc_config),
          {.session_id = session_id,
           .role = boardlink::PeerRole::kResponder,
           .negotiation_timeout = absl::GetFlag(FLAGS_timeout)});
  observer.SetSession(session.get());
  session->AddObserver(&observer);

  if (!session->Open().ok()) {
    return 1;
  }
  std::cout << "Waiting for a handheld in session " << session_id << "."
            << std::endl;

  observer.WaitUntilDone();

  session->RemoveObserver(&observer);
  if (absl::Status status = session->Disconnect(); !status.ok()) {
    LOG(WARNING) << "Could not clean up the relay: " << status;
  }
  observer.JoinSenders();
  return 0;
}
