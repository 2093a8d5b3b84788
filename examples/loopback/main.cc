// Runs a board and a handheld in one process over the in-memory relay and
// real peer connections on the loopback interface, sends a generated image
// and pulls a generated document.

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <absl/debugging/failure_signal_handler.h>
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/synchronization/mutex.h>
#include <absl/synchronization/notification.h>
#include <absl/time/time.h>
#include <boardlink/errors/errors.h>
#include <boardlink/net/webrtc/rtc_config.h>
#include <boardlink/net/webrtc/rtc_peer_connection.h>
#include <boardlink/session/session.h>
#include <boardlink/signaling/in_memory_relay_store.h>

ABSL_FLAG(uint64_t, image_size, 200000, "Size of the generated image.");

ABSL_FLAG(uint64_t, document_size, 1 << 20,
          "Size of the generated document.");

ABSL_FLAG(absl::Duration, timeout, absl::Seconds(30),
          "How long each step may take.");

namespace {

boardlink::net::Bytes MakePayload(uint64_t size, uint32_t seed) {
  std::mt19937 generator(seed);
  boardlink::net::Bytes payload(size);
  for (boardlink::net::Byte& byte : payload) {
    byte = static_cast<boardlink::net::Byte>(generator());
  }
  return payload;
}

// Records the one transfer a side expects to receive.
class ReceivingObserver : public boardlink::SessionObserver {
 public:
  void OnError(const absl::Status& status) override {
    LOG(ERROR) << boardlink::DescribeFailure(
                      boardlink::GetFailureCategory(status))
               << " (" << status << ")";
  }

  void OnTransferReceived(const boardlink::ReceivedTransfer& transfer) override {
    absl::MutexLock lock(&mu_);
    received_ = transfer;
    done_.Notify();
  }

  void OnTransferFailed(const absl::Status& status) override {
    OnError(status);
    done_.Notify();
  }

  std::optional<boardlink::ReceivedTransfer> Wait(absl::Duration timeout) {
    if (!done_.WaitForNotificationWithTimeout(timeout)) {
      return std::nullopt;
    }
    absl::MutexLock lock(&mu_);
    return received_;
  }

 private:
  absl::Notification done_;
  absl::Mutex mu_;
  std::optional<boardlink::ReceivedTransfer> received_ ABSL_GUARDED_BY(mu_);
};

class BoardSide final : public ReceivingObserver {
 public:
  explicit BoardSide(boardlink::net::Bytes document)
      : document_(std::move(document)) {}

  ~BoardSide() override { JoinServer(); }

  void JoinServer() {
    if (server_.joinable()) {
      server_.join();
    }
  }

  void SetSession(boardlink::BoardLinkSession* session) { session_ = session; }

  void OnDocumentRequested() override {
    if (server_.joinable()) {
      LOG(WARNING) << "Ignoring a second document request.";
      return;
    }
    server_ = std::thread([this]() {
      if (absl::Status status = session_->SendFile(
              boardlink::TransferKind::kPdf, "document.pdf", document_);
          !status.ok()) {
        OnError(status);
      }
    });
  }

 private:
  const boardlink::net::Bytes document_;
  boardlink::BoardLinkSession* session_ = nullptr;
  std::thread server_;
};

bool Check(bool condition, std::string_view what) {
  std::cout << (condition ? "ok    " : "FAILED") << " " << what << std::endl;
  return condition;
}

}  // namespace

int main(int argc, char** argv) {
  absl::InstallFailureSignalHandler({});
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  const absl::Duration timeout = absl::GetFlag(FLAGS_timeout);
  const boardlink::net::Bytes image =
      MakePayload(absl::GetFlag(FLAGS_image_size), 1);
  const boardlink::net::Bytes document =
      MakePayload(absl::GetFlag(FLAGS_document_size), 2);

  auto relay = std::make_shared<boardlink::InMemoryRelayStore>();
  // Host candidates are enough on one machine.
  boardlink::net::RtcConfig rtc_config;
  rtc_config.stun_servers.clear();

  BoardSide board_observer(document);
  ReceivingObserver handheld_observer;

  std::unique_ptr<boardlink::BoardLinkSession> board =
      boardlink::BoardLinkSession::OverRelay(
          relay, boardlink::net::MakeRtcPeerConnectionFactory(rtc_config),
          {.session_id = "loopback",
           .role = boardlink::PeerRole::kResponder,
           .negotiation_timeout = timeout});
  board_observer.SetSession(board.get());
  board->AddObserver(&board_observer);

  std::unique_ptr<boardlink::BoardLinkSession> handheld =
      boardlink::BoardLinkSession::OverRelay(
          relay, boardlink::net::MakeRtcPeerConnectionFactory(rtc_config),
          {.session_id = "loopback",
           .role = boardlink::PeerRole::kInitiator,
           .negotiation_timeout = timeout});
  handheld->AddObserver(&handheld_observer);

  bool ok = Check(board->Open().ok(), "board opens the session");
  ok = ok && Check(handheld->Open().ok(), "handheld finds the board");
  ok = ok && Check(handheld->WaitUntilConnected(timeout).ok(),
                   "handheld connects");
  ok = ok && Check(board->WaitUntilConnected(timeout).ok(), "board connects");

  if (ok) {
    ok = Check(handheld->SendImage(image).ok(), "handheld sends the image");
    const std::optional<boardlink::ReceivedTransfer> received =
        board_observer.Wait(timeout);
    ok = Check(ok && received.has_value() && received->payload == image &&
                   received->filename == "photo.jpg",
               "board receives the image intact");
  }

  if (ok) {
    ok = Check(handheld->RequestDocument().ok(),
               "handheld requests the document");
    const std::optional<boardlink::ReceivedTransfer> received =
        handheld_observer.Wait(timeout);
    ok = Check(ok && received.has_value() && received->payload == document &&
                   received->kind == boardlink::TransferKind::kPdf,
               "handheld receives the document intact");
  }

  handheld->RemoveObserver(&handheld_observer);
  board->RemoveObserver(&board_observer);
  board_observer.JoinServer();
  ok = Check(handheld->Disconnect().ok(), "handheld disconnects") && ok;
  ok = Check(board->Disconnect().ok(), "board disconnects") && ok;
  return ok ? 0 : 1;
}
