// The handheld side: joins the session a board is waiting in, sends the
// files named on the command line, and optionally pulls the board's
// document.
//
//   handheld --session=abc123 photo.jpg memo.webm --request_document

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <absl/debugging/failure_signal_handler.h>
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/synchronization/notification.h>
#include <absl/time/time.h>
#include <boardlink/errors/errors.h>
#include <boardlink/net/webrtc/rtc_config.h>
#include <boardlink/net/webrtc/rtc_peer_connection.h>
#include <boardlink/session/session.h>
#include <boardlink/signaling/redis_relay_store.h>
#include <boardlink/util/files.h>

ABSL_FLAG(std::string, session, "",
          "Identifier of the session the board is waiting in, as shown in "
          "its code.");

ABSL_FLAG(std::string, redis_host, "127.0.0.1", "Relay (Redis) host.");

ABSL_FLAG(uint16_t, redis_port, 6379, "Relay (Redis) port.");

ABSL_FLAG(std::string, redis_key_prefix, "boardlink:",
          "Prefix of every relay key. Must match the board's.");

ABSL_FLAG(std::vector<std::string>, stun_servers,
          boardlink::net::RtcConfig().stun_servers,
          "Comma-separated STUN server URLs.");

ABSL_FLAG(absl::Duration, timeout, absl::Seconds(30),
          "How long to wait for the connection to be established.");

ABSL_FLAG(bool, request_document, false,
          "Ask the board for its document after sending the files.");

ABSL_FLAG(std::string, output_dir, ".",
          "Where to save the document received from the board.");

namespace {

class HandheldObserver final : public boardlink::SessionObserver {
 public:
  void OnConnected() override { LOG(INFO) << "Connected to the board."; }

  void OnError(const absl::Status& status) override {
    std::cerr << boardlink::DescribeFailure(
                     boardlink::GetFailureCategory(status))
              << " (" << status << ")" << std::endl;
  }

  void OnTransferProgress(const boardlink::TransferHeader& header,
                          double fraction) override {
    std::cout << absl::StrFormat("\rReceiving %s: %3.0f%%", header.filename,
                                 fraction * 100)
              << std::flush;
  }

  void OnTransferReceived(const boardlink::ReceivedTransfer& transfer) override {
    std::cout << std::endl;
    const std::string path =
        absl::StrCat(absl::GetFlag(FLAGS_output_dir), "/",
                     boardlink::SanitizeFilename(transfer.filename));
    if (absl::Status status =
            boardlink::WriteFileBytes(path, transfer.payload);
        !status.ok()) {
      LOG(ERROR) << status;
    } else {
      LOG(INFO) << "Saved the board's document to " << path << ".";
    }
    document_received_.Notify();
  }

  void OnTransferFailed(const absl::Status& status) override {
    std::cout << std::endl;
    OnError(status);
    document_received_.Notify();
  }

  bool WaitForDocument(absl::Duration timeout) {
    return document_received_.WaitForNotificationWithTimeout(timeout);
  }

 private:
  absl::Notification document_received_;
};

}  // namespace

int main(int argc, char** argv) {
  absl::InstallFailureSignalHandler({});
  std::vector<char*> files = absl::ParseCommandLine(argc, argv);
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

  HandheldObserver observer;
  std::unique_ptr<boardlink::BoardLinkSession> session =
      boardlink::BoardLinkSession::OverRelay(
          *std::move(store),
          boardlink::net::MakeRtcPeerConnectionFactory(rtc_config),
          {.session_id = session_id,
           .role = boardlink::PeerRole::kInitiator,
           .negotiation_timeout = absl::GetFlag(FLAGS_timeout)});
  session->AddObserver(&observer);

  // Errors from Open() and the wait are reported through the observer.
  if (!session->Open().ok()) {
    return 1;
  }
  if (!session->WaitUntilConnected(absl::GetFlag(FLAGS_timeout) +
                                   absl::Seconds(1))
           .ok()) {
    session->Disconnect().IgnoreError();
    return 1;
  }

  int exit_code = 0;
  // files[0] is the program name.
  for (size_t i = 1; i < files.size(); ++i) {
    const std::string path = files[i];
    absl::StatusOr<boardlink::net::Bytes> payload =
        boardlink::ReadFileBytes(path);
    if (!payload.ok()) {
      LOG(ERROR) << payload.status();
      exit_code = 1;
      continue;
    }

    const std::string filename = boardlink::SanitizeFilename(path);
    absl::Status status = session->SendFile(
        boardlink::GuessTransferKind(filename), filename, *payload,
        [&filename](double fraction) {
          std::cout << absl::StrFormat("\rSending %s: %3.0f%%", filename,
                                       fraction * 100)
                    << std::flush;
        });
    std::cout << std::endl;
    if (!status.ok()) {
      observer.OnError(status);
      exit_code = 1;
    }
  }

  if (absl::GetFlag(FLAGS_request_document)) {
    if (absl::Status status = session->RequestDocument(); !status.ok()) {
      observer.OnError(status);
      exit_code = 1;
    } else if (!observer.WaitForDocument(absl::Minutes(2))) {
      LOG(ERROR) << "The board did not send its document.";
      exit_code = 1;
    }
  }

  session->RemoveObserver(&observer);
  if (absl::Status status = session->Disconnect(); !status.ok()) {
    LOG(WARNING) << "Could not clean up the relay: " << status;
  }
  return exit_code;
}
