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

#ifndef BOARDLINK_TRANSFER_RECEIVER_H_
#define BOARDLINK_TRANSFER_RECEIVER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>

#include "boardlink/concurrency/concurrency.h"
#include "boardlink/net/transport.h"
#include "boardlink/transfer/wire.h"

namespace boardlink {

struct ReceivedTransfer {
  TransferKind kind = TransferKind::kImage;
  std::string filename;
  net::Bytes payload;
};

/**
 * Receives the events of a TransferReceiver. Methods are called on the
 * transport's delivery thread; a slow observer delays the next message.
 */
class TransferObserver {
 public:
  virtual ~TransferObserver() = default;

  virtual void OnTransferStarted(const TransferHeader& header) {}
  // received_size / total_size after every frame.
  virtual void OnTransferProgress(const TransferHeader& header,
                                  double fraction) {}
  virtual void OnTransferReceived(const ReceivedTransfer& transfer) {}
  // TransferAborted or DataIntegrityError. The transfer is dropped.
  virtual void OnTransferFailed(const absl::Status& status) {}
  virtual void OnDocumentRequested() {}
};

/**
 * The receiving half of the chunked transfer protocol.
 *
 * At most one transfer is pending. A header that arrives while another
 * transfer is pending aborts the pending one (reported as TransferAborted)
 * and starts the new one. Frames are validated against the header as they
 * arrive and again on completion; any mismatch drops the transfer with
 * DataIntegrityError, and frames of a dropped transfer are discarded until
 * the next header.
 *
 * @headerfile boardlink/transfer/receiver.h
 */
class TransferReceiver final : public net::TransportObserver {
 public:
  TransferReceiver() = default;

  ~TransferReceiver() override;

  TransferReceiver(const TransferReceiver&) = delete;
  TransferReceiver& operator=(const TransferReceiver&) = delete;

  // Starts consuming messages from `transport`, detaching from any previous
  // one. Neither call may be made from an observer method.
  void Attach(std::shared_ptr<net::DataChannelTransport> transport);
  void Detach();

  void AddObserver(TransferObserver* observer);
  void RemoveObserver(TransferObserver* observer);

  [[nodiscard]] bool HasPendingTransfer() const;

  void OnMessage(const net::InboundMessage& message) override;
  void OnClosed() override;

 private:
  struct PendingTransfer {
    TransferHeader header;
    std::vector<net::Bytes> frames;
    uint64_t received_size = 0;
  };

  void HandleText(const std::string& text);
  void HandleHeader(TransferHeader header);
  void HandleFrame(net::Bytes frame);
  void HandleComplete();

  // Drops the pending transfer and reports `status`.
  void FailPending(const absl::Status& status);

  void ForEachObserver(const std::function<void(TransferObserver*)>& fn);

  mutable Mutex mu_;
  std::shared_ptr<net::DataChannelTransport> transport_ ABSL_GUARDED_BY(mu_);
  std::optional<PendingTransfer> pending_ ABSL_GUARDED_BY(mu_);
  bool discarding_ ABSL_GUARDED_BY(mu_) = false;

  mutable Mutex observers_mu_;
  std::vector<TransferObserver*> observers_ ABSL_GUARDED_BY(observers_mu_);
};

}  // namespace boardlink

#endif  // BOARDLINK_TRANSFER_RECEIVER_H_
