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

#ifndef BOARDLINK_TRANSFER_SENDER_H_
#define BOARDLINK_TRANSFER_SENDER_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/time/time.h>
#include <absl/types/span.h>

#include "boardlink/concurrency/concurrency.h"
#include "boardlink/net/transport.h"
#include "boardlink/transfer/wire.h"

namespace boardlink {

struct TransferOptions {
  size_t chunk_size = kChunkSize;
  // A frame is held back while sending it would push the transport's
  // buffered amount above this.
  size_t max_buffered_amount = 4 * kChunkSize;
  // Fallback when the buffered-amount-low signal does not arrive.
  absl::Duration poll_interval = absl::Milliseconds(10);
};

// Called with frames_sent / total_chunks after every binary frame.
using ProgressCallback = std::function<void(double fraction)>;

/**
 * The sending half of the chunked transfer protocol.
 *
 * SendFile() blocks the calling thread until the last frame has been handed
 * to the transport, waiting for the transport to drain whenever the next frame
 * would exceed `max_buffered_amount`. One file is sent at a time.
 *
 * @headerfile boardlink/transfer/sender.h
 */
class TransferSender final : public net::TransportObserver {
 public:
  explicit TransferSender(std::shared_ptr<net::DataChannelTransport> transport,
                          TransferOptions options = {});

  ~TransferSender() override;

  TransferSender(const TransferSender&) = delete;
  TransferSender& operator=(const TransferSender&) = delete;

  /**
   * Sends `payload` as a header, ceil(size / chunk_size) binary frames and a
   * completion message.
   *
   * @return
   *   TransportNotOpenError if the channel is not open or closes midway,
   *   TransferInProgressError if another SendFile() call is running.
   */
  absl::Status SendFile(TransferKind kind, std::string_view filename,
                        absl::Span<const net::Byte> payload,
                        ProgressCallback on_progress = nullptr);

  absl::Status SendImage(absl::Span<const net::Byte> payload,
                         std::string_view filename = "photo.jpg",
                         ProgressCallback on_progress = nullptr);

  absl::Status SendAudio(absl::Span<const net::Byte> payload,
                         std::string_view filename = "recording.webm",
                         ProgressCallback on_progress = nullptr);

  // Asks the remote peer for its document. It arrives as a regular pdf
  // transfer.
  absl::Status RequestDocument();

  [[nodiscard]] bool IsSending() const;

  void OnClosed() override;
  void OnBufferedAmountLow() override;

 private:
  absl::Status SendFrames(const TransferHeader& header,
                          absl::Span<const net::Byte> payload,
                          const ProgressCallback& on_progress);

  absl::Status SendControl(const ControlMessage& message);

  // Blocks until `size` more bytes fit under `max_buffered_amount`. An empty
  // buffer always accepts one message.
  absl::Status WaitForBufferSpace(size_t size);

  const std::shared_ptr<net::DataChannelTransport> transport_;
  const TransferOptions options_;

  mutable Mutex mu_;
  CondVar cv_;
  bool sending_ ABSL_GUARDED_BY(mu_) = false;
  bool closed_ ABSL_GUARDED_BY(mu_) = false;
  uint64_t low_signals_ ABSL_GUARDED_BY(mu_) = 0;
};

}  // namespace boardlink

#endif  // BOARDLINK_TRANSFER_SENDER_H_
