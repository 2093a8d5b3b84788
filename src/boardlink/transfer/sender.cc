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

#include "boardlink/transfer/sender.h"

#include <algorithm>
#include <string>
#include <utility>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/str_cat.h>

#include "boardlink/errors/errors.h"
#include "boardlink/util/status_macros.h"

namespace boardlink {

TransferSender::TransferSender(
    std::shared_ptr<net::DataChannelTransport> transport,
    TransferOptions options)
    : transport_(std::move(transport)), options_(options) {
  CHECK(transport_ != nullptr) << "TransferSender needs a transport.";
  CHECK_GT(options_.chunk_size, 0u);
  // Low enough that one more chunk fits once the signal fires.
  transport_->SetBufferedAmountLowThreshold(
      options_.max_buffered_amount > options_.chunk_size
          ? options_.max_buffered_amount - options_.chunk_size
          : 0);
  transport_->AddObserver(this);
}

TransferSender::~TransferSender() { transport_->RemoveObserver(this); }

absl::Status TransferSender::SendFile(TransferKind kind,
                                      std::string_view filename,
                                      absl::Span<const net::Byte> payload,
                                      ProgressCallback on_progress) {
  if (!transport_->IsOpen()) {
    return TransportNotOpenError(absl::StrCat(
        "Cannot send ", filename, ": data channel ", transport_->GetLabel(),
        " is not open."));
  }

  {
    MutexLock lock(&mu_);
    if (sending_) {
      return TransferInProgressError(
          absl::StrCat("Cannot send ", filename,
                       ": another transfer is in progress."));
    }
    sending_ = true;
  }

  const TransferHeader header =
      MakeTransferHeader(kind, filename, payload.size(), options_.chunk_size);
  absl::Status status = SendFrames(header, payload, on_progress);

  {
    MutexLock lock(&mu_);
    sending_ = false;
  }

  if (!status.ok()) {
    LOG(ERROR) << "Sending " << filename << " failed: " << status;
    return status;
  }
  LOG(INFO) << "Sent " << TransferKindName(kind) << " " << filename << " ("
            << header.total_size << " bytes in " << header.total_chunks
            << " frames).";
  return absl::OkStatus();
}

absl::Status TransferSender::SendImage(absl::Span<const net::Byte> payload,
                                       std::string_view filename,
                                       ProgressCallback on_progress) {
  return SendFile(TransferKind::kImage, filename, payload,
                  std::move(on_progress));
}

absl::Status TransferSender::SendAudio(absl::Span<const net::Byte> payload,
                                       std::string_view filename,
                                       ProgressCallback on_progress) {
  return SendFile(TransferKind::kAudio, filename, payload,
                  std::move(on_progress));
}

absl::Status TransferSender::RequestDocument() {
  if (!transport_->IsOpen()) {
    return TransportNotOpenError(
        absl::StrCat("Cannot request the document: data channel ",
                     transport_->GetLabel(), " is not open."));
  }
  RETURN_IF_ERROR(SendControl(DocumentRequest{}));
  LOG(INFO) << "Requested the document from the remote peer.";
  return absl::OkStatus();
}

bool TransferSender::IsSending() const {
  MutexLock lock(&mu_);
  return sending_;
}

void TransferSender::OnClosed() {
  MutexLock lock(&mu_);
  closed_ = true;
  cv_.SignalAll();
}

void TransferSender::OnBufferedAmountLow() {
  MutexLock lock(&mu_);
  ++low_signals_;
  cv_.SignalAll();
}

absl::Status TransferSender::SendFrames(const TransferHeader& header,
                                        absl::Span<const net::Byte> payload,
                                        const ProgressCallback& on_progress) {
  RETURN_IF_ERROR(SendControl(header));

  for (uint64_t frame = 0; frame < header.total_chunks; ++frame) {
    const size_t offset = frame * options_.chunk_size;
    const size_t size = std::min(options_.chunk_size, payload.size() - offset);

    RETURN_IF_ERROR(WaitForBufferSpace(size));
    RETURN_IF_ERROR(transport_->SendBinary(payload.subspan(offset, size)));
    DLOG(INFO) << "Sent frame " << frame + 1 << "/" << header.total_chunks
               << " of " << header.filename << " (" << size << " bytes).";

    if (on_progress) {
      on_progress(static_cast<double>(frame + 1) /
                  static_cast<double>(header.total_chunks));
    }
  }

  return SendControl(TransferComplete{});
}

absl::Status TransferSender::SendControl(const ControlMessage& message) {
  const std::string text = SerializeControlMessage(message);
  RETURN_IF_ERROR(WaitForBufferSpace(text.size()));
  return transport_->SendText(text);
}

absl::Status TransferSender::WaitForBufferSpace(size_t size) {
  while (true) {
    uint64_t seen_signals;
    {
      MutexLock lock(&mu_);
      if (closed_) {
        return TransportNotOpenError(
            absl::StrCat("Data channel ", transport_->GetLabel(),
                         " closed during the transfer."));
      }
      seen_signals = low_signals_;
    }

    if (!transport_->IsOpen()) {
      return TransportNotOpenError(absl::StrCat(
          "Data channel ", transport_->GetLabel(), " is not open."));
    }
    const size_t buffered = transport_->GetBufferedAmount();
    if (buffered == 0 || buffered + size <= options_.max_buffered_amount) {
      return absl::OkStatus();
    }

    MutexLock lock(&mu_);
    if (low_signals_ == seen_signals && !closed_) {
      cv_.WaitWithTimeout(&mu_, options_.poll_interval);
    }
  }
}

}  // namespace boardlink
