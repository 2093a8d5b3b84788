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

#include "boardlink/transfer/receiver.h"

#include <algorithm>
#include <utility>
#include <variant>

#include <absl/log/log.h>
#include <absl/strings/str_cat.h>

#include "boardlink/errors/errors.h"

namespace boardlink {

TransferReceiver::~TransferReceiver() { Detach(); }

void TransferReceiver::Attach(
    std::shared_ptr<net::DataChannelTransport> transport) {
  Detach();
  transport->AddObserver(this);
  MutexLock lock(&mu_);
  transport_ = std::move(transport);
}

void TransferReceiver::Detach() {
  std::shared_ptr<net::DataChannelTransport> transport;
  {
    MutexLock lock(&mu_);
    transport = std::move(transport_);
    transport_ = nullptr;
    pending_.reset();
    discarding_ = false;
  }
  if (transport != nullptr) {
    transport->RemoveObserver(this);
  }
}

void TransferReceiver::AddObserver(TransferObserver* observer) {
  MutexLock lock(&observers_mu_);
  observers_.push_back(observer);
}

void TransferReceiver::RemoveObserver(TransferObserver* observer) {
  MutexLock lock(&observers_mu_);
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                   observers_.end());
}

bool TransferReceiver::HasPendingTransfer() const {
  MutexLock lock(&mu_);
  return pending_.has_value();
}

void TransferReceiver::ForEachObserver(
    const std::function<void(TransferObserver*)>& fn) {
  absl::ReaderMutexLock lock(&observers_mu_);
  for (TransferObserver* observer : observers_) {
    fn(observer);
  }
}

void TransferReceiver::OnMessage(const net::InboundMessage& message) {
  if (const auto* text = std::get_if<std::string>(&message)) {
    HandleText(*text);
    return;
  }
  if (const auto* bytes = std::get_if<net::Bytes>(&message)) {
    HandleFrame(*bytes);
    return;
  }

  // Materialized here, before the transport hands over the next message.
  const auto& deferred = std::get<net::DeferredBinary>(message);
  absl::StatusOr<net::Bytes> bytes = deferred.materialize();
  if (!bytes.ok()) {
    FailPending(DataIntegrityError(absl::StrCat(
        "Could not read a binary frame: ", bytes.status().message())));
    return;
  }
  HandleFrame(*std::move(bytes));
}

void TransferReceiver::OnClosed() {
  std::string filename;
  {
    MutexLock lock(&mu_);
    if (!pending_.has_value()) {
      return;
    }
    filename = pending_->header.filename;
  }
  FailPending(TransferAbortedError(absl::StrCat(
      "Data channel closed during the transfer of ", filename, ".")));
}

void TransferReceiver::HandleText(const std::string& text) {
  absl::StatusOr<ControlMessage> message = ParseControlMessage(text);
  if (!message.ok()) {
    LOG(WARNING) << "Dropping malformed control message: "
                 << message.status();
    return;
  }

  if (auto* header = std::get_if<TransferHeader>(&*message)) {
    HandleHeader(std::move(*header));
  } else if (std::holds_alternative<TransferComplete>(*message)) {
    HandleComplete();
  } else {
    LOG(INFO) << "The remote peer requested the document.";
    ForEachObserver(
        [](TransferObserver* observer) { observer->OnDocumentRequested(); });
  }
}

void TransferReceiver::HandleHeader(TransferHeader header) {
  std::string stale_filename;
  {
    MutexLock lock(&mu_);
    if (pending_.has_value()) {
      stale_filename = pending_->header.filename;
    }
  }
  if (!stale_filename.empty()) {
    FailPending(TransferAbortedError(
        absl::StrCat("Transfer of ", stale_filename,
                     " was superseded by the transfer of ", header.filename,
                     ".")));
  }

  if (header.total_chunks != CountChunks(header.total_size)) {
    FailPending(DataIntegrityError(absl::StrCat(
        "Header of ", header.filename, " announces ", header.total_chunks,
        " frames for ", header.total_size, " bytes; expected ",
        CountChunks(header.total_size), ".")));
    return;
  }

  LOG(INFO) << "Receiving " << TransferKindName(header.kind) << " "
            << header.filename << " (" << header.total_size << " bytes in "
            << header.total_chunks << " frames).";
  {
    MutexLock lock(&mu_);
    discarding_ = false;
    pending_ = PendingTransfer{.header = header};
  }
  ForEachObserver([&header](TransferObserver* observer) {
    observer->OnTransferStarted(header);
  });
}

void TransferReceiver::HandleFrame(net::Bytes frame) {
  TransferHeader header;
  double fraction = 0;
  absl::Status integrity_error;
  {
    MutexLock lock(&mu_);
    if (!pending_.has_value()) {
      if (!discarding_) {
        LOG(WARNING) << "Dropping a " << frame.size()
                     << "-byte frame outside of any transfer.";
      }
      return;
    }

    header = pending_->header;
    const uint64_t received_size = pending_->received_size + frame.size();
    if (frame.size() > kChunkSize) {
      integrity_error = DataIntegrityError(absl::StrCat(
          "Received a ", frame.size(), "-byte frame of ", header.filename,
          "; frames are at most ", kChunkSize, " bytes."));
    } else if (received_size > header.total_size) {
      integrity_error = DataIntegrityError(absl::StrCat(
          "Received ", received_size, " bytes of ", header.filename,
          " but the header announced ", header.total_size, "."));
    } else if (pending_->frames.size() + 1 > header.total_chunks) {
      integrity_error = DataIntegrityError(absl::StrCat(
          "Received more than the announced ", header.total_chunks,
          " frames of ", header.filename, "."));
    } else {
      pending_->received_size = received_size;
      pending_->frames.push_back(std::move(frame));
      fraction = static_cast<double>(received_size) /
                 static_cast<double>(header.total_size);
    }
  }

  if (!integrity_error.ok()) {
    FailPending(integrity_error);
    return;
  }
  ForEachObserver([&header, fraction](TransferObserver* observer) {
    observer->OnTransferProgress(header, fraction);
  });
}

void TransferReceiver::HandleComplete() {
  PendingTransfer pending;
  {
    MutexLock lock(&mu_);
    if (!pending_.has_value()) {
      if (!discarding_) {
        LOG(WARNING) << "Dropping a completion message outside of any "
                        "transfer.";
      }
      discarding_ = false;
      return;
    }
    pending = *std::move(pending_);
    pending_.reset();
  }

  const TransferHeader& header = pending.header;
  if (pending.received_size != header.total_size ||
      pending.frames.size() != header.total_chunks) {
    FailPending(DataIntegrityError(absl::StrCat(
        "Transfer of ", header.filename, " completed with ",
        pending.received_size, " bytes in ", pending.frames.size(),
        " frames, but the header announced ", header.total_size,
        " bytes in ", header.total_chunks, " frames.")));
    return;
  }

  ReceivedTransfer transfer{.kind = header.kind, .filename = header.filename};
  transfer.payload.reserve(header.total_size);
  for (const net::Bytes& frame : pending.frames) {
    transfer.payload.insert(transfer.payload.end(), frame.begin(),
                            frame.end());
  }

  LOG(INFO) << "Received " << TransferKindName(header.kind) << " "
            << header.filename << " (" << transfer.payload.size()
            << " bytes).";
  ForEachObserver([&transfer](TransferObserver* observer) {
    observer->OnTransferReceived(transfer);
  });
}

void TransferReceiver::FailPending(const absl::Status& status) {
  {
    MutexLock lock(&mu_);
    pending_.reset();
    // Frames of an aborted transfer are not expected, so only integrity
    // failures put the receiver in discard mode.
    discarding_ = IsErrorKind(status, ErrorKind::kDataIntegrity);
  }
  LOG(ERROR) << status;
  ForEachObserver([&status](TransferObserver* observer) {
    observer->OnTransferFailed(status);
  });
}

}  // namespace boardlink
