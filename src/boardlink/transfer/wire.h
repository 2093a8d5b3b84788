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

#ifndef BOARDLINK_TRANSFER_WIRE_H_
#define BOARDLINK_TRANSFER_WIRE_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <absl/status/statusor.h>

/**
 * @file
 * @brief
 *   Framing of a file transfer on a data channel.
 *
 * A transfer is one text header, `total_chunks` binary frames of at most the
 * chunk size each, and a text completion sentinel:
 *
 *   {"header": {"type": "image", "filename": "photo.jpg",
 *               "totalSize": 200000, "totalChunks": 4}}
 *   <65536 bytes> <65536 bytes> <65536 bytes> <3392 bytes>
 *   {"complete": true}
 *
 * Frames carry no sequence number; the channel is ordered, so only one
 * transfer per direction may be in flight.
 */

namespace boardlink {

inline constexpr size_t kChunkSize = 65536;

enum class TransferKind {
  kImage,
  kAudio,
  kPdf,
};

std::string_view TransferKindName(TransferKind kind);

absl::StatusOr<TransferKind> ParseTransferKind(std::string_view name);

struct TransferHeader {
  bool operator==(const TransferHeader& other) const {
    return kind == other.kind && filename == other.filename &&
           total_size == other.total_size &&
           total_chunks == other.total_chunks;
  }

  TransferKind kind = TransferKind::kImage;
  std::string filename;
  uint64_t total_size = 0;
  uint64_t total_chunks = 0;
};

// ceil(total_size / chunk_size); zero for an empty payload.
uint64_t CountChunks(uint64_t total_size, size_t chunk_size = kChunkSize);

TransferHeader MakeTransferHeader(TransferKind kind, std::string_view filename,
                                  uint64_t total_size,
                                  size_t chunk_size = kChunkSize);

struct TransferComplete {};

// Asks the remote peer to send its document.
struct DocumentRequest {};

using ControlMessage =
    std::variant<TransferHeader, TransferComplete, DocumentRequest>;

std::string SerializeControlMessage(const ControlMessage& message);

// InvalidArgument for malformed JSON and for messages that are none of the
// three control messages.
absl::StatusOr<ControlMessage> ParseControlMessage(std::string_view text);

}  // namespace boardlink

#endif  // BOARDLINK_TRANSFER_WIRE_H_
