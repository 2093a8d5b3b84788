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

#include "boardlink/transfer/wire.h"

#include <utility>
#include <variant>

#include <absl/strings/str_cat.h>
#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>

#include "boardlink/signaling/types.h"
#include "boardlink/util/status_macros.h"

namespace boardlink {

namespace {

// JSON numbers written by browsers may arrive as integers or doubles.
absl::StatusOr<uint64_t> ReadCount(const boost::json::object& object,
                                   std::string_view field) {
  const boost::json::value* value = object.if_contains(field);
  if (value == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Transfer header has no '", field, "'."));
  }
  if (value->is_uint64()) {
    return value->get_uint64();
  }
  if (value->is_int64() && value->get_int64() >= 0) {
    return static_cast<uint64_t>(value->get_int64());
  }
  // 0x1p64 is the first double past the uint64_t range.
  if (value->is_double() && value->get_double() >= 0 &&
      value->get_double() < 0x1p64 &&
      value->get_double() ==
          static_cast<double>(static_cast<uint64_t>(value->get_double()))) {
    return static_cast<uint64_t>(value->get_double());
  }
  return absl::InvalidArgumentError(absl::StrCat(
      "Transfer header field '", field, "' is not a non-negative integer."));
}

absl::StatusOr<TransferHeader> ParseHeader(const boost::json::value& json) {
  const boost::json::object* object = json.if_object();
  if (object == nullptr) {
    return absl::InvalidArgumentError("Transfer header is not an object.");
  }

  const boost::json::value* type = object->if_contains("type");
  const boost::json::value* filename = object->if_contains("filename");
  if (type == nullptr || !type->is_string() || filename == nullptr ||
      !filename->is_string()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Transfer header needs string 'type' and 'filename': ",
                     boost::json::serialize(json)));
  }

  TransferHeader header;
  ASSIGN_OR_RETURN(header.kind, ParseTransferKind(type->get_string()));
  header.filename = std::string(filename->get_string());
  ASSIGN_OR_RETURN(header.total_size, ReadCount(*object, "totalSize"));
  ASSIGN_OR_RETURN(header.total_chunks, ReadCount(*object, "totalChunks"));
  return header;
}

}  // namespace

std::string_view TransferKindName(TransferKind kind) {
  switch (kind) {
    case TransferKind::kImage:
      return "image";
    case TransferKind::kAudio:
      return "audio";
    case TransferKind::kPdf:
      return "pdf";
  }
  return "unknown";
}

absl::StatusOr<TransferKind> ParseTransferKind(std::string_view name) {
  if (name == "image") {
    return TransferKind::kImage;
  }
  if (name == "audio") {
    return TransferKind::kAudio;
  }
  if (name == "pdf") {
    return TransferKind::kPdf;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown transfer type: ", name));
}

uint64_t CountChunks(uint64_t total_size, size_t chunk_size) {
  return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

TransferHeader MakeTransferHeader(TransferKind kind, std::string_view filename,
                                  uint64_t total_size, size_t chunk_size) {
  return TransferHeader{.kind = kind,
                        .filename = std::string(filename),
                        .total_size = total_size,
                        .total_chunks = CountChunks(total_size, chunk_size)};
}

std::string SerializeControlMessage(const ControlMessage& message) {
  boost::json::object json;
  if (const auto* header = std::get_if<TransferHeader>(&message)) {
    boost::json::object header_json;
    header_json["type"] = TransferKindName(header->kind);
    header_json["filename"] = header->filename;
    header_json["totalSize"] = header->total_size;
    header_json["totalChunks"] = header->total_chunks;
    json["header"] = std::move(header_json);
  } else if (std::holds_alternative<TransferComplete>(message)) {
    json["complete"] = true;
  } else {
    json["type"] = "pdf_request";
  }
  return boost::json::serialize(json);
}

absl::StatusOr<ControlMessage> ParseControlMessage(std::string_view text) {
  ASSIGN_OR_RETURN(boost::json::value json, ParseJson(text));
  const boost::json::object* object = json.if_object();
  if (object == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Control message is not an object: ", text));
  }

  if (const boost::json::value* header = object->if_contains("header")) {
    ASSIGN_OR_RETURN(TransferHeader parsed, ParseHeader(*header));
    return ControlMessage(std::move(parsed));
  }
  if (const boost::json::value* complete = object->if_contains("complete");
      complete != nullptr && complete->is_bool() && complete->get_bool()) {
    return ControlMessage(TransferComplete{});
  }
  if (const boost::json::value* type = object->if_contains("type");
      type != nullptr && type->is_string() &&
      type->get_string() == "pdf_request") {
    return ControlMessage(DocumentRequest{});
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown control message: ", text));
}

}  // namespace boardlink
