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

#include "boardlink/util/files.h"

#include <fstream>
#include <iterator>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

namespace boardlink {

absl::StatusOr<net::Bytes> ReadFileBytes(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return absl::NotFoundError(absl::StrCat("Could not open ", path, "."));
  }
  net::Bytes bytes((std::istreambuf_iterator<char>(file)),
                   std::istreambuf_iterator<char>());
  if (file.bad()) {
    return absl::DataLossError(absl::StrCat("Could not read ", path, "."));
  }
  return bytes;
}

absl::Status WriteFileBytes(const std::string& path,
                            absl::Span<const net::Byte> bytes) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return absl::PermissionDeniedError(
        absl::StrCat("Could not create ", path, "."));
  }
  file.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  if (!file) {
    return absl::DataLossError(absl::StrCat("Could not write ", path, "."));
  }
  return absl::OkStatus();
}

TransferKind GuessTransferKind(std::string_view filename) {
  const std::string lower = absl::AsciiStrToLower(filename);
  for (const std::string_view suffix :
       {".webm", ".ogg", ".opus", ".wav", ".mp3", ".m4a"}) {
    if (absl::EndsWith(lower, suffix)) {
      return TransferKind::kAudio;
    }
  }
  if (absl::EndsWith(lower, ".pdf")) {
    return TransferKind::kPdf;
  }
  return TransferKind::kImage;
}

std::string SanitizeFilename(std::string_view filename) {
  const size_t slash = filename.find_last_of("/\\");
  std::string_view base =
      slash == std::string_view::npos ? filename : filename.substr(slash + 1);
  if (base.empty() || base == "." || base == "..") {
    return "received.bin";
  }
  return std::string(base);
}

}  // namespace boardlink
