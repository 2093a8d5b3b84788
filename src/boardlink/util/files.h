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

#ifndef BOARDLINK_UTIL_FILES_H_
#define BOARDLINK_UTIL_FILES_H_

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/types/span.h>

#include "boardlink/net/transport.h"
#include "boardlink/transfer/wire.h"

namespace boardlink {

absl::StatusOr<net::Bytes> ReadFileBytes(const std::string& path);

absl::Status WriteFileBytes(const std::string& path,
                            absl::Span<const net::Byte> bytes);

// By extension: images, audio recordings and PDF documents. Anything else is
// sent as an image, which the board displays as a download.
TransferKind GuessTransferKind(std::string_view filename);

// The last path component, so that a received filename cannot escape the
// output directory.
std::string SanitizeFilename(std::string_view filename);

}  // namespace boardlink

#endif  // BOARDLINK_UTIL_FILES_H_
