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

#include <cstdint>
#include <string>
#include <variant>

#include <absl/status/status_matchers.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "boardlink/transfer/wire.h"

#define ASSERT_OK(expression) ASSERT_THAT(expression, ::absl_testing::IsOk())

namespace {

using ::absl_testing::StatusIs;
using ::boardlink::ControlMessage;
using ::boardlink::TransferHeader;
using ::boardlink::TransferKind;

TEST(WireTest, CountChunks) {
  EXPECT_EQ(boardlink::CountChunks(0), 0u);
  EXPECT_EQ(boardlink::CountChunks(1), 1u);
  EXPECT_EQ(boardlink::CountChunks(65536), 1u);
  EXPECT_EQ(boardlink::CountChunks(65537), 2u);
  EXPECT_EQ(boardlink::CountChunks(200000), 4u);
  EXPECT_EQ(boardlink::CountChunks(10, /*chunk_size=*/3), 4u);
  EXPECT_EQ(boardlink::CountChunks(UINT64_MAX), UINT64_MAX / 65536 + 1);
}

TEST(WireTest, TransferKindNames) {
  EXPECT_EQ(boardlink::TransferKindName(TransferKind::kImage), "image");
  EXPECT_EQ(boardlink::TransferKindName(TransferKind::kAudio), "audio");
  EXPECT_EQ(boardlink::TransferKindName(TransferKind::kPdf), "pdf");

  EXPECT_THAT(boardlink::ParseTransferKind("pdf"),
              ::absl_testing::IsOkAndHolds(TransferKind::kPdf));
  EXPECT_THAT(boardlink::ParseTransferKind("video"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(WireTest, HeaderRoundTrip) {
  const TransferHeader header =
      boardlink::MakeTransferHeader(TransferKind::kImage, "photo.jpg", 200000);
  EXPECT_EQ(header.total_chunks, 4u);

  const std::string text = boardlink::SerializeControlMessage(header);
  absl::StatusOr<ControlMessage> parsed = boardlink::ParseControlMessage(text);
  ASSERT_OK(parsed);
  ASSERT_TRUE(std::holds_alternative<TransferHeader>(*parsed));
  EXPECT_EQ(std::get<TransferHeader>(*parsed), header);
}

TEST(WireTest, ParsesPeerHeader) {
  absl::StatusOr<ControlMessage> parsed = boardlink::ParseControlMessage(
      R"({"header": {"type": "audio", "filename": "recording.webm",
                     "totalSize": 70000, "totalChunks": 2}})");
  ASSERT_OK(parsed);
  const auto& header = std::get<TransferHeader>(*parsed);
  EXPECT_EQ(header.kind, TransferKind::kAudio);
  EXPECT_EQ(header.filename, "recording.webm");
  EXPECT_EQ(header.total_size, 70000u);
  EXPECT_EQ(header.total_chunks, 2u);
}

TEST(WireTest, AcceptsIntegralDoubles) {
  absl::StatusOr<ControlMessage> parsed = boardlink::ParseControlMessage(
      R"({"header": {"type": "pdf", "filename": "a.pdf",
                     "totalSize": 10.0, "totalChunks": 1.0}})");
  ASSERT_OK(parsed);
  EXPECT_EQ(std::get<TransferHeader>(*parsed).total_size, 10u);
}

TEST(WireTest, RejectsCountsBeyondUint64) {
  EXPECT_THAT(boardlink::ParseControlMessage(
                  R"({"header": {"type": "image", "filename": "a.jpg",
                                 "totalSize": 1e30, "totalChunks": 1}})"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(WireTest, CompletionAndDocumentRequest) {
  absl::StatusOr<ControlMessage> complete = boardlink::ParseControlMessage(
      boardlink::SerializeControlMessage(boardlink::TransferComplete{}));
  ASSERT_OK(complete);
  EXPECT_TRUE(std::holds_alternative<boardlink::TransferComplete>(*complete));

  absl::StatusOr<ControlMessage> request =
      boardlink::ParseControlMessage(R"({"type": "pdf_request"})");
  ASSERT_OK(request);
  EXPECT_TRUE(std::holds_alternative<boardlink::DocumentRequest>(*request));
}

TEST(WireTest, RejectsMalformedMessages) {
  EXPECT_THAT(boardlink::ParseControlMessage("not json"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(boardlink::ParseControlMessage("[1, 2]"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(boardlink::ParseControlMessage(R"({"complete": false})"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(boardlink::ParseControlMessage(
                  R"({"header": {"type": "image", "filename": "a.jpg",
                                 "totalSize": -1, "totalChunks": 1}})"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(boardlink::ParseControlMessage(
                  R"({"header": {"type": "image", "totalSize": 1,
                                 "totalChunks": 1}})"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
