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

#ifndef BOARDLINK_SIGNALING_REDIS_RELAY_STORE_H_
#define BOARDLINK_SIGNALING_REDIS_RELAY_STORE_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>
#include <hiredis/hiredis.h>

#include "boardlink/concurrency/concurrency.h"
#include "boardlink/signaling/relay_store.h"

namespace boardlink {

namespace internal {

struct RedisContextDeleter {
  void operator()(redisContext* context) const;
};

struct RedisReplyDeleter {
  void operator()(redisReply* reply) const;
};

using RedisContextPtr = std::unique_ptr<redisContext, RedisContextDeleter>;
using RedisReplyPtr = std::unique_ptr<redisReply, RedisReplyDeleter>;

}  // namespace internal

struct RedisRelayOptions {
  std::string host = "127.0.0.1";
  uint16_t port = 6379;
  // Prepended to every Redis key and channel this store touches.
  std::string key_prefix = "boardlink:";
  absl::Duration connect_timeout = absl::Seconds(5);
};

/**
 * A RelayStore backed by Redis.
 *
 * Plain values are Redis strings. Lists are hashes whose fields are
 * zero-padded sequence numbers drawn from a per-list counter, so sorting the
 * fields restores insertion order. Every write publishes on a per-key
 * channel; each watch owns a subscriber connection and a thread that re-reads
 * the full value whenever the channel fires.
 *
 * @headerfile boardlink/signaling/redis_relay_store.h
 */
class RedisRelayStore final : public RelayStore {
 public:
  static absl::StatusOr<std::unique_ptr<RedisRelayStore>> Connect(
      RedisRelayOptions options = {});

  ~RedisRelayStore() override = default;

  RedisRelayStore(const RedisRelayStore&) = delete;
  RedisRelayStore& operator=(const RedisRelayStore&) = delete;

  absl::Status Set(std::string_view key, std::string_view value) override;
  absl::StatusOr<std::string> Append(std::string_view key,
                                     std::string_view value) override;
  absl::StatusOr<std::optional<std::string>> Get(
      std::string_view key) override;
  absl::StatusOr<std::vector<RelayEntry>> List(std::string_view key) override;
  absl::StatusOr<bool> Exists(std::string_view prefix) override;
  absl::Status RemoveTree(std::string_view prefix) override;

  // Watches must be destroyed before the store.
  absl::StatusOr<std::unique_ptr<RelayWatch>> WatchValue(
      std::string_view key, RelayValueHandler on_value,
      RelayErrorHandler on_error) override;
  absl::StatusOr<std::unique_ptr<RelayWatch>> WatchList(
      std::string_view key, RelayListHandler on_list,
      RelayErrorHandler on_error) override;

 private:
  class Watch;

  explicit RedisRelayStore(RedisRelayOptions options,
                           internal::RedisContextPtr context);

  std::string ValueKey(std::string_view key) const;
  std::string ListKey(std::string_view key) const;
  std::string SequenceKey(std::string_view key) const;
  std::string ChangeChannel(std::string_view key) const;

  // Runs one command on the shared connection, reconnecting first if the
  // previous command broke it. The failed command itself is never retried.
  absl::StatusOr<internal::RedisReplyPtr> Execute(
      const std::vector<std::string>& args);

  // Collects every key matching `<type_prefix><prefix>` that is the prefix
  // itself or lies below it.
  absl::StatusOr<std::vector<std::string>> ScanTree(
      std::string_view type_prefix, std::string_view prefix,
      bool stop_at_first);

  absl::StatusOr<std::unique_ptr<RelayWatch>> StartWatch(
      std::string_view key, bool is_list, RelayValueHandler on_value,
      RelayListHandler on_list, RelayErrorHandler on_error);

  const RedisRelayOptions options_;

  Mutex mu_;
  internal::RedisContextPtr context_ ABSL_GUARDED_BY(mu_);
};

}  // namespace boardlink

#endif  // BOARDLINK_SIGNALING_REDIS_RELAY_STORE_H_
