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

#ifndef BOARDLINK_SIGNALING_IN_MEMORY_RELAY_STORE_H_
#define BOARDLINK_SIGNALING_IN_MEMORY_RELAY_STORE_H_

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "boardlink/concurrency/concurrency.h"
#include "boardlink/signaling/relay_store.h"

namespace boardlink {

/**
 * A process-local RelayStore.
 *
 * Notifications are delivered asynchronously, in write order, on a single
 * dispatcher thread owned by the store, and carry a snapshot taken at the
 * time of the write. Both peers of a loopback session can share one store.
 *
 * @headerfile boardlink/signaling/in_memory_relay_store.h
 */
class InMemoryRelayStore final : public RelayStore {
 public:
  InMemoryRelayStore();
  ~InMemoryRelayStore() override;

  InMemoryRelayStore(const InMemoryRelayStore&) = delete;
  InMemoryRelayStore& operator=(const InMemoryRelayStore&) = delete;

  absl::Status Set(std::string_view key, std::string_view value) override;
  absl::StatusOr<std::string> Append(std::string_view key,
                                     std::string_view value) override;
  absl::StatusOr<std::optional<std::string>> Get(
      std::string_view key) override;
  absl::StatusOr<std::vector<RelayEntry>> List(std::string_view key) override;
  absl::StatusOr<bool> Exists(std::string_view prefix) override;
  absl::Status RemoveTree(std::string_view prefix) override;

  absl::StatusOr<std::unique_ptr<RelayWatch>> WatchValue(
      std::string_view key, RelayValueHandler on_value,
      RelayErrorHandler on_error) override;
  absl::StatusOr<std::unique_ptr<RelayWatch>> WatchList(
      std::string_view key, RelayListHandler on_list,
      RelayErrorHandler on_error) override;

  // Blocks until every notification queued before the call has been
  // delivered. Must not be called from a watch handler.
  void Flush();

  // Fault injection: while set, writes fail with RelayWriteError and reads
  // with RelayReadError.
  void SetWritesFail(bool fail);
  void SetReadsFail(bool fail);

  // Failed writes are not counted.
  int64_t write_count() const;

 private:
  struct Watcher {
    std::string key;
    bool is_list = false;
    RelayValueHandler on_value;
    RelayListHandler on_list;
    std::atomic<bool> cancelled = false;
  };

  struct Delivery {
    std::shared_ptr<Watcher> watcher;
    std::optional<std::string> value;
    std::vector<RelayEntry> entries;
  };

  class Watch;

  void EnqueueSnapshot(const std::shared_ptr<Watcher>& watcher)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void NotifyKey(std::string_view key) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void RemoveWatcher(const Watcher* watcher);
  absl::StatusOr<std::unique_ptr<RelayWatch>> AddWatcher(
      std::shared_ptr<Watcher> watcher);
  void DispatchLoop();

  mutable Mutex mu_;
  CondVar cv_;

  absl::btree_map<std::string, std::string> values_ ABSL_GUARDED_BY(mu_);
  absl::btree_map<std::string, std::vector<RelayEntry>> lists_
      ABSL_GUARDED_BY(mu_);
  uint64_t next_entry_id_ ABSL_GUARDED_BY(mu_) = 0;
  int64_t write_count_ ABSL_GUARDED_BY(mu_) = 0;

  absl::flat_hash_map<std::string, std::vector<std::shared_ptr<Watcher>>>
      watchers_ ABSL_GUARDED_BY(mu_);

  std::deque<Delivery> queue_ ABSL_GUARDED_BY(mu_);
  uint64_t enqueued_ ABSL_GUARDED_BY(mu_) = 0;
  uint64_t delivered_ ABSL_GUARDED_BY(mu_) = 0;

  bool writes_fail_ ABSL_GUARDED_BY(mu_) = false;
  bool reads_fail_ ABSL_GUARDED_BY(mu_) = false;
  bool stopping_ ABSL_GUARDED_BY(mu_) = false;

  std::thread dispatcher_;
};

}  // namespace boardlink

#endif  // BOARDLINK_SIGNALING_IN_MEMORY_RELAY_STORE_H_
