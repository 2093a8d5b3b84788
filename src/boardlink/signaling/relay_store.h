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

#ifndef BOARDLINK_SIGNALING_RELAY_STORE_H_
#define BOARDLINK_SIGNALING_RELAY_STORE_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

/**
 * @file
 * @brief
 *   The key-value publish/subscribe service sessions are bootstrapped over.
 *
 * The relay is a neutral, low-trust store. It holds plain values and
 * append-only lists of entries under slash-separated keys, and notifies
 * watchers when a key changes. Notifications always carry the full current
 * value (or the full list), never a delta.
 *
 * @headerfile boardlink/signaling/relay_store.h
 */

namespace boardlink {

struct RelayEntry {
  bool operator==(const RelayEntry& other) const {
    return key == other.key && value == other.value;
  }

  // Stable, unique within its list, and ordered by insertion.
  std::string key;
  std::string value;
};

// Called with the full current value, or nullopt if the key is absent.
using RelayValueHandler =
    std::function<void(const std::optional<std::string>& value)>;
// Called with every entry of the list in insertion order.
using RelayListHandler =
    std::function<void(const std::vector<RelayEntry>& entries)>;
// Called when the watch itself fails (for example, the relay connection
// dropped). The watch is dead afterwards.
using RelayErrorHandler = std::function<void(const absl::Status& status)>;

/**
 * A live subscription to a relay key. Destroying the watch cancels it.
 *
 * After Cancel() returns no new delivery starts, but one that is already
 * running on another thread may still complete.
 */
class RelayWatch {
 public:
  virtual ~RelayWatch() = default;

  virtual void Cancel() = 0;
};

class RelayStore {
 public:
  virtual ~RelayStore() = default;

  /** Sets a plain value, overwriting any previous one. */
  virtual absl::Status Set(std::string_view key, std::string_view value) = 0;

  /**
   * Appends an entry to the list at `key` and returns the entry's generated
   * key. Existing entries are never modified.
   */
  virtual absl::StatusOr<std::string> Append(std::string_view key,
                                             std::string_view value) = 0;

  virtual absl::StatusOr<std::optional<std::string>> Get(
      std::string_view key) = 0;

  virtual absl::StatusOr<std::vector<RelayEntry>> List(
      std::string_view key) = 0;

  /** Whether any value or list lives at or below `prefix`. */
  virtual absl::StatusOr<bool> Exists(std::string_view prefix) = 0;

  /**
   * Removes every value and list at or below `prefix`. Removing an absent
   * tree is not an error.
   */
  virtual absl::Status RemoveTree(std::string_view prefix) = 0;

  /**
   * Watches a plain value. `on_value` is called once with the current value
   * shortly after registration, then again after every change.
   */
  virtual absl::StatusOr<std::unique_ptr<RelayWatch>> WatchValue(
      std::string_view key, RelayValueHandler on_value,
      RelayErrorHandler on_error) = 0;

  /**
   * Watches a list. `on_list` is called once with the current entries shortly
   * after registration, then again with all entries after every change.
   */
  virtual absl::StatusOr<std::unique_ptr<RelayWatch>> WatchList(
      std::string_view key, RelayListHandler on_list,
      RelayErrorHandler on_error) = 0;
};

}  // namespace boardlink

#endif  // BOARDLINK_SIGNALING_RELAY_STORE_H_
