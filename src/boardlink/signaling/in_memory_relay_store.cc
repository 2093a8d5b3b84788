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

#include "boardlink/signaling/in_memory_relay_store.h"

#include <algorithm>
#include <utility>

#include <absl/log/log.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "boardlink/errors/errors.h"

namespace boardlink {

namespace {

bool IsUnderPrefix(std::string_view key, std::string_view prefix) {
  if (!absl::StartsWith(key, prefix)) {
    return false;
  }
  return key.size() == prefix.size() || prefix.empty() ||
         prefix.back() == '/' || key[prefix.size()] == '/';
}

}  // namespace

class InMemoryRelayStore::Watch final : public RelayWatch {
 public:
  Watch(InMemoryRelayStore* store, std::shared_ptr<Watcher> watcher)
      : store_(store), watcher_(std::move(watcher)) {}

  ~Watch() override { Cancel(); }

  void Cancel() override {
    if (watcher_->cancelled.exchange(true)) {
      return;
    }
    store_->RemoveWatcher(watcher_.get());
  }

 private:
  InMemoryRelayStore* const store_;
  const std::shared_ptr<Watcher> watcher_;
};

InMemoryRelayStore::InMemoryRelayStore()
    : dispatcher_([this]() { DispatchLoop(); }) {}

InMemoryRelayStore::~InMemoryRelayStore() {
  {
    MutexLock lock(&mu_);
    stopping_ = true;
    cv_.SignalAll();
  }
  dispatcher_.join();
}

absl::Status InMemoryRelayStore::Set(std::string_view key,
                                     std::string_view value) {
  MutexLock lock(&mu_);
  if (writes_fail_) {
    return RelayWriteError(absl::StrCat("Relay unavailable, cannot set ", key));
  }
  values_[std::string(key)] = std::string(value);
  ++write_count_;
  NotifyKey(key);
  return absl::OkStatus();
}

absl::StatusOr<std::string> InMemoryRelayStore::Append(
    std::string_view key, std::string_view value) {
  MutexLock lock(&mu_);
  if (writes_fail_) {
    return RelayWriteError(
        absl::StrCat("Relay unavailable, cannot append to ", key));
  }
  std::string entry_key = absl::StrFormat("e%012d", next_entry_id_++);
  lists_[std::string(key)].push_back(
      RelayEntry{.key = entry_key, .value = std::string(value)});
  ++write_count_;
  NotifyKey(key);
  return entry_key;
}

absl::StatusOr<std::optional<std::string>> InMemoryRelayStore::Get(
    std::string_view key) {
  MutexLock lock(&mu_);
  if (reads_fail_) {
    return RelayReadError(absl::StrCat("Relay unavailable, cannot read ", key));
  }
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

absl::StatusOr<std::vector<RelayEntry>> InMemoryRelayStore::List(
    std::string_view key) {
  MutexLock lock(&mu_);
  if (reads_fail_) {
    return RelayReadError(absl::StrCat("Relay unavailable, cannot read ", key));
  }
  const auto it = lists_.find(key);
  if (it == lists_.end()) {
    return std::vector<RelayEntry>();
  }
  return it->second;
}

absl::StatusOr<bool> InMemoryRelayStore::Exists(std::string_view prefix) {
  MutexLock lock(&mu_);
  if (reads_fail_) {
    return RelayReadError(
        absl::StrCat("Relay unavailable, cannot read ", prefix));
  }
  for (auto it = values_.lower_bound(prefix);
       it != values_.end() && absl::StartsWith(it->first, prefix); ++it) {
    if (IsUnderPrefix(it->first, prefix)) {
      return true;
    }
  }
  for (auto it = lists_.lower_bound(prefix);
       it != lists_.end() && absl::StartsWith(it->first, prefix); ++it) {
    if (IsUnderPrefix(it->first, prefix) && !it->second.empty()) {
      return true;
    }
  }
  return false;
}

absl::Status InMemoryRelayStore::RemoveTree(std::string_view prefix) {
  MutexLock lock(&mu_);
  if (writes_fail_) {
    return RelayWriteError(
        absl::StrCat("Relay unavailable, cannot remove ", prefix));
  }

  std::vector<std::string> removed;
  for (auto it = values_.lower_bound(prefix);
       it != values_.end() && absl::StartsWith(it->first, prefix);) {
    if (IsUnderPrefix(it->first, prefix)) {
      removed.push_back(it->first);
      it = values_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto it = lists_.lower_bound(prefix);
       it != lists_.end() && absl::StartsWith(it->first, prefix);) {
    if (IsUnderPrefix(it->first, prefix)) {
      removed.push_back(it->first);
      it = lists_.erase(it);
    } else {
      ++it;
    }
  }

  ++write_count_;
  for (const std::string& key : removed) {
    NotifyKey(key);
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<RelayWatch>> InMemoryRelayStore::WatchValue(
    std::string_view key, RelayValueHandler on_value,
    RelayErrorHandler /*on_error*/) {
  // The in-memory relay cannot lose its connection, so watches never report
  // errors.
  auto watcher = std::make_shared<Watcher>();
  watcher->key = std::string(key);
  watcher->on_value = std::move(on_value);
  return AddWatcher(std::move(watcher));
}

absl::StatusOr<std::unique_ptr<RelayWatch>> InMemoryRelayStore::WatchList(
    std::string_view key, RelayListHandler on_list,
    RelayErrorHandler /*on_error*/) {
  auto watcher = std::make_shared<Watcher>();
  watcher->key = std::string(key);
  watcher->is_list = true;
  watcher->on_list = std::move(on_list);
  return AddWatcher(std::move(watcher));
}

absl::StatusOr<std::unique_ptr<RelayWatch>> InMemoryRelayStore::AddWatcher(
    std::shared_ptr<Watcher> watcher) {
  MutexLock lock(&mu_);
  if (reads_fail_) {
    return RelayReadError(
        absl::StrCat("Relay unavailable, cannot watch ", watcher->key));
  }
  watchers_[watcher->key].push_back(watcher);
  EnqueueSnapshot(watcher);
  return std::make_unique<Watch>(this, std::move(watcher));
}

void InMemoryRelayStore::RemoveWatcher(const Watcher* watcher) {
  MutexLock lock(&mu_);
  const auto it = watchers_.find(watcher->key);
  if (it == watchers_.end()) {
    return;
  }
  std::vector<std::shared_ptr<Watcher>>& list = it->second;
  list.erase(std::remove_if(list.begin(), list.end(),
                            [watcher](const std::shared_ptr<Watcher>& w) {
                              return w.get() == watcher;
                            }),
             list.end());
  if (list.empty()) {
    watchers_.erase(it);
  }
}

void InMemoryRelayStore::EnqueueSnapshot(
    const std::shared_ptr<Watcher>& watcher) {
  Delivery delivery{.watcher = watcher};
  if (watcher->is_list) {
    if (const auto it = lists_.find(watcher->key); it != lists_.end()) {
      delivery.entries = it->second;
    }
  } else {
    if (const auto it = values_.find(watcher->key); it != values_.end()) {
      delivery.value = it->second;
    }
  }
  queue_.push_back(std::move(delivery));
  ++enqueued_;
  cv_.SignalAll();
}

void InMemoryRelayStore::NotifyKey(std::string_view key) {
  const auto it = watchers_.find(key);
  if (it == watchers_.end()) {
    return;
  }
  for (const std::shared_ptr<Watcher>& watcher : it->second) {
    EnqueueSnapshot(watcher);
  }
}

void InMemoryRelayStore::Flush() {
  MutexLock lock(&mu_);
  const uint64_t target = enqueued_;
  while (delivered_ < target && !stopping_) {
    cv_.Wait(&mu_);
  }
}

void InMemoryRelayStore::SetWritesFail(bool fail) {
  MutexLock lock(&mu_);
  writes_fail_ = fail;
}

void InMemoryRelayStore::SetReadsFail(bool fail) {
  MutexLock lock(&mu_);
  reads_fail_ = fail;
}

int64_t InMemoryRelayStore::write_count() const {
  MutexLock lock(&mu_);
  return write_count_;
}

void InMemoryRelayStore::DispatchLoop() {
  MutexLock lock(&mu_);
  while (true) {
    while (queue_.empty() && !stopping_) {
      cv_.Wait(&mu_);
    }
    if (stopping_) {
      break;
    }

    Delivery delivery = std::move(queue_.front());
    queue_.pop_front();

    mu_.Unlock();
    if (!delivery.watcher->cancelled) {
      if (delivery.watcher->is_list) {
        delivery.watcher->on_list(delivery.entries);
      } else {
        delivery.watcher->on_value(delivery.value);
      }
    }
    mu_.Lock();

    ++delivered_;
    cv_.SignalAll();
  }

  if (!queue_.empty()) {
    DLOG(INFO) << "InMemoryRelayStore dropping " << queue_.size()
               << " undelivered notifications on shutdown.";
  }
}

}  // namespace boardlink
