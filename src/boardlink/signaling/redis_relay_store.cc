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

#include "boardlink/signaling/redis_relay_store.h"

#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <thread>
#include <utility>

#include <absl/log/log.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "boardlink/errors/errors.h"
#include "boardlink/util/status_macros.h"

namespace boardlink {

namespace internal {

void RedisContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

void RedisReplyDeleter::operator()(redisReply* reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

}  // namespace internal

namespace {

using internal::RedisContextPtr;
using internal::RedisReplyPtr;

absl::StatusOr<RedisContextPtr> ConnectContext(
    const RedisRelayOptions& options) {
  const int64_t timeout_us = absl::ToInt64Microseconds(options.connect_timeout);
  timeval timeout{.tv_sec = static_cast<time_t>(timeout_us / 1000000),
                  .tv_usec = static_cast<suseconds_t>(timeout_us % 1000000)};

  RedisContextPtr context(
      redisConnectWithTimeout(options.host.c_str(), options.port, timeout));
  if (context == nullptr) {
    return RelayReadError("Could not allocate a Redis context.");
  }
  if (context->err != 0) {
    return RelayReadError(absl::StrFormat("Could not connect to Redis at %s:%d: %s",
                                          options.host, options.port,
                                          context->errstr));
  }
  return context;
}

// Sends one command and takes ownership of its reply. Error replies become
// statuses built with `make_error`.
absl::StatusOr<RedisReplyPtr> RunCommand(
    redisContext* context, const std::vector<std::string>& args,
    absl::Status (*make_error)(std::string_view)) {
  std::vector<const char*> argv;
  std::vector<size_t> argv_len;
  argv.reserve(args.size());
  argv_len.reserve(args.size());
  for (const std::string& arg : args) {
    argv.push_back(arg.data());
    argv_len.push_back(arg.size());
  }

  RedisReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(
      context, static_cast<int>(argv.size()), argv.data(), argv_len.data())));
  if (reply == nullptr) {
    return make_error(absl::StrCat("Redis ", args.front(),
                                   " failed: ", context->errstr));
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    return make_error(absl::StrCat("Redis ", args.front(), " returned error: ",
                                   std::string_view(reply->str, reply->len)));
  }
  return reply;
}

std::string EscapeGlob(std::string_view text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (const char c : text) {
    if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

bool IsUnderPrefix(std::string_view key, std::string_view prefix) {
  if (!absl::StartsWith(key, prefix)) {
    return false;
  }
  return key.size() == prefix.size() || prefix.empty() ||
         prefix.back() == '/' || key[prefix.size()] == '/';
}

}  // namespace

struct WatchState {
  RedisRelayStore* store = nullptr;
  std::string key;
  bool is_list = false;
  RelayValueHandler on_value;
  RelayListHandler on_list;
  RelayErrorHandler on_error;

  Mutex mu;
  RedisContextPtr subscriber ABSL_GUARDED_BY(mu);
  bool cancelled ABSL_GUARDED_BY(mu) = false;

  bool IsCancelled() {
    MutexLock lock(&mu);
    return cancelled;
  }
};

class RedisRelayStore::Watch final : public RelayWatch {
 public:
  explicit Watch(std::shared_ptr<WatchState> state) : state_(std::move(state)) {
    thread_ = std::thread([state = state_]() { Run(state); });
  }

  ~Watch() override { Cancel(); }

  void Cancel() override {
    {
      MutexLock lock(&state_->mu);
      if (!state_->cancelled) {
        state_->cancelled = true;
        // Unblocks redisGetReply() on the watch thread.
        if (state_->subscriber != nullptr) {
          ::shutdown(state_->subscriber->fd, SHUT_RDWR);
        }
      }
    }
    if (!thread_.joinable()) {
      return;
    }
    if (thread_.get_id() == std::this_thread::get_id()) {
      // Cancelled from its own handler: the thread exits once the handler
      // returns and only touches the shared state from then on.
      thread_.detach();
    } else {
      thread_.join();
    }
  }

 private:
  static void Deliver(WatchState* state) {
    if (state->IsCancelled()) {
      return;
    }
    if (state->is_list) {
      absl::StatusOr<std::vector<RelayEntry>> entries =
          state->store->List(state->key);
      if (!entries.ok()) {
        LOG(ERROR) << "Could not read list " << state->key << ": "
                   << entries.status();
        state->on_error(entries.status());
        return;
      }
      state->on_list(*entries);
    } else {
      absl::StatusOr<std::optional<std::string>> value =
          state->store->Get(state->key);
      if (!value.ok()) {
        LOG(ERROR) << "Could not read value " << state->key << ": "
                   << value.status();
        state->on_error(value.status());
        return;
      }
      state->on_value(*value);
    }
  }

  static void Run(const std::shared_ptr<WatchState>& state) {
    redisContext* subscriber;
    {
      MutexLock lock(&state->mu);
      subscriber = state->subscriber.get();
    }

    Deliver(state.get());

    while (!state->IsCancelled()) {
      void* raw_reply = nullptr;
      if (redisGetReply(subscriber, &raw_reply) != REDIS_OK) {
        if (!state->IsCancelled()) {
          state->on_error(RelayReadError(absl::StrCat(
              "Redis subscription to ", state->key,
              " was lost: ", subscriber->errstr)));
        }
        return;
      }
      RedisReplyPtr reply(static_cast<redisReply*>(raw_reply));
      // Pushes are ["message", channel, payload]; the payload is ignored
      // because the full value is re-read.
      if (reply->type == REDIS_REPLY_ARRAY && reply->elements == 3 &&
          std::string_view(reply->element[0]->str,
                           reply->element[0]->len) == "message") {
        Deliver(state.get());
      }
    }
  }

  std::shared_ptr<WatchState> state_;
  std::thread thread_;
};

absl::StatusOr<std::unique_ptr<RedisRelayStore>> RedisRelayStore::Connect(
    RedisRelayOptions options) {
  ASSIGN_OR_RETURN(RedisContextPtr context, ConnectContext(options));
  LOG(INFO) << "Connected to Redis relay at " << options.host << ":"
            << options.port;
  return std::unique_ptr<RedisRelayStore>(
      new RedisRelayStore(std::move(options), std::move(context)));
}

RedisRelayStore::RedisRelayStore(RedisRelayOptions options,
                                 RedisContextPtr context)
    : options_(std::move(options)), context_(std::move(context)) {}

std::string RedisRelayStore::ValueKey(std::string_view key) const {
  return absl::StrCat(options_.key_prefix, "v:", key);
}

std::string RedisRelayStore::ListKey(std::string_view key) const {
  return absl::StrCat(options_.key_prefix, "l:", key);
}

std::string RedisRelayStore::SequenceKey(std::string_view key) const {
  return absl::StrCat(options_.key_prefix, "seq:", key);
}

std::string RedisRelayStore::ChangeChannel(std::string_view key) const {
  return absl::StrCat(options_.key_prefix, "changed:", key);
}

absl::StatusOr<RedisReplyPtr> RedisRelayStore::Execute(
    const std::vector<std::string>& args) {
  const bool is_write = args.front() != "GET" && args.front() != "HGETALL" &&
                        args.front() != "SCAN";
  absl::Status (*make_error)(std::string_view) =
      is_write ? &RelayWriteError : &RelayReadError;

  MutexLock lock(&mu_);
  if (context_ == nullptr || context_->err != 0) {
    absl::StatusOr<RedisContextPtr> context = ConnectContext(options_);
    if (!context.ok()) {
      return make_error(context.status().message());
    }
    context_ = *std::move(context);
  }
  return RunCommand(context_.get(), args, make_error);
}

absl::Status RedisRelayStore::Set(std::string_view key,
                                  std::string_view value) {
  RETURN_IF_ERROR(
      Execute({"SET", ValueKey(key), std::string(value)}).status());
  return Execute({"PUBLISH", ChangeChannel(key), "set"}).status();
}

absl::StatusOr<std::string> RedisRelayStore::Append(std::string_view key,
                                                    std::string_view value) {
  ASSIGN_OR_RETURN(RedisReplyPtr sequence, Execute({"INCR", SequenceKey(key)}));
  if (sequence->type != REDIS_REPLY_INTEGER) {
    return RelayWriteError(
        absl::StrCat("Redis INCR on ", SequenceKey(key),
                     " did not return an integer"));
  }
  std::string entry_key = absl::StrFormat("e%012d", sequence->integer);
  RETURN_IF_ERROR(
      Execute({"HSET", ListKey(key), entry_key, std::string(value)}).status());
  RETURN_IF_ERROR(Execute({"PUBLISH", ChangeChannel(key), "append"}).status());
  return entry_key;
}

absl::StatusOr<std::optional<std::string>> RedisRelayStore::Get(
    std::string_view key) {
  ASSIGN_OR_RETURN(RedisReplyPtr reply, Execute({"GET", ValueKey(key)}));
  if (reply->type == REDIS_REPLY_NIL) {
    return std::nullopt;
  }
  if (reply->type != REDIS_REPLY_STRING) {
    return RelayReadError(
        absl::StrCat("Redis GET on ", ValueKey(key), " is not a string"));
  }
  return std::string(reply->str, reply->len);
}

absl::StatusOr<std::vector<RelayEntry>> RedisRelayStore::List(
    std::string_view key) {
  ASSIGN_OR_RETURN(RedisReplyPtr reply, Execute({"HGETALL", ListKey(key)}));
  if (reply->type != REDIS_REPLY_ARRAY && reply->type != REDIS_REPLY_MAP) {
    return RelayReadError(
        absl::StrCat("Redis HGETALL on ", ListKey(key), " is not a hash"));
  }

  std::vector<RelayEntry> entries;
  entries.reserve(reply->elements / 2);
  for (size_t i = 0; i + 1 < reply->elements; i += 2) {
    entries.push_back(RelayEntry{
        .key = std::string(reply->element[i]->str, reply->element[i]->len),
        .value = std::string(reply->element[i + 1]->str,
                             reply->element[i + 1]->len)});
  }
  std::sort(entries.begin(), entries.end(),
            [](const RelayEntry& a, const RelayEntry& b) {
              return a.key < b.key;
            });
  return entries;
}

absl::StatusOr<std::vector<std::string>> RedisRelayStore::ScanTree(
    std::string_view type_prefix, std::string_view prefix,
    bool stop_at_first) {
  const std::string store_prefix =
      absl::StrCat(options_.key_prefix, type_prefix);
  const std::string pattern =
      absl::StrCat(EscapeGlob(store_prefix), EscapeGlob(prefix), "*");

  std::vector<std::string> keys;
  std::string cursor = "0";
  do {
    ASSIGN_OR_RETURN(RedisReplyPtr reply,
                     Execute({"SCAN", cursor, "MATCH", pattern, "COUNT", "100"}));
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
      return RelayReadError("Redis SCAN returned an unexpected reply.");
    }
    cursor = std::string(reply->element[0]->str, reply->element[0]->len);
    const redisReply* batch = reply->element[1];
    for (size_t i = 0; i < batch->elements; ++i) {
      std::string key(batch->element[i]->str, batch->element[i]->len);
      std::string_view logical_key = key;
      logical_key.remove_prefix(store_prefix.size());
      if (!IsUnderPrefix(logical_key, prefix)) {
        continue;
      }
      keys.push_back(std::move(key));
      if (stop_at_first) {
        return keys;
      }
    }
  } while (cursor != "0");
  return keys;
}

absl::StatusOr<bool> RedisRelayStore::Exists(std::string_view prefix) {
  for (const std::string_view type_prefix : {"v:", "l:"}) {
    ASSIGN_OR_RETURN(std::vector<std::string> keys,
                     ScanTree(type_prefix, prefix, /*stop_at_first=*/true));
    if (!keys.empty()) {
      return true;
    }
  }
  return false;
}

absl::Status RedisRelayStore::RemoveTree(std::string_view prefix) {
  const std::string value_prefix = absl::StrCat(options_.key_prefix, "v:");
  const std::string list_prefix = absl::StrCat(options_.key_prefix, "l:");

  for (const std::string_view type_prefix : {"v:", "l:", "seq:"}) {
    absl::StatusOr<std::vector<std::string>> keys =
        ScanTree(type_prefix, prefix, /*stop_at_first=*/false);
    if (!keys.ok()) {
      return RelayWriteError(keys.status().message());
    }
    for (const std::string& key : *keys) {
      RETURN_IF_ERROR(Execute({"DEL", key}).status());

      std::string_view logical_key = key;
      if (absl::ConsumePrefix(&logical_key, value_prefix) ||
          absl::ConsumePrefix(&logical_key, list_prefix)) {
        RETURN_IF_ERROR(
            Execute({"PUBLISH", ChangeChannel(logical_key), "remove"})
                .status());
      }
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<RelayWatch>> RedisRelayStore::StartWatch(
    std::string_view key, bool is_list, RelayValueHandler on_value,
    RelayListHandler on_list, RelayErrorHandler on_error) {
  ASSIGN_OR_RETURN(RedisContextPtr subscriber, ConnectContext(options_));
  // The subscription is confirmed before the first read, so no change made
  // after the first read can be missed.
  RETURN_IF_ERROR(RunCommand(subscriber.get(),
                             {"SUBSCRIBE", ChangeChannel(key)}, &RelayReadError)
                      .status());

  auto state = std::make_shared<WatchState>();
  state->store = this;
  state->key = std::string(key);
  state->is_list = is_list;
  state->on_value = std::move(on_value);
  state->on_list = std::move(on_list);
  state->on_error = std::move(on_error);
  {
    MutexLock lock(&state->mu);
    state->subscriber = std::move(subscriber);
  }
  return std::make_unique<Watch>(std::move(state));
}

absl::StatusOr<std::unique_ptr<RelayWatch>> RedisRelayStore::WatchValue(
    std::string_view key, RelayValueHandler on_value,
    RelayErrorHandler on_error) {
  return StartWatch(key, /*is_list=*/false, std::move(on_value), nullptr,
                    std::move(on_error));
}

absl::StatusOr<std::unique_ptr<RelayWatch>> RedisRelayStore::WatchList(
    std::string_view key, RelayListHandler on_list,
    RelayErrorHandler on_error) {
  return StartWatch(key, /*is_list=*/true, nullptr, std::move(on_list),
                    std::move(on_error));
}

}  // namespace boardlink
