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

#include "boardlink/signaling/relay_signaling_channel.h"

#include <utility>

#include <absl/container/flat_hash_set.h>
#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/str_cat.h>
#include <boost/json/serialize.hpp>

#include "boardlink/errors/errors.h"

namespace boardlink {

struct RelaySignalingChannel::CandidateSubscription {
  Mutex mu;
  absl::flat_hash_set<std::string> seen_keys ABSL_GUARDED_BY(mu);
  CandidateHandler handler;
};

RelaySignalingChannel::RelaySignalingChannel(std::shared_ptr<RelayStore> store,
                                             std::string_view session_id,
                                             PeerRole local_role)
    : store_(std::move(store)),
      session_id_(session_id),
      local_role_(local_role) {
  CHECK(store_ != nullptr) << "RelaySignalingChannel needs a relay store.";
}

RelaySignalingChannel::~RelaySignalingChannel() {
  std::vector<std::unique_ptr<RelayWatch>> watches;
  {
    MutexLock lock(&mu_);
    watches = std::move(watches_);
    watches_.clear();
  }
  for (const auto& watch : watches) {
    watch->Cancel();
  }
}

std::string RelaySignalingChannel::SessionPath(std::string_view session_id) {
  return absl::StrCat("session/", session_id);
}

std::string RelaySignalingChannel::PeerPath(std::string_view session_id,
                                            PeerRole role) {
  return absl::StrCat(SessionPath(session_id), "/", PeerRoleName(role));
}

std::string RelaySignalingChannel::DescriptionPath(std::string_view session_id,
                                                   PeerRole role) {
  return absl::StrCat(PeerPath(session_id, role), "/description");
}

std::string RelaySignalingChannel::CandidatesPath(std::string_view session_id,
                                                  PeerRole role) {
  return absl::StrCat(PeerPath(session_id, role), "/candidates");
}

std::string RelaySignalingChannel::StatusPath(std::string_view session_id) {
  return absl::StrCat(SessionPath(session_id), "/status");
}

absl::Status RelaySignalingChannel::CheckNotTornDown() const {
  if (torn_down_) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Signalling for session ", session_id_, " has been torn down."));
  }
  return absl::OkStatus();
}

absl::Status RelaySignalingChannel::PublishLocalDescription(
    const SessionDescription& description) {
  {
    MutexLock lock(&mu_);
    if (absl::Status status = CheckNotTornDown(); !status.ok()) {
      return status;
    }
  }
  const std::string value =
      boost::json::serialize(SessionDescriptionToJson(description));
  if (absl::Status status =
          store_->Set(DescriptionPath(session_id_, local_role_), value);
      !status.ok()) {
    LOG(ERROR) << "Could not publish " << PeerRoleName(local_role_) << " "
               << SessionDescriptionKindName(description.kind)
               << " for session " << session_id_ << ": " << status;
    return status;
  }
  DLOG(INFO) << "Published " << SessionDescriptionKindName(description.kind)
             << " for session " << session_id_;
  return absl::OkStatus();
}

absl::Status RelaySignalingChannel::PublishCandidate(
    const IceCandidate& candidate) {
  {
    MutexLock lock(&mu_);
    if (absl::Status status = CheckNotTornDown(); !status.ok()) {
      return status;
    }
  }
  const std::string value =
      boost::json::serialize(IceCandidateToJson(candidate));
  absl::StatusOr<std::string> entry_key =
      store_->Append(CandidatesPath(session_id_, local_role_), value);
  if (!entry_key.ok()) {
    LOG(ERROR) << "Could not publish candidate for session " << session_id_
               << ": " << entry_key.status();
    return entry_key.status();
  }
  DLOG(INFO) << "Published candidate " << *entry_key << ": "
             << candidate.candidate;
  return absl::OkStatus();
}

absl::Status RelaySignalingChannel::SubscribeRemoteDescription(
    DescriptionHandler handler) {
  const std::string path = DescriptionPath(session_id_, RemoteRole(local_role_));
  return AddWatch(store_->WatchValue(
      path,
      [handler = std::move(handler),
       path](const std::optional<std::string>& value) {
        if (!value.has_value()) {
          return;
        }
        absl::StatusOr<boost::json::value> json = ParseJson(*value);
        if (!json.ok()) {
          LOG(WARNING) << "Ignoring malformed description at " << path << ": "
                       << json.status();
          return;
        }
        absl::StatusOr<SessionDescription> description =
            SessionDescriptionFromJson(*json);
        if (!description.ok()) {
          LOG(WARNING) << "Ignoring malformed description at " << path << ": "
                       << description.status();
          return;
        }
        handler(*description);
      },
      MakeErrorForwarder()));
}

absl::Status RelaySignalingChannel::SubscribeRemoteCandidates(
    CandidateHandler handler) {
  auto subscription = std::make_shared<CandidateSubscription>();
  subscription->handler = std::move(handler);

  const std::string path = CandidatesPath(session_id_, RemoteRole(local_role_));
  return AddWatch(store_->WatchList(
      path,
      [subscription, path](const std::vector<RelayEntry>& entries) {
        // Deliveries can come from more than one thread; holding the
        // subscription's mutex across the handler keeps candidates in
        // publication order.
        MutexLock lock(&subscription->mu);
        for (const RelayEntry& entry : entries) {
          if (!subscription->seen_keys.insert(entry.key).second) {
            continue;
          }
          absl::StatusOr<boost::json::value> json = ParseJson(entry.value);
          if (!json.ok()) {
            LOG(WARNING) << "Ignoring malformed candidate " << entry.key
                         << " at " << path << ": " << json.status();
            continue;
          }
          absl::StatusOr<IceCandidate> candidate = IceCandidateFromJson(*json);
          if (!candidate.ok()) {
            LOG(WARNING) << "Ignoring malformed candidate " << entry.key
                         << " at " << path << ": " << candidate.status();
            continue;
          }
          subscription->handler(*candidate);
        }
      },
      MakeErrorForwarder()));
}

absl::StatusOr<bool> RelaySignalingChannel::SessionExists() {
  return store_->Exists(SessionPath(session_id_));
}

absl::Status RelaySignalingChannel::PublishStatus(std::string_view status) {
  {
    MutexLock lock(&mu_);
    if (absl::Status not_torn_down = CheckNotTornDown(); !not_torn_down.ok()) {
      return not_torn_down;
    }
  }
  return store_->Set(StatusPath(session_id_), status);
}

absl::Status RelaySignalingChannel::SubscribeStatus(StatusValueHandler handler) {
  return AddWatch(store_->WatchValue(
      StatusPath(session_id_),
      [handler = std::move(handler)](const std::optional<std::string>& value) {
        if (value.has_value() && !value->empty()) {
          handler(*value);
        }
      },
      MakeErrorForwarder()));
}

void RelaySignalingChannel::OnError(SignalingErrorHandler handler) {
  MutexLock lock(&mu_);
  error_handlers_.push_back(std::move(handler));
}

absl::Status RelaySignalingChannel::Teardown() {
  std::vector<std::unique_ptr<RelayWatch>> watches;
  {
    MutexLock lock(&mu_);
    if (torn_down_) {
      return absl::OkStatus();
    }
    torn_down_ = true;
    watches = std::move(watches_);
    watches_.clear();
  }

  for (const auto& watch : watches) {
    watch->Cancel();
  }

  if (absl::Status status =
          store_->RemoveTree(PeerPath(session_id_, local_role_));
      !status.ok()) {
    LOG(ERROR) << "Could not remove " << PeerRoleName(local_role_)
               << " data of session " << session_id_ << ": " << status;
    return status;
  }
  LOG(INFO) << "Removed " << PeerRoleName(local_role_) << " data of session "
            << session_id_;
  return absl::OkStatus();
}

absl::Status RelaySignalingChannel::AddWatch(
    absl::StatusOr<std::unique_ptr<RelayWatch>> watch) {
  if (!watch.ok()) {
    return watch.status();
  }
  MutexLock lock(&mu_);
  if (torn_down_) {
    (*watch)->Cancel();
    return CheckNotTornDown();
  }
  watches_.push_back(*std::move(watch));
  return absl::OkStatus();
}

void RelaySignalingChannel::ReportError(const absl::Status& status) {
  std::vector<SignalingErrorHandler> handlers;
  {
    MutexLock lock(&mu_);
    if (torn_down_) {
      return;
    }
    handlers = error_handlers_;
  }
  LOG(ERROR) << "Signalling for session " << session_id_
             << " failed: " << status;
  for (const auto& handler : handlers) {
    handler(status);
  }
}

RelayErrorHandler RelaySignalingChannel::MakeErrorForwarder() {
  return [this](const absl::Status& status) { ReportError(status); };
}

}  // namespace boardlink
