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

/**
 * @file
 * @brief
 *   Concurrency primitives for boardlink.
 *
 * Relay subscriptions, peer connection hooks and data channel callbacks all
 * arrive on threads owned by the libraries that produce them. Every piece of
 * shared mutable state in boardlink is guarded by the primitives declared
 * here, which are thin aliases of the Abseil synchronization types.
 *
 * @headerfile boardlink/concurrency/concurrency.h
 */

#ifndef BOARDLINK_CONCURRENCY_CONCURRENCY_H_
#define BOARDLINK_CONCURRENCY_CONCURRENCY_H_

#include <absl/base/attributes.h>
#include <absl/base/thread_annotations.h>
#include <absl/synchronization/mutex.h>
#include <absl/synchronization/notification.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

/** @private */
namespace boardlink::concurrency {

using CondVar = absl::CondVar;
using Mutex = absl::Mutex;
using MutexLock = absl::MutexLock;
using Notification = absl::Notification;

inline void SleepFor(absl::Duration duration) {
  absl::SleepFor(duration);
}

}  // namespace boardlink::concurrency

namespace boardlink {

using concurrency::CondVar;
using concurrency::Mutex;
using concurrency::MutexLock;
using concurrency::Notification;

/** @brief
 *    Sleeps for the given duration.
 *
 * @param duration
 *   The duration to sleep for.
 */
inline void SleepFor(absl::Duration duration) {
  concurrency::SleepFor(duration);
}

}  // namespace boardlink

#endif  // BOARDLINK_CONCURRENCY_CONCURRENCY_H_
