// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#ifndef _MPU_INCLUDE_BASE_POLL_H_  // NOLINT
#define _MPU_INCLUDE_BASE_POLL_H_  // NOLINT

#include "base/Outcome.h"
#include "base/Waker.h"

namespace MPU {

namespace Threading {

enum class PollState : int {
  Pending,   // no progress yet, the waker will be woken on progress
  Ready,     // an outcome has been written
  Exhausted  // nothing more will ever be produced
};

// Pull based sequence of fallible items.
//
// PollNext either writes the next item (success or error) to *item and
// returns Ready, returns Pending after arranging for waker to be woken, or
// returns Exhausted once the sequence has ended. It is never polled again
// after Exhausted.
template <typename Item, typename Err>
class Stream {
 public:
  Stream() = default;
  virtual ~Stream() = default;

 public:
  virtual PollState PollNext(const Waker &waker, Outcome<Item, Err> *item) = 0;
};

// Deferred operation resolving to one fallible result.
//
// Poll returns Ready once with the result written to *outcome, otherwise
// Pending. Abandon tells the task its result is no longer wanted, the task
// must stop as soon as it can and must not be polled afterwards.
template <typename Result, typename Err>
class AsyncTask {
 public:
  AsyncTask() = default;
  virtual ~AsyncTask() = default;

 public:
  virtual PollState Poll(const Waker &waker, Outcome<Result, Err> *outcome) = 0;
  virtual void Abandon() = 0;
};

}  // namespace Threading
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_POLL_H_
