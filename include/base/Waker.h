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

#ifndef _MPU_INCLUDE_BASE_WAKER_H_  // NOLINT
#define _MPU_INCLUDE_BASE_WAKER_H_  // NOLINT

#include <stdint.h>

#include <condition_variable>  // NOLINT
#include <memory>
#include <mutex>  // NOLINT

namespace MPU {

namespace Threading {

// Wake-up signal between a poller and the work it polls.
//
// Copies share one signal. A worker calls Wake when it has made progress,
// the poller blocks in Wait until then. A Wake that happens before Wait is
// not lost, Wait consumes it and returns at once.
class Waker {
 public:
  Waker() : m_signal(std::make_shared<Signal>()) {}

  // No move operations, a moved-from waker would lose its signal.
  Waker(const Waker &) = default;
  Waker &operator=(const Waker &) = default;
  ~Waker() = default;

 public:
  void Wake() const;

  // Block until woken
  void Wait() const;

  // Block until woken or timeout
  //
  // @param  : time out in milliseconds
  // @return : true if woken, false if timeout
  bool WaitFor(uint32_t milliseconds) const;

 private:
  struct Signal {
    std::mutex m_mutex;
    std::condition_variable m_conditionVariable;
    bool m_woken = false;
  };

  std::shared_ptr<Signal> m_signal;
};

}  // namespace Threading
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_WAKER_H_
