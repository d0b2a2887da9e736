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

#include "base/Waker.h"

#include <chrono>  // NOLINT
#include <mutex>   // NOLINT

namespace MPU {

namespace Threading {

using std::lock_guard;
using std::mutex;
using std::unique_lock;

void Waker::Wake() const {
  {
    lock_guard<mutex> lock(m_signal->m_mutex);
    m_signal->m_woken = true;
  }
  m_signal->m_conditionVariable.notify_all();
}

void Waker::Wait() const {
  unique_lock<mutex> lock(m_signal->m_mutex);
  m_signal->m_conditionVariable.wait(lock,
                                     [this] { return m_signal->m_woken; });
  m_signal->m_woken = false;
}

bool Waker::WaitFor(uint32_t milliseconds) const {
  unique_lock<mutex> lock(m_signal->m_mutex);
  bool woken = m_signal->m_conditionVariable.wait_for(
      lock, std::chrono::milliseconds(milliseconds),
      [this] { return m_signal->m_woken; });
  m_signal->m_woken = false;
  return woken;
}

}  // namespace Threading
}  // namespace MPU
