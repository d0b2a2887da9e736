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

#include "base/ThreadPool.h"

#include <utility>

#include "base/TaskHandle.h"

namespace MPU {

namespace Threading {

using std::lock_guard;
using std::mutex;
using std::unique_lock;

ThreadPool::ThreadPool(size_t poolSize) {
  m_workers.reserve(poolSize);
  for (size_t i = 0; i < poolSize; ++i) {
    m_workers.emplace_back(new TaskHandle(this));
  }
}

// --------------------------------------------------------------------------
ThreadPool::~ThreadPool() {
  StopProcessing();
  // join every worker before the queue goes away
  m_workers.clear();
}

// --------------------------------------------------------------------------
size_t ThreadPool::GetFinishedTaskCount() const {
  size_t count = 0;
  for (const auto &worker : m_workers) {
    count += worker->GetFinishedCount();
  }
  return count;
}

// --------------------------------------------------------------------------
void ThreadPool::SubmitToThread(Task &&task, bool urgent) {
  {
    lock_guard<mutex> lock(m_pendingLock);
    if (urgent) {
      m_pending.emplace_front(std::move(task));
    } else {
      m_pending.emplace_back(std::move(task));
    }
  }
  m_pendingCond.notify_one();
}

// --------------------------------------------------------------------------
bool ThreadPool::WaitForTask(const TaskHandle &worker, Task *task) {
  unique_lock<mutex> lock(m_pendingLock);
  m_pendingCond.wait(
      lock, [this, &worker] { return worker.IsStopped() || !m_pending.empty(); });
  if (worker.IsStopped()) {
    return false;
  }
  *task = std::move(m_pending.front());
  m_pending.pop_front();
  return true;
}

// --------------------------------------------------------------------------
void ThreadPool::StopProcessing() {
  {
    // stop under the queue lock so no worker sleeps through the flag change
    lock_guard<mutex> lock(m_pendingLock);
    for (auto &worker : m_workers) {
      worker->Stop();
    }
  }
  m_pendingCond.notify_all();
}

}  // namespace Threading
}  // namespace MPU
