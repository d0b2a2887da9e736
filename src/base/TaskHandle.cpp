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

#include "base/TaskHandle.h"

#include "base/ThreadPool.h"

namespace MPU {

namespace Threading {

// m_worker is declared last so the thread sees initialized members
TaskHandle::TaskHandle(ThreadPool *pool)
    : m_pool(pool),
      m_stopped(false),
      m_finished(0),
      m_worker(&TaskHandle::Run, this) {}

// --------------------------------------------------------------------------
TaskHandle::~TaskHandle() {
  Stop();
  if (m_worker.joinable()) {
    m_worker.join();
  }
}

// --------------------------------------------------------------------------
void TaskHandle::Run() {
  Task task;
  while (m_pool->WaitForTask(*this, &task)) {
    task();
    task = nullptr;  // release captures before blocking again
    ++m_finished;
  }
}

}  // namespace Threading
}  // namespace MPU
