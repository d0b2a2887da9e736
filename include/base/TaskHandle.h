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

#ifndef _MPU_INCLUDE_BASE_TASKHANDLE_H_  // NOLINT
#define _MPU_INCLUDE_BASE_TASKHANDLE_H_  // NOLINT

#include <stddef.h>

#include <atomic>
#include <thread>  // NOLINT

namespace MPU {

namespace Threading {

class ThreadPool;

// One worker thread owned by a ThreadPool. The thread starts in the ctor
// and is joined in the dtor.
class TaskHandle {
 public:
  explicit TaskHandle(ThreadPool *pool);
  ~TaskHandle();

  TaskHandle(TaskHandle &&) = delete;
  TaskHandle(const TaskHandle &) = delete;
  TaskHandle &operator=(TaskHandle &&) = delete;
  TaskHandle &operator=(const TaskHandle &) = delete;

 public:
  bool IsStopped() const { return m_stopped.load(); }
  size_t GetFinishedCount() const { return m_finished.load(); }

 private:
  void Stop() { m_stopped.store(true); }
  void Run();

 private:
  ThreadPool *m_pool;
  std::atomic<bool> m_stopped;
  std::atomic<size_t> m_finished;
  std::thread m_worker;

  friend class ThreadPool;
};

}  // namespace Threading
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_TASKHANDLE_H_
