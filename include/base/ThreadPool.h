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

#ifndef _MPU_INCLUDE_BASE_THREADPOOL_H_  // NOLINT
#define _MPU_INCLUDE_BASE_THREADPOOL_H_  // NOLINT

#include <stddef.h>

#include <condition_variable>  // NOLINT
#include <deque>
#include <functional>
#include <memory>
#include <mutex>  // NOLINT
#include <utility>
#include <vector>

#include "gtest/gtest_prod.h"  // FRIEND_TEST

namespace MPU {

namespace Threading {

class TaskHandle;

using Task = std::function<void()>;

// Fixed size pool of worker threads sharing one FIFO queue.
//
// Tasks which are still queued when the pool is destroyed are dropped,
// tasks already running are joined.
class ThreadPool {
 public:
  explicit ThreadPool(size_t poolSize);
  ~ThreadPool();

  ThreadPool(ThreadPool &&) = delete;
  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

 public:
  size_t GetPoolSize() const { return m_workers.size(); }

  // Number of tasks the workers have finished so far
  size_t GetFinishedTaskCount() const;

  // Queue a task, urgent task jumps ahead of everything already queued
  void SubmitToThread(Task &&task, bool urgent = false);

  template <typename F, typename... Args>
  void Submit(F &&f, Args &&... args);

  // Run f(args...) on a worker, then hand its return value to handler
  // together with args, i.e. handler(f(args...), args...).
  template <typename ReceivedHandler, typename F, typename... Args>
  void SubmitAsync(ReceivedHandler &&handler, F &&f, Args &&... args);

 private:
  // Block the calling worker until a task is available or the worker has
  // been told to quit.
  //
  // @param  : the calling worker, output slot for the task
  // @return : false if the worker should exit
  bool WaitForTask(const TaskHandle &worker, Task *task);

  // Tell every worker to quit. Pending tasks are never run afterwards.
  // Only the destructor and the interrupt test call this.
  void StopProcessing();
  FRIEND_TEST(ThreadPoolTest, TestInterrupt);

 private:
  std::deque<Task> m_pending;
  std::mutex m_pendingLock;
  std::condition_variable m_pendingCond;
  std::vector<std::unique_ptr<TaskHandle>> m_workers;

  friend class TaskHandle;
};

template <typename F, typename... Args>
void ThreadPool::Submit(F &&f, Args &&... args) {
  SubmitToThread(std::bind(std::forward<F>(f), std::forward<Args>(args)...));
}

template <typename ReceivedHandler, typename F, typename... Args>
void ThreadPool::SubmitAsync(ReceivedHandler &&handler, F &&f,
                             Args &&... args) {
  auto task =
      std::bind(std::forward<ReceivedHandler>(handler),
                std::bind(std::forward<F>(f), std::forward<Args>(args)...),
                std::forward<Args>(args)...);
  SubmitToThread([task]() { task(); });
}

}  // namespace Threading
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_THREADPOOL_H_
