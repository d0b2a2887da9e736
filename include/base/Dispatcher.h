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

#ifndef _MPU_INCLUDE_BASE_DISPATCHER_H_  // NOLINT
#define _MPU_INCLUDE_BASE_DISPATCHER_H_  // NOLINT

#include <stddef.h>

#include <memory>
#include <utility>
#include <vector>

#include "base/Outcome.h"
#include "base/Poll.h"
#include "base/Waker.h"

namespace MPU {

namespace Threading {

// Bounded concurrency executor over a lazily produced sequence of tasks.
//
// Tasks are pulled from the input stream and admitted while fewer than
// 'limit' are in flight (limit 0 means no bound). Every poll pass polls all
// in flight tasks, and results are collected in completion order. The pass
// repeats while it changed the number of tasks in flight, as a finished task
// frees a slot for the next one.
//
// The first error, from the input or from a task, abandons every task in
// flight and becomes the outcome. Nothing is admitted after that.
//
// The dispatcher never creates threads. It runs on the thread that polls it.
template <typename Result, typename Err>
class Dispatcher {
 public:
  using TaskType = AsyncTask<Result, Err>;
  using TaskPtr = std::unique_ptr<TaskType>;
  using TaskStream = Stream<TaskPtr, Err>;
  using DispatchOutcome = Outcome<std::vector<Result>, Err>;

  Dispatcher(std::unique_ptr<TaskStream> input, size_t limit)
      : m_input(std::move(input)),
        m_limit(limit),
        m_inputDone(false),
        m_finished(false),
        m_admittedCount(0) {}

  Dispatcher(Dispatcher &&) = delete;
  Dispatcher(const Dispatcher &) = delete;
  Dispatcher &operator=(Dispatcher &&) = delete;
  Dispatcher &operator=(const Dispatcher &) = delete;

  ~Dispatcher() { AbandonAll(); }

 public:
  // Advance admission and every task in flight
  //
  // @param  : waker to be woken on progress, outcome
  // @return : Ready with *outcome written once all tasks succeeded or the
  //           first error occurred, Pending otherwise, Exhausted if polled
  //           again after Ready
  PollState Poll(const Waker &waker, DispatchOutcome *outcome);

  // Poll until ready, waiting on waker between passes
  //
  // @param  : waker shared with the tasks
  // @return : outcome of the dispatch
  DispatchOutcome Run(const Waker &waker);

  size_t GetLimit() const { return m_limit; }
  size_t GetInFlightCount() const { return m_tasks.size(); }
  size_t GetAdmittedCount() const { return m_admittedCount; }
  bool IsInputExhausted() const { return m_inputDone; }
  bool IsFinished() const { return m_finished; }

 private:
  bool HasFreeSlot() const { return m_limit == 0 || m_tasks.size() < m_limit; }

  // Signal abandon to each task in flight and drop them
  void AbandonAll();

  PollState Fail(const Err &err, DispatchOutcome *outcome);

 private:
  std::unique_ptr<TaskStream> m_input;
  size_t m_limit;
  bool m_inputDone;
  bool m_finished;
  size_t m_admittedCount;
  std::vector<TaskPtr> m_tasks;
  std::vector<Result> m_results;
};

// --------------------------------------------------------------------------
template <typename Result, typename Err>
PollState Dispatcher<Result, Err>::Poll(const Waker &waker,
                                        DispatchOutcome *outcome) {
  if (m_finished) {
    return PollState::Exhausted;
  }

  while (true) {
    while (!m_inputDone && HasFreeSlot()) {
      Outcome<TaskPtr, Err> next;
      PollState state = m_input->PollNext(waker, &next);
      if (state == PollState::Pending) {
        break;
      } else if (state == PollState::Exhausted) {
        m_inputDone = true;
        break;
      }
      if (!next.IsSuccess()) {
        return Fail(next.GetError(), outcome);
      }
      TaskPtr task = next.GetResultWithOwnership();
      if (task) {
        m_tasks.push_back(std::move(task));
        ++m_admittedCount;
      }
    }

    size_t before = m_tasks.size();
    size_t i = 0;
    while (i < m_tasks.size()) {
      Outcome<Result, Err> result;
      if (m_tasks[i]->Poll(waker, &result) == PollState::Ready) {
        // swap remove, order of tasks in flight is irrelevant
        if (i + 1 != m_tasks.size()) {
          std::swap(m_tasks[i], m_tasks.back());
        }
        m_tasks.pop_back();
        if (!result.IsSuccess()) {
          return Fail(result.GetError(), outcome);
        }
        m_results.push_back(result.GetResultWithOwnership());
      } else {
        ++i;
      }
    }
    size_t after = m_tasks.size();

    if (m_inputDone && m_tasks.empty()) {
      m_finished = true;
      *outcome = DispatchOutcome(std::move(m_results));
      m_results.clear();
      return PollState::Ready;
    } else if (before == after) {
      return PollState::Pending;
    }
  }
}

// --------------------------------------------------------------------------
template <typename Result, typename Err>
typename Dispatcher<Result, Err>::DispatchOutcome Dispatcher<Result, Err>::Run(
    const Waker &waker) {
  DispatchOutcome outcome;
  while (Poll(waker, &outcome) == PollState::Pending) {
    waker.Wait();
  }
  return outcome;
}

// --------------------------------------------------------------------------
template <typename Result, typename Err>
void Dispatcher<Result, Err>::AbandonAll() {
  for (auto &task : m_tasks) {
    task->Abandon();
  }
  m_tasks.clear();
}

// --------------------------------------------------------------------------
template <typename Result, typename Err>
PollState Dispatcher<Result, Err>::Fail(const Err &err,
                                        DispatchOutcome *outcome) {
  AbandonAll();
  m_results.clear();
  m_finished = true;
  *outcome = DispatchOutcome(err);
  return PollState::Ready;
}

}  // namespace Threading
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_DISPATCHER_H_
