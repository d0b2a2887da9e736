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

#ifndef _MPU_INCLUDE_CLIENT_PARTUPLOADTASK_H_  // NOLINT
#define _MPU_INCLUDE_CLIENT_PARTUPLOADTASK_H_  // NOLINT

#include <atomic>
#include <memory>
#include <mutex>  // NOLINT
#include <string>

#include "base/Outcome.h"
#include "base/Poll.h"
#include "base/ThreadPool.h"
#include "base/Waker.h"
#include "client/MPUError.h"
#include "client/RemoteStore.h"
#include "data/Part.h"
#include "data/Splitter.h"

namespace MPU {

namespace Client {

using PartUploadOutcome = Outcome<CompletedPart, UploadError>;
using PartUploadTaskBase = MPU::Threading::AsyncTask<CompletedPart, UploadError>;

// Upload of one part, resolving to the part number and its etag
//
// The request starts at the first poll. With an executor the blocking
// RemoteStore::UploadPart runs on a worker thread which wakes the poller
// when done, otherwise it runs inline within the first poll.
class PartUploadTask : public PartUploadTaskBase {
 public:
  PartUploadTask(const std::shared_ptr<RemoteStore> &store,
                 MPU::Threading::ThreadPool *executor,
                 const std::string &bucket, const std::string &key,
                 const std::string &uploadId, MPU::Data::Part &&part);

  PartUploadTask(PartUploadTask &&) = delete;
  PartUploadTask(const PartUploadTask &) = delete;
  PartUploadTask &operator=(PartUploadTask &&) = delete;
  PartUploadTask &operator=(const PartUploadTask &) = delete;
  ~PartUploadTask() = default;

 public:
  MPU::Threading::PollState Poll(const MPU::Threading::Waker &waker,
                                 PartUploadOutcome *outcome) override;

  // Mark the task abandoned. A request not yet started is skipped, a result
  // arriving later is dropped.
  void Abandon() override;

  int GetPartNumber() const { return m_part->partNumber; }
  bool IsStarted() const { return m_started; }
  bool IsAbandoned() const { return m_state->abandoned.load(); }

 private:
  // Shared with the worker, which may outlive the task
  struct State {
    State() : done(false), abandoned(false) {}

    std::mutex lock;
    bool done;
    PartUploadOutcome result;
    MPU::Threading::Waker waker;
    std::atomic<bool> abandoned;
  };

  void Start();

 private:
  std::shared_ptr<RemoteStore> m_store;
  MPU::Threading::ThreadPool *m_executor;  // not owned, may be null
  std::string m_bucket;
  std::string m_key;
  std::string m_uploadId;
  std::shared_ptr<const MPU::Data::Part> m_part;
  bool m_started;
  std::shared_ptr<State> m_state;
};

// Turn each part from the splitter into an upload task
//
// Splitter errors are passed through unchanged.
class PartUploadTaskStream
    : public MPU::Threading::Stream<std::unique_ptr<PartUploadTaskBase>,
                                    UploadError> {
 public:
  using TaskOutcome = Outcome<std::unique_ptr<PartUploadTaskBase>, UploadError>;

  PartUploadTaskStream(std::unique_ptr<MPU::Data::PartStream> parts,
                       const std::shared_ptr<RemoteStore> &store,
                       MPU::Threading::ThreadPool *executor,
                       const std::string &bucket, const std::string &key,
                       const std::string &uploadId);

  PartUploadTaskStream(PartUploadTaskStream &&) = delete;
  PartUploadTaskStream(const PartUploadTaskStream &) = delete;
  PartUploadTaskStream &operator=(PartUploadTaskStream &&) = delete;
  PartUploadTaskStream &operator=(const PartUploadTaskStream &) = delete;
  ~PartUploadTaskStream() = default;

 public:
  MPU::Threading::PollState PollNext(const MPU::Threading::Waker &waker,
                                     TaskOutcome *task) override;

 private:
  std::unique_ptr<MPU::Data::PartStream> m_parts;
  std::shared_ptr<RemoteStore> m_store;
  MPU::Threading::ThreadPool *m_executor;
  std::string m_bucket;
  std::string m_key;
  std::string m_uploadId;
};

}  // namespace Client
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_CLIENT_PARTUPLOADTASK_H_
