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

#include "client/PartUploadTask.h"

#include <exception>
#include <memory>
#include <mutex>  // NOLINT
#include <string>
#include <utility>

#include "base/HashUtils.h"
#include "base/LogMacros.h"
#include "client/MPUError.h"

namespace MPU {

namespace Client {

using MPU::Data::Part;
using MPU::Data::PartOutcome;
using MPU::Data::PartStream;
using MPU::HashUtils::Base64Encode;
using MPU::Threading::PollState;
using MPU::Threading::ThreadPool;
using MPU::Threading::Waker;
using std::lock_guard;
using std::mutex;
using std::shared_ptr;
using std::string;
using std::to_string;
using std::unique_ptr;

// --------------------------------------------------------------------------
PartUploadTask::PartUploadTask(const shared_ptr<RemoteStore> &store,
                               ThreadPool *executor, const string &bucket,
                               const string &key, const string &uploadId,
                               Part &&part)
    : m_store(store),
      m_executor(executor),
      m_bucket(bucket),
      m_key(key),
      m_uploadId(uploadId),
      m_part(std::make_shared<const Part>(std::move(part))),
      m_started(false),
      m_state(std::make_shared<State>()) {}

// --------------------------------------------------------------------------
PollState PartUploadTask::Poll(const Waker &waker,
                               PartUploadOutcome *outcome) {
  {
    lock_guard<mutex> lock(m_state->lock);
    if (m_state->done) {
      *outcome = std::move(m_state->result);
      return PollState::Ready;
    }
    // Keep the latest waker, the worker wakes whoever polled last.
    m_state->waker = waker;
  }

  if (!m_started) {
    m_started = true;
    Start();

    // Inline upload has finished by now
    lock_guard<mutex> lock(m_state->lock);
    if (m_state->done) {
      *outcome = std::move(m_state->result);
      return PollState::Ready;
    }
  }
  return PollState::Pending;
}

// --------------------------------------------------------------------------
void PartUploadTask::Abandon() {
  m_state->abandoned.store(true);
  DebugInfo("Abandon upload of part " + to_string(m_part->partNumber));
}

// --------------------------------------------------------------------------
void PartUploadTask::Start() {
  auto state = m_state;
  auto store = m_store;
  auto part = m_part;
  string bucket = m_bucket;
  string key = m_key;
  string uploadId = m_uploadId;

  auto ReceivedHandler = [state](const PartUploadOutcome &outcome) {
    Waker waker;
    {
      lock_guard<mutex> lock(state->lock);
      state->done = true;
      if (!state->abandoned.load()) {
        state->result = outcome;
      }
      waker = state->waker;
    }
    waker.Wake();
  };

  auto DoUpload = [state, store, part, bucket, key,
                   uploadId]() -> PartUploadOutcome {
    if (state->abandoned.load()) {
      return MakeUploadError(MPUError::INTERNAL_FAILURE, "UploadPart",
                             "Part " + to_string(part->partNumber) +
                                 " abandoned before upload");
    }
    string eTag;
    UploadError err;
    try {
      err = store->UploadPart(bucket, key, uploadId, part->partNumber,
                              part->contentLength, part->contentMD5,
                              part->body, &eTag);
    } catch (const std::exception &ex) {
      // Must not escape a worker thread
      err = MakeUploadError(MPUError::INTERNAL_FAILURE, "UploadPart",
                            ex.what());
    }
    if (IsGoodMPUError(err)) {
      DebugInfo("Uploaded part " + to_string(part->partNumber) + " of " +
                to_string(part->contentLength) + " bytes [Content-MD5=" +
                Base64Encode(part->contentMD5) + ", etag=" + eTag + "]");
      return CompletedPart(part->partNumber, eTag);
    }
    DebugError("Fail to upload part " + to_string(part->partNumber) + ", " +
               GetMessageForMPUError(err));
    return err;
  };

  if (m_executor != nullptr) {
    m_executor->SubmitAsync(ReceivedHandler, DoUpload);
  } else {
    ReceivedHandler(DoUpload());
  }
}

// --------------------------------------------------------------------------
PartUploadTaskStream::PartUploadTaskStream(unique_ptr<PartStream> parts,
                                           const shared_ptr<RemoteStore> &store,
                                           ThreadPool *executor,
                                           const string &bucket,
                                           const string &key,
                                           const string &uploadId)
    : m_parts(std::move(parts)),
      m_store(store),
      m_executor(executor),
      m_bucket(bucket),
      m_key(key),
      m_uploadId(uploadId) {}

// --------------------------------------------------------------------------
PollState PartUploadTaskStream::PollNext(const Waker &waker,
                                         TaskOutcome *task) {
  PartOutcome part;
  PollState state = m_parts->PollNext(waker, &part);
  if (state != PollState::Ready) {
    return state;
  }
  if (!part.IsSuccess()) {
    *task = TaskOutcome(part.GetError());
    return PollState::Ready;
  }

  Part next = part.GetResultWithOwnership();
  *task = TaskOutcome(unique_ptr<PartUploadTaskBase>(
      new PartUploadTask(m_store, m_executor, m_bucket, m_key, m_uploadId,
                         std::move(next))));
  return PollState::Ready;
}

}  // namespace Client
}  // namespace MPU
