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

#include "client/MultipartUpload.h"

#include <algorithm>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "base/Dispatcher.h"
#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/ThreadPool.h"
#include "base/Waker.h"
#include "client/PartUploadTask.h"
#include "data/Splitter.h"

namespace MPU {

namespace Client {

using MPU::Data::ByteSource;
using MPU::Data::PartStream;
using MPU::Data::Splitter;
using MPU::Exception::MPUException;
using MPU::Threading::Dispatcher;
using MPU::Threading::ThreadPool;
using MPU::Threading::Waker;
using std::string;
using std::to_string;
using std::unique_ptr;
using std::vector;

// --------------------------------------------------------------------------
string GetUploadStateName(UploadState state) {
  switch (state) {
    case UploadState::Initial:
      return "Initial";
    case UploadState::Created:
      return "Created";
    case UploadState::InProgress:
      return "InProgress";
    case UploadState::Completing:
      return "Completing";
    case UploadState::Done:
      return "Done";
    case UploadState::Aborting:
      return "Aborting";
    case UploadState::Aborted:
      return "Aborted";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
MultipartUpload::MultipartUpload(const std::shared_ptr<RemoteStore> &store,
                                 const UploadConfiguration &config)
    : m_store(store), m_config(config), m_body(), m_session(), m_sent(false) {}

// --------------------------------------------------------------------------
MultipartUpload &MultipartUpload::SetBucket(const string &bucket) {
  m_session.bucket = bucket;
  return *this;
}

// --------------------------------------------------------------------------
MultipartUpload &MultipartUpload::SetKey(const string &key) {
  m_session.key = key;
  return *this;
}

// --------------------------------------------------------------------------
MultipartUpload &MultipartUpload::SetBody(unique_ptr<ByteSource> body) {
  m_body = std::move(body);
  return *this;
}

// --------------------------------------------------------------------------
UploadOutcome MultipartUpload::Send() {
  if (m_sent) {
    return MakeUploadError(MPUError::UPLOAD_ALREADY_SENT, "Send",
                           "Upload of " + GetObjectDescription() +
                               " has already been sent");
  }
  m_sent = true;

  auto err = ValidateParameters();
  if (!IsGoodMPUError(err)) {
    Error(GetMessageForMPUError(err));
    return err;
  }

  string uploadId;
  try {
    err = m_store->CreateMultipartUpload(m_session.bucket, m_session.key,
                                         &uploadId);
  } catch (const std::exception &ex) {
    err = MakeUploadError(MPUError::INTERNAL_FAILURE,
                          "CreateMultipartUpload", ex.what());
  }
  if (!IsGoodMPUError(err)) {
    Error("Fail to initiate multipart upload " + GetObjectDescription() +
          ", " + GetMessageForMPUError(err));
    return err;
  }
  m_session.uploadId = uploadId;
  m_session.state = UploadState::Created;
  Info("Initiate multipart upload " + GetObjectDescription() +
       " [uploadId=" + uploadId + "] " + m_config.ToString());

  UploadOutcome outcome;
  try {
    outcome = UploadAndComplete();
  } catch (const MPUException &ex) {
    outcome = MakeUploadError(MPUError::INTERNAL_FAILURE, "Send", ex.what());
  } catch (const std::exception &ex) {
    // thrown by the store or the body, the upload still has to be aborted
    outcome = MakeUploadError(MPUError::INTERNAL_FAILURE, "Send",
                              string("Unexpected exception: ") + ex.what());
  }

  if (outcome.IsSuccess()) {
    m_session.state = UploadState::Done;
    Info("Complete multipart upload " + GetObjectDescription() +
         " [uploadId=" + uploadId +
         ", parts=" + to_string(m_session.completedParts.size()) +
         ", size=" + to_string(outcome.GetResult().contentLength) + "]");
  } else {
    Error("Fail to multipart upload " + GetObjectDescription() +
          " [uploadId=" + uploadId + "], " +
          GetMessageForMPUError(outcome.GetError()));
    Abort(outcome.GetError());
  }
  return outcome;
}

// --------------------------------------------------------------------------
UploadError MultipartUpload::ValidateParameters() const {
  if (!m_store) {
    return MakeUploadError(MPUError::PARAMETER_MISSING, "Send",
                           "Remote store is not set");
  }
  if (m_session.bucket.empty()) {
    return MakeUploadError(MPUError::PARAMETER_MISSING, "Send",
                           "Bucket is not set");
  }
  if (m_session.key.empty()) {
    return MakeUploadError(MPUError::PARAMETER_MISSING, "Send",
                           "Key is not set");
  }
  if (!m_body) {
    return MakeUploadError(MPUError::PARAMETER_MISSING, "Send",
                           "Body is not set");
  }
  string reason;
  if (!m_config.Validate(&reason)) {
    return MakeUploadError(MPUError::PARAMETER_VALUE_INVALID, "Send", reason);
  }
  return GoodUploadError();
}

// --------------------------------------------------------------------------
UploadOutcome MultipartUpload::UploadAndComplete() {
  m_session.state = UploadState::InProgress;

  // Executor must outlive the dispatcher, whose tasks are pending on it.
  unique_ptr<ThreadPool> executor;
  if (m_config.GetPoolSize() > 0) {
    executor.reset(new ThreadPool(m_config.GetPoolSize()));
  }

  unique_ptr<PartStream> parts(new Splitter(std::move(m_body),
                                            m_config.GetMinPartSize(),
                                            m_config.GetMaxPartSize()));
  unique_ptr<PartUploadTaskStream> tasks(new PartUploadTaskStream(
      std::move(parts), m_store, executor.get(), m_session.bucket,
      m_session.key, m_session.uploadId));

  Dispatcher<CompletedPart, UploadError>::DispatchOutcome dispatched;
  {
    Dispatcher<CompletedPart, UploadError> dispatcher(
        std::move(tasks), m_config.GetConcurrencyLimit());
    Waker waker;
    dispatched = dispatcher.Run(waker);
  }
  if (!dispatched.IsSuccess()) {
    return dispatched.GetError();
  }

  vector<CompletedPart> completedParts = dispatched.GetResultWithOwnership();
  std::sort(completedParts.begin(), completedParts.end(),
            [](const CompletedPart &lhs, const CompletedPart &rhs) {
              return lhs.partNumber < rhs.partNumber;
            });
  for (size_t i = 0; i < completedParts.size(); ++i) {
    if (completedParts[i].partNumber != static_cast<int>(i + 1)) {
      return MakeUploadError(
          MPUError::INTERNAL_FAILURE, "CompleteMultipartUpload",
          "Completed parts are not numbered contiguously, expect part " +
              to_string(i + 1) + " but got part " +
              to_string(completedParts[i].partNumber));
    }
  }
  m_session.completedParts = std::move(completedParts);
  DebugInfo("Uploaded " + to_string(m_session.completedParts.size()) +
            " parts of " + GetObjectDescription());

  m_session.state = UploadState::Completing;
  ObjectMetadata metadata;
  auto err = m_store->CompleteMultipartUpload(
      m_session.bucket, m_session.key, m_session.uploadId,
      m_session.completedParts, &metadata);
  if (!IsGoodMPUError(err)) {
    return err;
  }
  return metadata;
}

// --------------------------------------------------------------------------
void MultipartUpload::Abort(const UploadError &cause) {
  m_session.state = UploadState::Aborting;
  Info("Abort multipart upload " + GetObjectDescription() +
       " [uploadId=" + m_session.uploadId + "] due to " +
       MPUErrorToString(cause.GetError()));

  UploadError err;
  try {
    err = m_store->AbortMultipartUpload(m_session.bucket, m_session.key,
                                        m_session.uploadId);
  } catch (const std::exception &ex) {
    err = MakeUploadError(MPUError::INTERNAL_FAILURE, "AbortMultipartUpload",
                          ex.what());
  }
  if (!IsGoodMPUError(err)) {
    Warning("Fail to abort multipart upload " + GetObjectDescription() +
            " [uploadId=" + m_session.uploadId + "], " +
            GetMessageForMPUError(err));
    m_session.hasAbortError = true;
    m_session.abortError = err;
  }
  m_session.state = UploadState::Aborted;
}

}  // namespace Client
}  // namespace MPU
