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

#ifndef _MPU_INCLUDE_CLIENT_MULTIPARTUPLOAD_H_  // NOLINT
#define _MPU_INCLUDE_CLIENT_MULTIPARTUPLOAD_H_  // NOLINT

#include <memory>
#include <string>
#include <vector>

#include "base/Outcome.h"
#include "client/MPUError.h"
#include "client/RemoteStore.h"
#include "client/UploadConfiguration.h"
#include "data/ByteSource.h"

namespace MPU {

namespace Client {

enum class UploadState : int {
  Initial,     // not sent yet
  Created,     // upload id obtained
  InProgress,  // parts being uploaded
  Completing,  // complete request sent
  Done,
  Aborting,  // abort request sent
  Aborted
};

std::string GetUploadStateName(UploadState state);

struct UploadSession {
  UploadSession()
      : state(UploadState::Initial), hasAbortError(false), abortError() {}

  std::string uploadId;
  std::string bucket;
  std::string key;
  std::vector<CompletedPart> completedParts;  // sorted by part number
  UploadState state;
  bool hasAbortError;
  UploadError abortError;  // set when abort itself failed
};

using UploadOutcome = Outcome<ObjectMetadata, UploadError>;

// Upload a byte source as one object through the multipart protocol
//
// Send creates the upload, uploads the parts produced by the splitter with
// at most the configured number in flight, then completes the upload. Any
// failure after creation aborts the upload and the first error is returned.
// A MultipartUpload can be sent only once.
class MultipartUpload {
 public:
  explicit MultipartUpload(
      const std::shared_ptr<RemoteStore> &store,
      const UploadConfiguration &config = UploadConfiguration());

  MultipartUpload(MultipartUpload &&) = delete;
  MultipartUpload(const MultipartUpload &) = delete;
  MultipartUpload &operator=(MultipartUpload &&) = delete;
  MultipartUpload &operator=(const MultipartUpload &) = delete;
  ~MultipartUpload() = default;

 public:
  MultipartUpload &SetBucket(const std::string &bucket);
  MultipartUpload &SetKey(const std::string &key);
  MultipartUpload &SetBody(std::unique_ptr<MPU::Data::ByteSource> body);

  // Run the upload to its end
  //
  // @param  : void
  // @return : metadata of the completed object, or the first error
  UploadOutcome Send();

  const UploadSession &GetSession() const { return m_session; }
  UploadState GetState() const { return m_session.state; }
  const UploadConfiguration &GetConfiguration() const { return m_config; }

 private:
  UploadError ValidateParameters() const;

  // Upload every part and complete, nothing is aborted here
  UploadOutcome UploadAndComplete();

  // Abort the upload, an abort failure is only recorded in the session
  void Abort(const UploadError &cause);

  std::string GetObjectDescription() const {
    return m_session.bucket + "/" + m_session.key;
  }

 private:
  std::shared_ptr<RemoteStore> m_store;
  UploadConfiguration m_config;
  std::unique_ptr<MPU::Data::ByteSource> m_body;
  UploadSession m_session;
  bool m_sent;
};

}  // namespace Client
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_CLIENT_MULTIPARTUPLOAD_H_
