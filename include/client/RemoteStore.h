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

#ifndef _MPU_INCLUDE_CLIENT_REMOTESTORE_H_  // NOLINT
#define _MPU_INCLUDE_CLIENT_REMOTESTORE_H_  // NOLINT

#include <stdint.h>

#include <string>
#include <vector>

#include "base/HashUtils.h"
#include "client/MPUError.h"
#include "data/Chunk.h"

namespace MPU {

namespace Client {

// A part which has been uploaded
struct CompletedPart {
  CompletedPart() : partNumber(0) {}
  CompletedPart(int number, const std::string &tag)
      : partNumber(number), eTag(tag) {}

  int partNumber;
  std::string eTag;
};

// Object assembled by completing a multipart upload
struct ObjectMetadata {
  ObjectMetadata() : contentLength(0), partsCount(0) {}

  std::string bucket;
  std::string key;
  std::string eTag;
  uint64_t contentLength;
  int partsCount;
};

// A multipart upload initiated but neither completed nor aborted
struct UploadSummary {
  std::string bucket;
  std::string key;
  std::string uploadId;
};

// Object storage supporting multipart upload.
//
// Every operation returns GOOD or the error of the request, results go to
// the out parameters. Implementations must allow UploadPart to be called
// concurrently from several threads.
class RemoteStore {
 public:
  RemoteStore() = default;

  RemoteStore(RemoteStore &&) = delete;
  RemoteStore(const RemoteStore &) = delete;
  RemoteStore &operator=(RemoteStore &&) = delete;
  RemoteStore &operator=(const RemoteStore &) = delete;
  virtual ~RemoteStore() = default;

 public:
  // Initiate multipart upload id
  //
  // @param  : bucket, object key, upload id (output)
  // @return : ClientError
  virtual UploadError CreateMultipartUpload(const std::string &bucket,
                                            const std::string &key,
                                            std::string *uploadId) = 0;

  // Upload one part
  //
  // @param  : bucket, object key, upload id, part number, content length,
  //           md5 of content, body, etag (output)
  // @return : ClientError
  virtual UploadError UploadPart(const std::string &bucket,
                                 const std::string &key,
                                 const std::string &uploadId, int partNumber,
                                 uint64_t contentLength,
                                 const MPU::HashUtils::MD5Digest &contentMD5,
                                 const std::vector<MPU::Data::Chunk> &body,
                                 std::string *eTag) = 0;

  // Assemble uploaded parts into the object
  //
  // @param  : bucket, object key, upload id, parts sorted by part number,
  //           metadata of object (output)
  // @return : ClientError
  virtual UploadError CompleteMultipartUpload(
      const std::string &bucket, const std::string &key,
      const std::string &uploadId, const std::vector<CompletedPart> &sortedParts,
      ObjectMetadata *metadata) = 0;

  // Discard the upload and all its parts
  //
  // @param  : bucket, object key, upload id
  // @return : ClientError
  virtual UploadError AbortMultipartUpload(const std::string &bucket,
                                           const std::string &key,
                                           const std::string &uploadId) = 0;
};

}  // namespace Client
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_CLIENT_REMOTESTORE_H_
