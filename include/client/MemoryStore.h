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

#ifndef _MPU_INCLUDE_CLIENT_MEMORYSTORE_H_  // NOLINT
#define _MPU_INCLUDE_CLIENT_MEMORYSTORE_H_  // NOLINT

#include <stdint.h>

#include <map>
#include <mutex>  // NOLINT
#include <string>
#include <unordered_map>
#include <vector>

#include "base/HashUtils.h"
#include "client/MPUError.h"
#include "client/RemoteStore.h"

namespace MPU {

namespace Client {

// In process object storage with multipart upload.
//
// It checks requests the way an object storage service does: unknown upload
// ids, part numbers out of range, content length mismatch, bad md5, parts
// out of order, unknown or stale etags and too small parts are rejected.
// All operations are thread safe.
class MemoryStore : public RemoteStore {
 public:
  // @param  : min size of every part except the last when completing,
  //           0 for no check
  explicit MemoryStore(uint64_t minPartSize = 0);

  MemoryStore(MemoryStore &&) = delete;
  MemoryStore(const MemoryStore &) = delete;
  MemoryStore &operator=(MemoryStore &&) = delete;
  MemoryStore &operator=(const MemoryStore &) = delete;
  virtual ~MemoryStore() = default;

 public:
  UploadError CreateMultipartUpload(const std::string &bucket,
                                    const std::string &key,
                                    std::string *uploadId) override;

  UploadError UploadPart(const std::string &bucket, const std::string &key,
                         const std::string &uploadId, int partNumber,
                         uint64_t contentLength,
                         const MPU::HashUtils::MD5Digest &contentMD5,
                         const std::vector<MPU::Data::Chunk> &body,
                         std::string *eTag) override;

  UploadError CompleteMultipartUpload(
      const std::string &bucket, const std::string &key,
      const std::string &uploadId, const std::vector<CompletedPart> &sortedParts,
      ObjectMetadata *metadata) override;

  UploadError AbortMultipartUpload(const std::string &bucket,
                                   const std::string &key,
                                   const std::string &uploadId) override;

 public:
  // List uploads in progress of bucket
  //
  // @param  : bucket, uploads (output)
  // @return : ClientError
  UploadError ListMultipartUploads(const std::string &bucket,
                                   std::vector<UploadSummary> *uploads) const;

  // Get object content
  //
  // @param  : bucket, object key, content (output)
  // @return : ClientError, KEY_NOT_EXIST if no such object
  UploadError GetObject(const std::string &bucket, const std::string &key,
                        std::string *content) const;

  // Number of parts stored for an upload in progress, -1 if no such upload
  int GetUploadedPartCount(const std::string &uploadId) const;

  uint64_t GetMinPartSize() const { return m_minPartSize; }

 private:
  struct StoredPart {
    std::string data;
    MPU::HashUtils::MD5Digest md5;
    std::string eTag;
  };

  struct Session {
    std::string bucket;
    std::string key;
    std::map<int, StoredPart> parts;
  };

  struct StoredObject {
    std::string data;
    std::string eTag;
  };

  // Find the session of upload id, nullptr if not exists or if it belongs
  // to another object. Must be called with m_lock held.
  Session *FindSession(const std::string &bucket, const std::string &key,
                       const std::string &uploadId);

  static std::string ObjectPath(const std::string &bucket,
                                const std::string &key) {
    return bucket + "/" + key;
  }

 private:
  uint64_t m_minPartSize;
  uint64_t m_nextUploadId;
  std::unordered_map<std::string, Session, MPU::HashUtils::StringHash>
      m_sessions;  // upload id to session
  std::unordered_map<std::string, StoredObject, MPU::HashUtils::StringHash>
      m_objects;  // bucket/key to object
  mutable std::mutex m_lock;
};

}  // namespace Client
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_CLIENT_MEMORYSTORE_H_
