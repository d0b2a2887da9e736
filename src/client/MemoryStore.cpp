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

#include "client/MemoryStore.h"

#include <mutex>  // NOLINT
#include <string>
#include <utility>
#include <vector>

#include "base/HashUtils.h"
#include "base/LogMacros.h"
#include "configure/Default.h"
#include "data/Chunk.h"

namespace MPU {

namespace Client {

using MPU::Configure::Default::GetUploadMultipartMaxPartNumber;
using MPU::Data::Chunk;
using MPU::HashUtils::Base64Encode;
using MPU::HashUtils::ComputeMD5;
using MPU::HashUtils::HexEncode;
using MPU::HashUtils::MD5Digest;
using MPU::HashUtils::MD5Hash;
using std::lock_guard;
using std::mutex;
using std::string;
using std::to_string;
using std::vector;

namespace {

UploadError Reject(MPUError err, const string &operation,
                   const string &message) {
  DebugWarning(operation + " rejected: " + MPUErrorToString(err) + " " +
               message);
  return MakeUploadError(err, operation, message);
}

string FormatUpload(const string &bucket, const string &key,
                    const string &uploadId) {
  return "[bucket:key:uploadId=" + bucket + ":" + key + ":" + uploadId + "]";
}

}  // namespace

// --------------------------------------------------------------------------
MemoryStore::MemoryStore(uint64_t minPartSize)
    : m_minPartSize(minPartSize), m_nextUploadId(1) {}

// --------------------------------------------------------------------------
MemoryStore::Session *MemoryStore::FindSession(const string &bucket,
                                               const string &key,
                                               const string &uploadId) {
  auto it = m_sessions.find(uploadId);
  if (it == m_sessions.end() || it->second.bucket != bucket ||
      it->second.key != key) {
    return nullptr;
  }
  return &it->second;
}

// --------------------------------------------------------------------------
UploadError MemoryStore::CreateMultipartUpload(const string &bucket,
                                               const string &key,
                                               string *uploadId) {
  static const char *const OPERATION = "CreateMultipartUpload";
  if (bucket.empty() || key.empty()) {
    return Reject(MPUError::PARAMETER_MISSING, OPERATION,
                  "Empty bucket or key " + FormatUpload(bucket, key, ""));
  }

  lock_guard<mutex> lock(m_lock);
  string id = HexEncode(ComputeMD5(ObjectPath(bucket, key) + "#" +
                                   to_string(m_nextUploadId++)));
  Session session;
  session.bucket = bucket;
  session.key = key;
  m_sessions.emplace(id, std::move(session));
  if (uploadId != nullptr) {
    *uploadId = id;
  }
  return GoodUploadError();
}

// --------------------------------------------------------------------------
UploadError MemoryStore::UploadPart(const string &bucket, const string &key,
                                    const string &uploadId, int partNumber,
                                    uint64_t contentLength,
                                    const MD5Digest &contentMD5,
                                    const vector<Chunk> &body, string *eTag) {
  static const char *const OPERATION = "UploadPart";
  if (partNumber < 1 || partNumber > GetUploadMultipartMaxPartNumber()) {
    return Reject(MPUError::PARAMETER_VALUE_INVALID, OPERATION,
                  "Part number out of range " + to_string(partNumber));
  }

  // Digest outside of lock, parts are uploaded concurrently
  StoredPart stored;
  stored.data = MPU::Data::ConcatChunks(body);
  if (stored.data.size() != contentLength) {
    return Reject(MPUError::PARAMETER_VALUE_INVALID, OPERATION,
                  "Content length " + to_string(contentLength) +
                      " mismatch body size " + to_string(stored.data.size()));
  }
  stored.md5 = ComputeMD5(stored.data);
  if (stored.md5 != contentMD5) {
    return Reject(MPUError::BAD_DIGEST, OPERATION,
                  "Content-MD5 " + Base64Encode(contentMD5) +
                      " mismatch of part " + to_string(partNumber) +
                      ", computed " + Base64Encode(stored.md5));
  }
  stored.eTag = "\"" + HexEncode(stored.md5) + "\"";

  lock_guard<mutex> lock(m_lock);
  Session *session = FindSession(bucket, key, uploadId);
  if (session == nullptr) {
    return Reject(MPUError::NO_SUCH_UPLOAD, OPERATION,
                  FormatUpload(bucket, key, uploadId));
  }
  if (eTag != nullptr) {
    *eTag = stored.eTag;
  }
  session->parts[partNumber] = std::move(stored);
  return GoodUploadError();
}

// --------------------------------------------------------------------------
UploadError MemoryStore::CompleteMultipartUpload(
    const string &bucket, const string &key, const string &uploadId,
    const vector<CompletedPart> &sortedParts, ObjectMetadata *metadata) {
  static const char *const OPERATION = "CompleteMultipartUpload";
  lock_guard<mutex> lock(m_lock);
  Session *session = FindSession(bucket, key, uploadId);
  if (session == nullptr) {
    return Reject(MPUError::NO_SUCH_UPLOAD, OPERATION,
                  FormatUpload(bucket, key, uploadId));
  }

  StoredObject object;
  MD5Hash digests;
  for (size_t i = 0; i < sortedParts.size(); ++i) {
    const CompletedPart &completed = sortedParts[i];
    if (i > 0 && completed.partNumber <= sortedParts[i - 1].partNumber) {
      return Reject(MPUError::INVALID_PART_ORDER, OPERATION,
                    "Part " + to_string(completed.partNumber) +
                        " follows part " +
                        to_string(sortedParts[i - 1].partNumber));
    }
    auto it = session->parts.find(completed.partNumber);
    if (it == session->parts.end() || it->second.eTag != completed.eTag) {
      return Reject(MPUError::INVALID_PART, OPERATION,
                    "Unknown part " + to_string(completed.partNumber) +
                        " etag " + completed.eTag);
    }
    const StoredPart &part = it->second;
    bool isLast = (i + 1 == sortedParts.size());
    if (!isLast && part.data.size() < m_minPartSize) {
      return Reject(MPUError::ENTITY_TOO_SMALL, OPERATION,
                    "Part " + to_string(completed.partNumber) + " of " +
                        to_string(part.data.size()) + " bytes");
    }
    object.data.append(part.data);
    digests.Update(part.md5);
  }
  object.eTag = "\"" + HexEncode(digests.Finalize()) + "-" +
                to_string(sortedParts.size()) + "\"";

  if (metadata != nullptr) {
    metadata->bucket = bucket;
    metadata->key = key;
    metadata->eTag = object.eTag;
    metadata->contentLength = object.data.size();
    metadata->partsCount = static_cast<int>(sortedParts.size());
  }
  m_objects[ObjectPath(bucket, key)] = std::move(object);
  m_sessions.erase(uploadId);
  return GoodUploadError();
}

// --------------------------------------------------------------------------
UploadError MemoryStore::AbortMultipartUpload(const string &bucket,
                                              const string &key,
                                              const string &uploadId) {
  lock_guard<mutex> lock(m_lock);
  if (FindSession(bucket, key, uploadId) == nullptr) {
    return Reject(MPUError::NO_SUCH_UPLOAD, "AbortMultipartUpload",
                  FormatUpload(bucket, key, uploadId));
  }
  m_sessions.erase(uploadId);
  return GoodUploadError();
}

// --------------------------------------------------------------------------
UploadError MemoryStore::ListMultipartUploads(
    const string &bucket, vector<UploadSummary> *uploads) const {
  if (uploads == nullptr) {
    return MakeUploadError(MPUError::PARAMETER_MISSING, "ListMultipartUploads",
                           "Null output");
  }
  lock_guard<mutex> lock(m_lock);
  uploads->clear();
  for (auto &idToSession : m_sessions) {
    if (idToSession.second.bucket == bucket) {
      UploadSummary summary;
      summary.bucket = bucket;
      summary.key = idToSession.second.key;
      summary.uploadId = idToSession.first;
      uploads->push_back(std::move(summary));
    }
  }
  return GoodUploadError();
}

// --------------------------------------------------------------------------
UploadError MemoryStore::GetObject(const string &bucket, const string &key,
                                   string *content) const {
  lock_guard<mutex> lock(m_lock);
  auto it = m_objects.find(ObjectPath(bucket, key));
  if (it == m_objects.end()) {
    return MakeUploadError(MPUError::KEY_NOT_EXIST, "GetObject",
                           ObjectPath(bucket, key));
  }
  if (content != nullptr) {
    *content = it->second.data;
  }
  return GoodUploadError();
}

// --------------------------------------------------------------------------
int MemoryStore::GetUploadedPartCount(const string &uploadId) const {
  lock_guard<mutex> lock(m_lock);
  auto it = m_sessions.find(uploadId);
  return it == m_sessions.end() ? -1 : static_cast<int>(it->second.parts.size());
}

}  // namespace Client
}  // namespace MPU
