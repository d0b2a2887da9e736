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

#ifndef _MPU_INCLUDE_CLIENT_UPLOADCONFIGURATION_H_  // NOLINT
#define _MPU_INCLUDE_CLIENT_UPLOADCONFIGURATION_H_  // NOLINT

#include <stddef.h>
#include <stdint.h>

#include <string>

namespace MPU {

namespace Client {

// Settings of a multipart upload, defaults come from Configure::Default
class UploadConfiguration {
 public:
  UploadConfiguration();
  UploadConfiguration(uint64_t minPartSize, uint64_t maxPartSize,
                      size_t concurrencyLimit, size_t poolSize);

  UploadConfiguration(const UploadConfiguration &) = default;
  UploadConfiguration(UploadConfiguration &&) = default;
  UploadConfiguration &operator=(const UploadConfiguration &) = default;
  UploadConfiguration &operator=(UploadConfiguration &&) = default;
  ~UploadConfiguration() = default;

 public:
  // accessor
  uint64_t GetMinPartSize() const { return m_minPartSize; }
  uint64_t GetMaxPartSize() const { return m_maxPartSize; }
  size_t GetConcurrencyLimit() const { return m_concurrencyLimit; }
  size_t GetPoolSize() const { return m_poolSize; }
  bool IsConcurrencyUnlimited() const { return m_concurrencyLimit == 0; }

  // 0 for no limit
  void SetConcurrencyLimit(size_t limit) { m_concurrencyLimit = limit; }
  // 0 to upload parts on the calling thread
  void SetPoolSize(size_t poolSize) { m_poolSize = poolSize; }
  void SetPartSizeRange(uint64_t minPartSize, uint64_t maxPartSize) {
    m_minPartSize = minPartSize;
    m_maxPartSize = maxPartSize;
  }

  // Check settings
  //
  // @param  : reason of invalidity (output)
  // @return : bool
  bool Validate(std::string *reason) const;

  std::string ToString() const;

 private:
  uint64_t m_minPartSize;
  uint64_t m_maxPartSize;
  size_t m_concurrencyLimit;  // max parts in flight, 0 for no limit
  size_t m_poolSize;          // threads doing part upload
};

}  // namespace Client
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_CLIENT_UPLOADCONFIGURATION_H_
