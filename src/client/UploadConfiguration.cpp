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

#include "client/UploadConfiguration.h"

#include <string>

#include "configure/Default.h"

namespace MPU {

namespace Client {

using MPU::Configure::Default::GetClientDefaultPoolSize;
using MPU::Configure::Default::GetDefaultParallelTransfers;
using MPU::Configure::Default::GetUploadMultipartMaxPartSize;
using MPU::Configure::Default::GetUploadMultipartMinPartSize;
using std::string;
using std::to_string;

UploadConfiguration::UploadConfiguration()
    : m_minPartSize(GetUploadMultipartMinPartSize()),
      m_maxPartSize(GetUploadMultipartMaxPartSize()),
      m_concurrencyLimit(GetDefaultParallelTransfers()),
      m_poolSize(static_cast<size_t>(GetClientDefaultPoolSize())) {}

UploadConfiguration::UploadConfiguration(uint64_t minPartSize,
                                         uint64_t maxPartSize,
                                         size_t concurrencyLimit,
                                         size_t poolSize)
    : m_minPartSize(minPartSize),
      m_maxPartSize(maxPartSize),
      m_concurrencyLimit(concurrencyLimit),
      m_poolSize(poolSize) {}

bool UploadConfiguration::Validate(string *reason) const {
  string msg;
  if (m_minPartSize == 0) {
    msg = "Min part size must be positive";
  } else if (m_maxPartSize < m_minPartSize) {
    msg = "Max part size " + to_string(m_maxPartSize) +
          " is less than min part size " + to_string(m_minPartSize);
  }
  if (reason != nullptr) {
    *reason = msg;
  }
  return msg.empty();
}

string UploadConfiguration::ToString() const {
  return "[partSize=" + to_string(m_minPartSize) + ".." +
         to_string(m_maxPartSize) + ", concurrencyLimit=" +
         (m_concurrencyLimit == 0 ? string("unlimited")
                                  : to_string(m_concurrencyLimit)) +
         ", poolSize=" + to_string(m_poolSize) + "]";
}

}  // namespace Client
}  // namespace MPU
