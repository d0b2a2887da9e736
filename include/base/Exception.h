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

#ifndef _MPU_INCLUDE_BASE_EXCEPTION_H_  // NOLINT
#define _MPU_INCLUDE_BASE_EXCEPTION_H_  // NOLINT

#include <exception>
#include <string>

namespace MPU {

namespace Exception {

class MPUException : public std::exception {
 public:
  explicit MPUException(const std::string &msg) : m_msg(msg) {}
  explicit MPUException(const char *msg) : m_msg(msg) {}

  MPUException(MPUException &&) = default;
  MPUException(const MPUException &) = default;
  MPUException &operator=(MPUException &&) = default;
  MPUException &operator=(const MPUException &) = default;
  virtual ~MPUException() = default;

 public:
  const char *what() const noexcept override { return m_msg.c_str(); }
  const std::string &get() const noexcept { return m_msg; }

 private:
  std::string m_msg;
};

}  // namespace Exception
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_EXCEPTION_H_
