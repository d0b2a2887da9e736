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

#ifndef _MPU_INCLUDE_BASE_OUTCOME_H_  // NOLINT
#define _MPU_INCLUDE_BASE_OUTCOME_H_  // NOLINT

#include <utility>

namespace MPU {

// Either the value an operation produced or the error it failed with.
//
// Both members are always constructed, Result and Error therefore need a
// default constructor. Check IsSuccess before reading one of them.
// A default constructed outcome is a failure holding Error().
template <typename Result, typename Error>
class Outcome {
 public:
  Outcome() = default;

  Outcome(Result &&result)  // NOLINT
      : m_result(std::move(result)), m_success(true) {}
  Outcome(const Result &result)  // NOLINT
      : m_result(result), m_success(true) {}

  Outcome(Error &&error)  // NOLINT
      : m_error(std::move(error)) {}
  Outcome(const Error &error)  // NOLINT
      : m_error(error) {}

  Outcome(Outcome &&) = default;
  Outcome(const Outcome &) = default;
  Outcome &operator=(Outcome &&) = default;
  Outcome &operator=(const Outcome &) = default;
  ~Outcome() = default;

 public:
  bool IsSuccess() const { return m_success; }

  const Result &GetResult() const { return m_result; }
  Result &GetResult() { return m_result; }
  // Leave a moved-from result behind
  Result &&GetResultWithOwnership() { return std::move(m_result); }

  const Error &GetError() const { return m_error; }

 private:
  Result m_result{};
  Error m_error{};
  bool m_success = false;
};

}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_OUTCOME_H_
