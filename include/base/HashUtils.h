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

#ifndef _MPU_INCLUDE_BASE_HASHUTILS_H_  // NOLINT
#define _MPU_INCLUDE_BASE_HASHUTILS_H_  // NOLINT

#include <stddef.h>

#include <array>
#include <functional>
#include <string>
#include <type_traits>

// Forward declaration from openssl/evp.h
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace MPU {

namespace HashUtils {

struct EnumHash {
  template <typename T>
  int operator()(T enumValue) const {
    return static_cast<int>(enumValue);
  }
};

struct StringHash {
  size_t operator()(const std::string &str) const {
    return std::hash<std::string>()(str);
  }
};

static const size_t MD5_DIGEST_SIZE = 16;

using MD5Digest = std::array<unsigned char, MD5_DIGEST_SIZE>;

// Incremental MD5 over OpenSSL EVP
//
// Feed bytes with Update in order, then call Finalize to get the digest.
// Finalize resets the context, so the same object can digest the next
// message.
class MD5Hash {
 public:
  MD5Hash();
  ~MD5Hash();

  MD5Hash(MD5Hash &&) = delete;
  MD5Hash(const MD5Hash &) = delete;
  MD5Hash &operator=(MD5Hash &&) = delete;
  MD5Hash &operator=(const MD5Hash &) = delete;

 public:
  // Update digest with bytes
  //
  // @param  : data pointer, length in bytes
  // @return : void
  //
  // Throw MPUException if openssl fails.
  void Update(const char *data, size_t len);
  // Feed the raw bytes of another digest, e.g. for multipart etags
  void Update(const MD5Digest &digest);

  // Finalize digest and reset context
  //
  // @param  : void
  // @return : md5 digest
  MD5Digest Finalize();

  void Reset();

 private:
  EVP_MD_CTX *m_ctx;
};

// Compute md5 of a buffer in one go
MD5Digest ComputeMD5(const char *data, size_t len);
MD5Digest ComputeMD5(const std::string &data);

// Encode bytes to lowercase hex string
std::string HexEncode(const unsigned char *data, size_t len);
std::string HexEncode(const MD5Digest &digest);

// Encode bytes to base64 without line breaks
//
// @param  : md5 digest
// @return : base64 string, e.g. the value of a Content-MD5 header
std::string Base64Encode(const MD5Digest &digest);

}  // namespace HashUtils
}  // namespace MPU

// NOLINTNEXTLINE
#endif  // _MPU_INCLUDE_BASE_HASHUTILS_H_
