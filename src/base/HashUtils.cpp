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

#include "base/HashUtils.h"

#include <openssl/evp.h>

#include <string>
#include <vector>

#include "base/Exception.h"

namespace MPU {

namespace HashUtils {

using MPU::Exception::MPUException;
using std::string;

// --------------------------------------------------------------------------
MD5Hash::MD5Hash() : m_ctx(EVP_MD_CTX_new()) {
  if (m_ctx == nullptr) {
    throw MPUException("Unable to allocate md5 digest context");
  }
  Reset();
}

// --------------------------------------------------------------------------
MD5Hash::~MD5Hash() {
  if (m_ctx != nullptr) {
    EVP_MD_CTX_free(m_ctx);
  }
}

// --------------------------------------------------------------------------
void MD5Hash::Reset() {
  if (EVP_DigestInit_ex(m_ctx, EVP_md5(), nullptr) != 1) {
    throw MPUException("Unable to initialize md5 digest");
  }
}

// --------------------------------------------------------------------------
void MD5Hash::Update(const char *data, size_t len) {
  if (len == 0) {
    return;
  }
  if (EVP_DigestUpdate(m_ctx, data, len) != 1) {
    throw MPUException("Unable to update md5 digest");
  }
}

// --------------------------------------------------------------------------
void MD5Hash::Update(const MD5Digest &digest) {
  if (EVP_DigestUpdate(m_ctx, digest.data(), digest.size()) != 1) {
    throw MPUException("Unable to update md5 digest");
  }
}

// --------------------------------------------------------------------------
MD5Digest MD5Hash::Finalize() {
  MD5Digest digest;
  unsigned int digestLen = 0;
  if (EVP_DigestFinal_ex(m_ctx, digest.data(), &digestLen) != 1 ||
      digestLen != MD5_DIGEST_SIZE) {
    throw MPUException("Unable to finalize md5 digest");
  }
  Reset();
  return digest;
}

// --------------------------------------------------------------------------
MD5Digest ComputeMD5(const char *data, size_t len) {
  MD5Hash hash;
  hash.Update(data, len);
  return hash.Finalize();
}

// --------------------------------------------------------------------------
MD5Digest ComputeMD5(const string &data) {
  return ComputeMD5(data.data(), data.size());
}

// --------------------------------------------------------------------------
string HexEncode(const unsigned char *data, size_t len) {
  static const char *const HEX_DIGITS = "0123456789abcdef";
  string hex;
  hex.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    hex.push_back(HEX_DIGITS[data[i] >> 4]);
    hex.push_back(HEX_DIGITS[data[i] & 0x0f]);
  }
  return hex;
}

// --------------------------------------------------------------------------
string HexEncode(const MD5Digest &digest) {
  return HexEncode(digest.data(), digest.size());
}

// --------------------------------------------------------------------------
string Base64Encode(const MD5Digest &digest) {
  // 4 output bytes per 3 input bytes, plus trailing NUL
  std::vector<unsigned char> out(((digest.size() + 2) / 3) * 4 + 1);
  int len = EVP_EncodeBlock(out.data(), digest.data(),
                            static_cast<int>(digest.size()));
  if (len < 0) {
    throw MPUException("Unable to base64 encode md5 digest");
  }
  return string(out.begin(), out.begin() + len);
}

}  // namespace HashUtils
}  // namespace MPU
