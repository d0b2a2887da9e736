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

#include <stdint.h>

#include <algorithm>
#include <atomic>
#include <chrono>  // NOLINT
#include <ios>
#include <memory>
#include <mutex>  // NOLINT
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>  // NOLINT
#include <utility>
#include <vector>

#include "gtest/gtest.h"

#include "base/HashUtils.h"
#include "base/Logging.h"
#include "base/Poll.h"
#include "base/Utils.h"
#include "base/Waker.h"
#include "client/MPUError.h"
#include "client/MemoryStore.h"
#include "client/MultipartUpload.h"
#include "client/UploadConfiguration.h"
#include "configure/Default.h"
#include "data/ByteSource.h"
#include "data/Chunk.h"
#include "data/Size.h"

namespace MPU {

namespace Client {

using MPU::Data::ByteSource;
using MPU::Data::Chunk;
using MPU::Data::ChunkListByteSource;
using MPU::Data::ChunkOutcome;
using MPU::Data::StreamByteSource;
using MPU::HashUtils::MD5Digest;
using MPU::Threading::PollState;
using MPU::Threading::Waker;
using std::atomic;
using std::istringstream;
using std::lock_guard;
using std::make_shared;
using std::mutex;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;
using ::testing::Test;

static const char *defaultLogDir = "/tmp/mpu_test.logs/";
void InitLog() {
  MPU::Utils::CreateDirectoryIfNotExistsNoLog(defaultLogDir);
  MPU::Logging::InitializeLogging(unique_ptr<MPU::Logging::Log>(
      new MPU::Logging::DefaultLog(defaultLogDir)));
  EXPECT_TRUE(MPU::Logging::GetLogInstance() != nullptr)
      << "log instance is null";
}

static const uint64_t minPartSize_ = MPU::Data::Size::KB64;
static const uint64_t maxPartSize_ = 4 * MPU::Data::Size::KB64;
static const char *bucket_ = "bucket";

UploadError InjectedError(const string &operation, MPUError err) {
  return MakeUploadError(err, operation, "injected failure");
}

// Memory store counting calls and failing on demand
class RecordingStore : public MemoryStore {
 public:
  explicit RecordingStore(uint64_t minPartSize)
      : MemoryStore(minPartSize),
        createCount(0),
        uploadPartCount(0),
        completeCount(0),
        abortCount(0),
        inFlight(0),
        maxInFlight(0),
        failCreate(false),
        failPartNumber(0),
        throwPartNumber(0),
        failComplete(false),
        throwComplete(false),
        failAbort(false),
        throwAbort(false),
        uploadDelayMs(0) {}

  UploadError CreateMultipartUpload(const string &bucket, const string &key,
                                    string *uploadId) override {
    ++createCount;
    if (failCreate) {
      return InjectedError("CreateMultipartUpload",
                           MPUError::SERVICE_UNAVAILABLE);
    }
    return MemoryStore::CreateMultipartUpload(bucket, key, uploadId);
  }

  UploadError UploadPart(const string &bucket, const string &key,
                         const string &uploadId, int partNumber,
                         uint64_t contentLength, const MD5Digest &contentMD5,
                         const vector<Chunk> &body, string *eTag) override {
    ++uploadPartCount;
    int current = ++inFlight;
    int seen = maxInFlight.load();
    while (current > seen && !maxInFlight.compare_exchange_weak(seen, current)) {
    }
    {
      lock_guard<mutex> lock(m_lock);
      uploadedParts.push_back(partNumber);
    }
    if (uploadDelayMs > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(uploadDelayMs));
    }

    UploadError err;
    if (partNumber == failPartNumber) {
      err = InjectedError("UploadPart", MPUError::SERVICE_UNAVAILABLE);
    } else if (partNumber == throwPartNumber) {
      --inFlight;
      throw std::runtime_error("connection reset");
    } else {
      err = MemoryStore::UploadPart(bucket, key, uploadId, partNumber,
                                    contentLength, contentMD5, body, eTag);
    }
    --inFlight;
    return err;
  }

  UploadError CompleteMultipartUpload(
      const string &bucket, const string &key, const string &uploadId,
      const vector<CompletedPart> &sortedParts,
      ObjectMetadata *metadata) override {
    ++completeCount;
    completedPartsCount = sortedParts.size();
    if (failComplete) {
      return InjectedError("CompleteMultipartUpload",
                           MPUError::INVALID_PART);
    }
    if (throwComplete) {
      throw std::runtime_error("complete timed out");
    }
    return MemoryStore::CompleteMultipartUpload(bucket, key, uploadId,
                                                sortedParts, metadata);
  }

  UploadError AbortMultipartUpload(const string &bucket, const string &key,
                                   const string &uploadId) override {
    ++abortCount;
    abortedUploadId = uploadId;
    if (failAbort) {
      return InjectedError("AbortMultipartUpload",
                           MPUError::SERVICE_UNAVAILABLE);
    }
    if (throwAbort) {
      throw std::runtime_error("abort timed out");
    }
    return MemoryStore::AbortMultipartUpload(bucket, key, uploadId);
  }

  bool HasUploadOf(const string &key) const {
    vector<UploadSummary> uploads;
    auto err = ListMultipartUploads(bucket_, &uploads);
    EXPECT_TRUE(IsGoodMPUError(err));
    return std::any_of(
        uploads.begin(), uploads.end(),
        [&key](const UploadSummary &upload) { return upload.key == key; });
  }

  vector<int> GetUploadedParts() const {
    lock_guard<mutex> lock(m_lock);
    return uploadedParts;
  }

 public:
  atomic<int> createCount;
  atomic<int> uploadPartCount;
  atomic<int> completeCount;
  atomic<int> abortCount;
  atomic<int> inFlight;
  atomic<int> maxInFlight;
  size_t completedPartsCount = 0;
  string abortedUploadId;

  // set before Send
  bool failCreate;
  int failPartNumber;   // 0 for none
  int throwPartNumber;  // 0 for none
  bool failComplete;
  bool throwComplete;
  bool failAbort;
  bool throwAbort;
  int uploadDelayMs;

 private:
  mutable mutex m_lock;
  vector<int> uploadedParts;
};

string MakeBytes(size_t len, unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  string bytes(len, '\0');
  for (auto &c : bytes) {
    c = static_cast<char>(dist(gen));
  }
  return bytes;
}

// Split data into chunks of random sizes, some of them empty
vector<Chunk> IntoRandomChunks(const string &data, std::mt19937 *gen) {
  vector<size_t> sizes;
  size_t total = 0;
  while (total < data.size()) {
    std::uniform_int_distribution<size_t> dist(0, data.size() - total);
    size_t size = dist(*gen);
    sizes.push_back(size);
    total += size;
  }
  std::shuffle(sizes.begin(), sizes.end(), *gen);

  Chunk whole(data);
  vector<Chunk> chunks;
  for (auto size : sizes) {
    chunks.push_back(whole.SplitTo(size));
  }
  return chunks;
}

unique_ptr<ByteSource> MakeStreamSource(const string &data, size_t chunkSize) {
  return unique_ptr<ByteSource>(
      new StreamByteSource(make_shared<istringstream>(data), chunkSize));
}

// Yield one chunk, then fail the way a stream with exceptions() set does
class ThrowingSource : public ByteSource {
 public:
  explicit ThrowingSource(size_t firstChunkSize)
      : m_first(MakeBytes(firstChunkSize, 23)), m_polled(false) {}

  PollState PollNext(const Waker &waker, ChunkOutcome *item) override {
    if (!m_polled) {
      m_polled = true;
      *item = ChunkOutcome(Chunk(m_first));
      return PollState::Ready;
    }
    throw std::ios_base::failure("read failed");
  }

 private:
  string m_first;
  bool m_polled;
};

class MultipartUploadTest : public Test {
 protected:
  static void SetUpTestCase() { InitLog(); }

  void SetUp() override {
    m_store = make_shared<RecordingStore>(minPartSize_);
    m_config = UploadConfiguration(minPartSize_, maxPartSize_, 5, 4);
  }

  // Upload data in random chunks and check the object read back
  void Check(size_t size, size_t concurrencyLimit, unsigned seed) {
    string key = "object-" + std::to_string(seed);
    string data = MakeBytes(size, seed);
    std::mt19937 gen(seed);
    m_config.SetConcurrencyLimit(concurrencyLimit);

    MultipartUpload upload(m_store, m_config);
    upload.SetBucket(bucket_).SetKey(key).SetBody(unique_ptr<ByteSource>(
        new ChunkListByteSource(IntoRandomChunks(data, &gen))));
    auto outcome = upload.Send();
    ASSERT_TRUE(outcome.IsSuccess())
        << GetMessageForMPUError(outcome.GetError());
    EXPECT_EQ(outcome.GetResult().bucket, bucket_);
    EXPECT_EQ(outcome.GetResult().key, key);
    EXPECT_EQ(outcome.GetResult().contentLength, size);

    string content;
    ASSERT_TRUE(IsGoodMPUError(m_store->GetObject(bucket_, key, &content)));
    EXPECT_TRUE(content == data) << "object content mismatch";
    EXPECT_EQ(upload.GetState(), UploadState::Done);
    VerifyCallCounts(true);
    if (concurrencyLimit > 0) {
      EXPECT_LE(m_store->maxInFlight.load(),
                static_cast<int>(concurrencyLimit));
    }
  }

  void VerifyCallCounts(bool success) {
    EXPECT_EQ(m_store->createCount.load(), 1);
    if (success) {
      EXPECT_EQ(m_store->completeCount.load(), 1);
      EXPECT_EQ(m_store->abortCount.load(), 0);
    } else {
      EXPECT_LE(m_store->completeCount.load(), 1);
      EXPECT_EQ(m_store->abortCount.load(), 1);
    }
  }

 protected:
  shared_ptr<RecordingStore> m_store;
  UploadConfiguration m_config;
};

TEST_F(MultipartUploadTest, TestEmpty) { Check(0, 0, 1); }

TEST_F(MultipartUploadTest, TestSmall) { Check(minPartSize_ / 2, 0, 2); }

TEST_F(MultipartUploadTest, TestExact) { Check(minPartSize_ * 2, 0, 3); }

TEST_F(MultipartUploadTest, TestLarge) { Check(minPartSize_ * 5 / 2, 0, 4); }

TEST_F(MultipartUploadTest, TestSequential) { Check(minPartSize_ * 5, 1, 5); }

TEST_F(MultipartUploadTest, TestConcurrent) { Check(minPartSize_ * 5, 2, 6); }

TEST_F(MultipartUploadTest, TestConcurrentUnlimited) {
  Check(minPartSize_ * 5, 0, 7);
}

TEST_F(MultipartUploadTest, TestZeroByteSource) {
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("empty").SetBody(
      MakeStreamSource(string(), 1024));
  auto outcome = upload.Send();
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetResult().contentLength, 0u);
  EXPECT_EQ(outcome.GetResult().partsCount, 0);

  // created then completed with no part
  VerifyCallCounts(true);
  EXPECT_EQ(m_store->uploadPartCount.load(), 0);
  EXPECT_EQ(m_store->completedPartsCount, 0u);
  EXPECT_TRUE(upload.GetSession().completedParts.empty());
  string content = "garbage";
  ASSERT_TRUE(IsGoodMPUError(m_store->GetObject(bucket_, "empty", &content)));
  EXPECT_TRUE(content.empty());
}

TEST_F(MultipartUploadTest, TestExactlyMinBytes) {
  string data = MakeBytes(minPartSize_, 8);
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("min").SetBody(
      MakeStreamSource(data, MPU::Data::Size::KB1 * 8));
  auto outcome = upload.Send();
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetResult().partsCount, 1);
  EXPECT_EQ(outcome.GetResult().contentLength, minPartSize_);
  EXPECT_EQ(m_store->uploadPartCount.load(), 1);
}

TEST_F(MultipartUploadTest, TestTwiceMinWithMaxTwiceMin) {
  string data = MakeBytes(minPartSize_ * 2, 9);
  m_config.SetPartSizeRange(minPartSize_, minPartSize_ * 2);
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("twice").SetBody(unique_ptr<ByteSource>(
      new ChunkListByteSource(vector<Chunk>{Chunk(data)})));
  auto outcome = upload.Send();
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetResult().partsCount, 1);
  EXPECT_EQ(outcome.GetResult().contentLength, minPartSize_ * 2);
  ASSERT_EQ(upload.GetSession().completedParts.size(), 1u);
  EXPECT_EQ(upload.GetSession().completedParts[0].partNumber, 1);
}

TEST_F(MultipartUploadTest, TestLimitOneUploadsSequentially) {
  string data = MakeBytes(minPartSize_ * 5 / 2, 10);
  m_config.SetConcurrencyLimit(1);
  m_store->uploadDelayMs = 5;
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("sequential").SetBody(
      MakeStreamSource(data, MPU::Data::Size::KB1 * 16));
  auto outcome = upload.Send();
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(m_store->maxInFlight.load(), 1);
  EXPECT_EQ(m_store->GetUploadedParts(), (vector<int>{1, 2, 3}));

  string content;
  ASSERT_TRUE(IsGoodMPUError(m_store->GetObject(bucket_, "sequential",
                                                &content)));
  EXPECT_TRUE(content == data);
}

TEST_F(MultipartUploadTest, TestConcurrencyBound) {
  string data = MakeBytes(minPartSize_ * 12, 11);
  m_config.SetConcurrencyLimit(2);
  m_config.SetPoolSize(4);
  m_store->uploadDelayMs = 10;
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("bounded").SetBody(unique_ptr<ByteSource>(
      new ChunkListByteSource(vector<Chunk>{Chunk(data)})));
  auto outcome = upload.Send();
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetResult().partsCount, 3);
  EXPECT_LE(m_store->maxInFlight.load(), 2);

  auto &parts = upload.GetSession().completedParts;
  ASSERT_EQ(parts.size(), 3u);
  for (size_t i = 0; i < parts.size(); ++i) {
    EXPECT_EQ(parts[i].partNumber, static_cast<int>(i + 1));
  }
}

TEST_F(MultipartUploadTest, TestInlineUpload) {
  string data = MakeBytes(minPartSize_ * 3, 12);
  m_config.SetPoolSize(0);
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("inline").SetBody(
      MakeStreamSource(data, MPU::Data::Size::KB64));
  auto outcome = upload.Send();
  ASSERT_TRUE(outcome.IsSuccess());
  EXPECT_EQ(m_store->maxInFlight.load(), 1);
  // tasks finishing at their first poll are swap removed, so the order of
  // upload is not the part order
  auto uploaded = m_store->GetUploadedParts();
  std::sort(uploaded.begin(), uploaded.end());
  EXPECT_EQ(uploaded, (vector<int>{1, 2, 3}));
}

TEST_F(MultipartUploadTest, TestCreateFailure) {
  m_store->failCreate = true;
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("create").SetBody(
      MakeStreamSource(MakeBytes(100, 13), 1024));
  auto outcome = upload.Send();
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), MPUError::SERVICE_UNAVAILABLE);
  EXPECT_EQ(m_store->createCount.load(), 1);
  EXPECT_EQ(m_store->uploadPartCount.load(), 0);
  EXPECT_EQ(m_store->completeCount.load(), 0);
  EXPECT_EQ(m_store->abortCount.load(), 0);
  EXPECT_EQ(upload.GetState(), UploadState::Initial);
  EXPECT_TRUE(upload.GetSession().uploadId.empty());
}

TEST_F(MultipartUploadTest, TestPartFailureAborts) {
  m_store->failPartNumber = 2;
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("part").SetBody(unique_ptr<ByteSource>(
      new ChunkListByteSource(
          vector<Chunk>{Chunk(MakeBytes(maxPartSize_ * 2, 14))})));
  auto outcome = upload.Send();
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), MPUError::SERVICE_UNAVAILABLE);
  EXPECT_EQ(outcome.GetError().GetExceptionName(), "UploadPart");
  VerifyCallCounts(false);
  EXPECT_EQ(m_store->completeCount.load(), 0);
  EXPECT_EQ(m_store->abortedUploadId, upload.GetSession().uploadId);
  EXPECT_EQ(upload.GetState(), UploadState::Aborted);
  EXPECT_FALSE(upload.GetSession().hasAbortError);
  EXPECT_FALSE(m_store->HasUploadOf("part"));
  string content;
  EXPECT_EQ(m_store->GetObject(bucket_, "part", &content).GetError(),
            MPUError::KEY_NOT_EXIST);
}

TEST_F(MultipartUploadTest, TestPartExceptionBecomesInternalFailure) {
  m_store->throwPartNumber = 1;
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("throw").SetBody(
      MakeStreamSource(MakeBytes(minPartSize_, 15), 4096));
  auto outcome = upload.Send();
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), MPUError::INTERNAL_FAILURE);
  EXPECT_EQ(outcome.GetError().GetMessage(), "connection reset");
  VerifyCallCounts(false);
  EXPECT_FALSE(m_store->HasUploadOf("throw"));
}

TEST_F(MultipartUploadTest, TestCompleteFailureAborts) {
  m_store->failComplete = true;
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("complete").SetBody(
      MakeStreamSource(MakeBytes(minPartSize_ * 2, 16), 4096));
  auto outcome = upload.Send();
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), MPUError::INVALID_PART);
  EXPECT_EQ(outcome.GetError().GetExceptionName(), "CompleteMultipartUpload");
  VerifyCallCounts(false);
  EXPECT_EQ(m_store->completeCount.load(), 1);
  EXPECT_EQ(upload.GetState(), UploadState::Aborted);
  EXPECT_EQ(upload.GetSession().completedParts.size(), 2u);
  EXPECT_FALSE(m_store->HasUploadOf("complete"));
}

TEST_F(MultipartUploadTest, TestAbortFailureRecorded) {
  m_store->failPartNumber = 1;
  m_store->failAbort = true;
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("abort").SetBody(
      MakeStreamSource(MakeBytes(minPartSize_, 17), 4096));
  auto outcome = upload.Send();
  ASSERT_FALSE(outcome.IsSuccess());
  // the primary error is kept
  EXPECT_EQ(outcome.GetError().GetError(), MPUError::SERVICE_UNAVAILABLE);
  EXPECT_EQ(outcome.GetError().GetExceptionName(), "UploadPart");
  VerifyCallCounts(false);

  const UploadSession &session = upload.GetSession();
  EXPECT_EQ(session.state, UploadState::Aborted);
  ASSERT_TRUE(session.hasAbortError);
  EXPECT_EQ(session.abortError.GetError(), MPUError::SERVICE_UNAVAILABLE);
  EXPECT_EQ(session.abortError.GetExceptionName(), "AbortMultipartUpload");
  // nothing cleaned up remotely
  EXPECT_TRUE(m_store->HasUploadOf("abort"));
}

TEST_F(MultipartUploadTest, TestCompleteExceptionAborts) {
  m_store->throwComplete = true;
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("complete-throw").SetBody(
      MakeStreamSource(MakeBytes(minPartSize_ * 2, 21), 4096));
  auto outcome = upload.Send();
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), MPUError::INTERNAL_FAILURE);
  EXPECT_NE(outcome.GetError().GetMessage().find("complete timed out"),
            string::npos);
  VerifyCallCounts(false);
  EXPECT_EQ(m_store->completeCount.load(), 1);
  EXPECT_EQ(upload.GetState(), UploadState::Aborted);
  EXPECT_FALSE(upload.GetSession().hasAbortError);
  EXPECT_FALSE(m_store->HasUploadOf("complete-throw"));
}

TEST_F(MultipartUploadTest, TestAbortExceptionRecorded) {
  m_store->failComplete = true;
  m_store->throwAbort = true;
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("abort-throw").SetBody(
      MakeStreamSource(MakeBytes(minPartSize_, 22), 4096));
  auto outcome = upload.Send();
  ASSERT_FALSE(outcome.IsSuccess());
  // the complete error is returned, not the abort exception
  EXPECT_EQ(outcome.GetError().GetError(), MPUError::INVALID_PART);
  EXPECT_EQ(outcome.GetError().GetExceptionName(), "CompleteMultipartUpload");
  VerifyCallCounts(false);

  const UploadSession &session = upload.GetSession();
  EXPECT_EQ(session.state, UploadState::Aborted);
  ASSERT_TRUE(session.hasAbortError);
  EXPECT_EQ(session.abortError.GetError(), MPUError::INTERNAL_FAILURE);
  EXPECT_EQ(session.abortError.GetExceptionName(), "AbortMultipartUpload");
  EXPECT_TRUE(m_store->HasUploadOf("abort-throw"));
}

TEST_F(MultipartUploadTest, TestBodyExceptionAborts) {
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("body-throw").SetBody(
      unique_ptr<ByteSource>(new ThrowingSource(minPartSize_)));
  auto outcome = upload.Send();
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), MPUError::INTERNAL_FAILURE);
  VerifyCallCounts(false);
  EXPECT_EQ(m_store->completeCount.load(), 0);
  EXPECT_EQ(upload.GetState(), UploadState::Aborted);
  EXPECT_FALSE(m_store->HasUploadOf("body-throw"));
}

TEST_F(MultipartUploadTest, TestReadErrorAfterTwoParts) {
  vector<ChunkOutcome> items;
  items.push_back(ChunkOutcome(Chunk(MakeBytes(minPartSize_, 18))));
  items.push_back(ChunkOutcome(Chunk(MakeBytes(minPartSize_, 19))));
  items.push_back(ChunkOutcome(Chunk(MakeBytes(minPartSize_ / 2, 20))));
  items.push_back(ChunkOutcome(MakeUploadError(
      MPUError::SOURCE_READ_FAILED, "ReadSource", "disk unplugged")));
  m_config.SetConcurrencyLimit(1);

  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("read").SetBody(
      unique_ptr<ByteSource>(new ChunkListByteSource(std::move(items))));
  auto outcome = upload.Send();
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), MPUError::SOURCE_READ_FAILED);
  EXPECT_EQ(outcome.GetError().GetMessage(), "disk unplugged");

  EXPECT_EQ(m_store->GetUploadedParts(), (vector<int>{1, 2}));
  VerifyCallCounts(false);
  EXPECT_EQ(m_store->completeCount.load(), 0);
  EXPECT_EQ(m_store->abortedUploadId, upload.GetSession().uploadId);
  EXPECT_FALSE(m_store->HasUploadOf("read"));
}

TEST_F(MultipartUploadTest, TestAbortOnReadError) {
  vector<ChunkOutcome> items;
  items.push_back(ChunkOutcome(Chunk(MakeBytes(minPartSize_ * 3 / 4, 21))));
  items.push_back(ChunkOutcome(Chunk(MakeBytes(minPartSize_ * 5 / 4, 22))));
  items.push_back(ChunkOutcome(
      MakeUploadError(MPUError::SOURCE_READ_FAILED, "ReadSource", "error")));

  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("abort-read").SetBody(
      unique_ptr<ByteSource>(new ChunkListByteSource(std::move(items))));
  auto outcome = upload.Send();
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), MPUError::SOURCE_READ_FAILED);
  VerifyCallCounts(false);
  EXPECT_FALSE(m_store->HasUploadOf("abort-read"));
}

TEST_F(MultipartUploadTest, TestSendOnlyOnce) {
  MultipartUpload upload(m_store, m_config);
  upload.SetBucket(bucket_).SetKey("once").SetBody(
      MakeStreamSource(MakeBytes(10, 23), 1024));
  ASSERT_TRUE(upload.Send().IsSuccess());

  auto outcome = upload.Send();
  ASSERT_FALSE(outcome.IsSuccess());
  EXPECT_EQ(outcome.GetError().GetError(), MPUError::UPLOAD_ALREADY_SENT);
  VerifyCallCounts(true);
  EXPECT_EQ(upload.GetState(), UploadState::Done);
}

TEST_F(MultipartUploadTest, TestParameterValidation) {
  {
    MultipartUpload upload(m_store, m_config);
    upload.SetKey("key").SetBody(MakeStreamSource("abc", 1024));
    auto outcome = upload.Send();
    ASSERT_FALSE(outcome.IsSuccess());
    EXPECT_EQ(outcome.GetError().GetError(), MPUError::PARAMETER_MISSING);
  }
  {
    MultipartUpload upload(m_store, m_config);
    upload.SetBucket(bucket_).SetBody(MakeStreamSource("abc", 1024));
    auto outcome = upload.Send();
    ASSERT_FALSE(outcome.IsSuccess());
    EXPECT_EQ(outcome.GetError().GetError(), MPUError::PARAMETER_MISSING);
  }
  {
    MultipartUpload upload(m_store, m_config);
    upload.SetBucket(bucket_).SetKey("key");
    auto outcome = upload.Send();
    ASSERT_FALSE(outcome.IsSuccess());
    EXPECT_EQ(outcome.GetError().GetError(), MPUError::PARAMETER_MISSING);
  }
  {
    m_config.SetPartSizeRange(minPartSize_, minPartSize_ - 1);
    MultipartUpload upload(m_store, m_config);
    upload.SetBucket(bucket_).SetKey("key").SetBody(
        MakeStreamSource("abc", 1024));
    auto outcome = upload.Send();
    ASSERT_FALSE(outcome.IsSuccess());
    EXPECT_EQ(outcome.GetError().GetError(),
              MPUError::PARAMETER_VALUE_INVALID);
  }
  {
    MultipartUpload upload{shared_ptr<RemoteStore>(), UploadConfiguration()};
    upload.SetBucket(bucket_).SetKey("key").SetBody(
        MakeStreamSource("abc", 1024));
    auto outcome = upload.Send();
    ASSERT_FALSE(outcome.IsSuccess());
    EXPECT_EQ(outcome.GetError().GetError(), MPUError::PARAMETER_MISSING);
  }
  EXPECT_EQ(m_store->createCount.load(), 0);
}

TEST_F(MultipartUploadTest, TestDefaultConfiguration) {
  UploadConfiguration config;
  EXPECT_EQ(config.GetMinPartSize(), MPU::Data::Size::MB5);
  EXPECT_EQ(config.GetMaxPartSize(), MPU::Data::Size::GB5);
  EXPECT_EQ(config.GetConcurrencyLimit(), 5u);
  string reason;
  EXPECT_TRUE(config.Validate(&reason)) << reason;

  auto store = make_shared<RecordingStore>(MPU::Data::Size::MB5);
  string data = MakeBytes(MPU::Data::Size::MB10 + MPU::Data::Size::MB1, 24);
  MultipartUpload upload(store, config);
  upload.SetBucket(bucket_).SetKey("default").SetBody(
      MakeStreamSource(data, MPU::Data::Size::MB1));
  auto outcome = upload.Send();
  ASSERT_TRUE(outcome.IsSuccess()) << GetMessageForMPUError(outcome.GetError());
  EXPECT_EQ(outcome.GetResult().partsCount, 3);
  string content;
  ASSERT_TRUE(IsGoodMPUError(store->GetObject(bucket_, "default", &content)));
  EXPECT_TRUE(content == data);
}

TEST(UploadStateTest, TestNames) {
  EXPECT_EQ(GetUploadStateName(UploadState::Initial), "Initial");
  EXPECT_EQ(GetUploadStateName(UploadState::Completing), "Completing");
  EXPECT_EQ(GetUploadStateName(UploadState::Aborted), "Aborted");
}

}  // namespace Client
}  // namespace MPU

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
