/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#include <stdint.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include "walarc/error_code.hpp"
#include "walarc/test_common.hpp"
#include "walarc/fs/filesystem.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/storage/filesystem_storage_client.hpp"
#include "walarc/storage/storage_options.hpp"
#include "walarc/storage/uploader_impl.hpp"
#include "walarc/stream/byte_stream.hpp"
#include "walarc/stream/file_stream.hpp"
#include "walarc/stream/md5_source.hpp"
#include "walarc/stream/memory_stream.hpp"

/**
 * @file test_storage_client.cpp
 * Testcases for walarc::storage::StorageClient, its filesystem implementation, and Uploader.
 */

namespace walarc {
namespace storage {
DEFINE_TEST_CASE_PACKAGE(StorageClientTest, walarc.storage);

StorageOptions tiny_storage_options() {
  StorageOptions options;
  options.part_size_kb_ = 16;
  options.upload_concurrency_ = 3;
  options.retry_base_delay_ms_ = 1;
  options.max_retries_ = 3;
  return options;
}

std::string make_data(uint32_t size) {
  std::string data(size, '\0');
  for (uint32_t i = 0; i < size; ++i) {
    data[i] = static_cast<char>(i ^ (i >> 8));
  }
  return data;
}

std::string read_file(const fs::Path& path) {
  stream::FileSource source(path);
  EXPECT_EQ(kErrorCodeOk, source.open());
  stream::MemorySink sink;
  EXPECT_EQ(kErrorCodeOk, stream::copy_stream(&source, &sink, nullptr));
  return sink.get_data();
}

std::string md5_of(const std::string& data) {
  stream::MemorySource source(data);
  stream::Md5Source md5(&source);
  stream::MemorySink sink;
  EXPECT_EQ(kErrorCodeOk, stream::copy_stream(&md5, &sink, nullptr));
  std::string digest;
  EXPECT_EQ(kErrorCodeOk, md5.hex_digest(&digest));
  return digest;
}

/** Nothing is left in the staging area once uploads finished, successfully or not. */
void expect_no_staging(const FilesystemStorageClient& client) {
  fs::Path uploads(client.get_root());
  uploads /= FilesystemStorageClient::kUploadsFolder;
  if (fs::exists(uploads)) {
    EXPECT_EQ(0U, uploads.child_paths().size());
  }
}

struct CountingListener : public RetryListener {
  CountingListener() : retries_(0) {}
  void on_retry(const std::string& /*path*/, uint32_t attempt, ErrorCode cause) override {
    ++retries_;
    EXPECT_GE(attempt, 1U);
    EXPECT_EQ(kErrorCodeStorageTransport, cause);
  }
  std::atomic<uint32_t> retries_;
};

/** Fails the first failures_ part uploads with a transient error, or always if negative. */
class FlakyStorageClient : public FilesystemStorageClient {
 public:
  FlakyStorageClient(const StorageOptions& options, const fs::Path& root, int32_t failures)
    : FilesystemStorageClient(options, root), failures_(failures), calls_(0) {}

  uint32_t get_calls() const { return calls_; }

 protected:
  ErrorCode upload_part(
    const std::string& upload_id,
    uint32_t part_number,
    const char* data,
    uint64_t size) override {
    int32_t call = calls_++;
    if (failures_ < 0 || call < failures_) {
      return kErrorCodeStorageTransport;
    }
    return FilesystemStorageClient::upload_part(upload_id, part_number, data, size);
  }

 private:
  const int32_t         failures_;
  std::atomic<int32_t>  calls_;
};

/** Fails every part with a non-transient error. */
class BrokenStorageClient : public FilesystemStorageClient {
 public:
  BrokenStorageClient(const StorageOptions& options, const fs::Path& root)
    : FilesystemStorageClient(options, root), calls_(0) {}
  uint32_t get_calls() const { return calls_; }

 protected:
  ErrorCode upload_part(const std::string&, uint32_t, const char*, uint64_t) override {
    ++calls_;
    return kErrorCodeFsWriteFailed;
  }

 private:
  std::atomic<uint32_t> calls_;
};

/** Fails in the middle of the stream. */
class FailingSource : public stream::ByteSource {
 public:
  explicit FailingSource(uint64_t fail_after) : fail_after_(fail_after), position_(0) {}
  ErrorCode read(void* buffer, uint64_t desired, uint64_t* read_bytes) override {
    *read_bytes = 0;
    if (position_ >= fail_after_) {
      return kErrorCodeFsReadFailed;
    }
    uint64_t size = std::min<uint64_t>(desired, fail_after_ - position_);
    std::memset(buffer, 'f', size);
    position_ += size;
    *read_bytes = size;
    return kErrorCodeOk;
  }

 private:
  const uint64_t fail_after_;
  uint64_t position_;
};

fs::Path random_root() {
  return fs::Path(std::string("tmp_buckets/") + get_random_name());
}

TEST(StorageClientTest, Multipart) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  EXPECT_EQ(std::string("file"), std::string(client.get_scheme()));
  // 16KB parts: 5 full parts and a short one
  const std::string data = make_data(16 * 1024 * 5 + 1000);
  stream::MemorySource source(data);
  std::string location;
  EXPECT_EQ(kErrorCodeOk, client.submit_object("server/obj.lz4", &source, nullptr, &location));
  EXPECT_EQ("file://" + client.get_object_path("server/obj.lz4").string(), location);
  EXPECT_EQ(data, read_file(client.get_object_path("server/obj.lz4")));

  std::string checksum;
  EXPECT_EQ(kErrorCodeOk, client.head_object("server/obj.lz4", &checksum));
  EXPECT_EQ(md5_of(data), checksum);
  expect_no_staging(client);
  fs::remove_all(root);
}

TEST(StorageClientTest, ExactPartBoundary) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  const std::string data = make_data(16 * 1024 * 2);
  stream::MemorySource source(data);
  std::string location;
  EXPECT_EQ(kErrorCodeOk, client.submit_object("a/b", &source, nullptr, &location));
  EXPECT_EQ(data, read_file(client.get_object_path("a/b")));
  fs::remove_all(root);
}

TEST(StorageClientTest, EmptyObject) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  stream::MemorySource source("");
  std::string location;
  EXPECT_EQ(kErrorCodeOk, client.submit_object("empty", &source, nullptr, &location));
  EXPECT_TRUE(fs::is_regular_file(client.get_object_path("empty")));
  EXPECT_EQ(0U, fs::file_size(client.get_object_path("empty")));
  std::string checksum;
  EXPECT_EQ(kErrorCodeOk, client.head_object("empty", &checksum));
  EXPECT_EQ(std::string("d41d8cd98f00b204e9800998ecf8427e"), checksum);
  fs::remove_all(root);
}

TEST(StorageClientTest, NoSuchObject) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  std::string checksum;
  EXPECT_EQ(kErrorCodeStorageNoSuchObject, client.head_object("nothing/here", &checksum));
}

TEST(StorageClientTest, RetryThenSucceed) {
  fs::Path root(random_root());
  FlakyStorageClient client(tiny_storage_options(), root, 2);
  CountingListener listener;
  const std::string data = make_data(40000);
  stream::MemorySource source(data);
  std::string location;
  EXPECT_EQ(kErrorCodeOk, client.submit_object("flaky", &source, &listener, &location));
  EXPECT_EQ(2U, listener.retries_.load());
  EXPECT_EQ(3U + 2U, client.get_calls());  // three parts plus two failed attempts
  EXPECT_EQ(data, read_file(client.get_object_path("flaky")));
  fs::remove_all(root);
}

TEST(StorageClientTest, RetryExhausted) {
  fs::Path root(random_root());
  StorageOptions options = tiny_storage_options();
  FlakyStorageClient client(options, root, -1);
  CountingListener listener;
  stream::MemorySource source(make_data(1000));
  std::string location;
  EXPECT_EQ(kErrorCodeStorageRetryExhausted,
            client.submit_object("never", &source, &listener, &location));
  EXPECT_EQ(static_cast<uint32_t>(options.max_retries_), listener.retries_.load());
  EXPECT_EQ(options.max_retries_ + 1U, client.get_calls());
  EXPECT_FALSE(fs::exists(client.get_object_path("never")));
  expect_no_staging(client);
  fs::remove_all(root);
}

TEST(StorageClientTest, NonTransientNotRetried) {
  fs::Path root(random_root());
  BrokenStorageClient client(tiny_storage_options(), root);
  CountingListener listener;
  stream::MemorySource source(make_data(1000));
  std::string location;
  EXPECT_EQ(kErrorCodeFsWriteFailed, client.submit_object("broken", &source, &listener, &location));
  EXPECT_EQ(0U, listener.retries_.load());
  EXPECT_EQ(1U, client.get_calls());
  EXPECT_FALSE(fs::exists(client.get_object_path("broken")));
  expect_no_staging(client);
  fs::remove_all(root);
}

TEST(StorageClientTest, SourceFails) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  FailingSource source(50000);
  std::string location;
  EXPECT_EQ(kErrorCodeFsReadFailed, client.submit_object("partial", &source, nullptr, &location));
  EXPECT_FALSE(fs::exists(client.get_object_path("partial")));
  expect_no_staging(client);
  fs::remove_all(root);
}

TEST(StorageClientTest, UploaderSubmit) {
  fs::Path root(random_root());
  FlakyStorageClient client(tiny_storage_options(), root, -1);
  Uploader uploader(&client);
  EXPECT_TRUE(uploader.is_last_success());
  stream::MemorySource source("abc");
  UploadResult result;
  EXPECT_EQ(kErrorCodeStorageRetryExhausted, uploader.submit(&source, "x/y", &result));
  EXPECT_FALSE(result.is_success());
  EXPECT_EQ(std::string("x/y"), result.path_);
  EXPECT_TRUE(result.location_.empty());
  EXPECT_FALSE(uploader.is_last_success());

  FilesystemStorageClient good_client(tiny_storage_options(), root);
  Uploader good_uploader(&good_client);
  stream::MemorySource good_source("abc");
  EXPECT_EQ(kErrorCodeOk, good_uploader.submit(&good_source, "x/z", &result));
  EXPECT_TRUE(result.is_success());
  EXPECT_EQ("file://" + good_client.get_object_path("x/z").string(), result.location_);
  EXPECT_TRUE(good_uploader.is_last_success());
  std::string checksum;
  EXPECT_EQ(kErrorCodeOk, good_uploader.head("x/z", &checksum));
  EXPECT_EQ(md5_of("abc"), checksum);
  fs::remove_all(root);
}

TEST(StorageClientTest, UploaderAwaitAll) {
  fs::Path root(random_root());
  FilesystemStorageClient client(tiny_storage_options(), root);
  Uploader uploader(&client);
  const int kThreads = 8;
  std::atomic<int> finished(0);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    uploader.register_upload();
    threads.emplace_back([&uploader, &finished, i]{
      std::this_thread::sleep_for(std::chrono::milliseconds(10 * (i % 3)));
      stream::MemorySource source(make_data(20000 + i));
      UploadResult result;
      std::string path = std::string("concurrent/") + std::to_string(i);
      EXPECT_EQ(kErrorCodeOk, uploader.submit(&source, path, &result));
      ++finished;
      uploader.complete_upload();
    });
  }
  uploader.await_all();
  EXPECT_EQ(kThreads, finished.load());
  EXPECT_EQ(0U, uploader.get_outstanding_count());
  for (std::thread& t : threads) {
    t.join();
  }
  for (int i = 0; i < kThreads; ++i) {
    std::string path = std::string("concurrent/") + std::to_string(i);
    EXPECT_EQ(make_data(20000 + i), read_file(client.get_object_path(path)));
  }
  fs::remove_all(root);
}

}  // namespace storage
}  // namespace walarc

TEST_MAIN_CAPTURE_SIGNALS(StorageClientTest, walarc.storage);
