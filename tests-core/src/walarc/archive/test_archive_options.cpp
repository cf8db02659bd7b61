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
#include <stdlib.h>
#include <gtest/gtest.h>

#include <string>

#include "walarc/error_stack.hpp"
#include "walarc/test_common.hpp"
#include "walarc/archive/archive_options.hpp"
#include "walarc/archive/backup_sentinel.hpp"
#include "walarc/fs/filesystem.hpp"
#include "walarc/fs/path.hpp"

namespace walarc {
namespace archive {
DEFINE_TEST_CASE_PACKAGE(ArchiveOptionsTest, walarc.archive);

/** Sets an environment variable for the scope. */
struct ScopedEnv {
  ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
  ~ScopedEnv() { ::unsetenv(name_); }
  const char* name_;
};

TEST(ArchiveOptionsTest, Defaults) {
  ArchiveOptions options;
  EXPECT_EQ(std::string(""), options.storage_prefix_);
  EXPECT_EQ(10U, options.tar_upload_concurrency_);
  EXPECT_EQ(0U, options.background_upload_workers_);
  EXPECT_EQ(1000000000LL, options.tar_size_threshold_);
  EXPECT_FALSE(options.verify_upload_);
  EXPECT_FALSE(options.crypto_.is_armed());
  EXPECT_EQ(kErrorCodeOk, options.storage_.validate());
}

TEST(ArchiveOptionsTest, XmlRoundTrip) {
  ArchiveOptions options;
  options.storage_prefix_ = "file://bucket/server";
  options.tar_upload_concurrency_ = 7;
  options.background_upload_workers_ = 3;
  options.tar_size_threshold_ = 123456789LL;
  options.verify_upload_ = true;
  options.sentinel_user_data_ = "{\"owner\": \"ops\"}";
  options.storage_.storage_class_ = "STANDARD_IA";
  options.storage_.part_size_kb_ = 1024;
  options.crypto_.public_key_path_ = "/etc/walarc/public.pem";

  std::string xml;
  ErrorStack save_result = options.save_to_string(&xml);
  EXPECT_FALSE(save_result.is_error()) << save_result;

  ArchiveOptions loaded;
  ErrorStack load_result = loaded.load_from_string(xml);
  EXPECT_FALSE(load_result.is_error()) << load_result;
  EXPECT_EQ(options.storage_prefix_, loaded.storage_prefix_);
  EXPECT_EQ(7U, loaded.tar_upload_concurrency_);
  EXPECT_EQ(3U, loaded.background_upload_workers_);
  EXPECT_EQ(123456789LL, loaded.tar_size_threshold_);
  EXPECT_TRUE(loaded.verify_upload_);
  EXPECT_EQ(options.sentinel_user_data_, loaded.sentinel_user_data_);
  EXPECT_EQ(std::string("STANDARD_IA"), loaded.storage_.storage_class_);
  EXPECT_EQ(1024U, loaded.storage_.part_size_kb_);
  EXPECT_TRUE(loaded.crypto_.is_armed());
}

TEST(ArchiveOptionsTest, FileRoundTrip) {
  fs::Path path(get_random_tmp_file_path("walarc_conf.xml"));
  ArchiveOptions options;
  options.storage_prefix_ = "file://bucket/fromfile";
  options.debugging_.verbose_log_level_ = 2;
  options.debugging_.verbose_modules_ = "storage_*=1";
  ErrorStack save_result = options.save_to_file(path);
  EXPECT_FALSE(save_result.is_error()) << save_result;
  EXPECT_TRUE(fs::is_regular_file(path));
  EXPECT_EQ(0600U, fs::file_mode(path) & 0777U);

  // saving again replaces the file instead of failing on the existing one
  options.tar_upload_concurrency_ = 2;
  save_result = options.save_to_file(path);
  EXPECT_FALSE(save_result.is_error()) << save_result;

  ArchiveOptions loaded;
  ErrorStack load_result = loaded.load_from_file(path);
  EXPECT_FALSE(load_result.is_error()) << load_result;
  EXPECT_EQ(std::string("file://bucket/fromfile"), loaded.storage_prefix_);
  EXPECT_EQ(2U, loaded.tar_upload_concurrency_);
  EXPECT_EQ(2, loaded.debugging_.verbose_log_level_);
  EXPECT_EQ(std::string("storage_*=1"), loaded.debugging_.verbose_modules_);
  EXPECT_EQ(1U, path.parent_path().child_paths().size());  // no temporary file left

  fs::Path missing(path.string() + ".missing");
  EXPECT_TRUE(loaded.load_from_file(missing).is_error());
  fs::remove_all(path.parent_path());
}

TEST(ArchiveOptionsTest, LoadFromEnv) {
  ScopedEnv prefix("WALE_S3_PREFIX", "file://envbucket/envserver");
  ScopedEnv concurrency("WALG_UPLOAD_CONCURRENCY", "5");
  ScopedEnv workers("WALG_DOWNLOAD_CONCURRENCY", "2");
  ScopedEnv verify("WALG_VERIFY_UPLOAD", "true");
  ScopedEnv kms("WALG_S3_SSE", "aws:kms");
  ScopedEnv kms_id("WALG_S3_SSE_KMS_ID", "key-1");

  ArchiveOptions options;
  ErrorStack result = options.load_from_env();
  EXPECT_FALSE(result.is_error()) << result;
  EXPECT_EQ(std::string("file://envbucket/envserver"), options.storage_prefix_);
  EXPECT_EQ(5U, options.tar_upload_concurrency_);
  EXPECT_EQ(2U, options.background_upload_workers_);
  EXPECT_TRUE(options.verify_upload_);
  EXPECT_EQ(std::string("aws:kms"), options.storage_.server_side_encryption_);
  EXPECT_EQ(kErrorCodeOk, options.storage_.validate());
  // untouched
  EXPECT_EQ(1000000000LL, options.tar_size_threshold_);
}

TEST(ArchiveOptionsTest, LoadFromEnvInvalid) {
  {
    ScopedEnv concurrency("WALG_UPLOAD_CONCURRENCY", "many");
    ArchiveOptions options;
    EXPECT_EQ(kErrorCodeConfInvalidEnv, options.load_from_env().get_error_code());
  }
  {
    ScopedEnv concurrency("WALG_UPLOAD_CONCURRENCY", "0");
    ArchiveOptions options;
    EXPECT_EQ(kErrorCodeConfInvalidEnv, options.load_from_env().get_error_code());
  }
  {
    ScopedEnv verify("WALG_VERIFY_UPLOAD", "maybe");
    ArchiveOptions options;
    EXPECT_EQ(kErrorCodeConfInvalidEnv, options.load_from_env().get_error_code());
  }
}

TEST(ArchiveOptionsTest, SseKmsMismatch) {
  storage::StorageOptions options;
  options.server_side_encryption_ = storage::StorageOptions::kSseKms;
  EXPECT_EQ(kErrorCodeConfSseKmsMismatch, options.validate());
  options.sse_kms_key_id_ = "key-1";
  EXPECT_EQ(kErrorCodeOk, options.validate());
  options.server_side_encryption_ = "AES256";
  EXPECT_EQ(kErrorCodeConfSseKmsMismatch, options.validate());
  options.sse_kms_key_id_ = "";
  EXPECT_EQ(kErrorCodeOk, options.validate());
  options.part_size_kb_ = 0;
  EXPECT_EQ(kErrorCodeConfValueOutofrange, options.validate());
}

TEST(ArchiveOptionsTest, Sentinel) {
  BackupSentinel sentinel;
  sentinel.backup_name_ = "base_000000010000000000000004";
  sentinel.finish_lsn_ = "0/4000130";
  sentinel.part_count_ = 5;
  sentinel.uncompressed_size_ = 987654321LL;
  sentinel.user_data_ = "nightly";
  std::string xml;
  ErrorStack save_result = sentinel.save_to_string(&xml);
  EXPECT_FALSE(save_result.is_error()) << save_result;

  BackupSentinel loaded;
  ErrorStack load_result = loaded.load_from_string(xml);
  EXPECT_FALSE(load_result.is_error()) << load_result;
  EXPECT_EQ(sentinel.backup_name_, loaded.backup_name_);
  EXPECT_EQ(sentinel.finish_lsn_, loaded.finish_lsn_);
  EXPECT_EQ(5U, loaded.part_count_);
  EXPECT_EQ(987654321LL, loaded.uncompressed_size_);
  EXPECT_EQ(std::string("nightly"), loaded.user_data_);

  sentinel.finish_lsn_ = "not-an-lsn";
  ErrorStack bad_save = sentinel.save_to_string(&xml);
  EXPECT_FALSE(bad_save.is_error());
  EXPECT_EQ(kErrorCodeWalInvalidLsn, loaded.load_from_string(xml).get_error_code());
}

}  // namespace archive
}  // namespace walarc

TEST_MAIN_CAPTURE_SIGNALS(ArchiveOptionsTest, walarc.archive);
