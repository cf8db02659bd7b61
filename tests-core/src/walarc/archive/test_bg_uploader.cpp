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
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "walarc/error_code.hpp"
#include "walarc/test_common.hpp"
#include "walarc/archive/bg_uploader_impl.hpp"
#include "walarc/archive/segment_archiver.hpp"
#include "walarc/fs/filesystem.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/wal/segment_name.hpp"

namespace walarc {
namespace archive {
DEFINE_TEST_CASE_PACKAGE(BgUploaderTest, walarc.archive);

/** Records calls. Fails every call if told so. */
class RecordingArchiver : public SegmentArchiver {
 public:
  explicit RecordingArchiver(bool fail) : fail_(fail), running_(0), max_running_(0) {}

  ErrorCode archive_segment(const fs::Path& segment_file) override {
    uint32_t running = ++running_;
    uint32_t seen = max_running_.load();
    while (running > seen && !max_running_.compare_exchange_weak(seen, running)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    {
      std::lock_guard<std::mutex> guard(mutex_);
      ++calls_[segment_file.filename()];
    }
    --running_;
    return fail_ ? kErrorCodeFsWriteFailed : kErrorCodeOk;
  }

  uint32_t get_calls(const std::string& segment) {
    std::lock_guard<std::mutex> guard(mutex_);
    return calls_[segment];
  }
  uint32_t get_distinct() {
    std::lock_guard<std::mutex> guard(mutex_);
    return calls_.size();
  }

  const bool            fail_;
  std::atomic<uint32_t> running_;
  std::atomic<uint32_t> max_running_;
  std::mutex            mutex_;
  std::map<std::string, uint32_t> calls_;
};

/** A WAL folder with sealed segments, each marked ready. */
struct WalFolder {
  explicit WalFolder(uint32_t segments) : folder_(get_random_tmp_file_path("pg_wal")) {
    wal::SegmentName name;
    EXPECT_EQ(kErrorCodeOk, wal::SegmentName::parse("000000010000000000000001", &name));
    for (uint32_t i = 0; i < segments; ++i) {
      EXPECT_TRUE(write_test_file(segment_path(name.str()), "segment " + name.str()));
      EXPECT_TRUE(write_test_file(marker_path(name.str(), ".ready"), ""));
      names_.push_back(name.str());
      wal::SegmentName next;
      EXPECT_EQ(kErrorCodeOk, name.next(&next));
      name = next;
    }
  }
  ~WalFolder() { fs::remove_all(folder_.parent_path()); }

  fs::Path segment_path(const std::string& name) const {
    fs::Path path(folder_);
    path /= name;
    return path;
  }
  fs::Path marker_path(const std::string& name, const char* suffix) const {
    fs::Path path(folder_);
    path /= BackgroundSegmentUploader::kArchiveStatusFolder;
    path /= name + suffix;
    return path;
  }

  fs::Path                  folder_;
  std::vector<std::string>  names_;
};

/** Polls until the condition holds or a generous timeout passes. */
template <typename COND>
bool wait_until(COND condition) {
  for (int i = 0; i < 1000; ++i) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

TEST(BgUploaderTest, Disabled) {
  WalFolder wal(3);
  RecordingArchiver archiver(false);
  BackgroundSegmentUploader uploader(&archiver);
  uploader.start(wal.segment_path(wal.names_[0]), 0);
  EXPECT_FALSE(uploader.is_started());
  uploader.stop();
  EXPECT_EQ(0U, archiver.get_distinct());
}

TEST(BgUploaderTest, EachSegmentOnce) {
  const uint32_t kSegments = 12;
  const int32_t kWorkers = 3;
  WalFolder wal(kSegments);
  RecordingArchiver archiver(false);
  BackgroundSegmentUploader uploader(&archiver);
  // the first segment is what the caller archives by itself
  uploader.start(wal.segment_path(wal.names_[0]), kWorkers);
  EXPECT_TRUE(uploader.is_started());
  EXPECT_TRUE(wait_until([&]{ return uploader.get_total_uploaded() == kSegments - 1; }));
  uploader.stop();
  EXPECT_FALSE(uploader.is_started());
  EXPECT_EQ(0, uploader.get_running_workers());

  EXPECT_LE(archiver.max_running_.load(), static_cast<uint32_t>(kWorkers));
  EXPECT_EQ(0U, archiver.get_calls(wal.names_[0]));
  EXPECT_TRUE(fs::exists(wal.marker_path(wal.names_[0], ".ready")));
  for (uint32_t i = 1; i < kSegments; ++i) {
    EXPECT_EQ(1U, archiver.get_calls(wal.names_[i])) << wal.names_[i];
    EXPECT_FALSE(fs::exists(wal.marker_path(wal.names_[i], ".ready")));
    EXPECT_TRUE(fs::exists(wal.marker_path(wal.names_[i], ".done")));
  }
  EXPECT_EQ(0U, uploader.get_poisoned_count());
}

TEST(BgUploaderTest, JoinsFinishedWorkers) {
  const uint32_t kSegments = 30;
  const int32_t kWorkers = 2;
  WalFolder wal(kSegments);
  RecordingArchiver archiver(false);
  BackgroundSegmentUploader uploader(&archiver);
  uploader.start(wal.segment_path(wal.names_[0]), kWorkers);
  uint32_t max_unjoined = 0;
  EXPECT_TRUE(wait_until([&]{
    max_unjoined = std::max(max_unjoined, uploader.get_unjoined_worker_count());
    return uploader.get_total_uploaded() == kSegments - 1;
  }));
  // exited workers are joined by the following scans, long before stop()
  EXPECT_TRUE(wait_until([&]{ return uploader.get_unjoined_worker_count() == 0; }));
  // the workers running plus those that finished since the last scan
  EXPECT_LT(max_unjoined, kSegments - 1);
  EXPECT_TRUE(uploader.is_started());
  uploader.stop();
  EXPECT_EQ(0U, uploader.get_unjoined_worker_count());
}

TEST(BgUploaderTest, StopDrains) {
  WalFolder wal(20);
  RecordingArchiver archiver(false);
  {
    BackgroundSegmentUploader uploader(&archiver);
    uploader.start(wal.segment_path(wal.names_[0]), 4);
    EXPECT_TRUE(wait_until([&]{ return archiver.get_distinct() > 0; }));
    uploader.stop();
    EXPECT_EQ(0, uploader.get_running_workers());
    // every dispatched segment finished, marker included
    EXPECT_EQ(archiver.get_distinct(), uploader.get_total_uploaded());
    uploader.stop();  // idempotent
  }
  for (uint32_t i = 1; i < wal.names_.size(); ++i) {
    bool archived = archiver.get_calls(wal.names_[i]) > 0;
    EXPECT_EQ(archived, fs::exists(wal.marker_path(wal.names_[i], ".done"))) << wal.names_[i];
    EXPECT_NE(archived, fs::exists(wal.marker_path(wal.names_[i], ".ready"))) << wal.names_[i];
  }
}

TEST(BgUploaderTest, GivesUpAfterMaxAttempts) {
  WalFolder wal(3);
  RecordingArchiver archiver(true);
  BackgroundSegmentUploader uploader(&archiver);
  uploader.start(wal.segment_path(wal.names_[0]), 2);
  EXPECT_TRUE(wait_until([&]{ return uploader.get_poisoned_count() == 2U; }));
  uploader.stop();
  EXPECT_EQ(0U, uploader.get_total_uploaded());
  for (uint32_t i = 1; i < 3; ++i) {
    EXPECT_EQ(3U, archiver.get_calls(wal.names_[i]));
    EXPECT_TRUE(fs::exists(wal.marker_path(wal.names_[i], ".ready")));
    EXPECT_FALSE(fs::exists(wal.marker_path(wal.names_[i], ".done")));
  }
}

}  // namespace archive
}  // namespace walarc

TEST_MAIN_CAPTURE_SIGNALS(BgUploaderTest, walarc.archive);
