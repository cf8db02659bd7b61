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
#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "walarc/error_stack.hpp"
#include "walarc/test_common.hpp"
#include "walarc/archive/archive_options.hpp"
#include "walarc/archive/archive_paths.hpp"
#include "walarc/archive/archiver.hpp"
#include "walarc/archive/backup_pusher_impl.hpp"
#include "walarc/archive/backup_sentinel.hpp"
#include "walarc/debugging/debugging_supports.hpp"
#include "walarc/fs/filesystem.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/stream/file_stream.hpp"
#include "walarc/stream/lz4_stream.hpp"
#include "walarc/stream/memory_stream.hpp"
#include "walarc/tar/tar_entry.hpp"
#include "walarc/tar/tar_reader.hpp"

namespace walarc {
namespace archive {
DEFINE_TEST_CASE_PACKAGE(ArchiverTest, walarc.archive);

const char* const kSegment = "000000010000000000000003";

/** Local file of the object in the test bucket. */
fs::Path object_file(const ArchiveOptions& options, const std::string& object_path) {
  fs::Path path(options.local_bucket_root_);
  path /= "testbucket";
  path /= object_path;
  return path;
}

std::string read_lz4_object(const fs::Path& file) {
  stream::FileSource source(file);
  EXPECT_EQ(kErrorCodeOk, source.open());
  stream::Lz4DecompressSource decompressor(&source);
  stream::MemorySink sink;
  EXPECT_EQ(kErrorCodeOk, stream::copy_stream(&decompressor, &sink, nullptr));
  return sink.get_data();
}

/** Entry name to body of every entry in a part object. Directories map to "". */
std::map<std::string, std::string> read_part(const fs::Path& file) {
  std::map<std::string, std::string> ret;
  stream::FileSource source(file);
  EXPECT_EQ(kErrorCodeOk, source.open());
  stream::Lz4DecompressSource decompressor(&source);
  tar::TarReader reader(&decompressor);
  while (true) {
    tar::TarEntry entry;
    bool end;
    EXPECT_EQ(kErrorCodeOk, reader.next(&entry, &end));
    if (end) {
      break;
    }
    stream::MemorySink body;
    EXPECT_EQ(kErrorCodeOk, reader.read_body(&body));
    ret[entry.name_] = body.get_data();
  }
  return ret;
}

/** A small but plausible data directory. */
fs::Path make_data_dir() {
  fs::Path root(get_random_tmp_file_path("pgdata"));
  struct File { const char* path; std::string content; };
  const std::vector<File> files = {
    {"PG_VERSION", "10\n"},
    {"global/pg_control", std::string(8192, '\x07')},
    {"global/1262", std::string(20000, 'g')},
    {"base/1/1259", std::string(70000, 'c')},
    {"base/1/1249", std::string(3000, 'a')},
    {"base/13212/2608", std::string(150000, 'd')},
    {"pg_wal/000000010000000000000001", std::string(30000, 'w')},
    {"pg_wal/archive_status/000000010000000000000001.done", ""},
    {"postmaster.pid", "1234\n"},
    {"postmaster.opts", "postgres\n"},
  };
  for (const File& file : files) {
    fs::Path path(root);
    path /= file.path;
    EXPECT_TRUE(write_test_file(path, file.content));
  }
  fs::Path empty(root);
  empty /= "pg_tblspc";
  EXPECT_TRUE(fs::create_directories(empty));
  return root;
}

TEST(ArchiverTest, InitializeUninitialize) {
  ArchiveOptions options = get_tiny_options();
  Archiver archiver(options);
  EXPECT_FALSE(archiver.is_initialized());
  COERCE_ERROR(archiver.initialize());
  EXPECT_TRUE(archiver.is_initialized());
  EXPECT_EQ(std::string("testserver"), archiver.get_server());
  COERCE_ERROR(archiver.uninitialize());
  EXPECT_FALSE(archiver.is_initialized());
  cleanup_test(options);
}

TEST(ArchiverTest, TwoArchiversShareLogging) {
  ArchiveOptions options = get_tiny_options();
  Archiver first(options);
  Archiver second(options);
  EXPECT_EQ(0, debugging::DebuggingSupports::get_active_count());
  COERCE_ERROR(first.initialize());
  COERCE_ERROR(second.initialize());
  EXPECT_EQ(2, debugging::DebuggingSupports::get_active_count());
  COERCE_ERROR(first.uninitialize());
  EXPECT_EQ(1, debugging::DebuggingSupports::get_active_count());
  COERCE_ERROR(second.uninitialize());
  EXPECT_EQ(0, debugging::DebuggingSupports::get_active_count());
  cleanup_test(options);
}

TEST(ArchiverTest, InvalidPrefix) {
  ArchiveOptions options = get_tiny_options();
  options.storage_prefix_ = "testbucket/testserver";
  Archiver archiver(options);
  EXPECT_EQ(kErrorCodeConfInvalidPrefix, archiver.initialize().get_error_code());
  EXPECT_FALSE(archiver.is_initialized());
  COERCE_ERROR(archiver.uninitialize());
  cleanup_test(options);
}

TEST(ArchiverTest, UnsupportedScheme) {
  ArchiveOptions options = get_tiny_options();
  options.storage_prefix_ = "gs://testbucket/testserver";
  Archiver archiver(options);
  EXPECT_EQ(kErrorCodeStorageUnsupportedScheme, archiver.initialize().get_error_code());
  COERCE_ERROR(archiver.uninitialize());
  cleanup_test(options);
}

TEST(ArchiverTest, NotInitialized) {
  ArchiveOptions options = get_tiny_options();
  Archiver archiver(options);
  EXPECT_EQ(kErrorCodeNotInitialized, archiver.wal_push(fs::Path(kSegment)).get_error_code());
  cleanup_test(options);
}

TEST(ArchiverTest, WalPush) {
  ArchiveOptions options = get_tiny_options();
  fs::Path segment(get_random_tmp_file_path(kSegment));
  std::string content;
  for (int i = 0; i < 20000; ++i) {
    content += "record " + std::to_string(i) + ";";
  }
  EXPECT_TRUE(write_test_file(segment, content));

  Archiver archiver(options);
  COERCE_ERROR(archiver.initialize());
  {
    UninitializeGuard guard(&archiver);
    COERCE_ERROR(archiver.wal_push(segment));
    COERCE_ERROR(archiver.uninitialize());
  }
  fs::Path object(object_file(options, wal_object_path("testserver", kSegment)));
  EXPECT_TRUE(fs::is_regular_file(object)) << object;
  EXPECT_LT(fs::file_size(object), content.size());
  EXPECT_EQ(content, read_lz4_object(object));
  fs::remove_all(segment.parent_path());
  cleanup_test(options);
}

TEST(ArchiverTest, WalPushMissingFile) {
  ArchiveOptions options = get_tiny_options();
  Archiver archiver(options);
  COERCE_ERROR(archiver.initialize());
  {
    UninitializeGuard guard(&archiver);
    fs::Path missing(get_random_tmp_file_path(kSegment));
    EXPECT_EQ(kErrorCodeFsNotFound, archiver.wal_push(missing).get_error_code());
    COERCE_ERROR(archiver.uninitialize());
  }
  EXPECT_FALSE(fs::exists(object_file(options, wal_object_path("testserver", kSegment))));
  cleanup_test(options);
}

TEST(ArchiverTest, WalPushWithBackgroundUpload) {
  ArchiveOptions options = get_tiny_options();
  options.background_upload_workers_ = 2;
  fs::Path folder(get_random_tmp_file_path("pg_wal"));
  const std::vector<std::string> others = {
    "000000010000000000000004", "000000010000000000000005", "000000010000000000000006"};
  fs::Path segment(folder);
  segment /= kSegment;
  EXPECT_TRUE(write_test_file(segment, std::string(40000, 's')));
  for (const std::string& other : others) {
    fs::Path path(folder);
    path /= other;
    EXPECT_TRUE(write_test_file(path, other));
    fs::Path ready(folder);
    ready /= "archive_status";
    ready /= other + ".ready";
    EXPECT_TRUE(write_test_file(ready, ""));
  }

  Archiver archiver(options);
  COERCE_ERROR(archiver.initialize());
  {
    UninitializeGuard guard(&archiver);
    COERCE_ERROR(archiver.wal_push(segment));
    COERCE_ERROR(archiver.uninitialize());
  }
  EXPECT_TRUE(fs::exists(object_file(options, wal_object_path("testserver", kSegment))));
  // how many were picked up in the background depends on timing, but every .done is stored
  for (const std::string& other : others) {
    fs::Path done(folder);
    done /= "archive_status";
    done /= other + ".done";
    fs::Path object(object_file(options, wal_object_path("testserver", other)));
    if (fs::exists(done)) {
      EXPECT_EQ(other, read_lz4_object(object));
    }
  }
  fs::remove_all(folder.parent_path());
  cleanup_test(options);
}

TEST(ArchiverTest, BackupPush) {
  ArchiveOptions options = get_tiny_options();
  options.sentinel_user_data_ = "from options";
  fs::Path data_dir = make_data_dir();
  BackupRequest request;
  request.data_dir_ = data_dir;
  request.backup_name_ = "base_000000010000000000000002";
  request.finish_lsn_ = "0/2000130";
  request.backup_label_ = "START WAL LOCATION: 0/2000028 (file 000000010000000000000002)\n";
  request.tablespace_map_ = "";
  request.producers_ = 3;

  BackupSentinel sentinel;
  Archiver archiver(options);
  COERCE_ERROR(archiver.initialize());
  {
    UninitializeGuard guard(&archiver);
    COERCE_ERROR(archiver.backup_push(request, &sentinel));
    COERCE_ERROR(archiver.uninitialize());
  }
  EXPECT_EQ(request.backup_name_, sentinel.backup_name_);
  EXPECT_EQ(request.finish_lsn_, sentinel.finish_lsn_);
  EXPECT_EQ(std::string("from options"), sentinel.user_data_);
  EXPECT_GE(sentinel.part_count_, 3U);
  EXPECT_GT(sentinel.uncompressed_size_, 250000);

  // the sentinel object is the same as what was returned
  fs::Path sentinel_file(
    object_file(options, sentinel_object_path("testserver", request.backup_name_)));
  EXPECT_TRUE(fs::is_regular_file(sentinel_file));
  BackupSentinel stored;
  COERCE_ERROR(stored.load_from_file(sentinel_file));
  EXPECT_EQ(sentinel.part_count_, stored.part_count_);
  EXPECT_EQ(sentinel.uncompressed_size_, stored.uncompressed_size_);

  fs::Path partitions(
    object_file(options, partitions_prefix("testserver", request.backup_name_)));
  std::vector<fs::Path> parts = partitions.child_paths();
  EXPECT_EQ(sentinel.part_count_, parts.size());

  std::map<std::string, std::string> entries;
  std::map<std::string, std::string> control;
  for (const fs::Path& part : parts) {
    std::map<std::string, std::string> part_entries = read_part(part);
    if (part.filename() == "pg_control.tar.lz4") {
      control = part_entries;
      continue;
    }
    for (const auto& entry : part_entries) {
      EXPECT_EQ(0U, entries.count(entry.first)) << entry.first;
      entries.insert(entry);
    }
  }
  EXPECT_EQ(1U, control.size());
  EXPECT_EQ(std::string(8192, '\x07'), control["global/pg_control"]);

  EXPECT_EQ(std::string("10\n"), entries["PG_VERSION"]);
  EXPECT_EQ(std::string(70000, 'c'), entries["base/1/1259"]);
  EXPECT_EQ(std::string(150000, 'd'), entries["base/13212/2608"]);
  EXPECT_EQ(request.backup_label_, entries["backup_label"]);
  EXPECT_EQ(1U, entries.count("tablespace_map"));
  EXPECT_EQ(1U, entries.count("pg_tblspc/"));
  EXPECT_EQ(1U, entries.count("pg_wal/"));
  EXPECT_EQ(0U, entries.count("pg_wal/000000010000000000000001"));
  EXPECT_EQ(0U, entries.count("pg_wal/archive_status/"));
  EXPECT_EQ(0U, entries.count("postmaster.pid"));
  EXPECT_EQ(0U, entries.count("postmaster.opts"));
  EXPECT_EQ(0U, entries.count("global/pg_control"));

  fs::remove_all(data_dir.parent_path());
  cleanup_test(options);
}

TEST(ArchiverTest, BackupPushWithoutPgControl) {
  ArchiveOptions options = get_tiny_options();
  fs::Path data_dir = make_data_dir();
  fs::Path control(data_dir);
  control /= BackupPusher::kPgControlPath;
  EXPECT_TRUE(fs::remove(control));
  BackupRequest request;
  request.data_dir_ = data_dir;
  request.backup_name_ = "base_000000010000000000000002";

  Archiver archiver(options);
  COERCE_ERROR(archiver.initialize());
  {
    UninitializeGuard guard(&archiver);
    BackupSentinel sentinel;
    EXPECT_EQ(
      kErrorCodeArchiveNoSentinel,
      archiver.backup_push(request, &sentinel).get_error_code());
    COERCE_ERROR(archiver.uninitialize());
  }
  EXPECT_FALSE(fs::exists(
    object_file(options, sentinel_object_path("testserver", request.backup_name_))));
  fs::remove_all(data_dir.parent_path());
  cleanup_test(options);
}

TEST(ArchiverTest, Excluded) {
  EXPECT_TRUE(BackupPusher::is_excluded("postmaster.pid"));
  EXPECT_TRUE(BackupPusher::is_excluded("postmaster.opts"));
  EXPECT_TRUE(BackupPusher::is_excluded("pg_wal/000000010000000000000001"));
  EXPECT_TRUE(BackupPusher::is_excluded("pg_xlog/archive_status"));
  EXPECT_TRUE(BackupPusher::is_excluded("global/pg_control"));
  EXPECT_FALSE(BackupPusher::is_excluded("pg_wal"));
  EXPECT_FALSE(BackupPusher::is_excluded("base/1/1259"));
  EXPECT_FALSE(BackupPusher::is_excluded("global/1262"));
}

}  // namespace archive
}  // namespace walarc

TEST_MAIN_CAPTURE_SIGNALS(ArchiverTest, walarc.archive);
