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

#include <string>

#include "walarc/error_code.hpp"
#include "walarc/test_common.hpp"
#include "walarc/archive/archive_paths.hpp"

namespace walarc {
namespace archive {
DEFINE_TEST_CASE_PACKAGE(ArchivePathsTest, walarc.archive);

TEST(ArchivePathsTest, ParsePrefix) {
  StoragePrefix prefix;
  EXPECT_EQ(kErrorCodeOk, StoragePrefix::parse("s3://mybucket/db/main/", &prefix));
  EXPECT_EQ(std::string("s3"), prefix.scheme_);
  EXPECT_EQ(std::string("mybucket"), prefix.bucket_);
  EXPECT_EQ(std::string("db/main"), prefix.server_);

  EXPECT_EQ(kErrorCodeOk, StoragePrefix::parse("file://onlybucket", &prefix));
  EXPECT_EQ(std::string("file"), prefix.scheme_);
  EXPECT_EQ(std::string("onlybucket"), prefix.bucket_);
  EXPECT_EQ(std::string(""), prefix.server_);

  EXPECT_EQ(kErrorCodeOk, StoragePrefix::parse("file://b//x//y", &prefix));
  EXPECT_EQ(std::string("x/y"), prefix.server_);
}

TEST(ArchivePathsTest, ParsePrefixInvalid) {
  StoragePrefix prefix;
  EXPECT_EQ(kErrorCodeConfInvalidPrefix, StoragePrefix::parse("", &prefix));
  EXPECT_EQ(kErrorCodeConfInvalidPrefix, StoragePrefix::parse("bucket/server", &prefix));
  EXPECT_EQ(kErrorCodeConfInvalidPrefix, StoragePrefix::parse("://bucket/server", &prefix));
  EXPECT_EQ(kErrorCodeConfInvalidPrefix, StoragePrefix::parse("s3:///server", &prefix));
  EXPECT_EQ(kErrorCodeConfInvalidPrefix, StoragePrefix::parse("s3://", &prefix));
}

TEST(ArchivePathsTest, Sanitize) {
  EXPECT_EQ(std::string("a/b/c"), sanitize_path("//a//b///c"));
  EXPECT_EQ(std::string("a/b/"), sanitize_path("/a/b/"));
  EXPECT_EQ(std::string(""), sanitize_path("///"));
  EXPECT_EQ(std::string("plain"), sanitize_path("plain"));
}

TEST(ArchivePathsTest, ObjectPaths) {
  EXPECT_EQ(
    std::string("db/wal_005/000000010000000000000003.lz4"),
    wal_object_path("db", "000000010000000000000003"));
  EXPECT_EQ(
    std::string("wal_005/000000010000000000000003.lz4"),
    wal_object_path("", "000000010000000000000003"));
  EXPECT_EQ(
    std::string("db/basebackups_005/base_000000010000000000000004/tar_partitions/"),
    partitions_prefix("db", "base_000000010000000000000004"));
  EXPECT_EQ(
    std::string("db/basebackups_005/base_000000010000000000000004_backup_stop_sentinel.xml"),
    sentinel_object_path("db", "base_000000010000000000000004"));
}

}  // namespace archive
}  // namespace walarc

TEST_MAIN_CAPTURE_SIGNALS(ArchivePathsTest, walarc.archive);
