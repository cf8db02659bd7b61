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

#include <string>

#include "walarc/error_code.hpp"
#include "walarc/test_common.hpp"
#include "walarc/wal/segment_name.hpp"

/**
 * @file test_segment_name.cpp
 * Testcases for walarc::wal::SegmentName and LSN parsing.
 */

namespace walarc {
namespace wal {
DEFINE_TEST_CASE_PACKAGE(SegmentNameTest, walarc.wal);

std::string next_of(const std::string& name) {
  std::string out;
  EXPECT_EQ(kErrorCodeOk, next_segment_name(name, &out)) << name;
  return out;
}

TEST(SegmentNameTest, Parse) {
  SegmentName name;
  EXPECT_EQ(kErrorCodeOk, SegmentName::parse("0000000A0000000B000000C1", &name));
  EXPECT_EQ(0xAU, name.get_timeline());
  EXPECT_EQ(0xBU, name.get_log_id());
  EXPECT_EQ(0xC1U, name.get_segment_no());
  EXPECT_EQ(std::string("0000000A0000000B000000C1"), name.str());

  EXPECT_EQ(kErrorCodeOk, SegmentName::parse("0000000a0000000b000000c1", &name));
  EXPECT_EQ(std::string("0000000A0000000B000000C1"), name.str());
}

TEST(SegmentNameTest, ParseInvalid) {
  SegmentName name;
  EXPECT_EQ(kErrorCodeWalInvalidSegmentName, SegmentName::parse("", &name));
  EXPECT_EQ(kErrorCodeWalInvalidSegmentName, SegmentName::parse("00000001000000000000001", &name));
  EXPECT_EQ(kErrorCodeWalInvalidSegmentName,
            SegmentName::parse("0000000100000000000000010", &name));
  EXPECT_EQ(kErrorCodeWalInvalidSegmentName, SegmentName::parse("00000001000000000000001G", &name));
  EXPECT_EQ(kErrorCodeWalInvalidSegmentName, SegmentName::parse("000000010000000000000100", &name));
  std::string out;
  EXPECT_EQ(kErrorCodeWalInvalidSegmentName, next_segment_name("xyz", &out));
}

TEST(SegmentNameTest, NextWithinLogId) {
  EXPECT_EQ(std::string("000000010000000000000002"), next_of("000000010000000000000001"));
  EXPECT_EQ(std::string("0000000100000000000000A0"), next_of("00000001000000000000009F"));
  EXPECT_EQ(std::string("0000000100000000000000FF"), next_of("0000000100000000000000FE"));
}

TEST(SegmentNameTest, NextCarriesIntoLogId) {
  EXPECT_EQ(std::string("000000010000000100000000"), next_of("0000000100000000000000FF"));
  EXPECT_EQ(std::string("000000010000000200000000"), next_of("0000000100000001000000FF"));
  EXPECT_EQ(std::string("000000010000010000000000"), next_of("00000001000000FF000000FF"));
}

TEST(SegmentNameTest, NextKeepsTimeline) {
  for (uint32_t timeline = 1; timeline < 0x20; timeline += 7) {
    SegmentName name(timeline, 0x12, 0xFF);
    SegmentName next;
    EXPECT_EQ(kErrorCodeOk, name.next(&next));
    EXPECT_EQ(timeline, next.get_timeline());
    EXPECT_EQ(0x13U, next.get_log_id());
    EXPECT_EQ(0U, next.get_segment_no());
    EXPECT_TRUE(name < next);
    EXPECT_TRUE(name.str() < next.str());
  }
}

TEST(SegmentNameTest, WalkManySegments) {
  // 256 segments per log-id, so 1000 steps from 0/0 end in log-id 3, segment 0xE8
  std::string name("000000010000000000000000");
  for (int i = 0; i < 1000; ++i) {
    name = next_of(name);
  }
  EXPECT_EQ(std::string("0000000100000003000000E8"), name);
}

TEST(SegmentNameTest, Overflow) {
  SegmentName last(1, kMaxLogId, kMaxSegmentNo);
  SegmentName next;
  EXPECT_EQ(kErrorCodeWalSegmentOverflow, last.next(&next));
  std::string out;
  EXPECT_EQ(kErrorCodeWalSegmentOverflow, next_segment_name("00000001FFFFFFFF000000FF", &out));
  EXPECT_EQ(std::string("00000001FFFFFFFF000000FF"), next_of("00000001FFFFFFFF000000FE"));
}

TEST(SegmentNameTest, Lsn) {
  Lsn lsn = 0;
  EXPECT_EQ(kErrorCodeOk, parse_lsn("2/E5000028", &lsn));
  EXPECT_EQ(0x2E5000028ULL, lsn);
  EXPECT_EQ(kErrorCodeOk, parse_lsn("0/0", &lsn));
  EXPECT_EQ(0ULL, lsn);
  EXPECT_EQ(kErrorCodeOk, parse_lsn("FFFFFFFF/FFFFFFFF", &lsn));
  EXPECT_EQ(0xFFFFFFFFFFFFFFFFULL, lsn);
  EXPECT_EQ(kErrorCodeWalInvalidLsn, parse_lsn("2E5000028", &lsn));
  EXPECT_EQ(kErrorCodeWalInvalidLsn, parse_lsn("/1", &lsn));
  EXPECT_EQ(kErrorCodeWalInvalidLsn, parse_lsn("1/", &lsn));
  EXPECT_EQ(kErrorCodeWalInvalidLsn, parse_lsn("1/0x10", &lsn));
  EXPECT_EQ(kErrorCodeWalInvalidLsn, parse_lsn("1/123456789", &lsn));
}

TEST(SegmentNameTest, PrefetchPaths) {
  PrefetchPaths paths("/var/pgdata/xlog", "000000010000000000000051");
  EXPECT_EQ(std::string("/var/pgdata/xlog/.wal-g/prefetch"), paths.prefetch_dir_);
  EXPECT_EQ(std::string("/var/pgdata/xlog/.wal-g/prefetch/running"), paths.running_dir_);
  EXPECT_EQ(std::string("/var/pgdata/xlog/.wal-g/prefetch/running/000000010000000000000051"),
            paths.running_file_);
  EXPECT_EQ(std::string("/var/pgdata/xlog/.wal-g/prefetch/000000010000000000000051"),
            paths.fetched_file_);
  PrefetchPaths slashed("/var/pgdata/xlog/", "000000010000000000000051");
  EXPECT_EQ(paths.fetched_file_, slashed.fetched_file_);
}

}  // namespace wal
}  // namespace walarc

TEST_MAIN_CAPTURE_SIGNALS(SegmentNameTest, walarc.wal);
