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
#ifndef WALARC_WAL_SEGMENT_NAME_HPP_
#define WALARC_WAL_SEGMENT_NAME_HPP_
#include <stdint.h>

#include <iosfwd>
#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/error_code.hpp"

/**
 * @defgroup WAL Write-Ahead Log Naming
 * @brief Arithmetic on WAL segment names and log sequence numbers.
 * @details
 * A segment name is 24 upper-case hexadecimal characters, three 8-character fields:
 * @code
 * TTTTTTTT LLLLLLLL SSSSSSSS
 * timeline log-id   segment
 * @endcode
 * With 16MB segments a log-id holds 0x100 segments, so the segment field never exceeds 0xFF.
 * Incrementing the last segment of a log-id carries into the log-id.
 */
namespace walarc {
namespace wal {

/**
 * @brief A position in the write-ahead log. High 32 bits are the log-id.
 * @ingroup WAL
 */
typedef uint64_t Lsn;

/** Number of characters in a segment name. */
const uint32_t kSegmentNameLength = 24;
/** Number of characters in each of the three fields of a segment name. */
const uint32_t kSegmentFieldLength = 8;
/** Largest segment number in one log-id. */
const uint32_t kMaxSegmentNo = 0xFF;
/** Largest log-id. The successor of kMaxLogId's last segment does not exist. */
const uint32_t kMaxLogId = 0xFFFFFFFFU;

/**
 * @brief Parses the "<hex>/<hex>" textual form of an LSN, e.g. "2/E5000028" is 0x2E5000028.
 * @ingroup WAL
 * @return kErrorCodeWalInvalidLsn if the slash is missing or either half is not 1-8 hex digits.
 */
ErrorCode parse_lsn(const std::string& text, Lsn* out);

/**
 * @brief An immutable WAL segment identifier.
 * @ingroup WAL
 * @details
 * Construct one with parse() or by deriving the successor of another with next().
 */
class SegmentName {
 public:
  SegmentName() : timeline_(0), log_id_(0), segment_no_(0) {}
  SegmentName(uint32_t timeline, uint32_t log_id, uint32_t segment_no)
    : timeline_(timeline), log_id_(log_id), segment_no_(segment_no) {}

  /**
   * @brief Parses the 24-character form.
   * @return kErrorCodeWalInvalidSegmentName if the length is not 24, a character is not
   * a hex digit, or the segment field exceeds kMaxSegmentNo.
   */
  static ErrorCode parse(const std::string& text, SegmentName* out);

  /**
   * @brief Derives the successor of this segment.
   * @return kErrorCodeWalSegmentOverflow if this is the last segment of kMaxLogId.
   */
  ErrorCode   next(SegmentName* out) const;

  uint32_t    get_timeline() const { return timeline_; }
  uint32_t    get_log_id() const { return log_id_; }
  uint32_t    get_segment_no() const { return segment_no_; }

  /** The 24-character upper-case form. */
  std::string str() const;

  bool operator==(const SegmentName& other) const {
    return timeline_ == other.timeline_ && log_id_ == other.log_id_
      && segment_no_ == other.segment_no_;
  }
  bool operator!=(const SegmentName& other) const { return !operator==(other); }
  /** Same order as the names compare as strings. */
  bool operator<(const SegmentName& other) const {
    if (timeline_ != other.timeline_) {
      return timeline_ < other.timeline_;
    } else if (log_id_ != other.log_id_) {
      return log_id_ < other.log_id_;
    }
    return segment_no_ < other.segment_no_;
  }

  friend std::ostream& operator<<(std::ostream& o, const SegmentName& v);

 private:
  uint32_t timeline_;
  uint32_t log_id_;
  uint32_t segment_no_;
};

/**
 * @brief Shorthand of SegmentName::parse() followed by SegmentName::next().
 * @ingroup WAL
 * @details
 * "0000000100000001000000FF" becomes "000000010000000200000000".
 */
ErrorCode next_segment_name(const std::string& name, std::string* out);

/**
 * @brief Where a restore-side prefetcher keeps a segment it fetches ahead of time.
 * @ingroup WAL
 * @details
 * For wal_dir "/var/pgdata/xlog/" and segment "000000010000000000000051":
 * @code
 * prefetch_dir_  /var/pgdata/xlog/.wal-g/prefetch
 * running_dir_   /var/pgdata/xlog/.wal-g/prefetch/running
 * running_file_  /var/pgdata/xlog/.wal-g/prefetch/running/000000010000000000000051
 * fetched_file_  /var/pgdata/xlog/.wal-g/prefetch/000000010000000000000051
 * @endcode
 * Pure string composition. Nothing is touched on disk.
 */
struct PrefetchPaths {
  PrefetchPaths(const std::string& wal_dir, const std::string& segment_name);

  std::string prefetch_dir_;
  std::string running_dir_;
  std::string running_file_;
  std::string fetched_file_;
};

}  // namespace wal
}  // namespace walarc
#endif  // WALARC_WAL_SEGMENT_NAME_HPP_
