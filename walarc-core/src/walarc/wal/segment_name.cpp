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
#include "walarc/wal/segment_name.hpp"

#include <glog/logging.h>

#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

namespace walarc {
namespace wal {
namespace {
/** Parses 1 to 8 hex digits. Unlike strtoul, rejects signs, spaces and "0x". */
bool parse_hex32(const std::string& text, uint32_t* out) {
  if (text.empty() || text.size() > kSegmentFieldLength) {
    return false;
  }
  uint32_t value = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else {
      return false;
    }
    value = (value << 4) | digit;
  }
  *out = value;
  return true;
}
}  // namespace

ErrorCode parse_lsn(const std::string& text, Lsn* out) {
  std::size_t slash = text.find('/');
  if (slash == std::string::npos) {
    return kErrorCodeWalInvalidLsn;
  }
  uint32_t high;
  uint32_t low;
  if (!parse_hex32(text.substr(0, slash), &high) || !parse_hex32(text.substr(slash + 1), &low)) {
    return kErrorCodeWalInvalidLsn;
  }
  *out = (static_cast<Lsn>(high) << 32) | low;
  return kErrorCodeOk;
}

ErrorCode SegmentName::parse(const std::string& text, SegmentName* out) {
  if (text.size() != kSegmentNameLength) {
    return kErrorCodeWalInvalidSegmentName;
  }
  uint32_t timeline;
  uint32_t log_id;
  uint32_t segment_no;
  if (!parse_hex32(text.substr(0, kSegmentFieldLength), &timeline)
    || !parse_hex32(text.substr(kSegmentFieldLength, kSegmentFieldLength), &log_id)
    || !parse_hex32(text.substr(kSegmentFieldLength * 2U, kSegmentFieldLength), &segment_no)) {
    return kErrorCodeWalInvalidSegmentName;
  }
  if (segment_no > kMaxSegmentNo) {
    return kErrorCodeWalInvalidSegmentName;
  }
  *out = SegmentName(timeline, log_id, segment_no);
  return kErrorCodeOk;
}

ErrorCode SegmentName::next(SegmentName* out) const {
  if (segment_no_ < kMaxSegmentNo) {
    *out = SegmentName(timeline_, log_id_, segment_no_ + 1U);
  } else if (log_id_ < kMaxLogId) {
    *out = SegmentName(timeline_, log_id_ + 1U, 0);
  } else {
    return kErrorCodeWalSegmentOverflow;
  }
  return kErrorCodeOk;
}

std::string SegmentName::str() const {
  std::stringstream s;
  s << std::hex << std::uppercase << std::setfill('0')
    << std::setw(kSegmentFieldLength) << timeline_
    << std::setw(kSegmentFieldLength) << log_id_
    << std::setw(kSegmentFieldLength) << segment_no_;
  return s.str();
}

std::ostream& operator<<(std::ostream& o, const SegmentName& v) {
  o << v.str();
  return o;
}

ErrorCode next_segment_name(const std::string& name, std::string* out) {
  SegmentName current;
  CHECK_ERROR_CODE(SegmentName::parse(name, &current));
  SegmentName successor;
  CHECK_ERROR_CODE(current.next(&successor));
  *out = successor.str();
  VLOG(1) << "Successor of " << name << " is " << *out;
  return kErrorCodeOk;
}

PrefetchPaths::PrefetchPaths(const std::string& wal_dir, const std::string& segment_name) {
  std::string base = wal_dir;
  if (base.empty() || base[base.size() - 1] != '/') {
    base += '/';
  }
  prefetch_dir_ = base + ".wal-g/prefetch";
  running_dir_ = prefetch_dir_ + "/running";
  running_file_ = running_dir_ + "/" + segment_name;
  fetched_file_ = prefetch_dir_ + "/" + segment_name;
}

}  // namespace wal
}  // namespace walarc
