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
#include "walarc/tar/tar_entry.hpp"

#include <stdint.h>
#include <glog/logging.h>

#include <algorithm>
#include <cstring>
#include <ostream>
#include <string>

namespace walarc {
namespace tar {
namespace {
// offsets and lengths of ustar fields
const uint32_t kNameOffset = 0;
const uint32_t kNameLength = 100;
const uint32_t kModeOffset = 100;
const uint32_t kUidOffset = 108;
const uint32_t kGidOffset = 116;
const uint32_t kIdLength = 8;
const uint32_t kSizeOffset = 124;
const uint32_t kSizeLength = 12;
const uint32_t kMtimeOffset = 136;
const uint32_t kChecksumOffset = 148;
const uint32_t kChecksumLength = 8;
const uint32_t kTypeOffset = 156;
const uint32_t kLinkNameOffset = 157;
const uint32_t kMagicOffset = 257;
const uint32_t kVersionOffset = 263;
const uint32_t kPrefixOffset = 345;
const uint32_t kPrefixLength = 155;

/** Largest value in an 11-digit octal field. Bigger sizes use the base-256 extension. */
const uint64_t kMaxOctal11 = 077777777777ULL;

void put_octal(char* field, uint32_t length, uint64_t value) {
  // length-1 digits with leading zeros, then NUL.
  std::memset(field, '0', length - 1);
  field[length - 1] = '\0';
  for (int32_t i = static_cast<int32_t>(length) - 2; i >= 0 && value > 0; --i) {
    field[i] = static_cast<char>('0' + (value & 7));
    value >>= 3;
  }
}

void put_number(char* field, uint32_t length, uint64_t value) {
  if (value <= kMaxOctal11 || length < 12) {
    put_octal(field, length, value);
    return;
  }
  // GNU base-256: high bit of the first byte set, then big-endian binary.
  std::memset(field, 0, length);
  field[0] = static_cast<char>(0x80);
  for (int32_t i = static_cast<int32_t>(length) - 1; i > 0 && value > 0; --i) {
    field[i] = static_cast<char>(value & 0xFF);
    value >>= 8;
  }
}

bool get_number(const char* field, uint32_t length, uint64_t* out) {
  *out = 0;
  if (static_cast<unsigned char>(field[0]) & 0x80) {
    for (uint32_t i = 1; i < length; ++i) {
      *out = (*out << 8) | static_cast<unsigned char>(field[i]);
    }
    return true;
  }
  uint32_t i = 0;
  while (i < length && field[i] == ' ') {
    ++i;
  }
  for (; i < length && field[i] != '\0' && field[i] != ' '; ++i) {
    if (field[i] < '0' || field[i] > '7') {
      return false;
    }
    *out = (*out << 3) | static_cast<uint64_t>(field[i] - '0');
  }
  return true;
}

void put_string(char* field, uint32_t length, const std::string& value) {
  std::memcpy(field, value.data(), std::min<size_t>(value.size(), length));
}

std::string get_string(const char* field, uint32_t length) {
  const void* end = std::memchr(field, '\0', length);
  size_t size = end ? static_cast<const char*>(end) - field : length;
  return std::string(field, size);
}

uint64_t compute_checksum(const char* block) {
  uint64_t sum = 0;
  for (uint32_t i = 0; i < kTarBlockSize; ++i) {
    if (i >= kChecksumOffset && i < kChecksumOffset + kChecksumLength) {
      sum += ' ';
    } else {
      sum += static_cast<unsigned char>(block[i]);
    }
  }
  return sum;
}
}  // namespace

ErrorCode TarEntry::encode(char* block) const {
  std::memset(block, 0, kTarBlockSize);
  std::string name = name_;
  std::string prefix;
  if (name.size() > kNameLength) {
    // split at a '/' so that the tail fits in name and the head fits in prefix.
    size_t pos = name.find('/', name.size() - kNameLength - 1);
    if (pos == std::string::npos || pos > kPrefixLength || pos == 0) {
      LOG(ERROR) << "Path is too long for a tar entry: " << name_;
      return kErrorCodeTarNameTooLong;
    }
    prefix = name.substr(0, pos);
    name = name.substr(pos + 1);
  }
  if (link_name_.size() > kNameLength) {
    LOG(ERROR) << "Symlink target is too long for a tar entry: " << link_name_;
    return kErrorCodeTarNameTooLong;
  }
  put_string(block + kNameOffset, kNameLength, name);
  put_octal(block + kModeOffset, kIdLength, mode_ & 07777);
  put_octal(block + kUidOffset, kIdLength, 0);
  put_octal(block + kGidOffset, kIdLength, 0);
  put_number(block + kSizeOffset, kSizeLength, type_ == kTarRegularFile ? size_ : 0);
  put_number(block + kMtimeOffset, kSizeLength, mtime_);
  block[kTypeOffset] = static_cast<char>(type_);
  put_string(block + kLinkNameOffset, kNameLength, link_name_);
  std::memcpy(block + kMagicOffset, "ustar", 6);
  std::memcpy(block + kVersionOffset, "00", 2);
  put_string(block + kPrefixOffset, kPrefixLength, prefix);

  // 6 octal digits, NUL, space
  put_octal(block + kChecksumOffset, 7, compute_checksum(block));
  block[kChecksumOffset + 7] = ' ';
  return kErrorCodeOk;
}

ErrorCode TarEntry::decode(const char* block) {
  uint64_t checksum;
  if (!get_number(block + kChecksumOffset, kChecksumLength, &checksum)
    || checksum != compute_checksum(block)) {
    LOG(ERROR) << "Checksum mismatch in a tar header";
    return kErrorCodeTarCorrupted;
  }
  uint64_t mode;
  if (!get_number(block + kModeOffset, kIdLength, &mode)
    || !get_number(block + kSizeOffset, kSizeLength, &size_)
    || !get_number(block + kMtimeOffset, kSizeLength, &mtime_)) {
    return kErrorCodeTarCorrupted;
  }
  mode_ = static_cast<uint32_t>(mode);
  char type = block[kTypeOffset];
  if (type == '\0') {
    type = kTarRegularFile;  // pre-POSIX regular file
  }
  type_ = static_cast<TarEntryType>(type);
  name_ = get_string(block + kNameOffset, kNameLength);
  if (std::memcmp(block + kMagicOffset, "ustar", 5) == 0) {
    std::string prefix = get_string(block + kPrefixOffset, kPrefixLength);
    if (!prefix.empty()) {
      name_ = prefix + "/" + name_;
    }
  }
  link_name_ = get_string(block + kLinkNameOffset, kNameLength);
  return kErrorCodeOk;
}

std::ostream& operator<<(std::ostream& o, const TarEntry& v) {
  o << "<TarEntry>"
    << "<name_>" << v.name_ << "</name_>"
    << "<type_>" << static_cast<char>(v.type_) << "</type_>"
    << "<mode_>" << std::oct << v.mode_ << std::dec << "</mode_>"
    << "<size_>" << v.size_ << "</size_>"
    << "<mtime_>" << v.mtime_ << "</mtime_>";
  if (!v.link_name_.empty()) {
    o << "<link_name_>" << v.link_name_ << "</link_name_>";
  }
  o << "</TarEntry>";
  return o;
}

}  // namespace tar
}  // namespace walarc
