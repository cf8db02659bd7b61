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
#include "walarc/archive/archive_paths.hpp"

#include <ostream>
#include <string>

#include "walarc/assorted/assorted_func.hpp"

namespace walarc {
namespace archive {
namespace {
const char* const kWalFolder = "/wal_005/";
const char* const kBackupFolder = "/basebackups_005/";
const char* const kSchemeSeparator = "://";
}  // namespace

ErrorCode StoragePrefix::parse(const std::string& text, StoragePrefix* out) {
  size_t scheme_end = text.find(kSchemeSeparator);
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return kErrorCodeConfInvalidPrefix;
  }
  std::string rest = text.substr(scheme_end + 3);
  size_t bucket_end = rest.find('/');
  std::string bucket = rest.substr(0, bucket_end);
  if (bucket.empty()) {
    return kErrorCodeConfInvalidPrefix;
  }
  std::string server;
  if (bucket_end != std::string::npos) {
    server = rest.substr(bucket_end + 1);
  }
  while (!server.empty() && server[server.size() - 1] == '/') {
    server.erase(server.size() - 1);
  }
  out->scheme_ = text.substr(0, scheme_end);
  out->bucket_ = bucket;
  out->server_ = sanitize_path(server);
  return kErrorCodeOk;
}

std::ostream& operator<<(std::ostream& o, const StoragePrefix& v) {
  o << v.scheme_ << kSchemeSeparator << v.bucket_ << "/" << v.server_;
  return o;
}

std::string sanitize_path(const std::string& path) {
  std::string ret(path);
  while (ret.find("//") != std::string::npos) {
    ret = assorted::replace_all(ret, "//", "/");
  }
  while (!ret.empty() && ret[0] == '/') {
    ret.erase(0, 1);
  }
  return ret;
}

std::string wal_object_path(const std::string& server, const std::string& segment_file_name) {
  return sanitize_path(server + kWalFolder + segment_file_name + ".lz4");
}

std::string partitions_prefix(const std::string& server, const std::string& backup_name) {
  return sanitize_path(server + kBackupFolder + backup_name + "/tar_partitions/");
}

std::string sentinel_object_path(const std::string& server, const std::string& backup_name) {
  return sanitize_path(server + kBackupFolder + backup_name + "_backup_stop_sentinel.xml");
}

}  // namespace archive
}  // namespace walarc
