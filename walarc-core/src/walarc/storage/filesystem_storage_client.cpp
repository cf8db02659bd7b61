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
#include "walarc/storage/filesystem_storage_client.hpp"

#include <glog/logging.h>

#include <functional>
#include <sstream>
#include <string>
#include <thread>

#include "walarc/assert_nd.hpp"
#include "walarc/fs/filesystem.hpp"
#include "walarc/stream/byte_stream.hpp"
#include "walarc/stream/file_stream.hpp"
#include "walarc/stream/md5_source.hpp"

namespace walarc {
namespace storage {
const char* const FilesystemStorageClient::kUploadsFolder = ".uploads";

FilesystemStorageClient::FilesystemStorageClient(
  const StorageOptions& options,
  const fs::Path& root)
  : StorageClient(options), root_(root) {
}

fs::Path FilesystemStorageClient::get_object_path(const std::string& path) const {
  fs::Path ret(root_);
  ret /= path;
  return ret;
}

fs::Path FilesystemStorageClient::get_upload_folder(const std::string& upload_id) const {
  fs::Path ret(root_);
  ret /= kUploadsFolder;
  ret /= upload_id;
  return ret;
}

fs::Path FilesystemStorageClient::get_part_path(
  const std::string& upload_id,
  uint32_t part_number) const {
  fs::Path ret(get_upload_folder(upload_id));
  std::stringstream name;
  name << "part_" << part_number;
  ret /= name.str();
  return ret;
}

ErrorCode FilesystemStorageClient::head_object(const std::string& path, std::string* checksum) {
  fs::Path file(get_object_path(path));
  if (!fs::is_regular_file(file)) {
    return kErrorCodeStorageNoSuchObject;
  }
  stream::FileSource source(file);
  CHECK_ERROR_CODE(source.open());
  stream::Md5Source md5(&source);
  char buffer[1 << 14];
  while (true) {
    uint64_t read_bytes;
    CHECK_ERROR_CODE(md5.read(buffer, sizeof(buffer), &read_bytes));
    if (read_bytes == 0) {
      break;
    }
  }
  return md5.hex_digest(checksum);
}

ErrorCode FilesystemStorageClient::create_multipart(
  const std::string& path,
  std::string* upload_id) {
  fs::Path uploads(root_);
  uploads /= kUploadsFolder;
  if (!fs::create_directories(uploads)) {
    LOG(ERROR) << "Could not create " << uploads << " for " << path;
    return kErrorCodeFsMkdirFailed;
  }
  const uint64_t differentiator = std::hash<std::thread::id>()(std::this_thread::get_id());
  // mkdir() fails if the folder exists, so it doubles as the claim of a unique id.
  for (uint32_t trial = 0; trial < 16U; ++trial) {
    std::string id = fs::unique_name("%%%%%%%%%%%%%%%%", differentiator + trial);
    if (fs::create_directory(get_upload_folder(id))) {
      *upload_id = id;
      return kErrorCodeOk;
    }
  }
  LOG(ERROR) << "Could not create a staging folder under " << uploads;
  return kErrorCodeFsMkdirFailed;
}

ErrorCode FilesystemStorageClient::upload_part(
  const std::string& upload_id,
  uint32_t part_number,
  const char* data,
  uint64_t size) {
  if (!fs::is_directory(get_upload_folder(upload_id))) {
    return kErrorCodeStorageNoSuchUpload;
  }
  stream::FileSink sink(get_part_path(upload_id, part_number));
  CHECK_ERROR_CODE(sink.open());
  CHECK_ERROR_CODE(sink.write(data, size));
  return sink.close();
}

ErrorCode FilesystemStorageClient::complete_multipart(
  const std::string& path,
  const std::string& upload_id,
  uint32_t part_count,
  std::string* location) {
  fs::Path folder(get_upload_folder(upload_id));
  if (!fs::is_directory(folder)) {
    return kErrorCodeStorageNoSuchUpload;
  }
  fs::Path destination(get_object_path(path));
  fs::Path assembled(folder);
  assembled /= "assembled";
  {
    stream::FileSink sink(assembled);
    CHECK_ERROR_CODE(sink.open());
    for (uint32_t part_number = 1; part_number <= part_count; ++part_number) {
      stream::FileSource part(get_part_path(upload_id, part_number));
      CHECK_ERROR_CODE(part.open());
      CHECK_ERROR_CODE(stream::copy_stream(&part, &sink, nullptr));
    }
    CHECK_ERROR_CODE(sink.close());
  }
  if (!fs::create_directories(destination.parent_path())) {
    LOG(ERROR) << "Could not create the folder of " << destination;
    return kErrorCodeFsMkdirFailed;
  }
  if (!fs::durable_atomic_rename(assembled, destination)) {
    LOG(ERROR) << "Could not rename " << assembled << " to " << destination;
    return kErrorCodeFsRenameFailed;
  }
  fs::remove_all(folder);
  *location = std::string(get_scheme()) + "://" + destination.string();
  VLOG(1) << "Stored " << path << " with storage_class=" << options_.storage_class_
    << ", sse=" << options_.server_side_encryption_;
  return kErrorCodeOk;
}

ErrorCode FilesystemStorageClient::abort_multipart(const std::string& upload_id) {
  fs::Path folder(get_upload_folder(upload_id));
  if (!fs::exists(folder)) {
    return kErrorCodeStorageNoSuchUpload;
  }
  fs::remove_all(folder);
  return kErrorCodeOk;
}

}  // namespace storage
}  // namespace walarc
