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
#include "walarc/storage/uploader_impl.hpp"

#include <glog/logging.h>

#include <ostream>
#include <string>

#include "walarc/assert_nd.hpp"

namespace walarc {
namespace storage {

Uploader::Uploader(StorageClient* client) : client_(client), last_success_(true) {
  ASSERT_ND(client_);
}

ErrorCode Uploader::submit(
  stream::ByteSource* source,
  const std::string& path,
  UploadResult* result) {
  result->path_ = path;
  result->location_.clear();
  result->error_ = client_->submit_object(path, source, this, &result->location_);
  last_success_ = result->is_success();
  if (!result->is_success()) {
    LOG(ERROR) << "Failed to upload " << path << ": " << get_error_name(result->error_)
      << " (" << get_error_message(result->error_) << ")";
  }
  return result->error_;
}

ErrorCode Uploader::head(const std::string& path, std::string* checksum) {
  return client_->head_object(path, checksum);
}

void Uploader::on_retry(const std::string& path, uint32_t attempt, ErrorCode cause) {
  LOG(WARNING) << "Retrying upload of " << path << " (retry " << attempt << " of "
    << client_->get_options().max_retries_ << ") after " << get_error_name(cause);
}

std::ostream& operator<<(std::ostream& o, const UploadResult& v) {
  o << "<UploadResult>"
    << "<path_>" << v.path_ << "</path_>"
    << "<location_>" << v.location_ << "</location_>"
    << "<checksum_>" << v.checksum_ << "</checksum_>"
    << "<error_>" << get_error_name(v.error_) << "</error_>"
    << "</UploadResult>";
  return o;
}

}  // namespace storage
}  // namespace walarc
