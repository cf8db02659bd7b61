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
#include "walarc/stream/md5_source.hpp"

#include <glog/logging.h>
#include <openssl/evp.h>

#include <string>

#include "walarc/assorted/assorted_func.hpp"

namespace walarc {
namespace stream {

Md5Source::Md5Source(ByteSource* upstream)
  : upstream_(upstream),
    context_(EVP_MD_CTX_new()),
    failed_(false),
    finalized_(false),
    read_bytes_(0) {
  if (context_ == nullptr || EVP_DigestInit_ex(context_, EVP_md5(), nullptr) != 1) {
    LOG(ERROR) << "Failed to initialize MD5 digest context";
    failed_ = true;
  }
}

Md5Source::~Md5Source() {
  if (context_) {
    EVP_MD_CTX_free(context_);
    context_ = nullptr;
  }
}

ErrorCode Md5Source::read(void* buffer, uint64_t desired, uint64_t* read_bytes) {
  *read_bytes = 0;
  if (failed_ || finalized_) {
    return kErrorCodeStrChecksumFailed;
  }
  CHECK_ERROR_CODE(upstream_->read(buffer, desired, read_bytes));
  if (*read_bytes > 0) {
    if (EVP_DigestUpdate(context_, buffer, *read_bytes) != 1) {
      LOG(ERROR) << "EVP_DigestUpdate failed";
      failed_ = true;
      return kErrorCodeStrChecksumFailed;
    }
    read_bytes_ += *read_bytes;
  }
  return kErrorCodeOk;
}

ErrorCode Md5Source::hex_digest(std::string* out) {
  if (failed_) {
    return kErrorCodeStrChecksumFailed;
  }
  if (!finalized_) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context_, digest, &length) != 1) {
      LOG(ERROR) << "EVP_DigestFinal_ex failed";
      failed_ = true;
      return kErrorCodeStrChecksumFailed;
    }
    digest_ = assorted::to_hex_string(digest, length);
    finalized_ = true;
  }
  *out = digest_;
  return kErrorCodeOk;
}

}  // namespace stream
}  // namespace walarc
