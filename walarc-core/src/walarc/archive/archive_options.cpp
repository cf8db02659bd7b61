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
#include "walarc/archive/archive_options.hpp"

#include <stdint.h>
#include <glog/logging.h>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

#include "walarc/assert_nd.hpp"

namespace walarc {
namespace archive {
ArchiveOptions::ArchiveOptions() :
  storage_prefix_(""),
  local_bucket_root_("/var/lib/walarc"),
  tar_upload_concurrency_(kDefaultTarUploadConcurrency),
  background_upload_workers_(kDefaultBackgroundUploadWorkers),
  tar_size_threshold_(kDefaultTarSizeThreshold),
  verify_upload_(false),
  sentinel_user_data_("") {
}

ArchiveOptions::ArchiveOptions(const ArchiveOptions& other) {
  operator=(other);
}

// template-ing just for const/non-const
template <typename OPTION_PTR, typename CHILD_PTR>
std::vector< CHILD_PTR > get_children_impl(OPTION_PTR option) {
  std::vector< CHILD_PTR > children;
  children.push_back(&option->storage_);
  children.push_back(&option->crypto_);
  children.push_back(&option->debugging_);
  return children;
}
std::vector< externalize::Externalizable* > get_children(ArchiveOptions* option) {
  return get_children_impl<ArchiveOptions*, externalize::Externalizable*>(option);
}
std::vector< const externalize::Externalizable* > get_children(const ArchiveOptions* option) {
  return get_children_impl<const ArchiveOptions*, const externalize::Externalizable*>(option);
}

ArchiveOptions& ArchiveOptions::operator=(const ArchiveOptions& other) {
  storage_prefix_ = other.storage_prefix_;
  local_bucket_root_ = other.local_bucket_root_;
  tar_upload_concurrency_ = other.tar_upload_concurrency_;
  background_upload_workers_ = other.background_upload_workers_;
  tar_size_threshold_ = other.tar_size_threshold_;
  verify_upload_ = other.verify_upload_;
  sentinel_user_data_ = other.sentinel_user_data_;
  auto mine = get_children(this);
  auto others = get_children(&other);
  ASSERT_ND(mine.size() == others.size());
  for (size_t i = 0; i < mine.size(); ++i) {
    mine[i]->assign(others[i]);
  }
  return *this;
}

namespace {
/** @return whether the variable is set */
bool get_env(const char* name, std::string* out) {
  const char* value = std::getenv(name);
  if (value == nullptr) {
    return false;
  }
  *out = value;
  return true;
}

ErrorStack get_env_int(const char* name, int64_t min_value, int64_t max_value, int64_t* out) {
  std::string text;
  if (!get_env(name, &text)) {
    return kRetOk;
  }
  char* end = nullptr;
  errno = 0;
  int64_t value = std::strtoll(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0' || errno != 0 || value < min_value || value > max_value) {
    return ERROR_STACK_MSG(kErrorCodeConfInvalidEnv, (std::string(name) + "=" + text).c_str());
  }
  *out = value;
  return kRetOk;
}

ErrorStack get_env_bool(const char* name, bool* out) {
  std::string text;
  if (!get_env(name, &text)) {
    return kRetOk;
  }
  if (text == "1" || text == "true" || text == "TRUE" || text == "True") {
    *out = true;
  } else if (text == "0" || text == "false" || text == "FALSE" || text == "False") {
    *out = false;
  } else {
    return ERROR_STACK_MSG(kErrorCodeConfInvalidEnv, (std::string(name) + "=" + text).c_str());
  }
  return kRetOk;
}
}  // namespace

ErrorStack ArchiveOptions::load_from_env() {
  get_env("WALE_S3_PREFIX", &storage_prefix_);

  int64_t value = tar_upload_concurrency_;
  CHECK_ERROR(get_env_int("WALG_UPLOAD_CONCURRENCY", 1, 0xFFFF, &value));
  tar_upload_concurrency_ = static_cast<uint16_t>(value);
  value = background_upload_workers_;
  CHECK_ERROR(get_env_int("WALG_DOWNLOAD_CONCURRENCY", 0, 0xFFFF, &value));
  background_upload_workers_ = static_cast<uint16_t>(value);
  CHECK_ERROR(get_env_int("WALG_TAR_SIZE_THRESHOLD", 1, INT64_MAX, &tar_size_threshold_));
  CHECK_ERROR(get_env_bool("WALG_VERIFY_UPLOAD", &verify_upload_));
  get_env("WALG_SENTINEL_USER_DATA", &sentinel_user_data_);

  get_env("WALG_S3_STORAGE_CLASS", &storage_.storage_class_);
  get_env("WALG_S3_SSE", &storage_.server_side_encryption_);
  get_env("WALG_S3_SSE_KMS_ID", &storage_.sse_kms_key_id_);

  get_env("WALG_CRYPTO_PUBLIC_KEY_PATH", &crypto_.public_key_path_);
  get_env("WALG_CRYPTO_PRIVATE_KEY_PATH", &crypto_.private_key_path_);
  return kRetOk;
}

ErrorStack ArchiveOptions::load(tinyxml2::XMLElement* element) {
  *this = ArchiveOptions();  // This guarantees default values for optional XML elements.
  EXTERNALIZE_LOAD_ELEMENT(element, storage_prefix_);
  EXTERNALIZE_LOAD_ELEMENT(element, local_bucket_root_);
  EXTERNALIZE_LOAD_ELEMENT(element, tar_upload_concurrency_);
  EXTERNALIZE_LOAD_ELEMENT(element, background_upload_workers_);
  EXTERNALIZE_LOAD_ELEMENT(element, tar_size_threshold_);
  EXTERNALIZE_LOAD_ELEMENT(element, verify_upload_);
  EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, sentinel_user_data_, "");
  for (externalize::Externalizable* child : get_children(this)) {
    CHECK_ERROR(get_child_element(element, child->get_tag_name(), child));
  }
  return kRetOk;
}

ErrorStack ArchiveOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element, "Set of options given to the archiver at start-up"));
  EXTERNALIZE_SAVE_ELEMENT(element, storage_prefix_,
    "Where objects go, as <scheme>://<bucket>/<server>");
  EXTERNALIZE_SAVE_ELEMENT(element, local_bucket_root_,
    "Folder that holds one sub-folder per bucket for the file scheme");
  EXTERNALIZE_SAVE_ELEMENT(element, tar_upload_concurrency_,
    "Number of tar parts open at the same time during a backup push. At least 3.");
  EXTERNALIZE_SAVE_ELEMENT(element, background_upload_workers_,
    "Max number of other ready WAL segments uploaded in the background. 0 to disable.");
  EXTERNALIZE_SAVE_ELEMENT(element, tar_size_threshold_,
    "A tar part is rotated once it holds this many bytes before compression.");
  EXTERNALIZE_SAVE_ELEMENT(element, verify_upload_,
    "Whether to compare the checksum of every uploaded object with what the store reports.");
  EXTERNALIZE_SAVE_ELEMENT(element, sentinel_user_data_,
    "Opaque text stored as it is in the backup sentinel.");
  for (const externalize::Externalizable* child : get_children(this)) {
    CHECK_ERROR(add_child_element(element, child->get_tag_name(), "", *child));
  }
  return kRetOk;
}

}  // namespace archive
}  // namespace walarc
