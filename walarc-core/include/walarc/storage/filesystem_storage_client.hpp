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
#ifndef WALARC_STORAGE_FILESYSTEM_STORAGE_CLIENT_HPP_
#define WALARC_STORAGE_FILESYSTEM_STORAGE_CLIENT_HPP_
#include <stdint.h>

#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/error_code.hpp"
#include "walarc/fs/path.hpp"
#include "walarc/storage/storage_client.hpp"

namespace walarc {
namespace storage {
/**
 * @brief StorageClient that keeps objects as files under a local directory.
 * @ingroup STORAGE
 * @details
 * Serves the "file" scheme, mainly for tests and for archiving to a mounted volume.
 * Parts are staged as <root>/.uploads/<upload_id>/part_<N> and concatenated into
 * <root>/<path> on completion, followed by an atomic rename, so a reader never sees a
 * partially written object.
 * The checksum is the MD5 of the stored bytes.
 */
class FilesystemStorageClient : public StorageClient {
 public:
  static const char* const kUploadsFolder;

  FilesystemStorageClient(const StorageOptions& options, const fs::Path& root);

  ErrorCode   head_object(const std::string& path, std::string* checksum) CXX11_OVERRIDE;
  const char* get_scheme() const CXX11_OVERRIDE { return "file"; }

  /** Local file that stores the object. */
  fs::Path    get_object_path(const std::string& path) const;
  const fs::Path& get_root() const { return root_; }

 protected:
  ErrorCode create_multipart(const std::string& path, std::string* upload_id) CXX11_OVERRIDE;
  ErrorCode upload_part(
    const std::string& upload_id,
    uint32_t part_number,
    const char* data,
    uint64_t size) CXX11_OVERRIDE;
  ErrorCode complete_multipart(
    const std::string& path,
    const std::string& upload_id,
    uint32_t part_count,
    std::string* location) CXX11_OVERRIDE;
  ErrorCode abort_multipart(const std::string& upload_id) CXX11_OVERRIDE;

 private:
  fs::Path  get_upload_folder(const std::string& upload_id) const;
  fs::Path  get_part_path(const std::string& upload_id, uint32_t part_number) const;

  const fs::Path  root_;
};

}  // namespace storage
}  // namespace walarc
#endif  // WALARC_STORAGE_FILESYSTEM_STORAGE_CLIENT_HPP_
