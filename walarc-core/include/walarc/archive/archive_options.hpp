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
#ifndef WALARC_ARCHIVE_ARCHIVE_OPTIONS_HPP_
#define WALARC_ARCHIVE_ARCHIVE_OPTIONS_HPP_
#include <stdint.h>

#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/error_stack.hpp"
#include "walarc/externalize/externalizable.hpp"

// rather than forward declarations of option classes for each package, we include them here.
// just holding instances, rather than pointers, makes (de)allocation simpler.
#include "walarc/crypto/crypto_options.hpp"
#include "walarc/debugging/debugging_options.hpp"
#include "walarc/storage/storage_options.hpp"

namespace walarc {
namespace archive {
/**
 * @brief Set of option values given to the Archiver at start-up.
 * @ingroup ARCHIVE
 * @details
 * This object is a collection of archive-wide settings and settings for individual
 * packages (XxxOptions). Instantiate it with the default constructor, then either modify values,
 * load an XML file written by save_to_file(), or apply environment variables:
 * @code{.cpp}
 * archive::ArchiveOptions options;
 * CHECK_ERROR(options.load_from_file(fs::Path("/etc/walarc.xml")));
 * CHECK_ERROR(options.load_from_env());
 * @endcode
 *
 * @section ENV Environment variables
 * <table>
 * <tr><th>Variable</th><th>Overrides</th></tr>
 * <tr><td>WALE_S3_PREFIX</td><td>storage_prefix_</td></tr>
 * <tr><td>WALG_UPLOAD_CONCURRENCY</td><td>tar_upload_concurrency_</td></tr>
 * <tr><td>WALG_DOWNLOAD_CONCURRENCY</td><td>background_upload_workers_</td></tr>
 * <tr><td>WALG_TAR_SIZE_THRESHOLD</td><td>tar_size_threshold_</td></tr>
 * <tr><td>WALG_VERIFY_UPLOAD</td><td>verify_upload_</td></tr>
 * <tr><td>WALG_SENTINEL_USER_DATA</td><td>sentinel_user_data_</td></tr>
 * <tr><td>WALG_S3_STORAGE_CLASS</td><td>StorageOptions::storage_class_</td></tr>
 * <tr><td>WALG_S3_SSE</td><td>StorageOptions::server_side_encryption_</td></tr>
 * <tr><td>WALG_S3_SSE_KMS_ID</td><td>StorageOptions::sse_kms_key_id_</td></tr>
 * <tr><td>WALG_CRYPTO_PUBLIC_KEY_PATH</td><td>CryptoOptions::public_key_path_</td></tr>
 * <tr><td>WALG_CRYPTO_PRIVATE_KEY_PATH</td><td>CryptoOptions::private_key_path_</td></tr>
 * </table>
 */
struct ArchiveOptions CXX11_FINAL : public virtual externalize::Externalizable {
  enum Constants {
    kDefaultTarUploadConcurrency = 10,
    kDefaultBackgroundUploadWorkers = 0,
  };
  static const int64_t kDefaultTarSizeThreshold = 1000000000LL;

  /**
   * Constructs option values with default values.
   */
  ArchiveOptions();
  ArchiveOptions(const ArchiveOptions& other);
  ArchiveOptions& operator=(const ArchiveOptions& other);

  /**
   * @brief Where objects go, as "<scheme>://<bucket>/<server>".
   * @details
   * Only the "file" scheme is served by this build. Default is "" which fails at start-up.
   */
  std::string     storage_prefix_;

  /**
   * @brief Folder that holds one sub-folder per bucket for the "file" scheme.
   * @details
   * Default is "/var/lib/walarc".
   */
  std::string     local_bucket_root_;

  /**
   * @brief Number of tar parts open at the same time during a backup push.
   * @details
   * Values below 3 are raised to 3. Default is 10.
   */
  uint16_t        tar_upload_concurrency_;

  /**
   * @brief Max number of other ready WAL segments uploaded in the background by a WAL push.
   * @details
   * 0 disables the background upload. Default is 0.
   */
  uint16_t        background_upload_workers_;

  /** A tar part is rotated once it holds this many bytes before compression. Default 1GB. */
  int64_t         tar_size_threshold_;

  /** Whether to compare the checksum of every uploaded object with what the store reports. */
  bool            verify_upload_;

  /** Opaque text stored as it is in the backup sentinel. */
  std::string     sentinel_user_data_;

  storage::StorageOptions     storage_;
  crypto::CryptoOptions       crypto_;
  debugging::DebuggingOptions debugging_;

  /**
   * @brief Overwrites values with the environment variables that are set.
   * @return kErrorCodeConfInvalidEnv if a numeric or boolean variable is malformed
   */
  ErrorStack      load_from_env();

  EXTERNALIZABLE(ArchiveOptions);
};
}  // namespace archive
}  // namespace walarc
#endif  // WALARC_ARCHIVE_ARCHIVE_OPTIONS_HPP_
