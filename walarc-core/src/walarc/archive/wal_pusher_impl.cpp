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
#include "walarc/archive/wal_pusher_impl.hpp"

#include <glog/logging.h>

#include <string>

#include "walarc/assert_nd.hpp"
#include "walarc/archive/archive_paths.hpp"
#include "walarc/archive/bg_uploader_impl.hpp"
#include "walarc/storage/stream_pipe_impl.hpp"
#include "walarc/storage/uploader_impl.hpp"
#include "walarc/stream/file_stream.hpp"

namespace walarc {
namespace archive {

WalPusher::WalPusher(
  storage::Uploader* uploader,
  crypto::Crypter* crypter,
  const std::string& server,
  bool verify)
  : uploader_(uploader), crypter_(crypter), server_(server), verify_(verify) {
  ASSERT_ND(uploader_);
  ASSERT_ND(crypter_);
}

ErrorCode WalPusher::archive_segment(const fs::Path& segment_file) {
  stream::FileSource source(segment_file);
  CHECK_ERROR_CODE(source.open());
  const std::string path = wal_object_path(server_, segment_file.filename());
  storage::StreamPipe pipe(uploader_, crypter_, path, verify_);
  storage::UploadResult result;
  ErrorCode code = pipe.upload_all(&source, &result);
  if (code == kErrorCodeOk) {
    LOG(INFO) << "Archived " << segment_file << " as " << result.location_;
  }
  return code;
}

ErrorCode WalPusher::push(const fs::Path& segment_file, int32_t background_workers) {
  BackgroundSegmentUploader background(this);
  background.start(segment_file, background_workers);
  ErrorCode code = archive_segment(segment_file);
  background.stop();
  return code;
}

}  // namespace archive
}  // namespace walarc
