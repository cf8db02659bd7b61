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
#include "walarc/debugging/debugging_supports.hpp"

#include <glog/logging.h>
#include <glog/vlog_is_on.h>

#include <mutex>

#include "walarc/assert_nd.hpp"

namespace walarc {
namespace debugging {
namespace {

std::mutex  glog_users_mutex;
/** Guarded by glog_users_mutex. Never negative. */
int         glog_users = 0;

void apply_glog_flags(const DebuggingOptions& options) {
  FLAGS_logtostderr = options.debug_log_to_stderr_;
  FLAGS_stderrthreshold = static_cast<int>(options.debug_log_stderr_threshold_);
  FLAGS_minloglevel = static_cast<int>(options.debug_log_min_threshold_);
  // glog reads log_dir when it opens the first log file, so before InitGoogleLogging.
  FLAGS_log_dir = options.debug_log_dir_;
  FLAGS_v = options.verbose_log_level_;
  if (!options.verbose_modules_.empty()) {
    google::SetVLOGLevel(options.verbose_modules_.c_str(), options.verbose_log_level_);
  }
}

}  // namespace

int DebuggingSupports::get_active_count() {
  std::lock_guard<std::mutex> guard(glog_users_mutex);
  return glog_users;
}

ErrorStack DebuggingSupports::initialize_once() {
  std::lock_guard<std::mutex> guard(glog_users_mutex);
  ASSERT_ND(glog_users >= 0);
  if (glog_users++ == 0) {
    apply_glog_flags(options_);
    // glog keeps this pointer, so it has to be a literal.
    google::InitGoogleLogging("walarc");
    LOG(INFO) << "Initialized glog. stderr=" << options_.debug_log_to_stderr_
      << ", v=" << options_.verbose_log_level_;
  } else {
    VLOG(0) << "glog is already set up by another archiver. users=" << glog_users;
  }
  return kRetOk;
}

ErrorStack DebuggingSupports::uninitialize_once() {
  std::lock_guard<std::mutex> guard(glog_users_mutex);
  ASSERT_ND(glog_users > 0);
  if (--glog_users == 0) {
    LOG(INFO) << "Shutting down glog";
    google::ShutdownGoogleLogging();
  }
  return kRetOk;
}

}  // namespace debugging
}  // namespace walarc
