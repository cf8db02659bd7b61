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
#include "walarc/debugging/debugging_options.hpp"

namespace walarc {
namespace debugging {
DebuggingOptions::DebuggingOptions()
  : debug_log_to_stderr_(true),
    debug_log_stderr_threshold_(kDebugLogWarning),
    debug_log_min_threshold_(kDebugLogInfo),
    verbose_log_level_(0),
    debug_log_dir_("/tmp") {
}

ErrorStack DebuggingOptions::load(tinyxml2::XMLElement* element) {
  EXTERNALIZE_LOAD_ELEMENT(element, debug_log_to_stderr_);
  EXTERNALIZE_LOAD_ENUM_ELEMENT(element, debug_log_stderr_threshold_);
  EXTERNALIZE_LOAD_ENUM_ELEMENT(element, debug_log_min_threshold_);
  EXTERNALIZE_LOAD_ELEMENT(element, verbose_log_level_);
  EXTERNALIZE_LOAD_ELEMENT(element, verbose_modules_);
  EXTERNALIZE_LOAD_ELEMENT(element, debug_log_dir_);
  return kRetOk;
}

ErrorStack DebuggingOptions::save(tinyxml2::XMLElement* element) const {
  CHECK_ERROR(insert_comment(element,
    "Logging of the archive commands. Levels: 0=info 1=warning 2=error 3=fatal"));
  EXTERNALIZE_SAVE_ELEMENT(element, debug_log_to_stderr_,
    "false writes log files under debug_log_dir_ instead of stderr");
  EXTERNALIZE_SAVE_ENUM_ELEMENT(element, debug_log_stderr_threshold_,
    "Level from which logs are also copied to stderr");
  EXTERNALIZE_SAVE_ENUM_ELEMENT(element, debug_log_min_threshold_,
    "Level below which logs are dropped");
  EXTERNALIZE_SAVE_ELEMENT(element, verbose_log_level_,
    "1 traces single tar entries and storage requests");
  EXTERNALIZE_SAVE_ELEMENT(element, verbose_modules_,
    "Per-file verbose levels such as storage_*=1,tar_*=1");
  EXTERNALIZE_SAVE_ELEMENT(element, debug_log_dir_, "Folder of the log files");
  return kRetOk;
}

}  // namespace debugging
}  // namespace walarc
