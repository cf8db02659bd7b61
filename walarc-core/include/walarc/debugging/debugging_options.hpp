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
#ifndef WALARC_DEBUGGING_DEBUGGING_OPTIONS_HPP_
#define WALARC_DEBUGGING_DEBUGGING_OPTIONS_HPP_
#include <stdint.h>

#include <string>

#include "walarc/cxx11.hpp"
#include "walarc/externalize/externalizable.hpp"

namespace walarc {
namespace debugging {
/**
 * @brief Where archive logs go and how chatty they are.
 * @ingroup DEBUGGING
 * @details
 * Stored as the \<DebuggingOptions\> child of the archive configuration.
 * An archive command runs under postgres, which captures stderr into the server log,
 * so logs go to stderr unless told otherwise.
 */
struct DebuggingOptions CXX11_FINAL : public virtual externalize::Externalizable {
  /** Severities in glog's numbering. */
  enum DebugLogLevel {
    kDebugLogInfo = 0,
    kDebugLogWarning,
    kDebugLogError,
    kDebugLogFatal,
  };

  DebuggingOptions();

  /** Default true. When false, glog writes files under debug_log_dir_. */
  bool                                debug_log_to_stderr_;
  /** Default warning. Messages at or above it are also copied to stderr. */
  DebugLogLevel                       debug_log_stderr_threshold_;
  /** Default info. Messages below it are dropped. */
  DebugLogLevel                       debug_log_min_threshold_;

  /**
   * @brief VLOG(n) with n at or below this is printed.
   * @details
   * Default 0. Level 1 traces single tar entries and storage requests.
   */
  int16_t                             verbose_log_level_;

  /**
   * @brief Raises the verbose level only for some source files.
   * @details
   * glog's "module=level,module=level" form, where module is a file base name glob
   * such as "storage_*". Empty by default.
   */
  std::string                         verbose_modules_;

  /** Default "/tmp". */
  std::string                         debug_log_dir_;

  EXTERNALIZABLE(DebuggingOptions);
};
}  // namespace debugging
}  // namespace walarc
#endif  // WALARC_DEBUGGING_DEBUGGING_OPTIONS_HPP_
