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
#ifndef WALARC_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
#define WALARC_DEBUGGING_DEBUGGING_SUPPORTS_HPP_

#include "walarc/cxx11.hpp"
#include "walarc/initializable.hpp"
#include "walarc/debugging/debugging_options.hpp"

namespace walarc {
namespace debugging {
/**
 * @brief Sets up google-logging for an Archiver.
 * @ingroup DEBUGGING
 * @details
 * glog is process-wide while Archivers are not; tests run several of them in one process.
 * Setups are reference-counted: the first one to initialize applies its DebuggingOptions and
 * calls InitGoogleLogging, the last one to uninitialize shuts glog down. Options of later
 * setups are ignored while an earlier one is alive.
 */
class DebuggingSupports CXX11_FINAL : public DefaultInitializable {
 public:
  DebuggingSupports() CXX11_FUNC_DELETE;
  explicit DebuggingSupports(const DebuggingOptions& options) : options_(options) {}
  ErrorStack  initialize_once() CXX11_OVERRIDE;
  ErrorStack  uninitialize_once() CXX11_OVERRIDE;

  /** How many setups currently keep glog alive. */
  static int  get_active_count();

 private:
  const DebuggingOptions  options_;
};
}  // namespace debugging
}  // namespace walarc
#endif  // WALARC_DEBUGGING_DEBUGGING_SUPPORTS_HPP_
