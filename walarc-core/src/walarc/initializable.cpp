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
#include "walarc/initializable.hpp"

#include <glog/logging.h>

#include <iostream>
#include <typeinfo>

#include "walarc/assorted/assorted_func.hpp"

namespace walarc {
ErrorStack DefaultInitializable::initialize() {
  if (initialized_) {
    return ERROR_STACK(kErrorCodeAlreadyInitialized);
  }
  ErrorStack error = initialize_once();
  if (!error.is_error()) {
    initialized_ = true;
    return kRetOk;
  }
  ErrorStack cleanup = uninitialize_once();
  if (cleanup.is_error()) {
    LOG(ERROR) << "Cleanup after a failed initialization also failed: " << cleanup;
  }
  return ErrorStack(error, __FILE__, __FUNCTION__, __LINE__);
}

ErrorStack DefaultInitializable::uninitialize() {
  if (!initialized_) {
    return kRetOk;
  }
  initialized_ = false;
  return uninitialize_once();
}

UninitializeGuard::~UninitializeGuard() {
  if (target_ == nullptr || !target_->is_initialized()) {
    return;
  }
  // The target may be the one that owns glog, so this stays on stderr.
  std::string type_name = assorted::demangle_type_name(typeid(*target_).name());
  std::cerr << "UninitializeGuard: " << type_name << " was left initialized" << std::endl;
  ErrorStack error = target_->uninitialize();
  if (error.is_error()) {
    std::cerr << "UninitializeGuard: " << type_name << "::uninitialize() failed. " << error
      << std::endl;
  }
}
}  // namespace walarc
