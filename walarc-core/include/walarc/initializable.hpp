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
#ifndef WALARC_INITIALIZABLE_HPP_
#define WALARC_INITIALIZABLE_HPP_
#include "walarc/cxx11.hpp"
#include "walarc/error_stack.hpp"

namespace walarc {
/**
 * @defgroup INITIALIZABLE Initialize/Uninitialize Resources
 * @ingroup IDIOMS
 * @brief Two-phase setup and teardown for objects whose setup can fail.
 * @details
 * Constructors and destructors can't report errors. Anything that opens files, starts threads
 * or sets up libraries does so in initialize() and releases them in uninitialize(), and the
 * owner checks both ErrorStacks.
 */

/**
 * @brief Interface of two-phase setup.
 * @ingroup INITIALIZABLE
 */
class Initializable {
 public:
  virtual ~Initializable() {}

  /**
   * @pre is_initialized() == false
   * @post is_initialized() == true iff no error was returned. On an error, whatever was
   * acquired so far is already released.
   */
  virtual ErrorStack  initialize() = 0;
  virtual bool        is_initialized() const = 0;

  /**
   * Idempotent. Releases as much as it can even when a step fails, and returns the first
   * failure. Destructors never call it for you.
   */
  virtual ErrorStack  uninitialize() = 0;
};

/**
 * @brief Initializable with the bookkeeping done.
 * @ingroup INITIALIZABLE
 * @details
 * Subclasses write initialize_once() and uninitialize_once(). uninitialize_once() must cope
 * with a half-done initialize_once(), because it is also the cleanup of a failed one.
 */
class DefaultInitializable : public virtual Initializable {
 public:
  DefaultInitializable() : initialized_(false) {}
  virtual ~DefaultInitializable() {}

  DefaultInitializable(const DefaultInitializable&) CXX11_FUNC_DELETE;
  DefaultInitializable& operator=(const DefaultInitializable&) CXX11_FUNC_DELETE;

  ErrorStack  initialize() CXX11_OVERRIDE CXX11_FINAL;
  ErrorStack  uninitialize() CXX11_OVERRIDE CXX11_FINAL;
  bool        is_initialized() const CXX11_OVERRIDE CXX11_FINAL { return initialized_; }

  virtual ErrorStack  initialize_once() = 0;
  virtual ErrorStack  uninitialize_once() = 0;

 private:
  bool    initialized_;
};

/**
 * @brief Uninitializes the target on scope exit unless someone already did.
 * @ingroup INITIALIZABLE
 * @details
 * For early returns between initialize() and uninitialize(). Its own errors can only be
 * printed, so the normal path still calls uninitialize() and checks it.
 */
class UninitializeGuard {
 public:
  explicit UninitializeGuard(Initializable *target) : target_(target) {}
  ~UninitializeGuard();
  void release() { target_ = CXX11_NULLPTR; }

 private:
  UninitializeGuard(const UninitializeGuard&) CXX11_FUNC_DELETE;
  UninitializeGuard& operator=(const UninitializeGuard&) CXX11_FUNC_DELETE;

  Initializable* target_;
};

}  // namespace walarc
#endif  // WALARC_INITIALIZABLE_HPP_
