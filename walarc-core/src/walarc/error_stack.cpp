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
#include "walarc/error_stack.hpp"

#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "walarc/assert_nd.hpp"
#include "walarc/assorted/assorted_func.hpp"

namespace walarc {

ErrorStack::ErrorStack(const char* file, const char* func, uint32_t line, ErrorCode code,
        const char* message)
  : os_errno_(errno), error_code_(code), frame_count_(0), checked_(false) {
  ASSERT_ND(code != kErrorCodeOk);
  push_frame(file, func, line);
  if (message) {
    message_ = message;
  }
}

ErrorStack::ErrorStack(const ErrorStack& other, const char* file, const char* func, uint32_t line)
  : os_errno_(0), error_code_(kErrorCodeOk), frame_count_(0), checked_(true) {
  operator=(other);
  if (error_code_ != kErrorCodeOk) {
    push_frame(file, func, line);
  }
}

ErrorStack::ErrorStack(const ErrorStack& other)
  : os_errno_(0), error_code_(kErrorCodeOk), frame_count_(0), checked_(true) {
  operator=(other);
}

ErrorStack& ErrorStack::operator=(const ErrorStack& other) {
  if (this == &other) {
    return *this;
  }
  error_code_ = other.error_code_;
  if (LIKELY(error_code_ == kErrorCodeOk)) {
    message_.clear();
    os_errno_ = 0;
    frame_count_ = 0;
    checked_ = true;
    return *this;
  }
  message_ = other.message_;
  os_errno_ = other.os_errno_;
  frame_count_ = other.frame_count_;
  for (uint16_t i = 0; i < frame_count_; ++i) {
    frames_[i] = other.frames_[i];
  }
  checked_ = false;
  other.checked_ = true;
  return *this;
}

ErrorStack::~ErrorStack() {
#ifdef DEBUG
  if (UNLIKELY(error_code_ != kErrorCodeOk && !checked_)) {
    dump_and_abort("An ErrorStack was destructed without being checked");
  }
#endif  // DEBUG
}

void ErrorStack::push_frame(const char* file, const char* func, uint32_t line) {
  if (frame_count_ < kMaxFrames) {
    frames_[frame_count_].file_ = file;
    frames_[frame_count_].func_ = func;
    frames_[frame_count_].line_ = line;
    ++frame_count_;
  }
}

void ErrorStack::dump_and_abort(const char* abort_message) const {
  std::stringstream str;
  str << "walarc::ErrorStack::dump_and_abort: " << abort_message << std::endl
    << *this << std::endl << print_backtrace();
  LOG(FATAL) << str.str();
  std::cerr.flush();
  std::abort();
}

std::ostream& operator<<(std::ostream& o, const ErrorStack& obj) {
  if (obj.error_code_ == kErrorCodeOk) {
    o << "No error";
    return o;
  }
  obj.checked_ = true;
  o << get_error_name(obj.error_code_) << "(" << obj.error_code_ << "):" << obj.get_message();
  if (!obj.message_.empty()) {
    o << " [" << obj.message_ << "]";
  }
  if (obj.os_errno_ != 0) {
    o << " (errno=" << assorted::os_error(obj.os_errno_) << ")";
  }
  for (uint16_t i = 0; i < obj.frame_count_; ++i) {
    const ErrorStack::Frame& frame = obj.frames_[i];
    o << std::endl << "  at " << frame.func_ << "() " << frame.file_ << ":" << frame.line_;
  }
  if (obj.frame_count_ >= ErrorStack::kMaxFrames) {
    o << std::endl << "  ...";
  }
  return o;
}

}  // namespace walarc
