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
#include "walarc/thread/stoppable_thread_impl.hpp"

#include <glog/logging.h>

#include <chrono>
#include <ostream>
#include <string>
#include <thread>

#include "walarc/assert_nd.hpp"

namespace walarc {
namespace thread {
void StoppableThread::start(
  const std::string& name,
  std::chrono::milliseconds interval,
  Round round) {
  ASSERT_ND(!started_);
  name_ = name;
  interval_ = interval;
  round_ = round;
  stop_requested_ = false;
  wakeup_requested_ = false;
  started_ = true;
  thread_ = std::thread(&StoppableThread::handle, this);
  LOG(INFO) << name_ << " started. interval=" << interval_.count() << "ms";
}

void StoppableThread::handle() {
  while (true) {
    wakeup_requested_ = false;
    round_();
    ++rounds_;
    if (sleep()) {
      break;
    }
  }
  VLOG(0) << name_ << " exits after " << rounds_.load() << " rounds";
}

bool StoppableThread::sleep() {
  condition_.wait_for(interval_, [this]{
    return stop_requested_.load() || wakeup_requested_.load();
  });
  return stop_requested_;
}

void StoppableThread::wakeup() {
  condition_.notify_one([this]{ wakeup_requested_ = true; });
}

void StoppableThread::stop() {
  if (!started_) {
    return;
  }
  LOG(INFO) << "Stopping " << name_ << "...";
  condition_.notify_one([this]{ stop_requested_ = true; });
  if (thread_.joinable()) {
    thread_.join();
  }
  started_ = false;
  LOG(INFO) << "Stopped " << name_;
}

std::ostream& operator<<(std::ostream& o, const StoppableThread& v) {
  o << "<StoppableThread>"
    << "<name_>" << v.name_ << "</name_>"
    << "<interval_ms>" << v.interval_.count() << "</interval_ms>"
    << "<running>" << v.is_running() << "</running>"
    << "<rounds_>" << v.rounds_.load() << "</rounds_>"
    << "</StoppableThread>";
  return o;
}

}  // namespace thread
}  // namespace walarc
