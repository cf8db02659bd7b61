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
#ifndef WALARC_THREAD_STOPPABLE_THREAD_IMPL_HPP_
#define WALARC_THREAD_STOPPABLE_THREAD_IMPL_HPP_
#include <stdint.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <iosfwd>
#include <string>
#include <thread>

#include "walarc/thread/condition_variable_impl.hpp"

namespace walarc {
namespace thread {
/**
 * @brief A thread that runs one round of work per interval until stopped.
 * @ingroup THREAD
 * @details
 * The first round runs as soon as the thread starts. wakeup() starts the next round early.
 * If it arrives during a round, the next round follows right after the current one, so
 * an event is never left waiting for a whole interval.
 * stop() lets the current round finish and joins the thread.
 */
class StoppableThread final {
 public:
  typedef std::function<void()> Round;

  StoppableThread() : interval_(0), started_(false), stop_requested_(false),
    wakeup_requested_(false), rounds_(0) {}
  ~StoppableThread() { stop(); }

  StoppableThread(const StoppableThread &other) = delete;
  StoppableThread& operator=(const StoppableThread &other) = delete;

  void start(const std::string& name, std::chrono::milliseconds interval, Round round);
  /** Idempotent. Does nothing if not started. */
  void stop();
  void wakeup();

  bool      is_running() const { return started_ && !stop_requested_; }
  /** Rounds completed so far. */
  uint64_t  get_rounds() const { return rounds_; }

  friend std::ostream&    operator<<(std::ostream& o, const StoppableThread& v);

 private:
  void handle();
  /** @return whether stop was requested */
  bool sleep();

  std::string                     name_;
  std::chrono::milliseconds       interval_;
  Round                           round_;
  std::thread                     thread_;
  ConditionVariable               condition_;
  std::atomic<bool>               started_;
  std::atomic<bool>               stop_requested_;
  /** Set by wakeup(), cleared when a round begins. */
  std::atomic<bool>               wakeup_requested_;
  std::atomic<uint64_t>           rounds_;
};

}  // namespace thread
}  // namespace walarc
#endif  // WALARC_THREAD_STOPPABLE_THREAD_IMPL_HPP_
