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
#ifndef WALARC_THREAD_CONDITION_VARIABLE_IMPL_HPP_
#define WALARC_THREAD_CONDITION_VARIABLE_IMPL_HPP_

#include <stdint.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "walarc/assert_nd.hpp"

namespace walarc {
namespace thread {
/**
 * @brief std::condition_variable with its mutex, driven only by predicates and signal actions.
 * @ingroup THREAD
 * @details
 * A notifier changes the shared state inside the lock through its action, and a waiter
 * checks the same state through its predicate. A signal sent before the wait is not lost.
 *
 * The destructor waits for notifiers still inside notify_xxx(), because the woken waiter
 * often destroys the object right away. A pipe reader woken by the writer's close is one case.
 */
class ConditionVariable final {
 public:
  ConditionVariable() : notifiers_(0) {}
  ~ConditionVariable() {
    while (notifiers_.load() > 0) {
      std::this_thread::yield();
    }
  }

  ConditionVariable(const ConditionVariable &other) = delete;
  ConditionVariable& operator=(const ConditionVariable &other) = delete;

  template<typename PREDICATE>
  void wait(PREDICATE predicate) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, predicate);
  }

  /** @return the predicate's value when this returns */
  template<class REP, class PERIOD, typename PREDICATE>
  bool wait_for(const std::chrono::duration<REP, PERIOD>& timeout, PREDICATE predicate) {
    std::unique_lock<std::mutex> lock(mutex_);
    return condition_.wait_for(lock, timeout, predicate);
  }

  template<typename SIGNAL_ACTION>
  void notify_all(SIGNAL_ACTION signal_action) {
    ++notifiers_;
    {
      std::lock_guard<std::mutex> guard(mutex_);
      signal_action();
    }
    condition_.notify_all();
    --notifiers_;
  }

  template<typename SIGNAL_ACTION>
  void notify_one(SIGNAL_ACTION signal_action) {
    ++notifiers_;
    {
      std::lock_guard<std::mutex> guard(mutex_);
      signal_action();
    }
    condition_.notify_one();
    --notifiers_;
  }

 private:
  std::condition_variable         condition_;
  std::mutex                      mutex_;
  /** Threads inside notify_xxx(). */
  std::atomic<uint32_t>           notifiers_;
};

}  // namespace thread
}  // namespace walarc
#endif  // WALARC_THREAD_CONDITION_VARIABLE_IMPL_HPP_
