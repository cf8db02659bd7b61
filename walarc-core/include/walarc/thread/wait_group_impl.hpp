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
#ifndef WALARC_THREAD_WAIT_GROUP_IMPL_HPP_
#define WALARC_THREAD_WAIT_GROUP_IMPL_HPP_
#include <stdint.h>

#include <atomic>
#include <chrono>

#include "walarc/assert_nd.hpp"
#include "walarc/thread/condition_variable_impl.hpp"

namespace walarc {
namespace thread {
/**
 * @brief Counts outstanding jobs and lets any number of threads block until the count drops
 * to zero.
 * @ingroup THREAD
 * @details
 * Every add(n) must be matched by n calls to done(). add() must happen-before the job
 * it counts starts, so register the job before handing it to another thread.
 * The group can be reused once the count is back to zero.
 *
 * This class is totally header-only.
 */
class WaitGroup final {
 public:
  WaitGroup() : count_(0) {}

  WaitGroup(const WaitGroup &other) = delete;
  WaitGroup& operator=(const WaitGroup &other) = delete;

  void add(uint32_t delta = 1) {
    condition_.notify_all([this, delta]{ count_ += delta; });
  }

  void done() {
    condition_.notify_all([this]{
      ASSERT_ND(count_ > 0);
      --count_;
    });
  }

  /** Blocks until every job added so far is done. */
  void wait() {
    if (count_ == 0) {
      return;
    }
    condition_.wait([this]{ return count_ == 0; });
  }

  /** @return whether the count reached zero within the period. */
  template<class REP, class PERIOD>
  bool wait_for(const std::chrono::duration<REP, PERIOD>& timeout) {
    if (count_ == 0) {
      return true;
    }
    return condition_.wait_for(timeout, [this]{ return count_ == 0; });
  }

  uint32_t get_count() const { return count_.load(); }

 private:
  ConditionVariable               condition_;
  std::atomic<uint32_t>           count_;
};

}  // namespace thread
}  // namespace walarc
#endif  // WALARC_THREAD_WAIT_GROUP_IMPL_HPP_
