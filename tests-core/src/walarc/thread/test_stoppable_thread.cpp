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
#include <stdint.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "walarc/test_common.hpp"
#include "walarc/thread/stoppable_thread_impl.hpp"
#include "walarc/thread/wait_group_impl.hpp"

/**
 * @file test_stoppable_thread.cpp
 * Testcases for walarc::thread::StoppableThread and WaitGroup.
 */

namespace walarc {
namespace thread {
DEFINE_TEST_CASE_PACKAGE(StoppableThreadTest, walarc.thread);

/** Polls until the thread has completed more than the given rounds. */
bool wait_rounds_beyond(const StoppableThread& th, uint64_t rounds) {
  for (int i = 0; i < 1000 && th.get_rounds() <= rounds; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return th.get_rounds() > rounds;
}

TEST(StoppableThreadTest, Minimal) {
  for (int sleep_ms = 0; sleep_ms < 50; sleep_ms += 10) {
    StoppableThread th;
    EXPECT_FALSE(th.is_running());
    th.start("test", std::chrono::milliseconds(5), []{});
    EXPECT_TRUE(th.is_running());
    if (sleep_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
    }
    th.stop();
    EXPECT_FALSE(th.is_running());
    th.stop();
  }
}

TEST(StoppableThreadTest, FirstRoundRunsImmediately) {
  StoppableThread th;
  std::atomic<uint32_t> calls(0);
  th.start("test", std::chrono::seconds(60), [&]{ ++calls; });
  EXPECT_TRUE(wait_rounds_beyond(th, 0));
  th.stop();
  EXPECT_EQ(1U, calls.load());
  EXPECT_EQ(1U, th.get_rounds());
}

TEST(StoppableThreadTest, Wakeup) {
  StoppableThread th;
  // an interval long enough that only wakeup() can explain the rounds
  th.start("test", std::chrono::seconds(60), []{});
  ASSERT_TRUE(wait_rounds_beyond(th, 0));
  for (int i = 0; i < 3; ++i) {
    uint64_t before = th.get_rounds();
    th.wakeup();
    EXPECT_TRUE(wait_rounds_beyond(th, before));
  }
  th.stop();
}

TEST(StoppableThreadTest, WakeupDuringRound) {
  StoppableThread th;
  std::atomic<bool> in_round(false);
  std::atomic<bool> release(false);
  th.start("test", std::chrono::seconds(60), [&]{
    if (th.get_rounds() == 0) {
      in_round = true;
      while (!release) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    }
  });
  while (!in_round) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  th.wakeup();
  release = true;
  // the wakeup sent during the first round is not lost
  EXPECT_TRUE(wait_rounds_beyond(th, 1));
  th.stop();
}

TEST(StoppableThreadTest, Many) {
  std::vector<StoppableThread*> threads;
  const int kThreads = 10;
  for (int i = 0; i < kThreads; ++i) {
    StoppableThread* th = new StoppableThread();
    threads.push_back(th);
    th->start("test", std::chrono::milliseconds(5), []{});
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  for (int i = 0; i < kThreads; ++i) {
    StoppableThread* th = threads[i];
    EXPECT_TRUE(th->is_running());
    EXPECT_GT(th->get_rounds(), 0U);
    th->stop();
    EXPECT_FALSE(th->is_running());
    delete th;
  }
}

TEST(StoppableThreadTest, WaitGroup) {
  WaitGroup group;
  group.wait();  // nothing added
  EXPECT_TRUE(group.wait_for(std::chrono::milliseconds(1)));

  const uint32_t kJobs = 8;
  std::atomic<uint32_t> finished(0);
  group.add(kJobs);
  EXPECT_EQ(kJobs, group.get_count());
  EXPECT_FALSE(group.wait_for(std::chrono::milliseconds(5)));
  std::vector<std::thread> jobs;
  for (uint32_t i = 0; i < kJobs; ++i) {
    jobs.emplace_back([&, i]{
      std::this_thread::sleep_for(std::chrono::milliseconds(i * 3));
      ++finished;
      group.done();
    });
  }
  group.wait();
  EXPECT_EQ(kJobs, finished.load());
  EXPECT_EQ(0U, group.get_count());
  for (std::thread& job : jobs) {
    job.join();
  }
}

}  // namespace thread
}  // namespace walarc

TEST_MAIN_CAPTURE_SIGNALS(StoppableThreadTest, walarc.thread);
