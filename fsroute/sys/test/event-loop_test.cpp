#include "fsroute/event-loop.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <system_error>
#include <utility>
#include <vector>

#include "fsroute/base-fd.hpp"
#include "fsroute/event-fd.hpp"

namespace fsroute {

using namespace std::chrono_literals;

TEST(EventLoopTest, PollTimesOutWithoutEvents) {
  EventLoop loop(std::chrono::milliseconds{5});
  const auto events = loop.poll();
  EXPECT_TRUE(events.empty());
  EXPECT_NE(events.data(), nullptr);
}

TEST(EventLoopTest, EventFdWakesUpPoll) {
  EventLoop loop(std::chrono::milliseconds{500});
  EventFd wakeup;
  loop.addOrThrow(wakeup.fd(), EventIn);

  wakeup.send();
  const auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, wakeup.fd());
  EXPECT_NE(events[0].eventBmp & EventIn, 0U);

  wakeup.read();
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoopTest, BufferGrowsWhenSaturated) {
  EventLoop loop(std::chrono::milliseconds{50}, 2);
  EXPECT_EQ(loop.capacity(), 2U);

  std::vector<BaseFd> fds;
  for (int pipeIdx = 0; pipeIdx < 4; ++pipeIdx) {
    int pipeFds[2];
    ASSERT_EQ(0, ::pipe(pipeFds));
    fds.emplace_back(pipeFds[0]);
    fds.emplace_back(pipeFds[1]);
    loop.addOrThrow(pipeFds[0], EventIn);
    ASSERT_EQ(1, ::write(pipeFds[1], "x", 1));
  }

  const auto first = loop.poll();
  EXPECT_EQ(first.size(), 2U);
  EXPECT_EQ(loop.capacity(), 4U);

  const auto second = loop.poll();
  EXPECT_EQ(second.size(), 4U);
  EXPECT_EQ(loop.capacity(), 8U);
}

TEST(EventLoopTest, ZeroCapacityIsPromoted) {
  EventLoop loop(std::chrono::milliseconds{1}, 0);
  EXPECT_EQ(loop.capacity(), 1U);
}

TEST(EventLoopTest, AddInvalidFdThrows) {
  EventLoop loop(std::chrono::milliseconds{1});
  EXPECT_THROW(loop.addOrThrow(-1, EventIn), std::system_error);
}

TEST(EventLoopTest, MoveConstructorAndAssignment) {
  EventLoop loop(std::chrono::milliseconds{1}, 4);
  EventLoop moved(std::move(loop));
  EXPECT_EQ(moved.capacity(), 4U);

  EventLoop other;
  other = std::move(moved);
  EXPECT_EQ(other.capacity(), 4U);
  EXPECT_TRUE(other.poll().empty());
}

TEST(EventLoopTest, DelStopsReporting) {
  EventLoop loop(std::chrono::milliseconds{5});
  EventFd wakeup;
  loop.addOrThrow(wakeup.fd(), EventIn);
  loop.del(wakeup.fd());
  wakeup.send();
  EXPECT_TRUE(loop.poll().empty());
  // Deleting twice only logs.
  loop.del(wakeup.fd());
}

}  // namespace fsroute
