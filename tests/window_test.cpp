#include <gtest/gtest.h>
#include <vector>
#include <stdexcept>
#include "window.hpp"

TEST(SlidingWindow, AdmitsUntilFull)
{
  SlidingWindow window(3);
  EXPECT_TRUE(window.empty());
  EXPECT_TRUE(window.admit(1, "one"));
  EXPECT_TRUE(window.admit(2, "two"));
  EXPECT_FALSE(window.isFull());
  EXPECT_TRUE(window.admit(3, "three"));
  EXPECT_TRUE(window.isFull());
  EXPECT_FALSE(window.admit(4, "four"));
  EXPECT_EQ(3, window.size());
  EXPECT_EQ("[1, 2, 3]", window.toString());
}

TEST(SlidingWindow, RejectsGapsInTheRun)
{
  SlidingWindow window(4);
  EXPECT_TRUE(window.admit(5, "five"));
  EXPECT_FALSE(window.admit(7, "seven"));
  EXPECT_FALSE(window.admit(5, "again"));
  EXPECT_EQ(1, window.size());
}

TEST(SlidingWindow, PopHeadSlidesByOneAndForgetsThePacket)
{
  SlidingWindow window(2);
  window.admit(1, "one");
  window.admit(2, "two");
  EXPECT_EQ(1, window.head());

  EXPECT_TRUE(window.popHead());
  EXPECT_EQ(2, window.head());
  EXPECT_EQ("two", window.packet(2));
  EXPECT_THROW(window.packet(1), std::out_of_range);

  EXPECT_TRUE(window.admit(3, "three"));
  std::vector<uint16_t> expected = {2, 3};
  EXPECT_EQ(expected, window.sequences());

  EXPECT_TRUE(window.popHead());
  EXPECT_TRUE(window.popHead());
  EXPECT_FALSE(window.popHead());
  EXPECT_EQ("[]", window.toString());
}

TEST(SlidingWindow, CapacityIsAtLeastOne)
{
  SlidingWindow window(0);
  EXPECT_EQ(1, window.capacity());
  EXPECT_TRUE(window.admit(1, "one"));
  EXPECT_TRUE(window.isFull());
}

TEST(SlidingWindow, KeepsStoredBytesVerbatim)
{
  SlidingWindow window(2);
  std::string bytes("\0\x01\xff", 3);
  window.admit(9, bytes);
  EXPECT_EQ(bytes, window.packet(9));
}
