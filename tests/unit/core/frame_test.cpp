#include <lolcommits/core/frame.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace lc = lolcommits::core;

TEST(Frame, DefaultEmpty) {
  lc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_EQ(f.size_bytes(), 0u);
  EXPECT_FALSE(f.valid());
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(100 * 100 * 3);
  lc::Frame f(100, 100, lc::PixelFormat::RGB8, std::move(buf));
  EXPECT_EQ(f.width(), 100u);
  EXPECT_EQ(f.height(), 100u);
  EXPECT_EQ(f.format(), lc::PixelFormat::RGB8);
  EXPECT_EQ(f.channels(), 3u);
  EXPECT_FALSE(f.empty());
  EXPECT_TRUE(f.valid());
  EXPECT_EQ(f.size_bytes(), 100u * 100 * 3);
  EXPECT_EQ(f.data().size(), 100u * 100 * 3);
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(lc::Frame::min_bytes(10, 10, lc::PixelFormat::Grayscale8), 100u);
  EXPECT_EQ(lc::Frame::min_bytes(10, 10, lc::PixelFormat::RGB8), 300u);
  EXPECT_EQ(lc::Frame::min_bytes(10, 10, lc::PixelFormat::BGRA8), 400u);
  EXPECT_EQ(lc::Frame::min_bytes(10, 10, lc::PixelFormat::Unknown), 0u);
}

TEST(Frame, ShortBufferIsInvalid) {
  std::vector<std::byte> buf(10 * 10 * 3 - 1);
  lc::Frame f(10, 10, lc::PixelFormat::RGB8, std::move(buf));
  EXPECT_FALSE(f.valid());
}

TEST(Frame, UnknownFormatIsInvalid) {
  std::vector<std::byte> buf(64);
  lc::Frame f(4, 4, lc::PixelFormat::Unknown, std::move(buf));
  EXPECT_FALSE(f.valid());
}

TEST(Frame, PixelAddressing) {
  std::vector<std::byte> buf(3 * 2 * 3);
  buf[(1 * 3 + 2) * 3 + 1] = std::byte{42};  // (x=2, y=1), green
  lc::Frame f(3, 2, lc::PixelFormat::RGB8, std::move(buf));
  EXPECT_EQ(f.pixel(2, 1)[1], 42);
  EXPECT_EQ(f.pixel(0, 0)[0], 0);
}
