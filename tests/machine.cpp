#include <gtest/gtest.h>
#include <sstream>

#include "machine.hpp"

TEST(NetworkU32, WriteIsBigEndian) {
  std::ostringstream out;
  ASSERT_TRUE(writeNetworku32(out, 0xDEADBEEF));

  std::string bytes = out.str();
  ASSERT_EQ(bytes.size(), 4u);
  EXPECT_EQ(static_cast<u8>(bytes[0]), 0xDE);
  EXPECT_EQ(static_cast<u8>(bytes[1]), 0xAD);
  EXPECT_EQ(static_cast<u8>(bytes[2]), 0xBE);
  EXPECT_EQ(static_cast<u8>(bytes[3]), 0xEF);

  std::istringstream in(bytes, std::ios_base::binary);
  u32 v = 0;
  ASSERT_TRUE(readNetworku32(in, v));
  EXPECT_EQ(v, 0xDEADBEEFu);
}

TEST(NetworkU32, ReadFailsOnShortStream) {
  // Only 3 bytes available -> read should fail and leave the value unchanged
  std::istringstream in(std::string("\x01\x02\x03", 3), std::ios_base::binary);
  u32 v = 0xFFFFFFFF;
  EXPECT_FALSE(readNetworku32(in, v));
  EXPECT_EQ(v, 0xFFFFFFFFu);
}

TEST(NetworkU16, WriteIsBigEndian) {
  std::ostringstream out;
  ASSERT_TRUE(writeNetworku16(out, 0x0200));
  std::string bytes = out.str();
  ASSERT_EQ(bytes.size(), 2u);
  EXPECT_EQ(static_cast<u8>(bytes[0]), 0x02);
  EXPECT_EQ(static_cast<u8>(bytes[1]), 0x00);

  std::istringstream in(bytes, std::ios_base::binary);
  u16 v = 0;
  ASSERT_TRUE(readNetworku16(in, v));
  EXPECT_EQ(v, 0x0200);
  u8 extra = 0;
  EXPECT_FALSE(readNetworku8(in, extra));
}

/* membuf writes land in the viewed memory and stop at its end */
TEST(Membuf, WritesIntoRegion) {
  std::array<std::byte, 6> region{};
  membuf buf(region.data(), region.size());
  std::ostream out(&buf);

  EXPECT_TRUE(writeNetworku32(out, 0x01020304));
  EXPECT_TRUE(writeNetworku16(out, 0x0506));
  EXPECT_EQ(region[0], std::byte{0x01});
  EXPECT_EQ(region[5], std::byte{0x06});

  // the region is full
  EXPECT_FALSE(writeNetworku8(out, 0x07));
}

TEST(Membuf, ReadOnlyView) {
  const std::array<std::byte, 4> region = {std::byte{0}, std::byte{0}, std::byte{1}, std::byte{0}};
  imembuf buf(region.data(), region.size());
  std::istream in(&buf);

  u32 v = 0;
  ASSERT_TRUE(readNetworku32(in, v));
  EXPECT_EQ(v, 256u);
}
