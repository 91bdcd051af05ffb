#pragma once

#include <iostream>
#include <cstdint>
#include <cstddef>
#include <array>

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

inline bool writeNetworku8(std::ostream &out, u8 v)
{
  char c = static_cast<char>(v);
  if (!out.write(&c, 1))
    return false;
  return true;
}

inline bool readNetworku8(std::istream &in, u8 &v)
{
  char c;
  in.read(&c, 1);
  if (!in)
    return false;

  v = static_cast<u8>(static_cast<unsigned char>(c));
  return true;
}

inline bool writeNetworku16(std::ostream &out, u16 v)
{
  unsigned char buf[] = {
      static_cast<unsigned char>((v >> 8) & 0xFF),
      static_cast<unsigned char>((v >> 0) & 0xFF),
  };

  if (!out.write(reinterpret_cast<const char *>(buf), 2))
    return false;
  return true;
}

inline bool readNetworku16(std::istream &in, u16 &v)
{
  std::array<unsigned char, 2> buf;
  in.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (!in)
    return false;

  v = static_cast<u16>((static_cast<u32>(buf[0]) << 8) |
                       (static_cast<u32>(buf[1])));
  return true;
}

inline bool writeNetworku32(std::ostream &out, u32 v)
{
  unsigned char buf[] = {
      static_cast<unsigned char>((v >> 24) & 0xFF),
      static_cast<unsigned char>((v >> 16) & 0xFF),
      static_cast<unsigned char>((v >> 8) & 0xFF),
      static_cast<unsigned char>((v >> 0) & 0xFF),
  };

  if (!out.write(reinterpret_cast<const char *>(buf), 4))
    return false;
  return true;
}

inline bool readNetworku32(std::istream &in, u32 &v)
{
  std::array<unsigned char, 4> buf;
  in.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (!in)
    return false;

  v = (static_cast<u32>(buf[0]) << 24) |
      (static_cast<u32>(buf[1]) << 16) |
      (static_cast<u32>(buf[2]) << 8) |
      (static_cast<u32>(buf[3]));
  return true;
}

// view a region of memory as a stream. writes past the end fail instead of growing
class membuf : public std::streambuf
{
public:
  membuf(std::byte *data, std::size_t N)
  {
    char *p = reinterpret_cast<char *>(data);
    setg(p, p, p + N);
    setp(p, p + N);
  }
};

// read only counterpart of membuf
class imembuf : public std::streambuf
{
public:
  imembuf(const std::byte *data, std::size_t N)
  {
    // the get area is never written through
    char *p = const_cast<char *>(reinterpret_cast<const char *>(data));
    setg(p, p, p + N);
  }
};
