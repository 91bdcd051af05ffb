#pragma once

#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

#include "toydb/errors.hpp"

inline std::string toString(const std::vector<std::byte> &bytes)
{
  return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
}

inline std::vector<std::byte> toBytes(const std::string &s)
{
  std::vector<std::byte> bytes(s.size());
  std::transform(s.begin(), s.end(), bytes.begin(), [](char c) { return static_cast<std::byte>(c); });
  return bytes;
}

// the statement throws a PagerError of the given kind
#define EXPECT_PAGER_ERROR(statement, expectedKind)                      \
  EXPECT_THROW(                                                          \
      {                                                                  \
        try                                                              \
        {                                                                \
          statement;                                                     \
        }                                                                \
        catch (const PagerError &e)                                      \
        {                                                                \
          EXPECT_EQ(toString(expectedKind), toString(e.kind())) << e.what(); \
          throw;                                                         \
        }                                                                \
      },                                                                 \
      PagerError)
