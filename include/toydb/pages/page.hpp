#pragma once

#include "page_header.hpp"

#include <algorithm>
#include <string_view>
#include <utility>
#include <vector>

// the in memory view of a single page slot
struct Page
{
  PageId id = NO_PAGE_ID;
  PageId nextId = NO_PAGE_ID;
  std::vector<std::byte> payload;

  Page() = default;

  Page(PageId id, PageId nextId, std::vector<std::byte> payload)
      : id(id), nextId(nextId), payload(std::move(payload))
  {
  }

  // a page with a zeroed payload sized for pageSize
  static Page blank(PageId id, u32 pageSize, PageId nextId = NO_PAGE_ID)
  {
    return Page(id, nextId, std::vector<std::byte>(payloadSize(pageSize), std::byte{0}));
  }

  static Page fromString(PageId id, std::string_view data, PageId nextId = NO_PAGE_ID)
  {
    std::vector<std::byte> payload(data.size());
    std::transform(data.begin(), data.end(), payload.begin(), [](char c) { return static_cast<std::byte>(c); });
    return Page(id, nextId, std::move(payload));
  }

  static constexpr u32 payloadSize(u32 pageSize) noexcept
  {
    return pageSize < PAGE_OVERHEAD ? 0 : pageSize - PAGE_OVERHEAD;
  }

  friend bool operator==(const Page &a, const Page &b)
  {
    return a.id == b.id && a.nextId == b.nextId && a.payload == b.payload;
  }
};
