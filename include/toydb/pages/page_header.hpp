#pragma once

#include "machine.hpp"

using PageId = u32;
// marks the absence of a page, e.g. the end of a chain or an empty freelist
constexpr PageId NO_PAGE_ID = 0xFFFFFFFF;

// every page starts with its own id followed by the id of the next page in its chain
constexpr u32 PAGE_OVERHEAD = sizeof(PageId) + sizeof(PageId);

// the metadata block sits at offset 0, before page 0
constexpr u32 METADATA_SIZE = 128;
constexpr u8 FILE_SPEC_VERSION = 1;

inline bool isNoPage(PageId id) noexcept
{
  return id == NO_PAGE_ID;
}

// the header for the database file, stored in the metadata block
struct DatabaseHeader
{
  u8 version = FILE_SPEC_VERSION;
  u16 pageSize = 0;
  u32 pagesNumber = 0;
  PageId firstEmptyPageId = NO_PAGE_ID; // head of the freelist
  PageId tablesMetaPageId = NO_PAGE_ID;
  PageId indexesMetaPageId = NO_PAGE_ID;

  friend bool operator==(const DatabaseHeader &, const DatabaseHeader &) = default;
};
