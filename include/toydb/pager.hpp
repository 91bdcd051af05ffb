#pragma once

#include "errors.hpp"
#include "pages/page.hpp"
#include "storage.hpp"

#include <filesystem>
#include <utility>

// fixed for the lifetime of an open database, never changed by the pager
struct PagerConf
{
  std::filesystem::path filePath;
  u32 pageSize = 0;
  // bytes before page 0, normally the metadata block
  u64 baseOffset = METADATA_SIZE;
  // initial number of allocated pages
  u32 pagesNumber = 0;
};

// threaded through every pager operation, see PagerSession
struct PagerState
{
  u32 pagesNumber = 0; // only grows
  PageId firstEmptyPageId = NO_PAGE_ID;

  friend bool operator==(const PagerState &, const PagerState &) = default;
};

// translates page ids to byte ranges of the storage and checks every page it reads.
// holds no mutable state of its own: operations that change the allocator take the
// current state and return the next one
class Pager
{
public:
  Pager(const PagerConf &conf, Storage &storage);

  const PagerConf &conf() const noexcept { return m_conf; }
  u64 offsetOf(PageId id) const noexcept { return m_conf.baseOffset + static_cast<u64>(id) * m_conf.pageSize; }

  Page readPage(PageId id) const;
  // only slots below state.pagesNumber can be written, allocatePage grows the file
  void writePage(const Page &page, const PagerState &state);

  // reuses the head of the freelist if there is one, otherwise appends a blank page
  [[nodiscard]] std::pair<PageId, PagerState> allocatePage(PagerState state);
  // zeroes the page and pushes it onto the freelist
  [[nodiscard]] PagerState freePage(PageId id, PagerState state);

  // point `from` at `to` without touching its payload. `to` may be NO_PAGE_ID to end a chain
  void chainPage(PageId from, PageId to, const PagerState &state);

private:
  PagerConf m_conf;
  Storage &m_storage;
};
