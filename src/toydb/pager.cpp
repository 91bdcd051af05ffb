#include "toydb/pager.hpp"
#include "toydb/codec.hpp"
#include "toydb/freelist.hpp"

#include <sstream>

Pager::Pager(const PagerConf &conf, Storage &storage)
    : m_conf(conf), m_storage(storage)
{
  if (m_conf.pageSize < PAGE_OVERHEAD)
  {
    std::ostringstream ss;
    ss << "Page size " << m_conf.pageSize << " is smaller than the page header";
    throw PagerError(PagerError::Kind::SizeMismatch, NO_PAGE_ID, ss.str());
  }
}

Page Pager::readPage(PageId id) const
{
  if (isNoPage(id))
  {
    throw PagerFault("Attempted to read NO_PAGE_ID");
  }

  std::vector<std::byte> bytes;
  try
  {
    bytes = m_storage.readRange(offsetOf(id), m_conf.pageSize);
  }
  catch (const StorageError &e)
  {
    if (e.kind() != StorageError::Kind::ShortRead)
    {
      throw;
    }
    throw PagerError(PagerError::Kind::PageNotFound, id, e.what());
  }

  Page page = decodePage(bytes);
  if (page.id != id)
  {
    // a stale slot, a corrupt freelist or a truncated file
    std::ostringstream ss;
    ss << "Stored page id " << page.id << " does not match";
    throw PagerError(PagerError::Kind::PageIdMismatch, id, ss.str());
  }
  return page;
}

void Pager::writePage(const Page &page, const PagerState &state)
{
  if (isNoPage(page.id))
  {
    throw PagerFault("Attempted to write NO_PAGE_ID");
  }
  if (page.id >= state.pagesNumber)
  {
    std::ostringstream ss;
    ss << "Write past the " << state.pagesNumber << " allocated pages";
    throw PagerError(PagerError::Kind::OverflowWrite, page.id, ss.str());
  }

  const std::vector<std::byte> bytes = encodePage(page, m_conf.pageSize);
  m_storage.writeRange(offsetOf(page.id), bytes);
}

std::pair<PageId, PagerState> Pager::allocatePage(PagerState state)
{
  if (!isNoPage(state.firstEmptyPageId))
  {
    const PageId id = Freelist(*this).pop(state);
    return {id, state};
  }

  // append to file instead
  if (isNoPage(state.pagesNumber))
  {
    throw PagerError(PagerError::Kind::OverflowWrite, NO_PAGE_ID, "No page ids left to allocate");
  }
  const PageId id = state.pagesNumber;
  state.pagesNumber++;
  writePage(Page::blank(id, m_conf.pageSize), state); // write it to disk now
  return {id, state};
}

PagerState Pager::freePage(PageId id, PagerState state)
{
  if (isNoPage(id))
  {
    throw PagerFault("Attempted to free NO_PAGE_ID");
  }
  if (id >= state.pagesNumber)
  {
    throw PagerError(PagerError::Kind::OverflowWrite, id, "Cannot free a page that was never allocated");
  }
  if (id == state.firstEmptyPageId)
  {
    // freeing the head again would link it to itself
    throw PagerFault("Attempted to free a page that is already the head of the freelist");
  }

  Freelist(*this).push(id, state);
  return state;
}

void Pager::chainPage(PageId from, PageId to, const PagerState &state)
{
  if (isNoPage(from))
  {
    throw PagerFault("Attempted to chain from NO_PAGE_ID");
  }

  Page page = readPage(from);
  page.nextId = to;
  writePage(page, state);
}
