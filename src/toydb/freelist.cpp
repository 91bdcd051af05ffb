#include "toydb/freelist.hpp"
#include "toydb/pager.hpp"

void Freelist::push(PageId id, PagerState &state)
{
  // stale row data is not left behind in free pages
  const Page page = Page::blank(id, m_pager.conf().pageSize, state.firstEmptyPageId);
  m_pager.writePage(page, state);
  state.firstEmptyPageId = id;
}

PageId Freelist::pop(PagerState &state)
{
  if (isNoPage(state.firstEmptyPageId))
  {
    throw PagerFault("cannot pop page: free list is empty");
  }

  const Page head = m_pager.readPage(state.firstEmptyPageId);
  if (head.nextId == head.id)
  {
    throw PagerError(PagerError::Kind::PageIdMismatch, head.id, "Freelist page links to itself");
  }

  // update the head of the linked list
  state.firstEmptyPageId = head.nextId;
  return head.id;
}
