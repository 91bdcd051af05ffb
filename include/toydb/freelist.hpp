#pragma once

#include "pages/page_header.hpp"

class Pager;
struct PagerState;

// the freelist pages are kept as a linked list through their nextId, the head is
// PagerState::firstEmptyPageId and is persisted in the metadata block
class Freelist
{
public:
  explicit Freelist(Pager &pager) noexcept : m_pager(pager) {}

  // the page becomes the new head, its payload is cleared
  void push(PageId id, PagerState &state);
  // unlink the head and return it. costs one page read to find the next head
  [[nodiscard]] PageId pop(PagerState &state);

private:
  Pager &m_pager;
};
