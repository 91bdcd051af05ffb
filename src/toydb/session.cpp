#include "toydb/session.hpp"

PagerSession::PagerSession(const PagerConf &conf, Storage &storage)
    : PagerSession(conf, storage, PagerState{conf.pagesNumber, NO_PAGE_ID})
{
}

PagerSession::PagerSession(const PagerConf &conf, Storage &storage, PagerState state)
    : m_pager(conf, storage), m_state(state)
{
}

PageId PagerSession::allocatePage()
{
  auto [id, next] = m_pager.allocatePage(m_state);
  m_state = next;
  return id;
}

void PagerSession::freePage(PageId id)
{
  m_state = m_pager.freePage(id, m_state);
}
