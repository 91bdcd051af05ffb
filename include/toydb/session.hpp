#pragma once

#include "pager.hpp"

#include <type_traits>
#include <utility>

// owns the one authoritative PagerState of an open database and threads it through
// every pager operation. the storage is borrowed and must outlive the session
class PagerSession
{
public:
  // starts with conf.pagesNumber pages and an empty freelist
  PagerSession(const PagerConf &conf, Storage &storage);
  PagerSession(const PagerConf &conf, Storage &storage, PagerState state);

  PagerSession(const PagerSession &) = delete;
  PagerSession &operator=(const PagerSession &) = delete;
  PagerSession(PagerSession &&) noexcept = default;
  PagerSession &operator=(PagerSession &&) noexcept = delete;

  const PagerState &state() const noexcept { return m_state; }
  const PagerConf &conf() const noexcept { return m_pager.conf(); }

  Page readPage(PageId id) const { return m_pager.readPage(id); }
  void writePage(const Page &page) { m_pager.writePage(page, m_state); }
  PageId allocatePage();
  void freePage(PageId id);
  void chainPage(PageId from, PageId to) { m_pager.chainPage(from, to, m_state); }

  // run action(*this) as one unit. yields the action's result along with the final state.
  // if the action throws the state is put back to what it was before the run
  template <typename Action>
  auto run(Action &&action)
  {
    using Result = std::invoke_result_t<Action, PagerSession &>;
    const PagerState saved = m_state;
    try
    {
      if constexpr (std::is_void_v<Result>)
      {
        std::forward<Action>(action)(*this);
        return m_state;
      }
      else
      {
        Result result = std::forward<Action>(action)(*this);
        return std::pair<Result, PagerState>(std::move(result), m_state);
      }
    }
    catch (...)
    {
      m_state = saved;
      throw;
    }
  }

private:
  Pager m_pager;
  PagerState m_state;
};

// run a single action on a fresh session over storage
template <typename Action>
auto runPager(const PagerConf &conf, const PagerState &state, Storage &storage, Action &&action)
{
  PagerSession session(conf, storage, state);
  return session.run(std::forward<Action>(action));
}
