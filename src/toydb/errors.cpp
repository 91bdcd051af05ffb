#include "toydb/errors.hpp"

#include <sstream>

namespace
{
std::string formatMessage(PageId id, const std::string &message)
{
  if (isNoPage(id))
  {
    return message;
  }
  std::ostringstream ss;
  ss << "Page " << id << ": " << message;
  return ss.str();
}
}

PagerError::PagerError(Kind kind, PageId id, const std::string &message)
    : std::runtime_error(formatMessage(id, message)), m_kind(kind), m_id(id)
{
}

const char *toString(PagerError::Kind kind) noexcept
{
  switch (kind)
  {
  case PagerError::Kind::PageNotFound:
    return "PageNotFound";
  case PagerError::Kind::PageIdMismatch:
    return "PageIdMismatch";
  case PagerError::Kind::OverflowWrite:
    return "OverflowWrite";
  case PagerError::Kind::SizeMismatch:
    return "SizeMismatch";
  case PagerError::Kind::DecodeError:
    return "DecodeError";
  }
  return "Unknown";
}
