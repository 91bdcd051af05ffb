#pragma once

#include "pages/page_header.hpp"

#include <stdexcept>
#include <string>

// a caller broke one of the pager's preconditions, e.g. passed NO_PAGE_ID.
// this is a bug in the caller, not a problem with the stored data
class PagerFault : public std::logic_error
{
public:
  explicit PagerFault(const std::string &message) : std::logic_error(message) {}
};

// the stored pages are not in the state the caller expected
class PagerError : public std::runtime_error
{
public:
  enum class Kind
  {
    PageNotFound,
    PageIdMismatch,
    OverflowWrite,
    SizeMismatch,
    DecodeError,
  };

  PagerError(Kind kind, PageId id, const std::string &message);

  inline Kind kind() const noexcept { return m_kind; }
  inline PageId id() const noexcept { return m_id; }

private:
  Kind m_kind;
  PageId m_id;
};

const char *toString(PagerError::Kind kind) noexcept;

// failures of the underlying byte store
class StorageError : public std::runtime_error
{
public:
  enum class Kind
  {
    ShortRead,
    SeekFailed,
    WriteFailed,
    OpenFailed,
  };

  StorageError(Kind kind, const std::string &message)
      : std::runtime_error(message), m_kind(kind)
  {
  }

  inline Kind kind() const noexcept { return m_kind; }

private:
  Kind m_kind;
};
