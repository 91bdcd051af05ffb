#pragma once

#include "session.hpp"

#include <filesystem>

// an open database: the metadata block at offset 0 followed by the pages.
// the storage is borrowed and must outlive the database
class Database
{
public:
  // reads the metadata block, throws PagerError(DecodeError) if it is missing or malformed
  explicit Database(Storage &storage, const std::filesystem::path &filePath = {});

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  PagerSession &session() noexcept { return m_session; }
  const PagerConf &conf() const noexcept { return m_session.conf(); }

  // roots of the table and index catalogs, NO_PAGE_ID until a catalog exists
  PageId tablesMetaPageId() const noexcept { return m_header.tablesMetaPageId; }
  PageId indexesMetaPageId() const noexcept { return m_header.indexesMetaPageId; }
  void setTablesMetaPageId(PageId id) noexcept { m_header.tablesMetaPageId = id; }
  void setIndexesMetaPageId(PageId id) noexcept { m_header.indexesMetaPageId = id; }

  // the metadata block as it would be written by flush()
  DatabaseHeader header() const noexcept;
  // write the metadata block with the current allocator state
  void flush();

private:
  Storage &m_storage;
  DatabaseHeader m_header;
  PagerSession m_session;
};
