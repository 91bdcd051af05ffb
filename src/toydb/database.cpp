#include "toydb/database.hpp"
#include "toydb/codec.hpp"

#include <iostream>

namespace
{
DatabaseHeader readHeader(Storage &storage)
{
  std::vector<std::byte> bytes;
  try
  {
    bytes = storage.readRange(0, METADATA_SIZE);
  }
  catch (const StorageError &e)
  {
    if (e.kind() != StorageError::Kind::ShortRead)
    {
      throw;
    }
    std::cerr << "Database file has no metadata block: " << e.what() << std::endl;
    throw PagerError(PagerError::Kind::DecodeError, NO_PAGE_ID, "Missing metadata block");
  }

  try
  {
    return decodeMetadata(bytes);
  }
  catch (const PagerError &e)
  {
    std::cerr << "Rejected metadata block: " << e.what() << std::endl;
    throw;
  }
}

PagerConf makeConf(const DatabaseHeader &header, const std::filesystem::path &filePath)
{
  PagerConf conf;
  conf.filePath = filePath;
  conf.pageSize = header.pageSize;
  conf.baseOffset = METADATA_SIZE;
  conf.pagesNumber = header.pagesNumber;
  return conf;
}
}

Database::Database(Storage &storage, const std::filesystem::path &filePath)
    : m_storage(storage),
      m_header(readHeader(storage)),
      m_session(makeConf(m_header, filePath), storage, PagerState{m_header.pagesNumber, m_header.firstEmptyPageId})
{
}

DatabaseHeader Database::header() const noexcept
{
  DatabaseHeader h = m_header;
  h.pagesNumber = m_session.state().pagesNumber;
  h.firstEmptyPageId = m_session.state().firstEmptyPageId;
  return h;
}

void Database::flush()
{
  const DatabaseHeader h = header();
  m_storage.writeRange(0, encodeMetadata(h));
  m_header = h;
}
