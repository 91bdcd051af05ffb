#include "toydb/codec.hpp"
#include "toydb/errors.hpp"

#include <sstream>

std::vector<std::byte> encodePage(const Page &page, u32 pageSize)
{
  if (pageSize < PAGE_OVERHEAD)
  {
    std::ostringstream ss;
    ss << "page size " << pageSize << " cannot hold the " << PAGE_OVERHEAD << " byte header";
    throw PagerError(PagerError::Kind::SizeMismatch, page.id, ss.str());
  }
  if (page.payload.size() != Page::payloadSize(pageSize))
  {
    std::ostringstream ss;
    ss << "payload is " << page.payload.size() << " bytes, expected " << Page::payloadSize(pageSize);
    throw PagerError(PagerError::Kind::SizeMismatch, page.id, ss.str());
  }

  std::vector<std::byte> bytes(pageSize, std::byte{0});
  membuf buf(bytes.data(), bytes.size());
  std::ostream out(&buf);

  if (!writeNetworku32(out, page.id) || !writeNetworku32(out, page.nextId))
  {
    throw PagerError(PagerError::Kind::SizeMismatch, page.id, "Failed to encode page header");
  }
  if (!out.write(reinterpret_cast<const char *>(page.payload.data()),
                 static_cast<std::streamsize>(page.payload.size())))
  {
    throw PagerError(PagerError::Kind::SizeMismatch, page.id, "Failed to encode page payload");
  }

  return bytes;
}

Page decodePage(std::span<const std::byte> bytes)
{
  if (bytes.size() < PAGE_OVERHEAD)
  {
    std::ostringstream ss;
    ss << "Cannot decode page from " << bytes.size() << " bytes";
    throw PagerError(PagerError::Kind::DecodeError, NO_PAGE_ID, ss.str());
  }

  imembuf buf(bytes.data(), bytes.size());
  std::istream in(&buf);

  Page page;
  if (!readNetworku32(in, page.id) || !readNetworku32(in, page.nextId))
  {
    throw PagerError(PagerError::Kind::DecodeError, NO_PAGE_ID, "Failed to decode page header");
  }

  // the payload is whatever follows the header
  page.payload.assign(bytes.begin() + PAGE_OVERHEAD, bytes.end());
  return page;
}

std::vector<std::byte> encodeMetadata(const DatabaseHeader &header)
{
  // reserved bytes stay zeroed
  std::vector<std::byte> bytes(METADATA_SIZE, std::byte{0});
  membuf buf(bytes.data(), bytes.size());
  std::ostream out(&buf);

  const bool ok = writeNetworku8(out, header.version) &&
                  writeNetworku16(out, header.pageSize) &&
                  writeNetworku32(out, header.pagesNumber) &&
                  writeNetworku32(out, header.firstEmptyPageId) &&
                  writeNetworku32(out, header.tablesMetaPageId) &&
                  writeNetworku32(out, header.indexesMetaPageId);
  if (!ok)
  {
    throw PagerError(PagerError::Kind::SizeMismatch, NO_PAGE_ID, "Failed to encode metadata block");
  }

  return bytes;
}

DatabaseHeader decodeMetadata(std::span<const std::byte> bytes)
{
  if (bytes.size() < METADATA_SIZE)
  {
    std::ostringstream ss;
    ss << "Metadata block is " << bytes.size() << " bytes, expected " << METADATA_SIZE;
    throw PagerError(PagerError::Kind::DecodeError, NO_PAGE_ID, ss.str());
  }

  imembuf buf(bytes.data(), METADATA_SIZE);
  std::istream in(&buf);

  DatabaseHeader header;
  const bool ok = readNetworku8(in, header.version) &&
                  readNetworku16(in, header.pageSize) &&
                  readNetworku32(in, header.pagesNumber) &&
                  readNetworku32(in, header.firstEmptyPageId) &&
                  readNetworku32(in, header.tablesMetaPageId) &&
                  readNetworku32(in, header.indexesMetaPageId);
  if (!ok)
  {
    throw PagerError(PagerError::Kind::DecodeError, NO_PAGE_ID, "Failed to decode metadata block");
  }

  if (header.version != FILE_SPEC_VERSION)
  {
    std::ostringstream ss;
    ss << "Unsupported file spec version " << static_cast<u32>(header.version);
    throw PagerError(PagerError::Kind::DecodeError, NO_PAGE_ID, ss.str());
  }

  if (header.pageSize < PAGE_OVERHEAD)
  {
    std::ostringstream ss;
    ss << "Page size " << header.pageSize << " cannot hold the " << PAGE_OVERHEAD << " byte page header";
    throw PagerError(PagerError::Kind::DecodeError, NO_PAGE_ID, ss.str());
  }

  return header;
}
