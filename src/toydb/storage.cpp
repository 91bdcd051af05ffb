#include "toydb/storage.hpp"
#include "toydb/errors.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace
{
[[noreturn]] void throwShortRead(u64 offset, std::size_t length, u64 available)
{
  std::ostringstream ss;
  ss << "Short read of " << length << " bytes at offset " << offset << ", store has " << available << " bytes";
  throw StorageError(StorageError::Kind::ShortRead, ss.str());
}
}

u64 StreamStorage::size()
{
  // a previous short read leaves eof set, which would make every later seek fail
  m_stream.clear();
  if (!m_stream.seekg(0, std::ios::end))
  {
    throw StorageError(StorageError::Kind::SeekFailed, "Failed to seek to the end of the stream");
  }
  const std::streamoff end = m_stream.tellg();
  if (end < 0)
  {
    throw StorageError(StorageError::Kind::SeekFailed, "Failed to get size of the stream");
  }
  return static_cast<u64>(end);
}

std::vector<std::byte> StreamStorage::readRange(u64 offset, std::size_t length)
{
  const u64 available = size();
  if (offset > available || length > available - offset)
  {
    throwShortRead(offset, length, available);
  }

  std::vector<std::byte> bytes(length);
  if (!m_stream.seekg(static_cast<std::streamoff>(offset)))
  {
    throw StorageError(StorageError::Kind::SeekFailed, "Failed in seeking to read");
  }
  m_stream.read(reinterpret_cast<char *>(bytes.data()), static_cast<std::streamsize>(length));
  if (static_cast<std::size_t>(m_stream.gcount()) != length)
  {
    throwShortRead(offset, length, offset + static_cast<u64>(m_stream.gcount()));
  }
  return bytes;
}

void StreamStorage::writeRange(u64 offset, std::span<const std::byte> bytes)
{
  const u64 end = size();
  if (offset > end)
  {
    // streams cannot seek past their end, so pad up to the offset first
    if (!m_stream.seekp(0, std::ios::end))
    {
      throw StorageError(StorageError::Kind::SeekFailed, "Failed in seeking to pad");
    }
    const std::vector<char> padding(offset - end, 0);
    if (!m_stream.write(padding.data(), static_cast<std::streamsize>(padding.size())))
    {
      throw StorageError(StorageError::Kind::WriteFailed, "Failed to pad the stream");
    }
  }
  else if (!m_stream.seekp(static_cast<std::streamoff>(offset)))
  {
    throw StorageError(StorageError::Kind::SeekFailed, "Failed in seeking to write");
  }

  if (!m_stream.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size())))
  {
    throw StorageError(StorageError::Kind::WriteFailed, "Failed to write");
  }
  if (!m_stream.flush())
  {
    throw StorageError(StorageError::Kind::WriteFailed, "Failed to flush");
  }
}

FileStorage::FileStorage(const std::filesystem::path &path)
    : m_file(path, std::ios::in | std::ios::out | std::ios::binary),
      m_storage(m_file)
{
  if (!m_file)
  {
    std::cerr << "Failed to open database file " << path << std::endl;
    throw StorageError(StorageError::Kind::OpenFailed, "Failed to open database file " + path.string());
  }
}

MemoryStorage::MemoryStorage(std::string_view bytes)
    : m_bytes(bytes.size())
{
  std::transform(bytes.begin(), bytes.end(), m_bytes.begin(), [](char c) { return static_cast<std::byte>(c); });
}

std::vector<std::byte> MemoryStorage::readRange(u64 offset, std::size_t length)
{
  seek(offset);
  if (m_cursor > m_bytes.size() || length > m_bytes.size() - m_cursor)
  {
    throwShortRead(offset, length, m_bytes.size());
  }

  const auto start = m_bytes.begin() + static_cast<std::ptrdiff_t>(m_cursor);
  std::vector<std::byte> bytes(start, start + static_cast<std::ptrdiff_t>(length));
  m_cursor += length;
  return bytes;
}

void MemoryStorage::writeRange(u64 offset, std::span<const std::byte> bytes)
{
  seek(offset);
  if (m_cursor + bytes.size() > m_bytes.size())
  {
    m_bytes.resize(m_cursor + bytes.size(), std::byte{0});
  }
  std::copy(bytes.begin(), bytes.end(), m_bytes.begin() + static_cast<std::ptrdiff_t>(m_cursor));
  m_cursor += bytes.size();
}
