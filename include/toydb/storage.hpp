#pragma once

#include "machine.hpp"

#include <filesystem>
#include <fstream>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

// random access byte store underneath the pager.
// reads never return fewer bytes than requested, they throw StorageError(ShortRead) instead
class Storage
{
public:
  virtual ~Storage() = default;

  virtual std::vector<std::byte> readRange(u64 offset, std::size_t length) = 0;
  // writing past the end grows the store, the gap is zero filled
  virtual void writeRange(u64 offset, std::span<const std::byte> bytes) = 0;
  virtual u64 size() = 0;
};

// storage over a borrowed stream, e.g. an fstream or a stringstream
class StreamStorage : public Storage
{
public:
  explicit StreamStorage(std::iostream &stream) noexcept : m_stream(stream) {}

  std::vector<std::byte> readRange(u64 offset, std::size_t length) override;
  void writeRange(u64 offset, std::span<const std::byte> bytes) override;
  u64 size() override;

private:
  std::iostream &m_stream;
};

// owns the database file for its lifetime. the file must already exist
class FileStorage : public Storage
{
public:
  explicit FileStorage(const std::filesystem::path &path);

  FileStorage(const FileStorage &) = delete;
  FileStorage &operator=(const FileStorage &) = delete;

  std::vector<std::byte> readRange(u64 offset, std::size_t length) override { return m_storage.readRange(offset, length); }
  void writeRange(u64 offset, std::span<const std::byte> bytes) override { m_storage.writeRange(offset, bytes); }
  u64 size() override { return m_storage.size(); }

private:
  std::fstream m_file;
  StreamStorage m_storage;
};

// in memory byte buffer with a cursor, reproduces file I/O without touching the filesystem
class MemoryStorage : public Storage
{
public:
  MemoryStorage() = default;
  explicit MemoryStorage(std::vector<std::byte> bytes) : m_bytes(std::move(bytes)) {}
  explicit MemoryStorage(std::string_view bytes);

  void seek(u64 offset) noexcept { m_cursor = offset; }
  u64 cursor() const noexcept { return m_cursor; }

  std::vector<std::byte> readRange(u64 offset, std::size_t length) override;
  void writeRange(u64 offset, std::span<const std::byte> bytes) override;
  u64 size() override { return m_bytes.size(); }

  const std::vector<std::byte> &bytes() const noexcept { return m_bytes; }

private:
  std::vector<std::byte> m_bytes;
  u64 m_cursor = 0;
};
