#pragma once

#include "pages/page.hpp"

#include <span>
#include <vector>

// pages are stored as | id u32 | nextId u32 | payload |, all integers big endian
// throws PagerError(SizeMismatch) unless the payload fills exactly pageSize - PAGE_OVERHEAD bytes
std::vector<std::byte> encodePage(const Page &page, u32 pageSize);
// throws PagerError(DecodeError) if bytes cannot hold a page header
Page decodePage(std::span<const std::byte> bytes);

std::vector<std::byte> encodeMetadata(const DatabaseHeader &header);
// throws PagerError(DecodeError) on a short block or an unknown version
DatabaseHeader decodeMetadata(std::span<const std::byte> bytes);
