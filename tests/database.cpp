#include <gtest/gtest.h>

#include "database_fixture.hpp"
#include "test_utils.hpp"
#include "toydb/codec.hpp"
#include "toydb/database.hpp"

namespace
{
DatabaseHeader emptyHeader(u16 pageSize = 64)
{
  DatabaseHeader header;
  header.pageSize = pageSize;
  return header;
}
}

TEST(Database, OpenReadsMetadata) {
  DatabaseHeader header = emptyHeader(512);
  header.pagesNumber = 0;
  header.tablesMetaPageId = 3;
  MemoryStorage storage(encodeMetadata(header));

  Database db(storage, "test.db");
  EXPECT_EQ(512u, db.conf().pageSize);
  EXPECT_EQ(METADATA_SIZE, db.conf().baseOffset);
  EXPECT_EQ("test.db", db.conf().filePath.string());
  EXPECT_EQ((PagerState{0, NO_PAGE_ID}), db.session().state());
  EXPECT_EQ(3u, db.tablesMetaPageId());
  EXPECT_EQ(NO_PAGE_ID, db.indexesMetaPageId());
  EXPECT_EQ(header, db.header());
}

TEST(Database, MissingMetadata) {
  MemoryStorage storage(std::string_view("\x01\x00\x40", 3));
  EXPECT_PAGER_ERROR(Database db(storage), PagerError::Kind::DecodeError);
}

TEST(Database, UnsupportedVersion) {
  DatabaseHeader header = emptyHeader();
  header.version = 0;
  MemoryStorage storage(encodeMetadata(header));
  EXPECT_PAGER_ERROR(Database db(storage), PagerError::Kind::DecodeError);
}

/* pages are laid out after the metadata block */
TEST(Database, PagesFollowMetadata) {
  MemoryStorage storage(encodeMetadata(emptyHeader()));
  Database db(storage);

  const PageId id = db.session().allocatePage();
  EXPECT_EQ(0u, id);
  EXPECT_EQ(METADATA_SIZE + 64u, storage.size());

  Page page = db.session().readPage(id);
  page.payload[0] = std::byte{'x'};
  db.session().writePage(page);
  EXPECT_EQ(std::byte{'x'}, storage.bytes()[METADATA_SIZE + PAGE_OVERHEAD]);
}

/* the allocator state only reaches the metadata block on flush */
TEST(Database, FlushPersistsState) {
  MemoryStorage storage(encodeMetadata(emptyHeader()));
  {
    Database db(storage);
    PagerSession &session = db.session();
    const PageId a = session.allocatePage();
    session.allocatePage();
    session.freePage(a);
    db.setTablesMetaPageId(1);
    db.setIndexesMetaPageId(2);

    EXPECT_EQ(emptyHeader(), decodeMetadata(storage.readRange(0, METADATA_SIZE)));
    db.flush();
  }

  Database db(storage);
  EXPECT_EQ((PagerState{2, 0}), db.session().state());
  EXPECT_EQ(1u, db.tablesMetaPageId());
  EXPECT_EQ(2u, db.indexesMetaPageId());
  EXPECT_EQ(0u, db.session().allocatePage());
  EXPECT_EQ(NO_PAGE_ID, db.session().state().firstEmptyPageId);
}

TEST_F(TempFileFixture, OpenDatabaseFile) {
  createFile(toString(encodeMetadata(emptyHeader(32))));
  {
    FileStorage storage(path);
    Database db(storage, path);
    db.session().run([](PagerSession &s) {
      const PageId id = s.allocatePage();
      s.writePage(Page::fromString(id, std::string(24, 'r')));
    });
    db.flush();
  }

  FileStorage storage(path);
  Database db(storage, path);
  EXPECT_EQ(path.string(), db.conf().filePath.string());
  EXPECT_EQ(1u, db.session().state().pagesNumber);
  EXPECT_EQ(Page::fromString(0, std::string(24, 'r')), db.session().readPage(0));
  EXPECT_EQ(METADATA_SIZE + 32u, storage.size());
}

TEST(Database, PageSizeSmallerThanHeader) {
  MemoryStorage storage(encodeMetadata(emptyHeader(PAGE_OVERHEAD - 1)));
  EXPECT_PAGER_ERROR(Database db(storage), PagerError::Kind::DecodeError);
}
