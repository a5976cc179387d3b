// (c) 2024, Interance GmbH & Co KG.

#include "database.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <sqlite3.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace item_service;

namespace {

constexpr auto id1 = "0b5c7e7c-2f0a-4d8e-9c1a-5a3f6e2d1b40";

// `id1` as written by a client that emits uppercase UUIDs.
constexpr auto id1_upper = "0B5C7E7C-2F0A-4D8E-9C1A-5A3F6E2D1B40";

constexpr auto id2 = "9d7e1f3a-6b2c-4e5d-8a9f-0c1b2d3e4f50";

class DatabaseTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto err = db.open();
    ASSERT_FALSE(err) << to_string(err);
  }

  test::temp_file file;
  database db{file.path()};
};

} // namespace

TEST(Database, ToFilenameStripsScheme) {
  EXPECT_EQ(database::to_filename("sqlite://items.db"), "items.db");
  EXPECT_EQ(database::to_filename("sqlite:items.db"), "items.db");
  EXPECT_EQ(database::to_filename("sqlite:///tmp/items.db"), "/tmp/items.db");
  EXPECT_EQ(database::to_filename("/var/lib/items.db"), "/var/lib/items.db");
  EXPECT_EQ(database::to_filename("file:items.db?mode=rwc"),
            "file:items.db?mode=rwc");
}

TEST(Database, OpenFailsForEmptyUrl) {
  database db{"sqlite://"};
  auto err = db.open();
  EXPECT_TRUE(err == ec::invalid_argument);
}

TEST(Database, OpenFailsForMissingDirectory) {
  database db{"/nonexistent-item-service-dir/sub/items.db"};
  auto err = db.open();
  EXPECT_TRUE(err == ec::database_inaccessible);
}

TEST(Database, QueriesFailWithoutConnection) {
  database db{"items.db"};
  auto value = db.get(id1);
  ASSERT_FALSE(value);
  EXPECT_TRUE(value.error() == ec::database_inaccessible);
  EXPECT_EQ(db.insert(item{id1, "a", "b"}), ec::database_inaccessible);
}

TEST(Database, SchemeUrlOpensSameFile) {
  test::temp_file file;
  database first{file.path()};
  ASSERT_FALSE(first.open());
  ASSERT_EQ(first.insert(item{id1, "a", "b"}), ec::nil);
  database second{"sqlite://" + file.path()};
  ASSERT_FALSE(second.open());
  auto value = second.get(id1);
  ASSERT_TRUE(value);
  EXPECT_EQ(value->name, "a");
}

TEST_F(DatabaseTest, NewDatabaseIsEmpty) {
  auto values = db.list();
  ASSERT_TRUE(values);
  EXPECT_TRUE(values->empty());
}

TEST_F(DatabaseTest, InsertThenGet) {
  ASSERT_EQ(db.insert(item{id1, "hammer", "a heavy tool"}), ec::nil);
  auto value = db.get(id1);
  ASSERT_TRUE(value);
  EXPECT_EQ(value->id, id1);
  EXPECT_EQ(value->name, "hammer");
  EXPECT_EQ(value->description, "a heavy tool");
}

TEST_F(DatabaseTest, GetUnknownIdReportsNoSuchItem) {
  auto value = db.get(id1);
  ASSERT_FALSE(value);
  EXPECT_TRUE(value.error() == ec::no_such_item);
}

TEST_F(DatabaseTest, InsertDuplicateIdFails) {
  ASSERT_EQ(db.insert(item{id1, "a", "b"}), ec::nil);
  EXPECT_EQ(db.insert(item{id1, "c", "d"}), ec::key_already_exists);
  auto value = db.get(id1);
  ASSERT_TRUE(value);
  EXPECT_EQ(value->name, "a");
}

TEST_F(DatabaseTest, TextIsStoredVerbatim) {
  auto name = std::string{"quotes ' \" and unicode \xc3\xa4\xc3\xb6\xc3\xbc"};
  auto description = std::string{};
  ASSERT_EQ(db.insert(item{id1, name, description}), ec::nil);
  auto value = db.get(id1);
  ASSERT_TRUE(value);
  EXPECT_EQ(value->name, name);
  EXPECT_EQ(value->description, description);
}

TEST_F(DatabaseTest, ListReturnsAllItems) {
  ASSERT_EQ(db.insert(item{id1, "a", "b"}), ec::nil);
  ASSERT_EQ(db.insert(item{id2, "c", "d"}), ec::nil);
  auto values = db.list();
  ASSERT_TRUE(values);
  ASSERT_EQ(values->size(), 2u);
  std::vector<std::string> ids;
  for (auto& value : *values)
    ids.push_back(value.id);
  std::sort(ids.begin(), ids.end());
  EXPECT_EQ(ids, (std::vector<std::string>{id1, id2}));
}

TEST_F(DatabaseTest, UpdateOverwritesNameAndDescription) {
  ASSERT_EQ(db.insert(item{id1, "a", "b"}), ec::nil);
  auto count = db.update(item{id1, "x", "y"});
  ASSERT_TRUE(count);
  EXPECT_EQ(*count, 1u);
  auto value = db.get(id1);
  ASSERT_TRUE(value);
  EXPECT_EQ(value->name, "x");
  EXPECT_EQ(value->description, "y");
}

TEST_F(DatabaseTest, UpdateUnknownIdMatchesNoRows) {
  auto count = db.update(item{id1, "x", "y"});
  ASSERT_TRUE(count);
  EXPECT_EQ(*count, 0u);
  EXPECT_FALSE(db.get(id1));
}

TEST_F(DatabaseTest, DelRemovesItem) {
  ASSERT_EQ(db.insert(item{id1, "a", "b"}), ec::nil);
  ASSERT_EQ(db.insert(item{id2, "c", "d"}), ec::nil);
  auto count = db.del(id1);
  ASSERT_TRUE(count);
  EXPECT_EQ(*count, 1u);
  auto value = db.get(id1);
  ASSERT_FALSE(value);
  EXPECT_TRUE(value.error() == ec::no_such_item);
  EXPECT_TRUE(db.get(id2));
}

TEST_F(DatabaseTest, DelUnknownIdMatchesNoRows) {
  auto count = db.del(id1);
  ASSERT_TRUE(count);
  EXPECT_EQ(*count, 0u);
}

TEST_F(DatabaseTest, ReopeningKeepsExistingRows) {
  ASSERT_EQ(db.insert(item{id1, "a", "b"}), ec::nil);
  database other{file.path()};
  ASSERT_FALSE(other.open());
  auto values = other.list();
  ASSERT_TRUE(values);
  EXPECT_EQ(values->size(), 1u);
}

TEST_F(DatabaseTest, IdsMatchRegardlessOfCase) {
  ASSERT_EQ(db.insert(item{id1_upper, "a", "b"}), ec::nil);
  auto value = db.get(id1);
  ASSERT_TRUE(value);
  EXPECT_EQ(value->id, id1_upper);
  auto updated = db.update(item{id1, "x", "y"});
  ASSERT_TRUE(updated);
  EXPECT_EQ(*updated, 1u);
  value = db.get(id1_upper);
  ASSERT_TRUE(value);
  EXPECT_EQ(value->name, "x");
  auto deleted = db.del(id1);
  ASSERT_TRUE(deleted);
  EXPECT_EQ(*deleted, 1u);
  EXPECT_FALSE(db.get(id1_upper));
}

TEST_F(DatabaseTest, InsertDuplicateIdWithOtherCaseFails) {
  ASSERT_EQ(db.insert(item{id1_upper, "a", "b"}), ec::nil);
  EXPECT_EQ(db.insert(item{id1, "c", "d"}), ec::key_already_exists);
}

TEST(Database, IdsMatchRegardlessOfCaseInExistingTable) {
  test::temp_file file;
  {
    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(file.path().c_str(), &raw), SQLITE_OK);
    auto rc = sqlite3_exec(raw,
                           "CREATE TABLE items ("
                           "id TEXT PRIMARY KEY NOT NULL,"
                           "name TEXT NOT NULL,"
                           "description TEXT NOT NULL);"
                           "INSERT INTO items VALUES ("
                           "'0B5C7E7C-2F0A-4D8E-9C1A-5A3F6E2D1B40', 'a', 'b')",
                           nullptr, nullptr, nullptr);
    sqlite3_close(raw);
    ASSERT_EQ(rc, SQLITE_OK);
  }
  database db{file.path()};
  ASSERT_FALSE(db.open());
  auto value = db.get(id1);
  ASSERT_TRUE(value);
  EXPECT_EQ(value->name, "a");
  auto deleted = db.del(id1);
  ASSERT_TRUE(deleted);
  EXPECT_EQ(*deleted, 1u);
}
