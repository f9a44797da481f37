/**
 * Unit tests for the batch accumulator and its JSONL encoding.
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "ingest/batch.hpp"
#include "ingest/record.hpp"
#include "scripted_transport.hpp"

using testing_support::lines_of;

TEST(Jsonl, OneCompactLinePerRecordInOrder) {
  std::vector<Record> records = {
      Record{{"s", "a"}},
      Record{{"s", "b"}},
  };
  EXPECT_EQ(encode_jsonl(records), "{\"s\":\"a\"}\n{\"s\":\"b\"}\n");
}

TEST(Jsonl, HeterogeneousRecordsShareABody) {
  std::vector<Record> records = {
      Record{{"k", 1}},
      Record("text"),
      Record(42),
      Record::array({1, 2, 3}),
      Record(nullptr),
  };
  auto lines = lines_of(encode_jsonl(records));
  ASSERT_EQ(lines.size(), 5u);
  EXPECT_EQ(lines[0], "{\"k\":1}");
  EXPECT_EQ(lines[1], "\"text\"");
  EXPECT_EQ(lines[2], "42");
  EXPECT_EQ(lines[3], "[1,2,3]");
  EXPECT_EQ(lines[4], "null");
}

TEST(Jsonl, NestedNewlinesAreEscaped) {
  std::vector<Record> records = {Record{{"msg", "line1\nline2"}}};
  auto body = encode_jsonl(records);
  EXPECT_EQ(lines_of(body).size(), 1u);
}

TEST(Jsonl, InvalidUtf8IsReplacedNotThrown) {
  std::vector<Record> records = {Record(std::string("bad \xff byte"))};
  std::string body;
  EXPECT_NO_THROW(body = encode_jsonl(records));
  ASSERT_FALSE(body.empty());
  EXPECT_EQ(body.back(), '\n');
}

TEST(Batch, EncodingIsStableAcrossCalls) {
  Batch batch(4);
  batch.append(Record{{"a", 1}, {"b", {1, 2}}});
  batch.append(Record("x"));
  EXPECT_EQ(batch.encode(), batch.encode());
}

TEST(Batch, AppendKeepsOrderAndMayExceedReserve) {
  Batch batch(2);
  for (int i = 0; i < 5; i++) {
    batch.append(Record(i));
  }
  ASSERT_EQ(batch.size(), 5u);
  for (int i = 0; i < 5; i++) {
    EXPECT_EQ(batch.records()[i], i);
  }
  batch.clear();
  EXPECT_TRUE(batch.empty());
}

TEST(Batch, TrimOldestKeepsNewest) {
  Batch batch(8);
  for (int i = 0; i < 6; i++) {
    batch.append(Record(i));
  }
  EXPECT_EQ(batch.trim_oldest(4), 2u);
  ASSERT_EQ(batch.size(), 4u);
  EXPECT_EQ(batch.records().front(), 2);
  EXPECT_EQ(batch.records().back(), 5);
  EXPECT_EQ(batch.trim_oldest(10), 0u);
}
