/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "e4x/img/lru_cache.h"

#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "catch.hpp"

template <class Cache>
void insert(Cache& c, int l, int r) {
  for (int i = l; i < r; ++i) {
    c.put(i, i);
  }
}

TEST_CASE("lru keeps the most recent items") {
  LRUCache<int, int> c(4);
  insert(c, 0, 8);
  CHECK(c.count() == 4);
  CHECK(c.get(3) == nullptr);
  for (int i = 4; i < 8; ++i) {
    const int* v = c.get(i);
    REQUIRE(v);
    CHECK(*v == i);
  }
}

TEST_CASE("lru get refreshes an item") {
  LRUCache<int, int> c(3);
  insert(c, 0, 3);
  // 0 becomes MRU, so 1 is evicted next
  REQUIRE(c.get(0));
  c.put(3, 3);
  CHECK(c.get(1) == nullptr);
  CHECK(c.get(0));
  CHECK(c.get(2));
  CHECK(c.get(3));
}

TEST_CASE("lru put replaces a value") {
  LRUCache<int, int> c(2);
  c.put(1, 10);
  c.put(1, 11);
  CHECK(c.count() == 1);
  const int* v = c.get(1);
  REQUIRE(v);
  CHECK(*v == 11);
}

TEST_CASE("lru iteration runs from MRU to LRU") {
  LRUCache<int, int> c(5);
  insert(c, 0, 5);
  int i = 4;
  for (const auto& act: c) {
    CHECK(act == std::make_pair(i, i));
    --i;
  }
  CHECK(i == -1);
  c.clear();
  CHECK(std::distance(c.begin(), c.end()) == 0);
  CHECK(c.size() == 5);
}

TEST_CASE("block cache copies part of a chunk") {
  LRUBlockCacheLocking c(2, 16);
  CHECK(c.chunk_size() == 16);
  CHECK(c.cache_size() == 2);

  const char data[] = "0123456789abcdef";
  char out[5] = {0};
  CHECK(!c.copy_out(0, 0, 4, out));

  c.put(0, data, 16);
  REQUIRE(c.copy_out(0, 10, 4, out));
  CHECK(std::string(out) == "abcd");

  // a short final chunk keeps its own length
  c.put(16, data, 3);
  const std::vector<char>* chunk = c.get(16);
  REQUIRE(chunk);
  CHECK(chunk->size() == 3);

  c.put(32, data, 16);
  CHECK(!c.copy_out(0, 0, 1, out));

  c.clear();
  CHECK(!c.copy_out(32, 0, 1, out));
}
