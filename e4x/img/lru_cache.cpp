/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */
#include "lru_cache.h"
#include "e4x_img_i.h"

LRUBlockCache::LRUBlockCache(size_t cache_size, size_t chunk_size):
  cache(cache_size),
  ch_size(chunk_size)
{}

const std::vector<char>* LRUBlockCache::get(uint64_t key) {
  return cache.get(key);
}

void LRUBlockCache::put(uint64_t key, const char* val, size_t len) {
  if (len > ch_size) {
    len = ch_size;
  }
  cache.put(key, std::vector<char>(val, val + len));
}

size_t LRUBlockCache::cache_size() const {
  return cache.size();
}

size_t LRUBlockCache::chunk_size() const {
  return ch_size;
}

void LRUBlockCache::clear() {
  cache.clear();
}

LRUBlockCacheLocking::LRUBlockCacheLocking(
  size_t cache_size,
  size_t chunk_size):
  LRUBlockCache(cache_size, chunk_size)
{}

void LRUBlockCacheLocking::lock() {
  mutex.lock();
}

void LRUBlockCacheLocking::unlock() {
  mutex.unlock();
}

bool LRUBlockCacheLocking::copy_out(
  uint64_t key,
  size_t delta,
  size_t len,
  char* dst)
{
  std::scoped_lock lock{*this};
  const auto chunk = LRUBlockCache::get(key);
  if (!chunk || delta + len > chunk->size()) {
    return false;
  }
  std::memcpy(dst, chunk->data() + delta, len);
  return true;
}

void LRUBlockCacheLocking::put(uint64_t key, const char* val, size_t len) {
  std::scoped_lock lock{*this};
  LRUBlockCache::put(key, val, len);
}

void LRUBlockCacheLocking::clear() {
  std::scoped_lock lock{*this};
  LRUBlockCache::clear();
}
