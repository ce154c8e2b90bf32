/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */
#ifndef _E4X_IMG_LRU_CACHE_H
#define _E4X_IMG_LRU_CACHE_H

#include <cstdint>
#include <cstring>
#include <list>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

/*
 * Fixed capacity map that forgets the least recently used entry when a
 * new key is added to a full cache.  The list runs from most to least
 * recently used; the map points into it.
 */
template <class K, class V>
class LRUCache {
public:
  typedef K key_type;
  typedef V value_type;
  typedef std::list<std::pair<K, V>> list_type;

  explicit LRUCache(size_t max):
    N(max)
  {}

  const value_type* get(const key_type& key) {
    auto it = index.find(key);
    if (it == index.end()) {
      return nullptr;
    }
    touch(it->second);
    return &it->second->second;
  }

  void put(const key_type& key, value_type val) {
    auto it = index.find(key);
    if (it != index.end()) {
      it->second->second = std::move(val);
      touch(it->second);
      return;
    }

    if (N == 0) {
      return;
    }
    if (items.size() >= N) {
      index.erase(items.back().first);
      items.pop_back();
    }
    items.emplace_front(key, std::move(val));
    index[key] = items.begin();
  }

  size_t size() const {
    return N;
  }

  size_t count() const {
    return items.size();
  }

  void clear() {
    index.clear();
    items.clear();
  }

  typename list_type::const_iterator begin() const {
    return items.cbegin();
  }

  typename list_type::const_iterator end() const {
    return items.cend();
  }

private:
  const size_t N;

  list_type items;
  std::unordered_map<K, typename list_type::iterator> index;

  void touch(typename list_type::iterator a_it) {
    items.splice(items.begin(), items, a_it);
  }
};

/*
 * Cache of image chunks keyed by chunk offset.  The final chunk of an
 * image may be shorter than chunk_size, so each entry keeps its own length.
 */
class LRUBlockCache {
public:
  LRUBlockCache(size_t cache_size, size_t chunk_size);

  const std::vector<char>* get(uint64_t key);

  void put(uint64_t key, const char* val, size_t len);

  size_t cache_size() const;

  size_t chunk_size() const;

  void clear();

private:
  LRUCache<uint64_t, std::vector<char>> cache;
  const size_t ch_size;
};

/*
 * Same as LRUBlockCache, but every operation holds a mutex.  copy_out()
 * copies while the lock is held, so a concurrent put() cannot recycle
 * the entry under the reader.
 */
class LRUBlockCacheLocking: public LRUBlockCache {
public:
  LRUBlockCacheLocking(size_t cache_size, size_t chunk_size);

  void lock();

  void unlock();

  bool copy_out(uint64_t key, size_t delta, size_t len, char* dst);

  void put(uint64_t key, const char* val, size_t len);

  void clear();

private:
  std::mutex mutex;
};

#endif
