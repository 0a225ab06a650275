#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

namespace shopfloor::scheduling {

/*
  Lazily created mutex per key.

  Mutexes live for the lifetime of the table; the key spaces (orders,
  worker/step pairs) are bounded by the plant's master data.
*/
template <typename Key>
class KeyedMutexTable {
 public:
  std::mutex& For(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto&                       slot = mutexes_[key];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
  }

 private:
  std::mutex                                 mutex_;
  std::map<Key, std::unique_ptr<std::mutex>> mutexes_;
};

using OrderLocks = KeyedMutexTable<std::uint64_t>;

} // namespace shopfloor::scheduling
