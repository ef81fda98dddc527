#pragma once

#include <ankerl/unordered_dense.h>

namespace lamina::core {

// Container aliases backed by ankerl::unordered_dense.
//
// Dense storage keeps key-value pairs contiguous; iterators are invalidated on
// insertion and erase like std::vector, so never hold one across a callback
// that may touch the same map.
//
// Usage:
//   lamina::core::fast_map<int, Connection> connections;
//   lamina::core::fast_map<std::string, PendingRequest> pending;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace lamina::core
