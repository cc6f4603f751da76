// thought_types.hpp
#ifndef THOUGHT_TYPES_HPP
#define THOUGHT_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

// Define this if you want to override the default collection types
// Basically define these before including this header and ensure this define is set before this header is included
// in any other files that include this file
#ifndef THOUGHT_CRDT_COLLECTIONS_DEFINED
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <vector>

template <typename T> using CrdtVector = std::vector<T>;

template <typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
using CrdtMap = std::unordered_map<K, V, Hash, KeyEqual>;

template <typename K, typename V, typename Comparator = std::less<K>> using CrdtSortedMap = std::map<K, V, Comparator>;

template <typename K, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
using CrdtSet = std::unordered_set<K, Hash, KeyEqual>;
#endif

namespace thought_crdt {

using ThoughtNodeId = std::string;
using ThoughtCid = std::string;

/// Exception thrown when a caller breaks the contract of the thought CRDT
/// (missing cid, malformed state snapshot, empty node id).
class ThoughtCRDTException : public std::runtime_error {
public:
  explicit ThoughtCRDTException(const std::string &msg) : std::runtime_error(msg) {}
};

/// Source of wall-clock write times, in milliseconds since the Unix epoch.
using WallClock = std::function<uint64_t()>;

inline uint64_t system_wall_clock() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

} // namespace thought_crdt

#endif // THOUGHT_TYPES_HPP
