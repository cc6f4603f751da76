// vector_clock.hpp
#ifndef VECTOR_CLOCK_HPP
#define VECTOR_CLOCK_HPP

#include "thought_types.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace thought_crdt {

/// Causal relationship between two vector clocks, seen from the left-hand side.
enum class ClockOrdering { Before, After, Concurrent, Identical };

inline std::ostream &operator<<(std::ostream &os, ClockOrdering ordering) {
  switch (ordering) {
  case ClockOrdering::Before:
    return os << "before";
  case ClockOrdering::After:
    return os << "after";
  case ClockOrdering::Concurrent:
    return os << "concurrent";
  case ClockOrdering::Identical:
    return os << "identical";
  }
  return os;
}

/// Represents a vector clock for tracking causality between replicas.
///
/// Maps node ids to logical counters. Nodes missing from the map read as 0, so an explicit
/// zero entry and a missing entry are interchangeable in every comparison.
class VectorClock {
public:
  using Entries = CrdtSortedMap<ThoughtNodeId, uint64_t>;

  VectorClock() = default;
  explicit VectorClock(Entries entries) : entries_(std::move(entries)) {}

  /// Increments the counter of `node_id` for a local event.
  ///
  /// # Returns
  ///
  /// The new counter value.
  ///
  /// Complexity: O(log n), where n is the number of known nodes
  uint64_t increment(const ThoughtNodeId &node_id) { return ++entries_[node_id]; }

  /// Retrieves the counter for `node_id`, 0 if the node was never seen.
  uint64_t get(const ThoughtNodeId &node_id) const {
    auto it = entries_.find(node_id);
    return it != entries_.end() ? it->second : 0;
  }

  /// Absorbs another clock by taking the point-wise maximum.
  ///
  /// Idempotent and commutative. Counters are only ever raised.
  ///
  /// Complexity: O(m log n), where m is the size of `other`
  void merge(const VectorClock &other) {
    for (const auto &[node_id, counter] : other.entries_) {
      auto &local = entries_[node_id];
      local = std::max(local, counter);
    }
  }

  /// Returns the point-wise maximum of two clocks.
  static VectorClock merged(const VectorClock &a, const VectorClock &b) {
    VectorClock result = a;
    result.merge(b);
    return result;
  }

  /// Compares this clock against `other`.
  ///
  /// # Returns
  ///
  /// * `Before` if every counter is <= the other's and at least one is strictly lower.
  /// * `After` if the reverse holds.
  /// * `Identical` if all counters match (missing entries count as 0).
  /// * `Concurrent` otherwise.
  ///
  /// Complexity: O(n + m)
  ClockOrdering compare(const VectorClock &other) const {
    bool less = false;
    bool greater = false;

    auto a = entries_.begin();
    auto b = other.entries_.begin();
    while (a != entries_.end() || b != other.entries_.end()) {
      uint64_t a_count = 0;
      uint64_t b_count = 0;
      if (b == other.entries_.end() || (a != entries_.end() && a->first < b->first)) {
        a_count = (a++)->second;
      } else if (a == entries_.end() || b->first < a->first) {
        b_count = (b++)->second;
      } else {
        a_count = (a++)->second;
        b_count = (b++)->second;
      }

      if (a_count < b_count)
        less = true;
      else if (a_count > b_count)
        greater = true;

      if (less && greater)
        return ClockOrdering::Concurrent;
    }

    if (less)
      return ClockOrdering::Before;
    if (greater)
      return ClockOrdering::After;
    return ClockOrdering::Identical;
  }

  /// True iff this clock causally precedes `other`.
  bool happens_before(const VectorClock &other) const { return compare(other) == ClockOrdering::Before; }

  bool concurrent_with(const VectorClock &other) const { return compare(other) == ClockOrdering::Concurrent; }

  const Entries &entries() const { return entries_; }
  bool empty() const { return entries_.empty(); }

  friend bool operator==(const VectorClock &lhs, const VectorClock &rhs) {
    return lhs.compare(rhs) == ClockOrdering::Identical;
  }

  friend std::ostream &operator<<(std::ostream &os, const VectorClock &clock) {
    os << "{";
    bool first = true;
    for (const auto &[node_id, counter] : clock.entries_) {
      if (!first)
        os << ", ";
      os << node_id << ": " << counter;
      first = false;
    }
    return os << "}";
  }

private:
  Entries entries_;
};

} // namespace thought_crdt

#endif // VECTOR_CLOCK_HPP
