// thought_version.hpp
#ifndef THOUGHT_VERSION_HPP
#define THOUGHT_VERSION_HPP

#include "thought.hpp"
#include "vector_clock.hpp"

#include <iostream>
#include <utility>

namespace thought_crdt {

/// The latest known version of a thought at one replica.
struct StoredVersion {
  Thought value;
  uint64_t write_time = 0; // wall clock at the storing node, ms since epoch
  ThoughtNodeId writer_node;
  VectorClock clock; // snapshot of the writer's clock at write time
  bool tombstone = false;

  StoredVersion() = default;

  StoredVersion(Thought v, uint64_t wt, ThoughtNodeId writer, VectorClock c, bool t = false)
      : value(std::move(v)), write_time(wt), writer_node(std::move(writer)), clock(std::move(c)), tombstone(t) {}
};

inline bool operator==(const StoredVersion &lhs, const StoredVersion &rhs) {
  return lhs.value == rhs.value && lhs.write_time == rhs.write_time && lhs.writer_node == rhs.writer_node &&
         lhs.clock == rhs.clock && lhs.tombstone == rhs.tombstone;
}

inline bool operator!=(const StoredVersion &lhs, const StoredVersion &rhs) { return !(lhs == rhs); }

inline std::ostream &operator<<(std::ostream &os, const StoredVersion &stored) {
  os << stored.value << " writer=" << stored.writer_node << " write_time=" << stored.write_time
     << " clock=" << stored.clock;
  if (stored.tombstone)
    os << " [tombstone]";
  return os;
}

/// A thought together with the CRDT metadata of the version it was read from.
struct DecoratedThought {
  Thought thought;
  VectorClock clock;
  uint64_t last_modified = 0;
  ThoughtNodeId modified_by;
  uint64_t version = 0; // the writer's own counter in `clock`
};

inline DecoratedThought decorate(const StoredVersion &stored) {
  return DecoratedThought{stored.value, stored.clock, stored.write_time, stored.writer_node,
                          stored.clock.get(stored.writer_node)};
}

/// Outcome of comparing a local and a remote version of the same cid.
enum class Causality { OursNewer, TheirsNewer, Concurrent, Identical };

inline std::ostream &operator<<(std::ostream &os, Causality causality) {
  switch (causality) {
  case Causality::OursNewer:
    return os << "ours-newer";
  case Causality::TheirsNewer:
    return os << "theirs-newer";
  case Causality::Concurrent:
    return os << "concurrent";
  case Causality::Identical:
    return os << "identical";
  }
  return os;
}

/// Classifies two versions of one cid by their vector clocks only.
///
/// Write times and producer timestamps are never consulted here.
inline Causality compare_versions(const StoredVersion &ours, const StoredVersion &theirs) {
  switch (ours.clock.compare(theirs.clock)) {
  case ClockOrdering::Before:
    return Causality::TheirsNewer;
  case ClockOrdering::After:
    return Causality::OursNewer;
  case ClockOrdering::Concurrent:
    return Causality::Concurrent;
  case ClockOrdering::Identical:
    return Causality::Identical;
  }
  return Causality::Concurrent;
}

} // namespace thought_crdt

#endif // THOUGHT_VERSION_HPP
