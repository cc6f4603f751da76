// thought_crdt.hpp
#ifndef THOUGHT_CRDT_HPP
#define THOUGHT_CRDT_HPP

#include "semantic_resolver.hpp"
#include "thought_version.hpp"
#include "vector_clock.hpp"

#include <iostream>
#include <optional>
#include <utility>

namespace thought_crdt {

/// Store of the latest known version of every thought, keyed by cid. Tombstones stay in the map.
using ThoughtStore = CrdtMap<ThoughtCid, StoredVersion>;

/// A concurrent modification that was detected and resolved during a merge.
struct ConflictInfo {
  ThoughtCid cid;
  StoredVersion our_version;
  StoredVersion their_version;
  StoredVersion resolution;
  std::string strategy;
};

/// Result of merging a remote replica state.
struct MergeReport {
  CrdtVector<ThoughtCid> added;
  CrdtVector<ThoughtCid> updated;
  CrdtVector<ConflictInfo> conflicts;

  bool empty() const { return added.empty() && updated.empty() && conflicts.empty(); }
};

/// Whole-replica snapshot exchanged between nodes. Always held by value.
struct ReplicaState {
  ThoughtNodeId node_id;
  VectorClock vector_clock;
  ThoughtStore store;
};

/// State-based CRDT of thoughts: an LWW-Element-Set ordered by vector clocks, with concurrent
/// versions resolved by `Resolver`.
///
/// Not thread-safe. Callers must serialize access to one instance.
template <ConflictResolver Resolver = SemanticResolver> class BasicThoughtCRDT {
protected:
  ThoughtNodeId node_id_;
  VectorClock clock_;
  ThoughtStore store_;
  WallClock wall_clock_;
  Resolver resolver_;

public:
  // Create a new empty replica
  // Complexity: O(1)
  explicit BasicThoughtCRDT(ThoughtNodeId node_id, WallClock wall_clock = system_wall_clock,
                            Resolver resolver = Resolver())
      : node_id_(std::move(node_id)), clock_(), store_(), wall_clock_(std::move(wall_clock)),
        resolver_(std::move(resolver)) {
    if (node_id_.empty()) {
      throw ThoughtCRDTException("Replica node id must not be empty");
    }
    if (!wall_clock_) {
      wall_clock_ = system_wall_clock;
    }
  }

  /// Adds or updates a thought.
  ///
  /// The local clock is bumped first, then the new version is installed unless the stored version
  /// for the same cid is causally newer or identical. A stored version that is merely concurrent
  /// is overwritten as-is; semantic resolution only happens in `merge`.
  ///
  /// # Arguments
  ///
  /// * `thought` - The thought to store. Must carry a non-empty cid.
  ///
  /// # Returns
  ///
  /// The decorated view of the version stored under the cid after the call.
  ///
  /// Complexity: O(log n + c), where c is the size of the vector clock
  DecoratedThought add(Thought thought) {
    if (thought.cid.empty()) {
      throw ThoughtCRDTException("Thought is missing a cid");
    }

    clock_.increment(node_id_);
    StoredVersion incoming(std::move(thought), wall_clock_(), node_id_, clock_);

    auto it = store_.find(incoming.value.cid);
    if (it == store_.end()) {
      it = store_.emplace(incoming.value.cid, std::move(incoming)).first;
    } else if (should_replace_locally(it->second, incoming)) {
      it->second = std::move(incoming);
    }

    return decorate(it->second);
  }

  /// Tombstones a thought.
  ///
  /// The local clock is bumped even when the cid is unknown; removing an unknown cid is a no-op
  /// otherwise.
  ///
  /// Complexity: O(1) average
  void remove(const ThoughtCid &cid) {
    clock_.increment(node_id_);

    auto it = store_.find(cid);
    if (it == store_.end()) {
      return;
    }

    StoredVersion &existing = it->second;
    existing.write_time = wall_clock_();
    existing.writer_node = node_id_;
    existing.clock = clock_;
    existing.tombstone = true;
  }

  /// Merges a snapshot of a remote replica into this one.
  ///
  /// # Arguments
  ///
  /// * `remote` - The remote state. It is only read; every version kept is copied.
  ///
  /// # Returns
  ///
  /// The cids that were added or updated, and every conflict that was resolved.
  ///
  /// Complexity: O(r * c), where r is the number of remote versions and c the clock size
  MergeReport merge(const ReplicaState &remote) {
    MergeReport report;

    for (const auto &[cid, theirs] : remote.store) {
      auto it = store_.find(cid);
      if (it == store_.end()) {
        store_.emplace(cid, theirs);
        report.added.push_back(cid);
        continue;
      }

      StoredVersion &ours = it->second;
      switch (compare_versions(ours, theirs)) {
      case Causality::TheirsNewer:
        ours = theirs;
        report.updated.push_back(cid);
        break;
      case Causality::Concurrent: {
        Resolution resolution = resolver_(ours, theirs, node_id_);
        ConflictInfo conflict{cid, ours, theirs, resolution.version, std::move(resolution.strategy)};
        ours = std::move(resolution.version);
        report.conflicts.push_back(std::move(conflict));
        break;
      }
      case Causality::OursNewer:
      case Causality::Identical:
        break;
      }
    }

    clock_.merge(remote.vector_clock);
    return report;
  }

  /// Merges the current state of another replica.
  MergeReport merge(const BasicThoughtCRDT &other) { return merge(other.get_state()); }

  /// Retrieves every thought that is not tombstoned. Order is not significant.
  ///
  /// Complexity: O(n)
  CrdtVector<DecoratedThought> get_thoughts() const {
    CrdtVector<DecoratedThought> thoughts;
    thoughts.reserve(store_.size());
    for (const auto &[cid, stored] : store_) {
      if (!stored.tombstone) {
        thoughts.push_back(decorate(stored));
      }
    }
    return thoughts;
  }

  /// Retrieves a single live thought, or std::nullopt if it is unknown or tombstoned.
  std::optional<DecoratedThought> get_thought(const ThoughtCid &cid) const {
    auto it = store_.find(cid);
    if (it == store_.end() || it->second.tombstone) {
      return std::nullopt;
    }
    return decorate(it->second);
  }

  /// Retrieves a pointer to the stored version of `cid`, tombstones included, or nullptr.
  const StoredVersion *find_version(const ThoughtCid &cid) const {
    auto it = store_.find(cid);
    return it != store_.end() ? &it->second : nullptr;
  }

  bool is_tombstoned(const ThoughtCid &cid) const {
    const StoredVersion *stored = find_version(cid);
    return stored != nullptr && stored->tombstone;
  }

  /// Exports a deep copy of the replica for transfer to a peer.
  ReplicaState get_state() const { return ReplicaState{node_id_, clock_, store_}; }

  /// Replaces this replica's node id, clock and store with `state`.
  ///
  /// Throws ThoughtCRDTException if the node id is empty or a store key does not match the cid of
  /// its version; the replica is left untouched in that case.
  void load_state(ReplicaState state) {
    if (state.node_id.empty()) {
      throw ThoughtCRDTException("Replica state has an empty node id");
    }
    for (const auto &[cid, stored] : state.store) {
      if (cid.empty() || cid != stored.value.cid) {
        throw ThoughtCRDTException("Replica state is keyed inconsistently for cid '" + cid + "'");
      }
    }

    node_id_ = std::move(state.node_id);
    clock_ = std::move(state.vector_clock);
    store_ = std::move(state.store);
  }

  const ThoughtNodeId &get_node_id() const { return node_id_; }
  const VectorClock &get_clock() const { return clock_; }
  const ThoughtStore &get_store() const { return store_; }

  // Number of stored versions, tombstones included
  size_t size() const { return store_.size(); }

/// Prints the clock and every stored version for debugging purposes.
///
/// Complexity: O(n)
#ifndef NDEBUG
  void print_state() const {
    std::cout << "Node " << node_id_ << " clock " << clock_ << std::endl;
    for (const auto &[cid, stored] : store_) {
      std::cout << "  " << cid << (stored.tombstone ? " [tombstone]" : "") << " topic=" << stored.value.topic
                << " writer=" << stored.writer_node << " clock=" << stored.clock << std::endl;
      std::cout << "    payload: " << stored.value.payload.dump() << std::endl;
    }
  }
#else
  void print_state() const {}
#endif

protected:
  // A local write replaces the stored version unless the stored one is causally newer or identical
  static bool should_replace_locally(const StoredVersion &existing, const StoredVersion &incoming) {
    Causality causality = compare_versions(existing, incoming);
    return causality == Causality::TheirsNewer || causality == Causality::Concurrent;
  }
};

using ThoughtCRDT = BasicThoughtCRDT<>;

} // namespace thought_crdt

#endif // THOUGHT_CRDT_HPP
