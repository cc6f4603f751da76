// semantic_resolver.hpp
#ifndef SEMANTIC_RESOLVER_HPP
#define SEMANTIC_RESOLVER_HPP

#include "thought_version.hpp"

#include <concepts>
#include <string>

namespace thought_crdt {

inline constexpr const char *kSemanticMergeStrategy = "semantic-merge";
inline constexpr const char *kTombstoneStrategy = "tombstone-lww";

// Separator used when joining the free-text fields of concurrent dreams
inline constexpr const char *kDreamTextSeparator = " | ";

/// A version produced from two concurrent versions, with the name of the policy that produced it.
struct Resolution {
  StoredVersion version;
  std::string strategy;
};

/// A conflict resolver is called with the local version, the remote version and the id of the
/// node performing the merge. It must be a pure function of those inputs so that every replica
/// resolving the same pair ends up with the same record.
template <typename Resolver>
concept ConflictResolver =
    requires(const Resolver &r, const StoredVersion &ours, const StoredVersion &theirs, const ThoughtNodeId &node) {
      { r(ours, theirs, node) } -> std::convertible_to<Resolution>;
    };

/// Topic-aware resolution of concurrently modified thoughts.
///
/// The two sides are first put in a canonical older/newer order (producer timestamp, then the
/// serialized thought, then the clock entries, then write time), so the outcome does not depend on
/// which replica is resolving or which node resolved an input.
///
/// * If either side is a tombstone the side with the later write time wins; a tie goes to the
///   tombstone.
/// * Otherwise the payloads are merged by topic (see `merge_payloads`) on top of the newer
///   thought, and the link lists are unioned.
///
/// The resolved version carries the point-wise max of both clocks, the later write time, and the
/// resolving node as writer.
struct SemanticResolver {
  Resolution operator()(const StoredVersion &ours, const StoredVersion &theirs, const ThoughtNodeId &resolver_node) const;
};

static_assert(ConflictResolver<SemanticResolver>);

/// True if `a` sorts before `b` in the canonical order used to break ties between concurrent versions.
bool is_older(const StoredVersion &a, const StoredVersion &b);

/// Merges two thoughts field by field. `newer` provides the base record.
Thought merge_thoughts(const Thought &older, const Thought &newer);

/// Merges two payloads according to `topic`.
///
/// * Metric: union with `newer` winning, then numeric fields present on both sides are averaged.
/// * Event: union with `newer` winning, plus `merged: true` and `sources: [older, newer]`.
/// * Dream: union with `newer` winning, with `vision` and `content` joined from both sides.
/// * Other, or either payload not an object: `newer` wins outright.
nlohmann::json merge_payloads(const nlohmann::json &older, const nlohmann::json &newer, Topic topic);

/// Sorted union of two link lists without duplicates.
CrdtVector<ThoughtCid> merge_links(const CrdtVector<ThoughtCid> &a, const CrdtVector<ThoughtCid> &b);

} // namespace thought_crdt

#endif // SEMANTIC_RESOLVER_HPP
