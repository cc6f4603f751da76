// tests.cpp
#include "thought_crdt.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace thought_crdt;
using json = nlohmann::json;

// Test helper macros
#define TEST(name) void test_##name()
#define RUN_TEST(name)                                                                                                 \
  do {                                                                                                                 \
    std::cout << "Running test: " << #name << "...";                                                                   \
    test_##name();                                                                                                     \
    std::cout << " PASSED" << std::endl;                                                                               \
  } while (0)

#define ASSERT_EQ(a, b)                                                                                                \
  do {                                                                                                                 \
    if ((a) != (b)) {                                                                                                  \
      std::cerr << "Assertion failed: " << #a << " == " << #b << " (got " << (a) << " and " << (b) << ")"            \
                << std::endl;                                                                                          \
      std::exit(1);                                                                                                    \
    }                                                                                                                  \
  } while (0)

#define ASSERT_NEAR(a, b, eps)                                                                                         \
  do {                                                                                                                 \
    if (std::fabs((a) - (b)) > (eps)) {                                                                                \
      std::cerr << "Assertion failed: " << #a << " ~= " << #b << " (got " << (a) << " and " << (b) << ")"            \
                << std::endl;                                                                                          \
      std::exit(1);                                                                                                    \
    }                                                                                                                  \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                              \
  do {                                                                                                                 \
    if (!(cond)) {                                                                                                     \
      std::cerr << "Assertion failed: " << #cond << std::endl;                                                         \
      std::exit(1);                                                                                                    \
    }                                                                                                                  \
  } while (0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

#define ASSERT_THROWS(stmt, exception_type)                                                                            \
  do {                                                                                                                 \
    bool thrown = false;                                                                                               \
    try {                                                                                                              \
      stmt;                                                                                                            \
    } catch (const exception_type &) {                                                                                 \
      thrown = true;                                                                                                   \
    }                                                                                                                  \
    if (!thrown) {                                                                                                     \
      std::cerr << "Expected " << #exception_type << " from: " << #stmt << std::endl;                                  \
      std::exit(1);                                                                                                    \
    }                                                                                                                  \
  } while (0)

// Deterministic wall clock shared by a test and the replicas it drives
struct ManualClock {
  uint64_t now = 1000;
  WallClock source() {
    return [this] { return now; };
  }
};

Thought make_thought(const std::string &cid, const std::string &topic, json payload, uint64_t ts = 100,
                     CrdtVector<ThoughtCid> links = {}, const std::string &origin = "") {
  Thought thought;
  thought.cid = cid;
  thought.topic = topic;
  thought.payload = std::move(payload);
  thought.ts = ts;
  thought.links = std::move(links);
  thought.origin = origin;
  return thought;
}

bool contains(const CrdtVector<ThoughtCid> &cids, const ThoughtCid &cid) {
  return std::find(cids.begin(), cids.end(), cid) != cids.end();
}

// Same cids with the same values, tombstones and clocks
bool same_contents(const ThoughtStore &a, const ThoughtStore &b) {
  if (a.size() != b.size())
    return false;
  for (const auto &[cid, version] : a) {
    auto it = b.find(cid);
    if (it == b.end())
      return false;
    if (it->second.value != version.value || it->second.tombstone != version.tombstone ||
        it->second.clock != version.clock)
      return false;
  }
  return true;
}

TEST(add_and_get_thoughts) {
  ManualClock wall;
  ThoughtCRDT n1("n1", wall.source());

  DecoratedThought stored = n1.add(make_thought("t1", "metric", {{"H", 0.5}}));
  ASSERT_EQ(stored.thought.cid, "t1");
  ASSERT_EQ(stored.modified_by, "n1");
  ASSERT_EQ(stored.last_modified, 1000u);
  ASSERT_EQ(stored.version, 1u);
  ASSERT_EQ(n1.get_clock().get("n1"), 1u);

  auto thoughts = n1.get_thoughts();
  ASSERT_EQ(thoughts.size(), 1u);
  ASSERT_EQ(thoughts[0].thought.payload["H"].get<double>(), 0.5);
}

TEST(add_requires_cid) {
  ThoughtCRDT n1("n1");
  ASSERT_THROWS(n1.add(make_thought("", "metric", {{"H", 0.5}})), ThoughtCRDTException);
  ASSERT_EQ(n1.size(), 0u);
  ASSERT_THROWS(ThoughtCRDT(""), ThoughtCRDTException);
}

TEST(local_update_replaces_version) {
  ManualClock wall;
  ThoughtCRDT n1("n1", wall.source());

  n1.add(make_thought("t1", "event", {{"type", "a"}}));
  wall.now = 2000;
  DecoratedThought updated = n1.add(make_thought("t1", "event", {{"type", "b"}}));

  ASSERT_EQ(updated.version, 2u);
  ASSERT_EQ(updated.last_modified, 2000u);
  ASSERT_EQ(n1.get_thought("t1")->thought.payload["type"], "b");
  ASSERT_EQ(n1.size(), 1u);
}

TEST(remove_tombstones) {
  ManualClock wall;
  ThoughtCRDT n1("n1", wall.source());

  n1.add(make_thought("t1", "metric", {{"H", 0.5}}));
  wall.now = 1500;
  n1.remove("t1");

  ASSERT_TRUE(n1.get_thoughts().empty());
  ASSERT_FALSE(n1.get_thought("t1").has_value());
  ASSERT_TRUE(n1.is_tombstoned("t1"));
  ASSERT_EQ(n1.size(), 1u); // tombstone stays in the store

  const StoredVersion *tombstone = n1.find_version("t1");
  ASSERT_TRUE(tombstone != nullptr);
  ASSERT_EQ(tombstone->write_time, 1500u);
  ASSERT_EQ(tombstone->clock.get("n1"), 2u);
  ASSERT_EQ(tombstone->value.payload["H"].get<double>(), 0.5);
}

TEST(remove_unknown_is_noop) {
  ThoughtCRDT n1("n1");
  n1.remove("missing");
  ASSERT_EQ(n1.size(), 0u);
  ASSERT_EQ(n1.get_clock().get("n1"), 1u);
}

TEST(add_after_remove_resurrects) {
  ThoughtCRDT n1("n1");
  n1.add(make_thought("t1", "dream", {{"vision", "first"}}));
  n1.remove("t1");
  n1.add(make_thought("t1", "dream", {{"vision", "again"}}));

  ASSERT_FALSE(n1.is_tombstoned("t1"));
  ASSERT_EQ(n1.get_thought("t1")->thought.payload["vision"], "again");
}

TEST(merge_adds_unknown_thoughts) {
  ThoughtCRDT a("a");
  ThoughtCRDT b("b");

  a.add(make_thought("t1", "metric", {{"H", 0.5}}));
  a.add(make_thought("t2", "event", {{"type", "portal"}}));
  ReplicaState exported = a.get_state();

  MergeReport report = b.merge(exported);
  ASSERT_EQ(report.added.size(), 2u);
  ASSERT_TRUE(contains(report.added, "t1"));
  ASSERT_TRUE(contains(report.added, "t2"));
  ASSERT_TRUE(report.updated.empty());
  ASSERT_TRUE(report.conflicts.empty());

  // causal monotonicity
  ASSERT_TRUE(b.get_thought("t1").has_value());
  ASSERT_TRUE(b.get_clock().get("a") >= exported.vector_clock.get("a"));
}

TEST(merge_applies_causally_newer_version) {
  ThoughtCRDT a("a");
  ThoughtCRDT b("b");

  a.add(make_thought("t1", "metric", {{"H", 0.5}}));
  b.merge(a);
  a.add(make_thought("t1", "metric", {{"H", 0.7}}));

  MergeReport report = b.merge(a);
  ASSERT_TRUE(report.added.empty());
  ASSERT_EQ(report.updated.size(), 1u);
  ASSERT_EQ(report.updated[0], "t1");
  ASSERT_TRUE(report.conflicts.empty());
  ASSERT_EQ(b.get_thought("t1")->thought.payload["H"].get<double>(), 0.7);
}

TEST(merge_keeps_newer_local_version) {
  ThoughtCRDT a("a");
  ThoughtCRDT b("b");

  a.add(make_thought("t1", "metric", {{"H", 0.5}}));
  b.merge(a);
  b.add(make_thought("t1", "metric", {{"H", 0.9}}));

  MergeReport report = b.merge(a);
  ASSERT_TRUE(report.empty());
  ASSERT_EQ(b.get_thought("t1")->thought.payload["H"].get<double>(), 0.9);
}

TEST(metric_conflict_is_averaged) {
  ThoughtCRDT n1("n1");
  ThoughtCRDT n2("n2");

  n1.add(make_thought("t1", "metric", {{"H", 0.8}, {"tau", 0.2}}));
  n2.add(make_thought("t1", "metric", {{"H", 0.9}, {"tau", 0.1}}));

  MergeReport report = n1.merge(n2.get_state());
  ASSERT_EQ(report.conflicts.size(), 1u);
  ASSERT_EQ(report.conflicts[0].cid, "t1");
  ASSERT_EQ(report.conflicts[0].strategy, "semantic-merge");
  ASSERT_EQ(report.conflicts[0].our_version.value.payload["H"].get<double>(), 0.8);
  ASSERT_EQ(report.conflicts[0].their_version.value.payload["H"].get<double>(), 0.9);

  auto merged = n1.get_thought("t1");
  ASSERT_TRUE(merged.has_value());
  ASSERT_NEAR(merged->thought.payload["H"].get<double>(), 0.85, 1e-9);
  ASSERT_NEAR(merged->thought.payload["tau"].get<double>(), 0.15, 1e-9);
  ASSERT_EQ(merged->modified_by, "n1");
  ASSERT_EQ(merged->clock.get("n1"), 1u);
  ASSERT_EQ(merged->clock.get("n2"), 1u);
}

TEST(event_conflict_keeps_sources) {
  ThoughtCRDT n1("n1");
  ThoughtCRDT n2("n2");

  n1.add(make_thought("x", "event", {{"type", "a"}}));
  n2.add(make_thought("x", "event", {{"type", "b"}}));

  ReplicaState s1 = n1.get_state();
  ReplicaState s2 = n2.get_state();
  n1.merge(s2);
  n2.merge(s1);

  for (const ThoughtCRDT *replica : {&n1, &n2}) {
    auto merged = replica->get_thought("x");
    ASSERT_TRUE(merged.has_value());
    const json &payload = merged->thought.payload;
    ASSERT_EQ(payload["merged"], true);
    ASSERT_EQ(payload["sources"].size(), 2u);
    ASSERT_TRUE(std::find(payload["sources"].begin(), payload["sources"].end(), json{{"type", "a"}}) !=
                payload["sources"].end());
    ASSERT_TRUE(std::find(payload["sources"].begin(), payload["sources"].end(), json{{"type", "b"}}) !=
                payload["sources"].end());
  }
  ASSERT_EQ(n1.get_thought("x")->thought, n2.get_thought("x")->thought);
}

TEST(dream_conflict_concatenates_visions) {
  ThoughtCRDT n1("n1");
  ThoughtCRDT n2("n2");

  n1.add(make_thought("d", "dream", {{"vision", "mesh"}, {"lucidity", 0.3}}, 100));
  n2.add(make_thought("d", "dream", {{"vision", "tide"}, {"lucidity", 0.6}}, 200));

  ReplicaState s1 = n1.get_state();
  ReplicaState s2 = n2.get_state();
  n1.merge(s2);
  n2.merge(s1);

  auto merged = n1.get_thought("d");
  ASSERT_EQ(merged->thought.payload["vision"], "mesh | tide");
  ASSERT_EQ(merged->thought.payload["lucidity"].get<double>(), 0.6);
  ASSERT_EQ(merged->thought, n2.get_thought("d")->thought);
}

TEST(concurrent_writes_converge) {
  ManualClock wall1;
  ManualClock wall2;
  wall2.now = 5000;
  ThoughtCRDT n1("n1", wall1.source());
  ThoughtCRDT n2("n2", wall2.source());

  n1.add(make_thought("c", "intent", {{"goal", "rest"}}, 300, {"p1", "p2"}, "n1"));
  n2.add(make_thought("c", "intent", {{"goal", "wander"}}, 250, {"p2", "p3"}, "n2"));

  ReplicaState s1 = n1.get_state();
  ReplicaState s2 = n2.get_state();
  MergeReport r1 = n1.merge(s2);
  MergeReport r2 = n2.merge(s1);
  ASSERT_EQ(r1.conflicts.size(), 1u);
  ASSERT_EQ(r2.conflicts.size(), 1u);

  const Thought &t1 = n1.find_version("c")->value;
  const Thought &t2 = n2.find_version("c")->value;
  ASSERT_EQ(t1, t2);
  ASSERT_EQ(json(t1).dump(), json(t2).dump());

  // unknown topics take the later producer timestamp outright, links are unioned
  ASSERT_EQ(t1.payload["goal"], "rest");
  ASSERT_EQ(t1.origin, "n1");
  ASSERT_TRUE(t1.links == (CrdtVector<ThoughtCid>{"p1", "p2", "p3"}));
  ASSERT_EQ(n1.find_version("c")->write_time, 5000u);
  ASSERT_EQ(n1.find_version("c")->clock, n2.find_version("c")->clock);

  // a further exchange changes nothing
  ASSERT_TRUE(n1.merge(n2).empty());
  ASSERT_TRUE(n2.merge(n1).empty());
}

TEST(tombstone_propagates) {
  ThoughtCRDT a("a");
  ThoughtCRDT b("b");

  a.add(make_thought("t1", "metric", {{"H", 0.5}}));
  b.merge(a);
  ASSERT_TRUE(b.get_thought("t1").has_value());

  a.remove("t1");
  MergeReport report = b.merge(a.get_state());
  ASSERT_EQ(report.updated.size(), 1u);
  ASSERT_TRUE(b.get_thoughts().empty());
  ASSERT_TRUE(b.is_tombstoned("t1"));
}

TEST(later_concurrent_write_overrides_tombstone) {
  ManualClock wall_a;
  ManualClock wall_b;
  ThoughtCRDT a("a", wall_a.source());
  ThoughtCRDT b("b", wall_b.source());

  a.add(make_thought("t1", "event", {{"type", "a"}}));
  b.merge(a);

  wall_a.now = 2000;
  a.remove("t1");
  wall_b.now = 3000;
  b.add(make_thought("t1", "event", {{"type", "b"}}));

  ReplicaState sa = a.get_state();
  ReplicaState sb = b.get_state();
  MergeReport ra = a.merge(sb);
  b.merge(sa);

  ASSERT_EQ(ra.conflicts.size(), 1u);
  ASSERT_EQ(ra.conflicts[0].strategy, kTombstoneStrategy);
  ASSERT_FALSE(a.is_tombstoned("t1"));
  ASSERT_FALSE(b.is_tombstoned("t1"));
  ASSERT_EQ(a.get_thought("t1")->thought.payload["type"], "b");
  ASSERT_EQ(a.get_thought("t1")->thought, b.get_thought("t1")->thought);
}

TEST(later_concurrent_tombstone_wins) {
  ManualClock wall_a;
  ManualClock wall_b;
  ThoughtCRDT a("a", wall_a.source());
  ThoughtCRDT b("b", wall_b.source());

  a.add(make_thought("t1", "event", {{"type", "a"}}));
  b.merge(a);

  wall_b.now = 2000;
  b.add(make_thought("t1", "event", {{"type", "b"}}));
  wall_a.now = 3000;
  a.remove("t1");

  ReplicaState sa = a.get_state();
  b.merge(sa);
  a.merge(b);

  ASSERT_TRUE(a.is_tombstoned("t1"));
  ASSERT_TRUE(b.is_tombstoned("t1"));
  ASSERT_TRUE(b.get_thoughts().empty());
}

TEST(merge_is_idempotent) {
  ThoughtCRDT a("a");
  ThoughtCRDT b("b");

  a.add(make_thought("t1", "metric", {{"H", 0.8}}));
  a.add(make_thought("t2", "event", {{"type", "a"}}));
  b.add(make_thought("t1", "metric", {{"H", 0.4}}));
  b.add(make_thought("t3", "dream", {{"vision", "b"}}));

  ReplicaState sb = b.get_state();
  a.merge(sb);
  ThoughtStore after_first = a.get_state().store;
  VectorClock clock_after_first = a.get_clock();

  MergeReport second = a.merge(sb);
  ASSERT_TRUE(second.empty());
  ASSERT_TRUE(same_contents(a.get_store(), after_first));
  ASSERT_EQ(a.get_clock(), clock_after_first);
}

TEST(merge_order_does_not_matter) {
  ManualClock wall;
  ThoughtCRDT base("a", wall.source());
  base.add(make_thought("shared", "metric", {{"H", 0.5}, {"tau", 0.5}}));
  base.add(make_thought("doomed", "event", {{"type", "x"}}));

  ThoughtCRDT b("b", wall.source());
  ThoughtCRDT c("c", wall.source());
  b.merge(base);
  c.merge(base);

  wall.now = 2000;
  b.add(make_thought("shared", "metric", {{"H", 0.9}, {"tau", 0.1}}, 200));
  b.add(make_thought("b-only", "event", {{"type", "b"}}));
  wall.now = 3000;
  c.add(make_thought("shared", "metric", {{"H", 0.1}, {"tau", 0.3}}, 300));
  c.add(make_thought("c-only", "dream", {{"vision", "c"}}));
  c.remove("doomed");

  ThoughtCRDT a1("a", wall.source());
  ThoughtCRDT a2("a", wall.source());
  a1.load_state(base.get_state());
  a2.load_state(base.get_state());

  a1.merge(b.get_state());
  a1.merge(c.get_state());
  a2.merge(c.get_state());
  a2.merge(b.get_state());

  ASSERT_TRUE(same_contents(a1.get_store(), a2.get_store()));
  ASSERT_EQ(a1.get_clock(), a2.get_clock());
  ASSERT_EQ(*a1.find_version("shared"), *a2.find_version("shared"));
  ASSERT_NEAR(a1.get_thought("shared")->thought.payload["H"].get<double>(), 0.5, 1e-9);
  ASSERT_TRUE(a1.is_tombstoned("doomed"));
  ASSERT_EQ(a1.get_thoughts().size(), 3u);
}

// n1 and n3 sync first, each then meets n2, then n1 and n3 sync again
bool three_writers_converge(const std::string &topic) {
  ManualClock wall;
  ThoughtCRDT n1("n1", wall.source());
  ThoughtCRDT n2("n2", wall.source());
  ThoughtCRDT n3("n3", wall.source());

  n1.add(make_thought("x", topic, {{"v", "one"}}, 100));
  wall.now = 2000;
  n2.add(make_thought("x", topic, {{"v", "two"}}, 100));
  wall.now = 3000;
  n3.add(make_thought("x", topic, {{"v", "three"}}, 100));

  ReplicaState s1 = n1.get_state();
  ReplicaState s2 = n2.get_state();
  ReplicaState s3 = n3.get_state();
  n1.merge(s3);
  n3.merge(s1);
  n1.merge(s2);
  n3.merge(s2);
  ReplicaState t1 = n1.get_state();
  ReplicaState t3 = n3.get_state();
  n1.merge(t3);
  n3.merge(t1);
  n2.merge(n1);

  return same_contents(n1.get_store(), n3.get_store()) && same_contents(n1.get_store(), n2.get_store()) &&
         n1.get_clock() == n3.get_clock();
}

TEST(three_concurrent_writers_with_equal_timestamps_converge) {
  ASSERT_TRUE(three_writers_converge("intent"));
  ASSERT_TRUE(three_writers_converge("event"));
  ASSERT_TRUE(three_writers_converge("metric"));
  ASSERT_TRUE(three_writers_converge("dream"));
}

TEST(local_add_overwrites_concurrent_entry_without_resolution) {
  // A version this replica never causally observed, as can be restored through load_state
  StoredVersion foreign(make_thought("x", "event", {{"type", "foreign"}}), 900, "n2",
                        VectorClock(VectorClock::Entries{{"n2", 5}}));
  ReplicaState state;
  state.node_id = "n1";
  state.store.emplace("x", foreign);

  ThoughtCRDT n1("n1");
  n1.load_state(state);

  DecoratedThought stored = n1.add(make_thought("x", "event", {{"type", "local"}}));
  ASSERT_TRUE(n1.get_clock().concurrent_with(foreign.clock));
  ASSERT_EQ(stored.modified_by, "n1");
  ASSERT_EQ(stored.thought.payload, (json{{"type", "local"}}));
  ASSERT_FALSE(stored.thought.payload.contains("merged"));

  // the same pair resolves semantically when it arrives through merge instead
  ThoughtCRDT n3("n3");
  state.node_id = "n3";
  n3.load_state(state);
  ThoughtCRDT n4("n4");
  n4.add(make_thought("x", "event", {{"type", "local"}}));
  MergeReport report = n3.merge(n4);
  ASSERT_EQ(report.conflicts.size(), 1u);
  ASSERT_EQ(n3.get_thought("x")->thought.payload["merged"], true);
}

TEST(stale_local_add_is_ignored) {
  StoredVersion future(make_thought("x", "metric", {{"H", 0.1}}), 900, "n1",
                       VectorClock(VectorClock::Entries{{"n1", 10}}));
  ReplicaState state;
  state.node_id = "n1";
  state.vector_clock = VectorClock(VectorClock::Entries{{"n1", 1}});
  state.store.emplace("x", future);

  ThoughtCRDT n1("n1");
  n1.load_state(state);
  DecoratedThought stored = n1.add(make_thought("x", "metric", {{"H", 0.9}}));

  ASSERT_EQ(stored.thought.payload["H"].get<double>(), 0.1);
  ASSERT_EQ(stored.version, 10u);
}

TEST(state_snapshot_is_independent) {
  ThoughtCRDT a("a");
  a.add(make_thought("t1", "metric", {{"H", 0.5}}));

  ReplicaState snapshot = a.get_state();
  a.add(make_thought("t2", "metric", {{"H", 0.6}}));
  a.remove("t1");

  ASSERT_EQ(snapshot.store.size(), 1u);
  ASSERT_FALSE(snapshot.store.at("t1").tombstone);
  ASSERT_EQ(snapshot.vector_clock.get("a"), 1u);
  ASSERT_EQ(snapshot.node_id, "a");

  ThoughtCRDT restored("other");
  restored.load_state(snapshot);
  ASSERT_EQ(restored.get_node_id(), "a");
  ASSERT_EQ(restored.get_thoughts().size(), 1u);
}

TEST(merge_leaves_remote_untouched) {
  ThoughtCRDT a("a");
  ThoughtCRDT b("b");
  a.add(make_thought("t1", "metric", {{"H", 0.8}}));
  b.add(make_thought("t1", "metric", {{"H", 0.2}}));

  ReplicaState remote = b.get_state();
  ReplicaState before = remote;
  a.merge(remote);

  ASSERT_TRUE(same_contents(remote.store, before.store));
  ASSERT_EQ(remote.vector_clock, before.vector_clock);
  ASSERT_EQ(b.get_thought("t1")->thought.payload["H"].get<double>(), 0.2);
}

TEST(load_state_rejects_malformed_state) {
  ThoughtCRDT a("a");
  a.add(make_thought("t1", "metric", {{"H", 0.5}}));

  ReplicaState no_node;
  ASSERT_THROWS(a.load_state(no_node), ThoughtCRDTException);

  ReplicaState bad_key;
  bad_key.node_id = "b";
  bad_key.store.emplace("wrong", StoredVersion(make_thought("t9", "metric", {}), 1, "b", VectorClock()));
  ASSERT_THROWS(a.load_state(bad_key), ThoughtCRDTException);

  // a rejected state leaves the replica as it was
  ASSERT_EQ(a.get_node_id(), "a");
  ASSERT_TRUE(a.get_thought("t1").has_value());
}

TEST(merge_noop_cases) {
  ThoughtCRDT a("a");
  a.add(make_thought("t1", "metric", {{"H", 0.5}}));

  ReplicaState empty;
  empty.node_id = "b";
  ASSERT_TRUE(a.merge(empty).empty());
  ASSERT_TRUE(a.merge(a.get_state()).empty());
  ASSERT_EQ(a.get_thoughts().size(), 1u);
}

int main() {
  std::cout << "Running thought CRDT tests..." << std::endl << std::endl;

  RUN_TEST(add_and_get_thoughts);
  RUN_TEST(add_requires_cid);
  RUN_TEST(local_update_replaces_version);
  RUN_TEST(remove_tombstones);
  RUN_TEST(remove_unknown_is_noop);
  RUN_TEST(add_after_remove_resurrects);
  RUN_TEST(merge_adds_unknown_thoughts);
  RUN_TEST(merge_applies_causally_newer_version);
  RUN_TEST(merge_keeps_newer_local_version);
  RUN_TEST(metric_conflict_is_averaged);
  RUN_TEST(event_conflict_keeps_sources);
  RUN_TEST(dream_conflict_concatenates_visions);
  RUN_TEST(concurrent_writes_converge);
  RUN_TEST(tombstone_propagates);
  RUN_TEST(later_concurrent_write_overrides_tombstone);
  RUN_TEST(later_concurrent_tombstone_wins);
  RUN_TEST(merge_is_idempotent);
  RUN_TEST(merge_order_does_not_matter);
  RUN_TEST(three_concurrent_writers_with_equal_timestamps_converge);
  RUN_TEST(local_add_overwrites_concurrent_entry_without_resolution);
  RUN_TEST(stale_local_add_is_ignored);
  RUN_TEST(state_snapshot_is_independent);
  RUN_TEST(merge_leaves_remote_untouched);
  RUN_TEST(load_state_rejects_malformed_state);
  RUN_TEST(merge_noop_cases);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
